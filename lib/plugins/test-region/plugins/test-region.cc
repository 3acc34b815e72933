/* -*- mode:C++; -*- */
/* MIT License -- typecap: typed capabilities for seL4-style kernels
 *
 * Permission is hereby granted, free of charge, to any person
 * obtaining a copy of this software and associated documentation
 * files (the "Software"), to deal in the Software without
 * restriction, including without limitation the rights to use, copy,
 * modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
 * BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
 * ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * Copyright 2026 typecap contributors
 */

#include "plugins/TestPlugin.hh"
#include "boot/Bootstrap.hh"
#include "cap/CNodeSlots.hh"
#include "cap/Page.hh"
#include "cap/Untyped.hh"
#include "vspace/MemoryRegion.hh"

namespace typecap {
namespace test_region {

class TestRegion : public TestPlugin
{
public:
  TestRegion() : TestPlugin("test region") {}
  void initGlobal() override;

private:
  void generalRegion();
  void deviceRegion();
  void weakRegions();
  void sharing();
  void partitions();
  void largeRegion();
};

TestRegion instance;

void TestRegion::initGlobal()
{
  generalRegion();
  deviceRegion();
  weakRegions();
  sharing();
  partitions();
  largeRegion();
  done();
}

void TestRegion::generalRegion()
{
  log.error("general region");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto parts = must(quarter(must(asStrong<16>(must(generalUntyped(bi, 3)))),
                            must(slots.allocStrong<4>())));
  auto region = UnmappedMemoryRegion<14>::create(std::move(parts.q[0]), must(slots.allocStrong<4>()));
  TEST_SUCCESS(region.state());
  CPtr start = region->startCptr();
  TEST_EQ(region->numPages(), size_t(4));
  TEST_EQ(region->sizeBytes(), uint64_t(0x4000));
  for (size_t i = 0; i < 4; i++) TEST_EQ(s.typeOf(start + i), ObjectType::SMALL_PAGE);
  auto addr = region->paddr();
  TEST_SUCCESS(addr.state());
  TEST_EQ(*addr, uintptr_t(0x40240000));

  auto halves = std::move(*region).split();
  TEST_SUCCESS(halves.state());
  TEST_EQ(halves->first.startCptr(), start);
  TEST_EQ(halves->second.startCptr(), start + 2);
  TEST_EQ(halves->second.numPages(), size_t(2));
  auto upper = halves->second.paddr();
  TEST_SUCCESS(upper.state());
  TEST_EQ(*upper, uintptr_t(0x40242000));
  TEST_EQ(region->startCptr(), CPtr(NULL_CAP));

  log.error("the caps of a region");
  size_t n = 0;
  for (auto page : std::move(halves->first).caps().iter()) {
    TEST_EQ(page.cptr(), start + n);
    n++;
  }
  TEST_EQ(n, size_t(2));
  TEST_EQ(halves->first.startCptr(), CPtr(NULL_CAP));
}

void TestRegion::deviceRegion()
{
  log.error("device region");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto halves = must(split(must(asStrong<16>(must(deviceUntyped(bi, 7)))),
                           must(slots.allocStrong<2>())));
  typedef UnmappedMemoryRegion<15, Exclusive, Local, Device> DeviceRegion;
  auto region = DeviceRegion::createDevice(std::move(halves.second), must(slots.allocStrong<8>()));
  TEST_SUCCESS(region.state());
  TEST_EQ(region->kind().paddr(), uintptr_t(0x30008000));
  auto addr = region->paddr();
  TEST_SUCCESS(addr.state());
  TEST_EQ(*addr, uintptr_t(0x30008000));
  CPtr start = region->startCptr();

  auto parts = must(std::move(*region).split());
  TEST_EQ(parts.second.kind().paddr(), uintptr_t(0x3000C000));
  Cap<Page<Unmapped>> fifth(start + 4);
  auto frameAddr = paddr(fifth);
  TEST_SUCCESS(frameAddr.state());
  TEST_EQ(*frameAddr, uintptr_t(0x3000C000));
  fifth.release();

  log.error("device regions stay device regions");
  auto weak = std::move(parts.first).weaken();
  TEST_TRUE(weak.kind().device);
  TEST_EQ(weak.sizeBits(), size_t(14));
  auto general = std::move(weak).asStrong<14>();
  TEST_EQ(general.state(), Error::INVALID_ARGUMENT);
  auto device = std::move(weak).asStrong<14, Device>();
  TEST_SUCCESS(device.state());
  TEST_EQ(device->kind().paddr(), uintptr_t(0x30008000));
}

void TestRegion::weakRegions()
{
  log.error("weak regions");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  CPtr first = slots.offset();
  auto one = WeakMemoryRegion<Unmapped>::create(must(generalUntyped(bi, 5)), slots);
  TEST_SUCCESS(one.state());
  TEST_EQ(one->numPages(), size_t(1));
  TEST_EQ(one->startCptr(), first);
  TEST_FALSE(one->kind().device);
  TEST_EQ(slots.offset(), first + 1);
  TEST_EQ(std::move(*one).asStrong<13>().state(), Error::INVALID_REGION_SIZE);
  auto strong = std::move(*one).asStrong<12>();
  TEST_SUCCESS(strong.state());
  TEST_EQ(strong->startCptr(), first);

  log.error("smaller than a page");
  auto parts = must(quarter(must(asStrong<12>(must(generalUntyped(bi, 6)))),
                            must(slots.allocStrong<4>())));
  CPtr before = slots.offset();
  auto tiny = WeakMemoryRegion<Unmapped>::create(weaken(std::move(parts.q[0])), slots);
  TEST_EQ(tiny.state(), Error::INVALID_REGION_SIZE);
  TEST_EQ(slots.offset(), before);

  log.error("not enough slots");
  WeakSlots<Local> few = must(slots.alloc(3));
  auto cramped = WeakMemoryRegion<Unmapped>::create(must(generalUntyped(bi, 3)), few);
  TEST_EQ(cramped.state(), Error::NOT_ENOUGH_SLOTS);
  TEST_EQ(few.size(), size_t(3));

  log.error("weak device region");
  auto dev = WeakMemoryRegion<Unmapped>::create(must(deviceUntyped(bi, 8)), slots);
  TEST_SUCCESS(dev.state());
  TEST_TRUE(dev->kind().device);
  auto addr = dev->paddr();
  TEST_SUCCESS(addr.state());
  TEST_EQ(*addr, uintptr_t(0x30100000));
  TEST_EQ(s.typeOf(dev->startCptr()), ObjectType::SMALL_PAGE);
}

void TestRegion::sharing()
{
  log.error("sharing");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto parts = must(quarter(must(asStrong<16>(must(generalUntyped(bi, 4)))),
                            must(slots.allocStrong<4>())));
  auto region = must(UnmappedMemoryRegion<14>::create(std::move(parts.q[1]), must(slots.allocStrong<4>())));
  CPtr start = region.startCptr();
  CPtr dest = slots.offset();
  auto shared = std::move(region).share(must(slots.allocStrong<4>()), CapRights::R());
  TEST_SUCCESS(shared.state());
  TEST_EQ(shared->first.startCptr(), dest);
  TEST_EQ(shared->second.startCptr(), start);
  for (size_t i = 0; i < 4; i++) {
    TEST_EQ(s.typeOf(dest + i), ObjectType::SMALL_PAGE);
    TEST_EQ(s.rightsOf(dest + i), CapRights::R());
  }
  auto a = shared->first.paddr();
  auto b = shared->second.paddr();
  TEST_SUCCESS(a.state());
  TEST_SUCCESS(b.state());
  TEST_EQ(*a, *b);
  TEST_EQ(*a, uintptr_t(0x40254000));

  log.error("shared regions stay shared");
  auto weak = std::move(shared->first).weaken();
  auto again = std::move(weak).asStrong<14>();
  TEST_SUCCESS(again.state());
  static_assert(std::is_same<decltype(again)::value_t,
                             MemoryRegion<Unmapped,14,Shared,Local,General>>::value,
                "the copy is shared");

  auto exclusive = must(UnmappedMemoryRegion<14>::create(std::move(parts.q[2]), must(slots.allocStrong<4>())));
  auto marked = std::move(exclusive).toShared();
  TEST_EQ(marked.startCptr(), dest + 4);
  TEST_EQ(exclusive.startCptr(), CPtr(NULL_CAP));
}

void TestRegion::partitions()
{
  log.error("split into pages");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto quarters = must(quarter(must(asStrong<16>(must(generalUntyped(bi, 3)))),
                               must(slots.allocStrong<4>())));
  auto region = must(UnmappedMemoryRegion<14>::create(std::move(quarters.q[0]),
                                                      must(slots.allocStrong<4>())));
  CPtr start = region.startCptr();
  auto pages = std::move(region).splitInto<12>();
  TEST_SUCCESS(pages.state());
  TEST_EQ(pages->size(), size_t(4));
  TEST_EQ(region.startCptr(), CPtr(NULL_CAP));
  for (size_t i = 0; i < 4; i++) {
    TEST_EQ((*pages)[i].startCptr(), start + i);
    TEST_EQ((*pages)[i].numPages(), size_t(1));
    auto addr = (*pages)[i].paddr();
    TEST_SUCCESS(addr.state());
    TEST_EQ(*addr, uintptr_t(0x40240000 + i * 0x1000));
  }

  log.error("a region splits into itself");
  auto whole = must(UnmappedMemoryRegion<14>::create(std::move(quarters.q[1]),
                                                     must(slots.allocStrong<4>())));
  CPtr wholeStart = whole.startCptr();
  auto same = std::move(whole).splitInto<14>();
  TEST_SUCCESS(same.state());
  TEST_EQ(same->size(), size_t(1));
  TEST_EQ((*same)[0].startCptr(), wholeStart);

  log.error("device parts keep their physical addresses");
  typedef UnmappedMemoryRegion<16, Exclusive, Local, Device> DeviceRegion;
  auto device = must(DeviceRegion::createDevice(must(asStrong<16>(must(deviceUntyped(bi, 7)))),
                                                must(slots.allocStrong<16>())));
  CPtr deviceStart = device.startCptr();
  auto deviceParts = std::move(device).splitInto<14>();
  TEST_SUCCESS(deviceParts.state());
  for (size_t i = 0; i < 4; i++) {
    TEST_EQ((*deviceParts)[i].startCptr(), deviceStart + 4 * i);
    TEST_EQ((*deviceParts)[i].kind().paddr(), uintptr_t(0x30000000 + i * 0x4000));
  }
  Cap<Page<Unmapped>> last(deviceStart + 13);
  auto frameAddr = paddr(last);
  TEST_SUCCESS(frameAddr.state());
  TEST_EQ(*frameAddr, uintptr_t(0x3000D000));
  last.release();

  log.error("mapped parts follow the virtual addresses");
  auto mapped = MappedMemoryRegion<14>::uncheckedNew(
      start, Mapped(0x200000, ROOT_TASK_ASID, CapRights::RW()));
  auto mappedParts = std::move(mapped).splitInto<13>();
  TEST_SUCCESS(mappedParts.state());
  TEST_EQ((*mappedParts)[0].vaddr(), uintptr_t(0x200000));
  TEST_EQ((*mappedParts)[1].vaddr(), uintptr_t(0x202000));
  TEST_EQ((*mappedParts)[1].startCptr(), start + 2);
  TEST_EQ((*mappedParts)[1].asid(), ROOT_TASK_ASID);

  log.error("parts beyond the address space");
  uintptr_t nearTop = ~uintptr_t(0) - 0x2FFF;
  auto high = MappedMemoryRegion<14>::uncheckedNew(
      start, Mapped(nearTop, ROOT_TASK_ASID, CapRights::RW()));
  auto overflow = std::move(high).splitInto<12>();
  TEST_EQ(overflow.state(), Error::EXCEEDED_ADDRESSABLE_SPACE);
  TEST_EQ(high.startCptr(), start);
}

void TestRegion::largeRegion()
{
  log.error("large region");
  host::SimKernel::Config config;
  config.untyped.push_back(host::SimKernel::UntypedConfig{21, false, 0});
  auto& s = boot(config);
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);
  TEST_EQ(bi.untyped.size(), size_t(10));

  size_t retypes = s.count(host::SimKernel::RETYPE);
  auto region = WeakMemoryRegion<Unmapped>::create(must(generalUntyped(bi, 9)), slots);
  TEST_SUCCESS(region.state());
  TEST_EQ(region->numPages(), size_t(512));
  TEST_EQ(s.count(host::SimKernel::RETYPE) - retypes, size_t(2));
  TEST_EQ(s.typeOf(region->startCptr() + 511), ObjectType::SMALL_PAGE);
  auto addr = region->paddr();
  TEST_SUCCESS(addr.state());
  TEST_TRUE(is_aligned(*addr, size_t(1) << 21));
}

} // namespace test_region
} // namespace typecap
