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
#include "alloc/WUTBuddy.hh"
#include "cap/CapRange.hh"
#include "cap/CNodeSlots.hh"
#include "cap/Untyped.hh"
#include "vspace/PagingAArch64.hh"

namespace typecap {
namespace test_paging {

class TestPaging : public TestPlugin
{
public:
  TestPaging() : TestPlugin("test paging") {}
  void initGlobal() override;

private:
  /** boot and retype count frames into slots taken from the free slots */
  void setup(size_t count);
  CPtr frame(size_t i) const { return frames + i; }
  optional<void> map(size_t i, uintptr_t vaddr) {
    return ArchPaging::mapItem(frame(i), INIT_THREAD_VSPACE, vaddr, CapRights::RW(),
                               VMAttributes::standard(), buddy, slots);
  }

  void existingDirectory();
  void missingLevels();
  void refusedMaps();
  void exhaustedResources();

  WeakSlots<Local> slots;
  WUTBuddy<Local> buddy;
  CPtr frames;
};

TestPaging instance;

void TestPaging::initGlobal()
{
  existingDirectory();
  missingLevels();
  refusedMaps();
  exhaustedResources();
  done();
}

void TestPaging::setup(size_t count)
{
  auto& s = boot();
  auto const& bi = s.bootInfo();
  slots = rootCNodeSlots(bi);
  buddy = weakUTBuddy(must(generalUntyped(bi, 0)));
  auto pages = must(retypeMultiRuntime<Page<Unmapped>>(must(generalUntyped(bi, 2)), slots, count));
  frames = pages.startCptr();
}

void TestPaging::existingDirectory()
{
  log.error("existing directory");
  setup(4);
  auto& s = sim();
  TEST_TRUE(s.hasPageTable(INIT_THREAD_VSPACE, ProgramStart));
  TEST_FALSE(s.hasPageTable(INIT_THREAD_VSPACE, 0x10000000));
  size_t pageMaps = s.count(host::SimKernel::PAGE_MAP);

  TEST_SUCCESS(map(0, 0x10000000).state());
  TEST_EQ(s.count(host::SimKernel::PAGE_MAP) - pageMaps, size_t(2));
  TEST_EQ(s.count(host::SimKernel::TABLE_MAP), size_t(1));
  TEST_EQ(s.count(host::SimKernel::DIRECTORY_MAP), size_t(0));
  TEST_EQ(s.count(host::SimKernel::UPPER_DIRECTORY_MAP), size_t(0));
  TEST_TRUE(s.isMapped(frame(0)));
  TEST_EQ(s.mappedVaddr(frame(0)), uintptr_t(0x10000000));
  TEST_TRUE(s.hasPageTable(INIT_THREAD_VSPACE, 0x10000000));

  log.error("the next page reuses the table");
  TEST_SUCCESS(map(1, 0x10001000).state());
  TEST_EQ(s.count(host::SimKernel::PAGE_MAP) - pageMaps, size_t(3));
  TEST_EQ(s.count(host::SimKernel::TABLE_MAP), size_t(1));
  TEST_EQ(s.mappedPageCount(INIT_THREAD_VSPACE), size_t(4 + 2));
}

void TestPaging::missingLevels()
{
  log.error("missing levels");
  setup(2);
  auto& s = sim();
  size_t pageMaps = s.count(host::SimKernel::PAGE_MAP);
  size_t slotsBefore = slots.size();

  TEST_SUCCESS(map(0, 0x8000000000).state());
  TEST_EQ(s.count(host::SimKernel::PAGE_MAP) - pageMaps, size_t(2));
  TEST_EQ(s.count(host::SimKernel::TABLE_MAP), size_t(2));
  TEST_EQ(s.count(host::SimKernel::DIRECTORY_MAP), size_t(2));
  TEST_EQ(s.count(host::SimKernel::UPPER_DIRECTORY_MAP), size_t(1));
  TEST_EQ(s.mappedVaddr(frame(0)), uintptr_t(0x8000000000));
  TEST_TRUE(s.hasPageTable(INIT_THREAD_VSPACE, 0x8000000000));
  // the table splits the 20 bit untyped, the directories take the halves
  TEST_EQ(slotsBefore - slots.size(), size_t(16 + 1 + 1 + 2 + 1));

  log.error("a neighbour in the same table");
  TEST_SUCCESS(map(1, 0x8000003000).state());
  TEST_EQ(s.count(host::SimKernel::TABLE_MAP), size_t(2));
  TEST_EQ(s.count(host::SimKernel::UPPER_DIRECTORY_MAP), size_t(1));
}

void TestPaging::refusedMaps()
{
  log.error("refused maps");
  setup(3);
  auto& s = sim();

  TEST_EQ(map(0, 0x10000800).state(), Error::ADDR_NOT_PAGE_ALIGNED);
  TEST_EQ(map(0, arch::USER_TOP).state(), Error::PAGE_MAP_FAILURE);
  TEST_FALSE(s.isMapped(frame(0)));

  TEST_SUCCESS(map(0, 0x20000).state());
  TEST_EQ(map(1, 0x20000).state(), Error::PAGE_MAP_FAILURE);
  TEST_FALSE(s.isMapped(frame(1)));
  TEST_EQ(map(0, 0x21000).state(), Error::PAGE_MAP_FAILURE);
  TEST_EQ(s.mappedVaddr(frame(0)), uintptr_t(0x20000));

  log.error("a root without asid");
  auto const& bi = s.bootInfo();
  auto root = must(retype<PagingRoot>(must(asStrong<12>(must(generalUntyped(bi, 5)))),
                                      must(slots.allocStrong<1>())));
  TEST_EQ(ArchPaging::mapItem(frame(2), root.cptr(), 0x10000, CapRights::RW(),
                              VMAttributes::standard(), buddy, slots).state(),
          Error::PAGE_MAP_FAILURE);
}

void TestPaging::exhaustedResources()
{
  log.error("empty buddy");
  setup(1);
  auto& s = sim();
  WUTBuddy<Local> empty;
  TEST_EQ(ArchPaging::mapItem(frame(0), INIT_THREAD_VSPACE, 0x10000000, CapRights::RW(),
                              VMAttributes::standard(), empty, slots).state(),
          Error::RETYPE_ERROR);
  TEST_FALSE(s.isMapped(frame(0)));

  log.error("no slot for the table");
  auto small = weakUTBuddy(must(generalUntyped(s.bootInfo(), 5)));
  WeakSlots<Local> none;
  TEST_EQ(ArchPaging::mapItem(frame(0), INIT_THREAD_VSPACE, 0x10000000, CapRights::RW(),
                              VMAttributes::standard(), small, none).state(),
          Error::INSUFFICIENT_CNODE_SLOTS);
  TEST_EQ(small.total(), size_t(1));
  TEST_EQ(small.count(arch::PAGE_TABLE_BITS), size_t(1));

  log.error("the kept untyped serves the retry");
  TEST_SUCCESS(ArchPaging::mapItem(frame(0), INIT_THREAD_VSPACE, 0x10000000, CapRights::RW(),
                                   VMAttributes::standard(), small, slots).state());
  TEST_EQ(small.total(), size_t(0));
  TEST_TRUE(s.isMapped(frame(0)));

  log.error("the buddy lacks slots for a split");
  setup(1);
  WeakSlots<Local> one = must(slots.alloc(1));
  TEST_EQ(ArchPaging::mapItem(frame(0), INIT_THREAD_VSPACE, 0x10000000, CapRights::RW(),
                              VMAttributes::standard(), buddy, one).state(),
          Error::UT_BUDDY_ERROR);
  TEST_FALSE(sim().hasPageTable(INIT_THREAD_VSPACE, 0x10000000));
}

} // namespace test_paging
} // namespace typecap
