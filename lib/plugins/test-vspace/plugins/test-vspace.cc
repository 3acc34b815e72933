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
#include "cap/ASID.hh"
#include "cap/CNode.hh"
#include "cap/CNodeSlots.hh"
#include "cap/Untyped.hh"
#include "vspace/MemoryRegion.hh"
#include "vspace/VSpace.hh"

namespace typecap {
namespace test_vspace {

namespace {
  host::SimKernel* copySim = nullptr;

  /** copies within the root task's address space of the simulated kernel */
  void copyThroughSim(uintptr_t dst, uintptr_t src, size_t len)
  {
    bool ok = copySim->copyVirtual(INIT_THREAD_VSPACE, dst, src, len);
    ASSERT(ok);
  }
} // namespace

class TestVSpace : public TestPlugin
{
public:
  TestVSpace() : TestPlugin("test vspace") {}
  void initGlobal() override;

private:
  /** boot and wrap the root task, spare untyped comes from a separate buddy */
  host::SimKernel& setup();

  template<size_t BITS>
  Cap<Untyped<BITS>> untyped() { return must(spare.allocStrong<BITS>(slots)); }

  template<size_t BITS>
  UnmappedMemoryRegion<BITS> region() {
    return must(UnmappedMemoryRegion<BITS>::create(
        untyped<BITS>(), must(slots.allocStrong<(size_t(1) << (BITS - arch::PAGE_BITS))>())));
  }

  Cap<Page<Unmapped>> page() {
    return must(retype<Page<Unmapped>>(untyped<arch::PAGE_BITS>(), must(slots.allocStrong<1>())));
  }

  VSpace<Empty> emptyVSpace(UnassignedASID&& asid, Cap<WUntyped<General>>&& pagingUt) {
    auto root = untyped<arch::PAGE_GLOBAL_DIRECTORY_BITS>();
    auto rootSlot = must(slots.allocStrong<1>());
    auto pagingSlots = must(slots.alloc(64));
    return must(VSpace<Empty>::createEmpty(std::move(root), std::move(rootSlot), std::move(asid),
                                           std::move(pagingSlots), std::move(pagingUt)));
  }

  void rootRegion();
  void sharedMemory();
  void sharedMappedRegion();
  void partialFailure();
  void foreignRegion();
  void imagedSpaces();
  void childSpaces();
  void singlePages();
  void fixedAddresses();
  void scratchWindow();

  WeakSlots<Local> slots;
  WUTBuddy<Local> spare;
  RootResources rr;
};

TestVSpace instance;

void TestVSpace::initGlobal()
{
  rootRegion();
  sharedMemory();
  sharedMappedRegion();
  partialFailure();
  foreignRegion();
  imagedSpaces();
  childSpaces();
  singlePages();
  fixedAddresses();
  scratchWindow();
  copySim = nullptr;
  done();
}

host::SimKernel& TestVSpace::setup()
{
  auto& s = boot();
  auto const& bi = s.bootInfo();
  slots = rootCNodeSlots(bi);
  auto rootSlots = must(slots.alloc(256));
  rr = wrapBootInfo(bi, must(generalUntyped(bi, 0)), std::move(rootSlots));
  spare = weakUTBuddy(must(generalUntyped(bi, 2)));
  copySim = &s;
  return s;
}

void TestVSpace::rootRegion()
{
  log.error("root region");
  auto& s = setup();
  TEST_EQ(rr.vspace.asid().value(), ROOT_TASK_ASID);
  TEST_EQ(rr.vspace.rootCptr(), CPtr(INIT_THREAD_VSPACE));
  TEST_EQ(rr.vspace.addressRange().bottom(), uintptr_t(0x18000));
  TEST_EQ(rr.image.numPages, size_t(4));
  TEST_EQ(rr.reservedPageTables, size_t(1) + RootTaskStackPageTableCount);

  auto r = region<14>();
  CPtr start = r.startCptr();
  size_t pageMaps = s.count(host::SimKernel::PAGE_MAP);
  size_t tableMaps = s.count(host::SimKernel::TABLE_MAP);
  auto mapped = rr.vspace.mapRegion(std::move(r), CapRights::RW(), VMAttributes::standard());
  TEST_SUCCESS(mapped.state());
  TEST_EQ(mapped->vaddr(), uintptr_t(0x18000));
  TEST_EQ(mapped->asid(), ROOT_TASK_ASID);
  TEST_EQ(mapped->startCptr(), start);
  TEST_EQ(rr.vspace.addressRange().bottom(), uintptr_t(0x1C000));
  TEST_EQ(s.count(host::SimKernel::PAGE_MAP) - pageMaps, size_t(4));
  TEST_EQ(s.count(host::SimKernel::TABLE_MAP) - tableMaps, size_t(0));
  TEST_EQ(s.mappedVaddr(start + 3), uintptr_t(0x1B000));

  log.error("unmap hands the region back");
  auto unmapped = rr.vspace.unmapRegion(std::move(*mapped));
  TEST_SUCCESS(unmapped.state());
  TEST_EQ(unmapped->startCptr(), start);
  TEST_FALSE(s.isMapped(start));
  TEST_EQ(rr.vspace.addressRange().bottom(), uintptr_t(0x1C000));
}

void TestVSpace::sharedMemory()
{
  log.error("shared memory");
  auto& s = setup();
  auto const& bi = s.bootInfo();
  auto asids = std::move(rr.asidPool).alloc();
  TEST_EQ(asids.first.value(), asid_t(2));
  auto b = emptyVSpace(std::move(asids.first), must(generalUntyped(bi, 1)));
  TEST_EQ(b.asid().value(), asid_t(2));
  TEST_EQ(s.asidOf(b.rootCptr()), asid_t(2));

  auto shared = must(region<14>().share(must(slots.allocStrong<4>()), CapRights::RW()));
  auto inRoot = rr.vspace.mapSharedRegionAndConsume(std::move(shared.second), CapRights::RW(),
                                                    VMAttributes::standard());
  TEST_SUCCESS(inRoot.state());
  auto inB = b.mapSharedRegionAndConsume(std::move(shared.first), CapRights::RW(),
                                         VMAttributes::standard());
  TEST_SUCCESS(inB.state());
  TEST_EQ(inB->vaddr(), uintptr_t(arch::PAGE_SIZE));
  TEST_EQ(inB->asid(), asid_t(2));
  TEST_EQ(s.mappedPageCount(b.rootCptr()), size_t(4));

  TEST_TRUE(s.write8(INIT_THREAD_VSPACE, inRoot->vaddr() + 0x2010, 0xAB));
  uint8_t value = 0;
  TEST_TRUE(s.read8(b.rootCptr(), inB->vaddr() + 0x2010, value));
  TEST_EQ(int(value), 0xAB);
}

void TestVSpace::sharedMappedRegion()
{
  log.error("sharing a mapped region");
  auto& s = setup();
  auto const& bi = s.bootInfo();
  auto asids = std::move(rr.asidPool).alloc();
  auto b = emptyVSpace(std::move(asids.first), must(generalUntyped(bi, 1)));

  auto mapped = must(rr.vspace.mapRegion(region<14>(), CapRights::RW(), VMAttributes::standard()));
  CPtr start = mapped.startCptr();
  uintptr_t vaddr = mapped.vaddr();
  auto shared = std::move(mapped).share(must(slots.allocStrong<4>()), CapRights::RW());
  TEST_SUCCESS(shared.state());
  TEST_EQ(shared->second.startCptr(), start);
  TEST_EQ(shared->second.vaddr(), vaddr);
  TEST_EQ(shared->second.asid(), ROOT_TASK_ASID);
  TEST_TRUE(s.isMapped(start + 3));
  TEST_FALSE(s.isMapped(shared->first.startCptr()));

  auto inB = b.mapSharedRegionAndConsume(std::move(shared->first), CapRights::RW(),
                                         VMAttributes::standard());
  TEST_SUCCESS(inB.state());
  TEST_EQ(s.mappedPageCount(b.rootCptr()), size_t(4));

  log.error("writes through the kept mapping reach the other space");
  TEST_TRUE(s.write8(INIT_THREAD_VSPACE, shared->second.vaddr() + 0x3020, 0xAB));
  uint8_t value = 0;
  TEST_TRUE(s.read8(b.rootCptr(), inB->vaddr() + 0x3020, value));
  TEST_EQ(int(value), 0xAB);

  log.error("the kept mapping unmaps on its own");
  auto unmapped = rr.vspace.unmapRegion(std::move(shared->second));
  TEST_SUCCESS(unmapped.state());
  TEST_EQ(unmapped->startCptr(), start);
  for (size_t i = 0; i < 4; i++) {
    TEST_FALSE(s.isMapped(start + i));
  }
  TEST_EQ(s.mappedPageCount(b.rootCptr()), size_t(4));
  TEST_TRUE(s.read8(b.rootCptr(), inB->vaddr() + 0x3020, value));
  TEST_EQ(int(value), 0xAB);
}

void TestVSpace::partialFailure()
{
  log.error("partial failure");
  auto& s = setup();
  auto asids = std::move(rr.asidPool).alloc();
  auto c = emptyVSpace(std::move(asids.first), weaken(untyped<14>()));

  auto low = c.mapRegionAtAddr(region<12>(), 0x1FE000, CapRights::RW(), VMAttributes::standard());
  TEST_SUCCESS(low.state());
  auto high = c.mapRegionAtAddr(region<12>(), 0x600000, CapRights::RW(), VMAttributes::standard());
  TEST_SUCCESS(high.state());
  TEST_EQ(c.utBuddy().total(), size_t(0));
  TEST_EQ(s.mappedPageCount(c.rootCptr()), size_t(2));

  auto two = region<13>();
  CPtr start = two.startCptr();
  auto across = c.mapRegionAtAddr(std::move(two), 0x1FF000, CapRights::RW(), VMAttributes::standard());
  TEST_EQ(across.state(), Error::RETYPE_ERROR);
  TEST_EQ(two.startCptr(), start);
  TEST_FALSE(s.isMapped(start));
  TEST_FALSE(s.isMapped(start + 1));
  TEST_EQ(s.mappedPageCount(c.rootCptr()), size_t(2));

  log.error("the kept region maps elsewhere");
  auto elsewhere = c.mapRegionAtAddr(std::move(two), 0x1F0000, CapRights::RW(), VMAttributes::standard());
  TEST_SUCCESS(elsewhere.state());
  TEST_EQ(elsewhere->startCptr(), start);
  TEST_EQ(s.mappedPageCount(c.rootCptr()), size_t(4));
}

void TestVSpace::foreignRegion()
{
  log.error("foreign region");
  auto& s = setup();
  auto const& bi = s.bootInfo();
  auto asids = std::move(rr.asidPool).alloc();
  auto b = emptyVSpace(std::move(asids.first), must(generalUntyped(bi, 1)));

  auto mapped = must(rr.vspace.mapRegion(region<13>(), CapRights::RW(), VMAttributes::standard()));
  CPtr start = mapped.startCptr();
  auto refused = b.unmapRegion(std::move(mapped));
  TEST_EQ(refused.state(), Error::ASID_MISMATCH);
  TEST_TRUE(s.isMapped(start));
  TEST_TRUE(s.isMapped(start + 1));
}

void TestVSpace::imagedSpaces()
{
  log.error("read only image");
  auto& s = setup();
  auto a1 = std::move(rr.asidPool).alloc();
  auto a2 = std::move(a1.second).alloc();
  TEST_TRUE(s.write8(INIT_THREAD_VSPACE, ProgramStart + 0x1234, 0x5A));

  auto ro = VSpace<Imaged>::create(untyped<12>(), must(slots.allocStrong<1>()), std::move(a1.first),
                                   must(slots.alloc(32)), weaken(untyped<14>()),
                                   rr.image, ReadOnlyImage());
  TEST_SUCCESS(ro.state());
  TEST_EQ(s.mappedPageCount(ro->rootCptr()), size_t(4));
  TEST_EQ(ro->addressRange().bottom(), ProgramStart + 4 * arch::PAGE_SIZE);
  uint8_t value = 0;
  TEST_TRUE(s.read8(ro->rootCptr(), ProgramStart + 0x1234, value));
  TEST_EQ(int(value), 0x5A);
  TEST_TRUE(s.write8(INIT_THREAD_VSPACE, ProgramStart + 0x1234, 0x5B));
  TEST_TRUE(s.read8(ro->rootCptr(), ProgramStart + 0x1234, value));
  TEST_EQ(int(value), 0x5B);

  log.error("read writable image");
  auto window = must(rr.vspace.reserve<1>(page()));
  auto scratch = must(window.first.asScratch(rr.vspace));
  ReadWritableImage<1> config{&scratch, weaken(untyped<14>()), must(slots.alloc(4)), &copyThroughSim};
  auto rw = VSpace<Imaged>::create(untyped<12>(), must(slots.allocStrong<1>()), std::move(a2.first),
                                   must(slots.alloc(32)), weaken(untyped<14>()),
                                   rr.image, std::move(config));
  TEST_SUCCESS(rw.state());
  TEST_EQ(s.mappedPageCount(rw->rootCptr()), size_t(4));
  TEST_TRUE(s.read8(rw->rootCptr(), ProgramStart + 0x1234, value));
  TEST_EQ(int(value), 0x5B);
  TEST_TRUE(s.write8(rw->rootCptr(), ProgramStart + 0x1234, 0x11));
  TEST_TRUE(s.read8(INIT_THREAD_VSPACE, ProgramStart + 0x1234, value));
  TEST_EQ(int(value), 0x5B);
  TEST_FALSE(s.read8(INIT_THREAD_VSPACE, window.first.vaddr(), value));

  log.error("a window belongs to one address space");
  TEST_EQ(window.first.asScratch(*ro).state(), Error::ASID_MISMATCH);
}

void TestVSpace::childSpaces()
{
  log.error("child spaces");
  auto& s = setup();
  auto const& bi = s.bootInfo();
  auto asids = std::move(rr.asidPool).alloc();
  auto b = emptyVSpace(std::move(asids.first), must(generalUntyped(bi, 1)));
  auto node = must(retypeCNode<6>(untyped<12>(), must(slots.allocStrong<2>())));
  CPtr cnode = node.first.cptr();
  auto childSlots = std::move(node.second).alloc<8>();
  WeakSlots<Child> childRest = std::move(childSlots.second).weaken();

  log.error("map and move into the child");
  auto r = region<13>();
  CPtr start = r.startCptr();
  auto moved = b.mapRegionAndMove(std::move(r), CapRights::RW(), VMAttributes::standard(),
                                  must(childRest.allocStrong<2>()));
  TEST_SUCCESS(moved.state());
  TEST_EQ(moved->startCptr(), CPtr(9));
  TEST_EQ(moved->vaddr(), uintptr_t(arch::PAGE_SIZE));
  TEST_TRUE(s.isEmpty(start));
  TEST_FALSE(s.isEmptyIn(cnode, 9));
  TEST_FALSE(s.isEmptyIn(cnode, 10));
  TEST_EQ(s.mappedPageCount(b.rootCptr()), size_t(2));

  log.error("hand over the address space");
  size_t pool = b.utBuddy().total();
  TEST_TRUE(pool > 0);
  auto rootSlot = std::move(childSlots.first).alloc<1>();
  WeakSlots<Child> none;
  auto refused = std::move(b).forChild(std::move(rootSlot.first), none, must(childRest.alloc(8)));
  TEST_EQ(refused.state(), Error::INSUFFICIENT_CNODE_SLOTS);
  TEST_EQ(s.typeOf(b.rootCptr()), ObjectType::PAGE_GLOBAL_DIRECTORY);
  CPtr oldRoot = b.rootCptr();

  auto transfer = must(childRest.alloc(pool));
  auto child = std::move(b).forChild(std::move(rootSlot.first), transfer, must(childRest.alloc(8)));
  TEST_SUCCESS(child.state());
  TEST_EQ(child->rootCptr(), CPtr(1));
  TEST_EQ(child->asid().value(), asid_t(2));
  TEST_EQ(child->utBuddy().total(), pool);
  TEST_EQ(child->pagingSlots().size(), size_t(8));
  TEST_EQ(child->addressRange().bottom(), uintptr_t(3 * arch::PAGE_SIZE));
  TEST_TRUE(s.isEmpty(oldRoot));
  TEST_FALSE(s.isEmptyIn(cnode, 1));
  TEST_EQ(transfer.size(), size_t(0));
}

void TestVSpace::singlePages()
{
  log.error("single pages");
  auto& s = setup();
  auto const& bi = s.bootInfo();
  auto p = page();
  CPtr cptr = p.cptr();
  auto mapped = rr.vspace.mapGivenPage(std::move(p), CapRights::RW(), VMAttributes::standard());
  TEST_SUCCESS(mapped.state());
  TEST_EQ(mapped->data().state.vaddr, uintptr_t(0x18000));
  TEST_EQ(mapped->data().state.asid, ROOT_TASK_ASID);
  TEST_EQ(s.mappedVaddr(cptr), uintptr_t(0x18000));
  TEST_EQ(rr.vspace.addressRange().bottom(), uintptr_t(0x19000));

  auto unmapped = rr.vspace.unmapPage(std::move(*mapped));
  TEST_SUCCESS(unmapped.state());
  TEST_EQ(unmapped->cptr(), cptr);
  TEST_FALSE(s.isMapped(cptr));

  log.error("pages are unmapped where they were mapped");
  auto asids = std::move(rr.asidPool).alloc();
  auto b = emptyVSpace(std::move(asids.first), must(generalUntyped(bi, 1)));
  auto again = must(rr.vspace.mapGivenPage(std::move(*unmapped), CapRights::R(), VMAttributes::standard()));
  TEST_EQ(b.unmapPage(std::move(again)).state(), Error::ASID_MISMATCH);
  TEST_TRUE(s.isMapped(cptr));

  log.error("guard pages");
  TEST_SUCCESS(rr.vspace.skipPages(2).state());
  TEST_EQ(rr.vspace.addressRange().bottom(), uintptr_t(0x1C000));
  auto next = must(rr.vspace.mapGivenPage(page(), CapRights::RW(), VMAttributes::standard()));
  TEST_EQ(next.data().state.vaddr, uintptr_t(0x1C000));
}

void TestVSpace::fixedAddresses()
{
  log.error("fixed addresses");
  auto& s = setup();
  auto r = region<14>();
  CPtr start = r.startCptr();
  auto outside = rr.vspace.mapRegionAtAddr(std::move(r), arch::USER_TOP - arch::PAGE_SIZE,
                                           CapRights::RW(), VMAttributes::standard());
  TEST_EQ(outside.state(), Error::EXCEEDED_ADDRESSABLE_SPACE);
  TEST_EQ(r.startCptr(), start);

  auto placed = rr.vspace.mapRegionAtAddr(std::move(r), 0x40000000, CapRights::RW(),
                                          VMAttributes::standard());
  TEST_SUCCESS(placed.state());
  TEST_EQ(placed->vaddr(), uintptr_t(0x40000000));
  TEST_EQ(r.startCptr(), CPtr(NULL_CAP));
  TEST_EQ(rr.vspace.addressRange().bottom(), uintptr_t(0x40004000));
  TEST_EQ(s.mappedVaddr(start + 3), uintptr_t(0x40003000));

  log.error("a shared region maps through copies");
  auto shared = must(region<13>().share(must(slots.allocStrong<2>()), CapRights::RW()));
  CPtr original = shared.second.startCptr();
  auto copy = rr.vspace.mapSharedRegion(shared.second, CapRights::R(), VMAttributes::standard(),
                                        must(slots.allocStrong<2>()));
  TEST_SUCCESS(copy.state());
  TEST_EQ(copy->vaddr(), uintptr_t(0x40004000));
  TEST_NEQ(copy->startCptr(), original);
  TEST_FALSE(s.isMapped(original));
  TEST_EQ(s.rightsOf(copy->startCptr()), CapRights::R());
  auto second = rr.vspace.mapSharedRegion(shared.second, CapRights::R(), VMAttributes::standard(),
                                          must(slots.allocStrong<2>()));
  TEST_SUCCESS(second.state());
  TEST_EQ(second->vaddr(), uintptr_t(0x40006000));
}

void TestVSpace::scratchWindow()
{
  log.error("scratch window");
  auto& s = setup();
  auto const& bi = s.bootInfo();
  auto window = must(rr.vspace.reserve<2>(page()));
  TEST_EQ(window.first.vaddr(), uintptr_t(0x18000));
  TEST_EQ(window.first.size(), size_t(2 * arch::PAGE_SIZE));
  TEST_FALSE(s.isMapped(window.second.cptr()));
  TEST_EQ(rr.vspace.addressRange().bottom(), uintptr_t(0x1A000));
  auto scratch = must(window.first.asScratch(rr.vspace));

  auto r = region<13>();
  size_t tableMaps = s.count(host::SimKernel::TABLE_MAP);
  auto filled = scratch.temporarilyMapRegion(r, [&s](MappedMemoryRegion<13>& tmp) {
      s.write8(INIT_THREAD_VSPACE, tmp.vaddr() + arch::PAGE_SIZE + 7, 0x3C);
    });
  TEST_SUCCESS(filled.state());
  TEST_EQ(s.count(host::SimKernel::TABLE_MAP), tableMaps);
  TEST_FALSE(s.isMapped(r.startCptr()));
  TEST_FALSE(s.isMapped(r.startCptr() + 1));

  auto asids = std::move(rr.asidPool).alloc();
  auto b = emptyVSpace(std::move(asids.first), must(generalUntyped(bi, 1)));
  auto mapped = must(b.mapRegion(std::move(r), CapRights::RW(), VMAttributes::standard()));
  uint8_t value = 0;
  TEST_TRUE(s.read8(b.rootCptr(), mapped.vaddr() + arch::PAGE_SIZE + 7, value));
  TEST_EQ(int(value), 0x3C);
}

} // namespace test_vspace
} // namespace typecap
