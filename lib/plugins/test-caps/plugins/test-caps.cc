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
#include "cap/Cap.hh"
#include "cap/CapRange.hh"
#include "cap/CNode.hh"
#include "cap/CNodeSlots.hh"
#include "cap/Untyped.hh"

namespace typecap {
namespace test_caps {

class TestCaps : public TestPlugin
{
public:
  TestCaps() : TestPlugin("test caps") {}
  void initGlobal() override;

private:
  void bootLayout();
  void slotRanges();
  void endpointCaps();
  void childCNode();
  void capRanges();
};

TestCaps instance;

void TestCaps::initGlobal()
{
  bootLayout();
  slotRanges();
  endpointCaps();
  childCNode();
  capRanges();
  done();
}

void TestCaps::bootLayout()
{
  log.error("boot layout");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  TEST_EQ(bi.rootCNodeRadix, size_t(14));
  TEST_EQ(bi.userImageFrames.start, CPtr(NUM_INIT_CAPS));
  TEST_EQ(bi.userImageFrames.size(), size_t(4));
  TEST_EQ(bi.userImagePaging.size(), size_t(3));
  TEST_EQ(bi.untyped.size(), size_t(9));
  TEST_EQ(bi.empty.end, CPtr(1) << 14);
  TEST_EQ(s.typeOf(INIT_THREAD_CNODE), ObjectType::CAP_TABLE);
  TEST_EQ(s.radixOf(INIT_THREAD_CNODE), size_t(14));
  TEST_EQ(s.guardSizeOf(INIT_THREAD_CNODE), size_t(50));
  TEST_EQ(s.asidOf(INIT_THREAD_VSPACE), asid_t(1));
  TEST_TRUE(s.isMapped(bi.userImageFrames.start));
  TEST_EQ(s.mappedVaddr(bi.userImageFrames.start + 1), ProgramStart + arch::PAGE_SIZE);
  TEST_EQ(s.untypedBits(bi.untyped.start), size_t(20));
  TEST_TRUE(s.isEmpty(bi.empty.start));
}

void TestCaps::slotRanges()
{
  log.error("slot ranges");
  auto& s = boot();
  WeakSlots<Local> slots = rootCNodeSlots(s.bootInfo());
  CPtr first = s.bootInfo().empty.start;
  TEST_EQ(slots.size(), s.bootInfo().empty.size());

  auto four = slots.allocStrong<4>();
  TEST_SUCCESS(four.state());
  TEST_EQ(slots.offset(), first + 4);
  auto parts = std::move(*four).alloc<1>();
  TEST_EQ(parts.first.offset(), first);
  TEST_EQ(parts.second.offset(), first + 1);
  TEST_EQ(parts.second.size(), size_t(3));

  size_t visited = 0;
  for (auto slot : std::move(parts.second).iter()) {
    TEST_EQ(slot.offset(), first + 1 + visited);
    visited++;
  }
  TEST_EQ(visited, size_t(3));

  WeakSlots<Local> few = WeakSlots<Local>::uncheckedNew(INIT_THREAD_CNODE, 100, 2);
  TEST_EQ(few.alloc(3).state(), Error::NOT_ENOUGH_SLOTS);
  TEST_EQ(few.allocStrong<3>().state(), Error::NOT_ENOUGH_SLOTS);
  TEST_EQ(few.size(), size_t(2));

  auto it = few.incrementallyConsumingIter();
  TEST_TRUE(it.hasNext());
  TEST_EQ(it.next().offset(), CPtr(100));
  TEST_EQ(it.next().offset(), CPtr(101));
  TEST_FALSE(it.hasNext());
  TEST_EQ(few.size(), size_t(0));
}

void TestCaps::endpointCaps()
{
  log.error("endpoint caps");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto weak = generalUntyped(bi, 5);
  TEST_SUCCESS(weak.state());
  TEST_EQ(generalUntyped(bi, 7).state(), Error::INVALID_ARGUMENT);
  TEST_EQ(generalUntyped(bi, 42).state(), Error::INVALID_ARGUMENT);
  auto ut = asStrong<12>(std::move(*weak));
  TEST_SUCCESS(ut.state());

  auto ep = retype<Endpoint>(std::move(*ut), must(slots.allocStrong<1>()));
  TEST_SUCCESS(ep.state());
  CPtr epSlot = ep->cptr();
  TEST_EQ(s.typeOf(epSlot), ObjectType::ENDPOINT);

  auto minted = mint(*ep, must(slots.allocStrong<1>()), CapRights::RWG(), 0x42);
  TEST_SUCCESS(minted.state());
  TEST_EQ(s.badgeOf(minted->cptr()), Badge(0x42));

  auto copied = copy(*ep, must(slots.allocStrong<1>()), CapRights::R());
  TEST_SUCCESS(copied.state());
  TEST_EQ(s.rightsOf(copied->cptr()), CapRights::R());
  TEST_EQ(s.typeOf(copied->cptr()), ObjectType::ENDPOINT);

  log.error("copy into an occupied slot");
  auto clash = copy(*ep, Slots<1,Local>::uncheckedNew(INIT_THREAD_CNODE, INIT_THREAD_TCB), CapRights::RWG());
  TEST_EQ(clash.state(), Error::CNODE_COPY);
  TEST_EQ(s.typeOf(INIT_THREAD_TCB), ObjectType::TCB);

  auto moved = moveToSlot(std::move(*ep), must(slots.allocStrong<1>()));
  TEST_SUCCESS(moved.state());
  TEST_TRUE(s.isEmpty(epSlot));
  TEST_EQ(s.typeOf(moved->cptr()), ObjectType::ENDPOINT);

  log.error("delete revokes the derived caps");
  CPtr mintedSlot = minted->cptr();
  CPtr copiedSlot = copied->cptr();
  CPtr movedSlot = moved->cptr();
  TEST_SUCCESS(deleteCap(std::move(*moved)).state());
  TEST_TRUE(s.isEmpty(movedSlot));
  TEST_TRUE(s.isEmpty(mintedSlot));
  TEST_TRUE(s.isEmpty(copiedSlot));
}

void TestCaps::childCNode()
{
  log.error("child cnode");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto ut = asStrong<16>(must(generalUntyped(bi, 3)));
  TEST_SUCCESS(ut.state());
  auto two = must(slots.allocStrong<2>());
  CPtr scratch = two.offset();
  auto made = retypeCNode<12>(std::move(*ut), std::move(two));
  TEST_SUCCESS(made.state());
  CPtr cnode = made->first.cptr();
  TEST_EQ(cnode, scratch + 1);
  TEST_TRUE(s.isEmpty(scratch));
  TEST_EQ(s.radixOf(cnode), size_t(12));
  TEST_EQ(s.guardSizeOf(cnode), size_t(52));
  TEST_EQ(made->second.size(), childSlotCount<12>());
  TEST_EQ(made->second.size(), size_t(4095));
  TEST_EQ(made->second.cnode(), cnode);
  TEST_EQ(made->second.offset(), CPtr(1));

  auto self = generateSelfReference(made->first);
  TEST_SUCCESS(self.state());
  TEST_EQ(self->cptr(), CPtr(0));
  TEST_FALSE(s.isEmptyIn(cnode, 0));

  log.error("copy into the child cnode");
  auto epUt = must(asStrong<12>(must(generalUntyped(bi, 5))));
  auto ep = retype<Endpoint>(std::move(epUt), must(slots.allocStrong<1>()));
  TEST_SUCCESS(ep.state());
  auto dest = std::move(made->second).alloc<1>();
  TEST_TRUE(s.isEmptyIn(cnode, 1));
  auto inChild = copy(*ep, std::move(dest.first), CapRights::RW());
  TEST_SUCCESS(inChild.state());
  TEST_EQ(inChild->cptr(), CPtr(1));
  TEST_FALSE(s.isEmptyIn(cnode, 1));
  TEST_TRUE(s.isEmptyIn(cnode, 2));
  TEST_EQ(dest.second.offset(), CPtr(2));
}

void TestCaps::capRanges()
{
  log.error("cap ranges");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto ut = must(asStrong<16>(must(generalUntyped(bi, 4))));
  auto parts = quarter(std::move(ut), must(slots.allocStrong<4>()));
  TEST_SUCCESS(parts.state());
  TEST_EQ(s.untypedBits(parts->q[2].cptr()), size_t(14));

  auto eps = retypeMulti<Endpoint>(std::move(parts->q[0]), must(slots.allocStrong<4>()));
  TEST_SUCCESS(eps.state());
  CPtr start = eps->startCptr();
  for (size_t i = 0; i < 4; i++) TEST_EQ(s.typeOf(start + i), ObjectType::ENDPOINT);

  auto copies = eps->copy(must(slots.allocStrong<4>()), CapRights::R());
  TEST_SUCCESS(copies.state());
  size_t n = 0;
  for (auto c : std::move(*copies).iter()) {
    TEST_EQ(s.typeOf(c.cptr()), ObjectType::ENDPOINT);
    TEST_EQ(s.rightsOf(c.cptr()), CapRights::R());
    n++;
  }
  TEST_EQ(n, size_t(4));

  auto weak = std::move(*eps).weaken();
  TEST_EQ(weak.size(), size_t(4));
  TEST_EQ(std::move(weak).asStrong<3>().state(), Error::INVALID_ARGUMENT);
  auto strong = std::move(weak).asStrong<4>();
  TEST_SUCCESS(strong.state());
  TEST_EQ(strong->startCptr(), start);

  log.error("weak copy needs enough slots");
  WeakSlots<Local> two = WeakSlots<Local>::uncheckedNew(INIT_THREAD_CNODE, slots.offset(), 2);
  auto weakAgain = std::move(*strong).weaken();
  TEST_EQ(weakAgain.copy(two, CapRights::R()).state(), Error::NOT_ENOUGH_SLOTS);
}

} // namespace test_caps
} // namespace typecap
