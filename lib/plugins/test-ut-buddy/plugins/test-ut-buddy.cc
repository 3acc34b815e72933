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
#include "alloc/UTBuddy.hh"
#include "alloc/UTPool.hh"
#include "alloc/WUTBuddy.hh"
#include "cap/CNode.hh"
#include "cap/CNodeSlots.hh"
#include "cap/Untyped.hh"

namespace typecap {
namespace test_ut_buddy {

class TestUTBuddy : public TestPlugin
{
public:
  TestUTBuddy() : TestPlugin("test ut buddy") {}
  void initGlobal() override;

private:
  void staticBuddy();
  void weakBuddy();
  void poolLimits();
  void moveToChild();
};

TestUTBuddy instance;

void TestUTBuddy::initGlobal()
{
  staticBuddy();
  weakBuddy();
  poolLimits();
  moveToChild();
  done();
}

void TestUTBuddy::staticBuddy()
{
  log.error("static buddy");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto ut = must(asStrong<20>(must(generalUntyped(bi, 0))));
  auto buddy = utBuddy(std::move(ut));
  static_assert(decltype(buddy)::count(20) == 1, "one 20 bit untyped to start with");
  static_assert(decltype(buddy)::slotCount(14) == 12, "six splits of two slots each");
  TEST_EQ(buddy.pool().count(20), size_t(1));

  CPtr first = slots.offset();
  auto res = std::move(buddy).alloc<14>(must(slots.allocStrong<12>()));
  TEST_SUCCESS(res.state());
  auto rest = std::move(res->second);
  typedef decltype(rest) rest_t;
  static_assert(rest_t::count(20) == 0, "the source was split");
  static_assert(rest_t::count(19) == 1 && rest_t::count(14) == 1, "one buddy half per size");
  static_assert(rest_t::slotCount(14) == 0, "a 14 bit untyped is left");
  for (size_t bits = 14; bits < 20; bits++) {
    TEST_EQ(rest.pool().count(bits), size_t(1));
  }
  TEST_EQ(rest.pool().count(20), size_t(0));
  TEST_EQ(rest.pool().total(), size_t(6));
  TEST_EQ(buddy.pool().total(), size_t(0));
  TEST_EQ(slots.offset(), first + 12);

  CPtr got = res->first.cptr();
  TEST_EQ(s.typeOf(got), ObjectType::UNTYPED);
  TEST_EQ(s.untypedBits(got), size_t(14));
  TEST_EQ(s.untypedUsed(got), uint64_t(0));
  TEST_EQ(s.untypedBits(rest.pool().at(19, 0)), size_t(19));

  log.error("the leftover half needs no slots");
  auto again = std::move(rest).alloc<14>(must(slots.allocStrong<0>()));
  TEST_SUCCESS(again.state());
  TEST_EQ(s.untypedBits(again->first.cptr()), size_t(14));
  TEST_EQ(again->second.pool().count(14), size_t(0));
  TEST_EQ(again->second.pool().total(), size_t(5));

  auto weak = std::move(again->second).weaken();
  TEST_EQ(weak.total(), size_t(5));
  TEST_EQ(weak.count(15), size_t(1));
}

void TestUTBuddy::weakBuddy()
{
  log.error("weak buddy");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto buddy = weakUTBuddy(must(generalUntyped(bi, 0)));
  TEST_EQ(buddy.count(20), size_t(1));
  TEST_EQ(buddy.pool().slotsNeeded(12), size_t(16));

  CPtr first = slots.offset();
  auto a = buddy.alloc(slots, 12);
  TEST_SUCCESS(a.state());
  TEST_EQ(a->data().bits, size_t(12));
  TEST_EQ(s.untypedBits(a->cptr()), size_t(12));
  TEST_EQ(slots.offset(), first + 16);
  for (size_t bits = 12; bits < 20; bits++) TEST_EQ(buddy.count(bits), size_t(1));
  TEST_EQ(buddy.total(), size_t(8));

  auto b = buddy.alloc(slots, 12);
  TEST_SUCCESS(b.state());
  TEST_EQ(slots.offset(), first + 16);
  TEST_EQ(buddy.count(12), size_t(0));

  log.error("exhaustion and missing slots");
  TEST_EQ(buddy.alloc(slots, 21).state(), Error::UNTYPED_EXHAUSTED);
  WeakSlots<Local> one = must(slots.alloc(1));
  TEST_EQ(buddy.alloc(one, 4).state(), Error::NOT_ENOUGH_SLOTS);
  TEST_EQ(one.size(), size_t(1));
  TEST_EQ(buddy.total(), size_t(7));

  auto page = buddy.allocStrong<12>(slots);
  TEST_SUCCESS(page.state());
  TEST_EQ(buddy.count(13), size_t(0));
  TEST_EQ(buddy.count(12), size_t(1));
  auto frame = retype<Page<Unmapped>>(std::move(*page), must(slots.allocStrong<1>()));
  TEST_SUCCESS(frame.state());
  TEST_EQ(s.typeOf(frame->cptr()), ObjectType::SMALL_PAGE);

  log.error("returned untyped go back to their list");
  TEST_SUCCESS(buddy.add(std::move(*b)).state());
  TEST_EQ(buddy.count(12), size_t(2));
  TEST_TRUE(b->isNull());
}

void TestUTBuddy::poolLimits()
{
  log.error("pool limits");
  UTPool pool;
  TEST_EQ(pool.total(), size_t(0));
  TEST_EQ(pool.slotsNeeded(12), size_t(0));
  for (size_t i = 0; i < UTPoolSlotsPerSize; i++) {
    TEST_SUCCESS(pool.push(4, 100 + i).state());
  }
  TEST_EQ(pool.push(4, 200).state(), Error::UT_POOL_FULL);
  TEST_EQ(pool.count(4), UTPoolSlotsPerSize);
  TEST_EQ(pool.push(3, 300).state(), Error::INVALID_ARGUMENT);
  TEST_EQ(pool.push(48, 300).state(), Error::INVALID_ARGUMENT);
  TEST_EQ(pool.at(4, 0), CPtr(100));

  WeakSlots<Local> none;
  TEST_EQ(pool.take(2, none).state(), Error::INVALID_ARGUMENT);
  TEST_EQ(pool.take(5, none).state(), Error::UNTYPED_EXHAUSTED);
  auto top = pool.take(4, none);
  TEST_SUCCESS(top.state());
  TEST_EQ(*top, CPtr(100 + UTPoolSlotsPerSize - 1));
  TEST_EQ(pool.count(4), UTPoolSlotsPerSize - 1);
}

void TestUTBuddy::moveToChild()
{
  log.error("move to child");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto node = must(retypeCNode<8>(must(asStrong<12>(must(generalUntyped(bi, 5)))),
                                  must(slots.allocStrong<2>())));
  CPtr cnode = node.first.cptr();
  WeakSlots<Child> childSlots = std::move(node.second).weaken();

  auto buddy = weakUTBuddy(must(generalUntyped(bi, 2)));
  auto half = buddy.alloc(slots, 17);
  TEST_SUCCESS(half.state());
  TEST_EQ(buddy.total(), size_t(1));
  CPtr left = buddy.pool().at(17, 0);

  WeakSlots<Child> tooFew = must(childSlots.alloc(0));
  TEST_EQ(std::move(buddy).moveToChild(tooFew).state(), Error::NOT_ENOUGH_SLOTS);
  TEST_EQ(buddy.total(), size_t(1));

  auto moved = std::move(buddy).moveToChild(childSlots);
  TEST_SUCCESS(moved.state());
  TEST_EQ(moved->total(), size_t(1));
  TEST_EQ(moved->pool().at(17, 0), CPtr(1));
  TEST_FALSE(s.isEmptyIn(cnode, 1));
  TEST_TRUE(s.isEmpty(left));
  TEST_EQ(buddy.total(), size_t(0));
  TEST_EQ(childSlots.offset(), CPtr(2));
}

} // namespace test_ut_buddy
} // namespace typecap
