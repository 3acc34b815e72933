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
#include "cap/ASID.hh"
#include "cap/CNodeSlots.hh"
#include "cap/Untyped.hh"

namespace typecap {
namespace test_asid {

class TestASID : public TestPlugin
{
public:
  TestASID() : TestPlugin("test asid") {}
  void initGlobal() override;

private:
  void newPool();
  void initialPool();
  void refusedPool();
};

TestASID instance;

void TestASID::initGlobal()
{
  newPool();
  initialPool();
  refusedPool();
  done();
}

void TestASID::newPool()
{
  log.error("new pool");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto control = ASIDControl<ASIDPoolCount - 1>::uncheckedNew(ASID_CONTROL);
  auto poolUt = must(asStrong<arch::ASID_POOL_BITS>(must(generalUntyped(bi, 5))));
  CPtr utSlot = poolUt.cptr();
  auto made = std::move(control).makePool(std::move(poolUt), must(slots.allocStrong<1>()));
  TEST_SUCCESS(made.state());
  TEST_TRUE(control.cptr() == NULL_CAP);
  TEST_EQ(made->second.cptr(), CPtr(ASID_CONTROL));
  TEST_EQ(s.untypedUsed(utSlot), uint64_t(4096));

  auto root = must(retype<PagingRoot>(must(asStrong<12>(must(generalUntyped(bi, 6)))),
                                      must(slots.allocStrong<1>())));
  TEST_EQ(s.asidOf(root.cptr()), asid_t(0));

  CPtr poolSlot = made->first.cptr();
  auto first = std::move(made->first).alloc();
  TEST_EQ(first.first.value(), asid_t(ASIDPoolSize));
  TEST_EQ(first.first.pool(), poolSlot);
  TEST_TRUE(made->first.cptr() == NULL_CAP);
  auto assigned = assign(std::move(first.first), root);
  TEST_SUCCESS(assigned.state());
  TEST_EQ(assigned->value(), asid_t(ASIDPoolSize));
  TEST_EQ(s.asidOf(root.cptr()), asid_t(ASIDPoolSize));
  TEST_TRUE(first.first.pool() == NULL_CAP);

  log.error("a root takes one asid only");
  auto second = std::move(first.second).alloc();
  TEST_EQ(second.first.value(), asid_t(ASIDPoolSize + 1));
  TEST_EQ(assign(std::move(second.first), root).state(), Error::ASID_POOL_ASSIGN);
  TEST_EQ(s.asidOf(root.cptr()), asid_t(ASIDPoolSize));
}

void TestASID::initialPool()
{
  log.error("initial pool");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);
  TEST_EQ(s.asidOf(INIT_THREAD_VSPACE), asid_t(1));

  auto parts = must(quarter(must(asStrong<16>(must(generalUntyped(bi, 3)))),
                            must(slots.allocStrong<4>())));
  auto root = must(retype<PagingRoot>(std::move(parts.q[0]), must(slots.allocStrong<1>())));

  auto pool = ASIDPool<ASIDPoolSize - 2>::uncheckedNew(INIT_THREAD_ASID_POOL, 2);
  auto next = std::move(pool).alloc();
  auto assigned = assign(std::move(next.first), root);
  TEST_SUCCESS(assigned.state());
  TEST_EQ(assigned->value(), asid_t(2));
  TEST_EQ(s.asidOf(root.cptr()), asid_t(2));
  TEST_TRUE(*assigned != AssignedASID(1));

  auto other = must(retype<PagingRoot>(std::move(parts.q[1]), must(slots.allocStrong<1>())));
  auto more = std::move(next.second).alloc();
  auto third = assign(std::move(more.first), other);
  TEST_SUCCESS(third.state());
  TEST_EQ(s.asidOf(other.cptr()), asid_t(3));
}

void TestASID::refusedPool()
{
  log.error("refused pool");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto control = ASIDControl<ASIDPoolCount - 1>::uncheckedNew(ASID_CONTROL);
  auto poolUt = must(asStrong<arch::ASID_POOL_BITS>(must(generalUntyped(bi, 5))));
  auto occupied = Slots<1,Local>::uncheckedNew(INIT_THREAD_CNODE, INIT_THREAD_TCB);
  auto refused = std::move(control).makePool(std::move(poolUt), std::move(occupied));
  TEST_EQ(refused.state(), Error::ASID_CONTROL_MAKE_POOL);
  TEST_EQ(control.cptr(), CPtr(ASID_CONTROL));
  TEST_EQ(s.typeOf(INIT_THREAD_TCB), ObjectType::TCB);

  log.error("the kernel wants a page sized untouched untyped");
  CPtr dest = slots.offset();
  CPtr big = bi.untyped.start + 3;
  TEST_EQ(s.asidControlMakePool(ASID_CONTROL, big, INIT_THREAD_CNODE, dest, arch::WORD_BITS),
          KernelError::INVALID_ARGUMENT);
  CPtr device = bi.untyped.start + 8;
  TEST_EQ(s.asidControlMakePool(ASID_CONTROL, device, INIT_THREAD_CNODE, dest, arch::WORD_BITS),
          KernelError::INVALID_ARGUMENT);
  TEST_TRUE(s.isEmpty(dest));
}

} // namespace test_asid
} // namespace typecap
