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
#include "cap/CNodeSlots.hh"
#include "cap/Page.hh"
#include "cap/Untyped.hh"

namespace typecap {
namespace test_untyped {

class TestUntyped : public TestPlugin
{
public:
  TestUntyped() : TestPlugin("test untyped") {}
  void initGlobal() override;

private:
  void deviceSplit();
  void devicePage();
  void generalSplit();
  void runtimeRetype();
  void bulkKinds();
  void temporaries();
};

TestUntyped instance;

void TestUntyped::initGlobal()
{
  deviceSplit();
  devicePage();
  generalSplit();
  runtimeRetype();
  bulkKinds();
  temporaries();
  done();
}

void TestUntyped::deviceSplit()
{
  log.error("device split");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto weak = deviceUntyped(bi, 7);
  TEST_SUCCESS(weak.state());
  TEST_EQ(weak->data().bits, size_t(16));
  TEST_EQ(weak->data().kind.paddr(), uintptr_t(0x30000000));
  TEST_EQ(deviceUntyped(bi, 0).state(), Error::INVALID_ARGUMENT);

  auto ut = must(asStrong<16>(std::move(*weak)));
  auto halves = split(std::move(ut), must(slots.allocStrong<2>()));
  TEST_SUCCESS(halves.state());
  TEST_EQ(halves->first.data().kind.paddr(), uintptr_t(0x30000000));
  TEST_EQ(halves->second.data().kind.paddr(), uintptr_t(0x30008000));
  TEST_EQ(s.untypedBits(halves->second.cptr()), size_t(15));

  auto parts = quarter(std::move(halves->second), must(slots.allocStrong<4>()));
  TEST_SUCCESS(parts.state());
  for (size_t i = 0; i < 4; i++) {
    TEST_EQ(parts->q[i].data().kind.paddr(), uintptr_t(0x30008000 + 0x2000 * i));
    TEST_EQ(s.untypedBits(parts->q[i].cptr()), size_t(13));
  }

  log.error("device memory holds no kernel objects");
  CPtr dest = slots.offset();
  TEST_EQ(s.untypedRetype(parts->q[0].cptr(), ObjectType::ENDPOINT, 0,
                          INIT_THREAD_CNODE, 0, 0, dest, 1),
          KernelError::INVALID_ARGUMENT);
  TEST_TRUE(s.isEmpty(dest));
}

void TestUntyped::devicePage()
{
  log.error("device page");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto ut = must(asStrong<12>(must(deviceUntyped(bi, 8))));
  auto page = retypeDevicePage(std::move(ut), must(slots.allocStrong<1>()));
  TEST_SUCCESS(page.state());
  TEST_EQ(s.typeOf(page->cptr()), ObjectType::SMALL_PAGE);
  TEST_FALSE(s.isMapped(page->cptr()));
  auto addr = paddr(*page);
  TEST_SUCCESS(addr.state());
  TEST_EQ(*addr, uintptr_t(0x30100000));
}

void TestUntyped::generalSplit()
{
  log.error("general split");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto ut = must(asStrong<12>(must(generalUntyped(bi, 5))));
  CPtr parent = ut.cptr();
  auto parts = quarter(std::move(ut), must(slots.allocStrong<4>()));
  TEST_SUCCESS(parts.state());
  TEST_EQ(s.untypedUsed(parent), uint64_t(4096));

  log.error("a weak untyped checks the object size");
  auto small = weaken(std::move(parts->q[0]));
  TEST_EQ(small.data().bits, size_t(10));
  TEST_TRUE(parts->q[0].isNull());
  auto tcb = retype<TCB>(std::move(small), must(slots.allocStrong<1>()));
  TEST_EQ(tcb.state(), Error::NOT_BIG_ENOUGH);

  auto ep = retype<Endpoint>(weaken(std::move(parts->q[1])), must(slots.allocStrong<1>()));
  TEST_SUCCESS(ep.state());
  TEST_EQ(s.typeOf(ep->cptr()), ObjectType::ENDPOINT);

  log.error("asStrong rejects a size mismatch");
  auto mismatch = asStrong<11>(weaken(std::move(parts->q[2])));
  TEST_EQ(mismatch.state(), Error::INVALID_ARGUMENT);

  log.error("typed retype of notifications");
  auto notes = retypeMulti<Notification>(std::move(parts->q[3]), must(slots.allocStrong<8>()));
  TEST_SUCCESS(notes.state());
  for (size_t i = 0; i < 8; i++) {
    TEST_EQ(s.typeOf(notes->startCptr() + i), ObjectType::NOTIFICATION);
  }
}

void TestUntyped::runtimeRetype()
{
  log.error("runtime retype");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto ut = must(generalUntyped(bi, 6));
  CPtr utSlot = ut.cptr();

  TEST_EQ(retypeMultiRuntime<Endpoint>(std::move(ut), slots, KernelRetypeFanOutLimit + 1).state(),
          Error::FAN_OUT_LIMIT);
  TEST_EQ(retypeMultiRuntime<TCB>(std::move(ut), slots, 3).state(), Error::NOT_BIG_ENOUGH);
  WeakSlots<Local> few = must(slots.alloc(2));
  TEST_EQ(retypeMultiRuntime<Endpoint>(std::move(ut), few, 4).state(), Error::NOT_ENOUGH_SLOTS);
  TEST_EQ(few.size(), size_t(2));
  TEST_FALSE(ut.isNull());
  TEST_EQ(s.untypedUsed(utSlot), uint64_t(0));

  CPtr first = slots.offset();
  auto eps = retypeMultiRuntime<Endpoint>(std::move(ut), slots, 256);
  TEST_SUCCESS(eps.state());
  TEST_EQ(eps->size(), size_t(256));
  TEST_EQ(eps->startCptr(), first);
  TEST_EQ(slots.offset(), first + 256);
  TEST_EQ(s.typeOf(first + 255), ObjectType::ENDPOINT);
  TEST_EQ(s.untypedUsed(utSlot), uint64_t(4096));

  log.error("the kernel refuses a retype of an exhausted untyped");
  CPtr dest = slots.offset();
  TEST_EQ(s.untypedRetype(utSlot, ObjectType::ENDPOINT, 0, INIT_THREAD_CNODE, 0, 0, dest, 1),
          KernelError::NOT_ENOUGH_MEMORY);
  TEST_EQ(s.untypedRetype(utSlot, ObjectType::ENDPOINT, 0, INIT_THREAD_CNODE, 0, 0, first, 1),
          KernelError::DELETE_FIRST);
}

void TestUntyped::bulkKinds()
{
  log.error("bulk retype of page tables");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto parts = quarter(must(asStrong<16>(must(generalUntyped(bi, 3)))), must(slots.allocStrong<4>()));
  TEST_SUCCESS(parts.state());
  CPtr ptSlot = parts->q[0].cptr();
  auto pts = retypeMulti<PageTable>(std::move(parts->q[0]), must(slots.allocStrong<4>()));
  TEST_SUCCESS(pts.state());
  for (size_t i = 0; i < 4; i++) {
    TEST_EQ(s.typeOf(pts->startCptr() + i), ObjectType::PAGE_TABLE);
  }
  TEST_EQ(s.untypedUsed(ptSlot), uint64_t(1) << 14);

  log.error("bulk retype of thread control blocks");
  auto tcbs = retypeMulti<TCB>(must(asStrong<12>(must(generalUntyped(bi, 5)))),
                               must(slots.allocStrong<2>()));
  TEST_SUCCESS(tcbs.state());
  TEST_EQ(s.typeOf(tcbs->startCptr()), ObjectType::TCB);
  TEST_EQ(s.typeOf(tcbs->startCptr() + 1), ObjectType::TCB);

  CPtr first = slots.offset();
  auto weakTcbs = retypeMultiRuntime<TCB>(weaken(std::move(parts->q[1])), slots, 8);
  TEST_SUCCESS(weakTcbs.state());
  TEST_EQ(weakTcbs->size(), size_t(8));
  TEST_EQ(weakTcbs->startCptr(), first);
  TEST_EQ(s.typeOf(first + 7), ObjectType::TCB);

  auto fixed = std::move(*weakTcbs).asStrong<8>();
  TEST_SUCCESS(fixed.state());
  TEST_EQ(fixed->startCptr(), first);
}

void TestUntyped::temporaries()
{
  log.error("temporary untyped");
  auto& s = boot();
  auto const& bi = s.bootInfo();
  WeakSlots<Local> slots = rootCNodeSlots(bi);

  auto ut = must(asStrong<12>(must(generalUntyped(bi, 5))));
  CPtr epSlot = slots.offset();
  bool liveInside = false;
  auto res = withTemporary(ut, [&slots, &s, &liveInside](Cap<Untyped<12>> tmp) -> optional<void> {
      auto ep = retype<Endpoint>(std::move(tmp), must(slots.allocStrong<1>()));
      if (!ep) RETHROW(ep);
      liveInside = s.typeOf(ep->cptr()) == ObjectType::ENDPOINT;
      return optional<void>(Error::SUCCESS);
    });
  TEST_SUCCESS(res.state());
  TEST_TRUE(liveInside);
  TEST_TRUE(s.isEmpty(epSlot));
  TEST_EQ(s.untypedUsed(ut.cptr()), uint64_t(0));
  TEST_EQ(s.typeOf(ut.cptr()), ObjectType::UNTYPED);

  log.error("a failing scope still cleans up");
  CPtr firstSlot = slots.offset();
  auto failed = withTemporary(ut, [&slots](Cap<Untyped<12>> tmp) -> optional<void> {
      auto eps = retypeMulti<Endpoint,2>(std::move(tmp), must(slots.allocStrong<2>()));
      if (!eps) RETHROW(eps);
      WeakSlots<Local> none;
      auto more = none.allocStrong<1>();
      if (!more) RETHROW(more);
      return optional<void>(Error::SUCCESS);
    });
  TEST_EQ(failed.state(), Error::NOT_ENOUGH_SLOTS);
  TEST_TRUE(s.isEmpty(firstSlot));
  TEST_TRUE(s.isEmpty(firstSlot + 1));
  TEST_EQ(s.untypedUsed(ut.cptr()), uint64_t(0));

  log.error("temporary slots");
  auto other = must(asStrong<12>(must(generalUntyped(bi, 6))));
  CPtr tmpSlot = slots.offset();
  bool filled = false;
  auto lent = must(slots.allocStrong<1>()).withTemporary([&other, &s, &filled](Slots<1> tmp) -> optional<void> {
      CPtr at = tmp.offset();
      auto ep = retype<Endpoint>(std::move(other), std::move(tmp));
      if (!ep) RETHROW(ep);
      filled = s.typeOf(at) == ObjectType::ENDPOINT;
      return optional<void>(Error::SUCCESS);
    });
  TEST_SUCCESS(lent.first.state());
  TEST_TRUE(filled);
  TEST_EQ(lent.second.offset(), tmpSlot);
  TEST_TRUE(s.isEmpty(tmpSlot));
}

} // namespace test_untyped
} // namespace typecap
