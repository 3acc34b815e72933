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
#include "vspace/AvailableAddressRange.hh"

namespace typecap {
namespace test_address_range {

class TestAddressRange : public TestPlugin
{
public:
  TestAddressRange() : TestPlugin("test address range") {}
  void initGlobal() override;

private:
  void proposals();
  void observations();
  void skipping();
};

TestAddressRange instance;

void TestAddressRange::initGlobal()
{
  proposals();
  observations();
  skipping();
  done();
}

void TestAddressRange::proposals()
{
  log.error("proposals");
  AvailableAddressRange all;
  TEST_EQ(all.bottom(), uintptr_t(arch::PAGE_SIZE));
  TEST_EQ(all.top(), arch::USER_TOP);
  auto p = all.autoPropose(arch::PAGE_BITS);
  TEST_SUCCESS(p.state());
  TEST_EQ(*p, uintptr_t(0x1000));
  TEST_EQ(all.bottom(), uintptr_t(0x1000));

  AvailableAddressRange small(0x10000, 0x20000);
  auto exact = small.autoPropose(16);
  TEST_SUCCESS(exact.state());
  TEST_EQ(*exact, uintptr_t(0x10000));
  TEST_EQ(small.autoPropose(17).state(), Error::INSUFFICIENT_ADDRESS_SPACE);
  TEST_EQ(small.autoPropose(arch::WORD_BITS).state(), Error::INSUFFICIENT_ADDRESS_SPACE);
  TEST_EQ(all.autoPropose(47).state(), Error::INSUFFICIENT_ADDRESS_SPACE);
  TEST_SUCCESS(all.autoPropose(46).state());
}

void TestAddressRange::observations()
{
  log.error("observations");
  AvailableAddressRange r(0x10000, 0x100000);
  r.observeMapping(0x10000, 12);
  TEST_EQ(r.bottom(), uintptr_t(0x11000));
  TEST_EQ(r.top(), uintptr_t(0x100000));

  r.observeMapping(0xFF000, 12);
  TEST_EQ(r.top(), uintptr_t(0xFF000));
  TEST_EQ(r.bottom(), uintptr_t(0x11000));

  log.error("mappings outside change nothing");
  r.observeMapping(0x200000, 21);
  r.observeMapping(0x0, 16);
  r.observeMapping(0xFF000, 12);
  TEST_EQ(r.bottom(), uintptr_t(0x11000));
  TEST_EQ(r.top(), uintptr_t(0xFF000));

  log.error("a mapping across the bottom");
  r.observeMapping(0x10000, 14);
  TEST_EQ(r.bottom(), uintptr_t(0x14000));

  log.error("a mapping in the middle moves the nearer watermark");
  AvailableAddressRange m(0x10000, 0x20000);
  m.observeMapping(0x1A000, 12);
  TEST_EQ(m.top(), uintptr_t(0x1A000));
  TEST_EQ(m.bottom(), uintptr_t(0x10000));
  m.observeMapping(0x12000, 12);
  TEST_EQ(m.bottom(), uintptr_t(0x13000));

  log.error("ties move the bottom");
  AvailableAddressRange t(0x10000, 0x21000);
  t.observeMapping(0x18000, 12);
  TEST_EQ(t.bottom(), uintptr_t(0x19000));
  TEST_EQ(t.top(), uintptr_t(0x21000));

  log.error("a mapping at the end of the address space");
  AvailableAddressRange all;
  all.observeMapping(~uintptr_t(0) - 0xFFF, 13);
  TEST_EQ(all.top(), arch::USER_TOP);
  all.observeMapping(arch::USER_TOP - 0x1000, 12);
  TEST_EQ(all.top(), arch::USER_TOP - 0x1000);
}

void TestAddressRange::skipping()
{
  log.error("skipping");
  AvailableAddressRange r(0x10000, 0x20000);
  TEST_SUCCESS(r.skip(4).state());
  TEST_EQ(r.bottom(), uintptr_t(0x14000));
  TEST_SUCCESS(r.skip(0).state());
  TEST_EQ(r.bottom(), uintptr_t(0x14000));
  TEST_EQ(r.skip(13).state(), Error::INSUFFICIENT_ADDRESS_SPACE);
  TEST_EQ(r.bottom(), uintptr_t(0x14000));
  TEST_SUCCESS(r.skip(12).state());
  TEST_EQ(r.bottom(), r.top());
  TEST_EQ(r.autoPropose(arch::PAGE_BITS).state(), Error::INSUFFICIENT_ADDRESS_SPACE);
  TEST_EQ(r.skip(~size_t(0)).state(), Error::INSUFFICIENT_ADDRESS_SPACE);
}

} // namespace test_address_range
} // namespace typecap
