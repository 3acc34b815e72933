/* -*- mode:C++; indent-tabs-mode:nil; -*- */
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
#pragma once

#include <memory>
#include "plugins/Plugin.hh"
#include "host/SimKernel.hh"
#include "typecap/IKernel.hh"
#include "typecap/Error.hh"
#include "util/optional.hh"

namespace typecap {

#define TEST_OP(expr, op, val) \
  do {\
    auto result = (expr); \
    auto expected = (val); \
    bool success = ((result) op (expected)); \
    constexpr char expr_str[] = #expr; \
    constexpr char op_str[] = #op; \
    constexpr char val_str[] = #val; \
    test_log(success, expr_str, result, op_str, val_str, expected); \
  } while (false)

#define TEST_EQ(expr, val) TEST_OP(expr, ==, val)
#define TEST_NEQ(expr, val) TEST_OP(expr, !=, val)
#define TEST_SUCCESS(expr) TEST_OP(expr, ==, Error::SUCCESS)
#define TEST_FAILED(expr) TEST_OP(expr, !=, Error::SUCCESS)
#define TEST_TRUE(expr) TEST_OP(expr, ==, true)
#define TEST_FALSE(expr) TEST_OP(expr, !=, true)

class TestPlugin : public Plugin
{
public:
  bool passed() const override { return _failed == 0; }

protected:
  TestPlugin(const char* name = "test") : Plugin(name), _success(0), _failed(0) {}

  void test_success() { _success++; }
  void test_fail() { _failed++; }

  template<class R, class E>
  void test_log(bool success,
                const char* expr_str, R const& result,
                const char* op_str,
                const char* val_str, E const& expected);
  void done();

  /** start over with a freshly booted kernel, every cap operation goes to it */
  host::SimKernel& boot(host::SimKernel::Config const& config = host::SimKernel::Config())
  {
    _sim = std::make_unique<host::SimKernel>(config);
    kernel = _sim.get();
    return *_sim;
  }

  host::SimKernel& sim() { return *_sim; }

  /** the value of a setup step that has to succeed */
  template<class T>
  static T must(optional<T>&& o)
  {
    ASSERT_MSG(o.isSuccess(), "setup step failed");
    return std::move(*o);
  }

private:
  size_t _success;
  size_t _failed;
  std::unique_ptr<host::SimKernel> _sim;
};

template<class R, class E>
void TestPlugin::test_log(bool success,
    const char* expr_str, R const& result,
    const char* op_str,
    const char* val_str, E const& expected)
{
  if (success) {
    log.info("PASSED", expr_str, op_str, val_str);
    test_success();
  } else {
    log.error("FAILED", expr_str, op_str, val_str);
    log.info("VALUES", result, op_str, expected);
    test_fail();
  }
}

inline void TestPlugin::done()
{
  auto tests = _failed + _success;
  if (!_failed) {
    log.error("SUCCESS", tests, "tests have passed");
  } else {
    log.error("FAILED", _success, "out of", tests, "tests have passed");
  }
}

} // namespace typecap
