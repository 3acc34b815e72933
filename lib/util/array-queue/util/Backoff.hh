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

#include "cpu/hwthread_pause.hh"

namespace typecap {

  /** Exponential backoff for spin loops on contended atomics.
   *
   * spin() pauses for up to 2^SPIN_LIMIT rounds and is meant for
   * retrying a failed compare-and-swap. snooze() additionally yields to
   * the host scheduler once the spin limit is passed. Only snooze()
   * drives the backoff to completion, so a caller that wants to block
   * once isCompleted() returns true must use snooze().
   */
  class Backoff
  {
  public:
    enum : unsigned { SPIN_LIMIT = 6, YIELD_LIMIT = 10 };

    Backoff() : step(0) {}

    void reset() { step = 0; }

    void spin() {
      hwthread_pause(size_t(1) << (step < SPIN_LIMIT ? step : unsigned(SPIN_LIMIT)));
      if (step <= SPIN_LIMIT) step++;
    }

    void snooze() {
      if (step <= SPIN_LIMIT) hwthread_pause(size_t(1) << step);
      else hwthread_yield();
      if (step <= YIELD_LIMIT) step++;
    }

    bool isCompleted() const { return step > YIELD_LIMIT; }
    unsigned steps() const { return step; }

  private:
    unsigned step;
  };

} // namespace typecap
