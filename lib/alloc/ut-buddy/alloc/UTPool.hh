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

#include <cstddef>
#include "typecap/caps.hh"
#include "typecap/config.hh"
#include "cap/CNodeSlots.hh"
#include "util/optional.hh"

namespace typecap {

  /** Free lists of general untyped caps, one per size from the
   * smallest to the largest untyped the kernel supports. */
  class UTPool
  {
  public:
    static constexpr size_t NUM_SIZES = arch::NUM_UNTYPED_SIZES;

    UTPool();

    size_t count(size_t bits) const;
    size_t total() const;
    CPtr at(size_t bits, size_t i) const { return caps[bits - arch::MIN_UNTYPED_BITS][i]; }

    /** add an untyped of the given size to its free list */
    optional<void> push(size_t bits, CPtr ut);

    /** Take an untyped of the given size. If its list is empty, one
     * untyped from the smallest larger populated list is split down
     * step by step, each step consumes two of the slots.
     */
    optional<CPtr> take(size_t bits, WeakSlots<Local>& slots);

    /** slots take would consume for this size, with no larger untyped the result is 0 */
    size_t slotsNeeded(size_t bits) const;

    /** move every untyped into dest and record the new locations */
    optional<UTPool> moveTo(WeakSlots<Child>& dest) const;

  private:
    CPtr pop(size_t index) { return caps[index][--counts[index]]; }

    CPtr caps[NUM_SIZES][UTPoolSlotsPerSize];
    size_t counts[NUM_SIZES];
  };

} // namespace typecap
