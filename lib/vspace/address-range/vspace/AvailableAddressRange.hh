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
#include <cstdint>
#include "typecap/config.hh"
#include "util/align.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  /** Unclaimed virtual addresses between two watermarks. Mappings are
   * placed at the bottom watermark, observed mappings push the nearer
   * watermark away. Addresses are never handed back.
   */
  class AvailableAddressRange
  {
  public:
    AvailableAddressRange() : bottom_(arch::PAGE_SIZE), top_(arch::USER_TOP) {}
    AvailableAddressRange(uintptr_t bottom, uintptr_t top) : bottom_(bottom), top_(top) {}

    uintptr_t bottom() const { return bottom_; }
    uintptr_t top() const { return top_; }

    /** the address a region of 2^sizeBits bytes would get */
    optional<uintptr_t> autoPropose(size_t sizeBits) const {
      uint64_t end;
      if (sizeBits >= arch::WORD_BITS || !checked_add(bottom_, bits_to_bytes(sizeBits), end) || end > top_)
        THROW(Error::INSUFFICIENT_ADDRESS_SPACE, DVARhex(bottom_), DVAR(sizeBits));
      return bottom_;
    }

    /** Record a mapping of 2^sizeBits bytes at start. Mappings outside
     * the unclaimed interval change nothing, otherwise the watermark
     * nearer to the mapping moves past it. Ties move the bottom.
     */
    void observeMapping(uintptr_t start, size_t sizeBits) {
      uint64_t end;
      if (!checked_add(start, bits_to_bytes(sizeBits), end)) end = ~uint64_t(0);
      observeInterval(start, end);
    }

    /** skip count pages at the bottom */
    optional<void> skip(size_t count) {
      uint64_t bytes = uint64_t(count) * arch::PAGE_SIZE;
      uint64_t end;
      if (bytes / arch::PAGE_SIZE != count || !checked_add(bottom_, bytes, end) || end > top_)
        THROW(Error::INSUFFICIENT_ADDRESS_SPACE, DVAR(count));
      bottom_ = end;
      return optional<void>(Error::SUCCESS);
    }

  private:
    void observeInterval(uint64_t start, uint64_t end) {
      if (end <= bottom_ || start >= top_) return;
      uint64_t dBottom = start > bottom_ ? start - bottom_ : 0;
      uint64_t dTop = end < top_ ? top_ - end : 0;
      if (dBottom <= dTop) {
        if (end > bottom_) bottom_ = end;
      } else {
        if (start < top_) top_ = start;
      }
    }

    uintptr_t bottom_;
    uintptr_t top_;
  };

} // namespace typecap
