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
#include "typecap/caps.hh"

namespace typecap {

  /** a range [start, end) of slots in the root CNode */
  struct SlotRegion
  {
    CPtr start;
    CPtr end;
    size_t size() const { return end - start; }
  };

  /** an untyped cap handed to the root task at boot */
  struct UntypedDesc
  {
    uintptr_t paddr;
    uint8_t sizeBits;
    bool isDevice;
  };

  /** What the kernel tells the root task at boot. The untyped caps
   * are in the slots of the untyped region, described in the same
   * order by untypedList. */
  struct BootInfo
  {
    enum : size_t { MAX_UNTYPED = 64 };

    size_t rootCNodeRadix;
    SlotRegion empty;
    SlotRegion userImageFrames;
    SlotRegion userImagePaging;
    SlotRegion untyped;
    uintptr_t userImageVaddr;
    UntypedDesc untypedList[MAX_UNTYPED];
  };

} // namespace typecap
