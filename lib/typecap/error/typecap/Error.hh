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
 * Copyright 2016 Randolf Rotta, Robert Kuban, and contributors, BTU Cottbus-Senftenberg
 */
#pragma once

#include <cstdint>
#include "util/ostream.hh"

namespace typecap {

  enum struct Error : uint8_t
  {
    SUCCESS                    = 0,
    UNSET                      = 1, // the error value never has been set, do not use as return value
    GENERIC_ERROR              = 2,
    INVALID_ARGUMENT           = 3,

    // a kernel invocation failed, the kernel's code is logged
    UNTYPED_RETYPE             = 10,
    CNODE_COPY                 = 11,
    CNODE_MINT                 = 12,
    CNODE_MOVE                 = 13,
    CNODE_MUTATE               = 14,
    CNODE_DELETE               = 15,
    CNODE_REVOKE               = 16,
    ASID_CONTROL_MAKE_POOL     = 17,
    ASID_POOL_ASSIGN           = 18,
    PAGE_MAP                   = 19,
    PAGE_UNMAP                 = 20,
    PAGE_GET_ADDRESS           = 21,

    // resource exhaustion
    NOT_ENOUGH_SLOTS           = 30,
    UNTYPED_EXHAUSTED          = 31,
    UT_POOL_FULL               = 32,

    // retype preconditions
    NOT_BIG_ENOUGH             = 40,
    FAN_OUT_LIMIT              = 41,
    CAP_SIZE_OVERFLOW          = 42,
    BIT_SIZE_OVERFLOW          = 43,

    // paging pipeline
    MAPPING_OVERFLOW           = 50, // internal, never returned by a vspace
    ADDR_NOT_PAGE_ALIGNED      = 51,
    PAGE_MAP_FAILURE           = 52,
    INTERMEDIATE_LAYER_FAILURE = 53,
    RETYPE_ERROR               = 54,
    UT_BUDDY_ERROR             = 55,

    // vspace and regions
    INSUFFICIENT_CNODE_SLOTS   = 60,
    INSUFFICIENT_ADDRESS_SPACE = 61,
    EXCEEDED_ADDRESSABLE_SPACE = 62,
    ASID_MISMATCH              = 63,
    TOO_MANY_PAGES             = 64,
    INVALID_REGION_SIZE        = 65,

    // shared memory queue
    QUEUE_FULL                 = 70,
    QUEUE_EMPTY                = 71
  };

  /** error codes returned by the kernel's invocations */
  enum struct KernelError : uint8_t
  {
    NO_ERROR           = 0,
    INVALID_ARGUMENT   = 1,
    INVALID_CAPABILITY = 2,
    ILLEGAL_OPERATION  = 3,
    RANGE_ERROR        = 4,
    ALIGNMENT_ERROR    = 5,
    FAILED_LOOKUP      = 6,
    TRUNCATED_MESSAGE  = 7,
    DELETE_FIRST       = 8,
    REVOKE_FIRST       = 9,
    NOT_ENOUGH_MEMORY  = 10
  };

  template<class S>
  ostream_base<S>& operator<< (ostream_base<S>& out, Error e) {
    out << "E" << static_cast<int>(e); return out;
  }

  template<class S>
  ostream_base<S>& operator<< (ostream_base<S>& out, KernelError e) {
    out << "K" << static_cast<int>(e); return out;
  }

} // namespace typecap
