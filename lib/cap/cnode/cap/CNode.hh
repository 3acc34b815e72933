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
#include "typecap/IKernel.hh"
#include "cap/Cap.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  /** number of usable slots of a CNode, slot 0 holds the self reference */
  template<size_t RADIX>
  constexpr size_t childSlotCount() { return (size_t(1) << RADIX) - 1; }

  /** Copy the CNode's own cap into its slot 0, so that a thread whose
   * CSpace root is that CNode can address it. Call this once per CNode.
   */
  template<size_t RADIX>
  optional<Cap<CNode<RADIX>,Child>> generateSelfReference(Cap<CNode<RADIX>,Local> const& cnode)
  {
    TYPECAP_SYSCALL(Error::CNODE_COPY,
                    kernel->cnodeCopy(cnode.cptr(), 0, arch::WORD_BITS,
                                      INIT_THREAD_CNODE, cnode.cptr(), arch::WORD_BITS,
                                      CapRights::RWG()));
    return Cap<CNode<RADIX>,Child>(0);
  }

} // namespace typecap
