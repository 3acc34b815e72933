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
#include "typecap/Error.hh"
#include "util/error-trace.hh"

namespace typecap {

  /** The kernel invocations the capability manager relies on.
   *
   * Capability pointers are resolved in the CSpace of the calling
   * thread. A destination is named by a CNode root, an index into
   * that root resolved with the given depth and, for retype, an
   * offset into the resulting CNode. A depth of 0 names the root
   * itself.
   */
  class IKernel
  {
  public:
    virtual ~IKernel() {}

    virtual KernelError untypedRetype(CPtr untyped, ObjectType type, size_t sizeBits,
                                      CPtr root, CPtr nodeIndex, size_t nodeDepth,
                                      CPtr nodeOffset, size_t numObjects) = 0;

    virtual KernelError cnodeCopy(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                                  CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth,
                                  CapRights rights) = 0;
    virtual KernelError cnodeMint(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                                  CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth,
                                  CapRights rights, Badge badge) = 0;
    virtual KernelError cnodeMove(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                                  CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth) = 0;
    virtual KernelError cnodeMutate(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                                    CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth,
                                    CNodeCapData data) = 0;
    virtual KernelError cnodeDelete(CPtr root, CPtr index, uint8_t depth) = 0;
    virtual KernelError cnodeRevoke(CPtr root, CPtr index, uint8_t depth) = 0;

    virtual KernelError asidControlMakePool(CPtr control, CPtr untyped,
                                            CPtr root, CPtr index, uint8_t depth) = 0;
    virtual KernelError asidPoolAssign(CPtr pool, CPtr vspace) = 0;

    virtual KernelError pageMap(CPtr page, CPtr vspace, uintptr_t vaddr,
                                CapRights rights, VMAttributes attr) = 0;
    virtual KernelError pageUnmap(CPtr page) = 0;
    virtual KernelError pageGetAddress(CPtr page, uintptr_t& paddr) = 0;

    virtual KernelError pageTableMap(CPtr table, CPtr vspace, uintptr_t vaddr, VMAttributes attr) = 0;
    virtual KernelError pageDirectoryMap(CPtr dir, CPtr vspace, uintptr_t vaddr, VMAttributes attr) = 0;
    virtual KernelError pageUpperDirectoryMap(CPtr dir, CPtr vspace, uintptr_t vaddr, VMAttributes attr) = 0;
  };

  /** the kernel used by all capability operations of this process */
  extern IKernel* kernel;

} // namespace typecap

/** invoke the kernel and return the typed error if it refuses. */
#define TYPECAP_SYSCALL(op, call) \
  do { \
    ::typecap::KernelError kerr = (call); \
    if (kerr != ::typecap::KernelError::NO_ERROR) THROW(op, DVAR(kerr)); \
  } while (false)
