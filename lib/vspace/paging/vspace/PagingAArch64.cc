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

#include "vspace/PagingAArch64.hh"
#include "typecap/IKernel.hh"
#include "typecap/mlog.hh"
#include "util/error-trace.hh"

namespace typecap {

  namespace {
    /** translate the kernel's answer to a map invocation, a failed
     * lookup means that the paging object above is missing */
    optional<void> layerResult(KernelError err, Error hardFailure, uintptr_t vaddr)
    {
      switch (err) {
      case KernelError::NO_ERROR:
        return optional<void>(Error::SUCCESS);
      case KernelError::FAILED_LOOKUP:
        MLOG_DETAIL(mlog::vspace, "missing paging level", DVARhex(vaddr));
        return optional<void>(Error::MAPPING_OVERFLOW);
      case KernelError::ALIGNMENT_ERROR:
        THROW(Error::ADDR_NOT_PAGE_ALIGNED, DVARhex(vaddr));
      default:
        THROW(hardFailure, DVARhex(vaddr), DVAR(err));
      }
    }
  } // namespace

  optional<void> PageTableLayer::mapGranule(CPtr item, CPtr root, uintptr_t vaddr,
                                            CapRights rights, VMAttributes attrs)
  {
    return layerResult(kernel->pageMap(item, root, vaddr, rights, attrs),
                       Error::PAGE_MAP_FAILURE, vaddr);
  }

  optional<void> PageDirectoryLayer::mapGranule(CPtr item, CPtr root, uintptr_t vaddr,
                                                CapRights, VMAttributes attrs)
  {
    return layerResult(kernel->pageTableMap(item, root, vaddr, attrs),
                       Error::INTERMEDIATE_LAYER_FAILURE, vaddr);
  }

  optional<void> PageUpperDirectoryLayer::mapGranule(CPtr item, CPtr root, uintptr_t vaddr,
                                                     CapRights, VMAttributes attrs)
  {
    return layerResult(kernel->pageDirectoryMap(item, root, vaddr, attrs),
                       Error::INTERMEDIATE_LAYER_FAILURE, vaddr);
  }

  optional<void> PageGlobalDirectoryLayer::mapGranule(CPtr item, CPtr root, uintptr_t vaddr,
                                                      CapRights, VMAttributes attrs)
  {
    return layerResult(kernel->pageUpperDirectoryMap(item, root, vaddr, attrs),
                       Error::INTERMEDIATE_LAYER_FAILURE, vaddr);
  }

} // namespace typecap
