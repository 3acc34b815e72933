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

#include "typecap/caps.hh"
#include "cap/objects.hh"
#include "vspace/Paging.hh"
#include "util/optional.hh"

namespace typecap {

  /** Each layer maps its Item into the paging object of the layer.
   * Mapping fails with MAPPING_OVERFLOW if that paging object does not
   * exist yet at vaddr.
   */

  struct PageTableLayer
  {
    typedef Page<Unmapped> Item;
    static optional<void> mapGranule(CPtr item, CPtr root, uintptr_t vaddr,
                                     CapRights rights, VMAttributes attrs);
  };

  struct PageDirectoryLayer
  {
    typedef PageTable Item;
    static optional<void> mapGranule(CPtr item, CPtr root, uintptr_t vaddr,
                                     CapRights rights, VMAttributes attrs);
  };

  struct PageUpperDirectoryLayer
  {
    typedef PageDirectory Item;
    static optional<void> mapGranule(CPtr item, CPtr root, uintptr_t vaddr,
                                     CapRights rights, VMAttributes attrs);
  };

  struct PageGlobalDirectoryLayer
  {
    typedef PageUpperDirectory Item;
    static optional<void> mapGranule(CPtr item, CPtr root, uintptr_t vaddr,
                                     CapRights rights, VMAttributes attrs);
  };

  /** global dir -> upper dir -> dir -> table -> page */
  typedef PagingRec<PageTableLayer,
            PagingRec<PageDirectoryLayer,
              PagingRec<PageUpperDirectoryLayer,
                PagingTop<PageGlobalDirectoryLayer>>>> AArch64Paging;

  typedef AArch64Paging ArchPaging;

} // namespace typecap
