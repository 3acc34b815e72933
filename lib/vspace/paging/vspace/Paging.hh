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
#include <utility>
#include "typecap/caps.hh"
#include "typecap/mlog.hh"
#include "cap/Cap.hh"
#include "cap/Untyped.hh"
#include "cap/CNodeSlots.hh"
#include "alloc/WUTBuddy.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  /** The uppermost paging layer. A missing level above it cannot be
   * created, so an overflow here is a hard failure.
   */
  template<class LAYER>
  struct PagingTop
  {
    typedef LAYER layer_t;
    typedef typename LAYER::Item Item;
    static constexpr size_t DEPTH = 1;

    static optional<void> mapItem(CPtr item, CPtr root, uintptr_t vaddr,
                                  CapRights rights, VMAttributes attrs,
                                  WUTBuddy<Local>&, WeakSlots<Local>&)
    {
      auto res = LAYER::mapGranule(item, root, vaddr, rights, attrs);
      if (res.state() == Error::MAPPING_OVERFLOW)
        THROW(Error::INTERMEDIATE_LAYER_FAILURE, DVARhex(vaddr));
      return res;
    }
  };

  /** One paging layer followed by the layers above it. When the layer
   * reports that the object it maps into is missing, the object is
   * created from the untyped pool, mapped by the layers above, and the
   * map is tried once more.
   */
  template<class LAYER, class NEXT>
  struct PagingRec
  {
    typedef LAYER layer_t;
    typedef NEXT next_t;
    typedef typename LAYER::Item Item;
    static constexpr size_t DEPTH = NEXT::DEPTH + 1;

    static optional<void> mapItem(CPtr item, CPtr root, uintptr_t vaddr,
                                  CapRights rights, VMAttributes attrs,
                                  WUTBuddy<Local>& utb, WeakSlots<Local>& slots)
    {
      auto res = LAYER::mapGranule(item, root, vaddr, rights, attrs);
      if (res.state() != Error::MAPPING_OVERFLOW) return res;

      auto made = makeContainer(root, vaddr, attrs, utb, slots);
      if (!made) RETHROW(made);

      res = LAYER::mapGranule(item, root, vaddr, rights, attrs);
      if (res.state() == Error::MAPPING_OVERFLOW)
        THROW(Error::INTERMEDIATE_LAYER_FAILURE, DVARhex(vaddr));
      return res;
    }

  private:
    static optional<void> makeContainer(CPtr root, uintptr_t vaddr, VMAttributes attrs,
                                        WUTBuddy<Local>& utb, WeakSlots<Local>& slots)
    {
      typedef typename NEXT::Item Container;
      auto slot = slots.allocStrong<1>();
      if (!slot) THROW(Error::INSUFFICIENT_CNODE_SLOTS, DVARhex(vaddr));
      auto ut = utb.alloc(slots, ObjectTraits<Container>::SIZE_BITS);
      if (!ut) {
        if (ut.state() == Error::UNTYPED_EXHAUSTED) THROW(Error::RETYPE_ERROR, DVARhex(vaddr));
        THROW(Error::UT_BUDDY_ERROR, DVARhex(vaddr), DVAR(ut.state()));
      }
      auto container = retype<Container>(std::move(*ut), std::move(*slot));
      if (!container) THROW(Error::RETYPE_ERROR, DVARhex(vaddr), DVAR(container.state()));
      MLOG_DETAIL(mlog::vspace, "new paging object", DVAR(container->cptr()), DVARhex(vaddr));
      // paging objects stay in their slots for the lifetime of the address space
      return NEXT::mapItem(container->release(), root, vaddr, CapRights::RW(), attrs, utb, slots);
    }
  };

} // namespace typecap
