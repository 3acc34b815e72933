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
#include "typecap/config.hh"
#include "typecap/IKernel.hh"
#include "typecap/mlog.hh"
#include "cap/Cap.hh"
#include "cap/CNodeSlots.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  /** An ASID that is bound to a paging root. It identifies the
   * address space and can be compared and passed around freely. */
  class AssignedASID
  {
  public:
    AssignedASID() : asid_(0) {}
    explicit AssignedASID(asid_t asid) : asid_(asid) {}
    asid_t value() const { return asid_; }
    bool operator==(AssignedASID const& o) const { return asid_ == o.asid_; }
    bool operator!=(AssignedASID const& o) const { return asid_ != o.asid_; }
  private:
    asid_t asid_;
  };

  /** the right to bind one ASID of a pool to a paging root */
  class UnassignedASID
  {
  public:
    UnassignedASID() : pool_(NULL_CAP), asid_(0) {}
    UnassignedASID(UnassignedASID const&) = delete;
    UnassignedASID& operator=(UnassignedASID const&) = delete;
    UnassignedASID(UnassignedASID&& o) : pool_(o.pool_), asid_(o.asid_) { o.pool_ = NULL_CAP; }
    UnassignedASID& operator=(UnassignedASID&& o) {
      pool_ = o.pool_; asid_ = o.asid_; o.pool_ = NULL_CAP; return *this;
    }

    static UnassignedASID uncheckedNew(CPtr pool, asid_t asid) { return UnassignedASID(pool, asid); }
    CPtr pool() const { return pool_; }
    asid_t value() const { return asid_; }

  private:
    UnassignedASID(CPtr pool, asid_t asid) : pool_(pool), asid_(asid) {}
    CPtr pool_;
    asid_t asid_;
  };

  /** A pool with FREE unassigned ASIDs. The kernel hands out the lowest
   * free entry of a pool, so the next value is known in advance. */
  template<size_t FREE>
  class ASIDPool
  {
  public:
    static constexpr size_t FREE_COUNT = FREE;

    ASIDPool() : cptr_(NULL_CAP), next_(0) {}
    ASIDPool(ASIDPool const&) = delete;
    ASIDPool& operator=(ASIDPool const&) = delete;
    ASIDPool(ASIDPool&& o) : cptr_(o.cptr_), next_(o.next_) { o.cptr_ = NULL_CAP; }
    ASIDPool& operator=(ASIDPool&& o) {
      cptr_ = o.cptr_; next_ = o.next_; o.cptr_ = NULL_CAP; return *this;
    }

    static ASIDPool uncheckedNew(CPtr cptr, asid_t next) { return ASIDPool(cptr, next); }
    CPtr cptr() const { return cptr_; }

    std::pair<UnassignedASID, ASIDPool<FREE-1>> alloc() && {
      static_assert(FREE > 0, "ASID pool is exhausted");
      auto asid = UnassignedASID::uncheckedNew(cptr_, next_);
      auto rest = ASIDPool<FREE-1>::uncheckedNew(cptr_, next_ + 1);
      cptr_ = NULL_CAP;
      return std::make_pair(std::move(asid), std::move(rest));
    }

  private:
    ASIDPool(CPtr cptr, asid_t next) : cptr_(cptr), next_(next) {}
    CPtr cptr_;
    asid_t next_;
  };

  /** The single authority that creates ASID pools. REMAINING counts
   * the pools that can still be made. */
  template<size_t REMAINING>
  class ASIDControl
  {
  public:
    ASIDControl() : cptr_(NULL_CAP) {}
    ASIDControl(ASIDControl const&) = delete;
    ASIDControl& operator=(ASIDControl const&) = delete;
    ASIDControl(ASIDControl&& o) : cptr_(o.cptr_) { o.cptr_ = NULL_CAP; }
    ASIDControl& operator=(ASIDControl&& o) { cptr_ = o.cptr_; o.cptr_ = NULL_CAP; return *this; }

    static ASIDControl uncheckedNew(CPtr cptr) { return ASIDControl(cptr); }
    CPtr cptr() const { return cptr_; }

    optional<std::pair<ASIDPool<ASIDPoolSize>, ASIDControl<REMAINING-1>>>
    makePool(Cap<Untyped<arch::ASID_POOL_BITS>>&& ut, Slots<1,Local>&& dest) && {
      static_assert(REMAINING > 0, "no ASID pools left");
      Cap<Untyped<arch::ASID_POOL_BITS>> src(std::move(ut));
      Slots<1,Local> slot(std::move(dest));
      TYPECAP_SYSCALL(Error::ASID_CONTROL_MAKE_POOL,
                      kernel->asidControlMakePool(cptr_, src.cptr(), slot.cnode(),
                                                  slot.offset(), arch::WORD_BITS));
      asid_t base = asid_t((ASIDPoolCount - REMAINING) * ASIDPoolSize);
      MLOG_DETAIL(mlog::cap, "new asid pool", DVAR(slot.offset()), DVAR(base));
      auto pool = ASIDPool<ASIDPoolSize>::uncheckedNew(slot.offset(), base);
      auto rest = ASIDControl<REMAINING-1>::uncheckedNew(cptr_);
      cptr_ = NULL_CAP;
      return std::make_pair(std::move(pool), std::move(rest));
    }

  private:
    explicit ASIDControl(CPtr cptr) : cptr_(cptr) {}
    CPtr cptr_;
  };

  /** bind the ASID to the paging root, a root takes only one ASID */
  inline optional<AssignedASID> assign(UnassignedASID&& asid, Cap<PagingRoot,Local> const& root)
  {
    UnassignedASID src(std::move(asid));
    TYPECAP_SYSCALL(Error::ASID_POOL_ASSIGN, kernel->asidPoolAssign(src.pool(), root.cptr()));
    MLOG_DETAIL(mlog::cap, "assigned asid", DVAR(src.value()), DVAR(root.cptr()));
    return AssignedASID(src.value());
  }

} // namespace typecap
