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
#include "typecap/mlog.hh"
#include "cap/Cap.hh"
#include "cap/Untyped.hh"
#include "cap/CNodeSlots.hh"
#include "alloc/UTPool.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  /** Untyped buddy allocator whose free list sizes are not tracked
   * statically. Allocations check slots and memory at runtime. */
  template<class ROLE = Local>
  class WUTBuddy
  {
  public:
    WUTBuddy() {}
    WUTBuddy(WUTBuddy const&) = delete;
    WUTBuddy& operator=(WUTBuddy const&) = delete;
    WUTBuddy(WUTBuddy&& o) : pool_(o.pool_) { o.pool_ = UTPool(); }
    WUTBuddy& operator=(WUTBuddy&& o) { pool_ = o.pool_; o.pool_ = UTPool(); return *this; }

    static WUTBuddy uncheckedNew(UTPool const& pool) {
      WUTBuddy res;
      res.pool_ = pool;
      return res;
    }

    size_t count(size_t bits) const { return pool_.count(bits); }
    size_t total() const { return pool_.total(); }
    UTPool const& pool() const { return pool_; }

    optional<Cap<WUntyped<General>>> alloc(WeakSlots<Local>& slots, size_t bits) {
      static_assert(ROLE::IS_LOCAL, "a child's untyped cannot be split here");
      auto ut = pool_.take(bits, slots);
      if (!ut) RETHROW(ut);
      return Cap<WUntyped<General>>(*ut, WUntyped<General>{bits, General()});
    }

    template<size_t BITS>
    optional<Cap<Untyped<BITS>>> allocStrong(WeakSlots<Local>& slots) {
      static_assert(ROLE::IS_LOCAL, "a child's untyped cannot be split here");
      auto ut = pool_.take(BITS, slots);
      if (!ut) RETHROW(ut);
      return Cap<Untyped<BITS>>(*ut);
    }

    optional<void> add(Cap<WUntyped<General>,ROLE>&& ut) {
      Cap<WUntyped<General>,ROLE> src(std::move(ut));
      auto res = pool_.push(src.data().bits, src.cptr());
      if (!res) RETHROW(res);
      src.release();
      return res;
    }

    template<size_t BITS>
    optional<void> add(Cap<Untyped<BITS>,ROLE>&& ut) {
      Cap<Untyped<BITS>,ROLE> src(std::move(ut));
      auto res = pool_.push(BITS, src.cptr());
      if (!res) RETHROW(res);
      src.release();
      return res;
    }

    /** move all untyped into the CSpace of a child */
    optional<WUTBuddy<Child>> moveToChild(WeakSlots<Child>& dest) && {
      static_assert(ROLE::IS_LOCAL, "untyped already belongs to a child");
      auto moved = pool_.moveTo(dest);
      if (!moved) RETHROW(moved);
      pool_ = UTPool();
      MLOG_DETAIL(mlog::alloc, "moved untyped pool to child", DVAR(moved->total()));
      return WUTBuddy<Child>::uncheckedNew(*moved);
    }

  private:
    UTPool pool_;
  };

  inline WUTBuddy<Local> weakUTBuddy(Cap<WUntyped<General>>&& ut)
  {
    Cap<WUntyped<General>> src(std::move(ut));
    UTPool pool;
    auto res = pool.push(src.data().bits, src.release());
    // an empty pool always takes the first untyped
    ASSERT(res.isSuccess());
    return WUTBuddy<Local>::uncheckedNew(pool);
  }

} // namespace typecap
