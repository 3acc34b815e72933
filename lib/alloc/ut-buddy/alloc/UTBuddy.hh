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
#include "alloc/WUTBuddy.hh"
#include "util/assert.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  template<size_t... COUNTS> class UTBuddy;

namespace buddy {

  constexpr size_t MIN_BITS = arch::MIN_UNTYPED_BITS;

  /** compile time view of the free list sizes, index i holds untyped of MIN_BITS+i bits */
  template<size_t... C>
  struct Counts
  {
    static constexpr size_t SIZE = sizeof...(C);

    static constexpr size_t at(size_t i) {
      constexpr size_t values[] = {C..., 0};
      return i < SIZE ? values[i] : 0;
    }

    static constexpr size_t max() {
      size_t res = 0;
      for (size_t i = 0; i < SIZE; i++) if (at(i) > res) res = at(i);
      return res;
    }

    /** smallest populated index at or above target, SIZE if there is none */
    static constexpr size_t source(size_t target) {
      for (size_t j = target; j < SIZE; j++) if (at(j) > 0) return j;
      return SIZE;
    }

    static constexpr size_t slotCount(size_t target) {
      return source(target) < SIZE ? 2 * (source(target) - target) : 0;
    }

    /** size of list i after one untyped was taken from list target */
    static constexpr size_t newCount(size_t i, size_t target) {
      return i == source(target) ? at(i) - 1
        : (i >= target && i < source(target) ? 1 : at(i));
    }
  };

  template<size_t TARGET, class SEQ, size_t... C> struct TakeResultImpl;

  template<size_t TARGET, size_t... I, size_t... C>
  struct TakeResultImpl<TARGET, std::index_sequence<I...>, C...>
  {
    typedef UTBuddy<Counts<C...>::newCount(I, TARGET)...> type;
  };

  /** the buddy type left over after taking one untyped of list TARGET */
  template<size_t TARGET, size_t... C>
  using TakeResult = typename TakeResultImpl<TARGET, std::make_index_sequence<sizeof...(C)>, C...>::type;

  template<size_t BITS, class SEQ> struct InitialImpl;

  template<size_t BITS, size_t... I>
  struct InitialImpl<BITS, std::index_sequence<I...>>
  {
    typedef UTBuddy<(I == BITS - MIN_BITS ? 1 : 0)...> type;
  };

  /** the buddy type holding exactly one untyped of BITS bits */
  template<size_t BITS>
  using Initial = typename InitialImpl<BITS, std::make_index_sequence<BITS - MIN_BITS + 1>>::type;

} // namespace buddy

  /** Untyped buddy allocator with the free list sizes in its type.
   * COUNTS[i] untyped of MIN_UNTYPED_BITS+i bits are available. An
   * allocation yields the buddy type of the remaining lists, and
   * requesting a size that is not available fails to compile, as does
   * passing a wrong number of slots for the splits.
   */
  template<size_t... COUNTS>
  class UTBuddy
  {
  public:
    typedef buddy::Counts<COUNTS...> counts_t;
    static_assert(counts_t::max() <= UTPoolSlotsPerSize, "free list exceeds the pool capacity");

    UTBuddy() {}
    UTBuddy(UTBuddy const&) = delete;
    UTBuddy& operator=(UTBuddy const&) = delete;
    UTBuddy(UTBuddy&& o) : pool_(o.pool_) { o.pool_ = UTPool(); }
    UTBuddy& operator=(UTBuddy&& o) { pool_ = o.pool_; o.pool_ = UTPool(); return *this; }

    static UTBuddy uncheckedNew(UTPool const& pool) {
      UTBuddy res;
      res.pool_ = pool;
      return res;
    }

    static constexpr size_t count(size_t bits) { return counts_t::at(bits - buddy::MIN_BITS); }

    /** slots consumed by alloc<BITS> */
    static constexpr size_t slotCount(size_t bits) { return counts_t::slotCount(bits - buddy::MIN_BITS); }

    UTPool const& pool() const { return pool_; }

    template<size_t BITS, size_t N>
    optional<std::pair<Cap<Untyped<BITS>>, buddy::TakeResult<BITS - buddy::MIN_BITS, COUNTS...>>>
    alloc(Slots<N,Local>&& slots) && {
      static_assert(BITS >= buddy::MIN_BITS && BITS - buddy::MIN_BITS < counts_t::SIZE,
                    "size is not managed by this buddy");
      static_assert(counts_t::source(BITS - buddy::MIN_BITS) < counts_t::SIZE,
                    "no untyped large enough is left");
      static_assert(N == counts_t::slotCount(BITS - buddy::MIN_BITS),
                    "wrong number of slots for this allocation");
      typedef buddy::TakeResult<BITS - buddy::MIN_BITS, COUNTS...> rest_t;
      WeakSlots<Local> weak = std::move(slots).weaken();
      auto ut = pool_.take(BITS, weak);
      if (!ut) RETHROW(ut);
      ASSERT(weak.size() == 0);
      auto rest = rest_t::uncheckedNew(pool_);
      pool_ = UTPool();
      return std::make_pair(Cap<Untyped<BITS>>(*ut), std::move(rest));
    }

    WUTBuddy<Local> weaken() && {
      auto res = WUTBuddy<Local>::uncheckedNew(pool_);
      pool_ = UTPool();
      return res;
    }

  private:
    UTPool pool_;
  };

  /** a buddy that starts out with one untyped */
  template<size_t BITS>
  buddy::Initial<BITS> utBuddy(Cap<Untyped<BITS>>&& ut)
  {
    Cap<Untyped<BITS>> src(std::move(ut));
    UTPool pool;
    auto res = pool.push(BITS, src.release());
    ASSERT(res.isSuccess());
    return buddy::Initial<BITS>::uncheckedNew(pool);
  }

} // namespace typecap
