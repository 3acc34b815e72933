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
#include "cap/Cap.hh"
#include "cap/CNodeSlots.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  /** the state of the i-th element of a range, derived from the first */
  template<class T>
  struct RangeElement
  {
    static T at(T const& seed, size_t) { return seed; }
  };

  template<>
  struct RangeElement<Page<Mapped>>
  {
    static Page<Mapped> at(Page<Mapped> const& seed, size_t i) {
      Page<Mapped> res(seed);
      res.state.vaddr += i * arch::PAGE_SIZE;
      return res;
    }
  };

  template<class T, class ROLE>
  class CapRangeIter
  {
  public:
    class iterator
    {
    public:
      iterator(CPtr start, T const& seed, size_t i) : start(start), seed(seed), i(i) {}
      Cap<T,ROLE> operator*() const { return Cap<T,ROLE>(start + i, RangeElement<T>::at(seed, i)); }
      iterator& operator++() { i++; return *this; }
      bool operator!=(iterator const& o) const { return i != o.i; }
    private:
      CPtr start;
      T seed;
      size_t i;
    };

    CapRangeIter(CPtr start, T const& seed, size_t count) : start(start), seed(seed), count(count) {}
    iterator begin() const { return iterator(start, seed, 0); }
    iterator end() const { return iterator(start, seed, count); }

  private:
    CPtr start;
    T seed;
    size_t count;
  };

  template<class T, class ROLE> class WeakCapRange;

  /** N caps of one kind in consecutive slots */
  template<class T, class ROLE, size_t N>
  class CapRange
  {
  public:
    static constexpr size_t COUNT = N;

    CapRange() : start_(NULL_CAP) {}
    CapRange(CapRange const&) = delete;
    CapRange& operator=(CapRange const&) = delete;
    CapRange(CapRange&& o) : start_(o.start_), seed_(o.seed_) { o.start_ = NULL_CAP; }
    CapRange& operator=(CapRange&& o) {
      start_ = o.start_; seed_ = o.seed_; o.start_ = NULL_CAP; return *this;
    }

    static CapRange uncheckedNew(CPtr start, T const& seed) { return CapRange(start, seed); }

    CPtr startCptr() const { return start_; }
    T const& seed() const { return seed_; }
    constexpr size_t size() const { return N; }

    CapRangeIter<T,ROLE> iter() && {
      CapRangeIter<T,ROLE> res(start_, seed_, N);
      start_ = NULL_CAP;
      return res;
    }

    /** copy all caps into dest with the given rights */
    template<class DEST, class U = T>
    optional<CapRange<typename CopyAliasable<U>::Output, DEST, N>>
    copy(Slots<N,DEST>&& dest, CapRights rights) const {
      static_assert(ROLE::IS_LOCAL, "only local caps can be copied");
      static_assert(CopyAliasable<U>::value, "capability kind cannot be aliased");
      typedef typename CopyAliasable<U>::Output Out;
      Slots<N,DEST> slots(std::move(dest));
      for (size_t i = 0; i < N; i++) {
        Cap<T,Local> alias(start_ + i, RangeElement<T>::at(seed_, i));
        auto res = uncheckedCopy(alias, slots.cnode(), slots.offset() + i, rights);
        alias.release();
        if (!res) RETHROW(res);
      }
      return CapRange<Out,DEST,N>::uncheckedNew(slots.offset(), CopyAliasable<U>::output(seed_));
    }

    WeakCapRange<T,ROLE> weaken() && {
      auto res = WeakCapRange<T,ROLE>::uncheckedNew(start_, seed_, N);
      start_ = NULL_CAP;
      return res;
    }

  private:
    CapRange(CPtr start, T const& seed) : start_(start), seed_(seed) {}

    CPtr start_;
    T seed_;
  };

  /** caps of one kind in consecutive slots, counted at runtime */
  template<class T, class ROLE>
  class WeakCapRange
  {
  public:
    WeakCapRange() : start_(NULL_CAP), count_(0) {}
    WeakCapRange(WeakCapRange const&) = delete;
    WeakCapRange& operator=(WeakCapRange const&) = delete;
    WeakCapRange(WeakCapRange&& o) : start_(o.start_), seed_(o.seed_), count_(o.count_) { o.count_ = 0; }
    WeakCapRange& operator=(WeakCapRange&& o) {
      start_ = o.start_; seed_ = o.seed_; count_ = o.count_; o.count_ = 0; return *this;
    }

    static WeakCapRange uncheckedNew(CPtr start, T const& seed, size_t count) {
      return WeakCapRange(start, seed, count);
    }

    CPtr startCptr() const { return start_; }
    T const& seed() const { return seed_; }
    size_t size() const { return count_; }

    CapRangeIter<T,ROLE> iter() && {
      CapRangeIter<T,ROLE> res(start_, seed_, count_);
      count_ = 0;
      return res;
    }

    template<size_t N>
    optional<CapRange<T,ROLE,N>> asStrong() && {
      if (N != count_) THROW(Error::INVALID_ARGUMENT, DVAR(count_));
      count_ = 0;
      return CapRange<T,ROLE,N>::uncheckedNew(start_, seed_);
    }

    /** copy all caps into dest, which must hold enough slots */
    template<class DEST, class U = T>
    optional<WeakCapRange<typename CopyAliasable<U>::Output, DEST>>
    copy(WeakSlots<DEST>& dest, CapRights rights) const {
      static_assert(ROLE::IS_LOCAL, "only local caps can be copied");
      static_assert(CopyAliasable<U>::value, "capability kind cannot be aliased");
      typedef typename CopyAliasable<U>::Output Out;
      auto slots = dest.alloc(count_);
      if (!slots) RETHROW(slots);
      for (size_t i = 0; i < count_; i++) {
        Cap<T,Local> alias(start_ + i, RangeElement<T>::at(seed_, i));
        auto res = uncheckedCopy(alias, slots->cnode(), slots->offset() + i, rights);
        alias.release();
        if (!res) RETHROW(res);
      }
      return WeakCapRange<Out,DEST>::uncheckedNew(slots->offset(), CopyAliasable<U>::output(seed_), count_);
    }

  private:
    WeakCapRange(CPtr start, T const& seed, size_t count) : start_(start), seed_(seed), count_(count) {}

    CPtr start_;
    T seed_;
    size_t count_;
  };

} // namespace typecap
