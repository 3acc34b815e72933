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
#include <type_traits>
#include "typecap/caps.hh"
#include "typecap/IKernel.hh"
#include "typecap/mlog.hh"
#include "cap/Role.hh"
#include "util/optional.hh"
#include "util/assert.hh"

namespace typecap {

  template<size_t N, class ROLE> class Slots;
  template<class ROLE> class WeakSlots;

  /** Iterates over single slots of a range, front to back. */
  template<class ROLE>
  class SlotIter
  {
  public:
    class iterator
    {
    public:
      iterator(CPtr cnode, CPtr cur) : cnode(cnode), cur(cur) {}
      Slots<1,ROLE> operator*() const { return Slots<1,ROLE>::uncheckedNew(cnode, cur); }
      iterator& operator++() { cur++; return *this; }
      bool operator!=(iterator const& o) const { return cur != o.cur; }
    private:
      CPtr cnode;
      CPtr cur;
    };

    SlotIter(CPtr cnode, CPtr offset, size_t count)
      : cnode(cnode), offset(offset), count(count) {}
    iterator begin() const { return iterator(cnode, offset); }
    iterator end() const { return iterator(cnode, offset+count); }
    size_t size() const { return count; }

  private:
    CPtr cnode;
    CPtr offset;
    size_t count;
  };

  /** Revokes and clears a range of slots when it goes out of scope,
   * last slot first. */
  class TemporaryScope
  {
  public:
    TemporaryScope(CPtr cnode, CPtr offset, size_t count)
      : cnode(cnode), offset(offset), count(count) {}
    TemporaryScope(TemporaryScope const&) = delete;
    TemporaryScope& operator=(TemporaryScope const&) = delete;

    ~TemporaryScope() {
      for (size_t i = count; i > 0; i--) {
        CPtr index = offset + i - 1;
        auto err = kernel->cnodeRevoke(cnode, index, arch::WORD_BITS);
        PANIC_MSG(err == KernelError::NO_ERROR, "revoke of a temporary slot failed");
        err = kernel->cnodeDelete(cnode, index, arch::WORD_BITS);
        PANIC_MSG(err == KernelError::NO_ERROR, "delete of a temporary slot failed");
      }
      MLOG_DETAIL(mlog::cap, "cleared temporary slots", DVAR(cnode), DVAR(offset), DVAR(count));
    }

  private:
    CPtr cnode;
    CPtr offset;
    size_t count;
  };

  /** A range of N empty slots in a CNode. The range owns its slots,
   * splitting it hands the ownership on to the parts. For local slots
   * the CNode is the root CNode and the offset doubles as capability
   * pointer.
   */
  template<size_t N, class ROLE = Local>
  class Slots
  {
  public:
    static_assert(IsRole<ROLE>::value, "unknown capability role");
    static constexpr size_t COUNT = N;

    Slots() : cnode_(NULL_CAP), offset_(0) {}
    Slots(Slots const&) = delete;
    Slots& operator=(Slots const&) = delete;
    Slots(Slots&& o) : cnode_(o.cnode_), offset_(o.offset_) { o.cnode_ = NULL_CAP; }
    Slots& operator=(Slots&& o) {
      cnode_ = o.cnode_; offset_ = o.offset_; o.cnode_ = NULL_CAP; return *this;
    }

    /** wrap slots that are known to be empty and owned by nobody else */
    static Slots uncheckedNew(CPtr cnode, CPtr offset) { return Slots(cnode, offset); }

    CPtr cnode() const { return cnode_; }
    CPtr offset() const { return offset_; }
    constexpr size_t size() const { return N; }

    template<size_t K>
    std::pair<Slots<K,ROLE>, Slots<N-K,ROLE>> alloc() && {
      static_assert(K <= N, "not enough slots in the range");
      auto first = Slots<K,ROLE>::uncheckedNew(cnode_, offset_);
      auto rest = Slots<N-K,ROLE>::uncheckedNew(cnode_, offset_ + K);
      cnode_ = NULL_CAP;
      return std::make_pair(std::move(first), std::move(rest));
    }

    WeakSlots<ROLE> weaken() && {
      auto res = WeakSlots<ROLE>::uncheckedNew(cnode_, offset_, N);
      cnode_ = NULL_CAP;
      return res;
    }

    SlotIter<ROLE> iter() && {
      SlotIter<ROLE> res(cnode_, offset_, N);
      cnode_ = NULL_CAP;
      return res;
    }

    /** Lends the slots to f. Whatever f leaves in them is revoked and
     * deleted afterwards, also when f fails, and the now empty slots
     * are handed back together with the result of f. f reports only
     * success or failure, caps made in the slots cannot leave the scope.
     */
    template<class F>
    std::pair<optional<void>, Slots> withTemporary(F f) && {
      static_assert(std::is_same<decltype(f(std::declval<Slots>())), optional<void>>::value,
                    "a temporary scope returns optional<void>");
      optional<void> res = runScoped(f);
      return std::make_pair(res, std::move(*this));
    }

  private:
    Slots(CPtr cnode, CPtr offset) : cnode_(cnode), offset_(offset) {}

    template<class F>
    optional<void> runScoped(F& f) {
      TemporaryScope scope(cnode_, offset_, N);
      return f(Slots(cnode_, offset_));
    }

    CPtr cnode_;
    CPtr offset_;
  };

  /** A range of empty slots whose size is only known at runtime. */
  template<class ROLE = Local>
  class WeakSlots
  {
  public:
    static_assert(IsRole<ROLE>::value, "unknown capability role");

    /** Hands out one slot at a time and shrinks the range it came from. */
    class ConsumingIter
    {
    public:
      explicit ConsumingIter(WeakSlots& slots) : slots(slots) {}
      bool hasNext() const { return slots.size() > 0; }
      Slots<1,ROLE> next() {
        ASSERT(hasNext());
        auto res = Slots<1,ROLE>::uncheckedNew(slots.cnode_, slots.offset_);
        slots.offset_++;
        slots.count_--;
        return res;
      }
    private:
      WeakSlots& slots;
    };

    WeakSlots() : cnode_(NULL_CAP), offset_(0), count_(0) {}
    WeakSlots(WeakSlots const&) = delete;
    WeakSlots& operator=(WeakSlots const&) = delete;
    WeakSlots(WeakSlots&& o) : cnode_(o.cnode_), offset_(o.offset_), count_(o.count_) { o.count_ = 0; }
    WeakSlots& operator=(WeakSlots&& o) {
      cnode_ = o.cnode_; offset_ = o.offset_; count_ = o.count_; o.count_ = 0; return *this;
    }

    static WeakSlots uncheckedNew(CPtr cnode, CPtr offset, size_t count) {
      return WeakSlots(cnode, offset, count);
    }

    CPtr cnode() const { return cnode_; }
    CPtr offset() const { return offset_; }
    size_t size() const { return count_; }

    /** split count slots off the front */
    optional<WeakSlots> alloc(size_t count) {
      if (count > count_) THROW(Error::NOT_ENOUGH_SLOTS, DVAR(count), DVAR(count_));
      WeakSlots res(cnode_, offset_, count);
      offset_ += count;
      count_ -= count;
      return std::move(res);
    }

    template<size_t K>
    optional<Slots<K,ROLE>> allocStrong() {
      if (K > count_) THROW(Error::NOT_ENOUGH_SLOTS, DVAR(K), DVAR(count_));
      auto res = Slots<K,ROLE>::uncheckedNew(cnode_, offset_);
      offset_ += K;
      count_ -= K;
      return std::move(res);
    }

    SlotIter<ROLE> iter() && {
      SlotIter<ROLE> res(cnode_, offset_, count_);
      count_ = 0;
      return res;
    }

    ConsumingIter incrementallyConsumingIter() { return ConsumingIter(*this); }

  private:
    WeakSlots(CPtr cnode, CPtr offset, size_t count)
      : cnode_(cnode), offset_(offset), count_(count) {}

    CPtr cnode_;
    CPtr offset_;
    size_t count_;
  };

  template<size_t N> using LocalSlots = Slots<N, Local>;
  template<size_t N> using ChildSlots = Slots<N, Child>;

} // namespace typecap
