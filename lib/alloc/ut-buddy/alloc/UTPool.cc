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

#include "alloc/UTPool.hh"
#include "cap/Untyped.hh"
#include "typecap/IKernel.hh"
#include "typecap/mlog.hh"
#include "util/error-trace.hh"

namespace typecap {

  UTPool::UTPool()
  {
    for (size_t i = 0; i < NUM_SIZES; i++) counts[i] = 0;
  }

  size_t UTPool::count(size_t bits) const
  {
    if (bits < arch::MIN_UNTYPED_BITS || bits > arch::MAX_UNTYPED_BITS) return 0;
    return counts[bits - arch::MIN_UNTYPED_BITS];
  }

  size_t UTPool::total() const
  {
    size_t sum = 0;
    for (size_t i = 0; i < NUM_SIZES; i++) sum += counts[i];
    return sum;
  }

  optional<void> UTPool::push(size_t bits, CPtr ut)
  {
    if (bits < arch::MIN_UNTYPED_BITS || bits > arch::MAX_UNTYPED_BITS)
      THROW(Error::INVALID_ARGUMENT, DVAR(bits));
    size_t index = bits - arch::MIN_UNTYPED_BITS;
    if (counts[index] == UTPoolSlotsPerSize) THROW(Error::UT_POOL_FULL, DVAR(bits));
    caps[index][counts[index]++] = ut;
    return optional<void>(Error::SUCCESS);
  }

  size_t UTPool::slotsNeeded(size_t bits) const
  {
    if (bits < arch::MIN_UNTYPED_BITS || bits > arch::MAX_UNTYPED_BITS) return 0;
    size_t target = bits - arch::MIN_UNTYPED_BITS;
    for (size_t src = target; src < NUM_SIZES; src++) {
      if (counts[src] > 0) return 2 * (src - target);
    }
    return 0;
  }

  optional<CPtr> UTPool::take(size_t bits, WeakSlots<Local>& slots)
  {
    if (bits < arch::MIN_UNTYPED_BITS || bits > arch::MAX_UNTYPED_BITS)
      THROW(Error::INVALID_ARGUMENT, DVAR(bits));
    size_t target = bits - arch::MIN_UNTYPED_BITS;
    size_t src = target;
    while (src < NUM_SIZES && counts[src] == 0) src++;
    if (src == NUM_SIZES) THROW(Error::UNTYPED_EXHAUSTED, DVAR(bits));

    size_t needed = 2 * (src - target);
    if (slots.size() < needed) THROW(Error::NOT_ENOUGH_SLOTS, DVAR(needed), DVAR(slots.size()));

    CPtr cur = pop(src);
    for (size_t i = src; i > target; i--) {
      auto dest = slots.alloc(2);
      if (!dest) RETHROW(dest);
      auto res = internal::retypeRaw(cur, ObjectType::UNTYPED, i - 1 + arch::MIN_UNTYPED_BITS,
                                     dest->cnode(), dest->offset(), 2);
      if (!res) RETHROW(res);
      // lists between target and src were empty, they take one half each
      caps[i-1][counts[i-1]++] = dest->offset() + 1;
      cur = dest->offset();
    }
    MLOG_DETAIL(mlog::alloc, "took untyped", DVAR(bits), DVAR(cur), DVAR(needed));
    return cur;
  }

  optional<UTPool> UTPool::moveTo(WeakSlots<Child>& dest) const
  {
    if (dest.size() < total()) THROW(Error::NOT_ENOUGH_SLOTS, DVAR(dest.size()), DVAR(total()));
    UTPool moved;
    auto iter = dest.incrementallyConsumingIter();
    for (size_t i = 0; i < NUM_SIZES; i++) {
      for (size_t j = 0; j < counts[i]; j++) {
        auto slot = iter.next();
        TYPECAP_SYSCALL(Error::CNODE_MOVE,
                        kernel->cnodeMove(slot.cnode(), slot.offset(), arch::WORD_BITS,
                                          INIT_THREAD_CNODE, caps[i][j], arch::WORD_BITS));
        moved.caps[i][moved.counts[i]++] = slot.offset();
      }
    }
    return moved;
  }

} // namespace typecap
