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

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <new>
#include <utility>
#include "typecap/mlog.hh"
#include "util/Backoff.hh"
#include "util/align.hh"
#include "util/assert.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  enum : size_t { CACHELINESIZE = 64 };

  template<class V>
  struct alignas(CACHELINESIZE) CachePadded
  {
    V value;
  };

  /** Bounded multi-producer multi-consumer queue.
   *
   * Head and tail are positions made of a lap in the high bits and a
   * slot index in the low bits, oneLap is the smallest power of two
   * above the capacity. A slot's stamp equals tail when the slot is
   * free for the producer of that lap, and head+1 when it holds a value
   * for the consumer. Consuming sets the stamp one lap ahead.
   *
   * The slot buffer is addressed relative to the queue object, so a
   * queue placed in a shared page works from every address space the
   * page is mapped into. The queue must not be moved.
   */
  template<class T>
  class ArrayQueue
  {
  public:
    struct alignas(CACHELINESIZE) Slot
    {
      std::atomic<size_t> stamp;
      alignas(T) unsigned char storage[sizeof(T)];
      T* value() { return reinterpret_cast<T*>(storage); }
    };

    /** queue over a caller supplied buffer of capacity slots */
    ArrayQueue(size_t capacity, Slot* buffer)
      : cap(capacity), oneLap(nextPowerOfTwo(capacity + 1)),
        offset(reinterpret_cast<uintptr_t>(buffer) - reinterpret_cast<uintptr_t>(this))
    {
      ASSERT(capacity > 0);
      head.value.store(0, std::memory_order_relaxed);
      tail.value.store(0, std::memory_order_relaxed);
      for (size_t i = 0; i < cap; i++) new (&slots()[i].stamp) std::atomic<size_t>(i);
    }

    ArrayQueue(ArrayQueue const&) = delete;
    ArrayQueue& operator=(ArrayQueue const&) = delete;

    ~ArrayQueue() {
      size_t count = size();
      if (count > cap) count = cap;
      size_t hix = head.value.load(std::memory_order_relaxed) & (oneLap - 1);
      for (size_t i = 0; i < count; i++) {
        size_t index = hix + i < cap ? hix + i : hix + i - cap;
        slots()[index].value()->~T();
      }
    }

    /** bytes needed to place a queue of this capacity with constructAt */
    static size_t bytesFor(size_t capacity) { return headerBytes() + capacity * sizeof(Slot); }

    /** Construct a queue at mem, e.g. a shared page, with the slots
     * placed right behind the queue object. */
    static optional<ArrayQueue*> constructAt(void* mem, size_t bytes, size_t capacity) {
      uintptr_t base = reinterpret_cast<uintptr_t>(mem);
      if (capacity == 0 || !is_aligned(base, alignof(ArrayQueue)) || bytes < bytesFor(capacity))
        THROW(Error::INVALID_ARGUMENT, DVAR(capacity), DVAR(bytes));
      auto buffer = reinterpret_cast<Slot*>(base + headerBytes());
      auto queue = new (mem) ArrayQueue(capacity, buffer);
      MLOG_DETAIL(mlog::queue, "queue constructed", DVARhex(base), DVAR(capacity), DVAR(bytes));
      return queue;
    }

    /** append a value, fails with QUEUE_FULL */
    template<class U>
    optional<void> push(U&& value) {
      Backoff backoff;
      size_t t = tail.value.load(std::memory_order_relaxed);
      while (true) {
        size_t index = t & (oneLap - 1);
        size_t lap = t & ~(oneLap - 1);
        Slot& slot = slots()[index];
        size_t stamp = slot.stamp.load(std::memory_order_acquire);
        if (t == stamp) {
          size_t next = index + 1 < cap ? t + 1 : lap + oneLap;
          if (tail.value.compare_exchange_weak(t, next, std::memory_order_seq_cst,
                                               std::memory_order_relaxed)) {
            new (slot.value()) T(std::forward<U>(value));
            slot.stamp.store(t + 1, std::memory_order_release);
            return optional<void>(Error::SUCCESS);
          }
          backoff.spin();
        } else if (stamp + oneLap == t + 1) {
          std::atomic_thread_fence(std::memory_order_seq_cst);
          size_t h = head.value.load(std::memory_order_relaxed);
          if (h + oneLap == t) return optional<void>(Error::QUEUE_FULL);
          backoff.spin();
          t = tail.value.load(std::memory_order_relaxed);
        } else {
          backoff.snooze();
          t = tail.value.load(std::memory_order_relaxed);
        }
      }
    }

    /** remove the oldest value, fails with QUEUE_EMPTY */
    optional<T> pop() {
      Backoff backoff;
      size_t h = head.value.load(std::memory_order_relaxed);
      while (true) {
        size_t index = h & (oneLap - 1);
        size_t lap = h & ~(oneLap - 1);
        Slot& slot = slots()[index];
        size_t stamp = slot.stamp.load(std::memory_order_acquire);
        if (h + 1 == stamp) {
          size_t next = index + 1 < cap ? h + 1 : lap + oneLap;
          if (head.value.compare_exchange_weak(h, next, std::memory_order_seq_cst,
                                               std::memory_order_relaxed)) {
            T* v = slot.value();
            T res(std::move(*v));
            v->~T();
            slot.stamp.store(h + oneLap, std::memory_order_release);
            return std::move(res);
          }
          backoff.spin();
        } else if (stamp == h) {
          std::atomic_thread_fence(std::memory_order_seq_cst);
          size_t t = tail.value.load(std::memory_order_relaxed);
          if (t == h) return optional<T>(Error::QUEUE_EMPTY);
          backoff.spin();
          h = head.value.load(std::memory_order_relaxed);
        } else {
          backoff.snooze();
          h = head.value.load(std::memory_order_relaxed);
        }
      }
    }

    size_t capacity() const { return cap; }

    bool isEmpty() const {
      size_t h = head.value.load();
      size_t t = tail.value.load();
      return t == h;
    }

    bool isFull() const {
      size_t t = tail.value.load();
      size_t h = head.value.load();
      return h + oneLap == t;
    }

    /** number of values, taken from a consistent snapshot of head and tail */
    size_t size() const {
      while (true) {
        size_t t = tail.value.load();
        size_t h = head.value.load();
        if (tail.value.load() != t) continue;
        size_t hix = h & (oneLap - 1);
        size_t tix = t & (oneLap - 1);
        if (hix < tix) return tix - hix;
        if (hix > tix) return cap - hix + tix;
        return t == h ? 0 : cap;
      }
    }

  private:
    static size_t nextPowerOfTwo(size_t v) {
      size_t res = 1;
      while (res < v) res <<= 1;
      return res;
    }

    static size_t headerBytes() { return round_up(uint64_t(sizeof(ArrayQueue)), uint64_t(alignof(Slot))); }

    Slot* slots() const {
      return reinterpret_cast<Slot*>(reinterpret_cast<uintptr_t>(this) + offset);
    }

    CachePadded<std::atomic<size_t>> head;
    CachePadded<std::atomic<size_t>> tail;
    size_t cap;
    size_t oneLap;
    uintptr_t offset;
  };

} // namespace typecap
