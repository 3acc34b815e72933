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

#include <atomic>
#include <memory>
#include <thread>
#include <vector>
#include "plugins/TestPlugin.hh"
#include "util/ArrayQueue.hh"
#include "util/Backoff.hh"

namespace typecap {
namespace test_array_queue {

/** counts live instances, so that leaked or doubly destroyed values show */
struct Tracked
{
  static int live;
  Tracked() : id(0) { live++; }
  explicit Tracked(int id) : id(id) { live++; }
  Tracked(Tracked&& o) : id(o.id) { live++; }
  Tracked& operator=(Tracked&& o) { id = o.id; return *this; }
  ~Tracked() { live--; }
  int id;
};
int Tracked::live = 0;

class TestArrayQueue : public TestPlugin
{
public:
  TestArrayQueue() : TestPlugin("test array queue") {}
  void initGlobal() override;

private:
  void bounds();
  void order();
  void placement();
  void ownership();
  void producersConsumers(size_t producers, size_t consumers);
  void backoff();
};

TestArrayQueue instance;

void TestArrayQueue::initGlobal()
{
  bounds();
  order();
  placement();
  ownership();
  producersConsumers(1, 1);
  producersConsumers(2, 2);
  backoff();
  done();
}

void TestArrayQueue::bounds()
{
  log.error("full and empty");
  ArrayQueue<int>::Slot buffer[3];
  ArrayQueue<int> q(3, buffer);
  TEST_EQ(q.capacity(), size_t(3));
  TEST_TRUE(q.isEmpty());
  TEST_EQ(q.pop().state(), Error::QUEUE_EMPTY);
  TEST_SUCCESS(q.push(1).state());
  TEST_SUCCESS(q.push(2).state());
  TEST_SUCCESS(q.push(3).state());
  TEST_TRUE(q.isFull());
  TEST_EQ(q.size(), size_t(3));
  TEST_EQ(q.push(4).state(), Error::QUEUE_FULL);
  TEST_EQ(q.size(), size_t(3));
  auto first = q.pop();
  TEST_SUCCESS(first.state());
  TEST_EQ(*first, 1);
  TEST_FALSE(q.isFull());
  TEST_SUCCESS(q.push(4).state());
  TEST_TRUE(q.isFull());
}

void TestArrayQueue::order()
{
  log.error("values come out in order across laps");
  ArrayQueue<int>::Slot buffer[5];
  ArrayQueue<int> q(5, buffer);
  int next = 0;
  int expected = 0;
  bool inOrder = true;
  for (int round = 0; round < 20; round++) {
    for (int i = 0; i < 3; i++) {
      if (!q.push(next++)) inOrder = false;
    }
    for (int i = 0; i < 3; i++) {
      auto v = q.pop();
      if (!v || *v != expected++) inOrder = false;
    }
  }
  TEST_TRUE(inOrder);
  TEST_TRUE(q.isEmpty());
  TEST_EQ(q.size(), size_t(0));

  log.error("size wraps with the indices");
  for (int i = 0; i < 4; i++) TEST_SUCCESS(q.push(i).state());
  TEST_EQ(q.size(), size_t(4));
  TEST_EQ(must(q.pop()), 0);
  TEST_EQ(q.size(), size_t(3));
}

void TestArrayQueue::placement()
{
  log.error("construct in place");
  typedef ArrayQueue<uint64_t> Queue;
  size_t bytes = Queue::bytesFor(4);
  TEST_TRUE(bytes >= sizeof(Queue) + 4 * sizeof(Queue::Slot));
  alignas(CACHELINESIZE) unsigned char mem[1024];
  TEST_TRUE(bytes <= sizeof(mem));
  void* base = mem;

  TEST_EQ(Queue::constructAt(base, bytes, 0).state(), Error::INVALID_ARGUMENT);
  TEST_EQ(Queue::constructAt(base, bytes - 1, 4).state(), Error::INVALID_ARGUMENT);
  auto misaligned = reinterpret_cast<char*>(base) + 8;
  TEST_EQ(Queue::constructAt(misaligned, bytes, 4).state(), Error::INVALID_ARGUMENT);

  auto q = Queue::constructAt(base, bytes, 4);
  TEST_SUCCESS(q.state());
  TEST_EQ(reinterpret_cast<uintptr_t>(*q), reinterpret_cast<uintptr_t>(base));
  TEST_EQ((*q)->capacity(), size_t(4));
  TEST_SUCCESS((*q)->push(uint64_t(0xABCD)).state());
  TEST_EQ(must((*q)->pop()), uint64_t(0xABCD));
  (*q)->~Queue();
}

void TestArrayQueue::ownership()
{
  log.error("move only values");
  {
    ArrayQueue<std::unique_ptr<int>>::Slot buffer[2];
    ArrayQueue<std::unique_ptr<int>> q(2, buffer);
    TEST_SUCCESS(q.push(std::unique_ptr<int>(new int(7))).state());
    auto v = q.pop();
    TEST_SUCCESS(v.state());
    TEST_EQ(**v, 7);
  }

  log.error("values left behind are destroyed with the queue");
  Tracked::live = 0;
  {
    ArrayQueue<Tracked>::Slot buffer[4];
    ArrayQueue<Tracked> q(4, buffer);
    for (int i = 0; i < 4; i++) TEST_SUCCESS(q.push(Tracked(i)).state());
    TEST_EQ(Tracked::live, 4);
    {
      auto v = q.pop();
      TEST_SUCCESS(v.state());
      TEST_EQ(v->id, 0);
    }
    TEST_EQ(Tracked::live, 3);
    TEST_SUCCESS(q.push(Tracked(4)).state());
    TEST_EQ(Tracked::live, 4);
  }
  TEST_EQ(Tracked::live, 0);
}

void TestArrayQueue::producersConsumers(size_t producers, size_t consumers)
{
  log.error("concurrent producers and consumers", DVAR(producers), DVAR(consumers));
  enum : size_t { PER_PRODUCER = 20000 };
  ArrayQueue<size_t>::Slot buffer[16];
  ArrayQueue<size_t> q(16, buffer);
  size_t total = producers * PER_PRODUCER;
  std::atomic<size_t> consumed(0);
  std::atomic<size_t> sum(0);
  std::vector<std::thread> threads;

  for (size_t p = 0; p < producers; p++) {
    threads.emplace_back([&q, p]() {
      for (size_t i = 0; i < PER_PRODUCER; i++) {
        size_t value = p * PER_PRODUCER + i + 1;
        Backoff backoff;
        while (!q.push(value)) backoff.snooze();
      }
    });
  }
  for (size_t c = 0; c < consumers; c++) {
    threads.emplace_back([&q, &consumed, &sum, total]() {
      Backoff backoff;
      while (consumed.load() < total) {
        auto v = q.pop();
        if (v) {
          sum += *v;
          consumed++;
          backoff.reset();
        } else {
          backoff.snooze();
        }
      }
    });
  }
  for (auto& t : threads) t.join();

  TEST_EQ(consumed.load(), total);
  TEST_EQ(sum.load(), total * (total + 1) / 2);
  TEST_TRUE(q.isEmpty());
}

void TestArrayQueue::backoff()
{
  log.error("backoff");
  Backoff spinning;
  for (int i = 0; i < 20; i++) spinning.spin();
  TEST_EQ(spinning.steps(), unsigned(Backoff::SPIN_LIMIT + 1));
  TEST_FALSE(spinning.isCompleted());

  Backoff snoozing;
  for (int i = 0; i < 10; i++) snoozing.snooze();
  TEST_FALSE(snoozing.isCompleted());
  snoozing.snooze();
  TEST_TRUE(snoozing.isCompleted());
  snoozing.reset();
  TEST_EQ(snoozing.steps(), 0u);
}

} // namespace test_array_queue
} // namespace typecap
