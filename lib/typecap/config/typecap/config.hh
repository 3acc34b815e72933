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
#include <cstdint>

/** build-time constants, each can be overridden by a compile definition. */

#ifndef KERNEL_RETYPE_FAN_OUT_LIMIT
#define KERNEL_RETYPE_FAN_OUT_LIMIT 256
#endif

#ifndef ROOT_TASK_STACK_PAGE_TABLE_COUNT
#define ROOT_TASK_STACK_PAGE_TABLE_COUNT 1
#endif

#ifndef UT_POOL_SLOTS_PER_SIZE
#define UT_POOL_SLOTS_PER_SIZE 16
#endif

#ifndef ASID_POOL_COUNT
#define ASID_POOL_COUNT 128
#endif

#ifndef ASID_POOL_SIZE
#define ASID_POOL_SIZE 512
#endif

#ifndef MAX_PAGES_PER_MAPPING
#define MAX_PAGES_PER_MAPPING 4096
#endif

#ifndef PROGRAM_START
#define PROGRAM_START 0x10000
#endif

namespace typecap {

  constexpr size_t KernelRetypeFanOutLimit = KERNEL_RETYPE_FAN_OUT_LIMIT;
  constexpr size_t RootTaskStackPageTableCount = ROOT_TASK_STACK_PAGE_TABLE_COUNT;
  constexpr size_t UTPoolSlotsPerSize = UT_POOL_SLOTS_PER_SIZE;
  constexpr size_t ASIDPoolCount = ASID_POOL_COUNT;
  constexpr size_t ASIDPoolSize = ASID_POOL_SIZE;
  constexpr size_t MaxPagesPerMapping = MAX_PAGES_PER_MAPPING;
  constexpr uintptr_t ProgramStart = PROGRAM_START;

namespace arch {

  /** aarch64 with 4KiB granules and 48 bit virtual addresses */
  constexpr size_t WORD_BITS = 64;
  constexpr size_t PAGE_BITS = 12;
  constexpr size_t PAGE_SIZE = size_t(1) << PAGE_BITS;
  constexpr size_t LARGE_PAGE_BITS = 21;
  constexpr size_t HUGE_PAGE_BITS = 30;

  constexpr size_t PAGE_TABLE_BITS = 12;
  constexpr size_t PAGE_DIRECTORY_BITS = 12;
  constexpr size_t PAGE_UPPER_DIRECTORY_BITS = 12;
  constexpr size_t PAGE_GLOBAL_DIRECTORY_BITS = 12;

  constexpr size_t PT_INDEX_SHIFT = 12;
  constexpr size_t PD_INDEX_SHIFT = 21;
  constexpr size_t PUD_INDEX_SHIFT = 30;
  constexpr size_t PGD_INDEX_SHIFT = 39;
  constexpr size_t INDEX_BITS = 9;

  constexpr size_t MIN_UNTYPED_BITS = 4;
  constexpr size_t MAX_UNTYPED_BITS = 47;
  constexpr size_t NUM_UNTYPED_SIZES = MAX_UNTYPED_BITS - MIN_UNTYPED_BITS + 1;

  constexpr size_t CNODE_SLOT_BITS = 4;
  constexpr size_t TCB_BITS = 11;
  constexpr size_t ENDPOINT_BITS = 4;
  constexpr size_t NOTIFICATION_BITS = 5;
  constexpr size_t ASID_POOL_BITS = 12;

  /** first address reserved for the kernel */
  constexpr uintptr_t USER_TOP = uintptr_t(1) << 47;

} // namespace arch
} // namespace typecap
