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

#include <cstdint>

namespace typecap {

  /** Capability roles. A local cap lives in the CSpace of the running
   * thread and can be invoked. A child cap lives in the CSpace of a
   * process under construction and becomes usable once that process
   * runs.
   */
  struct Local { static constexpr bool IS_LOCAL = true; };
  struct Child { static constexpr bool IS_LOCAL = false; };

  template<class ROLE> struct IsRole { static constexpr bool value = false; };
  template<> struct IsRole<Local> { static constexpr bool value = true; };
  template<> struct IsRole<Child> { static constexpr bool value = true; };

  /** Memory kinds. Device memory remembers its physical base address. */
  struct General
  {
    static constexpr bool IS_DEVICE = false;
    uintptr_t paddr() const { return 0; }
    General part(uint64_t) const { return General(); }
  };

  struct Device
  {
    static constexpr bool IS_DEVICE = true;
    Device() : base(0) {}
    explicit Device(uintptr_t base) : base(base) {}
    uintptr_t paddr() const { return base; }
    /** the kind of a part that starts offset bytes into this memory */
    Device part(uint64_t offset) const { return Device(base + offset); }
    uintptr_t base;
  };

  /** runtime form of the memory kind, used by weak untypeds and regions */
  struct WeakKind
  {
    WeakKind() : device(false), paddr(0) {}
    WeakKind(General) : device(false), paddr(0) {}
    WeakKind(Device d) : device(true), paddr(d.base) {}
    bool device;
    uintptr_t paddr;
  };

} // namespace typecap
