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
#include "typecap/config.hh"
#include "util/ostream.hh"

namespace typecap {

  typedef uintptr_t CPtr;
  typedef uint64_t Badge;
  typedef uint32_t asid_t;

  /** slots of the root task's CSpace populated at boot */
  enum InitCaps : CPtr {
    NULL_CAP = 0,
    INIT_THREAD_TCB = 1,
    INIT_THREAD_CNODE = 2,
    INIT_THREAD_VSPACE = 3,
    IRQ_CONTROL = 4,
    ASID_CONTROL = 5,
    INIT_THREAD_ASID_POOL = 6,
    NUM_INIT_CAPS = 16
  };

  /** kernel object types of the aarch64 kernel, numbered as in the ABI. */
  enum struct ObjectType : uint8_t {
    UNTYPED = 0,
    TCB = 1,
    ENDPOINT = 2,
    NOTIFICATION = 3,
    CAP_TABLE = 4,
    HUGE_PAGE = 5,
    PAGE_UPPER_DIRECTORY = 6,
    PAGE_GLOBAL_DIRECTORY = 7,
    SMALL_PAGE = 8,
    LARGE_PAGE = 9,
    PAGE_TABLE = 10,
    PAGE_DIRECTORY = 11
  };

  template<class S>
  ostream_base<S>& operator<< (ostream_base<S>& out, ObjectType t) {
    out << "T" << static_cast<int>(t); return out;
  }

  struct CapRights
  {
    constexpr CapRights() : value(0) {}
    constexpr explicit CapRights(uint8_t value) : value(value) {}
    constexpr CapRights(bool write, bool read, bool grant, bool grantReply)
      : value(uint8_t(write) | uint8_t(read) << 1 | uint8_t(grant) << 2 | uint8_t(grantReply) << 3) {}

    constexpr bool canWrite() const { return value & 1; }
    constexpr bool canRead() const { return value & 2; }
    constexpr bool canGrant() const { return value & 4; }
    constexpr bool canGrantReply() const { return value & 8; }

    /** the rights both sides have in common */
    constexpr CapRights operator& (CapRights const& o) const { return CapRights(uint8_t(value & o.value)); }
    constexpr bool operator== (CapRights const& o) const { return value == o.value; }
    constexpr bool operator!= (CapRights const& o) const { return value != o.value; }

    static constexpr CapRights R() { return CapRights(false, true, false, false); }
    static constexpr CapRights W() { return CapRights(true, false, false, false); }
    static constexpr CapRights RW() { return CapRights(true, true, false, false); }
    static constexpr CapRights RWG() { return CapRights(true, true, true, true); }

    uint8_t value;
  };

  template<class S>
  ostream_base<S>& operator<< (ostream_base<S>& out, CapRights r) {
    out << (r.canRead() ? "r" : "-") << (r.canWrite() ? "w" : "-") << (r.canGrant() ? "g" : "-");
    return out;
  }

  /** aarch64 VM attributes as passed to the page map invocations */
  struct VMAttributes
  {
    enum : uint8_t { PAGE_CACHEABLE = 1, PARITY_ENABLED = 2, EXECUTE_NEVER = 4 };
    constexpr VMAttributes() : value(PAGE_CACHEABLE) {}
    constexpr explicit VMAttributes(uint8_t value) : value(value) {}
    constexpr bool cacheable() const { return value & PAGE_CACHEABLE; }
    constexpr bool executeNever() const { return value & EXECUTE_NEVER; }

    static constexpr VMAttributes standard() { return VMAttributes(PAGE_CACHEABLE); }
    static constexpr VMAttributes uncached() { return VMAttributes(0); }
    uint8_t value;
  };

  /** guard configuration of a CNode capability, as used by CNode mutate. */
  struct CNodeCapData
  {
    constexpr CNodeCapData() : value(0) {}
    constexpr CNodeCapData(uint64_t guard, size_t guardSize)
      : value((guard << 6) | (guardSize & 0x3f)) {}
    constexpr size_t guardSize() const { return value & 0x3f; }
    constexpr uint64_t guard() const { return value >> 6; }
    uint64_t value;
  };

} // namespace typecap
