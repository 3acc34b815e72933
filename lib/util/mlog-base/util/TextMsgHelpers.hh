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
 * Copyright 2016 Randolf Rotta, Robert Kuban, and contributors, BTU Cottbus-Senftenberg
 */
#pragma once

#include "util/ostream.hh"
#include <cstdint>

namespace mlog {

  using typecap::ostream_base;

  template<typename T, size_t N>
  struct DebugVar
  {
    DebugVar(char const (&name)[N], T const& value) : name(name), value(value) {}
    char const (&name)[N];
    T const& value;
  };

  template<class S, typename T, size_t N>
  ostream_base<S>& operator<< (ostream_base<S>& out, DebugVar<T,N> const& v) {
    out << v.name << "=" << v.value; return out;
  }

  template<class S, typename T, size_t N>
  ostream_base<S>& operator<< (ostream_base<S>& out, DebugVar<T*,N> const& v) {
    out << v.name << "=" << (void const*)v.value; return out;
  }

#define DVAR(var) mlog::DebugVar<decltype(var),sizeof(#var)>(#var,var)

  template<typename T>
  struct DebugVarHex
  {
    DebugVarHex(char const* name, T const& value) : name(name), value(value) {}
    char const* name;
    T const& value;
  };

  template<class S, typename T>
  inline ostream_base<S>& operator<< (ostream_base<S>& out, DebugVarHex<T> const& v) {
    out << v.name << "=0x" << typecap::hex << v.value << typecap::dec;
    return out;
  }

  template<class S, typename T>
  inline ostream_base<S>& operator<< (ostream_base<S>& out, DebugVarHex<T*> const& v) {
    out << v.name << "=" << (void const*)v.value; return out;
  }

#define DVARhex(var) mlog::DebugVarHex<decltype(var)>(#var,var)

  struct DebugMemRange
  {
    DebugMemRange(uintptr_t start, size_t length) : start(start), length(length) {}
    template<class S>
    friend ostream_base<S>& operator<< (ostream_base<S>& out, DebugMemRange const& v) {
      out << (void*)v.start << "-" << (void*)(v.start+v.length) << " ";
      if (v.length >= 1024*1024*1024)
        out << v.length/1024/1024/1024 << "GiB";
      else if (v.length >= 1024*1024)
        out << v.length/1024/1024 << "MiB";
      else if (v.length >= 1024)
        out << v.length/1024 << "KiB";
      else
        out << v.length << "B";
      return out;
    }
    uintptr_t start;
    size_t length;
  };

#define DMRANGE(start, length) mlog::DebugMemRange(start,length)

} // namespace mlog
