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
#include "util/streambuf.hh"
#include "util/mstring.hh"

namespace typecap {

  /** streambuf over an embedded character array of MAXSIZE bytes.
   * Output beyond the capacity is cut off, the content always stays
   * zero terminated.
   */
  template<size_t MAXSIZE>
  class FixedStreamBuf final
    : public streambuf
  {
  public:
    FixedStreamBuf() : _used(0) { sync(); }
    virtual ~FixedStreamBuf() {}

    size_t size() const { return _used; }
    char const* c_str() const { return _buf; }
    char* c_str() { return _buf; }

    int sputc(char c) {
      if (_used+1 < MAXSIZE) _buf[_used++] = c;
      sync();
      return c;
    }

    typecap::streamsize sputn(char const* s, typecap::streamsize count) {
      size_t len = (_used + count < MAXSIZE) ? count : MAXSIZE - _used - 1;
      memcpy(_buf+_used, s, len);
      _used += len;
      sync();
      return len;
    }

    void putcstr(char const* s) { sputn(s, strlen(s)); }

  protected:
    void sync() { _buf[_used] = 0; }

  protected:
    virtual int _sputc(char c) { return sputc(c); }
    virtual typecap::streamsize _sputn(char const* s, typecap::streamsize count) { return sputn(s,count); }
    virtual void _putcstr(char const* s) { putcstr(s); }
    virtual void _sync() { sync(); }

  protected:
    char _buf[MAXSIZE];
    size_t _used;
  };

} // namespace typecap
