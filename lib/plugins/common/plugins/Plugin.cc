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

#include "plugins/Plugin.hh"
#include "typecap/mlog.hh"

namespace typecap {

  Plugin* Plugin::first = nullptr;

  Plugin::Plugin(const char* name) : log(name)
  {
    this->next = first;
    first = this;
  }

  size_t Plugin::initPluginsGlobal()
  {
    size_t failed = 0;
    for (Plugin* c = first; c != nullptr; c = c->next) {
      MLOG_DETAIL(mlog::sim, "initPluginsGlobal", c);
      c->initGlobal();
      if (!c->passed()) failed++;
    }
    return failed;
  }

} // namespace typecap
