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
#include "util/Logger.hh"

namespace typecap {

  class IPlugin
  {
  public:
    virtual ~IPlugin() {}
    virtual void initGlobal() {}
    /** whether everything the plugin checked did hold */
    virtual bool passed() const { return true; }
  };

  /** Plugins register themselves on construction and are run in
   * reverse order of their construction. */
  class Plugin
    : public IPlugin
  {
  public:
    Plugin(const char* name = "plugin");

    /** run initGlobal of all plugins, returns the number of plugins that failed */
    static size_t initPluginsGlobal();

  protected:
    mlog::Logger<mlog::FilterAny> log;

  private:
    Plugin* next;
    static Plugin* first;
  };

} // namespace typecap
