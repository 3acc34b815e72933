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

#include "util/Logger.hh"

namespace mlog {

#ifndef MLOG_CAP
#define MLOG_CAP FilterWarning
#endif
  extern Logger<MLOG_CAP> cap;

#ifndef MLOG_ALLOC
#define MLOG_ALLOC FilterWarning
#endif
  extern Logger<MLOG_ALLOC> alloc;

#ifndef MLOG_VSPACE
#define MLOG_VSPACE FilterWarning
#endif
  extern Logger<MLOG_VSPACE> vspace;

#ifndef MLOG_QUEUE
#define MLOG_QUEUE FilterWarning
#endif
  extern Logger<MLOG_QUEUE> queue;

#ifndef MLOG_SIM
#define MLOG_SIM FilterWarning
#endif
  extern Logger<MLOG_SIM> sim;

} // namespace mlog
