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
#include <utility>
#include "typecap/caps.hh"
#include "typecap/config.hh"
#include "typecap/BootInfo.hh"
#include "typecap/mlog.hh"
#include "cap/Cap.hh"
#include "cap/CNodeSlots.hh"
#include "cap/ASID.hh"
#include "vspace/VSpace.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  /** ASID of the root task's address space, 0 is not a valid ASID */
  constexpr asid_t ROOT_TASK_ASID = 1;

  /** Typed handles of what the root task owns at boot. The first pool
   * was made by the kernel and already holds the root task's ASID. */
  struct RootResources
  {
    VSpace<Imaged,Local> vspace;
    Cap<TCB> tcb;
    ASIDControl<ASIDPoolCount - 1> asidControl;
    ASIDPool<ASIDPoolSize - 2> asidPool;
    UserImage image;
    size_t reservedPageTables = 0;
  };

  /** page tables the root task holds for its image and its stack */
  constexpr size_t rootTaskReservedPageTables(size_t imagePages)
  {
    return ((imagePages + (size_t(1) << arch::INDEX_BITS) - 1) >> arch::INDEX_BITS)
      + RootTaskStackPageTableCount;
  }

  /** the empty slots of the root CNode */
  inline WeakSlots<Local> rootCNodeSlots(BootInfo const& bi)
  {
    return WeakSlots<Local>::uncheckedNew(INIT_THREAD_CNODE, bi.empty.start, bi.empty.size());
  }

  inline UserImage userImage(BootInfo const& bi)
  {
    return UserImage(bi.userImageFrames.start, bi.userImageFrames.size(), bi.userImageVaddr);
  }

  /** The i-th boot untyped as general memory. Each untyped may be
   * taken only once, the handle owns it. */
  inline optional<Cap<WUntyped<General>>> generalUntyped(BootInfo const& bi, size_t i)
  {
    if (i >= bi.untyped.size() || i >= BootInfo::MAX_UNTYPED) THROW(Error::INVALID_ARGUMENT, DVAR(i));
    UntypedDesc const& desc = bi.untypedList[i];
    if (desc.isDevice) THROW(Error::INVALID_ARGUMENT, DVAR(i), DVARhex(desc.paddr));
    return Cap<WUntyped<General>>(bi.untyped.start + i, WUntyped<General>{desc.sizeBits, General()});
  }

  /** the i-th boot untyped as device memory at its physical address */
  inline optional<Cap<WUntyped<Device>>> deviceUntyped(BootInfo const& bi, size_t i)
  {
    if (i >= bi.untyped.size() || i >= BootInfo::MAX_UNTYPED) THROW(Error::INVALID_ARGUMENT, DVAR(i));
    UntypedDesc const& desc = bi.untypedList[i];
    if (!desc.isDevice) THROW(Error::INVALID_ARGUMENT, DVAR(i));
    return Cap<WUntyped<Device>>(bi.untyped.start + i, WUntyped<Device>{desc.sizeBits, Device(desc.paddr)});
  }

  /** Wrap the boot resources of the root task. The root address space
   * creates its paging objects from vspaceUt and vspaceSlots. Its free
   * addresses start one image size above the end of the image. */
  inline RootResources wrapBootInfo(BootInfo const& bi, Cap<WUntyped<General>>&& vspaceUt,
                                    WeakSlots<Local>&& vspaceSlots)
  {
    RootResources res;
    res.image = userImage(bi);
    res.reservedPageTables = rootTaskReservedPageTables(res.image.numPages);
    uintptr_t next = bi.userImageVaddr + 2 * res.image.numPages * arch::PAGE_SIZE;
    res.vspace = VSpace<Imaged,Local>::bootstrap(INIT_THREAD_VSPACE, next, std::move(vspaceSlots),
                                                 AssignedASID(ROOT_TASK_ASID), std::move(vspaceUt));
    res.tcb = Cap<TCB>(INIT_THREAD_TCB);
    res.asidControl = ASIDControl<ASIDPoolCount - 1>::uncheckedNew(ASID_CONTROL);
    res.asidPool = ASIDPool<ASIDPoolSize - 2>::uncheckedNew(INIT_THREAD_ASID_POOL, ROOT_TASK_ASID + 1);
    MLOG_INFO(mlog::vspace, "root task resources", DVAR(res.image.numPages), DVARhex(next),
              DVAR(bi.empty.size()), DVAR(bi.untyped.size()));
    return res;
  }

} // namespace typecap
