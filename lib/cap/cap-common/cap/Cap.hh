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
#include "typecap/IKernel.hh"
#include "typecap/mlog.hh"
#include "cap/Role.hh"
#include "cap/objects.hh"
#include "cap/CNodeSlots.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  /** Typed handle of a capability slot. The handle owns the slot and
   * the object in it, hence it can be moved but not copied. The kind T
   * carries the externally tracked state of the object, e.g. the
   * mapping of a page.
   */
  template<class T, class ROLE = Local>
  class Cap
  {
  public:
    static_assert(IsRole<ROLE>::value, "unknown capability role");
    typedef T kind_t;
    typedef ROLE role_t;

    Cap() : cptr_(NULL_CAP) {}
    explicit Cap(CPtr cptr, T const& data = T()) : cptr_(cptr), data_(data) {}
    Cap(Cap const&) = delete;
    Cap& operator=(Cap const&) = delete;
    Cap(Cap&& o) : cptr_(o.cptr_), data_(o.data_) { o.cptr_ = NULL_CAP; }
    Cap& operator=(Cap&& o) {
      cptr_ = o.cptr_; data_ = o.data_; o.cptr_ = NULL_CAP; return *this;
    }

    CPtr cptr() const { return cptr_; }
    T const& data() const { return data_; }
    T& data() { return data_; }
    bool isNull() const { return cptr_ == NULL_CAP; }

    /** give up the handle, the slot keeps its content */
    CPtr release() { CPtr res = cptr_; cptr_ = NULL_CAP; return res; }

  private:
    CPtr cptr_;
    T data_;
  };

  template<class T> using LocalCap = Cap<T, Local>;
  template<class T> using ChildCap = Cap<T, Child>;

  /** copy a local cap into dest with the given rights and return the raw destination */
  template<class T>
  optional<CPtr> uncheckedCopy(Cap<T,Local> const& cap, CPtr destCNode, CPtr destOffset, CapRights rights)
  {
    TYPECAP_SYSCALL(Error::CNODE_COPY,
                    kernel->cnodeCopy(destCNode, destOffset, arch::WORD_BITS,
                                      INIT_THREAD_CNODE, cap.cptr(), arch::WORD_BITS, rights));
    return destOffset;
  }

  template<class T, class DEST>
  optional<Cap<typename CopyAliasable<T>::Output, DEST>>
  copy(Cap<T,Local> const& cap, Slots<1,DEST>&& dest, CapRights rights)
  {
    static_assert(CopyAliasable<T>::value, "capability kind cannot be aliased");
    typedef typename CopyAliasable<T>::Output Out;
    Slots<1,DEST> slot(std::move(dest));
    auto res = uncheckedCopy(cap, slot.cnode(), slot.offset(), rights);
    if (!res) RETHROW(res);
    MLOG_DETAIL(mlog::cap, "copy", DVAR(cap.cptr()), DVAR(slot.cnode()), DVAR(slot.offset()), DVAR(rights));
    return Cap<Out,DEST>(*res, CopyAliasable<T>::output(cap.data()));
  }

  template<class T, class DEST>
  optional<Cap<T, DEST>>
  mint(Cap<T,Local> const& cap, Slots<1,DEST>&& dest, CapRights rights, Badge badge)
  {
    static_assert(Mintable<T>::value, "capability kind cannot carry a badge");
    Slots<1,DEST> slot(std::move(dest));
    TYPECAP_SYSCALL(Error::CNODE_MINT,
                    kernel->cnodeMint(slot.cnode(), slot.offset(), arch::WORD_BITS,
                                      INIT_THREAD_CNODE, cap.cptr(), arch::WORD_BITS, rights, badge));
    MLOG_DETAIL(mlog::cap, "mint", DVAR(cap.cptr()), DVAR(slot.offset()), DVARhex(badge));
    return Cap<T,DEST>(slot.offset(), cap.data());
  }

  template<class T, class DEST>
  optional<Cap<T, DEST>> moveToSlot(Cap<T,Local>&& cap, Slots<1,DEST>&& dest)
  {
    static_assert(Movable<T>::value, "capability kind cannot be moved");
    Cap<T,Local> src(std::move(cap));
    Slots<1,DEST> slot(std::move(dest));
    TYPECAP_SYSCALL(Error::CNODE_MOVE,
                    kernel->cnodeMove(slot.cnode(), slot.offset(), arch::WORD_BITS,
                                      INIT_THREAD_CNODE, src.cptr(), arch::WORD_BITS));
    MLOG_DETAIL(mlog::cap, "move", DVAR(src.cptr()), DVAR(slot.cnode()), DVAR(slot.offset()));
    return Cap<T,DEST>(slot.offset(), src.data());
  }

  /** revoke everything derived from the cap and clear its slot */
  template<class T>
  optional<void> deleteCap(Cap<T,Local>&& cap)
  {
    static_assert(Delible<T>::value, "capability kind cannot be deleted");
    Cap<T,Local> victim(std::move(cap));
    TYPECAP_SYSCALL(Error::CNODE_REVOKE,
                    kernel->cnodeRevoke(INIT_THREAD_CNODE, victim.cptr(), arch::WORD_BITS));
    TYPECAP_SYSCALL(Error::CNODE_DELETE,
                    kernel->cnodeDelete(INIT_THREAD_CNODE, victim.cptr(), arch::WORD_BITS));
    return optional<void>(Error::SUCCESS);
  }

} // namespace typecap
