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
#include "typecap/caps.hh"
#include "typecap/config.hh"
#include "cap/Role.hh"

namespace typecap {

  /** page states, the mapping is tracked outside of the kernel */
  struct Unmapped {};

  struct Mapped
  {
    Mapped() : vaddr(0), asid(0) {}
    Mapped(uintptr_t vaddr, asid_t asid, CapRights rights)
      : vaddr(vaddr), asid(asid), rights(rights) {}
    uintptr_t vaddr;
    asid_t asid;
    CapRights rights;
  };

  template<class STATE>
  struct Page { STATE state; };

  struct PageTable {};
  struct PageDirectory {};
  struct PageUpperDirectory {};
  struct PageGlobalDirectory {};
  typedef PageGlobalDirectory PagingRoot;

  struct TCB {};
  struct Endpoint {};
  struct Notification {};

  template<size_t RADIX>
  struct CNode {};

  template<size_t BITS, class KIND = General>
  struct Untyped
  {
    static_assert(BITS >= arch::MIN_UNTYPED_BITS && BITS <= arch::MAX_UNTYPED_BITS,
                  "untyped size out of range");
    KIND kind;
  };

  /** untyped memory whose size is only known at runtime */
  template<class KIND = General>
  struct WUntyped
  {
    size_t bits;
    KIND kind;
  };

  /** kernel object type and size of the typed kinds */
  template<class T> struct ObjectTraits;

  template<class STATE> struct ObjectTraits<Page<STATE>> {
    static constexpr ObjectType TYPE = ObjectType::SMALL_PAGE;
    static constexpr size_t SIZE_BITS = arch::PAGE_BITS;
    static constexpr size_t RETYPE_SIZE = 0;
  };
  template<> struct ObjectTraits<PageTable> {
    static constexpr ObjectType TYPE = ObjectType::PAGE_TABLE;
    static constexpr size_t SIZE_BITS = arch::PAGE_TABLE_BITS;
    static constexpr size_t RETYPE_SIZE = 0;
  };
  template<> struct ObjectTraits<PageDirectory> {
    static constexpr ObjectType TYPE = ObjectType::PAGE_DIRECTORY;
    static constexpr size_t SIZE_BITS = arch::PAGE_DIRECTORY_BITS;
    static constexpr size_t RETYPE_SIZE = 0;
  };
  template<> struct ObjectTraits<PageUpperDirectory> {
    static constexpr ObjectType TYPE = ObjectType::PAGE_UPPER_DIRECTORY;
    static constexpr size_t SIZE_BITS = arch::PAGE_UPPER_DIRECTORY_BITS;
    static constexpr size_t RETYPE_SIZE = 0;
  };
  template<> struct ObjectTraits<PageGlobalDirectory> {
    static constexpr ObjectType TYPE = ObjectType::PAGE_GLOBAL_DIRECTORY;
    static constexpr size_t SIZE_BITS = arch::PAGE_GLOBAL_DIRECTORY_BITS;
    static constexpr size_t RETYPE_SIZE = 0;
  };
  template<> struct ObjectTraits<TCB> {
    static constexpr ObjectType TYPE = ObjectType::TCB;
    static constexpr size_t SIZE_BITS = arch::TCB_BITS;
    static constexpr size_t RETYPE_SIZE = 0;
  };
  template<> struct ObjectTraits<Endpoint> {
    static constexpr ObjectType TYPE = ObjectType::ENDPOINT;
    static constexpr size_t SIZE_BITS = arch::ENDPOINT_BITS;
    static constexpr size_t RETYPE_SIZE = 0;
  };
  template<> struct ObjectTraits<Notification> {
    static constexpr ObjectType TYPE = ObjectType::NOTIFICATION;
    static constexpr size_t SIZE_BITS = arch::NOTIFICATION_BITS;
    static constexpr size_t RETYPE_SIZE = 0;
  };
  template<size_t RADIX> struct ObjectTraits<CNode<RADIX>> {
    static constexpr ObjectType TYPE = ObjectType::CAP_TABLE;
    static constexpr size_t SIZE_BITS = RADIX + arch::CNODE_SLOT_BITS;
    static constexpr size_t RETYPE_SIZE = RADIX;
  };
  template<size_t BITS, class KIND> struct ObjectTraits<Untyped<BITS,KIND>> {
    static constexpr ObjectType TYPE = ObjectType::UNTYPED;
    static constexpr size_t SIZE_BITS = BITS;
    static constexpr size_t RETYPE_SIZE = BITS;
  };

  /** Kinds whose caps may be aliased by copying. Output is the kind
   * of the copy, a copy of a mapped page is not mapped. */
  template<class T> struct CopyAliasable { static constexpr bool value = false; };

  template<class STATE> struct CopyAliasable<Page<STATE>> {
    static constexpr bool value = true;
    typedef Page<Unmapped> Output;
    static Output output(Page<STATE> const&) { return Output(); }
  };
  template<> struct CopyAliasable<Endpoint> {
    static constexpr bool value = true;
    typedef Endpoint Output;
    static Output output(Endpoint const& e) { return e; }
  };
  template<> struct CopyAliasable<Notification> {
    static constexpr bool value = true;
    typedef Notification Output;
    static Output output(Notification const& n) { return n; }
  };
  template<size_t RADIX> struct CopyAliasable<CNode<RADIX>> {
    static constexpr bool value = true;
    typedef CNode<RADIX> Output;
    static Output output(CNode<RADIX> const& c) { return c; }
  };

  /** kinds the kernel allows to carry a badge */
  template<class T> struct Mintable { static constexpr bool value = false; };
  template<> struct Mintable<Endpoint> { static constexpr bool value = true; };
  template<> struct Mintable<Notification> { static constexpr bool value = true; };

  /** kinds that may be deleted through their handle */
  template<class T> struct Delible { static constexpr bool value = false; };
  template<class STATE> struct Delible<Page<STATE>> { static constexpr bool value = true; };
  template<> struct Delible<Endpoint> { static constexpr bool value = true; };
  template<> struct Delible<Notification> { static constexpr bool value = true; };
  template<> struct Delible<TCB> { static constexpr bool value = true; };

  /** kinds that may be moved to another slot */
  template<class T> struct Movable { static constexpr bool value = true; };

} // namespace typecap
