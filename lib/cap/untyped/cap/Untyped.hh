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
#include <type_traits>
#include "typecap/caps.hh"
#include "typecap/config.hh"
#include "typecap/IKernel.hh"
#include "typecap/mlog.hh"
#include "cap/Cap.hh"
#include "cap/CapRange.hh"
#include "cap/CNodeSlots.hh"
#include "util/align.hh"
#include "util/assert.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

namespace internal {

  /** retype an untyped into num objects placed at consecutive offsets of the cnode */
  inline optional<void> retypeRaw(CPtr untyped, ObjectType type, size_t sizeBits,
                                  CPtr cnode, CPtr offset, size_t num)
  {
    TYPECAP_SYSCALL(Error::UNTYPED_RETYPE,
                    kernel->untypedRetype(untyped, type, sizeBits, cnode, 0, 0, offset, num));
    MLOG_DETAIL(mlog::cap, "retype", DVAR(untyped), DVAR(type), DVAR(sizeBits),
                DVAR(cnode), DVAR(offset), DVAR(num));
    return optional<void>(Error::SUCCESS);
  }

  template<class T> struct IsPage { static constexpr bool value = false; };
  template<class S> struct IsPage<Page<S>> { static constexpr bool value = true; };

  /** Revokes the untyped when the scope ends, so that everything
   * derived from it is deleted and its memory can be used again. */
  class UntypedScope
  {
  public:
    explicit UntypedScope(CPtr untyped) : untyped(untyped) {}
    UntypedScope(UntypedScope const&) = delete;
    UntypedScope& operator=(UntypedScope const&) = delete;
    ~UntypedScope() {
      auto err = kernel->cnodeRevoke(INIT_THREAD_CNODE, untyped, arch::WORD_BITS);
      PANIC_MSG(err == KernelError::NO_ERROR, "revoke of a temporary untyped failed");
    }
  private:
    CPtr untyped;
  };

} // namespace internal

  template<size_t BITS, class KIND>
  optional<std::pair<Cap<Untyped<BITS-1,KIND>>, Cap<Untyped<BITS-1,KIND>>>>
  split(Cap<Untyped<BITS,KIND>>&& ut, Slots<2,Local>&& dest)
  {
    typedef Untyped<BITS-1,KIND> Half;
    Cap<Untyped<BITS,KIND>> src(std::move(ut));
    Slots<2,Local> slots(std::move(dest));
    auto res = internal::retypeRaw(src.cptr(), ObjectType::UNTYPED, BITS-1,
                                   slots.cnode(), slots.offset(), 2);
    if (!res) RETHROW(res);
    KIND const& kind = src.data().kind;
    return std::make_pair(Cap<Half>(slots.offset(), Half{kind.part(0)}),
                          Cap<Half>(slots.offset()+1, Half{kind.part(bits_to_bytes(BITS-1))}));
  }

  template<size_t BITS, class KIND>
  struct Quarters
  {
    typedef Cap<Untyped<BITS-2,KIND>> quarter_t;
    quarter_t q[4];
  };

  template<size_t BITS, class KIND>
  optional<Quarters<BITS,KIND>>
  quarter(Cap<Untyped<BITS,KIND>>&& ut, Slots<4,Local>&& dest)
  {
    typedef Untyped<BITS-2,KIND> Part;
    Cap<Untyped<BITS,KIND>> src(std::move(ut));
    Slots<4,Local> slots(std::move(dest));
    auto res = internal::retypeRaw(src.cptr(), ObjectType::UNTYPED, BITS-2,
                                   slots.cnode(), slots.offset(), 4);
    if (!res) RETHROW(res);
    Quarters<BITS,KIND> parts;
    for (size_t i = 0; i < 4; i++) {
      parts.q[i] = Cap<Part>(slots.offset()+i, Part{src.data().kind.part(i * bits_to_bytes(BITS-2))});
    }
    return std::move(parts);
  }

  /** retype the untyped into one object of kind T */
  template<class T, size_t BITS, class KIND, class ROLE>
  optional<Cap<T,ROLE>> retype(Cap<Untyped<BITS,KIND>>&& ut, Slots<1,ROLE>&& dest)
  {
    static_assert(BITS >= ObjectTraits<T>::SIZE_BITS, "untyped too small for the object");
    static_assert(!KIND::IS_DEVICE, "device memory can only be retyped into pages with retypeDevicePage");
    Cap<Untyped<BITS,KIND>> src(std::move(ut));
    Slots<1,ROLE> slot(std::move(dest));
    auto res = internal::retypeRaw(src.cptr(), ObjectTraits<T>::TYPE, ObjectTraits<T>::RETYPE_SIZE,
                                   slot.cnode(), slot.offset(), 1);
    if (!res) RETHROW(res);
    return Cap<T,ROLE>(slot.offset());
  }

  /** retype the untyped into N objects of kind T in one kernel invocation */
  template<class T, size_t N, size_t BITS, class KIND, class ROLE>
  optional<CapRange<T,ROLE,N>> retypeMulti(Cap<Untyped<BITS,KIND>>&& ut, Slots<N,ROLE>&& dest)
  {
    static_assert(N <= KernelRetypeFanOutLimit, "too many objects for one retype");
    static_assert((N << ObjectTraits<T>::SIZE_BITS) <= (uint64_t(1) << BITS),
                  "untyped too small for the objects");
    static_assert(!KIND::IS_DEVICE || internal::IsPage<T>::value,
                  "device memory can only be retyped into pages");
    Cap<Untyped<BITS,KIND>> src(std::move(ut));
    Slots<N,ROLE> slots(std::move(dest));
    auto res = internal::retypeRaw(src.cptr(), ObjectTraits<T>::TYPE, ObjectTraits<T>::RETYPE_SIZE,
                                   slots.cnode(), slots.offset(), N);
    if (!res) RETHROW(res);
    return CapRange<T,ROLE,N>::uncheckedNew(slots.offset(), T());
  }

  /** Retype the untyped into a CNode of radix R and program its guard
   * so that a full word cptr resolves to the slot with that number.
   * The first of the two slots is scratch space and remains empty.
   * Slot 0 of the new CNode is kept back for a self reference.
   */
  template<size_t RADIX, size_t BITS>
  optional<std::pair<Cap<CNode<RADIX>,Local>, Slots<(size_t(1) << RADIX) - 1, Child>>>
  retypeCNode(Cap<Untyped<BITS,General>>&& ut, Slots<2,Local>&& dest)
  {
    static_assert(RADIX > 0 && RADIX + arch::CNODE_SLOT_BITS <= BITS, "untyped too small for the cnode");
    typedef Slots<(size_t(1) << RADIX) - 1, Child> ChildSlots_t;
    Cap<Untyped<BITS,General>> src(std::move(ut));
    Slots<2,Local> slots(std::move(dest));
    CPtr scratch = slots.offset();
    CPtr target = slots.offset() + 1;
    auto res = internal::retypeRaw(src.cptr(), ObjectType::CAP_TABLE, RADIX,
                                   slots.cnode(), scratch, 1);
    if (!res) RETHROW(res);
    TYPECAP_SYSCALL(Error::CNODE_MUTATE,
                    kernel->cnodeMutate(slots.cnode(), target, arch::WORD_BITS,
                                        slots.cnode(), scratch, arch::WORD_BITS,
                                        CNodeCapData(0, arch::WORD_BITS - RADIX)));
    MLOG_DETAIL(mlog::cap, "cnode with guard", DVAR(target), DVAR(RADIX));
    return std::make_pair(Cap<CNode<RADIX>,Local>(target), ChildSlots_t::uncheckedNew(target, 1));
  }

  /** retype a page sized device untyped into a page frame at its physical address */
  template<class ROLE>
  optional<Cap<Page<Unmapped>,ROLE>>
  retypeDevicePage(Cap<Untyped<arch::PAGE_BITS,Device>>&& ut, Slots<1,ROLE>&& dest)
  {
    Cap<Untyped<arch::PAGE_BITS,Device>> src(std::move(ut));
    Slots<1,ROLE> slot(std::move(dest));
    auto res = internal::retypeRaw(src.cptr(), ObjectType::SMALL_PAGE, 0,
                                   slot.cnode(), slot.offset(), 1);
    if (!res) RETHROW(res);
    return Cap<Page<Unmapped>,ROLE>(slot.offset());
  }

  /** Lend the untyped to f. Afterwards everything f derived from it is
   * revoked, so the untyped is whole again. f reports only success or
   * failure, caps derived inside the scope cannot leave it. */
  template<size_t BITS, class KIND, class F>
  optional<void> withTemporary(Cap<Untyped<BITS,KIND>>& ut, F f)
  {
    static_assert(std::is_same<decltype(f(std::declval<Cap<Untyped<BITS,KIND>>>())), optional<void>>::value,
                  "a temporary scope returns optional<void>");
    internal::UntypedScope scope(ut.cptr());
    return f(Cap<Untyped<BITS,KIND>>(ut.cptr(), ut.data()));
  }

  template<size_t BITS, class KIND>
  Cap<WUntyped<KIND>> weaken(Cap<Untyped<BITS,KIND>>&& ut)
  {
    Cap<Untyped<BITS,KIND>> src(std::move(ut));
    return Cap<WUntyped<KIND>>(src.release(), WUntyped<KIND>{BITS, src.data().kind});
  }

  /** recover the static size, fails if the size does not match */
  template<size_t BITS, class KIND>
  optional<Cap<Untyped<BITS,KIND>>> asStrong(Cap<WUntyped<KIND>>&& ut)
  {
    if (ut.data().bits != BITS) {
      size_t bits = ut.data().bits;
      THROW(Error::INVALID_ARGUMENT, DVAR(bits));
    }
    Cap<WUntyped<KIND>> src(std::move(ut));
    return Cap<Untyped<BITS,KIND>>(src.release(), Untyped<BITS,KIND>{src.data().kind});
  }

  /** retype a weak untyped into one object of kind T */
  template<class T, class KIND, class ROLE>
  optional<Cap<T,ROLE>> retype(Cap<WUntyped<KIND>>&& ut, Slots<1,ROLE>&& dest)
  {
    static_assert(!KIND::IS_DEVICE, "device memory can only be retyped into pages with retypeDevicePage");
    size_t bits = ut.data().bits;
    if (bits < ObjectTraits<T>::SIZE_BITS) THROW(Error::NOT_BIG_ENOUGH, DVAR(bits));
    Cap<WUntyped<KIND>> src(std::move(ut));
    Slots<1,ROLE> slot(std::move(dest));
    auto res = internal::retypeRaw(src.cptr(), ObjectTraits<T>::TYPE, ObjectTraits<T>::RETYPE_SIZE,
                                   slot.cnode(), slot.offset(), 1);
    if (!res) RETHROW(res);
    return Cap<T,ROLE>(slot.offset());
  }

  /** retype a weak untyped into count objects with the checks done at runtime */
  template<class T, class KIND, class ROLE>
  optional<WeakCapRange<T,ROLE>>
  retypeMultiRuntime(Cap<WUntyped<KIND>>&& ut, WeakSlots<ROLE>& dest, size_t count)
  {
    static_assert(!KIND::IS_DEVICE || internal::IsPage<T>::value,
                  "device memory can only be retyped into pages");
    size_t objBits = ObjectTraits<T>::SIZE_BITS;
    size_t bits = ut.data().bits;
    if (count > KernelRetypeFanOutLimit) THROW(Error::FAN_OUT_LIMIT, DVAR(count));
    if (count > (~uint64_t(0) >> objBits)) THROW(Error::CAP_SIZE_OVERFLOW, DVAR(count), DVAR(objBits));
    uint64_t capBytes = uint64_t(count) << objBits;
    if (bits >= arch::WORD_BITS) THROW(Error::BIT_SIZE_OVERFLOW, DVAR(bits));
    uint64_t utBytes = uint64_t(1) << bits;
    if (capBytes > utBytes) THROW(Error::NOT_BIG_ENOUGH, DVAR(capBytes), DVAR(utBytes));
    auto slots = dest.alloc(count);
    if (!slots) RETHROW(slots);
    Cap<WUntyped<KIND>> src(std::move(ut));
    auto res = internal::retypeRaw(src.cptr(), ObjectTraits<T>::TYPE, ObjectTraits<T>::RETYPE_SIZE,
                                   slots->cnode(), slots->offset(), count);
    if (!res) RETHROW(res);
    return WeakCapRange<T,ROLE>::uncheckedNew(slots->offset(), T(), count);
  }

} // namespace typecap
