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

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <type_traits>
#include "typecap/caps.hh"
#include "typecap/config.hh"
#include "typecap/IKernel.hh"
#include "typecap/mlog.hh"
#include "cap/Cap.hh"
#include "cap/CapRange.hh"
#include "cap/Untyped.hh"
#include "cap/CNodeSlots.hh"
#include "util/align.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  /** sharing status of a region, shared regions may alias their frames */
  struct Exclusive { static constexpr bool IS_SHARED = false; };
  struct Shared { static constexpr bool IS_SHARED = true; };

namespace internal {

  template<class STATE> struct RegionState;

  template<> struct RegionState<Unmapped>
  {
    static bool offsetBy(Unmapped const& s, uint64_t, Unmapped& res) { res = s; return true; }
  };

  template<> struct RegionState<Mapped>
  {
    static bool offsetBy(Mapped const& s, uint64_t bytes, Mapped& res) {
      uint64_t vaddr;
      if (!checked_add(s.vaddr, bytes, vaddr)) return false;
      res = Mapped(vaddr, s.asid, s.rights);
      return true;
    }
  };

  template<class KIND> struct KindFrom;
  template<> struct KindFrom<General> {
    static bool make(WeakKind const& k, General& res) { res = General(); return !k.device; }
  };
  template<> struct KindFrom<Device> {
    static bool make(WeakKind const& k, Device& res) { res = Device(k.paddr); return k.device; }
  };

  inline optional<uintptr_t> regionPaddr(CPtr firstPage, General const&)
  {
    uintptr_t addr = 0;
    TYPECAP_SYSCALL(Error::PAGE_GET_ADDRESS, kernel->pageGetAddress(firstPage, addr));
    return addr;
  }

  inline optional<uintptr_t> regionPaddr(CPtr, Device const& kind) { return kind.paddr(); }

  /** retype count pages in chunks the kernel accepts */
  inline optional<void> retypePages(CPtr ut, CPtr cnode, CPtr offset, size_t count)
  {
    for (size_t done = 0; done < count; ) {
      size_t chunk = count - done;
      if (chunk > KernelRetypeFanOutLimit) chunk = KernelRetypeFanOutLimit;
      auto res = retypeRaw(ut, ObjectType::SMALL_PAGE, 0, cnode, offset + done, chunk);
      if (!res) RETHROW(res);
      done += chunk;
    }
    return optional<void>(Error::SUCCESS);
  }

} // namespace internal

  template<class STATE, class SHARE, class ROLE> class WeakMemoryRegion;

  /** Consecutive page caps that back 2^BITS bytes of memory. The type
   * records whether the pages are mapped, whether the frames may be
   * aliased by other regions, where the caps live and the kind of
   * memory behind them.
   *
   * Exclusive-Unmapped --share--> Shared-Unmapped
   * Exclusive-Unmapped --map--> Exclusive-Mapped --unmap--> Exclusive-Unmapped
   * Shared-Unmapped --map--> Shared-Mapped --unmap--> Shared-Unmapped
   *
   * A shared region mapped with mapSharedRegionAndConsume holds the only
   * handles of its caps, a later mapping elsewhere needs a fresh copy.
   */
  template<class STATE, size_t BITS, class SHARE = Exclusive, class ROLE = Local, class KIND = General>
  class MemoryRegion
  {
  public:
    static_assert(BITS >= arch::PAGE_BITS, "a region holds at least one page");
    static_assert(BITS < arch::WORD_BITS, "region larger than the address space");
    static constexpr size_t SIZE_BITS = BITS;
    static constexpr size_t NUM_PAGES = size_t(1) << (BITS - arch::PAGE_BITS);

    MemoryRegion() : start_(NULL_CAP) {}
    MemoryRegion(MemoryRegion const&) = delete;
    MemoryRegion& operator=(MemoryRegion const&) = delete;
    MemoryRegion(MemoryRegion&& o) : start_(o.start_), state_(o.state_), kind_(o.kind_) { o.start_ = NULL_CAP; }
    MemoryRegion& operator=(MemoryRegion&& o) {
      start_ = o.start_; state_ = o.state_; kind_ = o.kind_; o.start_ = NULL_CAP; return *this;
    }

    static MemoryRegion uncheckedNew(CPtr start, STATE const& state, KIND const& kind = KIND()) {
      return MemoryRegion(start, state, kind);
    }

    /** retype a general untyped of the region's size into fresh pages */
    static optional<MemoryRegion> create(Cap<Untyped<BITS,General>>&& ut, Slots<NUM_PAGES,ROLE>&& dest) {
      static_assert(std::is_same<STATE,Unmapped>::value, "new regions are unmapped");
      static_assert(std::is_same<KIND,General>::value, "use createDevice for device memory");
      Cap<Untyped<BITS,General>> src(std::move(ut));
      Slots<NUM_PAGES,ROLE> slots(std::move(dest));
      auto res = internal::retypePages(src.cptr(), slots.cnode(), slots.offset(), NUM_PAGES);
      if (!res) RETHROW(res);
      return MemoryRegion(slots.offset(), STATE(), KIND());
    }

    /** retype device untyped into pages that remember the physical address */
    static optional<MemoryRegion> createDevice(Cap<Untyped<BITS,Device>>&& ut, Slots<NUM_PAGES,ROLE>&& dest) {
      static_assert(std::is_same<STATE,Unmapped>::value, "new regions are unmapped");
      static_assert(std::is_same<KIND,Device>::value, "use create for general memory");
      Cap<Untyped<BITS,Device>> src(std::move(ut));
      Slots<NUM_PAGES,ROLE> slots(std::move(dest));
      auto res = internal::retypePages(src.cptr(), slots.cnode(), slots.offset(), NUM_PAGES);
      if (!res) RETHROW(res);
      return MemoryRegion(slots.offset(), STATE(), src.data().kind);
    }

    CPtr startCptr() const { return start_; }
    STATE const& state() const { return state_; }
    KIND const& kind() const { return kind_; }
    constexpr size_t sizeBits() const { return BITS; }
    constexpr uint64_t sizeBytes() const { return uint64_t(1) << BITS; }
    constexpr size_t numPages() const { return NUM_PAGES; }

    template<class S = STATE>
    typename std::enable_if<std::is_same<S,Mapped>::value, uintptr_t>::type
    vaddr() const { return state_.vaddr; }

    template<class S = STATE>
    typename std::enable_if<std::is_same<S,Mapped>::value, asid_t>::type
    asid() const { return state_.asid; }

    /** physical address of the first frame */
    optional<uintptr_t> paddr() const {
      static_assert(ROLE::IS_LOCAL, "a child's pages cannot be inspected");
      return internal::regionPaddr(start_, kind_);
    }

    /** the page caps of the region */
    CapRange<Page<STATE>,ROLE,NUM_PAGES> caps() && {
      auto res = CapRange<Page<STATE>,ROLE,NUM_PAGES>::uncheckedNew(start_, Page<STATE>{state_});
      start_ = NULL_CAP;
      return res;
    }

    WeakMemoryRegion<STATE,SHARE,ROLE> weaken() && {
      auto res = WeakMemoryRegion<STATE,SHARE,ROLE>::uncheckedNew(start_, state_, WeakKind(kind_), BITS);
      start_ = NULL_CAP;
      return res;
    }

    MemoryRegion<STATE,BITS,Shared,ROLE,KIND> toShared() && {
      auto res = MemoryRegion<STATE,BITS,Shared,ROLE,KIND>::uncheckedNew(start_, state_, kind_);
      start_ = NULL_CAP;
      return res;
    }

    /** Copy the page caps into dest. Returns the unmapped shared copy
     * and this region, which is now marked as shared as well. */
    template<class DEST>
    optional<std::pair<MemoryRegion<Unmapped,BITS,Shared,DEST,KIND>, MemoryRegion<STATE,BITS,Shared,ROLE,KIND>>>
    share(Slots<NUM_PAGES,DEST>&& dest, CapRights rights) && {
      static_assert(ROLE::IS_LOCAL, "only local pages can be copied");
      Slots<NUM_PAGES,DEST> slots(std::move(dest));
      for (size_t i = 0; i < NUM_PAGES; i++) {
        Cap<Page<STATE>,Local> page(start_ + i);
        auto res = uncheckedCopy(page, slots.cnode(), slots.offset() + i, rights);
        page.release();
        if (!res) RETHROW(res);
      }
      MLOG_DETAIL(mlog::vspace, "shared region", DVAR(start_), DVAR(slots.offset()), DVAR(BITS));
      auto copy = MemoryRegion<Unmapped,BITS,Shared,DEST,KIND>::uncheckedNew(slots.offset(), Unmapped(), kind_);
      auto self = MemoryRegion<STATE,BITS,Shared,ROLE,KIND>::uncheckedNew(start_, state_, kind_);
      start_ = NULL_CAP;
      return std::make_pair(std::move(copy), std::move(self));
    }

    /** two halves over the first and second half of the pages */
    optional<std::pair<MemoryRegion<STATE,BITS-1,SHARE,ROLE,KIND>, MemoryRegion<STATE,BITS-1,SHARE,ROLE,KIND>>>
    split() && {
      static_assert(BITS > arch::PAGE_BITS, "a single page cannot be split");
      typedef MemoryRegion<STATE,BITS-1,SHARE,ROLE,KIND> Half;
      uint64_t halfBytes = uint64_t(1) << (BITS-1);
      STATE upper;
      if (!internal::RegionState<STATE>::offsetBy(state_, halfBytes, upper))
        THROW(Error::EXCEEDED_ADDRESSABLE_SPACE, DVAR(start_), DVAR(BITS));
      auto lower = Half::uncheckedNew(start_, state_, kind_);
      auto higher = Half::uncheckedNew(start_ + NUM_PAGES/2, upper, kind_.part(halfBytes));
      start_ = NULL_CAP;
      return std::make_pair(std::move(lower), std::move(higher));
    }

    /** 2^(BITS-TARGET) parts of 2^TARGET bytes each, in address order */
    template<size_t TARGET>
    optional<std::array<MemoryRegion<STATE,TARGET,SHARE,ROLE,KIND>, (size_t(1) << (BITS - TARGET))>>
    splitInto() && {
      static_assert(TARGET >= arch::PAGE_BITS, "parts hold at least one page");
      static_assert(TARGET <= BITS, "parts cannot be larger than the region");
      typedef MemoryRegion<STATE,TARGET,SHARE,ROLE,KIND> Part;
      std::array<Part, (size_t(1) << (BITS - TARGET))> parts;
      uint64_t partBytes = uint64_t(1) << TARGET;
      for (size_t i = 0; i < parts.size(); i++) {
        STATE state;
        if (!internal::RegionState<STATE>::offsetBy(state_, i * partBytes, state))
          THROW(Error::EXCEEDED_ADDRESSABLE_SPACE, DVAR(start_), DVAR(BITS), DVAR(TARGET));
        parts[i] = Part::uncheckedNew(start_ + i * Part::NUM_PAGES, state, kind_.part(i * partBytes));
      }
      MLOG_DETAIL(mlog::vspace, "split region", DVAR(start_), DVAR(BITS), DVAR(TARGET));
      start_ = NULL_CAP;
      return std::move(parts);
    }

  private:
    MemoryRegion(CPtr start, STATE const& state, KIND const& kind)
      : start_(start), state_(state), kind_(kind) {}

    CPtr start_;
    STATE state_;
    KIND kind_;
  };

  template<size_t BITS, class SHARE = Exclusive, class ROLE = Local, class KIND = General>
  using UnmappedMemoryRegion = MemoryRegion<Unmapped, BITS, SHARE, ROLE, KIND>;

  template<size_t BITS, class SHARE = Exclusive, class ROLE = Local, class KIND = General>
  using MappedMemoryRegion = MemoryRegion<Mapped, BITS, SHARE, ROLE, KIND>;

  /** A region whose size is only known at runtime, e.g. device memory
   * found in the boot information. */
  template<class STATE, class SHARE = Exclusive, class ROLE = Local>
  class WeakMemoryRegion
  {
  public:
    WeakMemoryRegion() : start_(NULL_CAP), sizeBits_(0) {}
    WeakMemoryRegion(WeakMemoryRegion const&) = delete;
    WeakMemoryRegion& operator=(WeakMemoryRegion const&) = delete;
    WeakMemoryRegion(WeakMemoryRegion&& o)
      : start_(o.start_), state_(o.state_), kind_(o.kind_), sizeBits_(o.sizeBits_) { o.start_ = NULL_CAP; }
    WeakMemoryRegion& operator=(WeakMemoryRegion&& o) {
      start_ = o.start_; state_ = o.state_; kind_ = o.kind_; sizeBits_ = o.sizeBits_;
      o.start_ = NULL_CAP;
      return *this;
    }

    static WeakMemoryRegion uncheckedNew(CPtr start, STATE const& state, WeakKind const& kind, size_t sizeBits) {
      return WeakMemoryRegion(start, state, kind, sizeBits);
    }

    /** retype a weak untyped into as many pages as fit */
    template<class KIND>
    static optional<WeakMemoryRegion> create(Cap<WUntyped<KIND>>&& ut, WeakSlots<ROLE>& dest) {
      static_assert(std::is_same<STATE,Unmapped>::value, "new regions are unmapped");
      size_t bits = ut.data().bits;
      if (bits < arch::PAGE_BITS || bits >= arch::WORD_BITS) THROW(Error::INVALID_REGION_SIZE, DVAR(bits));
      size_t count = size_t(1) << (bits - arch::PAGE_BITS);
      auto slots = dest.alloc(count);
      if (!slots) RETHROW(slots);
      Cap<WUntyped<KIND>> src(std::move(ut));
      auto res = internal::retypePages(src.cptr(), slots->cnode(), slots->offset(), count);
      if (!res) RETHROW(res);
      return WeakMemoryRegion(slots->offset(), STATE(), WeakKind(src.data().kind), bits);
    }

    CPtr startCptr() const { return start_; }
    STATE const& state() const { return state_; }
    WeakKind const& kind() const { return kind_; }
    size_t sizeBits() const { return sizeBits_; }
    uint64_t sizeBytes() const { return uint64_t(1) << sizeBits_; }
    size_t numPages() const { return size_t(1) << (sizeBits_ - arch::PAGE_BITS); }

    template<class S = STATE>
    typename std::enable_if<std::is_same<S,Mapped>::value, uintptr_t>::type
    vaddr() const { return state_.vaddr; }

    template<class S = STATE>
    typename std::enable_if<std::is_same<S,Mapped>::value, asid_t>::type
    asid() const { return state_.asid; }

    optional<uintptr_t> paddr() const {
      static_assert(ROLE::IS_LOCAL, "a child's pages cannot be inspected");
      if (kind_.device) return kind_.paddr;
      return internal::regionPaddr(start_, General());
    }

    /** recover the static size and kind */
    template<size_t BITS, class KIND = General>
    optional<MemoryRegion<STATE,BITS,SHARE,ROLE,KIND>> asStrong() && {
      if (sizeBits_ != BITS) THROW(Error::INVALID_REGION_SIZE, DVAR(sizeBits_));
      KIND kind;
      if (!internal::KindFrom<KIND>::make(kind_, kind)) THROW(Error::INVALID_ARGUMENT, DVAR(kind_.device));
      auto res = MemoryRegion<STATE,BITS,SHARE,ROLE,KIND>::uncheckedNew(start_, state_, kind);
      start_ = NULL_CAP;
      return std::move(res);
    }

    WeakMemoryRegion<STATE,Shared,ROLE> toShared() && {
      auto res = WeakMemoryRegion<STATE,Shared,ROLE>::uncheckedNew(start_, state_, kind_, sizeBits_);
      start_ = NULL_CAP;
      return res;
    }

  private:
    WeakMemoryRegion(CPtr start, STATE const& state, WeakKind const& kind, size_t sizeBits)
      : start_(start), state_(state), kind_(kind), sizeBits_(sizeBits) {}

    CPtr start_;
    STATE state_;
    WeakKind kind_;
    size_t sizeBits_;
  };

} // namespace typecap
