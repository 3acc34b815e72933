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
#include <cstdint>
#include <cstring>
#include <utility>
#include <type_traits>
#include "typecap/caps.hh"
#include "typecap/config.hh"
#include "typecap/IKernel.hh"
#include "typecap/mlog.hh"
#include "cap/Cap.hh"
#include "cap/Untyped.hh"
#include "cap/CNodeSlots.hh"
#include "cap/ASID.hh"
#include "alloc/WUTBuddy.hh"
#include "vspace/PagingAArch64.hh"
#include "vspace/AvailableAddressRange.hh"
#include "vspace/MemoryRegion.hh"
#include "util/align.hh"
#include "util/optional.hh"
#include "util/error-trace.hh"

namespace typecap {

  /** address space states, an imaged address space holds a program image */
  struct Empty {};
  struct Imaged {};

  /** the page frames of the running program's image, mapped in the root address space */
  struct UserImage
  {
    UserImage() : firstPage(NULL_CAP), numPages(0), vaddr(0) {}
    UserImage(CPtr firstPage, size_t numPages, uintptr_t vaddr)
      : firstPage(firstPage), numPages(numPages), vaddr(vaddr) {}
    CPtr firstPage;
    size_t numPages;
    uintptr_t vaddr;
  };

  /** copies len bytes between two addresses of the running program */
  typedef void (*PageCopyFn)(uintptr_t dst, uintptr_t src, size_t len);

  inline void copyLocalMemory(uintptr_t dst, uintptr_t src, size_t len)
  {
    std::memcpy(reinterpret_cast<void*>(dst), reinterpret_cast<void const*>(src), len);
  }

  template<size_t PAGES> class ReservedRegion;
  template<size_t PAGES> class ScratchRegion;

  /** map the image frames themselves, read only */
  struct ReadOnlyImage {};

  /** Map private copies of the image frames, writable. The copies are
   * filled through a scratch region of the parent. */
  template<size_t PAGES>
  struct ReadWritableImage
  {
    ScratchRegion<PAGES>* scratch;
    Cap<WUntyped<General>> codePagesUt;
    WeakSlots<Local> codePagesSlots;
    PageCopyFn copy;
  };

  /** An address space: its paging root, the ASID bound to it, the
   * unclaimed virtual addresses, and the untyped memory and slots used
   * to create paging objects on demand.
   */
  template<class STATE = Imaged, class ROLE = Local>
  class VSpace
  {
  public:
    VSpace() {}
    VSpace(VSpace const&) = delete;
    VSpace& operator=(VSpace const&) = delete;
    VSpace(VSpace&&) = default;
    VSpace& operator=(VSpace&&) = default;

    /** retype a fresh paging root and bind the ASID to it */
    static optional<VSpace> createEmpty(Cap<Untyped<arch::PAGE_GLOBAL_DIRECTORY_BITS>>&& rootUt,
                                        Slots<1,Local>&& rootSlot, UnassignedASID&& asid,
                                        WeakSlots<Local>&& slots, Cap<WUntyped<General>>&& pagingUt)
    {
      static_assert(ROLE::IS_LOCAL, "address spaces are built by their parent");
      auto root = retype<PagingRoot>(std::move(rootUt), std::move(rootSlot));
      if (!root) RETHROW(root);
      auto assigned = assign(std::move(asid), *root);
      if (!assigned) RETHROW(assigned);
      MLOG_INFO(mlog::vspace, "new address space", DVAR(root->cptr()), DVAR(assigned->value()));
      return VSpace(std::move(*root), *assigned, AvailableAddressRange(),
                    weakUTBuddy(std::move(pagingUt)), std::move(slots));
    }

    /** new address space with the program image mapped read only at ProgramStart */
    static optional<VSpace> create(Cap<Untyped<arch::PAGE_GLOBAL_DIRECTORY_BITS>>&& rootUt,
                                   Slots<1,Local>&& rootSlot, UnassignedASID&& asid,
                                   WeakSlots<Local>&& slots, Cap<WUntyped<General>>&& pagingUt,
                                   UserImage const& image, ReadOnlyImage)
    {
      static_assert(std::is_same<STATE,Imaged>::value, "use createEmpty for an address space without image");
      WeakSlots<Local> rest(std::move(slots));
      auto codeSlots = rest.alloc(image.numPages);
      if (!codeSlots) THROW(Error::INSUFFICIENT_CNODE_SLOTS, DVAR(image.numPages));
      auto vs = createEmpty(std::move(rootUt), std::move(rootSlot), std::move(asid),
                            std::move(rest), std::move(pagingUt));
      if (!vs) RETHROW(vs);
      for (size_t i = 0; i < image.numPages; i++) {
        Cap<Page<Mapped>> frame(image.firstPage + i);
        auto copied = uncheckedCopy(frame, codeSlots->cnode(), codeSlots->offset() + i, CapRights::R());
        frame.release();
        if (!copied) RETHROW(copied);
        auto mapped = vs->mapAt(*copied, ProgramStart + i * arch::PAGE_SIZE,
                                CapRights::R(), VMAttributes::standard());
        if (!mapped) RETHROW(mapped);
      }
      MLOG_DETAIL(mlog::vspace, "mapped image", DVAR(image.numPages), DVARhex(vs->range_.bottom()));
      return std::move(*vs);
    }

    /** new address space with a writable copy of the program image at ProgramStart */
    template<size_t PAGES>
    static optional<VSpace> create(Cap<Untyped<arch::PAGE_GLOBAL_DIRECTORY_BITS>>&& rootUt,
                                   Slots<1,Local>&& rootSlot, UnassignedASID&& asid,
                                   WeakSlots<Local>&& slots, Cap<WUntyped<General>>&& pagingUt,
                                   UserImage const& image, ReadWritableImage<PAGES>&& config)
    {
      static_assert(std::is_same<STATE,Imaged>::value, "use createEmpty for an address space without image");
      ReadWritableImage<PAGES> rw(std::move(config));
      auto vs = createEmpty(std::move(rootUt), std::move(rootSlot), std::move(asid),
                            std::move(slots), std::move(pagingUt));
      if (!vs) RETHROW(vs);
      auto pages = retypeMultiRuntime<Page<Unmapped>>(std::move(rw.codePagesUt), rw.codePagesSlots,
                                                      image.numPages);
      if (!pages) RETHROW(pages);
      for (size_t i = 0; i < image.numPages; i++) {
        CPtr page = pages->startCptr() + i;
        uintptr_t src = image.vaddr + i * arch::PAGE_SIZE;
        auto fresh = MemoryRegion<Unmapped,arch::PAGE_BITS>::uncheckedNew(page, Unmapped());
        auto filled = rw.scratch->temporarilyMapRegion(fresh,
            [&rw, src](MemoryRegion<Mapped,arch::PAGE_BITS>& tmp) {
              rw.copy(tmp.vaddr(), src, arch::PAGE_SIZE);
            });
        if (!filled) RETHROW(filled);
        auto mapped = vs->mapAt(page, ProgramStart + i * arch::PAGE_SIZE,
                                CapRights::RW(), VMAttributes::standard());
        if (!mapped) RETHROW(mapped);
      }
      MLOG_DETAIL(mlog::vspace, "copied image", DVAR(image.numPages), DVARhex(vs->range_.bottom()));
      return std::move(*vs);
    }

    /** Wrap the root task's own address space. The image is already
     * mapped, nextAddr is the first address after it. */
    static VSpace bootstrap(CPtr root, uintptr_t nextAddr, WeakSlots<Local>&& slots,
                            AssignedASID asid, Cap<WUntyped<General>>&& ut)
    {
      static_assert(std::is_same<STATE,Imaged>::value && ROLE::IS_LOCAL, "only the root task bootstraps");
      return VSpace(Cap<PagingRoot,Local>(root), asid, AvailableAddressRange(nextAddr, arch::USER_TOP),
                    weakUTBuddy(std::move(ut)), std::move(slots));
    }

    AssignedASID asid() const { return asid_; }
    CPtr rootCptr() const { return root_.cptr(); }
    AvailableAddressRange const& addressRange() const { return range_; }
    WUTBuddy<ROLE> const& utBuddy() const { return utb_; }
    WeakSlots<ROLE> const& pagingSlots() const { return slots_; }

    /** map the region at the next free address and move the watermark past it */
    template<size_t BITS, class KIND>
    optional<MemoryRegion<Mapped,BITS,Exclusive,Local,KIND>>
    mapRegion(MemoryRegion<Unmapped,BITS,Exclusive,Local,KIND>&& region,
              CapRights rights, VMAttributes attrs)
    {
      return mapRegionAuto<Exclusive>(std::move(region), rights, attrs);
    }

    /** Map the region at vaddr. If a page fails, the pages mapped so far
     * are unmapped again and region keeps its caps, so that the caller
     * can try another address. */
    template<size_t BITS, class SHARE, class KIND>
    optional<MemoryRegion<Mapped,BITS,SHARE,Local,KIND>>
    mapRegionAtAddr(MemoryRegion<Unmapped,BITS,SHARE,Local,KIND>&& region, uintptr_t vaddr,
                    CapRights rights, VMAttributes attrs)
    {
      static_assert(ROLE::IS_LOCAL, "a child's address space cannot be changed");
      size_t count = MemoryRegion<Unmapped,BITS,SHARE,Local,KIND>::NUM_PAGES;
      if (count > MaxPagesPerMapping) THROW(Error::TOO_MANY_PAGES, DVAR(count));
      uint64_t end;
      if (!checked_add(vaddr, region.sizeBytes(), end) || end > arch::USER_TOP)
        THROW(Error::EXCEEDED_ADDRESSABLE_SPACE, DVARhex(vaddr), DVAR(BITS));
      auto res = mapPagesAt(region.startCptr(), count, vaddr, rights, attrs, utb_, slots_);
      if (!res) RETHROW(res);
      range_.observeMapping(vaddr, BITS);
      MLOG_DETAIL(mlog::vspace, "mapped region", DVAR(region.startCptr()), DVARhex(vaddr), DVAR(BITS));
      auto mapped = MemoryRegion<Mapped,BITS,SHARE,Local,KIND>::uncheckedNew(
          region.startCptr(), Mapped(vaddr, asid_.value(), rights), region.kind());
      MemoryRegion<Unmapped,BITS,SHARE,Local,KIND> consumed(std::move(region));
      return std::move(mapped);
    }

    /** unmap all pages of a region that was mapped in this address space */
    template<size_t BITS, class SHARE, class KIND>
    optional<MemoryRegion<Unmapped,BITS,SHARE,Local,KIND>>
    unmapRegion(MemoryRegion<Mapped,BITS,SHARE,Local,KIND>&& region)
    {
      static_assert(ROLE::IS_LOCAL, "a child's address space cannot be changed");
      MemoryRegion<Mapped,BITS,SHARE,Local,KIND> src(std::move(region));
      if (src.asid() != asid_.value()) THROW(Error::ASID_MISMATCH, DVAR(src.asid()), DVAR(asid_.value()));
      auto res = unmapPages(src.startCptr(), MemoryRegion<Mapped,BITS,SHARE,Local,KIND>::NUM_PAGES);
      if (!res) RETHROW(res);
      MLOG_DETAIL(mlog::vspace, "unmapped region", DVAR(src.startCptr()), DVARhex(src.vaddr()));
      return MemoryRegion<Unmapped,BITS,SHARE,Local,KIND>::uncheckedNew(src.startCptr(), Unmapped(), src.kind());
    }

    /** Copy the caps of the shared region into slots and map the copies.
     * The region itself stays unmapped and can be mapped elsewhere. */
    template<size_t BITS, class KIND>
    optional<MemoryRegion<Mapped,BITS,Shared,Local,KIND>>
    mapSharedRegion(MemoryRegion<Unmapped,BITS,Shared,Local,KIND> const& region, CapRights rights,
                    VMAttributes attrs, Slots<(size_t(1) << (BITS - arch::PAGE_BITS)),Local>&& slots)
    {
      typedef MemoryRegion<Unmapped,BITS,Shared,Local,KIND> Region;
      Slots<Region::NUM_PAGES,Local> dest(std::move(slots));
      CPtr start = dest.offset();
      for (size_t i = 0; i < Region::NUM_PAGES; i++) {
        Cap<Page<Unmapped>> page(region.startCptr() + i);
        auto res = uncheckedCopy(page, dest.cnode(), start + i, rights);
        page.release();
        if (!res) RETHROW(res);
      }
      return mapRegionAuto<Shared>(Region::uncheckedNew(start, Unmapped(), region.kind()), rights, attrs);
    }

    /** Map the caps of the shared region without copying them. After an
     * unmap they need a fresh copy before they can be mapped elsewhere. */
    template<size_t BITS, class KIND>
    optional<MemoryRegion<Mapped,BITS,Shared,Local,KIND>>
    mapSharedRegionAndConsume(MemoryRegion<Unmapped,BITS,Shared,Local,KIND>&& region,
                              CapRights rights, VMAttributes attrs)
    {
      return mapRegionAuto<Shared>(std::move(region), rights, attrs);
    }

    /** map the region, then move its page caps into dest, e.g. the CNode of a child */
    template<size_t BITS, class KIND, class DEST>
    optional<MemoryRegion<Mapped,BITS,Exclusive,DEST,KIND>>
    mapRegionAndMove(MemoryRegion<Unmapped,BITS,Exclusive,Local,KIND>&& region, CapRights rights,
                     VMAttributes attrs, Slots<(size_t(1) << (BITS - arch::PAGE_BITS)),DEST>&& dest)
    {
      typedef MemoryRegion<Mapped,BITS,Exclusive,DEST,KIND> Moved;
      Slots<Moved::NUM_PAGES,DEST> slots(std::move(dest));
      auto mapped = mapRegionAuto<Exclusive>(std::move(region), rights, attrs);
      if (!mapped) RETHROW(mapped);
      for (size_t i = 0; i < Moved::NUM_PAGES; i++) {
        TYPECAP_SYSCALL(Error::CNODE_MOVE,
                        kernel->cnodeMove(slots.cnode(), slots.offset() + i, arch::WORD_BITS,
                                          INIT_THREAD_CNODE, mapped->startCptr() + i, arch::WORD_BITS));
      }
      MLOG_DETAIL(mlog::vspace, "moved mapped region", DVAR(slots.cnode()), DVAR(slots.offset()));
      return Moved::uncheckedNew(slots.offset(), mapped->state(), mapped->kind());
    }

    /** map a single page at the next free address */
    optional<Cap<Page<Mapped>>> mapGivenPage(Cap<Page<Unmapped>>&& page, CapRights rights, VMAttributes attrs)
    {
      static_assert(ROLE::IS_LOCAL, "a child's address space cannot be changed");
      auto vaddr = range_.autoPropose(arch::PAGE_BITS);
      if (!vaddr) RETHROW(vaddr);
      auto res = mapAt(page.cptr(), *vaddr, rights, attrs);
      if (!res) RETHROW(res);
      return Cap<Page<Mapped>>(page.release(), Page<Mapped>{Mapped(*vaddr, asid_.value(), rights)});
    }

    optional<Cap<Page<Unmapped>>> unmapPage(Cap<Page<Mapped>>&& page)
    {
      static_assert(ROLE::IS_LOCAL, "a child's address space cannot be changed");
      Cap<Page<Mapped>> src(std::move(page));
      asid_t asid = src.data().state.asid;
      if (asid != asid_.value()) THROW(Error::ASID_MISMATCH, DVAR(asid), DVAR(asid_.value()));
      auto res = unmapPages(src.cptr(), 1);
      if (!res) RETHROW(res);
      return Cap<Page<Unmapped>>(src.release());
    }

    /** leave count pages unmapped, e.g. as guard below a stack */
    optional<void> skipPages(size_t count) { return range_.skip(count); }

    /** Claim a window of PAGES pages whose paging objects all exist. The
     * sacrificial page is mapped into each page of the window once to
     * create them and is handed back unmapped. */
    template<size_t PAGES>
    optional<std::pair<ReservedRegion<PAGES>, Cap<Page<Unmapped>>>>
    reserve(Cap<Page<Unmapped>>&& sacrificialPage)
    {
      static_assert(PAGES > 0, "an empty window cannot be reserved");
      Cap<Page<Unmapped>> page(std::move(sacrificialPage));
      uintptr_t first = 0;
      for (size_t i = 0; i < PAGES; i++) {
        auto mapped = mapGivenPage(std::move(page), CapRights::RW(), VMAttributes::standard());
        if (!mapped) RETHROW(mapped);
        if (i == 0) first = mapped->data().state.vaddr;
        auto unmapped = unmapPage(std::move(*mapped));
        if (!unmapped) RETHROW(unmapped);
        page = std::move(*unmapped);
      }
      MLOG_DETAIL(mlog::vspace, "reserved window", DVARhex(first), DVAR(PAGES));
      return std::make_pair(ReservedRegion<PAGES>(first, asid_), std::move(page));
    }

    /** Hand the address space to a child. The paging root and all
     * untyped memory are moved into the child's CNode, further paging
     * objects will use the child's slots. */
    optional<VSpace<STATE,Child>> forChild(Slots<1,Child>&& childRootSlot,
                                           WeakSlots<Child>& utTransferSlots,
                                           WeakSlots<Child>&& childPagingSlots) &&
    {
      static_assert(ROLE::IS_LOCAL, "address space already belongs to a child");
      if (utTransferSlots.size() < utb_.total())
        THROW(Error::INSUFFICIENT_CNODE_SLOTS, DVAR(utTransferSlots.size()), DVAR(utb_.total()));
      auto root = moveToSlot(std::move(root_), std::move(childRootSlot));
      if (!root) RETHROW(root);
      auto utb = std::move(utb_).moveToChild(utTransferSlots);
      if (!utb) RETHROW(utb);
      MLOG_INFO(mlog::vspace, "address space handed to child", DVAR(asid_.value()), DVAR(root->cptr()));
      return VSpace<STATE,Child>(std::move(*root), asid_, range_, std::move(*utb),
                                 std::move(childPagingSlots));
    }

  protected:
    template<class S, class R> friend class VSpace;
    template<size_t P> friend class ScratchRegion;

    VSpace(Cap<PagingRoot,ROLE>&& root, AssignedASID asid, AvailableAddressRange const& range,
           WUTBuddy<ROLE>&& utb, WeakSlots<ROLE>&& slots)
      : root_(std::move(root)), asid_(asid), range_(range), utb_(std::move(utb)), slots_(std::move(slots))
    {}

    template<class SHARE, class INSHARE, size_t BITS, class KIND>
    optional<MemoryRegion<Mapped,BITS,SHARE,Local,KIND>>
    mapRegionAuto(MemoryRegion<Unmapped,BITS,INSHARE,Local,KIND>&& region, CapRights rights, VMAttributes attrs)
    {
      static_assert(ROLE::IS_LOCAL, "a child's address space cannot be changed");
      MemoryRegion<Unmapped,BITS,INSHARE,Local,KIND> src(std::move(region));
      auto vaddr = range_.autoPropose(BITS);
      if (!vaddr) RETHROW(vaddr);
      auto res = mapPagesAt(src.startCptr(), MemoryRegion<Unmapped,BITS,INSHARE,Local,KIND>::NUM_PAGES,
                            *vaddr, rights, attrs, utb_, slots_);
      if (!res) RETHROW(res);
      range_.observeMapping(*vaddr, BITS);
      MLOG_DETAIL(mlog::vspace, "mapped region", DVAR(src.startCptr()), DVARhex(*vaddr), DVAR(BITS));
      return MemoryRegion<Mapped,BITS,SHARE,Local,KIND>::uncheckedNew(
          src.startCptr(), Mapped(*vaddr, asid_.value(), rights), src.kind());
    }

    /** map one page at a fixed address and tell the address range about it */
    optional<void> mapAt(CPtr page, uintptr_t vaddr, CapRights rights, VMAttributes attrs)
    {
      auto res = mapPagesAt(page, 1, vaddr, rights, attrs, utb_, slots_);
      if (!res) RETHROW(res);
      range_.observeMapping(vaddr, arch::PAGE_BITS);
      return res;
    }

    /** map count consecutive page caps, on failure unmap the ones already mapped */
    optional<void> mapPagesAt(CPtr first, size_t count, uintptr_t vaddr, CapRights rights,
                              VMAttributes attrs, WUTBuddy<Local>& utb, WeakSlots<Local>& slots)
    {
      for (size_t i = 0; i < count; i++) {
        auto res = ArchPaging::mapItem(first + i, root_.cptr(), vaddr + i * arch::PAGE_SIZE,
                                       rights, attrs, utb, slots);
        if (!res) {
          rollback(first, i);
          RETHROW(res, DVARhex(vaddr), DVAR(i));
        }
      }
      return optional<void>(Error::SUCCESS);
    }

    optional<void> unmapPages(CPtr first, size_t count)
    {
      for (size_t i = 0; i < count; i++) {
        TYPECAP_SYSCALL(Error::PAGE_UNMAP, kernel->pageUnmap(first + i));
      }
      return optional<void>(Error::SUCCESS);
    }

    /** undo the first count mappings, failures are logged but not reported */
    void rollback(CPtr first, size_t count)
    {
      for (size_t i = count; i > 0; i--) {
        auto err = kernel->pageUnmap(first + i - 1);
        if (err != KernelError::NO_ERROR)
          MLOG_WARN(mlog::vspace, "rollback unmap failed", DVAR(first + i - 1), DVAR(err));
      }
    }

    Cap<PagingRoot,ROLE> root_;
    AssignedASID asid_;
    AvailableAddressRange range_;
    WUTBuddy<ROLE> utb_;
    WeakSlots<ROLE> slots_;
  };

  /** A window of virtual addresses whose paging objects are in place,
   * so mapping pages there needs neither untyped nor slots. */
  template<size_t PAGES>
  class ReservedRegion
  {
  public:
    static constexpr size_t NUM_PAGES = PAGES;

    ReservedRegion() : vaddr_(0) {}
    ReservedRegion(uintptr_t vaddr, AssignedASID asid) : vaddr_(vaddr), asid_(asid) {}

    uintptr_t vaddr() const { return vaddr_; }
    AssignedASID asid() const { return asid_; }
    constexpr size_t size() const { return PAGES * arch::PAGE_SIZE; }

    /** use the window for temporary mappings, vspace must be the one it was reserved in */
    optional<ScratchRegion<PAGES>> asScratch(VSpace<Imaged,Local>& vspace) const;

  private:
    uintptr_t vaddr_;
    AssignedASID asid_;
  };

  template<size_t PAGES>
  class ScratchRegion
  {
  public:
    ScratchRegion() : reserved_(nullptr), vspace_(nullptr) {}
    ScratchRegion(ReservedRegion<PAGES> const* reserved, VSpace<Imaged,Local>* vspace)
      : reserved_(reserved), vspace_(vspace) {}

    /** Map the region into the window, run f on the mapped region and
     * unmap it again. Fill a region this way before sharing it. */
    template<size_t BITS, class KIND, class F>
    optional<void> temporarilyMapRegion(MemoryRegion<Unmapped,BITS,Exclusive,Local,KIND>& region, F f)
    {
      typedef MemoryRegion<Mapped,BITS,Exclusive,Local,KIND> Temp;
      static_assert(Temp::NUM_PAGES <= PAGES, "region does not fit into the scratch window");
      WUTBuddy<Local> noUntyped;
      WeakSlots<Local> noSlots;
      uintptr_t vaddr = reserved_->vaddr();
      auto res = vspace_->mapPagesAt(region.startCptr(), Temp::NUM_PAGES, vaddr,
                                     CapRights::RW(), VMAttributes::standard(), noUntyped, noSlots);
      if (!res) RETHROW(res);
      auto tmp = Temp::uncheckedNew(region.startCptr(), Mapped(vaddr, reserved_->asid().value(), CapRights::RW()),
                                    region.kind());
      f(tmp);
      auto unmapped = vspace_->unmapPages(region.startCptr(), Temp::NUM_PAGES);
      if (!unmapped) RETHROW(unmapped);
      return optional<void>(Error::SUCCESS);
    }

  private:
    ReservedRegion<PAGES> const* reserved_;
    VSpace<Imaged,Local>* vspace_;
  };

  template<size_t PAGES>
  optional<ScratchRegion<PAGES>> ReservedRegion<PAGES>::asScratch(VSpace<Imaged,Local>& vspace) const
  {
    if (vspace.asid() != asid_) THROW(Error::ASID_MISMATCH, DVAR(asid_.value()), DVAR(vspace.asid().value()));
    return ScratchRegion<PAGES>(this, &vspace);
  }

} // namespace typecap
