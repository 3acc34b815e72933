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
#include <map>
#include <vector>
#include "typecap/caps.hh"
#include "typecap/config.hh"
#include "typecap/BootInfo.hh"
#include "typecap/IKernel.hh"

namespace typecap {
namespace host {

  /** Model of the capability kernel for running the library on a host.
   *
   * The root CNode has a guard that makes a full word cptr resolve to
   * the slot with that number, the same holds for CNodes made by
   * retypeCNode. Caps record the cap they were derived from, so revoke
   * removes everything below a cap. Each paging root has four levels of
   * tables and frames keep their contents, so a byte written through
   * one mapping is visible through every other mapping of the frame.
   */
  class SimKernel
    : public IKernel
  {
  public:
    struct UntypedConfig
    {
      uint8_t sizeBits;
      bool isDevice;
      uintptr_t paddr; // device memory only
    };

    struct Config
    {
      Config();
      size_t cnodeRadix;
      size_t imagePages;
      std::vector<UntypedConfig> untyped;
    };

    enum Op {
      RETYPE, COPY, MINT, MOVE, MUTATE, DELETE, REVOKE, MAKE_POOL, ASSIGN,
      PAGE_MAP, PAGE_UNMAP, GET_ADDRESS, TABLE_MAP, DIRECTORY_MAP, UPPER_DIRECTORY_MAP,
      NUM_OPS
    };

    SimKernel();
    explicit SimKernel(Config const& config);
    virtual ~SimKernel() {}

    BootInfo const& bootInfo() const { return bootinfo; }

    /** invocations of op so far, failed ones included */
    size_t count(Op op) const { return counters[op]; }

    /** the cap in a slot of the root CNode */
    bool isEmpty(CPtr slot) const;
    ObjectType typeOf(CPtr slot) const;
    CapRights rightsOf(CPtr slot) const;
    Badge badgeOf(CPtr slot) const;
    /** radix and guard size of a CNode cap */
    size_t radixOf(CPtr slot) const;
    size_t guardSizeOf(CPtr slot) const;
    /** whether a slot of the CNode that the root CNode slot cnode names is empty */
    bool isEmptyIn(CPtr cnode, CPtr slot) const;
    /** size of an untyped and the bytes retyped from it */
    size_t untypedBits(CPtr slot) const;
    uint64_t untypedUsed(CPtr slot) const;
    /** the ASID bound to a paging root, 0 if none */
    asid_t asidOf(CPtr root) const;
    /** whether a page cap is mapped, and where */
    bool isMapped(CPtr page) const;
    uintptr_t mappedVaddr(CPtr page) const;
    /** number of pages mapped in the address space of a paging root */
    size_t mappedPageCount(CPtr root) const;
    /** whether the page table that covers vaddr exists */
    bool hasPageTable(CPtr root, uintptr_t vaddr) const;

    /** access memory through the address space of a paging root */
    bool write8(CPtr root, uintptr_t vaddr, uint8_t value);
    bool read8(CPtr root, uintptr_t vaddr, uint8_t& value) const;
    bool copyVirtual(CPtr root, uintptr_t dst, uintptr_t src, size_t len);

    KernelError untypedRetype(CPtr untyped, ObjectType type, size_t sizeBits,
                              CPtr root, CPtr nodeIndex, size_t nodeDepth,
                              CPtr nodeOffset, size_t numObjects) override;

    KernelError cnodeCopy(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                          CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth,
                          CapRights rights) override;
    KernelError cnodeMint(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                          CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth,
                          CapRights rights, Badge badge) override;
    KernelError cnodeMove(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                          CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth) override;
    KernelError cnodeMutate(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                            CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth,
                            CNodeCapData data) override;
    KernelError cnodeDelete(CPtr root, CPtr index, uint8_t depth) override;
    KernelError cnodeRevoke(CPtr root, CPtr index, uint8_t depth) override;

    KernelError asidControlMakePool(CPtr control, CPtr untyped,
                                    CPtr root, CPtr index, uint8_t depth) override;
    KernelError asidPoolAssign(CPtr pool, CPtr vspace) override;

    KernelError pageMap(CPtr page, CPtr vspace, uintptr_t vaddr,
                        CapRights rights, VMAttributes attr) override;
    KernelError pageUnmap(CPtr page) override;
    KernelError pageGetAddress(CPtr page, uintptr_t& paddr) override;

    KernelError pageTableMap(CPtr table, CPtr vspace, uintptr_t vaddr, VMAttributes attr) override;
    KernelError pageDirectoryMap(CPtr dir, CPtr vspace, uintptr_t vaddr, VMAttributes attr) override;
    KernelError pageUpperDirectoryMap(CPtr dir, CPtr vspace, uintptr_t vaddr, VMAttributes attr) override;

  private:
    typedef size_t ObjId;
    enum : ObjId { NO_OBJECT = ~size_t(0) };

    /** object kinds, the first ones match ObjectType */
    enum Kind : uint8_t {
      K_UNTYPED = 0, K_TCB, K_ENDPOINT, K_NOTIFICATION, K_CNODE, K_HUGE_PAGE,
      K_PUD, K_PGD, K_PAGE, K_LARGE_PAGE, K_PT, K_PD,
      K_ASID_CONTROL, K_ASID_POOL, K_IRQ_CONTROL
    };

    struct Object
    {
      Kind kind;
      size_t sizeBits;
      uintptr_t paddr;
      bool device;
      uint64_t watermark;            // untyped
      std::vector<ObjId> slotsOf;    // cnode: index into caps per slot
      std::map<size_t, ObjId> entries; // paging objects and asid pools
      asid_t asid;                   // paging root, asid pool base
      bool mapped;                   // intermediate paging objects
      ObjId mappedIn;
      size_t mappedIndex;
    };

    struct CapEntry
    {
      CapEntry() : valid(false), obj(NO_OBJECT), badge(0), id(0), parent(0),
                   mapped(false), mapRoot(NO_OBJECT), mapVaddr(0) {}
      bool valid;
      ObjId obj;
      CapRights rights;
      Badge badge;
      CNodeCapData guard;
      uint64_t id;
      uint64_t parent;
      bool mapped;                   // frames
      ObjId mapRoot;
      uintptr_t mapVaddr;
    };

    /** a slot is a position in a CNode object */
    struct SlotRef
    {
      ObjId cnode;
      size_t index;
    };

    void boot(Config const& config);
    ObjId newObject(Kind kind, size_t sizeBits, uintptr_t paddr, bool device);
    void install(SlotRef slot, ObjId obj, CapRights rights, uint64_t parent);
    /** the table below parent at index, created if missing */
    ObjId ensureTable(ObjId parent, size_t index, Kind kind, uintptr_t& paddr, std::vector<ObjId>& made);

    size_t capIndex(SlotRef s) const { return objects[s.cnode].slotsOf[s.index]; }
    CapEntry& entry(SlotRef s) { return caps[capIndex(s)]; }
    CapEntry const& entry(SlotRef s) const { return caps[capIndex(s)]; }

    /** resolve cptr in the CNode with the given number of bits */
    KernelError resolveIn(CapEntry const& cnode, CPtr cptr, size_t depth, SlotRef& res) const;
    /** resolve a cptr of the root task */
    KernelError resolve(CPtr cptr, SlotRef& res) const;
    KernelError lookup(CPtr cptr, Kind kind, SlotRef& res) const;
    /** the CNode named by a root cptr and an index with depth, depth 0 names the root */
    KernelError resolveNode(CPtr root, CPtr index, size_t depth, ObjId& res) const;
    KernelError resolveDest(CPtr root, CPtr index, size_t depth, SlotRef& res) const;

    void removeCap(size_t index);
    void revokeBelow(uint64_t id);
    void unmapFrame(CapEntry& cap);
    void unlinkTable(ObjId obj);
    size_t objectBits(ObjectType type, size_t sizeBits) const;

    /** walk the tables of a root down to the level that maps at shift */
    ObjId walk(ObjId root, uintptr_t vaddr, size_t shift) const;
    KernelError mapTable(Op op, Kind kind, CPtr table, CPtr vspace, uintptr_t vaddr, size_t shift);
    bool translate(CPtr root, uintptr_t vaddr, uintptr_t& paddr) const;
    uint8_t* frameByte(uintptr_t paddr);
    void clearFrames(uintptr_t start, uint64_t bytes);

    KernelError fail(char const* op, KernelError err) const;

    std::vector<Object> objects;
    std::vector<CapEntry> caps;
    std::map<uintptr_t, std::vector<uint8_t>> frames;
    std::vector<ObjId> asidPools;
    ObjId rootCNode;
    uint64_t nextCapId;
    size_t counters[NUM_OPS];
    BootInfo bootinfo;
  };

} // namespace host
} // namespace typecap
