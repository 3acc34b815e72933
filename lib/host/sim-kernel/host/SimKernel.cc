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

#include "host/SimKernel.hh"
#include "typecap/mlog.hh"
#include "util/align.hh"

namespace typecap {
namespace host {

  namespace {
    constexpr uintptr_t BOOT_OBJECTS_BASE = 0x01000000;
    constexpr uintptr_t IMAGE_FRAMES_BASE = 0x02000000;
    constexpr uintptr_t GENERAL_UNTYPED_BASE = 0x40000000;
    constexpr size_t TABLE_ENTRIES_MASK = (size_t(1) << arch::INDEX_BITS) - 1;

    size_t tableIndex(uintptr_t vaddr, size_t shift) { return (vaddr >> shift) & TABLE_ENTRIES_MASK; }

    bool isFrameType(ObjectType type)
    {
      return type == ObjectType::SMALL_PAGE || type == ObjectType::LARGE_PAGE
        || type == ObjectType::HUGE_PAGE;
    }
  } // namespace

  SimKernel::Config::Config()
    : cnodeRadix(14)
    , imagePages(4)
  {
    untyped.push_back(UntypedConfig{20, false, 0});
    untyped.push_back(UntypedConfig{20, false, 0});
    untyped.push_back(UntypedConfig{18, false, 0});
    untyped.push_back(UntypedConfig{16, false, 0});
    untyped.push_back(UntypedConfig{16, false, 0});
    untyped.push_back(UntypedConfig{12, false, 0});
    untyped.push_back(UntypedConfig{12, false, 0});
    untyped.push_back(UntypedConfig{16, true, 0x30000000});
    untyped.push_back(UntypedConfig{12, true, 0x30100000});
  }

  SimKernel::SimKernel() { boot(Config()); }

  SimKernel::SimKernel(Config const& config) { boot(config); }

  SimKernel::ObjId SimKernel::newObject(Kind kind, size_t sizeBits, uintptr_t paddr, bool device)
  {
    Object o;
    o.kind = kind;
    o.sizeBits = sizeBits;
    o.paddr = paddr;
    o.device = device;
    o.watermark = 0;
    o.asid = 0;
    o.mapped = false;
    o.mappedIn = NO_OBJECT;
    o.mappedIndex = 0;
    if (kind == K_CNODE) {
      size_t slots = size_t(1) << (sizeBits - arch::CNODE_SLOT_BITS);
      o.slotsOf.reserve(slots);
      for (size_t i = 0; i < slots; i++) {
        o.slotsOf.push_back(caps.size());
        caps.push_back(CapEntry());
      }
    }
    objects.push_back(std::move(o));
    return objects.size() - 1;
  }

  void SimKernel::install(SlotRef slot, ObjId obj, CapRights rights, uint64_t parent)
  {
    CapEntry& c = entry(slot);
    c = CapEntry();
    c.valid = true;
    c.obj = obj;
    c.rights = rights;
    c.id = nextCapId++;
    c.parent = parent;
  }

  SimKernel::ObjId SimKernel::ensureTable(ObjId parent, size_t index, Kind kind,
                                          uintptr_t& paddr, std::vector<ObjId>& made)
  {
    auto it = objects[parent].entries.find(index);
    if (it != objects[parent].entries.end()) return it->second;
    ObjId table = newObject(kind, arch::PAGE_TABLE_BITS, paddr, false);
    paddr += arch::PAGE_SIZE;
    objects[parent].entries[index] = table;
    objects[table].mapped = true;
    objects[table].mappedIn = parent;
    objects[table].mappedIndex = index;
    made.push_back(table);
    return table;
  }

  void SimKernel::boot(Config const& config)
  {
    for (auto& c : counters) c = 0;
    nextCapId = 1;
    size_t radix = config.cnodeRadix;
    uintptr_t bootPaddr = BOOT_OBJECTS_BASE;
    auto alloc = [&bootPaddr](size_t bits) {
      uintptr_t res = bootPaddr;
      bootPaddr += uintptr_t(1) << bits;
      return res;
    };
    auto slot = [this](CPtr index) { return SlotRef{rootCNode, index}; };

    rootCNode = newObject(K_CNODE, radix + arch::CNODE_SLOT_BITS,
                          alloc(radix + arch::CNODE_SLOT_BITS), false);
    install(slot(INIT_THREAD_CNODE), rootCNode, CapRights::RWG(), 0);
    entry(slot(INIT_THREAD_CNODE)).guard = CNodeCapData(0, arch::WORD_BITS - radix);
    install(slot(INIT_THREAD_TCB), newObject(K_TCB, arch::TCB_BITS, alloc(arch::TCB_BITS), false),
            CapRights::RWG(), 0);
    ObjId pgd = newObject(K_PGD, arch::PAGE_GLOBAL_DIRECTORY_BITS,
                          alloc(arch::PAGE_GLOBAL_DIRECTORY_BITS), false);
    install(slot(INIT_THREAD_VSPACE), pgd, CapRights::RWG(), 0);
    install(slot(IRQ_CONTROL), newObject(K_IRQ_CONTROL, 0, 0, false), CapRights::RWG(), 0);
    install(slot(ASID_CONTROL), newObject(K_ASID_CONTROL, 0, 0, false), CapRights::RWG(), 0);
    ObjId pool = newObject(K_ASID_POOL, arch::ASID_POOL_BITS, alloc(arch::ASID_POOL_BITS), false);
    objects[pool].asid = 0;
    objects[pool].entries[1] = pgd;
    objects[pgd].asid = 1;
    asidPools.push_back(pool);
    install(slot(INIT_THREAD_ASID_POOL), pool, CapRights::RWG(), 0);

    CPtr next = NUM_INIT_CAPS;
    bootinfo.rootCNodeRadix = radix;
    bootinfo.userImageVaddr = ProgramStart;

    // the image is mapped before the root task runs
    std::vector<ObjId> tables;
    bootinfo.userImageFrames.start = next;
    for (size_t i = 0; i < config.imagePages; i++) {
      uintptr_t vaddr = ProgramStart + i * arch::PAGE_SIZE;
      ObjId frame = newObject(K_PAGE, arch::PAGE_BITS, IMAGE_FRAMES_BASE + i * arch::PAGE_SIZE, false);
      ObjId pud = ensureTable(pgd, tableIndex(vaddr, arch::PGD_INDEX_SHIFT), K_PUD, bootPaddr, tables);
      ObjId pd = ensureTable(pud, tableIndex(vaddr, arch::PUD_INDEX_SHIFT), K_PD, bootPaddr, tables);
      ObjId pt = ensureTable(pd, tableIndex(vaddr, arch::PD_INDEX_SHIFT), K_PT, bootPaddr, tables);
      objects[pt].entries[tableIndex(vaddr, arch::PT_INDEX_SHIFT)] = frame;
      install(slot(next), frame, CapRights::RWG(), 0);
      CapEntry& c = entry(slot(next));
      c.mapped = true;
      c.mapRoot = pgd;
      c.mapVaddr = vaddr;
      next++;
    }
    bootinfo.userImageFrames.end = next;

    bootinfo.userImagePaging.start = next;
    for (auto table : tables) install(slot(next++), table, CapRights::RWG(), 0);
    bootinfo.userImagePaging.end = next;

    bootinfo.untyped.start = next;
    uintptr_t generalPaddr = GENERAL_UNTYPED_BASE;
    size_t n = 0;
    for (auto const& ut : config.untyped) {
      if (n == BootInfo::MAX_UNTYPED) break;
      uintptr_t paddr = ut.paddr;
      if (!ut.isDevice) {
        paddr = round_up(generalPaddr, uintptr_t(1) << ut.sizeBits);
        generalPaddr = paddr + (uintptr_t(1) << ut.sizeBits);
      }
      install(slot(next++), newObject(K_UNTYPED, ut.sizeBits, paddr, ut.isDevice),
              CapRights::RWG(), 0);
      bootinfo.untypedList[n++] = UntypedDesc{paddr, ut.sizeBits, ut.isDevice};
    }
    bootinfo.untyped.end = next;

    bootinfo.empty.start = next;
    bootinfo.empty.end = CPtr(1) << radix;
    MLOG_INFO(mlog::sim, "booted", DVAR(radix), DVAR(bootinfo.empty.start), DVAR(n));
  }

  KernelError SimKernel::fail(char const* op, KernelError err) const
  {
    MLOG_INFO(mlog::sim, op, "refused", DVAR(err));
    return err;
  }

  KernelError SimKernel::resolveIn(CapEntry const& cnode, CPtr cptr, size_t depth, SlotRef& res) const
  {
    if (!cnode.valid || objects[cnode.obj].kind != K_CNODE) return KernelError::FAILED_LOOKUP;
    size_t radix = objects[cnode.obj].sizeBits - arch::CNODE_SLOT_BITS;
    size_t guardSize = cnode.guard.guardSize();
    if (depth != guardSize + radix) return KernelError::FAILED_LOOKUP;
    if (guardSize > 0) {
      uint64_t guardMask = guardSize >= 64 ? ~uint64_t(0) : (uint64_t(1) << guardSize) - 1;
      if (((cptr >> radix) & guardMask) != (cnode.guard.guard() & guardMask)) {
        return KernelError::FAILED_LOOKUP;
      }
    } else if (radix < arch::WORD_BITS && (cptr >> radix) != 0) {
      return KernelError::FAILED_LOOKUP;
    }
    res.cnode = cnode.obj;
    res.index = cptr & ((CPtr(1) << radix) - 1);
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::resolve(CPtr cptr, SlotRef& res) const
  {
    return resolveIn(entry(SlotRef{rootCNode, INIT_THREAD_CNODE}), cptr, arch::WORD_BITS, res);
  }

  KernelError SimKernel::lookup(CPtr cptr, Kind kind, SlotRef& res) const
  {
    auto err = resolve(cptr, res);
    if (err != KernelError::NO_ERROR) return err;
    CapEntry const& c = entry(res);
    if (!c.valid) return KernelError::FAILED_LOOKUP;
    if (objects[c.obj].kind != kind) return KernelError::INVALID_CAPABILITY;
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::resolveNode(CPtr root, CPtr index, size_t depth, ObjId& res) const
  {
    SlotRef rs;
    auto err = lookup(root, K_CNODE, rs);
    if (err != KernelError::NO_ERROR) return err;
    if (depth == 0) {
      res = entry(rs).obj;
      return KernelError::NO_ERROR;
    }
    SlotRef ns;
    err = resolveIn(entry(rs), index, depth, ns);
    if (err != KernelError::NO_ERROR) return err;
    CapEntry const& c = entry(ns);
    if (!c.valid || objects[c.obj].kind != K_CNODE) return KernelError::FAILED_LOOKUP;
    res = c.obj;
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::resolveDest(CPtr root, CPtr index, size_t depth, SlotRef& res) const
  {
    SlotRef rs;
    auto err = lookup(root, K_CNODE, rs);
    if (err != KernelError::NO_ERROR) return err;
    return resolveIn(entry(rs), index, depth, res);
  }

  size_t SimKernel::objectBits(ObjectType type, size_t sizeBits) const
  {
    switch (type) {
    case ObjectType::UNTYPED:
      if (sizeBits < arch::MIN_UNTYPED_BITS || sizeBits > arch::MAX_UNTYPED_BITS) return 0;
      return sizeBits;
    case ObjectType::TCB: return arch::TCB_BITS;
    case ObjectType::ENDPOINT: return arch::ENDPOINT_BITS;
    case ObjectType::NOTIFICATION: return arch::NOTIFICATION_BITS;
    case ObjectType::CAP_TABLE:
      if (sizeBits < 1 || sizeBits + arch::CNODE_SLOT_BITS > arch::MAX_UNTYPED_BITS) return 0;
      return sizeBits + arch::CNODE_SLOT_BITS;
    case ObjectType::HUGE_PAGE: return arch::HUGE_PAGE_BITS;
    case ObjectType::LARGE_PAGE: return arch::LARGE_PAGE_BITS;
    case ObjectType::SMALL_PAGE: return arch::PAGE_BITS;
    case ObjectType::PAGE_TABLE: return arch::PAGE_TABLE_BITS;
    case ObjectType::PAGE_DIRECTORY: return arch::PAGE_DIRECTORY_BITS;
    case ObjectType::PAGE_UPPER_DIRECTORY: return arch::PAGE_UPPER_DIRECTORY_BITS;
    case ObjectType::PAGE_GLOBAL_DIRECTORY: return arch::PAGE_GLOBAL_DIRECTORY_BITS;
    }
    return 0;
  }

  void SimKernel::clearFrames(uintptr_t start, uint64_t bytes)
  {
    auto it = frames.lower_bound(start);
    while (it != frames.end() && it->first < start + bytes) it = frames.erase(it);
  }

  KernelError SimKernel::untypedRetype(CPtr untyped, ObjectType type, size_t sizeBits,
                                       CPtr root, CPtr nodeIndex, size_t nodeDepth,
                                       CPtr nodeOffset, size_t numObjects)
  {
    counters[RETYPE]++;
    SlotRef us;
    auto err = lookup(untyped, K_UNTYPED, us);
    if (err != KernelError::NO_ERROR) return fail("retype", err);
    if (static_cast<uint8_t>(type) > static_cast<uint8_t>(ObjectType::PAGE_DIRECTORY)) {
      return fail("retype", KernelError::INVALID_ARGUMENT);
    }
    if (numObjects == 0 || numObjects > KernelRetypeFanOutLimit) {
      return fail("retype", KernelError::RANGE_ERROR);
    }
    size_t objBits = objectBits(type, sizeBits);
    if (objBits == 0) return fail("retype", KernelError::RANGE_ERROR);
    ObjId utObj = entry(us).obj;
    uint64_t utId = entry(us).id;
    bool device = objects[utObj].device;
    if (device && type != ObjectType::UNTYPED && !isFrameType(type)) {
      return fail("retype", KernelError::INVALID_ARGUMENT);
    }

    ObjId node;
    err = resolveNode(root, nodeIndex, nodeDepth, node);
    if (err != KernelError::NO_ERROR) return fail("retype", err);
    size_t slots = objects[node].slotsOf.size();
    if (nodeOffset >= slots || numObjects > slots - nodeOffset) {
      return fail("retype", KernelError::RANGE_ERROR);
    }
    for (size_t i = 0; i < numObjects; i++) {
      if (entry(SlotRef{node, nodeOffset + i}).valid) return fail("retype", KernelError::DELETE_FIRST);
    }

    uint64_t objBytes = uint64_t(1) << objBits;
    uint64_t utBytes = uint64_t(1) << objects[utObj].sizeBits;
    uint64_t start = round_up(objects[utObj].watermark, objBytes);
    if (objBits > objects[utObj].sizeBits || start > utBytes
        || numObjects > (utBytes - start) >> objBits) {
      return fail("retype", KernelError::NOT_ENOUGH_MEMORY);
    }

    uintptr_t base = objects[utObj].paddr + start;
    clearFrames(base, numObjects * objBytes);
    for (size_t i = 0; i < numObjects; i++) {
      ObjId obj = newObject(static_cast<Kind>(type), objBits, base + i * objBytes, device);
      install(SlotRef{node, nodeOffset + i}, obj, CapRights::RWG(), utId);
    }
    objects[utObj].watermark = start + numObjects * objBytes;
    MLOG_DETAIL(mlog::sim, "retype", DVAR(untyped), DVAR(type), DVAR(objBits),
                DVAR(nodeOffset), DVAR(numObjects));
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::cnodeCopy(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                                   CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth,
                                   CapRights rights)
  {
    counters[COPY]++;
    SlotRef ds, ss;
    auto err = resolveDest(destRoot, destIndex, destDepth, ds);
    if (err != KernelError::NO_ERROR) return fail("copy", err);
    err = resolveDest(srcRoot, srcIndex, srcDepth, ss);
    if (err != KernelError::NO_ERROR) return fail("copy", err);
    if (entry(ds).valid) return fail("copy", KernelError::DELETE_FIRST);
    CapEntry const& src = entry(ss);
    if (!src.valid) return fail("copy", KernelError::FAILED_LOOKUP);
    CapEntry c;
    c.valid = true;
    c.obj = src.obj;
    c.rights = src.rights & rights;
    c.badge = src.badge;
    c.guard = src.guard;
    c.id = nextCapId++;
    c.parent = src.id;
    entry(ds) = c;
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::cnodeMint(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                                   CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth,
                                   CapRights rights, Badge badge)
  {
    counters[MINT]++;
    SlotRef ds, ss;
    auto err = resolveDest(destRoot, destIndex, destDepth, ds);
    if (err != KernelError::NO_ERROR) return fail("mint", err);
    err = resolveDest(srcRoot, srcIndex, srcDepth, ss);
    if (err != KernelError::NO_ERROR) return fail("mint", err);
    if (entry(ds).valid) return fail("mint", KernelError::DELETE_FIRST);
    CapEntry const& src = entry(ss);
    if (!src.valid) return fail("mint", KernelError::FAILED_LOOKUP);
    Kind kind = objects[src.obj].kind;
    CapEntry c;
    c.valid = true;
    c.obj = src.obj;
    c.rights = src.rights & rights;
    c.badge = (kind == K_ENDPOINT || kind == K_NOTIFICATION) ? badge : src.badge;
    c.guard = src.guard;
    c.id = nextCapId++;
    c.parent = src.id;
    entry(ds) = c;
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::cnodeMove(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                                   CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth)
  {
    counters[MOVE]++;
    SlotRef ds, ss;
    auto err = resolveDest(destRoot, destIndex, destDepth, ds);
    if (err != KernelError::NO_ERROR) return fail("move", err);
    err = resolveDest(srcRoot, srcIndex, srcDepth, ss);
    if (err != KernelError::NO_ERROR) return fail("move", err);
    if (entry(ds).valid) return fail("move", KernelError::DELETE_FIRST);
    if (!entry(ss).valid) return fail("move", KernelError::FAILED_LOOKUP);
    if (capIndex(ds) == capIndex(ss)) return KernelError::NO_ERROR;
    entry(ds) = entry(ss);
    entry(ss) = CapEntry();
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::cnodeMutate(CPtr destRoot, CPtr destIndex, uint8_t destDepth,
                                     CPtr srcRoot, CPtr srcIndex, uint8_t srcDepth,
                                     CNodeCapData data)
  {
    counters[MUTATE]++;
    SlotRef ds, ss;
    auto err = resolveDest(destRoot, destIndex, destDepth, ds);
    if (err != KernelError::NO_ERROR) return fail("mutate", err);
    err = resolveDest(srcRoot, srcIndex, srcDepth, ss);
    if (err != KernelError::NO_ERROR) return fail("mutate", err);
    if (entry(ds).valid) return fail("mutate", KernelError::DELETE_FIRST);
    CapEntry src = entry(ss);
    if (!src.valid) return fail("mutate", KernelError::FAILED_LOOKUP);
    if (objects[src.obj].kind == K_CNODE) {
      size_t radix = objects[src.obj].sizeBits - arch::CNODE_SLOT_BITS;
      if (data.guardSize() + radix > arch::WORD_BITS) return fail("mutate", KernelError::RANGE_ERROR);
      src.guard = data;
    }
    entry(ss) = CapEntry();
    entry(ds) = src;
    return KernelError::NO_ERROR;
  }

  void SimKernel::unmapFrame(CapEntry& cap)
  {
    if (!cap.mapped) return;
    ObjId pt = walk(cap.mapRoot, cap.mapVaddr, arch::PT_INDEX_SHIFT);
    if (pt != NO_OBJECT) {
      auto& entries = objects[pt].entries;
      auto it = entries.find(tableIndex(cap.mapVaddr, arch::PT_INDEX_SHIFT));
      if (it != entries.end() && it->second == cap.obj) entries.erase(it);
    }
    cap.mapped = false;
    cap.mapRoot = NO_OBJECT;
    cap.mapVaddr = 0;
  }

  void SimKernel::unlinkTable(ObjId obj)
  {
    Object& o = objects[obj];
    if (!o.mapped) return;
    for (auto const& c : caps) {
      if (c.valid && c.obj == obj) return;
    }
    objects[o.mappedIn].entries.erase(o.mappedIndex);
    o.mapped = false;
    o.mappedIn = NO_OBJECT;
  }

  void SimKernel::removeCap(size_t index)
  {
    CapEntry& c = caps[index];
    if (!c.valid) return;
    unmapFrame(c);
    uint64_t id = c.id;
    uint64_t parent = c.parent;
    ObjId obj = c.obj;
    c = CapEntry();
    for (auto& other : caps) {
      if (other.valid && other.parent == id) other.parent = parent;
    }
    Kind kind = objects[obj].kind;
    if (kind == K_PT || kind == K_PD || kind == K_PUD) unlinkTable(obj);
  }

  void SimKernel::revokeBelow(uint64_t id)
  {
    for (size_t i = 0; i < caps.size(); i++) {
      if (caps[i].valid && caps[i].parent == id) {
        revokeBelow(caps[i].id);
        removeCap(i);
      }
    }
  }

  KernelError SimKernel::cnodeDelete(CPtr root, CPtr index, uint8_t depth)
  {
    counters[DELETE]++;
    SlotRef s;
    auto err = resolveDest(root, index, depth, s);
    if (err != KernelError::NO_ERROR) return fail("delete", err);
    removeCap(capIndex(s));
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::cnodeRevoke(CPtr root, CPtr index, uint8_t depth)
  {
    counters[REVOKE]++;
    SlotRef s;
    auto err = resolveDest(root, index, depth, s);
    if (err != KernelError::NO_ERROR) return fail("revoke", err);
    CapEntry const& c = entry(s);
    if (!c.valid) return KernelError::NO_ERROR;
    ObjId obj = c.obj;
    revokeBelow(c.id);
    if (objects[obj].kind == K_UNTYPED) objects[obj].watermark = 0;
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::asidControlMakePool(CPtr control, CPtr untyped,
                                             CPtr root, CPtr index, uint8_t depth)
  {
    counters[MAKE_POOL]++;
    SlotRef cs, us, ds;
    auto err = lookup(control, K_ASID_CONTROL, cs);
    if (err != KernelError::NO_ERROR) return fail("make pool", err);
    err = lookup(untyped, K_UNTYPED, us);
    if (err != KernelError::NO_ERROR) return fail("make pool", err);
    ObjId utObj = entry(us).obj;
    uint64_t utId = entry(us).id;
    if (objects[utObj].sizeBits != arch::ASID_POOL_BITS || objects[utObj].device) {
      return fail("make pool", KernelError::INVALID_ARGUMENT);
    }
    if (objects[utObj].watermark != 0) return fail("make pool", KernelError::REVOKE_FIRST);
    err = resolveDest(root, index, depth, ds);
    if (err != KernelError::NO_ERROR) return fail("make pool", err);
    if (entry(ds).valid) return fail("make pool", KernelError::DELETE_FIRST);
    if (asidPools.size() >= ASIDPoolCount) return fail("make pool", KernelError::DELETE_FIRST);

    ObjId pool = newObject(K_ASID_POOL, arch::ASID_POOL_BITS, objects[utObj].paddr, false);
    objects[pool].asid = asid_t(asidPools.size() * ASIDPoolSize);
    asidPools.push_back(pool);
    install(ds, pool, CapRights::RWG(), utId);
    objects[utObj].watermark = uint64_t(1) << arch::ASID_POOL_BITS;
    MLOG_DETAIL(mlog::sim, "made asid pool", DVAR(objects[pool].asid));
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::asidPoolAssign(CPtr pool, CPtr vspace)
  {
    counters[ASSIGN]++;
    SlotRef ps, vs;
    auto err = lookup(pool, K_ASID_POOL, ps);
    if (err != KernelError::NO_ERROR) return fail("assign", err);
    err = lookup(vspace, K_PGD, vs);
    if (err != KernelError::NO_ERROR) return fail("assign", err);
    ObjId poolObj = entry(ps).obj;
    ObjId root = entry(vs).obj;
    if (objects[root].asid != 0) return fail("assign", KernelError::INVALID_CAPABILITY);
    asid_t base = objects[poolObj].asid;
    for (size_t i = 0; i < ASIDPoolSize; i++) {
      if (base + i == 0) continue;
      if (objects[poolObj].entries.count(i)) continue;
      objects[poolObj].entries[i] = root;
      objects[root].asid = asid_t(base + i);
      return KernelError::NO_ERROR;
    }
    return fail("assign", KernelError::DELETE_FIRST);
  }

  SimKernel::ObjId SimKernel::walk(ObjId root, uintptr_t vaddr, size_t shift) const
  {
    static const size_t levels[] = {
      arch::PGD_INDEX_SHIFT, arch::PUD_INDEX_SHIFT, arch::PD_INDEX_SHIFT
    };
    ObjId cur = root;
    for (auto level : levels) {
      if (level <= shift) break;
      auto const& entries = objects[cur].entries;
      auto it = entries.find(tableIndex(vaddr, level));
      if (it == entries.end()) return NO_OBJECT;
      cur = it->second;
    }
    return cur;
  }

  KernelError SimKernel::pageMap(CPtr page, CPtr vspace, uintptr_t vaddr,
                                 CapRights rights, VMAttributes)
  {
    counters[PAGE_MAP]++;
    SlotRef ps, vs;
    auto err = lookup(page, K_PAGE, ps);
    if (err != KernelError::NO_ERROR) return fail("page map", err);
    err = lookup(vspace, K_PGD, vs);
    if (err != KernelError::NO_ERROR) return fail("page map", err);
    ObjId root = entry(vs).obj;
    if (objects[root].asid == 0) return fail("page map", KernelError::INVALID_CAPABILITY);
    if (!is_aligned(vaddr, arch::PAGE_SIZE)) return fail("page map", KernelError::ALIGNMENT_ERROR);
    if (vaddr >= arch::USER_TOP) return fail("page map", KernelError::INVALID_ARGUMENT);
    CapEntry& c = entry(ps);
    if (c.mapped) {
      if (c.mapRoot == root && c.mapVaddr == vaddr) {
        c.rights = c.rights & rights;
        return KernelError::NO_ERROR;
      }
      return fail("page map", KernelError::INVALID_ARGUMENT);
    }
    ObjId pt = walk(root, vaddr, arch::PT_INDEX_SHIFT);
    if (pt == NO_OBJECT) return fail("page map", KernelError::FAILED_LOOKUP);
    size_t idx = tableIndex(vaddr, arch::PT_INDEX_SHIFT);
    if (objects[pt].entries.count(idx)) return fail("page map", KernelError::DELETE_FIRST);
    objects[pt].entries[idx] = c.obj;
    c.mapped = true;
    c.mapRoot = root;
    c.mapVaddr = vaddr;
    MLOG_DETAIL(mlog::sim, "page map", DVAR(page), DVARhex(vaddr), DVAR(rights));
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::pageUnmap(CPtr page)
  {
    counters[PAGE_UNMAP]++;
    SlotRef ps;
    auto err = lookup(page, K_PAGE, ps);
    if (err != KernelError::NO_ERROR) return fail("page unmap", err);
    unmapFrame(entry(ps));
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::pageGetAddress(CPtr page, uintptr_t& paddr)
  {
    counters[GET_ADDRESS]++;
    SlotRef ps;
    auto err = lookup(page, K_PAGE, ps);
    if (err != KernelError::NO_ERROR) return fail("get address", err);
    paddr = objects[entry(ps).obj].paddr;
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::mapTable(Op op, Kind kind, CPtr table, CPtr vspace, uintptr_t vaddr, size_t shift)
  {
    counters[op]++;
    SlotRef ts, vs;
    auto err = lookup(table, kind, ts);
    if (err != KernelError::NO_ERROR) return fail("table map", err);
    err = lookup(vspace, K_PGD, vs);
    if (err != KernelError::NO_ERROR) return fail("table map", err);
    ObjId root = entry(vs).obj;
    ObjId obj = entry(ts).obj;
    if (objects[root].asid == 0) return fail("table map", KernelError::INVALID_CAPABILITY);
    if (objects[obj].mapped) return fail("table map", KernelError::INVALID_CAPABILITY);
    if (vaddr >= arch::USER_TOP) return fail("table map", KernelError::INVALID_ARGUMENT);
    ObjId parent = walk(root, vaddr, shift);
    if (parent == NO_OBJECT) return fail("table map", KernelError::FAILED_LOOKUP);
    size_t idx = tableIndex(vaddr, shift);
    if (objects[parent].entries.count(idx)) return fail("table map", KernelError::DELETE_FIRST);
    objects[parent].entries[idx] = obj;
    objects[obj].mapped = true;
    objects[obj].mappedIn = parent;
    objects[obj].mappedIndex = idx;
    MLOG_DETAIL(mlog::sim, "table map", DVAR(table), DVARhex(vaddr), DVAR(shift));
    return KernelError::NO_ERROR;
  }

  KernelError SimKernel::pageTableMap(CPtr table, CPtr vspace, uintptr_t vaddr, VMAttributes)
  {
    return mapTable(TABLE_MAP, K_PT, table, vspace, vaddr, arch::PD_INDEX_SHIFT);
  }

  KernelError SimKernel::pageDirectoryMap(CPtr dir, CPtr vspace, uintptr_t vaddr, VMAttributes)
  {
    return mapTable(DIRECTORY_MAP, K_PD, dir, vspace, vaddr, arch::PUD_INDEX_SHIFT);
  }

  KernelError SimKernel::pageUpperDirectoryMap(CPtr dir, CPtr vspace, uintptr_t vaddr, VMAttributes)
  {
    return mapTable(UPPER_DIRECTORY_MAP, K_PUD, dir, vspace, vaddr, arch::PGD_INDEX_SHIFT);
  }

  bool SimKernel::isEmpty(CPtr slot) const
  {
    SlotRef s;
    if (resolve(slot, s) != KernelError::NO_ERROR) return true;
    return !entry(s).valid;
  }

  ObjectType SimKernel::typeOf(CPtr slot) const
  {
    SlotRef s;
    if (resolve(slot, s) != KernelError::NO_ERROR || !entry(s).valid) return ObjectType::UNTYPED;
    Kind kind = objects[entry(s).obj].kind;
    if (kind > K_PD) return ObjectType::UNTYPED;
    return static_cast<ObjectType>(kind);
  }

  CapRights SimKernel::rightsOf(CPtr slot) const
  {
    SlotRef s;
    if (resolve(slot, s) != KernelError::NO_ERROR) return CapRights();
    return entry(s).rights;
  }

  Badge SimKernel::badgeOf(CPtr slot) const
  {
    SlotRef s;
    if (resolve(slot, s) != KernelError::NO_ERROR) return 0;
    return entry(s).badge;
  }

  size_t SimKernel::radixOf(CPtr slot) const
  {
    SlotRef s;
    if (lookup(slot, K_CNODE, s) != KernelError::NO_ERROR) return 0;
    return objects[entry(s).obj].sizeBits - arch::CNODE_SLOT_BITS;
  }

  size_t SimKernel::guardSizeOf(CPtr slot) const
  {
    SlotRef s;
    if (lookup(slot, K_CNODE, s) != KernelError::NO_ERROR) return 0;
    return entry(s).guard.guardSize();
  }

  bool SimKernel::isEmptyIn(CPtr cnode, CPtr slot) const
  {
    SlotRef s;
    if (lookup(cnode, K_CNODE, s) != KernelError::NO_ERROR) return true;
    Object const& node = objects[entry(s).obj];
    if (slot >= node.slotsOf.size()) return true;
    return !caps[node.slotsOf[slot]].valid;
  }

  size_t SimKernel::untypedBits(CPtr slot) const
  {
    SlotRef s;
    if (lookup(slot, K_UNTYPED, s) != KernelError::NO_ERROR) return 0;
    return objects[entry(s).obj].sizeBits;
  }

  uint64_t SimKernel::untypedUsed(CPtr slot) const
  {
    SlotRef s;
    if (lookup(slot, K_UNTYPED, s) != KernelError::NO_ERROR) return 0;
    return objects[entry(s).obj].watermark;
  }

  asid_t SimKernel::asidOf(CPtr root) const
  {
    SlotRef s;
    if (lookup(root, K_PGD, s) != KernelError::NO_ERROR) return 0;
    return objects[entry(s).obj].asid;
  }

  bool SimKernel::isMapped(CPtr page) const
  {
    SlotRef s;
    if (lookup(page, K_PAGE, s) != KernelError::NO_ERROR) return false;
    return entry(s).mapped;
  }

  uintptr_t SimKernel::mappedVaddr(CPtr page) const
  {
    SlotRef s;
    if (lookup(page, K_PAGE, s) != KernelError::NO_ERROR) return 0;
    return entry(s).mapVaddr;
  }

  size_t SimKernel::mappedPageCount(CPtr root) const
  {
    SlotRef s;
    if (lookup(root, K_PGD, s) != KernelError::NO_ERROR) return 0;
    ObjId obj = entry(s).obj;
    size_t count = 0;
    for (auto const& c : caps) {
      if (c.valid && c.mapped && c.mapRoot == obj) count++;
    }
    return count;
  }

  bool SimKernel::hasPageTable(CPtr root, uintptr_t vaddr) const
  {
    SlotRef s;
    if (lookup(root, K_PGD, s) != KernelError::NO_ERROR) return false;
    return walk(entry(s).obj, vaddr, arch::PT_INDEX_SHIFT) != NO_OBJECT;
  }

  bool SimKernel::translate(CPtr root, uintptr_t vaddr, uintptr_t& paddr) const
  {
    SlotRef s;
    if (lookup(root, K_PGD, s) != KernelError::NO_ERROR) return false;
    ObjId pt = walk(entry(s).obj, vaddr, arch::PT_INDEX_SHIFT);
    if (pt == NO_OBJECT) return false;
    auto const& entries = objects[pt].entries;
    auto it = entries.find(tableIndex(vaddr, arch::PT_INDEX_SHIFT));
    if (it == entries.end()) return false;
    paddr = objects[it->second].paddr + (vaddr & (arch::PAGE_SIZE - 1));
    return true;
  }

  uint8_t* SimKernel::frameByte(uintptr_t paddr)
  {
    auto& frame = frames[round_down(paddr, arch::PAGE_SIZE)];
    if (frame.empty()) frame.resize(arch::PAGE_SIZE, 0);
    return &frame[paddr & (arch::PAGE_SIZE - 1)];
  }

  bool SimKernel::write8(CPtr root, uintptr_t vaddr, uint8_t value)
  {
    uintptr_t paddr;
    if (!translate(root, vaddr, paddr)) return false;
    *frameByte(paddr) = value;
    return true;
  }

  bool SimKernel::read8(CPtr root, uintptr_t vaddr, uint8_t& value) const
  {
    uintptr_t paddr;
    if (!translate(root, vaddr, paddr)) return false;
    auto it = frames.find(round_down(paddr, arch::PAGE_SIZE));
    value = it == frames.end() ? 0 : it->second[paddr & (arch::PAGE_SIZE - 1)];
    return true;
  }

  bool SimKernel::copyVirtual(CPtr root, uintptr_t dst, uintptr_t src, size_t len)
  {
    for (size_t i = 0; i < len; i++) {
      uint8_t value;
      if (!read8(root, src + i, value)) return false;
      if (!write8(root, dst + i, value)) return false;
    }
    return true;
  }

} // namespace host
} // namespace typecap
