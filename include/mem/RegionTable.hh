/*
 * Copyright 2023-2026 Playlab/ACAL
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file RegionTable.hh
 * @brief Permission-checked bus façade over a MemoryController
 *
 * The table owns a set of non-overlapping named regions with Read/Write/Exec permissions. Every
 * access is checked byte range by byte range against those regions before anything else
 * happens; on success the attached cache (if any) classifies each byte of the access and the
 * access is then handed to the controller.
 *
 * ```
 * CPU / DMA
 *    │ readBytes / writeBytes / fetchBytes
 *    ▼
 * RegionTable ── checkAccess() ──► RegionViolation / OutOfBounds (nothing touched)
 *    │
 *    ├── CacheEngine::access(addr + i, isWrite)   for every byte outside MMIO regions
 *    ▼
 * MemoryController
 * ```
 *
 * **Address map file** (`registerRegions()`):
 * ```json
 * {
 *   "address_map": [
 *     { "name": "code", "start": "0x0",    "size": "0x4000", "perms": "RX" },
 *     { "name": "heap", "start": "0x4000", "size": "0x8000", "perms": "RW" }
 *   ]
 * }
 * ```
 * `start`/`size` accept hexadecimal strings or plain integers.
 *
 * The region list is guarded by a shared mutex that is released before the cache or the
 * controller is called.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "mem/MemoryController.hh"
#include "utils/HashableType.hh"
#include "utils/TypeDef.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace hiersim {

class CacheEngine;

enum class MemProt : uint32_t { None = 0, Read = 1, Write = 2, Exec = 4 };

inline MemProt operator|(MemProt _lhs, MemProt _rhs) {
	return static_cast<MemProt>(static_cast<uint32_t>(_lhs) | static_cast<uint32_t>(_rhs));
}

inline MemProt operator&(MemProt _lhs, MemProt _rhs) {
	return static_cast<MemProt>(static_cast<uint32_t>(_lhs) & static_cast<uint32_t>(_rhs));
}

/// @brief True when @p _granted contains every permission of @p _needed.
inline bool hasPermission(MemProt _granted, MemProt _needed) { return (_granted & _needed) == _needed; }

/// @brief "RWX" style rendering, '-' for a missing permission.
std::string toString(MemProt _prot);

/// @brief Parses "R", "RW", "rx", ... Throws InvalidConfiguration on any other character.
MemProt parseMemProt(const std::string& _str);

struct MemoryRegion {
	std::string name;
	Addr        start = 0;
	uint64_t    size  = 0;
	MemProt     perms = MemProt::None;
	bool        mmio  = false;

	/// @brief Last byte of the region (inclusive).
	Addr getEnd() const { return start + size - 1; }

	bool contains(Addr _addr) const { return _addr >= start && _addr - start < size; }
};

class RegionTable : virtual public HashableType {
public:
	explicit RegionTable(MemoryController& _controller) : controller(_controller) {}

	~RegionTable() override = default;

	/**
	 * @throws InvalidConfiguration for an empty region, OutOfBounds past the physical space,
	 *         OverlapError when it intersects an existing region.
	 */
	void mapRegion(Addr _start, uint64_t _size, MemProt _perms, const std::string& _name);

	/// @brief Maps every entry of an `address_map` document (see file comment).
	void registerRegions(const nlohmann::json& _addressMap);

	/**
	 * @brief Verifies that every byte of [addr, addr + len) is mapped with @p _needed.
	 * @throws OutOfBounds past the physical space, RegionViolation otherwise.
	 */
	void checkAccess(Addr _addr, uint64_t _len, MemProt _needed) const;

	ReadResult readBytes(Addr _addr, uint64_t _len);

	Tick writeBytes(Addr _addr, const std::vector<uint8_t>& _data);

	/// @brief Instruction fetch, requires Exec.
	ReadResult fetchBytes(Addr _addr, uint64_t _len);

	/// @brief Checks permissions and classifies through the cache before the controller paces the access.
	std::future<ReadResult> readBytesAsync(Addr _addr, uint64_t _len, std::stop_token _token = {});

	std::future<Tick> writeBytesAsync(Addr _addr, const std::vector<uint8_t>& _data, std::stop_token _token = {});

	/**
	 * @brief Attaches MMIO handlers to a previously mapped region with the same start and size.
	 * @throws RegionViolation when no such region exists.
	 */
	void registerMmioHandlers(Addr _start, uint64_t _size, MmioReadHandler _readHandler,
	                          MmioWriteHandler _writeHandler);

	/// @brief Routes every later non-MMIO access through @p _cache. The cache must outlive the table.
	void attachCache(CacheEngine& _cache) { this->cache = &_cache; }

	void detachCache() { this->cache = nullptr; }

	std::vector<MemoryRegion> getRegions() const;

	/// @brief One line per region sorted by start: `name: 0x<start> - 0x<end> (size=0x<size>, prot=RWX)`.
	std::vector<std::string> getRegionsInfo() const;

	uint64_t computePhysicalSize() const { return this->controller.getPhysicalSize(); }

	std::string getTopologyInfo() const { return this->controller.getTopologyInfo(); }

	Tick getCurrentCycle() const { return this->controller.getCurrentCycle(); }

	MemoryController& getController() { return this->controller; }

private:
	/// @brief Checks permissions and returns the sub-ranges that may be cached.
	std::vector<std::pair<Addr, uint64_t>> resolve(Addr _addr, uint64_t _len, MemProt _needed) const;

	/// @brief Region containing @p _addr, nullptr when unmapped. Caller holds the lock.
	const MemoryRegion* findRegion(Addr _addr) const;

	/// @brief Shared front half of every access: permissions, controller bounds, cache accounting.
	void prepareAccess(Addr _addr, uint64_t _len, MemProt _needed, bool _isWrite);

	MemoryController& controller;

	std::atomic<CacheEngine*> cache = nullptr;

	/// @brief Keyed by region start.
	std::map<Addr, MemoryRegion> regions;

	mutable std::shared_mutex mu;
};

}  // namespace hiersim
