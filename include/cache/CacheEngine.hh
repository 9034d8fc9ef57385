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
 * @file CacheEngine.hh
 * @brief Set-associative tag/timing cache model with LRU/FIFO replacement
 *
 * The engine tracks tags, recency and dirtiness only; the bytes themselves always live in DRAM.
 * Each call to access() classifies one address as a hit or a miss and updates the counters:
 *
 * ```
 * access(addr, isWrite)
 *   ├─ reads/writes++
 *   ├─ hit  : hits++, lastUsed = stamp
 *   │         write: WriteBack -> dirty, WriteThrough -> backingStoreWrites++
 *   └─ miss : misses++, fill first invalid line or evict victim
 *             (LRU: min lastUsed, FIFO: min insertOrder, ties -> lowest way)
 *             dirty victim under WriteBack -> backingStoreWrites++, BackingStore::writebackBlock()
 * ```
 *
 * One engine-wide mutex guards lines and counters. The backing store is called while that mutex
 * is held, so the lock order is always CacheEngine -> BackingStore.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "cache/CacheTypes.hh"
#include "mem/AddressCodec.hh"
#include "mem/BackingStore.hh"
#include "observer/MemoryObserver.hh"
#include "utils/HashableType.hh"
#include "utils/TypeDef.hh"

namespace hiersim {

class CacheEngine : virtual public HashableType {
	struct CacheLine {
		bool     valid       = false;
		uint64_t tag         = 0;
		bool     dirty       = false;
		uint64_t lastUsed    = 0;
		uint64_t insertOrder = 0;
	};

public:
	/// @throws InvalidConfiguration when @p _params does not describe a valid cache.
	explicit CacheEngine(const CacheParams& _params);

	~CacheEngine() override = default;

	CacheEngine(const CacheEngine&)            = delete;
	CacheEngine& operator=(const CacheEngine&) = delete;

	/// @brief Classifies one access. Never fails.
	void access(Addr _addr, bool _isWrite);

	/// @brief Target of dirty-victim flushes. Must outlive the engine.
	void attachBackingStore(BackingStore& _store);

	CacheCounters getCounters() const;

	double getHitRate() const { return this->getCounters().getHitRate(); }

	double getMissRate() const { return this->getCounters().getMissRate(); }

	uint64_t getNumSets() const { return this->geometry.numSets; }

	const CacheParams& getParams() const { return this->params; }

	/// @brief Copy of every set, way by way.
	std::vector<std::vector<CacheLineSnapshot>> getSetsSnapshot() const;

	std::string getTopologyInfo() const;

	/// @brief Invalidates every line without writing anything back. Counters are preserved.
	void reset();

	ObserverList& getObservers() { return this->observers; }

private:
	size_t selectVictim(const std::vector<CacheLine>& _set) const;

	const CacheParams   params;
	const CacheGeometry geometry;

	std::vector<std::vector<CacheLine>> sets;

	CacheCounters counters;

	/// @brief Source of lastUsed/insertOrder stamps.
	uint64_t stampCounter = 1;

	BackingStore* backingStore = nullptr;

	mutable std::mutex mu;

	ObserverList observers;
};

}  // namespace hiersim
