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

#include "cache/CacheEngine.hh"

#include <sstream>
#include <string>

#include "mem/MemoryError.hh"

namespace hiersim {

void CacheParams::validate() const {
	if (cacheSizeBytes == 0 || blockSizeBytes == 0 || associativity == 0) {
		throw InvalidConfiguration("cache size, block size and associativity must be positive");
	}
	if (cacheSizeBytes % blockSizeBytes != 0) {
		throw InvalidConfiguration("cache size " + std::to_string(cacheSizeBytes) + " is not a multiple of block size " +
		                           std::to_string(blockSizeBytes));
	}
	if (associativity > this->getNumLines()) {
		throw InvalidConfiguration("associativity " + std::to_string(associativity) + " exceeds the " +
		                           std::to_string(this->getNumLines()) + " available lines");
	}
}

namespace {

// Validates before any member is built from the parameters.
const CacheParams& validated(const CacheParams& _params) {
	_params.validate();
	return _params;
}

}  // namespace

CacheEngine::CacheEngine(const CacheParams& _params)
    : params(validated(_params)), geometry{_params.blockSizeBytes, _params.getNumSets()} {
	this->sets.assign(this->geometry.numSets, std::vector<CacheLine>(this->params.associativity));
}

void CacheEngine::access(Addr _addr, bool _isWrite) {
	std::lock_guard<std::mutex> lock(this->mu);

	if (_isWrite) {
		this->counters.writes++;
	} else {
		this->counters.reads++;
	}

	const auto coord = AddressCodec::decodeCache(this->geometry, _addr);
	auto&      set   = this->sets[coord.setIndex];

	bool hit = false;
	for (auto& line : set) {
		if (line.valid && line.tag == coord.tag) {
			hit = true;
			this->counters.hits++;
			line.lastUsed = this->stampCounter++;

			if (_isWrite) {
				if (this->params.writePolicy == WritePolicy::WriteThrough) {
					this->counters.backingStoreWrites++;
				} else {
					line.dirty = true;
				}
			}
			break;
		}
	}

	if (!hit) {
		this->counters.misses++;

		size_t way    = this->selectVictim(set);
		auto&  victim = set[way];

		if (victim.valid && victim.dirty && this->params.writePolicy == WritePolicy::WriteBack) {
			this->counters.backingStoreWrites++;
			if (this->backingStore) {
				Addr victim_addr = AddressCodec::encodeCache(this->geometry, CacheCoord{victim.tag, coord.setIndex, 0});
				this->backingStore->writebackBlock(victim_addr, this->params.blockSizeBytes);
			}
		}

		const uint64_t stamp = this->stampCounter++;
		victim.valid         = true;
		victim.tag           = coord.tag;
		victim.lastUsed      = stamp;
		victim.insertOrder   = stamp;
		victim.dirty         = _isWrite && this->params.writePolicy == WritePolicy::WriteBack;

		if (_isWrite && this->params.writePolicy == WritePolicy::WriteThrough) { this->counters.backingStoreWrites++; }
	}

	this->observers.notify([this](MemoryObserver& o) { o.onCacheCounters(this->counters); });
}

void CacheEngine::attachBackingStore(BackingStore& _store) {
	std::lock_guard<std::mutex> lock(this->mu);
	this->backingStore = &_store;
}

CacheCounters CacheEngine::getCounters() const {
	std::lock_guard<std::mutex> lock(this->mu);
	return this->counters;
}

std::vector<std::vector<CacheLineSnapshot>> CacheEngine::getSetsSnapshot() const {
	std::lock_guard<std::mutex> lock(this->mu);

	std::vector<std::vector<CacheLineSnapshot>> snapshot;
	snapshot.reserve(this->sets.size());
	for (const auto& set : this->sets) {
		auto& ways = snapshot.emplace_back();
		ways.reserve(set.size());
		for (const auto& line : set) { ways.push_back(CacheLineSnapshot{line.valid, line.tag, line.dirty}); }
	}
	return snapshot;
}

std::string CacheEngine::getTopologyInfo() const {
	std::stringstream ss;
	ss << "CacheSize=" << this->params.cacheSizeBytes << ", BlockSize=" << this->params.blockSizeBytes
	   << ", Associativity=" << this->params.associativity << ", Sets=" << this->geometry.numSets
	   << ", Replacement=" << (this->params.replacementPolicy == ReplacementPolicy::LRU ? "LRU" : "FIFO")
	   << ", WritePolicy=" << (this->params.writePolicy == WritePolicy::WriteBack ? "WriteBack" : "WriteThrough");
	return ss.str();
}

void CacheEngine::reset() {
	std::lock_guard<std::mutex> lock(this->mu);
	for (auto& set : this->sets) {
		for (auto& line : set) { line = CacheLine{}; }
	}
}

size_t CacheEngine::selectVictim(const std::vector<CacheLine>& _set) const {
	for (size_t i = 0; i < _set.size(); ++i) {
		if (!_set[i].valid) { return i; }
	}

	size_t victim = 0;
	for (size_t i = 1; i < _set.size(); ++i) {
		const uint64_t candidate = (this->params.replacementPolicy == ReplacementPolicy::LRU) ? _set[i].lastUsed
		                                                                                       : _set[i].insertOrder;
		const uint64_t current   = (this->params.replacementPolicy == ReplacementPolicy::LRU) ? _set[victim].lastUsed
		                                                                                       : _set[victim].insertOrder;
		if (candidate < current) { victim = i; }
	}
	return victim;
}

}  // namespace hiersim
