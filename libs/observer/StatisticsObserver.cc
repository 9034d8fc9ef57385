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

#include "observer/StatisticsObserver.hh"

#include <iomanip>

#include "utils/Logging.hh"

namespace hiersim {

void StatisticsObserver::onRowBufferHit(uint32_t _channel, uint32_t _rank, uint32_t _bank, uint32_t _row) {
	const std::string label =
	    "ch" + std::to_string(_channel) + ".rk" + std::to_string(_rank) + ".bk" + std::to_string(_bank);
	this->rowBufferHits.getEntry(label)->push(1);
}

void StatisticsObserver::onCacheCounters(const CacheCounters& _counters) {
	std::lock_guard<std::mutex> lock(this->cacheCountersMu);
	this->lastCacheCounters = _counters;
}

CacheCounters StatisticsObserver::getLastCacheCounters() const {
	std::lock_guard<std::mutex> lock(this->cacheCountersMu);
	return this->lastCacheCounters;
}

void StatisticsObserver::report() const {
	CLASS_STATISTICS << "DRAM reads  : " << this->getNumReads() << " (" << this->getBytesRead() << " bytes)";
	CLASS_STATISTICS << "DRAM writes : " << this->getNumWrites() << " (" << this->getBytesWritten() << " bytes)";
	CLASS_STATISTICS << "Refreshes   : " << this->getNumRefreshes();
	CLASS_STATISTICS << "Row hits    : " << this->getNumRowBufferHits();

	for (const auto& [bank, share] : this->getRowBufferHitDistribution()) {
		CLASS_STATISTICS << "  " << bank << " : " << std::fixed << std::setprecision(2) << share * 100 << "%";
	}

	const auto counters = this->getLastCacheCounters();
	if (counters.getAccesses() > 0) {
		CLASS_STATISTICS << "Cache       : reads=" << counters.reads << " writes=" << counters.writes
		                 << " hits=" << counters.hits << " misses=" << counters.misses
		                 << " backingStoreWrites=" << counters.backingStoreWrites << " hitRate=" << std::fixed
		                 << std::setprecision(4) << counters.getHitRate();
	}
}

}  // namespace hiersim
