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

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "observer/MemoryObserver.hh"
#include "profiling/Statistics.hh"
#include "utils/HashableType.hh"

namespace hiersim {

/**
 * @class StatisticsObserver
 * @brief Aggregates every notification into lock-free counters.
 *
 * Row-buffer hits are categorized by bank (`ch<c>.rk<r>.bk<b>`) so the hit distribution across
 * banks can be reported at the end of a run.
 */
class StatisticsObserver : public MemoryObserver, virtual public HashableType {
public:
	void onRead(Addr _addr, uint64_t _len) override { this->readBytes.push(_len); }

	void onWrite(Addr _addr, uint64_t _len) override { this->writeBytes.push(_len); }

	void onRowBufferHit(uint32_t _channel, uint32_t _rank, uint32_t _bank, uint32_t _row) override;

	void onRefreshStarted() override { this->refreshes.push(1); }

	void onCacheCounters(const CacheCounters& _counters) override;

	uint64_t getNumReads() const { return this->readBytes.size(); }

	uint64_t getNumWrites() const { return this->writeBytes.size(); }

	uint64_t getBytesRead() const { return this->readBytes.sum(); }

	uint64_t getBytesWritten() const { return this->writeBytes.sum(); }

	uint64_t getNumRefreshes() const { return this->refreshes.sum(); }

	uint64_t getNumRowBufferHits() const { return this->rowBufferHits.sum(); }

	/// @brief Fraction of all row-buffer hits per bank label.
	std::map<std::string, double> getRowBufferHitDistribution() const {
		return this->rowBufferHits.sumDistribution();
	}

	CacheCounters getLastCacheCounters() const;

	/// @brief Writes every counter through the statistics log channel.
	void report() const;

private:
	Statistics<uint64_t, StatisticsMode::AccumulatorWithSize> readBytes;
	Statistics<uint64_t, StatisticsMode::AccumulatorWithSize> writeBytes;
	Statistics<uint64_t, StatisticsMode::Accumulator>         refreshes;

	CategorizedStatistics<std::string, uint64_t, StatisticsMode::Accumulator, /* Sorted */ true,
	                      /* ThreadSafeMap */ true>
	    rowBufferHits;

	mutable std::mutex cacheCountersMu;
	CacheCounters      lastCacheCounters;
};

}  // namespace hiersim
