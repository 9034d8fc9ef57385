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
 * @file TestMemorySystem.cc
 * @brief Integration tests of RegionTable + CacheEngine + MemoryController
 *
 * ```
 * RegionTable ── CacheEngine (64 B, 16 B blocks, direct-mapped, write-back)
 *      │               │ writebackBlock()
 *      ▼               ▼
 *          MemoryController
 * ```
 */

#include <gtest/gtest.h>

#include <stop_token>
#include <thread>
#include <vector>

#include "cache/CacheEngine.hh"
#include "mem/MemoryController.hh"
#include "mem/MemoryError.hh"
#include "mem/RegionTable.hh"
#include "observer/StatisticsObserver.hh"

using namespace hiersim;

namespace {

CacheParams smallDirectMapped() {
	CacheParams params;
	params.cacheSizeBytes = 64;
	params.blockSizeBytes = 16;
	params.associativity  = 1;
	return params;
}

struct MemorySystem {
	MemorySystem(const CacheParams& _params, uint64_t _pacingNsPerCycle = 0)
	    : controller(DramGeometry{}, DramTiming(), _pacingNsPerCycle), cache(_params), bus(controller) {
		cache.attachBackingStore(controller);
		controller.getObservers().attach(stats);
		cache.getObservers().attach(stats);
		bus.mapRegion(0x0, 0x10000, MemProt::Read | MemProt::Write, "ram");
		bus.mapRegion(0x10000, 0x1000, MemProt::Read, "rom");
		bus.attachCache(cache);
	}

	StatisticsObserver stats;
	MemoryController   controller;
	CacheEngine        cache;
	RegionTable        bus;
};

}  // namespace

TEST(MemorySystemTest, DataAlwaysLivesInDram) {
	MemorySystem sys(smallDirectMapped());

	sys.bus.writeBytes(0x0, {0xAB});
	EXPECT_EQ(sys.controller.peekBytes(0x0, 1), (std::vector<uint8_t>{0xAB})) << "write-back still stores the byte";

	sys.bus.readBytes(0x40, 1);  // same set, evicts the dirty block
	EXPECT_EQ(sys.bus.readBytes(0x0, 1).data, (std::vector<uint8_t>{0xAB}));
}

TEST(MemorySystemTest, DirtyEvictionReachesTheController) {
	MemorySystem sys(smallDirectMapped());

	sys.bus.writeBytes(0x0, {0x11});
	const Tick afterWrite = sys.controller.getCurrentCycle();

	sys.bus.readBytes(0x40, 1);

	EXPECT_EQ(sys.cache.getCounters().backingStoreWrites, 1);
	EXPECT_EQ(sys.stats.getNumWrites(), 2) << "the store itself, then the 16-byte writeback";
	EXPECT_EQ(sys.stats.getBytesWritten(), 1 + 16);
	EXPECT_EQ(sys.stats.getNumReads(), 1);
	EXPECT_EQ(sys.controller.getCurrentCycle(), afterWrite + 16 + 16)
	    << "writeback and read both hit the open row 0";

	const auto last = sys.stats.getLastCacheCounters();
	EXPECT_EQ(last, sys.cache.getCounters()) << "observers see the counters after every access";
}

TEST(MemorySystemTest, RefusedAccessesChangeNothing) {
	MemorySystem sys(smallDirectMapped());

	EXPECT_THROW(sys.bus.writeBytes(0x10000, {1, 2}), RegionViolation);
	EXPECT_THROW(sys.bus.readBytes(0x11000, 1), RegionViolation);
	EXPECT_THROW(sys.bus.writeBytes(0x1FF, {1, 2}), OutOfBounds);

	EXPECT_EQ(sys.controller.peekBytes(0x10000, 2), (std::vector<uint8_t>{0, 0}));
	EXPECT_EQ(sys.controller.getCurrentCycle(), 0);
	EXPECT_EQ(sys.cache.getCounters(), CacheCounters{});
	EXPECT_EQ(sys.stats.getNumWrites(), 0);
}

TEST(MemorySystemTest, CpuAndDmaOnDisjointBytes) {
	CacheParams params;  // 1024 B, 2-way, LRU, write-back
	MemorySystem sys(params);

	constexpr Addr     kCpuBase = 0x0000;
	constexpr Addr     kDmaBase = 0x8000;
	constexpr uint64_t kBytes   = 512;
	constexpr int      kRounds  = 20;

	auto worker = [&sys](Addr _base, uint8_t _salt) {
		for (int round = 0; round < kRounds; ++round) {
			for (uint64_t i = 0; i < kBytes; i += 4) {
				std::vector<uint8_t> data(4);
				for (int b = 0; b < 4; ++b) { data[b] = (uint8_t)((i + b) * 7 + _salt + round); }
				sys.bus.writeBytes(_base + i, data);
				EXPECT_EQ(sys.bus.readBytes(_base + i, 4).data, data);
			}
		}
	};

	std::thread cpu(worker, kCpuBase, (uint8_t)0x10);
	std::thread dma(worker, kDmaBase, (uint8_t)0x80);
	cpu.join();
	dma.join();

	auto cpuBytes = sys.controller.peekBytes(kCpuBase, kBytes);
	auto dmaBytes = sys.controller.peekBytes(kDmaBase, kBytes);
	for (uint64_t i = 0; i < kBytes; ++i) {
		ASSERT_EQ(cpuBytes[i], (uint8_t)(i * 7 + 0x10 + kRounds - 1)) << "cpu byte " << i;
		ASSERT_EQ(dmaBytes[i], (uint8_t)(i * 7 + 0x80 + kRounds - 1)) << "dma byte " << i;
	}

	const auto counters = sys.cache.getCounters();
	EXPECT_EQ(counters.reads, 2 * kRounds * kBytes);
	EXPECT_EQ(counters.writes, 2 * kRounds * kBytes);
	EXPECT_EQ(sys.stats.getNumReads(), 2 * kRounds * kBytes / 4);
}

TEST(MemorySystemTest, AsyncCancellationKeepsTheAccess) {
	MemorySystem sys(smallDirectMapped(), 1'000'000);

	std::stop_source source;
	auto             future = sys.bus.writeBytesAsync(0x20, {0x99}, source.get_token());
	source.request_stop();

	EXPECT_THROW(future.get(), AccessCancelled);
	EXPECT_EQ(sys.controller.peekBytes(0x20, 1), (std::vector<uint8_t>{0x99}));
	EXPECT_EQ(sys.cache.getCounters().writes, 1);
}
