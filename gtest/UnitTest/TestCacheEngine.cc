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
 * @file TestCacheEngine.cc
 * @brief Unit tests of the set-associative cache model
 *
 * Unless stated otherwise the cache is 1024 bytes with 16-byte blocks, 2-way, LRU, write-back:
 * 64 lines in 32 sets, so addresses 0x200 apart fall into the same set.
 */

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "cache/CacheEngine.hh"
#include "mem/BackingStore.hh"
#include "mem/MemoryError.hh"

using namespace hiersim;

namespace {

constexpr Addr kSetStride = 0x200;

class RecordingStore : public BackingStore {
public:
	Tick writebackBlock(Addr _addr, uint64_t _len) override {
		blocks.push_back({_addr, _len});
		return 1;
	}

	std::vector<std::pair<Addr, uint64_t>> blocks;
};

CacheParams makeParams(uint64_t _size, uint64_t _block, uint64_t _assoc,
                       ReplacementPolicy _repl = ReplacementPolicy::LRU, WritePolicy _write = WritePolicy::WriteBack) {
	CacheParams params;
	params.cacheSizeBytes    = _size;
	params.blockSizeBytes    = _block;
	params.associativity     = _assoc;
	params.replacementPolicy = _repl;
	params.writePolicy       = _write;
	return params;
}

}  // namespace

TEST(CacheEngineTest, ParameterValidation) {
	EXPECT_NO_THROW(CacheEngine(makeParams(1024, 16, 2)));
	EXPECT_NO_THROW(CacheEngine(makeParams(1024, 16, 64))) << "fully associative";
	EXPECT_THROW(CacheEngine(makeParams(0, 16, 2)), InvalidConfiguration);
	EXPECT_THROW(CacheEngine(makeParams(1024, 0, 2)), InvalidConfiguration);
	EXPECT_THROW(CacheEngine(makeParams(1024, 16, 0)), InvalidConfiguration);
	EXPECT_THROW(CacheEngine(makeParams(1000, 16, 2)), InvalidConfiguration) << "not a multiple of the block size";
	EXPECT_THROW(CacheEngine(makeParams(1024, 16, 65)), InvalidConfiguration) << "more ways than lines";
}

TEST(CacheEngineTest, Topology) {
	CacheEngine cache(makeParams(1024, 16, 2));
	EXPECT_EQ(cache.getNumSets(), 32);
	EXPECT_EQ(cache.getTopologyInfo(),
	          "CacheSize=1024, BlockSize=16, Associativity=2, Sets=32, Replacement=LRU, WritePolicy=WriteBack");

	CacheEngine fifo(makeParams(256, 32, 8, ReplacementPolicy::FIFO, WritePolicy::WriteThrough));
	EXPECT_EQ(fifo.getNumSets(), 1);
	EXPECT_EQ(fifo.getTopologyInfo(),
	          "CacheSize=256, BlockSize=32, Associativity=8, Sets=1, Replacement=FIFO, WritePolicy=WriteThrough");
}

TEST(CacheEngineTest, ClassicTrace) {
	// R 0x0000, R 0x0010, R 0x0020, W 0x0000: three sets, three misses, then a hit
	CacheEngine cache(makeParams(1024, 16, 2));
	cache.access(0x0000, false);
	cache.access(0x0010, false);
	cache.access(0x0020, false);
	cache.access(0x0000, true);

	auto c = cache.getCounters();
	EXPECT_EQ(c.reads, 3);
	EXPECT_EQ(c.writes, 1);
	EXPECT_EQ(c.misses, 3);
	EXPECT_EQ(c.hits, 1);
	EXPECT_EQ(c.backingStoreWrites, 0);
	EXPECT_DOUBLE_EQ(cache.getHitRate(), 0.25);
	EXPECT_DOUBLE_EQ(cache.getMissRate(), 0.75);

	auto sets = cache.getSetsSnapshot();
	EXPECT_TRUE(sets[0][0].dirty) << "the write-back hit marks the line dirty";
}

TEST(CacheEngineTest, SameSetConflictScenario) {
	// R a, R b, R c, W a with a, b, c in one set: c evicts a, W a evicts the clean b
	CacheEngine    cache(makeParams(1024, 16, 2));
	RecordingStore store;
	cache.attachBackingStore(store);

	const Addr a = 0x0, b = kSetStride, c = 2 * kSetStride;
	cache.access(a, false);
	cache.access(b, false);
	cache.access(c, false);
	cache.access(a, true);

	auto counters = cache.getCounters();
	EXPECT_EQ(counters.hits, 0);
	EXPECT_EQ(counters.misses, 4);
	EXPECT_EQ(counters.backingStoreWrites, 0);
	EXPECT_TRUE(store.blocks.empty()) << "no dirty line was evicted";
}

TEST(CacheEngineTest, DirectMapped) {
	CacheEngine cache(makeParams(1024, 16, 1));  // 64 sets, conflicts 0x400 apart

	cache.access(0x0, false);
	for (int i = 0; i < 5; ++i) { cache.access(0x4, false); }
	EXPECT_EQ(cache.getCounters().misses, 1);
	EXPECT_EQ(cache.getCounters().hits, 5);

	cache.access(0x400, false);
	cache.access(0x0, false);
	EXPECT_EQ(cache.getCounters().misses, 3) << "the conflicting tag evicts, and the old block misses again";
}

TEST(CacheEngineTest, LruEvictsLeastRecentlyUsed) {
	CacheEngine cache(makeParams(1024, 16, 2));
	const Addr  a = 0x0, b = kSetStride, c = 2 * kSetStride;

	cache.access(a, false);  // miss
	cache.access(b, false);  // miss
	cache.access(a, false);  // hit, b becomes LRU
	cache.access(c, false);  // miss, evicts b
	cache.access(a, false);  // hit
	EXPECT_EQ(cache.getCounters().hits, 2);

	cache.access(b, false);  // miss
	EXPECT_EQ(cache.getCounters().misses, 4);
}

TEST(CacheEngineTest, LruWithHigherAssociativity) {
	// k + 1 distinct tags in one set evict the first one
	CacheEngine cache(makeParams(1024, 16, 4));  // 16 sets, stride 0x100
	for (Addr i = 0; i < 5; ++i) { cache.access(i * 0x100, false); }
	EXPECT_EQ(cache.getCounters().misses, 5);

	for (Addr i = 1; i < 5; ++i) { cache.access(i * 0x100, false); }
	EXPECT_EQ(cache.getCounters().hits, 4);

	cache.access(0x0, false);
	EXPECT_EQ(cache.getCounters().misses, 6);
}

TEST(CacheEngineTest, FifoIgnoresHits) {
	CacheEngine cache(makeParams(1024, 16, 2, ReplacementPolicy::FIFO));
	const Addr  a = 0x0, b = kSetStride, c = 2 * kSetStride;

	cache.access(a, false);  // miss
	cache.access(b, false);  // miss
	cache.access(a, false);  // hit, insertion order unchanged
	cache.access(c, false);  // miss, evicts a (inserted first)
	cache.access(b, false);  // hit
	cache.access(a, false);  // miss

	auto counters = cache.getCounters();
	EXPECT_EQ(counters.hits, 2);
	EXPECT_EQ(counters.misses, 4);
}

TEST(CacheEngineTest, WriteBackFlushesDirtyVictimsOnce) {
	CacheEngine    cache(makeParams(1024, 16, 2));
	RecordingStore store;
	cache.attachBackingStore(store);

	const Addr a = 0x1234 & ~0xFULL, b = a + kSetStride, c = a + 2 * kSetStride;
	cache.access(a + 3, true);  // miss, dirty
	cache.access(a + 5, true);  // hit, still one dirty line
	cache.access(b, false);
	EXPECT_EQ(cache.getCounters().backingStoreWrites, 0) << "write-back defers the write";

	cache.access(c, false);  // evicts a (LRU), dirty
	EXPECT_EQ(cache.getCounters().backingStoreWrites, 1);
	ASSERT_EQ(store.blocks.size(), 1);
	EXPECT_EQ(store.blocks[0], (std::pair<Addr, uint64_t>{a, 16})) << "the whole victim block is flushed";

	cache.access(a, false);  // evicts the clean b
	EXPECT_EQ(cache.getCounters().backingStoreWrites, 1);
	EXPECT_EQ(store.blocks.size(), 1);
}

TEST(CacheEngineTest, WriteThroughWritesEveryTime) {
	CacheEngine    cache(makeParams(1024, 16, 2, ReplacementPolicy::LRU, WritePolicy::WriteThrough));
	RecordingStore store;
	cache.attachBackingStore(store);

	cache.access(0x0, true);   // miss
	cache.access(0x0, true);   // hit
	cache.access(0x4, false);  // hit
	EXPECT_EQ(cache.getCounters().backingStoreWrites, 2);

	cache.access(kSetStride, true);
	cache.access(2 * kSetStride, true);  // evicts 0x0
	EXPECT_EQ(cache.getCounters().backingStoreWrites, 4);
	EXPECT_TRUE(store.blocks.empty()) << "nothing is ever flushed on eviction";

	for (const auto& set : cache.getSetsSnapshot()) {
		for (const auto& line : set) { EXPECT_FALSE(line.dirty); }
	}
}

TEST(CacheEngineTest, NonPowerOfTwoSetCount) {
	CacheEngine cache(makeParams(48, 16, 1));  // 3 sets, block n maps to set n % 3
	EXPECT_EQ(cache.getNumSets(), 3);

	cache.access(0x00, false);  // block 0: set 0, tag 0
	cache.access(0x30, false);  // block 3: set 0, tag 1
	EXPECT_EQ(cache.getCounters().hits, 0) << "distinct blocks never share a line";
	EXPECT_EQ(cache.getCounters().misses, 2);

	cache.access(0x20, false);  // block 2: set 2
	cache.access(0x40, false);  // block 4: set 1
	cache.access(0x34, false);  // block 3 again
	EXPECT_EQ(cache.getCounters().hits, 1);

	cache.access(0x00, false);  // evicts block 3
	EXPECT_EQ(cache.getCounters().misses, 5);
}

TEST(CacheEngineTest, NonPowerOfTwoWritebackTargetsTheVictim) {
	RecordingStore store;
	CacheEngine    cache(makeParams(48, 16, 1));
	cache.attachBackingStore(store);

	cache.access(0x00, false);
	cache.access(0x35, true);   // block 3 replaces block 0 in set 0, dirty
	cache.access(0x60, false);  // block 6 replaces block 3

	ASSERT_EQ(store.blocks.size(), 1);
	EXPECT_EQ(store.blocks[0].first, 0x30) << "the dirty block is written back, not another block of its set";
	EXPECT_EQ(store.blocks[0].second, 16);
}

TEST(CacheEngineTest, SnapshotAndReset) {
	CacheEngine cache(makeParams(64, 16, 2));  // 2 sets of 2 ways
	cache.access(0x00, true);
	cache.access(0x10, false);
	cache.access(0x20, false);

	auto sets = cache.getSetsSnapshot();
	ASSERT_EQ(sets.size(), 2);
	ASSERT_EQ(sets[0].size(), 2);
	EXPECT_TRUE(sets[0][0].valid);
	EXPECT_TRUE(sets[0][0].dirty);
	EXPECT_EQ(sets[0][0].tag, 0);
	EXPECT_TRUE(sets[0][1].valid);
	EXPECT_EQ(sets[0][1].tag, 1);
	EXPECT_FALSE(sets[0][1].dirty);
	EXPECT_TRUE(sets[1][0].valid);
	EXPECT_FALSE(sets[1][1].valid);

	const auto counters = cache.getCounters();
	cache.reset();
	EXPECT_EQ(cache.getCounters(), counters) << "reset keeps the counters";
	for (const auto& set : cache.getSetsSnapshot()) {
		for (const auto& line : set) { EXPECT_FALSE(line.valid); }
	}

	cache.access(0x00, false);
	EXPECT_EQ(cache.getCounters().misses, counters.misses + 1);
}

TEST(CacheEngineTest, ConcurrentAccessesAreCounted) {
	CacheEngine cache(makeParams(1024, 16, 2));

	std::vector<std::thread> threads;
	for (int t = 0; t < 4; ++t) {
		threads.emplace_back([&cache, t] {
			for (int i = 0; i < 1000; ++i) { cache.access((Addr)(t * 0x1000 + (i % 64)), i % 3 == 0); }
		});
	}
	for (auto& thread : threads) { thread.join(); }

	auto c = cache.getCounters();
	EXPECT_EQ(c.getAccesses(), 4000);
	EXPECT_EQ(c.hits + c.misses, 4000);
}
