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
 * @file TestObservers.cc
 * @brief Unit tests of the observers attached to the controller and the cache
 *
 * ## StatisticsObserverTest Suite
 * - Read, write, refresh and per-bank row-buffer hit counts from real controller traffic
 * - Detached observers are no longer notified
 * - The latest cache counters are kept
 *
 * ## EventChannelObserverTest Suite
 * - Events arrive in notification order (row hit before the read it belongs to)
 * - A consumer thread blocked in waitNext() sees every event until close()
 * - Concurrent drain() calls hand each event to exactly one caller
 * - JSON form carries only the fields of the event type
 */

#include <gtest/gtest.h>

#include <thread>
#include <vector>

// Third-Party Library
#include <nlohmann/json.hpp>

#include "mem/AddressCodec.hh"
#include "mem/MemoryController.hh"
#include "observer/EventChannelObserver.hh"
#include "observer/StatisticsObserver.hh"

using namespace hiersim;

TEST(StatisticsObserverTest, CountsControllerTraffic) {
	MemoryController   controller(DramGeometry{}, DramTiming());
	StatisticsObserver stats;
	controller.getObservers().attach(stats);

	controller.writeBytes(0x0, {1, 2, 3, 4});
	controller.readBytes(0x0, 2);
	controller.readBytes(0x8, 8);
	controller.refreshAll();

	EXPECT_EQ(stats.getNumWrites(), 1);
	EXPECT_EQ(stats.getBytesWritten(), 4);
	EXPECT_EQ(stats.getNumReads(), 2);
	EXPECT_EQ(stats.getBytesRead(), 10);
	EXPECT_EQ(stats.getNumRefreshes(), 1);
	EXPECT_EQ(stats.getNumRowBufferHits(), 2);

	const auto coord = AddressCodec::decodeDram(DramGeometry{}, 0x0);
	const auto label = "ch" + std::to_string(coord.channel) + ".rk" + std::to_string(coord.rank) + ".bk" +
	                   std::to_string(coord.bank);
	const auto distribution = stats.getRowBufferHitDistribution();
	ASSERT_EQ(distribution.size(), 1);
	EXPECT_DOUBLE_EQ(distribution.at(label), 1.0);

	controller.getObservers().detach(stats);
	controller.readBytes(0x0, 1);
	EXPECT_EQ(stats.getNumReads(), 2) << "a detached observer is no longer notified";
}

TEST(StatisticsObserverTest, KeepsLatestCacheCounters) {
	StatisticsObserver stats;
	EXPECT_EQ(stats.getLastCacheCounters(), CacheCounters{});

	CacheCounters counters;
	counters.reads  = 3;
	counters.hits   = 2;
	counters.misses = 1;
	stats.onCacheCounters(counters);
	counters.writes = 1;
	stats.onCacheCounters(counters);

	EXPECT_EQ(stats.getLastCacheCounters(), counters);
	EXPECT_DOUBLE_EQ(stats.getLastCacheCounters().getHitRate(), 0.5);
}

TEST(EventChannelObserverTest, DrainPreservesNotificationOrder) {
	MemoryController     controller(DramGeometry{}, DramTiming());
	EventChannelObserver events;
	controller.getObservers().attach(events);

	controller.writeBytes(0x40, {7});
	controller.readBytes(0x40, 1);
	controller.refreshAll();

	auto drained = events.drain();
	ASSERT_EQ(drained.size(), 4);
	EXPECT_EQ(drained[0].type, MemoryEventType::Write);
	EXPECT_EQ(drained[0].addr, 0x40);
	EXPECT_EQ(drained[0].len, 1);
	EXPECT_EQ(drained[1].type, MemoryEventType::RowBufferHit) << "row hits are reported before the read completes";
	EXPECT_EQ(drained[2].type, MemoryEventType::Read);
	EXPECT_EQ(drained[3].type, MemoryEventType::RefreshStarted);

	EXPECT_TRUE(events.drain().empty());
	EXPECT_EQ(events.pending(), 0);
}

TEST(EventChannelObserverTest, ConsumerThreadSeesEveryEvent) {
	MemoryController     controller(DramGeometry{}, DramTiming());
	EventChannelObserver events;
	controller.getObservers().attach(events);

	std::vector<MemoryEvent> received;
	std::thread              consumer([&events, &received] {
		MemoryEvent event;
		while (events.waitNext(event)) { received.push_back(event); }
	});

	constexpr int kWrites = 100;
	for (int i = 0; i < kWrites; ++i) { controller.writeBytes((Addr)i * 1024, {(uint8_t)i}); }
	events.close();
	consumer.join();

	ASSERT_EQ(received.size(), kWrites);
	for (int i = 0; i < kWrites; ++i) {
		EXPECT_EQ(received[i].type, MemoryEventType::Write);
		EXPECT_EQ(received[i].addr, (Addr)i * 1024);
	}
}

TEST(EventChannelObserverTest, ConcurrentDrainsShareTheQueue) {
	EventChannelObserver events;
	constexpr int        kEvents = 20000;
	for (int i = 0; i < kEvents; ++i) { events.onWrite((Addr)i, 1); }

	std::vector<std::vector<MemoryEvent>> drained(4);
	std::vector<std::thread>              drainers;
	for (auto& out : drained) {
		drainers.emplace_back([&events, &out] {
			for (int round = 0; round < 8; ++round) {
				auto batch = events.drain();
				out.insert(out.end(), batch.begin(), batch.end());
			}
		});
	}
	for (auto& drainer : drainers) { drainer.join(); }

	std::vector<bool> seen(kEvents, false);
	size_t            total = 0;
	for (const auto& out : drained) {
		for (const auto& event : out) {
			ASSERT_LT(event.addr, (Addr)kEvents);
			EXPECT_FALSE(seen[event.addr]) << "event " << event.addr << " delivered twice";
			seen[event.addr] = true;
			++total;
		}
	}
	EXPECT_EQ(total, kEvents);
	EXPECT_EQ(events.pending(), 0);
}

TEST(EventChannelObserverTest, ClosedObserverDropsEvents) {
	EventChannelObserver events;
	events.onRead(0x10, 4);
	events.close();
	EXPECT_TRUE(events.isClosed());

	events.onWrite(0x20, 4);

	MemoryEvent event;
	ASSERT_TRUE(events.waitNext(event)) << "events queued before close are still delivered";
	EXPECT_EQ(event.type, MemoryEventType::Read);
	EXPECT_FALSE(events.waitNext(event));
}

TEST(EventChannelObserverTest, JsonCarriesOnlyRelevantFields) {
	MemoryEvent read{.type = MemoryEventType::Read, .addr = 0x100, .len = 8};
	nlohmann::json j = read;
	EXPECT_EQ(j, (nlohmann::json{{"type", "Read"}, {"addr", 0x100}, {"len", 8}}));

	MemoryEvent hit{.type = MemoryEventType::RowBufferHit, .channel = 0, .rank = 0, .bank = 3, .row = 9};
	j = hit;
	EXPECT_EQ(j["type"], "RowBufferHit");
	EXPECT_EQ(j["bank"], 3);
	EXPECT_EQ(j["row"], 9);
	EXPECT_FALSE(j.contains("addr"));

	j = MemoryEvent{.type = MemoryEventType::RefreshStarted};
	EXPECT_EQ(j, (nlohmann::json{{"type", "RefreshStarted"}}));

	MemoryEvent counters{.type = MemoryEventType::CacheCounters};
	counters.counters.misses = 5;
	j                        = counters;
	EXPECT_EQ(j["misses"], 5);
	EXPECT_EQ(j["backingStoreWrites"], 0);
}
