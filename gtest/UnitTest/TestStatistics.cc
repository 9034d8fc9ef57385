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
 * @file TestStatistics.cc
 * @brief Unit tests of the Statistics collectors used by the observers and memTrace
 *
 * | Suite          | Covers                                                        |
 * |----------------|---------------------------------------------------------------|
 * | StatisticsTest | per-sample queries, atomic accumulators, per-category shares  |
 */

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "profiling/Statistics.hh"

using namespace hiersim;

TEST(StatisticsTest, DefaultModeKeepsEverySample) {
	Statistics<uint64_t> latencies;
	EXPECT_EQ(latencies.size(), 0);
	EXPECT_EQ(latencies.avg(), 0);
	EXPECT_EQ(latencies.min(), 0);

	for (uint64_t v : {28, 16, 40, 16}) { latencies.push(v); }
	EXPECT_EQ(latencies.size(), 4);
	EXPECT_EQ(latencies.sum(), 100);
	EXPECT_EQ(latencies.avg(), 25);
	EXPECT_EQ(latencies.min(), 16);
	EXPECT_EQ(latencies.max(), 40);
}

TEST(StatisticsTest, AccumulatorsAcrossThreads) {
	Statistics<uint64_t, StatisticsMode::AccumulatorWithSize> bytes;
	Statistics<uint64_t, StatisticsMode::Accumulator>         events;

	std::vector<std::thread> workers;
	for (int t = 0; t < 4; ++t) {
		workers.emplace_back([&bytes, &events] {
			for (int i = 0; i < 1000; ++i) {
				bytes.push(4);
				events.push(1);
			}
		});
	}
	for (auto& worker : workers) { worker.join(); }

	EXPECT_EQ(bytes.size(), 4000);
	EXPECT_EQ(bytes.sum(), 16000);
	EXPECT_EQ(bytes.avg(), 4);
	EXPECT_EQ(events.sum(), 4000);
}

TEST(StatisticsTest, CategorizedDistribution) {
	CategorizedStatistics<std::string, uint64_t, StatisticsMode::Accumulator, true, true> perBank;
	EXPECT_TRUE(perBank.sumDistribution().empty());

	perBank.getEntry("ch0.rk0.bk0")->push(3);
	perBank.getEntry("ch0.rk0.bk1")->push(1);
	EXPECT_EQ(perBank.getEntry("ch0.rk0.bk0"), perBank.getEntry("ch0.rk0.bk0")) << "entries are created once";

	EXPECT_EQ(perBank.numCategories(), 2);
	EXPECT_EQ(perBank.sum(), 4);

	const auto share = perBank.sumDistribution();
	EXPECT_EQ(share.begin()->first, "ch0.rk0.bk0") << "sorted by category";
	EXPECT_DOUBLE_EQ(share.at("ch0.rk0.bk0"), 0.75);
	EXPECT_DOUBLE_EQ(share.at("ch0.rk0.bk1"), 0.25);
}
