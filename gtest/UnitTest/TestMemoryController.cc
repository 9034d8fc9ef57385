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
 * @file TestMemoryController.cc
 * @brief Unit tests of the DRAM controller: row-buffer timing, MMIO dispatch, refresh, paced
 *        asynchronous accesses and bounds checking
 *
 * Default timing used throughout: tCL=12, tRCD=12, tRP=12, burst=4, tRFC=350.
 *
 * ```
 * closed bank           : tRCD + tCL + burst        = 28
 * row-buffer hit        : tCL + burst               = 16
 * row-buffer conflict   : tRP + tRCD + tCL + burst  = 40
 * ```
 */

#include <gtest/gtest.h>

#include <stop_token>
#include <vector>

#include "mem/MemoryController.hh"
#include "mem/MemoryError.hh"
#include "observer/MemoryObserver.hh"

using namespace hiersim;

namespace {

constexpr Addr kRowBytes  = 512;
constexpr Addr kBankBytes = 256 * kRowBytes;

class RecordingObserver : public MemoryObserver {
public:
	void onRead(Addr _addr, uint64_t _len) override { reads.push_back({_addr, _len}); }
	void onWrite(Addr _addr, uint64_t _len) override { writes.push_back({_addr, _len}); }
	void onRowBufferHit(uint32_t _ch, uint32_t _rank, uint32_t _bank, uint32_t _row) override {
		rowHits.push_back(_bank * 1000 + _row);
	}
	void onRefreshStarted() override { ++refreshes; }

	std::vector<std::pair<Addr, uint64_t>> reads;
	std::vector<std::pair<Addr, uint64_t>> writes;
	std::vector<uint64_t>                  rowHits;
	int                                    refreshes = 0;
};

}  // namespace

TEST(MemoryControllerTest, RowBufferTiming) {
	MemoryController ctrl(DramGeometry{});
	RecordingObserver observer;
	ctrl.getObservers().attach(observer);

	EXPECT_EQ(ctrl.readBytes(0, 4).cycles, 28) << "first access to a closed bank";
	EXPECT_EQ(ctrl.readBytes(8, 4).cycles, 16) << "same row: row-buffer hit";
	EXPECT_EQ(ctrl.writeBytes(100, {1, 2}), 16) << "writes hit the open row too";
	EXPECT_EQ(ctrl.readBytes(kRowBytes, 1).cycles, 40) << "another row of the same bank";
	EXPECT_EQ(ctrl.readBytes(kBankBytes, 1).cycles, 28) << "another bank is independent";
	EXPECT_EQ(ctrl.readBytes(kRowBytes + 1, 1).cycles, 16) << "bank 0 kept row 1 open";

	EXPECT_EQ(ctrl.getCurrentCycle(), 28 + 16 + 16 + 40 + 28 + 16);

	EXPECT_EQ(observer.rowHits, (std::vector<uint64_t>{0, 0, 1})) << "bank 0 row 0 twice, then bank 0 row 1";
	EXPECT_EQ(observer.reads.size(), 5);
	EXPECT_EQ(observer.writes.size(), 1);
}

TEST(MemoryControllerTest, CustomTiming) {
	DramTiming timing;
	timing.casLatency       = 5;
	timing.rasToCasDelay    = 7;
	timing.rowPrechargeTime = 9;
	timing.burstLength      = 1;
	MemoryController ctrl(DramGeometry{}, timing);

	EXPECT_EQ(ctrl.readBytes(0, 1).cycles, 7 + 5 + 1);
	EXPECT_EQ(ctrl.readBytes(0, 1).cycles, 5 + 1);
	EXPECT_EQ(ctrl.readBytes(kRowBytes, 1).cycles, 9 + 7 + 5 + 1);
}

TEST(MemoryControllerTest, DataRoundTrip) {
	MemoryController ctrl(DramGeometry{});

	const std::vector<uint8_t> data = {0xCA, 0xFE, 0xBA, 0xBE};
	ctrl.writeBytes(0x2000, data);
	ctrl.readBytes(0x10, 1);  // move the row buffer away

	EXPECT_EQ(ctrl.readBytes(0x2000, 4).data, data);
	EXPECT_EQ(ctrl.peekBytes(0x2000, 4), data);
	EXPECT_EQ(ctrl.readBytes(0x2004, 2).data, (std::vector<uint8_t>{0, 0}));
}

TEST(MemoryControllerTest, BoundsChecking) {
	MemoryController ctrl(DramGeometry{});
	const uint64_t   size = ctrl.getPhysicalSize();
	ASSERT_EQ(size, 1u << 20);

	{  // physical space
		EXPECT_NO_THROW(ctrl.readBytes(size - 1, 1));
		EXPECT_THROW(ctrl.readBytes(size, 1), OutOfBounds);
		EXPECT_THROW(ctrl.writeBytes(size + 100, {1}), OutOfBounds);
		EXPECT_THROW(ctrl.readBytes(size - 1, 2), OutOfBounds);
	}

	{  // accesses may not cross a row, and a failed access charges nothing
		const Tick before = ctrl.getCurrentCycle();
		EXPECT_THROW(ctrl.readBytes(kRowBytes - 2, 4), OutOfBounds);
		EXPECT_THROW(ctrl.writeBytes(kRowBytes - 1, {1, 2}), OutOfBounds);
		EXPECT_THROW(ctrl.validateAccess(kRowBytes - 1, 2), OutOfBounds);
		EXPECT_EQ(ctrl.getCurrentCycle(), before);
		EXPECT_NO_THROW(ctrl.validateAccess(kRowBytes - 2, 2));
	}

	{  // peek may span rows
		EXPECT_EQ(ctrl.peekBytes(kRowBytes - 2, 4).size(), 4);
		EXPECT_THROW(ctrl.peekBytes(size - 1, 2), OutOfBounds);
	}
}

TEST(MemoryControllerTest, ZeroLengthIsNoOp) {
	MemoryController  ctrl(DramGeometry{});
	RecordingObserver observer;
	ctrl.getObservers().attach(observer);

	auto result = ctrl.readBytes(~0ULL, 0);
	EXPECT_TRUE(result.data.empty());
	EXPECT_EQ(result.cycles, 0);
	EXPECT_EQ(ctrl.writeBytes(~0ULL, {}), 0);
	EXPECT_EQ(ctrl.getCurrentCycle(), 0);
	EXPECT_TRUE(observer.reads.empty());
	EXPECT_TRUE(observer.writes.empty());
}

TEST(MemoryControllerTest, RefreshClosesEveryBank) {
	MemoryController  ctrl(DramGeometry{});
	RecordingObserver observer;
	ctrl.getObservers().attach(observer);

	ctrl.readBytes(0, 1);
	ctrl.readBytes(3 * kBankBytes + 5 * kRowBytes, 1);

	auto before = ctrl.getSnapshot();
	EXPECT_EQ(before.banks.size(), 8);
	EXPECT_EQ(before.banks[0].openRow, 0u);
	EXPECT_EQ(before.banks[3].openRow, 5u);
	EXPECT_EQ(before.banks[3].bank, 3);

	const Tick cycle = ctrl.getCurrentCycle();
	EXPECT_EQ(ctrl.refreshAll(), 350);
	EXPECT_EQ(ctrl.getCurrentCycle(), cycle + 350);
	EXPECT_EQ(observer.refreshes, 1);

	for (const auto& bank : ctrl.getSnapshot().banks) { EXPECT_FALSE(bank.openRow.has_value()) << bank.bank; }

	EXPECT_EQ(ctrl.readBytes(0, 1).cycles, 28) << "the bank is closed again after refresh";
}

TEST(MemoryControllerTest, MmioDispatch) {
	MemoryController ctrl(DramGeometry{});

	std::vector<uint8_t> received;
	ctrl.registerMmioHandler(
	    0x1000, 0x10,
	    [](Addr _addr, uint64_t _len) { return ReadResult{std::vector<uint8_t>(_len, (uint8_t)(_addr & 0xFF)), 3}; },
	    [&received](Addr _addr, const std::vector<uint8_t>& _data) {
		    received.insert(received.end(), _data.begin(), _data.end());
		    return Tick(2);
	    });

	EXPECT_TRUE(ctrl.isMmio(0x1000));
	EXPECT_TRUE(ctrl.isMmio(0x100F));
	EXPECT_FALSE(ctrl.isMmio(0x1010));

	auto result = ctrl.readBytes(0x1004, 2);
	EXPECT_EQ(result.data, (std::vector<uint8_t>{0x04, 0x04}));
	EXPECT_EQ(result.cycles, 3);
	EXPECT_EQ(ctrl.writeBytes(0x1000, {7, 8, 9}), 2);
	EXPECT_EQ(received, (std::vector<uint8_t>{7, 8, 9}));
	EXPECT_EQ(ctrl.getCurrentCycle(), 5);

	EXPECT_EQ(ctrl.peekBytes(0x1000, 3), (std::vector<uint8_t>(3, 0))) << "DRAM behind the window is untouched";
	EXPECT_FALSE(ctrl.getSnapshot().banks[0].openRow.has_value()) << "MMIO does not open rows";

	{  // registration errors
		auto rd = [](Addr, uint64_t) { return ReadResult{}; };
		auto wr = [](Addr, const std::vector<uint8_t>&) { return Tick(0); };
		EXPECT_THROW(ctrl.registerMmioHandler(0x1008, 0x10, rd, wr), OverlapError);
		EXPECT_THROW(ctrl.registerMmioHandler(0x0FF0, 0x11, rd, wr), OverlapError);
		EXPECT_THROW(ctrl.registerMmioHandler(0x2000, 0, rd, wr), InvalidConfiguration);
		EXPECT_THROW(ctrl.registerMmioHandler(0x2000, 0x10, nullptr, wr), InvalidConfiguration);
		EXPECT_THROW(ctrl.registerMmioHandler(ctrl.getPhysicalSize() - 4, 0x10, rd, wr), OutOfBounds);
		EXPECT_NO_THROW(ctrl.registerMmioHandler(0x1010, 0x10, rd, wr)) << "adjacent ranges are fine";
	}
}

TEST(MemoryControllerTest, WritebackIsTimingOnly) {
	MemoryController  ctrl(DramGeometry{});
	RecordingObserver observer;
	ctrl.getObservers().attach(observer);

	ctrl.writeBytes(0x40, {0xAA});
	const Tick cycles = ctrl.writebackBlock(0x40, 16);
	EXPECT_EQ(cycles, 16) << "row 0 is still open";
	EXPECT_EQ(ctrl.peekBytes(0x40, 1), (std::vector<uint8_t>{0xAA}));

	ASSERT_EQ(observer.writes.size(), 2);
	EXPECT_EQ(observer.writes[1], (std::pair<Addr, uint64_t>{0x40, 16}));

	{  // clamped to the row and to the physical space, never throws
		EXPECT_NO_THROW(ctrl.writebackBlock(kRowBytes - 4, 16));
		EXPECT_EQ(observer.writes.back().second, 4);
		EXPECT_EQ(ctrl.writebackBlock(ctrl.getPhysicalSize(), 16), 0);
		EXPECT_EQ(ctrl.writebackBlock(0x40, 0), 0);
	}
}

TEST(MemoryControllerTest, AsyncAccessCompletes) {
	MemoryController ctrl(DramGeometry{}, DramTiming(), /* pacingNsPerCycle */ 0);

	auto write = ctrl.writeBytesAsync(0x300, {1, 2, 3});
	EXPECT_EQ(write.get(), 28);

	auto read   = ctrl.readBytesAsync(0x300, 3);
	auto result = read.get();
	EXPECT_EQ(result.data, (std::vector<uint8_t>{1, 2, 3}));
	EXPECT_EQ(result.cycles, 16);

	EXPECT_THROW(ctrl.readBytesAsync(ctrl.getPhysicalSize(), 1), OutOfBounds) << "bounds are checked up front";
}

TEST(MemoryControllerTest, AsyncAccessCancellation) {
	// 1 ms per cycle: a 28-cycle access paces for 28 ms
	MemoryController ctrl(DramGeometry{}, DramTiming(), 1'000'000);

	std::stop_source source;
	auto             write = ctrl.writeBytesAsync(0x80, {0x42}, source.get_token());
	source.request_stop();

	EXPECT_THROW(write.get(), AccessCancelled);
	EXPECT_EQ(ctrl.peekBytes(0x80, 1), (std::vector<uint8_t>{0x42})) << "the access committed before pacing";
	EXPECT_EQ(ctrl.getCurrentCycle(), 28);

	std::stop_source stopped;
	stopped.request_stop();
	EXPECT_THROW(ctrl.readBytesAsync(0x80, 1, stopped.get_token()).get(), AccessCancelled);
}

TEST(MemoryControllerTest, IntrospectionAndReset) {
	MemoryController ctrl(DramGeometry{});
	EXPECT_EQ(ctrl.getTopologyInfo(), "Channels=1, Ranks=1, BanksPerRank=8, RowsPerBank=256, ColsPerRow=512");
	EXPECT_EQ(ctrl.getPacingNsPerCycle(), MemoryController::kDefaultPacingNsPerCycle);

	ctrl.writeBytes(0x10, {9});
	const Tick cycle = ctrl.getCurrentCycle();

	ctrl.reset();
	EXPECT_EQ(ctrl.getCurrentCycle(), cycle) << "reset keeps the cycle counter";
	EXPECT_EQ(ctrl.peekBytes(0x10, 1), (std::vector<uint8_t>{0}));
	EXPECT_FALSE(ctrl.getSnapshot().banks[0].openRow.has_value());

	EXPECT_THROW(MemoryController(DramGeometry{1, 1, 0, 4, 4}), InvalidConfiguration);
}
