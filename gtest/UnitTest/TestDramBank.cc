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
 * @file TestDramBank.cc
 * @brief Unit tests of the row-buffer state machine and cell storage of a single bank
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "mem/DramBank.hh"
#include "mem/MemoryError.hh"

using namespace hiersim;

TEST(DramBankTest, RowBufferStateMachine) {
	DramBank bank(4, 16);
	EXPECT_FALSE(bank.hasOpenRow()) << "a new bank starts closed";
	EXPECT_EQ(bank.getRowCount(), 4);
	EXPECT_EQ(bank.getColCount(), 16);

	bank.activate(2);
	ASSERT_TRUE(bank.hasOpenRow());
	EXPECT_EQ(bank.getOpenRow(), 2u);

	// A second activation must be preceded by a precharge
	EXPECT_THROW(bank.activate(1), std::logic_error);

	bank.precharge();
	EXPECT_FALSE(bank.hasOpenRow());
	bank.precharge();  // idempotent
	EXPECT_FALSE(bank.hasOpenRow());

	EXPECT_THROW(bank.activate(4), OutOfBounds);
}

TEST(DramBankTest, ReadWriteThroughOpenRow) {
	DramBank bank(4, 16);

	{  // no open row
		const uint8_t byte = 0x5A;
		EXPECT_THROW(bank.readFromOpenRow(0, 1), std::logic_error);
		EXPECT_THROW(bank.writeToOpenRow(0, &byte, 1), std::logic_error);
	}

	bank.activate(1);
	const std::vector<uint8_t> data = {0xDE, 0xAD, 0xBE, 0xEF};
	bank.writeToOpenRow(12, data.data(), (uint32_t)data.size());
	EXPECT_EQ(bank.readFromOpenRow(12, 4), data);
	EXPECT_EQ(bank.readFromOpenRow(0, 2), (std::vector<uint8_t>{0, 0})) << "cells start zeroed";

	EXPECT_THROW(bank.readFromOpenRow(13, 4), OutOfBounds) << "span past the last column";
	EXPECT_THROW(bank.writeToOpenRow(16, data.data(), 1), OutOfBounds);

	// peek does not need the row to be open
	bank.precharge();
	EXPECT_EQ(bank.peek(1, 12, 4), data);
	EXPECT_EQ(bank.peek(0, 12, 4), (std::vector<uint8_t>(4, 0))) << "other rows are untouched";
	EXPECT_THROW(bank.peek(4, 0, 1), OutOfBounds);
}

TEST(DramBankTest, ResetClosesAndClears) {
	DramBank bank(2, 8);
	bank.activate(0);
	const uint8_t byte = 0x11;
	bank.writeToOpenRow(3, &byte, 1);

	bank.reset();
	EXPECT_FALSE(bank.hasOpenRow());
	EXPECT_EQ(bank.peek(0, 3, 1), (std::vector<uint8_t>{0}));
}

TEST(DramBankTest, RejectsEmptyGeometry) {
	EXPECT_THROW(DramBank(0, 8), InvalidConfiguration);
	EXPECT_THROW(DramBank(8, 0), InvalidConfiguration);
}
