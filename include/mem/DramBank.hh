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
#include <optional>
#include <vector>

namespace hiersim {

/**
 * @class DramBank
 * @brief Storage and row-buffer state of one DRAM bank.
 *
 * State machine: `Closed --activate(row)--> Open(row) --precharge()--> Closed`.
 * Byte transfers only ever touch the open row. Timing is applied by MemoryController; the bank
 * itself only tracks state. Not thread-safe, the owning controller serializes access.
 */
class DramBank {
public:
	DramBank(uint32_t _rows, uint32_t _cols);

	std::optional<uint32_t> getOpenRow() const { return this->openRow; }

	bool hasOpenRow() const { return this->openRow.has_value(); }

	uint32_t getRowCount() const { return this->rows; }

	uint32_t getColCount() const { return this->cols; }

	/// @brief Opens @p _row. The bank must be closed; throws OutOfBounds for an invalid row.
	void activate(uint32_t _row);

	void precharge() { this->openRow.reset(); }

	std::vector<uint8_t> readFromOpenRow(uint32_t _col, uint32_t _len) const;

	void writeToOpenRow(uint32_t _col, const uint8_t* _data, uint32_t _len);

	/// @brief Reads any row without touching the row buffer.
	std::vector<uint8_t> peek(uint32_t _row, uint32_t _col, uint32_t _len) const;

	/// @brief Closes the bank and zeroes its storage.
	void reset();

private:
	void checkSpan(uint32_t _col, uint32_t _len) const;

	const uint32_t rows;
	const uint32_t cols;

	std::optional<uint32_t> openRow;

	/// @brief Row-major storage, rows x cols bytes.
	std::vector<uint8_t> cells;
};

}  // namespace hiersim
