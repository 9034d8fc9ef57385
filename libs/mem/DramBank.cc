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

#include "mem/DramBank.hh"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "mem/MemoryError.hh"

namespace hiersim {

DramBank::DramBank(uint32_t _rows, uint32_t _cols) : rows(_rows), cols(_cols) {
	if (_rows == 0 || _cols == 0) { throw InvalidConfiguration("a DRAM bank needs at least one row and one column"); }
	this->cells.assign((size_t)_rows * _cols, 0);
}

void DramBank::activate(uint32_t _row) {
	if (_row >= this->rows) {
		throw OutOfBounds("row " + std::to_string(_row) + " >= " + std::to_string(this->rows));
	}
	if (this->openRow.has_value()) {
		throw std::logic_error("DramBank::activate() on a bank with open row " + std::to_string(*this->openRow));
	}
	this->openRow = _row;
}

std::vector<uint8_t> DramBank::readFromOpenRow(uint32_t _col, uint32_t _len) const {
	if (!this->openRow.has_value()) { throw std::logic_error("DramBank::readFromOpenRow() without an open row"); }
	this->checkSpan(_col, _len);

	auto begin = this->cells.begin() + (size_t)(*this->openRow) * this->cols + _col;
	return std::vector<uint8_t>(begin, begin + _len);
}

void DramBank::writeToOpenRow(uint32_t _col, const uint8_t* _data, uint32_t _len) {
	if (!this->openRow.has_value()) { throw std::logic_error("DramBank::writeToOpenRow() without an open row"); }
	this->checkSpan(_col, _len);

	std::copy(_data, _data + _len, this->cells.begin() + (size_t)(*this->openRow) * this->cols + _col);
}

std::vector<uint8_t> DramBank::peek(uint32_t _row, uint32_t _col, uint32_t _len) const {
	if (_row >= this->rows) {
		throw OutOfBounds("row " + std::to_string(_row) + " >= " + std::to_string(this->rows));
	}
	this->checkSpan(_col, _len);

	auto begin = this->cells.begin() + (size_t)_row * this->cols + _col;
	return std::vector<uint8_t>(begin, begin + _len);
}

void DramBank::reset() {
	this->openRow.reset();
	std::fill(this->cells.begin(), this->cells.end(), 0);
}

void DramBank::checkSpan(uint32_t _col, uint32_t _len) const {
	if ((uint64_t)_col + _len > this->cols) {
		throw OutOfBounds("column span [" + std::to_string(_col) + ", " + std::to_string((uint64_t)_col + _len) +
		                  ") exceeds " + std::to_string(this->cols) + " columns");
	}
}

}  // namespace hiersim
