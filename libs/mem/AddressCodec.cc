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

#include "mem/AddressCodec.hh"

#include <string>

#include "mem/MemoryError.hh"

namespace hiersim {

void DramGeometry::validate() const {
	if (channels == 0 || ranksPerChannel == 0 || banksPerRank == 0 || rowsPerBank == 0 || colsPerRow == 0) {
		throw InvalidConfiguration("every DRAM dimension must be positive");
	}
}

DramCoord AddressCodec::decodeDram(const DramGeometry& _geo, Addr _addr) {
	DramCoord coord;

	coord.col = (uint32_t)(_addr % _geo.colsPerRow);
	_addr /= _geo.colsPerRow;
	coord.row = (uint32_t)(_addr % _geo.rowsPerBank);
	_addr /= _geo.rowsPerBank;
	coord.bank = (uint32_t)(_addr % _geo.banksPerRank);
	_addr /= _geo.banksPerRank;
	coord.rank = (uint32_t)(_addr % _geo.ranksPerChannel);
	_addr /= _geo.ranksPerChannel;
	coord.channel = (uint32_t)(_addr % _geo.channels);

	return coord;
}

Addr AddressCodec::encodeDram(const DramGeometry& _geo, const DramCoord& _coord) {
	if (_coord.channel >= _geo.channels || _coord.rank >= _geo.ranksPerChannel || _coord.bank >= _geo.banksPerRank ||
	    _coord.row >= _geo.rowsPerBank || _coord.col >= _geo.colsPerRow) {
		throw OutOfBounds("DRAM coordinate (" + std::to_string(_coord.channel) + "," + std::to_string(_coord.rank) +
		                  "," + std::to_string(_coord.bank) + "," + std::to_string(_coord.row) + "," +
		                  std::to_string(_coord.col) + ") is outside the configured geometry");
	}

	Addr addr = _coord.channel;
	addr      = addr * _geo.ranksPerChannel + _coord.rank;
	addr      = addr * _geo.banksPerRank + _coord.bank;
	addr      = addr * _geo.rowsPerBank + _coord.row;
	addr      = addr * _geo.colsPerRow + _coord.col;
	return addr;
}

CacheCoord AddressCodec::decodeCache(const CacheGeometry& _geo, Addr _addr) {
	const uint32_t offset_bits = AddressCodec::bitsNeeded(_geo.blockSizeBytes);
	const uint64_t num_sets    = _geo.numSets ? _geo.numSets : 1;
	const Addr     block       = (offset_bits >= 64) ? 0 : (_addr >> offset_bits);

	CacheCoord coord;
	coord.offset   = _addr & AddressCodec::lowMask(offset_bits);
	coord.setIndex = block % num_sets;
	coord.tag      = block / num_sets;

	return coord;
}

Addr AddressCodec::encodeCache(const CacheGeometry& _geo, const CacheCoord& _coord) {
	const uint32_t offset_bits = AddressCodec::bitsNeeded(_geo.blockSizeBytes);
	const uint64_t num_sets    = _geo.numSets ? _geo.numSets : 1;
	const Addr     block       = _coord.tag * num_sets + (_coord.setIndex % num_sets);

	Addr addr = (offset_bits >= 64) ? 0 : (block << offset_bits);
	addr |= _coord.offset & AddressCodec::lowMask(offset_bits);
	return addr;
}

uint32_t AddressCodec::bitsNeeded(uint64_t _n) {
	uint32_t bits = 0;
	while (bits < 64 && (1ULL << bits) < _n) { ++bits; }
	return bits;
}

}  // namespace hiersim
