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
 * @file AddressCodec.hh
 * @brief Stateless physical address decomposition for the DRAM controller and the cache
 *
 * **DRAM layout** (column varies fastest):
 * ```
 * addr = ((((channel * R + rank) * B + bank) * Rows + row) * Cols + col)
 * ```
 *
 * **Cache layout**:
 * ```
 * block    = addr >> log2(blockSize)
 * setIndex = block % numSets
 * tag      = block / numSets
 * ```
 * With a power-of-two set count this is the usual `| tag | setIndex | offset |` bit split. With
 * any other set count every block still gets its own (setIndex, tag) pair, so encodeCache()
 * rebuilds the address of exactly that block. A single set makes the whole block number the tag.
 */

#pragma once

#include <cstdint>

#include "utils/TypeDef.hh"

namespace hiersim {

struct DramGeometry {
	uint32_t channels        = 1;
	uint32_t ranksPerChannel = 1;
	uint32_t banksPerRank    = 8;
	uint32_t rowsPerBank     = 256;
	uint32_t colsPerRow      = 512;

	/// @brief Throws InvalidConfiguration when any dimension is zero.
	void validate() const;

	uint64_t getNumBanks() const { return (uint64_t)channels * ranksPerChannel * banksPerRank; }

	uint64_t getPhysicalSize() const { return this->getNumBanks() * rowsPerBank * colsPerRow; }
};

struct DramCoord {
	uint32_t channel = 0;
	uint32_t rank    = 0;
	uint32_t bank    = 0;
	uint32_t row     = 0;
	uint32_t col     = 0;

	bool operator==(const DramCoord&) const = default;
};

struct CacheGeometry {
	uint64_t blockSizeBytes = 16;
	uint64_t numSets        = 1;
};

struct CacheCoord {
	uint64_t tag      = 0;
	uint64_t setIndex = 0;
	uint64_t offset   = 0;

	bool operator==(const CacheCoord&) const = default;
};

class AddressCodec {
public:
	AddressCodec() = delete;

	static DramCoord decodeDram(const DramGeometry& _geo, Addr _addr);

	/// @brief Inverse of decodeDram(). Throws OutOfBounds when a field exceeds its dimension.
	static Addr encodeDram(const DramGeometry& _geo, const DramCoord& _coord);

	static CacheCoord decodeCache(const CacheGeometry& _geo, Addr _addr);

	static Addr encodeCache(const CacheGeometry& _geo, const CacheCoord& _coord);

	/// @brief Smallest bit width able to index @p _n distinct values (0 for _n <= 1).
	static uint32_t bitsNeeded(uint64_t _n);

	static uint64_t lowMask(uint32_t _bits) { return (_bits >= 64) ? ~0ULL : ((1ULL << _bits) - 1); }
};

}  // namespace hiersim
