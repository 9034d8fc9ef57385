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

namespace hiersim {

enum class ReplacementPolicy { LRU, FIFO };

enum class WritePolicy { WriteBack, WriteThrough };

/**
 * @brief Geometry and policies of a CacheEngine.
 *
 * numLines = cacheSizeBytes / blockSizeBytes, numSets = numLines / associativity.
 */
struct CacheParams {
	uint64_t          cacheSizeBytes    = 1024;
	uint64_t          blockSizeBytes    = 16;
	uint64_t          associativity     = 2;
	ReplacementPolicy replacementPolicy = ReplacementPolicy::LRU;
	WritePolicy       writePolicy       = WritePolicy::WriteBack;

	/// @brief Throws InvalidConfiguration unless every size is positive, the cache size is a multiple of
	///        the block size and 1 <= associativity <= numLines.
	void validate() const;

	uint64_t getNumLines() const { return cacheSizeBytes / blockSizeBytes; }

	uint64_t getNumSets() const { return this->getNumLines() / associativity; }
};

struct CacheCounters {
	uint64_t reads              = 0;
	uint64_t writes             = 0;
	uint64_t hits               = 0;
	uint64_t misses             = 0;
	uint64_t backingStoreWrites = 0;

	uint64_t getAccesses() const { return reads + writes; }

	double getHitRate() const { return this->getAccesses() ? (double)hits / (double)this->getAccesses() : 0.0; }

	double getMissRate() const { return this->getAccesses() ? (double)misses / (double)this->getAccesses() : 0.0; }

	bool operator==(const CacheCounters&) const = default;
};

struct CacheLineSnapshot {
	bool     valid = false;
	uint64_t tag   = 0;
	bool     dirty = false;
};

}  // namespace hiersim
