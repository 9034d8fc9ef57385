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

#include "utils/TypeDef.hh"

namespace hiersim {

/**
 * @brief Lower level that receives dirty-block flushes from a cache.
 */
class BackingStore {
public:
	virtual ~BackingStore() = default;

	/**
	 * @brief Accounts the write of one block back to memory.
	 * @return Cycles spent on the flush. Must not throw.
	 */
	virtual Tick writebackBlock(Addr _addr, uint64_t _len) = 0;
};

}  // namespace hiersim
