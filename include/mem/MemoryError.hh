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
 * @file MemoryError.hh
 * @brief Exceptions raised by the memory hierarchy
 *
 * Every failure of the memory core is raised before any state is touched and is never logged
 * or retried by the core itself. Callers tell the kinds apart by type:
 *
 * | Exception            | Raised when                                                        |
 * |----------------------|--------------------------------------------------------------------|
 * | InvalidConfiguration | geometry/cache parameters or a region definition are not usable    |
 * | OutOfBounds          | an access leaves the physical space or the row of its bank         |
 * | RegionViolation      | an address is unmapped or its region lacks the needed permission   |
 * | OverlapError         | a region or MMIO range collides with one already registered        |
 * | AccessCancelled      | an asynchronous access was cancelled while it was being paced      |
 */

#pragma once

#include <stdexcept>
#include <string>

namespace hiersim {

class MemoryError : public std::runtime_error {
public:
	explicit MemoryError(const std::string& _what) : std::runtime_error(_what) {}
};

class InvalidConfiguration : public MemoryError {
public:
	explicit InvalidConfiguration(const std::string& _what) : MemoryError("InvalidConfiguration: " + _what) {}
};

class OutOfBounds : public MemoryError {
public:
	explicit OutOfBounds(const std::string& _what) : MemoryError("OutOfBounds: " + _what) {}
};

class RegionViolation : public MemoryError {
public:
	explicit RegionViolation(const std::string& _what) : MemoryError("RegionViolation: " + _what) {}
};

class OverlapError : public MemoryError {
public:
	explicit OverlapError(const std::string& _what) : MemoryError("OverlapError: " + _what) {}
};

/**
 * @brief Delivered through the future of a cancelled asynchronous access.
 * @note The memory effect of the access has already been committed when this is raised.
 */
class AccessCancelled : public MemoryError {
public:
	explicit AccessCancelled(const std::string& _what) : MemoryError("AccessCancelled: " + _what) {}
};

}  // namespace hiersim
