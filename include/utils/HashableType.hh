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

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <typeinfo>

namespace hiersim {

/**
 * @class HashableType
 * @brief Exposes the readable type name and the type hash of the most derived object.
 *
 * The type name is used as the label of the CLASS_* logging macros, so components only need to
 * inherit from this class to get labeled log lines.
 */
class HashableType {
public:
	HashableType()          = default;
	virtual ~HashableType() = default;

	/**
	 * @brief Demangled name of the most derived type (e.g. `hiersim::CacheEngine`).
	 */
	virtual const std::string getTypeName() const {
		const char* mangled = typeid(*this).name();
		int         status  = 0;

		std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(mangled, nullptr, nullptr, &status),
		                                                 std::free);
		return (status == 0 && demangled) ? std::string(demangled.get()) : std::string(mangled);
	}

	virtual size_t getTypeHash() const { return typeid(*this).hash_code(); }
};

}  // namespace hiersim
