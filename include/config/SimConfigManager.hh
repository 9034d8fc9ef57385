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
 * @file SimConfigManager.hh
 * @brief Registry of SimConfig groups keyed by their top-level JSON name
 *
 * ```
 * SimConfigManager
 *   ├─ SimConfig "DRAM"        channels, ranks_per_channel, ..., timing
 *   ├─ SimConfig "Cache"       enabled, cache_size_bytes, ..., write_policy
 *   └─ SimConfig "AddressMap"  regions
 * ```
 *
 * A config file is one JSON object whose keys name registered groups:
 *
 * ```json
 * {
 *   "DRAM":  { "banks_per_rank": 4, "timing": { "type": "DramTiming", "params": { "casLatency": 11 } } },
 *   "Cache": { "associativity": 4, "replacement_policy": "FIFO" }
 * }
 * ```
 *
 * Several files may be given. A group may appear in only one of them.
 */

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "config/SimConfig.hh"
#include "utils/HashableType.hh"
#include "utils/Logging.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace hiersim {

class SimConfigManager : virtual public HashableType {
public:
	SimConfigManager(const std::string& _name) : name(_name) {}

	virtual ~SimConfigManager() {
		for (auto& it : configs) {
			VERBOSE_CLASS_INFO << "Deleting SimConfig object : " << it.first;
			delete it.second;
		}
	}

	template <typename T>
	T getParameter(const std::string& _configName, const std::string& _paramName) const {
		return this->getConfig(_configName)->getParameter<T>(_paramName);
	}

	template <typename T_Struct, typename T_Member>
	T_Member getParameterMemberData(const std::string& _configName, const std::string& _paramName,
	                                const std::string& _memberData) const {
		return this->getConfig(_configName)->getParameterMemberData<T_Struct, T_Member>(_paramName, _memberData);
	}

	SimConfig* getConfig(const std::string& _configName) const;

	bool hasConfig(const std::string& _configName) const { return this->configs.contains(_configName); }

	/**
	 * @brief Loads every file in order. Throws InvalidConfiguration when a file is missing, is not
	 *        valid JSON, or repeats a group already given by an earlier file.
	 */
	void parseConfigFiles(const std::vector<std::string>& _configFilePaths);

	/// @brief Applies one already-parsed config document. Unknown groups are warned about and skipped.
	void parseConfig(const nlohmann::json& _config, const std::string& _source = "<json>");

protected:
	/// @brief Subclasses create their SimConfig groups here.
	virtual void registerConfigs() {}

	/// @brief Takes ownership of `_config`.
	void addConfig(const std::string& _name, SimConfig* _config);

	template <typename T, typename TStruct = void>
	void updateParameter(const std::string& _configName, const std::string& _paramName, const std::string& _member_name,
	                     const T& _value) {
		if constexpr (std::is_same_v<TStruct, void>) {
			this->getConfig(_configName)->setParameter<T>(_paramName, _value);
		} else {
			this->getConfig(_configName)->setParameterMemberData<TStruct, T>(_paramName, _member_name, _value);
		}
	}

private:
	std::unordered_map<std::string, SimConfig*> configs;

	const std::string name;
};

}  // end of namespace hiersim
