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

#include "config/SimConfigManager.hh"

#include <filesystem>
#include <fstream>
#include <unordered_set>

#include "mem/MemoryError.hh"

namespace hiersim {

void SimConfigManager::addConfig(const std::string& _name, SimConfig* _config) {
	CLASS_ASSERT_MSG(!this->configs.contains(_name), "SimConfig '" + _name + "' is already registered.");
	VERBOSE_CLASS_INFO << "Adding SimConfig: " << _name;
	this->configs.emplace(_name, _config);
}

void SimConfigManager::parseConfigFiles(const std::vector<std::string>& _configFilePaths) {
	std::unordered_set<std::string> processed_keys;

	for (const auto& path : _configFilePaths) {
		if (!std::filesystem::exists(path)) { throw InvalidConfiguration("config file " + path + " does not exist"); }

		std::ifstream f(path);
		if (!f.is_open()) { throw InvalidConfiguration("cannot open config file " + path); }

		nlohmann::json j;
		try {
			j = nlohmann::json::parse(f);
		} catch (const nlohmann::json::parse_error& e) {
			throw InvalidConfiguration("JSON parsing error in " + path + ": " + e.what());
		}
		if (!j.is_object()) { throw InvalidConfiguration("config file " + path + " must hold a JSON object"); }

		for (const auto& [key, params] : j.items()) {
			if (!processed_keys.insert(key).second) {
				throw InvalidConfiguration("config group '" + key + "' is given twice (again in " + path + ")");
			}
		}

		LABELED_INFO(this->name) << "Loading config file " << path;
		this->parseConfig(j, path);
	}
}

void SimConfigManager::parseConfig(const nlohmann::json& _config, const std::string& _source) {
	for (const auto& [key, params] : _config.items()) {
		if (auto iter = this->configs.find(key); iter != this->configs.end()) {
			iter->second->parseParameters(params);
		} else {
			LABELED_WARNING(this->name) << "Unrecognized configuration key '" << key << "' found in " << _source
			                            << ". It is not a registered config group and is ignored.";
		}
	}
}

SimConfig* SimConfigManager::getConfig(const std::string& _configName) const {
	auto iter = this->configs.find(_configName);
	CLASS_ASSERT_MSG(iter != this->configs.end(), "The config '" + _configName + "' does not exist.");
	return iter->second;
}

}  // namespace hiersim
