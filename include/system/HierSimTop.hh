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
 * @file HierSimTop.hh
 * @brief Builds a complete memory hierarchy from config files and the command line
 *
 * ```cpp
 * int main(int argc, char** argv) {
 *     top = std::make_shared<HierSimTop>();
 *     top->init(argc, argv);
 *     auto result = top->getRegionTable().readBytes(0x40, 4);
 *     top->finish();
 * }
 * ```
 *
 * The components are owned by the top. The StatisticsObserver is attached to the controller and
 * to the cache, so finish() can report the counters of the whole run.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cache/CacheEngine.hh"
#include "config/CLIManager.hh"
#include "mem/MemoryController.hh"
#include "mem/RegionTable.hh"
#include "observer/StatisticsObserver.hh"
#include "utils/TypeDef.hh"

namespace hiersim {

class HierSimTop : public CLIManager {
public:
	HierSimTop(const std::vector<std::string>& _configFilePaths = {});

	virtual ~HierSimTop();

	/**
	 * @brief Resolves the configuration (defaults, then files, then command line) and builds the
	 *        controller, the region table and, when enabled, the cache.
	 * @throws InvalidConfiguration, OutOfBounds or OverlapError for a bad configuration.
	 */
	void init(int argc, char** argv);

	/// @brief Logs topology, regions and every counter.
	void finish();

	bool isInitialized() const { return this->controller != nullptr; }

	/// @brief 0 before init().
	Tick getCurrentCycle() const { return this->controller ? this->controller->getCurrentCycle() : 0; }

	MemoryController& getController();

	RegionTable& getRegionTable();

	/// @brief nullptr when the cache is disabled.
	CacheEngine* getCache() const { return this->cache.get(); }

	StatisticsObserver& getStatistics() { return this->statistics; }

protected:
	void registerConfigs() override;

	void registerCLIArguments() override;

	/// @brief Runs after the memory system is built, e.g. to attach MMIO devices.
	virtual void registerDevices() {}

private:
	void buildMemorySystem();

	// Declaration order is the reverse of the teardown order.
	StatisticsObserver                statistics;
	std::unique_ptr<MemoryController> controller;
	std::unique_ptr<CacheEngine>      cache;
	std::unique_ptr<RegionTable>      regionTable;
};

// The global top-level instance, used by the logger for the cycle prefix.
extern std::shared_ptr<HierSimTop> top;

}  // namespace hiersim
