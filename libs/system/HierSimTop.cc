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

#include "system/HierSimTop.hh"

#include <exception>
#include <iostream>
#include <sstream>
#include <syncstream>

#include "config/HierSimConfig.hh"
#include "utils/Logging.hh"

namespace hiersim {

std::shared_ptr<HierSimTop> top = nullptr;

HierSimTop::HierSimTop(const std::vector<std::string>& _configFilePaths)
    : CLIManager("HierSim - a DRAM, bus and cache hierarchy simulator", _configFilePaths) {
	std::stringstream ss;
	ss << "	 _   _ _           ____  _           " << std::endl;
	ss << "	| | | (_) ___ _ __/ ___|(_)_ __ ___  " << std::endl;
	ss << "	| |_| | |/ _ \\ '__\\___ \\| | '_ ` _ \\ " << std::endl;
	ss << "	|  _  | |  __/ |   ___) | | | | | | |" << std::endl;
	ss << "	|_| |_|_|\\___|_|  |____/|_|_| |_| |_|" << std::endl << std::endl;

	std::osyncstream(std::cout) << ss.str();

	std::set_terminate(&LogOStream::handleTerminate);
}

HierSimTop::~HierSimTop() {
	if (this->regionTable) { this->regionTable->detachCache(); }
}

void HierSimTop::registerConfigs() {
	this->addConfig("DRAM", new DramConfig("DRAM"));
	this->addConfig("Cache", new CacheConfig("Cache"));
	this->addConfig("AddressMap", new AddressMapConfig("AddressMap"));
}

void HierSimTop::registerCLIArguments() {
	this->registerHierSimCLIArguments();

	this->addCLIOption<uint64_t>("--channels", "Number of DRAM channels", "DRAM", "channels");
	this->addCLIOption<uint64_t>("--ranks", "Ranks per channel", "DRAM", "ranks_per_channel");
	this->addCLIOption<uint64_t>("--banks", "Banks per rank", "DRAM", "banks_per_rank");
	this->addCLIOption<uint64_t>("--rows", "Rows per bank", "DRAM", "rows_per_bank");
	this->addCLIOption<uint64_t>("--cols", "Columns (bytes) per row", "DRAM", "cols_per_row");
	this->addCLIOption<uint64_t>("--pacing_ns", "Wall-clock nanoseconds per cycle for asynchronous accesses", "DRAM",
	                             "pacing_ns_per_cycle");

	this->addCLIOption<Tick, DramTiming>("--tCL", "CAS latency in cycles", "DRAM", "timing", "casLatency");
	this->addCLIOption<Tick, DramTiming>("--tRCD", "RAS-to-CAS delay in cycles", "DRAM", "timing", "rasToCasDelay");
	this->addCLIOption<Tick, DramTiming>("--tRP", "Row precharge time in cycles", "DRAM", "timing",
	                                     "rowPrechargeTime");
	this->addCLIOption<Tick, DramTiming>("--tRFC", "Refresh cycle time in cycles", "DRAM", "timing",
	                                     "refreshCycleTime");
	this->addCLIOption<Tick, DramTiming>("--burst", "Burst length in cycles", "DRAM", "timing", "burstLength");

	this->addCLIOption<bool>("--cache", "Enable the cache in front of the bus", "Cache", "enabled");
	this->addCLIOption<uint64_t>("--cache_size", "Cache capacity in bytes", "Cache", "cache_size_bytes");
	this->addCLIOption<uint64_t>("--block_size", "Cache block size in bytes", "Cache", "block_size_bytes");
	this->addCLIOption<uint64_t>("--assoc", "Cache associativity", "Cache", "associativity");
	this->addCLIOption<ReplacementPolicy>("--replacement", "Replacement policy (LRU, FIFO)", "Cache",
	                                      "replacement_policy", "", false)
	    ->transform(CLI::CheckedTransformer(ReplacementPolicyMap, CLI::ignore_case));
	this->addCLIOption<WritePolicy>("--write_policy", "Write policy (WriteBack, WriteThrough)", "Cache",
	                                "write_policy", "", false)
	    ->transform(CLI::CheckedTransformer(WritePolicyMap, CLI::ignore_case));
}

void HierSimTop::init(int argc, char** argv) {
	this->registerConfigs();
	this->registerCLIArguments();
	this->parseCLIArguments(argc, argv);

	auto paths = this->configFilePaths;
	paths.insert(paths.end(), this->configFilePathsFromCLI.begin(), this->configFilePathsFromCLI.end());
	this->parseConfigFiles(paths);

	this->setCLIParametersToSimConfig();

	this->buildMemorySystem();
	this->registerDevices();
}

void HierSimTop::buildMemorySystem() {
	auto dram = dynamic_cast<DramConfig*>(this->getConfig("DRAM"));
	auto cfg  = dynamic_cast<CacheConfig*>(this->getConfig("Cache"));
	auto map  = dynamic_cast<AddressMapConfig*>(this->getConfig("AddressMap"));
	CLASS_ASSERT_MSG(dram && cfg && map, "HierSim config groups are missing.");

	this->controller =
	    std::make_unique<MemoryController>(dram->getGeometry(), dram->getTiming(), dram->getPacingNsPerCycle());
	this->controller->getObservers().attach(this->statistics);
	CLASS_INFO << "DRAM: " << this->controller->getTopologyInfo();

	this->regionTable = std::make_unique<RegionTable>(*this->controller);
	if (auto regions = map->getRegions(); !regions.is_null()) {
		this->regionTable->registerRegions(regions);
	} else {
		this->regionTable->mapRegion(0, this->controller->getPhysicalSize(),
		                             MemProt::Read | MemProt::Write | MemProt::Exec, "dram");
	}
	for (const auto& line : this->regionTable->getRegionsInfo()) { CLASS_INFO << "Region " << line; }

	if (cfg->isEnabled()) {
		this->cache = std::make_unique<CacheEngine>(cfg->getCacheParams());
		this->cache->attachBackingStore(*this->controller);
		this->cache->getObservers().attach(this->statistics);
		this->regionTable->attachCache(*this->cache);
		CLASS_INFO << "Cache: " << this->cache->getTopologyInfo();
	} else {
		CLASS_INFO << "Cache: disabled";
	}
}

MemoryController& HierSimTop::getController() {
	CLASS_ASSERT_MSG(this->controller, "HierSimTop::init() has not been called.");
	return *this->controller;
}

RegionTable& HierSimTop::getRegionTable() {
	CLASS_ASSERT_MSG(this->regionTable, "HierSimTop::init() has not been called.");
	return *this->regionTable;
}

void HierSimTop::finish() {
	if (!this->isInitialized()) {
		CLASS_WARNING << "finish() called before init()";
		return;
	}

	CLASS_STATISTICS << "Total cycles : " << this->controller->getCurrentCycle();
	this->statistics.report();

	if (this->cache) {
		const auto counters = this->cache->getCounters();
		CLASS_STATISTICS << "Cache hit rate  : " << counters.getHitRate();
		CLASS_STATISTICS << "Cache miss rate : " << counters.getMissRate();
	}
}

}  // namespace hiersim
