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
 * @file TestHierSimConfig.cc
 * @brief Unit tests of the configuration layer and of HierSimTop assembly
 *
 * ## SimConfigTest Suite
 * - DRAM geometry and partial `timing` overrides, bare and `{"type","params"}` forms
 * - Refusal of negative, mistyped and unknown values
 * - INT/FLOAT/STRING/TICK scalar parameters of a custom config group
 * - Cache policy enums and AddressMap region shapes
 *
 * ## HierSimTopTest Suite
 * Drives `init()` with temporary JSON files and argv vectors:
 * - defaults build one RWX `dram` region and the 1 KiB cache
 * - command line > config files > defaults
 * - a disabled cache and a configured address map
 * - duplicate groups, missing files and malformed JSON are InvalidConfiguration
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// Third-Party Library
#include <nlohmann/json.hpp>

#include "config/HierSimConfig.hh"
#include "mem/MemoryError.hh"
#include "system/HierSimTop.hh"

using namespace hiersim;
using json = nlohmann::json;

namespace {

/// Owns the strings behind a mutable argv.
class Argv {
public:
	Argv(std::initializer_list<std::string> _args = {}) : args(_args) {
		this->args.insert(this->args.begin(), "hiersim");
		for (auto& arg : this->args) { this->ptrs.push_back(arg.data()); }
	}

	int    argc() { return (int)this->ptrs.size(); }
	char** argv() { return this->ptrs.data(); }

private:
	std::vector<std::string> args;
	std::vector<char*>       ptrs;
};

std::string writeConfigFile(const std::string& _fileName, const json& _content) {
	auto path = std::filesystem::temp_directory_path() / ("hiersim_" + _fileName);
	std::ofstream(path) << _content.dump(2);
	return path.string();
}

class ScalarConfig : public SimConfig {
public:
	ScalarConfig() : SimConfig("Scalar") {
		this->addParameter<int>("offset", -4, ParamType::INT);
		this->addParameter<float>("ratio", 0.5f, ParamType::FLOAT);
		this->addParameter<std::string>("label", "dram", ParamType::STRING);
		this->addParameter<Tick>("deadline", 100, ParamType::TICK);
	}

	void registerTwice() { this->addParameter<int>("offset", 0, ParamType::INT); }
};

}  // namespace

TEST(SimConfigTest, DramDefaultsAndPartialTiming) {
	DramConfig dram;
	EXPECT_EQ(dram.getGeometry().getPhysicalSize(), 1 << 20);
	EXPECT_EQ(dram.getTiming().casLatency, 12);
	EXPECT_EQ(dram.getPacingNsPerCycle(), MemoryController::kDefaultPacingNsPerCycle);

	dram.parseParameters(json{{"banks_per_rank", 4}, {"timing", {{"casLatency", 20}}}});
	EXPECT_EQ(dram.getGeometry().banksPerRank, 4);
	EXPECT_EQ(dram.getTiming().casLatency, 20);
	EXPECT_EQ(dram.getTiming().rowPrechargeTime, 12) << "fields missing from the override keep their value";

	dram.parseParameters(json{{"timing", {{"type", "DramTiming"}, {"params", {{"burstLength", 8}}}}}});
	EXPECT_EQ(dram.getTiming().burstLength, 8);
	EXPECT_EQ(dram.getTiming().casLatency, 20);
	EXPECT_EQ(dram.getParameterMemberData<DramTiming, Tick>("timing", "burstLength"), 8);
}

TEST(SimConfigTest, RejectsBadValues) {
	DramConfig dram;
	EXPECT_THROW(dram.parseParameters(json{{"channels", -1}}), InvalidConfiguration);
	EXPECT_THROW(dram.parseParameters(json{{"channels", "two"}}), InvalidConfiguration);
	EXPECT_THROW(dram.parseParameters(json{{"timing", {{"casLatency", -3}}}}), InvalidConfiguration);
	EXPECT_THROW(dram.parseParameters(json{{"timing", {{"type", "CacheParams"}, {"params", json::object()}}}}),
	             InvalidConfiguration);

	dram.parseParameters(json{{"rows_per_bank", 0}});
	EXPECT_THROW(dram.getGeometry(), InvalidConfiguration) << "zero dimensions are refused when the geometry is built";

	EXPECT_NO_THROW(dram.parseParameters(json{{"not_a_parameter", 1}})) << "unknown keys are only warned about";
}

TEST(SimConfigTest, ScalarParameterTypes) {
	ScalarConfig config;
	EXPECT_EQ(config.getParameter<int>("offset"), -4);
	EXPECT_EQ(config.getParameter<std::string>("label"), "dram");

	config.parseParameters(json{{"offset", -12}, {"ratio", 0.25}, {"label", "rom"}, {"deadline", 4096}});
	EXPECT_EQ(config.getParameter<int>("offset"), -12) << "INT accepts negative values";
	EXPECT_FLOAT_EQ(config.getParameter<float>("ratio"), 0.25f);
	EXPECT_EQ(config.getParameter<std::string>("label"), "rom");
	EXPECT_EQ(config.getParameter<Tick>("deadline"), 4096);

	EXPECT_THROW(config.parseParameters(json{{"deadline", -1}}), InvalidConfiguration);
	EXPECT_THROW(config.parseParameters(json{{"deadline", 2.5}}), InvalidConfiguration);
	EXPECT_THROW(config.parseParameters(json{{"label", 7}}), InvalidConfiguration);
	EXPECT_THROW(config.parseParameters(json{{"offset", "twelve"}}), InvalidConfiguration);
	EXPECT_EQ(config.getParameter<Tick>("deadline"), 4096) << "a refused value leaves the parameter unchanged";

	EXPECT_THROW(config.registerTwice(), std::runtime_error);
}

TEST(SimConfigTest, CachePolicies) {
	CacheConfig cache;
	EXPECT_TRUE(cache.isEnabled());
	EXPECT_EQ(cache.getCacheParams().replacementPolicy, ReplacementPolicy::LRU);
	EXPECT_EQ(cache.getCacheParams().writePolicy, WritePolicy::WriteBack);

	cache.parseParameters(json{{"enabled", false},
	                           {"associativity", 4},
	                           {"replacement_policy", "FIFO"},
	                           {"write_policy", {{"type", "WritePolicy"}, {"params", "WriteThrough"}}}});
	EXPECT_FALSE(cache.isEnabled());
	EXPECT_EQ(cache.getCacheParams().associativity, 4);
	EXPECT_EQ(cache.getCacheParams().replacementPolicy, ReplacementPolicy::FIFO);
	EXPECT_EQ(cache.getCacheParams().writePolicy, WritePolicy::WriteThrough);

	EXPECT_THROW(cache.parseParameters(json{{"replacement_policy", "Random"}}), InvalidConfiguration);
	EXPECT_THROW(cache.parseParameters(json{{"write_policy", 1}}), InvalidConfiguration);
	EXPECT_EQ(ReplacementPolicyReMap.at(ReplacementPolicy::FIFO), "FIFO");
}

TEST(SimConfigTest, AddressMapShapes) {
	AddressMapConfig map;
	EXPECT_TRUE(map.getRegions().is_null());

	const json regions = json::array({{{"name", "ram"}, {"start", "0x0"}, {"size", "0x1000"}}});
	map.parseParameters(json{{"regions", regions}});
	EXPECT_EQ(map.getRegions(), regions);

	map.parseParameters(json{{"regions", {{"address_map", regions}}}});
	EXPECT_TRUE(map.getRegions().contains("address_map"));

	EXPECT_THROW(map.parseParameters(json{{"regions", "ram"}}), InvalidConfiguration);
	EXPECT_THROW(map.parseParameters(json{{"regions", {{"address_map", 3}}}}), InvalidConfiguration);
}

TEST(HierSimTopTest, DefaultsBuildOneRwxRegion) {
	HierSimTop top;
	EXPECT_FALSE(top.isInitialized());
	EXPECT_EQ(top.getCurrentCycle(), 0);

	Argv args;
	top.init(args.argc(), args.argv());

	ASSERT_TRUE(top.isInitialized());
	EXPECT_EQ(top.getController().getPhysicalSize(), 1 << 20);
	ASSERT_NE(top.getCache(), nullptr);
	EXPECT_EQ(top.getCache()->getNumSets(), 32);

	const auto regions = top.getRegionTable().getRegions();
	ASSERT_EQ(regions.size(), 1);
	EXPECT_EQ(regions[0].name, "dram");
	EXPECT_EQ(regions[0].size, 1 << 20);
	EXPECT_EQ(regions[0].perms, MemProt::Read | MemProt::Write | MemProt::Exec);

	top.getRegionTable().writeBytes(0x40, {1, 2});
	EXPECT_EQ(top.getStatistics().getNumWrites(), 1);
	EXPECT_EQ(top.getCache()->getCounters().writes, 2);
	EXPECT_GT(top.getCurrentCycle(), 0);
	top.finish();
}

TEST(HierSimTopTest, CommandLineOverridesConfigFiles) {
	const auto path = writeConfigFile("override.json",
	                                  json{{"Cache", {{"associativity", 4}, {"replacement_policy", "FIFO"}}},
	                                       {"DRAM", {{"timing", {{"casLatency", 30}}}}}});

	HierSimTop top;
	Argv       args({"-c", path, "--assoc", "1", "--tRP", "5"});
	top.init(args.argc(), args.argv());

	const auto params = top.getCache()->getParams();
	EXPECT_EQ(params.associativity, 1) << "the command line wins over the file";
	EXPECT_EQ(params.replacementPolicy, ReplacementPolicy::FIFO) << "the file wins over the defaults";

	const auto timing = top.getController().getTiming();
	EXPECT_EQ(timing.casLatency, 30);
	EXPECT_EQ(timing.rowPrechargeTime, 5);
	EXPECT_EQ(timing.rasToCasDelay, 12);

	std::filesystem::remove(path);
}

TEST(HierSimTopTest, DisabledCacheAndConfiguredRegions) {
	const auto path = writeConfigFile(
	    "regions.json",
	    json{{"Cache", {{"enabled", false}}},
	         {"AddressMap",
	          {{"regions",
	            {{"address_map",
	              json::array({{{"name", "rom"}, {"start", "0x0"}, {"size", "0x1000"}, {"perms", "RX"}},
	                           {{"name", "ram"}, {"start", "0x1000"}, {"size", "0x1000"}}})}}}}}});

	HierSimTop top;
	Argv       args({"--config", path});
	top.init(args.argc(), args.argv());

	EXPECT_EQ(top.getCache(), nullptr);
	EXPECT_EQ(top.getRegionTable().getRegions().size(), 2);
	EXPECT_THROW(top.getRegionTable().writeBytes(0x10, {1}), RegionViolation);
	EXPECT_NO_THROW(top.getRegionTable().writeBytes(0x1010, {1}));

	std::filesystem::remove(path);
}

TEST(HierSimTopTest, BrokenConfigFilesAreRefused) {
	const auto first  = writeConfigFile("first.json", json{{"Cache", {{"associativity", 4}}}});
	const auto second = writeConfigFile("second.json", json{{"Cache", {{"associativity", 8}}}});

	{
		HierSimTop top;
		Argv       args({"-c", first, second});
		EXPECT_THROW(top.init(args.argc(), args.argv()), InvalidConfiguration) << "a group may be given only once";
		EXPECT_FALSE(top.isInitialized());
	}
	{
		HierSimTop top;
		Argv       args({"-c", "/nonexistent/hiersim.json"});
		EXPECT_THROW(top.init(args.argc(), args.argv()), InvalidConfiguration);
	}
	{
		const auto bad = std::filesystem::temp_directory_path() / "hiersim_bad.json";
		std::ofstream(bad) << "{ \"DRAM\": ";
		HierSimTop top;
		Argv       args({"-c", bad.string()});
		EXPECT_THROW(top.init(args.argc(), args.argv()), InvalidConfiguration);
		std::filesystem::remove(bad);
	}

	std::filesystem::remove(first);
	std::filesystem::remove(second);
}
