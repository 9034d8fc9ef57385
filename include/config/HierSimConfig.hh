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
 * @file HierSimConfig.hh
 * @brief The "DRAM", "Cache" and "AddressMap" config groups
 *
 * ```json
 * {
 *   "DRAM": {
 *     "channels": 1, "ranks_per_channel": 1, "banks_per_rank": 8, "rows_per_bank": 256, "cols_per_row": 512,
 *     "timing": { "type": "DramTiming", "params": { "casLatency": 12, "rowPrechargeTime": 12 } },
 *     "pacing_ns_per_cycle": 500
 *   },
 *   "Cache": {
 *     "enabled": true, "cache_size_bytes": 1024, "block_size_bytes": 16, "associativity": 2,
 *     "replacement_policy": "LRU", "write_policy": "WriteBack"
 *   },
 *   "AddressMap": {
 *     "regions": { "address_map": [ { "name": "rom", "start": "0x0", "size": "0x1000", "perms": "RX" } ] }
 *   }
 * }
 * ```
 */

#pragma once

#include <map>
#include <string>

#include "cache/CacheTypes.hh"
#include "config/SimConfig.hh"
#include "mem/AddressCodec.hh"
#include "mem/MemoryController.hh"
#include "utils/TypeDef.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace hiersim {

NLOHMANN_JSON_SERIALIZE_ENUM(ReplacementPolicy, {
                                                    {ReplacementPolicy::LRU, "LRU"},
                                                    {ReplacementPolicy::FIFO, "FIFO"},
                                                })

NLOHMANN_JSON_SERIALIZE_ENUM(WritePolicy, {
                                              {WritePolicy::WriteBack, "WriteBack"},
                                              {WritePolicy::WriteThrough, "WriteThrough"},
                                          })

// Name -> value, for the command line and for validating JSON strings.
extern std::map<std::string, ReplacementPolicy> ReplacementPolicyMap;
extern std::map<std::string, WritePolicy>       WritePolicyMap;

// Value -> printable name.
extern std::map<ReplacementPolicy, std::string> ReplacementPolicyReMap;
extern std::map<WritePolicy, std::string>       WritePolicyReMap;

SPECIALIZE_PARAMETER(DramTiming, Tick, MAKE_MEMBER_PAIR(DramTiming, casLatency),
                     MAKE_MEMBER_PAIR(DramTiming, rasToCasDelay), MAKE_MEMBER_PAIR(DramTiming, rowPrechargeTime),
                     MAKE_MEMBER_PAIR(DramTiming, rowActiveTime), MAKE_MEMBER_PAIR(DramTiming, refreshCycleTime),
                     MAKE_MEMBER_PAIR(DramTiming, burstLength))

/// @brief Fields missing from `j` keep the value already in `t`.
void from_json(const nlohmann::json& j, DramTiming& t);

void to_json(nlohmann::json& j, const DramTiming& t);

class DramConfig : public SimConfig {
public:
	DramConfig(const std::string& _name = "DRAM");

	virtual ~DramConfig() = default;

	/// @brief Throws InvalidConfiguration when a dimension is zero or does not fit 32 bits.
	DramGeometry getGeometry() const;

	DramTiming getTiming() const { return this->getParameter<DramTiming>("timing"); }

	uint64_t getPacingNsPerCycle() const { return this->getParameter<uint64_t>("pacing_ns_per_cycle"); }

protected:
	void parseParametersUserDefined(const std::string& _param_name, const nlohmann::json& _param_value) override;
};

class CacheConfig : public SimConfig {
public:
	CacheConfig(const std::string& _name = "Cache");

	virtual ~CacheConfig() = default;

	bool isEnabled() const { return this->getParameter<bool>("enabled"); }

	/// @brief The parameters are validated by CacheEngine, not here.
	CacheParams getCacheParams() const;

protected:
	void parseParametersUserDefined(const std::string& _param_name, const nlohmann::json& _param_value) override;
};

class AddressMapConfig : public SimConfig {
public:
	AddressMapConfig(const std::string& _name = "AddressMap");

	virtual ~AddressMapConfig() = default;

	/// @brief Null when no regions were configured.
	nlohmann::json getRegions() const { return this->getParameter<nlohmann::json>("regions"); }

protected:
	void parseParametersUserDefined(const std::string& _param_name, const nlohmann::json& _param_value) override;
};

}  // namespace hiersim
