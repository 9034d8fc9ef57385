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

#include "config/HierSimConfig.hh"

#include <limits>

#include "mem/MemoryError.hh"

namespace hiersim {

std::map<std::string, ReplacementPolicy> ReplacementPolicyMap = {{"LRU", ReplacementPolicy::LRU},
                                                                 {"FIFO", ReplacementPolicy::FIFO}};

std::map<std::string, WritePolicy> WritePolicyMap = {{"WriteBack", WritePolicy::WriteBack},
                                                     {"WriteThrough", WritePolicy::WriteThrough}};

std::map<ReplacementPolicy, std::string> ReplacementPolicyReMap = {{ReplacementPolicy::LRU, "LRU"},
                                                                   {ReplacementPolicy::FIFO, "FIFO"}};

std::map<WritePolicy, std::string> WritePolicyReMap = {{WritePolicy::WriteBack, "WriteBack"},
                                                       {WritePolicy::WriteThrough, "WriteThrough"}};

namespace {

// Accepts both {"type": <expected>, "params": <value>} and the bare value.
const nlohmann::json& unwrapUserDefined(const std::string& _param_name, const nlohmann::json& _param_value,
                                        const std::string& _expectedType) {
	if (!_param_value.is_object() || !_param_value.contains("type")) { return _param_value; }

	std::string data_type;
	_param_value.at("type").get_to(data_type);
	if (data_type != _expectedType) {
		throw InvalidConfiguration("'" + _param_name + "' expects type " + _expectedType + ", got " + data_type);
	}
	if (!_param_value.contains("params")) {
		throw InvalidConfiguration("'" + _param_name + "' of type " + data_type + " has no \"params\"");
	}
	return _param_value.at("params");
}

template <typename TEnum>
TEnum parseEnum(const std::string& _param_name, const nlohmann::json& _value,
                const std::map<std::string, TEnum>& _names) {
	if (!_value.is_string() || !_names.contains(_value.get<std::string>())) {
		std::string allowed;
		for (const auto& [name, value] : _names) { allowed += (allowed.empty() ? "" : ", ") + name; }
		throw InvalidConfiguration("'" + _param_name + "' must be one of " + allowed + ", got " + _value.dump());
	}
	return _value.get<TEnum>();
}

uint32_t narrowDimension(const std::string& _param_name, uint64_t _value) {
	if (_value > std::numeric_limits<uint32_t>::max()) {
		throw InvalidConfiguration("'" + _param_name + "' = " + std::to_string(_value) + " is too large");
	}
	return static_cast<uint32_t>(_value);
}

}  // namespace

void from_json(const nlohmann::json& j, DramTiming& t) {
	auto read = [&j](const char* _key, Tick& _field) {
		if (!j.contains(_key)) { return; }
		if (!j.at(_key).is_number_unsigned()) {
			throw InvalidConfiguration(std::string("DramTiming.") + _key + " must be a non-negative integer");
		}
		j.at(_key).get_to(_field);
	};

	read("casLatency", t.casLatency);
	read("rasToCasDelay", t.rasToCasDelay);
	read("rowPrechargeTime", t.rowPrechargeTime);
	read("rowActiveTime", t.rowActiveTime);
	read("refreshCycleTime", t.refreshCycleTime);
	read("burstLength", t.burstLength);
}

void to_json(nlohmann::json& j, const DramTiming& t) {
	j = nlohmann::json{{"casLatency", t.casLatency},           {"rasToCasDelay", t.rasToCasDelay},
	                   {"rowPrechargeTime", t.rowPrechargeTime}, {"rowActiveTime", t.rowActiveTime},
	                   {"refreshCycleTime", t.refreshCycleTime}, {"burstLength", t.burstLength}};
}

/**********************************
 *                                *
 *           DramConfig           *
 *                                *
 **********************************/

DramConfig::DramConfig(const std::string& _name) : SimConfig(_name) {
	const DramGeometry geometry;

	this->addParameter<uint64_t>("channels", geometry.channels, ParamType::UINT);
	this->addParameter<uint64_t>("ranks_per_channel", geometry.ranksPerChannel, ParamType::UINT);
	this->addParameter<uint64_t>("banks_per_rank", geometry.banksPerRank, ParamType::UINT);
	this->addParameter<uint64_t>("rows_per_bank", geometry.rowsPerBank, ParamType::UINT);
	this->addParameter<uint64_t>("cols_per_row", geometry.colsPerRow, ParamType::UINT);
	this->addParameter<DramTiming>("timing", DramTiming(), ParamType::USER_DEFINED);
	this->addParameter<uint64_t>("pacing_ns_per_cycle", MemoryController::kDefaultPacingNsPerCycle, ParamType::UINT);
}

DramGeometry DramConfig::getGeometry() const {
	DramGeometry geometry;
	geometry.channels        = narrowDimension("channels", this->getParameter<uint64_t>("channels"));
	geometry.ranksPerChannel = narrowDimension("ranks_per_channel", this->getParameter<uint64_t>("ranks_per_channel"));
	geometry.banksPerRank    = narrowDimension("banks_per_rank", this->getParameter<uint64_t>("banks_per_rank"));
	geometry.rowsPerBank     = narrowDimension("rows_per_bank", this->getParameter<uint64_t>("rows_per_bank"));
	geometry.colsPerRow      = narrowDimension("cols_per_row", this->getParameter<uint64_t>("cols_per_row"));
	geometry.validate();
	return geometry;
}

void DramConfig::parseParametersUserDefined(const std::string& _param_name, const nlohmann::json& _param_value) {
	if (_param_name == "timing") {
		// Start from the current timing so a config file may override single fields.
		auto timing = this->getTiming();
		from_json(unwrapUserDefined(_param_name, _param_value, "DramTiming"), timing);
		this->setParameter<DramTiming>(_param_name, timing);
	} else {
		CLASS_WARNING << "Undefined USER_DEFINED parameter '" << _param_name << "' in " << this->getName();
	}
}

/**********************************
 *                                *
 *          CacheConfig           *
 *                                *
 **********************************/

CacheConfig::CacheConfig(const std::string& _name) : SimConfig(_name) {
	const CacheParams params;

	this->addParameter<bool>("enabled", true, ParamType::BOOL);
	this->addParameter<uint64_t>("cache_size_bytes", params.cacheSizeBytes, ParamType::UINT);
	this->addParameter<uint64_t>("block_size_bytes", params.blockSizeBytes, ParamType::UINT);
	this->addParameter<uint64_t>("associativity", params.associativity, ParamType::UINT);
	this->addParameter<ReplacementPolicy>("replacement_policy", params.replacementPolicy, ParamType::USER_DEFINED);
	this->addParameter<WritePolicy>("write_policy", params.writePolicy, ParamType::USER_DEFINED);
}

CacheParams CacheConfig::getCacheParams() const {
	CacheParams params;
	params.cacheSizeBytes    = this->getParameter<uint64_t>("cache_size_bytes");
	params.blockSizeBytes    = this->getParameter<uint64_t>("block_size_bytes");
	params.associativity     = this->getParameter<uint64_t>("associativity");
	params.replacementPolicy = this->getParameter<ReplacementPolicy>("replacement_policy");
	params.writePolicy       = this->getParameter<WritePolicy>("write_policy");
	return params;
}

void CacheConfig::parseParametersUserDefined(const std::string& _param_name, const nlohmann::json& _param_value) {
	if (_param_name == "replacement_policy") {
		const auto& value = unwrapUserDefined(_param_name, _param_value, "ReplacementPolicy");
		this->setParameter<ReplacementPolicy>(_param_name, parseEnum(_param_name, value, ReplacementPolicyMap));
	} else if (_param_name == "write_policy") {
		const auto& value = unwrapUserDefined(_param_name, _param_value, "WritePolicy");
		this->setParameter<WritePolicy>(_param_name, parseEnum(_param_name, value, WritePolicyMap));
	} else {
		CLASS_WARNING << "Undefined USER_DEFINED parameter '" << _param_name << "' in " << this->getName();
	}
}

/**********************************
 *                                *
 *        AddressMapConfig        *
 *                                *
 **********************************/

AddressMapConfig::AddressMapConfig(const std::string& _name) : SimConfig(_name) {
	this->addParameter<nlohmann::json>("regions", nlohmann::json(), ParamType::USER_DEFINED);
}

void AddressMapConfig::parseParametersUserDefined(const std::string& _param_name,
                                                  const nlohmann::json& _param_value) {
	if (_param_name == "regions") {
		const bool wellFormed = _param_value.is_array() ||
		                        (_param_value.is_object() && _param_value.contains("address_map") &&
		                         _param_value.at("address_map").is_array());
		if (!wellFormed) {
			throw InvalidConfiguration("'regions' must be an array or an object with an \"address_map\" array");
		}
		this->setParameter<nlohmann::json>(_param_name, _param_value);
	} else {
		CLASS_WARNING << "Undefined USER_DEFINED parameter '" << _param_name << "' in " << this->getName();
	}
}

}  // namespace hiersim
