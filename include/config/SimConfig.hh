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
 * @file SimConfig.hh
 * @brief Typed parameter storage filled from JSON config files and the command line
 *
 * Every configuration group of the simulator ("DRAM", "Cache", "AddressMap") is a SimConfig holding
 * named Parameter<T> objects. Struct-valued parameters expose their members by name through
 * SPECIALIZE_PARAMETER so that single CLI options can override a single field.
 *
 * ```cpp
 * SPECIALIZE_PARAMETER(DramTiming, Tick,
 *     MAKE_MEMBER_PAIR(DramTiming, casLatency),
 *     MAKE_MEMBER_PAIR(DramTiming, rasToCasDelay))
 *
 * config.addParameter<uint64_t>("channels", 1, ParamType::UINT);
 * config.addParameter<DramTiming>("timing", DramTiming{}, ParamType::USER_DEFINED);
 *
 * auto channels = config.getParameter<uint64_t>("channels");
 * auto tCL      = config.getParameterMemberData<DramTiming, Tick>("timing", "casLatency");
 * ```
 *
 * | ParamType    | JSON value                    | C++ type    |
 * |--------------|-------------------------------|-------------|
 * | INT          | number                        | int         |
 * | UINT         | non-negative integer          | uint64_t    |
 * | FLOAT        | number                        | float       |
 * | BOOL         | true / false                  | bool        |
 * | STRING       | string                        | std::string |
 * | TICK         | non-negative integer          | Tick        |
 * | USER_DEFINED | parseParametersUserDefined()  | any         |
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>

#include "utils/HashableType.hh"
#include "utils/Logging.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace hiersim {

class SimConfigManager;

enum class ParamType { INT, UINT, FLOAT, BOOL, STRING, TICK, USER_DEFINED };

class ParameterBase {
public:
	ParameterBase(std::string _name, ParamType _type) : name(_name), type(_type) {}

	virtual ~ParameterBase() = default;

	std::string getName() const { return this->name; }

	ParamType getType() const { return this->type; }

private:
	std::string name;
	ParamType   type;
};

/**
 * @brief A single named value.
 *
 * The member name argument of setValue()/getValue() is ignored unless the struct type has been
 * registered with SPECIALIZE_PARAMETER.
 */
template <typename T>
class Parameter : public ParameterBase {
public:
	Parameter(const std::string& _name, const T& _value, ParamType _type)
	    : ParameterBase(_name, _type), value(_value) {}

	~Parameter() override = default;

	template <typename TParam>
	void setValue(const std::string& _member_name, const TParam& _value) {
		if constexpr (std::is_same_v<TParam, T>) {
			this->value = _value;
		} else {
			throw std::runtime_error("Type mismatch! Expected " + std::string(typeid(T).name()) + " but got " +
			                         std::string(typeid(TParam).name()) + ".");
		}
	}

	template <typename TParam>
	TParam getValue(const std::string& _member_name) const {
		if constexpr (std::is_same_v<T, TParam>) {
			return this->value;
		} else {
			throw std::runtime_error("Type mismatch! Expected " + std::string(typeid(T).name()) + " but got " +
			                         std::string(typeid(TParam).name()) + ".");
		}
	}

private:
	T value;
};

#define FLATTEN(...) __VA_ARGS__

/**
 * @brief Gives Parameter<StructType> by-name access to every member of type `Type`.
 *
 * Must be expanded at namespace scope inside `hiersim`, once per (struct, member type) pair.
 */
#define SPECIALIZE_PARAMETER(ParamterStructType, Type, ...)                                                           \
	template <>                                                                                                       \
	template <>                                                                                                       \
	inline Type Parameter<ParamterStructType>::getValue<Type>(const std::string& member_name) const {                 \
		static const std::unordered_map<std::string, Type ParamterStructType::*> member_map = {FLATTEN(__VA_ARGS__)}; \
		auto                                                                     it = member_map.find(member_name);   \
		if (it != member_map.end()) {                                                                                 \
			return this->value.*(it->second);                                                                         \
		} else {                                                                                                      \
			throw std::runtime_error("Member not found: " + member_name);                                             \
		}                                                                                                             \
	}                                                                                                                 \
	template <>                                                                                                       \
	template <>                                                                                                       \
	inline void Parameter<ParamterStructType>::setValue<Type>(const std::string& member_name, const Type& value) {    \
		static const std::unordered_map<std::string, Type ParamterStructType::*> member_map = {FLATTEN(__VA_ARGS__)}; \
		auto                                                                     it = member_map.find(member_name);   \
		if (it != member_map.end()) {                                                                                 \
			this->value.*(it->second) = value;                                                                        \
		} else {                                                                                                      \
			throw std::runtime_error("Member not found: " + member_name);                                             \
		}                                                                                                             \
	}

#define MAKE_MEMBER_PAIR(ParamterStructType, Member) \
	{ #Member, &ParamterStructType::Member }

class SimConfig : virtual public HashableType {
	friend class SimConfigManager;

public:
	SimConfig(const std::string& _name) : name(_name) {}

	virtual ~SimConfig() {
		for (auto& it : parameters) {
			VERBOSE_LABELED_INFO(this->name) << "Deleting Parameter objects : " << it.first;
			delete it.second;
		}
	}

	SimConfig(const SimConfig&)            = delete;
	SimConfig& operator=(const SimConfig&) = delete;

	std::string getName() const { return this->name; }

	bool hasParameter(const std::string& _name) const { return this->parameters.contains(_name); }

	template <typename T>
	T getParameter(const std::string& _name) const;

	template <typename TStruct, typename T>
	T getParameterMemberData(const std::string& _name, const std::string& _member_name) const;

	template <typename T>
	void setParameter(const std::string& _name, const T& _value);

	template <typename TStruct, typename T>
	void setParameterMemberData(const std::string& _name, const std::string& _member_name, const T& _value);

	/**
	 * @brief Applies every entry of a JSON object to the matching parameter.
	 *
	 * Unknown keys are reported as warnings and skipped. A value of the wrong JSON type is an
	 * InvalidConfiguration error.
	 */
	void parseParameters(const nlohmann::json& _params);

protected:
	/// @brief Called for USER_DEFINED parameters. The default implementation ignores them.
	virtual void parseParametersUserDefined(const std::string& _paramName, const nlohmann::json& _paramValue) {}

	template <typename T>
	void addParameter(const std::string& _name, const T& _value, ParamType _type);

private:
	template <typename T>
	Parameter<T>* getParameterPtr(const std::string& _name) const;

	std::unordered_map<std::string, ParameterBase*> parameters;

	const std::string name;
};

}  // end of namespace hiersim

#include "config/SimConfig.inl"
