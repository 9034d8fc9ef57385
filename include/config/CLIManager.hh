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
 * @file CLIManager.hh
 * @brief Command-line front end of the SimConfigManager, built on CLI11
 *
 * An option registered with addCLIOption() does not write the parameter immediately. The parsed
 * value is queued and applied by setCLIParametersToSimConfig(), which must run after the config
 * files were parsed so that the command line overrides the files:
 *
 * ```
 * registerConfigs()                 defaults
 * registerCLIArguments()            options, "--help" shows the defaults
 * parseCLIArguments(argc, argv)     queue CLI values, collect -c files
 * parseConfigFiles(...)             files override defaults
 * setCLIParametersToSimConfig()     CLI overrides files
 * ```
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "config/SimConfig.hh"
#include "config/SimConfigManager.hh"

// Third-Party Library
#include <CLI/CLI.hpp>

namespace hiersim {

class CLIManager : public SimConfigManager {
	struct CLIParameter {
		std::string           configName;
		std::string           paramName;
		std::function<void()> updateFunc;
	};

public:
	CLIManager(const std::string& _appDescription, const std::vector<std::string>& _configFilePaths = {})
	    : SimConfigManager("SimConfigManager"), configFilePaths(_configFilePaths), app(_appDescription) {}

	virtual ~CLIManager() = default;

	const std::vector<std::string>& getConfigFilePathsFromCLI() const { return this->configFilePathsFromCLI; }

protected:
	/// @brief Options shared by every HierSim executable (`-c,--config`).
	void registerHierSimCLIArguments();

	virtual void registerCLIArguments() {}

	/// @brief Exits the process with CLI11's exit code on a parse error or on `--help`.
	void parseCLIArguments(int argc, char** argv) {
		argv = this->app.ensure_utf8(argv);
		try {
			this->app.parse(argc, argv);
		} catch (const CLI::ParseError& e) { exit(this->app.exit(e)); }
	}

	/**
	 * @brief Binds `_optionName` to a parameter, or to one member of a struct parameter when
	 *        `TStruct` is given.
	 * @param _defaultValue show the current parameter value as the default in `--help`.
	 */
	template <typename T, typename TStruct = void>
	inline CLI::Option* addCLIOption(const std::string& _optionName, const std::string& _optionDescription,
	                                 const std::string& _configName, const std::string& _paramName,
	                                 const std::string& _memberName = "", const bool& _defaultValue = true);

	void setCLIParametersToSimConfig();

	CLI::App* getCLIApp() { return &this->app; }

	std::vector<std::string> configFilePaths = {};

	std::vector<std::string> configFilePathsFromCLI = {};

private:
	void addCLIParameter(const std::string& _configName, const std::string& _paramName,
	                     std::function<void()> _updateFunc);

	std::vector<CLIParameter> cliParameters;

	CLI::App app;
};

}  // end of namespace hiersim

#include "config/CLIManager.inl"
