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

#include "config/CLIManager.hh"

namespace hiersim {

void CLIManager::setCLIParametersToSimConfig() {
	for (const auto& cli_param : this->cliParameters) {
		VERBOSE_CLASS_INFO << "Applying command-line value of " << cli_param.configName << "." << cli_param.paramName;
		cli_param.updateFunc();
	}
}

void CLIManager::addCLIParameter(const std::string& _configName, const std::string& _paramName,
                                 std::function<void()> _updateFunc) {
	this->cliParameters.push_back(CLIParameter{_configName, _paramName, std::move(_updateFunc)});
}

void CLIManager::registerHierSimCLIArguments() {
	this->getCLIApp()
	    ->add_option("-c,--config", this->configFilePathsFromCLI, "Specifies the path(s) to configuration file(s).")
	    ->expected(0, -1);
}

}  // namespace hiersim
