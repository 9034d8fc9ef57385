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

#include "utils/Logging.hh"

#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <syncstream>
#include <thread>

#include "system/HierSimTop.hh"

namespace hiersim {

LogOStream::LogOStream(LoggingSeverity _level, const char* _file, int _line, const std::string& _label)
    : level(_level), file(_file), line(_line), label(_label) {
	this->setPrefix();
	if (!this->label.empty()) { this->ss << "[" << this->label << "] "; }
}

LogOStream::~LogOStream() noexcept(false) {
	if (this->level == LoggingSeverity::L_ERROR) {
		this->ss << " (" << this->file << ":" << this->line << ")";
		std::osyncstream(std::cerr) << this->ss.str() << std::endl;

		// Unwinding already in progress: a second exception would call std::terminate directly.
		if (std::uncaught_exceptions() == 0) { throw std::runtime_error(this->ss.str()); }
	} else if (this->level == LoggingSeverity::L_WARNING) {
		std::osyncstream(std::cerr) << this->ss.str() << std::endl;
	} else {
		std::osyncstream(std::cout) << this->ss.str() << std::endl;
	}
}

void LogOStream::setPrefix() {
	if (top) {
		this->ss << "Cycle=" << top->getCurrentCycle() << " ";
	} else {
		this->ss << "Cycle=N/A ";
	}

	switch (this->level) {
		case LoggingSeverity::L_STATISTICS:
			this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_GREEN).getCode() + "Stats: ";
			break;
		case LoggingSeverity::L_INFO: this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_BLUE).getCode() + "Info: "; break;
		case LoggingSeverity::L_WARNING:
			this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_YELLOW).getCode() + "Warning: ";
			break;
		case LoggingSeverity::L_ERROR: this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_RED).getCode() + "Error: "; break;
	}

	this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::RESET).getCode();
}

void LogOStream::handleTerminate() {
	bool expected_false = false;

	// Only the first failing thread reports; the others park until abort() takes the process down.
	if (LogOStream::hasCalledTerminate.compare_exchange_strong(expected_false, true)) {
		if (auto eptr = std::current_exception()) {
			try {
				std::rethrow_exception(eptr);
			} catch (const std::exception& e) {
				std::osyncstream(std::cerr) << e.what() << std::endl;
			} catch (...) {
				std::osyncstream(std::cerr) << ANSI_SGR(ANSI_SGR::PARAMETER::FG_RED).getCode()
				                            << "An uncaught unknown exception happened."
				                            << ANSI_SGR(ANSI_SGR::PARAMETER::RESET).getCode() << std::endl;
			}
		}
	} else {
		while (true) { std::this_thread::sleep_for(std::chrono::milliseconds(1)); }
	}

	std::abort();
}

}  // namespace hiersim
