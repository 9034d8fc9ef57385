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

#pragma once

#include <istream>
#include <memory>
#include <string>

#include "BufferedMmioDevice.hh"
#include "HierSim.hh"

/**
 * @brief Replays a memory trace against the configured hierarchy.
 *
 * One command per line, case-insensitive, `#` starts a comment:
 *
 * ```
 * R <hex addr>            read one byte
 * W <hex addr> [<byte>]   write one byte (0 when omitted)
 * X <hex addr>            fetch one byte, needs the X permission
 * REFRESH                 refresh every bank
 * STATS                   print the counters so far
 * EXIT                    stop replaying
 * ```
 *
 * A faulting access is reported as a warning and replay continues.
 */
class MemTraceTop : public hiersim::HierSimTop {
public:
	MemTraceTop() : hiersim::HierSimTop() {}

	/// @brief Replays the trace file, or stdin when none was given.
	void run();

	/// @brief Executes one trace line. Returns false for EXIT.
	bool execute(const std::string& _line);

	void printStats();

	const BufferedMmioDevice* getMmioDevice() const { return this->mmioDevice.get(); }

protected:
	void registerCLIArguments() override;

	void registerDevices() override;

private:
	void replay(std::istream& _in);

	std::string traceFilePath;
	std::string mmioRegionName = "mmio";
	uint64_t    lineNumber     = 0;
	uint64_t    faults         = 0;

	std::unique_ptr<BufferedMmioDevice> mmioDevice;

	hiersim::Statistics<hiersim::Tick> latencies;
};
