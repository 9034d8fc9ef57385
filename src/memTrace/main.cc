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
 * @file main.cc
 * @brief Trace-driven front end of HierSim
 *
 * ```
 * ./memTrace -c configs/memTrace.json --assoc 4 --replacement FIFO trace.txt
 * echo "W 0x40 0xAB\nR 0x40\nSTATS" | ./memTrace
 * ```
 */

#include "HierSim.hh"
#include "MemTraceTop.hh"

using namespace hiersim;

int main(int argc, char** argv) {
	auto memTrace = std::make_shared<MemTraceTop>();
	top           = memTrace;

	memTrace->init(argc, argv);
	memTrace->run();
	memTrace->printStats();
	memTrace->finish();

	top = nullptr;
	return 0;
}
