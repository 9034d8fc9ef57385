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

#include "MemTraceTop.hh"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace hiersim;

namespace {

Addr parseHex(const std::string& _token) {
	size_t pos   = 0;
	auto   value = std::stoull(_token, &pos, 16);
	if (pos != _token.size()) { throw std::invalid_argument("trailing characters in '" + _token + "'"); }
	return value;
}

std::string toUpper(std::string _str) {
	std::transform(_str.begin(), _str.end(), _str.begin(), [](unsigned char c) { return std::toupper(c); });
	return _str;
}

}  // namespace

void MemTraceTop::registerCLIArguments() {
	this->HierSimTop::registerCLIArguments();

	this->getCLIApp()->add_option("trace", this->traceFilePath, "Trace file to replay (stdin when omitted)");
	this->getCLIApp()
	    ->add_option("--mmio_region", this->mmioRegionName,
	                 "Name of the address-map region backed by a buffered MMIO device")
	    ->default_str(this->mmioRegionName);
}

void MemTraceTop::registerDevices() {
	for (const auto& region : this->getRegionTable().getRegions()) {
		if (region.name != this->mmioRegionName) { continue; }

		this->mmioDevice = std::make_unique<BufferedMmioDevice>(region.start, region.size);
		this->mmioDevice->attachTo(this->getRegionTable());
		CLASS_INFO << "Buffered MMIO device attached to region '" << region.name << "'";
	}
}

void MemTraceTop::run() {
	if (this->traceFilePath.empty()) {
		this->replay(std::cin);
		return;
	}

	std::ifstream in(this->traceFilePath);
	CLASS_ASSERT_MSG(in.is_open(), "cannot open trace file " + this->traceFilePath);
	this->replay(in);
}

void MemTraceTop::replay(std::istream& _in) {
	std::string line;
	while (std::getline(_in, line)) {
		if (!this->execute(line)) { break; }
	}
}

bool MemTraceTop::execute(const std::string& _line) {
	++this->lineNumber;

	std::istringstream       iss(_line.substr(0, _line.find('#')));
	std::vector<std::string> tokens;
	for (std::string token; iss >> token;) { tokens.push_back(token); }
	if (tokens.empty()) { return true; }

	const auto op = toUpper(tokens[0]);
	if (op == "EXIT") { return false; }
	if (op == "STATS") {
		this->printStats();
		return true;
	}

	auto& bus = this->getRegionTable();
	try {
		if (op == "REFRESH") {
			this->latencies.push(this->getController().refreshAll());
		} else if ((op == "R" || op == "X") && tokens.size() == 2) {
			const auto addr   = parseHex(tokens[1]);
			const auto result = (op == "R") ? bus.readBytes(addr, 1) : bus.fetchBytes(addr, 1);
			this->latencies.push(result.cycles);
			VERBOSE_CLASS_INFO << op << " 0x" << std::hex << addr << " -> 0x" << std::setw(2) << std::setfill('0')
			                   << (int)result.data.at(0) << std::dec << " (" << result.cycles << " cycles)";
		} else if (op == "W" && (tokens.size() == 2 || tokens.size() == 3)) {
			const auto addr  = parseHex(tokens[1]);
			const auto value = (tokens.size() == 3) ? parseHex(tokens[2]) : 0;
			if (value > 0xFF) { throw std::invalid_argument("byte value " + tokens[2] + " exceeds 0xFF"); }
			this->latencies.push(bus.writeBytes(addr, {static_cast<uint8_t>(value)}));
		} else {
			CLASS_WARNING << "line " << this->lineNumber << ": invalid command '" << _line << "'";
		}
	} catch (const MemoryError& e) {
		++this->faults;
		CLASS_WARNING << "line " << this->lineNumber << ": " << e.what();
	} catch (const std::logic_error& e) {
		CLASS_WARNING << "line " << this->lineNumber << ": malformed operand in '" << _line << "' (" << e.what() << ")";
	}
	return true;
}

void MemTraceTop::printStats() {
	CLASS_STATISTICS << "Commands : " << this->latencies.size() << " (" << this->faults << " faults)";
	CLASS_STATISTICS << "Latency  : avg=" << this->latencies.avg() << " min=" << this->latencies.min()
	                 << " max=" << this->latencies.max() << " cycles";
	if (auto cache = this->getCache()) {
		const auto c = cache->getCounters();
		CLASS_STATISTICS << "Cache    : reads=" << c.reads << " writes=" << c.writes << " hits=" << c.hits
		                 << " misses=" << c.misses << " backingStoreWrites=" << c.backingStoreWrites;
	}
	if (this->mmioDevice) { CLASS_STATISTICS << "MMIO     : " << this->mmioDevice->getBytesReceived() << " bytes"; }
}
