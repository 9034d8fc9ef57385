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

#include "mem/RegionTable.hh"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>

#include "cache/CacheEngine.hh"
#include "mem/MemoryError.hh"

namespace hiersim {

namespace {

std::string toHex(uint64_t _value) {
	std::stringstream ss;
	ss << "0x" << std::uppercase << std::hex << _value;
	return ss.str();
}

uint64_t parseAddress(const nlohmann::json& _value, const std::string& _field) {
	if (_value.is_number_unsigned()) { return _value.get<uint64_t>(); }
	if (_value.is_string()) {
		const auto str = _value.get<std::string>();
		try {
			size_t pos    = 0;
			auto   result = std::stoull(str, &pos, 0);
			if (pos == str.size()) { return result; }
		} catch (const std::logic_error&) {
			// falls through to the InvalidConfiguration below
		}
	}
	throw InvalidConfiguration("address map field '" + _field + "' is not an address: " + _value.dump());
}

}  // namespace

std::string toString(MemProt _prot) {
	std::string str;
	str += hasPermission(_prot, MemProt::Read) ? 'R' : '-';
	str += hasPermission(_prot, MemProt::Write) ? 'W' : '-';
	str += hasPermission(_prot, MemProt::Exec) ? 'X' : '-';
	return str;
}

MemProt parseMemProt(const std::string& _str) {
	MemProt prot = MemProt::None;
	for (char c : _str) {
		switch (std::toupper(static_cast<unsigned char>(c))) {
			case 'R': prot = prot | MemProt::Read; break;
			case 'W': prot = prot | MemProt::Write; break;
			case 'X': prot = prot | MemProt::Exec; break;
			case '-': break;
			default: throw InvalidConfiguration("unknown permission '" + std::string(1, c) + "' in \"" + _str + "\"");
		}
	}
	return prot;
}

void RegionTable::mapRegion(Addr _start, uint64_t _size, MemProt _perms, const std::string& _name) {
	if (_size == 0) { throw InvalidConfiguration("region '" + _name + "' has zero size"); }

	const uint64_t physical_size = this->computePhysicalSize();
	if (_start >= physical_size || _size > physical_size - _start) {
		throw OutOfBounds("region '" + _name + "' [" + toHex(_start) + ", +" + toHex(_size) +
		                  ") exceeds physical size " + toHex(physical_size));
	}

	std::unique_lock<std::shared_mutex> lock(this->mu);
	for (const auto& [start, region] : this->regions) {
		if (_start <= region.getEnd() && start <= _start + _size - 1) {
			throw OverlapError("region '" + _name + "' overlaps region '" + region.name + "'");
		}
	}

	this->regions.emplace(_start, MemoryRegion{_name, _start, _size, _perms, false});
}

void RegionTable::registerRegions(const nlohmann::json& _addressMap) {
	const auto& entries = _addressMap.contains("address_map") ? _addressMap.at("address_map") : _addressMap;
	if (!entries.is_array()) { throw InvalidConfiguration("address map must be an array of regions"); }

	for (const auto& entry : entries) {
		if (!entry.contains("name") || !entry.contains("start") || !entry.contains("size")) {
			throw InvalidConfiguration("address map entry needs name, start and size: " + entry.dump());
		}
		const auto perms = entry.contains("perms") ? parseMemProt(entry.at("perms").get<std::string>())
		                                           : (MemProt::Read | MemProt::Write);

		this->mapRegion(parseAddress(entry.at("start"), "start"), parseAddress(entry.at("size"), "size"), perms,
		                entry.at("name").get<std::string>());
	}
}

void RegionTable::checkAccess(Addr _addr, uint64_t _len, MemProt _needed) const {
	// The cacheable sub-ranges are not needed here.
	static_cast<void>(this->resolve(_addr, _len, _needed));
}

ReadResult RegionTable::readBytes(Addr _addr, uint64_t _len) {
	if (_len == 0) { return ReadResult{}; }

	this->prepareAccess(_addr, _len, MemProt::Read, false);
	return this->controller.readBytes(_addr, _len);
}

Tick RegionTable::writeBytes(Addr _addr, const std::vector<uint8_t>& _data) {
	if (_data.empty()) { return 0; }

	this->prepareAccess(_addr, _data.size(), MemProt::Write, true);
	return this->controller.writeBytes(_addr, _data);
}

ReadResult RegionTable::fetchBytes(Addr _addr, uint64_t _len) {
	if (_len == 0) { return ReadResult{}; }

	this->prepareAccess(_addr, _len, MemProt::Exec, false);
	return this->controller.readBytes(_addr, _len);
}

std::future<ReadResult> RegionTable::readBytesAsync(Addr _addr, uint64_t _len, std::stop_token _token) {
	if (_len > 0) { this->prepareAccess(_addr, _len, MemProt::Read, false); }
	return this->controller.readBytesAsync(_addr, _len, _token);
}

std::future<Tick> RegionTable::writeBytesAsync(Addr _addr, const std::vector<uint8_t>& _data, std::stop_token _token) {
	if (!_data.empty()) { this->prepareAccess(_addr, _data.size(), MemProt::Write, true); }
	return this->controller.writeBytesAsync(_addr, _data, _token);
}

void RegionTable::registerMmioHandlers(Addr _start, uint64_t _size, MmioReadHandler _readHandler,
                                       MmioWriteHandler _writeHandler) {
	{
		std::shared_lock<std::shared_mutex> lock(this->mu);
		auto                                iter = this->regions.find(_start);
		if (iter == this->regions.end() || iter->second.size != _size) {
			throw RegionViolation("no mapped region starts at " + toHex(_start) + " with size " + toHex(_size));
		}
	}

	this->controller.registerMmioHandler(_start, _size, std::move(_readHandler), std::move(_writeHandler));

	std::unique_lock<std::shared_mutex> lock(this->mu);
	if (auto iter = this->regions.find(_start); iter != this->regions.end()) { iter->second.mmio = true; }
}

std::vector<MemoryRegion> RegionTable::getRegions() const {
	std::shared_lock<std::shared_mutex> lock(this->mu);

	std::vector<MemoryRegion> out;
	out.reserve(this->regions.size());
	for (const auto& [start, region] : this->regions) { out.push_back(region); }
	return out;
}

std::vector<std::string> RegionTable::getRegionsInfo() const {
	std::vector<std::string> info;
	for (const auto& region : this->getRegions()) {
		info.push_back(region.name + ": " + toHex(region.start) + " - " + toHex(region.getEnd()) +
		               " (size=" + toHex(region.size) + ", prot=" + toString(region.perms) + ")");
	}
	return info;
}

std::vector<std::pair<Addr, uint64_t>> RegionTable::resolve(Addr _addr, uint64_t _len, MemProt _needed) const {
	const uint64_t physical_size = this->computePhysicalSize();
	if (_addr >= physical_size || _len > physical_size - _addr) {
		throw OutOfBounds("access " + toHex(_addr) + "+" + toHex(_len) + " exceeds physical size " +
		                  toHex(physical_size));
	}

	std::vector<std::pair<Addr, uint64_t>> cacheable;

	std::shared_lock<std::shared_mutex> lock(this->mu);

	Addr     cursor    = _addr;
	uint64_t remaining = _len;
	while (remaining > 0) {
		const auto region = this->findRegion(cursor);
		if (!region) { throw RegionViolation("address " + toHex(cursor) + " is not mapped"); }
		if (!hasPermission(region->perms, _needed)) {
			throw RegionViolation("region '" + region->name + "' (prot=" + toString(region->perms) + ") denies " +
			                      toString(_needed) + " at " + toHex(cursor));
		}

		const uint64_t avail = std::min<uint64_t>(remaining, region->getEnd() - cursor + 1);
		if (!region->mmio) { cacheable.emplace_back(cursor, avail); }

		cursor += avail;
		remaining -= avail;
	}
	return cacheable;
}

const MemoryRegion* RegionTable::findRegion(Addr _addr) const {
	auto iter = this->regions.upper_bound(_addr);
	if (iter == this->regions.begin()) { return nullptr; }

	--iter;
	return iter->second.contains(_addr) ? &iter->second : nullptr;
}

void RegionTable::prepareAccess(Addr _addr, uint64_t _len, MemProt _needed, bool _isWrite) {
	auto cacheable = this->resolve(_addr, _len, _needed);

	// Row crossings must fail before the cache records anything.
	this->controller.validateAccess(_addr, _len);

	if (auto engine = this->cache.load()) {
		for (const auto& [start, len] : cacheable) {
			for (uint64_t i = 0; i < len; ++i) { engine->access(start + i, _isWrite); }
		}
	}
}

}  // namespace hiersim
