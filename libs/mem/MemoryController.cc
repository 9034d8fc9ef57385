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

#include "mem/MemoryController.hh"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <sstream>

#include "mem/MemoryError.hh"

namespace hiersim {

namespace {

/// Blocks the calling thread for @p _delay unless a stop is requested first.
void pace(std::chrono::nanoseconds _delay, std::stop_token _token) {
	if (_delay.count() > 0) {
		std::mutex                   m;
		std::condition_variable_any  cv;
		std::unique_lock<std::mutex> lock(m);
		cv.wait_for(lock, _token, _delay, [] { return false; });
	}

	if (_token.stop_requested()) { throw AccessCancelled("asynchronous access cancelled while pacing"); }
}

}  // namespace

MemoryController::MemoryController(const DramGeometry& _geometry, const DramTiming& _timing,
                                   uint64_t _pacingNsPerCycle)
    : geometry(_geometry), timing(_timing), pacingNsPerCycle(_pacingNsPerCycle) {
	this->geometry.validate();

	this->banks.reserve(this->geometry.getNumBanks());
	for (uint64_t i = 0; i < this->geometry.getNumBanks(); ++i) {
		this->banks.emplace_back(this->geometry.rowsPerBank, this->geometry.colsPerRow);
	}
}

ReadResult MemoryController::readBytes(Addr _addr, uint64_t _len) {
	if (_len == 0) { return ReadResult{}; }

	std::lock_guard<std::mutex> lock(this->mu);
	this->checkPhysicalRange(_addr, _len);

	if (auto mmio = this->findMmio(_addr)) {
		auto result = mmio->readHandler(_addr, _len);
		this->cycleCounter += result.cycles;
		this->observers.notify([&](MemoryObserver& o) { o.onRead(_addr, _len); });
		return result;
	}

	auto coord = AddressCodec::decodeDram(this->geometry, _addr);
	this->checkRowSpan(coord, _len);

	auto& bank   = this->getBank(coord);
	Tick  cycles = this->openRow(coord, bank);
	auto  data   = bank.readFromOpenRow(coord.col, (uint32_t)_len);

	this->cycleCounter += cycles;
	this->observers.notify([&](MemoryObserver& o) { o.onRead(_addr, _len); });
	return ReadResult{std::move(data), cycles};
}

Tick MemoryController::writeBytes(Addr _addr, const std::vector<uint8_t>& _data) {
	if (_data.empty()) { return 0; }

	std::lock_guard<std::mutex> lock(this->mu);
	this->checkPhysicalRange(_addr, _data.size());

	if (auto mmio = this->findMmio(_addr)) {
		Tick cycles = mmio->writeHandler(_addr, _data);
		this->cycleCounter += cycles;
		this->observers.notify([&](MemoryObserver& o) { o.onWrite(_addr, _data.size()); });
		return cycles;
	}

	auto coord = AddressCodec::decodeDram(this->geometry, _addr);
	this->checkRowSpan(coord, _data.size());

	auto& bank   = this->getBank(coord);
	Tick  cycles = this->openRow(coord, bank);
	bank.writeToOpenRow(coord.col, _data.data(), (uint32_t)_data.size());

	this->cycleCounter += cycles;
	this->observers.notify([&](MemoryObserver& o) { o.onWrite(_addr, _data.size()); });
	return cycles;
}

std::future<ReadResult> MemoryController::readBytesAsync(Addr _addr, uint64_t _len, std::stop_token _token) {
	auto result = this->readBytes(_addr, _len);
	auto delay  = std::chrono::nanoseconds(result.cycles * this->pacingNsPerCycle);

	return std::async(std::launch::async, [result = std::move(result), delay, _token]() {
		pace(delay, _token);
		return result;
	});
}

std::future<Tick> MemoryController::writeBytesAsync(Addr _addr, const std::vector<uint8_t>& _data,
                                                    std::stop_token _token) {
	Tick cycles = this->writeBytes(_addr, _data);
	auto delay  = std::chrono::nanoseconds(cycles * this->pacingNsPerCycle);

	return std::async(std::launch::async, [cycles, delay, _token]() {
		pace(delay, _token);
		return cycles;
	});
}

Tick MemoryController::refreshAll() {
	std::lock_guard<std::mutex> lock(this->mu);

	this->observers.notify([](MemoryObserver& o) { o.onRefreshStarted(); });
	for (auto& bank : this->banks) { bank.precharge(); }

	this->cycleCounter += this->timing.refreshCycleTime;
	return this->timing.refreshCycleTime;
}

Tick MemoryController::writebackBlock(Addr _addr, uint64_t _len) {
	if (_len == 0 || _addr >= this->getPhysicalSize()) { return 0; }

	std::lock_guard<std::mutex> lock(this->mu);
	if (this->findMmio(_addr)) { return 0; }

	auto     coord = AddressCodec::decodeDram(this->geometry, _addr);
	uint64_t len   = std::min<uint64_t>(_len, this->getPhysicalSize() - _addr);
	len            = std::min<uint64_t>(len, this->geometry.colsPerRow - coord.col);

	Tick cycles = this->openRow(coord, this->getBank(coord));

	this->cycleCounter += cycles;
	this->observers.notify([&](MemoryObserver& o) { o.onWrite(_addr, len); });
	return cycles;
}

void MemoryController::registerMmioHandler(Addr _start, uint64_t _size, MmioReadHandler _readHandler,
                                           MmioWriteHandler _writeHandler) {
	if (_size == 0) { throw InvalidConfiguration("MMIO range must not be empty"); }
	if (!_readHandler || !_writeHandler) { throw InvalidConfiguration("MMIO range needs both handlers"); }

	std::lock_guard<std::mutex> lock(this->mu);
	this->checkPhysicalRange(_start, _size);

	for (const auto& range : this->mmioRanges) {
		if (_start < range.start + range.size && range.start < _start + _size) {
			std::stringstream ss;
			ss << std::hex << "MMIO range 0x" << _start << "+0x" << _size << " overlaps 0x" << range.start << "+0x"
			   << range.size;
			throw OverlapError(ss.str());
		}
	}

	this->mmioRanges.push_back(MmioRange{_start, _size, std::move(_readHandler), std::move(_writeHandler)});
}

bool MemoryController::isMmio(Addr _addr) const {
	std::lock_guard<std::mutex> lock(this->mu);
	return this->findMmio(_addr) != nullptr;
}

void MemoryController::validateAccess(Addr _addr, uint64_t _len) const {
	if (_len == 0) { return; }

	std::lock_guard<std::mutex> lock(this->mu);
	this->checkPhysicalRange(_addr, _len);
	if (!this->findMmio(_addr)) { this->checkRowSpan(AddressCodec::decodeDram(this->geometry, _addr), _len); }
}

std::vector<uint8_t> MemoryController::peekBytes(Addr _addr, uint64_t _len) const {
	std::vector<uint8_t> out;
	if (_len == 0) { return out; }

	std::lock_guard<std::mutex> lock(this->mu);
	this->checkPhysicalRange(_addr, _len);

	out.reserve(_len);
	while (_len > 0) {
		auto     coord = AddressCodec::decodeDram(this->geometry, _addr);
		uint64_t chunk = std::min<uint64_t>(_len, this->geometry.colsPerRow - coord.col);
		auto     bytes = this->getBank(coord).peek(coord.row, coord.col, (uint32_t)chunk);

		out.insert(out.end(), bytes.begin(), bytes.end());
		_addr += chunk;
		_len -= chunk;
	}
	return out;
}

std::string MemoryController::getTopologyInfo() const {
	std::stringstream ss;
	ss << "Channels=" << this->geometry.channels << ", Ranks=" << this->geometry.ranksPerChannel
	   << ", BanksPerRank=" << this->geometry.banksPerRank << ", RowsPerBank=" << this->geometry.rowsPerBank
	   << ", ColsPerRow=" << this->geometry.colsPerRow;
	return ss.str();
}

ControllerSnapshot MemoryController::getSnapshot() const {
	ControllerSnapshot snapshot;
	snapshot.topology = this->getTopologyInfo();

	std::lock_guard<std::mutex> lock(this->mu);
	snapshot.currentCycle = this->cycleCounter.load();
	snapshot.banks.reserve(this->banks.size());

	for (uint32_t ch = 0; ch < this->geometry.channels; ++ch) {
		for (uint32_t rk = 0; rk < this->geometry.ranksPerChannel; ++rk) {
			for (uint32_t bk = 0; bk < this->geometry.banksPerRank; ++bk) {
				const auto& bank = this->getBank(DramCoord{ch, rk, bk, 0, 0});
				snapshot.banks.push_back(BankSnapshot{ch, rk, bk, bank.getOpenRow()});
			}
		}
	}
	return snapshot;
}

void MemoryController::reset() {
	std::lock_guard<std::mutex> lock(this->mu);
	for (auto& bank : this->banks) { bank.reset(); }
}

const MemoryController::MmioRange* MemoryController::findMmio(Addr _addr) const {
	for (const auto& range : this->mmioRanges) {
		if (_addr >= range.start && _addr < range.start + range.size) { return &range; }
	}
	return nullptr;
}

DramBank& MemoryController::getBank(const DramCoord& _coord) {
	return this->banks[((uint64_t)_coord.channel * this->geometry.ranksPerChannel + _coord.rank) *
	                       this->geometry.banksPerRank +
	                   _coord.bank];
}

const DramBank& MemoryController::getBank(const DramCoord& _coord) const {
	return this->banks[((uint64_t)_coord.channel * this->geometry.ranksPerChannel + _coord.rank) *
	                       this->geometry.banksPerRank +
	                   _coord.bank];
}

void MemoryController::checkPhysicalRange(Addr _addr, uint64_t _len) const {
	const uint64_t size = this->getPhysicalSize();
	if (_addr >= size || _len > size - _addr) {
		std::stringstream ss;
		ss << std::hex << "access 0x" << _addr << "+0x" << _len << " exceeds physical size 0x" << size;
		throw OutOfBounds(ss.str());
	}
}

void MemoryController::checkRowSpan(const DramCoord& _coord, uint64_t _len) const {
	if ((uint64_t)_coord.col + _len > this->geometry.colsPerRow) {
		throw OutOfBounds("column span " + std::to_string(_coord.col) + "+" + std::to_string(_len) + " exceeds " +
		                  std::to_string(this->geometry.colsPerRow) + " columns of row " + std::to_string(_coord.row));
	}
}

Tick MemoryController::openRow(const DramCoord& _coord, DramBank& _bank) {
	Tick cycles = 0;

	if (_bank.getOpenRow() == _coord.row) {
		cycles += this->timing.casLatency + this->timing.burstLength;
		this->observers.notify(
		    [&](MemoryObserver& o) { o.onRowBufferHit(_coord.channel, _coord.rank, _coord.bank, _coord.row); });
		return cycles;
	}

	if (_bank.hasOpenRow()) {
		cycles += this->timing.rowPrechargeTime;
		_bank.precharge();
	}
	cycles += this->timing.rasToCasDelay;
	_bank.activate(_coord.row);
	cycles += this->timing.casLatency + this->timing.burstLength;

	return cycles;
}

}  // namespace hiersim
