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

#include "BufferedMmioDevice.hh"

using namespace hiersim;

BufferedMmioDevice::BufferedMmioDevice(Addr _start, uint64_t _size, Tick _cyclesPerByte)
    : start(_start), cyclesPerByte(_cyclesPerByte), buffer(_size, 0) {
	if (_size == 0) { throw InvalidConfiguration("BufferedMmioDevice needs a non-empty range"); }
}

ReadResult BufferedMmioDevice::read(Addr _addr, uint64_t _len) const {
	std::lock_guard<std::mutex> lock(this->mu);

	ReadResult result;
	result.data.reserve(_len);
	for (uint64_t i = 0; i < _len; ++i) {
		result.data.push_back(this->buffer[(_addr - this->start + i) % this->buffer.size()]);
	}
	result.cycles = _len * this->cyclesPerByte;
	return result;
}

Tick BufferedMmioDevice::write(Addr _addr, const std::vector<uint8_t>& _data) {
	std::lock_guard<std::mutex> lock(this->mu);

	for (uint8_t byte : _data) {
		if (this->pos >= this->buffer.size()) { this->pos = 0; }
		this->buffer[this->pos++] = byte;
	}
	this->bytesReceived += _data.size();
	VERBOSE_CLASS_INFO << "received " << _data.size() << " byte(s) at 0x" << std::hex << _addr;

	return _data.size() * this->cyclesPerByte;
}

std::vector<uint8_t> BufferedMmioDevice::getBufferSnapshot() const {
	std::lock_guard<std::mutex> lock(this->mu);
	return this->buffer;
}

uint64_t BufferedMmioDevice::getBytesReceived() const {
	std::lock_guard<std::mutex> lock(this->mu);
	return this->bytesReceived;
}

void BufferedMmioDevice::attachTo(RegionTable& _bus) {
	_bus.registerMmioHandlers(
	    this->start, this->buffer.size(), [this](Addr _addr, uint64_t _len) { return this->read(_addr, _len); },
	    [this](Addr _addr, const std::vector<uint8_t>& _data) { return this->write(_addr, _data); });
}
