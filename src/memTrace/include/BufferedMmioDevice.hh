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

#include <cstdint>
#include <mutex>
#include <vector>

#include "HierSim.hh"

/**
 * @brief A sink device mapped onto an MMIO region.
 *
 * Written bytes are appended to a ring buffer as large as the region, wrapping to the start when
 * full. A read returns the buffer contents at the corresponding offsets. Each byte costs
 * `cyclesPerByte` cycles in either direction.
 */
class BufferedMmioDevice : virtual public hiersim::HashableType {
public:
	BufferedMmioDevice(hiersim::Addr _start, uint64_t _size, hiersim::Tick _cyclesPerByte = 1);

	hiersim::ReadResult read(hiersim::Addr _addr, uint64_t _len) const;

	hiersim::Tick write(hiersim::Addr _addr, const std::vector<uint8_t>& _data);

	/// @brief Copy of the whole buffer.
	std::vector<uint8_t> getBufferSnapshot() const;

	uint64_t getBytesReceived() const;

	/// @brief Registers both handlers on the region starting at the device base.
	void attachTo(hiersim::RegionTable& _bus);

private:
	const hiersim::Addr start;
	const hiersim::Tick cyclesPerByte;

	mutable std::mutex   mu;
	std::vector<uint8_t> buffer;
	size_t               pos           = 0;
	uint64_t             bytesReceived = 0;
};
