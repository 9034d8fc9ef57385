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
 * @file MemoryController.hh
 * @brief Single-ported DRAM controller with row-buffer timing and an MMIO side channel
 *
 * **Access cost** (per access, one bank):
 * ```
 * row hit                  : tCL + burst                    (onRowBufferHit)
 * closed bank              : tRCD + tCL + burst
 * conflicting open row     : tRP + tRCD + tCL + burst
 * refreshAll()             : tRFC, all banks closed           (onRefreshStarted)
 * MMIO range               : whatever the handler reports
 * ```
 *
 * **Concurrency:** every state-changing call takes the controller mutex for the whole
 * transition and byte transfer, so accesses are totally ordered by lock acquisition. The cycle
 * counter is atomic and can be read at any time without the lock.
 *
 * **Async variants** commit the access on the calling thread first and then return a future
 * that becomes ready after `cycles * pacingNsPerCycle` nanoseconds. Requesting a stop on the
 * supplied token while the future is pacing makes it throw AccessCancelled; the access itself
 * is never rolled back.
 *
 * **Usage Example:**
 * ```cpp
 * MemoryController ctrl(DramGeometry{1, 1, 8, 256, 512});
 * ctrl.writeBytes(0x40, {0xde, 0xad});
 * auto [data, cycles] = ctrl.readBytes(0x40, 2);   // row hit: tCL + burst
 * ```
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mem/AddressCodec.hh"
#include "mem/BackingStore.hh"
#include "mem/DramBank.hh"
#include "observer/MemoryObserver.hh"
#include "utils/HashableType.hh"
#include "utils/TypeDef.hh"

namespace hiersim {

struct DramTiming {
	Tick casLatency       = 12;   ///< tCL
	Tick rasToCasDelay    = 12;   ///< tRCD
	Tick rowPrechargeTime = 12;   ///< tRP
	Tick rowActiveTime    = 30;   ///< tRAS, informational only
	Tick refreshCycleTime = 350;  ///< tRFC
	Tick burstLength      = 4;

	bool operator==(const DramTiming&) const = default;
};

struct ReadResult {
	std::vector<uint8_t> data;
	Tick                 cycles = 0;
};

/// @brief Reads @p len bytes at an absolute address; returns the bytes and the cycles spent.
using MmioReadHandler = std::function<ReadResult(Addr, uint64_t)>;

/// @brief Writes the bytes at an absolute address; returns the cycles spent.
using MmioWriteHandler = std::function<Tick(Addr, const std::vector<uint8_t>&)>;

struct BankSnapshot {
	uint32_t                channel = 0;
	uint32_t                rank    = 0;
	uint32_t                bank    = 0;
	std::optional<uint32_t> openRow;
};

struct ControllerSnapshot {
	std::string               topology;
	Tick                      currentCycle = 0;
	std::vector<BankSnapshot> banks;
};

class MemoryController : virtual public HashableType, public BackingStore {
	struct MmioRange {
		Addr             start;
		uint64_t         size;
		MmioReadHandler  readHandler;
		MmioWriteHandler writeHandler;
	};

public:
	static constexpr uint64_t kDefaultPacingNsPerCycle = 500;

	MemoryController(const DramGeometry& _geometry, const DramTiming& _timing = DramTiming(),
	                 uint64_t _pacingNsPerCycle = kDefaultPacingNsPerCycle);

	~MemoryController() override = default;

	MemoryController(const MemoryController&)            = delete;
	MemoryController& operator=(const MemoryController&) = delete;

	/**
	 * @brief Reads @p _len bytes from one row of one bank (or from an MMIO handler).
	 * @throws OutOfBounds when the range leaves the physical space or the row.
	 */
	ReadResult readBytes(Addr _addr, uint64_t _len);

	/**
	 * @brief Writes @p _data into one row of one bank (or to an MMIO handler).
	 * @return Cycles charged for the access.
	 * @throws OutOfBounds when the range leaves the physical space or the row.
	 */
	Tick writeBytes(Addr _addr, const std::vector<uint8_t>& _data);

	std::future<ReadResult> readBytesAsync(Addr _addr, uint64_t _len, std::stop_token _token = {});

	std::future<Tick> writeBytesAsync(Addr _addr, const std::vector<uint8_t>& _data, std::stop_token _token = {});

	/**
	 * @brief Closes every bank and charges tRFC once.
	 * @return tRFC
	 */
	Tick refreshAll();

	/**
	 * @brief Timing-only write used by cache writebacks.
	 *
	 * The range is clamped to the physical space and to the row of its first byte, and ranges
	 * starting in an MMIO window are skipped. DRAM contents are left untouched.
	 */
	Tick writebackBlock(Addr _addr, uint64_t _len) override;

	/**
	 * @brief Routes accesses starting in [start, start + size) to the handlers.
	 * @throws OutOfBounds outside the physical space, OverlapError on overlap with another MMIO range,
	 *         InvalidConfiguration for an empty range or a missing handler.
	 */
	void registerMmioHandler(Addr _start, uint64_t _size, MmioReadHandler _readHandler,
	                         MmioWriteHandler _writeHandler);

	bool isMmio(Addr _addr) const;

	/**
	 * @brief Runs the bounds checks of readBytes()/writeBytes() without performing the access.
	 * @throws OutOfBounds
	 */
	void validateAccess(Addr _addr, uint64_t _len) const;

	/// @brief Copies DRAM bytes without touching row buffers or the cycle counter. May span rows.
	std::vector<uint8_t> peekBytes(Addr _addr, uint64_t _len) const;

	Tick getCurrentCycle() const { return this->cycleCounter.load(); }

	uint64_t getPhysicalSize() const { return this->geometry.getPhysicalSize(); }

	const DramGeometry& getGeometry() const { return this->geometry; }

	const DramTiming& getTiming() const { return this->timing; }

	uint64_t getPacingNsPerCycle() const { return this->pacingNsPerCycle; }

	std::string getTopologyInfo() const;

	ControllerSnapshot getSnapshot() const;

	/// @brief Closes every bank and zeroes storage. The cycle counter keeps counting.
	void reset();

	ObserverList& getObservers() { return this->observers; }

private:
	const MmioRange* findMmio(Addr _addr) const;

	DramBank& getBank(const DramCoord& _coord);

	const DramBank& getBank(const DramCoord& _coord) const;

	/// @brief Throws OutOfBounds unless [addr, addr + len) lies in the physical space.
	void checkPhysicalRange(Addr _addr, uint64_t _len) const;

	/// @brief Throws OutOfBounds unless the range stays inside the row of its first byte.
	void checkRowSpan(const DramCoord& _coord, uint64_t _len) const;

	/// @brief Moves @p _bank to Open(coord.row) and returns the transition + CAS cost.
	Tick openRow(const DramCoord& _coord, DramBank& _bank);

	const DramGeometry geometry;
	const DramTiming   timing;
	const uint64_t     pacingNsPerCycle;

	/// @brief Indexed by ((channel * ranks + rank) * banks + bank).
	std::vector<DramBank> banks;

	std::vector<MmioRange> mmioRanges;

	std::atomic<Tick> cycleCounter = 0;

	mutable std::mutex mu;

	ObserverList observers;
};

}  // namespace hiersim
