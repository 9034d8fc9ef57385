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
 * @file EventChannelObserver.hh
 * @brief Forwards memory notifications to a consumer thread through an msd::channel
 *
 * The notifying component only enqueues a MemoryEvent, so a slow consumer (a UI, a trace writer)
 * never holds up the access path. The channel is unbounded and pushing never blocks.
 *
 * ```cpp
 * EventChannelObserver events;
 * controller.getObservers().attach(events);
 * std::thread consumer([&] {
 *     MemoryEvent ev;
 *     while (events.waitNext(ev)) { render(ev); }
 * });
 * ...
 * events.close();
 * consumer.join();
 * ```
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Third-Party Library
#include <msd/channel.hpp>
#include <nlohmann/json.hpp>

#include "observer/MemoryObserver.hh"
#include "utils/HashableType.hh"

namespace hiersim {

enum class MemoryEventType { Read, Write, RowBufferHit, RefreshStarted, CacheCounters };

NLOHMANN_JSON_SERIALIZE_ENUM(MemoryEventType, {
                                                  {MemoryEventType::Read, "Read"},
                                                  {MemoryEventType::Write, "Write"},
                                                  {MemoryEventType::RowBufferHit, "RowBufferHit"},
                                                  {MemoryEventType::RefreshStarted, "RefreshStarted"},
                                                  {MemoryEventType::CacheCounters, "CacheCounters"},
                                              })

struct MemoryEvent {
	MemoryEventType type    = MemoryEventType::Read;
	Addr            addr    = 0;
	uint64_t        len     = 0;
	uint32_t        channel = 0;
	uint32_t        rank    = 0;
	uint32_t        bank    = 0;
	uint32_t        row     = 0;
	CacheCounters   counters;
};

/// @brief Only the fields meaningful for the event type are emitted.
void to_json(nlohmann::json& _j, const MemoryEvent& _event);

class EventChannelObserver : public MemoryObserver, virtual public HashableType {
public:
	EventChannelObserver() = default;
	~EventChannelObserver();

	EventChannelObserver(const EventChannelObserver&)            = delete;
	EventChannelObserver& operator=(const EventChannelObserver&) = delete;

	void onRead(Addr _addr, uint64_t _len) override;

	void onWrite(Addr _addr, uint64_t _len) override;

	void onRowBufferHit(uint32_t _channel, uint32_t _rank, uint32_t _bank, uint32_t _row) override;

	void onRefreshStarted() override;

	void onCacheCounters(const CacheCounters& _counters) override;

	/**
	 * @brief Pops every event queued so far without blocking.
	 *
	 * Concurrent drain() calls are serialized, and each event goes to exactly one of them.
	 * drain() must not race with waitNext() on another thread.
	 */
	std::vector<MemoryEvent> drain();

	/**
	 * @brief Blocks until an event is available. Supports a single consuming thread.
	 * @return false once the observer is closed and every queued event has been consumed.
	 */
	bool waitNext(MemoryEvent& _event);

	/// @brief Events notified after close() are dropped.
	void close();

	bool isClosed() const { return this->queue.closed(); }

	size_t pending() const { return this->queue.size(); }

private:
	void publish(const MemoryEvent& _event);

	// An empty optional after a read means the channel was closed and drained.
	msd::channel<std::optional<MemoryEvent>> queue;

	// Makes the empty() check and the pop in drain() one step.
	std::mutex drainMu;
};

}  // namespace hiersim
