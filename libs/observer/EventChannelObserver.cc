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

#include "observer/EventChannelObserver.hh"

#include "utils/Logging.hh"

namespace hiersim {

void to_json(nlohmann::json& _j, const MemoryEvent& _event) {
	_j = nlohmann::json{{"type", _event.type}};

	switch (_event.type) {
		case MemoryEventType::Read:
		case MemoryEventType::Write:
			_j["addr"] = _event.addr;
			_j["len"]  = _event.len;
			break;
		case MemoryEventType::RowBufferHit:
			_j["channel"] = _event.channel;
			_j["rank"]    = _event.rank;
			_j["bank"]    = _event.bank;
			_j["row"]     = _event.row;
			break;
		case MemoryEventType::CacheCounters:
			_j["reads"]              = _event.counters.reads;
			_j["writes"]             = _event.counters.writes;
			_j["hits"]               = _event.counters.hits;
			_j["misses"]             = _event.counters.misses;
			_j["backingStoreWrites"] = _event.counters.backingStoreWrites;
			break;
		case MemoryEventType::RefreshStarted: break;
	}
}

EventChannelObserver::~EventChannelObserver() { this->close(); }

void EventChannelObserver::onRead(Addr _addr, uint64_t _len) {
	this->publish(MemoryEvent{.type = MemoryEventType::Read, .addr = _addr, .len = _len});
}

void EventChannelObserver::onWrite(Addr _addr, uint64_t _len) {
	this->publish(MemoryEvent{.type = MemoryEventType::Write, .addr = _addr, .len = _len});
}

void EventChannelObserver::onRowBufferHit(uint32_t _channel, uint32_t _rank, uint32_t _bank, uint32_t _row) {
	this->publish(MemoryEvent{.type    = MemoryEventType::RowBufferHit,
	                          .channel = _channel,
	                          .rank    = _rank,
	                          .bank    = _bank,
	                          .row     = _row});
}

void EventChannelObserver::onRefreshStarted() { this->publish(MemoryEvent{.type = MemoryEventType::RefreshStarted}); }

void EventChannelObserver::onCacheCounters(const CacheCounters& _counters) {
	this->publish(MemoryEvent{.type = MemoryEventType::CacheCounters, .counters = _counters});
}

std::vector<MemoryEvent> EventChannelObserver::drain() {
	std::lock_guard<std::mutex> lock(this->drainMu);

	std::vector<MemoryEvent> events;
	while (!this->queue.empty()) {
		std::optional<MemoryEvent> event;
		this->queue >> event;
		if (!event) { break; }
		events.push_back(*event);
	}
	return events;
}

bool EventChannelObserver::waitNext(MemoryEvent& _event) {
	std::optional<MemoryEvent> event;
	this->queue >> event;
	if (!event) { return false; }

	_event = *event;
	return true;
}

void EventChannelObserver::close() {
	if (!this->queue.closed()) { this->queue.close(); }
}

void EventChannelObserver::publish(const MemoryEvent& _event) {
	if (this->queue.closed()) {
		VERBOSE_CLASS_INFO << "event dropped after close";
		return;
	}
	try {
		this->queue << std::optional<MemoryEvent>(_event);
	} catch (const msd::closed_channel&) { VERBOSE_CLASS_INFO << "event dropped after close"; }
}

}  // namespace hiersim
