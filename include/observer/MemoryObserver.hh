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
 * @file MemoryObserver.hh
 * @brief Observation hooks of the memory hierarchy
 *
 * Components notify their ObserverList while still holding their own lock, so the order of the
 * notifications matches the order in which accesses were serialized. An observer must therefore
 * return quickly and must never call back into the component that notified it. Observers that
 * feed a UI should hand the event over to another thread (see EventChannelObserver).
 *
 * ```cpp
 * StatisticsObserver stats;
 * controller.getObservers().attach(stats);
 * cache.getObservers().attach(stats);
 * ```
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <vector>

#include "cache/CacheTypes.hh"
#include "utils/TypeDef.hh"

namespace hiersim {

class MemoryObserver {
public:
	virtual ~MemoryObserver() = default;

	virtual void onRead(Addr _addr, uint64_t _len) {}

	virtual void onWrite(Addr _addr, uint64_t _len) {}

	virtual void onRowBufferHit(uint32_t _channel, uint32_t _rank, uint32_t _bank, uint32_t _row) {}

	virtual void onRefreshStarted() {}

	virtual void onCacheCounters(const CacheCounters& _counters) {}
};

/**
 * @brief Non-owning registration list. Observers must outlive their registration.
 */
class ObserverList {
public:
	void attach(MemoryObserver& _observer) {
		std::lock_guard<std::mutex> lock(this->mu);
		this->observers.push_back(&_observer);
	}

	void detach(MemoryObserver& _observer) {
		std::lock_guard<std::mutex> lock(this->mu);
		this->observers.erase(std::remove(this->observers.begin(), this->observers.end(), &_observer),
		                      this->observers.end());
	}

	size_t size() const {
		std::lock_guard<std::mutex> lock(this->mu);
		return this->observers.size();
	}

	template <typename Func>
	void notify(Func&& _func) const {
		std::lock_guard<std::mutex> lock(this->mu);
		for (auto observer : this->observers) { _func(*observer); }
	}

private:
	mutable std::mutex           mu;
	std::vector<MemoryObserver*> observers;
};

}  // namespace hiersim
