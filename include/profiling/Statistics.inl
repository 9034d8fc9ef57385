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

#include <algorithm>
#include <mutex>
#include <numeric>

#include "profiling/Statistics.hh"

namespace hiersim {

/**********************************
 *                                *
 *   StatisticsMode::Default      *
 *                                *
 **********************************/

// The locks are deferred and only taken when the mutex is enabled, so they live until the method returns.

template <typename TValue, StatisticsMode Mode, bool EnableMutex>
void Statistics<TValue, Mode, EnableMutex>::push(const TValue& _val) {
	std::unique_lock<std::shared_mutex> lock(this->container_mu_, std::defer_lock);
	if constexpr (EnableMutex) lock.lock();

	this->container_.push_back(_val);
}

template <typename TValue, StatisticsMode Mode, bool EnableMutex>
TValue Statistics<TValue, Mode, EnableMutex>::sum() const {
	std::shared_lock<std::shared_mutex> lock(this->container_mu_, std::defer_lock);
	if constexpr (EnableMutex) lock.lock();

	return std::accumulate(this->container_.begin(), this->container_.end(), TValue{});
}

template <typename TValue, StatisticsMode Mode, bool EnableMutex>
TValue Statistics<TValue, Mode, EnableMutex>::avg() const {
	std::shared_lock<std::shared_mutex> lock(this->container_mu_, std::defer_lock);
	if constexpr (EnableMutex) lock.lock();

	if (this->container_.empty()) return TValue{};
	return std::accumulate(this->container_.begin(), this->container_.end(), TValue{}) /
	       static_cast<TValue>(this->container_.size());
}

template <typename TValue, StatisticsMode Mode, bool EnableMutex>
TValue Statistics<TValue, Mode, EnableMutex>::min() const {
	std::shared_lock<std::shared_mutex> lock(this->container_mu_, std::defer_lock);
	if constexpr (EnableMutex) lock.lock();

	return this->container_.empty() ? TValue{} : *std::min_element(this->container_.begin(), this->container_.end());
}

template <typename TValue, StatisticsMode Mode, bool EnableMutex>
TValue Statistics<TValue, Mode, EnableMutex>::max() const {
	std::shared_lock<std::shared_mutex> lock(this->container_mu_, std::defer_lock);
	if constexpr (EnableMutex) lock.lock();

	return this->container_.empty() ? TValue{} : *std::max_element(this->container_.begin(), this->container_.end());
}

template <typename TValue, StatisticsMode Mode, bool EnableMutex>
size_t Statistics<TValue, Mode, EnableMutex>::size() const {
	std::shared_lock<std::shared_mutex> lock(this->container_mu_, std::defer_lock);
	if constexpr (EnableMutex) lock.lock();

	return this->container_.size();
}

/**********************************
 *                                *
 *   StatisticsMode::Accumulator  *
 *                                *
 **********************************/

template <typename TValue, bool EnableMutex>
void Statistics<TValue, StatisticsMode::Accumulator, EnableMutex>::push(const TValue& _val) {
	this->value_ += _val;
}

template <typename TValue, bool EnableMutex>
TValue Statistics<TValue, StatisticsMode::Accumulator, EnableMutex>::sum() const {
	return this->value_;
}

/******************************************
 *                                        *
 *   StatisticsMode::AccumulatorWithSize  *
 *                                        *
 ******************************************/

template <typename TValue, bool EnableMutex>
void Statistics<TValue, StatisticsMode::AccumulatorWithSize, EnableMutex>::push(const TValue& _val) {
	this->value_ += _val;
	this->size_ += 1;
}

template <typename TValue, bool EnableMutex>
TValue Statistics<TValue, StatisticsMode::AccumulatorWithSize, EnableMutex>::sum() const {
	return this->value_;
}

template <typename TValue, bool EnableMutex>
TValue Statistics<TValue, StatisticsMode::AccumulatorWithSize, EnableMutex>::avg() const {
	const size_t n = this->size_;
	return (n != 0) ? this->value_ / static_cast<TValue>(n) : TValue{};
}

template <typename TValue, bool EnableMutex>
size_t Statistics<TValue, StatisticsMode::AccumulatorWithSize, EnableMutex>::size() const {
	return this->size_;
}

/**********************************
 *                                *
 *     CategorizedStatistics      *
 *                                *
 **********************************/

template <typename TCategory, typename TValue, StatisticsMode Mode, bool Sorted, bool ThreadSafeMap,
          bool ThreadSafeStatistics>
std::shared_ptr<Statistics<TValue, Mode, ThreadSafeStatistics>>
CategorizedStatistics<TCategory, TValue, Mode, Sorted, ThreadSafeMap, ThreadSafeStatistics>::getEntry(
    const TCategory& _cat) {
	{
		std::shared_lock<std::shared_mutex> lock(this->map_container_mu_, std::defer_lock);
		if constexpr (ThreadSafeMap) lock.lock();

		if (auto iter = this->map_container_.find(_cat); iter != this->map_container_.end()) [[likely]] {
			return iter->second;
		}
	}

	std::unique_lock<std::shared_mutex> lock(this->map_container_mu_, std::defer_lock);
	if constexpr (ThreadSafeMap) lock.lock();

	auto& entry = this->map_container_[_cat];
	if (!entry) { entry = std::make_shared<EntryType>(); }
	return entry;
}

template <typename TCategory, typename TValue, StatisticsMode Mode, bool Sorted, bool ThreadSafeMap,
          bool ThreadSafeStatistics>
size_t CategorizedStatistics<TCategory, TValue, Mode, Sorted, ThreadSafeMap, ThreadSafeStatistics>::numCategories()
    const {
	std::shared_lock<std::shared_mutex> lock(this->map_container_mu_, std::defer_lock);
	if constexpr (ThreadSafeMap) lock.lock();

	return this->map_container_.size();
}

template <typename TCategory, typename TValue, StatisticsMode Mode, bool Sorted, bool ThreadSafeMap,
          bool ThreadSafeStatistics>
TValue CategorizedStatistics<TCategory, TValue, Mode, Sorted, ThreadSafeMap, ThreadSafeStatistics>::sum() const {
	std::shared_lock<std::shared_mutex> lock(this->map_container_mu_, std::defer_lock);
	if constexpr (ThreadSafeMap) lock.lock();

	TValue total{};
	for (const auto& [cat, entry] : this->map_container_) { total += entry->sum(); }
	return total;
}

template <typename TCategory, typename TValue, StatisticsMode Mode, bool Sorted, bool ThreadSafeMap,
          bool ThreadSafeStatistics>
auto CategorizedStatistics<TCategory, TValue, Mode, Sorted, ThreadSafeMap, ThreadSafeStatistics>::sumDistribution()
    const -> MapOf<double> {
	MapOf<double> distribution;
	double        total = 0;

	{
		std::shared_lock<std::shared_mutex> lock(this->map_container_mu_, std::defer_lock);
		if constexpr (ThreadSafeMap) lock.lock();

		for (const auto& [cat, entry] : this->map_container_) {
			distribution[cat] = static_cast<double>(entry->sum());
			total += distribution[cat];
		}
	}

	if (total != 0) {
		for (auto& [cat, val] : distribution) { val /= total; }
	}
	return distribution;
}

}  // namespace hiersim
