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
 * @file Statistics.hh
 * @brief Sample collectors used by the observers and the trace driver
 *
 * | Mode                | Storage                  | Queries                    |
 * |---------------------|--------------------------|----------------------------|
 * | Default             | every sample (vector)    | sum, avg, min, max, size   |
 * | Accumulator         | one atomic running total | sum                        |
 * | AccumulatorWithSize | atomic total and count   | sum, avg, size             |
 *
 * CategorizedStatistics keeps one Statistics object per category, e.g. row-buffer hits per bank:
 *
 * ```cpp
 * CategorizedStatistics<std::string, uint64_t, StatisticsMode::Accumulator, true, true> perBank;
 * perBank.getEntry("ch0.rk0.bk3")->push(1);
 * auto share = perBank.sumDistribution();   // bank -> fraction of all hits
 * ```
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace hiersim {

enum class StatisticsMode { Default, Accumulator, AccumulatorWithSize };

template <typename TValue, StatisticsMode Mode = StatisticsMode::Default, bool EnableMutex = false>
class Statistics {
public:
	Statistics() = default;

	Statistics(const TValue& _val) { this->push(_val); }

	void push(const TValue& _val);

	TValue sum() const;

	TValue avg() const;

	TValue min() const;

	TValue max() const;

	size_t size() const;

private:
	std::vector<TValue>       container_;
	mutable std::shared_mutex container_mu_;
};

template <typename TValue, bool EnableMutex>
class Statistics<TValue, StatisticsMode::Accumulator, EnableMutex> {
public:
	Statistics() = default;

	Statistics(const TValue& _val) { this->push(_val); }

	void push(const TValue& _val);

	TValue sum() const;

private:
	std::atomic<TValue> value_ = TValue{};
};

template <typename TValue, bool EnableMutex>
class Statistics<TValue, StatisticsMode::AccumulatorWithSize, EnableMutex> {
public:
	Statistics() = default;

	Statistics(const TValue& _val) { this->push(_val); }

	void push(const TValue& _val);

	TValue sum() const;

	TValue avg() const;

	size_t size() const;

private:
	std::atomic<TValue> value_ = TValue{};
	std::atomic<size_t> size_  = 0;
};

/**
 * @brief One Statistics object per category.
 *
 * @tparam Sorted               std::map (ordered by category) instead of std::unordered_map.
 * @tparam ThreadSafeMap        guard category creation and lookup with a shared mutex.
 * @tparam ThreadSafeStatistics forwarded as EnableMutex to every entry.
 */
template <typename TCategory, typename TValue, StatisticsMode Mode = StatisticsMode::Default, bool Sorted = false,
          bool ThreadSafeMap = false, bool ThreadSafeStatistics = false>
class CategorizedStatistics {
	using EntryType = Statistics<TValue, Mode, ThreadSafeStatistics>;

	template <typename T>
	using MapOf = std::conditional_t<Sorted, std::map<TCategory, T>, std::unordered_map<TCategory, T>>;

public:
	CategorizedStatistics() = default;

	std::shared_ptr<EntryType> getEntry(const TCategory& _cat);

	size_t numCategories() const;

	TValue sum() const;

	/// @brief Per-category share of the total sum (all zero when the total is zero).
	MapOf<double> sumDistribution() const;

private:
	MapOf<std::shared_ptr<EntryType>> map_container_;
	mutable std::shared_mutex         map_container_mu_;
};

}  // namespace hiersim

#include "profiling/Statistics.inl"
