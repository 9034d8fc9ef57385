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
 * @file HierSim.hh
 * @brief Umbrella header of the HierSim memory hierarchy simulator
 *
 * ```
 * CPU / DMA threads
 *        │
 *   RegionTable ──── CacheEngine (tag and timing model)
 *        │                │ dirty writebacks
 *   MemoryController ◄────┘
 *        │
 *   DramBank × channels × ranks × banks
 * ```
 */

#pragma once

// Memory - DRAM, controller and bus
#include "mem/AddressCodec.hh"
#include "mem/BackingStore.hh"
#include "mem/DramBank.hh"
#include "mem/MemoryController.hh"
#include "mem/MemoryError.hh"
#include "mem/RegionTable.hh"

// Cache
#include "cache/CacheEngine.hh"
#include "cache/CacheTypes.hh"

// Observer - Notification hooks
#include "observer/EventChannelObserver.hh"
#include "observer/MemoryObserver.hh"
#include "observer/StatisticsObserver.hh"

// Config - Parameter management
#include "config/CLIManager.hh"
#include "config/HierSimConfig.hh"
#include "config/SimConfig.hh"
#include "config/SimConfigManager.hh"

// Profiling
#include "profiling/Statistics.hh"

// System
#include "system/HierSimTop.hh"

// Utilities
#include "utils/HashableType.hh"
#include "utils/Logging.hh"
#include "utils/TypeDef.hh"
