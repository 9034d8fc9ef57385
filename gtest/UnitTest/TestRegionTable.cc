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
 * @file TestRegionTable.cc
 * @brief Unit tests of the bus façade: region mapping, permission checks, multi-region
 *        accesses, MMIO attachment, JSON address maps and cache routing
 */

#include <gtest/gtest.h>

#include <vector>

#include "cache/CacheEngine.hh"
#include "mem/MemoryController.hh"
#include "mem/MemoryError.hh"
#include "mem/RegionTable.hh"

using namespace hiersim;

namespace {

const MemProt RW  = MemProt::Read | MemProt::Write;
const MemProt RX  = MemProt::Read | MemProt::Exec;
const MemProt RWX = MemProt::Read | MemProt::Write | MemProt::Exec;

}  // namespace

TEST(RegionTableTest, PermissionHelpers) {
	EXPECT_EQ(toString(RWX), "RWX");
	EXPECT_EQ(toString(RX), "R-X");
	EXPECT_EQ(toString(MemProt::None), "---");

	EXPECT_EQ(parseMemProt("rw"), RW);
	EXPECT_EQ(parseMemProt("R-X"), RX);
	EXPECT_EQ(parseMemProt(""), MemProt::None);
	EXPECT_THROW(parseMemProt("RZ"), InvalidConfiguration);

	EXPECT_TRUE(hasPermission(RWX, RW));
	EXPECT_FALSE(hasPermission(RX, MemProt::Write));
}

TEST(RegionTableTest, MappingRules) {
	MemoryController ctrl(DramGeometry{});
	RegionTable      bus(ctrl);

	bus.mapRegion(0x1000, 0x1000, RW, "ram");

	EXPECT_THROW(bus.mapRegion(0x1800, 0x1000, RW, "overlap"), OverlapError);
	EXPECT_THROW(bus.mapRegion(0x0800, 0x0801, RW, "overlap_start"), OverlapError);
	EXPECT_THROW(bus.mapRegion(0x1FFF, 1, RW, "last_byte"), OverlapError);
	EXPECT_THROW(bus.mapRegion(0x3000, 0, RW, "empty"), InvalidConfiguration);
	EXPECT_THROW(bus.mapRegion(ctrl.getPhysicalSize() - 0x10, 0x20, RW, "beyond"), OutOfBounds);

	EXPECT_NO_THROW(bus.mapRegion(0x0, 0x1000, RX, "rom")) << "touching regions do not overlap";
	EXPECT_NO_THROW(bus.mapRegion(0x2000, 0x100, RW, "next"));

	auto regions = bus.getRegions();
	ASSERT_EQ(regions.size(), 3);
	EXPECT_EQ(regions[0].name, "rom") << "regions are listed by start address";
	EXPECT_EQ(regions[1].name, "ram");
	EXPECT_EQ(regions[2].getEnd(), 0x20FF);

	EXPECT_EQ(bus.getRegionsInfo(), (std::vector<std::string>{
	                                    "rom: 0x0 - 0xFFF (size=0x1000, prot=R-X)",
	                                    "ram: 0x1000 - 0x1FFF (size=0x1000, prot=RW-)",
	                                    "next: 0x2000 - 0x20FF (size=0x100, prot=RW-)",
	                                }));
}

TEST(RegionTableTest, PermissionChecks) {
	MemoryController ctrl(DramGeometry{});
	RegionTable      bus(ctrl);
	bus.mapRegion(0x0, 0x100, MemProt::Read, "ro");
	bus.mapRegion(0x100, 0x100, RW, "rw");
	bus.mapRegion(0x200, 0x100, RX, "code");

	{  // a refused write changes nothing and costs nothing
		EXPECT_THROW(bus.writeBytes(0x10, {1, 2, 3}), RegionViolation);
		EXPECT_EQ(ctrl.peekBytes(0x10, 3), (std::vector<uint8_t>(3, 0)));
		EXPECT_EQ(ctrl.getCurrentCycle(), 0);
	}

	{  // execute permission
		EXPECT_NO_THROW(bus.fetchBytes(0x200, 4));
		EXPECT_THROW(bus.fetchBytes(0x100, 4), RegionViolation);
		EXPECT_THROW(bus.checkAccess(0x0, 1, MemProt::Exec), RegionViolation);
	}

	{  // unmapped and out-of-space addresses
		EXPECT_THROW(bus.readBytes(0x300, 1), RegionViolation);
		EXPECT_THROW(bus.readBytes(ctrl.getPhysicalSize(), 1), OutOfBounds);
	}

	{  // an access may span regions when every byte is permitted
		EXPECT_NO_THROW(bus.checkAccess(0xFE, 4, MemProt::Read));
		EXPECT_THROW(bus.checkAccess(0xFE, 4, MemProt::Write), RegionViolation) << "the first two bytes are read-only";
		EXPECT_THROW(bus.checkAccess(0x2FE, 4, MemProt::Read), RegionViolation) << "runs into unmapped space";
	}

	{  // successful accesses reach the controller
		EXPECT_EQ(bus.writeBytes(0x180, {0x5A, 0xA5}), 40) << "the fetch left row 1 open";
		EXPECT_EQ(bus.readBytes(0x180, 2).data, (std::vector<uint8_t>{0x5A, 0xA5}));
	}

	{  // zero-length accesses are never checked
		EXPECT_TRUE(bus.readBytes(0x300, 0).data.empty());
		EXPECT_EQ(bus.writeBytes(0x0, {}), 0);
	}
}

TEST(RegionTableTest, JsonAddressMap) {
	MemoryController ctrl(DramGeometry{});

	{  // hexadecimal strings, plain numbers, default permissions
		RegionTable bus(ctrl);
		bus.registerRegions(nlohmann::json::parse(R"({
			"address_map": [
				{ "name": "code", "start": "0x0",    "size": "0x4000", "perms": "RX" },
				{ "name": "heap", "start": 16384,    "size": 32768 }
			]
		})"));

		auto regions = bus.getRegions();
		ASSERT_EQ(regions.size(), 2);
		EXPECT_EQ(regions[0].perms, RX);
		EXPECT_EQ(regions[1].start, 0x4000);
		EXPECT_EQ(regions[1].size, 0x8000);
		EXPECT_EQ(regions[1].perms, RW) << "perms default to RW";
	}

	{  // a bare array is accepted too
		RegionTable bus(ctrl);
		bus.registerRegions(nlohmann::json::parse(R"([{ "name": "all", "start": "0", "size": "0x100000" }])"));
		EXPECT_EQ(bus.getRegions().size(), 1);
	}

	{  // malformed documents
		RegionTable bus(ctrl);
		EXPECT_THROW(bus.registerRegions(nlohmann::json::parse(R"([{ "name": "x", "start": "0x0" }])")),
		             InvalidConfiguration);
		EXPECT_THROW(bus.registerRegions(nlohmann::json::parse(R"([{ "name": "x", "start": "zz", "size": 1 }])")),
		             InvalidConfiguration);
		EXPECT_THROW(bus.registerRegions(nlohmann::json::parse(R"([{ "name": "x", "start": -4, "size": 1 }])")),
		             InvalidConfiguration);
		EXPECT_THROW(
		    bus.registerRegions(nlohmann::json::parse(R"([{ "name": "x", "start": 0, "size": 1, "perms": "RQ" }])")),
		    InvalidConfiguration);
		EXPECT_THROW(bus.registerRegions(nlohmann::json::parse(R"({ "address_map": 3 })")), InvalidConfiguration);
		EXPECT_THROW(bus.registerRegions(nlohmann::json::parse(R"([
			{ "name": "a", "start": "0x0",  "size": "0x20" },
			{ "name": "b", "start": "0x10", "size": "0x20" }
		])")),
		             OverlapError);
	}
}

TEST(RegionTableTest, MmioRegions) {
	MemoryController ctrl(DramGeometry{});
	RegionTable      bus(ctrl);
	bus.mapRegion(0x0, 0x1000, RW, "ram");
	bus.mapRegion(0x1000, 0x10, RW, "uart");

	auto rd = [](Addr, uint64_t _len) { return ReadResult{std::vector<uint8_t>(_len, 0x7E), 1}; };
	auto wr = [](Addr, const std::vector<uint8_t>& _data) { return Tick(_data.size()); };

	EXPECT_THROW(bus.registerMmioHandlers(0x1000, 0x8, rd, wr), RegionViolation) << "size must match the region";
	EXPECT_THROW(bus.registerMmioHandlers(0x2000, 0x10, rd, wr), RegionViolation) << "no region there";

	bus.registerMmioHandlers(0x1000, 0x10, rd, wr);
	EXPECT_TRUE(bus.getRegions()[1].mmio);
	EXPECT_TRUE(ctrl.isMmio(0x1000));

	EXPECT_EQ(bus.readBytes(0x1002, 2).data, (std::vector<uint8_t>{0x7E, 0x7E}));
	EXPECT_EQ(bus.writeBytes(0x1000, {1, 2, 3}), 3);
}

TEST(RegionTableTest, CacheRouting) {
	MemoryController ctrl(DramGeometry{});
	RegionTable      bus(ctrl);
	CacheEngine      cache(CacheParams{});
	cache.attachBackingStore(ctrl);

	bus.mapRegion(0x0, 0x1000, RW, "ram");
	bus.mapRegion(0x1000, 0x10, RW, "dev");
	bus.registerMmioHandlers(
	    0x1000, 0x10, [](Addr, uint64_t _len) { return ReadResult{std::vector<uint8_t>(_len, 0), 1}; },
	    [](Addr, const std::vector<uint8_t>&) { return Tick(1); });
	bus.attachCache(cache);

	{  // one cache access per byte
		bus.readBytes(0x20, 4);
		auto counters = cache.getCounters();
		EXPECT_EQ(counters.reads, 4);
		EXPECT_EQ(counters.misses, 1) << "the four bytes share a block";
		EXPECT_EQ(counters.hits, 3);

		bus.writeBytes(0x20, {1, 2});
		EXPECT_EQ(cache.getCounters().writes, 2);
	}

	{  // MMIO bytes bypass the cache
		const auto before = cache.getCounters();
		bus.readBytes(0x1000, 4);
		bus.writeBytes(0x1004, {1});
		EXPECT_EQ(cache.getCounters(), before);
	}

	{  // failed accesses leave the cache untouched
		const auto before = cache.getCounters();
		EXPECT_THROW(bus.readBytes(0x1FC, 8), OutOfBounds) << "crosses the end of row 0";
		EXPECT_THROW(bus.readBytes(0x2000, 1), RegionViolation);
		EXPECT_EQ(cache.getCounters(), before);
	}

	{  // detached
		const auto before = cache.getCounters();
		bus.detachCache();
		bus.readBytes(0x40, 1);
		EXPECT_EQ(cache.getCounters(), before);
	}
}

TEST(RegionTableTest, AsyncAccess) {
	MemoryController ctrl(DramGeometry{}, DramTiming(), 0);
	RegionTable      bus(ctrl);
	bus.mapRegion(0x0, 0x100, MemProt::Read, "ro");
	bus.mapRegion(0x100, 0x100, RW, "rw");

	EXPECT_THROW(bus.writeBytesAsync(0x0, {1}), RegionViolation) << "checked before the future is created";
	EXPECT_EQ(bus.writeBytesAsync(0x100, {9}).get(), 28);
	EXPECT_EQ(bus.readBytesAsync(0x100, 1).get().data, (std::vector<uint8_t>{9}));

	EXPECT_EQ(bus.getCurrentCycle(), ctrl.getCurrentCycle());
	EXPECT_EQ(bus.getTopologyInfo(), ctrl.getTopologyInfo());
}
