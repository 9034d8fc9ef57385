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
 * @file TestAddressCodec.cc
 * @brief Unit tests of the DRAM and cache address decompositions
 *
 * | Suite             | Covers                                                         |
 * |-------------------|----------------------------------------------------------------|
 * | AddressCodecDram  | field order (col fastest), encode/decode inverse, range checks |
 * | AddressCodecCache | offset/set/tag split, round trips, non-power-of-two set counts |
 */

#include <gtest/gtest.h>

#include "mem/AddressCodec.hh"
#include "mem/MemoryError.hh"

using namespace hiersim;

TEST(AddressCodecDram, DecodeOrder) {
	DramGeometry geo;  // 1 ch, 1 rank, 8 banks, 256 rows, 512 cols

	EXPECT_EQ(AddressCodec::decodeDram(geo, 0), (DramCoord{0, 0, 0, 0, 0}));
	EXPECT_EQ(AddressCodec::decodeDram(geo, 511), (DramCoord{0, 0, 0, 0, 511})) << "last column of row 0";
	EXPECT_EQ(AddressCodec::decodeDram(geo, 512), (DramCoord{0, 0, 0, 1, 0})) << "next row, same bank";
	EXPECT_EQ(AddressCodec::decodeDram(geo, 256 * 512), (DramCoord{0, 0, 1, 0, 0})) << "next bank";
	EXPECT_EQ(AddressCodec::decodeDram(geo, geo.getPhysicalSize() - 1), (DramCoord{0, 0, 7, 255, 511}));
}

TEST(AddressCodecDram, MultiChannelGeometry) {
	DramGeometry geo{2, 2, 2, 4, 8};
	EXPECT_EQ(geo.getNumBanks(), 8);
	EXPECT_EQ(geo.getPhysicalSize(), 256);

	// col + 8 * (row + 4 * (bank + 2 * (rank + 2 * channel)))
	EXPECT_EQ(AddressCodec::decodeDram(geo, 3 + 8 * (2 + 4 * (1 + 2 * (0 + 2 * 1)))), (DramCoord{1, 0, 1, 2, 3}));

	for (Addr addr = 0; addr < geo.getPhysicalSize(); ++addr) {
		EXPECT_EQ(AddressCodec::encodeDram(geo, AddressCodec::decodeDram(geo, addr)), addr);
	}
}

TEST(AddressCodecDram, EncodeRejectsOutOfRangeFields) {
	DramGeometry geo{2, 2, 2, 4, 8};

	EXPECT_NO_THROW(AddressCodec::encodeDram(geo, DramCoord{1, 1, 1, 3, 7}));
	EXPECT_THROW(AddressCodec::encodeDram(geo, DramCoord{2, 0, 0, 0, 0}), OutOfBounds);
	EXPECT_THROW(AddressCodec::encodeDram(geo, DramCoord{0, 2, 0, 0, 0}), OutOfBounds);
	EXPECT_THROW(AddressCodec::encodeDram(geo, DramCoord{0, 0, 2, 0, 0}), OutOfBounds);
	EXPECT_THROW(AddressCodec::encodeDram(geo, DramCoord{0, 0, 0, 4, 0}), OutOfBounds);
	EXPECT_THROW(AddressCodec::encodeDram(geo, DramCoord{0, 0, 0, 0, 8}), OutOfBounds);
}

TEST(AddressCodecDram, GeometryValidation) {
	EXPECT_NO_THROW(DramGeometry{}.validate());
	EXPECT_THROW((DramGeometry{0, 1, 1, 1, 1}.validate()), InvalidConfiguration);
	EXPECT_THROW((DramGeometry{1, 1, 1, 1, 0}.validate()), InvalidConfiguration);
}

TEST(AddressCodecCache, SplitsOffsetSetAndTag) {
	CacheGeometry geo{16, 32};  // 4 offset bits, 5 set bits

	auto coord = AddressCodec::decodeCache(geo, 0x1A3F);
	EXPECT_EQ(coord.offset, 0xF);
	EXPECT_EQ(coord.setIndex, 3);
	EXPECT_EQ(coord.tag, 0xD);

	EXPECT_EQ(AddressCodec::encodeCache(geo, coord), 0x1A3F);
	EXPECT_EQ(AddressCodec::encodeCache(geo, CacheCoord{0xD, 3, 0}), 0x1A30) << "block base address";
}

TEST(AddressCodecCache, FullyAssociativeUsesWholeBlockNumberAsTag) {
	CacheGeometry geo{16, 1};

	auto coord = AddressCodec::decodeCache(geo, 0x1234);
	EXPECT_EQ(coord.setIndex, 0);
	EXPECT_EQ(coord.offset, 0x4);
	EXPECT_EQ(coord.tag, 0x123);
}

TEST(AddressCodecCache, FullyAssociativeRoundTrip) {
	for (uint64_t block : {4, 16, 64}) {
		CacheGeometry geo{block, 1};
		for (Addr addr = 0; addr < 0x4000; addr += 7) {
			const auto coord = AddressCodec::decodeCache(geo, addr);
			ASSERT_EQ(coord.setIndex, 0);
			ASSERT_EQ(AddressCodec::encodeCache(geo, coord), addr) << "block " << block << " addr " << addr;
		}
	}
}

TEST(AddressCodecCache, PowerOfTwoRoundTrip) {
	for (uint64_t block : {1, 16, 64}) {
		for (uint64_t sets : {2, 8, 32, 256}) {
			CacheGeometry geo{block, sets};
			for (Addr addr = 0; addr < 0x10000; addr += 13) {
				const auto coord = AddressCodec::decodeCache(geo, addr);
				ASSERT_LT(coord.setIndex, sets);
				ASSERT_EQ(AddressCodec::encodeCache(geo, coord), addr)
				    << "block " << block << " sets " << sets << " addr " << addr;
			}
		}
	}
}

TEST(AddressCodecCache, NonPowerOfTwoSetCount) {
	CacheGeometry geo{16, 3};  // block n maps to set n % 3, tag n / 3

	EXPECT_EQ(AddressCodec::decodeCache(geo, 0x00), (CacheCoord{0, 0, 0}));
	EXPECT_EQ(AddressCodec::decodeCache(geo, 0x10), (CacheCoord{0, 1, 0}));
	EXPECT_EQ(AddressCodec::decodeCache(geo, 0x20), (CacheCoord{0, 2, 0}));
	EXPECT_EQ(AddressCodec::decodeCache(geo, 0x35), (CacheCoord{1, 0, 5})) << "block 3 shares set 0 with block 0";
	EXPECT_EQ(AddressCodec::decodeCache(geo, 0x40), (CacheCoord{1, 1, 0}));

	EXPECT_EQ(AddressCodec::encodeCache(geo, CacheCoord{1, 0, 0}), 0x30);

	for (Addr a = 0; a < 0x1000; ++a) {
		for (Addr b = a + 16; b < a + 0x100; b += 16) {
			const auto ca = AddressCodec::decodeCache(geo, a);
			const auto cb = AddressCodec::decodeCache(geo, b);
			ASSERT_FALSE(ca.setIndex == cb.setIndex && ca.tag == cb.tag) << a << " and " << b << " collide";
		}
		ASSERT_EQ(AddressCodec::encodeCache(geo, AddressCodec::decodeCache(geo, a)), a);
	}
}

TEST(AddressCodecCache, BitHelpers) {
	EXPECT_EQ(AddressCodec::bitsNeeded(0), 0);
	EXPECT_EQ(AddressCodec::bitsNeeded(1), 0);
	EXPECT_EQ(AddressCodec::bitsNeeded(2), 1);
	EXPECT_EQ(AddressCodec::bitsNeeded(3), 2);
	EXPECT_EQ(AddressCodec::bitsNeeded(16), 4);
	EXPECT_EQ(AddressCodec::bitsNeeded(17), 5);

	EXPECT_EQ(AddressCodec::lowMask(0), 0);
	EXPECT_EQ(AddressCodec::lowMask(4), 0xF);
	EXPECT_EQ(AddressCodec::lowMask(64), ~0ULL);
}
