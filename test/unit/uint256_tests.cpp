// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <kiln/vm/runtime/uint256.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <array>
#include <cstdint>

using namespace kiln::vm::runtime;
using namespace intx;

TEST(Uint256, SignExtend)
{
    ASSERT_EQ(signextend(0, 0xff), ~uint256_t{0});
    ASSERT_EQ(signextend(0, 0x7f), 0x7f);
    ASSERT_EQ(signextend(1, 0xff), 0xff);
    ASSERT_EQ(
        signextend(1, 0x8522),
        0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff8522_u256);
    ASSERT_EQ(signextend(32, 0x8522), 0x8522);
    ASSERT_EQ(
        signextend(7, 0xaa00000000000000ff_u256), 0xff_u256);
    ASSERT_EQ(
        signextend(8, 0xaa00000000000000ff_u256),
        0xffffffffffffffffffffffffffffffffffffffffffffffaa00000000000000ff_u256);
    ASSERT_EQ(signextend(uint256_t{1} << 200, 0x80), 0x80);
}

TEST(Uint256, Byte)
{
    auto const x =
        0x1100000000000000000000000000000000000000000000000000000000002233_u256;
    ASSERT_EQ(byte(0, x), 0x11);
    ASSERT_EQ(byte(30, x), 0x22);
    ASSERT_EQ(byte(31, x), 0x33);
    ASSERT_EQ(byte(32, x), 0);
    ASSERT_EQ(byte(99, x), 0);
}

TEST(Uint256, ShiftsSaturate)
{
    auto const x =
        0x112233445566778899aabbccddeeff112233445566778899aabbccddeeff1111_u256;
    ASSERT_EQ(shl(0, x), x);
    ASSERT_EQ(shl(255, x), uint256_t{1} << 255);
    ASSERT_EQ(shl(256, x), uint256_t{1} << 255);
    ASSERT_EQ(shl(~uint256_t{0}, x), uint256_t{1} << 255);
    ASSERT_EQ(shr(255, ~uint256_t{0}), 1);
    ASSERT_EQ(shr(1000, ~uint256_t{0}), 1);
    ASSERT_EQ(shr(8, x), x >> 8);
}

TEST(Uint256, ArithmeticShift)
{
    auto const neg =
        0xf000000000000000000000000000000000000000000000000000000000000000_u256;
    ASSERT_EQ(
        sar(4, neg),
        0xff00000000000000000000000000000000000000000000000000000000000000_u256);
    ASSERT_EQ(sar(255, neg), ~uint256_t{0});
    ASSERT_EQ(sar(256, neg), ~uint256_t{0});
    ASSERT_EQ(sar(0, neg), neg);
    auto const pos =
        0x3000000000000000000000000000000000000000000000000000000000000000_u256;
    ASSERT_EQ(
        sar(8, pos),
        0x0030000000000000000000000000000000000000000000000000000000000000_u256);
    ASSERT_EQ(sar(256, pos), 0);
}

TEST(Uint256, Signedness)
{
    ASSERT_TRUE(is_negative(min_signed));
    ASSERT_TRUE(is_negative(~uint256_t{0}));
    ASSERT_FALSE(is_negative(min_signed - 1));
    ASSERT_FALSE(is_negative(0));
}

TEST(Uint256, FromBytes)
{
    std::array<uint8_t, 4> const src{0x01, 0x02, 0x03, 0x04};
    ASSERT_EQ(from_bytes(4, src.data()), 0x01020304);
    ASSERT_EQ(from_bytes(2, src.data()), 0x0102);
    ASSERT_EQ(from_bytes(0, src.data()), 0);
    // Missing trailing bytes read as zero.
    ASSERT_EQ(from_bytes(6, 4, src.data()), 0x010203040000_u256);
}
