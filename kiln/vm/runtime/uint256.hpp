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

#pragma once

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>

namespace kiln::vm::runtime
{
    using uint256_t = ::intx::uint256;

    uint256_t signextend(uint256_t const &byte_index, uint256_t const &x);
    uint256_t byte(uint256_t const &byte_index, uint256_t const &x);

    /**
     * Logical shifts with the shift amount saturated at 255, so that a shift
     * of 256 or more behaves as a shift of exactly 255.
     */
    uint256_t shl(uint256_t const &shift_index, uint256_t const &x);
    uint256_t shr(uint256_t const &shift_index, uint256_t const &x);

    /**
     * Arithmetic shift right of the two's complement reading of `x`, with the
     * shift amount saturated at 255.
     */
    uint256_t sar(uint256_t const &shift_index, uint256_t const &x);

    /**
     * Whether `x`, read as a two's complement signed word, is negative.
     */
    constexpr bool is_negative(uint256_t const &x) noexcept
    {
        return (x[3] >> 63) != 0;
    }

    /**
     * The most negative signed word, 2^255.
     */
    inline constexpr uint256_t min_signed = uint256_t{1} << 255;

    /**
     * Parse a range of raw bytes with length `n` into a 256-bit big-endian word
     * value.
     *
     * If there are fewer than `n` bytes remaining in the source data (that is,
     * `remaining < n`), then treat the input as if it had been padded to the
     * right with zero bytes.
     */
    uint256_t
    from_bytes(std::size_t n, std::size_t remaining, uint8_t const *src);

    /**
     * Parse a range of raw bytes with length `n` into a 256-bit big-endian word
     * value. There must be at least `n` bytes readable from `src`.
     */
    uint256_t from_bytes(std::size_t n, uint8_t const *src);
}
