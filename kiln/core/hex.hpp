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

#include <kiln/core/byte_string.hpp>

#include <evmc/hex.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

KILN_NAMESPACE_BEGIN

/// Lower-case hex rendering with a `0x` prefix.
inline std::string to_hex(byte_string_view const bytes)
{
    return "0x" + evmc::hex(bytes);
}

/// Parses hex text with or without a `0x` prefix. Returns nothing on a
/// malformed digit or an odd number of digits.
inline std::optional<byte_string> parse_hex(std::string_view const s)
{
    return evmc::from_hex(s);
}

namespace literals
{
    inline byte_string operator""_hex(char const *s)
    {
        auto r = evmc::from_hex(std::string_view{s});
        if (!r) {
            throw std::invalid_argument{
                std::string{"malformed hex literal "} + s};
        }
        return *std::move(r);
    }
}

KILN_NAMESPACE_END
