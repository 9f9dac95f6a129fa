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

#include <ethash/hash_types.hpp>
#include <ethash/keccak.hpp>

KILN_NAMESPACE_BEGIN

using hash256 = ethash::hash256;

inline hash256 keccak256(byte_string_view const bytes)
{
    return ethash::keccak256(bytes.data(), bytes.size());
}

KILN_NAMESPACE_END
