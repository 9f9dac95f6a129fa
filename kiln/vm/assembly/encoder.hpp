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
#include <kiln/vm/assembly/token.hpp>

#include <cstddef>

namespace kiln::vm::assembly
{
    /// Number of bytes the token occupies once assembled.
    std::size_t token_size(Token const &token);

    /**
     * Raw bytecode for a resolved program. Throws `InvalidAssembly` if a
     * placeholder remains.
     */
    byte_string encode(Program const &program);

    /// Appends the encoding of a single resolved token.
    void encode_token(Token const &token, byte_string &out);
}
