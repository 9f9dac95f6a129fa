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

namespace kiln::vm::assembly
{
    /**
     * Disassembles raw bytecode. A 0xFE byte absorbs the rest of the input.
     * Throws `InvalidCode` for a truncated push and `InvalidOpcode` for a
     * byte that is not an instruction.
     */
    Program decode(byte_string_view code);
}
