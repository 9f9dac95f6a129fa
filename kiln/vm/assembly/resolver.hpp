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

#include <kiln/vm/assembly/token.hpp>

#include <cstddef>
#include <unordered_map>

namespace kiln::vm::assembly
{
    /**
     * Byte offsets of every `JumpDest` label in `program`, together with the
     * total assembled length.
     */
    struct JumpMap
    {
        std::unordered_map<Label, std::size_t> offsets;
        std::size_t end_size;
    };

    JumpMap resolve_labels(Program const &program);

    /**
     * Replaces every placeholder with a concrete token: jump pointers and the
     * self code size become `address_width` byte pushes, jump destinations
     * become `JUMPDEST`. Throws `InvalidOpcode` for a jump pointer with no
     * destination, and `InvalidAssembly` if the program does not fit the
     * address width.
     */
    Program resolve(Program const &program);
}
