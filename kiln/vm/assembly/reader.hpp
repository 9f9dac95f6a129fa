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

#include <kiln/vm/assembly/expr.hpp>

#include <string_view>

namespace kiln::vm::assembly
{
    /**
     * Reads the textual form of an operation tree:
     *
     *     ; comment to end of line
     *     (mstore 0 0x11223344)          operation with operands
     *     callvalue                      bare mnemonic
     *     #x0102                         byte literal, pushed as PUSH2
     *     (if cond non-zero zero)        conditional
     *     [ ... ]                        spliced list
     *     self-code-size                 total assembled length
     *
     * Mnemonics are case-insensitive. Throws `InvalidAssembly`, naming the
     * offset of the problem, on malformed input.
     */
    ExprList read_program(std::string_view text);
}
