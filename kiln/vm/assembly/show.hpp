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

#include <string>

namespace kiln::vm::assembly
{
    /// Mnemonic form of a token, e.g. `PUSH2 0x0102` or `SWAP3`.
    std::string show_token(Token const &token);

    /// One token per line, each prefixed with its byte offset.
    std::string show_program(Program const &program);
}
