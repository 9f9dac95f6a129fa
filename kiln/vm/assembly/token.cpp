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

#include <kiln/vm/assembly/assembly_error.hpp>
#include <kiln/vm/assembly/token.hpp>

#include <algorithm>
#include <cstddef>
#include <format>
#include <variant>

namespace kiln::vm::assembly
{
    Push make_push(byte_string_view const value)
    {
        if (value.size() > 32) {
            throw InvalidAssembly(std::format(
                "push value of {} bytes is larger than 32 bytes",
                value.size()));
        }
        return Push{byte_string{value}};
    }

    Push make_push(std::size_t const n, byte_string_view const value)
    {
        if (n != value.size()) {
            throw InvalidAssembly(std::format(
                "PUSH{} given a value of {} bytes", n, value.size()));
        }
        return make_push(value);
    }

    bool is_placeholder(Token const &token)
    {
        return std::holds_alternative<JumpPointer>(token) ||
               std::holds_alternative<JumpDest>(token) ||
               std::holds_alternative<SelfCodeSize>(token);
    }

    bool is_resolved(Program const &program)
    {
        return std::ranges::none_of(program, is_placeholder);
    }
}
