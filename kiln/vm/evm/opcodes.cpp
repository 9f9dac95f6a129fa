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

#include <kiln/core/ascii.hpp>
#include <kiln/vm/evm/opcodes.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

namespace kiln::vm::evm
{
    std::optional<EvmOpCode> find_opcode(std::string_view const name)
    {
        if (iequals(name, "DIFFICULTY")) {
            return PREVRANDAO;
        }
        for (std::size_t i = 0; i < opcode_table.size(); ++i) {
            if (is_known_opcode(static_cast<uint8_t>(i)) &&
                iequals(opcode_table[i].name, name)) {
                return static_cast<EvmOpCode>(i);
            }
        }
        return std::nullopt;
    }
}
