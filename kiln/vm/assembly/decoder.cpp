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
#include <kiln/vm/assembly/decoder.hpp>
#include <kiln/vm/assembly/token.hpp>
#include <kiln/vm/evm/opcodes.hpp>

#include <cstddef>
#include <cstdint>
#include <format>

namespace kiln::vm::assembly
{
    Program decode(byte_string_view const code)
    {
        Program out;
        std::size_t pos = 0;
        while (pos < code.size()) {
            uint8_t const opcode = code[pos++];
            if (evm::is_push_opcode(opcode)) {
                std::size_t const n = evm::get_push_opcode_index(opcode);
                if (code.size() - pos < n) {
                    throw InvalidCode(std::format(
                        "PUSH{} at offset {} needs {} bytes, {} remain",
                        n,
                        pos - 1,
                        n,
                        code.size() - pos));
                }
                out.emplace_back(Push{byte_string{code.substr(pos, n)}});
                pos += n;
            }
            else if (evm::is_dup_opcode(opcode)) {
                out.emplace_back(Dup{evm::get_dup_opcode_index(opcode)});
            }
            else if (evm::is_swap_opcode(opcode)) {
                out.emplace_back(Swap{evm::get_swap_opcode_index(opcode)});
            }
            else if (opcode == evm::INVALID) {
                out.emplace_back(Invalid{byte_string{code.substr(pos)}});
                pos = code.size();
            }
            else if (evm::is_known_opcode(opcode)) {
                out.emplace_back(Plain{static_cast<evm::EvmOpCode>(opcode)});
            }
            else {
                throw InvalidOpcode(std::format(
                    "unknown opcode 0x{:02x} at offset {}", opcode, pos - 1));
            }
        }
        return out;
    }
}
