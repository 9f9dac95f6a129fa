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

#include <kiln/core/cases.hpp>
#include <kiln/core/hex.hpp>
#include <kiln/vm/assembly/encoder.hpp>
#include <kiln/vm/assembly/show.hpp>
#include <kiln/vm/assembly/token.hpp>
#include <kiln/vm/evm/opcodes.hpp>

#include <cstddef>
#include <format>
#include <string>
#include <variant>

namespace kiln::vm::assembly
{
    std::string show_token(Token const &token)
    {
        return std::visit(
            Cases{
                [](Plain const &plain) -> std::string {
                    return std::string{evm::opcode_info(plain.opcode).name};
                },
                [](Push const &push) -> std::string {
                    if (push.n() == 0) {
                        return "PUSH0";
                    }
                    return std::format("PUSH{} {}", push.n(), to_hex(push.value));
                },
                [](Dup const &dup) -> std::string {
                    return std::format("DUP{}", dup.n);
                },
                [](Swap const &swap) -> std::string {
                    return std::format("SWAP{}", swap.n);
                },
                [](Invalid const &) -> std::string { return "INVALID"; },
                [](JumpPointer const &ptr) -> std::string {
                    return std::format("JUMPPTR {}", ptr.label);
                },
                [](JumpDest const &dest) -> std::string {
                    return std::format("JUMPDEST {}", dest.label);
                },
                [](SelfCodeSize const &) -> std::string {
                    return "SELFCODESIZE";
                }},
            token);
    }

    std::string show_program(Program const &program)
    {
        std::string out;
        std::size_t offset = 0;
        for (auto const &token : program) {
            out += std::format("{:04x}: {}", offset, show_token(token));
            if (auto const *invalid = std::get_if<Invalid>(&token);
                invalid && !invalid->data.empty()) {
                out += std::format(" ({} data bytes)", invalid->data.size());
            }
            out += '\n';
            offset += token_size(token);
        }
        return out;
    }
}
