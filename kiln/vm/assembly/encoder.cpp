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
#include <kiln/vm/assembly/assembly_error.hpp>
#include <kiln/vm/assembly/encoder.hpp>
#include <kiln/vm/assembly/token.hpp>
#include <kiln/vm/evm/opcodes.hpp>

#include <cstddef>
#include <cstdint>
#include <format>
#include <variant>

namespace kiln::vm::assembly
{
    std::size_t token_size(Token const &token)
    {
        return std::visit(
            Cases{
                [](Push const &push) -> std::size_t { return 1 + push.n(); },
                [](JumpPointer const &) -> std::size_t {
                    return 1 + address_width;
                },
                [](SelfCodeSize const &) -> std::size_t {
                    return 1 + address_width;
                },
                [](Invalid const &invalid) -> std::size_t {
                    return 1 + invalid.data.size();
                },
                [](auto const &) -> std::size_t { return 1; }},
            token);
    }

    void encode_token(Token const &token, byte_string &out)
    {
        std::visit(
            Cases{
                [&](Plain const &plain) { out.push_back(plain.opcode); },
                [&](Push const &push) {
                    out.push_back(
                        static_cast<uint8_t>(evm::PUSH0 + push.n()));
                    out.append(push.value);
                },
                [&](Dup const &dup) {
                    if (dup.n < 1 || dup.n > 16) {
                        throw InvalidAssembly(
                            std::format("DUP{} is out of range", dup.n));
                    }
                    out.push_back(static_cast<uint8_t>(evm::DUP1 + dup.n - 1));
                },
                [&](Swap const &swap) {
                    if (swap.n < 1 || swap.n > 16) {
                        throw InvalidAssembly(
                            std::format("SWAP{} is out of range", swap.n));
                    }
                    out.push_back(
                        static_cast<uint8_t>(evm::SWAP1 + swap.n - 1));
                },
                [&](Invalid const &invalid) {
                    out.push_back(evm::INVALID);
                    out.append(invalid.data);
                },
                [](JumpPointer const &ptr) {
                    throw InvalidAssembly(std::format(
                        "unresolved jump pointer {}", ptr.label));
                },
                [](JumpDest const &dest) {
                    throw InvalidAssembly(std::format(
                        "unresolved jump destination {}", dest.label));
                },
                [](SelfCodeSize const &) {
                    throw InvalidAssembly("unresolved self code size");
                }},
            token);
    }

    byte_string encode(Program const &program)
    {
        byte_string out;
        for (auto const &token : program) {
            encode_token(token, out);
        }
        return out;
    }
}
