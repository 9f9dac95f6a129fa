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
#include <kiln/vm/assembly/resolver.hpp>
#include <kiln/vm/assembly/token.hpp>
#include <kiln/vm/evm/opcodes.hpp>

#include <cstddef>
#include <cstdint>
#include <format>
#include <utility>
#include <variant>

namespace kiln::vm::assembly
{
    namespace
    {
        Push push_address(std::size_t const offset)
        {
            byte_string value(address_width, 0);
            for (std::size_t i = 0; i < address_width; ++i) {
                value[address_width - 1 - i] =
                    static_cast<uint8_t>(offset >> (8 * i));
            }
            return Push{std::move(value)};
        }
    }

    JumpMap resolve_labels(Program const &program)
    {
        JumpMap map{{}, 0};
        std::size_t offset = 0;
        for (auto const &token : program) {
            if (auto const *dest = std::get_if<JumpDest>(&token)) {
                map.offsets.insert_or_assign(dest->label, offset);
            }
            offset += token_size(token);
        }
        map.end_size = offset;
        return map;
    }

    Program resolve(Program const &program)
    {
        auto const map = resolve_labels(program);
        if (map.end_size >= (std::size_t{1} << (8 * address_width))) {
            throw InvalidAssembly(std::format(
                "program of {} bytes does not fit {} byte jump addresses",
                map.end_size,
                address_width));
        }

        Program out;
        out.reserve(program.size());
        for (auto const &token : program) {
            out.push_back(std::visit(
                Cases{
                    [&](JumpPointer const &ptr) -> Token {
                        auto const it = map.offsets.find(ptr.label);
                        if (it == map.offsets.end()) {
                            throw InvalidOpcode(std::format(
                                "unknown jump destination {}", ptr.label));
                        }
                        return push_address(it->second);
                    },
                    [](JumpDest const &) -> Token {
                        return Plain{evm::JUMPDEST};
                    },
                    [&](SelfCodeSize const &) -> Token {
                        return push_address(map.end_size);
                    },
                    [](auto const &other) -> Token { return other; }},
                token));
        }
        return out;
    }
}
