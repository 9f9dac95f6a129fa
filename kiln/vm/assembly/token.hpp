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
#include <kiln/vm/evm/opcodes.hpp>

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace kiln::vm::assembly
{
    using Label = std::uint32_t;

    /**
     * Width in bytes of the pushes that jump pointers and the self code size
     * resolve to. Programs must stay below 2^24 bytes.
     */
    inline constexpr std::size_t address_width = 3;

    /// A single instruction with no immediate data.
    struct Plain
    {
        evm::EvmOpCode opcode;

        bool operator==(Plain const &) const = default;
    };

    /**
     * `PUSHN` where N is the length of `value`, at most 32. A longer value
     * still encodes, as the byte `PUSH0 + N`, and the interpreter fails with
     * `value_overflow` when it executes it. `make_push` rejects such values.
     */
    struct Push
    {
        byte_string value;

        std::size_t n() const
        {
            return value.size();
        }

        bool operator==(Push const &) const = default;
    };

    struct Dup
    {
        std::uint8_t n;

        bool operator==(Dup const &) const = default;
    };

    struct Swap
    {
        std::uint8_t n;

        bool operator==(Swap const &) const = default;
    };

    /// The 0xFE sentinel, which carries every byte that follows it.
    struct Invalid
    {
        byte_string data;

        bool operator==(Invalid const &) const = default;
    };

    /// Placeholder for a push of the offset of the matching `JumpDest`.
    struct JumpPointer
    {
        Label label;

        bool operator==(JumpPointer const &) const = default;
    };

    /// Placeholder for a `JUMPDEST` that a `JumpPointer` refers to.
    struct JumpDest
    {
        Label label;

        bool operator==(JumpDest const &) const = default;
    };

    /// Placeholder for a push of the total assembled length.
    struct SelfCodeSize
    {
        bool operator==(SelfCodeSize const &) const = default;
    };

    using Token = std::variant<
        Plain, Push, Dup, Swap, Invalid, JumpPointer, JumpDest, SelfCodeSize>;

    using Program = std::vector<Token>;

    /**
     * Builds a push of exactly the given bytes; throws `InvalidAssembly` if
     * there are more than 32 of them.
     */
    Push make_push(byte_string_view value);

    /**
     * Builds a push of `n` bytes; throws `InvalidAssembly` unless
     * `n == value.size()`.
     */
    Push make_push(std::size_t n, byte_string_view value);

    /// Whether the token is a placeholder the jump resolver rewrites.
    bool is_placeholder(Token const &token);

    /// Whether no placeholders remain in the program.
    bool is_resolved(Program const &program);
}
