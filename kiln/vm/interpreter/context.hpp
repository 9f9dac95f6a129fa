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
#include <kiln/vm/assembly/token.hpp>
#include <kiln/vm/interpreter/vm_error.hpp>
#include <kiln/vm/runtime/uint256.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

namespace kiln::vm::interpreter
{
    using Word = runtime::uint256_t;

    inline constexpr std::size_t stack_limit = 1024;

    inline constexpr std::size_t memory_limit = 10'000'000;

    /**
     * Operand stack, bounded at `stack_limit` items. Index 0 is the top.
     */
    class Stack
    {
    public:
        VmResult<Word> pop();
        VmResult<void> push(Word const &value);

        /// The item `n` places below the top.
        VmResult<Word> peek(std::size_t n) const;

        /// Exchanges the top with the item `n` places below it.
        VmResult<void> swap(std::size_t n);

        std::size_t size() const
        {
            return items_.size();
        }

        /// Copy of the stack, top first.
        std::vector<Word> top_first() const;

    private:
        std::vector<Word> items_;
    };

    /**
     * Byte-addressed scratch memory. Any access to `[offset, offset + size)`
     * first zero-extends the memory to cover it, and fails with
     * `out_of_memory` if that would exceed `memory_limit` bytes. Memory never
     * shrinks.
     */
    class Memory
    {
    public:
        VmResult<byte_string> read(Word const &offset, Word const &size);
        VmResult<void> write(Word const &offset, byte_string_view data);

        std::size_t size() const
        {
            return data_.size();
        }

        byte_string const &data() const
        {
            return data_;
        }

    private:
        VmResult<std::size_t> expand(Word const &offset, Word const &size);

        byte_string data_;
    };

    /**
     * Slice `[offset, offset + size)` of `src`, zero-padded past its end,
     * subject to the same bound as memory.
     */
    VmResult<byte_string>
    read_padded(byte_string_view src, Word const &offset, Word const &size);

    /**
     * State of a single execution. Created from a resolved program and owned
     * by exactly one run.
     */
    struct Context
    {
        explicit Context(assembly::Program program);

        /// The token starting at `pc`, or `pc_out_of_bounds`.
        VmResult<assembly::Token const *> fetch() const;

        /// Whether `target` is the offset of a `JUMPDEST`.
        bool is_jumpdest(Word const &target) const;

        assembly::Program code;
        byte_string encoded;
        std::unordered_map<std::size_t, std::size_t> op_map;
        std::size_t pc{0};
        bool halted{false};
        Stack stack;
        Memory memory;
        std::map<Word, Word> transient_storage;
        bool reverted{false};
        byte_string return_data;
    };
}
