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

#include <kiln/vm/assembly/encoder.hpp>
#include <kiln/vm/assembly/token.hpp>
#include <kiln/vm/evm/opcodes.hpp>
#include <kiln/vm/interpreter/context.hpp>
#include <kiln/vm/interpreter/vm_error.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <utility>
#include <variant>

namespace kiln::vm::interpreter
{
    namespace
    {
        /// `offset + size` if it is within `memory_limit`.
        VmResult<std::size_t>
        checked_end(Word const &offset, Word const &size)
        {
            if (offset > memory_limit || size > memory_limit ||
                offset + size > memory_limit) {
                return VmError{VmErrorCode::out_of_memory};
            }
            return static_cast<std::size_t>(offset + size);
        }
    }

    VmResult<Word> Stack::pop()
    {
        if (items_.empty()) {
            return VmError{VmErrorCode::stack_underflow};
        }
        auto const value = items_.back();
        items_.pop_back();
        return value;
    }

    VmResult<void> Stack::push(Word const &value)
    {
        if (items_.size() >= stack_limit) {
            return VmError{VmErrorCode::stack_overflow};
        }
        items_.push_back(value);
        return outcome::success();
    }

    VmResult<Word> Stack::peek(std::size_t const n) const
    {
        if (n >= items_.size()) {
            return VmError{VmErrorCode::stack_underflow};
        }
        return items_[items_.size() - 1 - n];
    }

    VmResult<void> Stack::swap(std::size_t const n)
    {
        if (n >= items_.size()) {
            return VmError{VmErrorCode::stack_underflow};
        }
        std::swap(items_.back(), items_[items_.size() - 1 - n]);
        return outcome::success();
    }

    std::vector<Word> Stack::top_first() const
    {
        return {items_.rbegin(), items_.rend()};
    }

    VmResult<std::size_t> Memory::expand(Word const &offset, Word const &size)
    {
        BOOST_OUTCOME_TRY(auto const end, checked_end(offset, size));
        if (data_.size() < end) {
            data_.resize(end, 0);
        }
        return static_cast<std::size_t>(offset);
    }

    VmResult<byte_string> Memory::read(Word const &offset, Word const &size)
    {
        BOOST_OUTCOME_TRY(auto const start, expand(offset, size));
        return data_.substr(start, static_cast<std::size_t>(size));
    }

    VmResult<void>
    Memory::write(Word const &offset, byte_string_view const data)
    {
        BOOST_OUTCOME_TRY(auto const start, expand(offset, data.size()));
        std::copy(data.begin(), data.end(), data_.begin() + start);
        return outcome::success();
    }

    VmResult<byte_string> read_padded(
        byte_string_view const src, Word const &offset, Word const &size)
    {
        BOOST_OUTCOME_TRY(checked_end(offset, size));
        auto const start = static_cast<std::size_t>(offset);
        auto const n = static_cast<std::size_t>(size);
        byte_string out(n, 0);
        if (start < src.size()) {
            auto const available = std::min(n, src.size() - start);
            std::memcpy(out.data(), src.data() + start, available);
        }
        return out;
    }

    Context::Context(assembly::Program program)
        : code{std::move(program)}
        , encoded{assembly::encode(code)}
    {
        std::size_t offset = 0;
        for (std::size_t i = 0; i < code.size(); ++i) {
            op_map.emplace(offset, i);
            offset += assembly::token_size(code[i]);
        }
    }

    VmResult<assembly::Token const *> Context::fetch() const
    {
        auto const it = op_map.find(pc);
        if (it == op_map.end()) {
            return VmError{VmErrorCode::pc_out_of_bounds};
        }
        return &code[it->second];
    }

    bool Context::is_jumpdest(Word const &target) const
    {
        if (target >= encoded.size()) {
            return false;
        }
        auto const it = op_map.find(static_cast<std::size_t>(target));
        if (it == op_map.end()) {
            return false;
        }
        auto const *plain = std::get_if<assembly::Plain>(&code[it->second]);
        return plain && plain->opcode == evm::JUMPDEST;
    }
}
