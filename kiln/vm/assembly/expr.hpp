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
#include <kiln/vm/assembly/assembly_error.hpp>
#include <kiln/vm/evm/opcodes.hpp>
#include <kiln/vm/runtime/uint256.hpp>

#include <concepts>
#include <utility>
#include <variant>
#include <vector>

namespace kiln::vm::assembly
{
    struct Expr;

    using ExprList = std::vector<Expr>;

    /**
     * An operation applied to operands. The number of operands must equal the
     * opcode's stack input count; an operation with no operands is a bare
     * mnemonic.
     */
    struct Form
    {
        evm::EvmOpCode opcode;
        ExprList args;
    };

    /// A literal pushed with exactly its own length.
    struct Bytes
    {
        byte_string value;
    };

    /// A literal pushed with its minimal big-endian encoding.
    struct Integer
    {
        runtime::uint256_t value;
    };

    /// A sequence of expressions spliced in order.
    struct List
    {
        ExprList items;
    };

    /**
     * Runs `non_zero` when `cond` is non-zero. When `cond` is zero, `zero`
     * runs and, unless it halts or jumps away, continues into `non_zero`.
     */
    struct If
    {
        ExprList cond;
        ExprList non_zero;
        ExprList zero;
    };

    /// Pushes the total length of the assembled program.
    struct SelfCodeSizeRef
    {
    };

    struct Expr
    {
        using T = std::variant<Form, Bytes, Integer, List, If, SelfCodeSizeRef>;

        T node;

        Expr(evm::EvmOpCode const opcode)
            : node{Form{opcode, {}}}
        {
        }

        Expr(byte_string value)
            : node{Bytes{std::move(value)}}
        {
        }

        Expr(runtime::uint256_t const &value)
            : node{Integer{value}}
        {
        }

        template <std::integral I>
        Expr(I const value)
            : node{Integer{to_word(value)}}
        {
        }

        Expr(Form form)
            : node{std::move(form)}
        {
        }

        Expr(Bytes bytes)
            : node{std::move(bytes)}
        {
        }

        Expr(Integer integer)
            : node{std::move(integer)}
        {
        }

        Expr(List list)
            : node{std::move(list)}
        {
        }

        Expr(If branch)
            : node{std::move(branch)}
        {
        }

        Expr(SelfCodeSizeRef ref)
            : node{ref}
        {
        }

    private:
        template <std::integral I>
        static runtime::uint256_t to_word(I const value)
        {
            if constexpr (std::is_signed_v<I>) {
                if (value < 0) {
                    throw InvalidAssembly("negative integer literal");
                }
            }
            return runtime::uint256_t{static_cast<uint64_t>(value)};
        }
    };

    template <typename... Args>
    Expr op(evm::EvmOpCode const opcode, Args &&...args)
    {
        return Form{opcode, ExprList{Expr(std::forward<Args>(args))...}};
    }

    inline Expr if_(Expr cond, Expr non_zero, Expr zero)
    {
        return If{
            ExprList{std::move(cond)},
            ExprList{std::move(non_zero)},
            ExprList{std::move(zero)}};
    }

    inline Expr list(ExprList items)
    {
        return List{std::move(items)};
    }

    inline Expr self_code_size()
    {
        return SelfCodeSizeRef{};
    }
}
