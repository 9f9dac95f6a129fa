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

#include <kiln/vm/assembly/expr.hpp>
#include <kiln/vm/assembly/token.hpp>

namespace kiln::vm::assembly
{
    /**
     * Lowers an operation tree to a flat token sequence. Operands are emitted
     * in reverse, so that the first operand is on top of the stack when the
     * operation runs. Labels for `If` count up from zero over the lifetime of
     * the compiler; the free `compile` functions use a fresh one per call.
     */
    class Compiler
    {
    public:
        Program compile(Expr const &expr);
        Program compile(ExprList const &exprs);

    private:
        void emit(Expr const &expr, Program &out);
        void emit(ExprList const &exprs, Program &out);

        Label next_label_{0};
    };

    Program compile(Expr const &expr);
    Program compile(ExprList const &exprs);

    /// Minimal big-endian encoding of `value`; zero encodes as one zero byte.
    byte_string encode_unsigned(runtime::uint256_t const &value);
}
