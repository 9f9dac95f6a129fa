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

#include <kiln/vm/assembly/assembler.hpp>
#include <kiln/vm/assembly/compiler.hpp>
#include <kiln/vm/assembly/encoder.hpp>
#include <kiln/vm/assembly/resolver.hpp>
#include <kiln/vm/evm/opcodes.hpp>

namespace kiln::vm::assembly
{
    using namespace evm;

    byte_string assemble(Program const &program)
    {
        return encode(resolve(program));
    }

    byte_string build(Expr const &expr)
    {
        return assemble(compile(expr));
    }

    byte_string build(ExprList const &exprs)
    {
        return assemble(compile(exprs));
    }

    byte_string constructor(byte_string_view const code)
    {
        auto const size = code.size();
        auto init = build(ExprList{
            op(CODECOPY, 0, self_code_size(), size),
            op(RETURN, 0, size),
        });
        init.append(code);
        return init;
    }
}
