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
#include <kiln/vm/assembly/compiler.hpp>
#include <kiln/vm/assembly/expr.hpp>
#include <kiln/vm/assembly/token.hpp>
#include <kiln/vm/evm/opcodes.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>
#include <format>
#include <ranges>
#include <variant>

namespace kiln::vm::assembly
{
    byte_string encode_unsigned(runtime::uint256_t const &value)
    {
        uint8_t buf[32];
        intx::be::store(buf, value);
        std::size_t start = 0;
        while (start < 31 && buf[start] == 0) {
            ++start;
        }
        return byte_string(&buf[start], 32 - start);
    }

    Program Compiler::compile(Expr const &expr)
    {
        Program out;
        emit(expr, out);
        return out;
    }

    Program Compiler::compile(ExprList const &exprs)
    {
        Program out;
        emit(exprs, out);
        return out;
    }

    void Compiler::emit(ExprList const &exprs, Program &out)
    {
        for (auto const &expr : exprs) {
            emit(expr, out);
        }
    }

    void Compiler::emit(Expr const &expr, Program &out)
    {
        std::visit(
            Cases{
                [&](Form const &form) {
                    auto const &info = evm::opcode_info(form.opcode);
                    if (!evm::is_known_opcode(form.opcode) ||
                        evm::is_parameterised_opcode(form.opcode)) {
                        throw InvalidAssembly(std::format(
                            "invalid or unknown assembly: opcode 0x{:02x}",
                            static_cast<unsigned>(form.opcode)));
                    }
                    if (form.args.size() != info.min_stack) {
                        throw InvalidAssembly(std::format(
                            "{} takes {} operands, got {}",
                            info.name,
                            info.min_stack,
                            form.args.size()));
                    }
                    for (auto const &arg : std::views::reverse(form.args)) {
                        emit(arg, out);
                    }
                    out.emplace_back(Plain{form.opcode});
                },
                [&](Bytes const &bytes) {
                    if (bytes.value.size() > 32) {
                        throw InvalidAssembly(std::format(
                            "binary value of {} bytes is larger than 32 bytes",
                            bytes.value.size()));
                    }
                    out.emplace_back(make_push(bytes.value));
                },
                [&](Integer const &integer) {
                    out.emplace_back(make_push(encode_unsigned(integer.value)));
                },
                [&](List const &list) { emit(list.items, out); },
                [&](If const &branch) {
                    auto const label = next_label_++;
                    emit(branch.cond, out);
                    out.emplace_back(JumpPointer{label});
                    out.emplace_back(Plain{evm::JUMPI});
                    emit(branch.zero, out);
                    out.emplace_back(JumpDest{label});
                    emit(branch.non_zero, out);
                },
                [&](SelfCodeSizeRef const &) {
                    out.emplace_back(SelfCodeSize{});
                }},
            expr.node);
    }

    Program compile(Expr const &expr)
    {
        return Compiler{}.compile(expr);
    }

    Program compile(ExprList const &exprs)
    {
        return Compiler{}.compile(exprs);
    }
}
