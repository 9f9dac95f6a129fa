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

#include <kiln/core/ascii.hpp>
#include <kiln/core/byte_string.hpp>
#include <kiln/core/hex.hpp>
#include <kiln/vm/assembly/assembler.hpp>
#include <kiln/vm/assembly/assembly_error.hpp>
#include <kiln/vm/assembly/compiler.hpp>
#include <kiln/vm/assembly/expr.hpp>
#include <kiln/vm/assembly/reader.hpp>
#include <kiln/vm/evm/opcodes.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace kiln;
using namespace kiln::literals;
using namespace kiln::vm::assembly;
using enum kiln::vm::evm::EvmOpCode;

namespace
{
    byte_string build_text(std::string const &text)
    {
        return build(read_program(text));
    }
}

TEST(Reader, Forms)
{
    ASSERT_EQ(build_text("(log1 0 0 55)"), 0x603760006000a1_hex);
    ASSERT_EQ(
        build_text("(mstore 0 #x11223344) (revert 28 4)"),
        0x63112233446000526004601cfd_hex);
}

TEST(Reader, CheckOrigin)
{
    auto const text = R"(
        ; store a marker, then revert with it unless there is an origin
        (mstore 0 0x01020304)
        (if origin
            (revert 28 4)
            (return 0 0))
    )";
    ASSERT_EQ(
        to_hex(build_text(text)),
        "0x630102030460005232620000135760006000f35b6004601cfd");
}

TEST(Reader, MatchesTreeBuiltInCode)
{
    auto const text = R"(
        (mstore 0 258)
        (if (sub 0 callvalue) (revert 31 2) (revert 30 2))
    )";
    auto const expected = build(ExprList{
        op(MSTORE, 0, 0x0102),
        if_(op(SUB, 0, CALLVALUE), op(REVERT, 31, 2), op(REVERT, 30, 2)),
    });
    ASSERT_EQ(build_text(text), expected);
}

TEST(Reader, ListsAndAtoms)
{
    auto const exprs = read_program("[callvalue [pc]] STOP self-code-size");
    ASSERT_EQ(exprs.size(), 3);
    ASSERT_EQ(
        compile(exprs),
        (Program{
            Plain{CALLVALUE}, Plain{PC}, Plain{STOP}, SelfCodeSize{}}));
}

TEST(Reader, MnemonicsAreCaseInsensitive)
{
    ASSERT_EQ(
        compile(read_program("(MStore 0 (Add 1 2)) Difficulty")),
        compile(ExprList{op(MSTORE, 0, op(ADD, 1, 2)), PREVRANDAO}));
    ASSERT_EQ(
        build_text("(IF callvalue 1 2) Self-Code-Size stop"),
        build_text("(if callvalue 1 2) self-code-size stop"));
    ASSERT_FALSE(iequals("ADD", "ADDMOD"));
    ASSERT_TRUE(iequals("PrevRandao", "PREVRANDAO"));
}

TEST(Reader, IntegerBases)
{
    ASSERT_EQ(build_text("255"), 0x60ff_hex);
    ASSERT_EQ(build_text("0xff"), 0x60ff_hex);
    ASSERT_EQ(build_text("0"), 0x6000_hex);
    ASSERT_EQ(build_text("#x"), 0x5f_hex);
    ASSERT_EQ(build_text("#x0000"), 0x610000_hex);
}

TEST(Reader, Empty)
{
    ASSERT_TRUE(read_program("").empty());
    ASSERT_TRUE(read_program("  ; nothing here\n").empty());
}

TEST(Reader, Errors)
{
    ASSERT_THROW(read_program("(mstore 0 1"), InvalidAssembly);
    ASSERT_THROW(read_program("[stop"), InvalidAssembly);
    ASSERT_THROW(read_program(")"), InvalidAssembly);
    ASSERT_THROW(read_program("(frobnicate 1)"), InvalidAssembly);
    ASSERT_THROW(read_program("frobnicate"), InvalidAssembly);
    ASSERT_THROW(read_program("#x123"), InvalidAssembly);
    ASSERT_THROW(read_program("#xzz"), InvalidAssembly);
    ASSERT_THROW(read_program("12abc"), InvalidAssembly);
    ASSERT_THROW(
        read_program(
            "0x1000000000000000000000000000000000000000000000000000000000000000"
            "00"),
        InvalidAssembly);
    ASSERT_THROW(read_program("(if 1 2)"), InvalidAssembly);
    ASSERT_THROW(read_program("()"), InvalidAssembly);
    ASSERT_THROW(read_program("@"), InvalidAssembly);
}

TEST(Reader, ErrorsNameTheOffset)
{
    try {
        read_program("(stop)\n(nosuchop 1)");
        FAIL() << "expected InvalidAssembly";
    }
    catch (InvalidAssembly const &e) {
        ASSERT_EQ(std::string{e.what()}, "unknown mnemonic 'nosuchop' at offset 8");
    }
}

TEST(Reader, ArityIsCheckedByCompiler)
{
    auto const exprs = read_program("(add 1)");
    ASSERT_THROW(compile(exprs), InvalidAssembly);
}
