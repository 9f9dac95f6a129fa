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

#include <kiln/core/byte_string.hpp>
#include <kiln/core/hex.hpp>
#include <kiln/vm/assembly/decoder.hpp>
#include <kiln/vm/assembly/show.hpp>
#include <kiln/vm/assembly/token.hpp>
#include <kiln/vm/evm/opcodes.hpp>

#include <gtest/gtest.h>

using namespace kiln;
using namespace kiln::literals;
using namespace kiln::vm::assembly;
using enum kiln::vm::evm::EvmOpCode;

TEST(Show, Tokens)
{
    ASSERT_EQ(show_token(Plain{MSTORE}), "MSTORE");
    ASSERT_EQ(show_token(Plain{PREVRANDAO}), "PREVRANDAO");
    ASSERT_EQ(show_token(Push{byte_string{}}), "PUSH0");
    ASSERT_EQ(show_token(Push{0x0102030405_hex}), "PUSH5 0x0102030405");
    ASSERT_EQ(show_token(Dup{2}), "DUP2");
    ASSERT_EQ(show_token(Swap{16}), "SWAP16");
    ASSERT_EQ(show_token(Invalid{0x01_hex}), "INVALID");
    ASSERT_EQ(show_token(JumpPointer{3}), "JUMPPTR 3");
    ASSERT_EQ(show_token(JumpDest{3}), "JUMPDEST 3");
    ASSERT_EQ(show_token(SelfCodeSize{}), "SELFCODESIZE");
}

TEST(Show, Program)
{
    auto const listing = show_program(decode(0x6101025f8192fe0102_hex));
    ASSERT_EQ(
        listing,
        "0000: PUSH2 0x0102\n"
        "0003: PUSH0\n"
        "0004: DUP2\n"
        "0005: SWAP3\n"
        "0006: INVALID (2 data bytes)\n");
}

TEST(Show, EmptyProgram)
{
    ASSERT_EQ(show_program(Program{}), "");
}
