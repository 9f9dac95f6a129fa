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

#include <kiln/vm/evm/opcodes.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>

using namespace kiln::vm::evm;

TEST(OpCodes, TableNamesMatchEnum)
{
    ASSERT_EQ(opcode_info(ADD).name, "ADD");
    ASSERT_EQ(opcode_info(PREVRANDAO).name, "PREVRANDAO");
    ASSERT_EQ(opcode_info(static_cast<uint8_t>(PUSH1 + 4)).name, "PUSH5");
    ASSERT_EQ(opcode_info(DUP16).name, "DUP16");
    ASSERT_EQ(opcode_info(SWAP1).name, "SWAP1");
    ASSERT_EQ(opcode_info(INVALID).name, "INVALID");
    ASSERT_EQ(opcode_info(0x0C), unknown_opcode_info);
}

TEST(OpCodes, StackInputCounts)
{
    ASSERT_EQ(opcode_info(STOP).min_stack, 0);
    ASSERT_EQ(opcode_info(ISZERO).min_stack, 1);
    ASSERT_EQ(opcode_info(MSTORE).min_stack, 2);
    ASSERT_EQ(opcode_info(CODECOPY).min_stack, 3);
    ASSERT_EQ(opcode_info(LOG1).min_stack, 3);
    ASSERT_EQ(opcode_info(LOG4).min_stack, 6);
    ASSERT_EQ(opcode_info(CALL).min_stack, 7);
    ASSERT_EQ(opcode_info(PUSH32).num_args, 32);
}

TEST(OpCodes, Families)
{
    for (uint8_t i = PUSH0; i <= PUSH32; ++i) {
        ASSERT_TRUE(is_push_opcode(i));
        ASSERT_TRUE(is_parameterised_opcode(i));
        ASSERT_EQ(get_push_opcode_index(i), i - PUSH0);
    }
    ASSERT_EQ(get_dup_opcode_index(DUP1), 1);
    ASSERT_EQ(get_swap_opcode_index(SWAP16), 16);
    ASSERT_TRUE(is_parameterised_opcode(INVALID));
    ASSERT_FALSE(is_parameterised_opcode(JUMPDEST));
    ASSERT_TRUE(is_log_opcode(LOG0));
    ASSERT_FALSE(is_log_opcode(RETURN));
}

TEST(OpCodes, KnownOpcodeCount)
{
    int known = 0;
    for (int i = 0; i < 256; ++i) {
        if (is_known_opcode(static_cast<uint8_t>(i))) {
            ++known;
        }
    }
    // 83 plain instructions, 33 pushes, 16 dups, 16 swaps, INVALID.
    ASSERT_EQ(known, 149);
}

TEST(OpCodes, FindOpcode)
{
    ASSERT_EQ(find_opcode("mstore"), std::optional{MSTORE});
    ASSERT_EQ(find_opcode("CallValue"), std::optional{CALLVALUE});
    ASSERT_EQ(find_opcode("difficulty"), std::optional{PREVRANDAO});
    ASSERT_EQ(find_opcode("prevrandao"), std::optional{PREVRANDAO});
    ASSERT_EQ(find_opcode("push1"), std::optional<EvmOpCode>{PUSH1});
    ASSERT_FALSE(find_opcode("mstore9").has_value());
    ASSERT_FALSE(find_opcode("UNKNOWN").has_value());
    ASSERT_FALSE(find_opcode("").has_value());
}
