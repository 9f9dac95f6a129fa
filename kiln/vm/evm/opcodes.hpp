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

#include <kiln/core/assert.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

namespace kiln::vm::evm
{
    /**
     * Details of how an individual EVM opcode affects the stack when executed.
     */
    struct OpCodeInfo
    {
        /**
         * The human-readable (disassembled) form of the opcode.
         */
        std::string_view name;

        /**
         * The number of immediate bytes that follow this opcode in a binary
         * EVM program. Non-zero only for the `PUSHN` family.
         */
        std::uint8_t num_args;

        /**
         * The number of stack items consumed by this instruction. For the
         * assembler this is also the number of operands an operation form
         * takes.
         */
        std::uint8_t min_stack;

        /**
         * The number of stack items produced by this instruction.
         */
        std::uint8_t stack_increase;

        /**
         * N for all PUSHN, SWAPN, DUPN and LOGN instructions, and 0 otherwise.
         */
        std::uint8_t index;
    };

    constexpr bool operator==(OpCodeInfo const &a, OpCodeInfo const &b)
    {
        return std::tie(a.name, a.num_args, a.min_stack, a.stack_increase) ==
               std::tie(b.name, b.num_args, b.min_stack, b.stack_increase);
    }

    /**
     * Mnemonic mapping of human-readable opcode names to their underlying byte
     * values.
     */
    enum EvmOpCode : uint8_t
    {
        STOP = 0x00,
        ADD = 0x01,
        MUL = 0x02,
        SUB = 0x03,
        DIV = 0x04,
        SDIV = 0x05,
        MOD = 0x06,
        SMOD = 0x07,
        ADDMOD = 0x08,
        MULMOD = 0x09,
        EXP = 0x0A,
        SIGNEXTEND = 0x0B,
        LT = 0x10,
        GT = 0x11,
        SLT = 0x12,
        SGT = 0x13,
        EQ = 0x14,
        ISZERO = 0x15,
        AND = 0x16,
        OR = 0x17,
        XOR = 0x18,
        NOT = 0x19,
        BYTE = 0x1A,
        SHL = 0x1B,
        SHR = 0x1C,
        SAR = 0x1D,
        SHA3 = 0x20,
        ADDRESS = 0x30,
        BALANCE = 0x31,
        ORIGIN = 0x32,
        CALLER = 0x33,
        CALLVALUE = 0x34,
        CALLDATALOAD = 0x35,
        CALLDATASIZE = 0x36,
        CALLDATACOPY = 0x37,
        CODESIZE = 0x38,
        CODECOPY = 0x39,
        GASPRICE = 0x3A,
        EXTCODESIZE = 0x3B,
        EXTCODECOPY = 0x3C,
        RETURNDATASIZE = 0x3D,
        RETURNDATACOPY = 0x3E,
        EXTCODEHASH = 0x3F,
        BLOCKHASH = 0x40,
        COINBASE = 0x41,
        TIMESTAMP = 0x42,
        NUMBER = 0x43,
        PREVRANDAO = 0x44,
        GASLIMIT = 0x45,
        CHAINID = 0x46,
        SELFBALANCE = 0x47,
        BASEFEE = 0x48,
        BLOBHASH = 0x49,
        BLOBBASEFEE = 0x4A,
        POP = 0x50,
        MLOAD = 0x51,
        MSTORE = 0x52,
        MSTORE8 = 0x53,
        SLOAD = 0x54,
        SSTORE = 0x55,
        JUMP = 0x56,
        JUMPI = 0x57,
        PC = 0x58,
        MSIZE = 0x59,
        GAS = 0x5A,
        JUMPDEST = 0x5B,
        TLOAD = 0x5C,
        TSTORE = 0x5D,
        MCOPY = 0x5E,
        PUSH0 = 0x5F,
        PUSH1 = 0x60,
        PUSH32 = 0x7F,
        DUP1 = 0x80,
        DUP16 = 0x8F,
        SWAP1 = 0x90,
        SWAP16 = 0x9F,
        LOG0 = 0xA0,
        LOG1 = 0xA1,
        LOG2 = 0xA2,
        LOG3 = 0xA3,
        LOG4 = 0xA4,
        CREATE = 0xF0,
        CALL = 0xF1,
        CALLCODE = 0xF2,
        RETURN = 0xF3,
        DELEGATECALL = 0xF4,
        CREATE2 = 0xF5,
        STATICCALL = 0xFA,
        REVERT = 0xFD,
        INVALID = 0xFE,
        SELFDESTRUCT = 0xFF
    };

    /**
     * Placeholder value representing a byte that is not an instruction.
     */
    constexpr auto unknown_opcode_info = OpCodeInfo{"UNKNOWN", 0, 0, 0, 0};

    /**
     * Lookup table of opcode info for each possible 1-byte opcode value.
     * Bytes that do not correspond to an instruction map to
     * `unknown_opcode_info`.
     */
    consteval std::array<OpCodeInfo, 256> make_opcode_table();

    constexpr bool is_push_opcode(uint8_t const opcode)
    {
        return opcode >= PUSH0 && opcode <= PUSH32;
    }

    constexpr bool is_dup_opcode(uint8_t const opcode)
    {
        return opcode >= DUP1 && opcode <= DUP16;
    }

    constexpr bool is_swap_opcode(uint8_t const opcode)
    {
        return opcode >= SWAP1 && opcode <= SWAP16;
    }

    constexpr bool is_log_opcode(uint8_t const opcode)
    {
        return opcode >= LOG0 && opcode <= LOG4;
    }

    /**
     * Whether the opcode belongs to a family that carries its parameter in
     * the opcode byte itself (PUSHN, DUPN, SWAPN) or is the INVALID sentinel.
     * Such bytes are represented by dedicated tokens rather than plain
     * instructions.
     */
    constexpr bool is_parameterised_opcode(uint8_t const opcode)
    {
        return is_push_opcode(opcode) || is_dup_opcode(opcode) ||
               is_swap_opcode(opcode) || opcode == INVALID;
    }

    consteval inline void add_opcode(
        std::uint8_t opcode, std::array<OpCodeInfo, 256> &table,
        OpCodeInfo info)
    {
        KILN_DEBUG_ASSERT(table[opcode] == unknown_opcode_info);
        table[opcode] = info;
    }

    consteval std::array<OpCodeInfo, 256> make_opcode_table()
    {
        std::array<OpCodeInfo, 256> table{};
        table.fill(unknown_opcode_info);

        add_opcode(STOP, table, {"STOP", 0, 0, 0, 0});
        add_opcode(ADD, table, {"ADD", 0, 2, 1, 0});
        add_opcode(MUL, table, {"MUL", 0, 2, 1, 0});
        add_opcode(SUB, table, {"SUB", 0, 2, 1, 0});
        add_opcode(DIV, table, {"DIV", 0, 2, 1, 0});
        add_opcode(SDIV, table, {"SDIV", 0, 2, 1, 0});
        add_opcode(MOD, table, {"MOD", 0, 2, 1, 0});
        add_opcode(SMOD, table, {"SMOD", 0, 2, 1, 0});
        add_opcode(ADDMOD, table, {"ADDMOD", 0, 3, 1, 0});
        add_opcode(MULMOD, table, {"MULMOD", 0, 3, 1, 0});
        add_opcode(EXP, table, {"EXP", 0, 2, 1, 0});
        add_opcode(SIGNEXTEND, table, {"SIGNEXTEND", 0, 2, 1, 0});

        add_opcode(LT, table, {"LT", 0, 2, 1, 0});
        add_opcode(GT, table, {"GT", 0, 2, 1, 0});
        add_opcode(SLT, table, {"SLT", 0, 2, 1, 0});
        add_opcode(SGT, table, {"SGT", 0, 2, 1, 0});
        add_opcode(EQ, table, {"EQ", 0, 2, 1, 0});
        add_opcode(ISZERO, table, {"ISZERO", 0, 1, 1, 0});
        add_opcode(AND, table, {"AND", 0, 2, 1, 0});
        add_opcode(OR, table, {"OR", 0, 2, 1, 0});
        add_opcode(XOR, table, {"XOR", 0, 2, 1, 0});
        add_opcode(NOT, table, {"NOT", 0, 1, 1, 0});
        add_opcode(BYTE, table, {"BYTE", 0, 2, 1, 0});
        add_opcode(SHL, table, {"SHL", 0, 2, 1, 0});
        add_opcode(SHR, table, {"SHR", 0, 2, 1, 0});
        add_opcode(SAR, table, {"SAR", 0, 2, 1, 0});

        add_opcode(SHA3, table, {"SHA3", 0, 2, 1, 0});

        add_opcode(ADDRESS, table, {"ADDRESS", 0, 0, 1, 0});
        add_opcode(BALANCE, table, {"BALANCE", 0, 1, 1, 0});
        add_opcode(ORIGIN, table, {"ORIGIN", 0, 0, 1, 0});
        add_opcode(CALLER, table, {"CALLER", 0, 0, 1, 0});
        add_opcode(CALLVALUE, table, {"CALLVALUE", 0, 0, 1, 0});
        add_opcode(CALLDATALOAD, table, {"CALLDATALOAD", 0, 1, 1, 0});
        add_opcode(CALLDATASIZE, table, {"CALLDATASIZE", 0, 0, 1, 0});
        add_opcode(CALLDATACOPY, table, {"CALLDATACOPY", 0, 3, 0, 0});
        add_opcode(CODESIZE, table, {"CODESIZE", 0, 0, 1, 0});
        add_opcode(CODECOPY, table, {"CODECOPY", 0, 3, 0, 0});
        add_opcode(GASPRICE, table, {"GASPRICE", 0, 0, 1, 0});
        add_opcode(EXTCODESIZE, table, {"EXTCODESIZE", 0, 1, 1, 0});
        add_opcode(EXTCODECOPY, table, {"EXTCODECOPY", 0, 4, 0, 0});
        add_opcode(RETURNDATASIZE, table, {"RETURNDATASIZE", 0, 0, 1, 0});
        add_opcode(RETURNDATACOPY, table, {"RETURNDATACOPY", 0, 3, 0, 0});
        add_opcode(EXTCODEHASH, table, {"EXTCODEHASH", 0, 1, 1, 0});

        add_opcode(BLOCKHASH, table, {"BLOCKHASH", 0, 1, 1, 0});
        add_opcode(COINBASE, table, {"COINBASE", 0, 0, 1, 0});
        add_opcode(TIMESTAMP, table, {"TIMESTAMP", 0, 0, 1, 0});
        add_opcode(NUMBER, table, {"NUMBER", 0, 0, 1, 0});
        add_opcode(PREVRANDAO, table, {"PREVRANDAO", 0, 0, 1, 0});
        add_opcode(GASLIMIT, table, {"GASLIMIT", 0, 0, 1, 0});
        add_opcode(CHAINID, table, {"CHAINID", 0, 0, 1, 0});
        add_opcode(SELFBALANCE, table, {"SELFBALANCE", 0, 0, 1, 0});
        add_opcode(BASEFEE, table, {"BASEFEE", 0, 0, 1, 0});
        add_opcode(BLOBHASH, table, {"BLOBHASH", 0, 1, 1, 0});
        add_opcode(BLOBBASEFEE, table, {"BLOBBASEFEE", 0, 0, 1, 0});

        add_opcode(POP, table, {"POP", 0, 1, 0, 0});
        add_opcode(MLOAD, table, {"MLOAD", 0, 1, 1, 0});
        add_opcode(MSTORE, table, {"MSTORE", 0, 2, 0, 0});
        add_opcode(MSTORE8, table, {"MSTORE8", 0, 2, 0, 0});
        add_opcode(SLOAD, table, {"SLOAD", 0, 1, 1, 0});
        add_opcode(SSTORE, table, {"SSTORE", 0, 2, 0, 0});
        add_opcode(JUMP, table, {"JUMP", 0, 1, 0, 0});
        add_opcode(JUMPI, table, {"JUMPI", 0, 2, 0, 0});
        add_opcode(PC, table, {"PC", 0, 0, 1, 0});
        add_opcode(MSIZE, table, {"MSIZE", 0, 0, 1, 0});
        add_opcode(GAS, table, {"GAS", 0, 0, 1, 0});
        add_opcode(JUMPDEST, table, {"JUMPDEST", 0, 0, 0, 0});
        add_opcode(TLOAD, table, {"TLOAD", 0, 1, 1, 0});
        add_opcode(TSTORE, table, {"TSTORE", 0, 2, 0, 0});
        add_opcode(MCOPY, table, {"MCOPY", 0, 3, 0, 0});

        constexpr std::string_view push_names[] = {
            "PUSH0",  "PUSH1",  "PUSH2",  "PUSH3",  "PUSH4",  "PUSH5",
            "PUSH6",  "PUSH7",  "PUSH8",  "PUSH9",  "PUSH10", "PUSH11",
            "PUSH12", "PUSH13", "PUSH14", "PUSH15", "PUSH16", "PUSH17",
            "PUSH18", "PUSH19", "PUSH20", "PUSH21", "PUSH22", "PUSH23",
            "PUSH24", "PUSH25", "PUSH26", "PUSH27", "PUSH28", "PUSH29",
            "PUSH30", "PUSH31", "PUSH32"};
        for (uint8_t i = 0; i <= 32; ++i) {
            add_opcode(
                static_cast<uint8_t>(PUSH0 + i),
                table,
                {push_names[i], i, 0, 1, i});
        }

        constexpr std::string_view dup_names[] = {
            "DUP1",
            "DUP2",
            "DUP3",
            "DUP4",
            "DUP5",
            "DUP6",
            "DUP7",
            "DUP8",
            "DUP9",
            "DUP10",
            "DUP11",
            "DUP12",
            "DUP13",
            "DUP14",
            "DUP15",
            "DUP16"};
        constexpr std::string_view swap_names[] = {
            "SWAP1",
            "SWAP2",
            "SWAP3",
            "SWAP4",
            "SWAP5",
            "SWAP6",
            "SWAP7",
            "SWAP8",
            "SWAP9",
            "SWAP10",
            "SWAP11",
            "SWAP12",
            "SWAP13",
            "SWAP14",
            "SWAP15",
            "SWAP16"};
        for (uint8_t i = 1; i <= 16; ++i) {
            add_opcode(
                static_cast<uint8_t>(DUP1 + i - 1),
                table,
                {dup_names[i - 1], 0, i, static_cast<uint8_t>(i + 1), i});
            add_opcode(
                static_cast<uint8_t>(SWAP1 + i - 1),
                table,
                {swap_names[i - 1],
                 0,
                 static_cast<uint8_t>(i + 1),
                 static_cast<uint8_t>(i + 1),
                 i});
        }

        add_opcode(LOG0, table, {"LOG0", 0, 2, 0, 0});
        add_opcode(LOG1, table, {"LOG1", 0, 3, 0, 1});
        add_opcode(LOG2, table, {"LOG2", 0, 4, 0, 2});
        add_opcode(LOG3, table, {"LOG3", 0, 5, 0, 3});
        add_opcode(LOG4, table, {"LOG4", 0, 6, 0, 4});

        add_opcode(CREATE, table, {"CREATE", 0, 3, 1, 0});
        add_opcode(CALL, table, {"CALL", 0, 7, 1, 0});
        add_opcode(CALLCODE, table, {"CALLCODE", 0, 7, 1, 0});
        add_opcode(RETURN, table, {"RETURN", 0, 2, 0, 0});
        add_opcode(DELEGATECALL, table, {"DELEGATECALL", 0, 6, 1, 0});
        add_opcode(CREATE2, table, {"CREATE2", 0, 4, 1, 0});
        add_opcode(STATICCALL, table, {"STATICCALL", 0, 6, 1, 0});
        add_opcode(REVERT, table, {"REVERT", 0, 2, 0, 0});
        add_opcode(INVALID, table, {"INVALID", 0, 0, 0, 0});
        add_opcode(SELFDESTRUCT, table, {"SELFDESTRUCT", 0, 1, 0, 0});

        return table;
    }

    constexpr std::array<OpCodeInfo, 256> opcode_table = make_opcode_table();

    constexpr OpCodeInfo const &opcode_info(uint8_t const opcode)
    {
        return opcode_table[opcode];
    }

    constexpr bool is_known_opcode(uint8_t const opcode)
    {
        return opcode_table[opcode] != unknown_opcode_info;
    }

    /**
     * Case-insensitive lookup of an opcode by mnemonic. `DIFFICULTY` is
     * accepted as the pre-merge name of `PREVRANDAO`.
     */
    std::optional<EvmOpCode> find_opcode(std::string_view name);

    /**
     * Opcode must be the opcode of some DUPN instruction.
     * Returns `N`.
     */
    constexpr uint8_t get_dup_opcode_index(uint8_t const opcode)
    {
        KILN_DEBUG_ASSERT(is_dup_opcode(opcode));
        return static_cast<uint8_t>(opcode - DUP1 + 1);
    }

    /**
     * Opcode must be the opcode of some SWAPN instruction.
     * Returns `N`.
     */
    constexpr uint8_t get_swap_opcode_index(uint8_t const opcode)
    {
        KILN_DEBUG_ASSERT(is_swap_opcode(opcode));
        return static_cast<uint8_t>(opcode - SWAP1 + 1);
    }

    /**
     * Opcode must be the opcode of some PUSHN instruction.
     * Returns `N`.
     */
    constexpr uint8_t get_push_opcode_index(uint8_t const opcode)
    {
        KILN_DEBUG_ASSERT(is_push_opcode(opcode));
        return static_cast<uint8_t>(opcode - PUSH0);
    }
}
