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
#include <kiln/core/keccak.hpp>
#include <kiln/vm/assembly/assembler.hpp>
#include <kiln/vm/assembly/assembly_error.hpp>
#include <kiln/vm/assembly/compiler.hpp>
#include <kiln/vm/assembly/expr.hpp>
#include <kiln/vm/assembly/resolver.hpp>
#include <kiln/vm/assembly/token.hpp>
#include <kiln/vm/evm/opcodes.hpp>
#include <kiln/vm/interpreter/context.hpp>
#include <kiln/vm/interpreter/execute.hpp>
#include <kiln/vm/interpreter/vm_error.hpp>
#include <kiln/vm/runtime/uint256.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace kiln;
using namespace kiln::literals;
using namespace kiln::vm::assembly;
using namespace kiln::vm::interpreter;
using namespace intx;
using enum kiln::vm::evm::EvmOpCode;

namespace
{
    auto const pattern =
        0x112233445566778899aabbccddeeff112233445566778899aabbccddeeff1122_u256;

    Push word(Word const &value)
    {
        byte_string bytes(32, 0);
        intx::be::unsafe::store(bytes.data(), value);
        return Push{bytes};
    }

    ExecutionResult run(
        Program const &program, byte_string_view const calldata = {},
        Word const &value = 0, ExecConfig const &config = {})
    {
        auto r = exec(program, calldata, value, config);
        if (r.has_error()) {
            throw VmCallError{r.error()};
        }
        return std::move(r).value();
    }

    VmError run_error(Program const &program, ExecConfig const &config = {})
    {
        auto const r = exec(program, {}, 0, config);
        if (!r.has_error()) {
            throw std::logic_error{"expected execution to fail"};
        }
        return r.error();
    }

    hash256 zero_hash(byte_string_view)
    {
        return {};
    }
}

TEST(InterpreterStack, PushesAreTopFirst)
{
    auto const r = run(Program{
        word(0x100),
        word(0x101),
        Push{0x0102_hex},
        Push{byte_string{}},
        Plain{STOP}});
    ASSERT_EQ(r.stack, (std::vector<Word>{0, 0x102, 0x101, 0x100}));
    ASSERT_FALSE(r.reverted);
    ASSERT_TRUE(r.return_data.empty());
}

TEST(InterpreterStack, Pop)
{
    ASSERT_EQ(
        run(Program{word(1), word(2), Plain{POP}, Plain{STOP}}).stack,
        std::vector<Word>{1});
    ASSERT_EQ(
        run_error(Program{Plain{POP}}).code, VmErrorCode::stack_underflow);
}

TEST(InterpreterStack, Dup)
{
    Program const base{word(0x100), word(0x101), word(0x102), word(0x103)};
    auto const with = [&](Token const &token) {
        auto program = base;
        program.push_back(token);
        program.push_back(Plain{STOP});
        return program;
    };

    auto const dup1 = with(Dup{1});
    ASSERT_EQ(
        run(dup1).stack,
        (std::vector<Word>{0x103, 0x103, 0x102, 0x101, 0x100}));

    auto const dup2 = with(Dup{2});
    ASSERT_EQ(
        run(dup2).stack,
        (std::vector<Word>{0x102, 0x103, 0x102, 0x101, 0x100}));

    auto const dup5 = with(Dup{5});
    ASSERT_EQ(run_error(dup5).code, VmErrorCode::stack_underflow);
}

TEST(InterpreterStack, Swap)
{
    Program const base{word(0x100), word(0x101), word(0x102), word(0x103)};
    auto const with = [&](Token const &token) {
        auto program = base;
        program.push_back(token);
        program.push_back(Plain{STOP});
        return program;
    };

    auto const swap1 = with(Swap{1});
    ASSERT_EQ(
        run(swap1).stack, (std::vector<Word>{0x102, 0x103, 0x101, 0x100}));

    auto const swap3 = with(Swap{3});
    ASSERT_EQ(
        run(swap3).stack, (std::vector<Word>{0x100, 0x102, 0x101, 0x103}));

    auto const swap10 = with(Swap{10});
    ASSERT_EQ(run_error(swap10).code, VmErrorCode::stack_underflow);

    auto const swap4 = with(Swap{4});
    ASSERT_EQ(run_error(swap4).code, VmErrorCode::stack_underflow);
}

TEST(InterpreterStack, Overflow)
{
    Program program(stack_limit, Push{byte_string{}});
    program.push_back(Plain{STOP});
    ASSERT_EQ(run(program).stack.size(), stack_limit);

    program.insert(program.begin(), Push{byte_string{}});
    ASSERT_EQ(run_error(program).code, VmErrorCode::stack_overflow);
}

TEST(InterpreterStack, OversizedPush)
{
    ASSERT_EQ(
        run_error(Program{Push{byte_string(33, 0x01)}}).code,
        VmErrorCode::value_overflow);
}

TEST(InterpreterMemory, StoreLoad)
{
    auto const r = run(Program{
        word(pattern),
        word(100),
        Plain{MSTORE},
        word(110),
        Plain{MLOAD},
        Plain{STOP}});
    ASSERT_EQ(
        r.stack,
        std::vector<Word>{
            0xbbccddeeff112233445566778899aabbccddeeff112200000000000000000000_u256});
}

TEST(InterpreterMemory, Store8)
{
    auto const r = run(Program{
        word(pattern),
        word(100),
        Plain{MSTORE},
        word(0x112233445566778899aabbccddeeff112233445566778899aabbccddeeff11fe_u256),
        word(120),
        Plain{MSTORE8},
        word(110),
        Plain{MLOAD},
        Plain{STOP}});
    ASSERT_EQ(
        r.stack,
        std::vector<Word>{
            0xbbccddeeff1122334455fe778899aabbccddeeff112200000000000000000000_u256});
}

TEST(InterpreterMemory, SizeGrowsWithAccess)
{
    ASSERT_EQ(
        run(Program{Plain{MSIZE}, Plain{STOP}}).stack, std::vector<Word>{0});
    ASSERT_EQ(
        run(Program{
                word(pattern),
                word(100),
                Plain{MSTORE},
                word(110),
                Plain{MLOAD},
                Plain{POP},
                Plain{MSIZE},
                Plain{STOP}})
            .stack,
        std::vector<Word>{142});
    ASSERT_EQ(
        run(Program{
                Push{0xff_hex},
                Push{0x00_hex},
                Plain{MSTORE8},
                Plain{MSIZE},
                Plain{STOP}})
            .stack,
        std::vector<Word>{1});
}

TEST(InterpreterMemory, ZeroSizedAccessStillExpands)
{
    // SHA3 of nothing at offset 64.
    auto const r = run(Program{
        Push{byte_string{}},
        Push{0x40_hex},
        Plain{SHA3},
        Plain{MSIZE},
        Plain{STOP}});
    auto const empty = kiln::keccak256({});
    ASSERT_EQ(
        r.stack,
        (std::vector<Word>{64, intx::be::load<Word>(empty.bytes)}));
    ASSERT_EQ(
        r.stack[1],
        0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_u256);
}

TEST(InterpreterMemory, Limit)
{
    ASSERT_NO_THROW(
        run(Program{word(memory_limit - 32), Plain{MLOAD}, Plain{STOP}}));
    ASSERT_EQ(
        run_error(Program{word(memory_limit - 31), Plain{MLOAD}}).code,
        VmErrorCode::out_of_memory);
    ASSERT_EQ(
        run_error(Program{word(~Word{0}), Plain{MLOAD}}).code,
        VmErrorCode::out_of_memory);
    ASSERT_EQ(
        run_error(Program{word(~Word{0}), word(0), Plain{SHA3}}).code,
        VmErrorCode::out_of_memory);
}

TEST(InterpreterMemory, Copy)
{
    auto const r = run(Program{
        word(pattern),
        word(0),
        Plain{MSTORE},
        word(32),
        word(0),
        word(16),
        Plain{MCOPY},
        word(16),
        Plain{MLOAD},
        Plain{MSIZE},
        Plain{STOP}});
    ASSERT_EQ(r.stack, (std::vector<Word>{48, pattern}));
}

TEST(InterpreterMemory, Sha3)
{
    auto const r = run(Program{
        word(pattern),
        word(100),
        Plain{MSTORE},
        word(10),
        word(110),
        Plain{SHA3},
        Plain{STOP}});
    ASSERT_EQ(
        r.stack,
        std::vector<Word>{
            0x045e288bf0d99a3c6d375f2346e49d6ea1965518853fca8dbca586ba44775e46_u256});
}

TEST(InterpreterMemory, Sha3UsesConfiguredHash)
{
    ExecConfig config;
    config.hash = &zero_hash;
    auto const r = run(
        Program{word(10), word(110), Plain{SHA3}, Plain{STOP}}, {}, 0, config);
    ASSERT_EQ(r.stack, std::vector<Word>{0});
}

TEST(InterpreterStorage, Transient)
{
    auto const r = run(Program{
        word(0x42),
        word(1),
        Plain{TSTORE},
        word(0x43),
        word(1),
        Plain{TSTORE},
        word(1),
        Plain{TLOAD},
        word(2),
        Plain{TLOAD},
        Plain{STOP}});
    ASSERT_EQ(r.stack, (std::vector<Word>{0, 0x43}));
}

TEST(InterpreterControl, DirectJump)
{
    auto const program = [](byte_string const &target) {
        return Program{
            Push{target},
            Plain{JUMP},
            Plain{JUMPDEST},
            Push{0x02_hex},
            Plain{STOP},
            Plain{JUMPDEST},
            Push{0x03_hex},
            Plain{STOP}};
    };
    ASSERT_EQ(run(program(0x03_hex)).stack, std::vector<Word>{2});
    ASSERT_EQ(run(program(0x07_hex)).stack, std::vector<Word>{3});
    ASSERT_EQ(
        run_error(program(0x01_hex)).code, VmErrorCode::invalid_jump_dest);
    ASSERT_EQ(
        run_error(program(0x02_hex)).code, VmErrorCode::invalid_jump_dest);
    ASSERT_EQ(
        run_error(program(0x0b_hex)).code, VmErrorCode::invalid_jump_dest);
    ASSERT_EQ(
        run_error(program(byte_string(32, 0xff))).code,
        VmErrorCode::invalid_jump_dest);
}

TEST(InterpreterControl, ConditionalJump)
{
    auto const program = [](byte_string const &cond,
                            byte_string const &target) {
        return Program{
            Push{cond},
            Push{target},
            Plain{JUMPI},
            Push{0x02_hex},
            Plain{STOP},
            Plain{JUMPDEST},
            Push{0x03_hex},
            Plain{STOP}};
    };
    ASSERT_EQ(run(program(0x6f_hex, 0x08_hex)).stack, std::vector<Word>{3});
    ASSERT_EQ(run(program(0x00_hex, 0x08_hex)).stack, std::vector<Word>{2});
    // Not taken, so the target is never checked.
    ASSERT_EQ(run(program(0x00_hex, 0x01_hex)).stack, std::vector<Word>{2});
    ASSERT_EQ(
        run_error(program(0x01_hex, 0x00_hex)).code,
        VmErrorCode::invalid_jump_dest);
}

TEST(InterpreterControl, JumpIntoPushData)
{
    // The byte at offset 4 is 0x5b, but it is the immediate of a PUSH1.
    Program const program{
        Push{0x04_hex}, Plain{JUMP}, Push{0x5b_hex}, Plain{STOP}};
    ASSERT_EQ(assemble(program)[4], 0x5b);
    ASSERT_EQ(run_error(program).code, VmErrorCode::invalid_jump_dest);
}

TEST(InterpreterControl, ProgramCounter)
{
    auto const r = run(Program{
        Push{0x01_hex},
        Push{0x00_hex},
        Plain{POP},
        Plain{POP},
        Plain{PC},
        Plain{STOP}});
    ASSERT_EQ(r.stack, std::vector<Word>{6});
}

TEST(InterpreterControl, RunningOffTheEnd)
{
    ASSERT_EQ(run_error(Program{}).code, VmErrorCode::pc_out_of_bounds);
    ASSERT_EQ(
        run_error(Program{Push{0x01_hex}}).code,
        VmErrorCode::pc_out_of_bounds);
}

TEST(InterpreterControl, Invalid)
{
    ASSERT_EQ(
        run_error(Program{Invalid{0x11_hex}, Plain{STOP}}).code,
        VmErrorCode::invalid_operation);
}

TEST(InterpreterControl, ImpureOperations)
{
    for (auto const opcode : {ADDRESS, ORIGIN, CALLER, BALANCE, SLOAD, GAS,
                              LOG0, CALL, CREATE2, BLOBHASH, SELFDESTRUCT}) {
        auto const error = run_error(Program{Plain{opcode}});
        ASSERT_EQ(error.code, VmErrorCode::impure);
        ASSERT_EQ(error.opcode, std::optional{opcode});
    }
}

TEST(InterpreterControl, UnknownInstruction)
{
    auto const opcode = static_cast<kiln::vm::evm::EvmOpCode>(0x0C);
    auto const error = run_error(Program{Plain{opcode}});
    ASSERT_EQ(error.code, VmErrorCode::not_implemented);
    ASSERT_EQ(error.opcode, std::optional{opcode});
}

TEST(InterpreterControl, StepLimit)
{
    Program const loop{Plain{JUMPDEST}, Push{0x00_hex}, Plain{JUMP}};
    ExecConfig config;
    config.max_steps = 1000;
    ASSERT_EQ(
        run_error(loop, config).code, VmErrorCode::step_limit_exceeded);

    config.max_steps = 3;
    ASSERT_NO_THROW(
        run(Program{Push{0x01_hex}, Plain{POP}, Plain{STOP}}, {}, 0, config));
    config.max_steps = 2;
    ASSERT_EQ(
        run_error(Program{Push{0x01_hex}, Plain{POP}, Plain{STOP}}, config)
            .code,
        VmErrorCode::step_limit_exceeded);
}

TEST(InterpreterControl, Step)
{
    Context ctx{resolve(Program{Push{0x01_hex}, Dup{1}, Plain{ADD}})};
    Input const input{{}, 0};

    ASSERT_TRUE(step(ctx, input).has_value());
    ASSERT_EQ(ctx.pc, 2);
    ASSERT_TRUE(step(ctx, input).has_value());
    ASSERT_EQ(ctx.pc, 3);
    ASSERT_TRUE(step(ctx, input).has_value());
    ASSERT_EQ(ctx.pc, 4);
    ASSERT_EQ(ctx.stack.top_first(), std::vector<Word>{2});
    ASSERT_FALSE(ctx.halted);

    auto const r = step(ctx, input);
    ASSERT_TRUE(r.has_error());
    ASSERT_EQ(r.error().code, VmErrorCode::pc_out_of_bounds);
}

TEST(InterpreterCall, CallValue)
{
    ASSERT_EQ(
        run(Program{Plain{CALLVALUE}, Plain{STOP}}, {}, 0).stack,
        std::vector<Word>{0});
    ASSERT_EQ(
        run(Program{Plain{CALLVALUE}, Plain{STOP}}, {}, 55).stack,
        std::vector<Word>{55});
}

TEST(InterpreterCall, CallData)
{
    auto const calldata = 0xbbccddeeff1122334455_hex;

    ASSERT_EQ(
        run(Program{Push{0x64_hex}, Plain{CALLDATALOAD}, Plain{STOP}}).stack,
        std::vector<Word>{0});
    ASSERT_EQ(
        run(Program{Push{0x05_hex}, Plain{CALLDATALOAD}, Plain{STOP}}, calldata)
            .stack,
        std::vector<Word>{
            0x1122334455000000000000000000000000000000000000000000000000000000_u256});
    ASSERT_EQ(
        run(Program{Plain{CALLDATASIZE}, Plain{STOP}}).stack,
        std::vector<Word>{0});
    ASSERT_EQ(
        run(Program{Plain{CALLDATASIZE}, Plain{STOP}}, calldata).stack,
        std::vector<Word>{10});
}

TEST(InterpreterCall, CallDataCopy)
{
    Program const program{
        Push{0x05_hex},
        Push{0x01_hex},
        Push{0x64_hex},
        Plain{CALLDATACOPY},
        word(101),
        Plain{MLOAD},
        Plain{STOP}};
    ASSERT_EQ(run(program).stack, std::vector<Word>{0});
    ASSERT_EQ(
        run(program, 0xbbccddeeff1122334455_hex).stack,
        std::vector<Word>{
            0xddeeff1100000000000000000000000000000000000000000000000000000000_u256});
}

TEST(InterpreterCall, Code)
{
    ASSERT_EQ(
        run(Program{Plain{CODESIZE}, Plain{STOP}}).stack,
        std::vector<Word>{2});
    auto const r = run(Program{
        Push{0x05_hex},
        Push{0x01_hex},
        Push{0x64_hex},
        Plain{CODECOPY},
        word(101),
        Plain{MLOAD},
        Plain{STOP}});
    ASSERT_EQ(
        r.stack,
        std::vector<Word>{
            0x6001606400000000000000000000000000000000000000000000000000000000_u256});
}

TEST(InterpreterHalt, Return)
{
    auto const r = run(Program{
        word(pattern),
        word(100),
        Plain{MSTORE},
        word(10),
        word(110),
        Plain{RETURN},
        Push{0x01_hex}});
    ASSERT_FALSE(r.reverted);
    ASSERT_EQ(to_hex(r.return_data), "0xbbccddeeff1122334455");
    ASSERT_TRUE(r.stack.empty());
}

TEST(InterpreterHalt, Revert)
{
    auto const r = run(Program{
        word(pattern),
        word(100),
        Plain{MSTORE},
        word(10),
        word(110),
        Plain{REVERT}});
    ASSERT_TRUE(r.reverted);
    ASSERT_EQ(to_hex(r.return_data), "0xbbccddeeff1122334455");
}

TEST(InterpreterHalt, StopKeepsStack)
{
    auto const r = run(Program{Push{0x07_hex}, Plain{STOP}, Plain{POP}});
    ASSERT_EQ(r.stack, std::vector<Word>{7});
    ASSERT_FALSE(r.reverted);
    ASSERT_TRUE(r.return_data.empty());
}

TEST(InterpreterCompiled, IfFallsThroughFromZeroBranch)
{
    ASSERT_EQ(
        run(compile(ExprList{if_(0, 1, 2), STOP})).stack,
        (std::vector<Word>{1, 2}));
    ASSERT_EQ(
        run(compile(ExprList{if_(5, 1, 2), STOP})).stack,
        std::vector<Word>{1});
}

TEST(InterpreterCompiled, IfWithHaltingZeroBranch)
{
    auto const program = compile(ExprList{
        op(MSTORE, 0, 0x0102),
        if_(op(SUB, 0, CALLVALUE), op(REVERT, 31, 2), op(REVERT, 30, 2)),
    });
    auto const zero = run(program, {}, 0);
    ASSERT_TRUE(zero.reverted);
    ASSERT_EQ(zero.return_data, 0x0102_hex);

    auto const non_zero = run(program, {}, 1);
    ASSERT_TRUE(non_zero.reverted);
    ASSERT_EQ(non_zero.return_data, 0x0200_hex);
}

TEST(InterpreterCompiled, SelfCodeSize)
{
    auto const r = run(compile(ExprList{self_code_size(), STOP}));
    ASSERT_EQ(r.stack, std::vector<Word>{5});
}

TEST(InterpreterBytecode, RunsDecodedCode)
{
    auto const code = build(ExprList{
        op(MSTORE, 0, 0x11223344_hex),
        op(REVERT, 28, 4),
    });
    auto const r = exec(code, {});
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r.value().reverted);
    ASSERT_EQ(r.value().return_data, 0x11223344_hex);
}

TEST(InterpreterBytecode, UndecodableCodeThrows)
{
    ASSERT_THROW(static_cast<void>(exec(0x6211_hex, {})), InvalidCode);
    ASSERT_THROW(static_cast<void>(exec(0x0c_hex, {})), InvalidOpcode);
}
