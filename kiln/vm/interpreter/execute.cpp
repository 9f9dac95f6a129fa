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
#include <kiln/vm/assembly/decoder.hpp>
#include <kiln/vm/assembly/encoder.hpp>
#include <kiln/vm/assembly/resolver.hpp>
#include <kiln/vm/assembly/show.hpp>
#include <kiln/vm/assembly/token.hpp>
#include <kiln/vm/evm/opcodes.hpp>
#include <kiln/vm/interpreter/context.hpp>
#include <kiln/vm/interpreter/execute.hpp>
#include <kiln/vm/interpreter/vm_error.hpp>
#include <kiln/vm/runtime/uint256.hpp>

#include <intx/intx.hpp>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <variant>

namespace kiln::vm::interpreter
{
    using namespace evm;

    namespace
    {
        Word load_word(byte_string const &bytes)
        {
            return intx::be::unsafe::load<Word>(bytes.data());
        }

        byte_string store_word(Word const &value)
        {
            byte_string out(32, 0);
            intx::be::unsafe::store(out.data(), value);
            return out;
        }

        bool is_impure(EvmOpCode const opcode)
        {
            switch (opcode) {
            case ADDRESS:
            case BALANCE:
            case ORIGIN:
            case CALLER:
            case GASPRICE:
            case EXTCODESIZE:
            case EXTCODECOPY:
            case RETURNDATASIZE:
            case RETURNDATACOPY:
            case EXTCODEHASH:
            case BLOCKHASH:
            case COINBASE:
            case TIMESTAMP:
            case NUMBER:
            case PREVRANDAO:
            case GASLIMIT:
            case CHAINID:
            case SELFBALANCE:
            case BASEFEE:
            case BLOBHASH:
            case BLOBBASEFEE:
            case SLOAD:
            case SSTORE:
            case GAS:
            case LOG0:
            case LOG1:
            case LOG2:
            case LOG3:
            case LOG4:
            case CREATE:
            case CALL:
            case CALLCODE:
            case DELEGATECALL:
            case CREATE2:
            case STATICCALL:
            case SELFDESTRUCT:
                return true;
            default:
                return false;
            }
        }

        template <class F>
        VmResult<void> unary_op(Context &ctx, F &&f)
        {
            BOOST_OUTCOME_TRY(auto const a, ctx.stack.pop());
            return ctx.stack.push(f(a));
        }

        template <class F>
        VmResult<void> binary_op(Context &ctx, F &&f)
        {
            BOOST_OUTCOME_TRY(auto const a, ctx.stack.pop());
            BOOST_OUTCOME_TRY(auto const b, ctx.stack.pop());
            return ctx.stack.push(f(a, b));
        }

        template <class F>
        VmResult<void> ternary_op(Context &ctx, F &&f)
        {
            BOOST_OUTCOME_TRY(auto const a, ctx.stack.pop());
            BOOST_OUTCOME_TRY(auto const b, ctx.stack.pop());
            BOOST_OUTCOME_TRY(auto const c, ctx.stack.pop());
            return ctx.stack.push(f(a, b, c));
        }

        VmResult<Word> sdiv(Word const &a, Word const &b)
        {
            if (b == 0) {
                return Word{0};
            }
            if (a == runtime::min_signed && b == ~Word{0}) {
                return VmError{VmErrorCode::signed_integer_out_of_bounds};
            }
            return intx::sdivrem(a, b).quot;
        }

        Word smod(Word const &a, Word const &b)
        {
            if (b == 0) {
                return 0;
            }
            return intx::sdivrem(a, b).rem;
        }

        VmResult<void> jump_to(Context &ctx, Word const &target)
        {
            if (!ctx.is_jumpdest(target)) {
                return VmError{VmErrorCode::invalid_jump_dest};
            }
            ctx.pc = static_cast<std::size_t>(target);
            return outcome::success();
        }

        VmResult<void> copy_into_memory(
            Context &ctx, byte_string_view const src)
        {
            BOOST_OUTCOME_TRY(auto const dest, ctx.stack.pop());
            BOOST_OUTCOME_TRY(auto const offset, ctx.stack.pop());
            BOOST_OUTCOME_TRY(auto const size, ctx.stack.pop());
            BOOST_OUTCOME_TRY(auto const data, read_padded(src, offset, size));
            return ctx.memory.write(dest, data);
        }

        VmResult<void> halt_with_memory(Context &ctx, bool const reverted)
        {
            BOOST_OUTCOME_TRY(auto const offset, ctx.stack.pop());
            BOOST_OUTCOME_TRY(auto const size, ctx.stack.pop());
            BOOST_OUTCOME_TRY(auto data, ctx.memory.read(offset, size));
            ctx.return_data = std::move(data);
            ctx.halted = true;
            ctx.reverted = reverted;
            return outcome::success();
        }

        VmResult<void> dispatch(
            Context &ctx, Input const &input, ExecConfig const &config,
            EvmOpCode const opcode)
        {
            switch (opcode) {
            case STOP:
                ctx.halted = true;
                return outcome::success();

            case ADD:
                return binary_op(
                    ctx, [](Word const &a, Word const &b) { return a + b; });
            case MUL:
                return binary_op(
                    ctx, [](Word const &a, Word const &b) { return a * b; });
            case SUB:
                return binary_op(
                    ctx, [](Word const &a, Word const &b) { return a - b; });
            case DIV:
                return binary_op(ctx, [](Word const &a, Word const &b) {
                    return b == 0 ? Word{0} : a / b;
                });
            case SDIV: {
                BOOST_OUTCOME_TRY(auto const a, ctx.stack.pop());
                BOOST_OUTCOME_TRY(auto const b, ctx.stack.pop());
                BOOST_OUTCOME_TRY(auto const q, sdiv(a, b));
                return ctx.stack.push(q);
            }
            case MOD:
                return binary_op(ctx, [](Word const &a, Word const &b) {
                    return b == 0 ? Word{0} : a % b;
                });
            case SMOD:
                return binary_op(ctx, smod);
            case ADDMOD:
                return ternary_op(
                    ctx, [](Word const &a, Word const &b, Word const &n) {
                        return n == 0 ? Word{0} : intx::addmod(a, b, n);
                    });
            case MULMOD:
                return ternary_op(
                    ctx, [](Word const &a, Word const &b, Word const &n) {
                        return n == 0 ? Word{0} : intx::mulmod(a, b, n);
                    });
            case EXP:
                return binary_op(ctx, [](Word const &a, Word const &b) {
                    return intx::exp(a, b);
                });
            case SIGNEXTEND:
                return binary_op(ctx, runtime::signextend);

            case LT:
                return binary_op(ctx, [](Word const &a, Word const &b) {
                    return Word{a < b};
                });
            case GT:
                return binary_op(ctx, [](Word const &a, Word const &b) {
                    return Word{a > b};
                });
            case SLT:
                return binary_op(ctx, [](Word const &a, Word const &b) {
                    return Word{intx::slt(a, b)};
                });
            case SGT:
                return binary_op(ctx, [](Word const &a, Word const &b) {
                    return Word{intx::slt(b, a)}; // note swapped arguments
                });
            case EQ:
                return binary_op(ctx, [](Word const &a, Word const &b) {
                    return Word{a == b};
                });
            case ISZERO:
                return unary_op(
                    ctx, [](Word const &a) { return Word{a == 0}; });
            case AND:
                return binary_op(
                    ctx, [](Word const &a, Word const &b) { return a & b; });
            case OR:
                return binary_op(
                    ctx, [](Word const &a, Word const &b) { return a | b; });
            case XOR:
                return binary_op(
                    ctx, [](Word const &a, Word const &b) { return a ^ b; });
            case NOT:
                return unary_op(ctx, [](Word const &a) { return ~a; });
            case BYTE:
                return binary_op(ctx, runtime::byte);
            case SHL:
                return binary_op(ctx, runtime::shl);
            case SHR:
                return binary_op(ctx, runtime::shr);
            case SAR:
                return binary_op(ctx, runtime::sar);

            case SHA3: {
                BOOST_OUTCOME_TRY(auto const offset, ctx.stack.pop());
                BOOST_OUTCOME_TRY(auto const size, ctx.stack.pop());
                BOOST_OUTCOME_TRY(auto const data, ctx.memory.read(offset, size));
                auto const hash = config.hash(data);
                return ctx.stack.push(intx::be::load<Word>(hash.bytes));
            }

            case CALLVALUE:
                return ctx.stack.push(input.value);
            case CALLDATALOAD: {
                BOOST_OUTCOME_TRY(auto const i, ctx.stack.pop());
                BOOST_OUTCOME_TRY(
                    auto const data, read_padded(input.calldata, i, 32));
                return ctx.stack.push(load_word(data));
            }
            case CALLDATASIZE:
                return ctx.stack.push(input.calldata.size());
            case CALLDATACOPY:
                return copy_into_memory(ctx, input.calldata);
            case CODESIZE:
                return ctx.stack.push(ctx.encoded.size());
            case CODECOPY:
                return copy_into_memory(ctx, ctx.encoded);

            case POP: {
                BOOST_OUTCOME_TRY(ctx.stack.pop());
                return outcome::success();
            }
            case MLOAD: {
                BOOST_OUTCOME_TRY(auto const offset, ctx.stack.pop());
                BOOST_OUTCOME_TRY(auto const data, ctx.memory.read(offset, 32));
                return ctx.stack.push(load_word(data));
            }
            case MSTORE: {
                BOOST_OUTCOME_TRY(auto const offset, ctx.stack.pop());
                BOOST_OUTCOME_TRY(auto const value, ctx.stack.pop());
                return ctx.memory.write(offset, store_word(value));
            }
            case MSTORE8: {
                BOOST_OUTCOME_TRY(auto const offset, ctx.stack.pop());
                BOOST_OUTCOME_TRY(auto const value, ctx.stack.pop());
                uint8_t const low = static_cast<uint8_t>(value[0]);
                return ctx.memory.write(offset, byte_string_view{&low, 1});
            }
            case JUMP: {
                BOOST_OUTCOME_TRY(auto const target, ctx.stack.pop());
                return jump_to(ctx, target);
            }
            case JUMPI: {
                BOOST_OUTCOME_TRY(auto const target, ctx.stack.pop());
                BOOST_OUTCOME_TRY(auto const cond, ctx.stack.pop());
                if (cond == 0) {
                    return outcome::success();
                }
                return jump_to(ctx, target);
            }
            case PC:
                return ctx.stack.push(ctx.pc);
            case MSIZE:
                return ctx.stack.push(ctx.memory.size());
            case JUMPDEST:
                return outcome::success();
            case TLOAD: {
                BOOST_OUTCOME_TRY(auto const key, ctx.stack.pop());
                auto const it = ctx.transient_storage.find(key);
                return ctx.stack.push(
                    it == ctx.transient_storage.end() ? Word{0} : it->second);
            }
            case TSTORE: {
                BOOST_OUTCOME_TRY(auto const key, ctx.stack.pop());
                BOOST_OUTCOME_TRY(auto const value, ctx.stack.pop());
                ctx.transient_storage.insert_or_assign(key, value);
                return outcome::success();
            }
            case MCOPY: {
                BOOST_OUTCOME_TRY(auto const dest, ctx.stack.pop());
                BOOST_OUTCOME_TRY(auto const offset, ctx.stack.pop());
                BOOST_OUTCOME_TRY(auto const size, ctx.stack.pop());
                BOOST_OUTCOME_TRY(
                    auto const data, ctx.memory.read(offset, size));
                return ctx.memory.write(dest, data);
            }

            case RETURN:
                return halt_with_memory(ctx, false);
            case REVERT:
                return halt_with_memory(ctx, true);

            default:
                if (is_impure(opcode)) {
                    return VmError{VmErrorCode::impure, opcode};
                }
                return VmError{VmErrorCode::not_implemented, opcode};
            }
        }

        VmResult<void> execute_token(
            Context &ctx, Input const &input, ExecConfig const &config,
            assembly::Token const &token)
        {
            return std::visit(
                Cases{
                    [&](assembly::Plain const &plain) -> VmResult<void> {
                        return dispatch(ctx, input, config, plain.opcode);
                    },
                    [&](assembly::Push const &push) -> VmResult<void> {
                        if (push.n() > 32) {
                            return VmError{VmErrorCode::value_overflow};
                        }
                        return ctx.stack.push(
                            runtime::from_bytes(push.n(), push.value.data()));
                    },
                    [&](assembly::Dup const &dup) -> VmResult<void> {
                        BOOST_OUTCOME_TRY(
                            auto const value,
                            ctx.stack.peek(static_cast<std::size_t>(dup.n) - 1));
                        return ctx.stack.push(value);
                    },
                    [&](assembly::Swap const &swap) -> VmResult<void> {
                        return ctx.stack.swap(swap.n);
                    },
                    [](assembly::Invalid const &) -> VmResult<void> {
                        return VmError{VmErrorCode::invalid_operation};
                    },
                    [](auto const &) -> VmResult<void> {
                        return VmError{VmErrorCode::not_implemented};
                    }},
                token);
        }
    }

    VmResult<void>
    step(Context &ctx, Input const &input, ExecConfig const &config)
    {
        BOOST_OUTCOME_TRY(auto const *const token, ctx.fetch());
        if (config.trace) {
            LOG_TRACE_L1(
                "pc={} stack={} {}",
                ctx.pc,
                ctx.stack.size(),
                assembly::show_token(*token));
        }

        BOOST_OUTCOME_TRY(execute_token(ctx, input, config, *token));

        // A taken jump has set pc to its JUMPDEST, so this steps past it.
        ctx.pc += assembly::token_size(*token);
        return outcome::success();
    }

    VmResult<ExecutionResult> exec(
        assembly::Program const &code, byte_string_view const calldata,
        Word const &value, ExecConfig const &config)
    {
        Context ctx{assembly::resolve(code)};
        Input const input{byte_string{calldata}, value};

        std::uint64_t steps = 0;
        while (!ctx.halted) {
            if (config.max_steps && steps >= *config.max_steps) {
                LOG_DEBUG("execution stopped after {} steps", steps);
                return VmError{VmErrorCode::step_limit_exceeded};
            }
            auto const r = step(ctx, input, config);
            if (r.has_error()) {
                LOG_DEBUG(
                    "execution aborted at pc {}: {}",
                    ctx.pc,
                    r.error().message());
                return r.error();
            }
            ++steps;
        }

        return ExecutionResult{
            .stack = ctx.stack.top_first(),
            .reverted = ctx.reverted,
            .return_data = std::move(ctx.return_data)};
    }

    VmResult<ExecutionResult> exec(
        byte_string_view const code, byte_string_view const calldata,
        Word const &value, ExecConfig const &config)
    {
        return exec(assembly::decode(code), calldata, value, config);
    }

    CallOutcome exec_call(
        assembly::Program const &code, byte_string_view const calldata,
        Word const &value, ExecConfig const &config)
    {
        auto r = exec(code, calldata, value, config);
        if (r.has_error()) {
            throw VmCallError{r.error()};
        }
        auto &result = r.value();
        if (result.reverted) {
            return CallRevert{std::move(result.return_data)};
        }
        return CallOk{std::move(result.return_data)};
    }

    CallOutcome exec_call(
        byte_string_view const code, byte_string_view const calldata,
        Word const &value, ExecConfig const &config)
    {
        return exec_call(assembly::decode(code), calldata, value, config);
    }
}
