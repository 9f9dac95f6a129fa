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
#include <kiln/core/keccak.hpp>
#include <kiln/vm/assembly/token.hpp>
#include <kiln/vm/interpreter/context.hpp>
#include <kiln/vm/interpreter/vm_error.hpp>

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace kiln::vm::interpreter
{
    /// Hash primitive used by SHA3. Must be pure and reentrant.
    using HashFn = hash256 (*)(byte_string_view);

    /// Call input, read-only for the whole execution.
    struct Input
    {
        byte_string calldata;
        Word value;
    };

    struct ExecConfig
    {
        /// Log every dispatched instruction at trace level.
        bool trace{false};

        /// Abort with `step_limit_exceeded` after this many instructions.
        std::optional<std::uint64_t> max_steps{};

        HashFn hash{&kiln::keccak256};
    };

    struct ExecutionResult
    {
        /// Final stack, top first.
        std::vector<Word> stack;
        bool reverted;
        byte_string return_data;
    };

    /// Executes the instruction at `ctx.pc` and advances past it.
    VmResult<void>
    step(Context &ctx, Input const &input, ExecConfig const &config = {});

    /**
     * Runs a program until it halts. Placeholders are resolved first, so
     * the output of the compiler can be run directly.
     */
    VmResult<ExecutionResult> exec(
        assembly::Program const &code, byte_string_view calldata,
        Word const &value = 0, ExecConfig const &config = {});

    /**
     * Decodes and runs raw bytecode. Undecodable bytecode throws the
     * decoder's `AssemblyError`.
     */
    VmResult<ExecutionResult> exec(
        byte_string_view code, byte_string_view calldata,
        Word const &value = 0, ExecConfig const &config = {});

    struct CallOk
    {
        byte_string data;

        bool operator==(CallOk const &) const = default;
    };

    struct CallRevert
    {
        byte_string data;

        bool operator==(CallRevert const &) const = default;
    };

    using CallOutcome = std::variant<CallOk, CallRevert>;

    /**
     * Runs code for its return or revert data. Every other failure throws
     * `VmCallError`.
     */
    CallOutcome exec_call(
        assembly::Program const &code, byte_string_view calldata,
        Word const &value = 0, ExecConfig const &config = {});

    CallOutcome exec_call(
        byte_string_view code, byte_string_view calldata,
        Word const &value = 0, ExecConfig const &config = {});
}
