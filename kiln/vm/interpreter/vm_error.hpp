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

#include <kiln/core/result.hpp>
#include <kiln/vm/evm/opcodes.hpp>

#include <boost/outcome/policy/terminate.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>

namespace kiln::vm::interpreter
{
    enum class VmErrorCode : uint8_t
    {
        pc_out_of_bounds,
        stack_underflow,
        stack_overflow,
        value_overflow,
        signed_integer_out_of_bounds,
        out_of_memory,
        invalid_operation,
        invalid_jump_dest,
        invalid_push,
        impure,
        not_implemented,
        step_limit_exceeded,
    };
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<kiln::vm::interpreter::VmErrorCode>
    : quick_status_code_from_enum_defaults<kiln::vm::interpreter::VmErrorCode>
{
    static constexpr auto const domain_name = "VM Error";
    static constexpr auto const domain_uuid =
        "5d0bd3a4-61c4-4d0b-9c7e-2a8f6e1b3c47";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

namespace kiln::vm::interpreter
{
    /**
     * A run-time failure. `opcode` names the offending instruction for
     * `impure` and `not_implemented`.
     */
    struct VmError
    {
        VmErrorCode code;
        std::optional<evm::EvmOpCode> opcode{};

        bool operator==(VmError const &) const = default;

        std::string message() const;
    };

    template <class T>
    using VmResult = outcome::result<T, VmError, outcome::policy::terminate>;

    /// Raised by `exec_call` for anything other than a return or revert.
    class VmCallError final : public std::runtime_error
    {
    public:
        explicit VmCallError(VmError const &error);

        VmError const &error() const noexcept
        {
            return error_;
        }

    private:
        VmError error_;
    };
}
