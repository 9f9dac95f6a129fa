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
#include <kiln/vm/interpreter/vm_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <format>
#include <initializer_list>
#include <string>
#include <utility>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<quick_status_code_from_enum<
    kiln::vm::interpreter::VmErrorCode>::mapping> const &
quick_status_code_from_enum<kiln::vm::interpreter::VmErrorCode>::value_mappings()
{
    using kiln::vm::interpreter::VmErrorCode;

    static std::initializer_list<mapping> const v = {
        {VmErrorCode::pc_out_of_bounds, "pc out of bounds", {}},
        {VmErrorCode::stack_underflow, "stack underflow", {}},
        {VmErrorCode::stack_overflow, "stack overflow", {}},
        {VmErrorCode::value_overflow, "value overflow", {}},
        {VmErrorCode::signed_integer_out_of_bounds,
         "signed integer out of bounds",
         {}},
        {VmErrorCode::out_of_memory, "out of memory", {}},
        {VmErrorCode::invalid_operation, "invalid operation", {}},
        {VmErrorCode::invalid_jump_dest, "invalid jump destination", {}},
        {VmErrorCode::invalid_push, "invalid push", {}},
        {VmErrorCode::impure, "impure operation", {}},
        {VmErrorCode::not_implemented, "not implemented", {}},
        {VmErrorCode::step_limit_exceeded, "step limit exceeded", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

namespace kiln::vm::interpreter
{
    std::string VmError::message() const
    {
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::quick_status_code_from_enum_code<
            VmErrorCode> const sc(std::in_place, code);
        auto const msg = sc.message();
        std::string out{msg.c_str(), msg.size()};
        if (opcode) {
            out += std::format(" ({})", evm::opcode_info(*opcode).name);
        }
        return out;
    }

    VmCallError::VmCallError(VmError const &error)
        : std::runtime_error{"VmError: " + error.message()}
        , error_{error}
    {
    }
}
