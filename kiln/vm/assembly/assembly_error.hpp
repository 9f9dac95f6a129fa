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

#include <stdexcept>

namespace kiln::vm::assembly
{
    /**
     * Raised for defects in a program being authored, assembled or
     * disassembled. These are never recovered from inside the library.
     */
    class AssemblyError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Malformed operand, oversized literal or unrecognised form.
    class InvalidAssembly final : public AssemblyError
    {
    public:
        using AssemblyError::AssemblyError;
    };

    /// Bytecode ends inside the immediate of a push.
    class InvalidCode final : public AssemblyError
    {
    public:
        using AssemblyError::AssemblyError;
    };

    /// Unresolved jump label, or a byte that is not an instruction.
    class InvalidOpcode final : public AssemblyError
    {
    public:
        using AssemblyError::AssemblyError;
    };
}
