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

#include "environment.hpp"

#include <kiln/core/log_level_map.hpp>

#include <CLI/CLI.hpp>
#include <gtest/gtest.h>
#include <quill/Quill.h>

int main(int argc, char *argv[])
{
    // Process GoogleTest flags.
    testing::InitGoogleTest(&argc, argv);

    // Then our own flags.
    auto log_level = quill::LogLevel::Warning;
    CLI::App app{"kiln unit tests", "kiln-unit-tests"};
    app.add_option("--log_level", log_level, "level of logging")
        ->transform(
            CLI::CheckedTransformer(kiln::log_level_map, CLI::ignore_case));
    CLI11_PARSE(app, argc, argv);

    testing::AddGlobalTestEnvironment(new kiln::test::Environment{log_level});

    return RUN_ALL_TESTS();
}
