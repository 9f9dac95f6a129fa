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

#include <kiln/core/config.hpp>
#include <kiln/core/hex.hpp>
#include <kiln/core/log_level_map.hpp>
#include <kiln/vm/assembly/assembler.hpp>
#include <kiln/vm/assembly/assembly_error.hpp>
#include <kiln/vm/assembly/compiler.hpp>
#include <kiln/vm/assembly/decoder.hpp>
#include <kiln/vm/assembly/reader.hpp>
#include <kiln/vm/assembly/resolver.hpp>
#include <kiln/vm/assembly/show.hpp>
#include <kiln/vm/interpreter/execute.hpp>

#include <CLI/CLI.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <print>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace kiln;
using namespace kiln::vm;

KILN_ANONYMOUS_NAMESPACE_BEGIN

constexpr int exit_revert = 1;
constexpr int exit_vm_error = 2;
constexpr int exit_assembly_error = 3;

std::string read_source(std::string const &path)
{
    if (path == "-") {
        return {
            std::istreambuf_iterator<char>{std::cin},
            std::istreambuf_iterator<char>{}};
    }
    std::ifstream in{path};
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

byte_string hex_argument(std::string const &what, std::string const &text)
{
    auto bytes = parse_hex(text);
    if (!bytes) {
        throw vm::assembly::InvalidAssembly(
            "malformed hex for " + what + ": '" + text + "'");
    }
    return *bytes;
}

int build_impl(std::string const &path, bool const listing)
{
    auto const program = vm::assembly::read_program(read_source(path));
    LOG_DEBUG("read {} top-level forms from {}", program.size(), path);
    if (listing) {
        std::print(
            "{}",
            vm::assembly::show_program(
                vm::assembly::resolve(vm::assembly::compile(program))));
    }
    else {
        std::println("{}", to_hex(vm::assembly::build(program)));
    }
    return 0;
}

int disasm_impl(std::string const &code)
{
    auto const program = vm::assembly::decode(hex_argument("code", code));
    LOG_DEBUG("decoded {} instructions", program.size());
    std::print("{}", vm::assembly::show_program(program));
    return 0;
}

int exec_impl(
    std::string const &code, std::string const &calldata,
    std::string const &value, bool const trace,
    std::optional<uint64_t> const max_steps)
{
    interpreter::ExecConfig config;
    config.trace = trace;
    config.max_steps = max_steps;

    interpreter::Word callvalue = 0;
    try {
        callvalue = intx::from_string<interpreter::Word>(value);
    }
    catch (std::invalid_argument const &) {
        throw vm::assembly::InvalidAssembly(
            "malformed call value '" + value + "'");
    }
    catch (std::out_of_range const &) {
        throw vm::assembly::InvalidAssembly(
            "call value '" + value + "' does not fit 256 bits");
    }

    auto const code_bytes = hex_argument("code", code);
    auto const calldata_bytes = hex_argument("calldata", calldata);
    LOG_INFO(
        "executing {} bytes of code with {} bytes of call data",
        code_bytes.size(),
        calldata_bytes.size());
    auto const result =
        interpreter::exec(code_bytes, calldata_bytes, callvalue, config);
    quill::flush();

    if (result.has_error()) {
        std::println(stderr, "error: {}", result.error().message());
        return exit_vm_error;
    }
    auto const &r = result.value();
    if (r.reverted) {
        std::println("revert {}", to_hex(r.return_data));
        return exit_revert;
    }
    std::println("ok {}", to_hex(r.return_data));
    return 0;
}

int constructor_impl(std::string const &code)
{
    std::println(
        "{}", to_hex(vm::assembly::constructor(hex_argument("code", code))));
    return 0;
}

KILN_ANONYMOUS_NAMESPACE_END

int main(int argc, char *argv[])
{
    auto log_level = quill::LogLevel::Warning;

    std::string source;
    bool listing = false;
    std::string code;
    std::string calldata = "0x";
    std::string value = "0";
    bool trace = false;
    std::optional<uint64_t> max_steps;

    CLI::App cli{"kiln: assembler and pure interpreter for EVM bytecode"};
    cli.require_subcommand(1);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    auto *const build_cmd =
        cli.add_subcommand("build", "assemble a source file to bytecode");
    build_cmd->add_option("source", source, "source file, or - for stdin")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));
    build_cmd->add_flag(
        "--listing", listing, "print the resolved instruction listing");

    auto *const disasm_cmd =
        cli.add_subcommand("disasm", "disassemble hex bytecode");
    disasm_cmd->add_option("code", code, "hex bytecode")->required();

    auto *const exec_cmd =
        cli.add_subcommand("exec", "run hex bytecode in the pure interpreter");
    exec_cmd->add_option("code", code, "hex bytecode")->required();
    exec_cmd->add_option("--calldata", calldata, "hex call data");
    exec_cmd->add_option("--value", value, "call value, decimal or 0x hex");
    exec_cmd->add_flag("--trace", trace, "log every instruction");
    exec_cmd->add_option(
        "--max-steps", max_steps, "stop after this many instructions");

    auto *const constructor_cmd = cli.add_subcommand(
        "constructor", "wrap runtime bytecode in init code that returns it");
    constructor_cmd->add_option("code", code, "hex runtime bytecode")
        ->required();

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    if (trace && log_level > quill::LogLevel::TraceL1) {
        log_level = quill::LogLevel::TraceL1;
    }
    quill::get_root_logger()->set_log_level(log_level);

    try {
        if (*build_cmd) {
            return build_impl(source, listing);
        }
        if (*disasm_cmd) {
            return disasm_impl(code);
        }
        if (*exec_cmd) {
            return exec_impl(code, calldata, value, trace, max_steps);
        }
        if (*constructor_cmd) {
            return constructor_impl(code);
        }
    }
    catch (vm::assembly::AssemblyError const &e) {
        quill::flush();
        std::println(stderr, "error: {}", e.what());
        return exit_assembly_error;
    }
    return 0;
}
