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

#include <kiln/core/ascii.hpp>
#include <kiln/core/hex.hpp>
#include <kiln/vm/assembly/assembly_error.hpp>
#include <kiln/vm/assembly/expr.hpp>
#include <kiln/vm/assembly/reader.hpp>
#include <kiln/vm/evm/opcodes.hpp>

#include <intx/intx.hpp>

#include <cctype>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace kiln::vm::assembly
{
    namespace
    {
        bool is_symbol_char(char const c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
                   c == '_';
        }

        class Reader
        {
        public:
            explicit Reader(std::string_view const text)
                : text_{text}
            {
            }

            ExprList read_all()
            {
                ExprList items;
                drop_blanks();
                while (!at_end()) {
                    items.push_back(read_item());
                    drop_blanks();
                }
                return items;
            }

        private:
            [[noreturn]] void fail(std::string_view const msg) const
            {
                throw InvalidAssembly(
                    std::format("{} at offset {}", msg, pos_));
            }

            bool at_end() const
            {
                return pos_ >= text_.size();
            }

            char peek() const
            {
                return at_end() ? '\0' : text_[pos_];
            }

            void drop_blanks()
            {
                while (!at_end()) {
                    char const c = text_[pos_];
                    if (c == ';') {
                        while (!at_end() && text_[pos_] != '\n') {
                            ++pos_;
                        }
                    }
                    else if (std::isspace(static_cast<unsigned char>(c))) {
                        ++pos_;
                    }
                    else {
                        return;
                    }
                }
            }

            std::string_view try_parse_symbol()
            {
                auto const start = pos_;
                while (!at_end() && is_symbol_char(text_[pos_])) {
                    ++pos_;
                }
                return text_.substr(start, pos_ - start);
            }

            Expr read_item()
            {
                drop_blanks();
                char const c = peek();
                if (c == '(') {
                    ++pos_;
                    return read_form();
                }
                if (c == '[') {
                    ++pos_;
                    return read_list();
                }
                if (c == '#') {
                    return read_bytes();
                }
                if (c == ')' || c == ']') {
                    fail(std::format("unexpected '{}'", c));
                }
                if (at_end()) {
                    fail("unexpected end of input");
                }
                return read_atom();
            }

            Expr read_list()
            {
                ExprList items;
                drop_blanks();
                while (peek() != ']') {
                    if (at_end()) {
                        fail("unterminated list");
                    }
                    items.push_back(read_item());
                    drop_blanks();
                }
                ++pos_;
                return List{std::move(items)};
            }

            void expect_close()
            {
                drop_blanks();
                if (peek() != ')') {
                    fail("expected ')'");
                }
                ++pos_;
            }

            Expr read_form()
            {
                drop_blanks();
                auto const head_pos = pos_;
                auto const head = try_parse_symbol();
                if (head.empty()) {
                    fail("expected a mnemonic");
                }

                if (iequals(head, "if")) {
                    auto cond = read_item();
                    auto non_zero = read_item();
                    auto zero = read_item();
                    expect_close();
                    return if_(
                        std::move(cond), std::move(non_zero), std::move(zero));
                }

                auto const opcode = evm::find_opcode(head);
                if (!opcode) {
                    pos_ = head_pos;
                    fail(std::format("unknown mnemonic '{}'", head));
                }

                ExprList args;
                drop_blanks();
                while (peek() != ')') {
                    if (at_end()) {
                        fail("unterminated form");
                    }
                    args.push_back(read_item());
                    drop_blanks();
                }
                ++pos_;
                return Form{*opcode, std::move(args)};
            }

            Expr read_bytes()
            {
                auto const start = pos_;
                if (text_.substr(pos_, 2) != "#x") {
                    fail("expected '#x'");
                }
                pos_ += 2;
                auto const digits = try_parse_symbol();
                auto bytes = parse_hex(digits);
                if (!bytes) {
                    pos_ = start;
                    fail(std::format("malformed byte literal '#x{}'", digits));
                }
                return std::move(*bytes);
            }

            Expr read_atom()
            {
                auto const start = pos_;
                auto const symbol = try_parse_symbol();
                if (symbol.empty()) {
                    fail(std::format("unexpected '{}'", peek()));
                }

                if (std::isdigit(static_cast<unsigned char>(symbol.front()))) {
                    try {
                        return intx::from_string<runtime::uint256_t>(
                            std::string{symbol});
                    }
                    catch (std::invalid_argument const &) {
                        pos_ = start;
                        fail(std::format("malformed integer '{}'", symbol));
                    }
                    catch (std::out_of_range const &) {
                        pos_ = start;
                        fail(std::format(
                            "integer '{}' does not fit 256 bits", symbol));
                    }
                }

                if (iequals(symbol, "self-code-size")) {
                    return self_code_size();
                }

                auto const opcode = evm::find_opcode(symbol);
                if (!opcode) {
                    pos_ = start;
                    fail(std::format("unknown mnemonic '{}'", symbol));
                }
                return *opcode;
            }

            std::string_view text_;
            std::size_t pos_{0};
        };
    }

    ExprList read_program(std::string_view const text)
    {
        return Reader{text}.read_all();
    }
}
