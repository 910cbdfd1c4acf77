/*
 * Esta Parser Interface
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Declares the parse entry points which consume a TokenStream and produce an
 *   AST with correct operator precedence (logical < equality < comparison <
 *   additive < multiplicative < unary < call/primary). Parsing stops at the
 *   first lexical, syntax or literal-conversion error; the error is reported
 *   in ParseResult and no partial tree is returned. Implementation resides in
 *   parser.cpp.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include "esta/parse/tokens.hpp"
#include "esta/parse/ast.hpp"

namespace esta {

enum class ParseErrorKind { Lexical, Syntax, LiteralConversion };

const char* error_kind_name(ParseErrorKind kind);

struct ParseError {
    ParseErrorKind kind;
    std::size_t pos;     // offset of the offending token
    std::string lexeme;  // offending token text (empty at end of input)
    std::string message;
};

// Separator layout accepted by 'for'.
enum class ForSyntax {
    Conventional, // for init; test; inc { ... }
    Legacy        // for init; test; inc; { ... }
};

struct ParserOptions {
    ForSyntax for_syntax = ForSyntax::Conventional;
};

template <typename T>
struct ParseResult {
    T value;
    std::optional<ParseError> error;
    bool ok() const { return !error.has_value(); }
};

// Whole program: zero or more statements up to end of input.
ParseResult<AST> parse_tokens(const TokenStream& ts, ParserOptions opts = {});

// Lexes then parses.
ParseResult<AST> parse_source(const std::string& source, ParserOptions opts = {});

// Sub-parses; the stream must contain exactly one statement / expression.
ParseResult<StmtPtr> parse_statement(const TokenStream& ts, ParserOptions opts = {});
ParseResult<ExprPtr> parse_expression(const TokenStream& ts);

} // namespace esta
