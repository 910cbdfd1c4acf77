/*
 * Esta Lexer Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Provides lexical analysis for Esta source text. Converts a program into a
 *   stream of Token objects: identifiers and keywords, decimal digit runs,
 *   double-quoted strings (quotes kept in the lexeme, no escapes), and the
 *   punctuation/operator set ( ) { } ; , = == != < > <= >= + - * /.
 *   Characters that start no terminal become Invalid tokens; the stream is
 *   always terminated by a single Eof token. This is the first stage of the
 *   front-end, prior to parsing into an AST.
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
#include <string>
#include <vector>
#include <cstddef>
#include "esta/parse/tokens.hpp"

namespace esta {

class Lexer {
public:
    explicit Lexer(std::string input);
    TokenStream run();
private:
    Token next();
    char peek() const;
    char get();
    bool eof() const;
    void skip_space();
    Token lex_word();
    Token lex_number();
    Token lex_string();
    Token lex_operator();
    bool is_word_start(char c) const;
    bool is_word_char(char c) const;

    std::string m_input;
    std::size_t m_pos = 0; // current index
};

} // namespace esta
