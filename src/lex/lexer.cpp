/*
 * Esta Lexer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Converts Esta source text into a TokenStream (keywords,
 *              identifiers, numbers, strings, operators). See header for details.
 */
#include <cctype>
#include <unordered_map>
#include <esta/lex/lexer.hpp>

namespace esta {

namespace {

const std::unordered_map<std::string, TokenKind>& keywords() {
    static const std::unordered_map<std::string, TokenKind> table = {
        {"var", TokenKind::Var},       {"while", TokenKind::While},
        {"if", TokenKind::If},         {"else", TokenKind::Else},
        {"for", TokenKind::For},       {"fun", TokenKind::Fun},
        {"return", TokenKind::Return}, {"break", TokenKind::Break},
        {"continue", TokenKind::Continue},
        {"and", TokenKind::And},       {"or", TokenKind::Or},
        {"not", TokenKind::Not},       {"Nil", TokenKind::Nil},
        {"True", TokenKind::True},     {"False", TokenKind::False},
    };
    return table;
}

} // namespace

const char* token_kind_name(TokenKind kind) {
    switch (kind) {
        case TokenKind::Identifier: return "identifier";
        case TokenKind::Number: return "number";
        case TokenKind::String: return "string";
        case TokenKind::Var: return "'var'";
        case TokenKind::While: return "'while'";
        case TokenKind::If: return "'if'";
        case TokenKind::Else: return "'else'";
        case TokenKind::For: return "'for'";
        case TokenKind::Fun: return "'fun'";
        case TokenKind::Return: return "'return'";
        case TokenKind::Break: return "'break'";
        case TokenKind::Continue: return "'continue'";
        case TokenKind::And: return "'and'";
        case TokenKind::Or: return "'or'";
        case TokenKind::Not: return "'not'";
        case TokenKind::Nil: return "'Nil'";
        case TokenKind::True: return "'True'";
        case TokenKind::False: return "'False'";
        case TokenKind::LeftParen: return "'('";
        case TokenKind::RightParen: return "')'";
        case TokenKind::LeftBrace: return "'{'";
        case TokenKind::RightBrace: return "'}'";
        case TokenKind::Semi: return "';'";
        case TokenKind::Comma: return "','";
        case TokenKind::Assign: return "'='";
        case TokenKind::EqualEqual: return "'=='";
        case TokenKind::BangEqual: return "'!='";
        case TokenKind::Less: return "'<'";
        case TokenKind::Greater: return "'>'";
        case TokenKind::LessEqual: return "'<='";
        case TokenKind::GreaterEqual: return "'>='";
        case TokenKind::Plus: return "'+'";
        case TokenKind::Minus: return "'-'";
        case TokenKind::Star: return "'*'";
        case TokenKind::Slash: return "'/'";
        case TokenKind::Eof: return "end of input";
        case TokenKind::Invalid: return "invalid token";
    }
    return "token";
}

Lexer::Lexer(std::string input) : m_input(std::move(input)) {}

char Lexer::peek() const { return eof() ? '\0' : m_input[m_pos]; }
char Lexer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool Lexer::eof() const { return m_pos >= m_input.size(); }

void Lexer::skip_space() { while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) get(); }

bool Lexer::is_word_start(char c) const { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
bool Lexer::is_word_char(char c) const { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

Token Lexer::lex_operator() {
    std::size_t start = m_pos;
    char c = get();
    switch (c) {
        case '(': return {TokenKind::LeftParen, "(", start};
        case ')': return {TokenKind::RightParen, ")", start};
        case '{': return {TokenKind::LeftBrace, "{", start};
        case '}': return {TokenKind::RightBrace, "}", start};
        case ';': return {TokenKind::Semi, ";", start};
        case ',': return {TokenKind::Comma, ",", start};
        case '+': return {TokenKind::Plus, "+", start};
        case '-': return {TokenKind::Minus, "-", start};
        case '*': return {TokenKind::Star, "*", start};
        case '/': return {TokenKind::Slash, "/", start};
        case '=': if (peek() == '=') { get(); return {TokenKind::EqualEqual, "==", start}; } return {TokenKind::Assign, "=", start};
        case '<': if (peek() == '=') { get(); return {TokenKind::LessEqual, "<=", start}; } return {TokenKind::Less, "<", start};
        case '>': if (peek() == '=') { get(); return {TokenKind::GreaterEqual, ">=", start}; } return {TokenKind::Greater, ">", start};
        case '!':
            // '!' only exists as part of '!='
            if (peek() == '=') { get(); return {TokenKind::BangEqual, "!=", start}; }
            return {TokenKind::Invalid, "!", start};
        default: return {TokenKind::Invalid, std::string(1, c), start};
    }
}

Token Lexer::lex_word() {
    std::size_t start = m_pos;
    while (!eof() && is_word_char(peek())) get();
    std::string word = m_input.substr(start, m_pos - start);
    auto it = keywords().find(word);
    if (it != keywords().end()) return {it->second, word, start};
    return {TokenKind::Identifier, word, start};
}

Token Lexer::lex_number() {
    std::size_t start = m_pos;
    while (!eof() && std::isdigit(static_cast<unsigned char>(peek()))) get();
    return {TokenKind::Number, m_input.substr(start, m_pos - start), start};
}

Token Lexer::lex_string() {
    std::size_t start = m_pos;
    get(); // opening quote
    while (!eof() && peek() != '"') get();
    if (eof()) return {TokenKind::Invalid, m_input.substr(start), start}; // unterminated
    get(); // closing quote
    return {TokenKind::String, m_input.substr(start, m_pos - start), start};
}

Token Lexer::next() {
    skip_space(); if (eof()) return {TokenKind::Eof, "", m_pos};
    char c = peek();
    if (is_word_start(c)) return lex_word();
    if (std::isdigit(static_cast<unsigned char>(c))) return lex_number();
    if (c == '"') return lex_string();
    return lex_operator();
}

TokenStream Lexer::run() {
    TokenStream ts; while (true) { Token t = next(); ts.push_back(t); if (t.kind == TokenKind::Eof) break; }
    return ts;
}

} // namespace esta
