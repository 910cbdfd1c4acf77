/*
 * Parse error tests - Esta
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <esta/lex/lexer.hpp>
#include <esta/parse/parser.hpp>

using namespace esta;

static ParseError expect_failure(const std::string& src) {
    auto res = parse_source(src);
    EXPECT_FALSE(res.ok()) << src;
    EXPECT_TRUE(res.value.statements.empty()) << "partial tree for: " << src;
    if (!res.error) return ParseError{ParseErrorKind::Syntax, 0, "", "<no error>"};
    return *res.error;
}

TEST(ErrorSyntax, MissingDeclarationName) {
    auto err = expect_failure("var ;");
    EXPECT_EQ(err.kind, ParseErrorKind::Syntax);
    EXPECT_EQ(err.pos, 4u);
    EXPECT_EQ(err.lexeme, ";");
    EXPECT_EQ(err.message, "expected identifier after 'var', found ';'");
}

TEST(ErrorSyntax, NonCallExpressionStatement) {
    auto err = expect_failure("if x { 1; }");
    EXPECT_EQ(err.kind, ParseErrorKind::Syntax);
    EXPECT_EQ(err.pos, 8u);
}

TEST(ErrorSyntax, CallStatementMustBeBare) {
    for (const char* src : {"(f());", "((f()));", "x = 1; (g(x));"}) {
        auto err = expect_failure(src);
        EXPECT_EQ(err.kind, ParseErrorKind::Syntax) << src;
        EXPECT_EQ(err.message, "expected '=' after expression, found ';'") << src;
    }
    auto err = expect_failure("f() + 1;");
    EXPECT_EQ(err.lexeme, ";");
    EXPECT_TRUE(parse_source("(f()) = 1;").ok());
}

TEST(ErrorSyntax, MissingTerminatorInBlock) {
    auto err = expect_failure("if x { f() }");
    EXPECT_EQ(err.kind, ParseErrorKind::Syntax);
    EXPECT_EQ(err.lexeme, "}");
    EXPECT_EQ(err.message, "expected ';' after call statement, found '}'");
}

TEST(ErrorSyntax, MissingTerminators) {
    EXPECT_EQ(expect_failure("var x = 1").message, "expected ';' after declaration, found end of input");
    EXPECT_EQ(expect_failure("x = 1 y = 2;").lexeme, "y");
    EXPECT_EQ(expect_failure("return 1").kind, ParseErrorKind::Syntax);
    EXPECT_EQ(expect_failure("break").kind, ParseErrorKind::Syntax);
}

TEST(ErrorSyntax, UnclosedDelimiters) {
    EXPECT_EQ(expect_failure("while x { f();").message, "expected '}' to close block, found end of input");
    EXPECT_EQ(expect_failure("x = (1 + 2;").message,
              "expected ')' to close parenthesized expression, found ';'");
    EXPECT_EQ(expect_failure("f(1, 2;").message, "expected ')' to close argument list, found ';'");
}

TEST(ErrorSyntax, BodiesRequireBraces) {
    EXPECT_EQ(expect_failure("while x f();").message, "expected '{' to open while body, found 'f'");
    EXPECT_EQ(expect_failure("if x f();").message, "expected '{' to open if body, found 'f'");
}

TEST(ErrorSyntax, MalformedLists) {
    EXPECT_EQ(expect_failure("f(,);").message, "expected expression, found ','");
    EXPECT_EQ(expect_failure("f(1,,2);").message, "expected expression, found ','");
    EXPECT_EQ(expect_failure("fun g(a b) { }").message, "expected ')' to close parameter list, found 'b'");
    EXPECT_EQ(expect_failure("fun g(1) { }").message, "expected parameter name, found '1'");
    EXPECT_EQ(expect_failure("fun (a) { }").message, "expected function name after 'fun', found '('");
}

TEST(ErrorSyntax, StrayTokens) {
    EXPECT_EQ(expect_failure("}").message, "expected expression, found '}'");
    EXPECT_EQ(expect_failure("else { }").kind, ParseErrorKind::Syntax);
    EXPECT_EQ(expect_failure("x = ;").message, "expected expression, found ';'");
    EXPECT_EQ(expect_failure("1 + ;").pos, 4u);
}

TEST(ErrorSyntax, FailsAtFirstErrorOnly) {
    auto err = expect_failure("var a = 1;\nvar = 2;\nvar ;");
    EXPECT_EQ(err.pos, 15u);
    EXPECT_EQ(err.lexeme, "=");
}

TEST(ErrorLiteral, Int32Overflow) {
    auto err = expect_failure("x = 99999999999;");
    EXPECT_EQ(err.kind, ParseErrorKind::LiteralConversion);
    EXPECT_EQ(err.pos, 4u);
    EXPECT_EQ(err.lexeme, "99999999999");
    EXPECT_EQ(expect_failure("x = 2147483648;").kind, ParseErrorKind::LiteralConversion);
    EXPECT_TRUE(parse_source("x = 2147483647;").ok());
}

TEST(ErrorLiteral, NegationDoesNotRescueOverflow) {
    // the digits are converted before negation applies
    EXPECT_EQ(expect_failure("x = -2147483648;").kind, ParseErrorKind::LiteralConversion);
}

TEST(ErrorLexical, InvalidCharacter) {
    auto err = expect_failure("x = 1 @ 2;");
    EXPECT_EQ(err.kind, ParseErrorKind::Lexical);
    EXPECT_EQ(err.pos, 6u);
    EXPECT_EQ(err.lexeme, "@");
}

TEST(ErrorLexical, ReportedBeforeSyntax) {
    auto err = expect_failure("var ; x = \"unterminated");
    EXPECT_EQ(err.kind, ParseErrorKind::Lexical);
    EXPECT_EQ(err.pos, 10u);
}

TEST(ErrorLexical, HandBuiltStream) {
    TokenStream ts = {{TokenKind::Identifier, "f", 0}, {TokenKind::Invalid, "$", 1}, {TokenKind::Eof, "", 2}};
    auto res = parse_tokens(ts);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error->kind, ParseErrorKind::Lexical);
    EXPECT_EQ(res.error->pos, 1u);
}

TEST(ErrorKinds, Names) {
    EXPECT_STREQ(error_kind_name(ParseErrorKind::Lexical), "lexical");
    EXPECT_STREQ(error_kind_name(ParseErrorKind::Syntax), "syntax");
    EXPECT_STREQ(error_kind_name(ParseErrorKind::LiteralConversion), "literal conversion");
}

static std::string repeat(const std::string& s, std::size_t n) {
    std::string out;
    out.reserve(s.size() * n);
    for (std::size_t i = 0; i < n; ++i) out += s;
    return out;
}

TEST(ErrorNesting, DeepParentheses) {
    auto err = expect_failure("x = " + repeat("(", 10000) + "1" + repeat(")", 10000) + ";");
    EXPECT_EQ(err.kind, ParseErrorKind::Syntax);
    EXPECT_EQ(err.lexeme, "(");
    EXPECT_EQ(err.message, "expression nested too deeply, found '('");
}

TEST(ErrorNesting, DeepUnaryPrefixes) {
    auto err = expect_failure("x = " + repeat("- ", 10000) + "1;");
    EXPECT_EQ(err.kind, ParseErrorKind::Syntax);
    EXPECT_EQ(err.lexeme, "-");
}

TEST(ErrorNesting, DeepBlocks) {
    auto err = expect_failure(repeat("if a { ", 10000) + repeat("} ", 10000));
    EXPECT_EQ(err.kind, ParseErrorKind::Syntax);
    EXPECT_EQ(err.lexeme, "if");
    EXPECT_EQ(err.message, "statements nested too deeply, found 'if'");
}

TEST(ErrorNesting, ModerateNestingAccepted) {
    EXPECT_TRUE(parse_source("x = " + repeat("(", 200) + "1" + repeat(")", 200) + ";").ok());
    EXPECT_TRUE(parse_source(repeat("while a { ", 100) + "f();" + repeat(" }", 100)).ok());
}
