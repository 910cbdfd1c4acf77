/*
 * Expression parser tests - Esta
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <esta/lex/lexer.hpp>
#include <esta/parse/parser.hpp>
#include <esta/parse/printer.hpp>
#include <esta/parse/ast.hpp>

using namespace esta;

static std::string expr_dump(const std::string& src) {
    Lexer lx(src);
    auto ts = lx.run();
    auto res = parse_expression(ts);
    if (!res.ok()) return "error: " + res.error->message;
    return dump(*res.value);
}

TEST(ParserPrecedence, MulBindsTighterThanAdd) {
    EXPECT_EQ(expr_dump("1 + 2 * 3"), "(+ 1 (* 2 3))");
    EXPECT_EQ(expr_dump("1 * 2 + 3"), "(+ (* 1 2) 3)");
}

TEST(ParserPrecedence, FullLadder) {
    EXPECT_EQ(expr_dump("a or b == c < d + e * f"),
              "(or a (== b (< c (+ d (* e f)))))");
    EXPECT_EQ(expr_dump("a * b + c < d == e and f"),
              "(and (== (< (+ (* a b) c) d) e) f)");
}

TEST(ParserPrecedence, AndOrShareOneLayer) {
    EXPECT_EQ(expr_dump("a or b and c"), "(and (or a b) c)");
}

TEST(ParserAssociativity, LeftAssociativeChains) {
    EXPECT_EQ(expr_dump("10 - 3 - 2"), "(- (- 10 3) 2)");
    EXPECT_EQ(expr_dump("8 / 4 / 2"), "(/ (/ 8 4) 2)");
    EXPECT_EQ(expr_dump("a < b < c"), "(< (< a b) c)");
    EXPECT_EQ(expr_dump("a == b != c"), "(!= (== a b) c)");
}

TEST(ParserAssociativity, ParenthesesRegroupWithoutNode) {
    EXPECT_EQ(expr_dump("10 - (3 - 2)"), "(- 10 (- 3 2))");
    EXPECT_EQ(expr_dump("(1 + 2) * 3"), "(* (+ 1 2) 3)");
    EXPECT_EQ(expr_dump("((x))"), "x");
}

TEST(ParserUnary, Stacking) {
    EXPECT_EQ(expr_dump("- - 5"), "(- (- 5))");
    EXPECT_EQ(expr_dump("not not x"), "(not (not x))");
    EXPECT_EQ(expr_dump("not - x"), "(not (- x))");
}

TEST(ParserUnary, BindsTighterThanBinary) {
    EXPECT_EQ(expr_dump("-a * b"), "(* (- a) b)");
    EXPECT_EQ(expr_dump("a - -b"), "(- a (- b))");
    EXPECT_EQ(expr_dump("not a == b"), "(== (not a) b)");
}

TEST(ParserUnary, MinusTagIsShared) {
    Lexer lx("-x - y");
    auto ts = lx.run();
    auto res = parse_expression(ts);
    ASSERT_TRUE(res.ok());
    auto *bin = std::get_if<BinaryNode>(&res.value->node);
    ASSERT_NE(bin, nullptr);
    EXPECT_EQ(bin->op, Operator::Sub);
    auto *un = std::get_if<UnaryNode>(&bin->left->node);
    ASSERT_NE(un, nullptr);
    EXPECT_EQ(un->op, Operator::Sub);
}

TEST(ParserPrimary, Literals) {
    EXPECT_EQ(expr_dump("42"), "42");
    EXPECT_EQ(expr_dump("True"), "True");
    EXPECT_EQ(expr_dump("False"), "False");
    EXPECT_EQ(expr_dump("Nil"), "Nil");
    EXPECT_EQ(expr_dump("\"hi there\""), "\"hi there\"");
}

TEST(ParserPrimary, LiteralPayloads) {
    Lexer lx("\"abc\"");
    auto ts = lx.run();
    auto res = parse_expression(ts);
    ASSERT_TRUE(res.ok());
    auto *lit = std::get_if<LiteralNode>(&res.value->node);
    ASSERT_NE(lit, nullptr);
    auto *str = std::get_if<StringLit>(&lit->value);
    ASSERT_NE(str, nullptr);
    EXPECT_EQ(str->text, "\"abc\"");

    Lexer lx2("2147483647");
    auto ts2 = lx2.run();
    auto res2 = parse_expression(ts2);
    ASSERT_TRUE(res2.ok());
    auto *num = std::get_if<NumberLit>(&std::get<LiteralNode>(res2.value->node).value);
    ASSERT_NE(num, nullptr);
    EXPECT_EQ(num->value, 2147483647);
}

TEST(ParserCall, IdentifierVersusCall) {
    EXPECT_EQ(expr_dump("f"), "f");
    EXPECT_EQ(expr_dump("f()"), "(call f)");
    EXPECT_EQ(expr_dump("f(1, x + 1)"), "(call f 1 (+ x 1))");
    EXPECT_EQ(expr_dump("f(g(1), h())"), "(call f (call g 1) (call h))");
}

TEST(ParserCall, TrailingComma) {
    Lexer lx("f(1,2,)");
    auto ts = lx.run();
    auto res = parse_expression(ts);
    ASSERT_TRUE(res.ok());
    auto *call = std::get_if<CallNode>(&res.value->node);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->name, "f");
    EXPECT_EQ(call->args.size(), 2u);
    EXPECT_EQ(dump(*call->args[1]), "2");
}

TEST(ParserCall, EmptyArgumentList) {
    Lexer lx("f()");
    auto ts = lx.run();
    auto res = parse_expression(ts);
    ASSERT_TRUE(res.ok());
    auto *call = std::get_if<CallNode>(&res.value->node);
    ASSERT_NE(call, nullptr);
    EXPECT_TRUE(call->args.empty());
}

TEST(ParserCall, CallInsideArithmetic) {
    EXPECT_EQ(expr_dump("-f(x) * 2"), "(* (- (call f x)) 2)");
}

TEST(ParserPositions, NodesRecordFirstToken) {
    Lexer lx("a + b * c");
    auto ts = lx.run();
    auto res = parse_expression(ts);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value->pos, 0u);
    auto &add = std::get<BinaryNode>(res.value->node);
    EXPECT_EQ(add.right->pos, 4u);

    Lexer grouped("(a + b) * c");
    auto gts = grouped.run();
    auto gres = parse_expression(gts);
    ASSERT_TRUE(gres.ok());
    EXPECT_EQ(gres.value->pos, 0u);
    auto &mul = std::get<BinaryNode>(gres.value->node);
    EXPECT_EQ(mul.left->pos, 0u);
    EXPECT_EQ(mul.right->pos, 10u);

    Lexer inner("c * ((a))");
    auto its = inner.run();
    auto ires = parse_expression(its);
    ASSERT_TRUE(ires.ok());
    EXPECT_EQ(std::get<BinaryNode>(ires.value->node).right->pos, 4u);
}

TEST(ParserLimits, LongOperatorChain) {
    std::string src = "x = 1";
    for (int i = 0; i < 300000; ++i) src += " + 1";
    src += ";";
    {
        auto res = parse_source(src);
        ASSERT_TRUE(res.ok());
        std::string text = dump(res.value);
        EXPECT_EQ(text.rfind("(assign x (+ (+ (+ ", 0), 0u);
        EXPECT_EQ(text.substr(text.size() - 4), " 1))");
        std::string canonical = to_source(res.value);
        EXPECT_EQ(canonical.rfind("x = ((((", 0), 0u);
        EXPECT_EQ(canonical.substr(canonical.size() - 7), " + 1);\n");
    } // the whole tree is released here
    SUCCEED();
}

TEST(ParserExpression, TrailingTokensRejected) {
    Lexer lx("1 2");
    auto ts = lx.run();
    auto res = parse_expression(ts);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error->kind, ParseErrorKind::Syntax);
    EXPECT_EQ(res.error->pos, 2u);
    EXPECT_FALSE(res.value);
}
