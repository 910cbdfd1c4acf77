/*
 * Esta Parser Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Recursive-descent statement parser and precedence-climbing
 *              expression parser. See header for details.
 */
#include <esta/parse/ast.hpp>
#include <esta/parse/tokens.hpp>
#include <esta/parse/parser.hpp>
#include <esta/lex/lexer.hpp>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <system_error>
#include <utility>

namespace esta {

const char* error_kind_name(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::Lexical: return "lexical";
        case ParseErrorKind::Syntax: return "syntax";
        case ParseErrorKind::LiteralConversion: return "literal conversion";
    }
    return "parse";
}

namespace {

using OperatorTable = std::initializer_list<std::pair<TokenKind, Operator>>;

// Deepest statement or expression nesting the parser accepts, counted separately.
constexpr std::size_t kMaxNesting = 256;

// Counts one level of statement or expression nesting while in scope.
class NestingGuard {
public:
    explicit NestingGuard(std::size_t& depth) : m_depth(depth) { ++m_depth; }
    ~NestingGuard() { --m_depth; }
    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;
    bool exceeded() const { return m_depth > kMaxNesting; }
private:
    std::size_t& m_depth;
};

template <typename Node>
ExprPtr make_expr(Node node, std::size_t pos) {
    auto expr = std::make_unique<ExprNode>();
    expr->node.emplace<Node>(std::move(node));
    expr->pos = pos;
    return expr;
}

template <typename Node>
StmtPtr make_stmt(Node node, std::size_t pos) {
    auto stmt = std::make_unique<StmtNode>();
    stmt->node.emplace<Node>(std::move(node));
    stmt->pos = pos;
    return stmt;
}

std::string describe(const Token& tok) {
    if (tok.kind == TokenKind::Eof) return "end of input";
    return "'" + tok.lexeme + "'";
}

} // namespace

class Parser {
public:
    Parser(const TokenStream& ts, ParserOptions opts) : m_ts(ts), m_opts(opts) {}

    bool parse_program(AST& ast) {
        if (!check_lexical()) return false;
        while (!eof()) {
            auto stmt = parse_statement();
            if (!stmt) return false;
            ast.statements.push_back(std::move(stmt));
        }
        return true;
    }

    StmtPtr parse_single_statement() {
        if (!check_lexical()) return nullptr;
        auto stmt = parse_statement();
        if (!stmt) return nullptr;
        if (!eof()) return fail("expected end of input after statement");
        return stmt;
    }

    ExprPtr parse_single_expression() {
        if (!check_lexical()) return nullptr;
        auto expr = parse_expression();
        if (!expr) return nullptr;
        if (!eof()) return fail("expected end of input after expression");
        return expr;
    }

    std::optional<ParseError> take_error() { return std::move(m_error); }

private:
    const Token& peek(std::size_t ahead = 0) const {
        static const Token end_of_input{TokenKind::Eof, "", 0};
        return m_index + ahead < m_ts.size() ? m_ts[m_index + ahead] : end_of_input;
    }
    bool eof() const { return peek().kind == TokenKind::Eof; }
    bool check(TokenKind kind) const { return peek().kind == kind; }
    const Token& get() {
        const Token& tok = peek();
        if (tok.kind != TokenKind::Eof) ++m_index;
        return tok;
    }
    bool match(TokenKind kind) {
        if (!check(kind)) return false;
        get();
        return true;
    }

    void record(ParseErrorKind kind, const Token& tok, std::string message) {
        if (m_error) return; // keep the first failure
        m_error = ParseError{kind, tok.pos, tok.lexeme, std::move(message)};
    }

    std::nullptr_t fail(const std::string& message) {
        record(ParseErrorKind::Syntax, peek(), message + ", found " + describe(peek()));
        return nullptr;
    }

    bool expect(TokenKind kind, const char* context) {
        if (match(kind)) return true;
        fail(std::string("expected ") + token_kind_name(kind) + " " + context);
        return false;
    }

    // The lexer never aborts, so the first Invalid token is the lexical error.
    bool check_lexical() {
        for (const auto& tok : m_ts) {
            if (tok.kind != TokenKind::Invalid) continue;
            record(ParseErrorKind::Lexical, tok, "unrecognized input " + describe(tok));
            return false;
        }
        return true;
    }

    // T {, T} [,] — empty list and trailing comma allowed; consumes the closing ')'.
    template <typename ParseItem>
    bool parse_comma_list(ParseItem parse_item, const char* context) {
        while (!check(TokenKind::RightParen)) {
            if (!parse_item()) return false;
            if (!match(TokenKind::Comma)) break;
        }
        return expect(TokenKind::RightParen, context);
    }

    // ---- statements ----

    StmtPtr parse_statement() {
        NestingGuard guard(m_stmt_depth);
        if (guard.exceeded()) return fail("statements nested too deeply");
        switch (peek().kind) {
            case TokenKind::Var: return parse_declaration();
            case TokenKind::While: return parse_while();
            case TokenKind::If: return parse_if();
            case TokenKind::For: return parse_for();
            case TokenKind::Fun: return parse_fun_decl();
            case TokenKind::Return: return parse_return();
            case TokenKind::Break: return parse_jump<BreakNode>("after 'break'");
            case TokenKind::Continue: return parse_jump<ContinueNode>("after 'continue'");
            default: return parse_assignment_or_call();
        }
    }

    bool parse_block(BlockNode& block, const char* context) {
        if (!expect(TokenKind::LeftBrace, context)) return false;
        while (!check(TokenKind::RightBrace)) {
            if (eof()) { fail("expected '}' to close block"); return false; }
            auto stmt = parse_statement();
            if (!stmt) return false;
            block.statements.push_back(std::move(stmt));
        }
        get(); // '}'
        return true;
    }

    StmtPtr parse_declaration() {
        std::size_t pos = get().pos; // 'var'
        if (!check(TokenKind::Identifier)) return fail("expected identifier after 'var'");
        const Token& name = get();
        DeclarationNode decl;
        decl.name = name.lexeme;
        if (match(TokenKind::Assign)) {
            decl.initializer = parse_expression();
            if (!decl.initializer) return nullptr;
        } else {
            decl.initializer = make_expr(LiteralNode{NilLit{}}, name.pos);
        }
        if (!expect(TokenKind::Semi, "after declaration")) return nullptr;
        return make_stmt(std::move(decl), pos);
    }

    // '=' never appears inside an expression, so the left-hand side is parsed
    // as an ordinary expression and the next token picks the statement form.
    // A call statement must be written bare: name '(' ... ')' ';'.
    StmtPtr parse_assignment_or_call() {
        std::size_t pos = peek().pos;
        bool bare_call = check(TokenKind::Identifier) && peek(1).kind == TokenKind::LeftParen;
        auto expr = parse_expression();
        if (!expr) return nullptr;
        if (match(TokenKind::Assign)) {
            AssignmentNode assign;
            assign.target = std::move(expr);
            assign.value = parse_expression();
            if (!assign.value) return nullptr;
            if (!expect(TokenKind::Semi, "after assignment")) return nullptr;
            return make_stmt(std::move(assign), pos);
        }
        if (!bare_call || !std::holds_alternative<CallNode>(expr->node)) return fail("expected '=' after expression");
        if (!expect(TokenKind::Semi, "after call statement")) return nullptr;
        return make_stmt(ImpureCallNode{std::move(expr)}, pos);
    }

    StmtPtr parse_while() {
        std::size_t pos = get().pos;
        WhileNode loop;
        loop.condition = parse_expression();
        if (!loop.condition) return nullptr;
        if (!parse_block(loop.body, "to open while body")) return nullptr;
        return make_stmt(std::move(loop), pos);
    }

    StmtPtr parse_if() {
        std::size_t pos = get().pos;
        IfNode node;
        node.condition = parse_expression();
        if (!node.condition) return nullptr;
        if (!parse_block(node.then_block, "to open if body")) return nullptr;
        if (!match(TokenKind::Else)) {
            node.else_branch = make_stmt(BlockNode{}, peek().pos);
        } else if (check(TokenKind::LeftBrace)) {
            std::size_t else_pos = peek().pos;
            BlockNode block;
            if (!parse_block(block, "to open else body")) return nullptr;
            node.else_branch = make_stmt(std::move(block), else_pos);
        } else {
            node.else_branch = parse_statement();
            if (!node.else_branch) return nullptr;
        }
        return make_stmt(std::move(node), pos);
    }

    StmtPtr parse_for() {
        std::size_t pos = get().pos;
        ForNode loop;
        if (!check(TokenKind::Semi)) {
            loop.init = parse_expression();
            if (!loop.init) return nullptr;
        }
        if (!expect(TokenKind::Semi, "after for initializer")) return nullptr;
        if (!check(TokenKind::Semi)) {
            loop.test = parse_expression();
            if (!loop.test) return nullptr;
        }
        if (!expect(TokenKind::Semi, "after for condition")) return nullptr;
        TokenKind inc_end = m_opts.for_syntax == ForSyntax::Legacy ? TokenKind::Semi : TokenKind::LeftBrace;
        if (!check(inc_end)) {
            loop.increment = parse_expression();
            if (!loop.increment) return nullptr;
        }
        if (m_opts.for_syntax == ForSyntax::Legacy && !expect(TokenKind::Semi, "after for increment")) return nullptr;
        if (!parse_block(loop.body, "to open for body")) return nullptr;
        return make_stmt(std::move(loop), pos);
    }

    StmtPtr parse_fun_decl() {
        std::size_t pos = get().pos;
        if (!check(TokenKind::Identifier)) return fail("expected function name after 'fun'");
        FunDeclNode fun;
        fun.name = get().lexeme;
        if (!expect(TokenKind::LeftParen, "after function name")) return nullptr;
        bool params_ok = parse_comma_list([&]() {
            if (!check(TokenKind::Identifier)) { fail("expected parameter name"); return false; }
            fun.params.push_back(get().lexeme);
            return true;
        }, "to close parameter list");
        if (!params_ok) return nullptr;
        if (!parse_block(fun.body, "to open function body")) return nullptr;
        return make_stmt(std::move(fun), pos);
    }

    StmtPtr parse_return() {
        std::size_t pos = get().pos;
        ReturnNode ret;
        if (!check(TokenKind::Semi)) {
            ret.value = parse_expression();
            if (!ret.value) return nullptr;
        }
        if (!expect(TokenKind::Semi, "after return")) return nullptr;
        return make_stmt(std::move(ret), pos);
    }

    template <typename Node>
    StmtPtr parse_jump(const char* context) {
        std::size_t pos = get().pos;
        if (!expect(TokenKind::Semi, context)) return nullptr;
        return make_stmt(Node{}, pos);
    }

    // ---- expressions, lowest precedence first ----

    ExprPtr parse_expression() { return parse_logical(); }

    // Layer := Layer Op Next | Next, built iteratively so chains lean left.
    ExprPtr parse_binary_layer(ExprPtr (Parser::*next)(), OperatorTable ops) {
        auto left = (this->*next)();
        if (!left) return nullptr;
        while (true) {
            std::optional<Operator> op;
            for (const auto& entry : ops) {
                if (check(entry.first)) { op = entry.second; break; }
            }
            if (!op) break;
            get();
            auto right = (this->*next)();
            if (!right) return nullptr;
            std::size_t pos = left->pos;
            left = make_expr(BinaryNode{std::move(left), *op, std::move(right)}, pos);
        }
        return left;
    }

    ExprPtr parse_logical() {
        return parse_binary_layer(&Parser::parse_equality,
                                  {{TokenKind::And, Operator::And}, {TokenKind::Or, Operator::Or}});
    }

    ExprPtr parse_equality() {
        return parse_binary_layer(&Parser::parse_comparison,
                                  {{TokenKind::EqualEqual, Operator::Eq}, {TokenKind::BangEqual, Operator::NotEq}});
    }

    ExprPtr parse_comparison() {
        return parse_binary_layer(&Parser::parse_additive,
                                  {{TokenKind::Less, Operator::Less},
                                   {TokenKind::Greater, Operator::Greater},
                                   {TokenKind::LessEqual, Operator::LessEq},
                                   {TokenKind::GreaterEqual, Operator::GreaterEq}});
    }

    ExprPtr parse_additive() {
        return parse_binary_layer(&Parser::parse_multiplicative,
                                  {{TokenKind::Plus, Operator::Add}, {TokenKind::Minus, Operator::Sub}});
    }

    ExprPtr parse_multiplicative() {
        return parse_binary_layer(&Parser::parse_unary,
                                  {{TokenKind::Star, Operator::Mul}, {TokenKind::Slash, Operator::Div}});
    }

    ExprPtr parse_unary() {
        NestingGuard guard(m_expr_depth);
        if (guard.exceeded()) return fail("expression nested too deeply");
        if (!check(TokenKind::Not) && !check(TokenKind::Minus)) return parse_primary();
        const Token& op = get();
        auto operand = parse_unary();
        if (!operand) return nullptr;
        Operator tag = op.kind == TokenKind::Not ? Operator::Not : Operator::Sub;
        return make_expr(UnaryNode{tag, std::move(operand)}, op.pos);
    }

    ExprPtr parse_primary() {
        const Token& tok = peek();
        switch (tok.kind) {
            case TokenKind::Identifier: return parse_identifier_or_call();
            case TokenKind::Number: return parse_number();
            case TokenKind::String:
                get();
                return make_expr(LiteralNode{StringLit{tok.lexeme}}, tok.pos);
            case TokenKind::True:
            case TokenKind::False:
                get();
                return make_expr(LiteralNode{BooleanLit{tok.kind == TokenKind::True}}, tok.pos);
            case TokenKind::Nil:
                get();
                return make_expr(LiteralNode{NilLit{}}, tok.pos);
            case TokenKind::LeftParen: {
                std::size_t open = get().pos;
                auto inner = parse_expression();
                if (!inner) return nullptr;
                if (!expect(TokenKind::RightParen, "to close parenthesized expression")) return nullptr;
                inner->pos = open;
                return inner;
            }
            default:
                return fail("expected expression");
        }
    }

    ExprPtr parse_identifier_or_call() {
        const Token& name = get();
        if (!match(TokenKind::LeftParen)) return make_expr(IdentifierNode{name.lexeme}, name.pos);
        CallNode call;
        call.name = name.lexeme;
        bool args_ok = parse_comma_list([&]() {
            auto arg = parse_expression();
            if (!arg) return false;
            call.args.push_back(std::move(arg));
            return true;
        }, "to close argument list");
        if (!args_ok) return nullptr;
        return make_expr(std::move(call), name.pos);
    }

    ExprPtr parse_number() {
        const Token& tok = get();
        std::int32_t value = 0;
        const char* first = tok.lexeme.data();
        const char* last = first + tok.lexeme.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc::result_out_of_range) {
            record(ParseErrorKind::LiteralConversion, tok,
                   "numeric literal " + tok.lexeme + " does not fit in a 32-bit signed integer");
            return nullptr;
        }
        if (ec != std::errc() || ptr != last || tok.lexeme.empty()) {
            record(ParseErrorKind::Syntax, tok, "malformed numeric literal " + describe(tok));
            return nullptr;
        }
        return make_expr(LiteralNode{NumberLit{value}}, tok.pos);
    }

    const TokenStream& m_ts;
    ParserOptions m_opts;
    std::size_t m_index = 0;
    std::size_t m_stmt_depth = 0;
    std::size_t m_expr_depth = 0;
    std::optional<ParseError> m_error;
};

ParseResult<AST> parse_tokens(const TokenStream& ts, ParserOptions opts) {
    Parser p(ts, opts);
    ParseResult<AST> result;
    if (!p.parse_program(result.value)) result.value.statements.clear();
    result.error = p.take_error();
    return result;
}

ParseResult<AST> parse_source(const std::string& source, ParserOptions opts) {
    Lexer lx(source);
    auto ts = lx.run();
    return parse_tokens(ts, opts);
}

ParseResult<StmtPtr> parse_statement(const TokenStream& ts, ParserOptions opts) {
    Parser p(ts, opts);
    ParseResult<StmtPtr> result;
    result.value = p.parse_single_statement();
    result.error = p.take_error();
    return result;
}

ParseResult<ExprPtr> parse_expression(const TokenStream& ts) {
    Parser p(ts, ParserOptions{});
    ParseResult<ExprPtr> result;
    result.value = p.parse_single_expression();
    result.error = p.take_error();
    return result;
}

} // namespace esta
