/*
 * Esta AST Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Defines Abstract Syntax Tree node structures for Esta programs. Two closed
 *   families are modelled as std::variant sums: expressions (literals,
 *   identifiers, binary and unary operations, function calls) and statements
 *   (declarations, assignments, while/if/for, function declarations, return,
 *   break/continue, standalone calls and blocks). Every node exclusively owns
 *   its children. The AST is produced by the parser and handed to a consumer
 *   (evaluator, printer) as an owned tree.
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
#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <variant>

namespace esta {

// Unary negation shares the Sub tag with binary subtraction; arity tells them apart.
enum class Operator { And, Or, Eq, NotEq, Less, Greater, LessEq, GreaterEq, Add, Sub, Mul, Div, Not };

const char* operator_symbol(Operator op);

struct NumberLit { std::int32_t value; };
struct BooleanLit { bool value; };
struct StringLit { std::string text; }; // lexeme including the surrounding quotes
struct NilLit {};

using Literal = std::variant<NumberLit, BooleanLit, StringLit, NilLit>;

struct ExprNode;
struct StmtNode;
using ExprPtr = std::unique_ptr<ExprNode>;
using StmtPtr = std::unique_ptr<StmtNode>;

struct LiteralNode {
    Literal value;
};

struct IdentifierNode {
    std::string name;
};

struct BinaryNode {
    ExprPtr left;
    Operator op;
    ExprPtr right;
};

struct UnaryNode {
    Operator op; // Not or Sub
    ExprPtr operand;
};

struct CallNode {
    std::string name;
    std::vector<ExprPtr> args;
};

struct ExprNode {
    using Variant = std::variant<LiteralNode, IdentifierNode, BinaryNode, UnaryNode, CallNode>;
    Variant node;
    std::size_t pos = 0; // offset of the first token

    ExprNode() = default;
    ExprNode(ExprNode&&) = default;
    ExprNode& operator=(ExprNode&&) = default;
    // Releases the subtree with an explicit worklist; operator chains can be
    // far longer than the native stack allows to recurse.
    ~ExprNode();
};

struct BlockNode {
    std::vector<StmtPtr> statements;
};

struct DeclarationNode {
    std::string name;
    ExprPtr initializer; // Nil literal when omitted, never null
};

struct AssignmentNode {
    ExprPtr target;
    ExprPtr value;
};

struct WhileNode {
    ExprPtr condition;
    BlockNode body;
};

struct IfNode {
    ExprPtr condition;
    BlockNode then_block;
    StmtPtr else_branch; // never null; empty BlockNode when no 'else' was written
};

struct ForNode {
    // each clause may be null
    ExprPtr init;
    ExprPtr test;
    ExprPtr increment;
    BlockNode body;
};

struct FunDeclNode {
    std::string name;
    std::vector<std::string> params;
    BlockNode body;
};

struct ReturnNode {
    ExprPtr value; // null for a bare 'return;'
};

struct BreakNode {};
struct ContinueNode {};

struct ImpureCallNode {
    ExprPtr call; // always holds a CallNode
};

struct StmtNode {
    using Variant = std::variant<DeclarationNode, AssignmentNode, WhileNode, IfNode, ForNode,
                                 FunDeclNode, ReturnNode, BreakNode, ContinueNode,
                                 ImpureCallNode, BlockNode>;
    Variant node;
    std::size_t pos = 0;
};

struct AST {
    std::vector<StmtPtr> statements;
};

} // namespace esta
