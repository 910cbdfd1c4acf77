/*
 * Esta AST Printer
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Renders an AST either as a compact S-expression (dump) or as canonical
 *   Esta source (to_source). Canonical source parenthesises every operator
 *   application, so parsing it again yields a tree with the same dump.
 */
#pragma once
#include <string>
#include "esta/parse/ast.hpp"
#include "esta/parse/parser.hpp"

namespace esta {

// (+ 1 (* 2 3)), (if x (block (assign y 1)) (block)), (for _ (< i 10) _ (block))
std::string dump(const ExprNode& expr);
std::string dump(const StmtNode& stmt);
// One top-level statement per line.
std::string dump(const AST& ast);

std::string to_source(const AST& ast, ForSyntax for_syntax = ForSyntax::Conventional);

} // namespace esta
