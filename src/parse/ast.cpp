/*
 * Esta AST Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <esta/parse/ast.hpp>
#include <type_traits>
#include <utility>
#include <variant>

namespace esta {

namespace {

// Moves the direct children of a node onto the worklist, leaving it a leaf.
void detach_children(ExprNode& expr, std::vector<ExprPtr>& pending) {
    std::visit([&](auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, BinaryNode>) {
            if (n.left) pending.push_back(std::move(n.left));
            if (n.right) pending.push_back(std::move(n.right));
        } else if constexpr (std::is_same_v<T, UnaryNode>) {
            if (n.operand) pending.push_back(std::move(n.operand));
        } else if constexpr (std::is_same_v<T, CallNode>) {
            for (auto& a : n.args)
                if (a) pending.push_back(std::move(a));
            n.args.clear();
        }
    }, expr.node);
}

} // namespace

ExprNode::~ExprNode() {
    std::vector<ExprPtr> pending;
    detach_children(*this, pending);
    while (!pending.empty()) {
        ExprPtr next = std::move(pending.back());
        pending.pop_back();
        detach_children(*next, pending);
        // next is a leaf now; its own destructor finds nothing to release
    }
}

} // namespace esta
