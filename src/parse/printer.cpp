/*
 * Esta AST Printer Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <esta/parse/printer.hpp>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace esta {

const char* operator_symbol(Operator op) {
    switch (op) {
        case Operator::And: return "and";
        case Operator::Or: return "or";
        case Operator::Eq: return "==";
        case Operator::NotEq: return "!=";
        case Operator::Less: return "<";
        case Operator::Greater: return ">";
        case Operator::LessEq: return "<=";
        case Operator::GreaterEq: return ">=";
        case Operator::Add: return "+";
        case Operator::Sub: return "-";
        case Operator::Mul: return "*";
        case Operator::Div: return "/";
        case Operator::Not: return "not";
    }
    return "?";
}

namespace {

std::string literal_text(const Literal& lit) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, NumberLit>) return std::to_string(v.value);
        else if constexpr (std::is_same_v<T, BooleanLit>) return v.value ? "True" : "False";
        else if constexpr (std::is_same_v<T, StringLit>) return v.text;
        else return "Nil";
    }, lit);
}

// Renders a left-leaning run of binary nodes with a loop down the left spine,
// as "(op l r)" or, when infix, "(l op r)". Right operands go through render.
template <typename Render>
std::string render_chain(const ExprNode& root, bool infix, Render render) {
    std::vector<const BinaryNode*> spine;
    const ExprNode* leaf = &root;
    while (const auto* bin = std::get_if<BinaryNode>(&leaf->node)) {
        spine.push_back(bin);
        leaf = bin->left.get();
    }
    std::string out;
    for (const auto* bin : spine) {
        out += "(";
        if (!infix) { out += operator_symbol(bin->op); out += " "; }
    }
    out += render(*leaf);
    for (auto it = spine.rbegin(); it != spine.rend(); ++it) {
        out += " ";
        if (infix) { out += operator_symbol((*it)->op); out += " "; }
        out += render(*(*it)->right);
        out += ")";
    }
    return out;
}

std::string dump_block(const BlockNode& block) {
    std::string out = "(block";
    for (const auto& s : block.statements) out += " " + dump(*s);
    return out + ")";
}

std::string dump_optional(const ExprPtr& expr) { return expr ? dump(*expr) : "_"; }

// Canonical source writer; four-space indentation, one statement per line.
class SourceWriter {
public:
    explicit SourceWriter(ForSyntax for_syntax) : m_for_syntax(for_syntax) {}

    std::string str() const { return m_out.str(); }

    void statement(const StmtNode& stmt) {
        indent();
        inline_statement(stmt);
        m_out << '\n';
    }

    static std::string expr(const ExprNode& e) {
        return std::visit([&e](const auto& n) -> std::string {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, LiteralNode>) return literal_text(n.value);
            else if constexpr (std::is_same_v<T, IdentifierNode>) return n.name;
            else if constexpr (std::is_same_v<T, BinaryNode>)
                return render_chain(e, true, [](const ExprNode& x) { return expr(x); });
            else if constexpr (std::is_same_v<T, UnaryNode>)
                return std::string("(") + operator_symbol(n.op) + " " + expr(*n.operand) + ")";
            else {
                std::string out = n.name + "(";
                for (std::size_t i = 0; i < n.args.size(); ++i) {
                    if (i) out += ", ";
                    out += expr(*n.args[i]);
                }
                return out + ")";
            }
        }, e.node);
    }

private:
    void indent() { for (int i = 0; i < m_depth; ++i) m_out << "    "; }

    // Writes "{", the nested statements, and the closing "}" at the current depth.
    void block(const BlockNode& b) {
        m_out << "{\n";
        ++m_depth;
        for (const auto& s : b.statements) statement(*s);
        --m_depth;
        indent();
        m_out << "}";
    }

    void inline_statement(const StmtNode& stmt) {
        std::visit([&](const auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, DeclarationNode>) {
                m_out << "var " << n.name << " = " << expr(*n.initializer) << ";";
            } else if constexpr (std::is_same_v<T, AssignmentNode>) {
                m_out << expr(*n.target) << " = " << expr(*n.value) << ";";
            } else if constexpr (std::is_same_v<T, WhileNode>) {
                m_out << "while " << expr(*n.condition) << " ";
                block(n.body);
            } else if constexpr (std::is_same_v<T, IfNode>) {
                m_out << "if " << expr(*n.condition) << " ";
                block(n.then_block);
                const auto* else_block = std::get_if<BlockNode>(&n.else_branch->node);
                if (else_block && else_block->statements.empty()) return;
                m_out << " else ";
                inline_statement(*n.else_branch);
            } else if constexpr (std::is_same_v<T, ForNode>) {
                m_out << "for " << (n.init ? expr(*n.init) : "") << "; "
                      << (n.test ? expr(*n.test) : "") << "; "
                      << (n.increment ? expr(*n.increment) : "");
                if (m_for_syntax == ForSyntax::Legacy) m_out << ";";
                m_out << " ";
                block(n.body);
            } else if constexpr (std::is_same_v<T, FunDeclNode>) {
                m_out << "fun " << n.name << "(";
                for (std::size_t i = 0; i < n.params.size(); ++i) {
                    if (i) m_out << ", ";
                    m_out << n.params[i];
                }
                m_out << ") ";
                block(n.body);
            } else if constexpr (std::is_same_v<T, ReturnNode>) {
                m_out << "return";
                if (n.value) m_out << " " << expr(*n.value);
                m_out << ";";
            } else if constexpr (std::is_same_v<T, BreakNode>) {
                m_out << "break;";
            } else if constexpr (std::is_same_v<T, ContinueNode>) {
                m_out << "continue;";
            } else if constexpr (std::is_same_v<T, ImpureCallNode>) {
                m_out << expr(*n.call) << ";";
            } else {
                block(n);
            }
        }, stmt.node);
    }

    std::ostringstream m_out;
    ForSyntax m_for_syntax;
    int m_depth = 0;
};

} // namespace

std::string dump(const ExprNode& expr) {
    return std::visit([&expr](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, LiteralNode>) return literal_text(n.value);
        else if constexpr (std::is_same_v<T, IdentifierNode>) return n.name;
        else if constexpr (std::is_same_v<T, BinaryNode>)
            return render_chain(expr, false, [](const ExprNode& x) { return dump(x); });
        else if constexpr (std::is_same_v<T, UnaryNode>)
            return std::string("(") + operator_symbol(n.op) + " " + dump(*n.operand) + ")";
        else {
            std::string out = "(call " + n.name;
            for (const auto& a : n.args) out += " " + dump(*a);
            return out + ")";
        }
    }, expr.node);
}

std::string dump(const StmtNode& stmt) {
    return std::visit([](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, DeclarationNode>)
            return "(var " + n.name + " " + dump(*n.initializer) + ")";
        else if constexpr (std::is_same_v<T, AssignmentNode>)
            return "(assign " + dump(*n.target) + " " + dump(*n.value) + ")";
        else if constexpr (std::is_same_v<T, WhileNode>)
            return "(while " + dump(*n.condition) + " " + dump_block(n.body) + ")";
        else if constexpr (std::is_same_v<T, IfNode>)
            return "(if " + dump(*n.condition) + " " + dump_block(n.then_block) + " " + dump(*n.else_branch) + ")";
        else if constexpr (std::is_same_v<T, ForNode>)
            return "(for " + dump_optional(n.init) + " " + dump_optional(n.test) + " " +
                   dump_optional(n.increment) + " " + dump_block(n.body) + ")";
        else if constexpr (std::is_same_v<T, FunDeclNode>) {
            std::string params;
            for (const auto& p : n.params) params += (params.empty() ? "" : " ") + p;
            return "(fun " + n.name + " (" + params + ") " + dump_block(n.body) + ")";
        }
        else if constexpr (std::is_same_v<T, ReturnNode>)
            return n.value ? "(return " + dump(*n.value) + ")" : std::string("(return)");
        else if constexpr (std::is_same_v<T, BreakNode>) return "(break)";
        else if constexpr (std::is_same_v<T, ContinueNode>) return "(continue)";
        else if constexpr (std::is_same_v<T, ImpureCallNode>) return "(expr " + dump(*n.call) + ")";
        else return dump_block(n);
    }, stmt.node);
}

std::string dump(const AST& ast) {
    std::string out;
    for (const auto& s : ast.statements) {
        if (!out.empty()) out += "\n";
        out += dump(*s);
    }
    return out;
}

std::string to_source(const AST& ast, ForSyntax for_syntax) {
    SourceWriter w(for_syntax);
    for (const auto& s : ast.statements) w.statement(*s);
    return w.str();
}

} // namespace esta
