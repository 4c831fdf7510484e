#include "IR/IRWalker.h"

namespace FJS {
namespace IR {

void IRWalker::walk(const ExprRef& expression) {
    if (expression) {
        expression->accept(*this);
    }
}

void IRWalker::walk(const StmtRef& statement) {
    if (statement) {
        statement->accept(*this);
    }
}

void IRWalker::walkArguments(const std::vector<Argument>& arguments) {
    for (const auto& argument : arguments) {
        walk(argument.value);
    }
}

void IRWalker::visit(const LiteralExpr&) {}
void IRWalker::visit(const IdentifierExpr&) {}
void IRWalker::visit(const ThisExpr&) {}
void IRWalker::visit(const SuperExpr&) {}

void IRWalker::visit(const BinaryExpr& node) {
    walk(node.left);
    walk(node.right);
}

void IRWalker::visit(const UnaryExpr& node) {
    walk(node.operand);
}

void IRWalker::visit(const AssignmentExpr& node) {
    walk(node.target);
    walk(node.value);
}

void IRWalker::visit(const CallExpr& node) {
    walk(node.target);
    walkArguments(node.arguments);
}

void IRWalker::visit(const PropertyAccessExpr& node) {
    walk(node.target);
}

void IRWalker::visit(const IndexExpr& node) {
    walk(node.target);
    walk(node.index);
}

void IRWalker::visit(const ConditionalExpr& node) {
    walk(node.condition);
    walk(node.thenExpr);
    walk(node.elseExpr);
}

void IRWalker::visit(const CollectionLiteralExpr& node) {
    for (const auto& element : node.elements) {
        walk(element);
    }
}

void IRWalker::visit(const MapEntryExpr& node) {
    walk(node.key);
    walk(node.value);
}

void IRWalker::visit(const SpreadExpr& node) {
    walk(node.expression);
}

void IRWalker::visit(const IfElementExpr& node) {
    walk(node.condition);
    walk(node.thenElement);
    walk(node.elseElement);
}

void IRWalker::visit(const ForElementExpr& node) {
    walk(node.iterable);
    walk(node.body);
}

void IRWalker::visit(const StringInterpolationExpr& node) {
    for (const auto& part : node.parts) {
        walk(part);
    }
}

void IRWalker::visit(const AwaitExpr& node) {
    walk(node.expression);
}

void IRWalker::visit(const ThrowExpr& node) {
    walk(node.expression);
}

void IRWalker::visit(const CastExpr& node) {
    walk(node.expression);
}

void IRWalker::visit(const TypeTestExpr& node) {
    walk(node.expression);
}

void IRWalker::visit(const InstanceCreationExpr& node) {
    walkArguments(node.arguments);
}

void IRWalker::visit(const FunctionExpr& node) {
    for (const auto& parameter : node.parameters) {
        walk(parameter.defaultValue);
    }
    walk(node.body);
    walk(node.expressionBody);
}

void IRWalker::visit(const ParenthesizedExpr& node) {
    walk(node.expression);
}

void IRWalker::visit(const CascadeExpr& node) {
    walk(node.target);
    for (const auto& section : node.sections) {
        walk(section);
    }
}

void IRWalker::visit(const BlockStmt& node) {
    for (const auto& statement : node.statements) {
        walk(statement);
    }
}

void IRWalker::visit(const ExpressionStmt& node) {
    walk(node.expression);
}

void IRWalker::visit(const VariableDeclStmt& node) {
    for (const auto& variable : node.variables) {
        walk(variable.initializer);
    }
}

void IRWalker::visit(const IfStmt& node) {
    walk(node.condition);
    walk(node.thenBranch);
    walk(node.elseBranch);
}

void IRWalker::visit(const ForStmt& node) {
    walk(node.initializer);
    walk(node.condition);
    for (const auto& updater : node.updaters) {
        walk(updater);
    }
    walk(node.body);
}

void IRWalker::visit(const ForEachStmt& node) {
    walk(node.iterable);
    walk(node.body);
}

void IRWalker::visit(const WhileStmt& node) {
    walk(node.condition);
    walk(node.body);
}

void IRWalker::visit(const DoWhileStmt& node) {
    walk(node.body);
    walk(node.condition);
}

void IRWalker::visit(const SwitchStmt& node) {
    walk(node.subject);
    for (const auto& switchCase : node.cases) {
        for (const auto& label : switchCase.labels) {
            walk(label);
        }
        for (const auto& statement : switchCase.statements) {
            walk(statement);
        }
    }
}

void IRWalker::visit(const TryStmt& node) {
    walk(node.body);
    for (const auto& clause : node.catches) {
        walk(clause.body);
    }
    walk(node.finallyBlock);
}

void IRWalker::visit(const ReturnStmt& node) {
    walk(node.value);
}

void IRWalker::visit(const BreakStmt&) {}
void IRWalker::visit(const ContinueStmt&) {}

void IRWalker::visit(const YieldStmt& node) {
    walk(node.value);
}

} // namespace IR
} // namespace FJS
