#include "IR/IRNodes.h"

namespace FJS {
namespace IR {

std::string exprKindToString(ExprKind kind) {
    switch (kind) {
        case ExprKind::Literal: return "Literal";
        case ExprKind::Identifier: return "Identifier";
        case ExprKind::This: return "This";
        case ExprKind::Super: return "Super";
        case ExprKind::Binary: return "Binary";
        case ExprKind::Unary: return "Unary";
        case ExprKind::Assignment: return "Assignment";
        case ExprKind::Call: return "Call";
        case ExprKind::PropertyAccess: return "PropertyAccess";
        case ExprKind::Index: return "Index";
        case ExprKind::Conditional: return "Conditional";
        case ExprKind::CollectionLiteral: return "CollectionLiteral";
        case ExprKind::MapEntry: return "MapEntry";
        case ExprKind::Spread: return "Spread";
        case ExprKind::IfElement: return "IfElement";
        case ExprKind::ForElement: return "ForElement";
        case ExprKind::StringInterpolation: return "StringInterpolation";
        case ExprKind::Await: return "Await";
        case ExprKind::Throw: return "Throw";
        case ExprKind::Cast: return "Cast";
        case ExprKind::TypeTest: return "TypeTest";
        case ExprKind::InstanceCreation: return "InstanceCreation";
        case ExprKind::FunctionExpression: return "FunctionExpression";
        case ExprKind::Parenthesized: return "Parenthesized";
        case ExprKind::Cascade: return "Cascade";
        default: return "Unknown";
    }
}

std::string stmtKindToString(StmtKind kind) {
    switch (kind) {
        case StmtKind::Block: return "Block";
        case StmtKind::Expression: return "Expression";
        case StmtKind::VariableDecl: return "VariableDecl";
        case StmtKind::If: return "If";
        case StmtKind::For: return "For";
        case StmtKind::ForEach: return "ForEach";
        case StmtKind::While: return "While";
        case StmtKind::DoWhile: return "DoWhile";
        case StmtKind::Switch: return "Switch";
        case StmtKind::Try: return "Try";
        case StmtKind::Return: return "Return";
        case StmtKind::Break: return "Break";
        case StmtKind::Continue: return "Continue";
        case StmtKind::Yield: return "Yield";
        default: return "Unknown";
    }
}

const Argument* InstanceCreationExpr::findArgument(const std::string& argumentName) const {
    for (const auto& argument : arguments) {
        if (argument.name == argumentName) {
            return &argument;
        }
    }
    return nullptr;
}

void LiteralExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void IdentifierExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void ThisExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void SuperExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void BinaryExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void UnaryExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void AssignmentExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void CallExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void PropertyAccessExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void IndexExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void ConditionalExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void CollectionLiteralExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void MapEntryExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void SpreadExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void IfElementExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void ForElementExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void StringInterpolationExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void AwaitExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void ThrowExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void CastExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void TypeTestExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void InstanceCreationExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void FunctionExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void ParenthesizedExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void CascadeExpr::accept(IRVisitor& visitor) const { visitor.visit(*this); }

void BlockStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void ExpressionStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void VariableDeclStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void IfStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void ForStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void ForEachStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void WhileStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void DoWhileStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void SwitchStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void TryStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void ReturnStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void BreakStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void ContinueStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }
void YieldStmt::accept(IRVisitor& visitor) const { visitor.visit(*this); }

} // namespace IR
} // namespace FJS
