#include "Parser/AST.h"

namespace FJS {
namespace Parser {

std::string TypeAnnotation::toString() const {
    if (isFunctionType) {
        return functionSignature + (isNullable ? "?" : "");
    }

    std::string result = name;
    if (!arguments.empty()) {
        result += "<";
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (i > 0) result += ", ";
            result += arguments[i].toString();
        }
        result += ">";
    }
    if (isNullable) {
        result += "?";
    }
    return result;
}

bool SetOrMapLiteralExpr::isMap() const {
    if (elements.empty()) {
        // `{}` is a map unless a single type argument says otherwise
        return typeArguments.size() != 1;
    }
    for (const auto& element : elements) {
        if (dynamic_cast<const MapEntryExpr*>(element.get())) {
            return true;
        }
        // Collection if/for wrapping an entry
        if (auto* ifElement = dynamic_cast<const IfElementExpr*>(element.get())) {
            if (dynamic_cast<const MapEntryExpr*>(ifElement->thenElement.get())) {
                return true;
            }
        }
        if (auto* forElement = dynamic_cast<const ForElementExpr*>(element.get())) {
            if (dynamic_cast<const MapEntryExpr*>(forElement->body.get())) {
                return true;
            }
        }
    }
    return typeArguments.size() == 2;
}

FunctionExpr::FunctionExpr(const Common::SourceLocation& loc)
    : Expression(loc), isAsync(false), isGenerator(false) {}

FunctionExpr::~FunctionExpr() = default;

void IntegerLiteralExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void DoubleLiteralExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void StringLiteralExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void StringInterpolationExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void BoolLiteralExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void NullLiteralExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void IdentifierExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ThisExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void SuperExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void BinaryExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void PrefixExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void PostfixExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void AssignmentExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ConditionalExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void PropertyAccessExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void IndexExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void MethodInvocationExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void FunctionCallExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void InstanceCreationExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ListLiteralExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void SetOrMapLiteralExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void MapEntryExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void SpreadElementExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void IfElementExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ForElementExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void FunctionExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void AwaitExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ThrowExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void AsExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void IsExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ParenthesizedExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void CascadeReceiverExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void CascadeExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }

void BlockStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ExpressionStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void VariableDeclarationStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void LocalFunctionStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void IfStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ForStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ForEachStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void WhileStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void DoWhileStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void SwitchStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void TryStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ReturnStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void BreakStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ContinueStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void YieldStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void AssertStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }

} // namespace Parser
} // namespace FJS
