#pragma once
#include "IRNodes.h"

namespace FJS {
namespace IR {

// Visitor that descends into every child node. Subclasses override the
// visits they care about and call the base implementation to keep walking.
class IRWalker : public IRVisitor {
public:
    void walk(const ExprRef& expression);
    void walk(const StmtRef& statement);

    void visit(const LiteralExpr& node) override;
    void visit(const IdentifierExpr& node) override;
    void visit(const ThisExpr& node) override;
    void visit(const SuperExpr& node) override;
    void visit(const BinaryExpr& node) override;
    void visit(const UnaryExpr& node) override;
    void visit(const AssignmentExpr& node) override;
    void visit(const CallExpr& node) override;
    void visit(const PropertyAccessExpr& node) override;
    void visit(const IndexExpr& node) override;
    void visit(const ConditionalExpr& node) override;
    void visit(const CollectionLiteralExpr& node) override;
    void visit(const MapEntryExpr& node) override;
    void visit(const SpreadExpr& node) override;
    void visit(const IfElementExpr& node) override;
    void visit(const ForElementExpr& node) override;
    void visit(const StringInterpolationExpr& node) override;
    void visit(const AwaitExpr& node) override;
    void visit(const ThrowExpr& node) override;
    void visit(const CastExpr& node) override;
    void visit(const TypeTestExpr& node) override;
    void visit(const InstanceCreationExpr& node) override;
    void visit(const FunctionExpr& node) override;
    void visit(const ParenthesizedExpr& node) override;
    void visit(const CascadeExpr& node) override;

    void visit(const BlockStmt& node) override;
    void visit(const ExpressionStmt& node) override;
    void visit(const VariableDeclStmt& node) override;
    void visit(const IfStmt& node) override;
    void visit(const ForStmt& node) override;
    void visit(const ForEachStmt& node) override;
    void visit(const WhileStmt& node) override;
    void visit(const DoWhileStmt& node) override;
    void visit(const SwitchStmt& node) override;
    void visit(const TryStmt& node) override;
    void visit(const ReturnStmt& node) override;
    void visit(const BreakStmt& node) override;
    void visit(const ContinueStmt& node) override;
    void visit(const YieldStmt& node) override;

protected:
    void walkArguments(const std::vector<Argument>& arguments);
};

} // namespace IR
} // namespace FJS
