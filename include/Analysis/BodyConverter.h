#pragma once
#include <string>
#include <vector>
#include <functional>
#include "../Parser/AST.h"
#include "../IR/IRNodes.h"

namespace FJS {
namespace Analysis {

/**
 * Lowers syntax-tree expressions and statements into the immutable
 * statement/expression IR. Calls whose callee names a type become
 * instance creations; everything else maps one-to-one.
 */
class BodyConverter : public Parser::ASTVisitor {
public:
    // Predicate telling whether a bare name refers to a declared type
    using TypePredicate = std::function<bool(const std::string&)>;

    explicit BodyConverter(TypePredicate isKnownType = nullptr);

    IR::ExprRef convert(Parser::Expression* expression);
    IR::StmtRef convert(Parser::Statement* statement);
    IR::ParameterDeclaration convertParameter(const Parser::FormalParameter& parameter);
    std::vector<IR::ParameterDeclaration> convertParameters(const std::vector<Parser::FormalParameter>& parameters);
    std::vector<IR::Argument> convertArguments(const std::vector<Parser::Argument>& arguments);

    // `Foo`, `_Foo` or a registered name
    bool looksLikeTypeName(const std::string& name) const;

    // Expressions
    void visit(Parser::IntegerLiteralExpr& node) override;
    void visit(Parser::DoubleLiteralExpr& node) override;
    void visit(Parser::StringLiteralExpr& node) override;
    void visit(Parser::StringInterpolationExpr& node) override;
    void visit(Parser::BoolLiteralExpr& node) override;
    void visit(Parser::NullLiteralExpr& node) override;
    void visit(Parser::IdentifierExpr& node) override;
    void visit(Parser::ThisExpr& node) override;
    void visit(Parser::SuperExpr& node) override;
    void visit(Parser::BinaryExpr& node) override;
    void visit(Parser::PrefixExpr& node) override;
    void visit(Parser::PostfixExpr& node) override;
    void visit(Parser::AssignmentExpr& node) override;
    void visit(Parser::ConditionalExpr& node) override;
    void visit(Parser::PropertyAccessExpr& node) override;
    void visit(Parser::IndexExpr& node) override;
    void visit(Parser::MethodInvocationExpr& node) override;
    void visit(Parser::FunctionCallExpr& node) override;
    void visit(Parser::InstanceCreationExpr& node) override;
    void visit(Parser::ListLiteralExpr& node) override;
    void visit(Parser::SetOrMapLiteralExpr& node) override;
    void visit(Parser::MapEntryExpr& node) override;
    void visit(Parser::SpreadElementExpr& node) override;
    void visit(Parser::IfElementExpr& node) override;
    void visit(Parser::ForElementExpr& node) override;
    void visit(Parser::FunctionExpr& node) override;
    void visit(Parser::AwaitExpr& node) override;
    void visit(Parser::ThrowExpr& node) override;
    void visit(Parser::AsExpr& node) override;
    void visit(Parser::IsExpr& node) override;
    void visit(Parser::ParenthesizedExpr& node) override;
    void visit(Parser::CascadeReceiverExpr& node) override;
    void visit(Parser::CascadeExpr& node) override;

    // Statements
    void visit(Parser::BlockStmt& node) override;
    void visit(Parser::ExpressionStmt& node) override;
    void visit(Parser::VariableDeclarationStmt& node) override;
    void visit(Parser::LocalFunctionStmt& node) override;
    void visit(Parser::IfStmt& node) override;
    void visit(Parser::ForStmt& node) override;
    void visit(Parser::ForEachStmt& node) override;
    void visit(Parser::WhileStmt& node) override;
    void visit(Parser::DoWhileStmt& node) override;
    void visit(Parser::SwitchStmt& node) override;
    void visit(Parser::TryStmt& node) override;
    void visit(Parser::ReturnStmt& node) override;
    void visit(Parser::BreakStmt& node) override;
    void visit(Parser::ContinueStmt& node) override;
    void visit(Parser::YieldStmt& node) override;
    void visit(Parser::AssertStmt& node) override;

private:
    TypePredicate isKnownType_;
    IR::ExprRef exprResult_;
    IR::StmtRef stmtResult_;

    IR::ExprRef makeFunction(Parser::FunctionExpr& node);
    static std::vector<std::string> typeStrings(const std::vector<Parser::TypeAnnotation>& types);
};

} // namespace Analysis
} // namespace FJS
