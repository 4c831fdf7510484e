#pragma once
#include <string>
#include <vector>
#include <memory>
#include <tuple>
#include <type_traits>
#include <cstddef>
#include "../Common/SourceLocation.h"

namespace FJS {
namespace IR {

// Statement/expression IR used inside function, method and build bodies.
// Nodes are immutable once wrapped in a NodeRef; equality is structural.

class IRVisitor;

/**
 * Shared, immutable handle to an IR node. Two handles compare equal when
 * both are empty or the nodes they point to are structurally equal.
 */
template <typename T>
class NodeRef {
public:
    NodeRef() = default;
    NodeRef(std::nullptr_t) {}

    template <typename U>
        requires std::is_convertible_v<const U*, const T*>
    NodeRef(std::shared_ptr<U> node) : node_(std::move(node)) {}

    template <typename U>
        requires std::is_convertible_v<const U*, const T*>
    NodeRef(const NodeRef<U>& other) : node_(other.shared()) {}

    const T* get() const { return node_.get(); }
    const T& operator*() const { return *node_; }
    const T* operator->() const { return node_.get(); }
    explicit operator bool() const { return node_ != nullptr; }
    const std::shared_ptr<const T>& shared() const { return node_; }

    bool operator==(const NodeRef& other) const {
        if (!node_ || !other.node_) {
            return !node_ && !other.node_;
        }
        return node_ == other.node_ || node_->equals(*other.node_);
    }

private:
    std::shared_ptr<const T> node_;
};

//==============================================================================
// Base classes
//==============================================================================

enum class ExprKind {
    Literal,
    Identifier,
    This,
    Super,
    Binary,
    Unary,
    Assignment,
    Call,
    PropertyAccess,
    Index,
    Conditional,
    CollectionLiteral,
    MapEntry,
    Spread,
    IfElement,
    ForElement,
    StringInterpolation,
    Await,
    Throw,
    Cast,
    TypeTest,
    InstanceCreation,
    FunctionExpression,
    Parenthesized,
    Cascade
};

enum class StmtKind {
    Block,
    Expression,
    VariableDecl,
    If,
    For,
    ForEach,
    While,
    DoWhile,
    Switch,
    Try,
    Return,
    Break,
    Continue,
    Yield
};

class Expression {
public:
    virtual ~Expression() = default;
    virtual ExprKind kind() const = 0;
    virtual void accept(IRVisitor& visitor) const = 0;
    virtual bool equals(const Expression& other) const = 0;
};

class Statement {
public:
    virtual ~Statement() = default;
    virtual StmtKind kind() const = 0;
    virtual void accept(IRVisitor& visitor) const = 0;
    virtual bool equals(const Statement& other) const = 0;
};

using ExprRef = NodeRef<Expression>;
using StmtRef = NodeRef<Statement>;

// Field-wise comparison for nodes exposing `fields()` as a tuple of references
template <typename T, typename Base>
bool sameNode(const T& self, const Base& other) {
    auto* rhs = dynamic_cast<const T*>(&other);
    return rhs != nullptr && self.fields() == rhs->fields();
}

std::string exprKindToString(ExprKind kind);
std::string stmtKindToString(StmtKind kind);

//==============================================================================
// Shared pieces
//==============================================================================

struct Argument {
    std::string name;  // Empty for positional arguments
    ExprRef value;

    bool isNamed() const { return !name.empty(); }
    bool operator==(const Argument& other) const = default;
};

struct ParameterDeclaration {
    std::string name;
    std::string typeName;               // Empty when untyped
    bool isRequired = false;
    bool isNamed = false;
    bool isOptionalPositional = false;
    bool isFieldFormal = false;         // this.name
    bool isSuperFormal = false;         // super.name
    ExprRef defaultValue;
    Common::SourceLocation location;

    bool operator==(const ParameterDeclaration& other) const = default;
};

//==============================================================================
// Expressions
//==============================================================================

enum class LiteralKind {
    Null,
    Bool,
    Int,
    Double,
    String
};

struct LiteralExpr : Expression {
    LiteralKind literalKind = LiteralKind::Null;
    std::string value;  // Source text for numbers, "true"/"false", unescaped text for strings

    ExprKind kind() const override { return ExprKind::Literal; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(literalKind, value); }
};

struct IdentifierExpr : Expression {
    std::string name;

    ExprKind kind() const override { return ExprKind::Identifier; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(name); }
};

struct ThisExpr : Expression {
    ExprKind kind() const override { return ExprKind::This; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(); }
};

struct SuperExpr : Expression {
    ExprKind kind() const override { return ExprKind::Super; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(); }
};

struct BinaryExpr : Expression {
    ExprRef left;
    std::string op;
    ExprRef right;

    ExprKind kind() const override { return ExprKind::Binary; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(left, op, right); }
};

// -x, !x, ++x (prefix) and x++, x! (postfix)
struct UnaryExpr : Expression {
    std::string op;
    ExprRef operand;
    bool isPrefix = true;

    ExprKind kind() const override { return ExprKind::Unary; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(op, operand, isPrefix); }
};

struct AssignmentExpr : Expression {
    ExprRef target;
    std::string op;
    ExprRef value;

    ExprKind kind() const override { return ExprKind::Assignment; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(target, op, value); }
};

// f(x), obj.m<T>(x), obj?.m(x); an empty method name invokes `target` itself
struct CallExpr : Expression {
    ExprRef target;
    std::string method;
    std::vector<std::string> typeArguments;
    std::vector<Argument> arguments;
    bool isNullAware = false;

    ExprKind kind() const override { return ExprKind::Call; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(target, method, typeArguments, arguments, isNullAware); }
};

struct PropertyAccessExpr : Expression {
    ExprRef target;
    std::string name;
    bool isNullAware = false;

    ExprKind kind() const override { return ExprKind::PropertyAccess; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(target, name, isNullAware); }
};

struct IndexExpr : Expression {
    ExprRef target;
    ExprRef index;
    bool isNullAware = false;

    ExprKind kind() const override { return ExprKind::Index; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(target, index, isNullAware); }
};

struct ConditionalExpr : Expression {
    ExprRef condition;
    ExprRef thenExpr;
    ExprRef elseExpr;

    ExprKind kind() const override { return ExprKind::Conditional; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(condition, thenExpr, elseExpr); }
};

enum class CollectionKind {
    List,
    Set,
    Map
};

struct CollectionLiteralExpr : Expression {
    CollectionKind collectionKind = CollectionKind::List;
    std::vector<std::string> typeArguments;
    std::vector<ExprRef> elements;
    bool isConst = false;

    ExprKind kind() const override { return ExprKind::CollectionLiteral; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(collectionKind, typeArguments, elements, isConst); }
};

struct MapEntryExpr : Expression {
    ExprRef key;
    ExprRef value;

    ExprKind kind() const override { return ExprKind::MapEntry; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(key, value); }
};

struct SpreadExpr : Expression {
    ExprRef expression;
    bool isNullAware = false;

    ExprKind kind() const override { return ExprKind::Spread; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(expression, isNullAware); }
};

struct IfElementExpr : Expression {
    ExprRef condition;
    ExprRef thenElement;
    ExprRef elseElement;

    ExprKind kind() const override { return ExprKind::IfElement; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(condition, thenElement, elseElement); }
};

struct ForElementExpr : Expression {
    std::string variableType;
    std::string variableName;
    ExprRef iterable;
    ExprRef body;

    ExprKind kind() const override { return ExprKind::ForElement; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(variableType, variableName, iterable, body); }
};

// Literal segments are String LiteralExprs
struct StringInterpolationExpr : Expression {
    std::vector<ExprRef> parts;

    ExprKind kind() const override { return ExprKind::StringInterpolation; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(parts); }
};

struct AwaitExpr : Expression {
    ExprRef expression;

    ExprKind kind() const override { return ExprKind::Await; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(expression); }
};

// Empty expression means rethrow
struct ThrowExpr : Expression {
    ExprRef expression;

    ExprKind kind() const override { return ExprKind::Throw; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(expression); }
};

struct CastExpr : Expression {
    ExprRef expression;
    std::string typeName;

    ExprKind kind() const override { return ExprKind::Cast; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(expression, typeName); }
};

struct TypeTestExpr : Expression {
    ExprRef expression;
    std::string typeName;
    bool isNegated = false;

    ExprKind kind() const override { return ExprKind::TypeTest; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(expression, typeName, isNegated); }
};

// Text(...), const EdgeInsets.all(8), new Foo<T>()
struct InstanceCreationExpr : Expression {
    std::string typeName;
    std::vector<std::string> typeArguments;
    std::string constructorName;  // Empty for the unnamed constructor
    bool isConst = false;
    std::vector<Argument> arguments;

    ExprKind kind() const override { return ExprKind::InstanceCreation; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(typeName, typeArguments, constructorName, isConst, arguments); }

    const Argument* findArgument(const std::string& argumentName) const;
};

// Closures and local functions; exactly one of body / expressionBody is set
struct FunctionExpr : Expression {
    std::vector<std::string> typeParameters;
    std::vector<ParameterDeclaration> parameters;
    StmtRef body;
    ExprRef expressionBody;
    bool isAsync = false;
    bool isGenerator = false;

    ExprKind kind() const override { return ExprKind::FunctionExpression; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(typeParameters, parameters, body, expressionBody, isAsync, isGenerator); }
};

struct ParenthesizedExpr : Expression {
    ExprRef expression;

    ExprKind kind() const override { return ExprKind::Parenthesized; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(expression); }
};

// Paint()..color = c..strokeWidth = 2. Each section is a call, property,
// index or assignment chain whose innermost target is empty; the empty
// target stands for the cascade target.
struct CascadeExpr : Expression {
    ExprRef target;
    std::vector<ExprRef> sections;
    bool isNullAware = false;  // ?..

    ExprKind kind() const override { return ExprKind::Cascade; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Expression& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(target, sections, isNullAware); }
};

//==============================================================================
// Statements
//==============================================================================

struct BlockStmt : Statement {
    std::vector<StmtRef> statements;

    StmtKind kind() const override { return StmtKind::Block; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(statements); }
};

struct ExpressionStmt : Statement {
    ExprRef expression;

    StmtKind kind() const override { return StmtKind::Expression; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(expression); }
};

struct VariableBinding {
    std::string name;
    ExprRef initializer;

    bool operator==(const VariableBinding& other) const = default;
};

// Local variables; local functions are bindings to a FunctionExpr
struct VariableDeclStmt : Statement {
    std::string typeName;  // Empty when inferred
    bool isFinal = false;
    bool isConst = false;
    bool isLate = false;
    std::vector<VariableBinding> variables;

    StmtKind kind() const override { return StmtKind::VariableDecl; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(typeName, isFinal, isConst, isLate, variables); }
};

struct IfStmt : Statement {
    ExprRef condition;
    StmtRef thenBranch;
    StmtRef elseBranch;

    StmtKind kind() const override { return StmtKind::If; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(condition, thenBranch, elseBranch); }
};

struct ForStmt : Statement {
    StmtRef initializer;
    ExprRef condition;
    std::vector<ExprRef> updaters;
    StmtRef body;

    StmtKind kind() const override { return StmtKind::For; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(initializer, condition, updaters, body); }
};

struct ForEachStmt : Statement {
    std::string variableType;
    std::string variableName;
    bool isFinal = false;
    bool isAwait = false;
    ExprRef iterable;
    StmtRef body;

    StmtKind kind() const override { return StmtKind::ForEach; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(variableType, variableName, isFinal, isAwait, iterable, body); }
};

struct WhileStmt : Statement {
    ExprRef condition;
    StmtRef body;

    StmtKind kind() const override { return StmtKind::While; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(condition, body); }
};

struct DoWhileStmt : Statement {
    StmtRef body;
    ExprRef condition;

    StmtKind kind() const override { return StmtKind::DoWhile; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(body, condition); }
};

struct SwitchCase {
    std::vector<ExprRef> labels;
    bool isDefault = false;
    std::vector<StmtRef> statements;

    bool operator==(const SwitchCase& other) const = default;
};

struct SwitchStmt : Statement {
    ExprRef subject;
    std::vector<SwitchCase> cases;

    StmtKind kind() const override { return StmtKind::Switch; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(subject, cases); }
};

struct CatchClause {
    std::string exceptionType;   // Empty for a bare catch
    std::string exceptionName;
    std::string stackTraceName;
    StmtRef body;

    bool operator==(const CatchClause& other) const = default;
};

struct TryStmt : Statement {
    StmtRef body;
    std::vector<CatchClause> catches;
    StmtRef finallyBlock;

    StmtKind kind() const override { return StmtKind::Try; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(body, catches, finallyBlock); }
};

struct ReturnStmt : Statement {
    ExprRef value;

    StmtKind kind() const override { return StmtKind::Return; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(value); }
};

struct BreakStmt : Statement {
    std::string label;

    StmtKind kind() const override { return StmtKind::Break; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(label); }
};

struct ContinueStmt : Statement {
    std::string label;

    StmtKind kind() const override { return StmtKind::Continue; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(label); }
};

struct YieldStmt : Statement {
    ExprRef value;
    bool isStar = false;

    StmtKind kind() const override { return StmtKind::Yield; }
    void accept(IRVisitor& visitor) const override;
    bool equals(const Statement& other) const override { return sameNode(*this, other); }
    auto fields() const { return std::tie(value, isStar); }
};

//==============================================================================
// Visitor
//==============================================================================

class IRVisitor {
public:
    virtual ~IRVisitor() = default;

    // Expressions
    virtual void visit(const LiteralExpr& node) = 0;
    virtual void visit(const IdentifierExpr& node) = 0;
    virtual void visit(const ThisExpr& node) = 0;
    virtual void visit(const SuperExpr& node) = 0;
    virtual void visit(const BinaryExpr& node) = 0;
    virtual void visit(const UnaryExpr& node) = 0;
    virtual void visit(const AssignmentExpr& node) = 0;
    virtual void visit(const CallExpr& node) = 0;
    virtual void visit(const PropertyAccessExpr& node) = 0;
    virtual void visit(const IndexExpr& node) = 0;
    virtual void visit(const ConditionalExpr& node) = 0;
    virtual void visit(const CollectionLiteralExpr& node) = 0;
    virtual void visit(const MapEntryExpr& node) = 0;
    virtual void visit(const SpreadExpr& node) = 0;
    virtual void visit(const IfElementExpr& node) = 0;
    virtual void visit(const ForElementExpr& node) = 0;
    virtual void visit(const StringInterpolationExpr& node) = 0;
    virtual void visit(const AwaitExpr& node) = 0;
    virtual void visit(const ThrowExpr& node) = 0;
    virtual void visit(const CastExpr& node) = 0;
    virtual void visit(const TypeTestExpr& node) = 0;
    virtual void visit(const InstanceCreationExpr& node) = 0;
    virtual void visit(const FunctionExpr& node) = 0;
    virtual void visit(const ParenthesizedExpr& node) = 0;
    virtual void visit(const CascadeExpr& node) = 0;

    // Statements
    virtual void visit(const BlockStmt& node) = 0;
    virtual void visit(const ExpressionStmt& node) = 0;
    virtual void visit(const VariableDeclStmt& node) = 0;
    virtual void visit(const IfStmt& node) = 0;
    virtual void visit(const ForStmt& node) = 0;
    virtual void visit(const ForEachStmt& node) = 0;
    virtual void visit(const WhileStmt& node) = 0;
    virtual void visit(const DoWhileStmt& node) = 0;
    virtual void visit(const SwitchStmt& node) = 0;
    virtual void visit(const TryStmt& node) = 0;
    virtual void visit(const ReturnStmt& node) = 0;
    virtual void visit(const BreakStmt& node) = 0;
    virtual void visit(const ContinueStmt& node) = 0;
    virtual void visit(const YieldStmt& node) = 0;
};

} // namespace IR
} // namespace FJS
