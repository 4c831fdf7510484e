#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "../Common/SourceLocation.h"

namespace FJS {
namespace Parser {

// Syntax tree produced by the Dart-subset frontend. Expressions and statements
// dispatch through ASTVisitor; declarations are plain data walked by kind.

class ASTVisitor;

// Base AST node
class ASTNode {
public:
    Common::SourceLocation location;

    ASTNode(const Common::SourceLocation& loc) : location(loc) {}
    virtual ~ASTNode() = default;
};

// Type annotation as written: `List<String>?`, `ui.Color`, `void Function(int)`
struct TypeAnnotation {
    std::string name;                        // Possibly prefixed, e.g. "ui.Color"
    std::vector<TypeAnnotation> arguments;   // Generic arguments
    bool isNullable = false;
    bool isFunctionType = false;
    std::string functionSignature;           // Rendered "void Function(int)" for function types

    std::string toString() const;
};

//==============================================================================
// Expressions
//==============================================================================

class Expression : public ASTNode {
public:
    Expression(const Common::SourceLocation& loc) : ASTNode(loc) {}
    virtual void accept(ASTVisitor& visitor) = 0;
};

using ExprPtr = std::unique_ptr<Expression>;

struct Argument {
    std::string name;  // Empty for positional arguments
    ExprPtr value;
};

class IntegerLiteralExpr : public Expression {
public:
    std::string text;
    IntegerLiteralExpr(const std::string& t, const Common::SourceLocation& loc) : Expression(loc), text(t) {}
    void accept(ASTVisitor& visitor) override;
};

class DoubleLiteralExpr : public Expression {
public:
    std::string text;
    DoubleLiteralExpr(const std::string& t, const Common::SourceLocation& loc) : Expression(loc), text(t) {}
    void accept(ASTVisitor& visitor) override;
};

class StringLiteralExpr : public Expression {
public:
    std::string value;
    StringLiteralExpr(const std::string& v, const Common::SourceLocation& loc) : Expression(loc), value(v) {}
    void accept(ASTVisitor& visitor) override;
};

// 'Hello $name' -> [StringLiteralExpr("Hello "), IdentifierExpr(name)]
class StringInterpolationExpr : public Expression {
public:
    std::vector<ExprPtr> parts;
    StringInterpolationExpr(std::vector<ExprPtr> p, const Common::SourceLocation& loc)
        : Expression(loc), parts(std::move(p)) {}
    void accept(ASTVisitor& visitor) override;
};

class BoolLiteralExpr : public Expression {
public:
    bool value;
    BoolLiteralExpr(bool v, const Common::SourceLocation& loc) : Expression(loc), value(v) {}
    void accept(ASTVisitor& visitor) override;
};

class NullLiteralExpr : public Expression {
public:
    NullLiteralExpr(const Common::SourceLocation& loc) : Expression(loc) {}
    void accept(ASTVisitor& visitor) override;
};

class IdentifierExpr : public Expression {
public:
    std::string name;
    IdentifierExpr(const std::string& n, const Common::SourceLocation& loc) : Expression(loc), name(n) {}
    void accept(ASTVisitor& visitor) override;
};

class ThisExpr : public Expression {
public:
    ThisExpr(const Common::SourceLocation& loc) : Expression(loc) {}
    void accept(ASTVisitor& visitor) override;
};

class SuperExpr : public Expression {
public:
    SuperExpr(const Common::SourceLocation& loc) : Expression(loc) {}
    void accept(ASTVisitor& visitor) override;
};

class BinaryExpr : public Expression {
public:
    std::string op;
    ExprPtr left;
    ExprPtr right;
    BinaryExpr(ExprPtr l, const std::string& o, ExprPtr r, const Common::SourceLocation& loc)
        : Expression(loc), op(o), left(std::move(l)), right(std::move(r)) {}
    void accept(ASTVisitor& visitor) override;
};

// !x, -x, ~x, ++x, --x
class PrefixExpr : public Expression {
public:
    std::string op;
    ExprPtr operand;
    PrefixExpr(const std::string& o, ExprPtr e, const Common::SourceLocation& loc)
        : Expression(loc), op(o), operand(std::move(e)) {}
    void accept(ASTVisitor& visitor) override;
};

// x++, x--, x!
class PostfixExpr : public Expression {
public:
    std::string op;
    ExprPtr operand;
    PostfixExpr(ExprPtr e, const std::string& o, const Common::SourceLocation& loc)
        : Expression(loc), op(o), operand(std::move(e)) {}
    void accept(ASTVisitor& visitor) override;
};

class AssignmentExpr : public Expression {
public:
    std::string op;  // =, +=, ??=, ...
    ExprPtr target;
    ExprPtr value;
    AssignmentExpr(ExprPtr t, const std::string& o, ExprPtr v, const Common::SourceLocation& loc)
        : Expression(loc), op(o), target(std::move(t)), value(std::move(v)) {}
    void accept(ASTVisitor& visitor) override;
};

class ConditionalExpr : public Expression {
public:
    ExprPtr condition;
    ExprPtr thenExpr;
    ExprPtr elseExpr;
    ConditionalExpr(ExprPtr c, ExprPtr t, ExprPtr e, const Common::SourceLocation& loc)
        : Expression(loc), condition(std::move(c)), thenExpr(std::move(t)), elseExpr(std::move(e)) {}
    void accept(ASTVisitor& visitor) override;
};

class PropertyAccessExpr : public Expression {
public:
    ExprPtr target;
    std::string name;
    bool isNullAware;
    PropertyAccessExpr(ExprPtr t, const std::string& n, bool nullAware, const Common::SourceLocation& loc)
        : Expression(loc), target(std::move(t)), name(n), isNullAware(nullAware) {}
    void accept(ASTVisitor& visitor) override;
};

// target[index], target?[index]
class IndexExpr : public Expression {
public:
    ExprPtr target;
    ExprPtr index;
    bool isNullAware;
    IndexExpr(ExprPtr t, ExprPtr i, bool nullAware, const Common::SourceLocation& loc)
        : Expression(loc), target(std::move(t)), index(std::move(i)), isNullAware(nullAware) {}
    void accept(ASTVisitor& visitor) override;
};

// name(args), target.name(args), target?.name<T>(args)
// Unqualified calls to type names are left as invocations; the extractor
// decides whether they create instances.
class MethodInvocationExpr : public Expression {
public:
    ExprPtr target;  // May be null
    std::string methodName;
    std::vector<TypeAnnotation> typeArguments;
    std::vector<Argument> arguments;
    bool isNullAware;
    MethodInvocationExpr(ExprPtr t, const std::string& n, const Common::SourceLocation& loc)
        : Expression(loc), target(std::move(t)), methodName(n), isNullAware(false) {}
    void accept(ASTVisitor& visitor) override;
};

// Invocation of an arbitrary expression: (f)(x), callbacks[i]()
class FunctionCallExpr : public Expression {
public:
    ExprPtr callee;
    std::vector<Argument> arguments;
    FunctionCallExpr(ExprPtr c, std::vector<Argument> args, const Common::SourceLocation& loc)
        : Expression(loc), callee(std::move(c)), arguments(std::move(args)) {}
    void accept(ASTVisitor& visitor) override;
};

// new Foo(), const Foo.named<T>()
class InstanceCreationExpr : public Expression {
public:
    TypeAnnotation type;
    std::string constructorName;
    bool isConst;
    std::vector<Argument> arguments;
    InstanceCreationExpr(const TypeAnnotation& t, const std::string& ctor, bool c, const Common::SourceLocation& loc)
        : Expression(loc), type(t), constructorName(ctor), isConst(c) {}
    void accept(ASTVisitor& visitor) override;
};

class ListLiteralExpr : public Expression {
public:
    bool isConst;
    std::optional<TypeAnnotation> elementType;
    std::vector<ExprPtr> elements;
    ListLiteralExpr(bool c, const Common::SourceLocation& loc) : Expression(loc), isConst(c) {}
    void accept(ASTVisitor& visitor) override;
};

// `{}` literal; a map when any element is a MapEntryExpr or when empty
class SetOrMapLiteralExpr : public Expression {
public:
    bool isConst;
    std::vector<TypeAnnotation> typeArguments;
    std::vector<ExprPtr> elements;
    SetOrMapLiteralExpr(bool c, const Common::SourceLocation& loc) : Expression(loc), isConst(c) {}
    bool isMap() const;
    void accept(ASTVisitor& visitor) override;
};

class MapEntryExpr : public Expression {
public:
    ExprPtr key;
    ExprPtr value;
    MapEntryExpr(ExprPtr k, ExprPtr v, const Common::SourceLocation& loc)
        : Expression(loc), key(std::move(k)), value(std::move(v)) {}
    void accept(ASTVisitor& visitor) override;
};

// ...items, ...?items
class SpreadElementExpr : public Expression {
public:
    ExprPtr expression;
    bool isNullAware;
    SpreadElementExpr(ExprPtr e, bool nullAware, const Common::SourceLocation& loc)
        : Expression(loc), expression(std::move(e)), isNullAware(nullAware) {}
    void accept(ASTVisitor& visitor) override;
};

// Collection `if (cond) a else b`
class IfElementExpr : public Expression {
public:
    ExprPtr condition;
    ExprPtr thenElement;
    ExprPtr elseElement;  // May be null
    IfElementExpr(ExprPtr c, ExprPtr t, ExprPtr e, const Common::SourceLocation& loc)
        : Expression(loc), condition(std::move(c)), thenElement(std::move(t)), elseElement(std::move(e)) {}
    void accept(ASTVisitor& visitor) override;
};

// Collection `for (var x in xs) element`
class ForElementExpr : public Expression {
public:
    std::optional<TypeAnnotation> variableType;
    std::string variableName;
    ExprPtr iterable;
    ExprPtr body;
    ForElementExpr(const Common::SourceLocation& loc) : Expression(loc) {}
    void accept(ASTVisitor& visitor) override;
};

class BlockStmt;
struct FormalParameter;

// (a, b) => a + b, () async { ... }
class FunctionExpr : public Expression {
public:
    std::vector<std::string> typeParameters;
    std::vector<FormalParameter> parameters;
    std::unique_ptr<BlockStmt> blockBody;   // Either this...
    ExprPtr expressionBody;                 // ...or this
    bool isAsync;
    bool isGenerator;
    FunctionExpr(const Common::SourceLocation& loc);
    ~FunctionExpr() override;
    void accept(ASTVisitor& visitor) override;
};

class AwaitExpr : public Expression {
public:
    ExprPtr expression;
    AwaitExpr(ExprPtr e, const Common::SourceLocation& loc) : Expression(loc), expression(std::move(e)) {}
    void accept(ASTVisitor& visitor) override;
};

class ThrowExpr : public Expression {
public:
    ExprPtr expression;  // Null for `rethrow`
    ThrowExpr(ExprPtr e, const Common::SourceLocation& loc) : Expression(loc), expression(std::move(e)) {}
    void accept(ASTVisitor& visitor) override;
};

class AsExpr : public Expression {
public:
    ExprPtr expression;
    TypeAnnotation type;
    AsExpr(ExprPtr e, const TypeAnnotation& t, const Common::SourceLocation& loc)
        : Expression(loc), expression(std::move(e)), type(t) {}
    void accept(ASTVisitor& visitor) override;
};

class IsExpr : public Expression {
public:
    ExprPtr expression;
    TypeAnnotation type;
    bool isNegated;
    IsExpr(ExprPtr e, const TypeAnnotation& t, bool negated, const Common::SourceLocation& loc)
        : Expression(loc), expression(std::move(e)), type(t), isNegated(negated) {}
    void accept(ASTVisitor& visitor) override;
};

class ParenthesizedExpr : public Expression {
public:
    ExprPtr expression;
    ParenthesizedExpr(ExprPtr e, const Common::SourceLocation& loc) : Expression(loc), expression(std::move(e)) {}
    void accept(ASTVisitor& visitor) override;
};

// Stands for the cascade target at the head of each cascade section
class CascadeReceiverExpr : public Expression {
public:
    CascadeReceiverExpr(const Common::SourceLocation& loc) : Expression(loc) {}
    void accept(ASTVisitor& visitor) override;
};

// target..a()..b = c, target?..a()
// Each section is a selector chain rooted at a CascadeReceiverExpr.
class CascadeExpr : public Expression {
public:
    ExprPtr target;
    std::vector<ExprPtr> sections;
    bool isNullAware = false;
    CascadeExpr(ExprPtr t, const Common::SourceLocation& loc) : Expression(loc), target(std::move(t)) {}
    void accept(ASTVisitor& visitor) override;
};

//==============================================================================
// Statements
//==============================================================================

class Statement : public ASTNode {
public:
    Statement(const Common::SourceLocation& loc) : ASTNode(loc) {}
    virtual void accept(ASTVisitor& visitor) = 0;
};

using StmtPtr = std::unique_ptr<Statement>;

class BlockStmt : public Statement {
public:
    std::vector<StmtPtr> statements;
    BlockStmt(const Common::SourceLocation& loc) : Statement(loc) {}
    void accept(ASTVisitor& visitor) override;
};

class ExpressionStmt : public Statement {
public:
    ExprPtr expression;
    ExpressionStmt(ExprPtr e, const Common::SourceLocation& loc) : Statement(loc), expression(std::move(e)) {}
    void accept(ASTVisitor& visitor) override;
};

struct VariableDeclarator {
    std::string name;
    ExprPtr initializer;  // May be null
    Common::SourceLocation location;
};

// final x = 1; late String name; var a = 1, b = 2;
class VariableDeclarationStmt : public Statement {
public:
    std::optional<TypeAnnotation> type;
    bool isFinal;
    bool isConst;
    bool isLate;
    std::vector<VariableDeclarator> variables;
    VariableDeclarationStmt(const Common::SourceLocation& loc)
        : Statement(loc), isFinal(false), isConst(false), isLate(false) {}
    void accept(ASTVisitor& visitor) override;
};

// Nested function declaration inside a body
class LocalFunctionStmt : public Statement {
public:
    std::string name;
    std::optional<TypeAnnotation> returnType;
    std::unique_ptr<FunctionExpr> function;
    LocalFunctionStmt(const std::string& n, std::unique_ptr<FunctionExpr> fn, const Common::SourceLocation& loc)
        : Statement(loc), name(n), function(std::move(fn)) {}
    void accept(ASTVisitor& visitor) override;
};

class IfStmt : public Statement {
public:
    ExprPtr condition;
    StmtPtr thenBranch;
    StmtPtr elseBranch;  // May be null
    IfStmt(ExprPtr c, StmtPtr t, StmtPtr e, const Common::SourceLocation& loc)
        : Statement(loc), condition(std::move(c)), thenBranch(std::move(t)), elseBranch(std::move(e)) {}
    void accept(ASTVisitor& visitor) override;
};

class ForStmt : public Statement {
public:
    StmtPtr initializer;          // VariableDeclarationStmt or ExpressionStmt, may be null
    ExprPtr condition;            // May be null
    std::vector<ExprPtr> updaters;
    StmtPtr body;
    ForStmt(const Common::SourceLocation& loc) : Statement(loc) {}
    void accept(ASTVisitor& visitor) override;
};

class ForEachStmt : public Statement {
public:
    std::optional<TypeAnnotation> variableType;
    std::string variableName;
    bool isFinal;
    bool isAwait;
    ExprPtr iterable;
    StmtPtr body;
    ForEachStmt(const Common::SourceLocation& loc) : Statement(loc), isFinal(false), isAwait(false) {}
    void accept(ASTVisitor& visitor) override;
};

class WhileStmt : public Statement {
public:
    ExprPtr condition;
    StmtPtr body;
    WhileStmt(ExprPtr c, StmtPtr b, const Common::SourceLocation& loc)
        : Statement(loc), condition(std::move(c)), body(std::move(b)) {}
    void accept(ASTVisitor& visitor) override;
};

class DoWhileStmt : public Statement {
public:
    StmtPtr body;
    ExprPtr condition;
    DoWhileStmt(StmtPtr b, ExprPtr c, const Common::SourceLocation& loc)
        : Statement(loc), body(std::move(b)), condition(std::move(c)) {}
    void accept(ASTVisitor& visitor) override;
};

struct SwitchCase {
    std::vector<ExprPtr> labels;  // Empty for `default:`
    bool isDefault = false;
    std::vector<StmtPtr> statements;
};

class SwitchStmt : public Statement {
public:
    ExprPtr subject;
    std::vector<SwitchCase> cases;
    SwitchStmt(ExprPtr s, const Common::SourceLocation& loc) : Statement(loc), subject(std::move(s)) {}
    void accept(ASTVisitor& visitor) override;
};

struct CatchClause {
    std::optional<TypeAnnotation> exceptionType;  // `on Type`
    std::string exceptionName;                    // `catch (e ...)`
    std::string stackTraceName;                   // `catch (e, st)`
    std::unique_ptr<BlockStmt> body;
};

class TryStmt : public Statement {
public:
    std::unique_ptr<BlockStmt> body;
    std::vector<CatchClause> catches;
    std::unique_ptr<BlockStmt> finallyBlock;  // May be null
    TryStmt(const Common::SourceLocation& loc) : Statement(loc) {}
    void accept(ASTVisitor& visitor) override;
};

class ReturnStmt : public Statement {
public:
    ExprPtr value;  // May be null
    ReturnStmt(ExprPtr v, const Common::SourceLocation& loc) : Statement(loc), value(std::move(v)) {}
    void accept(ASTVisitor& visitor) override;
};

class BreakStmt : public Statement {
public:
    std::string label;
    BreakStmt(const std::string& l, const Common::SourceLocation& loc) : Statement(loc), label(l) {}
    void accept(ASTVisitor& visitor) override;
};

class ContinueStmt : public Statement {
public:
    std::string label;
    ContinueStmt(const std::string& l, const Common::SourceLocation& loc) : Statement(loc), label(l) {}
    void accept(ASTVisitor& visitor) override;
};

class YieldStmt : public Statement {
public:
    ExprPtr value;
    bool isStar;
    YieldStmt(ExprPtr v, bool star, const Common::SourceLocation& loc)
        : Statement(loc), value(std::move(v)), isStar(star) {}
    void accept(ASTVisitor& visitor) override;
};

class AssertStmt : public Statement {
public:
    ExprPtr condition;
    ExprPtr message;  // May be null
    AssertStmt(ExprPtr c, ExprPtr m, const Common::SourceLocation& loc)
        : Statement(loc), condition(std::move(c)), message(std::move(m)) {}
    void accept(ASTVisitor& visitor) override;
};

//==============================================================================
// Declarations
//==============================================================================

struct FormalParameter {
    std::string name;
    std::optional<TypeAnnotation> type;
    bool isRequired = false;            // `required` keyword or mandatory positional
    bool isNamed = false;               // Inside `{}`
    bool isOptionalPositional = false;  // Inside `[]`
    bool isFieldFormal = false;         // this.name
    bool isSuperFormal = false;         // super.name
    bool isFinal = false;
    ExprPtr defaultValue;               // May be null
    Common::SourceLocation location;
};

enum class DeclarationKind {
    Class,
    Mixin,
    Enum,
    Typedef,
    Extension,
    Function,
    Variable
};

enum class MemberKind {
    Field,
    Constructor,
    Method
};

class ClassMember : public ASTNode {
public:
    std::vector<std::string> annotations;  // e.g. "override"
    ClassMember(const Common::SourceLocation& loc) : ASTNode(loc) {}
    virtual MemberKind kind() const = 0;
};

class FieldDecl : public ClassMember {
public:
    std::optional<TypeAnnotation> type;
    bool isStatic = false;
    bool isFinal = false;
    bool isConst = false;
    bool isLate = false;
    std::vector<VariableDeclarator> variables;
    FieldDecl(const Common::SourceLocation& loc) : ClassMember(loc) {}
    MemberKind kind() const override { return MemberKind::Field; }
};

struct ConstructorInitializer {
    enum class Kind { Field, Super, This, Assert };
    Kind kind = Kind::Field;
    std::string name;              // Field name, or named super/this constructor
    ExprPtr value;                 // Field value or assert condition
    std::vector<Argument> arguments;
};

class ConstructorDecl : public ClassMember {
public:
    std::string className;
    std::string name;  // Empty for the unnamed constructor
    std::vector<FormalParameter> parameters;
    bool isConst = false;
    bool isFactory = false;
    std::vector<ConstructorInitializer> initializers;
    std::optional<TypeAnnotation> redirectTarget;  // factory Foo() = Bar;
    std::unique_ptr<BlockStmt> body;               // May be null
    ExprPtr expressionBody;                        // factory Foo() => ...
    ConstructorDecl(const Common::SourceLocation& loc) : ClassMember(loc) {}
    MemberKind kind() const override { return MemberKind::Constructor; }
};

class MethodDecl : public ClassMember {
public:
    std::string name;
    std::optional<TypeAnnotation> returnType;
    std::vector<std::string> typeParameters;
    std::vector<FormalParameter> parameters;
    bool isStatic = false;
    bool isGetter = false;
    bool isSetter = false;
    bool isOperator = false;
    bool isExternal = false;
    bool isAsync = false;
    bool isGenerator = false;
    std::unique_ptr<BlockStmt> body;  // Null with no expression body means abstract
    ExprPtr expressionBody;
    MethodDecl(const Common::SourceLocation& loc) : ClassMember(loc) {}
    MemberKind kind() const override { return MemberKind::Method; }
    bool isAbstract() const { return !body && !expressionBody; }
};

class Declaration : public ASTNode {
public:
    std::string name;
    std::vector<std::string> annotations;
    Declaration(const std::string& n, const Common::SourceLocation& loc) : ASTNode(loc), name(n) {}
    virtual DeclarationKind kind() const = 0;
};

struct TypeParameter {
    std::string name;
    std::optional<TypeAnnotation> bound;
};

class ClassDecl : public Declaration {
public:
    bool isAbstract = false;
    std::vector<TypeParameter> typeParameters;
    std::optional<TypeAnnotation> superclass;
    std::vector<TypeAnnotation> mixins;
    std::vector<TypeAnnotation> interfaces;
    std::vector<std::unique_ptr<ClassMember>> members;
    ClassDecl(const std::string& n, const Common::SourceLocation& loc) : Declaration(n, loc) {}
    DeclarationKind kind() const override { return DeclarationKind::Class; }
};

class MixinDecl : public Declaration {
public:
    std::vector<TypeParameter> typeParameters;
    std::vector<TypeAnnotation> onTypes;
    std::vector<TypeAnnotation> interfaces;
    std::vector<std::unique_ptr<ClassMember>> members;
    MixinDecl(const std::string& n, const Common::SourceLocation& loc) : Declaration(n, loc) {}
    DeclarationKind kind() const override { return DeclarationKind::Mixin; }
};

class EnumDecl : public Declaration {
public:
    std::vector<std::string> values;
    std::vector<TypeAnnotation> mixins;
    std::vector<TypeAnnotation> interfaces;
    std::vector<std::unique_ptr<ClassMember>> members;
    EnumDecl(const std::string& n, const Common::SourceLocation& loc) : Declaration(n, loc) {}
    DeclarationKind kind() const override { return DeclarationKind::Enum; }
};

class TypedefDecl : public Declaration {
public:
    std::vector<TypeParameter> typeParameters;
    TypeAnnotation aliasedType;
    TypedefDecl(const std::string& n, const Common::SourceLocation& loc) : Declaration(n, loc) {}
    DeclarationKind kind() const override { return DeclarationKind::Typedef; }
};

class ExtensionDecl : public Declaration {
public:
    std::vector<TypeParameter> typeParameters;
    TypeAnnotation extendedType;
    std::vector<std::unique_ptr<ClassMember>> members;
    ExtensionDecl(const std::string& n, const Common::SourceLocation& loc) : Declaration(n, loc) {}
    DeclarationKind kind() const override { return DeclarationKind::Extension; }
};

class FunctionDecl : public Declaration {
public:
    std::unique_ptr<MethodDecl> function;
    FunctionDecl(std::unique_ptr<MethodDecl> fn, const Common::SourceLocation& loc)
        : Declaration(fn->name, loc), function(std::move(fn)) {}
    DeclarationKind kind() const override { return DeclarationKind::Function; }
};

class TopLevelVariableDecl : public Declaration {
public:
    std::unique_ptr<FieldDecl> variables;
    TopLevelVariableDecl(std::unique_ptr<FieldDecl> vars, const Common::SourceLocation& loc)
        : Declaration(vars->variables.empty() ? "" : vars->variables.front().name, loc),
          variables(std::move(vars)) {}
    DeclarationKind kind() const override { return DeclarationKind::Variable; }
};

//==============================================================================
// Directives and compilation unit
//==============================================================================

struct ImportDirective {
    std::string uri;
    std::string prefix;
    bool isDeferred = false;
    std::vector<std::string> show;
    std::vector<std::string> hide;
    Common::SourceLocation location;
};

struct ExportDirective {
    std::string uri;
    std::vector<std::string> show;
    std::vector<std::string> hide;
    Common::SourceLocation location;
};

class CompilationUnit {
public:
    std::string filename;
    std::string libraryName;
    std::string partOf;  // Set when the unit is a `part of` file
    std::vector<ImportDirective> imports;
    std::vector<ExportDirective> exports;
    std::vector<std::string> parts;
    std::vector<std::unique_ptr<Declaration>> declarations;

    explicit CompilationUnit(const std::string& file) : filename(file) {}
};

//==============================================================================
// Visitor
//==============================================================================

class ASTVisitor {
public:
    virtual ~ASTVisitor() = default;

    // Expressions
    virtual void visit(IntegerLiteralExpr& node) = 0;
    virtual void visit(DoubleLiteralExpr& node) = 0;
    virtual void visit(StringLiteralExpr& node) = 0;
    virtual void visit(StringInterpolationExpr& node) = 0;
    virtual void visit(BoolLiteralExpr& node) = 0;
    virtual void visit(NullLiteralExpr& node) = 0;
    virtual void visit(IdentifierExpr& node) = 0;
    virtual void visit(ThisExpr& node) = 0;
    virtual void visit(SuperExpr& node) = 0;
    virtual void visit(BinaryExpr& node) = 0;
    virtual void visit(PrefixExpr& node) = 0;
    virtual void visit(PostfixExpr& node) = 0;
    virtual void visit(AssignmentExpr& node) = 0;
    virtual void visit(ConditionalExpr& node) = 0;
    virtual void visit(PropertyAccessExpr& node) = 0;
    virtual void visit(IndexExpr& node) = 0;
    virtual void visit(MethodInvocationExpr& node) = 0;
    virtual void visit(FunctionCallExpr& node) = 0;
    virtual void visit(InstanceCreationExpr& node) = 0;
    virtual void visit(ListLiteralExpr& node) = 0;
    virtual void visit(SetOrMapLiteralExpr& node) = 0;
    virtual void visit(MapEntryExpr& node) = 0;
    virtual void visit(SpreadElementExpr& node) = 0;
    virtual void visit(IfElementExpr& node) = 0;
    virtual void visit(ForElementExpr& node) = 0;
    virtual void visit(FunctionExpr& node) = 0;
    virtual void visit(AwaitExpr& node) = 0;
    virtual void visit(ThrowExpr& node) = 0;
    virtual void visit(AsExpr& node) = 0;
    virtual void visit(IsExpr& node) = 0;
    virtual void visit(ParenthesizedExpr& node) = 0;
    virtual void visit(CascadeReceiverExpr& node) = 0;
    virtual void visit(CascadeExpr& node) = 0;

    // Statements
    virtual void visit(BlockStmt& node) = 0;
    virtual void visit(ExpressionStmt& node) = 0;
    virtual void visit(VariableDeclarationStmt& node) = 0;
    virtual void visit(LocalFunctionStmt& node) = 0;
    virtual void visit(IfStmt& node) = 0;
    virtual void visit(ForStmt& node) = 0;
    virtual void visit(ForEachStmt& node) = 0;
    virtual void visit(WhileStmt& node) = 0;
    virtual void visit(DoWhileStmt& node) = 0;
    virtual void visit(SwitchStmt& node) = 0;
    virtual void visit(TryStmt& node) = 0;
    virtual void visit(ReturnStmt& node) = 0;
    virtual void visit(BreakStmt& node) = 0;
    virtual void visit(ContinueStmt& node) = 0;
    virtual void visit(YieldStmt& node) = 0;
    virtual void visit(AssertStmt& node) = 0;
};

} // namespace Parser
} // namespace FJS
