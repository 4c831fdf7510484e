#pragma once
#include <memory>
#include <vector>
#include <stdexcept>
#include "AST.h"
#include "../Lexer/Token.h"
#include "../Common/Error.h"

namespace FJS {
namespace Parser {

// Raised inside the parser and converted into a diagnostic at the nearest
// declaration boundary
class ParseError : public std::runtime_error {
public:
    ParseError(Common::ErrorCode code, const std::string& message, const Common::SourceLocation& loc)
        : std::runtime_error(message), code_(code), location_(loc) {}

    Common::ErrorCode code() const { return code_; }
    const Common::SourceLocation& location() const { return location_; }

private:
    Common::ErrorCode code_;
    Common::SourceLocation location_;
};

class Parser {
private:
    std::vector<Lexer::Token> tokens;
    size_t current;
    std::string filename;
    Common::ErrorReporter& errorReporter;

    // Token navigation
    const Lexer::Token& tokenAt(size_t index) const;
    const Lexer::Token& peek(size_t offset = 0) const;
    const Lexer::Token& previous() const;
    const Lexer::Token& advance();
    bool isAtEnd() const;
    bool check(Lexer::TokenType type) const;
    bool checkAt(size_t offset, Lexer::TokenType type) const;
    bool match(Lexer::TokenType type);
    bool matchAny(std::initializer_list<Lexer::TokenType> types);
    bool checkContextual(const std::string& word) const;
    bool matchContextual(const std::string& word);

    // Error handling
    const Lexer::Token& consume(Lexer::TokenType type, const std::string& message);
    std::string consumeIdentifier(const std::string& message);
    void consumeContextual(const std::string& word, const std::string& message);
    [[noreturn]] void error(const std::string& message);
    [[noreturn]] void unsupported(const std::string& message);
    void synchronize();

    // Lookahead helpers (never consume)
    bool skipType(size_t& index) const;
    bool skipTypeArguments(size_t& index) const;
    bool skipBalanced(size_t& index, Lexer::TokenType open, Lexer::TokenType close) const;
    bool looksLikeTypedVariable() const;
    bool looksLikeLocalFunction() const;
    bool looksLikeFunctionExpression() const;
    bool looksLikeGenericCall() const;
    bool looksLikeNullAwareIndex() const;
    bool atCascade() const;
    bool canStartExpression(const Lexer::Token& token) const;

    // Directives and declarations
    bool parseDirective(CompilationUnit& unit);
    std::vector<std::string> parseAnnotations();
    std::unique_ptr<Declaration> parseTopLevelDeclaration();
    std::unique_ptr<ClassDecl> parseClass(bool isAbstract);
    std::unique_ptr<MixinDecl> parseMixin();
    std::unique_ptr<EnumDecl> parseEnum();
    std::unique_ptr<TypedefDecl> parseTypedef();
    std::unique_ptr<ExtensionDecl> parseExtension();
    std::vector<std::unique_ptr<ClassMember>> parseClassBody(const std::string& className);
    std::unique_ptr<ClassMember> parseClassMember(const std::string& className);
    std::unique_ptr<ConstructorDecl> parseConstructor(const std::string& className, bool isConst, bool isFactory);
    std::vector<ConstructorInitializer> parseInitializerList();
    std::unique_ptr<MethodDecl> parseMethodRest(std::unique_ptr<MethodDecl> method);
    void parseFunctionBody(std::unique_ptr<BlockStmt>& block, ExprPtr& expression,
                           bool& isAsync, bool& isGenerator, bool allowAbstract);
    std::unique_ptr<FieldDecl> parseVariableList(std::unique_ptr<FieldDecl> field);
    std::vector<FormalParameter> parseFormalParameters();
    FormalParameter parseFormalParameter(bool named, bool optionalPositional);
    std::vector<TypeParameter> parseTypeParameters();
    std::vector<TypeAnnotation> parseTypeList();

    // Types
    TypeAnnotation parseType();
    std::vector<TypeAnnotation> parseTypeArguments();

    // Statements
    StmtPtr parseStatement();
    std::unique_ptr<BlockStmt> parseBlock();
    std::unique_ptr<VariableDeclarationStmt> parseVariableDeclaration(bool requireSemicolon);
    StmtPtr parseLocalFunction();
    StmtPtr parseIf();
    StmtPtr parseFor(bool isAwait);
    StmtPtr parseWhile();
    StmtPtr parseDoWhile();
    StmtPtr parseSwitch();
    StmtPtr parseTry();
    StmtPtr parseReturn();

    // Expressions
    ExprPtr parseExpression();
    ExprPtr parseCascade(ExprPtr target);
    ExprPtr parseConditional();
    ExprPtr parseIfNull();
    ExprPtr parseLogicalOr();
    ExprPtr parseLogicalAnd();
    ExprPtr parseEquality();
    ExprPtr parseRelational();
    ExprPtr parseBitwiseOr();
    ExprPtr parseBitwiseXor();
    ExprPtr parseBitwiseAnd();
    ExprPtr parseAdditive();
    ExprPtr parseMultiplicative();
    ExprPtr parseUnary();
    ExprPtr parsePostfix();
    ExprPtr parsePrimary();
    ExprPtr parseSelectors(ExprPtr expr);
    ExprPtr parseStringLiteral();
    ExprPtr parseInstanceCreation(bool isConst);
    ExprPtr parseListLiteral(bool isConst, std::vector<TypeAnnotation> typeArguments);
    ExprPtr parseSetOrMapLiteral(bool isConst, std::vector<TypeAnnotation> typeArguments);
    ExprPtr parseCollectionElement(bool allowEntries);
    ExprPtr parseFunctionExpression();
    std::vector<Argument> parseArguments();

public:
    Parser(const std::vector<Lexer::Token>& toks, const std::string& file, Common::ErrorReporter& reporter);

    std::unique_ptr<CompilationUnit> parse();

    // Parses exactly one expression spanning all tokens (string interpolation fragments)
    ExprPtr parseStandaloneExpression();
};

} // namespace Parser
} // namespace FJS
