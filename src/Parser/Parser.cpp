#include "Parser/Parser.h"
#include "Lexer/Lexer.h"
#include <cctype>

namespace FJS {
namespace Parser {

using Lexer::Token;
using Lexer::TokenType;

Parser::Parser(const std::vector<Lexer::Token>& toks, const std::string& file, Common::ErrorReporter& reporter)
    : tokens(toks), current(0), filename(file), errorReporter(reporter) {
    if (tokens.empty()) {
        tokens.emplace_back(TokenType::EndOfFile, "", Common::SourceLocation(file, 1, 1, 0));
    }
}

//==============================================================================
// Token navigation
//==============================================================================

const Token& Parser::tokenAt(size_t index) const {
    if (index >= tokens.size()) {
        return tokens.back();
    }
    return tokens[index];
}

const Token& Parser::peek(size_t offset) const {
    return tokenAt(current + offset);
}

const Token& Parser::previous() const {
    return tokenAt(current == 0 ? 0 : current - 1);
}

const Token& Parser::advance() {
    if (current < tokens.size()) current++;
    return previous();
}

bool Parser::isAtEnd() const {
    return current >= tokens.size() || peek().type == TokenType::EndOfFile;
}

bool Parser::check(TokenType type) const {
    if (current >= tokens.size()) return false;
    return peek().type == type;
}

bool Parser::checkAt(size_t offset, TokenType type) const {
    if (current + offset >= tokens.size()) return false;
    return peek(offset).type == type;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

bool Parser::matchAny(std::initializer_list<TokenType> types) {
    for (auto type : types) {
        if (check(type)) {
            advance();
            return true;
        }
    }
    return false;
}

bool Parser::checkContextual(const std::string& word) const {
    return current < tokens.size() && peek().isContextual(word);
}

bool Parser::matchContextual(const std::string& word) {
    if (checkContextual(word)) {
        advance();
        return true;
    }
    return false;
}

//==============================================================================
// Error handling
//==============================================================================

const Token& Parser::consume(TokenType type, const std::string& message) {
    if (check(type)) return advance();
    error(message);
}

std::string Parser::consumeIdentifier(const std::string& message) {
    return consume(TokenType::Identifier, message).lexeme;
}

void Parser::consumeContextual(const std::string& word, const std::string& message) {
    if (!matchContextual(word)) {
        error(message);
    }
}

void Parser::error(const std::string& message) {
    const Token& token = peek();
    std::string found = token.type == TokenType::EndOfFile ? "end of file" : "'" + token.lexeme + "'";
    throw ParseError(Common::ErrorCode::UnexpectedToken, message + " (found " + found + ")", token.location);
}

void Parser::unsupported(const std::string& message) {
    throw ParseError(Common::ErrorCode::UnsupportedSyntax, message, peek().location);
}

void Parser::synchronize() {
    // Skip to the next token that starts a line and can begin a top-level declaration
    advance();
    while (!isAtEnd()) {
        const Token& token = peek();
        if (token.location.column == 1 &&
            token.isOneOf(TokenType::Class, TokenType::Enum, TokenType::Identifier, TokenType::Void,
                          TokenType::Final, TokenType::Const, TokenType::Var)) {
            return;
        }
        if (token.location.column == 1 && token.is(TokenType::At)) {
            return;
        }
        advance();
    }
}

//==============================================================================
// Lookahead helpers
//==============================================================================

bool Parser::skipBalanced(size_t& index, TokenType open, TokenType close) const {
    if (tokenAt(index).type != open) return false;
    int depth = 0;
    while (index < tokens.size()) {
        TokenType type = tokenAt(index).type;
        if (type == TokenType::EndOfFile || type == TokenType::Invalid) return false;
        if (type == open) {
            depth++;
        } else if (type == close) {
            depth--;
            if (depth == 0) {
                index++;
                return true;
            }
        }
        index++;
    }
    return false;
}

bool Parser::skipTypeArguments(size_t& index) const {
    if (tokenAt(index).type != TokenType::LeftAngle) return false;
    index++;
    while (true) {
        if (!skipType(index)) return false;
        if (tokenAt(index).type == TokenType::Comma) {
            index++;
            continue;
        }
        if (tokenAt(index).type == TokenType::RightAngle) {
            index++;
            return true;
        }
        return false;
    }
}

bool Parser::skipType(size_t& index) const {
    const Token& first = tokenAt(index);
    if (first.type == TokenType::Void) {
        index++;
    } else if (first.type == TokenType::Identifier) {
        index++;
        while (tokenAt(index).type == TokenType::Dot && tokenAt(index + 1).type == TokenType::Identifier) {
            index += 2;
        }
        if (tokenAt(index).type == TokenType::LeftAngle && !skipTypeArguments(index)) {
            return false;
        }
        // Bare `Function(...)` type
        if (first.lexeme == "Function" && tokenAt(index).type == TokenType::LeftParen) {
            if (!skipBalanced(index, TokenType::LeftParen, TokenType::RightParen)) return false;
        }
    } else {
        return false;
    }

    if (tokenAt(index).type == TokenType::Question) {
        index++;
    }

    // `ReturnType Function(params)` suffixes
    while (tokenAt(index).isContextual("Function")) {
        size_t next = index + 1;
        if (tokenAt(next).type == TokenType::LeftAngle && !skipTypeArguments(next)) return false;
        if (tokenAt(next).type != TokenType::LeftParen) break;
        if (!skipBalanced(next, TokenType::LeftParen, TokenType::RightParen)) return false;
        index = next;
        if (tokenAt(index).type == TokenType::Question) {
            index++;
        }
    }
    return true;
}

bool Parser::looksLikeTypedVariable() const {
    size_t index = current;
    if (!skipType(index)) return false;
    if (tokenAt(index).type != TokenType::Identifier) return false;
    TokenType after = tokenAt(index + 1).type;
    return after == TokenType::Equals || after == TokenType::Semicolon || after == TokenType::Comma;
}

bool Parser::looksLikeLocalFunction() const {
    size_t index = current;
    size_t afterType = current;
    if (skipType(afterType) && tokenAt(afterType).type == TokenType::Identifier) {
        index = afterType;
    }
    if (tokenAt(index).type != TokenType::Identifier) return false;
    index++;
    if (tokenAt(index).type == TokenType::LeftAngle && !skipTypeArguments(index)) return false;
    if (tokenAt(index).type != TokenType::LeftParen) return false;
    if (!skipBalanced(index, TokenType::LeftParen, TokenType::RightParen)) return false;
    const Token& next = tokenAt(index);
    return next.type == TokenType::LeftBrace || next.type == TokenType::FatArrow ||
           next.isContextual("async") || next.isContextual("sync");
}

bool Parser::looksLikeFunctionExpression() const {
    size_t index = current;
    if (!skipBalanced(index, TokenType::LeftParen, TokenType::RightParen)) return false;
    const Token& next = tokenAt(index);
    return next.type == TokenType::FatArrow || next.type == TokenType::LeftBrace ||
           next.isContextual("async") || next.isContextual("sync");
}

bool Parser::looksLikeGenericCall() const {
    size_t index = current;
    if (!skipTypeArguments(index)) return false;
    if (tokenAt(index).type == TokenType::LeftParen) return true;
    return tokenAt(index).type == TokenType::Dot &&
           tokenAt(index + 1).type == TokenType::Identifier &&
           tokenAt(index + 2).type == TokenType::LeftParen;
}

// `?[` opens a null-aware index unless the bracketed part is the then-branch
// of a conditional: `flag ? [a] : [b]`
bool Parser::looksLikeNullAwareIndex() const {
    if (!check(TokenType::Question) || !checkAt(1, TokenType::LeftBracket)) return false;
    size_t index = current + 1;
    if (!skipBalanced(index, TokenType::LeftBracket, TokenType::RightBracket)) return false;
    return tokenAt(index).type != TokenType::Colon;
}

// `..` or `?..` (lexed as `?.` followed by `.`)
bool Parser::atCascade() const {
    return check(TokenType::DotDot) || (check(TokenType::QuestionDot) && checkAt(1, TokenType::Dot));
}

bool Parser::canStartExpression(const Token& token) const {
    switch (token.type) {
        case TokenType::Semicolon:
        case TokenType::RightParen:
        case TokenType::RightBracket:
        case TokenType::RightBrace:
        case TokenType::Comma:
        case TokenType::Dot:
        case TokenType::QuestionDot:
        case TokenType::Colon:
        case TokenType::Equals:
        case TokenType::EndOfFile:
        case TokenType::Invalid:
            return false;
        default:
            return true;
    }
}

//==============================================================================
// Compilation unit
//==============================================================================

std::unique_ptr<CompilationUnit> Parser::parse() {
    auto unit = std::make_unique<CompilationUnit>(filename);

    while (!isAtEnd()) {
        try {
            auto annotations = parseAnnotations();
            if (parseDirective(*unit)) {
                continue;
            }
            auto declaration = parseTopLevelDeclaration();
            declaration->annotations = std::move(annotations);
            unit->declarations.push_back(std::move(declaration));
        } catch (const ParseError& e) {
            errorReporter.reportError(e.code(), e.what(), e.location());
            synchronize();
        }
    }

    return unit;
}

ExprPtr Parser::parseStandaloneExpression() {
    auto expr = parseExpression();
    if (!isAtEnd()) {
        error("Unexpected token after interpolated expression");
    }
    return expr;
}

std::vector<std::string> Parser::parseAnnotations() {
    std::vector<std::string> annotations;
    while (match(TokenType::At)) {
        std::string name = consumeIdentifier("Expected annotation name");
        while (check(TokenType::Dot) && checkAt(1, TokenType::Identifier)) {
            advance();
            name += "." + advance().lexeme;
        }
        if (check(TokenType::LeftAngle)) {
            parseTypeArguments();
        }
        if (check(TokenType::LeftParen)) {
            size_t index = current;
            if (!skipBalanced(index, TokenType::LeftParen, TokenType::RightParen)) {
                error("Unterminated annotation arguments");
            }
            current = index;
        }
        annotations.push_back(name);
    }
    return annotations;
}

bool Parser::parseDirective(CompilationUnit& unit) {
    auto uriOf = [this](const Token& token) {
        if (token.hasInterpolation()) {
            error("URI must be a constant string");
        }
        return token.literalText();
    };

    auto parseCombinators = [this](std::vector<std::string>& show, std::vector<std::string>& hide) {
        while (true) {
            std::vector<std::string>* target = nullptr;
            if (matchContextual("show")) {
                target = &show;
            } else if (matchContextual("hide")) {
                target = &hide;
            } else {
                break;
            }
            do {
                target->push_back(consumeIdentifier("Expected name in combinator"));
            } while (match(TokenType::Comma));
        }
    };

    if (checkContextual("library") && (checkAt(1, TokenType::Identifier) || checkAt(1, TokenType::Semicolon))) {
        advance();
        std::string name;
        if (check(TokenType::Identifier)) {
            name = advance().lexeme;
            while (match(TokenType::Dot)) {
                name += "." + consumeIdentifier("Expected library name segment");
            }
        }
        consume(TokenType::Semicolon, "Expected ';' after library directive");
        unit.libraryName = name;
        return true;
    }

    if (checkContextual("import") && checkAt(1, TokenType::StringLiteral)) {
        ImportDirective directive;
        directive.location = advance().location;
        directive.uri = uriOf(consume(TokenType::StringLiteral, "Expected import URI"));

        // Conditional imports: `if (dart.library.io) 'io.dart'`
        while (match(TokenType::If)) {
            size_t index = current;
            if (!skipBalanced(index, TokenType::LeftParen, TokenType::RightParen)) {
                error("Malformed import configuration");
            }
            current = index;
            consume(TokenType::StringLiteral, "Expected configuration URI");
        }

        if (matchContextual("deferred")) {
            directive.isDeferred = true;
        }
        if (matchContextual("as")) {
            directive.prefix = consumeIdentifier("Expected import prefix");
        }
        parseCombinators(directive.show, directive.hide);
        consume(TokenType::Semicolon, "Expected ';' after import directive");
        unit.imports.push_back(std::move(directive));
        return true;
    }

    if (checkContextual("export") && checkAt(1, TokenType::StringLiteral)) {
        ExportDirective directive;
        directive.location = advance().location;
        directive.uri = uriOf(consume(TokenType::StringLiteral, "Expected export URI"));
        while (match(TokenType::If)) {
            size_t index = current;
            if (!skipBalanced(index, TokenType::LeftParen, TokenType::RightParen)) {
                error("Malformed export configuration");
            }
            current = index;
            consume(TokenType::StringLiteral, "Expected configuration URI");
        }
        parseCombinators(directive.show, directive.hide);
        consume(TokenType::Semicolon, "Expected ';' after export directive");
        unit.exports.push_back(std::move(directive));
        return true;
    }

    if (checkContextual("part") && checkAt(1, TokenType::StringLiteral)) {
        advance();
        unit.parts.push_back(uriOf(advance()));
        consume(TokenType::Semicolon, "Expected ';' after part directive");
        return true;
    }

    if (checkContextual("part") && peek(1).isContextual("of")) {
        advance();
        advance();
        if (check(TokenType::StringLiteral)) {
            unit.partOf = uriOf(advance());
        } else {
            std::string name = consumeIdentifier("Expected library name after 'part of'");
            while (match(TokenType::Dot)) {
                name += "." + consumeIdentifier("Expected library name segment");
            }
            unit.partOf = name;
        }
        consume(TokenType::Semicolon, "Expected ';' after part-of directive");
        return true;
    }

    return false;
}

//==============================================================================
// Top-level declarations
//==============================================================================

std::unique_ptr<Declaration> Parser::parseTopLevelDeclaration() {
    bool isAbstract = false;

    // Class modifiers
    while (true) {
        if (checkContextual("abstract") && (checkAt(1, TokenType::Class) || checkAt(1, TokenType::Identifier))) {
            isAbstract = true;
            advance();
            continue;
        }
        if ((checkContextual("base") || checkContextual("interface") || checkContextual("sealed")) &&
            (checkAt(1, TokenType::Class) || checkAt(1, TokenType::Identifier) || checkAt(1, TokenType::Final))) {
            if (checkContextual("sealed")) {
                isAbstract = true;
            }
            advance();
            continue;
        }
        if (check(TokenType::Final) && checkAt(1, TokenType::Class)) {
            advance();
            continue;
        }
        break;
    }

    if (checkContextual("mixin") && checkAt(1, TokenType::Class)) {
        advance();
    }

    if (match(TokenType::Class)) {
        return parseClass(isAbstract);
    }
    if (checkContextual("mixin") && checkAt(1, TokenType::Identifier)) {
        advance();
        return parseMixin();
    }
    if (match(TokenType::Enum)) {
        return parseEnum();
    }
    if (checkContextual("typedef")) {
        advance();
        return parseTypedef();
    }
    if (checkContextual("extension") && checkAt(1, TokenType::Identifier)) {
        advance();
        return parseExtension();
    }

    auto loc = peek().location;
    bool isExternal = matchContextual("external");

    // Top-level variables
    if (check(TokenType::Final) || check(TokenType::Const) || check(TokenType::Var) ||
        (checkContextual("late") && !checkAt(1, TokenType::LeftParen)) || looksLikeTypedVariable()) {
        auto field = std::make_unique<FieldDecl>(loc);
        field->isStatic = true;
        if (matchContextual("late")) field->isLate = true;
        if (match(TokenType::Final)) field->isFinal = true;
        else if (match(TokenType::Const)) field->isConst = true;
        else match(TokenType::Var);
        if (!(check(TokenType::Identifier) &&
              (checkAt(1, TokenType::Equals) || checkAt(1, TokenType::Semicolon) || checkAt(1, TokenType::Comma)))) {
            field->type = parseType();
        }
        field = parseVariableList(std::move(field));
        return std::make_unique<TopLevelVariableDecl>(std::move(field), loc);
    }

    // Top-level functions, getters and setters
    auto method = std::make_unique<MethodDecl>(loc);
    method->isStatic = true;
    method->isExternal = isExternal;

    bool accessorWithoutType =
        (checkContextual("get") && checkAt(1, TokenType::Identifier) && !checkAt(2, TokenType::LeftParen)) ||
        (checkContextual("set") && checkAt(1, TokenType::Identifier) && checkAt(2, TokenType::LeftParen));
    if (!accessorWithoutType) {
        size_t index = current;
        if (skipType(index) && tokenAt(index).type == TokenType::Identifier) {
            method->returnType = parseType();
        }
    }

    if (checkContextual("get") && checkAt(1, TokenType::Identifier)) {
        advance();
        method->isGetter = true;
    } else if (checkContextual("set") && checkAt(1, TokenType::Identifier)) {
        advance();
        method->isSetter = true;
    }

    method->name = consumeIdentifier("Expected declaration");
    if (!method->isGetter && !check(TokenType::LeftParen) && !check(TokenType::LeftAngle)) {
        error("Expected '(' after function name");
    }
    method = parseMethodRest(std::move(method));
    return std::make_unique<FunctionDecl>(std::move(method), loc);
}

std::unique_ptr<ClassDecl> Parser::parseClass(bool isAbstract) {
    auto loc = previous().location;
    std::string name = consumeIdentifier("Expected class name");
    auto decl = std::make_unique<ClassDecl>(name, loc);
    decl->isAbstract = isAbstract;

    if (check(TokenType::LeftAngle)) {
        decl->typeParameters = parseTypeParameters();
    }
    if (check(TokenType::Equals)) {
        unsupported("Mixin application classes are not supported");
    }
    if (match(TokenType::Extends)) {
        decl->superclass = parseType();
    }
    if (match(TokenType::With)) {
        decl->mixins = parseTypeList();
    }
    if (matchContextual("implements")) {
        decl->interfaces = parseTypeList();
    }

    decl->members = parseClassBody(name);
    return decl;
}

std::unique_ptr<MixinDecl> Parser::parseMixin() {
    auto loc = previous().location;
    std::string name = consumeIdentifier("Expected mixin name");
    auto decl = std::make_unique<MixinDecl>(name, loc);

    if (check(TokenType::LeftAngle)) {
        decl->typeParameters = parseTypeParameters();
    }
    if (matchContextual("on")) {
        decl->onTypes = parseTypeList();
    }
    if (matchContextual("implements")) {
        decl->interfaces = parseTypeList();
    }

    decl->members = parseClassBody(name);
    return decl;
}

std::unique_ptr<EnumDecl> Parser::parseEnum() {
    auto loc = previous().location;
    std::string name = consumeIdentifier("Expected enum name");
    auto decl = std::make_unique<EnumDecl>(name, loc);

    if (check(TokenType::LeftAngle)) {
        parseTypeParameters();
    }
    if (match(TokenType::With)) {
        decl->mixins = parseTypeList();
    }
    if (matchContextual("implements")) {
        decl->interfaces = parseTypeList();
    }

    consume(TokenType::LeftBrace, "Expected '{' after enum name");
    while (!check(TokenType::RightBrace) && !check(TokenType::Semicolon) && !isAtEnd()) {
        parseAnnotations();
        std::string value = consumeIdentifier("Expected enum value");
        if (check(TokenType::LeftAngle)) {
            parseTypeArguments();
        }
        if (match(TokenType::Dot)) {
            consumeIdentifier("Expected constructor name");
        }
        if (check(TokenType::LeftParen)) {
            parseArguments();
        }
        decl->values.push_back(value);
        if (!match(TokenType::Comma)) {
            break;
        }
    }

    // Enhanced enum members
    if (match(TokenType::Semicolon)) {
        while (!check(TokenType::RightBrace) && !isAtEnd()) {
            if (match(TokenType::Semicolon)) continue;
            decl->members.push_back(parseClassMember(name));
        }
    }

    consume(TokenType::RightBrace, "Expected '}' after enum body");
    return decl;
}

std::unique_ptr<TypedefDecl> Parser::parseTypedef() {
    auto loc = previous().location;
    if (!(check(TokenType::Identifier) && (checkAt(1, TokenType::Equals) || checkAt(1, TokenType::LeftAngle)))) {
        unsupported("Only `typedef Name = Type;` aliases are supported");
    }

    std::string name = consumeIdentifier("Expected typedef name");
    auto decl = std::make_unique<TypedefDecl>(name, loc);
    if (check(TokenType::LeftAngle)) {
        decl->typeParameters = parseTypeParameters();
    }
    consume(TokenType::Equals, "Expected '=' in typedef");
    decl->aliasedType = parseType();
    consume(TokenType::Semicolon, "Expected ';' after typedef");
    return decl;
}

std::unique_ptr<ExtensionDecl> Parser::parseExtension() {
    auto loc = previous().location;
    std::string name;
    if (!checkContextual("on")) {
        name = consumeIdentifier("Expected extension name");
    }
    auto decl = std::make_unique<ExtensionDecl>(name, loc);
    if (check(TokenType::LeftAngle)) {
        decl->typeParameters = parseTypeParameters();
    }
    consumeContextual("on", "Expected 'on' in extension declaration");
    decl->extendedType = parseType();
    decl->members = parseClassBody(name);
    return decl;
}

std::vector<TypeParameter> Parser::parseTypeParameters() {
    std::vector<TypeParameter> parameters;
    consume(TokenType::LeftAngle, "Expected '<'");
    do {
        parseAnnotations();
        TypeParameter parameter;
        parameter.name = consumeIdentifier("Expected type parameter name");
        if (match(TokenType::Extends)) {
            parameter.bound = parseType();
        }
        parameters.push_back(std::move(parameter));
    } while (match(TokenType::Comma));
    consume(TokenType::RightAngle, "Expected '>' after type parameters");
    return parameters;
}

std::vector<TypeAnnotation> Parser::parseTypeList() {
    std::vector<TypeAnnotation> types;
    do {
        types.push_back(parseType());
    } while (match(TokenType::Comma));
    return types;
}

//==============================================================================
// Class members
//==============================================================================

std::vector<std::unique_ptr<ClassMember>> Parser::parseClassBody(const std::string& className) {
    std::vector<std::unique_ptr<ClassMember>> members;
    consume(TokenType::LeftBrace, "Expected '{' to open class body");

    while (!check(TokenType::RightBrace) && !isAtEnd()) {
        if (match(TokenType::Semicolon)) continue;
        members.push_back(parseClassMember(className));
    }

    consume(TokenType::RightBrace, "Expected '}' to close class body");
    return members;
}

std::unique_ptr<ClassMember> Parser::parseClassMember(const std::string& className) {
    auto annotations = parseAnnotations();
    auto loc = peek().location;

    bool isStatic = false;
    bool isExternal = false;
    bool isLate = false;
    while (true) {
        if (checkContextual("static") && !checkAt(1, TokenType::LeftParen)) { advance(); isStatic = true; continue; }
        if (checkContextual("external") && !checkAt(1, TokenType::LeftParen)) { advance(); isExternal = true; continue; }
        if (checkContextual("late") && !checkAt(1, TokenType::LeftParen)) { advance(); isLate = true; continue; }
        if (checkContextual("covariant") && !checkAt(1, TokenType::LeftParen)) { advance(); continue; }
        if (checkContextual("abstract") && !checkAt(1, TokenType::LeftParen)) { advance(); continue; }
        break;
    }

    std::unique_ptr<ClassMember> member;

    // Constructors (never static)
    if (!isStatic) {
        if (check(TokenType::Const) && peek(1).isContextual(className)) {
            advance();
            member = parseConstructor(className, true, false);
        } else if (checkContextual("factory")) {
            advance();
            member = parseConstructor(className, false, true);
        } else if (checkContextual(className) && checkAt(1, TokenType::LeftParen)) {
            member = parseConstructor(className, false, false);
        } else if (checkContextual(className) && checkAt(1, TokenType::Dot) &&
                   checkAt(2, TokenType::Identifier) && checkAt(3, TokenType::LeftParen)) {
            member = parseConstructor(className, false, false);
        }
    }

    if (member) {
        member->annotations = std::move(annotations);
        return member;
    }

    // Fields
    bool hasFieldModifier = check(TokenType::Final) || check(TokenType::Const) || check(TokenType::Var);
    if (hasFieldModifier || isLate || looksLikeTypedVariable()) {
        auto field = std::make_unique<FieldDecl>(loc);
        field->isStatic = isStatic;
        field->isLate = isLate;
        if (match(TokenType::Final)) field->isFinal = true;
        else if (match(TokenType::Const)) field->isConst = true;
        else match(TokenType::Var);

        if (!(check(TokenType::Identifier) &&
              (checkAt(1, TokenType::Equals) || checkAt(1, TokenType::Semicolon) || checkAt(1, TokenType::Comma)))) {
            field->type = parseType();
        }
        field = parseVariableList(std::move(field));
        field->annotations = std::move(annotations);
        return field;
    }

    // Methods, getters, setters and operators
    auto method = std::make_unique<MethodDecl>(loc);
    method->isStatic = isStatic;
    method->isExternal = isExternal;

    bool accessorWithoutType =
        (checkContextual("get") && checkAt(1, TokenType::Identifier) && !checkAt(2, TokenType::LeftParen)) ||
        (checkContextual("set") && checkAt(1, TokenType::Identifier) && checkAt(2, TokenType::LeftParen)) ||
        (checkContextual("operator") && !checkAt(1, TokenType::Identifier));
    if (!accessorWithoutType) {
        size_t index = current;
        if (skipType(index) && tokenAt(index).type == TokenType::Identifier) {
            method->returnType = parseType();
        }
    }

    if (checkContextual("get") && checkAt(1, TokenType::Identifier)) {
        advance();
        method->isGetter = true;
        method->name = consumeIdentifier("Expected getter name");
    } else if (checkContextual("set") && checkAt(1, TokenType::Identifier)) {
        advance();
        method->isSetter = true;
        method->name = consumeIdentifier("Expected setter name");
    } else if (checkContextual("operator") && !checkAt(1, TokenType::LeftParen)) {
        advance();
        method->isOperator = true;
        std::string op;
        while (!check(TokenType::LeftParen) && !isAtEnd()) {
            op += advance().lexeme;
        }
        method->name = "operator" + op;
    } else {
        method->name = consumeIdentifier("Expected class member");
    }

    method = parseMethodRest(std::move(method));
    method->annotations = std::move(annotations);
    return method;
}

std::unique_ptr<ConstructorDecl> Parser::parseConstructor(const std::string& className, bool isConst, bool isFactory) {
    auto ctor = std::make_unique<ConstructorDecl>(peek().location);
    ctor->className = className;
    ctor->isConst = isConst;
    ctor->isFactory = isFactory;

    // `const factory` is legal too
    if (!isFactory && checkContextual("factory")) {
        advance();
        ctor->isFactory = true;
    }

    std::string name = consumeIdentifier("Expected constructor name");
    if (name != className) {
        error("Constructor name must match class '" + className + "'");
    }
    if (match(TokenType::Dot)) {
        ctor->name = consumeIdentifier("Expected named constructor");
    }

    ctor->parameters = parseFormalParameters();

    if (match(TokenType::Colon)) {
        ctor->initializers = parseInitializerList();
    }

    if (match(TokenType::Equals)) {
        ctor->redirectTarget = parseType();
        if (match(TokenType::Dot)) {
            ctor->redirectTarget->name += "." + consumeIdentifier("Expected constructor name");
        }
        consume(TokenType::Semicolon, "Expected ';' after redirecting constructor");
        return ctor;
    }

    if (match(TokenType::FatArrow)) {
        ctor->expressionBody = parseExpression();
        consume(TokenType::Semicolon, "Expected ';' after constructor body");
    } else if (check(TokenType::LeftBrace)) {
        ctor->body = parseBlock();
    } else {
        consume(TokenType::Semicolon, "Expected constructor body or ';'");
    }
    return ctor;
}

std::vector<ConstructorInitializer> Parser::parseInitializerList() {
    std::vector<ConstructorInitializer> initializers;
    do {
        ConstructorInitializer init;
        if (match(TokenType::Super)) {
            init.kind = ConstructorInitializer::Kind::Super;
            if (match(TokenType::Dot)) {
                init.name = consumeIdentifier("Expected super constructor name");
            }
            init.arguments = parseArguments();
        } else if (check(TokenType::This) && !checkAt(1, TokenType::Dot)) {
            advance();
            init.kind = ConstructorInitializer::Kind::This;
            init.arguments = parseArguments();
        } else if (check(TokenType::This) && checkAt(2, TokenType::Identifier) && checkAt(3, TokenType::LeftParen)) {
            advance();
            advance();
            init.kind = ConstructorInitializer::Kind::This;
            init.name = consumeIdentifier("Expected constructor name");
            init.arguments = parseArguments();
        } else if (match(TokenType::Assert)) {
            init.kind = ConstructorInitializer::Kind::Assert;
            consume(TokenType::LeftParen, "Expected '(' after assert");
            init.value = parseExpression();
            if (match(TokenType::Comma) && !check(TokenType::RightParen)) {
                Argument message;
                message.value = parseExpression();
                init.arguments.push_back(std::move(message));
                match(TokenType::Comma);
            }
            consume(TokenType::RightParen, "Expected ')' after assert");
        } else {
            init.kind = ConstructorInitializer::Kind::Field;
            if (match(TokenType::This)) {
                consume(TokenType::Dot, "Expected '.' after this");
            }
            init.name = consumeIdentifier("Expected field initializer");
            consume(TokenType::Equals, "Expected '=' in field initializer");
            init.value = parseConditional();
        }
        initializers.push_back(std::move(init));
    } while (match(TokenType::Comma));
    return initializers;
}

std::unique_ptr<MethodDecl> Parser::parseMethodRest(std::unique_ptr<MethodDecl> method) {
    if (check(TokenType::LeftAngle)) {
        for (auto& parameter : parseTypeParameters()) {
            method->typeParameters.push_back(parameter.name);
        }
    }

    if (!method->isGetter) {
        method->parameters = parseFormalParameters();
    }

    parseFunctionBody(method->body, method->expressionBody, method->isAsync, method->isGenerator, true);
    return method;
}

void Parser::parseFunctionBody(std::unique_ptr<BlockStmt>& block, ExprPtr& expression,
                               bool& isAsync, bool& isGenerator, bool allowAbstract) {
    if (matchContextual("async")) {
        isAsync = true;
        if (match(TokenType::Star)) isGenerator = true;
    } else if (matchContextual("sync")) {
        consume(TokenType::Star, "Expected '*' after sync");
        isGenerator = true;
    }

    if (match(TokenType::FatArrow)) {
        expression = parseExpression();
        if (allowAbstract) {
            consume(TokenType::Semicolon, "Expected ';' after expression body");
        }
        return;
    }
    if (check(TokenType::LeftBrace)) {
        block = parseBlock();
        return;
    }
    if (allowAbstract && match(TokenType::Semicolon)) {
        return;
    }
    error("Expected function body");
}

std::unique_ptr<FieldDecl> Parser::parseVariableList(std::unique_ptr<FieldDecl> field) {
    do {
        VariableDeclarator declarator;
        declarator.location = peek().location;
        declarator.name = consumeIdentifier("Expected variable name");
        if (match(TokenType::Equals)) {
            declarator.initializer = parseExpression();
        }
        field->variables.push_back(std::move(declarator));
    } while (match(TokenType::Comma));
    consume(TokenType::Semicolon, "Expected ';' after variable declaration");
    return field;
}

std::vector<FormalParameter> Parser::parseFormalParameters() {
    std::vector<FormalParameter> parameters;
    consume(TokenType::LeftParen, "Expected '(' to open parameter list");

    while (!check(TokenType::RightParen) && !isAtEnd()) {
        if (match(TokenType::LeftBrace)) {
            while (!check(TokenType::RightBrace) && !isAtEnd()) {
                parameters.push_back(parseFormalParameter(true, false));
                if (!match(TokenType::Comma)) break;
            }
            consume(TokenType::RightBrace, "Expected '}' after named parameters");
            break;
        }
        if (match(TokenType::LeftBracket)) {
            while (!check(TokenType::RightBracket) && !isAtEnd()) {
                parameters.push_back(parseFormalParameter(false, true));
                if (!match(TokenType::Comma)) break;
            }
            consume(TokenType::RightBracket, "Expected ']' after optional parameters");
            break;
        }
        parameters.push_back(parseFormalParameter(false, false));
        if (!match(TokenType::Comma)) break;
    }

    consume(TokenType::RightParen, "Expected ')' after parameters");
    return parameters;
}

FormalParameter Parser::parseFormalParameter(bool named, bool optionalPositional) {
    parseAnnotations();

    FormalParameter param;
    param.location = peek().location;
    param.isNamed = named;
    param.isOptionalPositional = optionalPositional;
    param.isRequired = !named && !optionalPositional;

    if (named && matchContextual("required")) {
        param.isRequired = true;
    }
    matchContextual("covariant");
    if (match(TokenType::Final)) {
        param.isFinal = true;
    } else {
        match(TokenType::Var);
    }

    // this.name / super.name, optionally typed
    auto parseFormalTarget = [&]() -> bool {
        if (check(TokenType::This) && checkAt(1, TokenType::Dot)) {
            advance();
            advance();
            param.isFieldFormal = true;
            param.name = consumeIdentifier("Expected field name after 'this.'");
            return true;
        }
        if (check(TokenType::Super) && checkAt(1, TokenType::Dot)) {
            advance();
            advance();
            param.isSuperFormal = true;
            param.name = consumeIdentifier("Expected parameter name after 'super.'");
            return true;
        }
        return false;
    };

    if (!parseFormalTarget()) {
        bool untyped = check(TokenType::Identifier) &&
                       (checkAt(1, TokenType::Comma) || checkAt(1, TokenType::RightParen) ||
                        checkAt(1, TokenType::RightBrace) || checkAt(1, TokenType::RightBracket) ||
                        checkAt(1, TokenType::Equals) || checkAt(1, TokenType::Colon) ||
                        checkAt(1, TokenType::LeftParen));
        if (!untyped) {
            param.type = parseType();
        }
        if (!parseFormalTarget()) {
            param.name = consumeIdentifier("Expected parameter name");
        }
    }

    // Function-typed parameter: `void onTap(int index)`
    if (check(TokenType::LeftParen)) {
        size_t index = current;
        if (!skipBalanced(index, TokenType::LeftParen, TokenType::RightParen)) {
            error("Unterminated function-typed parameter");
        }
        std::string signature = (param.type ? param.type->toString() : std::string("dynamic")) + " Function";
        for (size_t i = current; i < index; ++i) {
            signature += tokens[i].lexeme;
            if (tokens[i].type == TokenType::Comma) signature += " ";
        }
        current = index;
        TypeAnnotation fnType;
        fnType.name = "Function";
        fnType.isFunctionType = true;
        fnType.functionSignature = signature;
        if (match(TokenType::Question)) fnType.isNullable = true;
        param.type = fnType;
    }

    if (match(TokenType::Equals) || match(TokenType::Colon)) {
        param.defaultValue = parseExpression();
    }
    return param;
}

//==============================================================================
// Types
//==============================================================================

TypeAnnotation Parser::parseType() {
    TypeAnnotation type;

    if (checkContextual("Function") && (checkAt(1, TokenType::LeftParen) || checkAt(1, TokenType::LeftAngle))) {
        type.name = "Function";
    } else if (match(TokenType::Void)) {
        type.name = "void";
    } else {
        type.name = consumeIdentifier("Expected type");
        while (check(TokenType::Dot) && checkAt(1, TokenType::Identifier)) {
            advance();
            type.name += "." + advance().lexeme;
        }
        if (check(TokenType::LeftAngle)) {
            type.arguments = parseTypeArguments();
        }
        if (match(TokenType::Question)) {
            type.isNullable = true;
        }
    }

    // `Ret Function(Args)` suffixes collapse into a single function type
    while (checkContextual("Function")) {
        size_t index = current + 1;
        if (tokenAt(index).type == TokenType::LeftAngle && !skipTypeArguments(index)) break;
        if (tokenAt(index).type != TokenType::LeftParen) break;
        if (!skipBalanced(index, TokenType::LeftParen, TokenType::RightParen)) {
            error("Unterminated function type");
        }

        std::string signature = type.name == "Function" && type.arguments.empty() && !type.isFunctionType
                                    ? std::string()
                                    : type.toString() + " ";
        for (size_t i = current; i < index; ++i) {
            signature += tokens[i].lexeme;
            if (tokens[i].type == TokenType::Comma) signature += " ";
        }
        current = index;

        TypeAnnotation fnType;
        fnType.name = "Function";
        fnType.isFunctionType = true;
        fnType.functionSignature = signature;
        if (match(TokenType::Question)) fnType.isNullable = true;
        type = fnType;
    }

    return type;
}

std::vector<TypeAnnotation> Parser::parseTypeArguments() {
    std::vector<TypeAnnotation> arguments;
    consume(TokenType::LeftAngle, "Expected '<'");
    do {
        arguments.push_back(parseType());
    } while (match(TokenType::Comma));
    consume(TokenType::RightAngle, "Expected '>' after type arguments");
    return arguments;
}

//==============================================================================
// Statements
//==============================================================================

std::unique_ptr<BlockStmt> Parser::parseBlock() {
    auto block = std::make_unique<BlockStmt>(peek().location);
    consume(TokenType::LeftBrace, "Expected '{'");
    while (!check(TokenType::RightBrace) && !isAtEnd()) {
        block->statements.push_back(parseStatement());
    }
    consume(TokenType::RightBrace, "Expected '}'");
    return block;
}

StmtPtr Parser::parseStatement() {
    auto loc = peek().location;

    if (check(TokenType::LeftBrace)) {
        return parseBlock();
    }
    if (match(TokenType::Semicolon)) {
        return std::make_unique<BlockStmt>(loc);
    }
    if (match(TokenType::If)) {
        return parseIf();
    }
    if (checkContextual("await") && checkAt(1, TokenType::For)) {
        advance();
        advance();
        return parseFor(true);
    }
    if (match(TokenType::For)) {
        return parseFor(false);
    }
    if (match(TokenType::While)) {
        return parseWhile();
    }
    if (match(TokenType::Do)) {
        return parseDoWhile();
    }
    if (match(TokenType::Switch)) {
        return parseSwitch();
    }
    if (match(TokenType::Try)) {
        return parseTry();
    }
    if (match(TokenType::Return)) {
        return parseReturn();
    }
    if (match(TokenType::Break)) {
        std::string label;
        if (check(TokenType::Identifier)) label = advance().lexeme;
        consume(TokenType::Semicolon, "Expected ';' after break");
        return std::make_unique<BreakStmt>(label, loc);
    }
    if (match(TokenType::Continue)) {
        std::string label;
        if (check(TokenType::Identifier)) label = advance().lexeme;
        consume(TokenType::Semicolon, "Expected ';' after continue");
        return std::make_unique<ContinueStmt>(label, loc);
    }
    if (match(TokenType::Rethrow)) {
        consume(TokenType::Semicolon, "Expected ';' after rethrow");
        return std::make_unique<ExpressionStmt>(std::make_unique<ThrowExpr>(nullptr, loc), loc);
    }
    if (match(TokenType::Assert)) {
        consume(TokenType::LeftParen, "Expected '(' after assert");
        auto condition = parseExpression();
        ExprPtr message;
        if (match(TokenType::Comma) && !check(TokenType::RightParen)) {
            message = parseExpression();
            match(TokenType::Comma);
        }
        consume(TokenType::RightParen, "Expected ')' after assert");
        consume(TokenType::Semicolon, "Expected ';' after assert");
        return std::make_unique<AssertStmt>(std::move(condition), std::move(message), loc);
    }
    if (checkContextual("yield") && (checkAt(1, TokenType::Star) || canStartExpression(peek(1)))) {
        advance();
        bool isStar = match(TokenType::Star);
        auto value = parseExpression();
        consume(TokenType::Semicolon, "Expected ';' after yield");
        return std::make_unique<YieldStmt>(std::move(value), isStar, loc);
    }

    // Labels
    if (check(TokenType::Identifier) && checkAt(1, TokenType::Colon)) {
        unsupported("Labeled statements are not supported");
    }

    // Declarations
    if (check(TokenType::Final) || check(TokenType::Const) || check(TokenType::Var) ||
        (checkContextual("late") && checkAt(1, TokenType::Identifier)) || looksLikeTypedVariable()) {
        // `const Foo()` as an expression statement is unusual but legal
        if (!(check(TokenType::Const) && (checkAt(1, TokenType::LeftBracket) || checkAt(1, TokenType::LeftBrace)))) {
            return parseVariableDeclaration(true);
        }
    }
    if (looksLikeLocalFunction()) {
        return parseLocalFunction();
    }

    auto expr = parseExpression();
    consume(TokenType::Semicolon, "Expected ';' after expression");
    return std::make_unique<ExpressionStmt>(std::move(expr), loc);
}

std::unique_ptr<VariableDeclarationStmt> Parser::parseVariableDeclaration(bool requireSemicolon) {
    auto decl = std::make_unique<VariableDeclarationStmt>(peek().location);

    if (matchContextual("late")) decl->isLate = true;
    if (match(TokenType::Final)) {
        decl->isFinal = true;
    } else if (match(TokenType::Const)) {
        decl->isConst = true;
    } else {
        match(TokenType::Var);
    }

    bool untyped = check(TokenType::Identifier) &&
                   (checkAt(1, TokenType::Equals) || checkAt(1, TokenType::Semicolon) ||
                    checkAt(1, TokenType::Comma) || checkAt(1, TokenType::In));
    if (!untyped) {
        decl->type = parseType();
    }

    do {
        VariableDeclarator declarator;
        declarator.location = peek().location;
        declarator.name = consumeIdentifier("Expected variable name");
        if (match(TokenType::Equals)) {
            declarator.initializer = parseExpression();
        }
        decl->variables.push_back(std::move(declarator));
    } while (match(TokenType::Comma));

    if (requireSemicolon) {
        consume(TokenType::Semicolon, "Expected ';' after variable declaration");
    }
    return decl;
}

StmtPtr Parser::parseLocalFunction() {
    auto loc = peek().location;
    std::optional<TypeAnnotation> returnType;

    size_t index = current;
    if (skipType(index) && tokenAt(index).type == TokenType::Identifier) {
        returnType = parseType();
    }

    std::string name = consumeIdentifier("Expected function name");
    auto function = std::make_unique<FunctionExpr>(loc);
    if (check(TokenType::LeftAngle)) {
        for (const auto& parameter : parseTypeParameters()) {
            function->typeParameters.push_back(parameter.name);
        }
    }
    function->parameters = parseFormalParameters();
    parseFunctionBody(function->blockBody, function->expressionBody, function->isAsync, function->isGenerator, false);
    if (function->expressionBody) {
        consume(TokenType::Semicolon, "Expected ';' after local function");
    }

    auto stmt = std::make_unique<LocalFunctionStmt>(name, std::move(function), loc);
    stmt->returnType = std::move(returnType);
    return stmt;
}

StmtPtr Parser::parseIf() {
    auto loc = previous().location;
    consume(TokenType::LeftParen, "Expected '(' after if");
    auto condition = parseExpression();
    consume(TokenType::RightParen, "Expected ')' after if condition");

    auto thenBranch = parseStatement();
    StmtPtr elseBranch;
    if (match(TokenType::Else)) {
        elseBranch = parseStatement();
    }
    return std::make_unique<IfStmt>(std::move(condition), std::move(thenBranch), std::move(elseBranch), loc);
}

StmtPtr Parser::parseFor(bool isAwait) {
    auto loc = previous().location;
    consume(TokenType::LeftParen, "Expected '(' after for");

    // for (final x in xs), for (var x in xs), for (Type x in xs), for (x in xs)
    size_t index = current;
    bool hasModifier = tokenAt(index).type == TokenType::Final || tokenAt(index).type == TokenType::Var;
    if (hasModifier) index++;
    size_t afterType = index;
    bool isForEach = false;
    if (tokenAt(index).type == TokenType::Identifier && tokenAt(index + 1).type == TokenType::In) {
        isForEach = true;
    } else if (skipType(afterType) && tokenAt(afterType).type == TokenType::Identifier &&
               tokenAt(afterType + 1).type == TokenType::In) {
        isForEach = true;
    }

    if (isForEach) {
        auto stmt = std::make_unique<ForEachStmt>(loc);
        stmt->isAwait = isAwait;
        if (match(TokenType::Final)) {
            stmt->isFinal = true;
        } else {
            match(TokenType::Var);
        }
        if (!(check(TokenType::Identifier) && checkAt(1, TokenType::In))) {
            stmt->variableType = parseType();
        }
        stmt->variableName = consumeIdentifier("Expected loop variable");
        consume(TokenType::In, "Expected 'in'");
        stmt->iterable = parseExpression();
        consume(TokenType::RightParen, "Expected ')' after for-in");
        stmt->body = parseStatement();
        return stmt;
    }

    if (isAwait) {
        error("'await for' requires a for-in loop");
    }

    auto stmt = std::make_unique<ForStmt>(loc);
    if (!check(TokenType::Semicolon)) {
        if (check(TokenType::Final) || check(TokenType::Var) || check(TokenType::Const) || looksLikeTypedVariable()) {
            stmt->initializer = parseVariableDeclaration(false);
        } else {
            auto initLoc = peek().location;
            stmt->initializer = std::make_unique<ExpressionStmt>(parseExpression(), initLoc);
        }
    }
    consume(TokenType::Semicolon, "Expected ';' after for initializer");

    if (!check(TokenType::Semicolon)) {
        stmt->condition = parseExpression();
    }
    consume(TokenType::Semicolon, "Expected ';' after for condition");

    while (!check(TokenType::RightParen) && !isAtEnd()) {
        stmt->updaters.push_back(parseExpression());
        if (!match(TokenType::Comma)) break;
    }
    consume(TokenType::RightParen, "Expected ')' after for clauses");

    stmt->body = parseStatement();
    return stmt;
}

StmtPtr Parser::parseWhile() {
    auto loc = previous().location;
    consume(TokenType::LeftParen, "Expected '(' after while");
    auto condition = parseExpression();
    consume(TokenType::RightParen, "Expected ')' after while condition");
    auto body = parseStatement();
    return std::make_unique<WhileStmt>(std::move(condition), std::move(body), loc);
}

StmtPtr Parser::parseDoWhile() {
    auto loc = previous().location;
    auto body = parseStatement();
    consume(TokenType::While, "Expected 'while' after do body");
    consume(TokenType::LeftParen, "Expected '(' after while");
    auto condition = parseExpression();
    consume(TokenType::RightParen, "Expected ')' after do-while condition");
    consume(TokenType::Semicolon, "Expected ';' after do-while");
    return std::make_unique<DoWhileStmt>(std::move(body), std::move(condition), loc);
}

StmtPtr Parser::parseSwitch() {
    auto loc = previous().location;
    consume(TokenType::LeftParen, "Expected '(' after switch");
    auto subject = parseExpression();
    consume(TokenType::RightParen, "Expected ')' after switch subject");

    auto stmt = std::make_unique<SwitchStmt>(std::move(subject), loc);
    consume(TokenType::LeftBrace, "Expected '{' to open switch body");

    while (!check(TokenType::RightBrace) && !isAtEnd()) {
        SwitchCase switchCase;
        // Consecutive labels share one body
        while (check(TokenType::Case) || check(TokenType::Default)) {
            if (match(TokenType::Default)) {
                switchCase.isDefault = true;
            } else {
                advance();
                switchCase.labels.push_back(parseExpression());
                if (checkContextual("when")) {
                    unsupported("Guarded switch cases are not supported");
                }
            }
            consume(TokenType::Colon, "Expected ':' after case label");
        }
        if (switchCase.labels.empty() && !switchCase.isDefault) {
            error("Expected 'case' or 'default'");
        }
        while (!check(TokenType::Case) && !check(TokenType::Default) &&
               !check(TokenType::RightBrace) && !isAtEnd()) {
            switchCase.statements.push_back(parseStatement());
        }
        stmt->cases.push_back(std::move(switchCase));
    }

    consume(TokenType::RightBrace, "Expected '}' to close switch body");
    return stmt;
}

StmtPtr Parser::parseTry() {
    auto stmt = std::make_unique<TryStmt>(previous().location);
    stmt->body = parseBlock();

    while (checkContextual("on") || check(TokenType::Catch)) {
        CatchClause clause;
        if (matchContextual("on")) {
            clause.exceptionType = parseType();
        }
        if (match(TokenType::Catch)) {
            consume(TokenType::LeftParen, "Expected '(' after catch");
            clause.exceptionName = consumeIdentifier("Expected exception variable");
            if (match(TokenType::Comma)) {
                clause.stackTraceName = consumeIdentifier("Expected stack trace variable");
            }
            consume(TokenType::RightParen, "Expected ')' after catch variables");
        }
        clause.body = parseBlock();
        stmt->catches.push_back(std::move(clause));
    }

    if (match(TokenType::Finally)) {
        stmt->finallyBlock = parseBlock();
    }
    if (stmt->catches.empty() && !stmt->finallyBlock) {
        error("Expected 'on', 'catch' or 'finally' after try block");
    }
    return stmt;
}

StmtPtr Parser::parseReturn() {
    auto loc = previous().location;
    ExprPtr value;
    if (!check(TokenType::Semicolon)) {
        value = parseExpression();
    }
    consume(TokenType::Semicolon, "Expected ';' after return");
    return std::make_unique<ReturnStmt>(std::move(value), loc);
}

//==============================================================================
// Expressions
//==============================================================================

ExprPtr Parser::parseExpression() {
    auto loc = peek().location;

    if (match(TokenType::Throw)) {
        return std::make_unique<ThrowExpr>(parseExpression(), loc);
    }

    auto expr = parseConditional();

    if (atCascade()) {
        expr = parseCascade(std::move(expr));
    }

    if (check(TokenType::Equals) || check(TokenType::PlusEquals) || check(TokenType::MinusEquals) ||
        check(TokenType::StarEquals) || check(TokenType::SlashEquals) || check(TokenType::PercentEquals) ||
        check(TokenType::TildeSlashEquals) || check(TokenType::QuestionQuestionEquals)) {
        std::string op = advance().lexeme;
        auto value = parseExpression();  // Right-associative
        return std::make_unique<AssignmentExpr>(std::move(expr), op, std::move(value), loc);
    }

    return expr;
}

ExprPtr Parser::parseCascade(ExprPtr target) {
    auto targetLoc = target->location;
    auto cascade = std::make_unique<CascadeExpr>(std::move(target), targetLoc);

    while (atCascade()) {
        auto loc = peek().location;
        if (match(TokenType::QuestionDot)) {
            advance();
            if (!cascade->sections.empty()) {
                error("'?..' is only allowed on the first cascade section");
            }
            cascade->isNullAware = true;
        } else {
            advance();
        }

        ExprPtr section = std::make_unique<CascadeReceiverExpr>(loc);
        if (check(TokenType::LeftBracket)) {
            advance();
            auto index = parseExpression();
            consume(TokenType::RightBracket, "Expected ']' after index");
            section = std::make_unique<IndexExpr>(std::move(section), std::move(index), false, loc);
        } else {
            std::string name = consumeIdentifier("Expected member name after '..'");
            if (check(TokenType::LeftParen) || (check(TokenType::LeftAngle) && looksLikeGenericCall())) {
                auto call = std::make_unique<MethodInvocationExpr>(std::move(section), name, loc);
                if (check(TokenType::LeftAngle)) {
                    call->typeArguments = parseTypeArguments();
                }
                call->arguments = parseArguments();
                section = std::move(call);
            } else {
                section = std::make_unique<PropertyAccessExpr>(std::move(section), name, false, loc);
            }
        }
        section = parseSelectors(std::move(section));

        if (check(TokenType::Equals) || check(TokenType::PlusEquals) || check(TokenType::MinusEquals) ||
            check(TokenType::StarEquals) || check(TokenType::SlashEquals) || check(TokenType::PercentEquals) ||
            check(TokenType::TildeSlashEquals) || check(TokenType::QuestionQuestionEquals)) {
            std::string op = advance().lexeme;
            // The assigned value cannot itself cascade; a following `..` starts the next section
            auto value = parseConditional();
            section = std::make_unique<AssignmentExpr>(std::move(section), op, std::move(value), loc);
        }
        cascade->sections.push_back(std::move(section));
    }
    return cascade;
}

ExprPtr Parser::parseConditional() {
    auto loc = peek().location;
    auto condition = parseIfNull();

    if (match(TokenType::Question)) {
        auto thenExpr = parseExpression();
        consume(TokenType::Colon, "Expected ':' in conditional expression");
        auto elseExpr = parseExpression();
        return std::make_unique<ConditionalExpr>(std::move(condition), std::move(thenExpr), std::move(elseExpr), loc);
    }
    return condition;
}

ExprPtr Parser::parseIfNull() {
    auto expr = parseLogicalOr();
    while (check(TokenType::QuestionQuestion)) {
        auto loc = advance().location;
        expr = std::make_unique<BinaryExpr>(std::move(expr), "??", parseLogicalOr(), loc);
    }
    return expr;
}

ExprPtr Parser::parseLogicalOr() {
    auto expr = parseLogicalAnd();
    while (check(TokenType::LogicalOr)) {
        auto loc = advance().location;
        expr = std::make_unique<BinaryExpr>(std::move(expr), "||", parseLogicalAnd(), loc);
    }
    return expr;
}

ExprPtr Parser::parseLogicalAnd() {
    auto expr = parseEquality();
    while (check(TokenType::LogicalAnd)) {
        auto loc = advance().location;
        expr = std::make_unique<BinaryExpr>(std::move(expr), "&&", parseEquality(), loc);
    }
    return expr;
}

ExprPtr Parser::parseEquality() {
    auto expr = parseRelational();
    while (check(TokenType::DoubleEquals) || check(TokenType::NotEquals)) {
        const Token& op = advance();
        expr = std::make_unique<BinaryExpr>(std::move(expr), op.lexeme, parseRelational(), op.location);
    }
    return expr;
}

ExprPtr Parser::parseRelational() {
    auto expr = parseBitwiseOr();

    while (true) {
        if (checkContextual("as")) {
            auto loc = advance().location;
            expr = std::make_unique<AsExpr>(std::move(expr), parseType(), loc);
        } else if (check(TokenType::Is)) {
            auto loc = advance().location;
            bool negated = match(TokenType::Exclamation);
            expr = std::make_unique<IsExpr>(std::move(expr), parseType(), negated, loc);
        } else if (check(TokenType::LeftAngle) || check(TokenType::RightAngle) ||
                   check(TokenType::LessEquals) || check(TokenType::GreaterEquals)) {
            const Token& op = advance();
            expr = std::make_unique<BinaryExpr>(std::move(expr), op.lexeme, parseBitwiseOr(), op.location);
        } else {
            break;
        }
    }
    return expr;
}

ExprPtr Parser::parseBitwiseOr() {
    auto expr = parseBitwiseXor();
    while (check(TokenType::Pipe)) {
        auto loc = advance().location;
        expr = std::make_unique<BinaryExpr>(std::move(expr), "|", parseBitwiseXor(), loc);
    }
    return expr;
}

ExprPtr Parser::parseBitwiseXor() {
    auto expr = parseBitwiseAnd();
    while (check(TokenType::Caret)) {
        auto loc = advance().location;
        expr = std::make_unique<BinaryExpr>(std::move(expr), "^", parseBitwiseAnd(), loc);
    }
    return expr;
}

ExprPtr Parser::parseBitwiseAnd() {
    auto expr = parseAdditive();
    while (check(TokenType::Ampersand)) {
        auto loc = advance().location;
        expr = std::make_unique<BinaryExpr>(std::move(expr), "&", parseAdditive(), loc);
    }
    return expr;
}

ExprPtr Parser::parseAdditive() {
    auto expr = parseMultiplicative();
    while (check(TokenType::Plus) || check(TokenType::Minus)) {
        const Token& op = advance();
        expr = std::make_unique<BinaryExpr>(std::move(expr), op.lexeme, parseMultiplicative(), op.location);
    }
    return expr;
}

ExprPtr Parser::parseMultiplicative() {
    auto expr = parseUnary();
    while (check(TokenType::Star) || check(TokenType::Slash) ||
           check(TokenType::TildeSlash) || check(TokenType::Percent)) {
        const Token& op = advance();
        expr = std::make_unique<BinaryExpr>(std::move(expr), op.lexeme, parseUnary(), op.location);
    }
    return expr;
}

ExprPtr Parser::parseUnary() {
    auto loc = peek().location;

    if (check(TokenType::Minus) || check(TokenType::Exclamation) || check(TokenType::Tilde) ||
        check(TokenType::PlusPlus) || check(TokenType::MinusMinus)) {
        std::string op = advance().lexeme;
        return std::make_unique<PrefixExpr>(op, parseUnary(), loc);
    }

    if (checkContextual("await") && canStartExpression(peek(1))) {
        advance();
        return std::make_unique<AwaitExpr>(parseUnary(), loc);
    }

    return parsePostfix();
}

ExprPtr Parser::parsePostfix() {
    auto expr = parseSelectors(parsePrimary());

    while (check(TokenType::PlusPlus) || check(TokenType::MinusMinus)) {
        const Token& op = advance();
        expr = std::make_unique<PostfixExpr>(std::move(expr), op.lexeme, op.location);
    }
    return expr;
}

ExprPtr Parser::parseSelectors(ExprPtr expr) {
    while (true) {
        auto loc = peek().location;

        if (check(TokenType::Dot) || (check(TokenType::QuestionDot) && !checkAt(1, TokenType::Dot))) {
            bool nullAware = advance().type == TokenType::QuestionDot;
            std::string name = consumeIdentifier("Expected member name after '.'");

            if (check(TokenType::LeftParen) || (check(TokenType::LeftAngle) && looksLikeGenericCall())) {
                auto call = std::make_unique<MethodInvocationExpr>(std::move(expr), name, loc);
                call->isNullAware = nullAware;
                if (check(TokenType::LeftAngle)) {
                    call->typeArguments = parseTypeArguments();
                }
                call->arguments = parseArguments();
                expr = std::move(call);
            } else {
                expr = std::make_unique<PropertyAccessExpr>(std::move(expr), name, nullAware, loc);
            }
        } else if (check(TokenType::LeftParen)) {
            auto args = parseArguments();
            expr = std::make_unique<FunctionCallExpr>(std::move(expr), std::move(args), loc);
        } else if (check(TokenType::LeftBracket) || looksLikeNullAwareIndex()) {
            bool nullAware = match(TokenType::Question);
            advance();
            auto index = parseExpression();
            consume(TokenType::RightBracket, "Expected ']' after index");
            expr = std::make_unique<IndexExpr>(std::move(expr), std::move(index), nullAware, loc);
        } else if (check(TokenType::Exclamation) && !checkAt(1, TokenType::Equals)) {
            advance();
            expr = std::make_unique<PostfixExpr>(std::move(expr), "!", loc);
        } else {
            break;
        }
    }
    return expr;
}

ExprPtr Parser::parsePrimary() {
    const Token& token = peek();
    auto loc = token.location;

    switch (token.type) {
        case TokenType::IntegerLiteral:
            advance();
            return std::make_unique<IntegerLiteralExpr>(token.lexeme, loc);
        case TokenType::DoubleLiteral:
            advance();
            return std::make_unique<DoubleLiteralExpr>(token.lexeme, loc);
        case TokenType::BoolLiteral:
            advance();
            return std::make_unique<BoolLiteralExpr>(token.lexeme == "true", loc);
        case TokenType::NullLiteral:
            advance();
            return std::make_unique<NullLiteralExpr>(loc);
        case TokenType::StringLiteral:
            return parseStringLiteral();
        case TokenType::This:
            advance();
            return std::make_unique<ThisExpr>(loc);
        case TokenType::Super:
            advance();
            return std::make_unique<SuperExpr>(loc);
        case TokenType::New:
            advance();
            return parseInstanceCreation(false);
        case TokenType::Const:
            advance();
            if (check(TokenType::LeftBracket)) {
                return parseListLiteral(true, {});
            }
            if (check(TokenType::LeftBrace)) {
                return parseSetOrMapLiteral(true, {});
            }
            if (check(TokenType::LeftAngle)) {
                auto typeArguments = parseTypeArguments();
                if (check(TokenType::LeftBracket)) {
                    return parseListLiteral(true, std::move(typeArguments));
                }
                return parseSetOrMapLiteral(true, std::move(typeArguments));
            }
            return parseInstanceCreation(true);
        case TokenType::LeftAngle: {
            auto typeArguments = parseTypeArguments();
            if (check(TokenType::LeftBracket)) {
                return parseListLiteral(false, std::move(typeArguments));
            }
            if (check(TokenType::LeftBrace)) {
                return parseSetOrMapLiteral(false, std::move(typeArguments));
            }
            // <T>(T x) => x
            if (check(TokenType::LeftParen)) {
                auto function = parseFunctionExpression();
                auto& closure = static_cast<FunctionExpr&>(*function);
                for (const auto& argument : typeArguments) {
                    closure.typeParameters.push_back(argument.toString());
                }
                return function;
            }
            error("Expected collection literal after type arguments");
        }
        case TokenType::LeftBracket:
            return parseListLiteral(false, {});
        case TokenType::LeftBrace:
            return parseSetOrMapLiteral(false, {});
        case TokenType::LeftParen: {
            if (looksLikeFunctionExpression()) {
                return parseFunctionExpression();
            }
            advance();
            auto inner = parseExpression();
            consume(TokenType::RightParen, "Expected ')' after expression");
            return std::make_unique<ParenthesizedExpr>(std::move(inner), loc);
        }
        case TokenType::Hash:
            unsupported("Symbol literals are not supported");
        case TokenType::Switch:
            unsupported("Switch expressions are not supported");
        case TokenType::Identifier: {
            std::string name = advance().lexeme;

            if (check(TokenType::LeftParen)) {
                auto call = std::make_unique<MethodInvocationExpr>(nullptr, name, loc);
                call->arguments = parseArguments();
                return call;
            }

            if (check(TokenType::LeftAngle) && looksLikeGenericCall()) {
                auto typeArguments = parseTypeArguments();
                // Type<Args>.named(...)
                if (check(TokenType::Dot)) {
                    advance();
                    TypeAnnotation type;
                    type.name = name;
                    type.arguments = std::move(typeArguments);
                    auto creation = std::make_unique<InstanceCreationExpr>(
                        type, consumeIdentifier("Expected constructor name"), false, loc);
                    creation->arguments = parseArguments();
                    return creation;
                }
                auto call = std::make_unique<MethodInvocationExpr>(nullptr, name, loc);
                call->typeArguments = std::move(typeArguments);
                call->arguments = parseArguments();
                return call;
            }

            return std::make_unique<IdentifierExpr>(name, loc);
        }
        default:
            break;
    }

    error("Expected expression");
}

ExprPtr Parser::parseStringLiteral() {
    auto loc = peek().location;
    std::vector<Lexer::StringPart> parts;

    // Adjacent string literals concatenate
    while (check(TokenType::StringLiteral)) {
        const Token& token = advance();
        parts.insert(parts.end(), token.stringParts.begin(), token.stringParts.end());
    }

    bool interpolated = false;
    for (const auto& part : parts) {
        if (part.isInterpolation) {
            interpolated = true;
            break;
        }
    }

    if (!interpolated) {
        std::string value;
        for (const auto& part : parts) {
            value += part.text;
        }
        return std::make_unique<StringLiteralExpr>(value, loc);
    }

    std::vector<ExprPtr> expressions;
    std::string pending;
    auto flushText = [&]() {
        if (!pending.empty()) {
            expressions.push_back(std::make_unique<StringLiteralExpr>(pending, loc));
            pending.clear();
        }
    };

    for (const auto& part : parts) {
        if (!part.isInterpolation) {
            pending += part.text;
            continue;
        }
        flushText();

        Lexer::Lexer fragmentLexer(part.text, part.location, errorReporter);
        auto fragmentTokens = fragmentLexer.tokenize();
        Parser fragmentParser(fragmentTokens, filename, errorReporter);
        expressions.push_back(fragmentParser.parseStandaloneExpression());
    }
    flushText();

    return std::make_unique<StringInterpolationExpr>(std::move(expressions), loc);
}

ExprPtr Parser::parseInstanceCreation(bool isConst) {
    auto loc = previous().location;

    // Up to three dotted names: Type, Type.ctor, prefix.Type, prefix.Type.ctor
    std::vector<std::string> names;
    names.push_back(consumeIdentifier("Expected type name"));
    std::vector<TypeAnnotation> typeArguments;
    std::string constructorName;

    if (check(TokenType::LeftAngle)) {
        typeArguments = parseTypeArguments();
    }
    while (match(TokenType::Dot)) {
        names.push_back(consumeIdentifier("Expected name after '.'"));
        if (check(TokenType::LeftAngle)) {
            typeArguments = parseTypeArguments();
        }
    }

    TypeAnnotation type;
    if (names.size() >= 3) {
        type.name = names[0] + "." + names[1];
        constructorName = names[2];
    } else if (names.size() == 2) {
        bool prefixed = std::islower(static_cast<unsigned char>(names[0][0])) != 0;
        if (prefixed) {
            type.name = names[0] + "." + names[1];
        } else {
            type.name = names[0];
            constructorName = names[1];
        }
    } else {
        type.name = names[0];
    }
    type.arguments = std::move(typeArguments);

    auto creation = std::make_unique<InstanceCreationExpr>(type, constructorName, isConst, loc);
    creation->arguments = parseArguments();
    return creation;
}

ExprPtr Parser::parseListLiteral(bool isConst, std::vector<TypeAnnotation> typeArguments) {
    auto list = std::make_unique<ListLiteralExpr>(isConst, peek().location);
    if (!typeArguments.empty()) {
        list->elementType = typeArguments.front();
    }

    consume(TokenType::LeftBracket, "Expected '['");
    while (!check(TokenType::RightBracket) && !isAtEnd()) {
        list->elements.push_back(parseCollectionElement(false));
        if (!match(TokenType::Comma)) break;
    }
    consume(TokenType::RightBracket, "Expected ']' after list elements");
    return list;
}

ExprPtr Parser::parseSetOrMapLiteral(bool isConst, std::vector<TypeAnnotation> typeArguments) {
    auto literal = std::make_unique<SetOrMapLiteralExpr>(isConst, peek().location);
    literal->typeArguments = std::move(typeArguments);

    consume(TokenType::LeftBrace, "Expected '{'");
    while (!check(TokenType::RightBrace) && !isAtEnd()) {
        literal->elements.push_back(parseCollectionElement(true));
        if (!match(TokenType::Comma)) break;
    }
    consume(TokenType::RightBrace, "Expected '}' after collection elements");
    return literal;
}

ExprPtr Parser::parseCollectionElement(bool allowEntries) {
    auto loc = peek().location;

    if (check(TokenType::Ellipsis) || check(TokenType::EllipsisQuestion)) {
        bool nullAware = advance().type == TokenType::EllipsisQuestion;
        return std::make_unique<SpreadElementExpr>(parseExpression(), nullAware, loc);
    }

    if (match(TokenType::If)) {
        consume(TokenType::LeftParen, "Expected '(' after if");
        auto condition = parseExpression();
        consume(TokenType::RightParen, "Expected ')' after if condition");
        auto thenElement = parseCollectionElement(allowEntries);
        ExprPtr elseElement;
        if (match(TokenType::Else)) {
            elseElement = parseCollectionElement(allowEntries);
        }
        return std::make_unique<IfElementExpr>(std::move(condition), std::move(thenElement),
                                               std::move(elseElement), loc);
    }

    if (match(TokenType::For)) {
        auto element = std::make_unique<ForElementExpr>(loc);
        consume(TokenType::LeftParen, "Expected '(' after for");
        if (!match(TokenType::Final)) {
            match(TokenType::Var);
        }
        if (!(check(TokenType::Identifier) && checkAt(1, TokenType::In))) {
            element->variableType = parseType();
        }
        element->variableName = consumeIdentifier("Expected loop variable");
        if (!check(TokenType::In)) {
            unsupported("Only for-in collection elements are supported");
        }
        advance();
        element->iterable = parseExpression();
        consume(TokenType::RightParen, "Expected ')' after for-in");
        element->body = parseCollectionElement(allowEntries);
        return element;
    }

    auto expr = parseExpression();
    if (allowEntries && match(TokenType::Colon)) {
        auto value = parseExpression();
        return std::make_unique<MapEntryExpr>(std::move(expr), std::move(value), loc);
    }
    return expr;
}

ExprPtr Parser::parseFunctionExpression() {
    auto function = std::make_unique<FunctionExpr>(peek().location);
    if (check(TokenType::LeftAngle)) {
        for (const auto& parameter : parseTypeParameters()) {
            function->typeParameters.push_back(parameter.name);
        }
    }
    function->parameters = parseFormalParameters();
    parseFunctionBody(function->blockBody, function->expressionBody, function->isAsync, function->isGenerator, false);
    return function;
}

std::vector<Argument> Parser::parseArguments() {
    std::vector<Argument> arguments;
    consume(TokenType::LeftParen, "Expected '('");

    while (!check(TokenType::RightParen) && !isAtEnd()) {
        Argument argument;
        if (check(TokenType::Identifier) && checkAt(1, TokenType::Colon)) {
            argument.name = advance().lexeme;
            advance();
        }
        argument.value = parseExpression();
        arguments.push_back(std::move(argument));
        if (!match(TokenType::Comma)) break;
    }

    consume(TokenType::RightParen, "Expected ')' after arguments");
    return arguments;
}

} // namespace Parser
} // namespace FJS
