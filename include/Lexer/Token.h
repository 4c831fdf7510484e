#pragma once
#include <string>
#include <vector>
#include "TokenType.h"
#include "../Common/SourceLocation.h"

namespace FJS {
namespace Lexer {

// Piece of a string literal: either literal text (escapes already applied)
// or the source text of an interpolated expression (`$name` / `${expr}`)
struct StringPart {
    bool isInterpolation;
    std::string text;
    Common::SourceLocation location;
};

class Token {
public:
    TokenType type;
    std::string lexeme;  // The actual text from source
    Common::SourceLocation location;

    // For string literals
    std::vector<StringPart> stringParts;
    bool isRawString;

    Token()
        : type(TokenType::Invalid), lexeme(""), isRawString(false) {}

    Token(TokenType t, const std::string& lex, const Common::SourceLocation& loc)
        : type(t), lexeme(lex), location(loc), isRawString(false) {}

    bool is(TokenType t) const { return type == t; }
    bool isNot(TokenType t) const { return type != t; }
    bool isOneOf(TokenType t1, TokenType t2) const { return is(t1) || is(t2); }

    template<typename... Args>
    bool isOneOf(TokenType t1, TokenType t2, Args... args) const {
        return is(t1) || isOneOf(t2, args...);
    }

    // Identifier token with the given lexeme (built-in identifiers like `get`)
    bool isContextual(const std::string& word) const {
        return type == TokenType::Identifier && lexeme == word;
    }

    bool isKeyword() const;
    bool isOperator() const;
    bool isLiteral() const;

    // Concatenated literal text; only meaningful when there is no interpolation
    std::string literalText() const;
    bool hasInterpolation() const;

    std::string toString() const;
};

} // namespace Lexer
} // namespace FJS
