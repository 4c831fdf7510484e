#pragma once
#include <string>
#include <vector>
#include "Token.h"
#include "../Common/Error.h"

namespace FJS {
namespace Lexer {

class Lexer {
private:
    std::string source;
    std::string filename;
    size_t position;
    size_t line;
    size_t column;
    size_t basePosition; // Offset of `source` inside the enclosing file
    Common::ErrorReporter& errorReporter;

    char current() const;
    char peek(size_t offset = 1) const;
    char advance();
    bool isAtEnd() const;
    bool match(char expected);

    bool skipWhitespace();
    void skipLineComment();
    bool skipBlockComment();

    Token makeToken(TokenType type, const std::string& lexeme);
    Token makeToken(TokenType type, const std::string& lexeme, const Common::SourceLocation& loc);

    Token lexIdentifier();
    Token lexNumber();
    Token lexString(bool raw, const Common::SourceLocation& startLoc, size_t startPos);
    Token lexOperator();

    bool scanEscape(std::string& text);
    bool scanBracedInterpolation(std::string& expression);

    bool isDigit(char c) const;
    bool isHexDigit(char c) const;
    bool isAlpha(char c) const;
    bool isAlphaNumeric(char c) const;

public:
    Lexer(const std::string& src, const std::string& file, Common::ErrorReporter& reporter);

    // Lexes a fragment (e.g. an interpolated expression) whose first character
    // sits at `start` in the enclosing file
    Lexer(const std::string& src, const Common::SourceLocation& start, Common::ErrorReporter& reporter);

    Token nextToken();
    std::vector<Token> tokenize();

    Common::SourceLocation getCurrentLocation() const;
};

} // namespace Lexer
} // namespace FJS
