#include "Lexer/Lexer.h"
#include <cctype>

namespace FJS {
namespace Lexer {

Lexer::Lexer(const std::string& src, const std::string& file, Common::ErrorReporter& reporter)
    : source(src), filename(file), position(0), line(1), column(1), basePosition(0), errorReporter(reporter) {}

Lexer::Lexer(const std::string& src, const Common::SourceLocation& start, Common::ErrorReporter& reporter)
    : source(src), filename(start.filename), position(0), line(start.line), column(start.column),
      basePosition(start.position), errorReporter(reporter) {}

char Lexer::current() const {
    if (isAtEnd()) return '\0';
    return source[position];
}

char Lexer::peek(size_t offset) const {
    if (position + offset >= source.length()) return '\0';
    return source[position + offset];
}

char Lexer::advance() {
    if (isAtEnd()) return '\0';
    char c = source[position++];
    if (c == '\n') {
        line++;
        column = 1;
    } else {
        column++;
    }
    return c;
}

bool Lexer::isAtEnd() const {
    return position >= source.length();
}

bool Lexer::match(char expected) {
    if (isAtEnd() || current() != expected) return false;
    advance();
    return true;
}

bool Lexer::skipWhitespace() {
    while (!isAtEnd()) {
        char c = current();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f') {
            advance();
        } else if (c == '/' && peek() == '/') {
            skipLineComment();
        } else if (c == '/' && peek() == '*') {
            if (!skipBlockComment()) {
                return false;
            }
        } else if (c == '#' && peek() == '!' && position == 0) {
            // Script tag
            skipLineComment();
        } else {
            break;
        }
    }
    return true;
}

void Lexer::skipLineComment() {
    while (!isAtEnd() && current() != '\n') {
        advance();
    }
}

bool Lexer::skipBlockComment() {
    auto startLoc = getCurrentLocation();
    advance();
    advance();

    // Block comments nest
    int depth = 1;
    while (!isAtEnd() && depth > 0) {
        if (current() == '/' && peek() == '*') {
            advance();
            advance();
            depth++;
        } else if (current() == '*' && peek() == '/') {
            advance();
            advance();
            depth--;
        } else {
            advance();
        }
    }

    if (depth > 0) {
        errorReporter.reportError(
            Common::ErrorCode::UnterminatedComment,
            "Unterminated block comment",
            startLoc
        );
        return false;
    }
    return true;
}

Common::SourceLocation Lexer::getCurrentLocation() const {
    return Common::SourceLocation(filename, line, column, basePosition + position);
}

Token Lexer::makeToken(TokenType type, const std::string& lexeme) {
    return Token(type, lexeme, getCurrentLocation());
}

Token Lexer::makeToken(TokenType type, const std::string& lexeme, const Common::SourceLocation& loc) {
    return Token(type, lexeme, loc);
}

bool Lexer::isDigit(char c) const {
    return c >= '0' && c <= '9';
}

bool Lexer::isHexDigit(char c) const {
    return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool Lexer::isAlpha(char c) const {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
}

bool Lexer::isAlphaNumeric(char c) const {
    return isAlpha(c) || isDigit(c);
}

Token Lexer::lexIdentifier() {
    auto startLoc = getCurrentLocation();
    std::string text;

    while (!isAtEnd() && isAlphaNumeric(current())) {
        text += advance();
    }

    return makeToken(getKeywordType(text), text, startLoc);
}

Token Lexer::lexNumber() {
    auto startLoc = getCurrentLocation();
    std::string text;

    if (current() == '0' && (peek() == 'x' || peek() == 'X')) {
        text += advance();
        text += advance();
        if (!isHexDigit(current())) {
            errorReporter.reportError(
                Common::ErrorCode::InvalidNumberLiteral,
                "Invalid hexadecimal literal: " + text,
                startLoc
            );
            return makeToken(TokenType::Invalid, text, startLoc);
        }
        while (!isAtEnd() && isHexDigit(current())) {
            text += advance();
        }
        return makeToken(TokenType::IntegerLiteral, text, startLoc);
    }

    bool isDouble = false;
    while (!isAtEnd() && isDigit(current())) {
        text += advance();
    }

    // Fraction only when a digit follows the dot, so `1.toString()` stays an int
    if (current() == '.' && isDigit(peek())) {
        isDouble = true;
        text += advance();
        while (!isAtEnd() && isDigit(current())) {
            text += advance();
        }
    }

    if (current() == 'e' || current() == 'E') {
        size_t signOffset = (peek() == '+' || peek() == '-') ? 2 : 1;
        if (isDigit(peek(signOffset))) {
            isDouble = true;
            for (size_t i = 0; i < signOffset; ++i) {
                text += advance();
            }
            while (!isAtEnd() && isDigit(current())) {
                text += advance();
            }
        }
    }

    return makeToken(isDouble ? TokenType::DoubleLiteral : TokenType::IntegerLiteral, text, startLoc);
}

static void appendUtf8(std::string& out, unsigned long codePoint) {
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

bool Lexer::scanEscape(std::string& text) {
    advance(); // consume backslash
    if (isAtEnd()) {
        return false;
    }

    char escaped = advance();
    switch (escaped) {
        case 'n': text += '\n'; break;
        case 't': text += '\t'; break;
        case 'r': text += '\r'; break;
        case 'b': text += '\b'; break;
        case 'f': text += '\f'; break;
        case 'v': text += '\v'; break;
        case 'x': {
            std::string hex;
            while (hex.size() < 2 && isHexDigit(current())) {
                hex += advance();
            }
            if (hex.size() != 2) {
                return false;
            }
            appendUtf8(text, std::stoul(hex, nullptr, 16));
            break;
        }
        case 'u': {
            std::string hex;
            if (match('{')) {
                while (!isAtEnd() && isHexDigit(current()) && hex.size() < 6) {
                    hex += advance();
                }
                if (!match('}') || hex.empty()) {
                    return false;
                }
            } else {
                while (hex.size() < 4 && isHexDigit(current())) {
                    hex += advance();
                }
                if (hex.size() != 4) {
                    return false;
                }
            }
            appendUtf8(text, std::stoul(hex, nullptr, 16));
            break;
        }
        default:
            // \\ \' \" \$ and any other character stand for themselves
            text += escaped;
            break;
    }
    return true;
}

bool Lexer::scanBracedInterpolation(std::string& expression) {
    advance(); // $
    advance(); // {

    int depth = 1;
    while (!isAtEnd()) {
        char c = current();
        if (c == '{') {
            depth++;
        } else if (c == '}') {
            depth--;
            if (depth == 0) {
                advance();
                return true;
            }
        } else if (c == '\'' || c == '"') {
            // Copy a nested string verbatim so its braces are not counted
            char quote = advance();
            expression += quote;
            while (!isAtEnd() && current() != quote) {
                if (current() == '\\') {
                    expression += advance();
                }
                if (current() == '\n') {
                    return false;
                }
                expression += advance();
            }
            if (isAtEnd()) {
                return false;
            }
            expression += advance();
            continue;
        }
        expression += advance();
    }
    return false;
}

Token Lexer::lexString(bool raw, const Common::SourceLocation& startLoc, size_t startPos) {
    char quote = current();
    bool triple = peek(1) == quote && peek(2) == quote;
    advance();
    if (triple) {
        advance();
        advance();
    }

    Token token(TokenType::StringLiteral, "", startLoc);
    token.isRawString = raw;

    std::string text;
    auto textLoc = getCurrentLocation();
    auto flushText = [&]() {
        if (!text.empty()) {
            token.stringParts.push_back(StringPart{false, text, textLoc});
            text.clear();
        }
    };

    while (true) {
        if (isAtEnd()) {
            errorReporter.reportError(
                Common::ErrorCode::UnterminatedString,
                "Unterminated string literal",
                startLoc
            );
            return makeToken(TokenType::Invalid, source.substr(startPos, position - startPos), startLoc);
        }

        char c = current();
        if (!triple && c == '\n') {
            errorReporter.reportError(
                Common::ErrorCode::UnterminatedString,
                "Unterminated string literal",
                startLoc
            );
            return makeToken(TokenType::Invalid, source.substr(startPos, position - startPos), startLoc);
        }

        if (c == quote && (!triple || (peek(1) == quote && peek(2) == quote))) {
            advance();
            if (triple) {
                advance();
                advance();
            }
            break;
        }

        if (!raw && c == '\\') {
            if (!scanEscape(text)) {
                errorReporter.reportError(
                    Common::ErrorCode::UnterminatedString,
                    "Invalid escape sequence in string literal",
                    getCurrentLocation()
                );
                return makeToken(TokenType::Invalid, source.substr(startPos, position - startPos), startLoc);
            }
            continue;
        }

        if (!raw && c == '$' && peek() == '{') {
            flushText();
            auto exprLoc = getCurrentLocation();
            exprLoc.column += 2;
            exprLoc.position += 2;
            std::string expression;
            if (!scanBracedInterpolation(expression)) {
                errorReporter.reportError(
                    Common::ErrorCode::UnterminatedString,
                    "Unterminated string interpolation",
                    exprLoc
                );
                return makeToken(TokenType::Invalid, source.substr(startPos, position - startPos), startLoc);
            }
            token.stringParts.push_back(StringPart{true, expression, exprLoc});
            textLoc = getCurrentLocation();
            continue;
        }

        if (!raw && c == '$' && isAlpha(peek()) && peek() != '$') {
            flushText();
            advance(); // $
            auto exprLoc = getCurrentLocation();
            std::string name;
            while (!isAtEnd() && (isAlphaNumeric(current()) && current() != '$')) {
                name += advance();
            }
            token.stringParts.push_back(StringPart{true, name, exprLoc});
            textLoc = getCurrentLocation();
            continue;
        }

        if (text.empty()) {
            textLoc = getCurrentLocation();
        }
        text += advance();
    }

    flushText();
    if (token.stringParts.empty()) {
        token.stringParts.push_back(StringPart{false, "", startLoc});
    }
    token.lexeme = source.substr(startPos, position - startPos);
    return token;
}

Token Lexer::lexOperator() {
    auto startLoc = getCurrentLocation();
    char c = current();

    switch (c) {
        case '[': advance(); return makeToken(TokenType::LeftBracket, "[", startLoc);
        case ']': advance(); return makeToken(TokenType::RightBracket, "]", startLoc);
        case '{': advance(); return makeToken(TokenType::LeftBrace, "{", startLoc);
        case '}': advance(); return makeToken(TokenType::RightBrace, "}", startLoc);
        case '(': advance(); return makeToken(TokenType::LeftParen, "(", startLoc);
        case ')': advance(); return makeToken(TokenType::RightParen, ")", startLoc);
        case ';': advance(); return makeToken(TokenType::Semicolon, ";", startLoc);
        case ',': advance(); return makeToken(TokenType::Comma, ",", startLoc);
        case ':': advance(); return makeToken(TokenType::Colon, ":", startLoc);
        case '^': advance(); return makeToken(TokenType::Caret, "^", startLoc);
        case '@': advance(); return makeToken(TokenType::At, "@", startLoc);
        case '#': advance(); return makeToken(TokenType::Hash, "#", startLoc);
        case '<':
            advance();
            if (match('=')) return makeToken(TokenType::LessEquals, "<=", startLoc);
            return makeToken(TokenType::LeftAngle, "<", startLoc);
        case '>':
            // `>>` is never produced so nested generics close one bracket at a time
            advance();
            if (match('=')) return makeToken(TokenType::GreaterEquals, ">=", startLoc);
            return makeToken(TokenType::RightAngle, ">", startLoc);

        case '.':
            advance();
            if (current() == '.' && peek() == '.') {
                advance();
                advance();
                if (match('?')) {
                    return makeToken(TokenType::EllipsisQuestion, "...?", startLoc);
                }
                return makeToken(TokenType::Ellipsis, "...", startLoc);
            }
            if (match('.')) {
                return makeToken(TokenType::DotDot, "..", startLoc);
            }
            return makeToken(TokenType::Dot, ".", startLoc);

        case '?':
            advance();
            if (current() == '?') {
                advance();
                if (match('=')) return makeToken(TokenType::QuestionQuestionEquals, "??=", startLoc);
                return makeToken(TokenType::QuestionQuestion, "??", startLoc);
            }
            if (current() == '.' && !isDigit(peek())) {
                advance();
                return makeToken(TokenType::QuestionDot, "?.", startLoc);
            }
            return makeToken(TokenType::Question, "?", startLoc);

        case '~':
            advance();
            if (current() == '/') {
                advance();
                if (match('=')) return makeToken(TokenType::TildeSlashEquals, "~/=", startLoc);
                return makeToken(TokenType::TildeSlash, "~/", startLoc);
            }
            return makeToken(TokenType::Tilde, "~", startLoc);

        case '-':
            advance();
            if (match('-')) return makeToken(TokenType::MinusMinus, "--", startLoc);
            if (match('=')) return makeToken(TokenType::MinusEquals, "-=", startLoc);
            return makeToken(TokenType::Minus, "-", startLoc);

        case '+':
            advance();
            if (match('+')) return makeToken(TokenType::PlusPlus, "++", startLoc);
            if (match('=')) return makeToken(TokenType::PlusEquals, "+=", startLoc);
            return makeToken(TokenType::Plus, "+", startLoc);

        case '*':
            advance();
            if (match('=')) return makeToken(TokenType::StarEquals, "*=", startLoc);
            return makeToken(TokenType::Star, "*", startLoc);

        case '/':
            advance();
            if (match('=')) return makeToken(TokenType::SlashEquals, "/=", startLoc);
            return makeToken(TokenType::Slash, "/", startLoc);

        case '%':
            advance();
            if (match('=')) return makeToken(TokenType::PercentEquals, "%=", startLoc);
            return makeToken(TokenType::Percent, "%", startLoc);

        case '&':
            advance();
            if (match('&')) return makeToken(TokenType::LogicalAnd, "&&", startLoc);
            return makeToken(TokenType::Ampersand, "&", startLoc);

        case '|':
            advance();
            if (match('|')) return makeToken(TokenType::LogicalOr, "||", startLoc);
            return makeToken(TokenType::Pipe, "|", startLoc);

        case '=':
            advance();
            if (match('=')) return makeToken(TokenType::DoubleEquals, "==", startLoc);
            if (match('>')) return makeToken(TokenType::FatArrow, "=>", startLoc);
            return makeToken(TokenType::Equals, "=", startLoc);

        case '!':
            advance();
            if (match('=')) return makeToken(TokenType::NotEquals, "!=", startLoc);
            return makeToken(TokenType::Exclamation, "!", startLoc);

        default:
            advance();
            errorReporter.reportError(
                Common::ErrorCode::UnexpectedCharacter,
                std::string("Unexpected character: '") + c + "'",
                startLoc
            );
            return makeToken(TokenType::Invalid, std::string(1, c), startLoc);
    }
}

Token Lexer::nextToken() {
    if (!skipWhitespace()) {
        return makeToken(TokenType::Invalid, "");
    }

    if (isAtEnd()) {
        return makeToken(TokenType::EndOfFile, "");
    }

    char c = current();

    // Raw strings: r'...' / r"..."
    if ((c == 'r' || c == 'R') && (peek() == '\'' || peek() == '"')) {
        auto startLoc = getCurrentLocation();
        size_t startPos = position;
        advance();
        return lexString(true, startLoc, startPos);
    }

    // Identifiers and keywords
    if (isAlpha(c)) {
        return lexIdentifier();
    }

    // Numbers, including `.5`
    if (isDigit(c) || (c == '.' && isDigit(peek()))) {
        if (c == '.') {
            auto startLoc = getCurrentLocation();
            std::string text = "0";
            text += advance();
            while (!isAtEnd() && isDigit(current())) {
                text += advance();
            }
            return makeToken(TokenType::DoubleLiteral, text, startLoc);
        }
        return lexNumber();
    }

    // String literals
    if (c == '\'' || c == '"') {
        auto startLoc = getCurrentLocation();
        return lexString(false, startLoc, position);
    }

    // Operators and punctuation
    return lexOperator();
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;

    while (true) {
        Token token = nextToken();
        tokens.push_back(token);

        if (token.type == TokenType::EndOfFile || token.type == TokenType::Invalid) {
            break;
        }
    }

    return tokens;
}

} // namespace Lexer
} // namespace FJS
