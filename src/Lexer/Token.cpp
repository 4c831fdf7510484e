#include "Lexer/Token.h"

namespace FJS {
namespace Lexer {

bool Token::isKeyword() const {
    return type >= TokenType::Assert && type <= TokenType::With;
}

bool Token::isOperator() const {
    return type >= TokenType::LeftBracket && type <= TokenType::QuestionQuestionEquals;
}

bool Token::isLiteral() const {
    return type == TokenType::IntegerLiteral ||
           type == TokenType::DoubleLiteral ||
           type == TokenType::StringLiteral ||
           type == TokenType::BoolLiteral ||
           type == TokenType::NullLiteral;
}

std::string Token::literalText() const {
    std::string result;
    for (const auto& part : stringParts) {
        if (!part.isInterpolation) {
            result += part.text;
        }
    }
    return result;
}

bool Token::hasInterpolation() const {
    for (const auto& part : stringParts) {
        if (part.isInterpolation) {
            return true;
        }
    }
    return false;
}

std::string Token::toString() const {
    std::string result = tokenTypeToString(type);
    result += " '" + lexeme + "'";
    if (type == TokenType::StringLiteral && !hasInterpolation()) {
        result += " (\"" + literalText() + "\")";
    }
    result += " at " + location.toString();
    return result;
}

} // namespace Lexer
} // namespace FJS
