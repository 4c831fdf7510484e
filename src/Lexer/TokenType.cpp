#include "Lexer/TokenType.h"
#include <unordered_map>

namespace FJS {
namespace Lexer {

// Only reserved words are keywords; built-in identifiers such as `import`,
// `get`, `async` or `required` lex as identifiers and are matched by lexeme
static const std::unordered_map<std::string, TokenType> keywords = {
    {"assert", TokenType::Assert},
    {"break", TokenType::Break},
    {"case", TokenType::Case},
    {"catch", TokenType::Catch},
    {"class", TokenType::Class},
    {"const", TokenType::Const},
    {"continue", TokenType::Continue},
    {"default", TokenType::Default},
    {"do", TokenType::Do},
    {"else", TokenType::Else},
    {"enum", TokenType::Enum},
    {"extends", TokenType::Extends},
    {"final", TokenType::Final},
    {"finally", TokenType::Finally},
    {"for", TokenType::For},
    {"if", TokenType::If},
    {"in", TokenType::In},
    {"is", TokenType::Is},
    {"new", TokenType::New},
    {"rethrow", TokenType::Rethrow},
    {"return", TokenType::Return},
    {"super", TokenType::Super},
    {"switch", TokenType::Switch},
    {"this", TokenType::This},
    {"throw", TokenType::Throw},
    {"try", TokenType::Try},
    {"var", TokenType::Var},
    {"void", TokenType::Void},
    {"while", TokenType::While},
    {"with", TokenType::With},
    {"true", TokenType::BoolLiteral},
    {"false", TokenType::BoolLiteral},
    {"null", TokenType::NullLiteral},
};

std::string tokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::EndOfFile: return "EndOfFile";
        case TokenType::Invalid: return "Invalid";
        case TokenType::Assert: return "Assert";
        case TokenType::Break: return "Break";
        case TokenType::Case: return "Case";
        case TokenType::Catch: return "Catch";
        case TokenType::Class: return "Class";
        case TokenType::Const: return "Const";
        case TokenType::Continue: return "Continue";
        case TokenType::Default: return "Default";
        case TokenType::Do: return "Do";
        case TokenType::Else: return "Else";
        case TokenType::Enum: return "Enum";
        case TokenType::Extends: return "Extends";
        case TokenType::Final: return "Final";
        case TokenType::Finally: return "Finally";
        case TokenType::For: return "For";
        case TokenType::If: return "If";
        case TokenType::In: return "In";
        case TokenType::Is: return "Is";
        case TokenType::New: return "New";
        case TokenType::Rethrow: return "Rethrow";
        case TokenType::Return: return "Return";
        case TokenType::Super: return "Super";
        case TokenType::Switch: return "Switch";
        case TokenType::This: return "This";
        case TokenType::Throw: return "Throw";
        case TokenType::Try: return "Try";
        case TokenType::Var: return "Var";
        case TokenType::Void: return "Void";
        case TokenType::While: return "While";
        case TokenType::With: return "With";
        case TokenType::Identifier: return "Identifier";
        case TokenType::IntegerLiteral: return "IntegerLiteral";
        case TokenType::DoubleLiteral: return "DoubleLiteral";
        case TokenType::StringLiteral: return "StringLiteral";
        case TokenType::BoolLiteral: return "BoolLiteral";
        case TokenType::NullLiteral: return "NullLiteral";
        case TokenType::LeftBracket: return "LeftBracket";
        case TokenType::RightBracket: return "RightBracket";
        case TokenType::LeftBrace: return "LeftBrace";
        case TokenType::RightBrace: return "RightBrace";
        case TokenType::LeftParen: return "LeftParen";
        case TokenType::RightParen: return "RightParen";
        case TokenType::LeftAngle: return "LeftAngle";
        case TokenType::RightAngle: return "RightAngle";
        case TokenType::Semicolon: return "Semicolon";
        case TokenType::Comma: return "Comma";
        case TokenType::Dot: return "Dot";
        case TokenType::DotDot: return "DotDot";
        case TokenType::Ellipsis: return "Ellipsis";
        case TokenType::EllipsisQuestion: return "EllipsisQuestion";
        case TokenType::QuestionDot: return "QuestionDot";
        case TokenType::Colon: return "Colon";
        case TokenType::Equals: return "Equals";
        case TokenType::FatArrow: return "FatArrow";
        case TokenType::Plus: return "Plus";
        case TokenType::Minus: return "Minus";
        case TokenType::Star: return "Star";
        case TokenType::Slash: return "Slash";
        case TokenType::TildeSlash: return "TildeSlash";
        case TokenType::Percent: return "Percent";
        case TokenType::Ampersand: return "Ampersand";
        case TokenType::Pipe: return "Pipe";
        case TokenType::Caret: return "Caret";
        case TokenType::Tilde: return "Tilde";
        case TokenType::At: return "At";
        case TokenType::Exclamation: return "Exclamation";
        case TokenType::Question: return "Question";
        case TokenType::QuestionQuestion: return "QuestionQuestion";
        case TokenType::Hash: return "Hash";
        case TokenType::DoubleEquals: return "DoubleEquals";
        case TokenType::NotEquals: return "NotEquals";
        case TokenType::LessEquals: return "LessEquals";
        case TokenType::GreaterEquals: return "GreaterEquals";
        case TokenType::LogicalAnd: return "LogicalAnd";
        case TokenType::LogicalOr: return "LogicalOr";
        case TokenType::PlusPlus: return "PlusPlus";
        case TokenType::MinusMinus: return "MinusMinus";
        case TokenType::PlusEquals: return "PlusEquals";
        case TokenType::MinusEquals: return "MinusEquals";
        case TokenType::StarEquals: return "StarEquals";
        case TokenType::SlashEquals: return "SlashEquals";
        case TokenType::PercentEquals: return "PercentEquals";
        case TokenType::TildeSlashEquals: return "TildeSlashEquals";
        case TokenType::QuestionQuestionEquals: return "QuestionQuestionEquals";
        default: return "Unknown";
    }
}

bool isKeyword(const std::string& text) {
    return keywords.find(text) != keywords.end();
}

TokenType getKeywordType(const std::string& text) {
    auto it = keywords.find(text);
    if (it != keywords.end()) {
        return it->second;
    }
    return TokenType::Identifier;
}

} // namespace Lexer
} // namespace FJS
