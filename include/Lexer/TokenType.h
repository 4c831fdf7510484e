#pragma once
#include <string>

namespace FJS {
namespace Lexer {

enum class TokenType {
    // Special tokens
    EndOfFile,
    Invalid,

    // Reserved words
    Assert,           // assert
    Break,            // break
    Case,             // case
    Catch,            // catch
    Class,            // class
    Const,            // const
    Continue,         // continue
    Default,          // default
    Do,               // do
    Else,             // else
    Enum,             // enum
    Extends,          // extends
    Final,            // final
    Finally,          // finally
    For,              // for
    If,               // if
    In,               // in
    Is,               // is
    New,              // new
    Rethrow,          // rethrow
    Return,           // return
    Super,            // super
    Switch,           // switch
    This,             // this
    Throw,            // throw
    Try,              // try
    Var,              // var
    Void,             // void
    While,            // while
    With,             // with

    // Identifiers and literals
    Identifier,       // names, including built-in identifiers (import, get, async, ...)
    IntegerLiteral,   // 42, 0xFF
    DoubleLiteral,    // 1.5, 2e10
    StringLiteral,    // 'text', "text $x", r'raw', '''multi'''
    BoolLiteral,      // true, false
    NullLiteral,      // null

    // Operators and symbols
    LeftBracket,      // [
    RightBracket,     // ]
    LeftBrace,        // {
    RightBrace,       // }
    LeftParen,        // (
    RightParen,       // )
    LeftAngle,        // <
    RightAngle,       // >
    Semicolon,        // ;
    Comma,            // ,
    Dot,              // .
    DotDot,           // ..
    Ellipsis,         // ...
    EllipsisQuestion, // ...?
    QuestionDot,      // ?.
    Colon,            // :
    Equals,           // =
    FatArrow,         // =>
    Plus,             // +
    Minus,            // -
    Star,             // *
    Slash,            // /
    TildeSlash,       // ~/
    Percent,          // %
    Ampersand,        // &
    Pipe,             // |
    Caret,            // ^
    Tilde,            // ~
    At,               // @
    Exclamation,      // !
    Question,         // ?
    QuestionQuestion, // ??
    Hash,             // #
    DoubleEquals,     // ==
    NotEquals,        // !=
    LessEquals,       // <=
    GreaterEquals,    // >=
    LogicalAnd,       // &&
    LogicalOr,        // ||
    PlusPlus,         // ++
    MinusMinus,       // --
    PlusEquals,       // +=
    MinusEquals,      // -=
    StarEquals,       // *=
    SlashEquals,      // /=
    PercentEquals,    // %=
    TildeSlashEquals, // ~/=
    QuestionQuestionEquals // ??=
};

std::string tokenTypeToString(TokenType type);
bool isKeyword(const std::string& text);
TokenType getKeywordType(const std::string& text);

} // namespace Lexer
} // namespace FJS
