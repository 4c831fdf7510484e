#include <gtest/gtest.h>
#include "Lexer/Lexer.h"
#include "Parser/Parser.h"
#include "Parser/SourceParser.h"
#include "Common/Error.h"
#include "TestSupport.h"

using namespace FJS;
using FJS::Lexer::TokenType;

TEST(LexerTest, TokenizesDeclarationHeader) {
    Common::ErrorReporter reporter;
    Lexer::Lexer lexer("class Counter extends StatefulWidget {}", "test.dart", reporter);
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].type, TokenType::Class);
    EXPECT_EQ(tokens[1].type, TokenType::Identifier);
    EXPECT_EQ(tokens[1].lexeme, "Counter");
    EXPECT_EQ(tokens[2].type, TokenType::Extends);
    EXPECT_EQ(tokens[3].lexeme, "StatefulWidget");
    EXPECT_EQ(tokens[4].type, TokenType::LeftBrace);
    EXPECT_EQ(tokens[5].type, TokenType::RightBrace);
    EXPECT_EQ(tokens[6].type, TokenType::EndOfFile);
    EXPECT_FALSE(reporter.hasErrors());
}

TEST(LexerTest, NestedGenericsCloseOneBracketAtATime) {
    Common::ErrorReporter reporter;
    Lexer::Lexer lexer("List<List<int>> x;", "test.dart", reporter);
    auto tokens = lexer.tokenize();

    size_t closers = 0;
    for (const auto& token : tokens) {
        if (token.is(TokenType::RightAngle)) ++closers;
    }
    EXPECT_EQ(closers, 2u);
}

TEST(LexerTest, StringInterpolationParts) {
    Common::ErrorReporter reporter;
    Lexer::Lexer lexer("'Count: $count' 'plain'", "test.dart", reporter);
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::StringLiteral);
    EXPECT_TRUE(tokens[0].hasInterpolation());
    EXPECT_EQ(tokens[1].type, TokenType::StringLiteral);
    EXPECT_FALSE(tokens[1].hasInterpolation());
    EXPECT_EQ(tokens[1].literalText(), "plain");
}

TEST(LexerTest, ReportsUnexpectedCharacter) {
    Common::ErrorReporter reporter;
    Lexer::Lexer lexer("int x = 1 ` 2;", "test.dart", reporter);
    lexer.tokenize();
    EXPECT_TRUE(reporter.hasErrors());
}

TEST(ParserTest, ParsesDirectivesAndClass) {
    std::string source =
        "library counter;\n"
        "import 'package:flutter/material.dart' show Widget, StatelessWidget;\n"
        "import 'heavy.dart' deferred as heavy;\n"
        "export 'src/model.dart';\n"
        "part 'counter_part.dart';\n"
        "\n"
        "class _CounterState extends State<Counter> with TickerProviderStateMixin {\n"
        "  int _count = 0;\n"
        "  @override\n"
        "  Widget build(BuildContext context) => Text('$_count');\n"
        "}\n";

    Parser::DartSourceParser parser;
    auto result = parser.parseSource(source, "counter.dart");
    ASSERT_FALSE(result.hasErrors()) << result.firstError();
    ASSERT_TRUE(result.unit);

    const auto& unit = *result.unit;
    EXPECT_EQ(unit.libraryName, "counter");
    ASSERT_EQ(unit.imports.size(), 2u);
    EXPECT_EQ(unit.imports[0].uri, "package:flutter/material.dart");
    EXPECT_EQ(unit.imports[0].show, std::vector<std::string>({"Widget", "StatelessWidget"}));
    EXPECT_TRUE(unit.imports[1].isDeferred);
    EXPECT_EQ(unit.imports[1].prefix, "heavy");
    ASSERT_EQ(unit.exports.size(), 1u);
    EXPECT_EQ(unit.parts, std::vector<std::string>({"counter_part.dart"}));

    ASSERT_EQ(unit.declarations.size(), 1u);
    ASSERT_EQ(unit.declarations[0]->kind(), Parser::DeclarationKind::Class);
    const auto& decl = static_cast<const Parser::ClassDecl&>(*unit.declarations[0]);
    EXPECT_EQ(decl.name, "_CounterState");
    ASSERT_TRUE(decl.superclass.has_value());
    EXPECT_EQ(decl.superclass->name, "State");
    ASSERT_EQ(decl.superclass->arguments.size(), 1u);
    EXPECT_EQ(decl.superclass->arguments[0].name, "Counter");
    ASSERT_EQ(decl.mixins.size(), 1u);
    EXPECT_EQ(decl.members.size(), 2u);
}

TEST(ParserTest, ParsesConstructorsAndTopLevelDeclarations) {
    std::string source =
        "enum Mode { light, dark }\n"
        "typedef Callback = void Function(int value);\n"
        "mixin Loud on Object {}\n"
        "extension Shout on String { String shout() => toUpperCase(); }\n"
        "const int limit = 3;\n"
        "int twice(int x) => x * 2;\n"
        "class Label extends StatelessWidget {\n"
        "  const Label({super.key, required this.text, this.size = 12});\n"
        "  Label.empty() : text = '', size = 0;\n"
        "  factory Label.big(String text) => Label(text: text, size: 40);\n"
        "  final String text;\n"
        "  final int size;\n"
        "  int get doubled => size * 2;\n"
        "  @override\n"
        "  Widget build(BuildContext context) {\n"
        "    return Text(text);\n"
        "  }\n"
        "}\n";

    Parser::DartSourceParser parser;
    auto result = parser.parseSource(source, "label.dart");
    ASSERT_FALSE(result.hasErrors()) << result.firstError();
    ASSERT_EQ(result.unit->declarations.size(), 7u);
    EXPECT_EQ(result.unit->declarations[0]->kind(), Parser::DeclarationKind::Enum);
    EXPECT_EQ(result.unit->declarations[1]->kind(), Parser::DeclarationKind::Typedef);
    EXPECT_EQ(result.unit->declarations[2]->kind(), Parser::DeclarationKind::Mixin);
    EXPECT_EQ(result.unit->declarations[3]->kind(), Parser::DeclarationKind::Extension);
    EXPECT_EQ(result.unit->declarations[4]->kind(), Parser::DeclarationKind::Variable);
    EXPECT_EQ(result.unit->declarations[5]->kind(), Parser::DeclarationKind::Function);

    const auto& label = static_cast<const Parser::ClassDecl&>(*result.unit->declarations[6]);
    size_t constructors = 0;
    for (const auto& member : label.members) {
        if (member->kind() == Parser::MemberKind::Constructor) ++constructors;
    }
    EXPECT_EQ(constructors, 3u);
}

TEST(ParserTest, ParsesCascadesAndNullAwareIndex) {
    std::string source =
        "void paint(Canvas canvas, List<Offset>? points, bool outlined, Color? tint) {\n"
        "  final paint = Paint()..color = tint ?? Colors.black..strokeWidth = 2;\n"
        "  tint?..withOpacity(0.5)..computeLuminance();\n"
        "  final start = points?[0];\n"
        "  final styles = outlined ? [PaintingStyle.stroke] : [PaintingStyle.fill];\n"
        "  paint..style = styles[0]..shader = null;\n"
        "  canvas.drawCircle(start!, 4, paint);\n"
        "}\n";

    Parser::DartSourceParser parser;
    auto result = parser.parseSource(source, "painter.dart");
    ASSERT_FALSE(result.hasErrors()) << result.firstError();
    EXPECT_EQ(result.unit->declarations.size(), 1u);
}

TEST(ParserTest, NullAwareCascadeOnlyLeadsTheChain) {
    Parser::DartSourceParser parser;
    auto result = parser.parseSource("void f(Paint p) { p..color = c?..strokeWidth = 1; }\n", "bad.dart");
    EXPECT_TRUE(result.hasErrors());
}

TEST(ParserTest, MalformedSourceIsAnError) {
    Parser::DartSourceParser parser;
    auto result = parser.parseSource("class { int x = ; }", "broken.dart");
    EXPECT_TRUE(result.hasErrors());
    EXPECT_FALSE(result.firstError().empty());
}

TEST(ParserTest, UnreadableFileIsAnError) {
    TestSupport::TempDir dir;
    Parser::DartSourceParser parser;
    auto result = parser.parseFile(dir.path() + "/does_not_exist.dart");
    EXPECT_TRUE(result.hasErrors());
    EXPECT_FALSE(result.unit);
}
