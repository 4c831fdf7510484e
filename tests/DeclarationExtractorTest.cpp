#include <gtest/gtest.h>
#include "Analysis/DeclarationExtractor.h"
#include "IR/IRPrinter.h"
#include "TestSupport.h"

using namespace FJS;
using FJS::TestSupport::extractSource;

namespace {

const char* kCounterSource = R"(
import 'package:flutter/material.dart';

class Counter extends StatefulWidget {
  const Counter({super.key, required this.label, this.start = 0});

  final String label;
  final int start;

  @override
  State<Counter> createState() => _CounterState();
}

class _CounterState extends State<Counter> {
  int _count = 0;
  final TextEditingController _controller = TextEditingController();

  @override
  void initState() {
    super.initState();
    _count = widget.start;
  }

  @override
  void dispose() {
    _controller.dispose();
    super.dispose();
  }

  void _increment() {
    setState(() {
      _count++;
    });
  }

  @override
  Widget build(BuildContext context) {
    return Column(
      children: [
        Text('${widget.label}: $_count'),
        ElevatedButton(onPressed: _increment, child: const Text('Add')),
      ],
    );
  }
}
)";

} // namespace

TEST(DeclarationExtractorTest, ClassifiesStatefulComponentAndStateHolder) {
    auto decl = extractSource(kCounterSource, "/p/lib/counter.dart");

    ASSERT_EQ(decl.components.size(), 1u);
    const auto& counter = decl.components[0];
    EXPECT_EQ(counter.name, "Counter");
    EXPECT_TRUE(counter.isStateful());
    EXPECT_EQ(counter.id, "/p/lib/counter.dart#Counter");
    EXPECT_EQ(counter.stateHolderName, "_CounterState");
    EXPECT_FALSE(counter.build.has_value());

    ASSERT_EQ(decl.stateHolders.size(), 1u);
    const auto& state = decl.stateHolders[0];
    EXPECT_EQ(state.name, "_CounterState");
    EXPECT_EQ(state.componentName, "Counter");
    EXPECT_TRUE(state.initState.has_value());
    EXPECT_TRUE(state.dispose.has_value());
    EXPECT_TRUE(state.build.has_value());
    EXPECT_EQ(state.controllers, std::vector<std::string>({"_controller"}));
    EXPECT_TRUE(decl.plainTypes.empty());
}

TEST(DeclarationExtractorTest, MergesFieldsWithConstructorParameters) {
    auto decl = extractSource(kCounterSource, "/p/lib/counter.dart");
    const auto& properties = decl.components.at(0).properties;

    ASSERT_EQ(properties.size(), 2u);
    EXPECT_EQ(properties[0].name, "label");
    EXPECT_EQ(properties[0].typeName, "String");
    EXPECT_TRUE(properties[0].isRequired);
    EXPECT_TRUE(properties[0].isNamed);
    EXPECT_FALSE(properties[0].defaultValue);

    EXPECT_EQ(properties[1].name, "start");
    EXPECT_FALSE(properties[1].isRequired);
    ASSERT_TRUE(properties[1].defaultValue);
    EXPECT_EQ(IR::IRPrinter::print(properties[1].defaultValue), "0");
}

TEST(DeclarationExtractorTest, ReconstructsBuildTree) {
    auto decl = extractSource(kCounterSource, "/p/lib/counter.dart");
    const auto& build = decl.stateHolders.at(0).build;
    ASSERT_TRUE(build.has_value());
    EXPECT_EQ(build->contextName, "context");
    ASSERT_TRUE(build->tree.has_value());
    EXPECT_TRUE(build->alternatives.empty());
    EXPECT_TRUE(build->conditionalNotes.empty());

    const auto& column = *build->tree;
    EXPECT_EQ(column.typeName, "Column");
    EXPECT_TRUE(column.slot.empty());
    ASSERT_EQ(column.children.size(), 2u);
    EXPECT_EQ(column.children[0].typeName, "Text");
    EXPECT_EQ(column.children[0].slot, "children");

    const auto& button = column.children[1];
    EXPECT_EQ(button.typeName, "ElevatedButton");
    ASSERT_EQ(button.children.size(), 1u);
    EXPECT_EQ(button.children[0].slot, "child");
    EXPECT_TRUE(button.children[0].isConst);
    ASSERT_EQ(button.properties.size(), 1u);
    EXPECT_EQ(button.properties[0].first, "onPressed");
    EXPECT_EQ(button.properties[0].second, "_increment");
    EXPECT_EQ(column.nodeCount(), 4u);
}

TEST(DeclarationExtractorTest, StatelessComponentAndImportRecords) {
    const char* source = R"(
library greeting;
import 'package:flutter/material.dart' as m show Widget;
import 'heavy.dart' deferred as heavy;
export 'other.dart';

class Greeting extends StatelessWidget {
  const Greeting(this.name);
  final String name;

  @override
  Widget build(BuildContext context) => Text('Hello $name');
}

int answer() => 42;
)";
    auto decl = extractSource(source, "/p/lib/greeting.dart");

    EXPECT_EQ(decl.file, "/p/lib/greeting.dart");
    EXPECT_EQ(decl.libraryName, "greeting");
    ASSERT_EQ(decl.imports.size(), 2u);
    EXPECT_EQ(decl.imports[0].prefix, "m");
    EXPECT_EQ(decl.imports[0].show, std::vector<std::string>({"Widget"}));
    EXPECT_TRUE(decl.imports[1].isDeferred);
    EXPECT_EQ(decl.exports, std::vector<std::string>({"other.dart"}));

    ASSERT_EQ(decl.components.size(), 1u);
    EXPECT_FALSE(decl.components[0].isStateful());
    ASSERT_TRUE(decl.components[0].build.has_value());
    ASSERT_TRUE(decl.components[0].build->tree.has_value());
    EXPECT_EQ(decl.components[0].build->tree->typeName, "Text");
    EXPECT_FALSE(decl.components[0].properties.at(0).isNamed);

    ASSERT_EQ(decl.functions.size(), 1u);
    EXPECT_EQ(decl.functions[0].name, "answer");
}

TEST(DeclarationExtractorTest, ConditionalReturnKeepsBothBranches) {
    const char* source = R"(
class Toggle extends StatelessWidget {
  final bool on;
  Toggle(this.on);

  Widget build(BuildContext context) {
    return on ? Text('on') : Icon(Icons.close);
  }
}
)";
    auto decl = extractSource(source, "/p/lib/toggle.dart");
    const auto& build = decl.components.at(0).build;
    ASSERT_TRUE(build.has_value());

    ASSERT_EQ(build->alternatives.size(), 2u);
    EXPECT_EQ(build->alternatives[0].typeName, "Text");
    EXPECT_EQ(build->alternatives[1].typeName, "Icon");
    ASSERT_TRUE(build->tree.has_value());
    EXPECT_EQ(build->tree->typeName, "Text");
    EXPECT_EQ(build->conditionalNotes,
              std::vector<std::string>({"when on -> Text", "unless on -> Icon"}));
}

TEST(DeclarationExtractorTest, EarlyReturnsBecomeAlternatives) {
    const char* source = R"(
class Loader extends StatelessWidget {
  final bool loading;
  Loader(this.loading);

  Widget build(BuildContext context) {
    if (loading) {
      return CircularProgressIndicator();
    }
    return Text('done');
  }
}
)";
    auto decl = extractSource(source, "/p/lib/loader.dart");
    const auto& build = decl.components.at(0).build;
    ASSERT_TRUE(build.has_value());

    ASSERT_EQ(build->alternatives.size(), 2u);
    EXPECT_EQ(build->alternatives[0].typeName, "CircularProgressIndicator");
    EXPECT_EQ(build->alternatives[1].typeName, "Text");
    ASSERT_EQ(build->conditionalNotes.size(), 1u);
    EXPECT_EQ(build->conditionalNotes[0], "if (loading) -> CircularProgressIndicator");
}

TEST(DeclarationExtractorTest, ClassificationUsesRegistryAcrossFiles) {
    Semantic::SymbolRegistry registry;
    Import::DependencyGraph graph;
    graph.addEdge("/p/lib/fancy.dart", "/p/lib/base.dart");

    extractSource("abstract class BaseCard extends StatelessWidget {}\n", "/p/lib/base.dart", registry, graph);
    auto decl = extractSource(
        "class FancyCard extends BaseCard {\n"
        "  Widget build(BuildContext context) => Card();\n"
        "}\n",
        "/p/lib/fancy.dart", registry, graph);

    ASSERT_EQ(decl.components.size(), 1u);
    EXPECT_EQ(decl.components[0].name, "FancyCard");
    EXPECT_EQ(decl.components[0].superType, "BaseCard");

    auto descriptor = registry.lookup("FancyCard");
    ASSERT_TRUE(descriptor.has_value());
    EXPECT_TRUE(descriptor->isStatelessComponent);
}

TEST(DeclarationExtractorTest, PlainTypesKeepTheirShape) {
    const char* source = R"(
enum Mode { light, dark }

typedef Handler = void Function(int code);

class Cart extends ChangeNotifier {
  final List<String> items = [];

  void add(String item) {
    items.add(item);
    notifyListeners();
  }
}
)";
    auto decl = extractSource(source, "/p/lib/cart.dart");

    ASSERT_EQ(decl.plainTypes.size(), 3u);
    EXPECT_EQ(decl.plainTypes[0].kind, Semantic::TypeKind::Enum);
    EXPECT_EQ(decl.plainTypes[0].enumValues, std::vector<std::string>({"light", "dark"}));
    EXPECT_EQ(decl.plainTypes[1].kind, Semantic::TypeKind::TypeAlias);
    EXPECT_EQ(decl.plainTypes[2].name, "Cart");
    EXPECT_EQ(decl.plainTypes[2].superType, "ChangeNotifier");
    ASSERT_EQ(decl.plainTypes[2].methods.size(), 1u);

    auto descriptors = decl.typeDescriptors();
    ASSERT_EQ(descriptors.size(), 3u);
}

TEST(DeclarationExtractorTest, CascadedControllerIsTracked) {
    const char* source = R"(
class Spinner extends StatefulWidget {
  State<Spinner> createState() => _SpinnerState();
}

class _SpinnerState extends State<Spinner> with SingleTickerProviderStateMixin {
  late final _spin = AnimationController(vsync: this, duration: const Duration(seconds: 1))..repeat();

  Widget build(BuildContext context) => RotationTransition(turns: _spin, child: const Icon(Icons.sync));
}
)";
    auto decl = extractSource(source, "/p/lib/spinner.dart");

    ASSERT_EQ(decl.stateHolders.size(), 1u);
    EXPECT_EQ(decl.stateHolders[0].controllers, std::vector<std::string>({"_spin"}));
    ASSERT_TRUE(decl.stateHolders[0].build.has_value());
}

TEST(DeclarationExtractorTest, ParseErrorsRaiseExtractionError) {
    Semantic::SymbolRegistry registry;
    Import::DependencyGraph graph;
    Parser::DartSourceParser parser;
    auto parsed = parser.parseSource("class Broken extends { }", "/p/lib/broken.dart");
    ASSERT_TRUE(parsed.hasErrors());

    Analysis::AnalysisContext context("/p/lib/broken.dart", registry, graph);
    Analysis::DeclarationExtractor extractor(context);
    EXPECT_THROW(extractor.extract(parsed), Analysis::ExtractionError);
}
