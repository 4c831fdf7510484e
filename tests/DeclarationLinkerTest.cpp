#include <gtest/gtest.h>
#include <map>
#include "Analysis/DeclarationLinker.h"
#include "Analysis/DeclarationValidator.h"
#include "TestSupport.h"

using namespace FJS;
using FJS::Common::ErrorCode;
using FJS::IR::GraphEdgeKind;

namespace {

/**
 * Extracts a set of in-memory files against one registry, then links and
 * validates them.
 */
class LinkFixture : public ::testing::Test {
protected:
    Semantic::SymbolRegistry registry;
    Import::DependencyGraph graph;
    std::map<std::string, IR::FileDeclaration> files;

    void add(const std::string& file, const std::string& source) {
        graph.addNode(file);
        files[file] = TestSupport::extractSource(source, file, registry, graph);
    }

    IR::ApplicationDeclaration link() const {
        return Analysis::DeclarationLinker().link(files, graph, registry);
    }

    Analysis::ValidationResult validate(const IR::ApplicationDeclaration& app) const {
        return Analysis::DeclarationValidator(registry).validate(app);
    }
};

const char* kStatefulPair = R"(
class W extends StatefulWidget {
  State<W> createState() => _WState();
}

class _WState extends State<W> {
  Widget build(BuildContext context) => Text('w');
}
)";

} // namespace

TEST_F(LinkFixture, BindsStatefulComponentToItsState) {
    add("/p/lib/w.dart", kStatefulPair);
    auto app = link();

    ASSERT_EQ(app.components.size(), 1u);
    EXPECT_EQ(app.components[0].stateHolderId, "/p/lib/w.dart#_WState");
    EXPECT_TRUE(app.graph.hasEdge("/p/lib/w.dart#W", "/p/lib/w.dart#_WState", GraphEdgeKind::HasState));
    EXPECT_EQ(app.graph.countEdges(GraphEdgeKind::HasState), 1u);

    auto result = validate(app);
    EXPECT_TRUE(result.isValid) << result.getSummary();
    EXPECT_EQ(result.countOf(ErrorCode::MissingStateClass), 0u);
}

TEST_F(LinkFixture, StateHolderInAnotherFileIsBound) {
    graph.addEdge("/p/lib/state.dart", "/p/lib/widget.dart");
    add("/p/lib/widget.dart",
        "class Panel extends StatefulWidget {\n"
        "  State<Panel> createState() => PanelState();\n"
        "}\n");
    add("/p/lib/state.dart",
        "class PanelState extends State<Panel> {\n"
        "  Widget build(BuildContext context) => Container();\n"
        "}\n");

    auto app = link();
    EXPECT_EQ(app.findComponent("Panel")->stateHolderId, "/p/lib/state.dart#PanelState");
    EXPECT_EQ(app.resolvedImports.at("/p/lib/state.dart"), std::set<std::string>({"/p/lib/widget.dart"}));
}

TEST_F(LinkFixture, MissingStateClassIsAnError) {
    add("/p/lib/lonely.dart",
        "class Lonely extends StatefulWidget {\n"
        "  State<Lonely> createState() => _LonelyState();\n"
        "}\n");
    auto app = link();
    EXPECT_TRUE(app.components.at(0).stateHolderId.empty());
    EXPECT_EQ(app.graph.countEdges(GraphEdgeKind::HasState), 0u);

    auto result = validate(app);
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.countOf(ErrorCode::MissingStateClass), 1u);
    EXPECT_NE(result.errors[0].message.find("Lonely"), std::string::npos);
}

TEST_F(LinkFixture, OrphanedStateHolderIsAWarning) {
    add("/p/lib/orphan.dart",
        "class _GhostState extends State<Ghost> {\n"
        "  Widget build(BuildContext context) => Text('boo');\n"
        "}\n");
    auto result = validate(link());
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(result.countOf(ErrorCode::OrphanedStateHolder), 1u);
}

TEST_F(LinkFixture, ComposesEdgesIncludeEveryBranch) {
    add("/p/lib/parts.dart",
        "class Header extends StatelessWidget {\n"
        "  Widget build(BuildContext context) => Text('h');\n"
        "}\n"
        "class Footer extends StatelessWidget {\n"
        "  Widget build(BuildContext context) => Text('f');\n"
        "}\n"
        "class Page extends StatelessWidget {\n"
        "  final bool top;\n"
        "  Page(this.top);\n"
        "  Widget build(BuildContext context) {\n"
        "    return top ? Column(children: [Header()]) : Footer();\n"
        "  }\n"
        "}\n");
    auto app = link();

    EXPECT_TRUE(app.graph.hasEdge("/p/lib/parts.dart#Page", "/p/lib/parts.dart#Header", GraphEdgeKind::Composes));
    EXPECT_TRUE(app.graph.hasEdge("/p/lib/parts.dart#Page", "/p/lib/parts.dart#Footer", GraphEdgeKind::Composes));
    EXPECT_EQ(app.graph.countEdges(GraphEdgeKind::Composes), 2u);
    EXPECT_EQ(app.fileStructure.at("/p/lib/parts.dart"),
              std::vector<std::string>({"Component:Header", "Component:Footer", "Component:Page"}));
}

TEST_F(LinkFixture, ComponentCycleIsAnError) {
    add("/p/lib/loop.dart",
        "class Ping extends StatelessWidget {\n"
        "  Widget build(BuildContext context) => Pong();\n"
        "}\n"
        "class Pong extends StatelessWidget {\n"
        "  Widget build(BuildContext context) => Ping();\n"
        "}\n");
    auto result = validate(link());
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.countOf(ErrorCode::CircularComponentDependency), 1u);
}

TEST_F(LinkFixture, ObservableStateAndDependsOnEdges) {
    add("/p/lib/cart.dart",
        "class Cart extends ChangeNotifier {\n"
        "  int count = 0;\n"
        "  void add() {\n"
        "    count++;\n"
        "    notifyListeners();\n"
        "  }\n"
        "  void reset() {\n"
        "    count = 0;\n"
        "  }\n"
        "}\n");
    add("/p/lib/badge.dart",
        "class Badge extends StatelessWidget {\n"
        "  Widget build(BuildContext context) {\n"
        "    final cart = context.watch<Cart>();\n"
        "    return Text('${cart.count}');\n"
        "  }\n"
        "}\n");
    auto app = link();

    ASSERT_EQ(app.observables.size(), 1u);
    const auto& cart = app.observables[0];
    EXPECT_EQ(cart.kind, IR::ObservableKind::ChangeNotifier);
    ASSERT_EQ(cart.methods.size(), 2u);
    EXPECT_TRUE(cart.methods[0].notifiesListeners);
    EXPECT_FALSE(cart.methods[1].notifiesListeners);
    EXPECT_TRUE(app.plainTypes.empty());

    EXPECT_TRUE(app.graph.hasEdge("/p/lib/badge.dart#Badge", "/p/lib/cart.dart#Cart", GraphEdgeKind::DependsOn));

    auto result = validate(app);
    ASSERT_EQ(result.countOf(ErrorCode::MissingNotifyListeners), 1u);
    EXPECT_NE(result.warnings[0].message.find("reset"), std::string::npos);
}

TEST_F(LinkFixture, NotifyingMutatorClearsWarning) {
    add("/p/lib/cart.dart",
        "class Cart extends ChangeNotifier {\n"
        "  int count = 0;\n"
        "  void reset() {\n"
        "    count = 0;\n"
        "  }\n"
        "}\n");
    EXPECT_EQ(validate(link()).countOf(ErrorCode::MissingNotifyListeners), 1u);

    add("/p/lib/cart.dart",
        "class Cart extends ChangeNotifier {\n"
        "  int count = 0;\n"
        "  void reset() {\n"
        "    count = 0;\n"
        "    notifyListeners();\n"
        "  }\n"
        "}\n");
    EXPECT_EQ(validate(link()).countOf(ErrorCode::MissingNotifyListeners), 0u);
}

TEST_F(LinkFixture, OverriddenVoidMethodIsStillAMutator) {
    add("/p/lib/base.dart",
        "class Base extends ChangeNotifier {\n"
        "  int n = 0;\n"
        "  void reset() {\n"
        "    n = 1;\n"
        "    notifyListeners();\n"
        "  }\n"
        "}\n");
    add("/p/lib/c.dart",
        "class C extends Base {\n"
        "  @override\n"
        "  void reset() {\n"
        "    n = 0;\n"
        "  }\n"
        "}\n");
    auto result = validate(link());

    ASSERT_EQ(result.countOf(ErrorCode::MissingNotifyListeners), 1u);
    EXPECT_EQ(result.warnings[0].declaration, "C");
}

TEST_F(LinkFixture, MethodWithoutDeclaredReturnTypeIsNotAMutator) {
    add("/p/lib/cart.dart",
        "class Cart extends ChangeNotifier {\n"
        "  int n = 0;\n"
        "  helper() {\n"
        "    return n;\n"
        "  }\n"
        "}\n");
    EXPECT_EQ(validate(link()).countOf(ErrorCode::MissingNotifyListeners), 0u);
}

TEST_F(LinkFixture, ValueNotifierAssignmentCountsAsNotification) {
    add("/p/lib/counter.dart",
        "class Count extends ValueNotifier<int> {\n"
        "  Count() : super(0);\n"
        "  void bump() {\n"
        "    value = value + 1;\n"
        "  }\n"
        "}\n");
    auto app = link();
    ASSERT_EQ(app.observables.size(), 1u);
    EXPECT_EQ(app.observables[0].kind, IR::ObservableKind::ValueNotifier);
    EXPECT_EQ(app.observables[0].valueType, "int");
    EXPECT_EQ(validate(app).countOf(ErrorCode::MissingNotifyListeners), 0u);
}

TEST_F(LinkFixture, PropertyAndControllerWarnings) {
    add("/p/lib/form.dart",
        "class Field extends StatefulWidget {\n"
        "  const Field({required this.hint = 'x', this.model});\n"
        "  final String hint;\n"
        "  final Mystery? model;\n"
        "  State<Field> createState() => _FieldState();\n"
        "}\n"
        "class _FieldState extends State<Field> {\n"
        "  final TextEditingController text = TextEditingController();\n"
        "  final ScrollController scroll = ScrollController();\n"
        "  void dispose() {\n"
        "    text.dispose();\n"
        "    super.dispose();\n"
        "  }\n"
        "  Widget build(BuildContext context) => TextField(controller: text);\n"
        "}\n");
    auto result = validate(link());

    EXPECT_TRUE(result.isValid) << result.getSummary();
    EXPECT_EQ(result.countOf(ErrorCode::RedundantDefault), 1u);
    EXPECT_EQ(result.countOf(ErrorCode::UnknownType), 1u);
    EXPECT_EQ(result.countOf(ErrorCode::UndisposedController), 1u);
    EXPECT_EQ(result.countOf(ErrorCode::MissingDispose), 0u);
}

TEST_F(LinkFixture, DuplicatesAndImportWarnings) {
    add("/p/lib/a.dart",
        "import 'b.dart';\n"
        "import 'b.dart';\n"
        "import 'lazy.dart' deferred as lazy;\n"
        "class Tile extends StatelessWidget {\n"
        "  Widget build(BuildContext context) => Text('a');\n"
        "}\n");
    add("/p/lib/b.dart",
        "class Tile extends StatelessWidget {\n"
        "  Widget build(BuildContext context) => Text('b');\n"
        "}\n");
    auto result = validate(link());

    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.countOf(ErrorCode::DuplicateDeclaration), 1u);
    EXPECT_EQ(result.countOf(ErrorCode::DuplicateImport), 1u);
    EXPECT_EQ(result.countOf(ErrorCode::DeferredImport), 1u);
}

TEST_F(LinkFixture, MissingBuildMethodIsAnError) {
    add("/p/lib/empty.dart", "class Empty extends StatelessWidget {}\n");
    auto result = validate(link());
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.countOf(ErrorCode::MissingBuildMethod), 1u);
}
