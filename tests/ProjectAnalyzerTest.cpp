#include <gtest/gtest.h>
#include <filesystem>
#include <set>
#include "Driver/ProjectAnalyzer.h"
#include "Common/Error.h"
#include "TestSupport.h"

using namespace FJS;
using FJS::Driver::AnalyzerConfig;
using FJS::Driver::AnalyzerState;
using FJS::Driver::ProjectAnalyzer;

namespace {

const char* kManifest = "name: demo\nversion: 1.0.0\n";

const char* kModelSource = R"(
class Item {
  final String name;
  Item(this.name);
}
)";

const char* kWidgetSource = R"(
import 'package:flutter/material.dart';
import 'package:demo/a.dart';

class W extends StatefulWidget {
  const W({super.key, required this.item});
  final Item item;

  @override
  State<W> createState() => _WState();
}

class _WState extends State<W> {
  @override
  Widget build(BuildContext context) => Text(widget.item.name);
}
)";

const char* kHomeSource = R"(
import 'package:flutter/material.dart';
import 'b.dart';
import 'a.dart';

class Home extends StatelessWidget {
  const Home({super.key});

  @override
  Widget build(BuildContext context) => W(item: Item('x'));
}
)";

/**
 * Writes a three-file project: a.dart <- b.dart <- c.dart
 */
class ProjectFixture : public ::testing::Test {
protected:
    TestSupport::TempDir dir;
    std::string a;
    std::string b;
    std::string c;

    void SetUp() override {
        dir.write("pubspec.yaml", kManifest);
        a = dir.write("lib/a.dart", kModelSource);
        b = dir.write("lib/b.dart", kWidgetSource);
        c = dir.write("lib/c.dart", kHomeSource);
    }

    AnalyzerConfig config() const {
        AnalyzerConfig cfg;
        cfg.projectRoot = dir.path();
        cfg.maxParallelism = 2;
        return cfg;
    }
};

} // namespace

TEST_F(ProjectFixture, FirstRunAnalyzesEverything) {
    ProjectAnalyzer analyzer(config());
    auto result = analyzer.analyze();

    ASSERT_TRUE(result.success()) << result.errorMessage;
    EXPECT_EQ(analyzer.state(), AnalyzerState::Complete);
    EXPECT_EQ(analyzer.packageName(), "demo");
    EXPECT_EQ(result.analysisOrder, std::vector<std::string>({a, b, c}));
    EXPECT_EQ(result.dirtyFiles, std::set<std::string>({a, b, c}));
    EXPECT_TRUE(result.failures.empty());

    const auto& app = result.application;
    ASSERT_EQ(app.components.size(), 2u);
    const auto* w = app.findComponent("W");
    ASSERT_NE(w, nullptr);
    EXPECT_EQ(w->stateHolderId, b + "#_WState");
    EXPECT_TRUE(app.graph.hasEdge(c + "#Home", b + "#W", IR::GraphEdgeKind::Composes));
    EXPECT_EQ(app.resolvedImports.at(c), std::set<std::string>({a, b}));

    EXPECT_TRUE(result.validation.errors.empty()) << result.validation.getSummary();
    EXPECT_TRUE(result.isValid());

    EXPECT_EQ(result.statistics.totalFiles, 3u);
    EXPECT_EQ(result.statistics.processedFiles, 3u);
    EXPECT_EQ(result.statistics.cachedFiles, 0u);
    EXPECT_TRUE(analyzer.registry().isRegistered("_WState"));
}

TEST_F(ProjectFixture, BatchesNeverMixDependentFiles) {
    ProjectAnalyzer analyzer(config());
    auto result = analyzer.analyze();
    ASSERT_TRUE(result.success());

    // a <- b <- c is a chain, so every batch holds exactly one file
    ASSERT_EQ(result.batches.size(), 3u);
    EXPECT_EQ(result.batches[0], std::vector<std::string>({a}));
    EXPECT_EQ(result.batches[1], std::vector<std::string>({b}));
    EXPECT_EQ(result.batches[2], std::vector<std::string>({c}));
}

TEST_F(ProjectFixture, UnchangedSecondRunUsesCache) {
    ProjectAnalyzer analyzer(config());
    auto first = analyzer.analyze();
    ASSERT_TRUE(first.success());

    auto second = analyzer.analyze();
    ASSERT_TRUE(second.success());
    EXPECT_TRUE(second.dirtyFiles.empty());
    EXPECT_TRUE(second.batches.empty());
    EXPECT_EQ(second.statistics.cachedFiles, 3u);
    EXPECT_EQ(second.statistics.processedFiles, 0u);
    EXPECT_DOUBLE_EQ(second.statistics.cacheHitRate(), 1.0);
    EXPECT_EQ(second.application, first.application);
}

TEST_F(ProjectFixture, CacheSurvivesNewAnalyzerInstance) {
    IR::ApplicationDeclaration firstApp;
    {
        ProjectAnalyzer analyzer(config());
        auto first = analyzer.analyze();
        ASSERT_TRUE(first.success());
        firstApp = first.application;
    }

    ProjectAnalyzer fresh(config());
    auto second = fresh.analyze();
    ASSERT_TRUE(second.success());
    EXPECT_TRUE(second.dirtyFiles.empty());
    EXPECT_EQ(second.application, firstApp);
    // Symbols come back from the cached IR without reparsing
    EXPECT_TRUE(fresh.registry().isRegistered("W"));
    EXPECT_TRUE(fresh.registry().lookup("W")->isStatefulComponent);
}

TEST_F(ProjectFixture, ChangeInvalidatesTransitiveDependents) {
    ProjectAnalyzer analyzer(config());
    ASSERT_TRUE(analyzer.analyze().success());

    dir.write("lib/a.dart", std::string(kModelSource) + "\nclass Extra {}\n");
    auto result = analyzer.analyze();
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.dirtyFiles, std::set<std::string>({a, b, c}));

    dir.write("lib/c.dart", std::string(kHomeSource) + "\nint helper() => 1;\n");
    result = analyzer.analyze();
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.dirtyFiles, std::set<std::string>({c}));
    EXPECT_EQ(result.statistics.cachedFiles, 2u);
    EXPECT_EQ(result.application.fileStructure.at(c),
              std::vector<std::string>({"Component:Home", "Function:helper"}));
}

TEST_F(ProjectFixture, WhitespaceOnlyEditIsNotAChange) {
    ProjectAnalyzer analyzer(config());
    ASSERT_TRUE(analyzer.analyze().success());

    dir.write("lib/b.dart", std::string("\n\n") + kWidgetSource + "\n   \n");
    auto result = analyzer.analyze();
    ASSERT_TRUE(result.success());
    EXPECT_TRUE(result.dirtyFiles.empty());
}

TEST_F(ProjectFixture, MissingCacheBlobPromotesFileToDirty) {
    ProjectAnalyzer analyzer(config());
    ASSERT_TRUE(analyzer.analyze().success());

    ProjectAnalyzer second(config());
    second.initialize();
    ASSERT_NE(second.cache(), nullptr);
    std::filesystem::remove(second.cache()->blobPath(b));

    auto result = second.analyze();
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.dirtyFiles, std::set<std::string>({b, c}));
}

TEST_F(ProjectFixture, UnwrittenBlobLeavesNoHash) {
    ProjectAnalyzer analyzer(config());
    analyzer.initialize();
    ASSERT_NE(analyzer.cache(), nullptr);
    std::string blocked = analyzer.cache()->blobPath(a);
    std::filesystem::create_directories(std::filesystem::path(blocked) / "keep");

    ASSERT_TRUE(analyzer.analyze().success());
    EXPECT_FALSE(analyzer.cache()->hashOf(a).has_value());
    EXPECT_TRUE(analyzer.cache()->hashOf(b).has_value());

    std::filesystem::remove_all(blocked);
    auto result = analyzer.analyze();
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.dirtyFiles.count(a), 1u);
}

TEST_F(ProjectFixture, ParseFailureIsIsolatedToItsFile) {
    dir.write("lib/d.dart", "class Broken extends {\n");

    ProjectAnalyzer analyzer(config());
    auto result = analyzer.analyze();

    ASSERT_TRUE(result.success()) << result.errorMessage;
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].file, dir.identity("lib/d.dart"));
    EXPECT_EQ(result.statistics.failedFiles, 1u);
    EXPECT_EQ(result.statistics.processedFiles, 3u);
    EXPECT_NE(result.application.findComponent("Home"), nullptr);

    // The failed file has no cached IR and stays dirty
    auto again = analyzer.analyze();
    EXPECT_EQ(again.dirtyFiles, std::set<std::string>({dir.identity("lib/d.dart")}));
}

TEST_F(ProjectFixture, DeletedFileIsPrunedFromRegistryAndCache) {
    ProjectAnalyzer analyzer(config());
    ASSERT_TRUE(analyzer.analyze().success());
    ASSERT_TRUE(analyzer.registry().isRegistered("Home"));

    std::filesystem::remove(c);
    auto result = analyzer.analyze();
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.analysisOrder, std::vector<std::string>({a, b}));
    EXPECT_FALSE(analyzer.registry().isRegistered("Home"));
    EXPECT_FALSE(analyzer.cache()->hashOf(c).has_value());
    EXPECT_EQ(result.application.findComponent("Home"), nullptr);
}

TEST_F(ProjectFixture, ProgressCoversEveryPhase) {
    std::set<int> phases;
    AnalyzerConfig cfg = config();
    cfg.progress = [&phases](const Driver::ProgressEvent& event) { phases.insert(event.phase); };

    ProjectAnalyzer analyzer(cfg);
    ASSERT_TRUE(analyzer.analyze().success());
    EXPECT_EQ(phases, std::set<int>({1, 2, 3, 4, 5, 6}));
}

TEST_F(ProjectFixture, CacheCanBeDisabled) {
    AnalyzerConfig cfg = config();
    cfg.enableCache = false;

    ProjectAnalyzer analyzer(cfg);
    ASSERT_TRUE(analyzer.analyze().success());
    EXPECT_EQ(analyzer.cache(), nullptr);

    auto second = analyzer.analyze();
    EXPECT_EQ(second.dirtyFiles.size(), 3u);
    EXPECT_FALSE(std::filesystem::exists(dir.path() + "/.fjs_cache"));
}

TEST_F(ProjectFixture, AnalyzeFileExtractsOneFile) {
    ProjectAnalyzer analyzer(config());
    ASSERT_TRUE(analyzer.analyze().success());

    IR::FileDeclaration declaration = analyzer.analyzeFile(b);
    EXPECT_EQ(declaration.file, b);
    ASSERT_EQ(declaration.components.size(), 1u);
    EXPECT_EQ(declaration.components[0].name, "W");
}

TEST_F(ProjectFixture, ImportCycleIsFatal) {
    dir.write("lib/x.dart", "import 'y.dart';\nclass X {}\n");
    dir.write("lib/y.dart", "import 'x.dart';\nclass Y {}\n");

    ProjectAnalyzer analyzer(config());
    auto result = analyzer.analyze();
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.state, AnalyzerState::Error);
    EXPECT_EQ(result.errorCode, Common::ErrorCode::CircularImport);
}

TEST(ProjectAnalyzerTest, MissingProjectRootIsFatal) {
    TestSupport::TempDir dir;
    AnalyzerConfig cfg;
    cfg.projectRoot = dir.path() + "/nowhere";

    ProjectAnalyzer analyzer(cfg);
    try {
        analyzer.initialize();
        FAIL() << "expected FatalError";
    } catch (const Common::FatalError& e) {
        EXPECT_EQ(e.code(), Common::ErrorCode::ProjectRootNotFound);
    }

    auto result = analyzer.analyze();
    EXPECT_EQ(result.state, AnalyzerState::Error);
    EXPECT_EQ(result.errorCode, Common::ErrorCode::ProjectRootNotFound);
}

TEST(ProjectAnalyzerTest, MissingSourceRootOrManifestIsFatal) {
    TestSupport::TempDir dir;
    dir.write("pubspec.yaml", kManifest);

    AnalyzerConfig cfg;
    cfg.projectRoot = dir.path();
    try {
        ProjectAnalyzer(cfg).initialize();
        FAIL() << "expected FatalError";
    } catch (const Common::FatalError& e) {
        EXPECT_EQ(e.code(), Common::ErrorCode::ProjectRootNotFound);
    }

    std::filesystem::remove(dir.path() + "/pubspec.yaml");
    dir.write("lib/a.dart", kModelSource);
    try {
        ProjectAnalyzer(cfg).initialize();
        FAIL() << "expected FatalError";
    } catch (const Common::FatalError& e) {
        EXPECT_EQ(e.code(), Common::ErrorCode::ManifestNotFound);
    }
}
