#include <gtest/gtest.h>
#include "Import/DependencyResolver.h"
#include "Import/FileIdentity.h"
#include "TestSupport.h"

using namespace FJS;
using namespace FJS::Import;

TEST(DependencyResolverTest, ExtractReferencesSkipsDartUris) {
    std::string source =
        "import 'dart:async';\n"
        "import 'package:flutter/material.dart';\n"
        "import \"widgets/button.dart\" as btn;\n"
        "export 'src/model.dart' show Model;\n"
        "class A {}\n";

    auto references = DependencyResolver::extractReferences(source);
    ASSERT_EQ(references.size(), 3u);
    EXPECT_EQ(references[0], "package:flutter/material.dart");
    EXPECT_EQ(references[1], "widgets/button.dart");
    EXPECT_EQ(references[2], "src/model.dart");
}

TEST(DependencyResolverTest, PartDirectivesAreReferences) {
    std::string library =
        "library cart;\n"
        "import 'item.dart';\n"
        "part 'cart_total.dart';\n"
        "class Cart {}\n";
    EXPECT_EQ(DependencyResolver::extractReferences(library),
              std::vector<std::string>({"item.dart", "cart_total.dart"}));

    EXPECT_TRUE(DependencyResolver::extractReferences("part of 'cart.dart';\n").empty());
}

TEST(DependencyResolverTest, ReadPackageName) {
    EXPECT_EQ(DependencyResolver::readPackageName("name: my_app\nversion: 1.0.0\n"), "my_app");
    EXPECT_EQ(DependencyResolver::readPackageName("description: x\nname:   demo\n"), "demo");
    EXPECT_EQ(DependencyResolver::readPackageName("version: 1.0.0\n"), "");
}

TEST(DependencyResolverTest, ResolvesRelativeAndOwnPackageImports) {
    TestSupport::TempDir dir;
    std::string main = dir.write("lib/main.dart",
        "import 'package:demo/widgets/button.dart';\n"
        "import 'model.dart';\n"
        "import 'package:other/thing.dart';\n"
        "import 'missing.dart';\n");
    std::string button = dir.write("lib/widgets/button.dart", "import '../model.dart';\n");
    std::string model = dir.write("lib/model.dart", "class Model {}\n");

    DependencyResolver resolver(dir.path(), dir.identity("lib"), "demo");
    const auto& graph = resolver.buildGraph({main, button, model});

    EXPECT_EQ(graph.size(), 3u);
    EXPECT_EQ(graph.dependenciesOf(main), std::set<std::string>({button, model}));
    EXPECT_EQ(graph.dependenciesOf(button), std::set<std::string>({model}));
    EXPECT_TRUE(graph.dependenciesOf(model).empty());

    auto order = graph.topologicalSort();
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order.front(), model);
    EXPECT_EQ(order.back(), main);
}

TEST(DependencyResolverTest, UnresolvableUrisAreDropped) {
    TestSupport::TempDir dir;
    std::string main = dir.write("lib/main.dart", "");

    DependencyResolver resolver(dir.path(), dir.identity("lib"), "demo");
    EXPECT_FALSE(resolver.resolve("package:other/thing.dart", main).has_value());
    EXPECT_FALSE(resolver.resolve("nowhere.dart", main).has_value());
    EXPECT_FALSE(resolver.resolve("http://example.com/x.dart", main).has_value());
    EXPECT_EQ(resolver.cachedResolutions(), 3u);
}

TEST(DependencyResolverTest, FileIdentityHelpers) {
    TestSupport::TempDir dir;
    std::string file = dir.write("lib/a/b.dart", "");

    EXPECT_EQ(FileIdentity::of(dir.path() + "/lib/a/../a/b.dart"), file);
    EXPECT_EQ(FileIdentity::baseName(file), "b.dart");
    EXPECT_EQ(FileIdentity::relativeTo(file, dir.identity("lib")), "a/b.dart");
    EXPECT_EQ(FileIdentity::resolveRelative("../c.dart", file), dir.identity("lib/c.dart"));
}
