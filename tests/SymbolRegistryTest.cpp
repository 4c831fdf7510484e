#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "Semantic/SymbolRegistry.h"

using namespace FJS::Semantic;

namespace {

TypeDescriptor makeType(const std::string& name, const std::string& file, const std::string& superType = "") {
    TypeDescriptor descriptor;
    descriptor.name = name;
    descriptor.qualifiedName = file + "#" + name;
    descriptor.file = file;
    descriptor.superType = superType;
    return descriptor;
}

} // namespace

TEST(SymbolRegistryTest, ClassifiesByFrameworkRoot) {
    SymbolRegistry registry;
    registry.registerType(makeType("Counter", "/p/lib/counter.dart", "StatefulWidget"));
    registry.registerType(makeType("_CounterState", "/p/lib/counter.dart", "State<Counter>"));
    registry.registerType(makeType("Label", "/p/lib/label.dart", "StatelessWidget"));
    registry.registerType(makeType("CartModel", "/p/lib/cart.dart", "ChangeNotifier"));
    registry.registerType(makeType("Point", "/p/lib/point.dart"));

    auto counter = registry.lookup("Counter");
    ASSERT_TRUE(counter.has_value());
    EXPECT_TRUE(counter->isComponent);
    EXPECT_TRUE(counter->isStatefulComponent);
    EXPECT_FALSE(counter->isStatelessComponent);

    EXPECT_TRUE(registry.lookup("_CounterState")->isStateHolder);
    EXPECT_TRUE(registry.lookup("Label")->isStatelessComponent);
    EXPECT_TRUE(registry.lookup("CartModel")->isObservableState);

    auto point = registry.lookup("Point");
    EXPECT_FALSE(point->isComponent);
    EXPECT_FALSE(point->isStateHolder);
    EXPECT_FALSE(point->isObservableState);
}

TEST(SymbolRegistryTest, ClassificationFollowsProjectSupertypes) {
    SymbolRegistry registry;
    registry.replaceFile("/p/lib/base.dart", {
        makeType("FancyButton", "/p/lib/base.dart", "BaseButton"),
        makeType("BaseButton", "/p/lib/base.dart", "StatelessWidget")
    });

    EXPECT_TRUE(registry.lookup("FancyButton")->isStatelessComponent);
    EXPECT_TRUE(registry.lookup("BaseButton")->isStatelessComponent);
}

TEST(SymbolRegistryTest, ChangeNotifierMixinMarksObservable) {
    SymbolRegistry registry;
    TypeDescriptor settings = makeType("Settings", "/p/lib/settings.dart");
    settings.mixins = {"ChangeNotifier"};
    registry.registerType(settings);

    EXPECT_TRUE(registry.lookup("Settings")->isObservableState);
}

TEST(SymbolRegistryTest, ReplaceFileDropsStaleEntries) {
    SymbolRegistry registry;
    registry.replaceFile("/p/lib/a.dart", {makeType("Old", "/p/lib/a.dart"), makeType("Kept", "/p/lib/a.dart")});
    registry.replaceFile("/p/lib/a.dart", {makeType("Kept", "/p/lib/a.dart"), makeType("New", "/p/lib/a.dart")});

    EXPECT_FALSE(registry.isRegistered("Old"));
    EXPECT_TRUE(registry.isRegistered("Kept"));
    EXPECT_TRUE(registry.isRegistered("New"));
    EXPECT_EQ(registry.namesForFile("/p/lib/a.dart"), std::vector<std::string>({"Kept", "New"}));

    registry.removeAllForFile("/p/lib/a.dart");
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.hasEntriesForFile("/p/lib/a.dart"));
}

TEST(SymbolRegistryTest, LastWriterWinsAcrossFiles) {
    SymbolRegistry registry;
    registry.registerType(makeType("Item", "/p/lib/a.dart"));
    registry.registerType(makeType("Item", "/p/lib/b.dart"));

    EXPECT_EQ(registry.lookup("Item")->file, "/p/lib/b.dart");
    EXPECT_FALSE(registry.hasEntriesForFile("/p/lib/a.dart"));

    // Removing the file that lost the name must not remove the winner
    registry.removeAllForFile("/p/lib/a.dart");
    EXPECT_TRUE(registry.isRegistered("Item"));
}

TEST(SymbolRegistryTest, AvailabilityRequiresSameFileOrImport) {
    SymbolRegistry registry;
    registry.registerType(makeType("Button", "/p/lib/button.dart", "StatelessWidget"));

    EXPECT_TRUE(registry.isAvailableIn("Button", "/p/lib/button.dart", {}));
    EXPECT_TRUE(registry.isAvailableIn("Button", "/p/lib/home.dart", {"/p/lib/button.dart"}));
    EXPECT_FALSE(registry.isAvailableIn("Button", "/p/lib/home.dart", {"/p/lib/other.dart"}));
    EXPECT_FALSE(registry.isAvailableIn("Missing", "/p/lib/home.dart", {"/p/lib/button.dart"}));
}

TEST(SymbolRegistryTest, BuiltinsAndBaseNames) {
    EXPECT_TRUE(SymbolRegistry::isBuiltinType("Widget"));
    EXPECT_TRUE(SymbolRegistry::isBuiltinType("String"));
    EXPECT_TRUE(SymbolRegistry::isBuiltinType("BuildContext"));
    EXPECT_FALSE(SymbolRegistry::isBuiltinType("CartModel"));

    EXPECT_EQ(SymbolRegistry::baseTypeName("List<Item>?"), "List");
    EXPECT_EQ(SymbolRegistry::baseTypeName("ui.Color"), "Color");
    EXPECT_EQ(SymbolRegistry::baseTypeName("State<Counter>"), "State");
}

TEST(SymbolRegistryTest, ConcurrentRegistrationFromSeveralFiles) {
    SymbolRegistry registry;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t]() {
            std::string file = "/p/lib/f" + std::to_string(t) + ".dart";
            std::vector<TypeDescriptor> types;
            for (int i = 0; i < 50; ++i) {
                types.push_back(makeType("T" + std::to_string(t) + "_" + std::to_string(i), file));
            }
            registry.replaceFile(file, types);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry.size(), 200u);
    EXPECT_EQ(registry.getAllRegisteredTypes().size(), 200u);
}
