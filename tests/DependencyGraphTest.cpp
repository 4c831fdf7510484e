#include <gtest/gtest.h>
#include <algorithm>
#include "Import/DependencyGraph.h"

using namespace FJS::Import;

namespace {

size_t indexOf(const std::vector<std::string>& order, const std::string& file) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), file) - order.begin());
}

} // namespace

TEST(DependencyGraphTest, TopologicalSortPlacesDependenciesFirst) {
    DependencyGraph graph;
    graph.addEdge("main", "app");
    graph.addEdge("app", "widgets");
    graph.addEdge("app", "model");
    graph.addEdge("widgets", "model");

    auto order = graph.topologicalSort();
    ASSERT_EQ(order.size(), 4u);
    EXPECT_LT(indexOf(order, "model"), indexOf(order, "widgets"));
    EXPECT_LT(indexOf(order, "widgets"), indexOf(order, "app"));
    EXPECT_LT(indexOf(order, "app"), indexOf(order, "main"));
}

TEST(DependencyGraphTest, AddEdgeIsIdempotentAndAddsEndpoints) {
    DependencyGraph graph;
    graph.addEdge("a", "b");
    graph.addEdge("a", "b");

    EXPECT_TRUE(graph.contains("a"));
    EXPECT_TRUE(graph.contains("b"));
    EXPECT_EQ(graph.size(), 2u);
    EXPECT_EQ(graph.edgeCount(), 1u);
    EXPECT_EQ(graph.dependenciesOf("a"), std::set<std::string>({"b"}));
    EXPECT_EQ(graph.dependentsOf("b"), std::set<std::string>({"a"}));
    EXPECT_TRUE(graph.dependenciesOf("missing").empty());
}

TEST(DependencyGraphTest, IsolatedNodesAppearInOrder) {
    DependencyGraph graph;
    graph.addNode("lonely");
    graph.addEdge("x", "y");

    auto order = graph.topologicalSort();
    EXPECT_EQ(order.size(), 3u);
    EXPECT_NE(std::find(order.begin(), order.end(), "lonely"), order.end());
}

TEST(DependencyGraphTest, ThreeFileCycleFailsSortAndIsReported) {
    DependencyGraph graph;
    graph.addEdge("A", "B");
    graph.addEdge("B", "C");
    graph.addEdge("C", "A");

    EXPECT_THROW(graph.topologicalSort(), CircularDependencyError);
    EXPECT_TRUE(graph.hasCircularDependencies());

    auto check = graph.checkCycles();
    EXPECT_FALSE(check.isAcyclic());
    ASSERT_FALSE(check.cycles.empty());

    const auto& cycle = check.cycles.front();
    EXPECT_EQ(cycle.front(), cycle.back());
    for (const char* node : {"A", "B", "C"}) {
        EXPECT_NE(std::find(cycle.begin(), cycle.end(), node), cycle.end()) << node;
    }
}

TEST(DependencyGraphTest, CircularDependencyErrorNamesNodeInCycle) {
    DependencyGraph graph;
    graph.addEdge("A", "B");
    graph.addEdge("B", "A");
    graph.addEdge("C", "A");

    try {
        graph.topologicalSort();
        FAIL() << "expected CircularDependencyError";
    } catch (const CircularDependencyError& e) {
        EXPECT_TRUE(e.node() == "A" || e.node() == "B") << e.node();
    }
}

TEST(DependencyGraphTest, AcyclicGraphHasNoCycles) {
    DependencyGraph graph;
    graph.addEdge("a", "b");
    graph.addEdge("b", "c");

    auto check = graph.checkCycles();
    EXPECT_TRUE(check.isAcyclic());
    EXPECT_TRUE(check.cycles.empty());
    EXPECT_FALSE(graph.hasCircularDependencies());
}

TEST(DependencyGraphTest, TransitiveDependentsIsInvalidationClosure) {
    DependencyGraph graph;
    graph.addEdge("screen", "button");
    graph.addEdge("app", "screen");
    graph.addEdge("settings", "theme");

    auto affected = graph.transitiveDependentsOf("button");
    EXPECT_EQ(affected, std::set<std::string>({"screen", "app"}));
    EXPECT_TRUE(graph.transitiveDependentsOf("app").empty());
}

TEST(DependencyGraphTest, TransitiveDependentsTerminatesOnCycle) {
    DependencyGraph graph;
    graph.addEdge("a", "b");
    graph.addEdge("b", "a");

    auto affected = graph.transitiveDependentsOf("a");
    EXPECT_EQ(affected, std::set<std::string>({"a", "b"}));
}

TEST(DependencyGraphTest, ClearEmptiesGraph) {
    DependencyGraph graph;
    graph.addEdge("a", "b");
    graph.clear();
    EXPECT_EQ(graph.size(), 0u);
    EXPECT_EQ(graph.edgeCount(), 0u);
    EXPECT_TRUE(graph.topologicalSort().empty());
}
