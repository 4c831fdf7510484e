#pragma once
#include <string>
#include <vector>
#include <map>

namespace FJS {
namespace IR {

enum class GraphNodeKind {
    Component,
    StateHolder,
    ObservableState
};

enum class GraphEdgeKind {
    HasState,   // component -> its state holder
    Composes,   // component -> child component rendered in its build tree
    DependsOn   // component or state holder -> observable state it reads
};

struct GraphEdge {
    std::string from;
    std::string to;
    GraphEdgeKind kind = GraphEdgeKind::Composes;
    std::string detail;  // e.g. the access pattern that produced a depends-on edge

    bool operator==(const GraphEdge& other) const = default;
};

// Relationship graph between components, state holders and observable state
class ComponentGraph {
private:
    std::map<std::string, GraphNodeKind> nodes_;
    std::vector<GraphEdge> edges_;

public:
    void addNode(const std::string& id, GraphNodeKind kind);

    // Returns false when an edge with the same endpoints and kind exists
    bool addEdge(const std::string& from, const std::string& to, GraphEdgeKind kind,
                 const std::string& detail = "");

    bool hasNode(const std::string& id) const;
    bool hasEdge(const std::string& from, const std::string& to, GraphEdgeKind kind) const;

    std::vector<GraphEdge> edgesFrom(const std::string& id) const;
    std::vector<GraphEdge> edgesOfKind(GraphEdgeKind kind) const;
    size_t countEdges(GraphEdgeKind kind) const;

    const std::map<std::string, GraphNodeKind>& nodes() const { return nodes_; }
    const std::vector<GraphEdge>& edges() const { return edges_; }

    void clear();

    bool operator==(const ComponentGraph& other) const = default;
};

std::string graphNodeKindToString(GraphNodeKind kind);
std::string graphEdgeKindToString(GraphEdgeKind kind);

} // namespace IR
} // namespace FJS
