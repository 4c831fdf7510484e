#include "IR/ComponentGraph.h"

namespace FJS {
namespace IR {

void ComponentGraph::addNode(const std::string& id, GraphNodeKind kind) {
    nodes_[id] = kind;
}

bool ComponentGraph::addEdge(const std::string& from, const std::string& to, GraphEdgeKind kind,
                             const std::string& detail) {
    if (hasEdge(from, to, kind)) {
        return false;
    }
    edges_.push_back(GraphEdge{from, to, kind, detail});
    return true;
}

bool ComponentGraph::hasNode(const std::string& id) const {
    return nodes_.find(id) != nodes_.end();
}

bool ComponentGraph::hasEdge(const std::string& from, const std::string& to, GraphEdgeKind kind) const {
    for (const auto& edge : edges_) {
        if (edge.from == from && edge.to == to && edge.kind == kind) {
            return true;
        }
    }
    return false;
}

std::vector<GraphEdge> ComponentGraph::edgesFrom(const std::string& id) const {
    std::vector<GraphEdge> result;
    for (const auto& edge : edges_) {
        if (edge.from == id) {
            result.push_back(edge);
        }
    }
    return result;
}

std::vector<GraphEdge> ComponentGraph::edgesOfKind(GraphEdgeKind kind) const {
    std::vector<GraphEdge> result;
    for (const auto& edge : edges_) {
        if (edge.kind == kind) {
            result.push_back(edge);
        }
    }
    return result;
}

size_t ComponentGraph::countEdges(GraphEdgeKind kind) const {
    size_t count = 0;
    for (const auto& edge : edges_) {
        if (edge.kind == kind) {
            count++;
        }
    }
    return count;
}

void ComponentGraph::clear() {
    nodes_.clear();
    edges_.clear();
}

std::string graphNodeKindToString(GraphNodeKind kind) {
    switch (kind) {
        case GraphNodeKind::Component: return "component";
        case GraphNodeKind::StateHolder: return "state";
        case GraphNodeKind::ObservableState: return "observable";
        default: return "unknown";
    }
}

std::string graphEdgeKindToString(GraphEdgeKind kind) {
    switch (kind) {
        case GraphEdgeKind::HasState: return "has-state";
        case GraphEdgeKind::Composes: return "composes";
        case GraphEdgeKind::DependsOn: return "depends-on";
        default: return "unknown";
    }
}

} // namespace IR
} // namespace FJS
