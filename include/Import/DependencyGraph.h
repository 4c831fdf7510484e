#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include <stdexcept>

namespace FJS {
namespace Import {

// Thrown by topologicalSort when a back edge closes a cycle
class CircularDependencyError : public std::runtime_error {
public:
    explicit CircularDependencyError(const std::string& node)
        : std::runtime_error("Circular dependency detected at " + node), node_(node) {}

    const std::string& node() const { return node_; }

private:
    std::string node_;
};

enum class CycleStatus {
    Acyclic,
    Cyclic
};

// Single answer to "does the graph have cycles", with the cycles found
struct CycleCheckResult {
    CycleStatus status = CycleStatus::Acyclic;
    std::vector<std::vector<std::string>> cycles;

    bool isAcyclic() const { return status == CycleStatus::Acyclic; }
};

// Directed "imports" graph over file identities
class DependencyGraph {
private:
    // All files in the graph
    std::set<std::string> files;

    // file -> files it imports
    std::map<std::string, std::set<std::string>> dependencies;

    // file -> files importing it
    std::map<std::string, std::set<std::string>> dependents;

    // Helper for topological sort (DFS-based, throws on back edge)
    void topologicalSortUtil(const std::string& file,
                             std::set<std::string>& visiting,
                             std::set<std::string>& visited,
                             std::vector<std::string>& order) const;

    // Helper for cycle enumeration (DFS with explicit path stack)
    void detectCyclesUtil(const std::string& file,
                          std::set<std::string>& visited,
                          std::set<std::string>& recStack,
                          std::vector<std::string>& path,
                          std::vector<std::vector<std::string>>& cycles) const;

public:
    DependencyGraph() = default;

    // Add a file to the graph (idempotent)
    void addNode(const std::string& file);

    // Add an edge: `from` imports `to`. Missing endpoints are added; idempotent
    void addEdge(const std::string& from, const std::string& to);

    // Direct dependencies / dependents; empty for unknown files
    std::set<std::string> dependenciesOf(const std::string& file) const;
    std::set<std::string> dependentsOf(const std::string& file) const;

    // Every file that imports `file` directly or indirectly (excluding `file`
    // itself unless it sits on a cycle)
    std::set<std::string> transitiveDependentsOf(const std::string& file) const;

    // Dependencies before dependents. Throws CircularDependencyError
    std::vector<std::string> topologicalSort() const;

    // Enumerate cycles; each cycle ends with its closing node repeated.
    // Keeps scanning after the first cycle, so overlapping cycles may appear
    std::vector<std::vector<std::string>> detectCycles() const;

    // True if topologicalSort would throw
    bool hasCircularDependencies() const;

    // Acyclic, or Cyclic together with the enumerated cycles
    CycleCheckResult checkCycles() const;

    bool contains(const std::string& file) const;
    size_t size() const { return files.size(); }
    size_t edgeCount() const;
    const std::set<std::string>& nodes() const { return files; }

    // Print the dependency graph (for debugging)
    void print() const;

    void clear();
};

} // namespace Import
} // namespace FJS
