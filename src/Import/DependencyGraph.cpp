#include "Import/DependencyGraph.h"
#include <iostream>
#include <algorithm>
#include <deque>

namespace FJS {
namespace Import {

void DependencyGraph::addNode(const std::string& file) {
    files.insert(file);
    dependencies[file];
    dependents[file];
}

void DependencyGraph::addEdge(const std::string& from, const std::string& to) {
    addNode(from);
    addNode(to);
    dependencies[from].insert(to);
    dependents[to].insert(from);
}

std::set<std::string> DependencyGraph::dependenciesOf(const std::string& file) const {
    auto it = dependencies.find(file);
    if (it != dependencies.end()) {
        return it->second;
    }
    return {};
}

std::set<std::string> DependencyGraph::dependentsOf(const std::string& file) const {
    auto it = dependents.find(file);
    if (it != dependents.end()) {
        return it->second;
    }
    return {};
}

std::set<std::string> DependencyGraph::transitiveDependentsOf(const std::string& file) const {
    std::set<std::string> result;
    std::deque<std::string> toVisit;

    auto it = dependents.find(file);
    if (it != dependents.end()) {
        toVisit.insert(toVisit.end(), it->second.begin(), it->second.end());
    }

    while (!toVisit.empty()) {
        std::string current = toVisit.front();
        toVisit.pop_front();

        if (!result.insert(current).second) {
            continue;
        }

        auto depIt = dependents.find(current);
        if (depIt != dependents.end()) {
            for (const auto& dependent : depIt->second) {
                if (result.find(dependent) == result.end()) {
                    toVisit.push_back(dependent);
                }
            }
        }
    }

    return result;
}

void DependencyGraph::topologicalSortUtil(const std::string& file,
                                          std::set<std::string>& visiting,
                                          std::set<std::string>& visited,
                                          std::vector<std::string>& order) const {
    visiting.insert(file);

    auto it = dependencies.find(file);
    if (it != dependencies.end()) {
        for (const auto& dep : it->second) {
            if (visiting.find(dep) != visiting.end()) {
                throw CircularDependencyError(dep);
            }
            if (visited.find(dep) == visited.end()) {
                topologicalSortUtil(dep, visiting, visited, order);
            }
        }
    }

    visiting.erase(file);
    visited.insert(file);
    order.push_back(file);
}

std::vector<std::string> DependencyGraph::topologicalSort() const {
    std::set<std::string> visiting;
    std::set<std::string> visited;
    std::vector<std::string> order;
    order.reserve(files.size());

    for (const auto& file : files) {
        if (visited.find(file) == visited.end()) {
            topologicalSortUtil(file, visiting, visited, order);
        }
    }

    // Post-order already places dependencies before the files importing them
    return order;
}

void DependencyGraph::detectCyclesUtil(const std::string& file,
                                       std::set<std::string>& visited,
                                       std::set<std::string>& recStack,
                                       std::vector<std::string>& path,
                                       std::vector<std::vector<std::string>>& cycles) const {
    visited.insert(file);
    recStack.insert(file);
    path.push_back(file);

    auto it = dependencies.find(file);
    if (it != dependencies.end()) {
        for (const auto& dep : it->second) {
            if (recStack.find(dep) != recStack.end()) {
                // Found cycle: path segment from dep, closed by dep again
                auto start = std::find(path.begin(), path.end(), dep);
                std::vector<std::string> cycle(start, path.end());
                cycle.push_back(dep);
                cycles.push_back(std::move(cycle));
                continue;
            }

            if (visited.find(dep) == visited.end()) {
                detectCyclesUtil(dep, visited, recStack, path, cycles);
            }
        }
    }

    path.pop_back();
    recStack.erase(file);
}

std::vector<std::vector<std::string>> DependencyGraph::detectCycles() const {
    std::set<std::string> visited;
    std::set<std::string> recStack;
    std::vector<std::string> path;
    std::vector<std::vector<std::string>> cycles;

    for (const auto& file : files) {
        if (visited.find(file) == visited.end()) {
            detectCyclesUtil(file, visited, recStack, path, cycles);
        }
    }

    return cycles;
}

bool DependencyGraph::hasCircularDependencies() const {
    try {
        topologicalSort();
        return false;
    } catch (const CircularDependencyError&) {
        return true;
    }
}

CycleCheckResult DependencyGraph::checkCycles() const {
    CycleCheckResult result;
    result.cycles = detectCycles();
    result.status = result.cycles.empty() ? CycleStatus::Acyclic : CycleStatus::Cyclic;
    return result;
}

bool DependencyGraph::contains(const std::string& file) const {
    return files.find(file) != files.end();
}

size_t DependencyGraph::edgeCount() const {
    size_t count = 0;
    for (const auto& pair : dependencies) {
        count += pair.second.size();
    }
    return count;
}

void DependencyGraph::print() const {
    std::cout << "Dependency Graph:" << std::endl;
    for (const auto& pair : dependencies) {
        std::cout << "  " << pair.first << " -> [";
        size_t i = 0;
        for (const auto& dep : pair.second) {
            if (i++ > 0) std::cout << ", ";
            std::cout << dep;
        }
        std::cout << "]" << std::endl;
    }
}

void DependencyGraph::clear() {
    files.clear();
    dependencies.clear();
    dependents.clear();
}

} // namespace Import
} // namespace FJS
