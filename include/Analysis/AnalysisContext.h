#pragma once
#include <string>
#include <set>
#include "../Semantic/SymbolRegistry.h"
#include "../Import/DependencyGraph.h"

namespace FJS {
namespace Analysis {

/**
 * Read-only view handed to the extractor for one file: the file being
 * extracted, the project registry and the (immutable) import graph.
 */
struct AnalysisContext {
    std::string file;
    const Semantic::SymbolRegistry& registry;
    const Import::DependencyGraph& graph;
    std::set<std::string> resolvedImports;  // Direct dependencies of `file`

    AnalysisContext(const std::string& f, const Semantic::SymbolRegistry& reg,
                    const Import::DependencyGraph& g)
        : file(f), registry(reg), graph(g), resolvedImports(g.dependenciesOf(f)) {}

    // Type visible from this file (declared here or in a direct import)
    bool isTypeAvailable(const std::string& name) const {
        return registry.isAvailableIn(name, file, resolvedImports);
    }
};

} // namespace Analysis
} // namespace FJS
