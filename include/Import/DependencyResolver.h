#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include "DependencyGraph.h"

namespace FJS {
namespace Import {

/**
 * Builds the project's DependencyGraph from a lexical scan of import,
 * export and part directives (`part of` is not a reference). Relative and own-package URIs are resolved to file
 * identities; `dart:` and third-party package URIs are dropped.
 */
class DependencyResolver {
private:
    std::string projectRoot;
    std::string sourceRoot;
    std::string packageName;

    DependencyGraph graph;

    // "<file>|<uri>" -> resolved identity (nullopt: unresolvable)
    std::map<std::string, std::optional<std::string>> resolutionCache;

    void analyzeFile(const std::string& file);

public:
    DependencyResolver(const std::string& projectRoot, const std::string& sourceRoot,
                       const std::string& packageName);

    // Scan every source file under the source root and return the graph
    const DependencyGraph& buildGraph(const std::vector<std::string>& sourceFiles);

    // Scan one file's contents and add its edges to the graph
    void addFile(const std::string& file, const std::string& content);

    // Import/export URIs in textual order, `dart:` URIs excluded
    static std::vector<std::string> extractReferences(const std::string& content);

    // Resolve one URI as seen from `fromFile`; nullopt when it does not name
    // an existing project file
    std::optional<std::string> resolve(const std::string& uri, const std::string& fromFile);

    // `name:` entry of a pubspec-style manifest; empty if absent
    static std::string readPackageName(const std::string& manifestContent);

    const DependencyGraph& getGraph() const { return graph; }
    const std::string& getPackageName() const { return packageName; }
    size_t cachedResolutions() const { return resolutionCache.size(); }
};

} // namespace Import
} // namespace FJS
