#include "Import/DependencyResolver.h"
#include "Import/FileIdentity.h"
#include "Utils/FileUtils.h"
#include "Common/Debug.h"
#include <regex>
#include <iostream>
#include <stdexcept>

namespace FJS {
namespace Import {

DependencyResolver::DependencyResolver(const std::string& projectRoot, const std::string& sourceRoot,
                                       const std::string& packageName)
    : projectRoot(FileIdentity::of(projectRoot)),
      sourceRoot(FileIdentity::of(sourceRoot)),
      packageName(packageName) {}

const DependencyGraph& DependencyResolver::buildGraph(const std::vector<std::string>& sourceFiles) {
    graph.clear();
    for (const auto& file : sourceFiles) {
        analyzeFile(file);
    }
    DEBUG_OUT("Dependency graph built: " << graph.size() << " files, " << graph.edgeCount() << " edges" << std::endl);
    return graph;
}

void DependencyResolver::analyzeFile(const std::string& file) {
    std::string identity = FileIdentity::of(file);
    std::string content;
    try {
        content = Utils::FileUtils::readFile(identity);
    } catch (const std::runtime_error& e) {
        std::cerr << "Warning: " << e.what() << std::endl;
        graph.addNode(identity);
        return;
    }
    addFile(identity, content);
}

void DependencyResolver::addFile(const std::string& file, const std::string& content) {
    graph.addNode(file);
    for (const auto& uri : extractReferences(content)) {
        auto resolved = resolve(uri, file);
        if (resolved) {
            graph.addEdge(file, *resolved);
        }
    }
}

std::vector<std::string> DependencyResolver::extractReferences(const std::string& content) {
    static const std::regex pattern(R"((?:^|[\n;])\s*(?:import|export|part)\s+(['"])([^'"]+)\1)");

    std::vector<std::string> references;
    auto begin = std::sregex_iterator(content.begin(), content.end(), pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        std::string uri = (*it)[2].str();
        if (uri.rfind("dart:", 0) == 0) {
            continue;
        }
        references.push_back(uri);
    }
    return references;
}

std::optional<std::string> DependencyResolver::resolve(const std::string& uri, const std::string& fromFile) {
    std::string key = fromFile + "|" + uri;
    auto cached = resolutionCache.find(key);
    if (cached != resolutionCache.end()) {
        return cached->second;
    }

    std::optional<std::string> resolved;
    const std::string packagePrefix = "package:";
    if (uri.rfind(packagePrefix, 0) == 0) {
        std::string rest = uri.substr(packagePrefix.size());
        size_t slash = rest.find('/');
        // Other packages are external to the project and never tracked
        if (slash != std::string::npos && !packageName.empty() && rest.substr(0, slash) == packageName) {
            resolved = FileIdentity::of(Utils::FileUtils::joinPath({sourceRoot, rest.substr(slash + 1)}));
        }
    } else if (uri.find(':') == std::string::npos) {
        resolved = FileIdentity::resolveRelative(uri, fromFile);
    }

    if (resolved && !Utils::FileUtils::fileExists(*resolved)) {
        DEBUG_OUT("Resolved import not found: " << *resolved << " (from " << uri << ")" << std::endl);
        resolved.reset();
    }

    resolutionCache[key] = resolved;
    return resolved;
}

std::string DependencyResolver::readPackageName(const std::string& manifestContent) {
    static const std::regex pattern(R"((?:^|\n)name:[ \t]*([A-Za-z_][A-Za-z0-9_]*))");
    std::smatch match;
    if (std::regex_search(manifestContent, match, pattern)) {
        return match[1].str();
    }
    return "";
}

} // namespace Import
} // namespace FJS
