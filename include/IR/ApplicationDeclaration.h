#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include "Declarations.h"
#include "ComponentGraph.h"

namespace FJS {
namespace IR {

// Link-phase output: every file's declarations merged into one application
struct ApplicationDeclaration {
    std::vector<ComponentDeclaration> components;
    std::vector<StateHolderDeclaration> stateHolders;
    std::vector<PlainTypeDeclaration> plainTypes;  // Observable state excluded
    std::vector<ObservableStateDeclaration> observables;
    std::vector<FunctionDeclaration> functions;
    std::map<std::string, std::vector<ImportRecord>> importsByFile;
    std::map<std::string, std::set<std::string>> resolvedImports;  // file -> imported project files
    std::map<std::string, std::vector<std::string>> fileStructure;  // file -> ["Component:W", ...]
    ComponentGraph graph;

    const ComponentDeclaration* findComponent(const std::string& name) const;
    const StateHolderDeclaration* findStateHolder(const std::string& name) const;
    const ObservableStateDeclaration* findObservable(const std::string& name) const;

    size_t declarationCount() const;

    bool operator==(const ApplicationDeclaration& other) const = default;
};

} // namespace IR
} // namespace FJS
