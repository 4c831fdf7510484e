#pragma once
#include <string>
#include <vector>
#include <map>
#include "../IR/ApplicationDeclaration.h"
#include "../Import/DependencyGraph.h"
#include "../Semantic/SymbolRegistry.h"

namespace FJS {
namespace Analysis {

/**
 * Merges per-file IR into one ApplicationDeclaration.
 *
 * Steps, in order:
 *   1. concatenate declarations of every file (files in path order)
 *   2. reclassify notifier-derived plain types as observable state
 *   3. bind stateful components to the state holder naming them
 *   4. build the component graph (has-state, composes, depends-on)
 *
 * Unmatched bindings and unknown child types are left for the validator.
 */
class DeclarationLinker {
public:
    IR::ApplicationDeclaration link(const std::map<std::string, IR::FileDeclaration>& fileDeclarations,
                                    const Import::DependencyGraph& graph,
                                    const Semantic::SymbolRegistry& registry) const;

    // Type names read through Provider.of<T>, context.watch<T>, Consumer<T>, ...
    static std::vector<std::string> observedTypes(const std::string& text);

    // notifyListeners() call, or a `value` assignment for ValueNotifier
    static bool notifiesListeners(const IR::FunctionDeclaration& function, IR::ObservableKind kind);

    // Printed body of a function, empty for abstract members
    static std::string functionText(const IR::FunctionDeclaration& function);

private:
    void reclassifyObservables(IR::ApplicationDeclaration& app, const Semantic::SymbolRegistry& registry) const;
    void bindStateHolders(IR::ApplicationDeclaration& app) const;
    void buildGraph(IR::ApplicationDeclaration& app) const;
    void addComposesEdges(IR::ApplicationDeclaration& app, const std::string& fromId,
                          const IR::BuildDeclaration& build) const;
    void addDependsOnEdges(IR::ApplicationDeclaration& app, const std::string& fromId,
                           const std::string& text) const;
    void buildFileStructure(IR::ApplicationDeclaration& app,
                            const std::map<std::string, IR::FileDeclaration>& fileDeclarations) const;

    static std::string buildText(const IR::BuildDeclaration& build);
};

} // namespace Analysis
} // namespace FJS
