#include "Analysis/DeclarationValidator.h"
#include "Analysis/DeclarationLinker.h"
#include "IR/IRPrinter.h"
#include <algorithm>
#include <cctype>
#include <map>

namespace FJS {
namespace Analysis {

using Common::ErrorCode;

std::string ValidationIssue::toString() const {
    std::string where = location.isValid() ? location.toString() : file;
    return "[" + Common::errorCodeName(code) + "] " + (where.empty() ? "" : where + ": ") + message;
}

size_t ValidationResult::countOf(Common::ErrorCode code) const {
    auto matches = [code](const ValidationIssue& issue) { return issue.code == code; };
    return static_cast<size_t>(std::count_if(errors.begin(), errors.end(), matches) +
                               std::count_if(warnings.begin(), warnings.end(), matches));
}

DeclarationValidator::DeclarationValidator(const Semantic::SymbolRegistry& registry)
    : registry_(registry) {}

ValidationResult DeclarationValidator::validate(const IR::ApplicationDeclaration& app) const {
    ValidationResult result;
    checkDuplicates(app, result);
    checkComponents(app, result);
    checkProperties(app, result);
    checkStateHolders(app, result);
    checkObservables(app, result);
    checkComponentCycles(app, result);
    checkImports(app, result);
    return result;
}

//==============================================================================
// Duplicates
//==============================================================================

void DeclarationValidator::checkDuplicates(const IR::ApplicationDeclaration& app, ValidationResult& result) const {
    auto check = [&result](const std::string& category, const auto& declarations) {
        std::map<std::string, std::string> firstFile;
        for (const auto& decl : declarations) {
            auto [it, inserted] = firstFile.emplace(decl.name, decl.file);
            if (!inserted) {
                result.addError({ErrorCode::DuplicateDeclaration,
                                 "Duplicate " + category + " '" + decl.name + "' (first declared in " + it->second + ")",
                                 decl.file, decl.location, decl.name});
            }
        }
    };

    check("component", app.components);
    check("state holder", app.stateHolders);
    check("observable state", app.observables);
}

//==============================================================================
// Components
//==============================================================================

void DeclarationValidator::checkComponents(const IR::ApplicationDeclaration& app, ValidationResult& result) const {
    for (const auto& component : app.components) {
        if (!component.isStateful()) {
            if (!component.build) {
                result.addError({ErrorCode::MissingBuildMethod,
                                 "Component '" + component.name + "' has no build method",
                                 component.file, component.location, component.name});
            }
            continue;
        }

        if (component.stateHolderId.empty()) {
            std::string expected = component.stateHolderName.empty() ? "" : " '" + component.stateHolderName + "'";
            result.addError({ErrorCode::MissingStateClass,
                             "Stateful component '" + component.name + "' has no state class" + expected,
                             component.file, component.location, component.name});
            continue;
        }

        for (const auto& holder : app.stateHolders) {
            if (holder.id == component.stateHolderId && !holder.build) {
                result.addError({ErrorCode::MissingBuildMethod,
                                 "State class '" + holder.name + "' of '" + component.name + "' has no build method",
                                 holder.file, holder.location, holder.name});
            }
        }
    }
}

void DeclarationValidator::checkProperties(const IR::ApplicationDeclaration& app, ValidationResult& result) const {
    for (const auto& component : app.components) {
        for (const auto& property : component.properties) {
            if (property.isRequired && property.defaultValue) {
                result.addWarning({ErrorCode::RedundantDefault,
                                   "Property '" + property.name + "' of '" + component.name +
                                   "' is required but also has a default value",
                                   component.file, property.location, component.name});
            }

            if (property.typeName.empty() || property.typeName.find("Function") != std::string::npos) {
                continue;
            }
            for (const auto& name : referencedTypeNames(property.typeName)) {
                if (!isKnownType(name)) {
                    result.addWarning({ErrorCode::UnknownType,
                                       "Property '" + property.name + "' of '" + component.name +
                                       "' has unknown type '" + name + "'",
                                       component.file, property.location, component.name});
                }
            }
        }
    }
}

bool DeclarationValidator::isKnownType(const std::string& name) const {
    return Semantic::SymbolRegistry::isBuiltinType(name) || registry_.isRegistered(name);
}

std::vector<std::string> DeclarationValidator::referencedTypeNames(const std::string& typeName) {
    std::vector<std::string> names;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            names.push_back(current);
            current.clear();
        }
    };

    for (char c : typeName) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$') {
            current += c;
        } else if (c == '.') {
            // `ui.Color` -> `Color`
            current.clear();
        } else {
            flush();
        }
    }
    flush();
    return names;
}

//==============================================================================
// State holders
//==============================================================================

void DeclarationValidator::checkStateHolders(const IR::ApplicationDeclaration& app, ValidationResult& result) const {
    for (const auto& holder : app.stateHolders) {
        if (holder.componentName.empty() || !app.findComponent(holder.componentName)) {
            std::string target = holder.componentName.empty() ? "no component" : "'" + holder.componentName + "'";
            result.addWarning({ErrorCode::OrphanedStateHolder,
                               "State class '" + holder.name + "' refers to " + target + " which is not declared",
                               holder.file, holder.location, holder.name});
        }

        if (holder.controllers.empty()) continue;

        if (!holder.dispose) {
            result.addWarning({ErrorCode::MissingDispose,
                               "State class '" + holder.name + "' owns controllers but has no dispose method",
                               holder.file, holder.location, holder.name});
            continue;
        }

        std::string disposeText = DeclarationLinker::functionText(*holder.dispose);
        for (const auto& controller : holder.controllers) {
            bool disposed = disposeText.find(controller + ".dispose()") != std::string::npos ||
                            disposeText.find(controller + "?.dispose()") != std::string::npos;
            if (!disposed) {
                result.addWarning({ErrorCode::UndisposedController,
                                   "Controller '" + controller + "' of '" + holder.name + "' is never disposed",
                                   holder.file, holder.dispose->location, holder.name});
            }
        }
    }
}

//==============================================================================
// Observable state
//==============================================================================

bool DeclarationValidator::isAssumedMutator(const IR::FunctionDeclaration& function) {
    if (function.kind != IR::FunctionKind::Method || function.isStatic || !function.hasBody()) {
        return false;
    }
    return function.parameters.empty() && function.returnType == "void";
}

void DeclarationValidator::checkObservables(const IR::ApplicationDeclaration& app, ValidationResult& result) const {
    for (const auto& observable : app.observables) {
        for (const auto& method : observable.methods) {
            if (isAssumedMutator(method.function) && !method.notifiesListeners) {
                result.addWarning({ErrorCode::MissingNotifyListeners,
                                   "Method '" + method.function.name + "' of '" + observable.name +
                                   "' looks like a mutator but never notifies listeners",
                                   observable.file, method.function.location, observable.name});
            }
        }
    }
}

//==============================================================================
// Component cycles
//==============================================================================

void DeclarationValidator::checkComponentCycles(const IR::ApplicationDeclaration& app, ValidationResult& result) const {
    std::set<std::string> visited;
    std::set<std::string> recStack;
    std::vector<std::string> path;
    std::vector<std::vector<std::string>> cycles;

    for (const auto& [id, kind] : app.graph.nodes()) {
        if (kind == IR::GraphNodeKind::Component && visited.find(id) == visited.end()) {
            findCycles(app.graph, id, visited, recStack, path, cycles);
        }
    }

    for (const auto& cycle : cycles) {
        std::string rendered;
        for (const auto& id : cycle) {
            if (!rendered.empty()) rendered += " -> ";
            rendered += id.substr(id.rfind('#') + 1);
        }
        std::string file = cycle.front().substr(0, cycle.front().rfind('#'));
        result.addError({ErrorCode::CircularComponentDependency,
                         "Components render each other in a cycle: " + rendered,
                         file, {}, cycle.front().substr(cycle.front().rfind('#') + 1)});
    }
}

void DeclarationValidator::findCycles(const IR::ComponentGraph& graph, const std::string& node,
                                      std::set<std::string>& visited, std::set<std::string>& recStack,
                                      std::vector<std::string>& path,
                                      std::vector<std::vector<std::string>>& cycles) const {
    visited.insert(node);
    recStack.insert(node);
    path.push_back(node);

    for (const auto& edge : graph.edgesFrom(node)) {
        if (edge.kind != IR::GraphEdgeKind::Composes) continue;

        if (recStack.find(edge.to) != recStack.end()) {
            auto start = std::find(path.begin(), path.end(), edge.to);
            std::vector<std::string> cycle(start, path.end());
            cycle.push_back(edge.to);
            cycles.push_back(std::move(cycle));
        } else if (visited.find(edge.to) == visited.end()) {
            findCycles(graph, edge.to, visited, recStack, path, cycles);
        }
    }

    path.pop_back();
    recStack.erase(node);
}

//==============================================================================
// Imports
//==============================================================================

void DeclarationValidator::checkImports(const IR::ApplicationDeclaration& app, ValidationResult& result) const {
    for (const auto& [file, imports] : app.importsByFile) {
        std::set<std::pair<std::string, std::string>> seen;
        for (const auto& import : imports) {
            if (!seen.insert({import.uri, import.prefix}).second) {
                result.addWarning({ErrorCode::DuplicateImport,
                                   "Duplicate import of '" + import.uri + "'",
                                   file, import.location, ""});
            }
            if (import.isDeferred) {
                result.addWarning({ErrorCode::DeferredImport,
                                   "Deferred import of '" + import.uri + "' is loaded eagerly",
                                   file, import.location, ""});
            }
        }
    }
}

} // namespace Analysis
} // namespace FJS
