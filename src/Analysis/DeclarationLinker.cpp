#include "Analysis/DeclarationLinker.h"
#include "IR/IRPrinter.h"
#include "Common/Debug.h"
#include <regex>
#include <set>

namespace FJS {
namespace Analysis {

using Semantic::SymbolRegistry;

namespace {

const std::regex kObservePattern(R"((?:Provider\.of|\.read|\.watch|\.select|Consumer|Selector)<\s*(\w+))");
const std::regex kValueAssignment(R"((^|[^\w.])(this\.)?value\s*(\?\?|[-+*/%])?=(?!=))");

// `ValueNotifier<List<int>>` -> `List<int>`
std::string firstTypeArgument(const std::string& typeName) {
    size_t open = typeName.find('<');
    size_t close = typeName.rfind('>');
    if (open == std::string::npos || close == std::string::npos || close <= open) {
        return "";
    }
    std::string argument = typeName.substr(open + 1, close - open - 1);
    int depth = 0;
    for (size_t i = 0; i < argument.size(); ++i) {
        if (argument[i] == '<') depth++;
        else if (argument[i] == '>') depth--;
        else if (argument[i] == ',' && depth == 0) return argument.substr(0, i);
    }
    return argument;
}

std::string fileStructureLabel(Semantic::TypeKind kind) {
    switch (kind) {
        case Semantic::TypeKind::Mixin: return "Mixin";
        case Semantic::TypeKind::Enum: return "Enum";
        case Semantic::TypeKind::TypeAlias: return "Typedef";
        case Semantic::TypeKind::Extension: return "Extension";
        default: return "Class";
    }
}

} // anonymous namespace

IR::ApplicationDeclaration DeclarationLinker::link(const std::map<std::string, IR::FileDeclaration>& fileDeclarations,
                                                   const Import::DependencyGraph& graph,
                                                   const SymbolRegistry& registry) const {
    IR::ApplicationDeclaration app;

    // 1. Concatenate
    for (const auto& [file, decl] : fileDeclarations) {
        app.components.insert(app.components.end(), decl.components.begin(), decl.components.end());
        app.stateHolders.insert(app.stateHolders.end(), decl.stateHolders.begin(), decl.stateHolders.end());
        app.plainTypes.insert(app.plainTypes.end(), decl.plainTypes.begin(), decl.plainTypes.end());
        app.functions.insert(app.functions.end(), decl.functions.begin(), decl.functions.end());
        app.importsByFile[file] = decl.imports;
        app.resolvedImports[file] = graph.dependenciesOf(file);
    }

    // 2-4
    reclassifyObservables(app, registry);
    bindStateHolders(app);
    buildGraph(app);
    buildFileStructure(app, fileDeclarations);

    DEBUG_OUT("[link] " << app.components.size() << " components, " << app.stateHolders.size()
              << " state holders, " << app.observables.size() << " observables, "
              << app.graph.edges().size() << " edges" << std::endl);
    return app;
}

//==============================================================================
// Observable state
//==============================================================================

void DeclarationLinker::reclassifyObservables(IR::ApplicationDeclaration& app,
                                              const SymbolRegistry& registry) const {
    std::vector<IR::PlainTypeDeclaration> remaining;

    for (auto& type : app.plainTypes) {
        bool isClass = type.kind == Semantic::TypeKind::Class || type.kind == Semantic::TypeKind::AbstractClass;
        if (!isClass) {
            remaining.push_back(std::move(type));
            continue;
        }

        std::string superBase = SymbolRegistry::baseTypeName(type.superType);
        bool mixesNotifier = false;
        for (const auto& mixin : type.mixins) {
            if (SymbolRegistry::baseTypeName(mixin) == "ChangeNotifier") {
                mixesNotifier = true;
            }
        }

        bool observable = superBase == "ChangeNotifier" || superBase == "ValueNotifier" || mixesNotifier;
        if (!observable) {
            auto descriptor = registry.lookup(type.name);
            observable = descriptor && descriptor->file == type.file && descriptor->isObservableState;
        }
        if (!observable) {
            remaining.push_back(std::move(type));
            continue;
        }

        IR::ObservableStateDeclaration state;
        state.id = type.id;
        state.name = type.name;
        state.file = type.file;
        state.location = type.location;
        state.fields = type.fields;
        if (superBase == "ValueNotifier") {
            state.kind = IR::ObservableKind::ValueNotifier;
            state.valueType = firstTypeArgument(type.superType);
        }
        for (const auto& method : type.methods) {
            IR::ObservableMethod observableMethod;
            observableMethod.function = method;
            observableMethod.notifiesListeners = notifiesListeners(method, state.kind);
            state.methods.push_back(std::move(observableMethod));
        }
        app.observables.push_back(std::move(state));
    }

    app.plainTypes = std::move(remaining);
}

bool DeclarationLinker::notifiesListeners(const IR::FunctionDeclaration& function, IR::ObservableKind kind) {
    std::string text = functionText(function);
    if (text.find("notifyListeners(") != std::string::npos) {
        return true;
    }
    return kind == IR::ObservableKind::ValueNotifier && std::regex_search(text, kValueAssignment);
}

std::string DeclarationLinker::functionText(const IR::FunctionDeclaration& function) {
    std::string text;
    if (function.body) {
        text += IR::IRPrinter::print(function.body);
    }
    if (function.expressionBody) {
        if (!text.empty()) text += "\n";
        text += IR::IRPrinter::print(function.expressionBody);
    }
    return text;
}

std::string DeclarationLinker::buildText(const IR::BuildDeclaration& build) {
    std::string text;
    if (build.body) {
        text += IR::IRPrinter::print(build.body);
    }
    if (build.expressionBody) {
        if (!text.empty()) text += "\n";
        text += IR::IRPrinter::print(build.expressionBody);
    }
    return text;
}

std::vector<std::string> DeclarationLinker::observedTypes(const std::string& text) {
    std::vector<std::string> types;
    std::set<std::string> seen;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), kObservePattern);
         it != std::sregex_iterator(); ++it) {
        std::string name = (*it)[1].str();
        if (seen.insert(name).second) {
            types.push_back(name);
        }
    }
    return types;
}

//==============================================================================
// Binding
//==============================================================================

void DeclarationLinker::bindStateHolders(IR::ApplicationDeclaration& app) const {
    for (auto& component : app.components) {
        if (!component.isStateful()) continue;

        const IR::StateHolderDeclaration* match = nullptr;
        for (const auto& holder : app.stateHolders) {
            if (holder.componentName != component.name) continue;
            // The holder created by createState wins over other candidates
            if (!match || (holder.name == component.stateHolderName && match->name != component.stateHolderName)) {
                match = &holder;
            }
        }

        if (match) {
            component.stateHolderId = match->id;
            if (component.stateHolderName.empty()) {
                component.stateHolderName = match->name;
            }
        } else {
            component.stateHolderId.clear();
        }
    }
}

//==============================================================================
// Component graph
//==============================================================================

void DeclarationLinker::buildGraph(IR::ApplicationDeclaration& app) const {
    auto& graph = app.graph;
    graph.clear();

    for (const auto& component : app.components) {
        graph.addNode(component.id, IR::GraphNodeKind::Component);
    }
    for (const auto& holder : app.stateHolders) {
        graph.addNode(holder.id, IR::GraphNodeKind::StateHolder);
    }
    for (const auto& observable : app.observables) {
        graph.addNode(observable.id, IR::GraphNodeKind::ObservableState);
    }

    for (const auto& component : app.components) {
        std::string text;
        if (component.build) {
            addComposesEdges(app, component.id, *component.build);
            text += buildText(*component.build);
        }
        for (const auto& method : component.methods) {
            text += "\n" + functionText(method);
        }
        addDependsOnEdges(app, component.id, text);

        if (component.isStateful() && !component.stateHolderId.empty()) {
            graph.addEdge(component.id, component.stateHolderId, IR::GraphEdgeKind::HasState);
            // A stateful component renders through its state holder
            for (const auto& holder : app.stateHolders) {
                if (holder.id == component.stateHolderId && holder.build) {
                    addComposesEdges(app, component.id, *holder.build);
                }
            }
        }
    }

    for (const auto& holder : app.stateHolders) {
        std::string text;
        if (holder.build) {
            text += buildText(*holder.build);
        }
        for (const auto* hook : {&holder.initState, &holder.dispose, &holder.didUpdateWidget,
                                 &holder.didChangeDependencies}) {
            if (*hook) {
                text += "\n" + functionText(**hook);
            }
        }
        for (const auto& method : holder.methods) {
            text += "\n" + functionText(method);
        }
        addDependsOnEdges(app, holder.id, text);
    }
}

void DeclarationLinker::addComposesEdges(IR::ApplicationDeclaration& app, const std::string& fromId,
                                         const IR::BuildDeclaration& build) const {
    std::vector<std::string> typeNames;
    if (build.tree) {
        build.tree->collectTypeNames(typeNames);
    }
    for (const auto& alternative : build.alternatives) {
        alternative.collectTypeNames(typeNames);
    }

    for (const auto& typeName : typeNames) {
        std::string base = SymbolRegistry::baseTypeName(typeName);
        const IR::ComponentDeclaration* child = app.findComponent(base);
        if (child) {
            app.graph.addEdge(fromId, child->id, IR::GraphEdgeKind::Composes, base);
        }
    }
}

void DeclarationLinker::addDependsOnEdges(IR::ApplicationDeclaration& app, const std::string& fromId,
                                          const std::string& text) const {
    for (const auto& typeName : observedTypes(text)) {
        const IR::ObservableStateDeclaration* observable = app.findObservable(typeName);
        if (observable) {
            app.graph.addEdge(fromId, observable->id, IR::GraphEdgeKind::DependsOn, typeName);
        }
    }
}

void DeclarationLinker::buildFileStructure(IR::ApplicationDeclaration& app,
                                           const std::map<std::string, IR::FileDeclaration>& fileDeclarations) const {
    std::set<std::string> observableIds;
    for (const auto& observable : app.observables) {
        observableIds.insert(observable.id);
    }

    for (const auto& [file, decl] : fileDeclarations) {
        auto& entries = app.fileStructure[file];
        for (const auto& component : decl.components) {
            entries.push_back("Component:" + component.name);
        }
        for (const auto& holder : decl.stateHolders) {
            entries.push_back("State:" + holder.name);
        }
        for (const auto& type : decl.plainTypes) {
            std::string label = observableIds.count(type.id) ? "Observable" : fileStructureLabel(type.kind);
            entries.push_back(label + ":" + type.name);
        }
        for (const auto& function : decl.functions) {
            entries.push_back("Function:" + function.name);
        }
    }
}

} // namespace Analysis
} // namespace FJS
