#pragma once
#include <string>
#include <vector>
#include <optional>
#include <utility>
#include "IRNodes.h"
#include "../Semantic/TypeDescriptor.h"
#include "../Common/SourceLocation.h"

namespace FJS {
namespace IR {

// Declaration-level IR. Every struct is a value type with structural
// equality so cached and freshly extracted declarations can be compared.

// Identity of a declaration: "<file>#<name>"
std::string makeDeclarationId(const std::string& file, const std::string& name);

struct FieldDeclaration {
    std::string name;
    std::string typeName;  // Empty when inferred
    bool isFinal = false;
    bool isConst = false;
    bool isLate = false;
    bool isStatic = false;
    ExprRef initializer;
    Common::SourceLocation location;

    bool operator==(const FieldDeclaration& other) const = default;
};

// Component property: a field merged with its constructor parameter
struct PropertyDeclaration {
    std::string name;
    std::string typeName;
    bool isFinal = false;
    bool isRequired = false;
    bool isNamed = false;
    ExprRef defaultValue;
    Common::SourceLocation location;

    bool operator==(const PropertyDeclaration& other) const = default;
};

struct ConstructorDeclaration {
    std::string name;  // Empty for the unnamed constructor
    std::vector<ParameterDeclaration> parameters;
    bool isConst = false;
    bool isFactory = false;
    // `x = v` as assignments, `super(...)` / `this.named(...)` / `assert(...)` as calls
    std::vector<ExprRef> initializers;
    std::string redirectTarget;
    StmtRef body;
    Common::SourceLocation location;

    bool operator==(const ConstructorDeclaration& other) const = default;
};

enum class FunctionKind {
    Function,
    Method,
    Getter,
    Setter,
    Operator
};

// Top-level functions and methods of every declaration kind
struct FunctionDeclaration {
    std::string name;
    FunctionKind kind = FunctionKind::Function;
    std::string returnType;  // Empty when omitted
    std::vector<ParameterDeclaration> parameters;
    std::vector<std::string> typeParameters;
    StmtRef body;             // Block body
    ExprRef expressionBody;   // `=> expr` body
    bool isAsync = false;
    bool isGenerator = false;
    bool isStatic = false;
    bool isAbstract = false;
    std::vector<std::string> annotations;
    Common::SourceLocation location;

    bool hasBody() const { return static_cast<bool>(body) || static_cast<bool>(expressionBody); }
    bool operator==(const FunctionDeclaration& other) const = default;
};

// Node of a reconstructed component tree
struct ComponentNode {
    std::string typeName;
    std::string constructorName;
    bool isConst = false;
    std::string slot;  // Argument that holds this node in its parent ("child", "body", ...); empty at the root
    std::vector<std::pair<std::string, std::string>> properties;  // Non-component arguments, printed
    std::vector<ComponentNode> children;

    // Every type name in the tree, root first
    void collectTypeNames(std::vector<std::string>& out) const;
    size_t nodeCount() const;

    bool operator==(const ComponentNode& other) const = default;
};

struct BuildDeclaration {
    std::string contextName;  // Name of the BuildContext parameter
    StmtRef body;
    ExprRef expressionBody;
    std::optional<ComponentNode> tree;    // Primary tree (first branch of a conditional return)
    std::vector<ComponentNode> alternatives;  // Every branch tree, primary included
    std::vector<std::string> conditionalNotes;
    Common::SourceLocation location;

    bool operator==(const BuildDeclaration& other) const = default;
};

enum class ComponentKind {
    Stateless,
    Stateful
};

struct ComponentDeclaration {
    std::string id;
    std::string name;
    ComponentKind kind = ComponentKind::Stateless;
    std::string file;
    std::string superType;
    std::vector<PropertyDeclaration> properties;
    std::vector<ConstructorDeclaration> constructors;
    std::optional<BuildDeclaration> build;
    std::vector<FunctionDeclaration> methods;
    std::vector<std::string> mixins;
    std::vector<std::string> interfaces;
    std::string stateHolderName;  // From the state factory; empty if not found
    std::string stateHolderId;    // Set by the linker when bound
    Common::SourceLocation location;

    bool isStateful() const { return kind == ComponentKind::Stateful; }
    bool operator==(const ComponentDeclaration& other) const = default;
};

struct StateHolderDeclaration {
    std::string id;
    std::string name;
    std::string file;
    std::string componentName;  // X in State<X>
    std::vector<FieldDeclaration> fields;
    std::optional<FunctionDeclaration> initState;
    std::optional<FunctionDeclaration> dispose;
    std::optional<FunctionDeclaration> didUpdateWidget;
    std::optional<FunctionDeclaration> didChangeDependencies;
    std::optional<BuildDeclaration> build;
    std::vector<FunctionDeclaration> methods;
    std::vector<std::string> controllers;  // Names of controller-like fields
    std::vector<std::string> mixins;
    Common::SourceLocation location;

    bool operator==(const StateHolderDeclaration& other) const = default;
};

struct PlainTypeDeclaration {
    std::string id;
    std::string name;
    std::string file;
    Semantic::TypeKind kind = Semantic::TypeKind::Class;
    std::string superType;
    std::vector<std::string> interfaces;
    std::vector<std::string> mixins;
    std::vector<std::string> typeParameters;
    std::vector<FieldDeclaration> fields;
    std::vector<ConstructorDeclaration> constructors;
    std::vector<FunctionDeclaration> methods;
    std::vector<std::string> enumValues;
    std::string aliasedType;   // typedef
    std::string extendedType;  // extension
    Common::SourceLocation location;

    bool operator==(const PlainTypeDeclaration& other) const = default;
};

enum class ObservableKind {
    ChangeNotifier,
    ValueNotifier
};

struct ObservableMethod {
    FunctionDeclaration function;
    bool notifiesListeners = false;

    bool operator==(const ObservableMethod& other) const = default;
};

// Plain type reclassified by the linker as a change-notifying state holder
struct ObservableStateDeclaration {
    std::string id;
    std::string name;
    std::string file;
    ObservableKind kind = ObservableKind::ChangeNotifier;
    std::string valueType;  // T of ValueNotifier<T>; empty for ChangeNotifier
    std::vector<FieldDeclaration> fields;
    std::vector<ObservableMethod> methods;
    Common::SourceLocation location;

    bool operator==(const ObservableStateDeclaration& other) const = default;
};

struct ImportRecord {
    std::string uri;
    std::string prefix;
    bool isDeferred = false;
    std::vector<std::string> show;
    std::vector<std::string> hide;
    Common::SourceLocation location;

    bool operator==(const ImportRecord& other) const = default;
};

// Per-file IR
struct FileDeclaration {
    std::string file;
    std::string libraryName;
    std::vector<ImportRecord> imports;
    std::vector<std::string> exports;
    std::vector<std::string> parts;
    std::vector<ComponentDeclaration> components;
    std::vector<StateHolderDeclaration> stateHolders;
    std::vector<PlainTypeDeclaration> plainTypes;
    std::vector<FunctionDeclaration> functions;
    std::vector<FieldDeclaration> topLevelVariables;

    // Registry entries for every type this file declares
    std::vector<Semantic::TypeDescriptor> typeDescriptors() const;

    bool operator==(const FileDeclaration& other) const = default;
};

std::string componentKindToString(ComponentKind kind);
std::string functionKindToString(FunctionKind kind);
std::string observableKindToString(ObservableKind kind);

} // namespace IR
} // namespace FJS
