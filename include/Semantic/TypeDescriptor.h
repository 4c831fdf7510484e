#pragma once
#include <string>
#include <vector>
#include "../Common/SourceLocation.h"

namespace FJS {
namespace Semantic {

enum class TypeKind {
    Class,
    AbstractClass,
    Mixin,
    Enum,
    TypeAlias,
    Extension
};

std::string typeKindToString(TypeKind kind);

// Registry entry for one declared type. Role flags are derived from the
// supertype chain when the descriptor is registered.
struct TypeDescriptor {
    std::string name;
    std::string qualifiedName;  // "<file>#<name>"
    TypeKind kind = TypeKind::Class;
    std::string file;
    std::string superType;      // Base name, no type arguments; empty if none
    std::vector<std::string> interfaces;
    std::vector<std::string> mixins;
    std::vector<std::string> typeParameters;

    bool isComponent = false;
    bool isStatefulComponent = false;
    bool isStatelessComponent = false;
    bool isStateHolder = false;
    bool isObservableState = false;

    Common::SourceLocation location;

    bool operator==(const TypeDescriptor& other) const = default;
};

} // namespace Semantic
} // namespace FJS
