#include "IR/Declarations.h"

namespace FJS {
namespace IR {

std::string makeDeclarationId(const std::string& file, const std::string& name) {
    return file + "#" + name;
}

void ComponentNode::collectTypeNames(std::vector<std::string>& out) const {
    out.push_back(typeName);
    for (const auto& child : children) {
        child.collectTypeNames(out);
    }
}

size_t ComponentNode::nodeCount() const {
    size_t count = 1;
    for (const auto& child : children) {
        count += child.nodeCount();
    }
    return count;
}

std::vector<Semantic::TypeDescriptor> FileDeclaration::typeDescriptors() const {
    std::vector<Semantic::TypeDescriptor> descriptors;

    for (const auto& component : components) {
        Semantic::TypeDescriptor descriptor;
        descriptor.name = component.name;
        descriptor.qualifiedName = component.id;
        descriptor.kind = Semantic::TypeKind::Class;
        descriptor.file = file;
        descriptor.superType = component.superType;
        descriptor.interfaces = component.interfaces;
        descriptor.mixins = component.mixins;
        descriptor.location = component.location;
        descriptors.push_back(std::move(descriptor));
    }

    for (const auto& holder : stateHolders) {
        Semantic::TypeDescriptor descriptor;
        descriptor.name = holder.name;
        descriptor.qualifiedName = holder.id;
        descriptor.kind = Semantic::TypeKind::Class;
        descriptor.file = file;
        descriptor.superType = "State";
        descriptor.mixins = holder.mixins;
        descriptor.location = holder.location;
        descriptors.push_back(std::move(descriptor));
    }

    for (const auto& type : plainTypes) {
        Semantic::TypeDescriptor descriptor;
        descriptor.name = type.name;
        descriptor.qualifiedName = type.id;
        descriptor.kind = type.kind;
        descriptor.file = file;
        descriptor.superType = type.superType;
        descriptor.interfaces = type.interfaces;
        descriptor.mixins = type.mixins;
        descriptor.typeParameters = type.typeParameters;
        descriptor.location = type.location;
        descriptors.push_back(std::move(descriptor));
    }

    return descriptors;
}

std::string componentKindToString(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Stateless: return "stateless";
        case ComponentKind::Stateful: return "stateful";
        default: return "unknown";
    }
}

std::string functionKindToString(FunctionKind kind) {
    switch (kind) {
        case FunctionKind::Function: return "function";
        case FunctionKind::Method: return "method";
        case FunctionKind::Getter: return "getter";
        case FunctionKind::Setter: return "setter";
        case FunctionKind::Operator: return "operator";
        default: return "unknown";
    }
}

std::string observableKindToString(ObservableKind kind) {
    switch (kind) {
        case ObservableKind::ChangeNotifier: return "ChangeNotifier";
        case ObservableKind::ValueNotifier: return "ValueNotifier";
        default: return "unknown";
    }
}

} // namespace IR
} // namespace FJS
