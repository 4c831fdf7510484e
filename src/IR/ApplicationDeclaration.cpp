#include "IR/ApplicationDeclaration.h"

namespace FJS {
namespace IR {

const ComponentDeclaration* ApplicationDeclaration::findComponent(const std::string& name) const {
    for (const auto& component : components) {
        if (component.name == name) {
            return &component;
        }
    }
    return nullptr;
}

const StateHolderDeclaration* ApplicationDeclaration::findStateHolder(const std::string& name) const {
    for (const auto& holder : stateHolders) {
        if (holder.name == name) {
            return &holder;
        }
    }
    return nullptr;
}

const ObservableStateDeclaration* ApplicationDeclaration::findObservable(const std::string& name) const {
    for (const auto& observable : observables) {
        if (observable.name == name) {
            return &observable;
        }
    }
    return nullptr;
}

size_t ApplicationDeclaration::declarationCount() const {
    return components.size() + stateHolders.size() + plainTypes.size() + observables.size() + functions.size();
}

} // namespace IR
} // namespace FJS
