#include "Semantic/SymbolRegistry.h"
#include <algorithm>
#include <unordered_set>

namespace FJS {
namespace Semantic {

std::string typeKindToString(TypeKind kind) {
    switch (kind) {
        case TypeKind::Class: return "class";
        case TypeKind::AbstractClass: return "abstract class";
        case TypeKind::Mixin: return "mixin";
        case TypeKind::Enum: return "enum";
        case TypeKind::TypeAlias: return "typedef";
        case TypeKind::Extension: return "extension";
        default: return "unknown";
    }
}

void SymbolRegistry::registerType(const TypeDescriptor& descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    insertLocked(descriptor);
    classifyLocked(types_[descriptor.name]);
}

void SymbolRegistry::replaceFile(const std::string& file, const std::vector<TypeDescriptor>& descriptors) {
    std::lock_guard<std::mutex> lock(mutex_);
    removeFileLocked(file);
    for (const auto& descriptor : descriptors) {
        insertLocked(descriptor);
    }
    // Second pass so supertypes declared later in the same file are seen
    for (const auto& descriptor : descriptors) {
        classifyLocked(types_[descriptor.name]);
    }
}

void SymbolRegistry::removeAllForFile(const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    removeFileLocked(file);
}

void SymbolRegistry::insertLocked(const TypeDescriptor& descriptor) {
    auto existing = types_.find(descriptor.name);
    if (existing != types_.end() && existing->second.file != descriptor.file) {
        auto owner = namesByFile_.find(existing->second.file);
        if (owner != namesByFile_.end()) {
            owner->second.erase(descriptor.name);
            if (owner->second.empty()) {
                namesByFile_.erase(owner);
            }
        }
    }
    types_[descriptor.name] = descriptor;
    namesByFile_[descriptor.file].insert(descriptor.name);
}

void SymbolRegistry::removeFileLocked(const std::string& file) {
    auto it = namesByFile_.find(file);
    if (it == namesByFile_.end()) {
        return;
    }
    for (const auto& name : it->second) {
        auto type = types_.find(name);
        if (type != types_.end() && type->second.file == file) {
            types_.erase(type);
        }
    }
    namesByFile_.erase(it);
}

void SymbolRegistry::classifyLocked(TypeDescriptor& descriptor) const {
    descriptor.isComponent = false;
    descriptor.isStatefulComponent = false;
    descriptor.isStatelessComponent = false;
    descriptor.isStateHolder = false;
    descriptor.isObservableState = false;

    auto mixesInNotifier = [](const std::vector<std::string>& mixins) {
        return std::any_of(mixins.begin(), mixins.end(), [](const std::string& mixin) {
            return baseTypeName(mixin) == "ChangeNotifier";
        });
    };

    if (mixesInNotifier(descriptor.mixins)) {
        descriptor.isObservableState = true;
    }

    std::unordered_set<std::string> visited{descriptor.name};
    std::string current = baseTypeName(descriptor.superType);

    while (!current.empty() && visited.insert(current).second) {
        if (current == "StatelessWidget") {
            descriptor.isComponent = true;
            descriptor.isStatelessComponent = true;
            return;
        }
        if (current == "StatefulWidget") {
            descriptor.isComponent = true;
            descriptor.isStatefulComponent = true;
            return;
        }
        if (current == "State") {
            descriptor.isStateHolder = true;
            return;
        }
        if (current == "ChangeNotifier" || current == "ValueNotifier") {
            descriptor.isObservableState = true;
            return;
        }

        auto parent = types_.find(current);
        if (parent == types_.end()) {
            return;
        }
        if (mixesInNotifier(parent->second.mixins)) {
            descriptor.isObservableState = true;
        }
        current = baseTypeName(parent->second.superType);
    }
}

std::optional<TypeDescriptor> SymbolRegistry::lookup(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = types_.find(std::string(name));
    if (it != types_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool SymbolRegistry::isRegistered(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return types_.find(std::string(name)) != types_.end();
}

bool SymbolRegistry::isAvailableIn(std::string_view name, const std::string& fromFile,
                                   const std::set<std::string>& importsOfFromFile) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = types_.find(std::string(name));
    if (it == types_.end()) {
        return false;
    }
    const std::string& owner = it->second.file;
    return owner == fromFile || importsOfFromFile.find(owner) != importsOfFromFile.end();
}

bool SymbolRegistry::hasEntriesForFile(const std::string& file) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = namesByFile_.find(file);
    return it != namesByFile_.end() && !it->second.empty();
}

std::vector<std::string> SymbolRegistry::namesForFile(const std::string& file) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = namesByFile_.find(file);
    if (it == namesByFile_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> SymbolRegistry::getAllRegisteredTypes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(types_.size());
    for (const auto& pair : types_) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t SymbolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return types_.size();
}

void SymbolRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    types_.clear();
    namesByFile_.clear();
}

bool SymbolRegistry::isBuiltinType(std::string_view typeName) {
    static const std::unordered_set<std::string_view> builtins = {
        // Dart core
        "int", "double", "num", "String", "bool", "dynamic", "void", "Object", "Null", "Never",
        "List", "Map", "Set", "Iterable", "Future", "FutureOr", "Stream", "Function", "DateTime",
        "Duration", "Type", "Symbol", "Record",

        // Flutter framework
        "Widget", "BuildContext", "Key", "ValueKey", "GlobalKey", "Color", "TextStyle", "EdgeInsets",
        "EdgeInsetsGeometry", "BoxDecoration", "Border", "BorderRadius", "Alignment", "AlignmentGeometry",
        "MainAxisAlignment", "CrossAxisAlignment", "MainAxisSize", "Axis", "TextAlign", "FontWeight",
        "Curve", "Size", "Offset", "Rect", "IconData", "VoidCallback", "ValueChanged", "ValueSetter",
        "ValueGetter", "AsyncCallback", "GestureTapCallback", "AnimationController", "Animation",
        "TextEditingController", "ScrollController", "PageController", "TabController", "FocusNode",
        "NavigatorState", "ScaffoldState", "ThemeData", "ChangeNotifier", "ValueNotifier", "Listenable",
        "StatelessWidget", "StatefulWidget", "State", "PreferredSizeWidget"
    };
    return builtins.find(typeName) != builtins.end();
}

std::string SymbolRegistry::baseTypeName(std::string_view typeName) {
    std::string name(typeName);

    size_t angle = name.find('<');
    if (angle != std::string::npos) {
        name.erase(angle);
    }
    name.erase(std::remove_if(name.begin(), name.end(),
                              [](char c) { return c == '?' || c == ' ' || c == '\t'; }),
               name.end());

    size_t dot = name.rfind('.');
    if (dot != std::string::npos) {
        name.erase(0, dot + 1);
    }
    return name;
}

} // namespace Semantic
} // namespace FJS
