#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <set>
#include <map>
#include <unordered_map>
#include <optional>
#include <mutex>
#include "TypeDescriptor.h"

namespace FJS {
namespace Semantic {

/**
 * Project-wide table of declared types, keyed by simple name (last writer
 * wins) and indexed by owning file for incremental invalidation.
 * Thread-safe: every public member takes the registry lock.
 */
class SymbolRegistry {
public:
    SymbolRegistry() = default;

    // Insert or overwrite by name; role flags are recomputed
    void registerType(const TypeDescriptor& descriptor);

    // Atomically replace every descriptor owned by `file`
    void replaceFile(const std::string& file, const std::vector<TypeDescriptor>& descriptors);

    // Drop descriptors still owned by `file` (names since taken over by
    // another file are left alone)
    void removeAllForFile(const std::string& file);

    std::optional<TypeDescriptor> lookup(std::string_view name) const;
    bool isRegistered(std::string_view name) const;

    // Same file, or `fromFile` imports the owning file
    bool isAvailableIn(std::string_view name, const std::string& fromFile,
                       const std::set<std::string>& importsOfFromFile) const;

    bool hasEntriesForFile(const std::string& file) const;
    std::vector<std::string> namesForFile(const std::string& file) const;
    std::vector<std::string> getAllRegisteredTypes() const;

    size_t size() const;
    void clear();

    // Dart core and Flutter framework names that are never declared in the project
    static bool isBuiltinType(std::string_view typeName);

    // `List<int>?` -> `List`, `ui.Color` -> `Color`
    static std::string baseTypeName(std::string_view typeName);

private:
    std::unordered_map<std::string, TypeDescriptor> types_;
    std::map<std::string, std::set<std::string>> namesByFile_;
    mutable std::mutex mutex_;

    void insertLocked(const TypeDescriptor& descriptor);
    void removeFileLocked(const std::string& file);
    void classifyLocked(TypeDescriptor& descriptor) const;
};

} // namespace Semantic
} // namespace FJS
