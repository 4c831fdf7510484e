#pragma once
#include <string>

namespace FJS {
namespace Import {

/**
 * A FileIdentity is a canonical absolute path, the unit of dependency,
 * caching and invalidation. Identities are plain strings so they can key
 * ordinary maps and sets; this class only builds and inspects them.
 */
class FileIdentity {
public:
    // Absolute, lexically normalized, symlinks resolved where the path exists
    static std::string of(const std::string& path);

    // Resolve `relative` against the directory containing `fromFile`
    static std::string resolveRelative(const std::string& relative, const std::string& fromFile);

    static std::string baseName(const std::string& identity);
    static std::string directoryOf(const std::string& identity);

    // Path of `identity` relative to `root`, or the identity itself when outside root
    static std::string relativeTo(const std::string& identity, const std::string& root);
};

} // namespace Import
} // namespace FJS
