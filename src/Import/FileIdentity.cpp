#include "Import/FileIdentity.h"
#include <filesystem>
#include <system_error>

namespace FJS {
namespace Import {

namespace fs = std::filesystem;

std::string FileIdentity::of(const std::string& path) {
    if (path.empty()) {
        return path;
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(path), ec);
    if (ec) {
        absolute = fs::path(path);
    }

    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal().generic_string();
    }
    return canonical.lexically_normal().generic_string();
}

std::string FileIdentity::resolveRelative(const std::string& relative, const std::string& fromFile) {
    fs::path base = fs::path(fromFile).parent_path();
    return of((base / fs::path(relative)).lexically_normal().string());
}

std::string FileIdentity::baseName(const std::string& identity) {
    return fs::path(identity).filename().generic_string();
}

std::string FileIdentity::directoryOf(const std::string& identity) {
    return fs::path(identity).parent_path().generic_string();
}

std::string FileIdentity::relativeTo(const std::string& identity, const std::string& root) {
    fs::path relative = fs::path(identity).lexically_relative(fs::path(root));
    std::string result = relative.generic_string();
    if (result.empty() || result.rfind("..", 0) == 0) {
        return identity;
    }
    return result;
}

} // namespace Import
} // namespace FJS
