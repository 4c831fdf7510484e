#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace FJS {
namespace Utils {

/**
 * Filesystem helpers shared by the resolver, the cache and the driver
 */
class FileUtils {
public:
    /**
     * Check if a regular file exists
     * @param path File path
     * @return true if a regular file exists at path
     */
    static bool fileExists(const std::string& path);

    /**
     * Check if a directory exists
     */
    static bool directoryExists(const std::string& path);

    /**
     * Read a whole file into memory
     * @param path File path
     * @return File contents
     * @throws std::runtime_error if the file cannot be opened or read
     */
    static std::string readFile(const std::string& path);

    /**
     * Write a file atomically: contents go to a sibling temporary file which
     * is then renamed over the destination
     * @return true on success; on failure the destination is left untouched
     */
    static bool writeFileAtomic(const std::string& path, const std::string& contents);

    /**
     * Create a directory and any missing parents
     * @return true if the directory exists afterwards
     */
    static bool ensureDirectory(const std::string& path);

    /**
     * Delete a file
     * @return true if a file was removed
     */
    static bool deleteFile(const std::string& path);

    /**
     * Size of a regular file in bytes, 0 if it cannot be determined
     */
    static uintmax_t fileSize(const std::string& path);

    /**
     * Recursively list regular files under a directory with the given
     * extension (e.g. ".dart"), sorted lexicographically
     */
    static std::vector<std::string> listFilesRecursive(const std::string& directory,
                                                       const std::string& extension);

    /**
     * Join path components
     */
    static std::string joinPath(const std::vector<std::string>& parts);
};

} // namespace Utils
} // namespace FJS
