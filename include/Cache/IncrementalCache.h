#pragma once
#include <string>
#include <map>
#include <set>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include <cstdint>
#include "../IR/Declarations.h"

namespace FJS {
namespace Cache {

struct CacheStatistics {
    size_t entries = 0;        // Files with a recorded content hash
    size_t memoryEntries = 0;  // Declarations held in the LRU layer
    uintmax_t diskBytes = 0;   // Index plus every blob
};

/**
 * Persistent store of per-file content hashes and serialized FileDeclarations.
 *
 * On-disk layout under the cache directory:
 *   index        "FJSIDX 1" header, then one "<hash>\t<file>" line per file
 *   <id>.ir      one blob per file, <id> = hex(fnv1a(file identity))
 *
 * An in-memory LRU sits in front of the blobs. Every public method is
 * guarded by one mutex so extraction tasks may call in concurrently.
 * Read and write failures are reported on std::cerr and never thrown.
 */
class IncrementalCache {
public:
    static constexpr const char* kIndexHeader = "FJSIDX 1";
    static constexpr const char* kIndexFileName = "index";

    explicit IncrementalCache(const std::string& directory, size_t memoryCapacity = 256);

    /**
     * Create the cache directory and load the hash index. An index with an
     * unknown header is discarded and the cache starts empty.
     * @return false if the directory cannot be created
     */
    bool initialize();

    std::optional<std::string> hashOf(const std::string& file) const;
    void setHash(const std::string& file, const std::string& hash);

    // True if a declaration for file is in memory or on disk
    bool hasDeclaration(const std::string& file) const;

    /**
     * Load the declaration for file. A missing or corrupt blob is a miss.
     * @return nullptr on a miss
     */
    std::shared_ptr<const IR::FileDeclaration> getDeclaration(const std::string& file);

    /**
     * Store the declaration in memory and write its blob atomically
     * @return false if the blob could not be written
     */
    bool saveDeclaration(const std::string& file, const IR::FileDeclaration& declaration);

    /**
     * Save every declaration; one failed write does not stop the rest
     * @return the files whose blobs were written, in key order
     */
    std::vector<std::string> saveAll(const std::map<std::string, IR::FileDeclaration>& declarations);

    bool saveIndex();

    /**
     * Drop hashes and blobs for files not in existingFiles
     * @return number of entries removed
     */
    size_t prune(const std::set<std::string>& existingFiles);

    // Forget every entry and delete the index and blobs from disk
    void clear();

    CacheStatistics statistics() const;

    const std::string& directory() const { return directory_; }
    std::string blobPath(const std::string& file) const;
    std::string indexPath() const;

private:
    using MemoryEntry = std::pair<std::shared_ptr<const IR::FileDeclaration>, std::list<std::string>::iterator>;

    std::string directory_;
    size_t memoryCapacity_;
    bool initialized_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> hashes_;
    std::set<std::string> blobFiles_;  // Files whose blob was written or loaded
    std::list<std::string> recency_;   // Most recently used first
    std::unordered_map<std::string, MemoryEntry> memory_;

    void rememberLocked(const std::string& file, std::shared_ptr<const IR::FileDeclaration> declaration);
    void forgetLocked(const std::string& file);
    bool saveIndexLocked();
};

} // namespace Cache
} // namespace FJS
