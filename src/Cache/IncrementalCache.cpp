#include "Cache/IncrementalCache.h"
#include "Cache/IRSerializer.h"
#include "Common/Error.h"
#include "Common/Hash.h"
#include "Common/Debug.h"
#include "Utils/FileUtils.h"
#include <iostream>
#include <sstream>

namespace FJS {
namespace Cache {

IncrementalCache::IncrementalCache(const std::string& directory, size_t memoryCapacity)
    : directory_(directory),
      memoryCapacity_(memoryCapacity == 0 ? 1 : memoryCapacity),
      initialized_(false) {}

std::string IncrementalCache::blobPath(const std::string& file) const {
    return Utils::FileUtils::joinPath({directory_, Common::toHex(Common::fnv1a(file)) + ".ir"});
}

std::string IncrementalCache::indexPath() const {
    return Utils::FileUtils::joinPath({directory_, kIndexFileName});
}

bool IncrementalCache::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    hashes_.clear();
    blobFiles_.clear();
    recency_.clear();
    memory_.clear();

    if (!Utils::FileUtils::ensureDirectory(directory_)) {
        std::cerr << "Warning: [" << Common::errorCodeName(Common::ErrorCode::CacheWriteFailure)
                  << "] cannot create cache directory " << directory_ << std::endl;
        return false;
    }
    initialized_ = true;

    std::string path = indexPath();
    if (!Utils::FileUtils::fileExists(path)) {
        return true;
    }

    std::string content;
    try {
        content = Utils::FileUtils::readFile(path);
    } catch (const std::exception& e) {
        std::cerr << "Warning: [" << Common::errorCodeName(Common::ErrorCode::CacheReadFailure)
                  << "] " << e.what() << std::endl;
        return true;
    }

    std::istringstream lines(content);
    std::string line;
    if (!std::getline(lines, line) || line != kIndexHeader) {
        DEBUG_OUT("Cache index header mismatch, starting fresh" << std::endl);
        return true;
    }
    while (std::getline(lines, line)) {
        size_t tab = line.find('\t');
        if (tab == std::string::npos || tab == 0 || tab + 1 >= line.size()) {
            continue;
        }
        hashes_[line.substr(tab + 1)] = line.substr(0, tab);
    }
    DEBUG_OUT("Cache index loaded: " << hashes_.size() << " entries" << std::endl);
    return true;
}

std::optional<std::string> IncrementalCache::hashOf(const std::string& file) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hashes_.find(file);
    if (it == hashes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void IncrementalCache::setHash(const std::string& file, const std::string& hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    hashes_[file] = hash;
}

bool IncrementalCache::hasDeclaration(const std::string& file) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (memory_.count(file) > 0) {
        return true;
    }
    return Utils::FileUtils::fileExists(blobPath(file));
}

std::shared_ptr<const IR::FileDeclaration> IncrementalCache::getDeclaration(const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto cached = memory_.find(file);
    if (cached != memory_.end()) {
        recency_.splice(recency_.begin(), recency_, cached->second.second);
        return cached->second.first;
    }

    std::string path = blobPath(file);
    if (!Utils::FileUtils::fileExists(path)) {
        return nullptr;
    }

    try {
        auto declaration = std::make_shared<const IR::FileDeclaration>(
            IRSerializer::deserialize(Utils::FileUtils::readFile(path)));
        if (declaration->file != file) {
            throw SerializationError("blob belongs to " + declaration->file);
        }
        rememberLocked(file, declaration);
        blobFiles_.insert(file);
        return declaration;
    } catch (const std::exception& e) {
        std::cerr << "Warning: [" << Common::errorCodeName(Common::ErrorCode::CacheReadFailure)
                  << "] " << file << ": " << e.what() << std::endl;
        return nullptr;
    }
}

bool IncrementalCache::saveDeclaration(const std::string& file, const IR::FileDeclaration& declaration) {
    std::string blob = IRSerializer::serialize(declaration);

    std::lock_guard<std::mutex> lock(mutex_);
    rememberLocked(file, std::make_shared<const IR::FileDeclaration>(declaration));

    if (!initialized_ || !Utils::FileUtils::writeFileAtomic(blobPath(file), blob)) {
        std::cerr << "Warning: [" << Common::errorCodeName(Common::ErrorCode::CacheWriteFailure)
                  << "] cannot write cache entry for " << file << std::endl;
        return false;
    }
    blobFiles_.insert(file);
    return true;
}

std::vector<std::string> IncrementalCache::saveAll(const std::map<std::string, IR::FileDeclaration>& declarations) {
    std::vector<std::string> saved;
    for (const auto& [file, declaration] : declarations) {
        if (saveDeclaration(file, declaration)) {
            saved.push_back(file);
        }
    }
    return saved;
}

bool IncrementalCache::saveIndex() {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveIndexLocked();
}

bool IncrementalCache::saveIndexLocked() {
    std::ostringstream out;
    out << kIndexHeader << "\n";
    for (const auto& [file, hash] : hashes_) {
        out << hash << "\t" << file << "\n";
    }
    if (!initialized_ || !Utils::FileUtils::writeFileAtomic(indexPath(), out.str())) {
        std::cerr << "Warning: [" << Common::errorCodeName(Common::ErrorCode::CacheWriteFailure)
                  << "] cannot write cache index " << indexPath() << std::endl;
        return false;
    }
    return true;
}

size_t IncrementalCache::prune(const std::set<std::string>& existingFiles) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> stale;
    for (const auto& [file, hash] : hashes_) {
        if (existingFiles.count(file) == 0) stale.insert(file);
    }
    for (const auto& file : blobFiles_) {
        if (existingFiles.count(file) == 0) stale.insert(file);
    }
    for (const auto& [file, entry] : memory_) {
        if (existingFiles.count(file) == 0) stale.insert(file);
    }

    for (const auto& file : stale) {
        hashes_.erase(file);
        blobFiles_.erase(file);
        forgetLocked(file);
        Utils::FileUtils::deleteFile(blobPath(file));
    }
    if (!stale.empty()) {
        DEBUG_OUT("Cache pruned " << stale.size() << " entries" << std::endl);
    }
    return stale.size();
}

void IncrementalCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> files = blobFiles_;
    for (const auto& [file, hash] : hashes_) {
        files.insert(file);
    }
    for (const auto& file : files) {
        Utils::FileUtils::deleteFile(blobPath(file));
    }
    Utils::FileUtils::deleteFile(indexPath());
    hashes_.clear();
    blobFiles_.clear();
    recency_.clear();
    memory_.clear();
}

CacheStatistics IncrementalCache::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStatistics stats;
    stats.entries = hashes_.size();
    stats.memoryEntries = memory_.size();

    std::set<std::string> files = blobFiles_;
    for (const auto& [file, hash] : hashes_) {
        files.insert(file);
    }
    for (const auto& file : files) {
        stats.diskBytes += Utils::FileUtils::fileSize(blobPath(file));
    }
    stats.diskBytes += Utils::FileUtils::fileSize(indexPath());
    return stats;
}

void IncrementalCache::rememberLocked(const std::string& file,
                                      std::shared_ptr<const IR::FileDeclaration> declaration) {
    auto existing = memory_.find(file);
    if (existing != memory_.end()) {
        existing->second.first = std::move(declaration);
        recency_.splice(recency_.begin(), recency_, existing->second.second);
        return;
    }

    recency_.push_front(file);
    memory_.emplace(file, MemoryEntry(std::move(declaration), recency_.begin()));

    while (memory_.size() > memoryCapacity_) {
        memory_.erase(recency_.back());
        recency_.pop_back();
    }
}

void IncrementalCache::forgetLocked(const std::string& file) {
    auto it = memory_.find(file);
    if (it == memory_.end()) {
        return;
    }
    recency_.erase(it->second.second);
    memory_.erase(it);
}

} // namespace Cache
} // namespace FJS
