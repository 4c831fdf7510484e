#include "Utils/FileUtils.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <atomic>
#include <thread>
#include <functional>

namespace fs = std::filesystem;

namespace FJS {
namespace Utils {

bool FileUtils::fileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::directoryExists(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::string FileUtils::readFile(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("Failed to read file: " + path);
    }
    return buffer.str();
}

bool FileUtils::writeFileAtomic(const std::string& path, const std::string& contents) {
    // Unique per process and thread so concurrent writers never share a temp file
    static std::atomic<unsigned long> counter{0};
    std::ostringstream tempName;
    tempName << path << ".tmp." << std::hash<std::thread::id>{}(std::this_thread::get_id())
             << "." << counter.fetch_add(1);
    const std::string tempPath = tempName.str();

    {
        std::ofstream out(tempPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) {
            return false;
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code removeEc;
        fs::remove(tempPath, removeEc);
        return false;
    }
    return true;
}

bool FileUtils::ensureDirectory(const std::string& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return true;
    }
    fs::create_directories(path, ec);
    return fs::is_directory(path, ec);
}

bool FileUtils::deleteFile(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

uintmax_t FileUtils::fileSize(const std::string& path) {
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

std::vector<std::string> FileUtils::listFilesRecursive(const std::string& directory,
                                                       const std::string& extension) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return files;
    }

    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code statEc;
        if (entry.is_regular_file(statEc) && entry.path().extension() == extension) {
            files.push_back(entry.path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string FileUtils::joinPath(const std::vector<std::string>& parts) {
    if (parts.empty()) {
        return "";
    }
    fs::path result(parts[0]);
    for (size_t i = 1; i < parts.size(); ++i) {
        result /= parts[i];
    }
    return result.string();
}

} // namespace Utils
} // namespace FJS
