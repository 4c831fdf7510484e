#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace FJS {
namespace Common {

/// 64-bit FNV-1a over raw bytes
uint64_t fnv1a(std::string_view data);

/// Lowercase, zero-padded 16 digit hex rendering of a 64-bit hash
std::string toHex(uint64_t value);

/// Normalizes line endings to LF, strips trailing whitespace per line and
/// trims leading/trailing blank space, so whitespace-only edits hash equal
std::string normalizeContent(std::string_view content);

/// Content hash used for change detection: hex(fnv1a(normalizeContent(content)))
std::string contentHash(std::string_view content);

} // namespace Common
} // namespace FJS
