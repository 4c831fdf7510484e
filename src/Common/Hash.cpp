#include "Common/Hash.h"

namespace FJS {
namespace Common {

uint64_t fnv1a(std::string_view data) {
    uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : data) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::string toHex(uint64_t value) {
    static const char digits[] = "0123456789abcdef";
    std::string result(16, '0');
    for (int i = 15; i >= 0; --i) {
        result[i] = digits[value & 0xF];
        value >>= 4;
    }
    return result;
}

static bool isBlank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\v';
}

std::string normalizeContent(std::string_view content) {
    std::string result;
    result.reserve(content.size());

    std::string line;
    auto flushLine = [&](bool newline) {
        size_t end = line.size();
        while (end > 0 && (line[end - 1] == ' ' || line[end - 1] == '\t')) {
            --end;
        }
        result.append(line, 0, end);
        if (newline) {
            result += '\n';
        }
        line.clear();
    };

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '\r') {
            if (i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
            flushLine(true);
        } else if (c == '\n') {
            flushLine(true);
        } else {
            line += c;
        }
    }
    flushLine(false);

    size_t start = 0;
    while (start < result.size() && isBlank(result[start])) {
        ++start;
    }
    size_t end = result.size();
    while (end > start && isBlank(result[end - 1])) {
        --end;
    }
    return result.substr(start, end - start);
}

std::string contentHash(std::string_view content) {
    return toHex(fnv1a(normalizeContent(content)));
}

} // namespace Common
} // namespace FJS
