#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace FJS {
namespace Cache {

// Truncated or malformed cache data
class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& message)
        : std::runtime_error("Cache data corrupt: " + message) {}
};

/**
 * Little-endian writer for cache blobs. Strings and sequences are length
 * prefixed with a u32.
 */
class BinaryWriter {
public:
    void writeU8(uint8_t value);
    void writeU32(uint32_t value);
    void writeU64(uint64_t value);
    void writeBool(bool value);
    void writeString(const std::string& value);
    void writeStrings(const std::vector<std::string>& values);
    void writeRaw(const std::string& bytes);

    const std::string& data() const { return buffer_; }
    std::string take() { return std::move(buffer_); }

private:
    std::string buffer_;
};

// Reader over a borrowed buffer; every read throws SerializationError past the end
class BinaryReader {
public:
    explicit BinaryReader(const std::string& data) : data_(data), pos_(0) {}

    uint8_t readU8();
    uint32_t readU32();
    uint64_t readU64();
    bool readBool();
    std::string readString();
    std::vector<std::string> readStrings();
    std::string readRaw(size_t length);

    // Sequence length, checked against the bytes left
    uint32_t readCount();

    bool atEnd() const { return pos_ >= data_.size(); }
    size_t position() const { return pos_; }

private:
    const std::string& data_;
    size_t pos_;

    void require(size_t bytes) const;
};

} // namespace Cache
} // namespace FJS
