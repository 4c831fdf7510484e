#include "Cache/BinaryStream.h"

namespace FJS {
namespace Cache {

void BinaryWriter::writeU8(uint8_t value) {
    buffer_.push_back(static_cast<char>(value));
}

void BinaryWriter::writeU32(uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buffer_.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

void BinaryWriter::writeU64(uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buffer_.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

void BinaryWriter::writeBool(bool value) {
    writeU8(value ? 1 : 0);
}

void BinaryWriter::writeString(const std::string& value) {
    writeU32(static_cast<uint32_t>(value.size()));
    buffer_.append(value);
}

void BinaryWriter::writeStrings(const std::vector<std::string>& values) {
    writeU32(static_cast<uint32_t>(values.size()));
    for (const auto& value : values) {
        writeString(value);
    }
}

void BinaryWriter::writeRaw(const std::string& bytes) {
    buffer_.append(bytes);
}

void BinaryReader::require(size_t bytes) const {
    if (bytes > data_.size() || pos_ > data_.size() - bytes) {
        throw SerializationError("unexpected end of data at offset " + std::to_string(pos_));
    }
}

uint8_t BinaryReader::readU8() {
    require(1);
    return static_cast<uint8_t>(data_[pos_++]);
}

uint32_t BinaryReader::readU32() {
    require(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(static_cast<uint8_t>(data_[pos_++])) << (8 * i);
    }
    return value;
}

uint64_t BinaryReader::readU64() {
    require(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(static_cast<uint8_t>(data_[pos_++])) << (8 * i);
    }
    return value;
}

bool BinaryReader::readBool() {
    uint8_t value = readU8();
    if (value > 1) {
        throw SerializationError("invalid bool " + std::to_string(value));
    }
    return value == 1;
}

std::string BinaryReader::readString() {
    uint32_t length = readU32();
    return readRaw(length);
}

std::vector<std::string> BinaryReader::readStrings() {
    uint32_t count = readCount();
    std::vector<std::string> values;
    values.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        values.push_back(readString());
    }
    return values;
}

std::string BinaryReader::readRaw(size_t length) {
    require(length);
    std::string bytes = data_.substr(pos_, length);
    pos_ += length;
    return bytes;
}

uint32_t BinaryReader::readCount() {
    uint32_t count = readU32();
    // Every element takes at least one byte
    if (count > data_.size() - pos_) {
        throw SerializationError("sequence length " + std::to_string(count) + " exceeds remaining data");
    }
    return count;
}

} // namespace Cache
} // namespace FJS
