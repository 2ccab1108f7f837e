#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

// Little-endian reader over an in-memory asset. Every read is bounds checked;
// a failed read leaves the cursor where it was and returns false.
class BinaryReader {
public:
    BinaryReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit BinaryReader(const std::vector<uint8_t>& bytes) : data_(bytes.data()), size_(bytes.size()) {}

    size_t position() const { return pos_; }
    size_t size() const { return size_; }
    size_t remaining() const { return size_ - pos_; }

    bool seek(size_t offset) {
        if (offset > size_) return false;
        pos_ = offset;
        return true;
    }

    bool skip(size_t count) {
        if (count > remaining()) return false;
        pos_ += count;
        return true;
    }

    template<typename T>
    bool read(T& out) {
        static_assert(std::is_trivially_copyable_v<T>, "BinaryReader::read needs a POD type");
        if (sizeof(T) > remaining()) return false;
        std::memcpy(&out, data_ + pos_, sizeof(T));
        pos_ += sizeof(T);
        return true;
    }

    bool readU8(uint8_t& out) { return read(out); }
    bool readU16(uint16_t& out) { return read(out); }
    bool readI16(int16_t& out) { return read(out); }
    bool readU32(uint32_t& out) { return read(out); }
    bool readI32(int32_t& out) { return read(out); }
    bool readF32(float& out) { return read(out); }

    bool readVec3(glm::vec3& out) {
        float v[3];
        if (!read(v)) return false;
        out = glm::vec3(v[0], v[1], v[2]);
        return true;
    }

    // Dark engine stores quaternions as x, y, z, w
    bool readQuat(glm::quat& out) {
        float v[4];
        if (!read(v)) return false;
        out = glm::quat(v[3], v[0], v[1], v[2]);
        return true;
    }

    bool readBytes(size_t count, std::vector<uint8_t>& out) {
        if (count > remaining()) return false;
        out.assign(data_ + pos_, data_ + pos_ + count);
        pos_ += count;
        return true;
    }

private:
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t pos_ = 0;
};

// Read a whole file into memory. Returns nullopt if the file cannot be opened.
std::optional<std::vector<uint8_t>> readFileBytes(const std::string& path);
