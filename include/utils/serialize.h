#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>
#include <stdexcept>

namespace liarslie {
namespace utils {

// Big-endian byte buffer shared by the wire codecs. Variable-length fields carry a
// u32 length prefix. Reads past the end throw std::runtime_error; codecs turn that
// into DECODE_ERROR.
class ByteBuffer {
public:
    ByteBuffer() = default;
    explicit ByteBuffer(const std::vector<uint8_t>& data) : data_(data) {}
    explicit ByteBuffer(size_t capacity) { data_.reserve(capacity); }

    void writeUint8(uint8_t value) { data_.push_back(value); }
    void writeUint16(uint16_t value) { putBig(value); }
    void writeUint32(uint32_t value) { putBig(value); }
    void writeUint64(uint64_t value) { putBig(value); }

    void writeString(const std::string& value) {
        writeUint32(static_cast<uint32_t>(value.size()));
        data_.insert(data_.end(), value.begin(), value.end());
    }

    void writeBytes(const std::vector<uint8_t>& value) {
        writeUint32(static_cast<uint32_t>(value.size()));
        data_.insert(data_.end(), value.begin(), value.end());
    }

    void writeFixedBytes(const uint8_t* bytes, size_t length) {
        data_.insert(data_.end(), bytes, bytes + length);
    }

    uint8_t readUint8() { return getBig<uint8_t>(); }
    uint16_t readUint16() { return getBig<uint16_t>(); }
    uint32_t readUint32() { return getBig<uint32_t>(); }
    uint64_t readUint64() { return getBig<uint64_t>(); }

    std::string readString() {
        auto range = take(readUint32());
        return std::string(range.first, range.second);
    }

    std::vector<uint8_t> readBytes() {
        auto range = take(readUint32());
        return std::vector<uint8_t>(range.first, range.second);
    }

    const std::vector<uint8_t>& data() const { return data_; }
    size_t remaining() const { return data_.size() - readPos_; }
    bool exhausted() const { return readPos_ == data_.size(); }

private:
    using Iter = std::vector<uint8_t>::const_iterator;

    template<typename T>
    void putBig(T value) {
        static_assert(std::is_unsigned<T>::value, "unsigned integers only");
        for (size_t shift = sizeof(T); shift-- > 0;) {
            data_.push_back(static_cast<uint8_t>(value >> (shift * 8)));
        }
    }

    template<typename T>
    T getBig() {
        auto range = take(sizeof(T));
        T value = 0;
        for (Iter it = range.first; it != range.second; ++it) {
            value = static_cast<T>((static_cast<uint64_t>(value) << 8) | *it);
        }
        return value;
    }

    std::pair<Iter, Iter> take(size_t count) {
        if (count > remaining()) {
            throw std::runtime_error("Buffer underflow");
        }
        Iter begin = data_.cbegin() + static_cast<std::ptrdiff_t>(readPos_);
        readPos_ += count;
        return {begin, begin + static_cast<std::ptrdiff_t>(count)};
    }

    std::vector<uint8_t> data_;
    size_t readPos_ = 0;
};

}
}
