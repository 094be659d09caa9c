#pragma once

/**
 * @file cbor.hpp
 * @brief Minimal CBOR (RFC 8949) encoder and bounds-checked decoder
 *
 * Covers what field snapshots need: unsigned/negative integers, float64,
 * text and byte strings, and definite-length maps. Float arrays travel as
 * byte strings of little-endian IEEE-754 float32 values.
 */

#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace terrasculpt {
namespace cbor {

// CBOR major types
constexpr uint8_t UNSIGNED_INT = 0;
constexpr uint8_t NEGATIVE_INT = 1;
constexpr uint8_t BYTE_STRING = 2;
constexpr uint8_t TEXT_STRING = 3;
constexpr uint8_t ARRAY = 4;
constexpr uint8_t MAP = 5;
constexpr uint8_t SIMPLE = 7;

constexpr uint8_t FLOAT64 = 27;

// ============================================================================
// Encoding
// ============================================================================

inline void encodeHeader(std::vector<uint8_t>& out, uint8_t majorType, uint64_t value) {
    uint8_t mt = static_cast<uint8_t>(majorType << 5);

    int width;
    if (value < 24) {
        out.push_back(mt | static_cast<uint8_t>(value));
        return;
    } else if (value <= 0xFF) {
        out.push_back(mt | 24);
        width = 1;
    } else if (value <= 0xFFFF) {
        out.push_back(mt | 25);
        width = 2;
    } else if (value <= 0xFFFFFFFF) {
        out.push_back(mt | 26);
        width = 4;
    } else {
        out.push_back(mt | 27);
        width = 8;
    }
    for (int i = width - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

inline void encodeInt(std::vector<uint8_t>& out, int64_t value) {
    if (value >= 0) {
        encodeHeader(out, UNSIGNED_INT, static_cast<uint64_t>(value));
    } else {
        encodeHeader(out, NEGATIVE_INT, static_cast<uint64_t>(-1 - value));
    }
}

inline void encodeDouble(std::vector<uint8_t>& out, double value) {
    out.push_back((SIMPLE << 5) | FLOAT64);
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(bits >> (i * 8)));
    }
}

inline void encodeString(std::vector<uint8_t>& out, std::string_view str) {
    encodeHeader(out, TEXT_STRING, str.size());
    out.insert(out.end(), str.begin(), str.end());
}

/// Byte string holding `values` as little-endian float32
inline void encodeFloatArray(std::vector<uint8_t>& out, std::span<const float> values) {
    encodeHeader(out, BYTE_STRING, values.size() * 4);
    out.reserve(out.size() + values.size() * 4);
    for (float v : values) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        out.push_back(static_cast<uint8_t>(bits));
        out.push_back(static_cast<uint8_t>(bits >> 8));
        out.push_back(static_cast<uint8_t>(bits >> 16));
        out.push_back(static_cast<uint8_t>(bits >> 24));
    }
}

inline void encodeMapHeader(std::vector<uint8_t>& out, size_t count) {
    encodeHeader(out, MAP, count);
}

// ============================================================================
// Decoding
// ============================================================================

/// Reads CBOR items from a byte span. Any read past the end, or an
/// unsupported encoding, throws std::runtime_error.
class Decoder {
public:
    explicit Decoder(std::span<const uint8_t> span) : data_(span.data()), size_(span.size()) {}

    [[nodiscard]] bool hasMore() const { return pos_ < size_; }
    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return size_ - pos_; }

    uint8_t read() {
        need(1);
        return data_[pos_++];
    }

    // Read CBOR header, returns (major type, argument value)
    std::pair<uint8_t, uint64_t> readHeader() {
        uint8_t initial = read();
        uint8_t majorType = initial >> 5;
        uint8_t additional = initial & 0x1F;

        if (majorType == SIMPLE) {
            return {majorType, additional};
        }

        int width;
        if (additional < 24) {
            return {majorType, additional};
        } else if (additional == 24) {
            width = 1;
        } else if (additional == 25) {
            width = 2;
        } else if (additional == 26) {
            width = 4;
        } else if (additional == 27) {
            width = 8;
        } else {
            throw std::runtime_error("CBOR: indefinite or reserved length not supported");
        }

        uint64_t value = 0;
        for (int i = 0; i < width; ++i) {
            value = (value << 8) | read();
        }
        return {majorType, value};
    }

    std::string readString(uint64_t length) {
        need(length);
        std::string result(reinterpret_cast<const char*>(data_ + pos_), static_cast<size_t>(length));
        pos_ += static_cast<size_t>(length);
        return result;
    }

    /// Next item must be a text string
    std::string readText() {
        auto [type, length] = readHeader();
        if (type != TEXT_STRING) {
            throw std::runtime_error("CBOR: expected text string");
        }
        return readString(length);
    }

    /// Next item must be an integer
    int64_t readInt() {
        auto [majorType, value] = readHeader();
        if (majorType == UNSIGNED_INT) {
            return static_cast<int64_t>(value);
        } else if (majorType == NEGATIVE_INT) {
            return -1 - static_cast<int64_t>(value);
        }
        throw std::runtime_error("CBOR: expected integer");
    }

    /// Next item must be a float64 or an integer
    double readNumber() {
        if (peek() == ((SIMPLE << 5) | FLOAT64)) {
            ++pos_;
            need(8);
            uint64_t bits = 0;
            for (int i = 0; i < 8; ++i) {
                bits = (bits << 8) | data_[pos_++];
            }
            double result;
            std::memcpy(&result, &bits, sizeof(result));
            return result;
        }
        return static_cast<double>(readInt());
    }

    /// Next item must be a byte string of little-endian float32 values
    std::vector<float> readFloatArray() {
        auto [type, length] = readHeader();
        if (type != BYTE_STRING || length % 4 != 0) {
            throw std::runtime_error("CBOR: expected float32 byte string");
        }
        need(length);
        std::vector<float> values(static_cast<size_t>(length / 4));
        for (auto& v : values) {
            uint32_t bits = static_cast<uint32_t>(data_[pos_]) |
                            (static_cast<uint32_t>(data_[pos_ + 1]) << 8) |
                            (static_cast<uint32_t>(data_[pos_ + 2]) << 16) |
                            (static_cast<uint32_t>(data_[pos_ + 3]) << 24);
            std::memcpy(&v, &bits, sizeof(v));
            pos_ += 4;
        }
        return values;
    }

    // Skip a CBOR value (unknown map fields)
    void skipValue() {
        auto [majorType, value] = readHeader();
        switch (majorType) {
            case UNSIGNED_INT:
            case NEGATIVE_INT:
                break;
            case BYTE_STRING:
            case TEXT_STRING:
                need(value);
                pos_ += static_cast<size_t>(value);
                break;
            case ARRAY:
                for (uint64_t i = 0; i < value; ++i) {
                    skipValue();
                }
                break;
            case MAP:
                for (uint64_t i = 0; i < value; ++i) {
                    skipValue();
                    skipValue();
                }
                break;
            case SIMPLE: {
                size_t extra = value == 24 ? 1 : value == 25 ? 2 : value == 26 ? 4 : value == 27 ? 8 : 0;
                need(extra);
                pos_ += extra;
                break;
            }
            default:
                throw std::runtime_error("CBOR: unsupported major type");
        }
    }

private:
    [[nodiscard]] uint8_t peek() const {
        return pos_ < size_ ? data_[pos_] : 0;
    }

    void need(uint64_t count) const {
        if (count > size_ - pos_) {
            throw std::runtime_error("CBOR: truncated data");
        }
    }

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

}  // namespace cbor
}  // namespace terrasculpt
