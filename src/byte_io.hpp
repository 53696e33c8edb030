#pragma once

#include <cstdint>
#include <cstring>

namespace spectro_bin {

// Little-endian readers
inline std::uint16_t read_le16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0]) |
           (static_cast<std::uint16_t>(p[1]) << 8);
}

inline std::uint32_t read_le32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

// Big-endian readers
inline std::uint32_t read_be32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           static_cast<std::uint32_t>(p[3]);
}

// IEEE-754 single precision from a raw 32-bit pattern
inline float bits_to_float(std::uint32_t bits) {
    static_assert(sizeof(float) == sizeof(std::uint32_t), "float must be 32-bit");
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

inline float read_le_float(const std::uint8_t* p) {
    return bits_to_float(read_le32(p));
}

inline float read_be_float(const std::uint8_t* p) {
    return bits_to_float(read_be32(p));
}

} // namespace spectro_bin
