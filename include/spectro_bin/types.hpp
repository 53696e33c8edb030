#ifndef SPECTRO_BIN_TYPES_HPP_
#define SPECTRO_BIN_TYPES_HPP_

#include <spectro_bin/spectro_bin_export.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <utility>

namespace spectro_bin {

// ============================================================================
// Sample Formats
// ============================================================================

enum class data_format {
    float32_be,  // IEEE-754 single precision, big-endian
    float32_le,  // IEEE-754 single precision, little-endian
    int16,       // 16-bit unsigned, little-endian
    bytes        // one unsigned byte per sample
};

enum class byte_order {
    little,
    big
};

[[nodiscard]] constexpr std::size_t bytes_per_sample(data_format fmt) noexcept {
    switch (fmt) {
        case data_format::float32_be: return 4;
        case data_format::float32_le: return 4;
        case data_format::int16:      return 2;
        case data_format::bytes:      return 1;
    }
    return 1;
}

[[nodiscard]] constexpr bool is_float32(data_format fmt) noexcept {
    return fmt == data_format::float32_be || fmt == data_format::float32_le;
}

/**
 * Diagnostic label for a sample format.
 * @return One of "float32_be", "float32_le", "int16", "bytes"
 */
[[nodiscard]] SPECTRO_BIN_EXPORT const char* to_string(data_format fmt) noexcept;

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    io_error,
    write_error,
    internal_error
};

[[nodiscard]] SPECTRO_BIN_EXPORT const char* to_string(decode_error err) noexcept;

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

// Counts how many values of a candidate float decoding look like real readings.
using plausibility_scorer = std::function<std::size_t(std::span<const float>)>;

struct decode_options {
    // Bytes skipped when no end-of-header marker is found
    std::size_t min_header_skip = 100;

    // Values must lie strictly inside (-limit, limit) to be plausible
    float plausibility_limit = 1000.0f;

    // Replacement scoring function (empty = plausibility_score with the limit above)
    plausibility_scorer scorer;
};

} // namespace spectro_bin

#endif // SPECTRO_BIN_TYPES_HPP_
