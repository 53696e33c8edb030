#ifndef SPECTRO_BIN_HEADER_LOCATOR_HPP_
#define SPECTRO_BIN_HEADER_LOCATOR_HPP_

#include <spectro_bin/spectro_bin_export.h>
#include <spectro_bin/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace spectro_bin {

// ============================================================================
// Header Markers
// ============================================================================

// File identifier tag; the header text runs to the next NUL after it.
inline constexpr std::array<std::uint8_t, 4> wav_tag = {'.', 'W', 'A', 'V'};

// Big-endian float pair (0.0, 3.0) closing the binary header.
inline constexpr std::array<std::uint8_t, 8> header_end_marker = {
    0x00, 0x00, 0x00, 0x00, 0x40, 0x40, 0x00, 0x00};

// ============================================================================
// Header Location
// ============================================================================

struct header_location {
    // First byte of the data region (may exceed the buffer size)
    std::size_t boundary = 0;

    // Offset of header_end_marker, if found
    std::optional<std::size_t> marker;
};

/**
 * Find where the header ends and the sample data begins.
 *
 * The search starts after the ".WAV" identifier string (when present) and
 * looks for header_end_marker. Without a marker, at least
 * options.min_header_skip bytes are treated as header.
 *
 * @param data Raw file data
 * @param options Decode options
 * @return Boundary offset and optional marker position
 */
[[nodiscard]] SPECTRO_BIN_EXPORT header_location locate_header(std::span<const std::uint8_t> data,
                                                                const decode_options& options = {});

/**
 * Bytes from the boundary to the end of the buffer.
 * Empty when the boundary lies at or past the end.
 */
[[nodiscard]] SPECTRO_BIN_EXPORT std::span<const std::uint8_t> data_region(std::span<const std::uint8_t> data,
                                                                            const header_location& loc) noexcept;

} // namespace spectro_bin

#endif // SPECTRO_BIN_HEADER_LOCATOR_HPP_
