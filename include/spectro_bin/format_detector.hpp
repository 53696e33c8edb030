#ifndef SPECTRO_BIN_FORMAT_DETECTOR_HPP_
#define SPECTRO_BIN_FORMAT_DETECTOR_HPP_

#include <spectro_bin/spectro_bin_export.h>
#include <spectro_bin/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace spectro_bin {

/**
 * Count values that are finite and lie strictly inside (-limit, limit).
 * Absorbance and transmittance readings sit in a narrow range, so the
 * wrong byte order shows up as infinities, NaNs and huge magnitudes.
 *
 * @param values Candidate decoding
 * @param limit Exclusive magnitude bound
 * @return Number of plausible values
 */
[[nodiscard]] SPECTRO_BIN_EXPORT std::size_t plausibility_score(std::span<const float> values,
                                                                 float limit = 1000.0f) noexcept;

/**
 * Choose the sample format of a data region.
 *
 * Precedence: a positive multiple of 4 bytes is float32 (byte order picked
 * by score, ties go to big-endian), else a positive multiple of 2 bytes is
 * int16, else bytes. Every length maps to exactly one format.
 *
 * @param region Bytes after the header boundary
 * @param options Decode options (scorer, plausibility_limit)
 */
[[nodiscard]] SPECTRO_BIN_EXPORT data_format detect_format(std::span<const std::uint8_t> region,
                                                            const decode_options& options = {});

/**
 * Same as above with an explicit scoring function.
 */
[[nodiscard]] SPECTRO_BIN_EXPORT data_format detect_format(std::span<const std::uint8_t> region,
                                                            const plausibility_scorer& scorer);

} // namespace spectro_bin

#endif // SPECTRO_BIN_FORMAT_DETECTOR_HPP_
