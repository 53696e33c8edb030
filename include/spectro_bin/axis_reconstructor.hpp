#ifndef SPECTRO_BIN_AXIS_RECONSTRUCTOR_HPP_
#define SPECTRO_BIN_AXIS_RECONSTRUCTOR_HPP_

#include <spectro_bin/spectro_bin_export.h>
#include <spectro_bin/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace spectro_bin {

// Start and end wavelength stored just before the header end marker
struct axis_range {
    double start = 0.0;
    double end = 0.0;
};

/**
 * Read the big-endian float pair [start, end] from the 8 bytes preceding
 * the marker.
 * @param data Raw file data
 * @param marker Offset of the header end marker
 * @return Range, or nullopt if the marker is absent or the read is out of bounds
 */
[[nodiscard]] SPECTRO_BIN_EXPORT std::optional<axis_range> read_axis_range(std::span<const std::uint8_t> data,
                                                                            std::optional<std::size_t> marker) noexcept;

/**
 * Build one wavelength per sample.
 *
 * Float formats use the stored axis range when readable and [0, count-1]
 * otherwise, spaced evenly. Integer and byte formats use the sample index.
 *
 * @param fmt Detected sample format
 * @param marker Offset of the header end marker, if any
 * @param data Raw file data
 * @param count Number of decoded samples
 */
[[nodiscard]] SPECTRO_BIN_EXPORT std::vector<double> reconstruct_axis(data_format fmt,
                                                                       std::optional<std::size_t> marker,
                                                                       std::span<const std::uint8_t> data,
                                                                       std::size_t count);

} // namespace spectro_bin

#endif // SPECTRO_BIN_AXIS_RECONSTRUCTOR_HPP_
