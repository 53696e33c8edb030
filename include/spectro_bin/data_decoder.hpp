#ifndef SPECTRO_BIN_DATA_DECODER_HPP_
#define SPECTRO_BIN_DATA_DECODER_HPP_

#include <spectro_bin/spectro_bin_export.h>
#include <spectro_bin/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace spectro_bin {

struct decoded_sample {
    std::size_t index = 0;
    double value = 0.0;
};

/**
 * Decode consecutive 4-byte groups as IEEE-754 floats.
 * Trailing bytes that do not fill a group are ignored.
 * @param region Data bytes
 * @param order Byte order of each group
 */
[[nodiscard]] SPECTRO_BIN_EXPORT std::vector<float> decode_float32(std::span<const std::uint8_t> region,
                                                                    byte_order order);

/**
 * Decode a data region into samples in file order.
 * Values pass through unmodified (NaN and infinity included).
 * @param region Data bytes
 * @param fmt Format chosen by detect_format()
 */
[[nodiscard]] SPECTRO_BIN_EXPORT std::vector<decoded_sample> decode_samples(std::span<const std::uint8_t> region,
                                                                             data_format fmt);

} // namespace spectro_bin

#endif // SPECTRO_BIN_DATA_DECODER_HPP_
