#ifndef SPECTRO_BIN_DECODER_HPP_
#define SPECTRO_BIN_DECODER_HPP_

#include <spectro_bin/spectro_bin_export.h>
#include <spectro_bin/types.hpp>
#include <spectro_bin/spectrum.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace spectro_bin {

/**
 * Decode a spectrophotometer export into wavelength/value rows.
 *
 * Runs header location, format detection, sample decoding and axis
 * reconstruction in that order. Every byte buffer decodes; an empty data
 * region yields zero rows in the bytes format.
 *
 * @param data Raw file data
 * @param sink Destination for the format and rows
 * @param options Decode options
 * @return Decode result (fails only if the sink refuses the row count)
 */
[[nodiscard]] SPECTRO_BIN_EXPORT decode_result decode(std::span<const std::uint8_t> data,
                                                       spectrum_sink& sink,
                                                       const decode_options& options = {});

/**
 * Read a whole file into memory.
 * @param path Input file path
 * @param out Receives the file contents
 * @return Decode result (io_error if the file cannot be read)
 */
[[nodiscard]] SPECTRO_BIN_EXPORT decode_result read_file(const std::filesystem::path& path,
                                                          std::vector<std::uint8_t>& out);

/**
 * Read and decode a file.
 * @param path Input file path
 * @param sink Destination for the format and rows
 * @param options Decode options
 */
[[nodiscard]] SPECTRO_BIN_EXPORT decode_result decode_file(const std::filesystem::path& path,
                                                            spectrum_sink& sink,
                                                            const decode_options& options = {});

} // namespace spectro_bin

#endif // SPECTRO_BIN_DECODER_HPP_
