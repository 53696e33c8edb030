#include <spectro_bin/decoder.hpp>
#include <spectro_bin/axis_reconstructor.hpp>
#include <spectro_bin/data_decoder.hpp>
#include <spectro_bin/format_detector.hpp>
#include <spectro_bin/header_locator.hpp>

#include <fstream>
#include <new>
#include <string>
#include <system_error>

namespace spectro_bin {

// ============================================================================
// Pipeline
// ============================================================================

decode_result decode(std::span<const std::uint8_t> data,
                     spectrum_sink& sink,
                     const decode_options& options) {
    const header_location loc = locate_header(data, options);
    const auto region = data_region(data, loc);

    const data_format fmt = detect_format(region, options);
    const auto samples = decode_samples(region, fmt);
    const auto axis = reconstruct_axis(fmt, loc.marker, data, samples.size());

    if (!sink.begin(fmt, samples.size())) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate spectrum");
    }

    for (std::size_t i = 0; i < samples.size(); ++i) {
        sink.write_row(samples[i].index, {axis[i], samples[i].value});
    }

    return decode_result::success();
}

// ============================================================================
// File Helpers
// ============================================================================

decode_result read_file(const std::filesystem::path& path, std::vector<std::uint8_t>& out) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return decode_result::failure(decode_error::io_error,
            "File not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return decode_result::failure(decode_error::io_error,
            "Cannot open file: " + path.string());
    }

    const auto size = file.tellg();
    if (size < 0) {
        return decode_result::failure(decode_error::io_error,
            "Cannot determine file size: " + path.string());
    }
    file.seekg(0, std::ios::beg);

    try {
        out.resize(static_cast<std::size_t>(size));
    } catch (const std::bad_alloc&) {
        return decode_result::failure(decode_error::io_error,
            "File too large: " + path.string());
    }

    if (size > 0 && !file.read(reinterpret_cast<char*>(out.data()), size)) {
        return decode_result::failure(decode_error::io_error,
            "Failed to read file: " + path.string());
    }

    return decode_result::success();
}

decode_result decode_file(const std::filesystem::path& path,
                          spectrum_sink& sink,
                          const decode_options& options) {
    std::vector<std::uint8_t> data;
    auto result = read_file(path, data);
    if (!result) return result;

    return decode(data, sink, options);
}

} // namespace spectro_bin
