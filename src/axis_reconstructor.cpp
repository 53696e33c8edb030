#include <spectro_bin/axis_reconstructor.hpp>
#include "byte_io.hpp"

namespace spectro_bin {

namespace {

constexpr std::size_t AXIS_RANGE_SIZE = 8;  // two big-endian floats

// Bounds-checked view of count bytes starting back bytes before pos
std::span<const std::uint8_t> bytes_before(std::span<const std::uint8_t> data,
                                           std::size_t pos, std::size_t back,
                                           std::size_t count) noexcept {
    if (pos < back || pos > data.size() || count > back) {
        return {};
    }
    return data.subspan(pos - back, count);
}

} // namespace

std::optional<axis_range> read_axis_range(std::span<const std::uint8_t> data,
                                          std::optional<std::size_t> marker) noexcept {
    if (!marker) {
        return std::nullopt;
    }

    auto bytes = bytes_before(data, *marker, AXIS_RANGE_SIZE, AXIS_RANGE_SIZE);
    if (bytes.size() != AXIS_RANGE_SIZE) {
        return std::nullopt;
    }

    axis_range range;
    range.start = static_cast<double>(read_be_float(bytes.data()));
    range.end = static_cast<double>(read_be_float(bytes.data() + 4));
    return range;
}

std::vector<double> reconstruct_axis(data_format fmt,
                                     std::optional<std::size_t> marker,
                                     std::span<const std::uint8_t> data,
                                     std::size_t count) {
    std::vector<double> axis;
    axis.reserve(count);

    if (!is_float32(fmt)) {
        for (std::size_t i = 0; i < count; ++i) {
            axis.push_back(static_cast<double>(i));
        }
        return axis;
    }

    axis_range range{0.0, static_cast<double>(count) - 1.0};
    if (auto stored = read_axis_range(data, marker)) {
        range = *stored;
    }

    const double step = count > 1
        ? (range.end - range.start) / static_cast<double>(count - 1)
        : 0.0;

    for (std::size_t i = 0; i < count; ++i) {
        axis.push_back(range.start + static_cast<double>(i) * step);
    }
    return axis;
}

} // namespace spectro_bin
