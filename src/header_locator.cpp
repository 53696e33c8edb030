#include <spectro_bin/header_locator.hpp>

#include <algorithm>

namespace spectro_bin {

namespace {

// Offset of the first occurrence of needle at or after from
template <std::size_t N>
std::optional<std::size_t> find_sequence(std::span<const std::uint8_t> data,
                                         const std::array<std::uint8_t, N>& needle,
                                         std::size_t from) {
    if (from >= data.size()) {
        return std::nullopt;
    }
    auto it = std::search(data.begin() + static_cast<std::ptrdiff_t>(from), data.end(),
                          needle.begin(), needle.end());
    if (it == data.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - data.begin());
}

std::optional<std::size_t> find_byte(std::span<const std::uint8_t> data,
                                     std::uint8_t value,
                                     std::size_t from) {
    for (std::size_t i = from; i < data.size(); ++i) {
        if (data[i] == value) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace

header_location locate_header(std::span<const std::uint8_t> data,
                              const decode_options& options) {
    header_location loc;

    // "<name>.WAV\0" identifier string
    std::size_t text_end = 0;
    if (auto tag = find_sequence(data, wav_tag, 0)) {
        if (auto nul = find_byte(data, 0x00, *tag)) {
            text_end = *nul + 1;
        }
    }

    if (auto marker = find_sequence(data, header_end_marker, text_end)) {
        loc.marker = *marker;
        loc.boundary = *marker + header_end_marker.size();
        return loc;
    }

    loc.boundary = std::max(text_end, options.min_header_skip);
    return loc;
}

std::span<const std::uint8_t> data_region(std::span<const std::uint8_t> data,
                                          const header_location& loc) noexcept {
    if (loc.boundary >= data.size()) {
        return {};
    }
    return data.subspan(loc.boundary);
}

} // namespace spectro_bin
