#include <spectro_bin/format_detector.hpp>
#include <spectro_bin/data_decoder.hpp>

#include <cmath>
#include <vector>

namespace spectro_bin {

std::size_t plausibility_score(std::span<const float> values, float limit) noexcept {
    std::size_t score = 0;
    for (float v : values) {
        if (!std::isfinite(v)) {
            continue;
        }
        if (v > -limit && v < limit) {
            ++score;
        }
    }
    return score;
}

data_format detect_format(std::span<const std::uint8_t> region,
                          const decode_options& options) {
    if (options.scorer) {
        return detect_format(region, options.scorer);
    }
    const float limit = options.plausibility_limit;
    return detect_format(region, [limit](std::span<const float> values) {
        return plausibility_score(values, limit);
    });
}

data_format detect_format(std::span<const std::uint8_t> region,
                          const plausibility_scorer& scorer) {
    const std::size_t n = region.size();

    if (n > 0 && n % 4 == 0) {
        const std::vector<float> le = decode_float32(region, byte_order::little);
        const std::vector<float> be = decode_float32(region, byte_order::big);

        // Ties resolve to big-endian
        if (scorer(be) >= scorer(le)) {
            return data_format::float32_be;
        }
        return data_format::float32_le;
    }

    if (n > 0 && n % 2 == 0) {
        return data_format::int16;
    }

    return data_format::bytes;
}

} // namespace spectro_bin
