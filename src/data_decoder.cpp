#include <spectro_bin/data_decoder.hpp>
#include "byte_io.hpp"

namespace spectro_bin {

std::vector<float> decode_float32(std::span<const std::uint8_t> region, byte_order order) {
    const std::size_t count = region.size() / 4;
    std::vector<float> values;
    values.reserve(count);

    const std::uint8_t* p = region.data();
    for (std::size_t i = 0; i < count; ++i, p += 4) {
        values.push_back(order == byte_order::big ? read_be_float(p) : read_le_float(p));
    }
    return values;
}

std::vector<decoded_sample> decode_samples(std::span<const std::uint8_t> region, data_format fmt) {
    const std::size_t width = bytes_per_sample(fmt);
    const std::size_t count = region.size() / width;

    std::vector<decoded_sample> samples;
    samples.reserve(count);

    const std::uint8_t* p = region.data();
    for (std::size_t i = 0; i < count; ++i, p += width) {
        double value = 0.0;
        switch (fmt) {
            case data_format::float32_be:
                value = static_cast<double>(read_be_float(p));
                break;
            case data_format::float32_le:
                value = static_cast<double>(read_le_float(p));
                break;
            case data_format::int16:
                value = static_cast<double>(read_le16(p));
                break;
            case data_format::bytes:
                value = static_cast<double>(*p);
                break;
        }
        samples.push_back({i, value});
    }
    return samples;
}

} // namespace spectro_bin
