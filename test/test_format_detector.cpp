#include <doctest/doctest.h>
#include <spectro_bin/spectro_bin.hpp>

#include "helpers/byte_builder.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <vector>

using namespace test_helpers;

namespace {

// Plausible when read as little-endian; the 0xFF low byte turns the
// big-endian reading into a huge negative number.
std::vector<std::uint8_t> le_only_plausible() {
    std::vector<std::uint8_t> data;
    for (std::uint32_t bits : {0x3F8000FFu, 0x400000FFu, 0x404000FFu}) {
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        append_le_float(data, v);
    }
    return data;
}

std::vector<std::uint8_t> be_only_plausible() {
    std::vector<std::uint8_t> data;
    for (std::uint32_t bits : {0x3F8000FFu, 0x400000FFu}) {
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        append_be_float(data, v);
    }
    return data;
}

} // namespace

TEST_CASE("Format detector: plausibility score") {
    const float inf = std::numeric_limits<float>::infinity();
    const float nan = std::numeric_limits<float>::quiet_NaN();

    SUBCASE("Non-finite and out-of-range values do not count") {
        std::vector<float> values = {inf, -inf, nan, 1000.0f, -1000.0f, 999.9f, -999.9f, 0.0f};
        CHECK(spectro_bin::plausibility_score(values) == 3);
    }

    SUBCASE("Empty input") {
        std::vector<float> values;
        CHECK(spectro_bin::plausibility_score(values) == 0);
    }

    SUBCASE("Custom limit") {
        std::vector<float> values = {0.5f, 1.5f, -2.5f, 3.0f};
        CHECK(spectro_bin::plausibility_score(values, 2.0f) == 2);
        CHECK(spectro_bin::plausibility_score(values, 3.5f) == 4);
    }
}

TEST_CASE("Format detector: length precedence") {
    SUBCASE("Empty region is bytes") {
        std::vector<std::uint8_t> data;
        CHECK(spectro_bin::detect_format(data) == spectro_bin::data_format::bytes);
    }

    SUBCASE("Odd length is bytes") {
        std::vector<std::uint8_t> data(5, 0x01);
        CHECK(spectro_bin::detect_format(data) == spectro_bin::data_format::bytes);
    }

    SUBCASE("Two bytes is int16") {
        std::vector<std::uint8_t> data(2, 0x01);
        CHECK(spectro_bin::detect_format(data) == spectro_bin::data_format::int16);
    }

    SUBCASE("Six bytes is int16") {
        std::vector<std::uint8_t> data(6, 0x01);
        CHECK(spectro_bin::detect_format(data) == spectro_bin::data_format::int16);
    }

    SUBCASE("Multiple of four is float32") {
        std::vector<std::uint8_t> data(8, 0x00);
        CHECK(spectro_bin::is_float32(spectro_bin::detect_format(data)));
    }
}

TEST_CASE("Format detector: byte order") {
    SUBCASE("Tie resolves to big-endian") {
        std::vector<std::uint8_t> data(4, 0x00);
        CHECK(spectro_bin::detect_format(data) == spectro_bin::data_format::float32_be);
    }

    SUBCASE("Simple big-endian values") {
        std::vector<std::uint8_t> data;
        append_be_floats(data, {1.0f, 2.0f});
        CHECK(spectro_bin::detect_format(data) == spectro_bin::data_format::float32_be);
    }

    SUBCASE("Big-endian scores higher") {
        auto data = be_only_plausible();
        CHECK(spectro_bin::detect_format(data) == spectro_bin::data_format::float32_be);
    }

    SUBCASE("Little-endian scores higher") {
        auto data = le_only_plausible();
        CHECK(spectro_bin::detect_format(data) == spectro_bin::data_format::float32_le);
    }

    SUBCASE("Agrees with the scores of both decodings") {
        std::vector<std::uint8_t> data;
        append_le_floats(data, {0.1f, 0.2f, 12.5f, -3.75f});

        const auto le = spectro_bin::decode_float32(data, spectro_bin::byte_order::little);
        const auto be = spectro_bin::decode_float32(data, spectro_bin::byte_order::big);
        const auto expected = spectro_bin::plausibility_score(be) >= spectro_bin::plausibility_score(le)
            ? spectro_bin::data_format::float32_be
            : spectro_bin::data_format::float32_le;

        CHECK(spectro_bin::detect_format(data) == expected);
    }
}

TEST_CASE("Format detector: substitute scorer") {
    auto data = le_only_plausible();

    SUBCASE("Scorer passed directly") {
        // Prefers whichever decoding has more huge magnitudes
        spectro_bin::plausibility_scorer huge_count = [](std::span<const float> values) {
            std::size_t n = 0;
            for (float v : values) {
                if (std::fabs(v) > 1.0e30f) ++n;
            }
            return n;
        };
        CHECK(spectro_bin::detect_format(data, huge_count) == spectro_bin::data_format::float32_be);
        CHECK(spectro_bin::detect_format(data) == spectro_bin::data_format::float32_le);
    }

    SUBCASE("Scorer from options") {
        spectro_bin::decode_options options;
        options.scorer = [](std::span<const float>) -> std::size_t { return 0; };
        CHECK(spectro_bin::detect_format(data, options) == spectro_bin::data_format::float32_be);
    }

    SUBCASE("Limit from options") {
        // Every little-endian value is >= 1, so a limit of 1 scores both sides zero
        spectro_bin::decode_options options;
        options.plausibility_limit = 1.0f;
        CHECK(spectro_bin::detect_format(data, options) == spectro_bin::data_format::float32_be);
    }

    SUBCASE("Scorer does not affect integer formats") {
        std::vector<std::uint8_t> odd(6, 0x01);
        spectro_bin::decode_options options;
        options.scorer = [](std::span<const float>) -> std::size_t { return 0; };
        CHECK(spectro_bin::detect_format(odd, options) == spectro_bin::data_format::int16);
    }
}
