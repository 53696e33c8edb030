#include <spectro_bin/csv.hpp>

#include <cmath>
#include <cstdio>
#include <fstream>

namespace spectro_bin {

namespace {

constexpr const char* CSV_HEADER = "Wavelength,Absorbance\n";

// Fixed-point with the given precision; NaN (of either sign) and values
// snprintf cannot format render as "nan"
void append_number(std::string& out, double value, int precision) {
    if (std::isnan(value)) {
        out += "nan";
        return;
    }
    if (std::isinf(value)) {
        out += value < 0 ? "-inf" : "inf";
        return;
    }

    char buf[64];
    int len = std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    if (len <= 0) {
        out += "nan";
        return;
    }
    if (static_cast<std::size_t>(len) < sizeof(buf)) {
        out.append(buf, static_cast<std::size_t>(len));
        return;
    }

    // Magnitudes up to ~3.4e38 need more room than buf
    std::string big(static_cast<std::size_t>(len) + 1, '\0');
    if (std::snprintf(big.data(), big.size(), "%.*f", precision, value) != len) {
        out += "nan";
        return;
    }
    big.resize(static_cast<std::size_t>(len));
    out += big;
}

} // namespace

std::string encode_csv(const memory_spectrum& spec) {
    std::string out = CSV_HEADER;
    out.reserve(out.size() + spec.size() * 24);

    for (const auto& row : spec.rows()) {
        append_number(out, row.wavelength, 3);
        out += ',';
        append_number(out, row.value, 6);
        out += '\n';
    }
    return out;
}

bool save_csv(const memory_spectrum& spec, const std::filesystem::path& path) {
    const std::string text = encode_csv(spec);

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(text.data(), static_cast<std::streamsize>(text.size()));

    return file.good();
}

std::filesystem::path csv_path_for(const std::filesystem::path& input,
                                   const std::filesystem::path& output_dir) {
    std::filesystem::path output = input;
    output.replace_extension(".csv");
    if (!output_dir.empty()) {
        output = output_dir / output.filename();
    }
    return output;
}

// ============================================================================
// CSV Spectrum
// ============================================================================

std::string csv_spectrum::encode() const {
    return encode_csv(*this);
}

bool csv_spectrum::save(const std::filesystem::path& path) const {
    return save_csv(*this, path);
}

} // namespace spectro_bin
