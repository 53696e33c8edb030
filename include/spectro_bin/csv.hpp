#ifndef SPECTRO_BIN_CSV_HPP_
#define SPECTRO_BIN_CSV_HPP_

#include <spectro_bin/spectro_bin_export.h>
#include <spectro_bin/spectrum.hpp>

#include <filesystem>
#include <string>

namespace spectro_bin {

// ============================================================================
// CSV Encoder Functions
// ============================================================================

/**
 * Render a spectrum as CSV text.
 * Header "Wavelength,Absorbance", then "%.3f,%.6f" per row.
 * @param spec Source spectrum
 */
[[nodiscard]] SPECTRO_BIN_EXPORT std::string encode_csv(const memory_spectrum& spec);

/**
 * Save a spectrum to a CSV file.
 * @param spec Source spectrum
 * @param path Output file path
 * @return true on success
 */
[[nodiscard]] SPECTRO_BIN_EXPORT bool save_csv(const memory_spectrum& spec,
                                                const std::filesystem::path& path);

/**
 * CSV path for a decoded input: the input path with its extension replaced
 * by ".csv", placed in output_dir when that is not empty.
 * @param input Input file path
 * @param output_dir Destination directory (empty = beside the input)
 */
[[nodiscard]] SPECTRO_BIN_EXPORT std::filesystem::path csv_path_for(const std::filesystem::path& input,
                                                                     const std::filesystem::path& output_dir = {});

// ============================================================================
// CSV Spectrum
// ============================================================================

/**
 * Spectrum that can save its contents as CSV.
 */
class SPECTRO_BIN_EXPORT csv_spectrum : public memory_spectrum {
public:
    csv_spectrum() = default;
    ~csv_spectrum() override = default;

    csv_spectrum(const csv_spectrum&) = delete;
    csv_spectrum& operator=(const csv_spectrum&) = delete;
    csv_spectrum(csv_spectrum&&) noexcept = default;
    csv_spectrum& operator=(csv_spectrum&&) noexcept = default;

    [[nodiscard]] std::string encode() const;
    [[nodiscard]] bool save(const std::filesystem::path& path) const;
};

} // namespace spectro_bin

#endif // SPECTRO_BIN_CSV_HPP_
