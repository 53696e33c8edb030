#ifndef SPECTRO_BIN_SPECTRUM_HPP_
#define SPECTRO_BIN_SPECTRUM_HPP_

#include <spectro_bin/spectro_bin_export.h>
#include <spectro_bin/types.hpp>

#include <cstddef>
#include <span>
#include <vector>

namespace spectro_bin {

struct spectrum_row {
    double wavelength = 0.0;
    double value = 0.0;
};

// ============================================================================
// Spectrum Sink Interface
// ============================================================================

/**
 * Abstract destination for decoded spectra.
 * The decoder announces the format and row count once, then writes every
 * row in file order.
 *
 * Implement this interface to stream rows into your own container or
 * writer without an intermediate copy.
 */
class SPECTRO_BIN_EXPORT spectrum_sink {
public:
    virtual ~spectrum_sink() = default;

    /**
     * Prepare for a new spectrum.
     * Called before any row writes.
     * @param format Detected sample format
     * @param count Number of rows that will follow
     * @return true if allocation succeeded
     */
    virtual bool begin(data_format format, std::size_t count) = 0;

    /**
     * Write one row.
     * @param index Row index (0 to count-1)
     * @param row Wavelength and value
     */
    virtual void write_row(std::size_t index, const spectrum_row& row) = 0;
};

// ============================================================================
// Memory Spectrum (default implementation)
// ============================================================================

class SPECTRO_BIN_EXPORT memory_spectrum : public spectrum_sink {
public:
    memory_spectrum() = default;
    ~memory_spectrum() override = default;

    memory_spectrum(const memory_spectrum&) = delete;
    memory_spectrum& operator=(const memory_spectrum&) = delete;
    memory_spectrum(memory_spectrum&&) noexcept = default;
    memory_spectrum& operator=(memory_spectrum&&) noexcept = default;

    // Sink interface
    bool begin(data_format format, std::size_t count) override;
    void write_row(std::size_t index, const spectrum_row& row) override;

    // Accessors (read-only)
    [[nodiscard]] data_format format() const noexcept { return format_; }
    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }
    [[nodiscard]] std::span<const spectrum_row> rows() const noexcept { return rows_; }

private:
    std::vector<spectrum_row> rows_;
    data_format format_ = data_format::bytes;
};

} // namespace spectro_bin

#endif // SPECTRO_BIN_SPECTRUM_HPP_
