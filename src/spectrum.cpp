#include <spectro_bin/spectrum.hpp>

#include <new>
#include <stdexcept>

namespace spectro_bin {

bool memory_spectrum::begin(data_format format, std::size_t count) {
    format_ = format;
    rows_.clear();

    try {
        rows_.resize(count);
    } catch (const std::bad_alloc&) {
        return false;
    } catch (const std::length_error&) {
        return false;
    }

    return true;
}

void memory_spectrum::write_row(std::size_t index, const spectrum_row& row) {
    if (index >= rows_.size()) {
        return;
    }
    rows_[index] = row;
}

} // namespace spectro_bin
