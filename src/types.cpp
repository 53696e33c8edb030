#include <spectro_bin/types.hpp>

namespace spectro_bin {

const char* to_string(data_format fmt) noexcept {
    switch (fmt) {
        case data_format::float32_be: return "float32_be";
        case data_format::float32_le: return "float32_le";
        case data_format::int16:      return "int16";
        case data_format::bytes:      return "bytes";
    }
    return "unknown";
}

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:           return "none";
        case decode_error::io_error:       return "io_error";
        case decode_error::write_error:    return "write_error";
        case decode_error::internal_error: return "internal_error";
    }
    return "unknown";
}

} // namespace spectro_bin
