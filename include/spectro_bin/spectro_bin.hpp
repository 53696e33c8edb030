#ifndef SPECTRO_BIN_SPECTRO_BIN_HPP_
#define SPECTRO_BIN_SPECTRO_BIN_HPP_

#include <spectro_bin/spectro_bin_export.h>
#include <spectro_bin/types.hpp>
#include <spectro_bin/spectrum.hpp>
#include <spectro_bin/header_locator.hpp>
#include <spectro_bin/format_detector.hpp>
#include <spectro_bin/data_decoder.hpp>
#include <spectro_bin/axis_reconstructor.hpp>
#include <spectro_bin/decoder.hpp>
#include <spectro_bin/csv.hpp>

namespace spectro_bin {

// All public API is included via the headers above.
// See:
//   - types.hpp:              data_format, decode_error, decode_result, decode_options
//   - spectrum.hpp:           spectrum_sink, memory_spectrum
//   - header_locator.hpp:     locate_header(), data_region()
//   - format_detector.hpp:    plausibility_score(), detect_format()
//   - data_decoder.hpp:       decode_float32(), decode_samples()
//   - axis_reconstructor.hpp: read_axis_range(), reconstruct_axis()
//   - decoder.hpp:            decode(), decode_file(), read_file()
//   - csv.hpp:                encode_csv(), save_csv(), csv_spectrum

} // namespace spectro_bin

#endif // SPECTRO_BIN_SPECTRO_BIN_HPP_
