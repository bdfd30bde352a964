#include <shpkit/types.hpp>

namespace shpkit {

const char* to_string(codec_error err) noexcept {
    switch (err) {
        case codec_error::none:                return "none";
        case codec_error::not_a_sprite:        return "not_a_sprite";
        case codec_error::invalid_dimensions:  return "invalid_dimensions";
        case codec_error::truncated_data:      return "truncated_data";
        case codec_error::offset_out_of_range: return "offset_out_of_range";
        case codec_error::empty_sprite:        return "empty_sprite";
        case codec_error::invalid_palette:     return "invalid_palette";
        case codec_error::invalid_format:      return "invalid_format";
        case codec_error::dimensions_exceeded: return "dimensions_exceeded";
        case codec_error::io_error:            return "io_error";
        case codec_error::internal_error:      return "internal_error";
    }
    return "unknown";
}

} // namespace shpkit
