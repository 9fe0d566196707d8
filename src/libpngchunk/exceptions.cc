//
// Created by igor on 15/08/2025.
//

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    const char* to_string(error_code code) noexcept {
        switch (code) {
            case error_code::value_not_in_range:
                return "value_not_in_range";
            case error_code::wrong_length:
                return "wrong_length";
            case error_code::input_too_small:
                return "input_too_small";
            case error_code::chunk_type_not_valid:
                return "chunk_type_not_valid";
            case error_code::length_out_of_bounds:
                return "length_out_of_bounds";
            case error_code::length_limit_exceeded:
                return "length_limit_exceeded";
            case error_code::crc_mismatch:
                return "crc_mismatch";
            case error_code::utf8_decode_failure:
                return "utf8_decode_failure";
        }
        // make compiler happy
        return "unknown";
    }

} // namespace pngchunk
