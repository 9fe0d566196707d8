//
// Created by igor on 15/08/2025.
//

#include "utf8.hh"

namespace pngchunk {

    namespace {
        bool is_continuation(unsigned char c) {
            return (c & 0xC0) == 0x80;
        }
    }

    bool is_valid_utf8(const void* data, std::size_t size) noexcept {
        auto p = static_cast<const unsigned char*>(data);
        const auto* e = p + size;

        while (p < e) {
            unsigned char c = *p++;
            if (c < 0x80) {
                continue;
            }
            if ((c >> 5) == 0x6) {
                // 2 bytes, C0/C1 would be overlong
                if (p >= e || c < 0xC2 || !is_continuation(p[0])) {
                    return false;
                }
                p += 1;
            } else if ((c >> 4) == 0xE) {
                // 3 bytes
                if (e - p < 2 || !is_continuation(p[0]) || !is_continuation(p[1])) {
                    return false;
                }
                if (c == 0xE0 && p[0] < 0xA0) {
                    return false;  // overlong
                }
                if (c == 0xED && p[0] >= 0xA0) {
                    return false;  // surrogates
                }
                p += 2;
            } else if ((c >> 3) == 0x1E) {
                // 4 bytes
                if (e - p < 3 || !is_continuation(p[0]) || !is_continuation(p[1]) || !is_continuation(p[2])) {
                    return false;
                }
                if (c == 0xF0 && p[0] < 0x90) {
                    return false;  // overlong
                }
                if (c > 0xF4 || (c == 0xF4 && p[0] > 0x8F)) {
                    return false;  // above U+10FFFF
                }
                p += 3;
            } else {
                return false;
            }
        }
        return true;
    }

} // namespace pngchunk
