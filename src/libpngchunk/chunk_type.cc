//
// Created by igor on 15/08/2025.
//

#include <pngchunk/chunk_type.hh>

#include <cstring>
#include <iomanip>
#include <sstream>

namespace pngchunk {

    namespace {
        // Printable rendering for error messages, non-printables as \xNN
        std::string escaped(const void* data, std::size_t size) {
            std::ostringstream os;
            auto p = static_cast<const unsigned char*>(data);
            for (std::size_t i = 0; i < size; i++) {
                if (p[i] >= 32 && p[i] <= 126) {
                    os << static_cast<char>(p[i]);
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(p[i]) << std::dec;
                }
            }
            return os.str();
        }

        void validate(const void* data) {
            auto p = static_cast<const std::uint8_t*>(data);
            bool ok = true;
            for (std::size_t i = 0; i < chunk_type::size; i++) {
                ok = chunk_type::is_valid_byte(p[i]) && ok;
            }
            if (!ok) {
                THROW_CHUNK_TYPE(value_not_in_range,
                                 "Chunk type '", escaped(data, chunk_type::size),
                                 "' contains a byte outside A-Z/a-z");
            }
        }
    }

    chunk_type chunk_type::from_bytes(const std::array<std::uint8_t, 4>& bytes) {
        return from_bytes(bytes.data(), bytes.size());
    }

    chunk_type chunk_type::from_bytes(const void* data, std::size_t size) {
        if (size != chunk_type::size) {
            THROW_CHUNK_TYPE(wrong_length, "Chunk type must be 4 bytes, got ", size);
        }
        validate(data);
        auto p = static_cast<const char*>(data);
        return {p[0], p[1], p[2], p[3]};
    }

    chunk_type chunk_type::from_string(std::string_view sv) {
        if (sv.size() != chunk_type::size) {
            THROW_CHUNK_TYPE(wrong_length, "Chunk type must be 4 characters, got ", sv.size());
        }
        return from_bytes(sv.data(), sv.size());
    }

    std::optional<chunk_type> chunk_type::try_from_string(std::string_view sv) noexcept {
        if (sv.size() != chunk_type::size) {
            return std::nullopt;
        }
        for (char c : sv) {
            if (!is_valid_byte(static_cast<std::uint8_t>(c))) {
                return std::nullopt;
            }
        }
        return chunk_type(sv[0], sv[1], sv[2], sv[3]);
    }

    std::array<std::uint8_t, 4> chunk_type::bytes() const noexcept {
        std::array<std::uint8_t, 4> result{};
        to_bytes(result.data());
        return result;
    }

    void chunk_type::to_bytes(void* dest) const noexcept {
        std::memcpy(dest, m_chars.data(), size);
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        return os << '\'' << t.to_string_view() << '\'';
    }

} // namespace pngchunk
