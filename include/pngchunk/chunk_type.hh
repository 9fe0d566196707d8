//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <ostream>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/exceptions.hh>

namespace pngchunk {
    /**
     * @class chunk_type
     * @brief Four ASCII letter tag identifying the role of a PNG chunk
     *
     * Every byte is an ASCII letter. Bit 5 (0x20, the lowercase bit) of
     * each byte carries a property flag:
     *  - byte 0: ancillary (set) / critical (clear)
     *  - byte 1: private (set) / public (clear)
     *  - byte 2: reserved, must be clear for the type to be valid
     *  - byte 3: safe to copy (set) / unsafe to copy (clear)
     *
     * Instances are immutable and can only be created from a valid tag.
     */
    class PNGCHUNK_EXPORT chunk_type {
        public:
            static constexpr std::size_t size = 4;
            static constexpr std::uint8_t property_bit = 0x20;

            // Constructor from 4 individual chars, throws chunk_type_error
            constexpr chunk_type(char c0, char c1, char c2, char c3)
                : m_chars{c0, c1, c2, c3} {
                // every byte is inspected, only the fact of a failure is reported
                bool ok = true;
                for (char c : m_chars) {
                    ok = is_valid_byte(static_cast<std::uint8_t>(c)) && ok;
                }
                if (!ok) {
                    throw chunk_type_error(error_code::value_not_in_range,
                                           "Chunk type contains a byte outside A-Z/a-z");
                }
            }

            // Constructor from an owned 4 byte array
            static chunk_type from_bytes(const std::array<std::uint8_t, 4>& bytes);

            // Constructor from a borrowed slice, size must be exactly 4
            static chunk_type from_bytes(const void* data, std::size_t size);

            // Constructor from text, exactly 4 characters
            static chunk_type from_string(std::string_view sv);

            // Non-throwing variant of from_string
            static std::optional<chunk_type> try_from_string(std::string_view sv) noexcept;

            // ASCII letter ranges 65-90 and 97-122
            static constexpr bool is_valid_byte(std::uint8_t b) noexcept {
                return (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z');
            }

            // Canonical byte form, used for CRC computation and serialization
            [[nodiscard]] std::array<std::uint8_t, 4> bytes() const noexcept;

            // Write the 4 bytes to dest
            void to_bytes(void* dest) const noexcept;

            [[nodiscard]] std::string to_string() const {
                return {m_chars.data(), size};
            }

            [[nodiscard]] std::string_view to_string_view() const noexcept {
                return {m_chars.data(), size};
            }

            constexpr char operator[](std::size_t i) const { return m_chars[i]; }

            [[nodiscard]] constexpr auto begin() const { return m_chars.begin(); }
            [[nodiscard]] constexpr auto end() const { return m_chars.end(); }

            [[nodiscard]] constexpr bool is_critical() const noexcept { return !property(0); }
            [[nodiscard]] constexpr bool is_public() const noexcept { return !property(1); }
            [[nodiscard]] constexpr bool is_reserved_bit_valid() const noexcept { return !property(2); }
            [[nodiscard]] constexpr bool is_safe_to_copy() const noexcept { return property(3); }

            // Letters are guaranteed by construction, validity is the reserved bit
            [[nodiscard]] constexpr bool is_valid() const noexcept { return is_reserved_bit_valid(); }

            // Comparison operators
            bool operator==(const chunk_type& o) const { return m_chars == o.m_chars; }
            bool operator!=(const chunk_type& o) const { return !(*this == o); }
            bool operator<(const chunk_type& o) const { return m_chars < o.m_chars; }
            bool operator<=(const chunk_type& o) const { return m_chars <= o.m_chars; }
            bool operator>(const chunk_type& o) const { return m_chars > o.m_chars; }
            bool operator>=(const chunk_type& o) const { return m_chars >= o.m_chars; }

        private:
            [[nodiscard]] constexpr bool property(std::size_t i) const noexcept {
                return (static_cast<std::uint8_t>(m_chars[i]) & property_bit) != 0;
            }

            std::array<char, 4> m_chars;
    };

    // Stream output, quoted: 'IHDR'
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v = 0;
            t.to_bytes(&v);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal, validated at compile time in constant expressions
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != chunk_type::size) {
            throw chunk_type_error(error_code::wrong_length,
                                   "Chunk type literal must be exactly 4 characters");
        }
        return {str[0], str[1], str[2], str[3]};
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
