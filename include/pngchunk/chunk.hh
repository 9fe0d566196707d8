/**
 * @file chunk.hh
 * @brief PNG chunk record: encoding, decoding and validation
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief One length-prefixed, CRC protected record
     *
     * Wire layout, all integers big-endian:
     * @code
     *   length:4  type:4  data:length  crc:4
     * @endcode
     * The CRC is CRC-32/IEEE over the type bytes followed by the data.
     * A chunk owns its type and payload and is never modified after
     * construction.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Size of the length, type and crc fields together
        static constexpr std::size_t overhead = 12;

        /// Smallest possible record (empty payload)
        static constexpr std::size_t min_size = 16;

        /**
         * @brief Build a fresh record, the CRC is computed from type and data
         * @param type Chunk type
         * @param data Payload, may be empty
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Decode and validate a record from a raw byte buffer
         * @param data Start of the record
         * @param size Bytes available, may extend past the end of the record
         * @param options Limits and warning callback
         * @return Validated chunk
         * @throws input_too_small_error buffer shorter than 16 bytes
         * @throws chunk_type_not_valid_error type field is not 4 ASCII letters
         * @throws length_out_of_bounds_error declared length runs past the buffer
         * @throws chunk_error length_limit_exceeded in strict mode
         * @throws crc_mismatch_error stored CRC differs from the computed one
         */
        static chunk parse(const void* data, std::size_t size, const parse_options& options);

        /**
         * @brief Decode with default options
         */
        static chunk parse(const void* data, std::size_t size);

        static chunk parse(const std::vector<std::byte>& bytes, const parse_options& options);
        static chunk parse(const std::vector<std::byte>& bytes);

        // Accessors
        [[nodiscard]] std::uint32_t length() const noexcept { return m_length; }
        [[nodiscard]] const chunk_type& type() const noexcept { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return m_data; }
        [[nodiscard]] std::uint32_t crc() const noexcept { return m_crc; }

        /**
         * @brief On-wire size of the record (12 + length)
         *
         * Lets a container layer find where the next record starts.
         */
        [[nodiscard]] std::size_t wire_size() const noexcept { return overhead + m_data.size(); }

        /**
         * @brief Interpret the payload as UTF-8 text
         * @return Payload bytes as a string
         * @throws chunk_error utf8_decode_failure if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Serialize the full record: length ++ type ++ data ++ crc
         * @return wire_size() bytes
         */
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /**
         * @brief Serialize into a caller supplied buffer
         * @param dest Buffer of at least wire_size() bytes
         */
        void write_to(void* dest) const;

        /**
         * @brief Multi-line diagnostic summary
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    /**
     * @brief Build a chunk from a type string and a text payload
     * @param type Chunk type text, 4 ASCII letters
     * @param text Payload, copied byte for byte
     * @throws chunk_type_error if the type is invalid
     */
    PNGCHUNK_EXPORT chunk chunk_from_strings(std::string_view type, std::string_view text);

} // namespace pngchunk
