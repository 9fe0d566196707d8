/**
 * @file crc32.hh
 * @brief CRC-32/IEEE checksum used to protect PNG chunk records
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    class chunk_type;

    /**
     * @class crc32
     * @brief Incremental CRC-32/IEEE accumulator
     *
     * Thin wrapper over zlib's crc32(). The checksum of a chunk record
     * covers the type bytes followed by the payload, so callers feed
     * the type first and then the data.
     */
    class PNGCHUNK_EXPORT crc32 {
    public:
        crc32() noexcept;

        /**
         * @brief Feed bytes into the checksum
         * @param data Source buffer (may be null when size is 0)
         * @param size Number of bytes
         * @return Reference to this accumulator
         */
        crc32& update(const void* data, std::size_t size) noexcept;

        /**
         * @brief Feed the 4 bytes of a chunk type into the checksum
         */
        crc32& update(const chunk_type& type) noexcept;

        [[nodiscard]] std::uint32_t value() const noexcept { return m_value; }

    private:
        std::uint32_t m_value;
    };

    /**
     * @brief One-shot checksum of type ++ data
     * @param type Chunk type
     * @param data Payload buffer
     * @param size Payload size in bytes
     * @return CRC-32/IEEE of the concatenation
     */
    PNGCHUNK_EXPORT std::uint32_t chunk_crc(const chunk_type& type, const void* data, std::size_t size) noexcept;

} // namespace pngchunk
