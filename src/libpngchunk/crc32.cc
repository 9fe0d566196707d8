//
// Created by igor on 15/08/2025.
//

#include <pngchunk/crc32.hh>
#include <pngchunk/chunk_type.hh>

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace pngchunk {

    crc32::crc32() noexcept
        : m_value(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {
    }

    crc32& crc32::update(const void* data, std::size_t size) noexcept {
        auto p = static_cast<const Bytef*>(data);
        uLong crc = m_value;
        // zlib takes uInt lengths, feed larger buffers block by block
        while (size > 0) {
            auto block = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            crc = ::crc32(crc, p, block);
            p += block;
            size -= block;
        }
        m_value = static_cast<std::uint32_t>(crc);
        return *this;
    }

    crc32& crc32::update(const chunk_type& type) noexcept {
        const auto b = type.bytes();
        return update(b.data(), b.size());
    }

    std::uint32_t chunk_crc(const chunk_type& type, const void* data, std::size_t size) noexcept {
        return crc32().update(type).update(data, size).value();
    }

} // namespace pngchunk
