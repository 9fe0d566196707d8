/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for PNG chunk records
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <pngchunk/endian.hh>

namespace pngchunk {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     */
    enum class byte_order {
        little, ///< Little-endian
        big     ///< Big-endian (network order, used by every PNG field)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     */
    constexpr bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    /**
     * @brief Load a multi-byte value from an unaligned buffer
     * @tparam T Integral type to load
     * @param src Source buffer, at least sizeof(T) bytes
     * @param bo Byte order of the stored value
     * @return Value converted to native byte order
     */
    template<typename T>
    T load(const void* src, byte_order bo) {
        T value;
        std::memcpy(&value, src, sizeof(T));
        if constexpr (sizeof(T) > 1) {
            if (!byte_order_native(bo)) {
                value = swap_byte_order(value);
            }
        }
        return value;
    }

    /**
     * @brief Store a multi-byte value into an unaligned buffer
     * @tparam T Integral type to store
     * @param dst Destination buffer, at least sizeof(T) bytes
     * @param value Value in native byte order
     * @param bo Byte order to store in
     */
    template<typename T>
    void store(void* dst, T value, byte_order bo) {
        if constexpr (sizeof(T) > 1) {
            if (!byte_order_native(bo)) {
                value = swap_byte_order(value);
            }
        }
        std::memcpy(dst, &value, sizeof(T));
    }

    inline std::uint32_t load_be32(const void* src) {
        return load<std::uint32_t>(src, byte_order::big);
    }

    inline void store_be32(void* dst, std::uint32_t value) {
        store<std::uint32_t>(dst, value, byte_order::big);
    }
}
