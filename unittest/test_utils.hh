#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

// Payload bytes from text
inline std::vector<std::byte> bytes_of(std::string_view text) {
    std::vector<std::byte> result;
    result.reserve(text.size());
    for (char c : text) {
        result.push_back(static_cast<std::byte>(c));
    }
    return result;
}

inline void append_be32(std::vector<std::byte>& out, std::uint32_t v) {
    out.push_back(static_cast<std::byte>(v >> 24));
    out.push_back(static_cast<std::byte>(v >> 16));
    out.push_back(static_cast<std::byte>(v >> 8));
    out.push_back(static_cast<std::byte>(v));
}

// Hand assembled record: length ++ type ++ payload ++ crc
inline std::vector<std::byte> make_record(std::uint32_t length, std::string_view type,
                                          std::string_view payload, std::uint32_t crc) {
    std::vector<std::byte> out;
    append_be32(out, length);
    for (char c : type) {
        out.push_back(static_cast<std::byte>(c));
    }
    for (char c : payload) {
        out.push_back(static_cast<std::byte>(c));
    }
    append_be32(out, crc);
    return out;
}

// Known good record: "RuSt" carrying a 42 byte message
inline constexpr std::string_view secret_message = "This is where your secret message will be!";
inline constexpr std::uint32_t secret_message_crc = 2882656334u;

inline std::vector<std::byte> secret_record() {
    return make_record(42, "RuSt", secret_message, secret_message_crc);
}
