//
// Created by igor on 15/08/2025.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/crc32.hh>
#include <pngchunk/exceptions.hh>
#include "utf8.hh"

#include <cstring>
#include <ostream>
#include <sstream>
#include <utility>

namespace pngchunk {

    namespace {
        constexpr std::size_t length_offset = 0;
        constexpr std::size_t type_offset = 4;
        constexpr std::size_t data_offset = 8;
        constexpr std::size_t crc_size = 4;

        chunk_type read_type(const std::uint8_t* p) {
            try {
                return chunk_type::from_bytes(p, chunk_type::size);
            } catch (const chunk_type_error& e) {
                throw chunk_type_not_valid_error(e.code(), build_error_msg(
                    "Invalid chunk type at offset ", type_offset, ": ", e.what()));
            }
        }

        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(static_cast<std::uint32_t>(data.size())),
          m_type(type),
          m_data(std::move(data)),
          m_crc(chunk_crc(m_type, m_data.data(), m_data.size())) {
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length),
          m_type(type),
          m_data(std::move(data)),
          m_crc(crc) {
    }

    chunk chunk::parse(const void* data, std::size_t size, const parse_options& options) {
        if (size < min_size) {
            throw input_too_small_error(size, build_error_msg(
                "Chunk record needs at least ", min_size, " bytes, got ", size));
        }

        auto p = static_cast<const std::uint8_t*>(data);
        const std::uint32_t data_length = load_be32(p + length_offset);
        const chunk_type type = read_type(p + type_offset);

        if (data_length > options.max_chunk_length) {
            auto msg = build_error_msg("Chunk ", type, " declares ", data_length,
                                       " bytes, exceeds maximum allowed ", options.max_chunk_length);
            if (options.strict) {
                THROW_CHUNK(length_limit_exceeded, msg);
            }
            warn(options, length_offset, "size_limit", msg);
        }

        // payload and crc must both fit in what follows the type field
        const std::size_t available = size - data_offset;
        if (static_cast<std::uint64_t>(data_length) + crc_size > available) {
            throw length_out_of_bounds_error(data_length, available, build_error_msg(
                "Chunk ", type, " declares ", data_length, " data bytes but only ",
                available, " bytes follow the type field (including 4 CRC bytes)"));
        }

        const std::uint8_t* payload = p + data_offset;
        const std::uint32_t declared = load_be32(payload + data_length);
        const std::uint32_t computed = chunk_crc(type, payload, data_length);
        if (computed != declared) {
            throw crc_mismatch_error(computed, declared, build_error_msg(
                "CRC mismatch in chunk ", type, ": computed ", computed, ", stored ", declared));
        }

        if (!type.is_reserved_bit_valid()) {
            warn(options, type_offset + 2, "reserved_bit",
                 build_error_msg("Chunk ", type, " has the reserved bit set"));
        }

        const std::size_t end = data_offset + data_length + crc_size;
        if (size > end) {
            warn(options, end, "trailing_data",
                 build_error_msg(size - end, " bytes follow chunk ", type));
        }

        auto first = reinterpret_cast<const std::byte*>(payload);
        return {data_length, type, std::vector<std::byte>(first, first + data_length), computed};
    }

    chunk chunk::parse(const void* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    chunk chunk::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    chunk chunk::parse(const std::vector<std::byte>& bytes) {
        return parse(bytes.data(), bytes.size(), parse_options{});
    }

    std::string chunk::data_as_string() const {
        THROW_CHUNK_UNLESS(is_valid_utf8(m_data.data(), m_data.size()), utf8_decode_failure,
                           "Data of chunk ", m_type, " is not valid UTF-8");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::to_bytes() const {
        std::vector<std::byte> result(wire_size());
        write_to(result.data());
        return result;
    }

    void chunk::write_to(void* dest) const {
        auto p = static_cast<std::uint8_t*>(dest);
        store_be32(p + length_offset, m_length);
        m_type.to_bytes(p + type_offset);
        if (!m_data.empty()) {
            std::memcpy(p + data_offset, m_data.data(), m_data.size());
        }
        store_be32(p + data_offset + m_data.size(), m_crc);
    }

    std::string chunk::to_string() const {
        std::ostringstream os;
        os << *this;
        return os.str();
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type &&
               m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk {\n"
           << "  Length: " << c.length() << "\n"
           << "  Type: " << c.type().to_string_view() << "\n"
           << "  Data: " << c.data().size() << " bytes\n"
           << "  Crc: " << c.crc() << "\n"
           << "}\n";
        return os;
    }

    chunk chunk_from_strings(std::string_view type, std::string_view text) {
        auto first = reinterpret_cast<const std::byte*>(text.data());
        return {chunk_type::from_string(type), std::vector<std::byte>(first, first + text.size())};
    }

} // namespace pngchunk
