/**
 * @file chunk_inspector.cpp
 * @brief Decodes a chunk record given as hex on the command line
 *
 * Usage: chunk_inspector 0000000049454e44ae426082
 *
 * Prints the record summary and the property bits of its type.
 * Warnings are reported but do not stop decoding (lenient mode).
 */

#include <pngchunk/chunk.hh>
#include <pngchunk/chunk_types.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>

#include <cctype>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

static std::optional<std::vector<std::byte>> parse_hex(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
    }
    if (digits.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::byte> result;
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(digits[i])) ||
            !std::isxdigit(static_cast<unsigned char>(digits[i + 1]))) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::byte>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    }
    return result;
}

static const char* yes_no(bool v) {
    return v ? "yes" : "no";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <hex bytes>...\n";
        std::cout << "\n";
        std::cout << "Decodes one PNG chunk record and prints its fields.\n";
        return 1;
    }

    std::string text;
    for (int i = 1; i < argc; i++) {
        text += argv[i];
    }

    auto bytes = parse_hex(text);
    if (!bytes) {
        std::cerr << "Error: input is not a sequence of hex byte pairs\n";
        return 1;
    }

    pngchunk::parse_options opts;
    opts.strict = false;
    opts.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        auto c = pngchunk::chunk::parse(*bytes, opts);
        const auto& type = c.type();

        std::cout << c;
        std::cout << "Type " << type << (pngchunk::chunk_id::is_standard(type) ? " (standard)" : "") << "\n";
        std::cout << "  critical:     " << yes_no(type.is_critical()) << "\n";
        std::cout << "  public:       " << yes_no(type.is_public()) << "\n";
        std::cout << "  reserved ok:  " << yes_no(type.is_reserved_bit_valid()) << "\n";
        std::cout << "  safe to copy: " << yes_no(type.is_safe_to_copy()) << "\n";
    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error (" << pngchunk::to_string(e.code()) << "): " << e.what() << "\n";
        return 1;
    }

    return 0;
}
