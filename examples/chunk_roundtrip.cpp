/**
 * @file chunk_roundtrip.cpp
 * @brief Builds a few chunks, serializes them and decodes them again
 *
 * Shows the two ways of creating a chunk (fresh from a type and a payload,
 * or parsed from raw bytes) and what happens when a record is corrupted.
 */

#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <iomanip>
#include <iostream>
#include <vector>

static void dump(const std::vector<std::byte>& bytes) {
    std::cout << "  ";
    for (std::size_t i = 0; i < bytes.size(); i++) {
        std::cout << std::hex << std::setfill('0') << std::setw(2)
                  << static_cast<unsigned>(bytes[i]) << (i + 1 == bytes.size() ? "" : " ");
    }
    std::cout << std::dec << "\n";
}

int main() {
    try {
        std::vector<pngchunk::chunk> chunks{
            pngchunk::chunk_from_strings("FrSt", "I am the first chunkd"),
            pngchunk::chunk_from_strings("miDl", "I am another chunkd"),
            pngchunk::chunk_from_strings("LASt", "I am the last chunkd"),
        };

        for (const auto& c : chunks) {
            std::cout << c;
            auto bytes = c.to_bytes();
            dump(bytes);

            auto decoded = pngchunk::chunk::parse(bytes);
            std::cout << "  decoded: " << decoded.data_as_string()
                      << (decoded == c ? " (identical)" : " (DIFFERENT)") << "\n\n";
        }

        // flip one payload bit of the first record
        auto corrupted = chunks.front().to_bytes();
        corrupted[8] ^= std::byte{0x20};
        try {
            (void)pngchunk::chunk::parse(corrupted);
            std::cerr << "Corruption went unnoticed\n";
            return 1;
        } catch (const pngchunk::crc_mismatch_error& e) {
            std::cout << "Corrupted record rejected: " << e.what() << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
