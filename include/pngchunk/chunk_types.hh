//
// Created by igor on 14/08/2025.
//

#pragma once

#include <pngchunk/chunk_type.hh>

namespace pngchunk::chunk_id {

    // Critical chunks
    inline constexpr chunk_type IHDR = "IHDR"_ct;
    inline constexpr chunk_type PLTE = "PLTE"_ct;
    inline constexpr chunk_type IDAT = "IDAT"_ct;
    inline constexpr chunk_type IEND = "IEND"_ct;

    // Colour space information
    inline constexpr chunk_type cHRM = "cHRM"_ct;
    inline constexpr chunk_type gAMA = "gAMA"_ct;
    inline constexpr chunk_type iCCP = "iCCP"_ct;
    inline constexpr chunk_type sBIT = "sBIT"_ct;
    inline constexpr chunk_type sRGB = "sRGB"_ct;

    // Miscellaneous
    inline constexpr chunk_type bKGD = "bKGD"_ct;
    inline constexpr chunk_type hIST = "hIST"_ct;
    inline constexpr chunk_type tRNS = "tRNS"_ct;
    inline constexpr chunk_type pHYs = "pHYs"_ct;
    inline constexpr chunk_type sPLT = "sPLT"_ct;
    inline constexpr chunk_type tIME = "tIME"_ct;

    // Textual information
    inline constexpr chunk_type iTXt = "iTXt"_ct;
    inline constexpr chunk_type tEXt = "tEXt"_ct;
    inline constexpr chunk_type zTXt = "zTXt"_ct;

    // True for the chunk types registered by the PNG format itself
    inline bool is_standard(const chunk_type& t) {
        for (const auto& known : {IHDR, PLTE, IDAT, IEND,
                                  cHRM, gAMA, iCCP, sBIT, sRGB,
                                  bKGD, hIST, tRNS, pHYs, sPLT, tIME,
                                  iTXt, tEXt, zTXt}) {
            if (t == known) {
                return true;
            }
        }
        return false;
    }

} // namespace pngchunk::chunk_id
