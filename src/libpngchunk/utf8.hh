//
// Created by igor on 15/08/2025.
//

#pragma once

#include <cstddef>

namespace pngchunk {

    // Strict UTF-8 check: rejects overlong forms, surrogates and code points above U+10FFFF
    bool is_valid_utf8(const void* data, std::size_t size) noexcept;

} // namespace pngchunk
