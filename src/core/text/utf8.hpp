#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace warden::core::text {

// Strict check: rejects overlongs, surrogates and code points past U+10FFFF.
bool is_valid_utf8(std::string_view bytes);

// Number of trailing bytes that form the start of a multi-byte sequence cut
// short by the end of the buffer (0 when the buffer ends on a boundary).
std::size_t incomplete_tail_length(std::string_view bytes);

// Replaces every invalid sequence with U+FFFD.
std::string sanitize_utf8(std::string_view bytes);

}  // namespace warden::core::text
