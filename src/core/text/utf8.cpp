#include "core/text/utf8.hpp"

namespace warden::core::text {

namespace {

constexpr const char* kReplacement = "\xEF\xBF\xBD";

// Length of the valid sequence starting at `pos`, or 0 if it is invalid.
std::size_t sequence_length(std::string_view bytes, const std::size_t pos) {
    const auto lead = static_cast<unsigned char>(bytes[pos]);
    if (lead < 0x80) {
        return 1;
    }

    std::size_t length = 0;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) {
            min_second = 0xA0;
        } else if (lead == 0xED) {
            max_second = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) {
            min_second = 0x90;
        } else if (lead == 0xF4) {
            max_second = 0x8F;
        }
    } else {
        return 0;
    }

    if (pos + length > bytes.size()) {
        return 0;
    }
    const auto second = static_cast<unsigned char>(bytes[pos + 1]);
    if (second < min_second || second > max_second) {
        return 0;
    }
    for (std::size_t i = 2; i < length; ++i) {
        const auto next = static_cast<unsigned char>(bytes[pos + i]);
        if (next < 0x80 || next > 0xBF) {
            return 0;
        }
    }
    return length;
}

}  // namespace

bool is_valid_utf8(std::string_view bytes) {
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const std::size_t length = sequence_length(bytes, pos);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}

std::size_t incomplete_tail_length(std::string_view bytes) {
    const std::size_t lookback = bytes.size() < 3 ? bytes.size() : 3;
    for (std::size_t back = 1; back <= lookback; ++back) {
        const auto c = static_cast<unsigned char>(bytes[bytes.size() - back]);
        if ((c & 0xC0) == 0x80) {
            continue;
        }
        std::size_t expected = 1;
        if (c >= 0xF0) {
            expected = 4;
        } else if (c >= 0xE0) {
            expected = 3;
        } else if (c >= 0xC0) {
            expected = 2;
        }
        return expected > back ? back : 0;
    }
    return 0;
}

std::string sanitize_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const std::size_t length = sequence_length(bytes, pos);
        if (length == 0) {
            out += kReplacement;
            ++pos;
            continue;
        }
        out.append(bytes.data() + pos, length);
        pos += length;
    }
    return out;
}

}  // namespace warden::core::text
