#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "string_utils.hpp"

bool is_valid_utf8(std::string_view sv) {
    size_t i = 0;
    const size_t len = sv.length();

    while (i < len) {
        unsigned char c = sv[i];

        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t extra;
        uint32_t cp;
        uint32_t min_cp;

        if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
            min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
            min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
            min_cp = 0x10000;
        } else {
            // Stray continuation byte or 0xF8..0xFF
            return false;
        }

        // Truncated sequence
        if (i + extra >= len) {
            return false;
        }

        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = sv[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates and anything past the last plane
        if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }

        i += extra + 1;
    }

    return true;
}

// Length of the line break starting at sv[i], or 0 if there is none.
// Mirrors what calendar exporters may emit: LF, VT, FF, CR, NEL, LS and PS.
static size_t newline_length(std::string_view sv, size_t i) {
    switch (static_cast<unsigned char>(sv[i])) {
    case 0x0A:
    case 0x0B:
    case 0x0C:
    case 0x0D:
        return 1;
    default:
        break;
    }

    static constexpr std::array<std::string_view, 3> multibyte = {
        "\xC2\x85",     // U+0085 NEXT LINE
        "\xE2\x80\xA8", // U+2028 LINE SEPARATOR
        "\xE2\x80\xA9", // U+2029 PARAGRAPH SEPARATOR
    };

    for (auto nl : multibyte) {
        if (sv.substr(i).starts_with(nl)) {
            return nl.length();
        }
    }

    return 0;
}

std::vector<std::string_view> split_lines(std::string_view sv) {
    std::vector<std::string_view> lines;
    size_t start = 0;

    for (size_t i = 0; i < sv.length();) {
        size_t nl = newline_length(sv, i);
        if (nl == 0) {
            ++i;
            continue;
        }

        lines.push_back(sv.substr(start, i - start));
        i += nl;
        start = i;
    }

    lines.push_back(sv.substr(start));
    return lines;
}
