#include "utils/Utf8.hpp"

bool isValidUtf8(const std::string& bytes) {
    std::size_t n = bytes.size();
    std::size_t i = 0;

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);

        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len;
        unsigned int cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;  // stray continuation byte or 0xF8..0xFF
        }

        if (i + len > n) return false;

        for (std::size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // overlong encodings
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;

        i += len;
    }

    return true;
}
