#include "lineage/util/utf8.hpp"

namespace lineage::util {

// Structural check only: lead byte, continuation bytes, overlongs, surrogates
bool is_valid_utf8(const std::string& data) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* end = p + data.size();

    while (p < end) {
        if (*p < 0x80) {
            ++p;
            continue;
        }

        size_t extra;
        uint32_t cp;
        if ((*p & 0xE0) == 0xC0) {
            extra = 1;
            cp = *p & 0x1F;
        } else if ((*p & 0xF0) == 0xE0) {
            extra = 2;
            cp = *p & 0x0F;
        } else if ((*p & 0xF8) == 0xF0) {
            extra = 3;
            cp = *p & 0x07;
        } else {
            return false;
        }

        if (static_cast<size_t>(end - p) <= extra) return false;
        for (size_t i = 1; i <= extra; ++i) {
            if ((p[i] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i] & 0x3F);
        }

        if (extra == 1 && cp < 0x80) return false;
        if (extra == 2 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return false;
        if (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)) return false;

        p += extra + 1;
    }
    return true;
}

std::string latin1_to_utf8(const std::string& data) {
    std::string result;
    result.reserve(data.size() + data.size() / 8);
    for (unsigned char c : data) {
        if (c < 0x80) {
            result.push_back(static_cast<char>(c));
        } else {
            result += encode_utf8(c);
        }
    }
    return result;
}

std::string encode_utf8(uint32_t cp) {
    std::string result;
    if (cp < 0x80) {
        result.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return result;
}

std::string strip_invisible(const std::string& text) {
    static const std::string kBom = "\xEF\xBB\xBF";     // U+FEFF
    static const std::string kNbsp = "\xC2\xA0";        // U+00A0
    static const std::string kZwsp = "\xE2\x80\x8B";    // U+200B

    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, kBom.size(), kBom) == 0 || text.compare(i, kZwsp.size(), kZwsp) == 0) {
            i += 3;
        } else if (text.compare(i, kNbsp.size(), kNbsp) == 0) {
            result.push_back(' ');
            i += 2;
        } else {
            result.push_back(text[i++]);
        }
    }
    return result;
}

} // namespace lineage::util
