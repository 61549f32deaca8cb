#include "infrastructure/Utf8.hpp"

namespace dualtap::infrastructure {

namespace {

bool IsContinuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Same set Python's str.isspace() accepts: ASCII controls 0x09-0x0D and 0x1C-0x1F,
// plus the Unicode White_Space code points.
bool IsWhitespace(char32_t cp) {
    if ((cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20)) return true;
    if (cp == 0x85 || cp == 0xA0 || cp == 0x1680) return true;
    if (cp >= 0x2000 && cp <= 0x200A) return true;
    return cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

// Decodes the sequence starting at pos. Returns its length in bytes, 0 if invalid.
std::size_t DecodeAt(const std::string& text, std::size_t pos, char32_t& cp) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 0;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        length = 4;
    } else {
        return 0;
    }
    if (pos + length > text.size()) return 0;
    for (std::size_t i = 1; i < length; ++i) {
        if (!IsContinuation(text[pos + i])) return 0;
        cp = (cp << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
    }
    return length;
}

} // namespace

std::size_t Utf8::Length(const std::string& text) {
    std::size_t count = 0;
    for (char c : text) {
        if (!IsContinuation(c)) ++count;
    }
    return count;
}

std::string Utf8::Truncate(const std::string& text, std::size_t maxChars) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (IsContinuation(text[i])) continue;
        if (seen == maxChars) {
            return text.substr(0, i);
        }
        ++seen;
    }
    return text;
}

std::string Utf8::Trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    char32_t cp = 0;

    while (begin < end) {
        std::size_t length = DecodeAt(text, begin, cp);
        if (length == 0 || !IsWhitespace(cp)) break;
        begin += length;
    }

    while (end > begin) {
        std::size_t start = end - 1;
        while (start > begin && IsContinuation(text[start])) --start;
        std::size_t length = DecodeAt(text, start, cp);
        if (length != end - start || !IsWhitespace(cp)) break;
        end = start;
    }
    return text.substr(begin, end - begin);
}

} // namespace dualtap::infrastructure
