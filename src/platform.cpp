#include "mdoc/platform.h"
#include <array>
#include <cstdint>

namespace mdoc {

namespace {

// Advance widths (1/1000 em) for WinAnsi codes 32..126.
constexpr std::array<uint16_t, 95> kHelveticaWidths = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,  // ' ' .. '/'
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,  // '0' .. '?'
    1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778, // '@' .. 'O'
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,  // 'P' .. '_'
    333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,  // '`' .. 'o'
    556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584,       // 'p' .. '~'
};

constexpr std::array<uint16_t, 95> kHelveticaBoldWidths = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333, 584, 584, 584, 611,
    975, 722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833, 722, 778,
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 333, 278, 333, 584, 556,
    333, 556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889, 611, 611,
    611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584,
};

constexpr uint16_t kCourierWidth = 600;

bool isMonospace(const FontDescriptor& font) {
    return font.family == "Courier" || font.family == "monospace";
}

/// Width of one WinAnsi byte in 1/1000 em
uint16_t glyphWidth(unsigned char code, const FontDescriptor& font) {
    if (isMonospace(font)) return kCourierWidth;
    bool bold = font.weight == FontWeight::Bold;
    if (code >= 32 && code <= 126) {
        return bold ? kHelveticaBoldWidths[code - 32] : kHelveticaWidths[code - 32];
    }
    switch (code) {
        case 0x85: return 1000;               // ellipsis
        case 0x91: case 0x92: return bold ? 278 : 222;
        case 0x93: case 0x94: return bold ? 500 : 333;
        case 0x95: return 350;                // bullet
        case 0x96: return 556;                // en dash
        case 0x97: return 1000;               // em dash
        case 0x99: return 1000;               // trademark
        case 0xA0: return 278;                // nbsp
        case 0xB7: return 278;                // middle dot
        default:   return 556;
    }
}

uint32_t decodeUtf8(const std::string& s, size_t pos, size_t len) {
    unsigned char lead = static_cast<unsigned char>(s[pos]);
    if (len == 1) return lead;
    uint32_t cp = (len == 2) ? (lead & 0x1F) : (len == 3) ? (lead & 0x0F) : (lead & 0x07);
    for (size_t i = 1; i < len; ++i) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[pos + i]) & 0x3F);
    }
    return cp;
}

/// WinAnsi byte for a code point, or '?' when there is none
char winAnsiFor(uint32_t cp) {
    if (cp < 0x80) return static_cast<char>(cp);
    if (cp >= 0xA0 && cp <= 0xFF) return static_cast<char>(cp);
    switch (cp) {
        case 0x20AC: return static_cast<char>(0x80);
        case 0x201A: return static_cast<char>(0x82);
        case 0x0192: return static_cast<char>(0x83);
        case 0x201E: return static_cast<char>(0x84);
        case 0x2026: return static_cast<char>(0x85);
        case 0x2020: return static_cast<char>(0x86);
        case 0x2021: return static_cast<char>(0x87);
        case 0x02C6: return static_cast<char>(0x88);
        case 0x2030: return static_cast<char>(0x89);
        case 0x0160: return static_cast<char>(0x8A);
        case 0x2039: return static_cast<char>(0x8B);
        case 0x0152: return static_cast<char>(0x8C);
        case 0x017D: return static_cast<char>(0x8E);
        case 0x2018: return static_cast<char>(0x91);
        case 0x2019: return static_cast<char>(0x92);
        case 0x201C: return static_cast<char>(0x93);
        case 0x201D: return static_cast<char>(0x94);
        case 0x2022: return static_cast<char>(0x95);
        case 0x2013: return static_cast<char>(0x96);
        case 0x2014: return static_cast<char>(0x97);
        case 0x02DC: return static_cast<char>(0x98);
        case 0x2122: return static_cast<char>(0x99);
        case 0x0161: return static_cast<char>(0x9A);
        case 0x203A: return static_cast<char>(0x9B);
        case 0x0153: return static_cast<char>(0x9C);
        case 0x017E: return static_cast<char>(0x9E);
        case 0x0178: return static_cast<char>(0x9F);
        default:     return '?';
    }
}

} // anonymous namespace

size_t utf8CharLen(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1; // invalid byte, advance by 1
}

std::string utf8ToWinAnsi(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.size()) {
        size_t len = utf8CharLen(static_cast<unsigned char>(utf8[i]));
        if (i + len > utf8.size()) {
            out += '?';
            break;
        }
        unsigned char lead = static_cast<unsigned char>(utf8[i]);
        if (len == 1 && lead >= 0x80) {
            out += '?';   // stray continuation or invalid lead byte
        } else {
            out += winAnsiFor(decodeUtf8(utf8, i, len));
        }
        i += len;
    }
    return out;
}

FontMetrics StandardFontAdapter::resolveFontMetrics(const FontDescriptor& desc) {
    FontMetrics m;
    if (isMonospace(desc)) {
        m.ascent = desc.size * 0.629f;
        m.descent = desc.size * 0.157f;
    } else {
        m.ascent = desc.size * 0.718f;
        m.descent = desc.size * 0.207f;
    }
    m.leading = desc.size * 0.075f;
    return m;
}

TextMeasurement StandardFontAdapter::measureText(const std::string& text,
                                                 const FontDescriptor& font) {
    std::string encoded = utf8ToWinAnsi(text);
    uint32_t units = 0;
    for (unsigned char c : encoded) {
        units += glyphWidth(c, font);
    }
    auto metrics = resolveFontMetrics(font);
    return {static_cast<float>(units) * font.size / 1000.0f,
            metrics.ascent + metrics.descent};
}

size_t StandardFontAdapter::findLineBreak(const std::string& text,
                                          const FontDescriptor& font,
                                          float maxWidth) {
    // Walk characters once, remembering the last space reached while the
    // text before it still fits. A space at the end of a line is trimmed, so
    // it never causes an overflow itself.
    float width = 0;
    size_t lastBreak = 0;
    size_t i = 0;
    while (i < text.size()) {
        size_t len = utf8CharLen(static_cast<unsigned char>(text[i]));
        if (i + len > text.size()) len = text.size() - i;
        if (text[i] == ' ') {
            lastBreak = i + 1;
        }
        width += measureText(text.substr(i, len), font).width;
        if (width > maxWidth && text[i] != ' ') {
            return lastBreak;
        }
        i += len;
    }
    return text.size();
}

} // namespace mdoc
