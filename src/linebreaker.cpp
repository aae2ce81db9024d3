#include "mdoc/layout.h"
#include "mdoc/platform.h"
#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

namespace mdoc {

namespace linebreaker {

size_t fitCharacters(const std::string& text, const FontDescriptor& font,
                     float maxWidth, PlatformAdapter& platform) {
    float width = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = utf8CharLen(static_cast<unsigned char>(text[pos]));
        // Ensure we don't read past the string
        if (pos + len > text.size()) len = text.size() - pos;
        float charWidth = platform.measureText(text.substr(pos, len), font).width;
        if (width + charWidth > maxWidth && pos > 0) break;
        width += charWidth;
        pos += len;
    }
    return pos;
}

std::vector<std::string> wrapByCharacters(const std::string& text,
                                          const FontDescriptor& font,
                                          float maxWidth,
                                          PlatformAdapter& platform) {
    std::vector<std::string> segments;
    size_t start = 0;
    do {
        size_t len = fitCharacters(text.substr(start), font, maxWidth, platform);
        segments.push_back(text.substr(start, len));
        start += len;
    } while (start < text.size());
    return segments;
}

std::string expandTabs(const std::string& line, int tabWidth) {
    if (line.find('\t') == std::string::npos) return line;
    std::string result;
    int column = 0;
    for (char c : line) {
        if (c == '\t') {
            int spaces = tabWidth - (column % tabWidth);
            result.append(static_cast<size_t>(spaces), ' ');
            column += spaces;
        } else {
            result += c;
            // Count columns per character, not per continuation byte
            if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++column;
        }
    }
    return result;
}

InlineRun splitInlineRun(InlineRun& run, int inlineIndex, int charOffset) {
    InlineRun suffix;
    if (inlineIndex < 0 || inlineIndex >= static_cast<int>(run.size())) return suffix;

    size_t first = static_cast<size_t>(inlineIndex);
    auto& element = run[first];
    size_t offset = charOffset > 0 ? static_cast<size_t>(charOffset) : 0;
    if (offset >= element.text.size()) {
        ++first;
    } else if (offset > 0) {
        InlineElement tail = element;
        tail.text = element.text.substr(offset);
        element.text.resize(offset);
        suffix.push_back(std::move(tail));
        ++first;
    }

    suffix.insert(suffix.end(),
                  std::make_move_iterator(run.begin() + static_cast<std::ptrdiff_t>(first)),
                  std::make_move_iterator(run.end()));
    run.erase(run.begin() + static_cast<std::ptrdiff_t>(first), run.end());
    return suffix;
}

} // namespace linebreaker

} // namespace mdoc
