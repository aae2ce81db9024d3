#include "mdoc/document.h"
#include <cctype>
#include <cstring>

namespace mdoc {

namespace {

bool isEscapable(char c) {
    return c != '\0' && std::strchr("\\`*_[]()#+-.!>", c) != nullptr;
}

bool isAlnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Find a closing run of exactly len delimiter characters starting at or
/// after from. Content between must be non-empty and not padded with spaces.
/// Underscore closers must not be followed by an alphanumeric character.
size_t findClosing(const std::string& text, size_t from, char delim, size_t len) {
    if (from >= text.size() || isSpace(text[from])) return std::string::npos;
    for (size_t j = from + 1; j + len <= text.size(); ++j) {
        bool run = true;
        for (size_t k = 0; k < len; ++k) {
            if (text[j + k] != delim) { run = false; break; }
        }
        if (!run) continue;
        // Exact length: not part of a longer delimiter run
        if (text[j - 1] == delim) continue;
        if (j + len < text.size() && text[j + len] == delim) continue;
        if (isSpace(text[j - 1])) continue;
        if (delim == '_' && j + len < text.size() && isAlnum(text[j + len])) continue;
        return j;
    }
    return std::string::npos;
}

bool hasBold(InlineType t) {
    return t == InlineType::Bold || t == InlineType::BoldItalic;
}

bool hasItalic(InlineType t) {
    return t == InlineType::Italic || t == InlineType::BoldItalic;
}

/// Emphasis wrapping emphasis picks up both weights
InlineType combine(InlineType outer, InlineType inner) {
    bool bold = hasBold(outer) || hasBold(inner);
    bool italic = hasItalic(outer) || hasItalic(inner);
    if (bold && italic) return InlineType::BoldItalic;
    return bold ? InlineType::Bold : InlineType::Italic;
}

/// Parses the content of an emphasis span and appends its pieces.
/// Code spans and links inside keep their own type; everything else takes
/// the emphasis of the enclosing span.
void appendEmphasis(InlineRun& out, InlineType type, const std::string& content) {
    for (auto& el : parseInlines(content)) {
        if (el.type == InlineType::Code || el.type == InlineType::Link) {
            out.push_back(std::move(el));
            continue;
        }
        InlineType merged = el.type == InlineType::Text ? type : combine(type, el.type);
        if (!out.empty() && out.back().type == merged && out.back().href.empty()) {
            out.back().text += el.text;
        } else {
            out.push_back({merged, std::move(el.text), {}});
        }
    }
}

} // anonymous namespace

std::string plainText(const InlineRun& run) {
    std::string result;
    for (const auto& el : run) {
        result += el.text;
    }
    return result;
}

InlineRun parseInlines(const std::string& text) {
    InlineRun out;
    std::string plain;

    auto flush = [&]() {
        if (!plain.empty()) {
            out.push_back(InlineElement::plain(plain));
            plain.clear();
        }
    };
    auto emit = [&](InlineElement el) {
        flush();
        out.push_back(std::move(el));
    };
    auto emitEmphasis = [&](InlineType type, const std::string& content) {
        flush();
        appendEmphasis(out, type, content);
    };

    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        char c = text[i];

        if (c == '\\' && i + 1 < n && isEscapable(text[i + 1])) {
            plain += text[i + 1];
            i += 2;
            continue;
        }

        if (c == '`') {
            size_t close = text.find('`', i + 1);
            if (close != std::string::npos && close > i + 1) {
                emit(InlineElement::code(text.substr(i + 1, close - i - 1)));
                i = close + 1;
                continue;
            }
            plain += c;
            ++i;
            continue;
        }

        if (c == '[') {
            size_t close = text.find(']', i + 1);
            if (close != std::string::npos && close > i + 1 &&
                close + 1 < n && text[close + 1] == '(') {
                size_t paren = text.find(')', close + 2);
                if (paren != std::string::npos && paren > close + 2) {
                    emit(InlineElement::link(text.substr(i + 1, close - i - 1),
                                             text.substr(close + 2, paren - close - 2)));
                    i = paren + 1;
                    continue;
                }
            }
            plain += c;
            ++i;
            continue;
        }

        if (c == '*' || c == '_') {
            size_t run = 0;
            while (i + run < n && text[i + run] == c) ++run;

            // Intra-word underscores stay literal (snake_case identifiers)
            bool canOpen = !(c == '_' && i > 0 && isAlnum(text[i - 1]));
            bool matched = false;
            // Four stars is the upstream generator's bold
            bool quadBold = c == '*' && run == 4;
            if (canOpen && (run <= 3 || quadBold)) {
                size_t len = run;
                size_t close = findClosing(text, i + len, c, len);
                if (close != std::string::npos) {
                    std::string content = text.substr(i + len, close - i - len);
                    if (len == 3) emitEmphasis(InlineType::BoldItalic, content);
                    else if (len == 1) emitEmphasis(InlineType::Italic, content);
                    else emitEmphasis(InlineType::Bold, content);
                    i = close + len;
                    matched = true;
                }
            }
            if (!matched) {
                plain.append(text, i, run);
                i += run;
            }
            continue;
        }

        plain += c;
        ++i;
    }
    flush();
    return out;
}

} // namespace mdoc
