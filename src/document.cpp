#include "mdoc/document.h"
#include "mdoc/log.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace mdoc {

namespace {

constexpr int kTabWidth = 4;        // Tabs expand to the next multiple of this
constexpr int kListIndentWidth = 2; // Columns per list nesting level

/// Trim whitespace
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

/// Upstream generators sometimes deliver escaped text with literal "\n"
/// sequences and no real line breaks at all; only that form is unescaped.
std::string normalizeEscapes(const std::string& text) {
    if (text.find('\n') != std::string::npos) return text;
    if (text.find("\\n") == std::string::npos) return text;
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            if (text[i + 1] == 'n') { result += '\n'; ++i; continue; }
            if (text[i + 1] == 't') { result += '\t'; ++i; continue; }
        }
        result += text[i];
    }
    return result;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

/// "## Title ##" -> level 2, "Title". Returns 0 when the line is no heading.
int parseHeading(const std::string& trimmed, std::string& text) {
    int level = 0;
    while (level < static_cast<int>(trimmed.size()) && trimmed[level] == '#') ++level;
    if (level < 1 || level > 6) return 0;
    if (level == static_cast<int>(trimmed.size())) return 0;
    if (trimmed[level] != ' ' && trimmed[level] != '\t') return 0;

    std::string rest = trim(trimmed.substr(level));
    // Optional closing sequence, separated by a space
    size_t end = rest.find_last_not_of('#');
    if (end != std::string::npos && end + 1 < rest.size() &&
        (rest[end] == ' ' || rest[end] == '\t')) {
        rest = trim(rest.substr(0, end));
    } else if (end == std::string::npos) {
        rest.clear();
    }
    text = rest;
    return level;
}

/// Three or more of the same '-', '*' or '_', optionally space separated
bool isRule(const std::string& trimmed) {
    char marker = trimmed[0];
    if (marker != '-' && marker != '*' && marker != '_') return false;
    int count = 0;
    for (char c : trimmed) {
        if (c == marker) ++count;
        else if (c != ' ' && c != '\t') return false;
    }
    return count >= 3;
}

/// Backtick fence: returns fence length (0 when not a fence) and the
/// language hint of an opening fence
size_t parseFence(const std::string& trimmed, std::string& info) {
    size_t len = 0;
    while (len < trimmed.size() && trimmed[len] == '`') ++len;
    if (len < 3) return 0;
    info = trim(trimmed.substr(len));
    if (info.find('`') != std::string::npos) return 0;
    return len;
}

/// Quote depth and content; depth 0 when the line is no quote
int parseQuote(const std::string& trimmed, std::string& content) {
    int depth = 0;
    size_t i = 0;
    while (i < trimmed.size()) {
        if (trimmed[i] == '>') {
            ++depth;
            ++i;
        } else if ((trimmed[i] == ' ' || trimmed[i] == '\t') && depth > 0 &&
                   trimmed.find_first_not_of(" \t", i) != std::string::npos &&
                   trimmed[trimmed.find_first_not_of(" \t", i)] == '>') {
            i = trimmed.find_first_not_of(" \t", i);
        } else {
            break;
        }
    }
    content = trim(trimmed.substr(i));
    return depth;
}

/// Expanded width of the leading whitespace
int leadingColumns(const std::string& line, size_t& firstNonSpace) {
    int columns = 0;
    size_t i = 0;
    for (; i < line.size(); ++i) {
        if (line[i] == ' ') ++columns;
        else if (line[i] == '\t') columns += kTabWidth - (columns % kTabWidth);
        else break;
    }
    firstNonSpace = i;
    return columns;
}

bool parseListItem(const std::string& line, ListItemBlock& item, std::string& content) {
    size_t pos = 0;
    int columns = leadingColumns(line, pos);
    if (pos >= line.size()) return false;

    size_t markerEnd = 0;
    char c = line[pos];
    if (c == '-' || c == '*' || c == '+') {
        item.ordered = false;
        markerEnd = pos + 1;
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
        size_t d = pos;
        while (d < line.size() && std::isdigit(static_cast<unsigned char>(line[d])) && d - pos < 9) ++d;
        if (d >= line.size() || line[d] != '.') return false;
        item.ordered = true;
        item.number = std::stoi(line.substr(pos, d - pos));
        markerEnd = d + 1;
    } else {
        return false;
    }
    if (markerEnd >= line.size() || (line[markerEnd] != ' ' && line[markerEnd] != '\t')) {
        return false;
    }
    item.depth = columns / kListIndentWidth;
    content = trim(line.substr(markerEnd));
    return true;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Block scanner
// ---------------------------------------------------------------------------

std::vector<Block> parseBlocks(const std::string& markdown) {
    std::vector<Block> blocks;

    std::string paragraph;
    int quoteDepth = 0;
    std::string quoteText;
    bool inCode = false;
    size_t fenceLen = 0;
    CodeBlock code;

    auto flushParagraph = [&]() {
        if (!paragraph.empty()) {
            blocks.emplace_back(ParagraphBlock{parseInlines(paragraph)});
            paragraph.clear();
        }
    };
    auto flushQuote = [&]() {
        if (quoteDepth > 0) {
            blocks.emplace_back(QuoteBlock{quoteDepth, parseInlines(quoteText)});
            quoteDepth = 0;
            quoteText.clear();
        }
    };
    auto flushAll = [&]() {
        flushParagraph();
        flushQuote();
    };

    for (const auto& line : splitLines(normalizeEscapes(markdown))) {
        std::string trimmed = trim(line);

        if (inCode) {
            std::string info;
            size_t len = parseFence(trimmed, info);
            if (len >= fenceLen && info.empty()) {
                blocks.emplace_back(std::move(code));
                code = CodeBlock{};
                inCode = false;
            } else {
                code.lines.push_back(line);
            }
            continue;
        }

        if (trimmed.empty()) {
            flushAll();
            continue;
        }

        std::string info;
        if (size_t len = parseFence(trimmed, info)) {
            flushAll();
            inCode = true;
            fenceLen = len;
            code = CodeBlock{};
            if (!info.empty()) code.language = info;
            continue;
        }

        std::string headingText;
        if (int level = parseHeading(trimmed, headingText)) {
            flushAll();
            blocks.emplace_back(HeadingBlock{level, plainText(parseInlines(headingText)), -1});
            continue;
        }

        if (isRule(trimmed)) {
            flushAll();
            blocks.emplace_back(RuleBlock{});
            continue;
        }

        if (trimmed[0] == '>') {
            flushParagraph();
            std::string content;
            int depth = parseQuote(trimmed, content);
            if (content.empty()) {
                flushQuote();
            } else if (depth == quoteDepth) {
                quoteText += ' ';
                quoteText += content;
            } else {
                flushQuote();
                quoteDepth = depth;
                quoteText = content;
            }
            continue;
        }

        ListItemBlock item;
        std::string itemText;
        if (parseListItem(line, item, itemText)) {
            flushAll();
            item.inlines = parseInlines(itemText);
            blocks.emplace_back(std::move(item));
            continue;
        }

        flushQuote();
        if (!paragraph.empty()) paragraph += ' ';
        paragraph += trimmed;
    }

    if (inCode) {
        MDOC_LOGD("parseBlocks: unterminated code fence closed at end of input (%zu lines)",
                  code.lines.size());
        blocks.emplace_back(std::move(code));
    }
    flushAll();

    MDOC_LOGD("parseBlocks: input=%zu blocks=%zu", markdown.size(), blocks.size());
    return blocks;
}

// ---------------------------------------------------------------------------
// Section tree
// ---------------------------------------------------------------------------

void appendBlocks(Section& parent, std::vector<Block> blocks, int levelOffset) {
    // Path from parent down to the deepest open section. Only the last
    // element ever gains children, so the pointers stay valid.
    std::vector<Section*> stack{&parent};

    auto openSection = [&](int level) {
        Section section;
        section.level = level;
        stack.back()->children.push_back(std::move(section));
        stack.push_back(&stack.back()->children.back());
    };

    for (auto& block : blocks) {
        auto* heading = std::get_if<HeadingBlock>(&block.content);
        if (heading && parent.level >= 6) {
            // No room for child sections below a level-6 parent
            std::string text = heading->text;
            block = Block(ParagraphBlock{{InlineElement::bold(text)}});
            heading = nullptr;
        }

        if (heading) {
            int level = std::min(6, std::max(heading->level + levelOffset, parent.level + 1));
            heading->level = level;

            while (stack.size() > 1 && stack.back()->level >= level) {
                stack.pop_back();
            }
            while (stack.back()->level < level - 1) {
                openSection(stack.back()->level + 1);
            }
            openSection(level);
            stack.back()->title = heading->text;
            stack.back()->heading = std::move(block);
            continue;
        }

        if (stack.back()->level == 0) {
            openSection(1);
        }
        stack.back()->blocks.push_back(std::move(block));
    }
}

void assignAnchors(Document& doc) {
    int next = 0;
    forEachContentBlock(doc, [&](Block& block) {
        if (auto* heading = std::get_if<HeadingBlock>(&block.content)) {
            heading->anchor = next++;
        }
    });
}

Document parseMarkdown(const std::string& markdown) {
    Section root;
    root.level = 0;
    appendBlocks(root, parseBlocks(markdown));

    Document doc;
    doc.sections = std::move(root.children);
    if (doc.sections.empty()) {
        // Keep the document non-empty even for blank input
        doc.sections.emplace_back();
    }
    for (const auto& section : doc.sections) {
        if (!section.isImplicit()) {
            doc.title = section.title;
            break;
        }
    }
    assignAnchors(doc);
    MDOC_LOGI("parseMarkdown: input=%zu sections=%zu blocks=%zu",
              markdown.size(), doc.sections.size(), doc.blockCount());
    return doc;
}

// ---------------------------------------------------------------------------
// Model helpers
// ---------------------------------------------------------------------------

std::string Block::plainText() const {
    return std::visit(Overloaded{
        [](const HeadingBlock& b) { return b.text; },
        [](const ParagraphBlock& b) { return mdoc::plainText(b.inlines); },
        [](const ListItemBlock& b) { return mdoc::plainText(b.inlines); },
        [](const QuoteBlock& b) { return mdoc::plainText(b.inlines); },
        [](const CodeBlock& b) {
            std::string joined;
            for (size_t i = 0; i < b.lines.size(); ++i) {
                if (i > 0) joined += '\n';
                joined += b.lines[i];
            }
            return joined;
        },
        [](const RuleBlock&) { return std::string(); },
        [](const TocEntryBlock& b) { return b.text; },
    }, content);
}

const Section* Document::toc() const {
    for (const auto& section : sections) {
        if (section.kind == SectionKind::Toc) return &section;
    }
    return nullptr;
}

Section* Document::toc() {
    for (auto& section : sections) {
        if (section.kind == SectionKind::Toc) return &section;
    }
    return nullptr;
}

size_t Document::blockCount() const {
    size_t count = 0;
    forEachContentBlock(*this, [&](const Block&) { ++count; });
    return count;
}

void forEachBlock(Section& section, const std::function<void(Block&)>& fn) {
    if (section.heading) fn(*section.heading);
    for (auto& block : section.blocks) fn(block);
    for (auto& child : section.children) forEachBlock(child, fn);
}

void forEachBlock(const Section& section, const std::function<void(const Block&)>& fn) {
    if (section.heading) fn(*section.heading);
    for (const auto& block : section.blocks) fn(block);
    for (const auto& child : section.children) forEachBlock(child, fn);
}

void forEachContentBlock(Document& doc, const std::function<void(Block&)>& fn) {
    for (auto& section : doc.sections) {
        if (section.kind == SectionKind::Content) forEachBlock(section, fn);
    }
}

void forEachContentBlock(const Document& doc, const std::function<void(const Block&)>& fn) {
    for (const auto& section : doc.sections) {
        if (section.kind == SectionKind::Content) forEachBlock(section, fn);
    }
}

} // namespace mdoc
