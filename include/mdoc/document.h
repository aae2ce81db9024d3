#pragma once

#include "mdoc/style.h"
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mdoc {

/// Inline element types within a paragraph
enum class InlineType {
    Text,
    Bold,
    Italic,
    BoldItalic,
    Code,
    Link,
};

/// An inline run of text with uniform styling
struct InlineElement {
    InlineType type = InlineType::Text;
    std::string text;
    std::string href;       // For Link type only

    static InlineElement plain(const std::string& t) {
        return {InlineType::Text, t, {}};
    }
    static InlineElement bold(const std::string& t) {
        return {InlineType::Bold, t, {}};
    }
    static InlineElement italic(const std::string& t) {
        return {InlineType::Italic, t, {}};
    }
    static InlineElement boldItalic(const std::string& t) {
        return {InlineType::BoldItalic, t, {}};
    }
    static InlineElement code(const std::string& t) {
        return {InlineType::Code, t, {}};
    }
    static InlineElement link(const std::string& t, const std::string& url) {
        return {InlineType::Link, t, url};
    }

    bool operator==(const InlineElement& o) const {
        return type == o.type && text == o.text && href == o.href;
    }
};

using InlineRun = std::vector<InlineElement>;

/// Concatenated visible text of an inline run
std::string plainText(const InlineRun& run);

// ---------------------------------------------------------------------------
// Block kinds
// ---------------------------------------------------------------------------

struct HeadingBlock {
    int level = 1;           // 1..6
    std::string text;        // Visible text, markers removed
    int anchor = -1;         // Ordinal among content headings, set by the parser
};

struct ParagraphBlock {
    InlineRun inlines;
};

struct ListItemBlock {
    bool ordered = false;
    int number = 0;          // Source number for ordered items
    int depth = 0;           // 0 = top level
    InlineRun inlines;
};

struct QuoteBlock {
    int depth = 1;           // Count of leading '>' markers
    InlineRun inlines;
};

struct CodeBlock {
    std::optional<std::string> language;
    std::vector<std::string> lines;
};

struct RuleBlock {};

/// One line of the generated table of contents
struct TocEntryBlock {
    int level = 1;
    std::string text;
    int pageNumber = 0;      // As displayed (1-based)
    int anchor = -1;         // Anchor of the heading it points to
};

using BlockContent = std::variant<HeadingBlock, ParagraphBlock, ListItemBlock,
                                  QuoteBlock, CodeBlock, RuleBlock, TocEntryBlock>;

/// Visitor built from lambdas, for exhaustive std::visit over BlockContent
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

/// Placement of a block, written by the pagination pass
struct PageAssignment {
    int pageIndex = -1;      // 0-based within its layout run
    float offsetY = 0;       // Top of the block's first line, from the content top
    float height = 0;        // Rendered height excluding spacing
    bool overflow = false;   // Taller than a page; drawn past the bottom margin
};

/// A block-level element in the document
struct Block {
    BlockContent content;
    std::optional<Style> style;              // Set by StyleResolver
    std::optional<PageAssignment> placement; // Set by the pagination pass
    bool continuation = false;               // Remainder of a split block

    Block() = default;
    Block(BlockContent c) : content(std::move(c)) {}

    bool isHeading() const { return std::holds_alternative<HeadingBlock>(content); }

    /// Helper: visible text of the block (code lines joined with '\n')
    std::string plainText() const;
};

// ---------------------------------------------------------------------------
// Sections
// ---------------------------------------------------------------------------

enum class SectionKind {
    Content,
    Toc,
};

/// A heading and everything nested beneath it. Sections without a heading
/// block are implicit: they hold content before the first heading or bridge
/// a skipped heading level.
struct Section {
    int level = 1;
    std::string title;
    std::optional<Block> heading;
    std::vector<Block> blocks;
    std::vector<Section> children;
    SectionKind kind = SectionKind::Content;
    bool pageBreakBefore = false;

    bool isImplicit() const { return !heading.has_value(); }
};

/// The full document model
struct Document {
    std::string title;
    std::vector<Section> sections;

    /// The TOC section appended by buildToc, or nullptr before that pass
    const Section* toc() const;
    Section* toc();

    /// Number of blocks, section headings included, in content sections
    size_t blockCount() const;
};

/// Visit every block of a section depth-first: heading, own blocks, children
void forEachBlock(Section& section, const std::function<void(Block&)>& fn);
void forEachBlock(const Section& section, const std::function<void(const Block&)>& fn);

/// Visit every block of the content sections in document order
void forEachContentBlock(Document& doc, const std::function<void(Block&)>& fn);
void forEachContentBlock(const Document& doc, const std::function<void(const Block&)>& fn);

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

/// Split one line of inline markdown into spans. Never fails: unmatched
/// markers stay literal text.
InlineRun parseInlines(const std::string& text);

/// Split markdown into a flat ordered sequence of blocks.
/// Total: unrecognized syntax degrades to paragraphs.
std::vector<Block> parseBlocks(const std::string& markdown);

/// Graft blocks under parent, opening child sections for headings. Heading
/// levels are shifted by levelOffset and clamped to 6. A parent of level 0
/// acts as a document root: loose blocks go into an implicit level-1 section.
void appendBlocks(Section& parent, std::vector<Block> blocks, int levelOffset = 0);

/// Number content headings 0, 1, 2... in document order
void assignAnchors(Document& doc);

/// Parse markdown into a document tree with anchors assigned
Document parseMarkdown(const std::string& markdown);

} // namespace mdoc
