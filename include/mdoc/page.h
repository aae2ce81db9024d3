#pragma once

#include "mdoc/platform.h"
#include "mdoc/style.h"
#include <string>
#include <vector>

namespace mdoc {

/// A single text run positioned on a page.
/// The renderer draws it at the exact position with the given font.
struct TextRun {
    std::string text;
    FontDescriptor font;
    Color color;
    float x = 0;           // Horizontal position from left edge of page
    float y = 0;           // Vertical position (baseline) from top edge of page
    float width = 0;       // Measured width of the run

    // Source tracking
    int blockIndex = -1;   // Placement-order index of the source block
    int inlineIndex = -1;  // Index of source InlineElement in block (-1 = marker)
    int charOffset = 0;    // Byte offset within the inline element
    int charLength = 0;    // Number of bytes in this run

    bool isLink = false;   // This run is a hyperlink
    std::string href;      // Link target URL
    int targetAnchor = -1; // Internal link to a heading anchor (TOC lines)
};

/// A laid-out line on a page
struct Line {
    std::vector<TextRun> runs;
    float x = 0;           // Line start x
    float y = 0;           // Baseline y position
    float width = 0;       // Total line width
    float height = 0;      // Line advance
    float ascent = 0;
    float descent = 0;

    bool isLastLineOfParagraph = false;
};

/// Types of visual decorations on a page
enum class DecorationType {
    HorizontalRule,
    QuoteBar,
    CodeBackground,
};

/// A visual decoration element on a page (non-text)
struct Decoration {
    DecorationType type = DecorationType::HorizontalRule;
    float x = 0;
    float y = 0;
    float width = 0;
    float height = 0;
    Color color;
};

/// Position of a heading on a page, used as a link and outline destination
struct PageAnchor {
    int anchor = -1;
    float x = 0;
    float y = 0;           // Top of the heading, from the top edge of page
};

/// A single laid-out page
struct Page {
    int pageIndex = 0;
    std::vector<Line> lines;
    std::vector<Decoration> decorations;
    std::vector<PageAnchor> anchors;

    // Page dimensions
    float width = 0;
    float height = 0;
};

/// Warning types that may occur during layout
enum class LayoutWarning {
    EmptyContent,
    LayoutOverflow,
    TocNotConverged,
};

/// Result of laying out one run of sections
struct LayoutResult {
    std::vector<Page> pages;
    int totalBlocks = 0;
    std::vector<LayoutWarning> warnings;
};

} // namespace mdoc
