#pragma once

#include "mdoc/platform.h"
#include <cstdint>
#include <string>

namespace mdoc {

/// Text alignment options
enum class TextAlignment {
    Left,
    Center,
};

/// RGB color, components in 0..1
struct Color {
    float r = 0;
    float g = 0;
    float b = 0;

    /// Build from a 0xRRGGBB value
    static Color fromHex(uint32_t rgb) {
        return {static_cast<float>((rgb >> 16) & 0xFF) / 255.0f,
                static_cast<float>((rgb >> 8) & 0xFF) / 255.0f,
                static_cast<float>(rgb & 0xFF) / 255.0f};
    }

    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

/// Resolved visual style of one block. Computed by StyleResolver and never
/// mutated afterwards.
struct Style {
    FontDescriptor font;
    Color color;
    float leftIndent = 0;            // From the content box left edge (pt)
    float spaceBefore = 0;           // Suppressed at the top of a page
    float spaceAfter = 0;
    float lineSpacingMultiplier = 1.3f;
    TextAlignment alignment = TextAlignment::Left;

    /// Line advance for a line set in this style's font
    float lineHeight() const {
        return font.size * lineSpacingMultiplier;
    }

    bool operator==(const Style& o) const {
        return font == o.font && color == o.color &&
               leftIndent == o.leftIndent && spaceBefore == o.spaceBefore &&
               spaceAfter == o.spaceAfter &&
               lineSpacingMultiplier == o.lineSpacingMultiplier &&
               alignment == o.alignment;
    }
    bool operator!=(const Style& o) const { return !(*this == o); }
};

/// How page numbers shown in the TOC and page footers are counted
enum class PageNumbering {
    ContentRelative,   // First content page is 1; front matter is not counted
    Physical,          // Every physical page counts, title and TOC included
};

/// Page geometry plus typesetting parameters for one engine run.
/// Passed explicitly into every pass; there is no process-wide configuration.
struct RenderConfig {
    // Page geometry (points, A4 default)
    float pageWidth = 595.0f;
    float pageHeight = 842.0f;
    float marginTop = 50.0f;
    float marginBottom = 50.0f;
    float marginLeft = 50.0f;
    float marginRight = 50.0f;

    // Typography
    float baseFontSize = 10.5f;
    float lineSpacingMultiplier = 1.3f;
    float indentStep = 18.0f;        // Left indent per list/quote depth level
    int maxNestingDepth = 4;         // Deeper nesting clamps its indent

    // Table of contents
    int tocMaxLevel = 3;             // Deepest heading level listed
    std::string tocTitle = "Contents";
    PageNumbering pageNumbering = PageNumbering::ContentRelative;
    int maxTocPasses = 2;            // Cap on TOC/page-number fixed-point passes

    // Output
    bool showPageNumbers = true;
    bool compressStreams = true;

    float contentWidth() const { return pageWidth - marginLeft - marginRight; }
    float contentHeight() const { return pageHeight - marginTop - marginBottom; }

    /// Throws std::invalid_argument describing the first invalid field
    void validate() const;
};

} // namespace mdoc
