#pragma once

#include "mdoc/document.h"
#include "mdoc/style.h"
#include "mdoc/page.h"
#include "mdoc/platform.h"
#include <memory>
#include <string>
#include <vector>

namespace mdoc {

/// Caller-supplied front page (report title, generation date, ...)
struct TitlePage {
    std::string title;
    std::vector<std::string> lines;
};

/// The pagination engine: takes styled sections + page geometry, assigns a
/// page to every block and produces pages with positioned text runs.
///
/// Paragraphs and code blocks split across pages (by wrapped line and by
/// source line respectively); the remainder is inserted into the owning
/// block sequence as a continuation block. Every other kind moves to the
/// next page whole.
class LayoutEngine {
public:
    LayoutEngine(std::shared_ptr<PlatformAdapter> platform, const RenderConfig& config);
    ~LayoutEngine();

    /// Paginate the content sections of a styled document.
    /// Writes a PageAssignment into every block; may insert continuation blocks.
    LayoutResult paginate(Document& doc);

    /// Paginate the TOC section alone, numbered from page 0
    LayoutResult paginateToc(Document& doc);

    /// Lay out the title page (always exactly one page)
    LayoutResult layoutTitlePage(const TitlePage& titlePage, const Style& titleStyle,
                                 const Style& subtitleStyle);

    /// Lay out a single block into lines at x = 0 (for measurement)
    std::vector<Line> layoutBlock(const Block& block, const Style& style,
                                  float availableWidth);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

namespace linebreaker {

/// Byte length of the longest prefix of text, in whole UTF-8 characters,
/// that fits maxWidth. At least one character when text is non-empty.
size_t fitCharacters(const std::string& text, const FontDescriptor& font,
                     float maxWidth, PlatformAdapter& platform);

/// Hard-wrap one line of text by characters. An empty line yields a single
/// empty segment.
std::vector<std::string> wrapByCharacters(const std::string& text,
                                          const FontDescriptor& font,
                                          float maxWidth,
                                          PlatformAdapter& platform);

/// Replace tabs with spaces up to the next tab stop
std::string expandTabs(const std::string& line, int tabWidth = 4);

/// Split run before byte charOffset of element inlineIndex. run keeps the
/// prefix and the suffix is returned; together they hold the original text.
InlineRun splitInlineRun(InlineRun& run, int inlineIndex, int charOffset);

} // namespace linebreaker

} // namespace mdoc
