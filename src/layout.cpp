#include "mdoc/layout.h"
#include "mdoc/style_resolver.h"
#include "mdoc/log.h"
#include <algorithm>
#include <cstddef>

namespace mdoc {

namespace {

constexpr uint32_t kLinkColor = 0x2563EB;
constexpr float kFitEpsilon = 0.01f;
constexpr float kQuoteBarWidth = 2.0f;
constexpr float kRuleThickness = 0.75f;

/// List marker by nesting depth: bullet, dash, middle dot
std::string listMarker(const ListItemBlock& item) {
    if (item.ordered) return std::to_string(item.number) + ". ";
    if (item.depth == 0) return "\xe2\x80\xa2 ";   // "• "
    if (item.depth == 1) return "- ";
    return "\xc2\xb7 ";                              // "· "
}

} // anonymous namespace

class LayoutEngine::Impl {
public:
    Impl(std::shared_ptr<PlatformAdapter> platform, const RenderConfig& config)
        : platform_(platform ? std::move(platform) : std::make_shared<StandardFontAdapter>()),
          config_(config),
          resolver_(config) {}

    LayoutResult paginate(Document& doc) {
        PageState st;
        st.page = makePage(0);
        for (auto& section : doc.sections) {
            if (section.kind != SectionKind::Content) continue;
            layoutSection(section, st, false);
        }
        LayoutResult result = finish(st);
        if (result.totalBlocks == 0) {
            MDOC_LOGW("paginate: document has no content blocks");
            result.warnings.push_back(LayoutWarning::EmptyContent);
        }
        MDOC_LOGI("paginate: pages=%zu blocks=%d", result.pages.size(), result.totalBlocks);
        return result;
    }

    LayoutResult paginateToc(Document& doc) {
        Section* toc = doc.toc();
        if (!toc || toc->blocks.empty()) {
            MDOC_LOGD("paginateToc: no entries, nothing drawn");
            return {};
        }
        PageState st;
        st.page = makePage(0);
        layoutSection(*toc, st, false);
        LayoutResult result = finish(st);
        MDOC_LOGD("paginateToc: pages=%zu entries=%zu", result.pages.size(), toc->blocks.size());
        return result;
    }

    LayoutResult layoutTitlePage(const TitlePage& titlePage, const Style& titleStyle,
                                 const Style& subtitleStyle) {
        LayoutResult result;
        Page page = makePage(0);
        float contentWidth = config_.contentWidth();
        float cursorY = config_.contentHeight() * 0.3f;

        auto placeText = [&](const std::string& text, const Style& style) {
            auto lines = layoutInlineLines({InlineElement::plain(text)}, style, {},
                                           contentWidth, -1);
            positionLines(lines, lines.size(), style, config_.marginLeft, cursorY,
                          contentWidth, page);
            for (const auto& line : lines) cursorY += line.height;
            cursorY += style.spaceAfter;
        };

        placeText(titlePage.title, titleStyle);

        // Short centered rule under the title
        Decoration rule;
        rule.type = DecorationType::HorizontalRule;
        rule.width = contentWidth * 0.25f;
        rule.x = config_.marginLeft + (contentWidth - rule.width) / 2.0f;
        rule.y = config_.marginTop + cursorY - titleStyle.spaceAfter / 2.0f;
        rule.height = kRuleThickness;
        rule.color = subtitleStyle.color;
        page.decorations.push_back(rule);

        for (const auto& line : titlePage.lines) {
            placeText(line, subtitleStyle);
        }

        result.pages.push_back(std::move(page));
        return result;
    }

    std::vector<Line> layoutBlock(const Block& block, const Style& style, float availableWidth) {
        return layoutBlockLines(block, style, availableWidth, 0);
    }

private:
    std::shared_ptr<PlatformAdapter> platform_;
    RenderConfig config_;
    StyleResolver resolver_;

    /// Running state of one pagination pass
    struct PageState {
        LayoutResult result;
        Page page;
        float cursorY = 0;        // From the content top
        int blockIndex = 0;       // Placement-order counter
        bool pageHasContent = false;
    };

    Page makePage(int index) const {
        Page page;
        page.pageIndex = index;
        page.width = config_.pageWidth;
        page.height = config_.pageHeight;
        return page;
    }

    void startNewPage(PageState& st) {
        st.result.pages.push_back(std::move(st.page));
        st.page = makePage(static_cast<int>(st.result.pages.size()));
        st.cursorY = 0;
        st.pageHasContent = false;
        MDOC_LOGD("layout: newPage pageIndex=%d blockIdx=%d", st.page.pageIndex, st.blockIndex);
    }

    LayoutResult finish(PageState& st) {
        // Always emit the last page; an empty document still yields one page
        if (st.pageHasContent || st.result.pages.empty()) {
            st.result.pages.push_back(std::move(st.page));
        }
        st.result.totalBlocks = st.blockIndex;
        return std::move(st.result);
    }

    // ---------------------------------------------------------------
    // Section walk
    // ---------------------------------------------------------------
    void layoutSection(Section& section, PageState& st, bool breakBefore) {
        bool pendingBreak = breakBefore || section.pageBreakBefore;
        if (section.heading) {
            placeBlock(*section.heading, st, pendingBreak);
            pendingBreak = false;
        }
        for (size_t i = 0; i < section.blocks.size(); ++i) {
            auto remainder = placeBlock(section.blocks[i], st, pendingBreak);
            pendingBreak = false;
            if (remainder) {
                // Re-enters the loop as the next block in the owning sequence
                section.blocks.insert(section.blocks.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                                      std::move(*remainder));
            }
        }
        for (auto& child : section.children) {
            layoutSection(child, st, pendingBreak);
            pendingBreak = false;
        }
    }

    // ---------------------------------------------------------------
    // Block placement
    // ---------------------------------------------------------------
    std::optional<Block> placeBlock(Block& block, PageState& st, bool breakBefore) {
        const Style style = block.style ? *block.style : resolver_.styleFor(block);
        int blockIdx = st.blockIndex++;

        // The remainder of a split block resumes on the next page
        if ((breakBefore || block.continuation) && st.pageHasContent) startNewPage(st);

        const float contentHeight = config_.contentHeight();
        const float padding = blockPadding(block, style);
        const float available = config_.contentWidth() - style.leftIndent - 2 * horizontalInset(block, style);
        std::vector<Line> lines = layoutBlockLines(block, style, available, blockIdx);

        float linesHeight = 0;
        for (const auto& line : lines) linesHeight += line.height;
        float height = std::holds_alternative<RuleBlock>(block.content)
                           ? style.font.size * 0.5f
                           : linesHeight + 2 * padding;

        bool splittable = std::holds_alternative<ParagraphBlock>(block.content) ||
                          std::holds_alternative<CodeBlock>(block.content);
        // Keep a heading together with at least one following body line
        float keepWithNext = block.isHeading()
                                 ? style.spaceAfter + config_.baseFontSize * config_.lineSpacingMultiplier
                                 : 0.0f;

        auto fits = [&](float needed) {
            return st.cursorY + needed <= contentHeight + kFitEpsilon;
        };

        float spaceBefore = st.pageHasContent ? style.spaceBefore : 0.0f;
        size_t placeCount = lines.size();

        if (!fits(spaceBefore + height + keepWithNext)) {
            size_t splitAt = 0;
            if (splittable && st.pageHasContent) {
                splitAt = splitPoint(block, lines,
                                     contentHeight - st.cursorY - spaceBefore - 2 * padding);
            }
            if (splitAt == 0) {
                if (st.pageHasContent) {
                    startNewPage(st);
                    spaceBefore = 0;
                }
                if (!fits(height) && splittable) {
                    splitAt = std::max<size_t>(
                        splitPoint(block, lines, contentHeight - 2 * padding), 1);
                    splitAt = firstUnitBoundary(block, lines, splitAt);
                }
            }
            if (splitAt > 0 && splitAt < lines.size()) {
                placeCount = splitAt;
            }
        }

        std::optional<Block> remainder;
        if (placeCount < lines.size()) {
            remainder = splitBlock(block, lines, placeCount);
            linesHeight = 0;
            for (size_t i = 0; i < placeCount; ++i) linesHeight += lines[i].height;
            height = linesHeight + 2 * padding;
            MDOC_LOGD("layout: split block=%d at line %zu/%zu", blockIdx, placeCount, lines.size());
        }

        float top = st.cursorY + spaceBefore;
        PageAssignment placement;
        placement.pageIndex = st.page.pageIndex;
        placement.offsetY = top;
        placement.height = height;
        placement.overflow = top + height > contentHeight + kFitEpsilon;
        if (placement.overflow) {
            MDOC_LOGW("layout: block %d overflows page %d (height=%.1f available=%.1f)",
                      blockIdx, st.page.pageIndex, height, contentHeight - top);
            if (std::find(st.result.warnings.begin(), st.result.warnings.end(),
                          LayoutWarning::LayoutOverflow) == st.result.warnings.end()) {
                st.result.warnings.push_back(LayoutWarning::LayoutOverflow);
            }
        }
        block.placement = placement;

        drawBlock(block, style, lines, placeCount, top, height, padding, st.page);

        st.pageHasContent = true;
        // Space after may run past the page bottom; it is not content
        st.cursorY = top + height + style.spaceAfter;
        return remainder;
    }

    float blockPadding(const Block& block, const Style& style) const {
        return std::holds_alternative<CodeBlock>(block.content) ? style.font.size * 0.4f : 0.0f;
    }

    float horizontalInset(const Block& block, const Style& style) const {
        return std::holds_alternative<CodeBlock>(block.content) ? style.font.size * 0.5f : 0.0f;
    }

    /// Number of leading lines that fit space, snapped back to a split unit
    /// boundary (source lines for code). 0 when nothing can be split off.
    size_t splitPoint(const Block& block, const std::vector<Line>& lines, float space) const {
        size_t count = 0;
        float used = 0;
        while (count < lines.size() && used + lines[count].height <= space + kFitEpsilon) {
            used += lines[count].height;
            ++count;
        }
        if (std::holds_alternative<CodeBlock>(block.content)) {
            // Back off to the start of a source line
            while (count > 0 && count < lines.size() &&
                   lines[count].runs.front().inlineIndex == lines[count - 1].runs.front().inlineIndex) {
                --count;
            }
        }
        return count;
    }

    /// For a unit taller than the page: extend a forced split to the end of
    /// the first whole unit so that progress is always made.
    size_t firstUnitBoundary(const Block& block, const std::vector<Line>& lines, size_t count) const {
        if (!std::holds_alternative<CodeBlock>(block.content) || count == 0) return count;
        while (count < lines.size() &&
               lines[count].runs.front().inlineIndex == lines[count - 1].runs.front().inlineIndex) {
            ++count;
        }
        return count;
    }

    /// Cut block after its first lineCount lines; returns the continuation
    Block splitBlock(Block& block, const std::vector<Line>& lines, size_t lineCount) const {
        Block rest;
        rest.style = block.style;
        rest.continuation = true;

        if (auto* para = std::get_if<ParagraphBlock>(&block.content)) {
            const TextRun* first = nullptr;
            for (const auto& run : lines[lineCount].runs) {
                if (run.inlineIndex >= 0) { first = &run; break; }
            }
            InlineRun suffix = first
                ? linebreaker::splitInlineRun(para->inlines, first->inlineIndex, first->charOffset)
                : InlineRun{};
            rest.content = ParagraphBlock{std::move(suffix)};
        } else if (auto* code = std::get_if<CodeBlock>(&block.content)) {
            auto sourceLine = static_cast<size_t>(lines[lineCount].runs.front().inlineIndex);
            CodeBlock tail;
            tail.language = code->language;
            tail.lines.assign(code->lines.begin() + static_cast<std::ptrdiff_t>(sourceLine),
                              code->lines.end());
            code->lines.resize(sourceLine);
            rest.content = std::move(tail);
        }
        return rest;
    }

    void drawBlock(const Block& block, const Style& style, std::vector<Line>& lines,
                   size_t lineCount, float top, float height, float padding, Page& page) {
        const float x = config_.marginLeft + style.leftIndent;
        const float width = config_.contentWidth() - style.leftIndent;
        const float pageTop = config_.marginTop + top;

        std::visit(Overloaded{
            [&](const HeadingBlock& b) {
                if (b.anchor >= 0) page.anchors.push_back({b.anchor, x, pageTop});
                positionLines(lines, lineCount, style, x, top, width, page);
            },
            [&](const ParagraphBlock&) {
                positionLines(lines, lineCount, style, x, top, width, page);
            },
            [&](const ListItemBlock&) {
                positionLines(lines, lineCount, style, x, top, width, page);
            },
            [&](const QuoteBlock& b) {
                int levels = std::min(b.depth, config_.maxNestingDepth);
                for (int level = 0; level < levels; ++level) {
                    float barX = config_.indentStep * (static_cast<float>(level) + 0.25f);
                    if (barX + kQuoteBarWidth >= style.leftIndent) break;
                    Decoration bar;
                    bar.type = DecorationType::QuoteBar;
                    bar.x = config_.marginLeft + barX;
                    bar.y = pageTop;
                    bar.width = kQuoteBarWidth;
                    bar.height = height;
                    bar.color = style.color;
                    page.decorations.push_back(bar);
                }
                positionLines(lines, lineCount, style, x, top, width, page);
            },
            [&](const CodeBlock&) {
                Decoration background;
                background.type = DecorationType::CodeBackground;
                background.x = x;
                background.y = pageTop;
                background.width = width;
                background.height = height;
                background.color = Color::fromHex(0xF3F4F6);
                page.decorations.push_back(background);
                float inset = horizontalInset(block, style);
                positionLines(lines, lineCount, style, x + inset, top + padding,
                              width - 2 * inset, page);
            },
            [&](const RuleBlock&) {
                Decoration rule;
                rule.type = DecorationType::HorizontalRule;
                rule.x = x;
                rule.y = pageTop + (height - kRuleThickness) / 2.0f;
                rule.width = width;
                rule.height = kRuleThickness;
                rule.color = style.color;
                page.decorations.push_back(rule);
            },
            [&](const TocEntryBlock&) {
                positionLines(lines, lineCount, style, x, top, width, page);
            },
        }, block.content);
    }

    /// Move the first count lines from x = 0 to their place on the page
    void positionLines(const std::vector<Line>& lines, size_t count, const Style& style,
                       float x, float top, float width, Page& page) {
        float y = top;
        for (size_t i = 0; i < count; ++i) {
            Line line = lines[i];
            line.y = config_.marginTop + y + line.ascent;
            line.x = x;
            applyAlignment(line, style.alignment, width);
            for (auto& run : line.runs) {
                run.x += x;
                run.y = line.y;
            }
            y += line.height;
            page.lines.push_back(std::move(line));
        }
    }

    // ---------------------------------------------------------------
    // Line layout per block kind
    // ---------------------------------------------------------------
    std::vector<Line> layoutBlockLines(const Block& block, const Style& style,
                                       float availableWidth, int blockIndex) {
        return std::visit(Overloaded{
            [&](const HeadingBlock& b) {
                return layoutInlineLines({InlineElement::plain(b.text)}, style, {},
                                         availableWidth, blockIndex);
            },
            [&](const ParagraphBlock& b) {
                return layoutInlineLines(b.inlines, style, {}, availableWidth, blockIndex);
            },
            [&](const ListItemBlock& b) {
                return layoutInlineLines(b.inlines, style, listMarker(b), availableWidth,
                                         blockIndex);
            },
            [&](const QuoteBlock& b) {
                return layoutInlineLines(b.inlines, style, {}, availableWidth, blockIndex);
            },
            [&](const CodeBlock& b) {
                return layoutCodeLines(b, style, availableWidth, blockIndex);
            },
            [&](const RuleBlock&) {
                return std::vector<Line>{};
            },
            [&](const TocEntryBlock& b) {
                return layoutTocEntryLines(b, style, availableWidth, blockIndex);
            },
        }, block.content);
    }

    // ---------------------------------------------------------------
    // Multi-font inline line layout
    // ---------------------------------------------------------------
    std::vector<Line> layoutInlineLines(const InlineRun& inlines,
                                        const Style& style,
                                        const std::string& markerText,
                                        float availableWidth,
                                        int blockIndex) {
        std::vector<Line> lines;

        if (inlines.empty() && markerText.empty()) return lines;

        float lineHeight = style.lineHeight();
        FontMetrics baseMetrics = platform_->resolveFontMetrics(style.font);
        float maxAscent = baseMetrics.ascent;
        float maxDescent = baseMetrics.descent;

        float markerWidth = 0;
        if (!markerText.empty()) {
            markerWidth = platform_->measureText(markerText, style.font).width;
        }

        Line currentLine;
        float lineX = 0;
        bool atLineStart = true;

        // List marker on the first line; continuation lines hang under the text
        if (markerWidth > 0) {
            TextRun markerRun;
            markerRun.text = markerText;
            markerRun.font = style.font;
            markerRun.color = style.color;
            markerRun.x = 0;
            markerRun.width = markerWidth;
            markerRun.blockIndex = blockIndex;
            markerRun.inlineIndex = -1;
            markerRun.charLength = static_cast<int>(markerText.size());
            currentLine.runs.push_back(markerRun);
            lineX = markerWidth;
        }

        auto completeLine = [&](bool isLastOfParagraph) {
            currentLine.isLastLineOfParagraph = isLastOfParagraph;
            currentLine.width = lineX;
            currentLine.height = lineHeight;
            currentLine.ascent = maxAscent;
            currentLine.descent = maxDescent;
            lines.push_back(std::move(currentLine));
            currentLine = Line{};
            lineX = markerWidth;
            atLineStart = true;
            maxAscent = baseMetrics.ascent;
            maxDescent = baseMetrics.descent;
        };

        for (int inIdx = 0; inIdx < static_cast<int>(inlines.size()); ++inIdx) {
            const auto& inl = inlines[inIdx];

            FontDescriptor inlineFont = style.font;
            Color runColor = style.color;
            bool runIsLink = false;

            switch (inl.type) {
                case InlineType::Text:
                    break;
                case InlineType::Bold:
                    inlineFont.weight = FontWeight::Bold;
                    break;
                case InlineType::Italic:
                    inlineFont.style = FontStyle::Italic;
                    break;
                case InlineType::BoldItalic:
                    inlineFont.weight = FontWeight::Bold;
                    inlineFont.style = FontStyle::Italic;
                    break;
                case InlineType::Code:
                    inlineFont.family = "Courier";
                    inlineFont.size = style.font.size * 0.9f;
                    break;
                case InlineType::Link:
                    runIsLink = true;
                    runColor = Color::fromHex(kLinkColor);
                    break;
            }

            FontMetrics inlineMetrics = platform_->resolveFontMetrics(inlineFont);
            if (inlineMetrics.ascent > maxAscent) maxAscent = inlineMetrics.ascent;
            if (inlineMetrics.descent > maxDescent) maxDescent = inlineMetrics.descent;

            std::string remaining = inl.text;
            int charOffset = 0;

            auto pushRun = [&](const std::string& text, float width) {
                TextRun run;
                run.text = text;
                run.font = inlineFont;
                run.color = runColor;
                run.x = lineX;
                run.width = width;
                run.blockIndex = blockIndex;
                run.inlineIndex = inIdx;
                run.charOffset = charOffset;
                run.charLength = static_cast<int>(text.size());
                run.isLink = runIsLink;
                if (runIsLink) run.href = inl.href;
                currentLine.runs.push_back(std::move(run));
                lineX += width;
                atLineStart = false;
            };

            while (!remaining.empty()) {
                // Skip leading spaces at the beginning of a line
                if (atLineStart) {
                    size_t firstNonSpace = remaining.find_first_not_of(' ');
                    if (firstNonSpace == std::string::npos) {
                        charOffset += static_cast<int>(remaining.size());
                        remaining.clear();
                        break;
                    }
                    if (firstNonSpace > 0) {
                        charOffset += static_cast<int>(firstNonSpace);
                        remaining = remaining.substr(firstNonSpace);
                    }
                }

                float spaceLeft = availableWidth - lineX;
                auto measurement = platform_->measureText(remaining, inlineFont);

                if (measurement.width <= spaceLeft) {
                    // Entire remaining text fits on this line
                    pushRun(remaining, measurement.width);
                    charOffset += static_cast<int>(remaining.size());
                    remaining.clear();
                    continue;
                }

                size_t breakPos = platform_->findLineBreak(remaining, inlineFont, spaceLeft);

                if (breakPos == 0) {
                    if (!atLineStart) {
                        // Complete current line and retry on a new one
                        completeLine(false);
                        continue;
                    }
                    // A single word wider than the line: break between characters
                    breakPos = linebreaker::fitCharacters(remaining, inlineFont, spaceLeft,
                                                          *platform_);
                }

                std::string segment = remaining.substr(0, breakPos);
                while (!segment.empty() && segment.back() == ' ') {
                    segment.pop_back();
                }
                if (!segment.empty()) {
                    pushRun(segment, platform_->measureText(segment, inlineFont).width);
                }
                completeLine(false);

                charOffset += static_cast<int>(breakPos);
                remaining = remaining.substr(breakPos);
            }
        }

        if (!currentLine.runs.empty()) {
            completeLine(true);
        }
        if (!lines.empty()) {
            lines.back().isLastLineOfParagraph = true;
        }
        return lines;
    }

    /// Code lines hard-wrap by characters; every visual line records its
    /// source line in inlineIndex
    std::vector<Line> layoutCodeLines(const CodeBlock& code, const Style& style,
                                      float availableWidth, int blockIndex) {
        std::vector<Line> lines;
        FontMetrics metrics = platform_->resolveFontMetrics(style.font);

        for (int src = 0; src < static_cast<int>(code.lines.size()); ++src) {
            std::string text = linebreaker::expandTabs(code.lines[src]);
            int offset = 0;
            for (auto& segment : linebreaker::wrapByCharacters(text, style.font, availableWidth,
                                                               *platform_)) {
                TextRun run;
                run.text = segment;
                run.font = style.font;
                run.color = style.color;
                run.width = platform_->measureText(segment, style.font).width;
                run.blockIndex = blockIndex;
                run.inlineIndex = src;
                run.charOffset = offset;
                run.charLength = static_cast<int>(segment.size());
                offset += run.charLength;

                Line line;
                line.width = run.width;
                line.height = style.lineHeight();
                line.ascent = metrics.ascent;
                line.descent = metrics.descent;
                line.runs.push_back(std::move(run));
                lines.push_back(std::move(line));
            }
        }
        if (!lines.empty()) {
            lines.back().isLastLineOfParagraph = true;
        }
        return lines;
    }

    /// Entry text wraps left of a right-aligned page number
    std::vector<Line> layoutTocEntryLines(const TocEntryBlock& entry, const Style& style,
                                          float availableWidth, int blockIndex) {
        std::string number = std::to_string(entry.pageNumber);
        float numberWidth = platform_->measureText(number, style.font).width;
        float gap = style.font.size;

        auto lines = layoutInlineLines({InlineElement::plain(entry.text)}, style, {},
                                       std::max(availableWidth - numberWidth - gap, gap),
                                       blockIndex);
        if (lines.empty()) {
            Line empty;
            FontMetrics metrics = platform_->resolveFontMetrics(style.font);
            empty.height = style.lineHeight();
            empty.ascent = metrics.ascent;
            empty.descent = metrics.descent;
            lines.push_back(std::move(empty));
        }

        TextRun numberRun;
        numberRun.text = number;
        numberRun.font = style.font;
        numberRun.color = style.color;
        numberRun.x = availableWidth - numberWidth;
        numberRun.width = numberWidth;
        numberRun.blockIndex = blockIndex;
        numberRun.inlineIndex = -1;
        numberRun.charLength = static_cast<int>(number.size());
        lines.back().runs.push_back(std::move(numberRun));

        for (auto& line : lines) {
            line.width = availableWidth;
            for (auto& run : line.runs) {
                run.targetAnchor = entry.anchor;
            }
        }
        return lines;
    }

    // ---------------------------------------------------------------
    // Text alignment
    // ---------------------------------------------------------------
    void applyAlignment(Line& line, TextAlignment alignment, float contentWidth) {
        float extraSpace = contentWidth - line.width;
        if (extraSpace <= 0) return;

        switch (alignment) {
            case TextAlignment::Left:
                break;
            case TextAlignment::Center: {
                float offset = extraSpace / 2.0f;
                line.x += offset;
                for (auto& run : line.runs) {
                    run.x += offset;
                }
                break;
            }
        }
    }
};

LayoutEngine::LayoutEngine(std::shared_ptr<PlatformAdapter> platform, const RenderConfig& config)
    : impl_(std::make_unique<Impl>(std::move(platform), config)) {}

LayoutEngine::~LayoutEngine() = default;

LayoutResult LayoutEngine::paginate(Document& doc) {
    return impl_->paginate(doc);
}

LayoutResult LayoutEngine::paginateToc(Document& doc) {
    return impl_->paginateToc(doc);
}

LayoutResult LayoutEngine::layoutTitlePage(const TitlePage& titlePage, const Style& titleStyle,
                                           const Style& subtitleStyle) {
    return impl_->layoutTitlePage(titlePage, titleStyle, subtitleStyle);
}

std::vector<Line> LayoutEngine::layoutBlock(const Block& block, const Style& style,
                                            float availableWidth) {
    return impl_->layoutBlock(block, style, availableWidth);
}

} // namespace mdoc
