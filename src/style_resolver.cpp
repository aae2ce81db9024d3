#include "mdoc/style_resolver.h"
#include "mdoc/log.h"
#include <algorithm>

namespace mdoc {

namespace {

constexpr float kReferenceBodySize = 10.5f;

/// Heading sizes at the reference body size, H1..H6
constexpr float kHeadingSizes[6] = {20.0f, 16.0f, 13.0f, 12.0f, 11.0f, 10.5f};

constexpr uint32_t kHeadingColors[6] = {
    0x1E3A8A,   // H1 deep blue
    0x7C3AED,   // H2 violet
    0x059669,   // H3 green
    0x7C2D12,   // H4..H6 share one brown
    0x7C2D12,
    0x7C2D12,
};

constexpr uint32_t kBodyColor = 0x374151;
constexpr uint32_t kQuoteColor = 0x4F46E5;
constexpr uint32_t kCodeColor = 0x1F2937;
constexpr uint32_t kRuleColor = 0x9CA3AF;
constexpr uint32_t kTitleColor = 0x111827;
constexpr uint32_t kMutedColor = 0x6B7280;

constexpr float kCodeSizeFactor = 0.9f;

} // anonymous namespace

StyleResolver::StyleResolver(const RenderConfig& config)
    : config_(config) {}

Style StyleResolver::baseStyle() const {
    Style style;
    style.font.family = "Helvetica";
    style.font.size = config_.baseFontSize;
    style.color = Color::fromHex(kBodyColor);
    style.lineSpacingMultiplier = config_.lineSpacingMultiplier;
    style.spaceAfter = config_.baseFontSize * 0.6f;
    return style;
}

Style StyleResolver::headingStyle(int level) const {
    int idx = std::clamp(level, 1, 6) - 1;
    float scale = config_.baseFontSize / kReferenceBodySize;

    Style style = baseStyle();
    style.font.size = kHeadingSizes[idx] * scale;
    style.font.weight = FontWeight::Bold;
    style.color = Color::fromHex(kHeadingColors[idx]);
    style.lineSpacingMultiplier = 1.2f;
    // Larger headings get more air above them
    style.spaceBefore = style.font.size * (idx < 3 ? 0.9f : 0.7f);
    style.spaceAfter = style.font.size * 0.5f;
    return style;
}

float StyleResolver::indentFor(int depth) const {
    int clamped = std::clamp(depth, 0, config_.maxNestingDepth);
    return config_.indentStep * static_cast<float>(clamped);
}

Style StyleResolver::styleFor(const Block& block) const {
    return std::visit(Overloaded{
        [&](const HeadingBlock& b) {
            return headingStyle(b.level);
        },
        [&](const ParagraphBlock&) {
            return baseStyle();
        },
        [&](const ListItemBlock& b) {
            Style style = baseStyle();
            style.leftIndent = indentFor(b.depth + 1);
            style.spaceAfter = config_.baseFontSize * 0.3f;
            return style;
        },
        [&](const QuoteBlock& b) {
            Style style = baseStyle();
            style.font.style = FontStyle::Italic;
            style.color = Color::fromHex(kQuoteColor);
            style.leftIndent = indentFor(b.depth);
            style.spaceBefore = config_.baseFontSize * 0.3f;
            return style;
        },
        [&](const CodeBlock&) {
            Style style = baseStyle();
            style.font.family = "Courier";
            style.font.size = config_.baseFontSize * kCodeSizeFactor;
            style.color = Color::fromHex(kCodeColor);
            style.lineSpacingMultiplier = 1.25f;
            style.leftIndent = config_.indentStep / 2.0f;
            style.spaceBefore = config_.baseFontSize * 0.4f;
            style.spaceAfter = config_.baseFontSize * 0.8f;
            return style;
        },
        [&](const RuleBlock&) {
            Style style = baseStyle();
            style.color = Color::fromHex(kRuleColor);
            style.spaceBefore = config_.baseFontSize * 0.6f;
            style.spaceAfter = config_.baseFontSize * 0.6f;
            return style;
        },
        [&](const TocEntryBlock& b) {
            Style style = baseStyle();
            if (b.level == 1) style.font.weight = FontWeight::Bold;
            style.leftIndent = indentFor(b.level - 1);
            style.spaceBefore = b.level == 1 ? config_.baseFontSize * 0.3f : 0.0f;
            style.spaceAfter = config_.baseFontSize * 0.2f;
            return style;
        },
    }, block.content);
}

void StyleResolver::resolve(Section& section) const {
    forEachBlock(section, [&](Block& block) {
        block.style = styleFor(block);
    });
}

void StyleResolver::resolve(Document& doc) const {
    size_t count = 0;
    for (auto& section : doc.sections) {
        forEachBlock(section, [&](Block& block) {
            block.style = styleFor(block);
            ++count;
        });
    }
    MDOC_LOGD("StyleResolver::resolve: sections=%zu blocks=%zu", doc.sections.size(), count);
}

Style StyleResolver::titleStyle() const {
    Style style = baseStyle();
    style.font.size = 26.0f * config_.baseFontSize / kReferenceBodySize;
    style.font.weight = FontWeight::Bold;
    style.color = Color::fromHex(kTitleColor);
    style.alignment = TextAlignment::Center;
    style.lineSpacingMultiplier = 1.2f;
    style.spaceAfter = style.font.size;
    return style;
}

Style StyleResolver::subtitleStyle() const {
    Style style = baseStyle();
    style.font.size = 12.0f * config_.baseFontSize / kReferenceBodySize;
    style.color = Color::fromHex(kMutedColor);
    style.alignment = TextAlignment::Center;
    style.spaceAfter = style.font.size * 0.5f;
    return style;
}

Style StyleResolver::footerStyle() const {
    Style style = baseStyle();
    style.font.size = config_.baseFontSize * 0.8f;
    style.color = Color::fromHex(kMutedColor);
    style.alignment = TextAlignment::Center;
    style.spaceAfter = 0;
    return style;
}

} // namespace mdoc
