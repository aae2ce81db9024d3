#pragma once

#include "mdoc/style.h"
#include "mdoc/document.h"

namespace mdoc {

/// Maps (block kind, heading level, nesting depth) to a Style.
/// Stateless apart from the immutable RenderConfig: resolving a document
/// twice yields the same styles as resolving it once.
class StyleResolver {
public:
    explicit StyleResolver(const RenderConfig& config);

    /// Style for a single block
    Style styleFor(const Block& block) const;

    /// Annotate every block of the document in place (TOC section included)
    void resolve(Document& doc) const;

    /// Annotate every block of one section tree in place
    void resolve(Section& section) const;

    /// Styles for the caller-supplied title page
    Style titleStyle() const;
    Style subtitleStyle() const;

    /// Style of the small page-number footer
    Style footerStyle() const;

private:
    RenderConfig config_;

    Style baseStyle() const;
    Style headingStyle(int level) const;

    /// Left indent for a nesting depth, clamped at config_.maxNestingDepth
    float indentFor(int depth) const;
};

} // namespace mdoc
