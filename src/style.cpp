#include "mdoc/style.h"
#include <stdexcept>
#include <string>

namespace mdoc {

void RenderConfig::validate() const {
    if (!(pageWidth > 0) || !(pageHeight > 0)) {
        throw std::invalid_argument("page size must be positive, got " +
                                    std::to_string(pageWidth) + "x" +
                                    std::to_string(pageHeight));
    }
    if (marginTop < 0 || marginBottom < 0 || marginLeft < 0 || marginRight < 0) {
        throw std::invalid_argument("page margins must not be negative");
    }
    if (!(contentWidth() > 0) || !(contentHeight() > 0)) {
        throw std::invalid_argument("page margins leave no content area");
    }
    if (!(baseFontSize > 0)) {
        throw std::invalid_argument("base font size must be positive");
    }
    if (!(lineSpacingMultiplier > 0)) {
        throw std::invalid_argument("line spacing multiplier must be positive");
    }
    if (tocMaxLevel < 1 || tocMaxLevel > 6) {
        throw std::invalid_argument("TOC heading level cutoff must be in 1..6, got " +
                                    std::to_string(tocMaxLevel));
    }
    if (maxNestingDepth < 0) {
        throw std::invalid_argument("max nesting depth must not be negative");
    }
    if (indentStep < 0) {
        throw std::invalid_argument("indent step must not be negative");
    }
    if (maxTocPasses < 1) {
        throw std::invalid_argument("max TOC passes must be at least 1");
    }
}

} // namespace mdoc
