#pragma once

#include "mdoc/document.h"
#include "mdoc/style.h"
#include <string>
#include <vector>

namespace mdoc {

/// A heading as listed in the table of contents. Derived, rebuilt every run.
struct TocEntry {
    std::string text;
    int level = 1;
    int pageIndex = -1;     // Content page index where the heading starts
    int anchor = -1;
};

/// Collect content headings with level <= maxLevel in document order.
/// Requires a paginated document.
std::vector<TocEntry> collectTocEntries(const Document& doc, int maxLevel);

/// Replace the document's TOC section with a fresh one built from the
/// paginated content. Displayed numbers are pageIndex + 1 + pageNumberOffset.
/// The new TOC section is unstyled and unpaginated.
void buildToc(Document& doc, const RenderConfig& config, int pageNumberOffset);

/// Number of entries in the document's TOC section (0 before buildToc)
size_t tocEntryCount(const Document& doc);

} // namespace mdoc
