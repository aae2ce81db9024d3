#include "mdoc/toc.h"
#include "mdoc/log.h"
#include <algorithm>

namespace mdoc {

std::vector<TocEntry> collectTocEntries(const Document& doc, int maxLevel) {
    std::vector<TocEntry> entries;
    forEachContentBlock(doc, [&](const Block& block) {
        const auto* heading = std::get_if<HeadingBlock>(&block.content);
        if (!heading || heading->level > maxLevel) return;
        TocEntry entry;
        entry.text = heading->text;
        entry.level = heading->level;
        entry.pageIndex = block.placement ? block.placement->pageIndex : -1;
        entry.anchor = heading->anchor;
        entries.push_back(std::move(entry));
    });
    return entries;
}

void buildToc(Document& doc, const RenderConfig& config, int pageNumberOffset) {
    doc.sections.erase(std::remove_if(doc.sections.begin(), doc.sections.end(),
                                      [](const Section& s) { return s.kind == SectionKind::Toc; }),
                       doc.sections.end());

    Section toc;
    toc.level = 1;
    toc.kind = SectionKind::Toc;
    toc.title = config.tocTitle;
    toc.heading = Block(HeadingBlock{1, config.tocTitle, -1});

    int unplaced = 0;
    for (const auto& entry : collectTocEntries(doc, config.tocMaxLevel)) {
        if (entry.pageIndex < 0) ++unplaced;
        TocEntryBlock line;
        line.level = entry.level;
        line.text = entry.text;
        line.pageNumber = entry.pageIndex + 1 + pageNumberOffset;
        line.anchor = entry.anchor;
        toc.blocks.emplace_back(std::move(line));
    }
    if (unplaced > 0) {
        MDOC_LOGW("buildToc: %d headings have no page assignment", unplaced);
    }

    MDOC_LOGD("buildToc: entries=%zu offset=%d", toc.blocks.size(), pageNumberOffset);
    doc.sections.push_back(std::move(toc));
}

size_t tocEntryCount(const Document& doc) {
    const Section* toc = doc.toc();
    return toc ? toc->blocks.size() : 0;
}

} // namespace mdoc
