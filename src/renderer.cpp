#include "mdoc/renderer.h"
#include "mdoc/pdf_writer.h"
#include "mdoc/platform.h"
#include "mdoc/toc.h"
#include "mdoc/log.h"
#include <map>
#include <sstream>

namespace mdoc {

namespace {

constexpr const char* kBaseFonts[8] = {
    "Helvetica", "Helvetica-Bold", "Helvetica-Oblique", "Helvetica-BoldOblique",
    "Courier",   "Courier-Bold",   "Courier-Oblique",   "Courier-BoldOblique",
};

/// Resource name (/F1../F8) of the base-14 font drawing this descriptor
std::string fontResource(const FontDescriptor& font) {
    bool mono = font.family == "Courier" || font.family == "monospace";
    int idx = (mono ? 4 : 0) +
              (font.weight == FontWeight::Bold ? 1 : 0) +
              (font.style == FontStyle::Italic ? 2 : 0);
    return "F" + std::to_string(idx + 1);
}

std::string num(double v) {
    return PdfWriter::formatNumber(v);
}

std::string colorOp(const Color& c, const char* op) {
    return num(c.r) + " " + num(c.g) + " " + num(c.b) + " " + op;
}

/// Where a heading anchor landed in the output
struct Destination {
    int pageId = 0;
    float x = 0;
    float y = 0;   // PDF user space (bottom-up)
};

struct OutlineNode {
    int id = 0;
    std::string title;
    int anchor = -1;
    int parent = -1;            // Index into the node list, -1 = outline root
    std::vector<int> children;
    size_t descendants = 0;     // Open items anywhere below this one
};

/// Link rectangle around a run, in PDF user space
std::string runRect(const TextRun& run, float pageHeight) {
    float baseline = pageHeight - run.y;
    return "[" + num(run.x) + " " + num(baseline - run.font.size * 0.25f) + " " +
           num(run.x + run.width) + " " + num(baseline + run.font.size * 0.85f) + "]";
}

} // anonymous namespace

Renderer::Renderer(const RenderConfig& config)
    : config_(config) {}

std::string Renderer::render(const RenderPlan& plan) const {
    PdfWriter pdf;
    const float pageHeight = config_.pageHeight;

    int catalogId = pdf.reserveObject();
    int pagesId = pdf.reserveObject();

    std::ostringstream fonts;
    fonts << "<< /Font <<";
    for (int i = 0; i < 8; ++i) {
        int fontId = pdf.addObject(std::string("<< /Type /Font /Subtype /Type1 /BaseFont /") +
                                   kBaseFonts[i] + " /Encoding /WinAnsiEncoding >>");
        fonts << " /F" << (i + 1) << ' ' << fontId << " 0 R";
    }
    fonts << " >> >>";
    int resourcesId = pdf.addObject(fonts.str());

    // Drawing order: title page, TOC pages, content pages
    struct OutPage {
        const Page* page;
        int contentIndex;   // -1 for front matter
        int id;
    };
    std::vector<OutPage> outPages;
    if (plan.titlePage) {
        for (const auto& page : plan.titlePage->pages) outPages.push_back({&page, -1, 0});
    }
    for (const auto& page : plan.toc.pages) outPages.push_back({&page, -1, 0});
    for (size_t i = 0; i < plan.content.pages.size(); ++i) {
        outPages.push_back({&plan.content.pages[i], static_cast<int>(i), 0});
    }
    for (auto& out : outPages) out.id = pdf.reserveObject();

    // Heading anchors resolve to content pages only
    std::map<int, Destination> destinations;
    for (const auto& out : outPages) {
        if (out.contentIndex < 0) continue;
        for (const auto& anchor : out.page->anchors) {
            destinations[anchor.anchor] = {out.id, anchor.x, pageHeight - anchor.y};
        }
    }
    auto destArray = [&](const Destination& d) {
        return "[" + std::to_string(d.pageId) + " 0 R /XYZ " + num(d.x) + " " + num(d.y) + " 0]";
    };

    StandardFontAdapter metrics;
    size_t linkCount = 0;

    for (const auto& out : outPages) {
        const Page& page = *out.page;
        std::ostringstream content;
        std::vector<std::string> annots;

        for (const auto& deco : page.decorations) {
            content << colorOp(deco.color, "rg") << "\n"
                    << num(deco.x) << ' ' << num(pageHeight - deco.y - deco.height) << ' '
                    << num(deco.width) << ' ' << num(deco.height) << " re f\n";
        }

        for (const auto& line : page.lines) {
            for (const auto& run : line.runs) {
                if (run.text.empty()) continue;
                content << "BT /" << fontResource(run.font) << ' ' << num(run.font.size)
                        << " Tf " << colorOp(run.color, "rg") << ' '
                        << num(run.x) << ' ' << num(pageHeight - run.y) << " Td "
                        << PdfWriter::textString(run.text) << " Tj ET\n";

                if (run.targetAnchor >= 0) {
                    auto it = destinations.find(run.targetAnchor);
                    if (it != destinations.end()) {
                        annots.push_back("<< /Type /Annot /Subtype /Link /Rect " +
                                         runRect(run, pageHeight) +
                                         " /Border [0 0 0] /Dest " + destArray(it->second) + " >>");
                    }
                } else if (run.isLink && !run.href.empty()) {
                    annots.push_back("<< /Type /Annot /Subtype /Link /Rect " +
                                     runRect(run, pageHeight) +
                                     " /Border [0 0 0] /A << /S /URI /URI " +
                                     PdfWriter::textString(run.href) + " >> >>");
                }
            }
        }

        if (config_.showPageNumbers && out.contentIndex >= 0) {
            const Style& footer = plan.footerStyle;
            std::string label = std::to_string(out.contentIndex + 1 + plan.pageNumberOffset);
            float width = metrics.measureText(label, footer.font).width;
            float x = (config_.pageWidth - width) / 2.0f;
            float y = config_.marginBottom / 2.0f;
            content << "BT /" << fontResource(footer.font) << ' ' << num(footer.font.size)
                    << " Tf " << colorOp(footer.color, "rg") << ' '
                    << num(x) << ' ' << num(y) << " Td "
                    << PdfWriter::textString(label) << " Tj ET\n";
        }

        int contentId = pdf.addStream(content.str(), config_.compressStreams);

        std::ostringstream pageObj;
        pageObj << "<< /Type /Page /Parent " << pagesId << " 0 R /MediaBox [0 0 "
                << num(page.width) << ' ' << num(page.height)
                << "] /Contents " << contentId << " 0 R /Resources "
                << resourcesId << " 0 R";
        if (!annots.empty()) {
            pageObj << " /Annots [";
            for (const auto& annot : annots) {
                pageObj << ' ' << pdf.addObject(annot) << " 0 R";
            }
            pageObj << " ]";
            linkCount += annots.size();
        }
        pageObj << " >>";
        pdf.setObject(out.id, pageObj.str());
    }

    std::ostringstream kids;
    kids << "<< /Type /Pages /Kids [";
    for (const auto& out : outPages) kids << ' ' << out.id << " 0 R";
    kids << " ] /Count " << outPages.size() << " >>";
    pdf.setObject(pagesId, kids.str());

    // Outline tree mirrors the TOC entries
    int outlinesId = 0;
    if (plan.document) {
        std::vector<OutlineNode> nodes;
        std::vector<int> roots;
        std::vector<std::pair<int, int>> stack;   // (level, node index)
        for (const auto& entry : collectTocEntries(*plan.document, config_.tocMaxLevel)) {
            if (destinations.find(entry.anchor) == destinations.end()) continue;
            while (!stack.empty() && stack.back().first >= entry.level) stack.pop_back();
            OutlineNode node;
            node.title = entry.text;
            node.anchor = entry.anchor;
            node.parent = stack.empty() ? -1 : stack.back().second;
            int index = static_cast<int>(nodes.size());
            nodes.push_back(std::move(node));
            if (nodes[index].parent < 0) roots.push_back(index);
            else nodes[nodes[index].parent].children.push_back(index);
            stack.emplace_back(entry.level, index);
        }

        if (!nodes.empty()) {
            // Children always follow their parent in the node list
            for (size_t i = nodes.size(); i-- > 0;) {
                if (nodes[i].parent >= 0) {
                    nodes[nodes[i].parent].descendants += 1 + nodes[i].descendants;
                }
            }
            outlinesId = pdf.reserveObject();
            for (auto& node : nodes) node.id = pdf.reserveObject();

            auto writeSiblings = [&](const std::vector<int>& siblings, int parentId) {
                for (size_t i = 0; i < siblings.size(); ++i) {
                    const auto& node = nodes[siblings[i]];
                    std::ostringstream item;
                    item << "<< /Title " << PdfWriter::textString(node.title)
                         << " /Parent " << parentId << " 0 R";
                    if (i > 0) item << " /Prev " << nodes[siblings[i - 1]].id << " 0 R";
                    if (i + 1 < siblings.size()) item << " /Next " << nodes[siblings[i + 1]].id << " 0 R";
                    if (!node.children.empty()) {
                        item << " /First " << nodes[node.children.front()].id << " 0 R"
                             << " /Last " << nodes[node.children.back()].id << " 0 R"
                             << " /Count " << node.descendants;
                    }
                    item << " /Dest " << destArray(destinations[node.anchor]) << " >>";
                    pdf.setObject(node.id, item.str());
                }
            };
            writeSiblings(roots, outlinesId);
            for (const auto& node : nodes) {
                if (!node.children.empty()) writeSiblings(node.children, node.id);
            }

            pdf.setObject(outlinesId, "<< /Type /Outlines /First " +
                                          std::to_string(nodes[roots.front()].id) + " 0 R /Last " +
                                          std::to_string(nodes[roots.back()].id) + " 0 R /Count " +
                                          std::to_string(nodes.size()) + " >>");
        }
    }

    std::string catalog = "<< /Type /Catalog /Pages " + std::to_string(pagesId) + " 0 R";
    if (outlinesId > 0) {
        catalog += " /Outlines " + std::to_string(outlinesId) + " 0 R /PageMode /UseOutlines";
    }
    catalog += " >>";
    pdf.setObject(catalogId, catalog);

    std::string title = plan.document ? plan.document->title : std::string();
    int infoId = pdf.addObject("<< /Title " + PdfWriter::textString(title) +
                               " /Producer (mdoc) >>");

    std::string bytes = pdf.finish(catalogId, infoId);
    MDOC_LOGI("render: pages=%zu objects=%zu links=%zu bytes=%zu",
              outPages.size(), pdf.objectCount(), linkCount, bytes.size());
    return bytes;
}

} // namespace mdoc
