#include "mdoc/engine.h"
#include "mdoc/renderer.h"
#include "mdoc/style_resolver.h"
#include "mdoc/toc.h"
#include "mdoc/log.h"

namespace mdoc {

Engine::Engine(RenderConfig config, std::shared_ptr<PlatformAdapter> platform)
    : config_(std::move(config))
    , platform_(platform ? std::move(platform) : std::make_shared<StandardFontAdapter>()) {
    config_.validate();
}

Engine::~Engine() = default;

RenderOutput Engine::renderMarkdown(const std::string& markdown,
                                    const std::optional<TitlePage>& titlePage) const {
    MDOC_LOGI("renderMarkdown: input=%zu page=%.0fx%.0f",
              markdown.size(), config_.pageWidth, config_.pageHeight);
    return renderDocument(parseMarkdown(markdown), titlePage);
}

RenderOutput Engine::renderDocument(Document doc,
                                    const std::optional<TitlePage>& titlePage) const {
    RenderOutput output;
    StyleResolver resolver(config_);
    LayoutEngine layout(platform_, config_);
    const bool physical = config_.pageNumbering == PageNumbering::Physical;

    assignAnchors(doc);
    resolver.resolve(doc);
    LayoutResult content = layout.paginate(doc);
    output.contentPages = static_cast<int>(content.pages.size());
    output.warnings = content.warnings;

    RenderPlan plan;
    if (titlePage) {
        plan.titlePage = layout.layoutTitlePage(*titlePage, resolver.titleStyle(),
                                                resolver.subtitleStyle());
        output.titlePages = static_cast<int>(plan.titlePage->pages.size());
    }

    // TOC page numbers depend on the TOC's own length under physical
    // numbering: iterate build -> layout until the page count is stable,
    // capped at maxTocPasses.
    int tocPages = 0;
    bool converged = false;
    LayoutResult toc;
    while (output.tocPasses < config_.maxTocPasses) {
        ++output.tocPasses;
        int offset = physical ? output.titlePages + tocPages : 0;
        buildToc(doc, config_, offset);
        resolver.resolve(*doc.toc());
        toc = layout.paginateToc(doc);

        int laidOut = static_cast<int>(toc.pages.size());
        if (!physical || laidOut == tocPages) {
            converged = true;
            break;
        }
        tocPages = laidOut;
    }
    if (!converged) {
        MDOC_LOGW("renderDocument: TOC page count not stable after %d passes, keeping last",
                  output.tocPasses);
        output.warnings.push_back(LayoutWarning::TocNotConverged);
    }
    output.tocPages = static_cast<int>(toc.pages.size());
    output.warnings.insert(output.warnings.end(), toc.warnings.begin(), toc.warnings.end());

    plan.document = &doc;
    plan.toc = std::move(toc);
    plan.content = std::move(content);
    plan.pageNumberOffset = physical ? output.titlePages + output.tocPages : 0;
    plan.footerStyle = resolver.footerStyle();

    output.pdf = Renderer(config_).render(plan);
    output.document = std::move(doc);

    MDOC_LOGI("renderDocument: pages title=%d toc=%d content=%d passes=%d warnings=%zu",
              output.titlePages, output.tocPages, output.contentPages,
              output.tocPasses, output.warnings.size());
    return output;
}

RenderOutput Engine::renderReport(const std::vector<ArticleRecord>& records,
                                  const ReportMeta& meta) const {
    MDOC_LOGI("renderReport: records=%zu title='%s'", records.size(), meta.title.c_str());
    return renderDocument(buildReport(records, meta), reportTitlePage(meta));
}

} // namespace mdoc
