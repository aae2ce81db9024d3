#pragma once

#include "mdoc/document.h"
#include "mdoc/page.h"
#include "mdoc/style.h"
#include <optional>
#include <string>

namespace mdoc {

/// Everything the renderer needs for one output file. Pages are drawn in
/// order: title page, TOC pages, content pages.
struct RenderPlan {
    const Document* document = nullptr;
    std::optional<LayoutResult> titlePage;
    LayoutResult toc;
    LayoutResult content;
    int pageNumberOffset = 0;   // Footer number = content index + 1 + offset
    Style footerStyle;
};

/// Turns paginated layout into PDF bytes. Drawing is limited to placing the
/// laid-out text runs and decorations; fonts are the PDF base-14 set.
class Renderer {
public:
    explicit Renderer(const RenderConfig& config);

    std::string render(const RenderPlan& plan) const;

private:
    RenderConfig config_;
};

} // namespace mdoc
