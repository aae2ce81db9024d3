#pragma once

#include "mdoc/document.h"
#include "mdoc/style.h"
#include "mdoc/layout.h"
#include "mdoc/page.h"
#include "mdoc/platform.h"
#include "mdoc/report.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mdoc {

/// Output of one engine run
struct RenderOutput {
    std::string pdf;
    Document document;          // Final model: styled, paginated, with TOC
    int titlePages = 0;
    int tocPages = 0;
    int contentPages = 0;
    int tocPasses = 0;          // Fixed-point iterations used
    std::vector<LayoutWarning> warnings;

    int totalPages() const { return titlePages + tocPages + contentPages; }
};

/// Main entry point for the document engine.
/// Runs parse -> style -> paginate -> TOC -> render for one document.
/// An Engine holds no per-document state; one instance may serve many runs
/// sequentially, and separate instances may run concurrently.
class Engine {
public:
    /// Throws std::invalid_argument if config is invalid
    explicit Engine(RenderConfig config = {},
                    std::shared_ptr<PlatformAdapter> platform = nullptr);
    ~Engine();

    /// Parse markdown and render it
    RenderOutput renderMarkdown(const std::string& markdown,
                                const std::optional<TitlePage>& titlePage = std::nullopt) const;

    /// Render a pre-built document (parsed or assembled)
    RenderOutput renderDocument(Document doc,
                                const std::optional<TitlePage>& titlePage = std::nullopt) const;

    /// Assemble upstream records into a report and render it with a title page
    RenderOutput renderReport(const std::vector<ArticleRecord>& records,
                              const ReportMeta& meta) const;

    const RenderConfig& config() const { return config_; }

    /// Get the platform adapter
    std::shared_ptr<PlatformAdapter> platform() const { return platform_; }

private:
    RenderConfig config_;
    std::shared_ptr<PlatformAdapter> platform_;
};

} // namespace mdoc
