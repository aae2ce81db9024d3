#pragma once

#include "mdoc/document.h"
#include "mdoc/layout.h"
#include <string>
#include <vector>

namespace mdoc {

/// One upstream news record with its generated markdown body
struct ArticleRecord {
    std::string source;      // Feed identifier, e.g. "ethereum_blog"
    std::string title;
    std::string published;   // As supplied by the feed
    std::string url;
    std::string body;        // Markdown
};

/// Report-level metadata shown on the title page
struct ReportMeta {
    std::string title = "Web3 News Updates Report";
    std::string generatedAt;
};

/// Display name of a feed identifier ("polygon_blog" -> "Polygon Blog")
std::string formatSourceName(const std::string& source);

/// "Fri, 22 Aug 2025 00:00:00 GMT" -> "August 22, 2025". Inputs in an
/// unknown format are returned unchanged.
std::string formatPublishedDate(const std::string& published);

/// Assemble records into one document: a level-1 section per source (first
/// seen order), a level-2 section per record with its body nested below.
/// Throws std::invalid_argument for an empty record list.
Document buildReport(const std::vector<ArticleRecord>& records, const ReportMeta& meta);

/// Title page for a report
TitlePage reportTitlePage(const ReportMeta& meta);

} // namespace mdoc
