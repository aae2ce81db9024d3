#include "mdoc/report.h"
#include "mdoc/log.h"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <map>
#include <sstream>
#include <stdexcept>

namespace mdoc {

namespace {

const std::map<std::string, std::string>& knownSources() {
    static const std::map<std::string, std::string> names = {
        {"ethereum_blog", "Ethereum Blog"},
        {"arbitrum_medium", "Arbitrum Medium"},
        {"polygon_blog", "Polygon Blog"},
        {"solana_news", "Solana News"},
        {"flow_blog", "Flow Blog"},
    };
    return names;
}

/// Parse the whole of text with a strftime-style format
bool parseTime(const std::string& text, const char* format, std::tm& out) {
    std::tm tm = {};
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, format);
    if (in.fail()) return false;
    in >> std::ws;
    if (in.peek() != std::char_traits<char>::eof()) return false;
    out = tm;
    return true;
}

std::string trimmed(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

std::string formatSourceName(const std::string& source) {
    auto it = knownSources().find(source);
    if (it != knownSources().end()) return it->second;

    // Title-case every alphabetic word, '_' separates words
    std::string name;
    bool prevAlpha = false;
    for (char c : source) {
        if (c == '_') c = ' ';
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            name += static_cast<char>(prevAlpha ? std::tolower(uc) : std::toupper(uc));
            prevAlpha = true;
        } else {
            name += c;
            prevAlpha = false;
        }
    }
    return name;
}

std::string formatPublishedDate(const std::string& published) {
    std::string text = trimmed(published);
    const std::string gmt = " GMT";
    if (text.size() > gmt.size() && text.compare(text.size() - gmt.size(), gmt.size(), gmt) == 0) {
        text.resize(text.size() - gmt.size());
    }

    static const char* const kFormats[] = {
        "%a, %d %b %Y %H:%M:%S",   // RFC 822 feed dates
        "%Y-%m-%d",
        "%d %b %Y",
    };
    for (const char* format : kFormats) {
        std::tm tm = {};
        if (parseTime(text, format, tm)) {
            std::ostringstream out;
            out.imbue(std::locale::classic());
            out << std::put_time(&tm, "%B %d, %Y");
            return out.str();
        }
    }
    return published;
}

Document buildReport(const std::vector<ArticleRecord>& records, const ReportMeta& meta) {
    if (records.empty()) {
        throw std::invalid_argument("cannot build a report without records");
    }

    Document doc;
    doc.title = meta.title;

    std::map<std::string, size_t> groupIndex;
    for (const auto& record : records) {
        auto found = groupIndex.find(record.source);
        if (found == groupIndex.end()) {
            Section group;
            group.level = 1;
            group.title = formatSourceName(record.source);
            group.heading = Block(HeadingBlock{1, group.title, -1});
            // Each source after the first starts on a fresh page
            group.pageBreakBefore = !doc.sections.empty();
            found = groupIndex.emplace(record.source, doc.sections.size()).first;
            doc.sections.push_back(std::move(group));
        }

        Section article;
        article.level = 2;
        article.title = record.title.empty() ? "No Title" : record.title;
        article.heading = Block(HeadingBlock{2, article.title, -1});
        std::string date = formatPublishedDate(record.published);
        if (trimmed(date).empty()) date = "No Date";
        article.blocks.emplace_back(ParagraphBlock{{
            InlineElement::bold("Published:"),
            InlineElement::plain(" " + date),
        }});
        if (!record.url.empty()) {
            article.blocks.emplace_back(ParagraphBlock{{
                InlineElement::bold("Link:"),
                InlineElement::plain(" "),
                InlineElement::link(record.url, record.url),
            }});
        }
        appendBlocks(article, parseBlocks(record.body), 2);

        doc.sections[found->second].children.push_back(std::move(article));
    }

    assignAnchors(doc);
    MDOC_LOGI("buildReport: records=%zu sources=%zu blocks=%zu",
              records.size(), doc.sections.size(), doc.blockCount());
    return doc;
}

TitlePage reportTitlePage(const ReportMeta& meta) {
    TitlePage page;
    page.title = meta.title;
    if (!meta.generatedAt.empty()) {
        page.lines.push_back("Generated on " + meta.generatedAt);
    }
    return page;
}

} // namespace mdoc
