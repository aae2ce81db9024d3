#include <gtest/gtest.h>
#include "mdoc/report.h"
#include <stdexcept>

using namespace mdoc;

namespace {

ArticleRecord record(const std::string& source, const std::string& title,
                     const std::string& body = "Body text.") {
    ArticleRecord r;
    r.source = source;
    r.title = title;
    r.published = "Fri, 22 Aug 2025 00:00:00 GMT";
    r.url = "https://example.com/" + title;
    r.body = body;
    return r;
}

} // anonymous namespace

// MARK: - Formatting

TEST(ReportTest, KnownSourceNames) {
    EXPECT_EQ(formatSourceName("ethereum_blog"), "Ethereum Blog");
    EXPECT_EQ(formatSourceName("arbitrum_medium"), "Arbitrum Medium");
    EXPECT_EQ(formatSourceName("solana_news"), "Solana News");
}

TEST(ReportTest, UnknownSourceNamesAreTitleCased) {
    EXPECT_EQ(formatSourceName("base_dev_updates"), "Base Dev Updates");
    EXPECT_EQ(formatSourceName("OPTIMISM"), "Optimism");
    EXPECT_EQ(formatSourceName("web3_feed"), "Web3 Feed");
}

TEST(ReportTest, PublishedDateFormats) {
    EXPECT_EQ(formatPublishedDate("Fri, 22 Aug 2025 00:00:00 GMT"), "August 22, 2025");
    EXPECT_EQ(formatPublishedDate("2025-08-05"), "August 05, 2025");
    EXPECT_EQ(formatPublishedDate("12 Mar 2024"), "March 12, 2024");
}

TEST(ReportTest, UnparseableDatesPassThrough) {
    EXPECT_EQ(formatPublishedDate("yesterday"), "yesterday");
    EXPECT_EQ(formatPublishedDate(""), "");
    EXPECT_EQ(formatPublishedDate("2025-08-05 and more"), "2025-08-05 and more");
}

// MARK: - Assembly

TEST(ReportTest, GroupsBySourceInFirstSeenOrder) {
    std::vector<ArticleRecord> records = {
        record("polygon_blog", "A"),
        record("ethereum_blog", "B"),
        record("polygon_blog", "C"),
    };
    Document doc = buildReport(records, ReportMeta{});

    ASSERT_EQ(doc.sections.size(), 2u);
    EXPECT_EQ(doc.sections[0].title, "Polygon Blog");
    EXPECT_EQ(doc.sections[1].title, "Ethereum Blog");
    ASSERT_EQ(doc.sections[0].children.size(), 2u);
    EXPECT_EQ(doc.sections[0].children[0].title, "A");
    EXPECT_EQ(doc.sections[0].children[1].title, "C");
    ASSERT_EQ(doc.sections[1].children.size(), 1u);

    EXPECT_FALSE(doc.sections[0].pageBreakBefore);
    EXPECT_TRUE(doc.sections[1].pageBreakBefore);
    EXPECT_EQ(doc.title, ReportMeta{}.title);
}

TEST(ReportTest, ArticleHeaderBlocks) {
    Document doc = buildReport({record("flow_blog", "Launch")}, ReportMeta{});
    const Section& article = doc.sections[0].children[0];

    EXPECT_EQ(article.level, 2);
    ASSERT_TRUE(article.heading.has_value());
    EXPECT_EQ(std::get<HeadingBlock>(article.heading->content).level, 2);
    ASSERT_GE(article.blocks.size(), 3u);

    const auto& published = std::get<ParagraphBlock>(article.blocks[0].content).inlines;
    ASSERT_EQ(published.size(), 2u);
    EXPECT_EQ(published[0], InlineElement::bold("Published:"));
    EXPECT_EQ(published[1], InlineElement::plain(" August 22, 2025"));

    const auto& link = std::get<ParagraphBlock>(article.blocks[1].content).inlines;
    ASSERT_EQ(link.size(), 3u);
    EXPECT_EQ(link[0], InlineElement::bold("Link:"));
    EXPECT_EQ(link[2].type, InlineType::Link);
    EXPECT_EQ(link[2].href, "https://example.com/Launch");

    EXPECT_EQ(article.blocks[2].plainText(), "Body text.");
}

TEST(ReportTest, MissingTitleAndUrl) {
    ArticleRecord r = record("flow_blog", "");
    r.url.clear();
    Document doc = buildReport({r}, ReportMeta{});
    const Section& article = doc.sections[0].children[0];
    EXPECT_EQ(article.title, "No Title");
    // No link line without a URL
    ASSERT_GE(article.blocks.size(), 2u);
    EXPECT_EQ(article.blocks[1].plainText(), "Body text.");
}

TEST(ReportTest, MissingDateFallsBack) {
    ArticleRecord r = record("flow_blog", "Launch");
    r.published = "  ";
    Document doc = buildReport({r}, ReportMeta{});
    const auto& published =
        std::get<ParagraphBlock>(doc.sections[0].children[0].blocks[0].content).inlines;
    ASSERT_EQ(published.size(), 2u);
    EXPECT_EQ(published[1], InlineElement::plain(" No Date"));
}

TEST(ReportTest, BodyHeadingsNestBelowArticle) {
    Document doc = buildReport({record("flow_blog", "T", "# Summary\ntext\n## Detail\nmore")},
                               ReportMeta{});
    const Section& article = doc.sections[0].children[0];
    ASSERT_EQ(article.children.size(), 1u);
    const Section& summary = article.children[0];
    EXPECT_EQ(summary.level, 3);
    EXPECT_EQ(summary.title, "Summary");
    ASSERT_EQ(summary.children.size(), 1u);
    EXPECT_EQ(summary.children[0].level, 4);
}

TEST(ReportTest, EscapedNewlinesInBody) {
    Document doc = buildReport({record("flow_blog", "T", "first\\n\\nsecond")}, ReportMeta{});
    const Section& article = doc.sections[0].children[0];
    ASSERT_EQ(article.blocks.size(), 4u);
    EXPECT_EQ(article.blocks[2].plainText(), "first");
    EXPECT_EQ(article.blocks[3].plainText(), "second");
}

TEST(ReportTest, AnchorsFollowDocumentOrder) {
    Document doc = buildReport({record("polygon_blog", "A", "# Inner"),
                                record("ethereum_blog", "B")},
                               ReportMeta{});
    std::vector<int> anchors;
    forEachContentBlock(doc, [&](const Block& block) {
        if (auto* heading = std::get_if<HeadingBlock>(&block.content)) {
            anchors.push_back(heading->anchor);
        }
    });
    // Source, article, body heading, source, article
    ASSERT_EQ(anchors.size(), 5u);
    for (size_t i = 0; i < anchors.size(); ++i) {
        EXPECT_EQ(anchors[i], static_cast<int>(i));
    }
}

TEST(ReportTest, EmptyRecordListThrows) {
    EXPECT_THROW(buildReport({}, ReportMeta{}), std::invalid_argument);
}

TEST(ReportTest, TitlePageLines) {
    ReportMeta meta;
    meta.title = "Weekly Digest";
    meta.generatedAt = "August 22, 2025";
    TitlePage page = reportTitlePage(meta);
    EXPECT_EQ(page.title, "Weekly Digest");
    ASSERT_EQ(page.lines.size(), 1u);
    EXPECT_EQ(page.lines[0], "Generated on August 22, 2025");

    meta.generatedAt.clear();
    EXPECT_TRUE(reportTitlePage(meta).lines.empty());
}
