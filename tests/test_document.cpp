#include <gtest/gtest.h>
#include "mdoc/document.h"

using namespace mdoc;

namespace {

template <class T>
const T& as(const Block& block) {
    return std::get<T>(block.content);
}

} // anonymous namespace

// MARK: - Inline Parsing Tests

TEST(InlineTest, BoldSpanBetweenPlainText) {
    auto run = parseInlines("Some **bold** text.");
    ASSERT_EQ(run.size(), 3u);
    EXPECT_EQ(run[0], InlineElement::plain("Some "));
    EXPECT_EQ(run[1], InlineElement::bold("bold"));
    EXPECT_EQ(run[2], InlineElement::plain(" text."));
}

TEST(InlineTest, ItalicWithStarOrUnderscore) {
    auto run = parseInlines("*one* and _two_");
    ASSERT_EQ(run.size(), 3u);
    EXPECT_EQ(run[0], InlineElement::italic("one"));
    EXPECT_EQ(run[1], InlineElement::plain(" and "));
    EXPECT_EQ(run[2], InlineElement::italic("two"));
}

TEST(InlineTest, TripleStarIsBoldItalic) {
    auto run = parseInlines("***both***");
    ASSERT_EQ(run.size(), 1u);
    EXPECT_EQ(run[0], InlineElement::boldItalic("both"));
}

TEST(InlineTest, DoubleUnderscoreIsBold) {
    auto run = parseInlines("__strong__");
    ASSERT_EQ(run.size(), 1u);
    EXPECT_EQ(run[0], InlineElement::bold("strong"));
}

TEST(InlineTest, CodeSpanKeepsMarkersInside) {
    auto run = parseInlines("call `a*b*c` now");
    ASSERT_EQ(run.size(), 3u);
    EXPECT_EQ(run[1], InlineElement::code("a*b*c"));
}

TEST(InlineTest, LinkKeepsVisibleTextAndUrl) {
    auto run = parseInlines("see [the docs](https://example.com/docs) here");
    ASSERT_EQ(run.size(), 3u);
    EXPECT_EQ(run[1].type, InlineType::Link);
    EXPECT_EQ(run[1].text, "the docs");
    EXPECT_EQ(run[1].href, "https://example.com/docs");
    EXPECT_EQ(plainText(run), "see the docs here");
}

TEST(InlineTest, UnmatchedMarkersStayLiteral) {
    EXPECT_EQ(plainText(parseInlines("a **b")), "a **b");
    EXPECT_EQ(plainText(parseInlines("2 * 3 = 6")), "2 * 3 = 6");
    EXPECT_EQ(plainText(parseInlines("[broken](")), "[broken](");
    EXPECT_EQ(plainText(parseInlines("tick ` alone")), "tick ` alone");
    EXPECT_EQ(plainText(parseInlines("``")), "``");
}

TEST(InlineTest, IntraWordUnderscoresStayLiteral) {
    auto run = parseInlines("use snake_case_names here");
    ASSERT_EQ(run.size(), 1u);
    EXPECT_EQ(run[0].text, "use snake_case_names here");
}

TEST(InlineTest, BackslashEscapesMarker) {
    auto run = parseInlines("\\*not italic\\*");
    ASSERT_EQ(run.size(), 1u);
    EXPECT_EQ(run[0], InlineElement::plain("*not italic*"));
}

TEST(InlineTest, PaddedDelimitersDoNotOpen) {
    auto run = parseInlines("a * b * c");
    ASSERT_EQ(run.size(), 1u);
    EXPECT_EQ(run[0].type, InlineType::Text);
}

TEST(InlineTest, SpansReconstructTextWithoutMarkers) {
    struct Case { const char* input; const char* visible; };
    const Case cases[] = {
        {"plain", "plain"},
        {"**b** *i* `c` [l](u)", "b i c l"},
        {"mixed **bold and *star", "mixed **bold and *star"},
        {"**unclosed [x](y)", "**unclosed x"},
        {"", ""},
    };
    for (const auto& c : cases) {
        EXPECT_EQ(plainText(parseInlines(c.input)), c.visible) << c.input;
    }
}

TEST(InlineTest, FourStarsAreBold) {
    auto run = parseInlines("support ****\"Improve UX\"**** track");
    ASSERT_EQ(run.size(), 3u);
    EXPECT_EQ(run[0], InlineElement::plain("support "));
    EXPECT_EQ(run[1], InlineElement::bold("\"Improve UX\""));
    EXPECT_EQ(run[2], InlineElement::plain(" track"));

    auto lead = parseInlines("****Primary Objective:**** Understand users");
    ASSERT_EQ(lead.size(), 2u);
    EXPECT_EQ(lead[0], InlineElement::bold("Primary Objective:"));
}

TEST(InlineTest, GeneratedReportDialect) {
    struct Case { const char* input; const char* visible; };
    const Case cases[] = {
        {"- ****Stakeholder interviews**** with Protocol team members",
         "- Stakeholder interviews with Protocol team members"},
        {"****Wallet and Key Management****", "Wallet and Key Management"},
        {"*\"The goal is to make Ethereum as easy to use.\"*",
         "\"The goal is to make Ethereum as easy to use.\""},
        {"- `wallet.connect()` integration patterns", "- wallet.connect() integration patterns"},
        {"*****five*****", "*****five*****"},
    };
    for (const auto& c : cases) {
        EXPECT_EQ(plainText(parseInlines(c.input)), c.visible) << c.input;
    }
}

TEST(InlineTest, LinkInsideBoldKeepsVisibleText) {
    auto run = parseInlines("**see [docs](http://x)** now");
    EXPECT_EQ(plainText(run), "see docs now");
    ASSERT_EQ(run.size(), 3u);
    EXPECT_EQ(run[0], InlineElement::bold("see "));
    EXPECT_EQ(run[1], InlineElement::link("docs", "http://x"));
    EXPECT_EQ(run[2], InlineElement::plain(" now"));
}

TEST(InlineTest, CodeInsideEmphasisIsCode) {
    auto run = parseInlines("*call `f()` first*");
    ASSERT_EQ(run.size(), 3u);
    EXPECT_EQ(run[0], InlineElement::italic("call "));
    EXPECT_EQ(run[1], InlineElement::code("f()"));
    EXPECT_EQ(run[2], InlineElement::italic(" first"));
}

TEST(InlineTest, NestedEmphasisCombinesWeights) {
    auto run = parseInlines("**bold *both* bold**");
    ASSERT_EQ(run.size(), 3u);
    EXPECT_EQ(run[0], InlineElement::bold("bold "));
    EXPECT_EQ(run[1], InlineElement::boldItalic("both"));
    EXPECT_EQ(run[2], InlineElement::bold(" bold"));
}

// MARK: - Block Parsing Tests

TEST(BlockParserTest, HeadingLevels) {
    auto blocks = parseBlocks("# One\n## Two\n###### Six");
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(as<HeadingBlock>(blocks[0]).level, 1);
    EXPECT_EQ(as<HeadingBlock>(blocks[1]).level, 2);
    EXPECT_EQ(as<HeadingBlock>(blocks[2]).level, 6);
    EXPECT_EQ(as<HeadingBlock>(blocks[2]).text, "Six");
}

TEST(BlockParserTest, HeadingClosingHashesStripped) {
    auto blocks = parseBlocks("## Title ##\n# C#");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(as<HeadingBlock>(blocks[0]).text, "Title");
    EXPECT_EQ(as<HeadingBlock>(blocks[1]).text, "C#");
}

TEST(BlockParserTest, HeadingTextDropsInlineMarkers) {
    auto blocks = parseBlocks("# The **big** news");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(as<HeadingBlock>(blocks[0]).text, "The big news");
}

TEST(BlockParserTest, NotHeadingsDegradeToParagraphs) {
    auto blocks = parseBlocks("#NoSpace\n\n####### seven");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].plainText(), "#NoSpace");
    EXPECT_EQ(blocks[1].plainText(), "####### seven");
    EXPECT_TRUE(std::holds_alternative<ParagraphBlock>(blocks[1].content));
}

TEST(BlockParserTest, ConsecutiveLinesJoinIntoParagraph) {
    auto blocks = parseBlocks("line one\nline two\n\nnext");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].plainText(), "line one line two");
    EXPECT_EQ(blocks[1].plainText(), "next");
}

TEST(BlockParserTest, QuotesMergeByDepth) {
    auto blocks = parseBlocks("> a\n> b\n>> c\n\n> > d");
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(as<QuoteBlock>(blocks[0]).depth, 1);
    EXPECT_EQ(blocks[0].plainText(), "a b");
    EXPECT_EQ(as<QuoteBlock>(blocks[1]).depth, 2);
    EXPECT_EQ(blocks[1].plainText(), "c");
    EXPECT_EQ(as<QuoteBlock>(blocks[2]).depth, 2);
    EXPECT_EQ(blocks[2].plainText(), "d");
}

TEST(BlockParserTest, EmptyQuoteLineEndsRun) {
    auto blocks = parseBlocks("> a\n>\n> b");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].plainText(), "a");
    EXPECT_EQ(blocks[1].plainText(), "b");
}

TEST(BlockParserTest, ListItemsWithDepthAndNumbers) {
    auto blocks = parseBlocks("- one\n  - two\n    * three\n1. first\n10. tenth\n\t+ tabbed");
    ASSERT_EQ(blocks.size(), 6u);
    EXPECT_EQ(as<ListItemBlock>(blocks[0]).depth, 0);
    EXPECT_EQ(as<ListItemBlock>(blocks[1]).depth, 1);
    EXPECT_EQ(as<ListItemBlock>(blocks[2]).depth, 2);
    EXPECT_FALSE(as<ListItemBlock>(blocks[2]).ordered);
    EXPECT_TRUE(as<ListItemBlock>(blocks[3]).ordered);
    EXPECT_EQ(as<ListItemBlock>(blocks[3]).number, 1);
    EXPECT_EQ(as<ListItemBlock>(blocks[4]).number, 10);
    EXPECT_EQ(as<ListItemBlock>(blocks[5]).depth, 2);
    EXPECT_EQ(blocks[5].plainText(), "tabbed");
}

TEST(BlockParserTest, BoldAtLineStartIsNotListItem) {
    auto blocks = parseBlocks("**Note** this is text");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<ParagraphBlock>(blocks[0].content));
}

TEST(BlockParserTest, HorizontalRules) {
    auto blocks = parseBlocks("---\n\n* * *\n\n___\n\n--");
    ASSERT_EQ(blocks.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<RuleBlock>(blocks[0].content));
    EXPECT_TRUE(std::holds_alternative<RuleBlock>(blocks[1].content));
    EXPECT_TRUE(std::holds_alternative<RuleBlock>(blocks[2].content));
    EXPECT_TRUE(std::holds_alternative<ParagraphBlock>(blocks[3].content));
}

TEST(BlockParserTest, FencedCodeWithLanguage) {
    auto blocks = parseBlocks("```cpp\nint x;\n  indented\n\n# not a heading\n```\nafter");
    ASSERT_EQ(blocks.size(), 2u);
    const auto& code = as<CodeBlock>(blocks[0]);
    ASSERT_TRUE(code.language.has_value());
    EXPECT_EQ(*code.language, "cpp");
    ASSERT_EQ(code.lines.size(), 4u);
    EXPECT_EQ(code.lines[1], "  indented");
    EXPECT_EQ(code.lines[2], "");
    EXPECT_EQ(code.lines[3], "# not a heading");
    EXPECT_EQ(blocks[1].plainText(), "after");
}

TEST(BlockParserTest, UnterminatedFenceClosesAtEnd) {
    auto blocks = parseBlocks("intro\n\n```\nline one\n- not a list\n> not a quote");
    ASSERT_EQ(blocks.size(), 2u);
    const auto& code = as<CodeBlock>(blocks[1]);
    EXPECT_FALSE(code.language.has_value());
    ASSERT_EQ(code.lines.size(), 3u);
    EXPECT_EQ(code.lines[0], "line one");
    EXPECT_EQ(code.lines[1], "- not a list");
    EXPECT_EQ(code.lines[2], "> not a quote");
}

TEST(BlockParserTest, LongerClosingFenceCloses) {
    auto blocks = parseBlocks("```\ncode\n`````\ntext");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(as<CodeBlock>(blocks[0]).lines.size(), 1u);
}

TEST(BlockParserTest, LiteralEscapedNewlinesNormalized) {
    auto blocks = parseBlocks("# Title\\n\\nBody text\\n- item");
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(as<HeadingBlock>(blocks[0]).text, "Title");
    EXPECT_EQ(blocks[1].plainText(), "Body text");
    EXPECT_TRUE(std::holds_alternative<ListItemBlock>(blocks[2].content));
}

TEST(BlockParserTest, CrlfLineEndings) {
    auto blocks = parseBlocks("# T\r\n\r\nBody\r\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[1].plainText(), "Body");
}

// MARK: - Document Tree Tests

TEST(DocumentTest, ExampleDocumentTree) {
    auto doc = parseMarkdown("# Title\n\nSome **bold** text.\n\n## Sub\n- item one\n- item two");
    ASSERT_EQ(doc.sections.size(), 1u);
    const auto& title = doc.sections[0];
    EXPECT_EQ(title.level, 1);
    EXPECT_EQ(title.title, "Title");
    ASSERT_EQ(title.blocks.size(), 1u);
    const auto& para = as<ParagraphBlock>(title.blocks[0]);
    ASSERT_EQ(para.inlines.size(), 3u);
    EXPECT_EQ(para.inlines[0], InlineElement::plain("Some "));
    EXPECT_EQ(para.inlines[1], InlineElement::bold("bold"));
    EXPECT_EQ(para.inlines[2], InlineElement::plain(" text."));

    ASSERT_EQ(title.children.size(), 1u);
    const auto& sub = title.children[0];
    EXPECT_EQ(sub.level, 2);
    EXPECT_EQ(sub.title, "Sub");
    ASSERT_EQ(sub.blocks.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<ListItemBlock>(sub.blocks[0].content));
    EXPECT_TRUE(std::holds_alternative<ListItemBlock>(sub.blocks[1].content));

    EXPECT_EQ(doc.title, "Title");
    EXPECT_EQ(doc.blockCount(), 5u);
    EXPECT_EQ(doc.toc(), nullptr);
}

TEST(DocumentTest, ContentBeforeFirstHeadingIsImplicitSection) {
    auto doc = parseMarkdown("intro text\n\n# A\nbody");
    ASSERT_EQ(doc.sections.size(), 2u);
    EXPECT_TRUE(doc.sections[0].isImplicit());
    EXPECT_EQ(doc.sections[0].level, 1);
    ASSERT_EQ(doc.sections[0].blocks.size(), 1u);
    EXPECT_EQ(doc.sections[1].title, "A");
    EXPECT_EQ(doc.title, "A");
}

TEST(DocumentTest, SkippedLevelsBridgedByImplicitSections) {
    auto doc = parseMarkdown("# A\n### C\ntext");
    ASSERT_EQ(doc.sections.size(), 1u);
    const auto& a = doc.sections[0];
    ASSERT_EQ(a.children.size(), 1u);
    const auto& bridge = a.children[0];
    EXPECT_TRUE(bridge.isImplicit());
    EXPECT_EQ(bridge.level, 2);
    ASSERT_EQ(bridge.children.size(), 1u);
    EXPECT_EQ(bridge.children[0].level, 3);
    EXPECT_EQ(bridge.children[0].title, "C");
    EXPECT_EQ(bridge.children[0].blocks.size(), 1u);
}

TEST(DocumentTest, ChildLevelsAreAlwaysOneDeeper) {
    auto doc = parseMarkdown("## x\n# A\n#### y\n## B\n### C\n# D\n###### deep");
    std::function<void(const Section&)> check = [&](const Section& s) {
        for (const auto& child : s.children) {
            EXPECT_EQ(child.level, s.level + 1);
            check(child);
        }
    };
    for (const auto& s : doc.sections) {
        EXPECT_EQ(s.level, 1);
        check(s);
    }
}

TEST(DocumentTest, EqualLevelHeadingClosesSection) {
    auto doc = parseMarkdown("# A\n## B\ntext\n# C");
    ASSERT_EQ(doc.sections.size(), 2u);
    EXPECT_EQ(doc.sections[0].children.size(), 1u);
    EXPECT_EQ(doc.sections[1].title, "C");
}

TEST(DocumentTest, AnchorsNumberHeadingsInOrder) {
    auto doc = parseMarkdown("# A\n## B\n### C\n# D");
    std::vector<int> anchors;
    forEachContentBlock(doc, [&](const Block& block) {
        if (auto* h = std::get_if<HeadingBlock>(&block.content)) anchors.push_back(h->anchor);
    });
    EXPECT_EQ(anchors, (std::vector<int>{0, 1, 2, 3}));
}

TEST(DocumentTest, EmptyInputYieldsOneEmptySection) {
    auto doc = parseMarkdown("");
    ASSERT_EQ(doc.sections.size(), 1u);
    EXPECT_EQ(doc.blockCount(), 0u);
}

TEST(DocumentTest, AppendBlocksShiftsHeadingLevels) {
    Section article;
    article.level = 2;
    appendBlocks(article, parseBlocks("lead\n# Summary\nbody\n## Detail\n###### Tiny"), 2);

    ASSERT_EQ(article.blocks.size(), 1u);
    ASSERT_EQ(article.children.size(), 1u);
    const auto& summary = article.children[0];
    EXPECT_EQ(summary.level, 3);
    EXPECT_EQ(as<HeadingBlock>(*summary.heading).level, 3);
    ASSERT_EQ(summary.children.size(), 1u);
    const auto& detail = summary.children[0];
    EXPECT_EQ(detail.level, 4);

    // 6 + 2 clamps to 6, bridged from level 4
    ASSERT_EQ(detail.children.size(), 1u);
    EXPECT_TRUE(detail.children[0].isImplicit());
    ASSERT_EQ(detail.children[0].children.size(), 1u);
    EXPECT_EQ(detail.children[0].children[0].level, 6);
}

TEST(DocumentTest, PlainTextOfCodeJoinsLines) {
    Block block(CodeBlock{std::nullopt, {"a", "b"}});
    EXPECT_EQ(block.plainText(), "a\nb");
    EXPECT_EQ(Block(RuleBlock{}).plainText(), "");
}
