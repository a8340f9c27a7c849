#include <gtest/gtest.h>
#include <pdf_outliner/font_profile.h>
#include <pdf_outliner/fragment_normalizer.h>
#include <pdf_outliner/heading_classifier.h>
#include "test_helpers.h"
#include <vector>

namespace {

using namespace pdf_outliner;
using test::DocumentBuilder;
using test::make_line;

class HeadingClassifierTest : public ::testing::Test {
protected:
    DocumentClassification classify(const DocumentContent& content) {
        lines = normalizer.normalize(content.pages);
        profile = FontProfile::build(lines);
        return classifier.classify_document(lines, profile);
    }

    FragmentNormalizer normalizer;
    HeadingClassifier classifier;
    std::vector<Line> lines;
    FontProfile profile;
};

TEST_F(HeadingClassifierTest, DetectsTitleAndReranksTiers) {
    auto result = classify(test::company_report());

    EXPECT_EQ(result.title, "Company Report");
    EXPECT_FLOAT_EQ(result.title_size, 24.0f);

    ASSERT_EQ(result.headings.size(), 2u);
    EXPECT_EQ(result.headings[0].line.text, "Financials");
    EXPECT_EQ(result.headings[0].level, HeadingLevel::H1);
    EXPECT_EQ(result.headings[0].line.page, 2);
    EXPECT_EQ(result.headings[1].line.text, "Q1 Results");
    EXPECT_EQ(result.headings[1].level, HeadingLevel::H2);
    EXPECT_EQ(result.headings[1].line.page, 2);
}

TEST_F(HeadingClassifierTest, NumberingDecidesLevels) {
    auto content = DocumentBuilder()
        .page().line("1. Introduction", 16.0f, true).body(5)
        .heading("1.1 Background", 14.0f).body(5)
        .page().line("2. Methods", 16.0f, true).body(5)
        .build();

    auto result = classify(content);

    // A numbered first heading is never the title
    EXPECT_TRUE(result.title.empty());

    ASSERT_EQ(result.headings.size(), 3u);
    EXPECT_EQ(result.headings[0].level, HeadingLevel::H1);
    EXPECT_EQ(result.headings[1].level, HeadingLevel::H2);
    EXPECT_EQ(result.headings[2].level, HeadingLevel::H1);
    EXPECT_EQ(result.headings[2].line.page, 2);
}

TEST_F(HeadingClassifierTest, NumberedHeadingsWithoutBodyText) {
    // The 16pt headings outweigh everything else and become the body size
    auto content = DocumentBuilder()
        .page()
        .heading("1. Intro", 16.0f, false)
        .heading("1.1 Background", 14.0f, false)
        .heading("2. Methods", 16.0f, false)
        .build();

    auto result = classify(content);
    EXPECT_FLOAT_EQ(profile.body_size(), 16.0f);
    EXPECT_TRUE(profile.numbered_body());
    EXPECT_TRUE(result.title.empty());

    ASSERT_EQ(result.headings.size(), 3u);
    EXPECT_EQ(result.headings[0].line.text, "1. Intro");
    EXPECT_EQ(result.headings[0].level, HeadingLevel::H1);
    EXPECT_EQ(result.headings[1].line.text, "1.1 Background");
    EXPECT_EQ(result.headings[1].level, HeadingLevel::H2);
    EXPECT_EQ(result.headings[2].line.text, "2. Methods");
    EXPECT_EQ(result.headings[2].level, HeadingLevel::H1);
}

TEST_F(HeadingClassifierTest, NumberedListInBodyTextIsNotAHeading) {
    auto content = DocumentBuilder()
        .page().body(6)
        .line("1. Preheat the oven", 11.0f, false, 12.0f)
        .line("2. Mix the flour", 11.0f, false, 12.0f)
        .body(6)
        .build();

    auto result = classify(content);
    EXPECT_FALSE(profile.numbered_body());
    EXPECT_TRUE(result.headings.empty());
}

TEST_F(HeadingClassifierTest, UniformDocumentHasNoHeadings) {
    auto content = DocumentBuilder()
        .page().body(10)
        .page().body(10)
        .build();

    auto result = classify(content);
    EXPECT_TRUE(result.title.empty());
    EXPECT_TRUE(result.headings.empty());
}

TEST_F(HeadingClassifierTest, JoinsMultiLineTitle) {
    auto content = DocumentBuilder()
        .page()
        .line("Understanding Large", 26.0f, true, 0.0f, 120.0f)
        .line("Document Collections", 26.0f, true, 0.0f, 120.0f)
        .body(6)
        .heading("Overview", 18.0f).body(6)
        .build();

    auto result = classify(content);
    EXPECT_EQ(result.title, "Understanding Large Document Collections");

    ASSERT_EQ(result.headings.size(), 1u);
    EXPECT_EQ(result.headings[0].line.text, "Overview");
    EXPECT_EQ(result.headings[0].level, HeadingLevel::H1);
}

TEST_F(HeadingClassifierTest, SharedTitleSizeKeepsTiers) {
    auto content = DocumentBuilder()
        .page().line("Part One", 20.0f, true).body(6)
        .heading("Details", 14.0f).body(6)
        .page().line("Part Two", 20.0f, true).body(6)
        .build();

    auto result = classify(content);
    EXPECT_EQ(result.title, "Part One");

    ASSERT_EQ(result.headings.size(), 2u);
    EXPECT_EQ(result.headings[0].line.text, "Details");
    EXPECT_EQ(result.headings[0].level, HeadingLevel::H2);
    EXPECT_EQ(result.headings[1].line.text, "Part Two");
    EXPECT_EQ(result.headings[1].level, HeadingLevel::H1);
}

TEST_F(HeadingClassifierTest, SkipsTocEntriesAndPageNumbers) {
    auto content = DocumentBuilder()
        .page().line("Report", 22.0f, true).body(4)
        .heading("Contents", 16.0f)
        .line("Introduction ........ 3", 16.0f, true, 12.0f)
        .line("Results ........ 7", 16.0f, true, 12.0f)
        .body(6)
        .line("12", 16.0f, true, 30.0f)
        .build();

    auto result = classify(content);
    ASSERT_EQ(result.headings.size(), 1u);
    EXPECT_EQ(result.headings[0].line.text, "Contents");
}

TEST_F(HeadingClassifierTest, RejectsBodyLikeLines) {
    std::vector<Line> doc = {
        make_line("Body text that fills the page with ordinary sentences.", 1, 11.0f, false, 100.0f),
        make_line("Body text that fills the page with ordinary sentences.", 1, 11.0f, false, 114.0f),
        make_line("Big", 1, 18.0f, true, 150.0f),
    };
    auto doc_profile = FontProfile::build(doc);

    // Larger font but a full sentence ending in a period
    Line sentence = make_line("This larger line reads like a sentence that simply continues.",
                              1, 18.0f, false, 200.0f);
    EXPECT_FALSE(classifier.classify(sentence, doc_profile, &doc[1], nullptr).has_value());

    Line heading = make_line("Findings", 1, 18.0f, true, 200.0f);
    auto candidate = classifier.classify(heading, doc_profile, &doc[1], nullptr);
    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(candidate->level, HeadingLevel::H1);
    EXPECT_GE(candidate->score, classifier.config().accept_score);
}

TEST_F(HeadingClassifierTest, RejectsTooShortOrTooLongLines) {
    std::vector<Line> doc = {
        make_line("Body text that fills the page with ordinary sentences.", 1, 11.0f, false, 100.0f),
        make_line("Heading", 1, 18.0f, true, 150.0f),
    };
    auto doc_profile = FontProfile::build(doc);

    EXPECT_FALSE(classifier.classify(make_line("A", 1, 18.0f, true, 200.0f),
                                     doc_profile, nullptr, nullptr).has_value());
    EXPECT_FALSE(classifier.classify(make_line(std::string(201, 'x'), 1, 18.0f, true, 200.0f),
                                     doc_profile, nullptr, nullptr).has_value());
}

TEST_F(HeadingClassifierTest, BoldOnlyDocumentUsesIndentForLevels) {
    auto content = DocumentBuilder()
        .page()
        .line("Scope", 11.0f, true, 0.0f, 72.0f).body(4)
        .line("Definitions", 11.0f, true, 12.0f, 72.0f).body(4)
        .line("Terms used here", 11.0f, true, 12.0f, 96.0f).body(4)
        .build();

    auto result = classify(content);
    ASSERT_TRUE(profile.degenerate());

    // The first bold heading on page one is at the largest size
    EXPECT_EQ(result.title, "Scope");

    ASSERT_EQ(result.headings.size(), 2u);
    EXPECT_EQ(result.headings[0].line.text, "Definitions");
    EXPECT_EQ(result.headings[0].level, HeadingLevel::H1);
    EXPECT_EQ(result.headings[1].line.text, "Terms used here");
    EXPECT_EQ(result.headings[1].level, HeadingLevel::H2);
}

TEST_F(HeadingClassifierTest, SizeJitterKeepsSingleSizeFallback) {
    auto content = DocumentBuilder()
        .page()
        .line("Scope", 11.0f, true, 0.0f, 72.0f).body(4)
        .line("Definitions", 11.0f, true, 12.0f, 72.0f).body(4)
        .line("A body line set in a slightly different cut of the font.", 11.1f)
        .build();

    auto result = classify(content);
    EXPECT_TRUE(profile.degenerate());
    EXPECT_EQ(result.title, "Scope");
    ASSERT_EQ(result.headings.size(), 1u);
    EXPECT_EQ(result.headings[0].line.text, "Definitions");
}

TEST_F(HeadingClassifierTest, InlineBoldLeadInIsNotAHeading) {
    auto content = DocumentBuilder().page().body(3).build();
    auto& fragments = content.pages[0].fragments;
    fragments.push_back(test::make_fragment("Note:", 1, 11.0f, true, 72.0f, 140.0f, 30.0f));
    fragments.push_back(test::make_fragment("read the terms before signing.", 1, 11.0f, false,
                                            104.0f, 140.0f));

    auto result = classify(content);
    EXPECT_TRUE(result.title.empty());
    EXPECT_TRUE(result.headings.empty());
}

} // namespace
