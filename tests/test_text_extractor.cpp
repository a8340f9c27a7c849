#include <gtest/gtest.h>
#include <pdf_outliner/outline_extractor.h>
#include <pdf_outliner/text_extractor.h>
#include <pdf_outliner/text_utils.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace pdf_outliner;

std::string content_stream(const std::string& operators) {
    return "<< /Length " + std::to_string(operators.size()) + " >>\nstream\n" +
           operators + "\nendstream";
}

// Two pages set in the base-14 Helvetica fonts, a three-entry bookmark tree
// and an Info title.
std::string sample_report_pdf() {
    const std::vector<std::string> objects = {
        "<< /Type /Catalog /Pages 2 0 R /Outlines 8 0 R >>",
        "<< /Type /Pages /Kids [3 0 R 4 0 R] /Count 2 >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
        "/Resources << /Font << /F1 5 0 R /F2 6 0 R >> >> /Contents 7 0 R >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
        "/Resources << /Font << /F1 5 0 R /F2 6 0 R >> >> /Contents 12 0 R >>",
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold >>",
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>",
        content_stream("BT /F1 24 Tf 72 700 Td (Company Report) Tj ET\n"
                       "BT /F2 11 Tf 72 640 Td (Body text on the first page.) Tj ET"),
        "<< /Type /Outlines /First 9 0 R /Last 11 0 R /Count 3 >>",
        "<< /Title (Financials) /Parent 8 0 R /Next 11 0 R /First 10 0 R /Last 10 0 R "
        "/Count 1 /Dest [4 0 R /XYZ 0 792 0] >>",
        "<< /Title (Q1 Results) /Parent 9 0 R /Dest [4 0 R /XYZ 0 650 0] >>",
        "<< /Title (Outlook 2) /Parent 8 0 R /Prev 9 0 R /Dest [4 0 R /XYZ 0 500 0] >>",
        content_stream("BT /F1 18 Tf 72 700 Td (Financials) Tj ET\n"
                       "BT /F1 14 Tf 72 660 Td (Q1 Results) Tj ET\n"
                       "BT /F2 11 Tf 72 630 Td (Revenue grew in every region.) Tj ET"),
        "<< /Title (Sample Report) >>",
    };

    std::ostringstream pdf;
    pdf << "%PDF-1.4\n";

    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(static_cast<size_t>(pdf.tellp()));
        pdf << i + 1 << " 0 obj\n" << objects[i] << "\nendobj\n";
    }

    size_t xref = static_cast<size_t>(pdf.tellp());
    pdf << "xref\n0 " << objects.size() + 1 << "\n";
    pdf << "0000000000 65535 f \n";
    for (size_t offset : offsets) {
        char entry[21];
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
        pdf << entry;
    }
    pdf << "trailer\n<< /Size " << objects.size() + 1 << " /Root 1 0 R /Info 13 0 R >>\n"
        << "startxref\n" << xref << "\n%%EOF\n";
    return pdf.str();
}

const TextFragment* find_fragment(const PageFragments& page, const std::string& text) {
    for (const auto& fragment : page.fragments) {
        if (normalize_whitespace(fragment.text) == text) {
            return &fragment;
        }
    }
    return nullptr;
}

class TextExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "pdf_outliner_extractor_test";
        std::filesystem::create_directories(dir);
        sample_pdf = (dir / "sample.pdf").string();

        std::ofstream out(sample_pdf, std::ios::binary);
        out << sample_report_pdf();
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    std::filesystem::path dir;
    std::string sample_pdf;
};

TEST_F(TextExtractorTest, Construction) {
    EXPECT_NO_THROW(TextExtractor extractor);
}

TEST_F(TextExtractorTest, MissingFileThrows) {
    TextExtractor extractor;
    EXPECT_THROW(extractor.get_page_count("nonexistent.pdf"), std::runtime_error);
    EXPECT_THROW(extractor.load("nonexistent.pdf"), std::runtime_error);
    EXPECT_THROW(extractor.extract_page("nonexistent.pdf", 1), std::runtime_error);
}

TEST_F(TextExtractorTest, LoadsDocument) {
    TextExtractor extractor;
    EXPECT_EQ(extractor.get_page_count(sample_pdf), 2);

    auto content = extractor.load(sample_pdf);
    EXPECT_EQ(content.page_count, 2);
    EXPECT_EQ(content.metadata_title, "Sample Report");
    ASSERT_EQ(content.pages.size(), 2u);
    EXPECT_EQ(content.pages[0].page, 1);
    EXPECT_EQ(content.pages[1].page, 2);

    ASSERT_EQ(content.native_outline.size(), 3u);
    EXPECT_EQ(content.native_outline[0].level, 1);
    EXPECT_EQ(content.native_outline[0].title, "Financials");
    EXPECT_EQ(content.native_outline[0].page, 2);
    EXPECT_EQ(content.native_outline[1].level, 2);
    EXPECT_EQ(content.native_outline[1].title, "Q1 Results");
    EXPECT_EQ(content.native_outline[1].page, 2);
    EXPECT_EQ(content.native_outline[2].level, 1);
    EXPECT_EQ(content.native_outline[2].title, "Outlook 2");
    EXPECT_EQ(content.native_outline[2].page, 2);
}

TEST_F(TextExtractorTest, FragmentsCarryFontAndPosition) {
    TextExtractor extractor;
    auto page = extractor.extract_page(sample_pdf, 1);
    EXPECT_EQ(page.page, 1);

    const TextFragment* title = find_fragment(page, "Company Report");
    const TextFragment* body = find_fragment(page, "Body text on the first page.");
    ASSERT_NE(title, nullptr);
    ASSERT_NE(body, nullptr);

    EXPECT_NEAR(title->font_size, 24.0f, 0.5f);
    EXPECT_TRUE(title->is_bold);
    EXPECT_EQ(title->page, 1);
    EXPECT_NEAR(body->font_size, 11.0f, 0.5f);
    EXPECT_FALSE(body->is_bold);

    // Top-down coordinates, left edge at the text origin
    EXPECT_LT(title->bbox.y0, body->bbox.y0);
    EXPECT_LT(title->bbox.y1, 792.0f - 640.0f);
    EXPECT_NEAR(title->bbox.x0, 72.0f, 1.0f);
    EXPECT_GT(title->bbox.x1, title->bbox.x0);
}

TEST_F(TextExtractorTest, PageOutOfRangeThrows) {
    TextExtractor extractor;
    EXPECT_THROW(extractor.extract_page(sample_pdf, 0), std::out_of_range);
    EXPECT_THROW(extractor.extract_page(sample_pdf, 3), std::out_of_range);
    EXPECT_NO_THROW(extractor.extract_page(sample_pdf, 2));
}

TEST_F(TextExtractorTest, OutlineFromBookmarks) {
    ExtractOptions options;
    options.quiet = true;
    OutlineExtractor outliner(options);

    auto result = outliner.process(sample_pdf);
    ASSERT_TRUE(result.success()) << result.error;
    EXPECT_EQ(result.source, OutlineSource::Native);
    EXPECT_EQ(result.outline.title, "Sample Report");

    std::vector<OutlineEntry> expected = {
        {HeadingLevel::H1, "Financials", 2},
        {HeadingLevel::H2, "Q1 Results", 2},
        {HeadingLevel::H1, "Outlook", 2},
    };
    EXPECT_EQ(result.outline.flatten(), expected);
}

TEST_F(TextExtractorTest, OutlineFromFontsWhenBookmarksAreIgnored) {
    ExtractOptions options;
    options.quiet = true;
    options.prefer_native_outline = false;
    OutlineExtractor outliner(options);

    auto result = outliner.process(sample_pdf);
    ASSERT_TRUE(result.success()) << result.error;
    EXPECT_EQ(result.source, OutlineSource::Heuristic);
    EXPECT_EQ(result.outline.title, "Company Report");

    std::vector<OutlineEntry> expected = {
        {HeadingLevel::H1, "Financials", 2},
        {HeadingLevel::H2, "Q1 Results", 2},
    };
    EXPECT_EQ(result.outline.flatten(), expected);
}

} // namespace
