#pragma once

#include <string>
#include <vector>

namespace pdf_outliner {

// Page space, y grows downward (MuPDF convention)
struct BoundingBox {
    float x0 = 0.0f;
    float y0 = 0.0f;
    float x1 = 0.0f;
    float y1 = 0.0f;

    float width() const { return x1 - x0; }
    float height() const { return y1 - y0; }
};

struct TextFragment {
    std::string text;
    int page = 1;
    float font_size = 0.0f;
    bool is_bold = false;
    std::string font_name;
    BoundingBox bbox;
};

struct PageFragments {
    int page = 1;
    std::vector<TextFragment> fragments;
};

// One bookmark of the document's embedded outline, flattened depth-first
struct NativeOutlineEntry {
    int level = 1;
    std::string title;
    int page = 1;
};

// Everything the PDF backend hands to the heuristic pipeline for one document
struct DocumentContent {
    int page_count = 0;
    std::vector<PageFragments> pages;
    std::vector<NativeOutlineEntry> native_outline;
    std::string metadata_title;
};

// A visually distinct text row on one page
struct Line {
    std::string text;
    int page = 1;
    float font_size = 0.0f;
    bool is_bold = false;
    float y0 = 0.0f;       // top
    float y1 = 0.0f;       // bottom (baseline band)
    float x0 = 0.0f;       // indent
    float x1 = 0.0f;
    size_t fragment_count = 0;
};

enum class HeadingLevel {
    Title,
    H1,
    H2,
    H3
};

// 0 for Title, 1..3 for H1..H3
int depth_of(HeadingLevel level);
HeadingLevel level_from_depth(int depth);
std::string to_string(HeadingLevel level);

struct HeadingCandidate {
    Line line;
    HeadingLevel level = HeadingLevel::H1;
    float score = 0.0f;
};

struct OutlineNode {
    HeadingLevel level = HeadingLevel::H1;
    std::string text;
    int page = 1;
    std::vector<OutlineNode> children;
};

// Flat interchange form of an outline node
struct OutlineEntry {
    HeadingLevel level = HeadingLevel::H1;
    std::string text;
    int page = 1;

    bool operator==(const OutlineEntry& other) const {
        return level == other.level && text == other.text && page == other.page;
    }
};

struct Outline {
    std::string title;
    std::vector<OutlineNode> nodes;

    // Depth-first, document order
    std::vector<OutlineEntry> flatten() const;
    size_t size() const;
    bool empty() const { return nodes.empty(); }
};

} // namespace pdf_outliner
