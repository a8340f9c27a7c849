#include "pdf_outliner/types.h"

namespace pdf_outliner {

int depth_of(HeadingLevel level) {
    switch (level) {
        case HeadingLevel::Title: return 0;
        case HeadingLevel::H1: return 1;
        case HeadingLevel::H2: return 2;
        case HeadingLevel::H3: return 3;
    }
    return 0;
}

HeadingLevel level_from_depth(int depth) {
    if (depth <= 1) return HeadingLevel::H1;
    if (depth == 2) return HeadingLevel::H2;
    return HeadingLevel::H3;
}

std::string to_string(HeadingLevel level) {
    switch (level) {
        case HeadingLevel::Title: return "TITLE";
        case HeadingLevel::H1: return "H1";
        case HeadingLevel::H2: return "H2";
        case HeadingLevel::H3: return "H3";
    }
    return "";
}

namespace {

void flatten_into(const std::vector<OutlineNode>& nodes, std::vector<OutlineEntry>& out) {
    for (const auto& node : nodes) {
        out.push_back({node.level, node.text, node.page});
        flatten_into(node.children, out);
    }
}

size_t count_nodes(const std::vector<OutlineNode>& nodes) {
    size_t count = nodes.size();
    for (const auto& node : nodes) {
        count += count_nodes(node.children);
    }
    return count;
}

} // namespace

std::vector<OutlineEntry> Outline::flatten() const {
    std::vector<OutlineEntry> entries;
    flatten_into(nodes, entries);
    return entries;
}

size_t Outline::size() const {
    return count_nodes(nodes);
}

} // namespace pdf_outliner
