#include "pdf_outliner/outline_assembler.h"
#include "pdf_outliner/text_utils.h"
#include <algorithm>
#include <array>

namespace pdf_outliner {

namespace {

// Ancestor chain of the most recently inserted heading, at most H1 > H2 > H3
class LevelStack {
public:
    explicit LevelStack(std::vector<OutlineNode>& roots) : roots_(roots) {}

    // Levels must already be normalized: at most one deeper than the last push
    void push(OutlineNode node) {
        size_t depth = static_cast<size_t>(depth_of(node.level));
        size_ = std::min(size_, depth - 1);

        std::vector<OutlineNode>& siblings = size_ == 0 ? roots_ : stack_[size_ - 1]->children;
        siblings.push_back(std::move(node));
        stack_[size_++] = &siblings.back();
    }

private:
    std::vector<OutlineNode>& roots_;
    std::array<OutlineNode*, 3> stack_{};
    size_t size_ = 0;
};

Outline build_outline(std::vector<OutlineNode> nodes, const std::vector<HeadingLevel>& levels,
                      const std::string& title) {
    Outline outline;
    outline.title = title;
    LevelStack stack(outline.nodes);
    for (size_t i = 0; i < nodes.size(); ++i) {
        nodes[i].level = levels[i];
        stack.push(std::move(nodes[i]));
    }
    return outline;
}

} // namespace

std::vector<HeadingLevel> OutlineAssembler::normalize_levels(const std::vector<HeadingLevel>& levels) {
    std::vector<HeadingLevel> normalized;
    normalized.reserve(levels.size());

    int previous = 0;
    for (HeadingLevel level : levels) {
        int depth = std::max(1, std::min(depth_of(level), previous + 1));
        normalized.push_back(level_from_depth(depth));
        previous = depth;
    }

    return normalized;
}

Outline OutlineAssembler::assemble(std::vector<HeadingCandidate> candidates,
                                   const std::string& title) const {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const HeadingCandidate& a, const HeadingCandidate& b) {
                         if (a.line.page != b.line.page) return a.line.page < b.line.page;
                         return a.line.y0 < b.line.y0;
                     });

    std::vector<HeadingLevel> levels;
    std::vector<OutlineNode> nodes;
    for (const auto& candidate : candidates) {
        if (candidate.level == HeadingLevel::Title) continue;

        std::string text = clean_heading_text(candidate.line.text);
        if (text.empty()) continue;

        OutlineNode node;
        node.text = std::move(text);
        node.page = candidate.line.page;
        nodes.push_back(std::move(node));
        levels.push_back(candidate.level);
    }

    return build_outline(std::move(nodes), normalize_levels(levels), title);
}

Outline OutlineAssembler::assemble_native(const std::vector<NativeOutlineEntry>& entries,
                                          const std::string& title) const {
    // Bookmarks arrive in tree order already, so no sorting here
    std::vector<HeadingLevel> levels;
    std::vector<OutlineNode> nodes;
    for (const auto& entry : entries) {
        if (entry.level < 1 || entry.level > 3) continue;

        std::string text = clean_heading_text(entry.title);
        if (text.empty()) continue;

        OutlineNode node;
        node.text = std::move(text);
        node.page = std::max(1, entry.page);
        nodes.push_back(std::move(node));
        levels.push_back(level_from_depth(entry.level));
    }

    return build_outline(std::move(nodes), normalize_levels(levels), title);
}

} // namespace pdf_outliner
