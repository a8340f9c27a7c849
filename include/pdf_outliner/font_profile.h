#pragma once

#include "pdf_outliner/heuristic_config.h"
#include "pdf_outliner/types.h"
#include <map>
#include <vector>

namespace pdf_outliner {

// Document-wide font statistics. Built once from all lines of a document and
// read-only afterwards.
class FontProfile {
public:
    FontProfile() = default;

    // Weights each line's font size by its visible character count. Sizes
    // within size_epsilon of each other count as one size, keyed by their
    // heaviest member; the heaviest size is the body size.
    static FontProfile build(const std::vector<Line>& lines,
                             const HeuristicConfig& config = HeuristicConfig{});

    // Same statistics with `size` removed from the heading tier ranking.
    FontProfile excluding(float size) const;

    bool empty() const { return weights_.empty(); }
    // Fewer than two distinct sizes: only boldness and position can tell
    // headings apart.
    bool degenerate() const { return weights_.size() < 2; }

    float body_size() const { return body_size_; }
    // At least half of the body-size text is numbered lines, as in a
    // document that is little more than a list of numbered sections.
    bool numbered_body() const { return numbered_body_; }
    float max_size() const;
    float left_margin() const { return left_margin_; }

    // Sizes larger than the body size, largest first
    const std::vector<float>& larger_sizes() const { return larger_sizes_; }

    // 1-based heading tier of `size` (1 = H1), 0 when the size is not one of
    // the top tiers.
    int tier_of(float size) const;
    size_t tier_count() const;

    size_t weight_of(float size) const;
    const std::map<float, size_t>& weights() const { return weights_; }

private:
    std::map<float, size_t> weights_;
    std::vector<float> larger_sizes_;
    float body_size_ = 0.0f;
    float left_margin_ = 0.0f;
    bool numbered_body_ = false;
    float size_epsilon_ = 0.25f;
    size_t max_tiers_ = 3;
};

} // namespace pdf_outliner
