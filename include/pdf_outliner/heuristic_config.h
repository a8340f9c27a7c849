#pragma once

#include <cstddef>

namespace pdf_outliner {

// Tunable thresholds of the heading heuristics. Sizes are in points.
struct HeuristicConfig {
    // Fragment normalizer
    float baseline_tolerance_pt = 2.0f;
    float baseline_tolerance_ratio = 0.25f;  // of the font size
    float size_epsilon = 0.25f;

    // Font profile
    size_t max_tiers = 3;

    // Heading classifier
    float bold_larger_ratio = 1.15f;
    float isolation_gap_ratio = 0.5f;       // of body size
    size_t min_heading_chars = 2;
    size_t max_heading_chars = 200;
    size_t short_line_words = 12;
    size_t long_line_words = 25;
    float indent_step_pt = 18.0f;

    float tier_weight = 1.5f;
    float bold_larger_weight = 1.5f;
    float bold_weight = 0.5f;
    float isolation_weight = 1.0f;
    float brevity_weight = 0.5f;
    float numbering_weight = 1.0f;
    float long_line_penalty = 1.5f;
    float terminal_punctuation_penalty = 2.0f;
    float accept_score = 2.5f;

    // Title detection
    float title_join_gap_ratio = 0.8f;      // of title size
};

} // namespace pdf_outliner
