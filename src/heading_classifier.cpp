#include "pdf_outliner/heading_classifier.h"
#include "pdf_outliner/text_utils.h"
#include <algorithm>
#include <cmath>

namespace pdf_outliner {

namespace {

// Two lines on the same row, e.g. a bold lead-in followed by regular text
bool shares_row(const Line& a, const Line& b) {
    if (a.page != b.page) return false;
    float overlap = std::min(a.y1, b.y1) - std::max(a.y0, b.y0);
    float shorter = std::min(a.y1 - a.y0, b.y1 - b.y0);
    return shorter > 0.0f && overlap > 0.5f * shorter;
}

bool same_size(float a, float b, float epsilon) {
    return std::fabs(a - b) <= epsilon;
}

} // namespace

HeadingClassifier::HeadingClassifier(const HeuristicConfig& config) : config_(config) {}

std::optional<HeadingCandidate> HeadingClassifier::classify(const Line& line,
                                                            const FontProfile& profile,
                                                            const Line* prev,
                                                            const Line* next) const {
    const std::string& text = line.text;

    if (profile.empty()) return std::nullopt;
    if (visible_char_count(text) < config_.min_heading_chars ||
        text.size() > config_.max_heading_chars) {
        return std::nullopt;
    }
    if (!has_letter(text) || is_toc_entry(text) || is_page_number(text)) {
        return std::nullopt;
    }

    const float body = profile.body_size();
    const bool degenerate = profile.degenerate();
    const int depth = numbering_depth(text);
    const int tier = degenerate ? 0 : profile.tier_of(line.font_size);
    const bool bold_larger = line.is_bold && line.font_size >= body * config_.bold_larger_ratio;

    float score = 0.0f;
    if (tier > 0) {
        score += config_.tier_weight;
    } else if (bold_larger) {
        score += config_.bold_larger_weight;
    } else if (degenerate && line.is_bold) {
        // Only boldness sets headings apart from the body
        score += config_.bold_larger_weight;
    } else if (!(depth > 0 && (line.is_bold || profile.numbered_body()))) {
        // Numbering is a font signal only when bold, or when numbered lines are the body text
        return std::nullopt;
    }

    if (line.is_bold) {
        score += config_.bold_weight;
    }

    bool inline_with_neighbour = (prev && shares_row(line, *prev)) || (next && shares_row(line, *next));
    if (degenerate && inline_with_neighbour) {
        return std::nullopt;
    }
    if (!inline_with_neighbour && is_isolated(line, prev, next, body)) {
        score += config_.isolation_weight;
    }

    size_t words = word_count(text);
    if (words <= config_.short_line_words) {
        score += config_.brevity_weight;
    } else if (words > config_.long_line_words) {
        score -= config_.long_line_penalty;
    }
    if (ends_with_terminal_punctuation(text)) {
        score -= config_.terminal_punctuation_penalty;
    }
    if (depth > 0) {
        score += config_.numbering_weight;
    }

    if (score < config_.accept_score) {
        return std::nullopt;
    }

    HeadingCandidate candidate;
    candidate.line = line;
    candidate.score = score;
    if (depth > 0) {
        candidate.level = level_from_depth(std::min(depth, 3));
    } else if (tier > 0) {
        candidate.level = level_from_depth(tier);
    } else if (degenerate) {
        candidate.level = level_from_indent(line, profile);
    } else {
        candidate.level = HeadingLevel::H3;
    }
    return candidate;
}

DocumentClassification HeadingClassifier::classify_document(const std::vector<Line>& lines,
                                                            const FontProfile& profile) const {
    DocumentClassification result;
    auto candidates = classify_all(lines, profile);

    auto first = std::find_if(candidates.begin(), candidates.end(),
                              [](const auto& c) { return c.has_value(); });

    size_t title_begin = lines.size();
    size_t title_end = lines.size();

    if (first != candidates.end()) {
        size_t index = static_cast<size_t>(first - candidates.begin());
        const Line& line = lines[index];

        if (line.page == 1 && numbering_depth(line.text) == 0 &&
            same_size(line.font_size, profile.max_size(), config_.size_epsilon)) {
            title_begin = index;
            title_end = index + 1;
            result.title = line.text;
            result.title_size = line.font_size;

            // Titles set over several lines
            while (title_end < lines.size()) {
                const Line& prev = lines[title_end - 1];
                const Line& cont = lines[title_end];
                if (cont.page != line.page || cont.is_bold != line.is_bold ||
                    !same_size(cont.font_size, line.font_size, config_.size_epsilon) ||
                    cont.y0 - prev.y1 > config_.title_join_gap_ratio * line.font_size) {
                    break;
                }
                result.title += ' ';
                result.title += cont.text;
                ++title_end;
            }
        }
    }

    auto in_title = [&](size_t i) { return i >= title_begin && i < title_end; };

    if (!result.title.empty() && !profile.degenerate()) {
        bool size_shared = false;
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (!in_title(i) && candidates[i] &&
                same_size(candidates[i]->line.font_size, result.title_size, config_.size_epsilon)) {
                size_shared = true;
                break;
            }
        }
        if (!size_shared) {
            candidates = classify_all(lines, profile.excluding(result.title_size));
        }
    }

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!in_title(i) && candidates[i]) {
            result.headings.push_back(std::move(*candidates[i]));
        }
    }

    return result;
}

std::vector<std::optional<HeadingCandidate>> HeadingClassifier::classify_all(
        const std::vector<Line>& lines, const FontProfile& profile) const {
    std::vector<std::optional<HeadingCandidate>> candidates;
    candidates.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        const Line* prev = i > 0 ? &lines[i - 1] : nullptr;
        const Line* next = i + 1 < lines.size() ? &lines[i + 1] : nullptr;
        candidates.push_back(classify(lines[i], profile, prev, next));
    }

    return candidates;
}

bool HeadingClassifier::is_isolated(const Line& line, const Line* prev, const Line* next,
                                    float body_size) const {
    // First line of a page
    if (!prev || prev->page != line.page) {
        return true;
    }

    const float min_gap = config_.isolation_gap_ratio * body_size;
    if (line.y0 - prev->y1 >= min_gap) {
        return true;
    }
    return next && next->page == line.page && next->y0 - line.y1 >= min_gap;
}

HeadingLevel HeadingClassifier::level_from_indent(const Line& line, const FontProfile& profile) const {
    float indent = std::max(0.0f, line.x0 - profile.left_margin());
    int steps = config_.indent_step_pt > 0.0f ? static_cast<int>(indent / config_.indent_step_pt) : 0;
    return level_from_depth(std::min(steps + 1, 3));
}

} // namespace pdf_outliner
