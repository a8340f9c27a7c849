#pragma once

#include "pdf_outliner/font_profile.h"
#include "pdf_outliner/heuristic_config.h"
#include "pdf_outliner/types.h"
#include <optional>
#include <string>
#include <vector>

namespace pdf_outliner {

struct DocumentClassification {
    std::string title;
    float title_size = 0.0f;
    std::vector<HeadingCandidate> headings;  // document order, title excluded
};

class HeadingClassifier {
public:
    explicit HeadingClassifier(const HeuristicConfig& config = HeuristicConfig{});

    // Decides whether a single line is a heading. `prev` and `next` are the
    // neighbouring lines in document order and may be null.
    std::optional<HeadingCandidate> classify(const Line& line,
                                             const FontProfile& profile,
                                             const Line* prev,
                                             const Line* next) const;

    // Classifies every line, picks the title on page 1 and re-ranks the font
    // tiers when the title size is used by nothing else.
    DocumentClassification classify_document(const std::vector<Line>& lines,
                                             const FontProfile& profile) const;

    const HeuristicConfig& config() const { return config_; }

private:
    std::vector<std::optional<HeadingCandidate>> classify_all(const std::vector<Line>& lines,
                                                              const FontProfile& profile) const;
    bool is_isolated(const Line& line, const Line* prev, const Line* next, float body_size) const;
    HeadingLevel level_from_indent(const Line& line, const FontProfile& profile) const;

    HeuristicConfig config_;
};

} // namespace pdf_outliner
