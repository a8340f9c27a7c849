#pragma once

#include "pdf_outliner/heuristic_config.h"
#include "pdf_outliner/types.h"
#include <vector>

namespace pdf_outliner {

// Groups the backend's text fragments into visual lines. Fragments are merged
// when they follow each other in reading order on the same page, sit on the
// same baseline band and share font size and boldness.
class FragmentNormalizer {
public:
    explicit FragmentNormalizer(const HeuristicConfig& config = HeuristicConfig{});

    std::vector<Line> normalize(const std::vector<PageFragments>& pages) const;
    std::vector<Line> normalize_page(const PageFragments& page) const;

    static float round_size(float font_size);

private:
    bool continues_line(const Line& line, const TextFragment& fragment, float font_size) const;

    HeuristicConfig config_;
};

} // namespace pdf_outliner
