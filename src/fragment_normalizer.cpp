#include "pdf_outliner/fragment_normalizer.h"
#include "pdf_outliner/text_utils.h"
#include <algorithm>
#include <cmath>

namespace pdf_outliner {

FragmentNormalizer::FragmentNormalizer(const HeuristicConfig& config) : config_(config) {}

float FragmentNormalizer::round_size(float font_size) {
    return std::round(font_size * 10.0f) / 10.0f;
}

std::vector<Line> FragmentNormalizer::normalize(const std::vector<PageFragments>& pages) const {
    std::vector<Line> lines;

    for (const auto& page : pages) {
        auto page_lines = normalize_page(page);
        lines.insert(lines.end(),
                     std::make_move_iterator(page_lines.begin()),
                     std::make_move_iterator(page_lines.end()));
    }

    return lines;
}

std::vector<Line> FragmentNormalizer::normalize_page(const PageFragments& page) const {
    std::vector<Line> lines;

    for (const auto& fragment : page.fragments) {
        std::string text = normalize_whitespace(fragment.text);
        if (text.empty()) {
            continue;
        }

        float size = round_size(fragment.font_size);

        if (!lines.empty() && continues_line(lines.back(), fragment, size)) {
            Line& line = lines.back();
            line.text += ' ';
            line.text += text;
            line.y0 = std::min(line.y0, fragment.bbox.y0);
            line.y1 = std::max(line.y1, fragment.bbox.y1);
            line.x0 = std::min(line.x0, fragment.bbox.x0);
            line.x1 = std::max(line.x1, fragment.bbox.x1);
            line.fragment_count++;
            continue;
        }

        Line line;
        line.text = std::move(text);
        line.page = page.page;
        line.font_size = size;
        line.is_bold = fragment.is_bold;
        line.y0 = fragment.bbox.y0;
        line.y1 = fragment.bbox.y1;
        line.x0 = fragment.bbox.x0;
        line.x1 = fragment.bbox.x1;
        line.fragment_count = 1;
        lines.push_back(std::move(line));
    }

    return lines;
}

bool FragmentNormalizer::continues_line(const Line& line, const TextFragment& fragment,
                                        float font_size) const {
    if (std::fabs(line.font_size - font_size) > config_.size_epsilon) {
        return false;
    }
    if (line.is_bold != fragment.is_bold) {
        return false;
    }

    float tolerance = std::max(config_.baseline_tolerance_pt,
                               config_.baseline_tolerance_ratio * font_size);
    return std::fabs(line.y1 - fragment.bbox.y1) <= tolerance;
}

} // namespace pdf_outliner
