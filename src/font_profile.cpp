#include "pdf_outliner/font_profile.h"
#include "pdf_outliner/text_utils.h"
#include <algorithm>
#include <cmath>
#include <functional>

namespace pdf_outliner {

namespace {

struct SizeTally {
    size_t weight = 0;
    size_t numbered = 0;
};

} // namespace

FontProfile FontProfile::build(const std::vector<Line>& lines, const HeuristicConfig& config) {
    FontProfile profile;
    profile.size_epsilon_ = config.size_epsilon;
    profile.max_tiers_ = config.max_tiers;

    std::map<float, SizeTally> raw;
    bool have_margin = false;
    for (const auto& line : lines) {
        size_t chars = visible_char_count(line.text);
        if (chars == 0) {
            continue;
        }
        SizeTally& tally = raw[line.font_size];
        tally.weight += chars;
        if (numbering_depth(line.text) > 0) {
            tally.numbered += chars;
        }

        if (!have_margin || line.x0 < profile.left_margin_) {
            profile.left_margin_ = line.x0;
            have_margin = true;
        }
    }

    if (raw.empty()) {
        return profile;
    }

    // Jitter (11.0 vs 11.1) must not split one size in two
    std::map<float, size_t> numbered;
    for (auto it = raw.begin(); it != raw.end();) {
        const float first = it->first;
        float key = first;
        size_t key_weight = 0;
        SizeTally total;
        for (; it != raw.end() && it->first - first <= profile.size_epsilon_; ++it) {
            if (it->second.weight > key_weight) {
                key_weight = it->second.weight;
                key = it->first;
            }
            total.weight += it->second.weight;
            total.numbered += it->second.numbered;
        }
        profile.weights_[key] = total.weight;
        numbered[key] = total.numbered;
    }

    // Ascending map iteration with a strict comparison keeps the smaller
    // size on ties
    size_t best_weight = 0;
    for (const auto& [size, weight] : profile.weights_) {
        if (weight > best_weight) {
            best_weight = weight;
            profile.body_size_ = size;
        }
    }
    profile.numbered_body_ = numbered[profile.body_size_] * 2 >= best_weight;

    for (const auto& entry : profile.weights_) {
        if (entry.first > profile.body_size_ + profile.size_epsilon_) {
            profile.larger_sizes_.push_back(entry.first);
        }
    }
    std::sort(profile.larger_sizes_.begin(), profile.larger_sizes_.end(), std::greater<float>());

    return profile;
}

FontProfile FontProfile::excluding(float size) const {
    FontProfile profile = *this;
    profile.larger_sizes_.erase(
        std::remove_if(profile.larger_sizes_.begin(), profile.larger_sizes_.end(),
                       [&](float s) { return std::fabs(s - size) <= size_epsilon_; }),
        profile.larger_sizes_.end());
    return profile;
}

float FontProfile::max_size() const {
    return weights_.empty() ? 0.0f : weights_.rbegin()->first;
}

int FontProfile::tier_of(float size) const {
    size_t tiers = tier_count();
    for (size_t i = 0; i < tiers; ++i) {
        if (std::fabs(larger_sizes_[i] - size) <= size_epsilon_) {
            return static_cast<int>(i) + 1;
        }
    }
    return 0;
}

size_t FontProfile::tier_count() const {
    return std::min(larger_sizes_.size(), max_tiers_);
}

size_t FontProfile::weight_of(float size) const {
    size_t total = 0;
    for (const auto& [s, weight] : weights_) {
        if (std::fabs(s - size) <= size_epsilon_) {
            total += weight;
        }
    }
    return total;
}

} // namespace pdf_outliner
