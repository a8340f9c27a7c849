#pragma once

#include "pdf_outliner/types.h"
#include <string>
#include <vector>

namespace pdf_outliner {

// Turns classified headings into an outline tree. Levels are demoted so the
// depth never rises by more than one from one heading to the next, then each
// heading is attached to the latest heading of a lower level.
class OutlineAssembler {
public:
    Outline assemble(std::vector<HeadingCandidate> candidates, const std::string& title) const;

    // Embedded bookmarks; entries deeper than H3 are dropped
    Outline assemble_native(const std::vector<NativeOutlineEntry>& entries,
                            const std::string& title) const;

    // Depth-capped copy of `levels` with no upward jump larger than one
    static std::vector<HeadingLevel> normalize_levels(const std::vector<HeadingLevel>& levels);
};

} // namespace pdf_outliner
