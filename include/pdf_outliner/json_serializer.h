#pragma once

#include "pdf_outliner/types.h"
#include <string>

namespace pdf_outliner {

enum class OutputMode {
    Flat,    // "outline" is the depth-first list of headings
    Nested   // "outline" holds root nodes with "children"
};

struct SerializeOptions {
    OutputMode mode = OutputMode::Flat;
    bool pretty = true;
};

class JsonSerializer {
public:
    // {"title": ..., "outline": [{"level", "text", "page"}, ...]} written
    // with RapidJSON. Members keep this order and the output is byte-stable.
    static std::string serialize(const Outline& outline,
                                 const SerializeOptions& options = SerializeOptions{});

    // Writes serialize() output; throws std::runtime_error when the file
    // cannot be written.
    static void write_file(const Outline& outline, const std::string& path,
                           const SerializeOptions& options = SerializeOptions{});
};

} // namespace pdf_outliner
