#pragma once

#include "pdf_outliner/json_serializer.h"
#include "pdf_outliner/outline_extractor.h"
#include <string>
#include <vector>

namespace pdf_outliner {

struct BatchSummary {
    std::vector<DocumentResult> results;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t rejected = 0;

    bool any_failed() const { return failed > 0; }
};

// PDF files directly inside a directory, sorted by name, or the path itself
// when it names a PDF. Other files are skipped. Throws std::runtime_error when
// the path does not exist.
std::vector<std::string> collect_pdf_files(const std::string& input_path);

// <output_dir>/<pdf stem>.json
std::string output_path_for(const std::string& pdf_path, const std::string& output_dir);

// Runs the batch and writes one JSON file per successful document. Failed and
// rejected documents get no file.
BatchSummary process_files(OutlineExtractor& extractor,
                           const std::vector<std::string>& pdf_files,
                           const std::string& output_dir,
                           const SerializeOptions& serialize_options = SerializeOptions{},
                           ProgressCallback progress = nullptr);

} // namespace pdf_outliner
