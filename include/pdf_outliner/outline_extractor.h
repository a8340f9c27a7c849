#pragma once

#include "pdf_outliner/heuristic_config.h"
#include "pdf_outliner/text_extractor.h"
#include "pdf_outliner/types.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace pdf_outliner {

struct ExtractOptions {
    int max_pages = 50;              // 0 disables the guard
    size_t thread_count = 0;         // 0 = hardware concurrency
    bool prefer_native_outline = true;
    bool verbose = false;
    bool quiet = false;
    HeuristicConfig heuristics;
};

enum class DocumentStatus {
    Success,
    Failed,
    Rejected   // over the page limit, never processed
};

enum class OutlineSource {
    None,
    Native,
    Heuristic
};

std::string to_string(DocumentStatus status);
std::string to_string(OutlineSource source);

struct DocumentResult {
    std::string pdf_path;
    DocumentStatus status = DocumentStatus::Failed;
    OutlineSource source = OutlineSource::None;
    Outline outline;
    int page_count = 0;
    std::string error;
    double processing_time_ms = 0.0;

    bool success() const { return status == DocumentStatus::Success; }
};

class PageLimitExceeded : public std::runtime_error {
public:
    PageLimitExceeded(int page_count, int max_pages);

    int page_count() const { return page_count_; }
    int max_pages() const { return max_pages_; }

private:
    int page_count_;
    int max_pages_;
};

// Creates a fresh DocumentSource per document, so batch workers never share one
using SourceFactory = std::function<std::unique_ptr<DocumentSource>()>;
using ProgressCallback = std::function<void(size_t current, size_t total)>;

class OutlineExtractor {
public:
    // Without a factory documents are read with MuPDF (TextExtractor)
    explicit OutlineExtractor(const ExtractOptions& options = ExtractOptions{},
                              SourceFactory source_factory = nullptr);
    ~OutlineExtractor();

    // Native outline when present and allowed, heuristic detection otherwise
    Outline build_outline(const DocumentContent& content, OutlineSource* source = nullptr) const;

    // Single document; throws PageLimitExceeded or std::runtime_error
    Outline extract(const std::string& pdf_path);

    // Single document with failures captured in the result
    DocumentResult process(const std::string& pdf_path);

    // Documents run in parallel on the worker pool; results keep input order
    std::vector<DocumentResult> process_batch(const std::vector<std::string>& pdf_paths,
                                              ProgressCallback progress = nullptr);

    nlohmann::json get_stats() const;
    const ExtractOptions& options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace pdf_outliner
