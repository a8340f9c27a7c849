#include "pdf_outliner/outline_extractor.h"
#include "pdf_outliner/font_profile.h"
#include "pdf_outliner/fragment_normalizer.h"
#include "pdf_outliner/heading_classifier.h"
#include "pdf_outliner/outline_assembler.h"
#include "pdf_outliner/thread_pool.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>

namespace pdf_outliner {

std::string to_string(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Success: return "OK";
        case DocumentStatus::Failed: return "FAILED";
        case DocumentStatus::Rejected: return "REJECTED";
    }
    return "";
}

std::string to_string(OutlineSource source) {
    switch (source) {
        case OutlineSource::None: return "none";
        case OutlineSource::Native: return "native";
        case OutlineSource::Heuristic: return "heuristic";
    }
    return "";
}

PageLimitExceeded::PageLimitExceeded(int page_count, int max_pages)
    : std::runtime_error("Document has " + std::to_string(page_count) +
                         " pages, limit is " + std::to_string(max_pages)),
      page_count_(page_count),
      max_pages_(max_pages) {}

class OutlineExtractor::Impl {
public:
    Impl(const ExtractOptions& options, SourceFactory factory)
        : options_(options),
          source_factory_(std::move(factory)),
          normalizer_(options.heuristics),
          classifier_(options.heuristics),
          thread_pool_(options.thread_count) {
        if (!source_factory_) {
            bool verbose = options_.verbose;
            source_factory_ = [verbose]() -> std::unique_ptr<DocumentSource> {
                return std::make_unique<TextExtractor>(verbose);
            };
        }
    }

    Outline build_outline(const DocumentContent& content, OutlineSource* source) const {
        if (options_.prefer_native_outline && !content.native_outline.empty()) {
            Outline outline = assembler_.assemble_native(content.native_outline, content.metadata_title);
            if (!outline.empty()) {
                if (outline.title.empty()) {
                    outline.title = detect_title(content);
                }
                if (source) *source = OutlineSource::Native;
                return outline;
            }
            log_info("[OutlineExtractor::build_outline] Native outline has no usable entries, "
                     "using font-based detection");
        }

        auto lines = normalizer_.normalize(content.pages);
        auto profile = FontProfile::build(lines, options_.heuristics);
        auto classification = classifier_.classify_document(lines, profile);

        if (options_.verbose && !profile.empty()) {
            std::lock_guard<std::mutex> lock(log_mutex_);
            std::cout << "[OutlineExtractor::build_outline] Body size " << profile.body_size()
                      << "pt, " << profile.larger_sizes().size() << " larger sizes, "
                      << classification.headings.size() << " headings" << std::endl;
        }

        std::string title = classification.title.empty() ? content.metadata_title
                                                         : classification.title;
        if (source) *source = OutlineSource::Heuristic;
        return assembler_.assemble(std::move(classification.headings), title);
    }

    Outline extract(const std::string& pdf_path, int* page_count, OutlineSource* source) {
        auto document_source = source_factory_();

        int pages = document_source->get_page_count(pdf_path);
        if (page_count) *page_count = pages;
        if (options_.max_pages > 0 && pages > options_.max_pages) {
            throw PageLimitExceeded(pages, options_.max_pages);
        }

        DocumentContent content = document_source->load(pdf_path);
        return build_outline(content, source);
    }

    DocumentResult process(const std::string& pdf_path) {
        auto start_time = std::chrono::steady_clock::now();

        DocumentResult result;
        result.pdf_path = pdf_path;
        log_info("[OutlineExtractor::process] Processing " + pdf_path);

        try {
            result.outline = extract(pdf_path, &result.page_count, &result.source);
            result.status = DocumentStatus::Success;
        } catch (const PageLimitExceeded& e) {
            result.status = DocumentStatus::Rejected;
            result.error = e.what();
            log_warning("[OutlineExtractor::process] Warning: rejected " + pdf_path + ": " + e.what());
        } catch (const std::exception& e) {
            result.status = DocumentStatus::Failed;
            result.error = e.what();
            log_warning("[OutlineExtractor::process] Error processing " + pdf_path + ": " + e.what());
        }

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
        result.processing_time_ms = duration.count() / 1000.0;

        record(result, duration.count());
        return result;
    }

    std::vector<DocumentResult> process_batch(const std::vector<std::string>& pdf_paths,
                                              ProgressCallback progress) {
        std::vector<DocumentResult> results(pdf_paths.size());
        std::atomic<size_t> completed{0};
        std::mutex progress_mutex;

        std::vector<std::future<void>> futures;
        futures.reserve(pdf_paths.size());

        for (size_t i = 0; i < pdf_paths.size(); ++i) {
            futures.push_back(
                thread_pool_.enqueue([this, i, &pdf_paths, &results, &completed, &progress_mutex, &progress]() {
                    // process() captures every per-document failure
                    results[i] = process(pdf_paths[i]);

                    size_t done = ++completed;
                    if (progress) {
                        std::lock_guard<std::mutex> lock(progress_mutex);
                        progress(done, pdf_paths.size());
                    }
                })
            );
        }

        for (auto& future : futures) {
            future.get();
        }

        return results;
    }

    nlohmann::json get_stats() const {
        nlohmann::json stats;
        size_t processed = documents_processed_.load();

        stats["documents_processed"] = processed;
        stats["documents_failed"] = documents_failed_.load();
        stats["documents_rejected"] = documents_rejected_.load();
        stats["pages_processed"] = pages_processed_.load();
        stats["headings_found"] = headings_found_.load();
        stats["total_processing_time_ms"] = total_time_us_.load() / 1000.0;

        if (processed > 0) {
            stats["average_processing_time_ms"] = total_time_us_.load() / 1000.0 / processed;
        }

        return stats;
    }

    const ExtractOptions& options() const { return options_; }

private:
    std::string detect_title(const DocumentContent& content) const {
        auto lines = normalizer_.normalize(content.pages);
        auto profile = FontProfile::build(lines, options_.heuristics);
        return classifier_.classify_document(lines, profile).title;
    }

    void record(const DocumentResult& result, long long elapsed_us) {
        switch (result.status) {
            case DocumentStatus::Success:
                documents_processed_++;
                pages_processed_ += static_cast<size_t>(result.page_count);
                headings_found_ += result.outline.size();
                break;
            case DocumentStatus::Failed:
                documents_failed_++;
                break;
            case DocumentStatus::Rejected:
                documents_rejected_++;
                break;
        }
        total_time_us_ += static_cast<uint64_t>(elapsed_us);
    }

    void log_info(const std::string& message) const {
        if (!options_.verbose) return;
        std::lock_guard<std::mutex> lock(log_mutex_);
        std::cout << message << std::endl;
    }

    void log_warning(const std::string& message) const {
        if (options_.quiet) return;
        std::lock_guard<std::mutex> lock(log_mutex_);
        std::cerr << message << std::endl;
    }

    ExtractOptions options_;
    SourceFactory source_factory_;
    FragmentNormalizer normalizer_;
    HeadingClassifier classifier_;
    OutlineAssembler assembler_;

    std::atomic<size_t> documents_processed_{0};
    std::atomic<size_t> documents_failed_{0};
    std::atomic<size_t> documents_rejected_{0};
    std::atomic<size_t> pages_processed_{0};
    std::atomic<size_t> headings_found_{0};
    std::atomic<uint64_t> total_time_us_{0};
    mutable std::mutex log_mutex_;

    ThreadPool thread_pool_;
};

OutlineExtractor::OutlineExtractor(const ExtractOptions& options, SourceFactory source_factory)
    : pImpl(std::make_unique<Impl>(options, std::move(source_factory))) {}

OutlineExtractor::~OutlineExtractor() = default;

Outline OutlineExtractor::build_outline(const DocumentContent& content, OutlineSource* source) const {
    return pImpl->build_outline(content, source);
}

Outline OutlineExtractor::extract(const std::string& pdf_path) {
    return pImpl->extract(pdf_path, nullptr, nullptr);
}

DocumentResult OutlineExtractor::process(const std::string& pdf_path) {
    return pImpl->process(pdf_path);
}

std::vector<DocumentResult> OutlineExtractor::process_batch(const std::vector<std::string>& pdf_paths,
                                                            ProgressCallback progress) {
    return pImpl->process_batch(pdf_paths, progress);
}

nlohmann::json OutlineExtractor::get_stats() const {
    return pImpl->get_stats();
}

const ExtractOptions& OutlineExtractor::options() const {
    return pImpl->options();
}

} // namespace pdf_outliner
