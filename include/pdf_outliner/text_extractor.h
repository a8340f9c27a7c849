#pragma once

#include "pdf_outliner/types.h"
#include <string>
#include <memory>

namespace pdf_outliner {

// Supplies the heuristic pipeline with a document's text fragments, embedded
// bookmarks and metadata title.
class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    virtual int get_page_count(const std::string& pdf_path) = 0;
    virtual DocumentContent load(const std::string& pdf_path) = 0;
};

// MuPDF-backed DocumentSource. Owns one fz_context, so an instance must not be
// shared between threads.
class TextExtractor : public DocumentSource {
public:
    explicit TextExtractor(bool verbose = false);
    ~TextExtractor() override;

    int get_page_count(const std::string& pdf_path) override;
    DocumentContent load(const std::string& pdf_path) override;

    // 1-based page
    PageFragments extract_page(const std::string& pdf_path, int page_number);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace pdf_outliner
