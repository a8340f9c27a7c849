#include "pdf_outliner/batch_processor.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace pdf_outliner {

namespace fs = std::filesystem;

namespace {

bool has_pdf_extension(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".pdf";
}

} // namespace

std::vector<std::string> collect_pdf_files(const std::string& input_path) {
    if (!fs::exists(input_path)) {
        throw std::runtime_error("Input path does not exist: " + input_path);
    }

    std::vector<std::string> pdf_files;
    if (fs::is_regular_file(input_path)) {
        if (has_pdf_extension(input_path)) {
            pdf_files.push_back(input_path);
        }
        return pdf_files;
    }

    for (const auto& entry : fs::directory_iterator(input_path)) {
        if (entry.is_regular_file() && has_pdf_extension(entry.path())) {
            pdf_files.push_back(entry.path().string());
        }
    }
    std::sort(pdf_files.begin(), pdf_files.end());

    return pdf_files;
}

std::string output_path_for(const std::string& pdf_path, const std::string& output_dir) {
    return (fs::path(output_dir) / (fs::path(pdf_path).stem().string() + ".json")).string();
}

BatchSummary process_files(OutlineExtractor& extractor,
                           const std::vector<std::string>& pdf_files,
                           const std::string& output_dir,
                           const SerializeOptions& serialize_options,
                           ProgressCallback progress) {
    fs::create_directories(output_dir);

    BatchSummary summary;
    summary.results = extractor.process_batch(pdf_files, progress);

    for (auto& result : summary.results) {
        if (result.success()) {
            auto output_path = output_path_for(result.pdf_path, output_dir);
            try {
                JsonSerializer::write_file(result.outline, output_path, serialize_options);
            } catch (const std::exception& e) {
                result.status = DocumentStatus::Failed;
                result.error = e.what();

                std::error_code ec;
                fs::remove(output_path, ec);
                if (!extractor.options().quiet) {
                    std::cerr << "[process_files] Error writing " << output_path << ": "
                              << e.what() << std::endl;
                }
            }
        }

        switch (result.status) {
            case DocumentStatus::Success: summary.succeeded++; break;
            case DocumentStatus::Failed: summary.failed++; break;
            case DocumentStatus::Rejected: summary.rejected++; break;
        }
    }

    return summary;
}

} // namespace pdf_outliner
