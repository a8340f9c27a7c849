#include <pdf_outliner/batch_processor.h>
#include <pdf_outliner/outline_extractor.h>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <thread>
#include <string>
#include <vector>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace pdf_outliner;

struct CLIOptions {
    std::string input_path = "./input";
    std::string output_dir = "./output";
    int max_pages = 50;
    int thread_count = 0;  // 0 = auto
    bool native_outline = true;
    bool nested = false;
    bool compact = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nExtracts the title and H1/H2/H3 outline of every PDF in the input directory\n";
    std::cout << "and writes one <name>.json per PDF to the output directory.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -i, --input PATH           Input directory or PDF file (default: ./input)\n";
    std::cout << "  -o, --output DIR           Output directory (default: ./output)\n";
    std::cout << "  --max-pages N              Reject documents with more pages (default: 50, 0 = no limit)\n";
    std::cout << "  --threads N                Number of worker threads (default: auto-detect)\n";
    std::cout << "  --no-native-outline        Ignore embedded bookmarks, always use font analysis\n";
    std::cout << "  --nested                   Write the outline as a tree with \"children\"\n";
    std::cout << "  --compact                  Write JSON without indentation\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (one status line per document)\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -i /app/input -o /app/output\n";
    std::cout << "  " << program_name << " --input report.pdf --output out --nested\n";
}

void print_version() {
    std::cout << "pdf-outliner version 1.0.0\n";
    std::cout << "Built with C++17 and MuPDF\n";
}

int parse_int(const char* value, const char* name) {
    try {
        size_t consumed = 0;
        int result = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + " expects an integer, got '" + value + "'");
    }
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"max-pages", required_argument, nullptr, 1001},
        {"threads", required_argument, nullptr, 1002},
        {"no-native-outline", no_argument, nullptr, 1003},
        {"nested", no_argument, nullptr, 1004},
        {"compact", no_argument, nullptr, 1005},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1006},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_path = optarg;
                break;
            case 'o':
                options.output_dir = optarg;
                break;
            case 1001:  // max-pages
                options.max_pages = parse_int(optarg, "max-pages");
                if (options.max_pages < 0) {
                    throw std::invalid_argument("max-pages cannot be negative");
                }
                break;
            case 1002:  // threads
                options.thread_count = parse_int(optarg, "threads");
                if (options.thread_count < 0) {
                    throw std::invalid_argument("thread count cannot be negative");
                }
                break;
            case 1003:  // no-native-outline
                options.native_outline = false;
                break;
            case 1004:  // nested
                options.nested = true;
                break;
            case 1005:  // compact
                options.compact = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1006:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (optind < argc) {
        throw std::invalid_argument(std::string("Unexpected argument: ") + argv[optind]);
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    return options;
}

void print_result(const DocumentResult& result, const std::string& output_dir, bool quiet) {
    if (quiet) {
        std::cout << to_string(result.status) << "|" << result.pdf_path << "|"
                  << result.page_count << "|" << result.outline.size() << "\n";
        return;
    }

    switch (result.status) {
        case DocumentStatus::Success:
            std::cout << "  " << fs::path(result.pdf_path).filename().string() << ": "
                      << result.outline.size() << " headings (" << to_string(result.source)
                      << "), title \"" << result.outline.title << "\" -> "
                      << output_path_for(result.pdf_path, output_dir) << "\n";
            break;
        case DocumentStatus::Rejected:
            std::cout << "  " << fs::path(result.pdf_path).filename().string()
                      << ": rejected (" << result.error << ")\n";
            break;
        case DocumentStatus::Failed:
            std::cout << "  " << fs::path(result.pdf_path).filename().string()
                      << ": failed (" << result.error << ")\n";
            break;
    }
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (options.version) {
            print_version();
            return 0;
        }

        auto pdf_files = collect_pdf_files(options.input_path);
        if (pdf_files.empty()) {
            if (!options.quiet) {
                std::cout << "No PDF files found in " << options.input_path << "\n";
            }
            return 0;
        }

        ExtractOptions extract_opts;
        extract_opts.max_pages = options.max_pages;
        extract_opts.thread_count = static_cast<size_t>(options.thread_count);
        extract_opts.prefer_native_outline = options.native_outline;
        extract_opts.verbose = options.verbose;
        extract_opts.quiet = options.quiet;

        SerializeOptions serialize_opts;
        serialize_opts.mode = options.nested ? OutputMode::Nested : OutputMode::Flat;
        serialize_opts.pretty = !options.compact;

        if (!options.quiet) {
            std::cout << "Input: " << options.input_path << " (" << pdf_files.size() << " PDF files)\n";
            std::cout << "Output: " << options.output_dir << "\n";
            std::cout << "Configuration:\n";
            std::cout << "  Max pages: " << (options.max_pages > 0 ?
                std::to_string(options.max_pages) : "unlimited") << "\n";
            std::cout << "  Threads: " << (options.thread_count > 0 ?
                std::to_string(options.thread_count) : "auto (" +
                std::to_string(std::thread::hardware_concurrency()) + ")") << "\n";
            std::cout << "  Native outline: " << (options.native_outline ? "preferred" : "ignored") << "\n";
            std::cout << "\n";
        }

        auto start = std::chrono::steady_clock::now();

        OutlineExtractor extractor(extract_opts);
        ProgressCallback progress;
        if (options.verbose) {
            progress = [](size_t current, size_t total) {
                std::cout << "Progress: " << current << "/" << total
                          << " (" << (100 * current / total) << "%)" << std::endl;
            };
        }

        auto summary = process_files(extractor, pdf_files, options.output_dir, serialize_opts, progress);

        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        for (const auto& result : summary.results) {
            print_result(result, options.output_dir, options.quiet);
        }

        if (!options.quiet) {
            auto stats = extractor.get_stats();
            std::cout << "\n=== Processing Complete ===\n";
            std::cout << "Succeeded: " << summary.succeeded << "/" << pdf_files.size() << "\n";
            std::cout << "Rejected: " << summary.rejected << "\n";
            std::cout << "Failed: " << summary.failed << "\n";
            std::cout << "Pages processed: " << stats["pages_processed"] << "\n";
            std::cout << "Headings found: " << stats["headings_found"] << "\n";
            std::cout << "Total time: " << duration.count() << "ms\n";
            if (stats.contains("average_processing_time_ms")) {
                std::cout << "Average per document: " << std::fixed << std::setprecision(1)
                          << stats["average_processing_time_ms"].get<double>() << "ms\n";
            }
        }

        return summary.any_failed() ? 2 : 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
