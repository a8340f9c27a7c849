#include "pdf_outliner/text_extractor.h"
#include "pdf_outliner/fragment_normalizer.h"
#include "pdf_outliner/text_utils.h"
#include <mupdf/fitz.h>
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <vector>
#include <memory>
#include <iostream>

namespace pdf_outliner {

namespace {

struct DocumentDeleter {
    fz_context* ctx;
    void operator()(fz_document* doc) const { fz_drop_document(ctx, doc); }
};

struct StextDeleter {
    fz_context* ctx;
    void operator()(fz_stext_page* stext) const { fz_drop_stext_page(ctx, stext); }
};

struct OutlineDeleter {
    fz_context* ctx;
    void operator()(fz_outline* outline) const { fz_drop_outline(ctx, outline); }
};

using DocumentHandle = std::unique_ptr<fz_document, DocumentDeleter>;
using StextHandle = std::unique_ptr<fz_stext_page, StextDeleter>;
using OutlineHandle = std::unique_ptr<fz_outline, OutlineDeleter>;

} // namespace

class TextExtractor::Impl {
public:
    explicit Impl(bool verbose) : verbose_(verbose) {
        ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
        if (!ctx) {
            throw std::runtime_error("Failed to create MuPDF context");
        }
        fz_register_document_handlers(ctx);
    }

    ~Impl() {
        if (ctx) {
            fz_drop_context(ctx);
        }
    }

    int get_page_count(const std::string& pdf_path) {
        DocumentHandle doc = open(pdf_path);
        return count_pages(doc.get());
    }

    DocumentContent load(const std::string& pdf_path) {
        if (verbose_) {
            std::cout << "[TextExtractor::load] Opening " << pdf_path << std::endl;
        }

        DocumentHandle doc = open(pdf_path);

        DocumentContent content;
        content.page_count = count_pages(doc.get());
        content.metadata_title = lookup_title(doc.get());
        content.native_outline = load_outline(doc.get());

        for (int i = 0; i < content.page_count; ++i) {
            if (verbose_ && i % 50 == 0) {
                std::cout << "[TextExtractor::load] Processing page " << i + 1 << "/"
                          << content.page_count << std::endl;
            }
            content.pages.push_back(extract_page(doc.get(), i));
        }

        return content;
    }

    PageFragments extract_page(const std::string& pdf_path, int page_number) {
        DocumentHandle doc = open(pdf_path);
        int page_count = count_pages(doc.get());
        if (page_number < 1 || page_number > page_count) {
            throw std::out_of_range("Page number out of range");
        }
        return extract_page(doc.get(), page_number - 1);
    }

private:
    DocumentHandle open(const std::string& pdf_path) {
        if (!std::filesystem::exists(pdf_path)) {
            throw std::runtime_error("PDF file not found: " + pdf_path);
        }

        fz_document* doc = nullptr;
        fz_var(doc);

        fz_try(ctx) {
            doc = fz_open_document(ctx, pdf_path.c_str());
        }
        fz_catch(ctx) {
            throw std::runtime_error("Failed to open PDF document: " + pdf_path +
                                     " (" + fz_caught_message(ctx) + ")");
        }

        return DocumentHandle(doc, DocumentDeleter{ctx});
    }

    int count_pages(fz_document* doc) {
        int page_count = 0;

        fz_try(ctx) {
            page_count = fz_count_pages(ctx, doc);
        }
        fz_catch(ctx) {
            throw std::runtime_error(std::string("MuPDF error getting page count: ") +
                                     fz_caught_message(ctx));
        }

        return page_count;
    }

    std::string lookup_title(fz_document* doc) {
        char buffer[512] = {0};
        int length = -1;

        fz_try(ctx) {
            length = fz_lookup_metadata(ctx, doc, FZ_META_INFO_TITLE, buffer, sizeof(buffer));
        }
        fz_catch(ctx) {
            if (verbose_) {
                std::cerr << "[TextExtractor::lookup_title] No title metadata: "
                          << fz_caught_message(ctx) << std::endl;
            }
            return "";
        }

        return length > 0 ? clean_title_text(buffer) : "";
    }

    std::vector<NativeOutlineEntry> load_outline(fz_document* doc) {
        fz_outline* outline = nullptr;
        fz_var(outline);

        fz_try(ctx) {
            outline = fz_load_outline(ctx, doc);
        }
        fz_catch(ctx) {
            // A broken outline is not fatal: the heuristic path takes over
            if (verbose_) {
                std::cerr << "[TextExtractor::load_outline] Ignoring unreadable outline: "
                          << fz_caught_message(ctx) << std::endl;
            }
            return {};
        }

        OutlineHandle holder(outline, OutlineDeleter{ctx});
        std::vector<NativeOutlineEntry> entries;
        collect_outline(doc, outline, 1, entries);
        return entries;
    }

    void collect_outline(fz_document* doc, fz_outline* node, int level,
                         std::vector<NativeOutlineEntry>& entries) {
        for (; node; node = node->next) {
            int page = fz_page_number_from_location(ctx, doc, node->page);
            if (node->title && page >= 0) {
                entries.push_back({level, node->title, page + 1});
            }
            collect_outline(doc, node->down, level + 1, entries);
        }
    }

    PageFragments extract_page(fz_document* doc, int page_index) {
        fz_page* page = nullptr;
        fz_stext_page* stext = nullptr;
        fz_var(page);
        fz_var(stext);

        fz_try(ctx) {
            page = fz_load_page(ctx, doc, page_index);

            fz_stext_options opts = { 0 };
            opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE;
            stext = fz_new_stext_page_from_page(ctx, page, &opts);
        }
        fz_always(ctx) {
            if (page) fz_drop_page(ctx, page);
        }
        fz_catch(ctx) {
            throw std::runtime_error("MuPDF error during text extraction on page " +
                                     std::to_string(page_index + 1) + ": " + fz_caught_message(ctx));
        }

        StextHandle holder(stext, StextDeleter{ctx});
        return stext_to_fragments(stext, page_index + 1);
    }

    // One fragment per run of characters sharing a font and size
    PageFragments stext_to_fragments(fz_stext_page* stext, int page_number) {
        PageFragments result;
        result.page = page_number;

        for (fz_stext_block* block = stext->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) {
                continue;
            }

            for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
                TextFragment current;
                fz_font* current_font = nullptr;
                bool open_fragment = false;

                for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                    float size = FragmentNormalizer::round_size(ch->size);

                    if (open_fragment && (ch->font != current_font || current.font_size != size)) {
                        result.fragments.push_back(std::move(current));
                        current = TextFragment();
                        open_fragment = false;
                    }

                    fz_rect rect = fz_rect_from_quad(ch->quad);
                    if (!open_fragment) {
                        current_font = ch->font;
                        current.page = page_number;
                        current.font_size = size;
                        current.font_name = font_name(ch->font);
                        current.is_bold = is_bold(ch->font, current.font_name);
                        current.bbox = {rect.x0, rect.y0, rect.x1, rect.y1};
                        open_fragment = true;
                    } else {
                        current.bbox.x0 = std::min(current.bbox.x0, rect.x0);
                        current.bbox.y0 = std::min(current.bbox.y0, rect.y0);
                        current.bbox.x1 = std::max(current.bbox.x1, rect.x1);
                        current.bbox.y1 = std::max(current.bbox.y1, rect.y1);
                    }

                    // Convert Unicode to UTF-8
                    char utf8[FZ_UTFMAX + 1] = {0};
                    int len = fz_runetochar(utf8, ch->c);
                    current.text.append(utf8, static_cast<size_t>(len));
                }

                if (open_fragment) {
                    result.fragments.push_back(std::move(current));
                }
            }
        }

        return result;
    }

    std::string font_name(fz_font* font) {
        if (!font) return "";
        const char* name = fz_font_name(ctx, font);
        return name ? name : "";
    }

    bool is_bold(fz_font* font, const std::string& name) {
        return (font && fz_font_is_bold(ctx, font)) || looks_bold(name);
    }

    fz_context* ctx = nullptr;
    bool verbose_ = false;
};

TextExtractor::TextExtractor(bool verbose) : pImpl(std::make_unique<Impl>(verbose)) {}
TextExtractor::~TextExtractor() = default;

int TextExtractor::get_page_count(const std::string& pdf_path) {
    return pImpl->get_page_count(pdf_path);
}

DocumentContent TextExtractor::load(const std::string& pdf_path) {
    return pImpl->load(pdf_path);
}

PageFragments TextExtractor::extract_page(const std::string& pdf_path, int page_number) {
    return pImpl->extract_page(pdf_path, page_number);
}

} // namespace pdf_outliner
