#pragma once

#include <string>

namespace pdf_outliner {

// Removes control characters, collapses whitespace runs and trims.
std::string normalize_whitespace(const std::string& text);

// Heading text as it goes into the outline: whitespace normalized, a
// trailing dot leader with page number ("Intro ..... 3") or a trailing page
// number ("Intro 3") removed. A bare "Chapter 3" is left alone.
std::string clean_heading_text(const std::string& text);

// Metadata titles: whitespace normalized, a trailing .pdf/.doc/.docx removed,
// capped at 200 bytes on a UTF-8 boundary.
std::string clean_title_text(const std::string& text);

// Number of numeric segments of a leading numbering pattern ("1." -> 1,
// "2.3.1" -> 3, "Chapter 4" -> 1, "Section 2.1" -> 2), 0 when there is none.
int numbering_depth(const std::string& text);

bool is_toc_entry(const std::string& text);
bool is_page_number(const std::string& text);
bool ends_with_terminal_punctuation(const std::string& text);
bool has_letter(const std::string& text);

size_t word_count(const std::string& text);
// Characters excluding whitespace; UTF-8 continuation bytes are not counted
size_t visible_char_count(const std::string& text);

bool looks_bold(const std::string& font_name);

} // namespace pdf_outliner
