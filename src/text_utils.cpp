#include "pdf_outliner/text_utils.h"
#include <algorithm>
#include <cctype>
#include <regex>

namespace pdf_outliner {

namespace {

bool is_space_byte(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::string normalize_whitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;

    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        // U+00A0 no-break space
        bool nbsp = c == 0xC2 && i + 1 < text.size() &&
                    static_cast<unsigned char>(text[i + 1]) == 0xA0;
        if (is_space_byte(c) || nbsp) {
            if (nbsp) ++i;
            pending_space = !result.empty();
            continue;
        }
        if (c < 0x20 || c == 0x7F) {
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += static_cast<char>(c);
    }

    return result;
}

std::string clean_heading_text(const std::string& text) {
    static const std::regex dot_leader("^(.*?)\\s*(?:\\.\\s*){3,}\\d*$");
    static const std::regex page_reference("^(.*\\S)\\s+\\d{1,4}$");
    static const std::regex bare_keyword("^(?:chapter|section|part|appendix)$", std::regex::icase);

    std::string result = normalize_whitespace(text);
    std::smatch match;
    if (std::regex_match(result, match, dot_leader)) {
        return normalize_whitespace(match[1].str());
    }

    // "Introduction 3" loses its page number, "Chapter 3" keeps its number
    if (std::regex_match(result, match, page_reference)) {
        std::string head = match[1].str();
        if (has_letter(head) && !std::regex_match(head, bare_keyword)) {
            result = head;
        }
    }
    return result;
}

std::string clean_title_text(const std::string& text) {
    static const std::regex file_suffix("\\.(pdf|docx?)$", std::regex::icase);

    std::string result = std::regex_replace(normalize_whitespace(text), file_suffix, "");

    const size_t max_bytes = 200;
    if (result.size() > max_bytes) {
        size_t cut = max_bytes;
        while (cut > 0 && (static_cast<unsigned char>(result[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        result = normalize_whitespace(result.substr(0, cut));
    }
    return result;
}

int numbering_depth(const std::string& text) {
    static const std::regex decimal("^(\\d{1,2}(?:\\.\\d{1,3})*)(?:\\.|\\))?\\s+\\S.*");
    static const std::regex keyword(
        "^(?:chapter|section|part|appendix)\\s+((?:\\d+(?:\\.\\d+)*)|[ivxlcdm]+|[a-z])\\b.*",
        std::regex::icase);

    std::smatch match;
    std::string number;
    if (std::regex_match(text, match, decimal)) {
        number = match[1].str();
    } else if (std::regex_match(text, match, keyword)) {
        number = match[1].str();
        if (!std::isdigit(static_cast<unsigned char>(number[0]))) {
            return 1;
        }
    } else {
        return 0;
    }

    return static_cast<int>(std::count(number.begin(), number.end(), '.')) + 1;
}

bool is_toc_entry(const std::string& text) {
    return text.find("....") != std::string::npos ||
           text.find(". . .") != std::string::npos ||
           text.find("\xE2\x80\xA6\xE2\x80\xA6") != std::string::npos;
}

bool is_page_number(const std::string& text) {
    static const std::regex page_number("^(?:page\\s+)?\\d+(?:\\s*(?:/|of)\\s*\\d+)?$",
                                        std::regex::icase);
    return std::regex_match(text, page_number);
}

bool ends_with_terminal_punctuation(const std::string& text) {
    if (text.empty()) return false;
    char last = text.back();
    return last == '.' || last == '!' || last == '?' || last == ',' || last == ';';
}

bool has_letter(const std::string& text) {
    return std::any_of(text.begin(), text.end(), [](char ch) {
        unsigned char c = static_cast<unsigned char>(ch);
        return c >= 0x80 || std::isalpha(c);
    });
}

size_t word_count(const std::string& text) {
    size_t count = 0;
    bool in_word = false;
    for (char ch : text) {
        if (is_space_byte(static_cast<unsigned char>(ch))) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++count;
        }
    }
    return count;
}

size_t visible_char_count(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char ch) {
        unsigned char c = static_cast<unsigned char>(ch);
        return !is_space_byte(c) && (c & 0xC0) != 0x80;
    }));
}

bool looks_bold(const std::string& font_name) {
    static const char* markers[] = {"bold", "black", "heavy", "semibold", "demi"};

    std::string name = to_lower(font_name);
    for (const char* marker : markers) {
        if (name.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace pdf_outliner
