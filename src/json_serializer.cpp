#include "pdf_outliner/json_serializer.h"
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <fstream>
#include <stdexcept>

namespace pdf_outliner {

namespace {

using JsonValue = rapidjson::Value;

// Owns the RapidJSON document of one outline; every string is copied into
// the document's allocator.
class OutlineDocument {
public:
    OutlineDocument() { doc_.SetObject(); }

    rapidjson::Document& root() { return doc_; }
    rapidjson::Document::AllocatorType& allocator() { return doc_.GetAllocator(); }

    JsonValue string(const std::string& text) {
        return JsonValue(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator());
    }

    // Two-space indentation when pretty; non-ASCII is written as UTF-8
    std::string write(bool pretty) const {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            writer.SetIndent(' ', 2);
            doc_.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            doc_.Accept(writer);
        }
        return std::string(buffer.GetString(), buffer.GetSize());
    }

private:
    rapidjson::Document doc_;
};

JsonValue entry_value(OutlineDocument& document, HeadingLevel level, const std::string& text, int page) {
    JsonValue item(rapidjson::kObjectType);
    item.AddMember("level", document.string(to_string(level)), document.allocator());
    item.AddMember("text", document.string(text), document.allocator());
    item.AddMember("page", page, document.allocator());
    return item;
}

JsonValue nested_value(OutlineDocument& document, const OutlineNode& node) {
    JsonValue item = entry_value(document, node.level, node.text, node.page);

    JsonValue children(rapidjson::kArrayType);
    for (const auto& child : node.children) {
        children.PushBack(nested_value(document, child), document.allocator());
    }
    item.AddMember("children", children, document.allocator());
    return item;
}

} // namespace

std::string JsonSerializer::serialize(const Outline& outline, const SerializeOptions& options) {
    OutlineDocument document;
    rapidjson::Document& doc = document.root();

    doc.AddMember("title", document.string(outline.title), document.allocator());

    JsonValue items(rapidjson::kArrayType);
    if (options.mode == OutputMode::Nested) {
        for (const auto& node : outline.nodes) {
            items.PushBack(nested_value(document, node), document.allocator());
        }
    } else {
        for (const auto& entry : outline.flatten()) {
            items.PushBack(entry_value(document, entry.level, entry.text, entry.page), document.allocator());
        }
    }
    doc.AddMember("outline", items, document.allocator());

    return document.write(options.pretty);
}

void JsonSerializer::write_file(const Outline& outline, const std::string& path,
                                const SerializeOptions& options) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + path);
    }

    out << serialize(outline, options) << '\n';
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

} // namespace pdf_outliner
