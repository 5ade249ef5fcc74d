#pragma once

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <string>
#include <vector>
#include <memory>

namespace doc_chunker {

// Type aliases for easier use
using JsonDocument = rapidjson::Document;
using JsonValue = rapidjson::Value;
using JsonAllocator = rapidjson::MemoryPoolAllocator<>;

// Builds a RapidJSON document (object or array root) and serializes it.
// Used for the chunk arrays, which are the bulk of the output.
class JsonBuilder {
public:
    explicit JsonBuilder(rapidjson::Type root = rapidjson::kObjectType)
        : doc_(std::make_unique<JsonDocument>(root)) {}

    JsonDocument* document() { return doc_.get(); }
    JsonAllocator& allocator() { return doc_->GetAllocator(); }

    // Copies `text` into the document's allocator
    JsonValue string(const std::string& text) {
        JsonValue value;
        value.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator());
        return value;
    }

    JsonValue string_array(const std::vector<std::string>& items) {
        JsonValue array(rapidjson::kArrayType);
        for (const auto& item : items) {
            array.PushBack(string(item), allocator());
        }
        return array;
    }

    std::string serialize(bool pretty = false) const {
        rapidjson::StringBuffer buffer;

        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            writer.SetIndent(' ', 2);
            doc_->Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            doc_->Accept(writer);
        }

        return std::string(buffer.GetString(), buffer.GetSize());
    }

private:
    std::unique_ptr<JsonDocument> doc_;
};

} // namespace doc_chunker
