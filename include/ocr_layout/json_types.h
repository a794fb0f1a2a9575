#pragma once

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <string>
#include <memory>

namespace ocr_layout {

using JsonDocument = rapidjson::Document;
using JsonValue = rapidjson::Value;
using JsonAllocator = rapidjson::MemoryPoolAllocator<>;

// Owns a rapidjson document rooted at an object
class JsonBuilder {
public:
    JsonBuilder() : doc_(std::make_unique<JsonDocument>()) {
        doc_->SetObject();
    }

    JsonAllocator& allocator() { return doc_->GetAllocator(); }

    JsonValue make_string(const std::string& text) {
        JsonValue value;
        value.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator());
        return value;
    }

    void add(const char* key, JsonValue& value) {
        doc_->AddMember(rapidjson::StringRef(key), value, allocator());
    }

    std::string serialize(bool pretty = false) const {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
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

} // namespace ocr_layout
