//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// search/index_store.cpp
//===----------------------------------------------------------------------===//

#include "search/index_store.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace duckes {

namespace {

bool IsDigits(const std::string& s, size_t pos, size_t count) {
    if (pos + count > s.size()) return false;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// yyyy-MM-dd, optionally followed by a time part
bool IsIsoDate(const std::string& s) {
    if (!IsDigits(s, 0, 4) || s.size() < 10 || s[4] != '-' || !IsDigits(s, 5, 2) ||
        s[7] != '-' || !IsDigits(s, 8, 2)) {
        return false;
    }
    if (s.size() == 10) return true;
    return (s[10] == 'T' || s[10] == ' ') && IsDigits(s, 11, 2) && s.size() >= 16 && s[13] == ':';
}

bool IsIntegerString(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    return start < s.size() && IsDigits(s, start, s.size() - start);
}

bool IsNumberString(const std::string& s) {
    if (s.empty()) return false;
    char* end = nullptr;
    std::strtod(s.c_str(), &end);
    return end != s.c_str() && *end == '\0';
}

bool IsNumber(const Json::Value& v) {
    return v.type() == Json::intValue || v.type() == Json::uintValue || v.type() == Json::realValue;
}

} // namespace

std::optional<FieldType> FieldTypeFromName(const std::string& name) {
    if (name == "long" || name == "integer" || name == "short" || name == "byte") return FieldType::LONG;
    if (name == "double" || name == "float" || name == "half_float" || name == "scaled_float") return FieldType::DOUBLE;
    if (name == "boolean") return FieldType::BOOLEAN;
    if (name == "keyword") return FieldType::KEYWORD;
    if (name == "text") return FieldType::TEXT;
    if (name == "date") return FieldType::DATE;
    if (name == "object") return FieldType::OBJECT;
    return std::nullopt;
}

const char* FieldTypeName(FieldType type) {
    switch (type) {
        case FieldType::LONG:    return "long";
        case FieldType::DOUBLE:  return "double";
        case FieldType::BOOLEAN: return "boolean";
        case FieldType::KEYWORD: return "keyword";
        case FieldType::TEXT:    return "text";
        case FieldType::DATE:    return "date";
        case FieldType::OBJECT:  return "object";
    }
    return "unknown";
}

bool IndexStore::CreateIndex(const std::string& index, const Json::Value& properties) {
    SearchIndex created;
    for (const auto& field : properties.getMemberNames()) {
        std::string type_name = properties[field]["type"].asString();
        auto type = FieldTypeFromName(type_name);
        if (!type) {
            throw std::invalid_argument("No handler for type [" + type_name + "] declared on field [" + field + "]");
        }
        created.mapping[field] = *type;
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (indices.find(index) != indices.end()) {
        return false;
    }
    indices.emplace(index, std::move(created));
    return true;
}

bool IndexStore::HasIndex(const std::string& index) const {
    std::lock_guard<std::mutex> lock(mutex);
    return indices.find(index) != indices.end();
}

std::optional<FieldType> IndexStore::InferType(const Json::Value& value) {
    switch (value.type()) {
        case Json::intValue:
        case Json::uintValue:
            return FieldType::LONG;
        case Json::realValue:
            return FieldType::DOUBLE;
        case Json::booleanValue:
            return FieldType::BOOLEAN;
        case Json::stringValue:
            return IsIsoDate(value.asString()) ? FieldType::DATE : FieldType::TEXT;
        case Json::objectValue:
            return FieldType::OBJECT;
        case Json::arrayValue:
            for (const auto& element : value) {
                auto type = InferType(element);
                if (type) return type;
            }
            return std::nullopt;
        case Json::nullValue:
        default:
            return std::nullopt;
    }
}

bool IndexStore::Accepts(FieldType type, const Json::Value& value) {
    if (value.isNull()) {
        return true;
    }
    if (value.isArray()) {
        for (const auto& element : value) {
            if (!Accepts(type, element)) return false;
        }
        return true;
    }

    switch (type) {
        case FieldType::LONG:
            if (value.type() == Json::intValue || value.type() == Json::uintValue) return true;
            if (value.type() == Json::realValue) {
                double d = value.asDouble();
                return std::isfinite(d) && std::floor(d) == d;
            }
            return value.isString() && IsIntegerString(value.asString());
        case FieldType::DOUBLE:
            return IsNumber(value) || (value.isString() && IsNumberString(value.asString()));
        case FieldType::BOOLEAN:
            return value.isBool() ||
                   (value.isString() && (value.asString() == "true" || value.asString() == "false"));
        case FieldType::KEYWORD:
        case FieldType::TEXT:
            return value.isString() || IsNumber(value) || value.isBool();
        case FieldType::DATE:
            return (value.isString() && IsIsoDate(value.asString())) ||
                   value.type() == Json::intValue || value.type() == Json::uintValue;
        case FieldType::OBJECT:
            return value.isObject();
    }
    return false;
}

bool IndexStore::CheckField(SearchIndex& index, const std::string& field, const Json::Value& value,
                            std::string& reason) {
    auto it = index.mapping.find(field);
    if (it == index.mapping.end()) {
        auto inferred = InferType(value);
        if (inferred) {
            index.mapping[field] = *inferred;
        }
        return true;
    }
    if (!Accepts(it->second, value)) {
        reason = "failed to parse field [" + field + "] of type [" + FieldTypeName(it->second) + "]";
        return false;
    }
    return true;
}

IndexResult IndexStore::Index(const std::string& index, const Json::Value& source) {
    IndexResult result;
    if (!source.isObject()) {
        result.status = 400;
        result.error_type = "mapper_parsing_exception";
        result.reason = "failed to parse, document is empty or not an object";
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex);
    auto& target = indices[index];

    // Dynamic mappings of a rejected document are not kept
    auto mapping_before = target.mapping;
    for (const auto& field : source.getMemberNames()) {
        std::string reason;
        if (!CheckField(target, field, source[field], reason)) {
            target.mapping = std::move(mapping_before);
            result.status = 400;
            result.error_type = "mapper_parsing_exception";
            result.reason = reason;
            return result;
        }
    }

    result.id = std::to_string(target.next_id++);
    target.documents.push_back({result.id, source});
    return result;
}

uint64_t IndexStore::Count(const std::string& index) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = indices.find(index);
    return it == indices.end() ? 0 : it->second.documents.size();
}

std::optional<FieldType> IndexStore::GetFieldType(const std::string& index, const std::string& field) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = indices.find(index);
    if (it == indices.end()) return std::nullopt;
    auto fit = it->second.mapping.find(field);
    if (fit == it->second.mapping.end()) return std::nullopt;
    return fit->second;
}

IndexStore::ScrollPage IndexStore::BuildPage(const std::string& scroll_id, Scroll& scroll) {
    ScrollPage page;
    const auto& docs = indices[scroll.index].documents;
    page.total = docs.size();

    size_t end = std::min(docs.size(), scroll.offset + scroll.size);
    for (size_t i = scroll.offset; i < end; ++i) {
        page.hits.emplace_back(docs[i].id, docs[i].source);
    }
    scroll.offset = end;
    page.scroll_id = scroll_id;
    return page;
}

std::optional<IndexStore::ScrollPage> IndexStore::OpenScroll(const std::string& index, uint32_t size,
                                                             std::chrono::milliseconds keep_alive) {
    std::lock_guard<std::mutex> lock(mutex);
    ExpireScrolls();
    if (indices.find(index) == indices.end()) {
        return std::nullopt;
    }

    std::string scroll_id = "scroll-" + std::to_string(next_scroll_id++);
    Scroll scroll;
    scroll.index = index;
    scroll.size = size == 0 ? 10 : size;
    scroll.expires_at = Clock::now() + keep_alive;

    auto& stored = scrolls[scroll_id];
    stored = scroll;
    return BuildPage(scroll_id, stored);
}

std::optional<IndexStore::ScrollPage> IndexStore::NextPage(const std::string& scroll_id,
                                                           std::chrono::milliseconds keep_alive) {
    std::lock_guard<std::mutex> lock(mutex);
    ExpireScrolls();
    auto it = scrolls.find(scroll_id);
    if (it == scrolls.end()) {
        return std::nullopt;
    }
    it->second.expires_at = Clock::now() + keep_alive;
    return BuildPage(scroll_id, it->second);
}

bool IndexStore::ClearScroll(const std::string& scroll_id) {
    std::lock_guard<std::mutex> lock(mutex);
    return scrolls.erase(scroll_id) > 0;
}

size_t IndexStore::OpenScrollCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return scrolls.size();
}

void IndexStore::ExpireScrolls() {
    auto now = Clock::now();
    for (auto it = scrolls.begin(); it != scrolls.end();) {
        if (it->second.expires_at < now) {
            scrolls.erase(it++);
        } else {
            ++it;
        }
    }
}

} // namespace duckes
