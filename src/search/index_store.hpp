//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// search/index_store.hpp
//
// In-memory document store behind the embedded search node
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <json/json.h>
#include <optional>
#include <parallel_hashmap/phmap.h>

namespace duckes {

enum class FieldType {
    LONG,
    DOUBLE,
    BOOLEAN,
    KEYWORD,
    TEXT,
    DATE,
    OBJECT
};

// "long", "integer", ... -> FieldType. nullopt for unknown names.
std::optional<FieldType> FieldTypeFromName(const std::string& name);
const char* FieldTypeName(FieldType type);

struct IndexResult {
    int status = 201;
    std::string id;
    std::string error_type;
    std::string reason;
};

class IndexStore {
public:
    struct ScrollPage {
        std::string scroll_id;
        uint64_t total = 0;
        std::vector<std::pair<std::string, Json::Value>> hits;
    };

    IndexStore() = default;

    // Explicit mapping; false if the index exists. Throws std::invalid_argument on unknown types.
    bool CreateIndex(const std::string& index, const Json::Value& properties);
    bool HasIndex(const std::string& index) const;

    // Creates the index with dynamic mapping on first use
    IndexResult Index(const std::string& index, const Json::Value& source);

    uint64_t Count(const std::string& index) const;
    std::optional<FieldType> GetFieldType(const std::string& index, const std::string& field) const;

    std::optional<ScrollPage> OpenScroll(const std::string& index, uint32_t size,
                                         std::chrono::milliseconds keep_alive);
    // nullopt when the scroll id is unknown or expired
    std::optional<ScrollPage> NextPage(const std::string& scroll_id, std::chrono::milliseconds keep_alive);
    bool ClearScroll(const std::string& scroll_id);
    size_t OpenScrollCount() const;

private:
    struct Document {
        std::string id;
        Json::Value source;
    };

    struct SearchIndex {
        phmap::flat_hash_map<std::string, FieldType> mapping;
        std::vector<Document> documents;
        uint64_t next_id = 1;
    };

    struct Scroll {
        std::string index;
        size_t offset = 0;
        uint32_t size = 0;
        TimePoint expires_at;
    };

    // Validate one field against the mapping; adds a dynamic mapping when absent
    bool CheckField(SearchIndex& index, const std::string& field, const Json::Value& value,
                    std::string& reason);
    static bool Accepts(FieldType type, const Json::Value& value);
    static std::optional<FieldType> InferType(const Json::Value& value);

    ScrollPage BuildPage(const std::string& scroll_id, Scroll& scroll);
    void ExpireScrolls();

    mutable std::mutex mutex;
    phmap::flat_hash_map<std::string, SearchIndex> indices;
    phmap::flat_hash_map<std::string, Scroll> scrolls;
    uint64_t next_scroll_id = 1;
};

} // namespace duckes
