#pragma once

// ContentStore.h
// Read-only keyed content records for the informational panels
// ("about", "projects", "skills", "contact"), loaded from JSON.

#include "Utils/Result.h"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace Atrium::Game {

struct ContentRecord {
    std::string key;
    std::string title;
    std::string description;
    std::vector<std::string> technologies;
    nlohmann::json extra = nlohmann::json::object();    // Section-specific payload
};

class ContentStore {
public:
    ContentStore() = default;

    // File layout: { "<key>": { "title": ..., "description": ..., "technologies": [...], ... } }
    // Unknown fields of a record are kept in `extra`.
    static Utils::Result<ContentStore> LoadFromFile(const std::string& path);
    static Utils::Result<ContentStore> FromJson(const nlohmann::json& root);

    void Insert(ContentRecord record);

    [[nodiscard]] Utils::Result<ContentRecord> Get(const std::string& key) const;
    [[nodiscard]] bool Contains(const std::string& key) const;
    [[nodiscard]] size_t Size() const { return m_records.size(); }

private:
    std::unordered_map<std::string, ContentRecord> m_records;
};

} // namespace Atrium::Game
