#include "ContentStore.h"
#include "Utils/ConfigLoader.h"
#include <spdlog/spdlog.h>

namespace Atrium::Game {

Utils::Result<ContentStore> ContentStore::LoadFromFile(const std::string& path) {
    auto root = Utils::ConfigLoader::ReadJsonFile(path, "content");
    if (root.IsErr()) {
        return Utils::Result<ContentStore>::Err(root.Error());
    }

    auto result = FromJson(root.Value());
    if (result.IsOk()) {
        spdlog::info("[Content] Loaded {} records from {}", result.Value().Size(), path);
    }
    return result;
}

Utils::Result<ContentStore> ContentStore::FromJson(const nlohmann::json& root) {
    if (!root.is_object()) {
        return Utils::Result<ContentStore>::Err("Content root must be an object");
    }

    ContentStore store;
    for (const auto& [key, value] : root.items()) {
        if (!value.is_object()) {
            spdlog::warn("[Content] Skipping '{}': record is not an object", key);
            continue;
        }

        ContentRecord record;
        record.key = key;
        try {
            record.title = value.value("title", key);
            record.description = value.value("description", std::string());
            if (value.contains("technologies")) {
                record.technologies = value.at("technologies").get<std::vector<std::string>>();
            }
        } catch (const nlohmann::json::exception& e) {
            return Utils::Result<ContentStore>::Err("Malformed content record '" + key + "': " + e.what());
        }

        for (const auto& [field, fieldValue] : value.items()) {
            if (field != "title" && field != "description" && field != "technologies") {
                record.extra[field] = fieldValue;
            }
        }
        store.Insert(std::move(record));
    }
    return Utils::Result<ContentStore>::Ok(std::move(store));
}

void ContentStore::Insert(ContentRecord record) {
    std::string key = record.key;
    m_records[std::move(key)] = std::move(record);
}

Utils::Result<ContentRecord> ContentStore::Get(const std::string& key) const {
    auto it = m_records.find(key);
    if (it == m_records.end()) {
        return Utils::Result<ContentRecord>::Err("No content record for key '" + key + "'");
    }
    return Utils::Result<ContentRecord>::Ok(it->second);
}

bool ContentStore::Contains(const std::string& key) const {
    return m_records.find(key) != m_records.end();
}

} // namespace Atrium::Game
