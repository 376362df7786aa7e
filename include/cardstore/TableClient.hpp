#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cardstore {

// Key -> payload table access used by RemoteStore.
// Every call returns false on failure and describes it in `error`.
class TableClient {
public:
    virtual ~TableClient() = default;

    // `payload` is left empty when no row matches.
    virtual bool selectPayload(const std::string& table, const std::string& key,
                               std::optional<nlohmann::json>& payload, std::string& error) = 0;

    // Insert or replace the row with this key.
    virtual bool upsertPayload(const std::string& table, const std::string& key,
                               const nlohmann::json& payload, std::string& error) = 0;

    // Append a new row.
    virtual bool insertPayload(const std::string& table, const std::string& key,
                               const nlohmann::json& payload, std::string& error) = 0;
};

} // namespace cardstore
