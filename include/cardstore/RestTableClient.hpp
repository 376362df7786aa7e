#pragma once

#include <string>
#include "httplib.h"
#include "cardstore/TableClient.hpp"

namespace cardstore {

// TableClient over a PostgREST style endpoint (<base>/rest/v1/<table>).
class RestTableClient : public TableClient {
public:
    RestTableClient(const std::string& baseUrl, std::string apiKey, int timeoutSec = 10);

    bool selectPayload(const std::string& table, const std::string& key,
                       std::optional<nlohmann::json>& payload, std::string& error) override;
    bool upsertPayload(const std::string& table, const std::string& key,
                       const nlohmann::json& payload, std::string& error) override;
    bool insertPayload(const std::string& table, const std::string& key,
                       const nlohmann::json& payload, std::string& error) override;

    // Splits "https://host:port/prefix" into origin and path prefix.
    static std::pair<std::string, std::string> splitBaseUrl(const std::string& url);

private:
    std::string pathPrefix_;
    std::string apiKey_;
    httplib::Client client_;

    httplib::Headers headers() const;
    std::string tablePath(const std::string& table) const;
};

} // namespace cardstore
