#include "cardstore/RestTableClient.hpp"

#include <utility>

using json = nlohmann::json;

namespace cardstore {

namespace {

bool isSuccess(int status) { return status >= 200 && status < 300; }

std::string describeFailure(const httplib::Result& res) {
    if (!res) return "transport error: " + httplib::to_string(res.error());
    return "HTTP " + std::to_string(res->status) + ": " + res->body;
}

} // namespace

std::pair<std::string, std::string> RestTableClient::splitBaseUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    size_t hostStart = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos) return {url, ""};

    std::string prefix = url.substr(pathStart);
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return {url.substr(0, pathStart), prefix};
}

RestTableClient::RestTableClient(const std::string& baseUrl, std::string apiKey, int timeoutSec)
    : pathPrefix_(splitBaseUrl(baseUrl).second),
      apiKey_(std::move(apiKey)),
      client_(splitBaseUrl(baseUrl).first) {
    client_.set_connection_timeout(timeoutSec, 0);
    client_.set_read_timeout(timeoutSec, 0);
    client_.set_write_timeout(timeoutSec, 0);
}

httplib::Headers RestTableClient::headers() const {
    return {
        {"apikey", apiKey_},
        {"Authorization", "Bearer " + apiKey_},
        {"Accept", "application/json"}
    };
}

std::string RestTableClient::tablePath(const std::string& table) const {
    return pathPrefix_ + "/rest/v1/" + table;
}

bool RestTableClient::selectPayload(const std::string& table, const std::string& key,
                                    std::optional<json>& payload, std::string& error) {
    payload.reset();
    httplib::Params params{
        {"select", "payload"},
        {"key", "eq." + key}
    };
    auto res = client_.Get(tablePath(table), params, headers());
    if (!res || !isSuccess(res->status)) {
        error = describeFailure(res);
        return false;
    }

    auto rows = json::parse(res->body, nullptr, false);
    if (rows.is_discarded() || !rows.is_array()) {
        error = "unexpected response body";
        return false;
    }
    if (rows.size() > 1) {
        error = "multiple rows for key " + key;
        return false;
    }
    if (rows.size() == 1 && rows[0].is_object() && rows[0].contains("payload") && !rows[0]["payload"].is_null()) {
        payload = rows[0]["payload"];
    }
    return true;
}

bool RestTableClient::upsertPayload(const std::string& table, const std::string& key,
                                    const json& payload, std::string& error) {
    auto hdrs = headers();
    hdrs.emplace("Prefer", "resolution=merge-duplicates,return=minimal");
    json row = {{"key", key}, {"payload", payload}};
    auto res = client_.Post(tablePath(table) + "?on_conflict=key", hdrs, row.dump(), "application/json");
    if (!res || !isSuccess(res->status)) {
        error = describeFailure(res);
        return false;
    }
    return true;
}

bool RestTableClient::insertPayload(const std::string& table, const std::string& key,
                                    const json& payload, std::string& error) {
    auto hdrs = headers();
    hdrs.emplace("Prefer", "return=minimal");
    json row = {{"key", key}, {"payload", payload}};
    auto res = client_.Post(tablePath(table), hdrs, row.dump(), "application/json");
    if (!res || !isSuccess(res->status)) {
        error = describeFailure(res);
        return false;
    }
    return true;
}

} // namespace cardstore
