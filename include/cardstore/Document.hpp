#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cardstore {

// The single persisted unit: {version, cards}.
struct Document {
    int64_t version = 1;
    nlohmann::json cards = nlohmann::json::array();

    nlohmann::json toJson() const;

    // Tolerant decode of a stored payload; anything malformed falls back to defaults.
    static Document fromJson(const nlohmann::json& j);
};

// Positive integer from a JSON number or numeric string, otherwise fallback.
int64_t coerceVersion(const nlohmann::json& value, int64_t fallback = 1);

// Merge identity of a card. Empty when the card is not an object or has no id.
std::optional<std::string> cardKey(const nlohmann::json& card);

} // namespace cardstore
