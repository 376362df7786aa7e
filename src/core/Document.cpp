#include "cardstore/Document.hpp"

#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace cardstore {

json Document::toJson() const {
    return json{
        {"version", version},
        {"cards", cards.is_array() ? cards : json::array()}
    };
}

Document Document::fromJson(const json& j) {
    Document doc;
    if (!j.is_object()) return doc;
    if (j.contains("version")) {
        doc.version = coerceVersion(j["version"]);
    }
    if (j.contains("cards") && j["cards"].is_array()) {
        doc.cards = j["cards"];
    }
    return doc;
}

int64_t coerceVersion(const json& value, int64_t fallback) {
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        if (v == 0 || v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return fallback;
        return static_cast<int64_t>(v);
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        return v > 0 ? v : fallback;
    }
    if (value.is_number_float()) {
        double v = std::trunc(value.get<double>());
        if (!std::isfinite(v) || v < 1.0 || v > 9.0e18) return fallback;
        return static_cast<int64_t>(v);
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        try {
            size_t used = 0;
            double v = std::stod(s, &used);
            if (used != s.size()) return fallback;
            return coerceVersion(json(v), fallback);
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

std::optional<std::string> cardKey(const json& card) {
    if (!card.is_object()) return std::nullopt;
    auto it = card.find("id");
    if (it == card.end() || it->is_null()) return std::nullopt;

    const json& id = *it;
    if (id.is_string()) return id.get<std::string>();
    if (id.is_boolean()) return id.get<bool>() ? std::string("true") : std::string("false");
    if (id.is_number_unsigned()) return std::to_string(id.get<uint64_t>());
    if (id.is_number_integer()) return std::to_string(id.get<int64_t>());
    if (id.is_number_float()) {
        double v = id.get<double>();
        // [-2^63, 2^63) converts to int64 exactly
        const double limit = std::ldexp(1.0, 63);
        if (std::isfinite(v) && std::trunc(v) == v && v >= -limit && v < limit) {
            return std::to_string(static_cast<int64_t>(v));
        }
        return id.dump();
    }
    return id.dump();
}

} // namespace cardstore
