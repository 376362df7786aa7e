#pragma once

#include <nlohmann/json.hpp>

namespace cardstore {

// Id-keyed union of two card arrays.
//  - existing ids keep their position, new ids append in incoming order
//  - a matching incoming card overrides fields of the existing one (shallow)
//  - cards without an id are dropped from the result
nlohmann::json mergeCardsById(const nlohmann::json& current, const nlohmann::json& incoming);

} // namespace cardstore
