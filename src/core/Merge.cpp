#include "cardstore/Merge.hpp"

#include <string>
#include <unordered_map>
#include <vector>
#include "cardstore/Document.hpp"

using json = nlohmann::json;

namespace cardstore {

json mergeCardsById(const json& current, const json& incoming) {
    std::vector<json> ordered;
    std::unordered_map<std::string, size_t> slots;

    if (current.is_array()) {
        for (const auto& card : current) {
            auto key = cardKey(card);
            if (!key) continue;
            auto it = slots.find(*key);
            if (it == slots.end()) {
                slots.emplace(*key, ordered.size());
                ordered.push_back(card);
            } else {
                // duplicate id in stored data: last one wins, first position kept
                ordered[it->second] = card;
            }
        }
    }

    if (incoming.is_array()) {
        for (const auto& card : incoming) {
            auto key = cardKey(card);
            if (!key) continue;
            auto it = slots.find(*key);
            if (it == slots.end()) {
                slots.emplace(*key, ordered.size());
                ordered.push_back(card);
                continue;
            }
            json& target = ordered[it->second];
            for (auto field = card.begin(); field != card.end(); ++field) {
                target[field.key()] = field.value();
            }
        }
    }

    json out = json::array();
    for (auto& card : ordered) {
        out.push_back(std::move(card));
    }
    return out;
}

} // namespace cardstore
