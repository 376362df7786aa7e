#include "cardstore/RemoteStore.hpp"

#include <iostream>
#include <utility>

using json = nlohmann::json;

namespace cardstore {

RemoteStore::RemoteStore(std::unique_ptr<TableClient> client, const Config& cfg)
    : client_(std::move(client)),
      table_(cfg.table),
      historyTable_(cfg.historyTable),
      key_(cfg.documentKey) {}

Document RemoteStore::read() {
    std::optional<json> payload;
    std::string error;
    if (!client_->selectPayload(table_, key_, payload, error)) {
        std::cerr << "RemoteStore: read error (" << error << "), serving default document\n";
        return Document{};
    }
    if (!payload) return Document{};
    return Document::fromJson(*payload);
}

bool RemoteStore::write(const Document& doc) {
    std::string error;
    if (!client_->upsertPayload(table_, key_, doc.toJson(), error)) {
        std::cerr << "RemoteStore: write error: " << error << "\n";
        return false;
    }
    return true;
}

bool RemoteStore::appendHistory(const Document& doc) {
    std::string error;
    if (!client_->insertPayload(historyTable_, key_, doc.toJson(), error)) {
        std::cerr << "RemoteStore: history insert error: " << error << "\n";
        return false;
    }
    return true;
}

std::string RemoteStore::describe() const {
    return "table:" + table_ + "/" + key_;
}

} // namespace cardstore
