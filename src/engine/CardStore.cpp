//CardStore.cpp
#include "CardStore.hpp"

#include <iostream>
#include <limits>
#include <utility>
#include "cardstore/Merge.hpp"

using json = nlohmann::json;

namespace cardstore {

const char* toString(MutationStatus status) {
    switch (status) {
        case MutationStatus::Ok: return "ok";
        case MutationStatus::Unauthorized: return "unauthorized";
        case MutationStatus::InvalidBody: return "invalid_body";
        case MutationStatus::WriteFailed: return "write_failed";
    }
    return "unknown";
}

// -----------------------------------------------------------
// CTOR
// -----------------------------------------------------------
CardStore::CardStore(std::unique_ptr<Store> store, std::string adminSecret)
    : store_(std::move(store)),
      adminSecret_(std::move(adminSecret)),
      snapshots_(*store_) {}

// -----------------------------------------------------------
// READ
// -----------------------------------------------------------
Document CardStore::readCurrent() {
    try {
        return store_->read();
    } catch (const std::exception& e) {
        std::cerr << "CardStore: read failed (" << e.what() << "), serving default document\n";
        return Document{};
    }
}

Document CardStore::getDocument() {
    return readCurrent();
}

// -----------------------------------------------------------
// VALIDATION
// -----------------------------------------------------------
bool CardStore::authorized(const std::string& credential) const {
    return credential == adminSecret_;
}

bool CardStore::validBody(const json& body) {
    return body.is_object() && body.contains("cards") && body["cards"].is_array();
}

// -----------------------------------------------------------
// MUTATIONS
// -----------------------------------------------------------
MutationResult CardStore::replaceDocument(const std::string& credential, const json& body) {
    MutationResult result;
    if (!authorized(credential)) {
        result.status = MutationStatus::Unauthorized;
        return result;
    }
    if (!validBody(body)) {
        result.status = MutationStatus::InvalidBody;
        return result;
    }

    Document next;
    next.version = body.contains("version") ? coerceVersion(body["version"]) : 1;
    next.cards = body["cards"];

    Document previous = readCurrent();
    snapshots_.capture(previous);
    if (!store_->write(next)) {
        std::cerr << "CardStore: replace failed to persist version " << next.version << "\n";
        result.status = MutationStatus::WriteFailed;
        return result;
    }

    result.version = next.version;
    result.updated = next.cards.size();
    return result;
}

MutationResult CardStore::upsertDocument(const std::string& credential, const json& body) {
    MutationResult result;
    if (!authorized(credential)) {
        result.status = MutationStatus::Unauthorized;
        return result;
    }
    if (!validBody(body)) {
        result.status = MutationStatus::InvalidBody;
        return result;
    }

    const json& incoming = body["cards"];
    Document previous = readCurrent();

    if (previous.version >= std::numeric_limits<int64_t>::max()) {
        std::cerr << "CardStore: upsert refused, version " << previous.version << " cannot be incremented\n";
        result.status = MutationStatus::WriteFailed;
        return result;
    }

    Document next;
    next.version = previous.version + 1;
    next.cards = mergeCardsById(previous.cards, incoming);

    snapshots_.capture(previous);
    if (!store_->write(next)) {
        std::cerr << "CardStore: upsert failed to persist version " << next.version << "\n";
        result.status = MutationStatus::WriteFailed;
        return result;
    }

    result.version = next.version;
    result.updated = incoming.size();
    return result;
}

} // namespace cardstore
