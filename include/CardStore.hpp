//CardStore.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "cardstore/Document.hpp"
#include "cardstore/SnapshotManager.hpp"
#include "cardstore/Store.hpp"

namespace cardstore {

enum class MutationStatus { Ok, Unauthorized, InvalidBody, WriteFailed };

const char* toString(MutationStatus status);

struct MutationResult {
    MutationStatus status = MutationStatus::Ok;
    int64_t version = 0;   // version now stored (Ok only)
    std::size_t updated = 0; // incoming cards processed (Ok only)

    bool ok() const { return status == MutationStatus::Ok; }
};

// Read and write entry points for the single cards document.
// Mutations are read -> (merge) -> snapshot -> write with no lock across
// the sequence; concurrent upserts can overwrite each other.
class CardStore {
public:
    CardStore(std::unique_ptr<Store> store, std::string adminSecret);

    // Never fails; degraded reads yield the default document.
    Document getDocument();

    // Exact comparison against the configured secret.
    bool authorized(const std::string& credential) const;

    // Body shape check: an object with a `cards` array.
    static bool validBody(const nlohmann::json& body);

    // Full replace with body.cards; version from body.version, default 1.
    MutationResult replaceDocument(const std::string& credential, const nlohmann::json& body);

    // Id merge of body.cards into the stored cards; version = stored + 1.
    MutationResult upsertDocument(const std::string& credential, const nlohmann::json& body);

    Store& store() { return *store_; }

private:
    std::unique_ptr<Store> store_;
    std::string adminSecret_;
    SnapshotManager snapshots_;

    Document readCurrent();
};

} // namespace cardstore
