#pragma once

#include "cardstore/Store.hpp"

namespace cardstore {

// Captures the pre-mutation document into the store's history sink.
// Failures are logged and never propagate.
class SnapshotManager {
public:
    explicit SnapshotManager(Store& store) : store_(store) {}

    // Returns whether the snapshot was written; callers may ignore it.
    bool capture(const Document& previous) noexcept;

private:
    Store& store_;
};

} // namespace cardstore
