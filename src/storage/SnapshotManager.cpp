#include "cardstore/SnapshotManager.hpp"

#include <iostream>

namespace cardstore {

bool SnapshotManager::capture(const Document& previous) noexcept {
    try {
        if (store_.appendHistory(previous)) return true;
        std::cerr << "Snapshot: history write failed (ignored), version=" << previous.version << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Snapshot: history write error (ignored): " << e.what() << "\n";
    }
    return false;
}

} // namespace cardstore
