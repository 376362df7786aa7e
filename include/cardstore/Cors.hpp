#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace cardstore {

// No Origin header (curl, server-to-server) and an empty allowlist both pass.
inline bool originAllowed(const std::vector<std::string>& allowed, const std::string& origin) {
    if (origin.empty() || allowed.empty()) return true;
    return std::find(allowed.begin(), allowed.end(), origin) != allowed.end();
}

} // namespace cardstore
