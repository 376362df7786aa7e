#pragma once

#include <memory>
#include "cardstore/Config.hpp"
#include "cardstore/Store.hpp"

namespace cardstore {

// Remote table when both remote URL and key are set, local file otherwise.
// May throw StartupError.
std::unique_ptr<Store> makeStore(const Config& cfg);

} // namespace cardstore
