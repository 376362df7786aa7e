#include "cardstore/BackendSelector.hpp"

#include <iostream>
#include "cardstore/LocalStore.hpp"
#include "cardstore/RemoteStore.hpp"
#include "cardstore/RestTableClient.hpp"

namespace cardstore {

std::unique_ptr<Store> makeStore(const Config& cfg) {
    std::unique_ptr<Store> store;
    if (cfg.remoteConfigured()) {
        auto client = std::make_unique<RestTableClient>(cfg.remoteUrl, cfg.remoteKey, cfg.remoteTimeoutSec);
        store = std::make_unique<RemoteStore>(std::move(client), cfg);
    } else {
        store = std::make_unique<LocalStore>(cfg);
    }
    std::cout << "CardStore: backend " << store->describe() << std::endl;
    return store;
}

} // namespace cardstore
