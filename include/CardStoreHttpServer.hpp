#pragma once

#include <string>
#include <vector>
#include "httplib.h"
#include "CardStore.hpp"
#include "cardstore/Config.hpp"
#include <nlohmann/json.hpp>

class CardStoreHttpServer {
public:
    explicit CardStoreHttpServer(const cardstore::Config& cfg);
    void run();

    // Binds a free port on the configured host; returns it, or -1.
    int bindAnyPort();
    // Serves on the port from bindAnyPort until stop().
    bool serve();
    void stop();

private:
    void setupRoutes();

    std::string host_;
    int port_;
    std::vector<std::string> allowedOrigins_;
    httplib::Server server_;
    cardstore::CardStore store_;
};
