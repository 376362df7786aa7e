#pragma once

#include <string>
#include <vector>

namespace cardstore {

// Process-wide settings, read once at startup.
struct Config {
    std::string host = "0.0.0.0";
    int port = 5175;
    std::string adminSecret = "changeme";
    std::vector<std::string> allowedOrigins;

    // Remote table backend
    std::string remoteUrl;
    std::string remoteKey;
    std::string table = "configs";
    std::string historyTable = "configs_history";
    int remoteTimeoutSec = 10;

    // Local file backend
    std::string dataFile = "data/cards.json";
    std::string fallbackFile = "/tmp/cards.json";
    bool compressHistory = false;

    std::string documentKey = "cards";

    bool remoteConfigured() const { return !remoteUrl.empty() && !remoteKey.empty(); }

    static Config fromEnvironment();
};

std::vector<std::string> splitOrigins(const std::string& csv);

} // namespace cardstore
