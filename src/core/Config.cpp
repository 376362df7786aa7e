#include "cardstore/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace cardstore {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool envFlag(const char* value) {
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "1" || v == "true" || v == "on" || v == "yes";
}

} // namespace

std::vector<std::string> splitOrigins(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

Config Config::fromEnvironment() {
    Config cfg;

    if (const char* envHost = std::getenv("HOST")) {
        if (*envHost) cfg.host = envHost;
    }
    if (const char* envPort = std::getenv("PORT")) {
        try {
            int p = std::stoi(envPort);
            if (p > 0 && p < 65536) cfg.port = p;
        } catch (const std::exception&) {
            std::cerr << "Config: ignoring invalid PORT=" << envPort << "\n";
        }
    }
    if (const char* envSecret = std::getenv("ADMIN_SECRET")) {
        if (*envSecret) cfg.adminSecret = envSecret;
    }
    if (const char* envOrigins = std::getenv("ALLOWED_ORIGINS")) {
        cfg.allowedOrigins = splitOrigins(envOrigins);
    }

    if (const char* envUrl = std::getenv("SUPABASE_URL")) cfg.remoteUrl = envUrl;
    if (const char* envKey = std::getenv("SUPABASE_SERVICE_ROLE")) cfg.remoteKey = envKey;
    if (const char* envTable = std::getenv("CARDSTORE_TABLE")) {
        if (*envTable) cfg.table = envTable;
    }
    if (const char* envHistory = std::getenv("CARDSTORE_HISTORY_TABLE")) {
        if (*envHistory) cfg.historyTable = envHistory;
    }
    if (const char* envTimeout = std::getenv("CARDSTORE_REMOTE_TIMEOUT")) {
        try {
            cfg.remoteTimeoutSec = std::max(1, std::stoi(envTimeout));
        } catch (const std::exception&) {
            std::cerr << "Config: ignoring invalid CARDSTORE_REMOTE_TIMEOUT=" << envTimeout << "\n";
        }
    }

    if (const char* envData = std::getenv("DATA_FILE")) {
        if (*envData) cfg.dataFile = envData;
    }
    if (const char* envFallback = std::getenv("CARDSTORE_FALLBACK_FILE")) {
        if (*envFallback) cfg.fallbackFile = envFallback;
    }
    if (const char* envComp = std::getenv("CARDSTORE_HISTORY_COMPRESS")) {
        cfg.compressHistory = envFlag(envComp);
    }

    if (cfg.adminSecret == "changeme") {
        std::cerr << "Config: ADMIN_SECRET not set, using the default secret\n";
    }
    return cfg;
}

} // namespace cardstore
