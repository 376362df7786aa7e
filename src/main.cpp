#include "CardStoreHttpServer.hpp"
#include <iostream>

int main() {
    try {
        auto cfg = cardstore::Config::fromEnvironment();
        CardStoreHttpServer app(cfg);
        std::cout << "Starting server...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
