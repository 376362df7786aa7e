#include "CardStoreHttpServer.hpp"

#include <iostream>
#include <stdexcept>
#include "cardstore/BackendSelector.hpp"
#include "cardstore/Cors.hpp"

using json = nlohmann::json;
using cardstore::MutationResult;
using cardstore::MutationStatus;

CardStoreHttpServer::CardStoreHttpServer(const cardstore::Config& cfg)
    : host_(cfg.host),
      port_(cfg.port),
      allowedOrigins_(cfg.allowedOrigins),
      store_(cardstore::makeStore(cfg), cfg.adminSecret) {
    setupRoutes();
}

void CardStoreHttpServer::run() {
    std::cout << "CardStore HTTP server listening on "
              << host_ << ":" << port_ << std::endl;
    if (!server_.listen(host_.c_str(), port_)) {
        throw std::runtime_error("cannot listen on " + host_ + ":" + std::to_string(port_));
    }
}

int CardStoreHttpServer::bindAnyPort() {
    port_ = server_.bind_to_any_port(host_.c_str());
    return port_;
}

bool CardStoreHttpServer::serve() {
    return server_.listen_after_bind();
}

void CardStoreHttpServer::stop() {
    server_.stop();
}

void CardStoreHttpServer::setupRoutes() {

    // JSON helpers
    auto err = [](const std::string& code) {
        return json{{"error", code}};
    };

    auto isJsonContent = [](const httplib::Request& req) {
        auto ct = req.get_header_value("Content-Type");
        return ct.find("application/json") != std::string::npos;
    };

    auto addCors = [](httplib::Response& res, const std::string& origin) {
        if (!origin.empty()) {
            res.set_header("Access-Control-Allow-Origin", origin);
            res.set_header("Vary", "Origin");
        }
        res.set_header("Access-Control-Allow-Credentials", "true");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, OPTIONS");
        res.set_header("Access-Control-Allow-Headers",
                       "Content-Type, X-Requested-With, Authorization, x-admin-secret, X-Admin-Secret, Accept");
    };

    // Origin policy runs before any route
    server_.set_pre_routing_handler([this, err, addCors](const httplib::Request& req, httplib::Response& res) {
        auto origin = req.get_header_value("Origin");
        if (!cardstore::originAllowed(allowedOrigins_, origin)) {
            std::cerr << "CardStore: rejected origin " << origin << "\n";
            res.status = 403;
            res.set_content(err("origin_not_allowed").dump(), "application/json");
            return httplib::Server::HandlerResponse::Handled;
        }
        addCors(res, origin);
        return httplib::Server::HandlerResponse::Unhandled;
    });

    // Preflight for any route
    server_.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    // Body is parsed leniently; CardStore checks auth first, then shape.
    auto parseBody = [isJsonContent](const httplib::Request& req) {
        if (!isJsonContent(req)) return json::object();
        try {
            return json::parse(req.body);
        } catch (const json::parse_error& e) {
            std::cerr << "CardStore: unparseable body: " << e.what() << "\n";
            return json::object();
        }
    };

    auto respond = [err](httplib::Response& res, const MutationResult& result, bool withVersion) {
        switch (result.status) {
            case MutationStatus::Ok: {
                json body = {{"ok", true}};
                if (withVersion) {
                    body["version"] = result.version;
                    body["updated"] = result.updated;
                }
                res.status = 200;
                res.set_content(body.dump(), "application/json");
                return;
            }
            case MutationStatus::Unauthorized:
                res.status = 401;
                break;
            case MutationStatus::InvalidBody:
                res.status = 400;
                break;
            case MutationStatus::WriteFailed:
                res.status = 500;
                break;
        }
        res.set_content(err(cardstore::toString(result.status)).dump(), "application/json");
    };

    // --- ROOT ---
    server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("OK. Use /cards to view or save the configuration.", "text/plain");
    });

    // --- READ ---
    server_.Get("/cards", [this](const httplib::Request&, httplib::Response& res) {
        res.set_header("Cache-Control", "no-store");
        res.set_content(store_.getDocument().toJson().dump(), "application/json");
    });

    // --- REPLACE ---
    server_.Put("/cards", [this, parseBody, respond](const httplib::Request& req, httplib::Response& res) {
        auto secret = req.get_header_value("x-admin-secret");
        auto result = store_.replaceDocument(secret, parseBody(req));
        respond(res, result, false);
    });

    // --- UPSERT ---
    server_.Post("/cards/upsert", [this, parseBody, respond](const httplib::Request& req, httplib::Response& res) {
        auto secret = req.get_header_value("x-admin-secret");
        auto result = store_.upsertDocument(secret, parseBody(req));
        respond(res, result, true);
    });
}
