#pragma once

#include <functional>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "townsim/server/Server.hpp"

namespace townsim::server {

// Maps request documents `{"op": ..., "id"?: ..., ...}` onto the server.
//
// Responses carry `"ok"`, the request's `"id"` when it had one, and either
// the operation's fields or `"error": {"kind", "message"}`. Error kinds:
// validation, capacity, allocation, rateLimited, internal.
class RequestRouter {
public:
    explicit RequestRouter(Server& server);

    [[nodiscard]] nlohmann::json Handle(const nlohmann::json& request) noexcept;

    // Convenience for line-oriented transports. Malformed JSON is answered
    // with a validation error.
    [[nodiscard]] std::string HandleLine(const std::string& line) noexcept;

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    nlohmann::json submit(const nlohmann::json& req);
    nlohmann::json input(const nlohmann::json& req);
    nlohmann::json snapshot(const nlohmann::json& req);
    nlohmann::json allocate(const nlohmann::json& req);
    nlohmann::json release(const nlohmann::json& req);
    nlohmann::json listChannels(const nlohmann::json& req);
    nlohmann::json pending(const nlohmann::json& req);
    nlohmann::json sweepInputs(const nlohmann::json& req);
    nlohmann::json sweepOperations(const nlohmann::json& req);
    nlohmann::json sweepOrphans(const nlohmann::json& req);
    nlohmann::json health(const nlohmann::json& req);
    nlohmann::json setStatus(const nlohmann::json& req);
    nlohmann::json reassign(const nlohmann::json& req);
    nlohmann::json step(const nlohmann::json& req);
    nlohmann::json save(const nlohmann::json& req);

    Server&                        m_server;
    std::map<std::string, Handler> m_handlers;
};

} // namespace townsim::server
