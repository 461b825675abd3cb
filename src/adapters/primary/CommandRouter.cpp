// src/adapters/primary/CommandRouter.cpp
#include "adapters/primary/CommandRouter.hpp"
#include "domain/LedgerError.hpp"
#include <iostream>
#include <string>

namespace finance::adapters::primary {

namespace {

int statusFor(domain::ErrorKind kind) {
    switch (kind) {
        case domain::ErrorKind::VALIDATION:          return 400;
        case domain::ErrorKind::NOT_FOUND:           return 404;
        case domain::ErrorKind::INSUFFICIENT_FUNDS:  return 422;
        case domain::ErrorKind::CONCURRENCY_TIMEOUT: return 503;
    }
    return 500;
}

// Невалидный UTF-8 заменяется на U+FFFD, сериализация ответа не бросает
std::string serialize(const nlohmann::json& reply) {
    return reply.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

void CommandRouter::addRoute(const std::string& op, std::shared_ptr<ICommandHandler> handler) {
    routes_[op] = std::move(handler);
}

bool CommandRouter::hasRoute(const std::string& op) const {
    return routes_.count(op) > 0;
}

CommandResponse CommandRouter::dispatch(const CommandRequest& req) const {
    auto it = routes_.find(req.op);
    if (it == routes_.end()) {
        return error(404, "Unknown command: " + req.op, "op");
    }

    CommandResponse res;
    try {
        it->second->handle(req, res);
    } catch (const domain::LedgerError& e) {
        std::cerr << "[CommandRouter] " << req.op << " failed (" << domain::toString(e.kind())
                  << "): " << e.what() << std::endl;
        return error(statusFor(e.kind()), e.what(), e.field());
    } catch (const std::exception& e) {
        std::cerr << "[CommandRouter] " << req.op << " internal error: " << e.what() << std::endl;
        return error(500, "Internal server error");
    }
    return res;
}

std::string CommandRouter::handleLine(const std::string& line) const {
    nlohmann::json command;
    try {
        command = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        // Текст ошибки парсера содержит сырые байты строки, в ответ он не попадает
        std::cerr << "[CommandRouter] Invalid JSON at byte " << e.byte << std::endl;
        return serialize(toJson(error(400, "Invalid JSON at byte " + std::to_string(e.byte) + ".")));
    }

    if (!command.is_object() || !command.contains("op") || !command["op"].is_string()) {
        return serialize(toJson(error(400, "This field is required.", "op")));
    }
    if (!command.contains("user") || !command["user"].is_string() ||
        command["user"].get<std::string>().empty()) {
        return serialize(toJson(error(400, "This field is required.", "user")));
    }

    CommandRequest req;
    req.op = command["op"].get<std::string>();
    req.userId = command["user"].get<std::string>();
    if (command.contains("data") && command["data"].is_object()) {
        req.data = command["data"];
    }
    return serialize(toJson(dispatch(req)));
}

nlohmann::json CommandRouter::toJson(const CommandResponse& res) {
    nlohmann::json j;
    j["status"] = res.status;
    if (res.status >= 400 && res.body.is_object() && res.body.contains("error")) {
        j["error"] = res.body["error"];
        if (res.body.contains("field")) {
            j["field"] = res.body["field"];
        }
    } else {
        j["body"] = res.body;
    }
    return j;
}

CommandResponse CommandRouter::error(int status, const std::string& message, const std::string& field) {
    CommandResponse res;
    res.status = status;
    res.body = {{"error", message}};
    if (!field.empty()) {
        res.body["field"] = field;
    }
    return res;
}

} // namespace finance::adapters::primary
