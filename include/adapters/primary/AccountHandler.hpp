// include/adapters/primary/AccountHandler.hpp
#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/IAccountService.hpp"
#include <memory>
#include <iostream>

namespace finance::adapters::primary {

/**
 * @brief Команды управления счетами
 *
 * - account.create  {"name"}
 * - account.rename  {"id", "name"}
 * - account.list    {}
 * - account.get     {"id"}
 * - account.delete  {"id"}
 */
class AccountHandler : public ICommandHandler {
public:
    explicit AccountHandler(std::shared_ptr<ports::input::IAccountService> accountService)
        : accountService_(std::move(accountService))
    {
        std::cout << "[AccountHandler] Created" << std::endl;
    }

    void handle(const CommandRequest& req, CommandResponse& res) override {
        if (req.op == "account.create") {
            domain::AccountRequest request{JsonMapper::requireString(req.data, "name")};
            auto account = accountService_->createAccount(req.userId, request);
            res.status = 201;
            res.body = JsonMapper::toJson(account);
        } else if (req.op == "account.rename") {
            domain::AccountRequest request{JsonMapper::requireString(req.data, "name")};
            auto account = accountService_->renameAccount(
                req.userId, JsonMapper::requireId(req.data, "id"), request);
            res.status = 200;
            res.body = JsonMapper::toJson(account);
        } else if (req.op == "account.list") {
            res.status = 200;
            res.body = JsonMapper::toJsonArray(accountService_->listAccounts(req.userId));
        } else if (req.op == "account.get") {
            auto account = accountService_->getAccount(req.userId, JsonMapper::requireId(req.data, "id"));
            if (!account) {
                sendNotFound(res);
                return;
            }
            res.status = 200;
            res.body = JsonMapper::toJson(*account);
        } else if (req.op == "account.delete") {
            accountService_->deleteAccount(req.userId, JsonMapper::requireId(req.data, "id"));
            res.status = 204;
            res.body = nullptr;
        } else {
            sendNotFound(res);
        }
    }

private:
    std::shared_ptr<ports::input::IAccountService> accountService_;

    void sendNotFound(CommandResponse& res) {
        res.status = 404;
        res.body = {{"error", "Not found."}};
    }
};

} // namespace finance::adapters::primary
