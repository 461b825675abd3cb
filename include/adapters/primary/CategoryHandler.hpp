// include/adapters/primary/CategoryHandler.hpp
#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/ICategoryService.hpp"
#include <memory>
#include <iostream>

namespace finance::adapters::primary {

/**
 * @brief Команды категорий: category.create / rename / list / get / delete
 */
class CategoryHandler : public ICommandHandler {
public:
    explicit CategoryHandler(std::shared_ptr<ports::input::ICategoryService> categoryService)
        : categoryService_(std::move(categoryService))
    {
        std::cout << "[CategoryHandler] Created" << std::endl;
    }

    void handle(const CommandRequest& req, CommandResponse& res) override {
        if (req.op == "category.create") {
            domain::CategoryRequest request{JsonMapper::requireString(req.data, "name")};
            res.status = 201;
            res.body = JsonMapper::toJson(categoryService_->createCategory(req.userId, request));
        } else if (req.op == "category.rename") {
            domain::CategoryRequest request{JsonMapper::requireString(req.data, "name")};
            res.status = 200;
            res.body = JsonMapper::toJson(categoryService_->renameCategory(
                req.userId, JsonMapper::requireId(req.data, "id"), request));
        } else if (req.op == "category.list") {
            res.status = 200;
            res.body = JsonMapper::toJsonArray(categoryService_->listCategories(req.userId));
        } else if (req.op == "category.get") {
            auto category = categoryService_->getCategory(req.userId, JsonMapper::requireId(req.data, "id"));
            if (!category) {
                sendNotFound(res);
                return;
            }
            res.status = 200;
            res.body = JsonMapper::toJson(*category);
        } else if (req.op == "category.delete") {
            categoryService_->deleteCategory(req.userId, JsonMapper::requireId(req.data, "id"));
            res.status = 204;
            res.body = nullptr;
        } else {
            sendNotFound(res);
        }
    }

private:
    std::shared_ptr<ports::input::ICategoryService> categoryService_;

    void sendNotFound(CommandResponse& res) {
        res.status = 404;
        res.body = {{"error", "Not found."}};
    }
};

} // namespace finance::adapters::primary
