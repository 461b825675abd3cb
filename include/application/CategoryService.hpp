#pragma once

#include "ports/input/ICategoryService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IClock.hpp"
#include "application/TransactionScope.hpp"
#include "application/EntryValidation.hpp"
#include "domain/LedgerError.hpp"
#include <memory>
#include <iostream>

namespace finance::application {

/**
 * @brief Сервис категорий расходов
 */
class CategoryService : public ports::input::ICategoryService {
public:
    CategoryService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<ports::output::IClock> clock
    ) : uowFactory_(std::move(uowFactory))
      , clock_(std::move(clock))
    {}

    domain::Category createCategory(
        const std::string& userId,
        const domain::CategoryRequest& request
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            validateName(uow, userId, request.name, 0);

            domain::Category category;
            category.userId = userId;
            category.name = request.name;
            category.createdAt = clock_->now();
            category.updatedAt = category.createdAt;
            auto saved = uow.categories().insert(category);

            std::cout << "[CategoryService] Created category " << saved.id
                      << " '" << saved.name << "'" << std::endl;
            return saved;
        });
    }

    domain::Category renameCategory(
        const std::string& userId,
        int64_t categoryId,
        const domain::CategoryRequest& request
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto category = requireOwned(uow, userId, categoryId);
            validateName(uow, userId, request.name, categoryId);

            category.name = request.name;
            category.updatedAt = clock_->now();
            uow.categories().update(category);
            return category;
        });
    }

    std::vector<domain::Category> listCategories(const std::string& userId) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            return uow.categories().findByUserId(userId);
        });
    }

    std::optional<domain::Category> getCategory(
        const std::string& userId,
        int64_t categoryId
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto category = uow.categories().findById(categoryId);
            if (!category || category->userId != userId) {
                return std::optional<domain::Category>();
            }
            return category;
        });
    }

    void deleteCategory(const std::string& userId, int64_t categoryId) override {
        runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            requireOwned(uow, userId, categoryId);
            if (uow.categories().isReferenced(categoryId)) {
                throw domain::ValidationError("Category is used by expenses; delete them first.");
            }
            uow.categories().deleteById(categoryId);

            std::cout << "[CategoryService] Deleted category " << categoryId << std::endl;
        });
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<ports::output::IClock> clock_;

    domain::Category requireOwned(
        ports::output::IUnitOfWork& uow,
        const std::string& userId,
        int64_t categoryId
    ) {
        auto category = uow.categories().findById(categoryId);
        if (!category || category->userId != userId) {
            throw domain::NotFoundError("Category not found.");
        }
        return *category;
    }

    void validateName(
        ports::output::IUnitOfWork& uow,
        const std::string& userId,
        const std::string& name,
        int64_t selfId
    ) {
        validation::requireValidName(name);
        for (const auto& category : uow.categories().findByUserId(userId)) {
            if (category.name == name && category.id != selfId) {
                throw domain::ValidationError("Category with this name already exists.", "name");
            }
        }
    }
};

} // namespace finance::application
