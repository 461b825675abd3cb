#pragma once

#include "domain/Account.hpp"
#include "domain/Category.hpp"
#include "domain/Money.hpp"
#include "domain/LedgerError.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ICategoryRepository.hpp"
#include <string>
#include <cstdint>

namespace finance::application::validation {

/**
 * @brief Сумма записи: строго положительная и помещается в NUMERIC(12,2)
 */
inline void requirePositiveAmount(const domain::Money& amount) {
    if (!amount.isPositive()) {
        throw domain::ValidationError("Amount must be greater than 0.", "amount");
    }
    if (!amount.fitsStorage()) {
        throw domain::ValidationError(
            "Ensure that there are no more than 10 digits before the decimal point.", "amount");
    }
}

/**
 * @brief Счёт, на который ссылается запись
 *
 * @param allowSystem разрешить системный счёт (только зачисление зарплаты)
 * @param usage для сообщения об ошибке ("expenses", "incomes", ...)
 *
 * @throws domain::NotFoundError счёт не существует
 * @throws domain::ValidationError счёт чужой или системный
 */
inline domain::Account requireUsableAccount(
    ports::output::IAccountRepository& accounts,
    const std::string& userId,
    int64_t accountId,
    const std::string& field,
    bool allowSystem,
    const std::string& usage)
{
    auto account = accounts.findById(accountId);
    if (!account) {
        throw domain::NotFoundError("Account not found.", field);
    }
    if (account->userId != userId) {
        throw domain::ValidationError("Account must belong to the same user.", field);
    }
    if (account->isSystem && !allowSystem) {
        throw domain::ValidationError("System account cannot be used for " + usage + ".", field);
    }
    return *account;
}

/**
 * @throws domain::NotFoundError категория не существует
 * @throws domain::ValidationError категория чужая
 */
inline domain::Category requireOwnedCategory(
    ports::output::ICategoryRepository& categories,
    const std::string& userId,
    int64_t categoryId)
{
    auto category = categories.findById(categoryId);
    if (!category) {
        throw domain::NotFoundError("Category not found.", "category");
    }
    if (category->userId != userId) {
        throw domain::ValidationError("Category must belong to the same user.", "category");
    }
    return *category;
}

/**
 * @brief Имя счёта или категории: непустое, не длиннее 64 символов
 */
inline void requireValidName(const std::string& name) {
    if (name.empty()) {
        throw domain::ValidationError("This field is required.", "name");
    }
    if (name.size() > 64) {
        throw domain::ValidationError("Ensure this field has no more than 64 characters.", "name");
    }
}

} // namespace finance::application::validation
