#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include <type_traits>
#include <utility>

namespace finance::application {

/**
 * @brief Выполнить функцию в одной единице работы
 *
 * Фиксирует транзакцию, если fn завершилась успешно. Любое исключение
 * (из fn или из commit) откатывает все изменения и пробрасывается дальше.
 *
 * @example
 * ```cpp
 * auto expense = runInTransaction(*uowFactory_, [&](IUnitOfWork& uow) {
 *     uow.accounts().adjustBalance(accountId, -amount);
 *     return uow.expenses().insert(expense);
 * });
 * ```
 */
template <typename Fn>
auto runInTransaction(ports::output::IUnitOfWorkFactory& factory, Fn&& fn)
    -> decltype(fn(std::declval<ports::output::IUnitOfWork&>()))
{
    using Result = decltype(fn(std::declval<ports::output::IUnitOfWork&>()));

    auto uow = factory.begin();
    try {
        if constexpr (std::is_void_v<Result>) {
            fn(*uow);
            uow->commit();
        } else {
            Result result = fn(*uow);
            uow->commit();
            return result;
        }
    } catch (...) {
        uow->rollback();
        throw;
    }
}

} // namespace finance::application
