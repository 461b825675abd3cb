#pragma once

#include "adapters/primary/CommandRouter.hpp"
#include <atomic>
#include <iosfwd>
#include <memory>

// Forward declarations - Ports
namespace finance::ports::output {
    class IUnitOfWorkFactory;
}

namespace finance::settings {
    class LedgerSettings;
}

/**
 * @class FinanceApp
 * @brief Приложение учёта личных финансов
 *
 * 1. Выбор хранилища по FINANCE_STORAGE (memory | postgres)
 * 2. configureInjection() - настройка Boost.DI и регистрация обработчиков команд
 * 3. run() - цикл "строка JSON на входе -> строка JSON на выходе"
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapters: JSON command handlers
 * - Secondary Adapters: InMemoryLedgerStore / PostgresLedgerStore, SystemClock
 *
 * Dependency Injection: Boost.DI
 * - Output Ports привязаны к выбранному хранилищу
 * - Input Ports привязаны к Application Services (singleton)
 */
class FinanceApp
{
public:
    /**
     * @brief Настройки и хранилище из переменных окружения
     */
    FinanceApp();

    /**
     * @brief Явные настройки и хранилище (тесты)
     */
    FinanceApp(
        std::shared_ptr<finance::settings::LedgerSettings> settings,
        std::shared_ptr<finance::ports::output::IUnitOfWorkFactory> store
    );

    ~FinanceApp();

    /**
     * @brief Обрабатывать команды построчно до EOF или stop()
     * @return Количество обработанных команд
     */
    size_t run(std::istream& in, std::ostream& out);

    void stop();

    const finance::adapters::primary::CommandRouter& router() const { return router_; }

private:
    std::shared_ptr<finance::settings::LedgerSettings> settings_;
    std::shared_ptr<finance::ports::output::IUnitOfWorkFactory> store_;
    finance::adapters::primary::CommandRouter router_;
    std::atomic<bool> running_{false};

    void configureInjection();
    void printStartupBanner();
};
