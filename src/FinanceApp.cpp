#include "FinanceApp.hpp"

#include <boost/di.hpp>

// Handlers (Primary Adapters)
#include "adapters/primary/AccountHandler.hpp"
#include "adapters/primary/CategoryHandler.hpp"
#include "adapters/primary/ExpenseHandler.hpp"
#include "adapters/primary/IncomeHandler.hpp"
#include "adapters/primary/TransferHandler.hpp"
#include "adapters/primary/ReportHandler.hpp"

// Application Services
#include "application/AccountService.hpp"
#include "application/CategoryService.hpp"
#include "application/ExpenseService.hpp"
#include "application/IncomeService.hpp"
#include "application/TransferService.hpp"
#include "application/SystemAccountProvisioner.hpp"
#include "application/ReportService.hpp"

// Secondary Adapters
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/PostgresLedgerStore.hpp"

#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

#include <iostream>
#include <string>

namespace di = boost::di;

using namespace finance;

namespace
{
    std::shared_ptr<ports::output::IUnitOfWorkFactory> createStore(
        const std::shared_ptr<settings::LedgerSettings>& settings)
    {
        if (settings->usePostgres())
        {
            auto dbSettings = std::make_shared<settings::DbSettings>();
            std::cout << "[FinanceApp] Storage: PostgreSQL " << dbSettings->describe() << std::endl;
            return std::make_shared<adapters::secondary::PostgresLedgerStore>(dbSettings, settings);
        }
        std::cout << "[FinanceApp] Storage: in-memory" << std::endl;
        return std::make_shared<adapters::secondary::InMemoryLedgerStore>(settings);
    }
}

// ============================================================================
// FinanceApp Implementation
// ============================================================================

FinanceApp::FinanceApp()
    : settings_(std::make_shared<settings::LedgerSettings>())
{
    printStartupBanner();
    store_ = createStore(settings_);
    configureInjection();
}

FinanceApp::FinanceApp(
    std::shared_ptr<settings::LedgerSettings> settings,
    std::shared_ptr<ports::output::IUnitOfWorkFactory> store)
    : settings_(std::move(settings))
    , store_(std::move(store))
{
    configureInjection();
}

FinanceApp::~FinanceApp()
{
    std::cout << "[FinanceApp] Application destroyed" << std::endl;
}

void FinanceApp::configureInjection()
{
    std::cout << "[FinanceApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<settings::LedgerSettings>().to(settings_),

        di::bind<ports::output::IUnitOfWorkFactory>().to(store_),

        di::bind<ports::output::IClock>()
            .to<adapters::secondary::SystemClock>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ports::input::ISystemAccountProvisioner>()
            .to<application::SystemAccountProvisioner>()
            .in(di::singleton),

        di::bind<ports::input::IAccountService>()
            .to<application::AccountService>()
            .in(di::singleton),

        di::bind<ports::input::ICategoryService>()
            .to<application::CategoryService>()
            .in(di::singleton),

        di::bind<ports::input::IExpenseService>()
            .to<application::ExpenseService>()
            .in(di::singleton),

        di::bind<ports::input::IIncomeService>()
            .to<application::IncomeService>()
            .in(di::singleton),

        di::bind<ports::input::ITransferService>()
            .to<application::TransferService>()
            .in(di::singleton),

        di::bind<ports::input::IReportService>()
            .to<application::ReportService>()
            .in(di::singleton));

    // ========================================================================
    // Layer 3: Primary Adapters (command handlers)
    // ========================================================================

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::AccountHandler>>();
        for (const char* op : {"account.create", "account.rename", "account.list",
                               "account.get", "account.delete"})
        {
            router_.addRoute(op, handler);
        }
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::CategoryHandler>>();
        for (const char* op : {"category.create", "category.rename", "category.list",
                               "category.get", "category.delete"})
        {
            router_.addRoute(op, handler);
        }
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::ExpenseHandler>>();
        for (const char* op : {"expense.create", "expense.update", "expense.delete",
                               "expense.get", "expense.list"})
        {
            router_.addRoute(op, handler);
        }
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::IncomeHandler>>();
        for (const char* op : {"income.create", "income.update", "income.delete",
                               "income.get", "income.list"})
        {
            router_.addRoute(op, handler);
        }
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::TransferHandler>>();
        for (const char* op : {"transfer.create", "transfer.update", "transfer.delete",
                               "transfer.get", "transfer.list",
                               "transfer.salary", "transfer.salary_random"})
        {
            router_.addRoute(op, handler);
        }
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::ReportHandler>>();
        for (const char* op : {"report.summary", "report.categories", "report.transfer_total",
                               "report.income_total", "report.monthly_cashflow"})
        {
            router_.addRoute(op, handler);
        }
    }

    std::cout << "[FinanceApp] DI configuration completed" << std::endl;
}

size_t FinanceApp::run(std::istream& in, std::ostream& out)
{
    running_ = true;
    size_t processed = 0;

    std::string line;
    while (running_ && std::getline(in, line))
    {
        if (line.find_first_not_of(" \t\r") == std::string::npos)
        {
            continue;
        }
        out << router_.handleLine(line) << std::endl;
        ++processed;
    }

    running_ = false;
    std::cout << "[FinanceApp] Processed " << processed << " commands" << std::endl;
    return processed;
}

void FinanceApp::stop()
{
    running_ = false;
}

void FinanceApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║          Finance Tracker Ledger Service              ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Protocol:     one JSON command per line             ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
