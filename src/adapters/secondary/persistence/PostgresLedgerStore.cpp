// src/adapters/secondary/persistence/PostgresLedgerStore.cpp
#include "adapters/secondary/persistence/PostgresLedgerStore.hpp"
#include "domain/LedgerError.hpp"
#include <pqxx/pqxx>
#include <optional>
#include <string>
#include <vector>
#include <algorithm>
#include <iostream>

namespace finance::adapters::secondary {

namespace {

/**
 * @brief Перевести ошибку PostgreSQL в ошибку ядра
 *
 * SQLSTATE:
 * - 55P03 lock_not_available, 40P01 deadlock, 40001 serialization -> ConcurrencyTimeout
 * - 23505 unique_violation       -> ValidationError (поле name)
 * - 23503 foreign_key_violation  -> ValidationError
 * - 23514 check_violation        -> ValidationError
 * - 22003 numeric_value_out_of_range -> ValidationError (поле amount)
 * Остальные ошибки пробрасываются как есть.
 */
[[noreturn]] void translate(const pqxx::sql_error& e) {
    const std::string& state = e.sqlstate();
    std::cerr << "[PostgresLedgerStore] SQL error " << state << ": " << e.what() << std::endl;

    if (state == "55P03" || state == "40P01" || state == "40001") {
        throw domain::ConcurrencyTimeout("Could not lock rows, try again.");
    }
    if (state == "23505") {
        throw domain::ValidationError("An object with this name already exists.", "name");
    }
    if (state == "23503") {
        throw domain::ValidationError("Row is referenced by ledger entries; delete them first.");
    }
    if (state == "23514") {
        throw domain::ValidationError("Row violates a check constraint.");
    }
    if (state == "22003") {
        throw domain::ValidationError("Amount is out of range.", "amount");
    }
    throw;
}

template <typename... Args>
pqxx::result execParams(pqxx::work& txn, const std::string& sql, Args&&... args) {
    try {
        return txn.exec_params(sql, std::forward<Args>(args)...);
    } catch (const pqxx::sql_error& e) {
        translate(e);
    }
}

std::optional<int64_t> toSeconds(const std::optional<domain::Timestamp>& ts) {
    return ts ? std::optional<int64_t>(ts->toUnixSeconds()) : std::nullopt;
}

domain::Timestamp timestampOf(const pqxx::row& row, const char* column) {
    return domain::Timestamp::fromUnixSeconds(row[column].as<int64_t>());
}

// ============================================
// Счета
// ============================================

const char* const ACCOUNT_COLUMNS =
    "id, user_id, name, balance::text AS balance, is_system, "
    "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at";

domain::Account accountFromRow(const pqxx::row& row) {
    domain::Account account;
    account.id = row["id"].as<int64_t>();
    account.userId = row["user_id"].as<std::string>();
    account.name = row["name"].as<std::string>();
    account.balance = domain::Money::fromString(row["balance"].as<std::string>());
    account.isSystem = row["is_system"].as<bool>();
    account.createdAt = timestampOf(row, "created_at");
    return account;
}

class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(pqxx::work& txn) : txn_(txn) {}

    std::optional<domain::Account> findById(int64_t id) override {
        auto result = execParams(txn_,
            std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM accounts WHERE id = $1", id);
        return single(result);
    }

    std::optional<domain::Account> findByName(
        const std::string& userId,
        const std::string& name
    ) override {
        auto result = execParams(txn_,
            std::string("SELECT ") + ACCOUNT_COLUMNS +
            " FROM accounts WHERE user_id = $1 AND name = $2", userId, name);
        return single(result);
    }

    std::optional<domain::Account> findSystemAccount(const std::string& userId) override {
        auto result = execParams(txn_,
            std::string("SELECT ") + ACCOUNT_COLUMNS +
            " FROM accounts WHERE user_id = $1 AND is_system", userId);
        return single(result);
    }

    std::vector<domain::Account> findByUserId(const std::string& userId) override {
        auto result = execParams(txn_,
            std::string("SELECT ") + ACCOUNT_COLUMNS +
            " FROM accounts WHERE user_id = $1 AND NOT is_system ORDER BY name, id", userId);

        std::vector<domain::Account> accounts;
        for (const auto& row : result) {
            accounts.push_back(accountFromRow(row));
        }
        return accounts;
    }

    domain::Account insert(const domain::Account& account) override {
        auto result = execParams(txn_,
            std::string("INSERT INTO accounts (user_id, name, balance, is_system, created_at) "
                        "VALUES ($1, $2, $3::numeric, $4, to_timestamp($5)) RETURNING ") +
            ACCOUNT_COLUMNS,
            account.userId, account.name, account.balance.toString(),
            account.isSystem, account.createdAt.toUnixSeconds());
        return accountFromRow(result[0]);
    }

    std::optional<domain::Account> insertIfAbsent(const domain::Account& account) override {
        // Конкурирующая вставка ждёт фиксации первой и получает пустой RETURNING
        auto result = execParams(txn_,
            std::string("INSERT INTO accounts (user_id, name, balance, is_system, created_at) "
                        "VALUES ($1, $2, $3::numeric, $4, to_timestamp($5)) "
                        "ON CONFLICT DO NOTHING RETURNING ") + ACCOUNT_COLUMNS,
            account.userId, account.name, account.balance.toString(),
            account.isSystem, account.createdAt.toUnixSeconds());
        return single(result);
    }

    void rename(int64_t id, const std::string& name) override {
        auto result = execParams(txn_,
            "UPDATE accounts SET name = $2 WHERE id = $1", id, name);
        if (result.affected_rows() == 0) {
            throw domain::NotFoundError("Account not found.");
        }
    }

    bool deleteById(int64_t id) override {
        auto result = execParams(txn_, "DELETE FROM accounts WHERE id = $1", id);
        return result.affected_rows() > 0;
    }

    void adjustBalance(int64_t id, const domain::Money& delta) override {
        auto result = execParams(txn_,
            "UPDATE accounts SET balance = balance + $2::numeric WHERE id = $1",
            id, delta.toString());
        if (result.affected_rows() == 0) {
            throw domain::NotFoundError("Account not found.");
        }
    }

    std::vector<domain::Account> lockForUpdate(const std::vector<int64_t>& ids) override {
        std::vector<int64_t> ordered = ids;
        std::sort(ordered.begin(), ordered.end());
        ordered.erase(std::unique(ordered.begin(), ordered.end()), ordered.end());

        std::string array = "{";
        for (size_t i = 0; i < ordered.size(); ++i) {
            array += (i ? "," : "") + std::to_string(ordered[i]);
        }
        array += "}";

        auto result = execParams(txn_,
            std::string("SELECT ") + ACCOUNT_COLUMNS +
            " FROM accounts WHERE id = ANY($1::bigint[]) ORDER BY id FOR UPDATE", array);

        std::vector<domain::Account> accounts;
        for (const auto& row : result) {
            accounts.push_back(accountFromRow(row));
        }
        return accounts;
    }

    bool isReferenced(int64_t id) override {
        auto result = execParams(txn_,
            "SELECT EXISTS (SELECT 1 FROM expenses WHERE account_id = $1) "
            "OR EXISTS (SELECT 1 FROM incomes WHERE account_id = $1) "
            "OR EXISTS (SELECT 1 FROM transfers WHERE from_account_id = $1 OR to_account_id = $1)",
            id);
        return result[0][0].as<bool>();
    }

private:
    pqxx::work& txn_;

    static std::optional<domain::Account> single(const pqxx::result& result) {
        if (result.empty()) {
            return std::nullopt;
        }
        return accountFromRow(result[0]);
    }
};

// ============================================
// Категории
// ============================================

const char* const CATEGORY_COLUMNS =
    "id, user_id, name, "
    "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at, "
    "EXTRACT(EPOCH FROM updated_at)::BIGINT AS updated_at";

domain::Category categoryFromRow(const pqxx::row& row) {
    domain::Category category;
    category.id = row["id"].as<int64_t>();
    category.userId = row["user_id"].as<std::string>();
    category.name = row["name"].as<std::string>();
    category.createdAt = timestampOf(row, "created_at");
    category.updatedAt = timestampOf(row, "updated_at");
    return category;
}

class PostgresCategoryRepository : public ports::output::ICategoryRepository {
public:
    explicit PostgresCategoryRepository(pqxx::work& txn) : txn_(txn) {}

    std::optional<domain::Category> findById(int64_t id) override {
        auto result = execParams(txn_,
            std::string("SELECT ") + CATEGORY_COLUMNS + " FROM categories WHERE id = $1", id);
        if (result.empty()) {
            return std::nullopt;
        }
        return categoryFromRow(result[0]);
    }

    std::vector<domain::Category> findByUserId(const std::string& userId) override {
        auto result = execParams(txn_,
            std::string("SELECT ") + CATEGORY_COLUMNS +
            " FROM categories WHERE user_id = $1 ORDER BY name, id", userId);

        std::vector<domain::Category> categories;
        for (const auto& row : result) {
            categories.push_back(categoryFromRow(row));
        }
        return categories;
    }

    domain::Category insert(const domain::Category& category) override {
        auto result = execParams(txn_,
            std::string("INSERT INTO categories (user_id, name, created_at, updated_at) "
                        "VALUES ($1, $2, to_timestamp($3), to_timestamp($4)) RETURNING ") +
            CATEGORY_COLUMNS,
            category.userId, category.name,
            category.createdAt.toUnixSeconds(), category.updatedAt.toUnixSeconds());
        return categoryFromRow(result[0]);
    }

    void update(const domain::Category& category) override {
        auto result = execParams(txn_,
            "UPDATE categories SET name = $2, updated_at = to_timestamp($3) WHERE id = $1",
            category.id, category.name, category.updatedAt.toUnixSeconds());
        if (result.affected_rows() == 0) {
            throw domain::NotFoundError("Category not found.");
        }
    }

    bool deleteById(int64_t id) override {
        auto result = execParams(txn_, "DELETE FROM categories WHERE id = $1", id);
        return result.affected_rows() > 0;
    }

    bool isReferenced(int64_t id) override {
        auto result = execParams(txn_,
            "SELECT EXISTS (SELECT 1 FROM expenses WHERE category_id = $1)", id);
        return result[0][0].as<bool>();
    }

private:
    pqxx::work& txn_;
};

// ============================================
// Записи
// ============================================

class PostgresExpenseRepository : public ports::output::IExpenseRepository {
public:
    explicit PostgresExpenseRepository(pqxx::work& txn) : txn_(txn) {}

    std::optional<domain::Expense> findById(int64_t id) override {
        return single(execParams(txn_, select() + " WHERE id = $1", id));
    }

    std::optional<domain::Expense> findByIdForUpdate(int64_t id) override {
        return single(execParams(txn_, select() + " WHERE id = $1 FOR UPDATE", id));
    }

    std::vector<domain::Expense> findByUserId(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) override {
        auto result = execParams(txn_,
            select() +
            " WHERE user_id = $1"
            " AND ($2::bigint IS NULL OR created_at >= to_timestamp($2))"
            " AND ($3::bigint IS NULL OR created_at <= to_timestamp($3))"
            " AND ($4::bigint IS NULL OR account_id = $4)"
            " ORDER BY created_at DESC, id DESC",
            userId, toSeconds(filter.from), toSeconds(filter.to), filter.accountId);

        std::vector<domain::Expense> expenses;
        for (const auto& row : result) {
            expenses.push_back(fromRow(row));
        }
        return expenses;
    }

    domain::Expense insert(const domain::Expense& entry) override {
        auto result = execParams(txn_,
            "INSERT INTO expenses (user_id, account_id, category_id, amount, description, "
            "created_at, updated_at) "
            "VALUES ($1, $2, $3, $4::numeric, $5, to_timestamp($6), to_timestamp($7)) RETURNING id",
            entry.userId, entry.accountId, entry.categoryId, entry.amount.toString(),
            entry.description, entry.createdAt.toUnixSeconds(), entry.updatedAt.toUnixSeconds());

        domain::Expense saved = entry;
        saved.id = result[0]["id"].as<int64_t>();
        return saved;
    }

    void update(const domain::Expense& entry) override {
        auto result = execParams(txn_,
            "UPDATE expenses SET account_id = $2, category_id = $3, amount = $4::numeric, "
            "description = $5, updated_at = to_timestamp($6) WHERE id = $1",
            entry.id, entry.accountId, entry.categoryId, entry.amount.toString(),
            entry.description, entry.updatedAt.toUnixSeconds());
        if (result.affected_rows() == 0) {
            throw domain::NotFoundError("Expense not found.");
        }
    }

    bool deleteById(int64_t id) override {
        return execParams(txn_, "DELETE FROM expenses WHERE id = $1", id).affected_rows() > 0;
    }

private:
    pqxx::work& txn_;

    static std::string select() {
        return "SELECT id, user_id, account_id, category_id, amount::text AS amount, description, "
               "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at, "
               "EXTRACT(EPOCH FROM updated_at)::BIGINT AS updated_at FROM expenses";
    }

    static domain::Expense fromRow(const pqxx::row& row) {
        domain::Expense expense;
        expense.id = row["id"].as<int64_t>();
        expense.userId = row["user_id"].as<std::string>();
        expense.accountId = row["account_id"].as<int64_t>();
        expense.categoryId = row["category_id"].as<int64_t>();
        expense.amount = domain::Money::fromString(row["amount"].as<std::string>());
        expense.description = row["description"].as<std::string>();
        expense.createdAt = timestampOf(row, "created_at");
        expense.updatedAt = timestampOf(row, "updated_at");
        return expense;
    }

    static std::optional<domain::Expense> single(const pqxx::result& result) {
        if (result.empty()) {
            return std::nullopt;
        }
        return fromRow(result[0]);
    }
};

class PostgresIncomeRepository : public ports::output::IIncomeRepository {
public:
    explicit PostgresIncomeRepository(pqxx::work& txn) : txn_(txn) {}

    std::optional<domain::Income> findById(int64_t id) override {
        return single(execParams(txn_, select() + " WHERE id = $1", id));
    }

    std::optional<domain::Income> findByIdForUpdate(int64_t id) override {
        return single(execParams(txn_, select() + " WHERE id = $1 FOR UPDATE", id));
    }

    std::vector<domain::Income> findByUserId(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) override {
        auto result = execParams(txn_,
            select() +
            " WHERE user_id = $1"
            " AND ($2::bigint IS NULL OR created_at >= to_timestamp($2))"
            " AND ($3::bigint IS NULL OR created_at <= to_timestamp($3))"
            " AND ($4::bigint IS NULL OR account_id = $4)"
            " ORDER BY created_at DESC, id DESC",
            userId, toSeconds(filter.from), toSeconds(filter.to), filter.accountId);

        std::vector<domain::Income> incomes;
        for (const auto& row : result) {
            incomes.push_back(fromRow(row));
        }
        return incomes;
    }

    domain::Income insert(const domain::Income& entry) override {
        auto result = execParams(txn_,
            "INSERT INTO incomes (user_id, account_id, amount, description, created_at, updated_at) "
            "VALUES ($1, $2, $3::numeric, $4, to_timestamp($5), to_timestamp($6)) RETURNING id",
            entry.userId, entry.accountId, entry.amount.toString(), entry.description,
            entry.createdAt.toUnixSeconds(), entry.updatedAt.toUnixSeconds());

        domain::Income saved = entry;
        saved.id = result[0]["id"].as<int64_t>();
        return saved;
    }

    void update(const domain::Income& entry) override {
        auto result = execParams(txn_,
            "UPDATE incomes SET account_id = $2, amount = $3::numeric, description = $4, "
            "updated_at = to_timestamp($5) WHERE id = $1",
            entry.id, entry.accountId, entry.amount.toString(), entry.description,
            entry.updatedAt.toUnixSeconds());
        if (result.affected_rows() == 0) {
            throw domain::NotFoundError("Income not found.");
        }
    }

    bool deleteById(int64_t id) override {
        return execParams(txn_, "DELETE FROM incomes WHERE id = $1", id).affected_rows() > 0;
    }

private:
    pqxx::work& txn_;

    static std::string select() {
        return "SELECT id, user_id, account_id, amount::text AS amount, description, "
               "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at, "
               "EXTRACT(EPOCH FROM updated_at)::BIGINT AS updated_at FROM incomes";
    }

    static domain::Income fromRow(const pqxx::row& row) {
        domain::Income income;
        income.id = row["id"].as<int64_t>();
        income.userId = row["user_id"].as<std::string>();
        income.accountId = row["account_id"].as<int64_t>();
        income.amount = domain::Money::fromString(row["amount"].as<std::string>());
        income.description = row["description"].as<std::string>();
        income.createdAt = timestampOf(row, "created_at");
        income.updatedAt = timestampOf(row, "updated_at");
        return income;
    }

    static std::optional<domain::Income> single(const pqxx::result& result) {
        if (result.empty()) {
            return std::nullopt;
        }
        return fromRow(result[0]);
    }
};

class PostgresTransferRepository : public ports::output::ITransferRepository {
public:
    explicit PostgresTransferRepository(pqxx::work& txn) : txn_(txn) {}

    std::optional<domain::Transfer> findById(int64_t id) override {
        return single(execParams(txn_, select() + " WHERE id = $1", id));
    }

    std::optional<domain::Transfer> findByIdForUpdate(int64_t id) override {
        return single(execParams(txn_, select() + " WHERE id = $1 FOR UPDATE", id));
    }

    std::vector<domain::Transfer> findByUserId(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) override {
        auto result = execParams(txn_,
            select() +
            " WHERE user_id = $1"
            " AND ($2::bigint IS NULL OR created_at >= to_timestamp($2))"
            " AND ($3::bigint IS NULL OR created_at <= to_timestamp($3))"
            " AND ($4::bigint IS NULL OR from_account_id = $4 OR to_account_id = $4)"
            " AND ($5::bigint IS NULL OR from_account_id = $5)"
            " AND ($6::bigint IS NULL OR to_account_id = $6)"
            " ORDER BY created_at DESC, id DESC",
            userId, toSeconds(filter.from), toSeconds(filter.to),
            filter.accountId, filter.fromAccountId, filter.toAccountId);

        std::vector<domain::Transfer> transfers;
        for (const auto& row : result) {
            transfers.push_back(fromRow(row));
        }
        return transfers;
    }

    domain::Transfer insert(const domain::Transfer& entry) override {
        auto result = execParams(txn_,
            "INSERT INTO transfers (user_id, from_account_id, to_account_id, amount, created_at) "
            "VALUES ($1, $2, $3, $4::numeric, to_timestamp($5)) RETURNING id",
            entry.userId, entry.fromAccountId, entry.toAccountId, entry.amount.toString(),
            entry.createdAt.toUnixSeconds());

        domain::Transfer saved = entry;
        saved.id = result[0]["id"].as<int64_t>();
        return saved;
    }

    void update(const domain::Transfer& entry) override {
        auto result = execParams(txn_,
            "UPDATE transfers SET from_account_id = $2, to_account_id = $3, amount = $4::numeric "
            "WHERE id = $1",
            entry.id, entry.fromAccountId, entry.toAccountId, entry.amount.toString());
        if (result.affected_rows() == 0) {
            throw domain::NotFoundError("Transfer not found.");
        }
    }

    bool deleteById(int64_t id) override {
        return execParams(txn_, "DELETE FROM transfers WHERE id = $1", id).affected_rows() > 0;
    }

private:
    pqxx::work& txn_;

    static std::string select() {
        return "SELECT id, user_id, from_account_id, to_account_id, amount::text AS amount, "
               "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at FROM transfers";
    }

    static domain::Transfer fromRow(const pqxx::row& row) {
        domain::Transfer transfer;
        transfer.id = row["id"].as<int64_t>();
        transfer.userId = row["user_id"].as<std::string>();
        transfer.fromAccountId = row["from_account_id"].as<int64_t>();
        transfer.toAccountId = row["to_account_id"].as<int64_t>();
        transfer.amount = domain::Money::fromString(row["amount"].as<std::string>());
        transfer.createdAt = timestampOf(row, "created_at");
        return transfer;
    }

    static std::optional<domain::Transfer> single(const pqxx::result& result) {
        if (result.empty()) {
            return std::nullopt;
        }
        return fromRow(result[0]);
    }
};

// ============================================
// Единица работы
// ============================================

class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    PostgresUnitOfWork(const std::string& connectionString, std::chrono::milliseconds lockTimeout)
        : conn_(connectionString)
        , txn_(conn_)
        , accounts_(txn_)
        , categories_(txn_)
        , expenses_(txn_)
        , incomes_(txn_)
        , transfers_(txn_)
    {
        txn_.exec("SET LOCAL lock_timeout = " +
                  txn_.quote(std::to_string(lockTimeout.count()) + "ms"));
    }

    ~PostgresUnitOfWork() override {
        if (finished_) {
            return;
        }
        try {
            txn_.abort();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] abort error: " << e.what() << std::endl;
        }
    }

    ports::output::IAccountRepository& accounts() override { return accounts_; }
    ports::output::ICategoryRepository& categories() override { return categories_; }
    ports::output::IExpenseRepository& expenses() override { return expenses_; }
    ports::output::IIncomeRepository& incomes() override { return incomes_; }
    ports::output::ITransferRepository& transfers() override { return transfers_; }

    void commit() override {
        if (finished_) {
            return;
        }
        finished_ = true;
        try {
            txn_.commit();
        } catch (const pqxx::sql_error& e) {
            translate(e);
        }
    }

    void rollback() override {
        if (finished_) {
            return;
        }
        finished_ = true;
        txn_.abort();
    }

private:
    pqxx::connection conn_;
    pqxx::work txn_;
    PostgresAccountRepository accounts_;
    PostgresCategoryRepository categories_;
    PostgresExpenseRepository expenses_;
    PostgresIncomeRepository incomes_;
    PostgresTransferRepository transfers_;
    bool finished_ = false;
};

} // namespace

PostgresLedgerStore::PostgresLedgerStore(
    std::shared_ptr<settings::DbSettings> dbSettings,
    std::shared_ptr<settings::LedgerSettings> ledgerSettings
) : dbSettings_(std::move(dbSettings))
  , ledgerSettings_(std::move(ledgerSettings))
{
    initSchema();
}

std::unique_ptr<ports::output::IUnitOfWork> PostgresLedgerStore::begin() {
    return std::make_unique<PostgresUnitOfWork>(
        dbSettings_->getConnectionString(), ledgerSettings_->getLockTimeout());
}

void PostgresLedgerStore::initSchema() {
    try {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS accounts (
                id BIGSERIAL PRIMARY KEY,
                user_id VARCHAR(64) NOT NULL,
                name VARCHAR(64) NOT NULL,
                balance NUMERIC(12,2) NOT NULL DEFAULT 0,
                is_system BOOLEAN NOT NULL DEFAULT FALSE,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                UNIQUE (user_id, name)
            )
        )");

        txn.exec(R"(
            CREATE UNIQUE INDEX IF NOT EXISTS idx_accounts_one_system_per_user
            ON accounts (user_id) WHERE is_system
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS categories (
                id BIGSERIAL PRIMARY KEY,
                user_id VARCHAR(64) NOT NULL,
                name VARCHAR(64) NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                UNIQUE (user_id, name)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS expenses (
                id BIGSERIAL PRIMARY KEY,
                user_id VARCHAR(64) NOT NULL,
                account_id BIGINT NOT NULL REFERENCES accounts(id) ON DELETE RESTRICT,
                category_id BIGINT NOT NULL REFERENCES categories(id) ON DELETE RESTRICT,
                amount NUMERIC(12,2) NOT NULL CHECK (amount > 0),
                description TEXT NOT NULL DEFAULT '',
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS incomes (
                id BIGSERIAL PRIMARY KEY,
                user_id VARCHAR(64) NOT NULL,
                account_id BIGINT NOT NULL REFERENCES accounts(id) ON DELETE RESTRICT,
                amount NUMERIC(12,2) NOT NULL CHECK (amount > 0),
                description TEXT NOT NULL DEFAULT '',
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS transfers (
                id BIGSERIAL PRIMARY KEY,
                user_id VARCHAR(64) NOT NULL,
                from_account_id BIGINT NOT NULL REFERENCES accounts(id) ON DELETE RESTRICT,
                to_account_id BIGINT NOT NULL REFERENCES accounts(id) ON DELETE RESTRICT,
                amount NUMERIC(12,2) NOT NULL CHECK (amount > 0),
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                CHECK (from_account_id <> to_account_id)
            )
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_expenses_user_created ON expenses (user_id, created_at)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_incomes_user_created ON incomes (user_id, created_at)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_transfers_user_created ON transfers (user_id, created_at)");

        txn.commit();
        std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "[PostgresLedgerStore] initSchema error: " << e.what() << std::endl;
        throw;
    }
}

} // namespace finance::adapters::secondary
