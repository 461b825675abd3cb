// src/adapters/secondary/persistence/InMemoryLedgerStore.cpp
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/RowLockTable.hpp"
#include "domain/LedgerError.hpp"
#include <map>
#include <mutex>
#include <atomic>
#include <vector>
#include <optional>
#include <iterator>
#include <algorithm>
#include <iostream>

namespace finance::adapters::secondary {

/**
 * @brief Строка, изменённая ещё не завершённой транзакцией
 */
template <typename Row>
struct PendingRow {
    uint64_t txnId = 0;
    std::optional<Row> committed;   ///< nullopt: строку вставила эта транзакция
};

/**
 * @brief Таблица с последними зафиксированными версиями изменённых строк
 *
 * rows хранит текущие версии, включая незафиксированные изменения.
 * Перед первым изменением строки транзакция сохраняет её зафиксированную
 * версию в pending и держит блокировку строки до конца работы.
 * Другие транзакции без блокировки читают версию из pending.
 *
 * Все методы вызываются под State::dataMutex.
 */
template <typename Row>
class LedgerTable {
public:
    struct Conflict {
        int64_t id = 0;
        bool pending = false;   ///< Строку меняет другая транзакция: ждать её завершения
    };

    std::map<int64_t, Row> rows;
    int64_t nextId = 1;

    void touch(int64_t id, uint64_t txnId) {
        if (pending_.count(id)) {
            return;
        }
        auto it = rows.find(id);
        PendingRow<Row> before;
        before.txnId = txnId;
        if (it != rows.end()) {
            before.committed = it->second;
        }
        pending_.emplace(id, std::move(before));
    }

    bool pendingByOther(int64_t id, uint64_t txnId) const {
        auto it = pending_.find(id);
        return it != pending_.end() && it->second.txnId != txnId;
    }

    /**
     * @brief Строка существует для кого-либо (текущая или зафиксированная версия)
     */
    bool known(int64_t id) const {
        return rows.count(id) > 0 || pending_.count(id) > 0;
    }

    std::optional<Row> visible(int64_t id, uint64_t txnId) const {
        auto p = pending_.find(id);
        if (p != pending_.end() && p->second.txnId != txnId) {
            return p->second.committed;
        }
        auto it = rows.find(id);
        return it != rows.end() ? std::optional<Row>(it->second) : std::nullopt;
    }

    std::vector<Row> visibleRows(uint64_t txnId) const {
        std::vector<Row> result;
        for (const auto& [id, row] : rows) {
            auto p = pending_.find(id);
            if (p == pending_.end() || p->second.txnId == txnId) {
                result.push_back(row);
            } else if (p->second.committed) {
                result.push_back(*p->second.committed);
            }
        }
        // Удалённые другими транзакциями, но ещё зафиксированные
        for (const auto& [id, before] : pending_) {
            if (before.txnId != txnId && before.committed && !rows.count(id)) {
                result.push_back(*before.committed);
            }
        }
        return result;
    }

    /**
     * @brief Найти строку, нарушающую уникальность, как уникальный индекс
     *
     * Смотрит текущие версии и зафиксированные версии строк, изменённых
     * другими транзакциями. Конфликт с собственной или зафиксированной
     * строкой окончательный; со строкой другой транзакции - ждать её.
     */
    template <typename Match>
    std::optional<Conflict> findConflict(uint64_t txnId, int64_t selfId, Match match) const {
        std::optional<Conflict> waitFor;
        for (const auto& [id, row] : rows) {
            if (id == selfId || !match(row)) {
                continue;
            }
            if (!pendingByOther(id, txnId)) {
                return Conflict{id, false};
            }
            waitFor = Conflict{id, true};
        }
        for (const auto& [id, before] : pending_) {
            if (id != selfId && before.txnId != txnId && before.committed && match(*before.committed)) {
                waitFor = Conflict{id, true};
            }
        }
        return waitFor;
    }

    /**
     * @brief Есть ли строка (в любой версии), удовлетворяющая условию
     */
    template <typename Match>
    bool anyVersion(Match match) const {
        for (const auto& [id, row] : rows) {
            if (match(row)) return true;
        }
        for (const auto& [id, before] : pending_) {
            if (before.committed && match(*before.committed)) return true;
        }
        return false;
    }

    void commit(uint64_t txnId) {
        for (auto it = pending_.begin(); it != pending_.end();) {
            it = it->second.txnId == txnId ? pending_.erase(it) : std::next(it);
        }
    }

    void rollback(uint64_t txnId) {
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.txnId != txnId) {
                ++it;
                continue;
            }
            if (it->second.committed) {
                rows[it->first] = *it->second.committed;
            } else {
                rows.erase(it->first);
            }
            it = pending_.erase(it);
        }
    }

private:
    std::map<int64_t, PendingRow<Row>> pending_;
};

struct InMemoryLedgerStore::State {
    explicit State(std::chrono::milliseconds lockTimeout) : locks(lockTimeout) {}

    // Защищает все таблицы.
    // Под этим мьютексом нельзя ждать блокировку строки.
    std::mutex dataMutex;

    LedgerTable<domain::Account> accounts;
    LedgerTable<domain::Category> categories;
    LedgerTable<domain::Expense> expenses;
    LedgerTable<domain::Income> incomes;
    LedgerTable<domain::Transfer> transfers;

    std::atomic<uint64_t> nextTxnId{1};
    RowLockTable locks;

    void commit(uint64_t txnId) {
        accounts.commit(txnId);
        categories.commit(txnId);
        expenses.commit(txnId);
        incomes.commit(txnId);
        transfers.commit(txnId);
    }

    void rollback(uint64_t txnId) {
        expenses.rollback(txnId);
        incomes.rollback(txnId);
        transfers.rollback(txnId);
        categories.rollback(txnId);
        accounts.rollback(txnId);
    }
};

namespace {

using State = InMemoryLedgerStore::State;

const char* const ACCOUNTS = "accounts";
const char* const CATEGORIES = "categories";

// ============================================
// Транзакция: номер и блокировки строк
// ============================================

class Transaction {
public:
    explicit Transaction(std::shared_ptr<State> state)
        : state_(std::move(state))
        , id_(state_->nextTxnId++)
    {}

    State& state() { return *state_; }
    uint64_t id() const { return id_; }

    /**
     * @brief Дождаться и захватить блокировку строки (не под dataMutex)
     */
    void lock(const std::string& table, int64_t rowId) {
        state_->locks.acquire(RowKey{table, rowId}, id_);
    }

    /**
     * @brief Захватить блокировку только что вставленной строки (под dataMutex)
     *
     * До снятия dataMutex строку никто другой не видит, поэтому захват не ждёт.
     */
    void claimNew(const std::string& table, int64_t rowId) {
        state_->locks.acquire(RowKey{table, rowId}, id_);
    }

    void commit() {
        {
            std::lock_guard<std::mutex> lock(state_->dataMutex);
            state_->commit(id_);
        }
        state_->locks.releaseAll(id_);
    }

    void rollback() {
        {
            std::lock_guard<std::mutex> lock(state_->dataMutex);
            state_->rollback(id_);
        }
        state_->locks.releaseAll(id_);
    }

private:
    std::shared_ptr<State> state_;
    uint64_t id_;
};

// ============================================
// Счета
// ============================================

class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    explicit InMemoryAccountRepository(Transaction& txn) : txn_(txn) {}

    std::optional<domain::Account> findById(int64_t id) override {
        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        return table().visible(id, txn_.id());
    }

    std::optional<domain::Account> findByName(
        const std::string& userId,
        const std::string& name
    ) override {
        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        for (const auto& account : table().visibleRows(txn_.id())) {
            if (account.userId == userId && account.name == name) {
                return account;
            }
        }
        return std::nullopt;
    }

    std::optional<domain::Account> findSystemAccount(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        for (const auto& account : table().visibleRows(txn_.id())) {
            if (account.userId == userId && account.isSystem) {
                return account;
            }
        }
        return std::nullopt;
    }

    std::vector<domain::Account> findByUserId(const std::string& userId) override {
        std::vector<domain::Account> result;
        {
            std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
            for (const auto& account : table().visibleRows(txn_.id())) {
                if (account.userId == userId && !account.isSystem) {
                    result.push_back(account);
                }
            }
        }
        std::sort(result.begin(), result.end(),
            [](const domain::Account& a, const domain::Account& b) {
                return a.name != b.name ? a.name < b.name : a.id < b.id;
            });
        return result;
    }

    domain::Account insert(const domain::Account& account) override {
        auto saved = insertIfAbsent(account);
        if (!saved) {
            throw domain::ValidationError("Account with this name already exists.", "name");
        }
        return *saved;
    }

    std::optional<domain::Account> insertIfAbsent(const domain::Account& account) override {
        auto& state = txn_.state();
        while (true) {
            int64_t pendingId = 0;
            {
                std::lock_guard<std::mutex> lock(state.dataMutex);
                auto conflict = findConflict(account.userId, account.name, account.isSystem, 0);
                if (!conflict) {
                    domain::Account row = account;
                    row.id = table().nextId++;
                    table().touch(row.id, txn_.id());
                    table().rows[row.id] = row;
                    txn_.claimNew(ACCOUNTS, row.id);
                    return row;
                }
                if (!conflict->pending) {
                    return std::nullopt;
                }
                pendingId = conflict->id;
            }
            // Как уникальный индекс PostgreSQL: ждём, чем закончится
            // транзакция, изменившая конфликтующую строку
            txn_.lock(ACCOUNTS, pendingId);
        }
    }

    void rename(int64_t id, const std::string& name) override {
        lockRow(id);

        auto& state = txn_.state();
        while (true) {
            int64_t pendingId = 0;
            {
                std::lock_guard<std::mutex> lock(state.dataMutex);
                auto it = table().rows.find(id);
                if (it == table().rows.end()) {
                    throw domain::NotFoundError("Account not found.");
                }
                auto conflict = findConflict(it->second.userId, name, false, id);
                if (!conflict) {
                    table().touch(id, txn_.id());
                    it->second.name = name;
                    return;
                }
                if (!conflict->pending) {
                    throw domain::ValidationError("Account with this name already exists.", "name");
                }
                pendingId = conflict->id;
            }
            txn_.lock(ACCOUNTS, pendingId);
        }
    }

    bool deleteById(int64_t id) override {
        lockRow(id);

        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        auto it = table().rows.find(id);
        if (it == table().rows.end()) {
            return false;
        }
        if (referenced(id)) {
            throw domain::ValidationError("Account has ledger entries; delete them first.");
        }
        table().touch(id, txn_.id());
        table().rows.erase(it);
        return true;
    }

    void adjustBalance(int64_t id, const domain::Money& delta) override {
        // Неявная блокировка строки, как у UPDATE в PostgreSQL
        lockRow(id);

        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        auto it = table().rows.find(id);
        if (it == table().rows.end()) {
            throw domain::NotFoundError("Account not found.");
        }
        domain::Money updated = it->second.balance + delta;
        if (!updated.fitsStorage()) {
            throw domain::ValidationError("Account balance is out of range.", "amount");
        }
        table().touch(id, txn_.id());
        it->second.balance = updated;
    }

    std::vector<domain::Account> lockForUpdate(const std::vector<int64_t>& ids) override {
        std::vector<int64_t> ordered = ids;
        std::sort(ordered.begin(), ordered.end());
        ordered.erase(std::unique(ordered.begin(), ordered.end()), ordered.end());

        for (int64_t id : ordered) {
            lockRow(id);
        }

        std::vector<domain::Account> locked;
        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        for (int64_t id : ordered) {
            if (auto account = table().visible(id, txn_.id())) {
                locked.push_back(*account);
            }
        }
        return locked;
    }

    bool isReferenced(int64_t id) override {
        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        return referenced(id);
    }

private:
    Transaction& txn_;

    LedgerTable<domain::Account>& table() { return txn_.state().accounts; }

    /**
     * @brief Заблокировать строку, если она есть хоть в какой-то версии (не под dataMutex)
     */
    bool lockRow(int64_t id) {
        {
            std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
            if (!table().known(id)) {
                return false;
            }
        }
        txn_.lock(ACCOUNTS, id);
        return true;
    }

    // Методы ниже вызываются под dataMutex

    std::optional<LedgerTable<domain::Account>::Conflict> findConflict(
        const std::string& userId,
        const std::string& name,
        bool isSystem,
        int64_t selfId
    ) {
        return table().findConflict(txn_.id(), selfId, [&](const domain::Account& account) {
            return account.userId == userId &&
                   (account.name == name || (isSystem && account.isSystem));
        });
    }

    // Ссылки в любой версии: удаление чужой незавершённой транзакцией
    // ещё может откатиться
    bool referenced(int64_t id) {
        auto& state = txn_.state();
        return state.expenses.anyVersion([id](const domain::Expense& e) { return e.accountId == id; }) ||
               state.incomes.anyVersion([id](const domain::Income& e) { return e.accountId == id; }) ||
               state.transfers.anyVersion([id](const domain::Transfer& e) {
                   return e.fromAccountId == id || e.toAccountId == id;
               });
    }
};

// ============================================
// Категории
// ============================================

class InMemoryCategoryRepository : public ports::output::ICategoryRepository {
public:
    explicit InMemoryCategoryRepository(Transaction& txn) : txn_(txn) {}

    std::optional<domain::Category> findById(int64_t id) override {
        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        return table().visible(id, txn_.id());
    }

    std::vector<domain::Category> findByUserId(const std::string& userId) override {
        std::vector<domain::Category> result;
        {
            std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
            for (const auto& category : table().visibleRows(txn_.id())) {
                if (category.userId == userId) {
                    result.push_back(category);
                }
            }
        }
        std::sort(result.begin(), result.end(),
            [](const domain::Category& a, const domain::Category& b) {
                return a.name != b.name ? a.name < b.name : a.id < b.id;
            });
        return result;
    }

    domain::Category insert(const domain::Category& category) override {
        domain::Category row = category;
        withUniqueName(category.userId, category.name, 0, [&]() {
            row.id = table().nextId++;
            table().touch(row.id, txn_.id());
            table().rows[row.id] = row;
            txn_.claimNew(CATEGORIES, row.id);
        });
        return row;
    }

    void update(const domain::Category& category) override {
        lockRow(category.id);

        withUniqueName(category.userId, category.name, category.id, [&]() {
            auto it = table().rows.find(category.id);
            if (it == table().rows.end()) {
                throw domain::NotFoundError("Category not found.");
            }
            table().touch(category.id, txn_.id());
            it->second = category;
        });
    }

    bool deleteById(int64_t id) override {
        lockRow(id);

        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        auto it = table().rows.find(id);
        if (it == table().rows.end()) {
            return false;
        }
        if (referenced(id)) {
            throw domain::ValidationError("Category is used by expenses; delete them first.");
        }
        table().touch(id, txn_.id());
        table().rows.erase(it);
        return true;
    }

    bool isReferenced(int64_t id) override {
        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        return referenced(id);
    }

private:
    Transaction& txn_;

    LedgerTable<domain::Category>& table() { return txn_.state().categories; }

    bool lockRow(int64_t id) {
        {
            std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
            if (!table().known(id)) {
                return false;
            }
        }
        txn_.lock(CATEGORIES, id);
        return true;
    }

    /**
     * @brief Выполнить apply под dataMutex, когда имя свободно (вызывать не под dataMutex)
     *
     * Пока категорию с тем же именем меняет другая транзакция, ждём её завершения.
     */
    template <typename Apply>
    void withUniqueName(const std::string& userId, const std::string& name, int64_t selfId, Apply apply) {
        while (true) {
            int64_t pendingId = 0;
            {
                std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
                auto conflict = table().findConflict(txn_.id(), selfId,
                    [&](const domain::Category& c) { return c.userId == userId && c.name == name; });
                if (!conflict) {
                    apply();
                    return;
                }
                if (!conflict->pending) {
                    throw domain::ValidationError("Category with this name already exists.", "name");
                }
                pendingId = conflict->id;
            }
            txn_.lock(CATEGORIES, pendingId);
        }
    }

    bool referenced(int64_t id) {
        return txn_.state().expenses.anyVersion(
            [id](const domain::Expense& e) { return e.categoryId == id; });
    }
};

// ============================================
// Записи (расходы, доходы, переводы)
// ============================================

template <typename Entry>
struct EntryTable;

template <>
struct EntryTable<domain::Expense> {
    static constexpr const char* NAME = "expenses";
    static LedgerTable<domain::Expense>& of(State& s) { return s.expenses; }

    static bool matches(const domain::Expense& e, const domain::EntryFilter& f) {
        return !f.accountId || e.accountId == *f.accountId;
    }

    static void checkReferences(State& s, const domain::Expense& e) {
        if (!s.accounts.rows.count(e.accountId) || !s.categories.rows.count(e.categoryId)) {
            throw domain::ValidationError("Expense references a missing account or category.");
        }
    }
};

template <>
struct EntryTable<domain::Income> {
    static constexpr const char* NAME = "incomes";
    static LedgerTable<domain::Income>& of(State& s) { return s.incomes; }

    static bool matches(const domain::Income& e, const domain::EntryFilter& f) {
        return !f.accountId || e.accountId == *f.accountId;
    }

    static void checkReferences(State& s, const domain::Income& e) {
        if (!s.accounts.rows.count(e.accountId)) {
            throw domain::ValidationError("Income references a missing account.");
        }
    }
};

template <>
struct EntryTable<domain::Transfer> {
    static constexpr const char* NAME = "transfers";
    static LedgerTable<domain::Transfer>& of(State& s) { return s.transfers; }

    static bool matches(const domain::Transfer& e, const domain::EntryFilter& f) {
        if (f.accountId && e.fromAccountId != *f.accountId && e.toAccountId != *f.accountId) {
            return false;
        }
        return (!f.fromAccountId || e.fromAccountId == *f.fromAccountId) &&
               (!f.toAccountId || e.toAccountId == *f.toAccountId);
    }

    static void checkReferences(State& s, const domain::Transfer& e) {
        if (!s.accounts.rows.count(e.fromAccountId) || !s.accounts.rows.count(e.toAccountId)) {
            throw domain::ValidationError("Transfer references a missing account.");
        }
    }
};

template <typename Entry, typename Port>
class InMemoryEntryRepository : public Port {
    using Table = EntryTable<Entry>;

public:
    explicit InMemoryEntryRepository(Transaction& txn) : txn_(txn) {}

    std::optional<Entry> findById(int64_t id) override {
        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        return table().visible(id, txn_.id());
    }

    std::optional<Entry> findByIdForUpdate(int64_t id) override {
        if (!lockRow(id)) {
            return std::nullopt;
        }

        // Строку могли удалить, пока ждали блокировку
        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        return table().visible(id, txn_.id());
    }

    std::vector<Entry> findByUserId(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) override {
        std::vector<Entry> result;
        {
            std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
            for (const auto& entry : table().visibleRows(txn_.id())) {
                if (entry.userId == userId && filter.contains(entry.createdAt) &&
                    Table::matches(entry, filter)) {
                    result.push_back(entry);
                }
            }
        }
        std::sort(result.begin(), result.end(), [](const Entry& a, const Entry& b) {
            return a.createdAt != b.createdAt ? a.createdAt > b.createdAt : a.id > b.id;
        });
        return result;
    }

    Entry insert(const Entry& entry) override {
        auto& state = txn_.state();
        std::lock_guard<std::mutex> lock(state.dataMutex);
        Table::checkReferences(state, entry);

        Entry row = entry;
        row.id = table().nextId++;
        table().touch(row.id, txn_.id());
        table().rows[row.id] = row;
        txn_.claimNew(Table::NAME, row.id);
        return row;
    }

    void update(const Entry& entry) override {
        lockRow(entry.id);

        auto& state = txn_.state();
        std::lock_guard<std::mutex> lock(state.dataMutex);
        auto it = table().rows.find(entry.id);
        if (it == table().rows.end()) {
            throw domain::NotFoundError(std::string(Table::NAME) + " row not found.");
        }
        Table::checkReferences(state, entry);
        table().touch(entry.id, txn_.id());
        it->second = entry;
    }

    bool deleteById(int64_t id) override {
        lockRow(id);

        std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
        auto it = table().rows.find(id);
        if (it == table().rows.end()) {
            return false;
        }
        table().touch(id, txn_.id());
        table().rows.erase(it);
        return true;
    }

private:
    Transaction& txn_;

    LedgerTable<Entry>& table() { return Table::of(txn_.state()); }

    bool lockRow(int64_t id) {
        {
            std::lock_guard<std::mutex> lock(txn_.state().dataMutex);
            if (!table().known(id)) {
                return false;
            }
        }
        txn_.lock(Table::NAME, id);
        return true;
    }
};

// ============================================
// Единица работы
// ============================================

class InMemoryUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit InMemoryUnitOfWork(std::shared_ptr<State> state)
        : txn_(std::move(state))
        , accounts_(txn_)
        , categories_(txn_)
        , expenses_(txn_)
        , incomes_(txn_)
        , transfers_(txn_)
    {}

    ~InMemoryUnitOfWork() override {
        rollback();
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
        txn_.commit();
    }

    void rollback() override {
        if (finished_) {
            return;
        }
        finished_ = true;
        txn_.rollback();
    }

private:
    Transaction txn_;
    InMemoryAccountRepository accounts_;
    InMemoryCategoryRepository categories_;
    InMemoryEntryRepository<domain::Expense, ports::output::IExpenseRepository> expenses_;
    InMemoryEntryRepository<domain::Income, ports::output::IIncomeRepository> incomes_;
    InMemoryEntryRepository<domain::Transfer, ports::output::ITransferRepository> transfers_;
    bool finished_ = false;
};

} // namespace

InMemoryLedgerStore::InMemoryLedgerStore(std::shared_ptr<settings::LedgerSettings> settings)
    : state_(std::make_shared<State>(settings->getLockTimeout()))
{
    std::cout << "[InMemoryLedgerStore] Initialized (lock timeout "
              << settings->getLockTimeout().count() << " ms)" << std::endl;
}

InMemoryLedgerStore::~InMemoryLedgerStore() = default;

std::unique_ptr<ports::output::IUnitOfWork> InMemoryLedgerStore::begin() {
    return std::make_unique<InMemoryUnitOfWork>(state_);
}

} // namespace finance::adapters::secondary
