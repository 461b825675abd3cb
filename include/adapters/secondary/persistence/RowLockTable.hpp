// include/adapters/secondary/persistence/RowLockTable.hpp
#pragma once

#include <string>
#include <map>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>

namespace finance::adapters::secondary {

/**
 * @brief Ключ блокировки строки: таблица + id
 */
struct RowKey {
    std::string table;
    int64_t id = 0;

    bool operator<(const RowKey& other) const {
        return table != other.table ? table < other.table : id < other.id;
    }
};

/**
 * @brief Таблица эксклюзивных блокировок строк
 *
 * Аналог SELECT ... FOR UPDATE для in-memory хранилища.
 * Владелец блокировки: номер транзакции; повторный захват той же строки
 * тем же владельцем не блокирует. Блокировки снимаются только все сразу
 * (releaseAll) при завершении транзакции.
 */
class RowLockTable {
public:
    explicit RowLockTable(std::chrono::milliseconds timeout);

    /**
     * @brief Захватить строку для владельца
     *
     * @throws domain::ConcurrencyTimeout если строка занята дольше таймаута
     */
    void acquire(const RowKey& key, uint64_t owner);

    /**
     * @brief Снять все блокировки владельца и разбудить ожидающих
     */
    void releaseAll(uint64_t owner);

    bool isHeldBy(const RowKey& key, uint64_t owner) const;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::map<RowKey, uint64_t> owners_;
};

} // namespace finance::adapters::secondary
