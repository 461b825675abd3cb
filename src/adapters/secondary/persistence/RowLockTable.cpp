// src/adapters/secondary/persistence/RowLockTable.cpp
#include "adapters/secondary/persistence/RowLockTable.hpp"
#include "domain/LedgerError.hpp"
#include <iostream>

namespace finance::adapters::secondary {

RowLockTable::RowLockTable(std::chrono::milliseconds timeout)
    : timeout_(timeout)
{}

void RowLockTable::acquire(const RowKey& key, uint64_t owner) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto available = [&]() {
        auto it = owners_.find(key);
        return it == owners_.end() || it->second == owner;
    };

    if (!released_.wait_for(lock, timeout_, available)) {
        std::cerr << "[RowLockTable] Lock timeout on " << key.table << "#" << key.id
                  << " (txn " << owner << ")" << std::endl;
        throw domain::ConcurrencyTimeout(
            "Could not lock " + key.table + " row " + std::to_string(key.id) + ", try again.");
    }
    owners_[key] = owner;
}

void RowLockTable::releaseAll(uint64_t owner) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = owners_.begin(); it != owners_.end();) {
            if (it->second == owner) {
                it = owners_.erase(it);
            } else {
                ++it;
            }
        }
    }
    released_.notify_all();
}

bool RowLockTable::isHeldBy(const RowKey& key, uint64_t owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(key);
    return it != owners_.end() && it->second == owner;
}

} // namespace finance::adapters::secondary
