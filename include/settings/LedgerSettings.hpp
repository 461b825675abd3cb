// include/settings/LedgerSettings.hpp
#pragma once

#include <string>
#include <chrono>
#include <cstdlib>
#include <utility>
#include <stdexcept>

namespace finance::settings {

/**
 * @brief Настройки ядра учёта
 *
 * Читает параметры из переменных окружения (K8s ENV).
 *
 * Переменные:
 * - FINANCE_STORAGE: memory | postgres (по умолчанию memory)
 * - FINANCE_LOCK_TIMEOUT_MS: таймаут ожидания блокировки строк (5000)
 * - FINANCE_SYSTEM_ACCOUNT_NAME: имя системного счёта ("External (System)")
 */
class LedgerSettings {
public:
    LedgerSettings() {
        storage_ = getEnvOrDefault("FINANCE_STORAGE", "memory");
        lockTimeoutMs_ = std::stoi(getEnvOrDefault("FINANCE_LOCK_TIMEOUT_MS", "5000"));
        systemAccountName_ = getEnvOrDefault("FINANCE_SYSTEM_ACCOUNT_NAME", "External (System)");
        validate();
    }

    LedgerSettings(std::string storage, int lockTimeoutMs, std::string systemAccountName)
        : storage_(std::move(storage))
        , lockTimeoutMs_(lockTimeoutMs)
        , systemAccountName_(std::move(systemAccountName))
    {
        validate();
    }

    std::string getStorage() const { return storage_; }
    bool usePostgres() const { return storage_ == "postgres"; }

    std::chrono::milliseconds getLockTimeout() const {
        return std::chrono::milliseconds(lockTimeoutMs_);
    }

    std::string getSystemAccountName() const { return systemAccountName_; }

private:
    std::string storage_;
    int lockTimeoutMs_;
    std::string systemAccountName_;

    void validate() const {
        if (storage_ != "memory" && storage_ != "postgres") {
            throw std::invalid_argument("FINANCE_STORAGE must be 'memory' or 'postgres', got: " + storage_);
        }
        if (lockTimeoutMs_ <= 0) {
            throw std::invalid_argument("FINANCE_LOCK_TIMEOUT_MS must be positive");
        }
        if (systemAccountName_.empty()) {
            throw std::invalid_argument("FINANCE_SYSTEM_ACCOUNT_NAME must not be empty");
        }
    }

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace finance::settings
