// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <utility>
#include <stdexcept>

namespace finance::settings {

/**
 * @brief Настройки подключения хранилища учёта к PostgreSQL
 *
 * Читает параметры из переменных окружения (K8s ENV).
 *
 * Переменные:
 * - FINANCE_DB_HOST (finance-postgres)
 * - FINANCE_DB_PORT: 1..65535 (5432)
 * - FINANCE_DB_NAME (finance_db)
 * - FINANCE_DB_USER (finance_user)
 * - FINANCE_DB_PASSWORD (finance_secret_password)
 * - FINANCE_DB_CONNECT_TIMEOUT_S: таймаут установки соединения, 0 = без ограничения (5)
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("FINANCE_DB_HOST", "finance-postgres");
        port_ = parseInt("FINANCE_DB_PORT", getEnvOrDefault("FINANCE_DB_PORT", "5432"));
        name_ = getEnvOrDefault("FINANCE_DB_NAME", "finance_db");
        user_ = getEnvOrDefault("FINANCE_DB_USER", "finance_user");
        password_ = getEnvOrDefault("FINANCE_DB_PASSWORD", "finance_secret_password");
        connectTimeoutS_ = parseInt(
            "FINANCE_DB_CONNECT_TIMEOUT_S", getEnvOrDefault("FINANCE_DB_CONNECT_TIMEOUT_S", "5"));
        validate();
    }

    DbSettings(std::string host, int port, std::string name,
               std::string user, std::string password, int connectTimeoutS = 5)
        : host_(std::move(host))
        , port_(port)
        , name_(std::move(name))
        , user_(std::move(user))
        , password_(std::move(password))
        , connectTimeoutS_(connectTimeoutS)
    {
        validate();
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    int getConnectTimeoutSeconds() const { return connectTimeoutS_; }

    /**
     * @brief Строка подключения libpq в формате keyword=value
     *
     * Значения с пробелами, кавычками или обратной косой чертой
     * заключаются в одинарные кавычки и экранируются.
     */
    std::string getConnectionString() const {
        return "host=" + quote(host_) +
               " port=" + std::to_string(port_) +
               " dbname=" + quote(name_) +
               " user=" + quote(user_) +
               " password=" + quote(password_) +
               " connect_timeout=" + std::to_string(connectTimeoutS_) +
               " application_name=finance-ledger";
    }

    /**
     * @brief Описание цели подключения для логов (без пароля)
     */
    std::string describe() const {
        return user_ + "@" + host_ + ":" + std::to_string(port_) + "/" + name_;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    int connectTimeoutS_;

    void validate() const {
        if (host_.empty()) {
            throw std::invalid_argument("FINANCE_DB_HOST must not be empty");
        }
        if (port_ < 1 || port_ > 65535) {
            throw std::invalid_argument(
                "FINANCE_DB_PORT must be in 1..65535, got: " + std::to_string(port_));
        }
        if (name_.empty()) {
            throw std::invalid_argument("FINANCE_DB_NAME must not be empty");
        }
        if (user_.empty()) {
            throw std::invalid_argument("FINANCE_DB_USER must not be empty");
        }
        if (connectTimeoutS_ < 0) {
            throw std::invalid_argument("FINANCE_DB_CONNECT_TIMEOUT_S must not be negative");
        }
    }

    static std::string quote(const std::string& value) {
        bool plain = !value.empty() &&
            value.find_first_of(" \t\n'\\") == std::string::npos;
        if (plain) {
            return value;
        }
        std::string quoted = "'";
        for (char c : value) {
            if (c == '\'' || c == '\\') {
                quoted += '\\';
            }
            quoted += c;
        }
        return quoted + "'";
    }

    static int parseInt(const char* name, const std::string& value) {
        std::size_t used = 0;
        int parsed = 0;
        try {
            parsed = std::stoi(value, &used);
        } catch (const std::logic_error&) {
            throw std::invalid_argument(std::string(name) + " must be an integer, got: " + value);
        }
        if (used != value.size()) {
            throw std::invalid_argument(std::string(name) + " must be an integer, got: " + value);
        }
        return parsed;
    }

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace finance::settings
