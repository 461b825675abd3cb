#pragma once

#include <stdexcept>
#include <string>

namespace finance::domain {

/**
 * @brief Вид ошибки ядра
 */
enum class ErrorKind {
    VALIDATION,             ///< Некорректные данные, чужой счёт, дубликат имени
    INSUFFICIENT_FUNDS,     ///< Недостаточно средств на счёте списания перевода
    NOT_FOUND,              ///< Объект не существует или принадлежит другому пользователю
    CONCURRENCY_TIMEOUT     ///< Не удалось получить блокировку строк, можно повторить
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:          return "VALIDATION";
        case ErrorKind::INSUFFICIENT_FUNDS:  return "INSUFFICIENT_FUNDS";
        case ErrorKind::NOT_FOUND:           return "NOT_FOUND";
        case ErrorKind::CONCURRENCY_TIMEOUT: return "CONCURRENCY_TIMEOUT";
    }
    return "UNKNOWN";
}

/**
 * @brief Базовое исключение ядра учёта
 *
 * Любое исключение прерывает единицу работы целиком:
 * ни запись, ни дельты балансов не фиксируются.
 */
class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorKind kind, const std::string& message, const std::string& field = "")
        : std::runtime_error(message), kind_(kind), field_(field) {}

    ErrorKind kind() const { return kind_; }

    /**
     * @brief Поле запроса, к которому относится ошибка (может быть пустым)
     */
    const std::string& field() const { return field_; }

private:
    ErrorKind kind_;
    std::string field_;
};

class ValidationError : public LedgerError {
public:
    explicit ValidationError(const std::string& message, const std::string& field = "")
        : LedgerError(ErrorKind::VALIDATION, message, field) {}
};

class InsufficientFundsError : public LedgerError {
public:
    explicit InsufficientFundsError(const std::string& message)
        : LedgerError(ErrorKind::INSUFFICIENT_FUNDS, message, "amount") {}
};

class NotFoundError : public LedgerError {
public:
    explicit NotFoundError(const std::string& message, const std::string& field = "")
        : LedgerError(ErrorKind::NOT_FOUND, message, field) {}
};

/**
 * @brief Таймаут получения блокировки
 *
 * Транзиентная ошибка: вызывающая сторона может повторить
 * всю операцию с начала.
 */
class ConcurrencyTimeout : public LedgerError {
public:
    explicit ConcurrencyTimeout(const std::string& message)
        : LedgerError(ErrorKind::CONCURRENCY_TIMEOUT, message) {}
};

} // namespace finance::domain
