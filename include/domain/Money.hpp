#pragma once

#include <string>
#include <cstdint>
#include <cctype>
#include <stdexcept>
#include <limits>

namespace finance::domain {

/**
 * @brief Денежная сумма с фиксированной точкой (2 знака после запятой)
 *
 * Хранит значение в копейках (int64_t) для точности.
 * Строковое представление: "1234.56", "-10.00".
 *
 * @example
 * ```cpp
 * auto a = Money::fromString("500.00");
 * auto b = Money::fromString("99.5");
 * (a - b).toString();  // "400.50"
 * ```
 */
class Money {
public:
    /// Наибольшая сумма, которую хранит NUMERIC(12,2): 9999999999.99
    static constexpr int64_t MAX_CENTS = 999999999999;

    Money() = default;

    /**
     * @brief Создать сумму из копеек
     */
    static Money fromCents(int64_t cents) {
        Money m;
        m.cents_ = cents;
        return m;
    }

    /**
     * @brief Распарсить сумму из строки
     *
     * Допускается знак, не более 10 цифр целой части
     * и не более двух знаков после точки.
     *
     * @throws std::invalid_argument если строка не является суммой
     *         или сумма не помещается в NUMERIC(12,2)
     */
    static Money fromString(const std::string& str) {
        if (str.empty()) {
            throw std::invalid_argument("Empty amount");
        }

        size_t pos = 0;
        bool negative = false;
        if (str[pos] == '-' || str[pos] == '+') {
            negative = str[pos] == '-';
            ++pos;
        }

        int64_t units = 0;
        size_t intDigits = 0;
        while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
            if (++intDigits > MAX_INTEGER_DIGITS) {
                throw std::invalid_argument("Amount is too large: " + str);
            }
            units = units * 10 + (str[pos] - '0');
            ++pos;
        }

        int64_t fraction = 0;
        size_t fracDigits = 0;
        if (pos < str.size() && str[pos] == '.') {
            ++pos;
            while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
                if (++fracDigits > 2) {
                    throw std::invalid_argument("Amount has more than 2 decimal places: " + str);
                }
                fraction = fraction * 10 + (str[pos] - '0');
                ++pos;
            }
        }

        if (pos != str.size() || (intDigits == 0 && fracDigits == 0)) {
            throw std::invalid_argument("Invalid amount: " + str);
        }
        if (fracDigits == 1) {
            fraction *= 10;
        }

        int64_t cents = units * 100 + fraction;
        return fromCents(negative ? -cents : cents);
    }

    /**
     * @brief Преобразовать в строку с двумя знаками после точки
     */
    std::string toString() const {
        int64_t abs = cents_ < 0 ? -cents_ : cents_;
        std::string fraction = std::to_string(abs % 100);
        if (fraction.size() < 2) {
            fraction.insert(0, "0");
        }
        return (cents_ < 0 ? "-" : "") + std::to_string(abs / 100) + "." + fraction;
    }

    int64_t cents() const { return cents_; }

    bool isZero() const { return cents_ == 0; }
    bool isPositive() const { return cents_ > 0; }
    bool isNegative() const { return cents_ < 0; }

    /**
     * @brief Сумма в пределах NUMERIC(12,2)
     */
    bool fitsStorage() const { return cents_ >= -MAX_CENTS && cents_ <= MAX_CENTS; }

    // Арифметика с проверкой: выход за int64_t -> std::overflow_error

    Money operator+(const Money& other) const { return fromCents(add(cents_, other.cents_)); }
    Money operator-(const Money& other) const { return fromCents(add(cents_, negate(other.cents_))); }
    Money operator-() const { return fromCents(negate(cents_)); }

    Money& operator+=(const Money& other) {
        cents_ = add(cents_, other.cents_);
        return *this;
    }

    Money& operator-=(const Money& other) {
        cents_ = add(cents_, negate(other.cents_));
        return *this;
    }

    bool operator==(const Money& other) const { return cents_ == other.cents_; }
    bool operator!=(const Money& other) const { return cents_ != other.cents_; }
    bool operator<(const Money& other) const { return cents_ < other.cents_; }
    bool operator>(const Money& other) const { return cents_ > other.cents_; }
    bool operator<=(const Money& other) const { return cents_ <= other.cents_; }
    bool operator>=(const Money& other) const { return cents_ >= other.cents_; }

private:
    static constexpr size_t MAX_INTEGER_DIGITS = 10;

    int64_t cents_ = 0;

    static int64_t add(int64_t a, int64_t b) {
        if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
            (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
            throw std::overflow_error("Money overflow");
        }
        return a + b;
    }

    static int64_t negate(int64_t a) {
        if (a == std::numeric_limits<int64_t>::min()) {
            throw std::overflow_error("Money overflow");
        }
        return -a;
    }
};

} // namespace finance::domain
