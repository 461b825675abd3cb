#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>

namespace finance::domain {

/**
 * @brief Временная метка (UTC) с точностью до секунды
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    /**
     * @brief Создать Timestamp с текущим временем
     */
    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Создать из Unix timestamp
     */
    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    /**
     * @brief Начало календарного дня (00:00:00 UTC)
     */
    static Timestamp fromDate(int year, unsigned month, unsigned day) {
        return fromUnixSeconds(daysFromCivil(year, month, day) * SECONDS_PER_DAY);
    }

    /**
     * @brief Распарсить дату формата "YYYY-MM-DD"
     * @return nullopt если строка не является корректной датой
     */
    static std::optional<Timestamp> parseDate(const std::string& str) {
        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        char tail = 0;
        if (str.size() != 10 ||
            std::sscanf(str.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &tail) != 3) {
            return std::nullopt;
        }
        if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
            return std::nullopt;
        }
        return fromDate(year, month, day);
    }

    /**
     * @brief Количество дней в месяце
     */
    static unsigned daysInMonth(int year, unsigned month) {
        static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return (month == 2 && leap) ? 29 : days[month - 1];
    }

    /**
     * @brief Последняя секунда того же дня (23:59:59 UTC)
     */
    Timestamp endOfDay() const {
        int64_t day = floorDiv(toUnixSeconds(), SECONDS_PER_DAY);
        return fromUnixSeconds(day * SECONDS_PER_DAY + SECONDS_PER_DAY - 1);
    }

    /**
     * @brief Первый день месяца, в который попадает метка
     */
    Timestamp startOfMonth() const {
        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        civilFromDays(floorDiv(toUnixSeconds(), SECONDS_PER_DAY), year, month, day);
        return fromDate(year, month, 1);
    }

    /**
     * @brief Последняя секунда месяца, в который попадает метка
     */
    Timestamp endOfMonth() const {
        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        civilFromDays(floorDiv(toUnixSeconds(), SECONDS_PER_DAY), year, month, day);
        return fromDate(year, month, daysInMonth(year, month)).endOfDay();
    }

    /**
     * @brief Преобразовать в ISO 8601 строку ("2025-08-01T10:30:00Z")
     */
    std::string toString() const {
        int64_t seconds = toUnixSeconds();
        int64_t days = floorDiv(seconds, SECONDS_PER_DAY);
        int64_t secOfDay = seconds - days * SECONDS_PER_DAY;

        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        civilFromDays(days, year, month, day);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                      year, month, day,
                      static_cast<int>(secOfDay / 3600),
                      static_cast<int>((secOfDay % 3600) / 60),
                      static_cast<int>(secOfDay % 60));
        return buf;
    }

    /**
     * @brief Получить Unix timestamp (секунды с 1970)
     */
    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    /**
     * @brief Добавить секунды
     */
    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    /**
     * @brief Добавить дни
     */
    Timestamp addDays(int64_t days) const {
        return addSeconds(days * SECONDS_PER_DAY);
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }

private:
    static constexpr int64_t SECONDS_PER_DAY = 86400;

    static int64_t floorDiv(int64_t a, int64_t b) {
        int64_t q = a / b;
        return (a % b != 0 && (a < 0) != (b < 0)) ? q - 1 : q;
    }

    // Алгоритм Howard Hinnant (days_from_civil / civil_from_days)
    static int64_t daysFromCivil(int year, unsigned month, unsigned day) {
        year -= month <= 2 ? 1 : 0;
        const int64_t era = (year >= 0 ? year : year - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(year - era * 400);
        const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    static void civilFromDays(int64_t days, int& year, unsigned& month, unsigned& day) {
        days += 719468;
        const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(days - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        day = doy - (153 * mp + 2) / 5 + 1;
        month = mp < 10 ? mp + 3 : mp - 9;
        year = static_cast<int>(yoe + era * 400) + (month <= 2 ? 1 : 0);
    }
};

} // namespace finance::domain
