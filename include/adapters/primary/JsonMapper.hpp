// include/adapters/primary/JsonMapper.hpp
#pragma once

#include "domain/Account.hpp"
#include "domain/Category.hpp"
#include "domain/Expense.hpp"
#include "domain/Income.hpp"
#include "domain/Transfer.hpp"
#include "domain/Report.hpp"
#include "domain/EntryFilter.hpp"
#include "domain/LedgerError.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <cctype>
#include <stdexcept>

namespace finance::adapters::primary {

/**
 * @brief Преобразования между JSON командами и доменными типами
 *
 * Суммы в JSON передаются строками ("1234.56"); целые и дробные
 * числа тоже принимаются, но не более двух знаков после точки.
 * Ошибки разбора -> domain::ValidationError с именем поля.
 */
class JsonMapper {
public:
    // ============================================
    // Разбор полей запроса
    // ============================================

    static std::string requireString(const nlohmann::json& data, const std::string& field) {
        if (!data.contains(field) || !data[field].is_string()) {
            throw domain::ValidationError("This field is required.", field);
        }
        return data[field].get<std::string>();
    }

    static std::string optionalString(const nlohmann::json& data, const std::string& field) {
        if (!data.contains(field) || data[field].is_null()) {
            return "";
        }
        if (!data[field].is_string()) {
            throw domain::ValidationError("Must be a string.", field);
        }
        return data[field].get<std::string>();
    }

    static int64_t requireId(const nlohmann::json& data, const std::string& field) {
        auto id = optionalId(data, field);
        if (!id) {
            throw domain::ValidationError("This field is required.", field);
        }
        return *id;
    }

    static std::optional<int64_t> optionalId(const nlohmann::json& data, const std::string& field) {
        if (!data.contains(field) || data[field].is_null()) {
            return std::nullopt;
        }
        const auto& value = data[field];
        if (value.is_number_integer()) {
            return value.get<int64_t>();
        }
        const std::string text = value.is_string() ? value.get<std::string>() : "";
        bool digits = !text.empty() && text.size() <= 18;
        for (char c : text) {
            digits = digits && std::isdigit(static_cast<unsigned char>(c));
        }
        if (!digits) {
            throw domain::ValidationError("'" + field + "' must be an integer.", field);
        }
        return std::stoll(text);
    }

    static domain::Money requireMoney(const nlohmann::json& data, const std::string& field) {
        if (!data.contains(field) || data[field].is_null()) {
            throw domain::ValidationError("This field is required.", field);
        }
        const auto& value = data[field];
        if (!value.is_string() && !value.is_number()) {
            throw domain::ValidationError("A valid number is required.", field);
        }
        try {
            return domain::Money::fromString(value.is_string() ? value.get<std::string>() : value.dump());
        } catch (const std::invalid_argument&) {
            throw domain::ValidationError(
                "A valid number with at most 2 decimal places is required.", field);
        }
    }

    /**
     * @brief Начало периода: "YYYY-MM-DD" или "YYYY-MM" (первое число)
     */
    static std::optional<domain::Timestamp> optionalStart(const nlohmann::json& data, const std::string& field) {
        auto text = optionalString(data, field);
        if (text.empty()) {
            return std::nullopt;
        }
        auto date = parseDay(text.size() == 7 ? text + "-01" : text, field);
        return date;
    }

    /**
     * @brief Конец периода включительно: "YYYY-MM-DD" или "YYYY-MM" (последнее число)
     */
    static std::optional<domain::Timestamp> optionalEnd(const nlohmann::json& data, const std::string& field) {
        auto text = optionalString(data, field);
        if (text.empty()) {
            return std::nullopt;
        }
        if (text.size() == 7) {
            return parseDay(text + "-01", field).endOfMonth();
        }
        return parseDay(text, field).endOfDay();
    }

    static domain::EntryFilter toFilter(const nlohmann::json& data) {
        domain::EntryFilter filter;
        filter.from = optionalStart(data, "start");
        filter.to = optionalEnd(data, "end");
        filter.accountId = optionalId(data, "account");
        filter.fromAccountId = optionalId(data, "from_account");
        filter.toAccountId = optionalId(data, "to_account");
        return filter;
    }

    static domain::ReportQuery toReportQuery(const nlohmann::json& data) {
        domain::ReportQuery query;
        query.start = optionalStart(data, "start");
        query.end = optionalEnd(data, "end");
        query.accountId = optionalId(data, "account");
        query.fromAccountId = optionalId(data, "from_account");
        query.toAccountId = optionalId(data, "to_account");
        query.grouping = toGrouping(optionalString(data, "by"));
        return query;
    }

    /**
     * @brief "by": пусто, account, category или account_category
     */
    static domain::CashflowGrouping toGrouping(const std::string& by) {
        for (auto grouping : {domain::CashflowGrouping::NONE,
                              domain::CashflowGrouping::ACCOUNT,
                              domain::CashflowGrouping::CATEGORY,
                              domain::CashflowGrouping::ACCOUNT_CATEGORY}) {
            if (by == domain::toString(grouping)) {
                return grouping;
            }
        }
        if (by.empty()) {
            return domain::CashflowGrouping::NONE;
        }
        throw domain::ValidationError(
            "'by' must be one of: account, category, account_category.", "by");
    }

    // ============================================
    // Сериализация ответов
    // ============================================

    static nlohmann::json toJson(const domain::Account& account) {
        nlohmann::json j;
        j["id"] = account.id;
        j["name"] = account.name;
        j["balance"] = account.balance.toString();
        j["created_at"] = account.createdAt.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::Category& category) {
        nlohmann::json j;
        j["id"] = category.id;
        j["name"] = category.name;
        j["created_at"] = category.createdAt.toString();
        j["updated_at"] = category.updatedAt.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::Expense& expense) {
        nlohmann::json j;
        j["id"] = expense.id;
        j["account"] = expense.accountId;
        j["category"] = expense.categoryId;
        j["amount"] = expense.amount.toString();
        j["description"] = expense.description;
        j["created_at"] = expense.createdAt.toString();
        j["updated_at"] = expense.updatedAt.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::Income& income) {
        nlohmann::json j;
        j["id"] = income.id;
        j["account"] = income.accountId;
        j["amount"] = income.amount.toString();
        j["description"] = income.description;
        j["created_at"] = income.createdAt.toString();
        j["updated_at"] = income.updatedAt.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::Transfer& transfer) {
        nlohmann::json j;
        j["id"] = transfer.id;
        j["from_account"] = transfer.fromAccountId;
        j["to_account"] = transfer.toAccountId;
        j["amount"] = transfer.amount.toString();
        j["created_at"] = transfer.createdAt.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::CashflowSummary& summary) {
        nlohmann::json j;
        j["start"] = summary.start ? nlohmann::json(summary.start->toString()) : nlohmann::json();
        j["end"] = summary.end ? nlohmann::json(summary.end->toString()) : nlohmann::json();
        j["account"] = summary.accountId ? nlohmann::json(*summary.accountId) : nlohmann::json();
        j["income"] = summary.income.toString();
        j["transfers_in"] = summary.transfersIn.toString();
        j["income_including_transfers"] = summary.incomeIncludingTransfers.toString();
        j["expense"] = summary.expense.toString();
        j["net"] = summary.net.toString();
        j["total_balance"] = summary.totalBalance.toString();

        nlohmann::json balances = nlohmann::json::array();
        for (const auto& balance : summary.balances) {
            balances.push_back({
                {"account", balance.accountId},
                {"name", balance.name},
                {"balance", balance.balance.toString()}
            });
        }
        j["balances"] = balances;
        return j;
    }

    static nlohmann::json toJson(const domain::CategoryTotal& total) {
        nlohmann::json j;
        j["category"] = total.categoryId;
        j["name"] = total.name;
        j["total"] = total.total.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::MonthlyCashflow& month, domain::CashflowGrouping grouping) {
        nlohmann::json j;
        j["month"] = month.month.toString().substr(0, 10);
        j["income"] = month.income.toString();
        j["expense"] = month.expense.toString();
        j["net"] = month.net.toString();

        if (grouping == domain::CashflowGrouping::CATEGORY) {
            j["by_category"] = toJsonArray(month.categories);
        }
        if (grouping == domain::CashflowGrouping::ACCOUNT ||
            grouping == domain::CashflowGrouping::ACCOUNT_CATEGORY) {
            nlohmann::json accounts = nlohmann::json::array();
            for (const auto& account : month.accounts) {
                nlohmann::json a;
                a["account"] = account.accountId;
                a["name"] = account.name;
                a["income"] = account.income.toString();
                a["expense"] = account.expense.toString();
                a["net"] = account.net.toString();
                if (grouping == domain::CashflowGrouping::ACCOUNT_CATEGORY) {
                    a["by_category"] = toJsonArray(account.categories);
                }
                accounts.push_back(a);
            }
            j["by_account"] = accounts;
        }
        return j;
    }

    template <typename T>
    static nlohmann::json toJsonArray(const std::vector<T>& items) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& item : items) {
            array.push_back(toJson(item));
        }
        return array;
    }

private:
    static domain::Timestamp parseDay(const std::string& text, const std::string& field) {
        auto date = domain::Timestamp::parseDate(text);
        if (!date) {
            throw domain::ValidationError("Invalid '" + field + "'. Use YYYY-MM-DD or YYYY-MM.", field);
        }
        return *date;
    }
};

} // namespace finance::adapters::primary
