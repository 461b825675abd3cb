#pragma once

#include "domain/Income.hpp"
#include "domain/IncomeRequest.hpp"
#include "domain/EntryFilter.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace finance::ports::input {

/**
 * @brief Интерфейс сервиса доходов
 *
 * Протокол тот же, что у расходов, с обратным знаком дельты.
 */
class IIncomeService {
public:
    virtual ~IIncomeService() = default;

    virtual domain::Income createIncome(
        const std::string& userId,
        const domain::IncomeRequest& request
    ) = 0;

    virtual domain::Income updateIncome(
        const std::string& userId,
        int64_t incomeId,
        const domain::IncomeRequest& request
    ) = 0;

    virtual void deleteIncome(const std::string& userId, int64_t incomeId) = 0;

    virtual std::optional<domain::Income> getIncome(
        const std::string& userId,
        int64_t incomeId
    ) = 0;

    virtual std::vector<domain::Income> listIncomes(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) = 0;
};

} // namespace finance::ports::input
