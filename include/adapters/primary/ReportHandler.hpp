// include/adapters/primary/ReportHandler.hpp
#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/IReportService.hpp"
#include <memory>
#include <iostream>

namespace finance::adapters::primary {

/**
 * @brief Отчёты (только чтение)
 *
 * Период задаётся "start" / "end" в формате YYYY-MM-DD или YYYY-MM.
 *
 * - report.summary         {"start"?, "end"?, "account"?}
 * - report.categories      {"start"?, "end"?, "account"?}
 * - report.transfer_total  {"start"?, "end"?, "from_account"?, "to_account"?}
 * - report.income_total    {"start"?, "end"?, "account"?}
 * - report.monthly_cashflow {"start"?, "end"?, "account"?,
 *                            "by"?: account | category | account_category}
 */
class ReportHandler : public ICommandHandler {
public:
    explicit ReportHandler(std::shared_ptr<ports::input::IReportService> reportService)
        : reportService_(std::move(reportService))
    {
        std::cout << "[ReportHandler] Created" << std::endl;
    }

    void handle(const CommandRequest& req, CommandResponse& res) override {
        auto query = JsonMapper::toReportQuery(req.data);

        if (req.op == "report.summary") {
            res.status = 200;
            res.body = JsonMapper::toJson(reportService_->getSummary(req.userId, query));
        } else if (req.op == "report.categories") {
            res.status = 200;
            res.body = JsonMapper::toJsonArray(reportService_->getCategoryTotals(req.userId, query));
        } else if (req.op == "report.transfer_total") {
            res.status = 200;
            res.body = {{"total", reportService_->getTransferTotal(req.userId, query).toString()}};
        } else if (req.op == "report.income_total") {
            res.status = 200;
            res.body = {{"total", reportService_->getIncomeTotal(req.userId, query).toString()}};
        } else if (req.op == "report.monthly_cashflow") {
            res.status = 200;
            res.body = nlohmann::json::array();
            for (const auto& month : reportService_->getMonthlyCashflow(req.userId, query)) {
                res.body.push_back(JsonMapper::toJson(month, query.grouping));
            }
        } else {
            res.status = 404;
            res.body = {{"error", "Not found."}};
        }
    }

private:
    std::shared_ptr<ports::input::IReportService> reportService_;
};

} // namespace finance::adapters::primary
