/*
 Copyright (C) 2025 The LoanRisk Authors
 All rights reserved.

 This file is part of LoanRisk, a free-software/open-source library
 for loan portfolio cash flow projection and risk analysis.

 LoanRisk is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/


#include <lra/app/structuredanalyticserror.hpp>
#include <lra/engine/cashflowengine.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/log.hpp>

#include <boost/timer/timer.hpp>

#include <algorithm>
#include <future>
#include <set>
#include <thread>

using namespace QuantLib;
using namespace loanrisk::data;
using std::vector;

namespace loanrisk {
namespace analytics {

CashFlowEngine::CashFlowEngine(const QuantLib::ext::shared_ptr<AssumptionSet>& assumptions, Size nThreads)
    : amortizationEngine_(assumptions), nThreads_(nThreads) {
    LOANRISK_REQUIRE_INPUT(nThreads_ > 0, "CashFlowEngine: number of threads must be positive");
}

void CashFlowEngine::validate(const vector<LoanRecord>& loans) const {
    std::set<std::string> ids;
    for (const auto& l : loans) {
        l.validate();
        LOANRISK_REQUIRE_INPUT(ids.insert(l.id()).second, "duplicate loan id " << l.id());
        amortizationEngine_.assumptions()->resolve(l.tier());
    }
}

CashFlowResults CashFlowEngine::run(const LoanPortfolio& portfolio, bool aggregate,
                                    const vector<GroupingKey>& groupingKeys) const {
    return run(portfolio.loans(), aggregate, groupingKeys);
}

CashFlowResults CashFlowEngine::run(const vector<LoanRecord>& loans, bool aggregate,
                                    const vector<GroupingKey>& groupingKeys) const {

    boost::timer::cpu_timer timer;

    validate(loans);

    CashFlowResults results;
    results.loanCashFlows.resize(loans.size());

    Size eff_nThreads = std::min(loans.size(), nThreads_);

    LOG("Cash flow engine: " << loans.size() << " loans, nThreads = " << nThreads_ << ", eff nThreads = "
                             << eff_nThreads);

    if (eff_nThreads > 0) {

        // split the portfolio round robin, worker i handles loans i, i + n, i + 2n, ...

        vector<vector<LoanCashFlows>> buffers(eff_nThreads);
        vector<vector<PortfolioMonthlyTotal>> partials(eff_nThreads);
        vector<std::future<void>> futures(eff_nThreads);
        vector<std::thread> jobs;

        for (Size i = 0; i < eff_nThreads; ++i) {

            auto job = [this, &loans, &buffers, &partials, &groupingKeys, aggregate, eff_nThreads](Size id) {
                DLOG("Start cash flow worker " << id);
                try {
                    for (Size j = id; j < loans.size(); j += eff_nThreads)
                        buffers[id].push_back(amortizationEngine_.schedule(loans[j]));
                    if (aggregate)
                        partials[id] = CashFlowAggregator(groupingKeys).aggregate(buffers[id]);
                } catch (const std::exception& e) {
                    StructuredAnalyticsErrorMessage("Cash Flow Engine", e,
                                                    {{"thread", std::to_string(id)}})
                        .log();
                    throw;
                }
                DLOG("Cash flow worker " << id << " finished, " << buffers[id].size() << " loans scheduled");
            };

            std::packaged_task<void(Size)> task(job);
            futures[i] = task.get_future();
            jobs.emplace_back(std::move(task), i);
        }

        for (auto& t : jobs)
            t.join();

        // rethrows the first worker error

        for (Size i = 0; i < futures.size(); ++i) {
            QL_REQUIRE(futures[i].valid(), "internal error: did not get a valid result from thread " << i);
            futures[i].get();
        }

        // merge the buffers back into portfolio order

        for (Size i = 0; i < eff_nThreads; ++i) {
            for (Size k = 0; k < buffers[i].size(); ++k)
                results.loanCashFlows[i + k * eff_nThreads] = std::move(buffers[i][k]);
        }

        // reduce the worker totals

        if (aggregate)
            results.monthlyTotals = CashFlowAggregator::merge(partials);
    } else if (aggregate) {
        results.monthlyTotals = vector<PortfolioMonthlyTotal>();
    }

    if (results.monthlyTotals)
        DLOG("Aggregated " << results.monthlyTotals->size() << " monthly totals");

    timer.stop();
    LOG("Cash flow engine finished in " << timer.format(2, "%w") << " s");

    return results;
}

CashFlowResults computeCashFlows(const vector<LoanRecord>& loans, const AssumptionSet& assumptions, bool aggregate,
                                 const vector<GroupingKey>& groupingKeys, Size nThreads) {
    CashFlowEngine engine(QuantLib::ext::make_shared<AssumptionSet>(assumptions), nThreads);
    return engine.run(loans, aggregate, groupingKeys);
}

} // namespace analytics
} // namespace loanrisk
