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


/*! \file lra/app/loanriskapp.hpp
    \brief LoanRisk application class
    \ingroup app
*/

#pragma once

#include <lra/app/parameters.hpp>
#include <lra/engine/cashflowengine.hpp>
#include <lra/risk/riskmetrics.hpp>
#include <lrd/configuration/assumptions.hpp>
#include <lrd/portfolio/loanportfolio.hpp>
#include <lrd/report/inmemoryreport.hpp>

#include <boost/optional.hpp>
#include <boost/timer/timer.hpp>
#include <ql/shared_ptr.hpp>

#include <map>
#include <string>
#include <vector>

namespace loanrisk {
namespace analytics {

//! LoanRisk application
/*!
  Reads the parameter file groups, sets up logging, loads the loan portfolio and the assumptions and runs the
  active analytics \c cashflow, \c duration, \c wal and \c yield. Reports are kept in memory and written to the
  output path. Duration, WAL and yield share one risk metrics report, its file name is the Setup parameter
  \c riskMetricsFileName.

  A failing analytic is logged as a StructuredAnalyticsErrorMessage and does not stop the remaining analytics,
  errors() lists the failures. Errors in the setup (parameters, logging, input files) are thrown from run().

  \ingroup app
*/
class LoanRiskApp {
public:
    LoanRiskApp(const QuantLib::ext::shared_ptr<Parameters>& params, bool console = false);
    virtual ~LoanRiskApp();

    //! Run the active analytics
    void run();

    //! Failed analytics, one structured message (json) each
    const std::vector<std::string>& errors() const { return errors_; }

    //! \name Results
    //@{
    const data::LoanPortfolio& portfolio() const { return portfolio_; }
    const boost::optional<CashFlowResults>& cashFlows() const { return cashFlows_; }
    const boost::optional<DurationResult>& duration() const { return duration_; }
    const boost::optional<QuantLib::Real>& wal() const { return wal_; }
    const boost::optional<QuantLib::Real>& yield() const { return yield_; }
    //! in memory reports by name, "cashflow", "monthlytotals" and "riskmetrics"
    const std::map<std::string, QuantLib::ext::shared_ptr<data::InMemoryReport>>& reports() const {
        return reports_;
    }
    //@}

protected:
    virtual void setupLog(const std::string& path, const std::string& file, QuantLib::Size mask);
    virtual void closeLog();

private:
    void initFromParams();
    void loadInputs();
    bool needsCashFlows() const;
    void runCashFlows();
    void runDuration();
    void runWal();
    void runYield();
    void writeReports();
    void analyticFailed(const std::string& analytic, const std::exception& e);
    std::string outputFile(const std::string& analytic, const std::string& param, const std::string& def) const;

    QuantLib::ext::shared_ptr<Parameters> params_;
    bool console_;

    std::string inputPath_, outputPath_, logFile_;
    QuantLib::Size logMask_ = 15;
    QuantLib::Size nThreads_ = 1;
    QuantLib::Date asof_;

    data::LoanPortfolio portfolio_;
    QuantLib::ext::shared_ptr<data::AssumptionSet> assumptions_;

    boost::optional<CashFlowResults> cashFlows_;
    boost::optional<DurationResult> duration_;
    boost::optional<QuantLib::Real> wal_, yield_;
    std::map<std::string, QuantLib::ext::shared_ptr<data::InMemoryReport>> reports_;
    std::vector<std::string> errors_;

    boost::timer::cpu_timer runTimer_;
};

} // namespace analytics
} // namespace loanrisk
