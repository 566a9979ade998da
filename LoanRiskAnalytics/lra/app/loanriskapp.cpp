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


#include <lra/app/loanriskapp.hpp>
#include <lra/app/reportwriter.hpp>
#include <lra/app/structuredanalyticserror.hpp>
#include <lra/risk/yieldsolver.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/log.hpp>
#include <lrd/utilities/parsers.hpp>
#include <lrd/utilities/to_string.hpp>

#include <boost/filesystem.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>

using namespace QuantLib;
using namespace loanrisk::data;
using std::string;

namespace loanrisk {
namespace analytics {

namespace {
const std::vector<string> knownAnalytics = {"cashflow", "duration", "wal", "yield"};
}

LoanRiskApp::LoanRiskApp(const QuantLib::ext::shared_ptr<Parameters>& params, bool console)
    : params_(params), console_(console) {
    QL_REQUIRE(params_, "LoanRiskApp: no parameters given");
    runTimer_.stop();
}

LoanRiskApp::~LoanRiskApp() { closeLog(); }

void LoanRiskApp::setupLog(const string& path, const string& file, Size mask) {
    closeLog();

    boost::filesystem::path p{path};
    if (!boost::filesystem::exists(p)) {
        boost::filesystem::create_directories(p);
    }
    QL_REQUIRE(boost::filesystem::is_directory(p), "output path '" << path << "' is not a directory.");

    Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>(file));
    Log::instance().setMask(static_cast<unsigned>(mask));
    Log::instance().switchOn();
}

void LoanRiskApp::closeLog() { Log::instance().removeAllLoggers(); }

void LoanRiskApp::initFromParams() {
    QL_REQUIRE(params_->hasGroup("setup"), "parameter group 'setup' missing");

    inputPath_ = params_->get("setup", "inputPath", false);
    outputPath_ = params_->get("setup", "outputPath");

    string tmp = params_->get("setup", "logFile", false);
    logFile_ = (boost::filesystem::path(outputPath_) / (tmp.empty() ? "log.txt" : tmp)).string();
    logMask_ = 15;
    bool logToConsole = false;

    if (params_->hasGroup("logging")) {
        tmp = params_->get("logging", "logFile", false);
        if (!tmp.empty())
            logFile_ = (boost::filesystem::path(outputPath_) / tmp).string();
        tmp = params_->get("logging", "logMask", false);
        if (!tmp.empty())
            logMask_ = static_cast<Size>(parseInteger(tmp));
        tmp = params_->get("logging", "progressLogToConsole", false);
        if (!tmp.empty())
            logToConsole = parseBool(tmp);
    }

    setupLog(outputPath_, logFile_, logMask_);
    if (logToConsole)
        Log::instance().registerLogger(QuantLib::ext::make_shared<StderrLogger>());

    params_->log();

    tmp = params_->get("setup", "nThreads", false);
    nThreads_ = 1;
    if (!tmp.empty()) {
        int n = parseInteger(tmp);
        LOANRISK_REQUIRE_INPUT(n > 0, "nThreads (" << n << ") must be positive");
        nThreads_ = static_cast<Size>(n);
    }

    tmp = params_->get("setup", "asofDate", false);
    asof_ = tmp.empty() ? Date() : parseDate(tmp);

    for (const auto& a : knownAnalytics) {
        if (params_->hasGroup(a) && !params_->isActive(a))
            DLOG("analytic " << a << " not active");
    }
}

void LoanRiskApp::loadInputs() {
    boost::filesystem::path inputPath(inputPath_);

    string portfolioFile = (inputPath / params_->get("setup", "portfolioFile")).string();
    portfolio_.clear();
    portfolio_.fromFile(portfolioFile);

    string assumptionsFile = (inputPath / params_->get("setup", "assumptionsFile")).string();
    assumptions_ = QuantLib::ext::make_shared<AssumptionSet>();
    assumptions_->fromFile(assumptionsFile);
    LOG("Loaded assumptions from file " << assumptionsFile);
}

bool LoanRiskApp::needsCashFlows() const {
    return std::any_of(knownAnalytics.begin(), knownAnalytics.end(),
                       [this](const string& a) { return params_->isActive(a); });
}

void LoanRiskApp::run() {
    runTimer_.start();

    if (console_)
        std::cout << std::setw(30) << std::left << "Loading inputs" << std::flush;
    initFromParams();
    loadInputs();
    if (console_)
        std::cout << "OK" << std::endl;

    cashFlows_ = boost::none;
    duration_ = boost::none;
    wal_ = boost::none;
    yield_ = boost::none;
    reports_.clear();
    errors_.clear();

    if (needsCashFlows()) {
        try {
            runCashFlows();
        } catch (const std::exception& e) {
            analyticFailed("cashflow", e);
        }
    } else {
        WLOG("No active analytics");
    }

    if (cashFlows_) {
        if (params_->isActive("duration")) {
            try {
                runDuration();
            } catch (const std::exception& e) {
                analyticFailed("duration", e);
            }
        }
        if (params_->isActive("wal")) {
            try {
                runWal();
            } catch (const std::exception& e) {
                analyticFailed("wal", e);
            }
        }
        if (params_->isActive("yield")) {
            try {
                runYield();
            } catch (const std::exception& e) {
                analyticFailed("yield", e);
            }
        }
    }

    try {
        writeReports();
    } catch (const std::exception& e) {
        analyticFailed("reports", e);
    }

    runTimer_.stop();
    LOG("LoanRisk analytics done in " << runTimer_.format(2, "%w") << " sec, " << errors_.size() << " errors");
    if (console_)
        std::cout << "LoanRisk analytics done, " << errors_.size() << " errors" << std::endl;
}

void LoanRiskApp::runCashFlows() {
    LOG("Running cash flow projection for " << portfolio_.size() << " loans on " << nThreads_ << " threads");

    std::vector<GroupingKey> keys;
    string groupBy = params_->get("cashflow", "groupBy", false);
    if (!groupBy.empty()) {
        for (const auto& k : parseListOfValues(groupBy))
            keys.push_back(parseGroupingKey(k));
    }

    CashFlowEngine engine(assumptions_, nThreads_);
    cashFlows_ = engine.run(portfolio_, true, keys);

    if (params_->isActive("cashflow")) {
        ReportWriter writer;
        auto cf = QuantLib::ext::make_shared<InMemoryReport>();
        writer.writeLoanCashFlows(*cf, cashFlows_->loanCashFlows);
        reports_["cashflow"] = cf;
        auto totals = QuantLib::ext::make_shared<InMemoryReport>();
        writer.writeMonthlyTotals(*totals, *cashFlows_->monthlyTotals);
        reports_["monthlytotals"] = totals;
    }
}

void LoanRiskApp::runDuration() {
    boost::optional<Rate> discountRate;
    string tmp = params_->get("duration", "discountRate", false);
    if (!tmp.empty())
        discountRate = parseReal(tmp);
    tmp = params_->get("duration", "includeConvexity", false);
    bool includeConvexity = tmp.empty() ? true : parseBool(tmp);

    duration_ = RiskMetrics::duration(cashFlows_->loanCashFlows, discountRate, includeConvexity, asof_);
    LOG("Duration: PV " << duration_->presentValue << ", Macaulay " << duration_->macaulayDuration << ", modified "
                        << duration_->modifiedDuration);
}

void LoanRiskApp::runWal() {
    string tmp = params_->get("wal", "principalField", false);
    PrincipalField field = tmp.empty() ? PrincipalField::Total : parsePrincipalField(tmp);
    wal_ = RiskMetrics::weightedAverageLife(cashFlows_->loanCashFlows, field, asof_);
    LOG("WAL " << *wal_);
}

void LoanRiskApp::runYield() {
    string tmp = params_->get("yield", "presentValue", false);
    Real pv = tmp.empty() ? portfolio_.totalBalance() : parseReal(tmp);

    tmp = params_->get("yield", "compounding", false);
    CompoundingConvention compounding = tmp.empty() ? CompoundingConvention::Monthly : parseCompoundingConvention(tmp);

    tmp = params_->get("yield", "cashFlowField", false);
    CashFlowField field = tmp.empty() ? CashFlowField::Total : parseCashFlowField(tmp);

    YieldSolverConfig defaults;
    Size maxIterations = defaults.maxIterations();
    tmp = params_->get("yield", "maxIterations", false);
    if (!tmp.empty()) {
        int n = parseInteger(tmp);
        LOANRISK_REQUIRE_INPUT(n > 0, "maxIterations (" << n << ") must be positive");
        maxIterations = static_cast<Size>(n);
    }
    tmp = params_->get("yield", "accuracy", false);
    Real accuracy = tmp.empty() ? defaults.accuracy() : parseReal(tmp);
    tmp = params_->get("yield", "initialGuess", false);
    Real initialGuess = tmp.empty() ? defaults.initialGuess() : parseReal(tmp);

    Date start = asof_;
    if (start == Date()) {
        for (const auto& l : portfolio_.loans())
            start = start == Date() ? l.snapshotDate() : std::min(start, l.snapshotDate());
    }

    YieldSolver solver(YieldSolverConfig(maxIterations, accuracy, initialGuess));
    yield_ = solver.effectiveYield(*cashFlows_->monthlyTotals, pv, start, compounding, field);
    LOG("Yield " << *yield_ << " (" << compounding << ") for price " << pv << " as of " << to_string(start));
}

string LoanRiskApp::outputFile(const string& analytic, const string& param, const string& def) const {
    string tmp = params_->get(analytic, param, false);
    return (boost::filesystem::path(outputPath_) / (tmp.empty() ? def : tmp)).string();
}

void LoanRiskApp::writeReports() {
    if (duration_ || wal_ || yield_) {
        auto rm = QuantLib::ext::make_shared<InMemoryReport>();
        ReportWriter().writeRiskMetrics(*rm, duration_, wal_, yield_);
        reports_["riskmetrics"] = rm;
    }

    auto it = reports_.find("cashflow");
    if (it != reports_.end())
        it->second->toFile(outputFile("cashflow", "outputFileName", "cashflows.csv"));
    it = reports_.find("monthlytotals");
    if (it != reports_.end())
        it->second->toFile(outputFile("cashflow", "monthlyTotalsFileName", "monthly_totals.csv"));
    it = reports_.find("riskmetrics");
    if (it != reports_.end())
        it->second->toFile(outputFile("setup", "riskMetricsFileName", "riskmetrics.csv"));
}

void LoanRiskApp::analyticFailed(const string& analytic, const std::exception& e) {
    StructuredAnalyticsErrorMessage msg(analytic, e);
    msg.log();
    errors_.push_back(msg.json());
    if (console_)
        std::cout << "Error in analytic " << analytic << ": " << e.what() << std::endl;
}

} // namespace analytics
} // namespace loanrisk
