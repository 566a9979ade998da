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


#include <lra/risk/yieldsolver.hpp>
#include <lrd/utilities/dates.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/log.hpp>
#include <lrd/utilities/to_string.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <ql/interestrate.hpp>

#include <cmath>
#include <map>

using namespace QuantLib;
using namespace loanrisk::data;
using std::vector;

namespace loanrisk {
namespace analytics {

namespace {

InterestRate interestRate(Rate r, CompoundingConvention c) {
    if (c == CompoundingConvention::Continuous)
        return InterestRate(r, actualActual(), Continuous, NoFrequency);
    return InterestRate(r, actualActual(), Compounded, static_cast<Frequency>(periodsPerYear(c)));
}

// NPV of the series net of the purchase price as a function of the rate
class NpvFunction {
public:
    NpvFunction(const CashFlowSeries& series, Real pv, const Date& startDate, CompoundingConvention compounding)
        : amounts_(series.amounts), pv_(pv), compounding_(compounding) {
        times_.reserve(series.size());
        for (const auto& d : series.dates) {
            LOANRISK_REQUIRE_DOMAIN(d >= startDate, "cash flow date " << to_string(d) << " is before the start date "
                                                                       << to_string(startDate));
            times_.push_back(yearFraction(startDate, d));
        }
    }

    Real operator()(Rate r) const {
        InterestRate y = interestRate(r, compounding_);
        Real npv = -pv_;
        for (Size i = 0; i < times_.size(); ++i)
            npv += amounts_[i] * y.discountFactor(times_[i]);
        return npv;
    }

    Real derivative(Rate r) const {
        InterestRate y = interestRate(r, compounding_);
        Real factor = compounding_ == CompoundingConvention::Continuous
                          ? 1.0
                          : 1.0 / (1.0 + r / static_cast<Real>(periodsPerYear(compounding_)));
        Real d = 0.0;
        for (Size i = 0; i < times_.size(); ++i)
            d -= amounts_[i] * times_[i] * y.discountFactor(times_[i]) * factor;
        return d;
    }

private:
    const vector<Real>& amounts_;
    Real pv_;
    CompoundingConvention compounding_;
    vector<Time> times_;
};

YieldSolverResult result(Rate r, Real npv, Size iterations, bool bisection) {
    YieldSolverResult res;
    res.yield = r;
    res.npv = npv;
    res.iterations = iterations;
    res.bisection = bisection;
    return res;
}

} // namespace

CashFlowField parseCashFlowField(const std::string& s) {
    std::string str = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(s));
    if (str == "total")
        return CashFlowField::Total;
    if (str == "investor")
        return CashFlowField::Investor;
    LOANRISK_REQUIRE_INPUT(false, "cash flow field \"" << s << "\" not recognized, expected Total or Investor");
    return CashFlowField::Total;
}

YieldSolver::YieldSolver(const YieldSolverConfig& config) : config_(config) {}

Rate YieldSolver::solve(const CashFlowSeries& series, Real pv, const Date& startDate,
                        CompoundingConvention compounding) const {
    return solveWithDiagnostics(series, pv, startDate, compounding).yield;
}

YieldSolverResult YieldSolver::solveWithDiagnostics(const CashFlowSeries& series, Real pv, const Date& startDate,
                                                    CompoundingConvention compounding) const {

    LOANRISK_REQUIRE_INPUT(!series.empty(), "yield solver: cash flow series is empty");
    LOANRISK_REQUIRE_INPUT(series.dates.size() == series.amounts.size(),
                           "yield solver: " << series.dates.size() << " dates but " << series.amounts.size()
                                            << " amounts");
    LOANRISK_REQUIRE_INPUT(std::isfinite(pv) && pv > 0.0, "yield solver: present value (" << pv
                                                                                          << ") must be positive");
    LOANRISK_REQUIRE_INPUT(startDate != Date(), "yield solver: start date is missing");
    bool nonZero = false;
    for (Real a : series.amounts) {
        LOANRISK_REQUIRE_INPUT(std::isfinite(a), "yield solver: cash flow amount is not finite");
        nonZero = nonZero || a != 0.0;
    }
    LOANRISK_REQUIRE_INPUT(nonZero, "yield solver: all cash flows are zero");

    NpvFunction f(series, pv, startDate, compounding);

    const Size maxIterations = config_.maxIterations();
    const Real accuracy = config_.accuracy();
    Rate lower = config_.lowerBound();
    Rate upper = config_.upperBound();

    // Newton phase

    Size iterations = 0;
    Rate r = config_.initialGuess();
    Real fr = f(r);
    while (iterations < maxIterations) {
        if (!std::isfinite(fr))
            break;
        if (std::fabs(fr) < accuracy)
            return result(r, fr, iterations, false);
        Real df = f.derivative(r);
        if (!std::isfinite(df) || std::fabs(df) < QL_EPSILON)
            break;
        Real step = fr / df;
        Rate next = r - step;
        ++iterations;
        if (!std::isfinite(next) || next < lower || next > upper)
            break;
        Real fnext = f(next);
        if (std::fabs(step) < accuracy && std::isfinite(fnext))
            return result(next, fnext, iterations, false);
        if (!std::isfinite(fnext) || std::fabs(fnext) >= std::fabs(fr))
            break;
        r = next;
        fr = fnext;
    }

    if (iterations >= maxIterations) {
        LOANRISK_FAIL_NO_CONVERGENCE("yield solver: Newton iteration did not converge within "
                                     << maxIterations << " iterations, last rate " << r << ", npv " << fr);
    }

    // bisection phase

    DLOG("yield solver: switching to bisection after " << iterations << " Newton iterations at rate " << r);

    Real flower = f(lower), fupper = f(upper);
    if (!std::isfinite(flower) || !std::isfinite(fupper)) {
        LOANRISK_FAIL_NO_CONVERGENCE("yield solver: npv is not finite at the bounds [" << lower << ", " << upper
                                                                                       << "]");
    }
    if (std::fabs(flower) < accuracy)
        return result(lower, flower, iterations, true);
    if (std::fabs(fupper) < accuracy)
        return result(upper, fupper, iterations, true);
    if (flower * fupper > 0.0) {
        LOANRISK_FAIL_NO_CONVERGENCE("yield solver: no root bracketed by [" << lower << ", " << upper << "], npv "
                                                                            << flower << " and " << fupper);
    }

    // narrow the bracket with the last Newton iterate
    if (std::isfinite(fr) && r > lower && r < upper) {
        if (flower * fr < 0.0) {
            upper = r;
            fupper = fr;
        } else if (fr * fupper < 0.0) {
            lower = r;
            flower = fr;
        }
    }

    while (iterations < maxIterations) {
        ++iterations;
        Rate mid = 0.5 * (lower + upper);
        Real fmid = f(mid);
        if (std::fabs(fmid) < accuracy || 0.5 * (upper - lower) < accuracy)
            return result(mid, fmid, iterations, true);
        if ((fmid < 0.0) == (flower < 0.0)) {
            lower = mid;
            flower = fmid;
        } else {
            upper = mid;
            fupper = fmid;
        }
    }

    LOANRISK_FAIL_NO_CONVERGENCE("yield solver: no convergence within " << maxIterations << " iterations, bracket ["
                                                                        << lower << ", " << upper << "]");
}

Rate YieldSolver::effectiveYield(const vector<PortfolioMonthlyTotal>& totals, Real pv, const Date& startDate,
                                 CompoundingConvention compounding, CashFlowField field) const {
    return solve(series(totals, field), pv, startDate, compounding);
}

Real YieldSolver::npv(const CashFlowSeries& series, Real pv, const Date& startDate, CompoundingConvention compounding,
                      Rate rate) {
    LOANRISK_REQUIRE_INPUT(series.dates.size() == series.amounts.size(),
                           "npv: " << series.dates.size() << " dates but " << series.amounts.size() << " amounts");
    return NpvFunction(series, pv, startDate, compounding)(rate);
}

CashFlowSeries YieldSolver::series(const vector<PortfolioMonthlyTotal>& totals, CashFlowField field) {
    std::map<Date, Real> byDate;
    for (const auto& t : totals)
        byDate[t.date] += field == CashFlowField::Total ? t.totalPayment : t.investorTotal;
    CashFlowSeries s;
    for (const auto& d : byDate)
        s.add(d.first, d.second);
    return s;
}

Rate solveYield(const CashFlowSeries& series, Real pv, const Date& startDate, CompoundingConvention compounding,
                Size maxIterations, Real tolerance) {
    YieldSolverConfig config(maxIterations, tolerance);
    return YieldSolver(config).solve(series, pv, startDate, compounding);
}

} // namespace analytics
} // namespace loanrisk
