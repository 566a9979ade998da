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

/*! \file lrd/configuration/assumptions.hpp
    \brief Prepayment, credit and fee assumptions driving the cash flow projection
    \ingroup configuration
*/

#pragma once

#include <lrd/utilities/xmlutils.hpp>

#include <ql/types.hpp>
#include <ql/utilities/null.hpp>

#include <map>
#include <ostream>
#include <string>

namespace loanrisk {
namespace data {

//! Prepayment and credit assumption of one tier
/*! The credit cost is either given directly or as PD x LGD, exactly one of the two forms must be supplied.
    \ingroup configuration
*/
class TierAssumption : public XMLSerializable {
public:
    TierAssumption() {}
    //! Direct credit cost
    TierAssumption(const std::string& name, QuantLib::Real cpr, QuantLib::Real creditCost);
    //! Credit cost from probability of default and loss given default
    TierAssumption(const std::string& name, QuantLib::Real cpr, QuantLib::Real pd, QuantLib::Real lgd);

    //! \name XMLSerializable interface
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

    //! \name Inspectors
    //@{
    const std::string& name() const { return name_; }
    //! annual conditional prepayment rate
    QuantLib::Real cpr() const { return cpr_; }
    //! annual credit cost rate, PD x LGD if given in that form
    QuantLib::Real creditCost() const;
    bool hasPdLgd() const { return pd_ != QuantLib::Null<QuantLib::Real>(); }
    QuantLib::Real pd() const { return pd_; }
    QuantLib::Real lgd() const { return lgd_; }
    //@}

    //! Throws InvalidInputError unless CPR and credit cost lie in [0, 1) and exactly one credit form is given
    void check() const;

private:
    std::string name_;
    QuantLib::Real cpr_ = 0.0;
    QuantLib::Real creditCost_ = QuantLib::Null<QuantLib::Real>();
    QuantLib::Real pd_ = QuantLib::Null<QuantLib::Real>();
    QuantLib::Real lgd_ = QuantLib::Null<QuantLib::Real>();
};

//! How the scheduled principal is derived each month
/*! \ingroup configuration */
enum class AmortizationMethod {
    //! level payment fixed at the first month, prepayments and losses shorten the life of the loan
    ContractualPayment,
    //! level payment recomputed every month from the adjusted balance and the remaining term
    Reamortizing
};

AmortizationMethod parseAmortizationMethod(const std::string& s);

std::ostream& operator<<(std::ostream& out, AmortizationMethod m);

//! Assumption set
/*!
  Tier keyed prepayment and credit assumptions plus the fee and accounting parameters applied to every loan. A
  "default" tier is mandatory, loans whose tier is missing or unknown resolve to it.

  \ingroup configuration
*/
class AssumptionSet : public XMLSerializable {
public:
    //! Name of the fallback tier
    static const std::string defaultTier;

    //! Empty set, to be populated via fromXML() or addTier()
    AssumptionSet() {}
    //! Set with a default tier only and all fees zero
    explicit AssumptionSet(const TierAssumption& defaultAssumption);

    //! \name XMLSerializable interface
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

    //! Add or replace a tier
    void addTier(const TierAssumption& tier);
    bool hasTier(const std::string& name) const { return tiers_.find(name) != tiers_.end(); }
    const std::map<std::string, TierAssumption>& tiers() const { return tiers_; }

    //! Exact tier if present, else the default tier, throws InvalidInputError if neither exists
    const TierAssumption& resolve(const std::string& tier) const;

    //! \name Inspectors
    //@{
    QuantLib::Real servicingFeeRate() const { return servicingFeeRate_; }
    QuantLib::Real reportingFeeRate() const { return reportingFeeRate_; }
    QuantLib::Real originationFeeRate() const { return originationFeeRate_; }
    QuantLib::Real investorShare() const { return investorShare_; }
    bool creditLossReducesInterest() const { return creditLossReducesInterest_; }
    bool interestOnStartingBalance() const { return interestOnStartingBalance_; }
    AmortizationMethod amortizationMethod() const { return amortizationMethod_; }
    bool negativeAmortization() const { return negativeAmortization_; }
    //@}

    //! \name Setters
    //@{
    QuantLib::Real& servicingFeeRate() { return servicingFeeRate_; }
    QuantLib::Real& reportingFeeRate() { return reportingFeeRate_; }
    QuantLib::Real& originationFeeRate() { return originationFeeRate_; }
    QuantLib::Real& investorShare() { return investorShare_; }
    bool& creditLossReducesInterest() { return creditLossReducesInterest_; }
    bool& interestOnStartingBalance() { return interestOnStartingBalance_; }
    AmortizationMethod& amortizationMethod() { return amortizationMethod_; }
    bool& negativeAmortization() { return negativeAmortization_; }
    //@}

    //! Throws InvalidInputError if the default tier is missing, a tier is invalid, a fee is negative or the
    //! investor share is outside (0, 1]
    void check() const;

private:
    std::map<std::string, TierAssumption> tiers_;
    QuantLib::Real servicingFeeRate_ = 0.0;
    QuantLib::Real reportingFeeRate_ = 0.0;
    QuantLib::Real originationFeeRate_ = 0.0;
    QuantLib::Real investorShare_ = 1.0;
    bool creditLossReducesInterest_ = false;
    bool interestOnStartingBalance_ = false;
    AmortizationMethod amortizationMethod_ = AmortizationMethod::ContractualPayment;
    bool negativeAmortization_ = false;
};

} // namespace data
} // namespace loanrisk
