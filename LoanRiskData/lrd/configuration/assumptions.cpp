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

#include <lrd/configuration/assumptions.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/log.hpp>
#include <lrd/utilities/parsers.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <cmath>
#include <sstream>

using namespace QuantLib;
using std::string;

namespace loanrisk {
namespace data {

namespace {
bool inUnitInterval(Real x) { return std::isfinite(x) && x >= 0.0 && x < 1.0; }

Real optionalChild(XMLNode* node, const string& name) {
    string s = XMLUtils::getChildValue(node, name, false);
    return s.empty() ? Null<Real>() : parseReal(s);
}
} // namespace

const string AssumptionSet::defaultTier = "default";

TierAssumption::TierAssumption(const string& name, Real cpr, Real creditCost)
    : name_(name), cpr_(cpr), creditCost_(creditCost) {
    check();
}

TierAssumption::TierAssumption(const string& name, Real cpr, Real pd, Real lgd)
    : name_(name), cpr_(cpr), pd_(pd), lgd_(lgd) {
    check();
}

Real TierAssumption::creditCost() const { return hasPdLgd() ? pd_ * lgd_ : creditCost_; }

void TierAssumption::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "Tier");
    name_ = XMLUtils::getAttribute(node, "name");
    cpr_ = XMLUtils::getChildValueAsDouble(node, "CPR", true);
    creditCost_ = optionalChild(node, "CreditCost");
    pd_ = optionalChild(node, "PD");
    lgd_ = optionalChild(node, "LGD");
    check();
}

XMLNode* TierAssumption::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("Tier");
    XMLUtils::addAttribute(doc, node, "name", name_);
    XMLUtils::addChild(doc, node, "CPR", cpr_);
    if (hasPdLgd()) {
        XMLUtils::addChild(doc, node, "PD", pd_);
        XMLUtils::addChild(doc, node, "LGD", lgd_);
    } else {
        XMLUtils::addChild(doc, node, "CreditCost", creditCost_);
    }
    return node;
}

void TierAssumption::check() const {
    LOANRISK_REQUIRE_INPUT(!name_.empty(), "tier assumption: name must not be empty");
    LOANRISK_REQUIRE_INPUT(inUnitInterval(cpr_), "tier " << name_ << ": CPR (" << cpr_ << ") must be in [0, 1)");
    bool direct = creditCost_ != Null<Real>();
    bool hasPd = pd_ != Null<Real>();
    bool hasLgd = lgd_ != Null<Real>();
    LOANRISK_REQUIRE_INPUT(hasPd == hasLgd, "tier " << name_ << ": PD and LGD must be given together");
    LOANRISK_REQUIRE_INPUT(direct != hasPd,
                           "tier " << name_ << ": exactly one of CreditCost or PD/LGD must be given");
    if (hasPd) {
        LOANRISK_REQUIRE_INPUT(pd_ >= 0.0 && pd_ <= 1.0, "tier " << name_ << ": PD (" << pd_ << ") must be in [0, 1]");
        LOANRISK_REQUIRE_INPUT(lgd_ >= 0.0 && lgd_ <= 1.0,
                               "tier " << name_ << ": LGD (" << lgd_ << ") must be in [0, 1]");
    }
    LOANRISK_REQUIRE_INPUT(inUnitInterval(creditCost()),
                           "tier " << name_ << ": credit cost (" << creditCost() << ") must be in [0, 1)");
}

AmortizationMethod parseAmortizationMethod(const string& s) {
    string str = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(s));
    if (str == "contractualpayment" || str == "contractual")
        return AmortizationMethod::ContractualPayment;
    if (str == "reamortizing" || str == "reamortising")
        return AmortizationMethod::Reamortizing;
    LOANRISK_REQUIRE_INPUT(false, "Amortization method \"" << s << "\" not recognized");
    return AmortizationMethod::ContractualPayment;
}

std::ostream& operator<<(std::ostream& out, AmortizationMethod m) {
    switch (m) {
    case AmortizationMethod::ContractualPayment:
        return out << "ContractualPayment";
    case AmortizationMethod::Reamortizing:
        return out << "Reamortizing";
    default:
        return out << "Unknown";
    }
}

AssumptionSet::AssumptionSet(const TierAssumption& defaultAssumption) {
    LOANRISK_REQUIRE_INPUT(defaultAssumption.name() == defaultTier,
                           "AssumptionSet: expected a tier named '" << defaultTier << "', got '"
                                                                    << defaultAssumption.name() << "'");
    addTier(defaultAssumption);
}

void AssumptionSet::addTier(const TierAssumption& tier) {
    tier.check();
    tiers_[tier.name()] = tier;
}

const TierAssumption& AssumptionSet::resolve(const string& tier) const {
    auto it = tiers_.find(tier);
    if (it != tiers_.end())
        return it->second;
    it = tiers_.find(defaultTier);
    LOANRISK_REQUIRE_INPUT(it != tiers_.end(), "tier '" << tier << "' has no assumption and no '" << defaultTier
                                                        << "' tier is configured");
    return it->second;
}

void AssumptionSet::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "Assumptions");

    tiers_.clear();
    XMLNode* tiersNode = XMLUtils::getChildNode(node, "Tiers");
    LOANRISK_REQUIRE_INPUT(tiersNode, "Assumptions: Tiers node not found");
    for (XMLNode* child : XMLUtils::getChildrenNodes(tiersNode, "Tier")) {
        TierAssumption t;
        t.fromXML(child);
        LOANRISK_REQUIRE_INPUT(!hasTier(t.name()), "Assumptions: duplicate tier '" << t.name() << "'");
        addTier(t);
    }

    servicingFeeRate_ = reportingFeeRate_ = originationFeeRate_ = 0.0;
    if (XMLNode* fees = XMLUtils::getChildNode(node, "Fees")) {
        servicingFeeRate_ = XMLUtils::getChildValueAsDouble(fees, "ServicingFeeRate", false, 0.0);
        reportingFeeRate_ = XMLUtils::getChildValueAsDouble(fees, "ReportingFeeRate", false, 0.0);
        originationFeeRate_ = XMLUtils::getChildValueAsDouble(fees, "OriginationFeeRate", false, 0.0);
    }

    investorShare_ = XMLUtils::getChildValueAsDouble(node, "InvestorShare", false, 1.0);
    creditLossReducesInterest_ = XMLUtils::getChildValueAsBool(node, "CreditLossReducesInterest", false, false);
    interestOnStartingBalance_ = XMLUtils::getChildValueAsBool(node, "InterestOnStartingBalance", false, false);
    string method = XMLUtils::getChildValue(node, "AmortizationMethod", false, "ContractualPayment");
    amortizationMethod_ = parseAmortizationMethod(method);
    negativeAmortization_ = XMLUtils::getChildValueAsBool(node, "NegativeAmortization", false, false);

    check();
    DLOG("Loaded assumptions: " << tiers_.size() << " tiers, method " << amortizationMethod_);
}

XMLNode* AssumptionSet::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("Assumptions");

    XMLNode* tiersNode = doc.allocNode("Tiers");
    for (const auto& t : tiers_)
        XMLUtils::appendNode(tiersNode, t.second.toXML(doc));
    XMLUtils::appendNode(node, tiersNode);

    XMLNode* fees = doc.allocNode("Fees");
    XMLUtils::addChild(doc, fees, "ServicingFeeRate", servicingFeeRate_);
    XMLUtils::addChild(doc, fees, "ReportingFeeRate", reportingFeeRate_);
    XMLUtils::addChild(doc, fees, "OriginationFeeRate", originationFeeRate_);
    XMLUtils::appendNode(node, fees);

    XMLUtils::addChild(doc, node, "InvestorShare", investorShare_);
    XMLUtils::addChild(doc, node, "CreditLossReducesInterest", creditLossReducesInterest_);
    XMLUtils::addChild(doc, node, "InterestOnStartingBalance", interestOnStartingBalance_);
    std::ostringstream method;
    method << amortizationMethod_;
    XMLUtils::addChild(doc, node, "AmortizationMethod", method.str());
    XMLUtils::addChild(doc, node, "NegativeAmortization", negativeAmortization_);
    return node;
}

void AssumptionSet::check() const {
    LOANRISK_REQUIRE_INPUT(hasTier(defaultTier), "Assumptions: mandatory '" << defaultTier << "' tier is missing");
    for (const auto& t : tiers_)
        t.second.check();
    LOANRISK_REQUIRE_INPUT(servicingFeeRate_ >= 0.0,
                           "Assumptions: ServicingFeeRate (" << servicingFeeRate_ << ") must be non-negative");
    LOANRISK_REQUIRE_INPUT(reportingFeeRate_ >= 0.0,
                           "Assumptions: ReportingFeeRate (" << reportingFeeRate_ << ") must be non-negative");
    LOANRISK_REQUIRE_INPUT(originationFeeRate_ >= 0.0,
                           "Assumptions: OriginationFeeRate (" << originationFeeRate_ << ") must be non-negative");
    LOANRISK_REQUIRE_INPUT(investorShare_ > 0.0 && investorShare_ <= 1.0,
                           "Assumptions: InvestorShare (" << investorShare_ << ") must be in (0, 1]");
}

} // namespace data
} // namespace loanrisk
