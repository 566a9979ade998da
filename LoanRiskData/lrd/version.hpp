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

/*! \file lrd/version.hpp
    \brief Version
*/

#pragma once

// Boost Version
// Boost 1.72 and above have been tested on Linux.
#include <boost/version.hpp>
#if BOOST_VERSION < 107200
#error using an old version of Boost, please update.
#endif

// We require QuantLib 1.30 or higher, QuantLib::ext::shared_ptr is used throughout
#include <ql/version.hpp>
#if QL_HEX_VERSION < 0x013000f0
#error using an old version of QuantLib, please update.
#endif

//! Version string
#define LOANRISK_VERSION "1.0.0"

//! Version number
#define LOANRISK_VERSION_NUM 1000000
