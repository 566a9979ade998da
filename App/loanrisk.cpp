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
#include <lrd/version.hpp>

#include <iostream>

using namespace std;
using namespace loanrisk::analytics;

int main(int argc, char** argv) {

    if (argc == 2 && (string(argv[1]) == "-v" || string(argv[1]) == "--version")) {
        cout << "LoanRisk version " << LOANRISK_VERSION << endl;
        return 0;
    }

    if (argc != 2) {
        cout << endl << "usage: loanrisk path/to/loanrisk.xml" << endl << endl;
        return -1;
    }

    string inputFile(argv[1]);

    try {
        auto params = QuantLib::ext::make_shared<Parameters>();
        params->fromFile(inputFile);
        LoanRiskApp app(params, true);
        app.run();
        if (!app.errors().empty()) {
            cout << endl << app.errors().size() << " analytic(s) failed, see the log file for details" << endl;
            return 1;
        }
        return 0;
    } catch (const exception& e) {
        cout << endl << "an error occurred: " << e.what() << endl;
        return -1;
    }
}
