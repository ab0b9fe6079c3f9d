/*
 Copyright (C) 2026 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CRE, a free-software/open-source library
 for multi-curve calibration and market quote risk analysis

 CRE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <crea/app/creapp.hpp>

#include <cve/version.hpp>

#include <iostream>

using namespace std;
using namespace cre::data;
using namespace cre::analytics;

int main(int argc, char** argv) {

    if (argc == 2 && (string(argv[1]) == "-v" || string(argv[1]) == "--version")) {
        cout << "CRE version " << CRE_VERSION << endl;
        exit(0);
    }

    if (argc != 2) {
        std::cout << endl << "usage: cre path/to/cre.xml" << endl << endl;
        return -1;
    }

    string inputFile(argv[1]);

    try {
        auto params = QuantLib::ext::make_shared<Parameters>();
        params->fromFile(inputFile);
        CREApp cre(params, true);
        return cre.run() == 0 ? 0 : -1;
    } catch (const exception& e) {
        cout << endl << "an error occurred: " << e.what() << endl;
        return -1;
    }
}
