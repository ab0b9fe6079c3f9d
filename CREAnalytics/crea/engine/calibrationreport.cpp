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

#include <crea/engine/calibrationreport.hpp>

#include <cred/utilities/log.hpp>
#include <cred/utilities/to_string.hpp>

#include <ql/errors.hpp>

using namespace CurveExt;
using QuantLib::Date;
using std::string;

namespace cre {
namespace analytics {

void CalibrationReportWriter::writeCurves(data::Report& report, const CalibratedCurveGroup& group) {
    LOG("Write curves of calibrated group " << group.name());

    report.addColumn("CurveId", string())
        .addColumn("Currency", string())
        .addColumn("ValueType", string())
        .addColumn("Node", string())
        .addColumn("Date", Date())
        .addColumn("Time", double(), 6)
        .addColumn("Parameter", double(), 12)
        .addColumn("DiscountFactor", double(), 12)
        .addColumn("ZeroRate", double(), 12);

    for (auto const& name : group.calibratedCurves()) {
        const InterpolatedParameterCurve& c = group.curve(name);
        string valueType = data::to_string(c.valueType());
        for (Size i = 0; i < c.parameterCount(); ++i) {
            const ParameterMetadata& m = c.parameterMetadata()[i];
            QuantLib::Time t = c.nodeTimes()[i];
            report.next()
                .add(name)
                .add(c.currency())
                .add(valueType)
                .add(m.label.empty() ? nullString_ : m.label)
                .add(c.nodeDates()[i])
                .add(t)
                .add(c.parameters()[i])
                .add(c.discountFactor(t))
                .add(c.zeroRate(t));
        }
    }
    report.end();
}

void CalibrationReportWriter::writeJacobian(data::Report& report, const CalibratedCurveGroup& group) {
    LOG("Write Jacobian of calibrated group " << group.name());

    report.addColumn("QuoteId", string())
        .addColumn("CurveId", string())
        .addColumn("Node", string())
        .addColumn("Jacobian", double(), 12)
        .addColumn("ParameterQuoteDerivative", double(), 12);

    const Matrix& jacobian = group.jacobian();
    const Matrix& dpdq = group.parameterQuoteDerivatives();
    const std::vector<string>& quoteIds = group.quoteIds();
    QL_REQUIRE(jacobian.rows() == quoteIds.size(), "writeJacobian: " << jacobian.rows() << " Jacobian rows for "
                                                                     << quoteIds.size() << " quotes");

    for (Size k = 0; k < quoteIds.size(); ++k) {
        for (auto const& name : group.calibratedCurves()) {
            const InterpolatedParameterCurve& c = group.curve(name);
            Size offset = group.parameterOffset(name);
            for (Size i = 0; i < c.parameterCount(); ++i) {
                const string& label = c.parameterMetadata()[i].label;
                report.next()
                    .add(quoteIds[k])
                    .add(name)
                    .add(label.empty() ? nullString_ : label)
                    .add(jacobian[k][offset + i])
                    .add(dpdq[offset + i][k]);
            }
        }
    }
    report.end();
}

void CalibrationReportWriter::writeParameterSensitivities(data::Report& report,
                                                          const CurrencyParameterSensitivities& sensitivities) {
    LOG("Write parameter sensitivities");

    report.addColumn("CurveId", string())
        .addColumn("Currency", string())
        .addColumn("Node", string())
        .addColumn("Date", Date())
        .addColumn("Sensitivity", double(), 6);

    for (auto const& s : sensitivities.sensitivities()) {
        for (Size i = 0; i < s.sensitivity.size(); ++i) {
            report.next()
                .add(s.curveName)
                .add(s.currency)
                .add(s.metadata[i].label.empty() ? nullString_ : s.metadata[i].label)
                .add(s.metadata[i].date)
                .add(s.sensitivity[i]);
        }
    }
    report.end();
}

void CalibrationReportWriter::writeMarketQuoteSensitivities(data::Report& report,
                                                            const MarketQuoteSensitivities& sensitivities) {
    LOG("Write market quote sensitivities");

    report.addColumn("QuoteId", string()).addColumn("Currency", string()).addColumn("Sensitivity", double(), 6);

    for (auto const& d : sensitivities.data())
        report.next().add(d.first.first).add(d.first.second).add(d.second);
    report.end();
}

void CalibrationReportWriter::writeScenarioOutcomes(data::Report& report,
                                                    const std::vector<CalibrationOutcome>& outcomes) {
    LOG("Write outcomes of " << outcomes.size() << " scenarios");

    report.addColumn("Scenario", Size())
        .addColumn("Status", string())
        .addColumn("Iterations", Size())
        .addColumn("ErrorType", string())
        .addColumn("QuoteId", string())
        .addColumn("Message", string());

    for (Size i = 0; i < outcomes.size(); ++i) {
        if (succeeded(outcomes[i])) {
            auto group = calibratedGroup(outcomes[i]);
            Size iterations = 0;
            for (auto n : group->iterations())
                iterations += n;
            report.next()
                .add(i)
                .add(string("Calibrated"))
                .add(iterations)
                .add(nullString_)
                .add(nullString_)
                .add(nullString_);
        } else {
            CalibrationFailure f = *failure(outcomes[i]);
            report.next()
                .add(i)
                .add(string("Failed"))
                .add(Size(0))
                .add(data::to_string(f.kind))
                .add(f.quoteId.empty() ? nullString_ : f.quoteId)
                .add(f.message);
        }
    }
    report.end();
}

} // namespace analytics
} // namespace cre
