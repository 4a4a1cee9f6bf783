/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <validation/CPlaceboTestResult.h>

#include <core/CCsvOutputWriter.h>
#include <core/CException.h>
#include <core/CLogger.h>

#include <maths/CBasicStatistics.h>
#include <maths/CStatisticalTests.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace cval {
namespace validation {
namespace {
using TMeanVarAccumulator = maths::CBasicStatistics::SSampleMeanVar<double>::TAccumulator;

std::string toString(double value) {
    std::ostringstream result;
    result << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return result.str();
}

bool checkStatistic(const CPlaceboTestResult::SSummary& row,
                    const std::string& name,
                    double value,
                    bool strict) {
    if (std::isfinite(value) && (strict ? value > 0.0 : value >= 0.0)) {
        return true;
    }
    LOG_ERROR(<< name << " " << value << " for model '" << row.s_Model
              << "' on dataset '" << row.s_Dataset << "' must be "
              << (strict ? "positive" : "non-negative"));
    return false;
}
}

const CPlaceboTestResult::TStrVec CPlaceboTestResult::COLUMNS{
    "Model", "Dataset", "Effect", "Standard Deviation", "Standard Error", "p-value"};

void CPlaceboTestResult::add(const std::string& model, const std::string& dataset, TResultVec results) {
    TStrStrPr key{model, dataset};
    auto existing = std::find_if(m_Results.begin(), m_Results.end(),
                                 [&key](const TStrStrPrResultVecPr& entry) {
                                     return entry.first == key;
                                 });
    if (existing != m_Results.end()) {
        LOG_ERROR(<< "Duplicate results for model '" << model << "' on dataset '"
                  << dataset << "'");
        throw core::CInvalidConfiguration{"duplicate results for model '" + model +
                                          "' on dataset '" + dataset + "'"};
    }
    m_Results.emplace_back(std::move(key), std::move(results));
}

const CPlaceboTestResult::TResultVec&
CPlaceboTestResult::results(const std::string& model, const std::string& dataset) const {
    for (const auto& entry : m_Results) {
        if (entry.first.first == model && entry.first.second == dataset) {
            return entry.second;
        }
    }
    LOG_ERROR(<< "No results for model '" << model << "' on dataset '" << dataset << "'");
    throw core::CIndexOutOfRange{"no results for model '" + model + "' on dataset '" +
                                 dataset + "'"};
}

CPlaceboTestResult::TDoubleVec
CPlaceboTestResult::effects(const std::string& model, const std::string& dataset) const {
    const auto& results = this->results(model, dataset);
    TDoubleVec result;
    result.reserve(results.size());
    for (const auto& result_ : results) {
        result.push_back(result_.effect().percentage().value());
    }
    return result;
}

CPlaceboTestResult::SSummary CPlaceboTestResult::summarise(const std::string& model,
                                                           const std::string& dataset,
                                                           const TDoubleVec& effects) {
    if (effects.empty()) {
        double nan{std::numeric_limits<double>::quiet_NaN()};
        return {model, dataset, nan, nan, nan, nan};
    }

    TMeanVarAccumulator moments;
    moments.add(effects);

    double n{maths::CBasicStatistics::count(moments)};
    double sd{std::sqrt(maths::CBasicStatistics::maximumLikelihoodVariance(moments))};

    // The recurrences can leave rounding error in the variance of identical
    // values which must have exactly zero spread.
    auto range = std::minmax_element(effects.begin(), effects.end());
    if (*range.first == *range.second) {
        sd = 0.0;
    }
    auto test = maths::CStatisticalTests::oneSampleTTest(effects, 0.0);

    return {model,
            dataset,
            maths::CBasicStatistics::mean(moments),
            sd,
            sd / std::sqrt(n),
            test.s_PValue};
}

CPlaceboTestResult::TSummaryVec CPlaceboTestResult::summarise() const {
    TSummaryVec result;
    result.reserve(m_Results.size());
    for (const auto& entry : m_Results) {
        result.push_back(summarise(entry.first.first, entry.first.second,
                                   this->effects(entry.first.first, entry.first.second)));
        const auto& row = result.back();
        LOG_DEBUG(<< row.s_Model << " on " << row.s_Dataset << ": effect = " << row.s_Effect
                  << ", sd = " << row.s_StandardDeviation
                  << ", se = " << row.s_StandardError << ", p-value = " << row.s_PValue);
    }
    return result;
}

bool CPlaceboTestResult::validate(const TSummaryVec& summary, bool strict) {
    bool valid{true};
    for (const auto& row : summary) {
        if (std::isfinite(row.s_Effect) == false) {
            LOG_ERROR(<< "Effect " << row.s_Effect << " for model '" << row.s_Model
                      << "' on dataset '" << row.s_Dataset << "' is not finite");
            valid = false;
        }
        valid = checkStatistic(row, COLUMNS[3], row.s_StandardDeviation, strict) && valid;
        valid = checkStatistic(row, COLUMNS[4], row.s_StandardError, strict) && valid;
    }
    return valid;
}

bool CPlaceboTestResult::writeCsv(const TSummaryVec& summary, std::ostream& output) {
    core::CCsvOutputWriter writer{output};
    if (writer.fieldNames(COLUMNS) == false) {
        return false;
    }
    for (const auto& row : summary) {
        if (writer.writeRow({row.s_Model, row.s_Dataset, toString(row.s_Effect),
                             toString(row.s_StandardDeviation),
                             toString(row.s_StandardError), toString(row.s_PValue)}) == false) {
            return false;
        }
    }
    return true;
}

bool CPlaceboTestResult::writeCsv(std::ostream& output) const {
    return writeCsv(this->summarise(), output);
}
}
}
