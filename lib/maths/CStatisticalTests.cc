/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CStatisticalTests.h>

#include <core/CLogger.h>

#include <maths/CBasicStatistics.h>

#include <boost/math/distributions/students_t.hpp>

#include <cmath>
#include <limits>

namespace cval {
namespace maths {
namespace {
const double NaN{std::numeric_limits<double>::quiet_NaN()};
const double INF{std::numeric_limits<double>::infinity()};
const double ZERO_VARIANCE_TOLERANCE{1e-12};
}

double CStatisticalTests::twoSidedTTest(double t, double df) {
    if (std::isnan(t)) {
        return NaN;
    }
    if (std::isinf(t)) {
        return 0.0;
    }
    try {
        boost::math::students_t_distribution<> students(df);
        return 2.0 * boost::math::cdf(boost::math::complement(students, std::fabs(t)));
    } catch (const std::exception& e) {
        LOG_ERROR(<< "Failed to compute significance " << e.what()
                  << " df = " << df << ", t = " << t);
    }
    return NaN;
}

CStatisticalTests::STTestResult
CStatisticalTests::oneSampleTTest(const TDoubleVec& samples, double mean) {
    std::size_t n{samples.size()};
    if (n < 2) {
        LOG_DEBUG(<< "Too few samples, " << n << ", for a t-test");
        return {NaN, static_cast<double>(n) - 1.0, NaN};
    }

    CBasicStatistics::SSampleMeanVar<double>::TAccumulator moments;
    moments.add(samples);

    double df{static_cast<double>(n) - 1.0};
    double difference{CBasicStatistics::mean(moments) - mean};
    double sd{std::sqrt(CBasicStatistics::variance(moments))};

    // Rounding in the moment recurrences can leave a tiny residual variance
    // for identical samples.
    if (sd <= ZERO_VARIANCE_TOLERANCE * std::fabs(CBasicStatistics::mean(moments))) {
        return difference == 0.0 ? STTestResult{0.0, df, 1.0}
                                 : STTestResult{std::copysign(INF, difference), df, 0.0};
    }

    double t{difference / (sd / std::sqrt(static_cast<double>(n)))};
    double p{twoSidedTTest(t, df)};
    LOG_TRACE(<< "n = " << n << ", t = " << t << ", significance = " << p);

    return {t, df, p};
}
}
}
