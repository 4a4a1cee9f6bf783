/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <maths/CBasicStatistics.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <vector>

BOOST_AUTO_TEST_SUITE(CBasicStatisticsTest)

using namespace cval;

namespace {
using TDoubleVec = std::vector<double>;
using TMeanAccumulator = maths::CBasicStatistics::SSampleMean<double>::TAccumulator;
using TMeanVarAccumulator = maths::CBasicStatistics::SSampleMeanVar<double>::TAccumulator;

double twoPassVariance(const TDoubleVec& samples, bool unbiased) {
    double mean{0.0};
    for (auto x : samples) {
        mean += x;
    }
    mean /= static_cast<double>(samples.size());
    double result{0.0};
    for (auto x : samples) {
        result += (x - mean) * (x - mean);
    }
    return result / static_cast<double>(samples.size() - (unbiased ? 1 : 0));
}
}

BOOST_AUTO_TEST_CASE(testMeanVar) {
    test::CRandomNumbers rng;

    for (std::size_t t = 0; t < 20; ++t) {
        TDoubleVec samples;
        rng.generateNormalSamples(5.0, 4.0, 10 + 10 * t, samples);

        TMeanVarAccumulator moments;
        moments.add(samples);

        double mean{0.0};
        for (auto x : samples) {
            mean += x;
        }
        mean /= static_cast<double>(samples.size());

        BOOST_REQUIRE_EQUAL(static_cast<double>(samples.size()),
                            maths::CBasicStatistics::count(moments));
        BOOST_REQUIRE_CLOSE_ABSOLUTE(mean, maths::CBasicStatistics::mean(moments), 1e-10);
        BOOST_REQUIRE_CLOSE_ABSOLUTE(twoPassVariance(samples, true),
                                     maths::CBasicStatistics::variance(moments), 1e-10);
        BOOST_REQUIRE_CLOSE_ABSOLUTE(twoPassVariance(samples, false),
                                     maths::CBasicStatistics::maximumLikelihoodVariance(moments),
                                     1e-10);
    }
}

BOOST_AUTO_TEST_CASE(testSmallSamples) {
    TMeanVarAccumulator moments;
    BOOST_REQUIRE_EQUAL(0.0, maths::CBasicStatistics::count(moments));
    BOOST_REQUIRE_EQUAL(0.0, maths::CBasicStatistics::variance(moments));

    moments.add(3.0);
    BOOST_REQUIRE_EQUAL(3.0, maths::CBasicStatistics::mean(moments));
    BOOST_REQUIRE_EQUAL(0.0, maths::CBasicStatistics::variance(moments));
    BOOST_REQUIRE_EQUAL(0.0, maths::CBasicStatistics::maximumLikelihoodVariance(moments));

    // Weighted updates are equivalent to repeated ones.
    TMeanVarAccumulator weighted;
    weighted.add(1.0, 2.0);
    weighted.add(4.0);
    TMeanVarAccumulator repeated;
    repeated.add(TDoubleVec{1.0, 1.0, 4.0});
    BOOST_REQUIRE_CLOSE_ABSOLUTE(maths::CBasicStatistics::mean(repeated),
                                 maths::CBasicStatistics::mean(weighted), 1e-15);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(maths::CBasicStatistics::variance(repeated),
                                 maths::CBasicStatistics::variance(weighted), 1e-15);
}

BOOST_AUTO_TEST_CASE(testCombine) {
    test::CRandomNumbers rng;

    TDoubleVec samples;
    rng.generateUniformSamples(-10.0, 10.0, 100, samples);

    TMeanVarAccumulator all;
    all.add(samples);

    TMeanVarAccumulator lhs;
    TMeanVarAccumulator rhs;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        (i % 3 == 0 ? lhs : rhs).add(samples[i]);
    }

    TMeanVarAccumulator combined{lhs + rhs};
    BOOST_REQUIRE_EQUAL(maths::CBasicStatistics::count(all),
                        maths::CBasicStatistics::count(combined));
    BOOST_REQUIRE_CLOSE_ABSOLUTE(maths::CBasicStatistics::mean(all),
                                 maths::CBasicStatistics::mean(combined), 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(maths::CBasicStatistics::variance(all),
                                 maths::CBasicStatistics::variance(combined), 1e-10);

    combined += TMeanVarAccumulator{};
    BOOST_REQUIRE_EQUAL(maths::CBasicStatistics::count(all),
                        maths::CBasicStatistics::count(combined));
}

BOOST_AUTO_TEST_CASE(testPrint) {
    TMeanAccumulator mean;
    mean.add(TDoubleVec{1.0, 2.0, 3.0});
    BOOST_REQUIRE_EQUAL("(3, 2)", maths::CBasicStatistics::print(mean));

    TMeanVarAccumulator meanVar;
    meanVar.add(TDoubleVec{1.0, 3.0});
    BOOST_REQUIRE_EQUAL("(2, 2, 1)", maths::CBasicStatistics::print(meanVar));
}

BOOST_AUTO_TEST_SUITE_END()
