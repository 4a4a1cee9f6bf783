/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <maths/CStatisticalTests.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <vector>

BOOST_AUTO_TEST_SUITE(CStatisticalTestsTest)

using namespace cval;

using TDoubleVec = std::vector<double>;

BOOST_AUTO_TEST_CASE(testTwoSidedTTest) {
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, maths::CStatisticalTests::twoSidedTTest(0.0, 5.0), 1e-15);
    // The 97.5% quantile of Student's t with 10 degrees of freedom.
    BOOST_REQUIRE_CLOSE_ABSOLUTE(
        0.05, maths::CStatisticalTests::twoSidedTTest(2.2281388519649385, 10.0), 1e-9);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(
        0.05, maths::CStatisticalTests::twoSidedTTest(-2.2281388519649385, 10.0), 1e-9);
    BOOST_REQUIRE_EQUAL(0.0, maths::CStatisticalTests::twoSidedTTest(INFINITY, 3.0));
    BOOST_REQUIRE(std::isnan(maths::CStatisticalTests::twoSidedTTest(NAN, 3.0)));
    BOOST_REQUIRE(std::isnan(maths::CStatisticalTests::twoSidedTTest(1.0, -1.0)));
}

BOOST_AUTO_TEST_CASE(testOneSampleTTest) {
    auto result = maths::CStatisticalTests::oneSampleTTest({1.0, 2.0, 3.0, 4.0, 5.0});
    BOOST_REQUIRE_CLOSE_ABSOLUTE(4.242640687119285, result.s_Statistic, 1e-12);
    BOOST_REQUIRE_EQUAL(4.0, result.s_DegreesFreedom);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0132355995637, result.s_PValue, 1e-8);

    result = maths::CStatisticalTests::oneSampleTTest({1.0, 2.0, 3.0, 4.0, 5.0}, 3.0);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, result.s_Statistic, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, result.s_PValue, 1e-12);

    result = maths::CStatisticalTests::oneSampleTTest({-0.5, 0.3, 0.1, -0.2});
    BOOST_REQUIRE_CLOSE_ABSOLUTE(-0.42857142857142866, result.s_Statistic, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.697144339075, result.s_PValue, 1e-8);

    result = maths::CStatisticalTests::oneSampleTTest({2.0, 2.1, 1.9, 2.05});
    BOOST_REQUIRE_CLOSE_ABSOLUTE(47.13597352341413, result.s_Statistic, 1e-9);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(2.1023743976722464e-05, result.s_PValue, 1e-10);
}

BOOST_AUTO_TEST_CASE(testDegenerate) {
    auto result = maths::CStatisticalTests::oneSampleTTest({});
    BOOST_REQUIRE(std::isnan(result.s_PValue));
    result = maths::CStatisticalTests::oneSampleTTest({1.5});
    BOOST_REQUIRE(std::isnan(result.s_Statistic));
    BOOST_REQUIRE(std::isnan(result.s_PValue));

    result = maths::CStatisticalTests::oneSampleTTest({0.0, 0.0, 0.0, 0.0});
    BOOST_REQUIRE_EQUAL(0.0, result.s_Statistic);
    BOOST_REQUIRE_EQUAL(1.0, result.s_PValue);

    result = maths::CStatisticalTests::oneSampleTTest(TDoubleVec(10, 0.3));
    BOOST_REQUIRE(std::isinf(result.s_Statistic));
    BOOST_REQUIRE_EQUAL(0.0, result.s_PValue);

    result = maths::CStatisticalTests::oneSampleTTest(TDoubleVec(10, 0.3), 0.3);
    BOOST_REQUIRE_EQUAL(1.0, result.s_PValue);
}

BOOST_AUTO_TEST_CASE(testCalibration) {

    // Under the null hypothesis the significance should be uniform.

    test::CRandomNumbers rng;

    std::size_t rejected{0};
    std::size_t trials{2000};
    for (std::size_t t = 0; t < trials; ++t) {
        TDoubleVec samples;
        rng.generateNormalSamples(1.0, 2.0, 12, samples);
        auto result = maths::CStatisticalTests::oneSampleTTest(samples, 1.0);
        BOOST_REQUIRE(result.s_PValue >= 0.0 && result.s_PValue <= 1.0);
        if (result.s_PValue < 0.05) {
            ++rejected;
        }
    }

    double rate{static_cast<double>(rejected) / static_cast<double>(trials)};
    LOG_DEBUG(<< "rejection rate = " << rate);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.05, rate, 0.015);

    // A shifted mean is detected.
    TDoubleVec samples;
    rng.generateNormalSamples(3.0, 1.0, 30, samples);
    BOOST_REQUIRE(maths::CStatisticalTests::oneSampleTTest(samples, 0.0).s_PValue < 1e-6);
}

BOOST_AUTO_TEST_SUITE_END()
