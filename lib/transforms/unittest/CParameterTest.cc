/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CException.h>
#include <core/CLogger.h>

#include <maths/CBasicStatistics.h>
#include <maths/CSamplingDistribution.h>

#include <transforms/CParameter.h>

#include <test/BoostTestCloseAbsolute.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <thread>
#include <vector>

BOOST_AUTO_TEST_SUITE(CParameterTest)

using namespace cval;

using TDoubleVec = std::vector<double>;
using TMeanVarAccumulator = maths::CBasicStatistics::SSampleMeanVar<double>::TAccumulator;

BOOST_AUTO_TEST_CASE(testFixed) {
    auto parameter = transforms::CParameter::fixed(2.5);
    BOOST_REQUIRE(parameter.isFixed());
    BOOST_REQUIRE_EQUAL("2.5", parameter.print());

    for (std::size_t n : {1, 2, 10}) {
        TDoubleVec values{parameter.resolve(n)};
        BOOST_REQUIRE_EQUAL(n, values.size());
        for (auto value : values) {
            BOOST_REQUIRE_EQUAL(2.5, value);
        }
    }

    BOOST_REQUIRE_THROW(transforms::CParameter::fixed(std::nan("")),
                        core::CInvalidConfiguration);
}

BOOST_AUTO_TEST_CASE(testZeroUnits) {
    BOOST_REQUIRE_THROW(transforms::CParameter::fixed(1.0).resolve(0),
                        core::CInvalidConfiguration);
    BOOST_REQUIRE_THROW(transforms::CParameter::varying(
                            maths::CSamplingDistribution::normal(0.0, 1.0), 1)
                            .resolve(0),
                        core::CInvalidConfiguration);
}

BOOST_AUTO_TEST_CASE(testSeededIsReproducible) {
    auto normal = maths::CSamplingDistribution::normal(0.0, 1.0);
    auto parameter = transforms::CParameter::varying(normal, 42);
    BOOST_REQUIRE(parameter.isFixed() == false);

    TDoubleVec first{parameter.resolve(10)};
    BOOST_REQUIRE_EQUAL(10, first.size());
    for (std::size_t i = 0; i < 5; ++i) {
        BOOST_REQUIRE(first == parameter.resolve(10));
    }

    // An independently constructed parameter with the same seed agrees.
    BOOST_REQUIRE(first == transforms::CParameter::varying(normal, 42).resolve(10));

    // Resolving on other threads gives the same values.
    TDoubleVec fromThread;
    std::thread thread{[&] { fromThread = parameter.resolve(10); }};
    thread.join();
    BOOST_REQUIRE(first == fromThread);

    // Different seeds give different values.
    TDoubleVec other{transforms::CParameter::varying(normal, 123).resolve(10)};
    BOOST_REQUIRE(first != other);

    // The values differ by unit.
    BOOST_REQUIRE(first[0] != first[1]);
}

BOOST_AUTO_TEST_CASE(testUnseeded) {
    auto parameter = transforms::CParameter::varying(
        maths::CSamplingDistribution::uniform(0.0, 1.0));
    TDoubleVec first{parameter.resolve(10)};
    TDoubleVec second{parameter.resolve(10)};
    BOOST_REQUIRE(first != second);
}

BOOST_AUTO_TEST_CASE(testUnseededCopiesAreIndependent) {
    auto parameter = transforms::CParameter::varying(
        maths::CSamplingDistribution::normal(0.0, 1.0));

    // Copies must not replay the source's random stream.
    transforms::CParameter copy{parameter};
    BOOST_REQUIRE(copy.resolve(10) != parameter.resolve(10));

    transforms::CParameter assigned{transforms::CParameter::fixed(1.0)};
    assigned = parameter;
    BOOST_REQUIRE(assigned.isFixed() == false);
    BOOST_REQUIRE(assigned.resolve(10) != parameter.resolve(10));

    // Copies of a seeded parameter still agree.
    auto seeded = transforms::CParameter::varying(
        maths::CSamplingDistribution::normal(0.0, 1.0), 5);
    transforms::CParameter seededCopy{seeded};
    BOOST_REQUIRE(seededCopy.resolve(10) == seeded.resolve(10));
}

BOOST_AUTO_TEST_CASE(testDistribution) {
    auto parameter = transforms::CParameter::varying(
        maths::CSamplingDistribution::normal(5.0, 2.0), 7);

    TMeanVarAccumulator moments;
    moments.add(parameter.resolve(5000));
    LOG_DEBUG(<< "moments = " << maths::CBasicStatistics::print(moments));

    BOOST_REQUIRE_CLOSE_ABSOLUTE(5.0, maths::CBasicStatistics::mean(moments), 0.15);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(
        2.0, std::sqrt(maths::CBasicStatistics::variance(moments)), 0.15);
}

BOOST_AUTO_TEST_CASE(testFromString) {
    auto fixed = transforms::CParameter::fromString(" -0.25 ");
    BOOST_REQUIRE(fixed.isFixed());
    BOOST_REQUIRE_EQUAL(-0.25, fixed.resolve(1)[0]);

    auto seeded = transforms::CParameter::fromString("normal(0, 1) @ 42");
    BOOST_REQUIRE(seeded.isFixed() == false);
    BOOST_REQUIRE_EQUAL("normal(0, 1) @ 42", seeded.print());
    BOOST_REQUIRE(seeded.resolve(4) ==
                  transforms::CParameter::varying(
                      maths::CSamplingDistribution::normal(0.0, 1.0), 42)
                      .resolve(4));

    auto unseeded = transforms::CParameter::fromString("uniform(-1,1)");
    BOOST_REQUIRE_EQUAL("uniform(-1, 1)", unseeded.print());
    for (auto value : unseeded.resolve(20)) {
        BOOST_REQUIRE(value >= -1.0 && value < 1.0);
    }

    for (const char* bad : {"", "abc", "normal(0, 1) @ x",
                            "normal(0, 1) @ -1", "normal(0)",
                            "normal(0, -1)", "cauchy(0, 1)", "1.0 @ 3"}) {
        LOG_DEBUG(<< "Testing '" << bad << "'");
        BOOST_REQUIRE_THROW(transforms::CParameter::fromString(bad),
                            core::CInvalidConfiguration);
    }
}

BOOST_AUTO_TEST_SUITE_END()
