/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CException.h>
#include <core/CLogger.h>

#include <maths/CBasicStatistics.h>

#include <data/CDataSimulator.h>

#include <test/BoostTestCloseAbsolute.h>

#include <boost/test/unit_test.hpp>

#include <cmath>

BOOST_AUTO_TEST_SUITE(CDataSimulatorTest)

using namespace cval;

using TMeanVarAccumulator = maths::CBasicStatistics::SSampleMeanVar<double>::TAccumulator;

BOOST_AUTO_TEST_CASE(testShape) {
    data::CDataSimulator::SSimulationConfig config;
    config.s_Controls = 7;
    config.s_PreTreatment = 20;
    config.s_PostTreatment = 5;
    config.s_Treated = 2;

    auto dataset = data::CDataSimulator::simulate(config, "simulated");

    BOOST_REQUIRE_EQUAL("simulated", dataset.name());
    BOOST_REQUIRE_EQUAL(7, dataset.nUnits());
    BOOST_REQUIRE_EQUAL(2, dataset.nTreatedUnits());
    BOOST_REQUIRE_EQUAL(20, dataset.nPreInterventionTimePoints());
    BOOST_REQUIRE_EQUAL(5, dataset.nPostInterventionTimePoints());
    BOOST_REQUIRE(dataset.controlUnits().isFinite());
    BOOST_REQUIRE(dataset.treatedUnits().isFinite());
}

BOOST_AUTO_TEST_CASE(testMoments) {
    data::CDataSimulator::SSimulationConfig config;
    config.s_Controls = 50;
    config.s_PreTreatment = 100;
    config.s_PostTreatment = 100;
    config.s_Mean = 20.0;
    config.s_Scale = 2.0;

    auto dataset = data::CDataSimulator::simulate(config);

    TMeanVarAccumulator moments;
    auto controls = dataset.controlUnits();
    for (std::ptrdiff_t i = 0; i < controls.rows(); ++i) {
        for (std::ptrdiff_t j = 0; j < controls.cols(); ++j) {
            moments.add(controls(i, j));
        }
    }
    LOG_DEBUG(<< "moments = " << maths::CBasicStatistics::print(moments));

    // There are 10000 samples so the mean standard error is 0.02.
    BOOST_REQUIRE_CLOSE_ABSOLUTE(20.0, maths::CBasicStatistics::mean(moments), 0.1);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(
        2.0, std::sqrt(maths::CBasicStatistics::variance(moments)), 0.1);
}

BOOST_AUTO_TEST_CASE(testReproducible) {
    data::CDataSimulator::SSimulationConfig config;
    config.s_Seed = 42;

    auto first = data::CDataSimulator::simulate(config);
    auto second = data::CDataSimulator::simulate(config);
    BOOST_REQUIRE(first.controlUnits() == second.controlUnits());
    BOOST_REQUIRE(first.treatedUnits() == second.treatedUnits());

    config.s_Seed = 43;
    auto third = data::CDataSimulator::simulate(config);
    BOOST_REQUIRE(first.controlUnits() != third.controlUnits());
}

BOOST_AUTO_TEST_CASE(testInvalid) {
    data::CDataSimulator::SSimulationConfig config;
    config.s_PostTreatment = 0;
    BOOST_REQUIRE_THROW(data::CDataSimulator::simulate(config), core::CInvalidConfiguration);

    config = data::CDataSimulator::SSimulationConfig{};
    config.s_Treated = 0;
    BOOST_REQUIRE_THROW(data::CDataSimulator::simulate(config), core::CInvalidConfiguration);

    config = data::CDataSimulator::SSimulationConfig{};
    config.s_Scale = -1.0;
    BOOST_REQUIRE_THROW(data::CDataSimulator::simulate(config), core::CInvalidConfiguration);
}

BOOST_AUTO_TEST_SUITE_END()
