/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CException.h>
#include <core/Concurrency.h>

#include <data/CDatasetContainer.h>

#include <validation/CDifferenceInDifferences.h>
#include <validation/CModel.h>
#include <validation/CPlaceboTest.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CTestDatasets.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

BOOST_AUTO_TEST_SUITE(CPlaceboTestTest)

using namespace cval;

namespace {
//! The difference between the mean treated and mean control values over
//! the post intervention period.
class CMeanDifference : public validation::CModel {
public:
    std::string name() const override { return "MeanDifference"; }

    validation::CResult operator()(const data::CDataset& dataset) const override {
        double treated{dataset.yte().mean()};
        double controls{dataset.Xte().mean()};
        return {this->name(), validation::CEffect{treated - controls, treated}};
    }
};

//! Records the treated value of every view it sees as the effect.
class CTreatedUnit : public validation::CModel {
public:
    explicit CTreatedUnit(std::string name = "TreatedUnit")
        : m_Name{std::move(name)} {}

    std::string name() const override { return m_Name; }

    validation::CResult operator()(const data::CDataset& dataset) const override {
        ++m_Calls;
        double value{dataset.ytr()(0, 0)};
        return {m_Name, validation::CEffect{value, value + 1.0}};
    }

    std::size_t calls() const { return m_Calls.load(); }

private:
    std::string m_Name;
    mutable std::atomic<std::size_t> m_Calls{0};
};

class CFailing : public validation::CModel {
public:
    std::string name() const override { return "Failing"; }

    validation::CResult operator()(const data::CDataset& dataset) const override {
        if (dataset.ytr()(0, 0) == test::CTestDatasets::controlValue(2, 0)) {
            throw std::runtime_error{"failed on control 2"};
        }
        return {this->name(), validation::CEffect{0.0, 1.0}};
    }
};
}

BOOST_AUTO_TEST_CASE(testLeaveOneOut) {
    auto model = std::make_shared<CTreatedUnit>();
    data::CDatasetContainer datasets;
    datasets.add(test::CTestDatasets::indexed(5, 8, 4, 1, "a"));
    datasets.add(test::CTestDatasets::indexed(3, 8, 4, 2, "b"));

    validation::CPlaceboTest placebo{model, datasets};
    auto result = placebo.execute();

    BOOST_REQUIRE_EQUAL(8, model->calls());
    BOOST_REQUIRE_EQUAL(2, result.size());

    // Each control unit takes its turn as the treated unit in order.
    const auto& a = result.results("TreatedUnit", "a");
    BOOST_REQUIRE_EQUAL(5, a.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        BOOST_REQUIRE_EQUAL("TreatedUnit", a[i].modelName());
        BOOST_REQUIRE_EQUAL(test::CTestDatasets::controlValue(i, 0), a[i].effect().value());
    }
    BOOST_REQUIRE_EQUAL(3, result.results("TreatedUnit", "b").size());
}

BOOST_AUTO_TEST_CASE(testNoEffect) {
    // Identical units mean every placebo view has exactly zero effect.
    auto model = std::make_shared<CMeanDifference>();
    validation::CPlaceboTest placebo{model, data::CDatasetContainer{test::CTestDatasets::flat(3, 10, 5, 1, 1.0, "flat")}};
    auto result = placebo.execute();

    auto effects = result.effects("MeanDifference", "flat");
    BOOST_REQUIRE_EQUAL(3, effects.size());
    for (auto effect : effects) {
        BOOST_REQUIRE_EQUAL(0.0, effect);
    }

    auto summary = result.summarise();
    BOOST_REQUIRE_EQUAL(1, summary.size());
    BOOST_REQUIRE_EQUAL(0.0, summary[0].s_Effect);
    BOOST_REQUIRE_EQUAL(0.0, summary[0].s_StandardDeviation);
    BOOST_REQUIRE_EQUAL(0.0, summary[0].s_StandardError);
    BOOST_REQUIRE_EQUAL(1.0, summary[0].s_PValue);
}

BOOST_AUTO_TEST_CASE(testManyModels) {
    validation::CPlaceboTest::TModelCPtrVec models{
        std::make_shared<validation::CDifferenceInDifferences>(),
        std::make_shared<CMeanDifference>(), std::make_shared<CTreatedUnit>()};
    data::CDatasetContainer datasets;
    datasets.add(test::CTestDatasets::flat(4, 6, 3, 1, 2.0, "x"));
    datasets.add(test::CTestDatasets::flat(3, 6, 3, 1, 2.0, "y"));

    validation::CPlaceboTest placebo{models, datasets};
    BOOST_REQUIRE_EQUAL(3, placebo.models().size());
    BOOST_REQUIRE_EQUAL(2, placebo.datasets().size());

    auto summary = placebo.execute().summarise();
    BOOST_REQUIRE_EQUAL(6, summary.size());
    BOOST_REQUIRE_EQUAL("x", summary[0].s_Dataset);
    BOOST_REQUIRE_EQUAL("DiD", summary[0].s_Model);
    BOOST_REQUIRE_EQUAL("MeanDifference", summary[1].s_Model);
    BOOST_REQUIRE_EQUAL("TreatedUnit", summary[2].s_Model);
    BOOST_REQUIRE_EQUAL("y", summary[3].s_Dataset);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, summary[3].s_Effect, 1e-12);
}

BOOST_AUTO_TEST_CASE(testInvalid) {
    auto model = std::make_shared<CMeanDifference>();
    data::CDatasetContainer datasets{test::CTestDatasets::flat(3, 4, 2)};

    BOOST_REQUIRE_THROW(validation::CPlaceboTest(validation::CPlaceboTest::TModelCPtrVec{}, datasets),
                        core::CInvalidConfiguration);
    BOOST_REQUIRE_THROW(validation::CPlaceboTest(model, data::CDatasetContainer{}),
                        core::CInvalidConfiguration);
    BOOST_REQUIRE_THROW(validation::CPlaceboTest(validation::TModelCPtr{}, datasets),
                        core::CInvalidConfiguration);
    BOOST_REQUIRE_THROW(validation::CPlaceboTest(validation::CPlaceboTest::TModelCPtrVec{model, model}, datasets),
                        core::CInvalidConfiguration);

    data::CDatasetContainer noControls{test::CTestDatasets::flat(1, 4, 2).toPlaceboView(0)};
    BOOST_REQUIRE_THROW(validation::CPlaceboTest(model, noControls),
                        core::CInvalidConfiguration);
}

BOOST_AUTO_TEST_CASE(testModelFailure) {
    validation::CPlaceboTest placebo{std::make_shared<CFailing>(),
                                     data::CDatasetContainer{test::CTestDatasets::indexed(4, 5, 2)}};
    BOOST_REQUIRE_THROW(placebo.execute(), std::runtime_error);

    core::startDefaultAsyncExecutor(3);
    BOOST_REQUIRE_THROW(placebo.execute(), std::runtime_error);
    core::stopDefaultAsyncExecutor();
}

BOOST_AUTO_TEST_CASE(testParallel) {
    validation::CPlaceboTest::TModelCPtrVec models{
        std::make_shared<validation::CDifferenceInDifferences>(),
        std::make_shared<CTreatedUnit>()};
    data::CDatasetContainer datasets;
    datasets.add(test::CTestDatasets::indexed(7, 12, 6, 1, "a"));
    datasets.add(test::CTestDatasets::indexed(5, 12, 6, 2, "b"));

    validation::CPlaceboTest placebo{models, datasets};
    auto serial = placebo.execute().summarise();

    core::startDefaultAsyncExecutor(4);
    auto parallel = placebo.execute();
    core::stopDefaultAsyncExecutor();

    const auto& results = parallel.results("TreatedUnit", "a");
    for (std::size_t i = 0; i < results.size(); ++i) {
        BOOST_REQUIRE_EQUAL(test::CTestDatasets::controlValue(i, 0),
                            results[i].effect().value());
    }

    auto summary = parallel.summarise();
    BOOST_REQUIRE_EQUAL(serial.size(), summary.size());
    for (std::size_t i = 0; i < serial.size(); ++i) {
        BOOST_REQUIRE_EQUAL(serial[i].s_Model, summary[i].s_Model);
        BOOST_REQUIRE_EQUAL(serial[i].s_Dataset, summary[i].s_Dataset);
        BOOST_REQUIRE_EQUAL(serial[i].s_Effect, summary[i].s_Effect);
        BOOST_REQUIRE_EQUAL(serial[i].s_StandardDeviation, summary[i].s_StandardDeviation);
    }
}

BOOST_AUTO_TEST_CASE(testProgress) {
    data::CDatasetContainer datasets;
    datasets.add(test::CTestDatasets::flat(6, 4, 2, 1, 1.0, "a"));
    datasets.add(test::CTestDatasets::flat(2, 4, 2, 1, 1.0, "b"));

    validation::CPlaceboTest placebo{
        validation::CPlaceboTest::TModelCPtrVec{std::make_shared<CMeanDifference>(),
                                                std::make_shared<CTreatedUnit>()},
        datasets};

    for (std::size_t threads : {std::size_t{0}, std::size_t{3}}) {
        if (threads > 0) {
            core::startDefaultAsyncExecutor(threads);
        }
        double progress{0.0};
        double smallest{1.0};
        placebo.progressCallback([&](double fraction) {
            progress += fraction;
            smallest = std::min(smallest, fraction);
        });
        placebo.execute();
        BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, progress, 1e-9);
        BOOST_REQUIRE(smallest >= 0.0);
        if (threads > 0) {
            core::stopDefaultAsyncExecutor();
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()
