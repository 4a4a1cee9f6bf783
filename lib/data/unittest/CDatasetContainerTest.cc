/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CException.h>

#include <data/CDatasetContainer.h>

#include <test/CTestDatasets.h>

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(CDatasetContainerTest)

using namespace cval;

BOOST_AUTO_TEST_CASE(testSingle) {
    data::CDatasetContainer container{test::CTestDatasets::flat(2, 3, 2)};
    BOOST_REQUIRE_EQUAL(1, container.size());
    BOOST_REQUIRE_EQUAL("Dataset 0", container[0].name());
    BOOST_REQUIRE(container.find("Dataset 0") != nullptr);
    BOOST_REQUIRE(container.find("Dataset 1") == nullptr);
}

BOOST_AUTO_TEST_CASE(testNaming) {
    data::CDatasetContainer container{data::CDatasetContainer::TDatasetVec{
        test::CTestDatasets::flat(2, 3, 2), test::CTestDatasets::flat(2, 3, 2, 1, 1.0, "named"),
        test::CTestDatasets::flat(2, 3, 2)}};

    BOOST_REQUIRE_EQUAL(3, container.size());
    data::CDatasetContainer::TStrVec expected{"Dataset 0", "named", "Dataset 2"};
    BOOST_REQUIRE(expected == container.names());

    std::size_t n{0};
    for (const auto& dataset : container) {
        BOOST_REQUIRE_EQUAL(expected[n], dataset.name());
        ++n;
    }

    BOOST_REQUIRE_THROW(container[3], core::CIndexOutOfRange);
}

BOOST_AUTO_TEST_CASE(testDuplicates) {
    BOOST_REQUIRE_THROW(data::CDatasetContainer(data::CDatasetContainer::TDatasetVec{
                            test::CTestDatasets::flat(2, 3, 2, 1, 1.0, "a"),
                            test::CTestDatasets::flat(2, 3, 2, 1, 2.0, "a")}),
                        core::CInvalidConfiguration);

    // An explicit name can clash with a generated one.
    data::CDatasetContainer container;
    container.add(test::CTestDatasets::flat(2, 3, 2));
    BOOST_REQUIRE_THROW(container.add(test::CTestDatasets::flat(2, 3, 2, 1, 1.0, "Dataset 0")),
                        core::CInvalidConfiguration);
    BOOST_REQUIRE_EQUAL(1, container.size());
}

BOOST_AUTO_TEST_SUITE_END()
