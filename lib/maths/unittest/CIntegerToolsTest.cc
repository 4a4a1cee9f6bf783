/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/CIntegerTools.h>

#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <vector>

BOOST_AUTO_TEST_SUITE(CIntegerToolsTest)

using namespace cval;

BOOST_AUTO_TEST_CASE(testNextPow2) {
    BOOST_REQUIRE_EQUAL(0, maths::CIntegerTools::nextPow2(0));
    for (std::size_t i = 0; i < 63; ++i) {
        std::uint64_t x{std::uint64_t{1} << i};
        BOOST_REQUIRE_EQUAL(i + 1, maths::CIntegerTools::nextPow2(x));
        BOOST_REQUIRE_EQUAL(i + 1, maths::CIntegerTools::nextPow2(x | (x >> 1)));
        if (i > 0) {
            BOOST_REQUIRE_EQUAL(i, maths::CIntegerTools::nextPow2(x - 1));
        }
    }
    BOOST_REQUIRE_EQUAL(64, maths::CIntegerTools::nextPow2(~std::uint64_t{0}));
}

BOOST_AUTO_TEST_CASE(testReverseBits) {
    BOOST_REQUIRE_EQUAL(0, maths::CIntegerTools::reverseBits(0));
    BOOST_REQUIRE_EQUAL(std::uint64_t{1} << 63, maths::CIntegerTools::reverseBits(1));
    BOOST_REQUIRE_EQUAL(0xf000000000000000, maths::CIntegerTools::reverseBits(0xf));

    test::CRandomNumbers rng;
    std::vector<std::uint64_t> values;
    rng.generateSeeds(100, values);
    for (auto value : values) {
        BOOST_REQUIRE_EQUAL(value, maths::CIntegerTools::reverseBits(
                                       maths::CIntegerTools::reverseBits(value)));
    }
}

BOOST_AUTO_TEST_SUITE_END()
