/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <test/CRandomNumbers.h>

#include <boost/random/normal_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>

#include <cmath>

namespace cval {
namespace test {

void CRandomNumbers::generateNormalSamples(double mean,
                                           double variance,
                                           std::size_t numberSamples,
                                           TDoubleVec& samples) {
    boost::random::normal_distribution<> normal(mean, std::sqrt(variance));
    generateSamples(m_Generator, normal, numberSamples, samples);
}

void CRandomNumbers::generateUniformSamples(double a,
                                            double b,
                                            std::size_t numberSamples,
                                            TDoubleVec& samples) {
    boost::random::uniform_real_distribution<> uniform(a, b);
    generateSamples(m_Generator, uniform, numberSamples, samples);
}

void CRandomNumbers::generateUniformSamples(std::size_t a,
                                            std::size_t b,
                                            std::size_t numberSamples,
                                            TSizeVec& samples) {
    boost::random::uniform_int_distribution<std::size_t> uniform(a, b - 1);
    generateSamples(m_Generator, uniform, numberSamples, samples);
}

void CRandomNumbers::generateSeeds(std::size_t numberSeeds, std::vector<std::uint64_t>& seeds) {
    seeds.clear();
    seeds.reserve(numberSeeds);
    for (std::size_t i = 0; i < numberSeeds; ++i) {
        seeds.push_back(m_Generator());
    }
}

void CRandomNumbers::discard(std::size_t n) {
    m_Generator.discard(n);
}
}
}
