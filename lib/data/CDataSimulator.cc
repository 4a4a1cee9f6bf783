/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <data/CDataSimulator.h>

#include <core/CException.h>
#include <core/CLogger.h>

#include <maths/CPRNG.h>

#include <boost/random/normal_distribution.hpp>

#include <cmath>

namespace cval {
namespace data {
namespace {
using TDenseMatrix = CDataset::TDenseMatrix;

void fill(boost::random::normal_distribution<>& normal,
          maths::CPRNG::CXorOShiro128Plus& rng,
          TDenseMatrix& pre,
          TDenseMatrix& post) {
    for (std::ptrdiff_t j = 0; j < pre.cols(); ++j) {
        for (std::ptrdiff_t i = 0; i < pre.rows(); ++i) {
            pre(i, j) = normal(rng);
        }
        for (std::ptrdiff_t i = 0; i < post.rows(); ++i) {
            post(i, j) = normal(rng);
        }
    }
}
}

void CDataSimulator::SSimulationConfig::validate() const {
    std::string error;
    if (s_PreTreatment == 0 || s_PostTreatment == 0) {
        error = "need at least one pre and one post treatment time point";
    } else if (s_Treated == 0) {
        error = "need at least one treated unit";
    } else if (std::isfinite(s_Mean) == false) {
        error = "mean must be finite";
    } else if (std::isfinite(s_Scale) == false || s_Scale < 0.0) {
        error = "scale must be finite and non-negative";
    }
    if (error.empty() == false) {
        LOG_ERROR(<< "Bad simulation configuration: " << error);
        throw core::CInvalidConfiguration{error};
    }
}

CDataset CDataSimulator::simulate(const SSimulationConfig& config, const std::string& name) {
    config.validate();

    LOG_DEBUG(<< "Simulating " << config.s_Controls << " control and "
              << config.s_Treated << " treated units over "
              << config.s_PreTreatment << " + " << config.s_PostTreatment
              << " time points with seed " << config.s_Seed);

    maths::CPRNG::CXorOShiro128Plus rng{config.s_Seed};
    boost::random::normal_distribution<> normal{config.s_Mean, config.s_Scale};

    auto pre = static_cast<std::ptrdiff_t>(config.s_PreTreatment);
    auto post = static_cast<std::ptrdiff_t>(config.s_PostTreatment);
    TDenseMatrix Xtr(pre, static_cast<std::ptrdiff_t>(config.s_Controls));
    TDenseMatrix Xte(post, static_cast<std::ptrdiff_t>(config.s_Controls));
    TDenseMatrix ytr(pre, static_cast<std::ptrdiff_t>(config.s_Treated));
    TDenseMatrix yte(post, static_cast<std::ptrdiff_t>(config.s_Treated));

    fill(normal, rng, Xtr, Xte);
    fill(normal, rng, ytr, yte);

    return CDataset{std::move(Xtr), std::move(Xte), std::move(ytr), std::move(yte), name};
}
}
}
