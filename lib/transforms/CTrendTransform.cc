/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <transforms/CTrendTransform.h>

#include <core/CException.h>
#include <core/CLogger.h>

#include <cmath>
#include <memory>
#include <sstream>

namespace cval {
namespace transforms {

const std::string CTrendTransform::NAME{"Trend"};

CTrendTransform::CTrendTransform()
    : CTrendTransform{1, CParameter::fixed(1.0), CParameter::fixed(0.0)} {
}

CTrendTransform::CTrendTransform(int degree, CParameter coefficient, CParameter intercept)
    : m_Degree{degree}, m_Coefficient{std::move(coefficient)},
      m_Intercept{std::move(intercept)} {
    if (m_Degree < 1) {
        LOG_ERROR(<< "Trend degree must be at least one, got " << m_Degree);
        throw core::CInvalidConfiguration{"trend degree " + std::to_string(m_Degree) +
                                          " is not positive"};
    }
}

std::string CTrendTransform::name() const {
    return NAME;
}

std::string CTrendTransform::print() const {
    std::ostringstream result;
    result << NAME << "(degree = " << m_Degree
           << ", coefficient = " << m_Coefficient.print()
           << ", intercept = " << m_Intercept.print() << ')';
    return result.str();
}

CTransform::TTransformUPtr CTrendTransform::clone() const {
    return std::make_unique<CTrendTransform>(*this);
}

void CTrendTransform::deform(TDenseMatrix& series) const {
    auto n = static_cast<std::size_t>(series.cols());
    TDoubleVec coefficient{m_Coefficient.resolve(n)};
    TDoubleVec intercept{m_Intercept.resolve(n)};

    TDoubleVec trend(static_cast<std::size_t>(series.rows()));
    for (std::size_t t = 0; t < trend.size(); ++t) {
        trend[t] = std::pow(static_cast<double>(t), m_Degree);
    }

    for (std::ptrdiff_t j = 0; j < series.cols(); ++j) {
        auto k = static_cast<std::size_t>(j);
        for (std::ptrdiff_t t = 0; t < series.rows(); ++t) {
            series(t, j) += intercept[k] + coefficient[k] * trend[static_cast<std::size_t>(t)];
        }
    }
}
}
}
