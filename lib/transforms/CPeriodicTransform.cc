/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <transforms/CPeriodicTransform.h>

#include <boost/math/constants/constants.hpp>

#include <cmath>
#include <memory>
#include <sstream>

namespace cval {
namespace transforms {

const std::string CPeriodicTransform::NAME{"Periodic"};

CPeriodicTransform::CPeriodicTransform()
    : CPeriodicTransform{CParameter::fixed(1.0), CParameter::fixed(1.0),
                         CParameter::fixed(0.0), CParameter::fixed(0.0)} {
}

CPeriodicTransform::CPeriodicTransform(CParameter amplitude,
                                       CParameter frequency,
                                       CParameter shift,
                                       CParameter offset)
    : m_Amplitude{std::move(amplitude)}, m_Frequency{std::move(frequency)},
      m_Shift{std::move(shift)}, m_Offset{std::move(offset)} {
}

std::string CPeriodicTransform::name() const {
    return NAME;
}

std::string CPeriodicTransform::print() const {
    std::ostringstream result;
    result << NAME << "(amplitude = " << m_Amplitude.print()
           << ", frequency = " << m_Frequency.print() << ", shift = " << m_Shift.print()
           << ", offset = " << m_Offset.print() << ')';
    return result.str();
}

CTransform::TTransformUPtr CPeriodicTransform::clone() const {
    return std::make_unique<CPeriodicTransform>(*this);
}

void CPeriodicTransform::deform(TDenseMatrix& series) const {
    auto n = static_cast<std::size_t>(series.cols());
    TDoubleVec amplitude{m_Amplitude.resolve(n)};
    TDoubleVec frequency{m_Frequency.resolve(n)};
    TDoubleVec shift{m_Shift.resolve(n)};
    TDoubleVec offset{m_Offset.resolve(n)};

    double T{static_cast<double>(series.rows())};
    for (std::ptrdiff_t j = 0; j < series.cols(); ++j) {
        auto k = static_cast<std::size_t>(j);
        double omega{boost::math::double_constants::two_pi * frequency[k] / T};
        for (std::ptrdiff_t t = 0; t < series.rows(); ++t) {
            series(t, j) += offset[k] + amplitude[k] * std::sin(omega * static_cast<double>(t) +
                                                                 shift[k]);
        }
    }
}
}
}
