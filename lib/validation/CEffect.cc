/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <validation/CEffect.h>

#include <ostream>
#include <sstream>
#include <utility>

namespace cval {
namespace validation {

CEffect::CEffect(double value, double observed)
    : m_Value{value}, m_Observed{observed} {
}

double CEffect::value() const {
    return m_Value;
}

double CEffect::observed() const {
    return m_Observed;
}

double CEffect::counterfactual() const {
    return m_Observed - m_Value;
}

CEffect CEffect::percentage() const {
    double scale{100.0 / this->counterfactual()};
    return {scale * m_Value, scale * m_Observed};
}

std::string CEffect::print() const {
    std::ostringstream result;
    result << *this;
    return result.str();
}

std::ostream& operator<<(std::ostream& o, const CEffect& effect) {
    return o << "{effect = " << effect.value() << ", observed = " << effect.observed()
             << ", counterfactual = " << effect.counterfactual() << '}';
}

CResult::CResult(std::string modelName, CEffect effect)
    : m_ModelName{std::move(modelName)}, m_Effect{effect} {
}

const std::string& CResult::modelName() const {
    return m_ModelName;
}

const CEffect& CResult::effect() const {
    return m_Effect;
}
}
}
