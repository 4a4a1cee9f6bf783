/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <validation/CDifferenceInDifferences.h>

#include <core/CException.h>
#include <core/CLogger.h>

#include <utility>

namespace cval {
namespace validation {

const std::string CDifferenceInDifferences::DEFAULT_NAME{"DiD"};

CDifferenceInDifferences::CDifferenceInDifferences(std::string name)
    : m_Name{std::move(name)} {
}

std::string CDifferenceInDifferences::name() const {
    return m_Name;
}

CResult CDifferenceInDifferences::operator()(const data::CDataset& dataset) const {
    if (dataset.nUnits() == 0) {
        LOG_ERROR(<< m_Name << " needs control units but " << dataset.print() << " has none");
        throw core::CShapeMismatch{m_Name + " requires at least one control unit"};
    }

    double treatedPre{dataset.ytr().mean()};
    double treatedPost{dataset.yte().mean()};
    double controlPre{dataset.Xtr().mean()};
    double controlPost{dataset.Xte().mean()};

    double effect{(treatedPost - treatedPre) - (controlPost - controlPre)};
    LOG_TRACE(<< m_Name << " effect for " << dataset.print() << " = " << effect);

    return {m_Name, CEffect{effect, treatedPost}};
}
}
}
