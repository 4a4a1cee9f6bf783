/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <transforms/CTransform.h>

#include <core/CException.h>
#include <core/CLogger.h>

namespace cval {
namespace transforms {

data::CDataset CAdditiveTransform::apply(const data::CDataset& dataset) const {
    auto pre = static_cast<std::ptrdiff_t>(dataset.nPreInterventionTimePoints());
    auto post = static_cast<std::ptrdiff_t>(dataset.nPostInterventionTimePoints());

    LOG_TRACE(<< "Applying " << this->print() << " to " << dataset.print());

    TDenseMatrix controls{dataset.controlUnits()};
    TDenseMatrix treated{dataset.treatedUnits()};
    bool finite{controls.isFinite() && treated.isFinite()};

    // A placebo view of a panel with one control has no controls to deform.
    if (controls.cols() > 0) {
        this->deform(controls);
    }
    this->deform(treated);

    if (finite && (controls.isFinite() == false || treated.isFinite() == false)) {
        LOG_ERROR(<< this->print() << " produced non-finite values for " << dataset.print());
        throw core::CInvalidConfiguration{this->name() + " produced non-finite values"};
    }

    return dataset.withPanels(controls.topRows(pre), controls.bottomRows(post),
                              treated.topRows(pre), treated.bottomRows(post));
}
}
}
