/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_validation_CModel_h
#define INCLUDED_cval_validation_CModel_h

#include <data/CDataset.h>

#include <validation/CEffect.h>
#include <validation/ImportExport.h>

#include <memory>
#include <string>

namespace cval {
namespace validation {

//! \brief Interface for a causal effect estimator.
//!
//! DESCRIPTION:\n
//! A model estimates the effect of the intervention on the treated units
//! of a dataset. The placebo test may call one model for several datasets
//! concurrently so implementations of operator() must be thread safe.
class VALIDATION_EXPORT CModel {
public:
    virtual ~CModel() = default;

    //! Get the name which identifies the model in results.
    virtual std::string name() const = 0;

    //! Estimate the effect of the intervention in \p dataset.
    virtual CResult operator()(const data::CDataset& dataset) const = 0;
};

using TModelCPtr = std::shared_ptr<const CModel>;
}
}

#endif // INCLUDED_cval_validation_CModel_h
