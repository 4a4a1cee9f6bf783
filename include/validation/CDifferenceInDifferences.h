/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_validation_CDifferenceInDifferences_h
#define INCLUDED_cval_validation_CDifferenceInDifferences_h

#include <validation/CModel.h>
#include <validation/ImportExport.h>

#include <string>

namespace cval {
namespace validation {

//! \brief The difference-in-differences estimator.
//!
//! DESCRIPTION:\n
//! The effect is the change in the mean treated level from the pre to the
//! post intervention period less the same change for the controls. The
//! observed level is the mean post intervention treated value.
class VALIDATION_EXPORT CDifferenceInDifferences : public CModel {
public:
    static const std::string DEFAULT_NAME;

public:
    explicit CDifferenceInDifferences(std::string name = DEFAULT_NAME);

    std::string name() const override;

    //! \throws core::CShapeMismatch if \p dataset has no control units.
    CResult operator()(const data::CDataset& dataset) const override;

private:
    std::string m_Name;
};
}
}

#endif // INCLUDED_cval_validation_CDifferenceInDifferences_h
