/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_transforms_CTransform_h
#define INCLUDED_cval_transforms_CTransform_h

#include <data/CDataset.h>

#include <transforms/ImportExport.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace cval {
namespace transforms {

//! \brief Interface for a mapping from one panel to another.
//!
//! DESCRIPTION:\n
//! A transform holds no reference to any dataset. Applying it builds a new
//! dataset whose slots have exactly the shapes of the input's.
class TRANSFORMS_EXPORT CTransform {
public:
    using TTransformUPtr = std::unique_ptr<CTransform>;

public:
    virtual ~CTransform() = default;

    //! Apply to \p dataset.
    data::CDataset operator()(const data::CDataset& dataset) const {
        return this->apply(dataset);
    }

    //! Apply to \p dataset.
    virtual data::CDataset apply(const data::CDataset& dataset) const = 0;

    //! Get the transform name.
    virtual std::string name() const = 0;

    //! Get a description of the transform and its parameters.
    virtual std::string print() const = 0;

    //! Get a copy of this transform.
    virtual TTransformUPtr clone() const = 0;
};

//! \brief A transform which adds a deformation to every unit's full series.
//!
//! DESCRIPTION:\n
//! The deformation is computed for the full span of each unit's series,
//! with time index t running from 0 to the number of time points minus
//! one, and added to the pre and post intervention slots. Control and
//! treated units are deformed separately so parameters are resolved once
//! for each group.
class TRANSFORMS_EXPORT CAdditiveTransform : public CTransform {
public:
    using TDoubleVec = std::vector<double>;
    using TDenseMatrix = data::CDataset::TDenseMatrix;

public:
    data::CDataset apply(const data::CDataset& dataset) const override;

protected:
    //! Add the deformation to \p series, which has one row per time point
    //! and one column per unit.
    virtual void deform(TDenseMatrix& series) const = 0;
};
}
}

#endif // INCLUDED_cval_transforms_CTransform_h
