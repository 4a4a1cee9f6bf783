/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_validation_CEffect_h
#define INCLUDED_cval_validation_CEffect_h

#include <validation/ImportExport.h>

#include <iosfwd>
#include <string>

namespace cval {
namespace validation {

//! \brief An estimated causal effect.
//!
//! DESCRIPTION:\n
//! Holds the absolute effect and the observed post intervention level of
//! the treated units. The counterfactual level, what would have been
//! observed without the intervention, is their difference.
class VALIDATION_EXPORT CEffect {
public:
    CEffect(double value, double observed);

    //! The absolute effect.
    double value() const;
    //! The observed post intervention level.
    double observed() const;
    //! The level had there been no intervention.
    double counterfactual() const;

    //! Get the effect as a percentage of the counterfactual level. The
    //! observed level is likewise rescaled.
    //!
    //! \note If the counterfactual level is zero the value is not finite.
    CEffect percentage() const;

    std::string print() const;

private:
    double m_Value;
    double m_Observed;
};

VALIDATION_EXPORT
std::ostream& operator<<(std::ostream& o, const CEffect& effect);

//! \brief A model's estimate for one dataset.
class VALIDATION_EXPORT CResult {
public:
    CResult(std::string modelName, CEffect effect);

    const std::string& modelName() const;
    const CEffect& effect() const;

private:
    std::string m_ModelName;
    CEffect m_Effect;
};
}
}

#endif // INCLUDED_cval_validation_CEffect_h
