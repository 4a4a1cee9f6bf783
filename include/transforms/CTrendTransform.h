/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_transforms_CTrendTransform_h
#define INCLUDED_cval_transforms_CTrendTransform_h

#include <transforms/CParameter.h>
#include <transforms/CTransform.h>
#include <transforms/ImportExport.h>

namespace cval {
namespace transforms {

//! \brief Adds a polynomial trend to every unit.
//!
//! DESCRIPTION:\n
//! Unit j's value at time t becomes
//! <pre class="fragment">
//!   \f(t) + b_j + c_j t^d\f$
//! </pre>
//! where t counts time points from the start of the full series, the degree
//! d is a fixed positive integer and the intercept \f\f$ and coefficient
//! \f\f$ are resolved per unit.
class TRANSFORMS_EXPORT CTrendTransform : public CAdditiveTransform {
public:
    static const std::string NAME;

public:
    CTrendTransform();
    //! \throws core::CInvalidConfiguration if \p degree is less than one.
    CTrendTransform(int degree, CParameter coefficient, CParameter intercept);

    std::string name() const override;
    std::string print() const override;
    TTransformUPtr clone() const override;

    int degree() const { return m_Degree; }
    const CParameter& coefficient() const { return m_Coefficient; }
    const CParameter& intercept() const { return m_Intercept; }

protected:
    void deform(TDenseMatrix& series) const override;

private:
    int m_Degree;
    CParameter m_Coefficient;
    CParameter m_Intercept;
};
}
}

#endif // INCLUDED_cval_transforms_CTrendTransform_h
