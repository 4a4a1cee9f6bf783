/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_transforms_CPeriodicTransform_h
#define INCLUDED_cval_transforms_CPeriodicTransform_h

#include <transforms/CParameter.h>
#include <transforms/CTransform.h>
#include <transforms/ImportExport.h>

namespace cval {
namespace transforms {

//! \brief Adds a sinusoid to every unit.
//!
//! DESCRIPTION:\n
//! Unit j's value at time t becomes
//! <pre class="fragment">
//!   \f(t) + o_j + a_j \sin(2 \pi f_j t / T + s_j)\f$
//! </pre>
//! where T is the number of time points in the full series and the offset
//! \f\f$, amplitude \f\f$, frequency \f\f$ and shift \f\f$ are
//! resolved per unit. Frequency counts cycles over the full series: only
//! whole numbers of cycles leave the unit means unchanged, but any real
//! frequency is accepted.
class TRANSFORMS_EXPORT CPeriodicTransform : public CAdditiveTransform {
public:
    static const std::string NAME;

public:
    CPeriodicTransform();
    CPeriodicTransform(CParameter amplitude, CParameter frequency, CParameter shift, CParameter offset);

    std::string name() const override;
    std::string print() const override;
    TTransformUPtr clone() const override;

    const CParameter& amplitude() const { return m_Amplitude; }
    const CParameter& frequency() const { return m_Frequency; }
    const CParameter& shift() const { return m_Shift; }
    const CParameter& offset() const { return m_Offset; }

protected:
    void deform(TDenseMatrix& series) const override;

private:
    CParameter m_Amplitude;
    CParameter m_Frequency;
    CParameter m_Shift;
    CParameter m_Offset;
};
}
}

#endif // INCLUDED_cval_transforms_CPeriodicTransform_h
