/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_maths_CSignal_h
#define INCLUDED_cval_maths_CSignal_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>

#include <complex>
#include <cstddef>
#include <vector>

namespace cval {
namespace maths {

//! \brief Utility functionality to perform signal processing.
class MATHS_EXPORT CSignal : private core::CNonInstantiatable {
public:
    using TDoubleVec = std::vector<double>;
    using TComplex = std::complex<double>;
    using TComplexVec = std::vector<TComplex>;

public:
    //! Compute the conjugate of \p f.
    static void conj(TComplexVec& f);

    //! Compute the Hadamard product of \p fx and \p fy.
    static void hadamard(const TComplexVec& fx, TComplexVec& fy);

    //! Cooley-Tukey fast DFT transform implementation.
    //!
    //! \note This is a simple implementation radix 2 DIT which uses the chirp-z
    //! idea to handle the case that the length of \p fx is not a power of 2. As
    //! such it is definitely not a highly optimized FFT implementation. It should
    //! be sufficiently fast for our needs.
    static void fft(TComplexVec& f);

    //! This uses conjugate of the conjugate of the series is the inverse DFT trick
    //! to compute this using fft.
    static void ifft(TComplexVec& f);

    //! Get the magnitudes of the DFT of the real series \p values.
    static TDoubleVec amplitudeSpectrum(const TDoubleVec& values);

    //! Get the index in [1, n/2) of the largest magnitude DFT coefficient of
    //! \p values, where n is the length of \p values.
    //!
    //! This is the number of whole cycles over the series of its strongest
    //! periodic component. Returns zero if \p values has fewer than four
    //! elements.
    static std::size_t dominantFrequency(const TDoubleVec& values);
};
}
}

#endif // INCLUDED_cval_maths_CSignal_h
