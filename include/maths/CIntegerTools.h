/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_maths_CIntegerTools_h
#define INCLUDED_cval_maths_CIntegerTools_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>

#include <cstddef>
#include <cstdint>

namespace cval {
namespace maths {

//! \brief A collection of utility functions for operations we do on
//! integers.
//!
//! DESCRIPTION:\n
//! Integer operations we sometimes need that can be done cheaply with
//! some "bit twiddling hack".
class MATHS_EXPORT CIntegerTools : private core::CNonInstantiatable {
public:
    //! Get the number of bits needed to represent \p x, i.e.
    //! <pre class="fragment">
    //!   \f = \left \lfloor \log_2(x) \right \rfloor + 1\f$
    //! </pre>
    //! so that \f^{p-1} \leq x < 2^p\f$.
    static std::size_t nextPow2(std::uint64_t x);

    //! Computes the integer with the reverse of the bits of the binary
    //! representation of \p x.
    static std::uint64_t reverseBits(std::uint64_t x);
};
}
}

#endif // INCLUDED_cval_maths_CIntegerTools_h
