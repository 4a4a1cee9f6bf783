/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_transforms_CParameter_h
#define INCLUDED_cval_transforms_CParameter_h

#include <maths/CPRNG.h>
#include <maths/CSamplingDistribution.h>

#include <transforms/ImportExport.h>

#include <boost/variant.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cval {
namespace transforms {

//! \brief A transform parameter which is either fixed or varies by unit.
//!
//! DESCRIPTION:\n
//! A fixed parameter resolves to the same value for every unit. A unit
//! varying parameter draws one value per unit from a sampling distribution.
//!
//! If a varying parameter is given a seed then every resolution starts a
//! fresh generator from that seed, so resolving it any number of times, in
//! any order and on any thread, against the same unit count gives the same
//! values. Otherwise it owns a generator seeded from std::random_device
//! which advances with each resolution. A copy of an unseeded parameter gets
//! its own freshly seeded generator, so using one parameter for several
//! transform settings gives independent values for each.
//!
//! Parameters can be read from strings of the form
//! \code
//!   2.5
//!   normal(0, 1)
//!   normal(0, 1) @ 42
//! \endcode
//! where the number after \@ is the seed.
//!
//! IMPLEMENTATION:\n
//! The two kinds are a variant dispatched by a visitor. Resolving an
//! unseeded varying parameter mutates its generator so concurrent
//! resolutions of the same unseeded parameter are not safe.
class TRANSFORMS_EXPORT CParameter {
public:
    using TDoubleVec = std::vector<double>;
    using TOptionalSeed = std::optional<std::uint64_t>;

public:
    //! A fixed parameter with value \p value.
    static CParameter fixed(double value);

    //! A unit varying parameter drawn from \p distribution.
    static CParameter varying(const maths::CSamplingDistribution& distribution,
                              TOptionalSeed seed = TOptionalSeed{});

    //! Parse a parameter from its string form.
    //!
    //! \throws core::CInvalidConfiguration if \p description is malformed.
    static CParameter fromString(const std::string& description);

    //! Get one value for each of \p n units.
    //!
    //! \throws core::CInvalidConfiguration if \p n is zero.
    TDoubleVec resolve(std::size_t n) const;

    //! Check if this is a fixed parameter.
    bool isFixed() const;

    //! Get the string form of this parameter.
    std::string print() const;

private:
    struct SFixed {
        double s_Value;
    };

    struct SVarying {
        SVarying(const maths::CSamplingDistribution& distribution, TOptionalSeed seed);
        SVarying(const SVarying& other);
        SVarying(SVarying&&) = default;
        SVarying& operator=(const SVarying& other);
        SVarying& operator=(SVarying&&) = default;

        maths::CSamplingDistribution s_Distribution;
        TOptionalSeed s_Seed;
        //! Only used when there is no seed.
        maths::CPRNG::CXorOShiro128Plus s_Rng;
    };

    using TValue = boost::variant<SFixed, SVarying>;

    class CResolveVisitor;
    class CPrintVisitor;

private:
    explicit CParameter(TValue value);

private:
    mutable TValue m_Value;
};
}
}

#endif // INCLUDED_cval_transforms_CParameter_h
