/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_maths_CSamplingDistribution_h
#define INCLUDED_cval_maths_CSamplingDistribution_h

#include <maths/CPRNG.h>
#include <maths/ImportExport.h>

#include <boost/random/gamma_distribution.hpp>
#include <boost/random/lognormal_distribution.hpp>
#include <boost/random/normal_distribution.hpp>
#include <boost/random/student_t_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include <boost/variant.hpp>

#include <string>
#include <vector>

namespace cval {
namespace maths {

//! \brief A distribution from which per unit parameter values are drawn.
//!
//! DESCRIPTION:\n
//! This holds a variant which contains the actual boost::random distribution
//! which can be one of normal, uniform, log-normal, gamma or Student's t
//! (with location and scale). Samples are always drawn from an explicitly
//! supplied generator so the caller controls reproducibility.
//!
//! Distributions can be created from a string of the form
//! \code
//!   normal(0, 1)
//!   uniform(-1, 1)
//!   lognormal(0, 0.5)
//!   gamma(2, 1)
//!   student_t(3)
//!   student_t(3, 0, 2)
//! \endcode
//!
//! IMPLEMENTATION:\n
//! This uses a variant because we know the distributions we support up
//! front and it avoids heap allocation.
class MATHS_EXPORT CSamplingDistribution {
public:
    using TDoubleVec = std::vector<double>;

public:
    //! Normal with mean \p mean and standard deviation \p sd.
    static CSamplingDistribution normal(double mean, double sd);

    //! Uniform on [\p a, \p b).
    static CSamplingDistribution uniform(double a, double b);

    //! Log-normal whose logarithm has mean \p location and standard
    //! deviation \p scale.
    static CSamplingDistribution lognormal(double location, double scale);

    //! Gamma with shape \p shape and scale \p scale.
    static CSamplingDistribution gamma(double shape, double scale);

    //! Student's t with \p df degrees of freedom shifted by \p location
    //! and scaled by \p scale.
    static CSamplingDistribution studentT(double df, double location = 0.0, double scale = 1.0);

    //! Parse a distribution from its string form.
    //!
    //! \throws core::CInvalidConfiguration if \p description is malformed
    //! or the parameters are out of domain.
    static CSamplingDistribution fromString(const std::string& description);

    //! Draw one sample using \p rng.
    double sample(CPRNG::CXorOShiro128Plus& rng) const;

    //! Draw \p n samples using \p rng into \p result.
    void sample(CPRNG::CXorOShiro128Plus& rng, std::size_t n, TDoubleVec& result) const;

    //! Get the string form of this distribution.
    std::string print() const;

private:
    //! \brief Student's t with location and scale.
    struct SStudentT {
        template<typename RNG>
        double operator()(RNG& rng) {
            return s_Location + s_Scale * s_T(rng);
        }

        boost::random::student_t_distribution<> s_T;
        double s_Location;
        double s_Scale;
    };

    using TDistribution = boost::variant<boost::random::normal_distribution<>,
                                         boost::random::uniform_real_distribution<>,
                                         boost::random::lognormal_distribution<>,
                                         boost::random::gamma_distribution<>,
                                         SStudentT>;

private:
    explicit CSamplingDistribution(TDistribution distribution);

private:
    //! The actual distribution.
    TDistribution m_Distribution;
};
}
}

#endif // INCLUDED_cval_maths_CSamplingDistribution_h
