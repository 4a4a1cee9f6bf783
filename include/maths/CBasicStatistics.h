/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_maths_CBasicStatistics_h
#define INCLUDED_cval_maths_CBasicStatistics_h

#include <maths/ImportExport.h>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace cval {
namespace maths {

//! \brief Some basic stats utilities.
//!
//! DESCRIPTION:\n
//! Accumulators for the sample mean and variance.
class MATHS_EXPORT CBasicStatistics {
public:
    /////////////////////////// ACCUMULATORS ///////////////////////////

    //! \brief An accumulator class for sample central moments.
    //!
    //! DESCRIPTION:\n
    //! This function object accumulates sample central moments for a set
    //! of samples passed to its function operator.
    //!
    //! It is capable of calculating the mean and the 2nd central moment.
    //! Free functions are defined to compute the count, mean and variance.
    //!
    //! IMPLEMENTATION DECISIONS:\n
    //! We use recurrence relations for the second moment which minimize
    //! the cancellation errors. These can be derived by considering,\n
    //! <pre class="fragment">
    //!   \f$M(n, N) = \sum_{i=1}^{N}{ (x_i - M(1, N))^n } = \sum_{i=1}^{N}{ (x_i - M(1, N-1) + (M(1, N-1) - M(1, N)))^n }\f$
    //! </pre>
    //!
    //! where \f$M(1, N)\f$ is defined to be the sample mean of \f$N\f$ samples.
    //!
    //! \tparam T The floating point type.
    //! \tparam ORDER The highest order moment to gather.
    template<typename T, unsigned int ORDER>
    struct SSampleCentralMoments {
        static_assert(ORDER == 1 || ORDER == 2, "Only mean and variance are supported");

        using TValue = T;

        explicit SSampleCentralMoments(const T& initial = T(0)) : s_Count(0) {
            std::fill_n(s_Moments, ORDER, initial);
        }

        //! \name Update
        //@{
        //! Define a function operator for use with std:: algorithms.
        inline void operator()(const T& x) { this->add(x); }

        //! Update the moments with the collection \p x.
        template<typename U>
        void add(const std::vector<U>& x) {
            for (const auto& xi : x) {
                this->add(xi);
            }
        }

        //! Update the moments with \p x. \p n is the optional number
        //! of times to add \p x.
        void add(const T& x, const T& n = T{1}) {
            if (n == T{0}) {
                return;
            }

            s_Count += n;

            T alpha{n / s_Count};
            T beta{T{1} - alpha};

            T mean{s_Moments[0]};
            s_Moments[0] = beta * mean + alpha * x;

            if (ORDER > 1) {
                T r{x - s_Moments[0]};
                T dMean{mean - s_Moments[0]};
                T variance{s_Moments[ORDER - 1]};
                s_Moments[ORDER - 1] = beta * (variance + dMean * dMean) + alpha * r * r;
            }
        }

        //! Combine two moments. This is equivalent to running
        //! a single accumulator on the entire collection.
        const SSampleCentralMoments& operator+=(const SSampleCentralMoments& rhs) {
            if (rhs.s_Count == T{0}) {
                return *this;
            }

            s_Count = s_Count + rhs.s_Count;

            T alpha{rhs.s_Count / s_Count};
            T beta{T{1} - alpha};

            T meanLhs{s_Moments[0]};
            T meanRhs{rhs.s_Moments[0]};

            s_Moments[0] = beta * meanLhs + alpha * meanRhs;

            if (ORDER > 1) {
                T dMeanLhs{meanLhs - s_Moments[0]};
                T dMeanRhs{meanRhs - s_Moments[0]};
                T varianceLhs{s_Moments[ORDER - 1]};
                T varianceRhs{rhs.s_Moments[ORDER - 1]};
                s_Moments[ORDER - 1] = beta * (varianceLhs + dMeanLhs * dMeanLhs) +
                                       alpha * (varianceRhs + dMeanRhs * dMeanRhs);
            }

            return *this;
        }

        //! Combine two moments.
        SSampleCentralMoments operator+(const SSampleCentralMoments& rhs) const {
            SSampleCentralMoments result{*this};
            return result += rhs;
        }
        //@}

        T s_Count;
        T s_Moments[ORDER];
    };

    //! \name Accumulator Typedefs
    //@{
    //! Accumulator object to compute the sample mean.
    template<typename T>
    struct SSampleMean {
        using TAccumulator = SSampleCentralMoments<T, 1u>;
    };

    //! Accumulator object to compute the sample mean and variance.
    template<typename T>
    struct SSampleMeanVar {
        using TAccumulator = SSampleCentralMoments<T, 2u>;
    };
    //@}

    //! Extract the count from an accumulator object.
    template<typename T, unsigned int N>
    static inline const T& count(const SSampleCentralMoments<T, N>& accumulator) {
        return accumulator.s_Count;
    }

    //! Extract the mean from an accumulator object.
    template<typename T, unsigned int N>
    static inline const T& mean(const SSampleCentralMoments<T, N>& accumulator) {
        return accumulator.s_Moments[0];
    }

    //! Extract the variance from an accumulator object.
    //!
    //! \note This is the unbiased form.
    template<typename T, unsigned int N>
    static inline T variance(const SSampleCentralMoments<T, N>& accumulator) {
        static_assert(N >= 2, "N must be at least 2");

        if (accumulator.s_Count <= T{1}) {
            return T{0};
        }

        T bias{accumulator.s_Count / (accumulator.s_Count - T{1})};

        return bias * accumulator.s_Moments[1];
    }

    //! Extract the maximum likelihood variance from an accumulator object.
    //!
    //! \note This is the biased form, i.e. the population variance of the
    //! samples added.
    template<typename T, unsigned int N>
    static inline const T& maximumLikelihoodVariance(const SSampleCentralMoments<T, N>& accumulator) {
        static_assert(N >= 2, "N must be at least 2");
        return accumulator.s_Moments[1];
    }

    //! Print a mean accumulator.
    template<typename T, unsigned int N>
    static inline std::string print(const SSampleCentralMoments<T, N>& accumulator) {
        std::ostringstream result;
        result << '(' << count(accumulator) << ", " << mean(accumulator);
        if (N > 1) {
            result << ", " << accumulator.s_Moments[N - 1];
        }
        result << ')';
        return result.str();
    }
};

template<typename T, unsigned int ORDER>
std::ostream& operator<<(std::ostream& o,
                         const CBasicStatistics::SSampleCentralMoments<T, ORDER>& accumulator) {
    return o << CBasicStatistics::print(accumulator);
}
}
}

#endif // INCLUDED_cval_maths_CBasicStatistics_h
