/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_maths_CPRNG_h
#define INCLUDED_cval_maths_CPRNG_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>

#include <cstdint>

namespace cval {
namespace maths {

//! \brief Fast, seedable pseudo random number generators.
//!
//! DESCRIPTION:\n
//! These satisfy the UniformRandomBitGenerator concept so they can be used
//! with the boost::random distributions. The simulated panels and the
//! unit-varying parameters are all drawn from one of these so a fixed seed
//! reproduces a run exactly on any platform.
//!
//! \see http://xoroshiro.di.unimi.it/ for details.
class MATHS_EXPORT CPRNG : private core::CNonInstantiatable {
public:
    //! \brief A splitmix64 generator.
    //!
    //! DESCRIPTION:\n
    //! This is a fixed-increment version of Java 8's SplittableRandom generator.
    //! It is used to seed the other generators from a single 64 bit value.
    class MATHS_EXPORT CSplitMix64 {
    public:
        using result_type = std::uint64_t;

    public:
        CSplitMix64();
        explicit CSplitMix64(std::uint64_t seed);

        bool operator==(CSplitMix64 other) const;
        bool operator!=(CSplitMix64 other) const { return !this->operator==(other); }

        //! Set to the default seeded generator.
        void seed();
        //! Set the generator seed.
        void seed(std::uint64_t seed);

        //! The minimum value returnable by operator().
        static constexpr std::uint64_t min() { return 0; }
        //! The maximum value returnable by operator().
        static constexpr std::uint64_t max() { return ~std::uint64_t{0}; }

        //! Generate the next random number.
        std::uint64_t operator()();

        //! Fill the sequence [\p begin, \p end) with the next
        //! \p end - \p begin random numbers.
        template<typename ITR>
        void generate(ITR begin, ITR end) {
            for (/**/; begin != end; ++begin) {
                *begin = this->operator()();
            }
        }

        //! Discard the next \p n random numbers.
        void discard(std::uint64_t n);

    private:
        static const std::uint64_t A;
        static const std::uint64_t B;
        static const std::uint64_t C;

    private:
        std::uint64_t m_X;
    };

    //! \brief The xoroshiro128+ generator.
    //!
    //! DESCRIPTION:\n
    //! This has a period of 2^128 - 1 and passes the BigCrush tests. The
    //! state is seeded from CSplitMix64.
    class MATHS_EXPORT CXorOShiro128Plus {
    public:
        using result_type = std::uint64_t;

    public:
        CXorOShiro128Plus();
        explicit CXorOShiro128Plus(std::uint64_t seed);

        bool operator==(const CXorOShiro128Plus& other) const;
        bool operator!=(const CXorOShiro128Plus& other) const {
            return !this->operator==(other);
        }

        //! Set to the default seeded generator.
        void seed();
        //! Set the generator seed.
        void seed(std::uint64_t seed);

        //! The minimum value returnable by operator().
        static constexpr std::uint64_t min() { return 0; }
        //! The maximum value returnable by operator().
        static constexpr std::uint64_t max() { return ~std::uint64_t{0}; }

        //! Generate the next random number.
        std::uint64_t operator()();

        //! Fill the sequence [\p begin, \p end) with the next
        //! \p end - \p begin random numbers.
        template<typename ITR>
        void generate(ITR begin, ITR end) {
            for (/**/; begin != end; ++begin) {
                *begin = this->operator()();
            }
        }

        //! Discard the next \p n random numbers.
        void discard(std::uint64_t n);

    private:
        std::uint64_t m_X[2];
    };
};
}
}

#endif // INCLUDED_cval_maths_CPRNG_h
