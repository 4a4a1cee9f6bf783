/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CSignal.h>

#include <core/CLogger.h>

#include <maths/CIntegerTools.h>

#include <boost/math/constants/constants.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace cval {
namespace maths {
namespace {

using TComplex = CSignal::TComplex;
using TComplexVec = CSignal::TComplexVec;

void scale(double factor, TComplexVec& f) {
    for (auto& fi : f) {
        fi *= factor;
    }
}

//! In-place iterative Cooley-Tukey FFT of \p f whose size is a power of 2.
void radix2fft(TComplexVec& f) {
    std::size_t n{f.size()};

    // Sort into bit reversed index order so the butterflies can work in-place.
    std::size_t bits{CIntegerTools::nextPow2(n) - 1};
    for (std::size_t i = 0; i < n; ++i) {
        std::size_t j{static_cast<std::size_t>(CIntegerTools::reverseBits(i) >> (64 - bits))};
        if (i < j) {
            std::swap(f[i], f[j]);
        }
    }

    for (std::size_t length = 2; length <= n; length <<= 1) {
        std::size_t half{length / 2};
        double theta{-boost::math::double_constants::two_pi / static_cast<double>(length)};
        for (std::size_t k = 0; k < half; ++k) {
            TComplex twiddle{std::polar(1.0, theta * static_cast<double>(k))};
            for (std::size_t i = k; i < n; i += length) {
                TComplex even{f[i]};
                TComplex odd{twiddle * f[i + half]};
                f[i] = even + odd;
                f[i + half] = even - odd;
            }
        }
    }
}
}

void CSignal::conj(TComplexVec& f) {
    for (std::size_t i = 0; i < f.size(); ++i) {
        f[i] = std::conj(f[i]);
    }
}

void CSignal::hadamard(const TComplexVec& fx, TComplexVec& fy) {
    for (std::size_t i = 0; i < fx.size(); ++i) {
        fy[i] *= fx[i];
    }
}

void CSignal::fft(TComplexVec& f) {
    std::size_t n{f.size()};
    if (n < 2) {
        return;
    }

    std::size_t p{CIntegerTools::nextPow2(n)};
    std::size_t m{std::size_t{1} << p};

    if ((m >> 1) == n) {
        radix2fft(f);
    } else {
        // We use Bluestein's trick to reformulate as a convolution which can be
        // computed by padding to a power of 2.

        LOG_TRACE(<< "Using Bluestein's trick");

        m = 2 * n - 1;
        p = CIntegerTools::nextPow2(m);
        m = std::size_t{1} << p;

        TComplexVec chirp;
        chirp.reserve(n);
        TComplexVec a(m, TComplex{0.0, 0.0});
        TComplexVec b(m, TComplex{0.0, 0.0});

        chirp.emplace_back(1.0, 0.0);
        a[0] = f[0] * chirp[0];
        b[0] = chirp[0];
        for (std::size_t i = 1; i < n; ++i) {
            // Reduce i^2 modulo 2n to keep the phase accurate for long series.
            double t = boost::math::double_constants::pi *
                       static_cast<double>((i * i) % (2 * n)) / static_cast<double>(n);
            chirp.emplace_back(std::cos(t), std::sin(t));
            a[i] = f[i] * std::conj(chirp[i]);
            b[i] = b[m - i] = chirp[i];
        }

        fft(a);
        fft(b);
        hadamard(a, b);
        ifft(b);

        for (std::size_t i = 0; i < n; ++i) {
            f[i] = std::conj(chirp[i]) * b[i];
        }
    }
}

void CSignal::ifft(TComplexVec& f) {
    if (f.empty()) {
        return;
    }
    conj(f);
    fft(f);
    conj(f);
    scale(1.0 / static_cast<double>(f.size()), f);
}

CSignal::TDoubleVec CSignal::amplitudeSpectrum(const TDoubleVec& values) {
    TComplexVec f;
    f.reserve(values.size());
    for (auto value : values) {
        f.emplace_back(value, 0.0);
    }
    fft(f);

    TDoubleVec result;
    result.reserve(f.size());
    for (const auto& fi : f) {
        result.push_back(std::abs(fi));
    }
    return result;
}

std::size_t CSignal::dominantFrequency(const TDoubleVec& values) {
    if (values.size() < 4) {
        return 0;
    }

    TDoubleVec amplitudes{amplitudeSpectrum(values)};
    auto begin = amplitudes.begin() + 1;
    auto end = amplitudes.begin() + (values.size() + 1) / 2;
    std::size_t result{static_cast<std::size_t>(std::max_element(begin, end) -
                                                amplitudes.begin())};
    LOG_TRACE(<< "dominant frequency = " << result << " of " << values.size());

    return result;
}
}
}
