/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <transforms/CParameter.h>

#include <core/CException.h>
#include <core/CLogger.h>
#include <core/CStreamUtils.h>

#include <boost/lexical_cast.hpp>

#include <cmath>
#include <random>
#include <sstream>

namespace cval {
namespace transforms {
namespace {
std::uint64_t randomSeed() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) | rd();
}

bool parseSeed(const std::string& seedString, std::uint64_t& seed) {
    // lexical_cast wraps negative values for unsigned types
    if (seedString.find('-') != std::string::npos) {
        return false;
    }
    try {
        seed = boost::lexical_cast<std::uint64_t>(seedString);
    } catch (const boost::bad_lexical_cast&) {
        return false;
    }
    return true;
}
}

CParameter::SVarying::SVarying(const maths::CSamplingDistribution& distribution,
                               TOptionalSeed seed)
    : s_Distribution{distribution}, s_Seed{seed} {
    if (s_Seed == std::nullopt) {
        s_Rng.seed(randomSeed());
    }
}

CParameter::SVarying::SVarying(const SVarying& other)
    : SVarying{other.s_Distribution, other.s_Seed} {
}

CParameter::SVarying& CParameter::SVarying::operator=(const SVarying& other) {
    if (this != &other) {
        *this = SVarying{other};
    }
    return *this;
}

class CParameter::CResolveVisitor : public boost::static_visitor<TDoubleVec> {
public:
    explicit CResolveVisitor(std::size_t n) : m_N{n} {}

    TDoubleVec operator()(const SFixed& fixed) const {
        return TDoubleVec(m_N, fixed.s_Value);
    }

    TDoubleVec operator()(SVarying& varying) const {
        TDoubleVec result;
        if (varying.s_Seed != std::nullopt) {
            maths::CPRNG::CXorOShiro128Plus rng{*varying.s_Seed};
            varying.s_Distribution.sample(rng, m_N, result);
        } else {
            varying.s_Distribution.sample(varying.s_Rng, m_N, result);
        }
        return result;
    }

private:
    std::size_t m_N;
};

class CParameter::CPrintVisitor : public boost::static_visitor<std::string> {
public:
    std::string operator()(const SFixed& fixed) const {
        std::ostringstream result;
        result << fixed.s_Value;
        return result.str();
    }

    std::string operator()(const SVarying& varying) const {
        std::string result{varying.s_Distribution.print()};
        if (varying.s_Seed != std::nullopt) {
            result += " @ " + std::to_string(*varying.s_Seed);
        }
        return result;
    }
};

CParameter::CParameter(TValue value) : m_Value{std::move(value)} {
}

CParameter CParameter::fixed(double value) {
    if (std::isfinite(value) == false) {
        LOG_ERROR(<< "Fixed parameter value " << value << " is not finite");
        throw core::CInvalidConfiguration{"parameter value must be finite"};
    }
    return CParameter{SFixed{value}};
}

CParameter CParameter::varying(const maths::CSamplingDistribution& distribution,
                               TOptionalSeed seed) {
    return CParameter{SVarying{distribution, seed}};
}

CParameter CParameter::fromString(const std::string& description) {
    std::string value{description};
    core::CStreamUtils::trimWhitespace(value);

    if (value.find('(') == std::string::npos) {
        try {
            return fixed(boost::lexical_cast<double>(value));
        } catch (const boost::bad_lexical_cast&) {
            LOG_ERROR(<< "Bad parameter value '" << description << "'");
            throw core::CInvalidConfiguration{"parameter '" + description +
                                              "' is neither a number nor a distribution"};
        }
    }

    TOptionalSeed seed;
    std::size_t at{value.rfind('@')};
    if (at != std::string::npos) {
        std::string seedString{value.substr(at + 1)};
        core::CStreamUtils::trimWhitespace(seedString);
        std::uint64_t seedValue{0};
        if (parseSeed(seedString, seedValue) == false) {
            LOG_ERROR(<< "Bad seed '" << seedString << "' in parameter '"
                      << description << "'");
            throw core::CInvalidConfiguration{"bad seed '" + seedString +
                                              "' in '" + description + "'"};
        }
        seed = seedValue;
        value.erase(at);
    }

    return varying(maths::CSamplingDistribution::fromString(value), seed);
}

CParameter::TDoubleVec CParameter::resolve(std::size_t n) const {
    if (n == 0) {
        LOG_ERROR(<< "Can't resolve parameter " << this->print() << " for zero units");
        throw core::CInvalidConfiguration{"number of units must be positive"};
    }
    return boost::apply_visitor(CResolveVisitor{n}, m_Value);
}

bool CParameter::isFixed() const {
    return boost::get<SFixed>(&m_Value) != nullptr;
}

std::string CParameter::print() const {
    return boost::apply_visitor(CPrintVisitor{}, m_Value);
}
}
}
