/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CSamplingDistribution.h>

#include <core/CException.h>
#include <core/CLogger.h>
#include <core/CStreamUtils.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>

#include <cmath>
#include <initializer_list>
#include <sstream>

namespace cval {
namespace maths {
namespace {
using TStrVec = std::vector<std::string>;

const std::string NORMAL{"normal"};
const std::string UNIFORM{"uniform"};
const std::string LOGNORMAL{"lognormal"};
const std::string GAMMA{"gamma"};
const std::string STUDENT_T{"student_t"};

void checkParameter(bool valid, const std::string& distribution, const std::string& what) {
    if (valid == false) {
        LOG_ERROR(<< "Bad " << distribution << " parameters: " << what);
        throw core::CInvalidConfiguration{distribution + " requires " + what};
    }
}

bool isFinite(double x) {
    return std::isfinite(x);
}

//! \brief Draws a sample from the visited distribution.
class CSampleVisitor : public boost::static_visitor<double> {
public:
    explicit CSampleVisitor(CPRNG::CXorOShiro128Plus& rng) : m_Rng{rng} {}

    template<typename DISTRIBUTION>
    double operator()(const DISTRIBUTION& distribution) const {
        DISTRIBUTION copy{distribution};
        return copy(m_Rng);
    }

private:
    CPRNG::CXorOShiro128Plus& m_Rng;
};

//! \brief Prints the visited distribution.
class CPrintVisitor : public boost::static_visitor<std::string> {
public:
    std::string operator()(const boost::random::normal_distribution<>& normal) const {
        return print(NORMAL, {normal.mean(), normal.sigma()});
    }
    std::string operator()(const boost::random::uniform_real_distribution<>& uniform) const {
        return print(UNIFORM, {uniform.a(), uniform.b()});
    }
    std::string operator()(const boost::random::lognormal_distribution<>& lognormal) const {
        return print(LOGNORMAL, {lognormal.m(), lognormal.s()});
    }
    std::string operator()(const boost::random::gamma_distribution<>& gamma) const {
        return print(GAMMA, {gamma.alpha(), gamma.beta()});
    }
    template<typename STUDENT_T_DISTRIBUTION>
    std::string operator()(const STUDENT_T_DISTRIBUTION& t) const {
        return print(STUDENT_T, {t.s_T.n(), t.s_Location, t.s_Scale});
    }

private:
    static std::string print(const std::string& name, std::initializer_list<double> parameters) {
        std::ostringstream result;
        result << name << '(';
        std::string delimiter;
        for (auto parameter : parameters) {
            result << delimiter << parameter;
            delimiter = ", ";
        }
        result << ')';
        return result.str();
    }
};
}

CSamplingDistribution::CSamplingDistribution(TDistribution distribution)
    : m_Distribution{std::move(distribution)} {
}

CSamplingDistribution CSamplingDistribution::normal(double mean, double sd) {
    checkParameter(isFinite(mean) && isFinite(sd) && sd > 0.0, NORMAL,
                   "finite mean and positive standard deviation");
    return CSamplingDistribution{boost::random::normal_distribution<>{mean, sd}};
}

CSamplingDistribution CSamplingDistribution::uniform(double a, double b) {
    checkParameter(isFinite(a) && isFinite(b) && a < b, UNIFORM, "finite a < b");
    return CSamplingDistribution{boost::random::uniform_real_distribution<>{a, b}};
}

CSamplingDistribution CSamplingDistribution::lognormal(double location, double scale) {
    checkParameter(isFinite(location) && isFinite(scale) && scale > 0.0,
                   LOGNORMAL, "finite location and positive scale");
    return CSamplingDistribution{boost::random::lognormal_distribution<>{location, scale}};
}

CSamplingDistribution CSamplingDistribution::gamma(double shape, double scale) {
    checkParameter(isFinite(shape) && isFinite(scale) && shape > 0.0 && scale > 0.0,
                   GAMMA, "positive shape and scale");
    return CSamplingDistribution{boost::random::gamma_distribution<>{shape, scale}};
}

CSamplingDistribution CSamplingDistribution::studentT(double df, double location, double scale) {
    checkParameter(isFinite(df) && isFinite(location) && isFinite(scale) &&
                       df > 0.0 && scale > 0.0,
                   STUDENT_T, "positive degrees of freedom and scale");
    return CSamplingDistribution{
        SStudentT{boost::random::student_t_distribution<>{df}, location, scale}};
}

CSamplingDistribution CSamplingDistribution::fromString(const std::string& description) {
    std::string name{description};
    core::CStreamUtils::trimWhitespace(name);

    std::size_t open{name.find('(')};
    std::size_t close{name.rfind(')')};
    if (open == std::string::npos || close == std::string::npos ||
        close < open || close + 1 != name.length()) {
        LOG_ERROR(<< "Malformed distribution '" << description << "'");
        throw core::CInvalidConfiguration{"malformed distribution '" + description + "'"};
    }

    std::string arguments{name.substr(open + 1, close - open - 1)};
    name.erase(open);
    core::CStreamUtils::trimWhitespace(name);

    TStrVec tokens;
    boost::algorithm::split(tokens, arguments, boost::algorithm::is_any_of(","));
    std::vector<double> parameters;
    for (auto& token : tokens) {
        core::CStreamUtils::trimWhitespace(token);
        if (token.empty() && tokens.size() == 1) {
            break;
        }
        try {
            parameters.push_back(boost::lexical_cast<double>(token));
        } catch (const boost::bad_lexical_cast&) {
            LOG_ERROR(<< "Bad parameter '" << token << "' in distribution '"
                      << description << "'");
            throw core::CInvalidConfiguration{"non-numeric parameter '" + token +
                                              "' in '" + description + "'"};
        }
    }

    auto requireArity = [&](std::size_t arity) {
        checkParameter(parameters.size() == arity, name,
                       std::to_string(arity) + " parameter(s)");
    };

    if (name == NORMAL) {
        requireArity(2);
        return normal(parameters[0], parameters[1]);
    }
    if (name == UNIFORM) {
        requireArity(2);
        return uniform(parameters[0], parameters[1]);
    }
    if (name == LOGNORMAL) {
        requireArity(2);
        return lognormal(parameters[0], parameters[1]);
    }
    if (name == GAMMA) {
        requireArity(2);
        return gamma(parameters[0], parameters[1]);
    }
    if (name == STUDENT_T) {
        if (parameters.size() == 1) {
            return studentT(parameters[0]);
        }
        requireArity(3);
        return studentT(parameters[0], parameters[1], parameters[2]);
    }

    LOG_ERROR(<< "Unknown distribution '" << name << "'");
    throw core::CInvalidConfiguration{"unknown distribution '" + name + "'"};
}

double CSamplingDistribution::sample(CPRNG::CXorOShiro128Plus& rng) const {
    return boost::apply_visitor(CSampleVisitor{rng}, m_Distribution);
}

void CSamplingDistribution::sample(CPRNG::CXorOShiro128Plus& rng,
                                   std::size_t n,
                                   TDoubleVec& result) const {
    result.clear();
    result.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        result.push_back(this->sample(rng));
    }
}

std::string CSamplingDistribution::print() const {
    return boost::apply_visitor(CPrintVisitor{}, m_Distribution);
}
}
}
