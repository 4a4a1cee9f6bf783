/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <validation/CPlaceboTestConfig.h>

#include <core/CException.h>
#include <core/CLogger.h>
#include <core/CStreamUtils.h>

#include <transforms/CParameter.h>
#include <transforms/CPeriodicTransform.h>
#include <transforms/CTrendTransform.h>

#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <set>
#include <type_traits>

namespace cval {
namespace validation {
namespace {
using TStrSet = std::set<std::string>;

const std::string SIMULATION{"simulation"};
const std::string PLACEBO{"placebo"};
const std::string PERIODIC{"periodic"};
const std::string TREND{"trend"};

bool isStanza(const std::string& name, const std::string& stanza) {
    return name == stanza || name.compare(0, stanza.length() + 1, stanza + '.') == 0;
}

void warnUnknownSettings(const boost::property_tree::ptree& section,
                         const std::string& stanza,
                         const TStrSet& known) {
    for (const auto& setting : section) {
        if (known.count(setting.first) == 0) {
            LOG_WARN(<< "Ignoring unknown setting '" << setting.first
                     << "' in [" << stanza << "]");
        }
    }
}

template<typename FIELDTYPE>
bool processSetting(const boost::property_tree::ptree& section,
                    const std::string& name,
                    FIELDTYPE& value) {
    auto valueStr = section.get_optional<std::string>(name);
    if (!valueStr) {
        LOG_DEBUG(<< "Using default value (" << value << ") for unspecified setting " << name);
        return true;
    }
    std::string trimmed{*valueStr};
    core::CStreamUtils::trimWhitespace(trimmed);
    // lexical_cast wraps negative values for unsigned types
    if (std::is_unsigned<FIELDTYPE>::value && trimmed.find('-') != std::string::npos) {
        LOG_ERROR(<< "Invalid value for setting " << name << " : " << *valueStr);
        return false;
    }
    try {
        value = boost::lexical_cast<FIELDTYPE>(trimmed);
    } catch (const boost::bad_lexical_cast&) {
        LOG_ERROR(<< "Invalid value for setting " << name << " : " << *valueStr);
        return false;
    }
    return true;
}

bool processParameter(const boost::property_tree::ptree& section,
                      const std::string& name,
                      transforms::CParameter& value) {
    auto valueStr = section.get_optional<std::string>(name);
    if (!valueStr) {
        LOG_DEBUG(<< "Using default value (" << value.print()
                  << ") for unspecified setting " << name);
        return true;
    }
    try {
        value = transforms::CParameter::fromString(*valueStr);
    } catch (const core::CInvalidConfiguration& e) {
        LOG_ERROR(<< "Invalid value for setting " << name << " : " << e.what());
        return false;
    }
    return true;
}
}

const std::size_t CPlaceboTestConfig::DEFAULT_DATASETS{1};
const std::size_t CPlaceboTestConfig::DEFAULT_THREADS{0};

CPlaceboTestConfig::CPlaceboTestConfig()
    : m_NumberDatasets{DEFAULT_DATASETS}, m_Threads{DEFAULT_THREADS} {
}

bool CPlaceboTestConfig::init(const std::string& configFile) {
    std::ifstream strm(configFile.c_str());
    if (!strm.is_open()) {
        LOG_ERROR(<< "Error opening config file " << configFile);
        return false;
    }
    return this->init(strm, configFile);
}

bool CPlaceboTestConfig::init(std::istream& strm, const std::string& source) {
    boost::property_tree::ptree propTree;
    try {
        core::CStreamUtils::skipUtf8Bom(strm);
        boost::property_tree::ini_parser::read_ini(strm, propTree);
    } catch (boost::property_tree::ptree_error& e) {
        LOG_ERROR(<< "Error reading config file " << source << " : " << e.what());
        return false;
    }

    *this = CPlaceboTestConfig{};

    for (const auto& stanza : propTree) {
        const std::string& name{stanza.first};
        bool ok{true};
        if (stanza.second.data().empty() == false) {
            LOG_WARN(<< "Ignoring setting '" << name << "' outside any stanza");
        } else if (name == SIMULATION) {
            ok = this->processSimulation(stanza.second);
        } else if (name == PLACEBO) {
            ok = this->processPlacebo(stanza.second);
        } else if (isStanza(name, PERIODIC)) {
            ok = this->processPeriodic(stanza.second);
        } else if (isStanza(name, TREND)) {
            ok = this->processTrend(stanza.second);
        } else {
            LOG_WARN(<< "Ignoring unknown stanza [" << name << "]");
        }
        if (ok == false) {
            LOG_ERROR(<< "Error processing [" << name << "] in config file " << source);
            return false;
        }
    }

    try {
        m_Simulation.validate();
    } catch (const core::CInvalidConfiguration& e) {
        LOG_ERROR(<< "Error processing config file " << source << " : " << e.what());
        return false;
    }
    if (m_NumberDatasets == 0) {
        LOG_ERROR(<< "Error processing config file " << source << " : no datasets");
        return false;
    }

    LOG_DEBUG(<< "Transforms = " << m_Pipeline.print());

    return true;
}

const CPlaceboTestConfig::TSimulationConfig& CPlaceboTestConfig::simulation() const {
    return m_Simulation;
}

std::size_t CPlaceboTestConfig::numberDatasets() const {
    return m_NumberDatasets;
}

std::size_t CPlaceboTestConfig::threads() const {
    return m_Threads;
}

const transforms::CTransformPipeline& CPlaceboTestConfig::pipeline() const {
    return m_Pipeline;
}

data::CDatasetContainer CPlaceboTestConfig::datasets() const {
    data::CDatasetContainer result;
    TSimulationConfig simulation{m_Simulation};
    for (std::size_t i = 0; i < m_NumberDatasets; ++i) {
        simulation.s_Seed = m_Simulation.s_Seed + i;
        result.add(m_Pipeline(data::CDataSimulator::simulate(simulation)));
    }
    return result;
}

bool CPlaceboTestConfig::processSimulation(const boost::property_tree::ptree& section) {
    warnUnknownSettings(section, SIMULATION,
                        {"controls", "pretreatment", "posttreatment", "treated",
                         "mean", "scale", "seed", "datasets"});
    return processSetting(section, "controls", m_Simulation.s_Controls) &&
           processSetting(section, "pretreatment", m_Simulation.s_PreTreatment) &&
           processSetting(section, "posttreatment", m_Simulation.s_PostTreatment) &&
           processSetting(section, "treated", m_Simulation.s_Treated) &&
           processSetting(section, "mean", m_Simulation.s_Mean) &&
           processSetting(section, "scale", m_Simulation.s_Scale) &&
           processSetting(section, "seed", m_Simulation.s_Seed) &&
           processSetting(section, "datasets", m_NumberDatasets);
}

bool CPlaceboTestConfig::processPlacebo(const boost::property_tree::ptree& section) {
    warnUnknownSettings(section, PLACEBO, {"threads"});
    return processSetting(section, "threads", m_Threads);
}

bool CPlaceboTestConfig::processPeriodic(const boost::property_tree::ptree& section) {
    warnUnknownSettings(section, PERIODIC, {"amplitude", "frequency", "shift", "offset"});
    transforms::CPeriodicTransform defaults;
    transforms::CParameter amplitude{defaults.amplitude()};
    transforms::CParameter frequency{defaults.frequency()};
    transforms::CParameter shift{defaults.shift()};
    transforms::CParameter offset{defaults.offset()};
    if (processParameter(section, "amplitude", amplitude) == false ||
        processParameter(section, "frequency", frequency) == false ||
        processParameter(section, "shift", shift) == false ||
        processParameter(section, "offset", offset) == false) {
        return false;
    }
    m_Pipeline.append(transforms::CPeriodicTransform{amplitude, frequency, shift, offset});
    return true;
}

bool CPlaceboTestConfig::processTrend(const boost::property_tree::ptree& section) {
    warnUnknownSettings(section, TREND, {"degree", "coefficient", "intercept"});
    transforms::CTrendTransform defaults;
    int degree{defaults.degree()};
    transforms::CParameter coefficient{defaults.coefficient()};
    transforms::CParameter intercept{defaults.intercept()};
    if (processSetting(section, "degree", degree) == false ||
        processParameter(section, "coefficient", coefficient) == false ||
        processParameter(section, "intercept", intercept) == false) {
        return false;
    }
    try {
        m_Pipeline.append(transforms::CTrendTransform{degree, coefficient, intercept});
    } catch (const core::CInvalidConfiguration& e) {
        LOG_ERROR(<< "Invalid trend : " << e.what());
        return false;
    }
    return true;
}
}
}
