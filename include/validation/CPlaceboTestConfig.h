/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_validation_CPlaceboTestConfig_h
#define INCLUDED_cval_validation_CPlaceboTestConfig_h

#include <data/CDataSimulator.h>
#include <data/CDatasetContainer.h>

#include <transforms/CTransformPipeline.h>

#include <validation/ImportExport.h>

#include <boost/property_tree/ptree_fwd.hpp>

#include <cstddef>
#include <iosfwd>
#include <string>

namespace cval {
namespace validation {

//! \brief The configuration of a placebo test run.
//!
//! DESCRIPTION:\n
//! Read from an INI file of the form
//! \code
//!   [simulation]
//!   controls = 10
//!   pretreatment = 60
//!   posttreatment = 30
//!   treated = 1
//!   mean = 20
//!   scale = 0.2
//!   seed = 123
//!   datasets = 1
//!
//!   [periodic]
//!   amplitude = 2
//!   frequency = 3
//!
//!   [trend]
//!   coefficient = 0.05
//!   intercept = normal(0, 1) @ 42
//!
//!   [placebo]
//!   threads = 4
//! \endcode
//!
//! The periodic and trend stanzas are optional and repeatable, a repeat
//! being named with a suffix such as [periodic.2]. Their transforms are
//! applied in file order. Parameter values are either numbers or
//! distributions with an optional seed, see CParameter. Settings which
//! are missing take their default values.
//!
//! Dataset i of the run is simulated with seed plus i.
//!
//! A threads value of 0 uses one thread per hardware thread and 1 runs
//! the trials serially.
class VALIDATION_EXPORT CPlaceboTestConfig {
public:
    using TSimulationConfig = data::CDataSimulator::SSimulationConfig;

public:
    static const std::size_t DEFAULT_DATASETS;
    static const std::size_t DEFAULT_THREADS;

public:
    CPlaceboTestConfig();

    //! Initialise from the INI file \p configFile.
    bool init(const std::string& configFile);

    //! Initialise from INI text read from \p strm.
    bool init(std::istream& strm, const std::string& source);

    const TSimulationConfig& simulation() const;
    std::size_t numberDatasets() const;
    std::size_t threads() const;
    const transforms::CTransformPipeline& pipeline() const;

    //! Simulate the configured datasets and apply the transforms.
    data::CDatasetContainer datasets() const;

private:
    bool processSimulation(const boost::property_tree::ptree& section);
    bool processPlacebo(const boost::property_tree::ptree& section);
    bool processPeriodic(const boost::property_tree::ptree& section);
    bool processTrend(const boost::property_tree::ptree& section);

private:
    TSimulationConfig m_Simulation;
    std::size_t m_NumberDatasets;
    std::size_t m_Threads;
    transforms::CTransformPipeline m_Pipeline;
};
}
}

#endif // INCLUDED_cval_validation_CPlaceboTestConfig_h
