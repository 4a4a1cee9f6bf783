/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_data_CDataSimulator_h
#define INCLUDED_cval_data_CDataSimulator_h

#include <core/CNonInstantiatable.h>

#include <data/CDataset.h>
#include <data/ImportExport.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace cval {
namespace data {

//! \brief Generates synthetic base panels.
//!
//! DESCRIPTION:\n
//! Every unit is an independent series of normal samples with a shared mean
//! and scale. These are the raw material which the transforms deform before
//! a placebo test is run.
//!
//! IMPLEMENTATION:\n
//! The samples are drawn from a CXorOShiro128Plus generator seeded with the
//! configured seed, column by column, so the same configuration always gives
//! the same panel.
class DATA_EXPORT CDataSimulator : private core::CNonInstantiatable {
public:
    //! \brief The parameters of a simulated panel.
    struct DATA_EXPORT SSimulationConfig {
        //! Check the configuration and throw if it's invalid.
        //!
        //! \throws core::CInvalidConfiguration.
        void validate() const;

        //! The number of control units.
        std::size_t s_Controls{10};
        //! The number of pre intervention time points.
        std::size_t s_PreTreatment{60};
        //! The number of post intervention time points.
        std::size_t s_PostTreatment{30};
        //! The number of treated units.
        std::size_t s_Treated{1};
        double s_Mean{20.0};
        double s_Scale{0.2};
        std::uint64_t s_Seed{123};
    };

public:
    //! Simulate a dataset called \p name.
    //!
    //! \throws core::CInvalidConfiguration if \p config is invalid.
    static CDataset simulate(const SSimulationConfig& config,
                             const std::string& name = std::string{});
};
}
}

#endif // INCLUDED_cval_data_CDataSimulator_h
