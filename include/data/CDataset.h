/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_data_CDataset_h
#define INCLUDED_cval_data_CDataset_h

#include <core/CoreTypes.h>

#include <maths/CLinearAlgebraEigen.h>

#include <data/ImportExport.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cval {
namespace data {

//! \brief A panel of time series split into control and treated units
//! and into pre and post intervention periods.
//!
//! DESCRIPTION:\n
//! The panel is held in four time-major matrices, one row per time step
//! and one column per unit:
//!   -# Xtr the pre intervention control units,
//!   -# Xte the post intervention control units,
//!   -# ytr the pre intervention treated units,
//!   -# yte the post intervention treated units.
//!
//! The constructor checks that the pre (post) matrices have the same number
//! of rows, that both periods are non-empty, that the control (treated)
//! matrices have the same number of columns and that there is at least one
//! treated unit. A CDataset is never modified after construction: transforms
//! and placebo views build new instances.
//!
//! Each row is stamped with a time, starting at the start time and advancing
//! by the time step, so the intervention happens at the time of the first
//! post intervention row.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Copying a CDataset copies its matrices. The panels we validate are small
//! and value semantics make it impossible for a placebo view to alias its
//! source.
class DATA_EXPORT CDataset {
public:
    using TDenseMatrix = maths::TDenseMatrix;
    using TOptionalDenseMatrix = std::optional<TDenseMatrix>;
    using TTimeVec = std::vector<core_t::TTime>;

public:
    //! 2023-01-01T00:00:00Z.
    static const core_t::TTime DEFAULT_START_TIME;
    //! One day.
    static const core_t::TTime DEFAULT_TIME_STEP;

public:
    //! \throws core::CShapeMismatch if the matrices are inconsistent.
    CDataset(TDenseMatrix Xtr,
             TDenseMatrix Xte,
             TDenseMatrix ytr,
             TDenseMatrix yte,
             std::string name = std::string{},
             core_t::TTime startTime = DEFAULT_START_TIME,
             core_t::TTime timeStep = DEFAULT_TIME_STEP,
             TOptionalDenseMatrix counterfactual = TOptionalDenseMatrix{});

    //! \name Panel Slots
    //@{
    const TDenseMatrix& Xtr() const;
    const TDenseMatrix& Xte() const;
    const TDenseMatrix& ytr() const;
    const TDenseMatrix& yte() const;
    //! Xtr stacked on Xte.
    TDenseMatrix controlUnits() const;
    //! ytr stacked on yte.
    TDenseMatrix treatedUnits() const;
    //! The post intervention treated values had there been no intervention.
    const TOptionalDenseMatrix& counterfactual() const;
    //@}

    //! The dataset name. This may be empty.
    const std::string& name() const;
    //! Get a copy of this dataset called \p name.
    CDataset named(std::string name) const;

    //! \name Time Index
    //@{
    core_t::TTime startTime() const;
    core_t::TTime timeStep() const;
    //! One time per row of the full span.
    TTimeVec fullIndex() const;
    //! The time of the first post intervention row.
    core_t::TTime treatmentTime() const;
    //@}

    //! \name Dimensions
    //@{
    std::size_t nTimePoints() const;
    std::size_t nPreInterventionTimePoints() const;
    std::size_t nPostInterventionTimePoints() const;
    //! The number of control units.
    std::size_t nUnits() const;
    std::size_t nTreatedUnits() const;
    //@}

    //! Build a dataset with the same name, time index and counterfactual
    //! from new panel slots.
    //!
    //! \throws core::CShapeMismatch if the new slots don't have the shapes
    //! of this dataset's.
    CDataset withPanels(TDenseMatrix Xtr, TDenseMatrix Xte, TDenseMatrix ytr, TDenseMatrix yte) const;

    //! Get a copy of this dataset without control unit \p i.
    //!
    //! \throws core::CIndexOutOfRange if \p i is not less than nUnits().
    CDataset dropControlUnit(std::size_t i) const;

    //! Get the leave-one-out view in which control unit \p i is the only
    //! treated unit and the remaining control units are the controls.
    //!
    //! The view keeps the name and time index of this dataset and has no
    //! counterfactual.
    //!
    //! \throws core::CIndexOutOfRange if \p i is not less than nUnits().
    CDataset toPlaceboView(std::size_t i) const;

    //! Get a short description of the dataset.
    std::string print() const;

private:
    //! Check the slot shapes and throw if they are inconsistent.
    void checkInvariants() const;

    //! Check \p i indexes a control unit and throw if not.
    void checkControlIndex(std::size_t i, const char* operation) const;

private:
    TDenseMatrix m_Xtr;
    TDenseMatrix m_Xte;
    TDenseMatrix m_Ytr;
    TDenseMatrix m_Yte;
    std::string m_Name;
    core_t::TTime m_StartTime;
    core_t::TTime m_TimeStep;
    TOptionalDenseMatrix m_Counterfactual;
};

//! Drop column \p j from \p matrix.
DATA_EXPORT
maths::TDenseMatrix dropColumn(const maths::TDenseMatrix& matrix, std::ptrdiff_t j);
}
}

#endif // INCLUDED_cval_data_CDataset_h
