/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <data/CDataset.h>

#include <core/CException.h>
#include <core/CLogger.h>

#include <sstream>
#include <utility>

namespace cval {
namespace data {
namespace {
using TDenseMatrix = CDataset::TDenseMatrix;

TDenseMatrix stack(const TDenseMatrix& top, const TDenseMatrix& bottom) {
    TDenseMatrix result(top.rows() + bottom.rows(), top.cols());
    result.topRows(top.rows()) = top;
    result.bottomRows(bottom.rows()) = bottom;
    return result;
}

void throwShapeMismatch(const std::string& message) {
    LOG_ERROR(<< message);
    throw core::CShapeMismatch{message};
}
}

const core_t::TTime CDataset::DEFAULT_START_TIME{1672531200};
const core_t::TTime CDataset::DEFAULT_TIME_STEP{86400};

CDataset::CDataset(TDenseMatrix Xtr,
                   TDenseMatrix Xte,
                   TDenseMatrix ytr,
                   TDenseMatrix yte,
                   std::string name,
                   core_t::TTime startTime,
                   core_t::TTime timeStep,
                   TOptionalDenseMatrix counterfactual)
    : m_Xtr{std::move(Xtr)}, m_Xte{std::move(Xte)}, m_Ytr{std::move(ytr)},
      m_Yte{std::move(yte)}, m_Name{std::move(name)}, m_StartTime{startTime},
      m_TimeStep{timeStep}, m_Counterfactual{std::move(counterfactual)} {
    this->checkInvariants();
}

const TDenseMatrix& CDataset::Xtr() const {
    return m_Xtr;
}

const TDenseMatrix& CDataset::Xte() const {
    return m_Xte;
}

const TDenseMatrix& CDataset::ytr() const {
    return m_Ytr;
}

const TDenseMatrix& CDataset::yte() const {
    return m_Yte;
}

TDenseMatrix CDataset::controlUnits() const {
    return stack(m_Xtr, m_Xte);
}

TDenseMatrix CDataset::treatedUnits() const {
    return stack(m_Ytr, m_Yte);
}

const CDataset::TOptionalDenseMatrix& CDataset::counterfactual() const {
    return m_Counterfactual;
}

const std::string& CDataset::name() const {
    return m_Name;
}

CDataset CDataset::named(std::string name) const {
    CDataset result{*this};
    result.m_Name = std::move(name);
    return result;
}

core_t::TTime CDataset::startTime() const {
    return m_StartTime;
}

core_t::TTime CDataset::timeStep() const {
    return m_TimeStep;
}

CDataset::TTimeVec CDataset::fullIndex() const {
    TTimeVec result;
    result.reserve(this->nTimePoints());
    for (std::size_t i = 0; i < this->nTimePoints(); ++i) {
        result.push_back(m_StartTime + static_cast<core_t::TTime>(i) * m_TimeStep);
    }
    return result;
}

core_t::TTime CDataset::treatmentTime() const {
    return m_StartTime +
           static_cast<core_t::TTime>(this->nPreInterventionTimePoints()) * m_TimeStep;
}

std::size_t CDataset::nTimePoints() const {
    return this->nPreInterventionTimePoints() + this->nPostInterventionTimePoints();
}

std::size_t CDataset::nPreInterventionTimePoints() const {
    return static_cast<std::size_t>(m_Xtr.rows());
}

std::size_t CDataset::nPostInterventionTimePoints() const {
    return static_cast<std::size_t>(m_Xte.rows());
}

std::size_t CDataset::nUnits() const {
    return static_cast<std::size_t>(m_Xtr.cols());
}

std::size_t CDataset::nTreatedUnits() const {
    return static_cast<std::size_t>(m_Ytr.cols());
}

CDataset CDataset::withPanels(TDenseMatrix Xtr, TDenseMatrix Xte, TDenseMatrix ytr, TDenseMatrix yte) const {
    auto sameShape = [](const TDenseMatrix& lhs, const TDenseMatrix& rhs) {
        return lhs.rows() == rhs.rows() && lhs.cols() == rhs.cols();
    };
    if (sameShape(Xtr, m_Xtr) == false || sameShape(Xte, m_Xte) == false ||
        sameShape(ytr, m_Ytr) == false || sameShape(yte, m_Yte) == false) {
        throwShapeMismatch("replacement panels [" + Xtr.printShape() + ", " +
                           Xte.printShape() + ", " + ytr.printShape() + ", " +
                           yte.printShape() + "] don't match " + this->print());
    }
    return CDataset{std::move(Xtr), std::move(Xte), std::move(ytr),
                    std::move(yte), m_Name,         m_StartTime,
                    m_TimeStep,     m_Counterfactual};
}

CDataset CDataset::dropControlUnit(std::size_t i) const {
    this->checkControlIndex(i, "drop control unit");
    auto j = static_cast<std::ptrdiff_t>(i);
    return CDataset{dropColumn(m_Xtr, j), dropColumn(m_Xte, j), m_Ytr,
                    m_Yte,                m_Name,               m_StartTime,
                    m_TimeStep,           m_Counterfactual};
}

CDataset CDataset::toPlaceboView(std::size_t i) const {
    this->checkControlIndex(i, "placebo view");
    auto j = static_cast<std::ptrdiff_t>(i);
    TDenseMatrix ytr(m_Xtr.rows(), 1);
    ytr.col(0) = m_Xtr.col(j);
    TDenseMatrix yte(m_Xte.rows(), 1);
    yte.col(0) = m_Xte.col(j);
    return CDataset{dropColumn(m_Xtr, j), dropColumn(m_Xte, j),
                    std::move(ytr),       std::move(yte),
                    m_Name,               m_StartTime,
                    m_TimeStep};
}

std::string CDataset::print() const {
    std::ostringstream result;
    result << (m_Name.empty() ? std::string{"<unnamed>"} : m_Name) << " {"
           << "controls = " << this->nUnits() << ", treated = " << this->nTreatedUnits()
           << ", pre = " << this->nPreInterventionTimePoints()
           << ", post = " << this->nPostInterventionTimePoints() << '}';
    return result.str();
}

void CDataset::checkInvariants() const {
    if (m_Xtr.rows() == 0 || m_Xte.rows() == 0) {
        throwShapeMismatch("pre and post intervention periods must both be "
                           "non-empty, got Xtr " +
                           m_Xtr.printShape() + " and Xte " + m_Xte.printShape());
    }
    if (m_Xtr.rows() != m_Ytr.rows()) {
        throwShapeMismatch("Xtr " + m_Xtr.printShape() + " and ytr " +
                           m_Ytr.printShape() + " have different lengths");
    }
    if (m_Xte.rows() != m_Yte.rows()) {
        throwShapeMismatch("Xte " + m_Xte.printShape() + " and yte " +
                           m_Yte.printShape() + " have different lengths");
    }
    if (m_Xtr.cols() != m_Xte.cols()) {
        throwShapeMismatch("Xtr " + m_Xtr.printShape() + " and Xte " +
                           m_Xte.printShape() + " have different unit counts");
    }
    if (m_Ytr.cols() != m_Yte.cols()) {
        throwShapeMismatch("ytr " + m_Ytr.printShape() + " and yte " +
                           m_Yte.printShape() + " have different unit counts");
    }
    if (m_Ytr.cols() == 0) {
        throwShapeMismatch("at least one treated unit is required");
    }
    if (m_Counterfactual != std::nullopt &&
        (m_Counterfactual->rows() != m_Yte.rows() ||
         m_Counterfactual->cols() != m_Yte.cols())) {
        throwShapeMismatch("counterfactual " + m_Counterfactual->printShape() +
                           " and yte " + m_Yte.printShape() + " differ");
    }
    if (m_TimeStep <= 0) {
        throwShapeMismatch("time step must be positive, got " + std::to_string(m_TimeStep));
    }
}

void CDataset::checkControlIndex(std::size_t i, const char* operation) const {
    if (i >= this->nUnits()) {
        std::string message{std::string{operation} + " requested for control unit " +
                            std::to_string(i) + " of " + std::to_string(this->nUnits())};
        LOG_ERROR(<< message);
        throw core::CIndexOutOfRange{message};
    }
}

TDenseMatrix dropColumn(const TDenseMatrix& matrix, std::ptrdiff_t j) {
    TDenseMatrix result(matrix.rows(), matrix.cols() - 1);
    result.leftCols(j) = matrix.leftCols(j);
    result.rightCols(matrix.cols() - j - 1) = matrix.rightCols(matrix.cols() - j - 1);
    return result;
}
}
}
