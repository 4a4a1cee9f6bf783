/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_maths_CLinearAlgebraEigen_h
#define INCLUDED_cval_maths_CLinearAlgebraEigen_h

#include <Eigen/Core>

#include <cstddef>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace cval {
namespace maths {

//! \brief Decorates an Eigen matrix with some useful methods.
//!
//! DESCRIPTION:\n
//! Panels are stored time-major, i.e. one row per time step and one column
//! per unit, in one of these.
template<typename SCALAR>
class CDenseMatrix : public Eigen::Matrix<SCALAR, Eigen::Dynamic, Eigen::Dynamic> {
public:
    using TBase = Eigen::Matrix<SCALAR, Eigen::Dynamic, Eigen::Dynamic>;

public:
    //! Forwarding constructor.
    template<typename... ARGS>
    CDenseMatrix(ARGS&&... args) : TBase(std::forward<ARGS>(args)...) {}

    //! \name Copy and Move Semantics
    //@{
    CDenseMatrix(const CDenseMatrix& other) = default;
    CDenseMatrix(CDenseMatrix&& other) = default;
    CDenseMatrix& operator=(const CDenseMatrix& other) = default;
    CDenseMatrix& operator=(CDenseMatrix&& other) = default;
    // @}

    //! Check if every coefficient is finite.
    bool isFinite() const { return this->allFinite(); }

    //! Get a copy of column \p j as a std::vector.
    std::vector<SCALAR> column(std::ptrdiff_t j) const {
        std::vector<SCALAR> result;
        result.reserve(this->rows());
        for (std::ptrdiff_t i = 0; i < this->rows(); ++i) {
            result.push_back(this->coeff(i, j));
        }
        return result;
    }

    //! Get the shape as "rows x cols".
    std::string printShape() const {
        std::ostringstream result;
        result << this->rows() << 'x' << this->cols();
        return result.str();
    }
};

using TDenseMatrix = CDenseMatrix<double>;
}
}

#endif // INCLUDED_cval_maths_CLinearAlgebraEigen_h
