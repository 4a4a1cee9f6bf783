/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_core_CException_h
#define INCLUDED_cval_core_CException_h

#include <core/ImportExport.h>

#include <stdexcept>
#include <string>

namespace cval {
namespace core {

//! \brief
//! Base class for the errors raised by the validation libraries.
//!
//! DESCRIPTION:\n
//! None of these errors are transient: they are raised at the point
//! of detection and propagate to the caller of the public entry point.
//! The detecting code logs the problem at ERROR level before throwing.
//!
class CORE_EXPORT CException : public std::runtime_error {
public:
    explicit CException(const std::string& what) : std::runtime_error{what} {}
};

//! \brief A parameter, transform or configuration value is out of domain.
class CORE_EXPORT CInvalidConfiguration : public CException {
public:
    explicit CInvalidConfiguration(const std::string& what)
        : CException{"Invalid configuration: " + what} {}
};

//! \brief An index is outside the valid range for the container it addresses.
class CORE_EXPORT CIndexOutOfRange : public CException {
public:
    explicit CIndexOutOfRange(const std::string& what)
        : CException{"Index out of range: " + what} {}
};

//! \brief Matrices which must share a dimension don't.
class CORE_EXPORT CShapeMismatch : public CException {
public:
    explicit CShapeMismatch(const std::string& what)
        : CException{"Shape mismatch: " + what} {}
};
}
}

#endif // INCLUDED_cval_core_CException_h
