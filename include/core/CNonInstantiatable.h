/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_core_CNonInstantiatable_h
#define INCLUDED_cval_core_CNonInstantiatable_h

#include <core/ImportExport.h>

namespace cval {
namespace core {

//! \brief
//! Base for classes which only have static members.
//!
//! DESCRIPTION:\n
//! Collections of static functions, such as the statistical tests,
//! should inherit privately from this class.
//!
class CORE_EXPORT CNonInstantiatable {
public:
    CNonInstantiatable() = delete;
    CNonInstantiatable(const CNonInstantiatable&) = delete;
};
}
}

#endif // INCLUDED_cval_core_CNonInstantiatable_h
