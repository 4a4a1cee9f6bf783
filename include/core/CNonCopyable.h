/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_core_CNonCopyable_h
#define INCLUDED_cval_core_CNonCopyable_h

#include <core/ImportExport.h>

namespace cval {
namespace core {

//! \brief
//! Base for classes which must not be copied.
//!
//! DESCRIPTION:\n
//! Classes for which copying is not allowed should inherit privately
//! from this class.  Used for the process wide singletons (the logger)
//! and for objects owning threads.
//!
class CORE_EXPORT CNonCopyable {
protected:
    CNonCopyable() = default;
    ~CNonCopyable() = default;

public:
    CNonCopyable(const CNonCopyable&) = delete;
    CNonCopyable& operator=(const CNonCopyable&) = delete;
};
}
}

#endif // INCLUDED_cval_core_CNonCopyable_h
