/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_core_CoreTypes_h
#define INCLUDED_cval_core_CoreTypes_h

#include <ctime>

namespace cval {
namespace core_t {

//! Times are seconds since the epoch.
using TTime = std::time_t;
}
}

#endif // INCLUDED_cval_core_CoreTypes_h
