/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_test_CBoostTestJUnitOutput_h
#define INCLUDED_cval_test_CBoostTestJUnitOutput_h

#include <test/ImportExport.h>

#include <fstream>

namespace cval {
namespace test {

//! \brief
//! Add JUnit output to default test output.
//!
//! DESCRIPTION:\n
//! A custom Boost.Test init function which adds JUnit output, written
//! to junit_results.xml in the working directory of the test executable,
//! alongside the console output.
class TEST_EXPORT CBoostTestJUnitOutput {
public:
    CBoostTestJUnitOutput() = delete;
    CBoostTestJUnitOutput(const CBoostTestJUnitOutput&) = delete;
    CBoostTestJUnitOutput& operator=(const CBoostTestJUnitOutput&) = delete;

    static bool init();

private:
    static std::ofstream ms_JUnitOutputFile;
};
}
}

#endif // INCLUDED_cval_test_CBoostTestJUnitOutput_h
