/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_test_CTestDatasets_h
#define INCLUDED_cval_test_CTestDatasets_h

#include <core/CNonInstantiatable.h>

#include <data/CDataset.h>

#include <test/ImportExport.h>

#include <cstddef>
#include <string>

namespace cval {
namespace test {

//! \brief Small hand-built panels for unit tests.
class TEST_EXPORT CTestDatasets : private core::CNonInstantiatable {
public:
    //! Every value of every unit is \p level.
    static data::CDataset flat(std::size_t controls,
                               std::size_t pre,
                               std::size_t post,
                               std::size_t treated = 1,
                               double level = 1.0,
                               const std::string& name = std::string{});

    //! Each value identifies its unit and time. Control unit j has value
    //! 1000 (j + 1) + t at time t and treated unit k has value
    //! -1000 (k + 1) - t.
    static data::CDataset indexed(std::size_t controls,
                                  std::size_t pre,
                                  std::size_t post,
                                  std::size_t treated = 1,
                                  const std::string& name = std::string{});

    //! The value indexed() uses for control unit \p j at time \p t.
    static double controlValue(std::size_t j, std::size_t t);

    //! The value indexed() uses for treated unit \p k at time \p t.
    static double treatedValue(std::size_t k, std::size_t t);
};
}
}

#endif // INCLUDED_cval_test_CTestDatasets_h
