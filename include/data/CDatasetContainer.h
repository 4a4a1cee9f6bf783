/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_data_CDatasetContainer_h
#define INCLUDED_cval_data_CDatasetContainer_h

#include <data/CDataset.h>
#include <data/ImportExport.h>

#include <cstddef>
#include <string>
#include <vector>

namespace cval {
namespace data {

//! \brief An ordered collection of uniquely named datasets.
//!
//! DESCRIPTION:\n
//! A dataset without a name is called "Dataset <index>", where index is its
//! position in the container. Names must be unique.
class DATA_EXPORT CDatasetContainer {
public:
    using TDatasetVec = std::vector<CDataset>;
    using TDatasetVecCItr = TDatasetVec::const_iterator;
    using TStrVec = std::vector<std::string>;

public:
    CDatasetContainer() = default;
    //! \throws core::CInvalidConfiguration if names are duplicated.
    explicit CDatasetContainer(const CDataset& dataset);
    //! \throws core::CInvalidConfiguration if names are duplicated.
    explicit CDatasetContainer(const TDatasetVec& datasets);

    //! Append \p dataset naming it if necessary.
    //!
    //! \throws core::CInvalidConfiguration if a dataset with the same
    //! name is already present.
    void add(const CDataset& dataset);

    //! Get the dataset at \p i.
    //!
    //! \throws core::CIndexOutOfRange if \p i is not less than size().
    const CDataset& operator[](std::size_t i) const;

    //! Get the dataset called \p name or null if there isn't one.
    const CDataset* find(const std::string& name) const;

    //! Get the dataset names in order.
    TStrVec names() const;

    std::size_t size() const { return m_Datasets.size(); }
    bool empty() const { return m_Datasets.empty(); }

    TDatasetVecCItr begin() const { return m_Datasets.begin(); }
    TDatasetVecCItr end() const { return m_Datasets.end(); }

private:
    TDatasetVec m_Datasets;
};
}
}

#endif // INCLUDED_cval_data_CDatasetContainer_h
