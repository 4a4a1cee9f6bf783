/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <data/CDatasetContainer.h>

#include <core/CException.h>
#include <core/CLogger.h>

#include <algorithm>

namespace cval {
namespace data {

CDatasetContainer::CDatasetContainer(const CDataset& dataset) {
    this->add(dataset);
}

CDatasetContainer::CDatasetContainer(const TDatasetVec& datasets) {
    m_Datasets.reserve(datasets.size());
    for (const auto& dataset : datasets) {
        this->add(dataset);
    }
}

void CDatasetContainer::add(const CDataset& dataset) {
    std::string name{dataset.name().empty()
                         ? "Dataset " + std::to_string(m_Datasets.size())
                         : dataset.name()};
    if (this->find(name) != nullptr) {
        LOG_ERROR(<< "Duplicate dataset name '" << name << "'");
        throw core::CInvalidConfiguration{"duplicate dataset name '" + name + "'"};
    }
    m_Datasets.push_back(dataset.name().empty() ? dataset.named(name) : dataset);
}

const CDataset& CDatasetContainer::operator[](std::size_t i) const {
    if (i >= m_Datasets.size()) {
        std::string message{"dataset " + std::to_string(i) + " of " +
                            std::to_string(m_Datasets.size())};
        LOG_ERROR(<< "Requested " << message);
        throw core::CIndexOutOfRange{message};
    }
    return m_Datasets[i];
}

const CDataset* CDatasetContainer::find(const std::string& name) const {
    auto i = std::find_if(m_Datasets.begin(), m_Datasets.end(),
                          [&name](const CDataset& dataset) {
                              return dataset.name() == name;
                          });
    return i == m_Datasets.end() ? nullptr : &(*i);
}

CDatasetContainer::TStrVec CDatasetContainer::names() const {
    TStrVec result;
    result.reserve(m_Datasets.size());
    for (const auto& dataset : m_Datasets) {
        result.push_back(dataset.name());
    }
    return result;
}
}
}
