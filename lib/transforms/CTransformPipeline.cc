/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <transforms/CTransformPipeline.h>

#include <core/CLogger.h>

#include <memory>

namespace cval {
namespace transforms {

const std::string CTransformPipeline::NAME{"Pipeline"};

CTransformPipeline::CTransformPipeline(const CTransformPipeline& other) {
    this->append(other);
}

CTransformPipeline& CTransformPipeline::operator=(const CTransformPipeline& other) {
    if (this != &other) {
        CTransformPipeline copy{other};
        *this = std::move(copy);
    }
    return *this;
}

CTransformPipeline& CTransformPipeline::append(const CTransform& transform) {
    const auto* pipeline = dynamic_cast<const CTransformPipeline*>(&transform);
    if (pipeline == nullptr) {
        m_Transforms.push_back(transform.clone());
    } else if (pipeline != this) {
        m_Transforms.reserve(m_Transforms.size() + pipeline->size());
        for (const auto& member : pipeline->m_Transforms) {
            m_Transforms.push_back(member->clone());
        }
    } else {
        std::size_t n{m_Transforms.size()};
        for (std::size_t i = 0; i < n; ++i) {
            m_Transforms.push_back(m_Transforms[i]->clone());
        }
    }
    return *this;
}

data::CDataset CTransformPipeline::apply(const data::CDataset& dataset) const {
    data::CDataset result{dataset};
    for (const auto& transform : m_Transforms) {
        LOG_TRACE(<< "Applying " << transform->name());
        result = transform->apply(result);
    }
    return result;
}

std::string CTransformPipeline::name() const {
    return NAME;
}

std::string CTransformPipeline::print() const {
    std::string result{NAME + '['};
    for (std::size_t i = 0; i < m_Transforms.size(); ++i) {
        result += (i > 0 ? " -> " : "") + m_Transforms[i]->print();
    }
    return result + ']';
}

CTransform::TTransformUPtr CTransformPipeline::clone() const {
    return std::make_unique<CTransformPipeline>(*this);
}
}
}
