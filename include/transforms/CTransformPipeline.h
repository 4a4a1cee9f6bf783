/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_transforms_CTransformPipeline_h
#define INCLUDED_cval_transforms_CTransformPipeline_h

#include <transforms/CTransform.h>
#include <transforms/ImportExport.h>

#include <cstddef>
#include <vector>

namespace cval {
namespace transforms {

//! \brief An ordered sequence of transforms applied one after another.
//!
//! DESCRIPTION:\n
//! A pipeline is itself a transform. Appending a pipeline appends its
//! members, so pipelines never nest and composition is associative. An
//! empty pipeline is the identity.
class TRANSFORMS_EXPORT CTransformPipeline : public CTransform {
public:
    static const std::string NAME;

public:
    CTransformPipeline() = default;
    CTransformPipeline(const CTransformPipeline& other);
    CTransformPipeline(CTransformPipeline&&) = default;
    CTransformPipeline& operator=(const CTransformPipeline& other);
    CTransformPipeline& operator=(CTransformPipeline&&) = default;

    //! Append a copy of \p transform.
    CTransformPipeline& append(const CTransform& transform);

    data::CDataset apply(const data::CDataset& dataset) const override;
    std::string name() const override;
    std::string print() const override;
    TTransformUPtr clone() const override;

    std::size_t size() const { return m_Transforms.size(); }
    bool empty() const { return m_Transforms.empty(); }
    const CTransform& operator[](std::size_t i) const { return *m_Transforms[i]; }

private:
    using TTransformUPtrVec = std::vector<TTransformUPtr>;

private:
    TTransformUPtrVec m_Transforms;
};
}
}

#endif // INCLUDED_cval_transforms_CTransformPipeline_h
