/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_validation_CPlaceboTestResult_h
#define INCLUDED_cval_validation_CPlaceboTestResult_h

#include <validation/CEffect.h>
#include <validation/ImportExport.h>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace cval {
namespace validation {

//! \brief The per control unit results of a placebo test.
//!
//! DESCRIPTION:\n
//! Holds, for each (model, dataset) pair in the order they were evaluated,
//! the result of the model on every placebo view of the dataset. These
//! are summarised by the mean percentage effect, its population standard
//! deviation and standard error, and the two-sided significance of a one
//! sample t-test against zero effect.
//!
//! If a pair has a single result then its standard deviation and error are
//! zero and its significance is NaN since there is no sample variance.
class VALIDATION_EXPORT CPlaceboTestResult {
public:
    using TDoubleVec = std::vector<double>;
    using TStrVec = std::vector<std::string>;
    using TStrStrPr = std::pair<std::string, std::string>;
    using TResultVec = std::vector<CResult>;
    using TStrStrPrResultVecPr = std::pair<TStrStrPr, TResultVec>;
    using TStrStrPrResultVecPrVec = std::vector<TStrStrPrResultVecPr>;
    using TStrStrPrResultVecPrVecCItr = TStrStrPrResultVecPrVec::const_iterator;

    //! \brief One row of the summary table.
    struct VALIDATION_EXPORT SSummary {
        std::string s_Model;
        std::string s_Dataset;
        double s_Effect;
        double s_StandardDeviation;
        double s_StandardError;
        double s_PValue;
    };

    using TSummaryVec = std::vector<SSummary>;

public:
    //! The summary table column names.
    static const TStrVec COLUMNS;

public:
    //! Add the results for \p model on \p dataset.
    //!
    //! \throws core::CInvalidConfiguration if there are already results
    //! for this pair.
    void add(const std::string& model, const std::string& dataset, TResultVec results);

    //! Get the results for \p model on \p dataset.
    //!
    //! \throws core::CIndexOutOfRange if there are none.
    const TResultVec& results(const std::string& model, const std::string& dataset) const;

    //! Get the percentage effects for \p model on \p dataset.
    TDoubleVec effects(const std::string& model, const std::string& dataset) const;

    std::size_t size() const { return m_Results.size(); }
    bool empty() const { return m_Results.empty(); }
    TStrStrPrResultVecPrVecCItr begin() const { return m_Results.begin(); }
    TStrStrPrResultVecPrVecCItr end() const { return m_Results.end(); }

    //! Summarise \p effects for one (model, dataset) pair.
    static SSummary summarise(const std::string& model,
                              const std::string& dataset,
                              const TDoubleVec& effects);

    //! Summarise every (model, dataset) pair.
    TSummaryVec summarise() const;

    //! Check the standard deviation and error of every row of \p summary
    //! are non-negative, or if \p strict is true positive, and that the
    //! effect is finite.
    //!
    //! \return False, having logged each problem, if any row is invalid.
    static bool validate(const TSummaryVec& summary, bool strict);

    //! Write \p summary as CSV with a header row.
    static bool writeCsv(const TSummaryVec& summary, std::ostream& output);

    //! Summarise and write as CSV.
    bool writeCsv(std::ostream& output) const;

private:
    TStrStrPrResultVecPrVec m_Results;
};
}
}

#endif // INCLUDED_cval_validation_CPlaceboTestResult_h
