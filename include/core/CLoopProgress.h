/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_core_CLoopProgress_h
#define INCLUDED_cval_core_CLoopProgress_h

#include <core/ImportExport.h>

#include <cstddef>
#include <functional>
#include <iterator>

namespace cval {
namespace core {

//! \brief Manages recording the progress of a loop.
//!
//! DESCRIPTION:\n
//! Recording progress on every iteration of a loop is rarely needed and in
//! parallel code causes contention on whatever the callback updates. This
//! breaks the progress reporting of a loop into a fixed number of steps.
//!
//! Example:
//! \code{cpp}
//! double progress{0.0};
//! CLoopProgress loopProgress{n, [&progress](double p) { progress += p; }};
//! for (std::size_t i = 0; i < n; ++i, loopProgress.increment()) {
//!   ...
//! }
//! std::cout << progress << std::endl;
//! \endcode
//!
//! Output: 1
//!
//! IMPLEMENTATION:\n
//! The number of steps is chosen to be a power of 2 so that the progress per
//! step is exactly representable as an IEEE floating point type. This means in
//! normal usage the total progress will be exactly the scale at the end of a loop.
class CORE_EXPORT CLoopProgress {
public:
    using TProgressCallback = std::function<void(double)>;

public:
    CLoopProgress();
    template<typename ITR>
    CLoopProgress(ITR begin, ITR end, const TProgressCallback& recordProgress = noop, double scale = 1.0)
        : CLoopProgress(static_cast<std::size_t>(std::distance(begin, end)),
                        recordProgress,
                        scale) {}
    CLoopProgress(std::size_t range,
                  const TProgressCallback& recordProgress = noop,
                  double scale = 1.0,
                  std::size_t steps = 32);

    //! Attach a new progress monitor callback.
    void progressCallback(const TProgressCallback& recordProgress);

    //! Increment the progress by \p i.
    void increment(std::size_t i = 1);

private:
    static void noop(double);

private:
    std::size_t m_Range;
    std::size_t m_Steps;
    double m_StepProgress;
    std::size_t m_Pos = 0;
    std::size_t m_LastProgress = 0;
    TProgressCallback m_RecordProgress;
};
}
}

#endif // INCLUDED_cval_core_CLoopProgress_h
