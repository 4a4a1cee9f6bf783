/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_core_Concurrency_h
#define INCLUDED_cval_core_Concurrency_h

#include <core/CLoopProgress.h>
#include <core/ImportExport.h>

#include <boost/any.hpp>

#include <algorithm>
#include <functional>
#include <future>
#include <type_traits>
#include <vector>

namespace cval {
namespace core {

//! \brief Somewhere to run tasks.
//!
//! DESCRIPTION:\n
//! Tasks are type erased to return boost::any so a single queue can hold
//! all of them. The busy flag marks an executor which is currently running
//! a parallel loop so nested loops know to run in their caller's thread.
class CORE_EXPORT CExecutor {
public:
    using TTask = std::packaged_task<boost::any()>;

public:
    virtual ~CExecutor() = default;

    //! Arrange for \p task to be run.
    virtual void schedule(TTask&& task) = 0;
    virtual bool busy() const = 0;
    virtual void busy(bool value) = 0;
};

//! Replace the default executor with a thread pool of \p threadPoolSize
//! threads.
//!
//! A size of zero means one thread per hardware thread. Sizes less than two
//! leave execution serial. Call this from single threaded code only.
CORE_EXPORT
void startDefaultAsyncExecutor(std::size_t threadPoolSize = 0);

//! Join the default thread pool's threads and go back to running tasks in
//! the calling thread. Call this from single threaded code only.
CORE_EXPORT
void stopDefaultAsyncExecutor();

//! The executor used by parallel_for_each.
CORE_EXPORT
CExecutor& defaultAsyncExecutor();

//! The number of threads in the default executor, zero if it is serial.
CORE_EXPORT
std::size_t defaultAsyncThreadPoolSize();

namespace concurrency_detail {
template<typename R>
struct SInvokeToAny {
    template<typename F>
    static boost::any invoke(F& f) {
        return boost::any{f()};
    }
};
template<>
struct SInvokeToAny<void> {
    template<typename F>
    static boost::any invoke(F& f) {
        f();
        return boost::any{};
    }
};

//! \brief Recovers the type of a task's result from its std::future.
template<typename R>
class CTypedFuture {
public:
    CTypedFuture() = default;
    CTypedFuture(std::future<boost::any>&& future) : m_Future{std::move(future)} {}

    bool valid() const { return m_Future.valid(); }
    void wait() const { m_Future.wait(); }
    //! \note Rethrows anything the task threw.
    R get() { return boost::any_cast<R>(m_Future.get()); }

private:
    std::future<boost::any> m_Future;
};
}

template<typename R>
using future = concurrency_detail::CTypedFuture<R>;

//! Run f(args...) on \p executor.
//!
//! The arguments are copied, or moved if they are rvalues, into the task.
//! An exception thrown by f is rethrown by the returned future's get.
//!
//! \warning A task which waits on another task scheduled on the same pool
//! can deadlock. Use parallel_for_each for nested parallelism.
template<typename FUNCTION, typename... ARGS>
future<std::invoke_result_t<std::decay_t<FUNCTION>, std::decay_t<ARGS>...>>
async(CExecutor& executor, FUNCTION&& f, ARGS&&... args) {
    using TResult = std::invoke_result_t<std::decay_t<FUNCTION>, std::decay_t<ARGS>...>;

    auto bound = std::bind<TResult>(std::forward<FUNCTION>(f), std::forward<ARGS>(args)...);
    CExecutor::TTask task{[bound_ = std::move(bound)]() mutable {
        return concurrency_detail::SInvokeToAny<TResult>::invoke(bound_);
    }};
    future<TResult> result{task.get_future()};
    executor.schedule(std::move(task));
    return result;
}

//! Block until every one of \p futures is ready.
template<typename T>
void wait_for_all(const std::vector<future<T>>& futures) {
    for (const auto& future : futures) {
        future.wait();
    }
}

//! Wait for all \p futures and then return true if every one holds true.
//!
//! \note The first exception any of them holds is rethrown, but only once
//! all have finished.
CORE_EXPORT
bool get_conjunction_of_all(std::vector<future<bool>>& futures);

namespace concurrency_detail {
//! \brief Marks the default executor busy for the lifetime of the object
//! unless it already was.
class CORE_EXPORT CDefaultAsyncExecutorBusyForScope {
public:
    CDefaultAsyncExecutorBusyForScope();
    ~CDefaultAsyncExecutorBusyForScope();

    CDefaultAsyncExecutorBusyForScope(const CDefaultAsyncExecutorBusyForScope&) = delete;
    CDefaultAsyncExecutorBusyForScope& operator=(const CDefaultAsyncExecutorBusyForScope&) = delete;

    bool wasBusy() const;

private:
    bool m_WasBusy;
};

CORE_EXPORT
void noop(double);
}

//! Call \p f on every index in [\p start, \p end) using the default executor.
//!
//! DESCRIPTION:\n
//! The range is split into \p partitions contiguous blocks of near equal
//! size and each block is visited in order by its own copy of \p f. The
//! copies are returned in block order so any state they accumulate can be
//! combined by the caller. If there is only one block, or the default
//! executor is already running a parallel loop, the loop runs in the
//! calling thread with the single copy.
//!
//! \param[in] recordProgress Receives fractional progress which sums to one.
//! It can be called concurrently from different threads.
//! \note f must be copy constructible and its copies safe to call from
//! different threads.
//! \note Rethrows the first exception thrown by any copy of f once every
//! block has finished.
template<typename FUNCTION>
std::vector<std::decay_t<FUNCTION>>
parallel_for_each(std::size_t partitions,
                  std::size_t start,
                  std::size_t end,
                  FUNCTION&& f,
                  const std::function<void(double)>& recordProgress = concurrency_detail::noop) {

    using TFunctionVec = std::vector<std::decay_t<FUNCTION>>;

    if (end <= start) {
        recordProgress(1.0);
        return TFunctionVec{std::forward<FUNCTION>(f)};
    }

    std::size_t size{end - start};
    partitions = std::min(partitions, size);

    concurrency_detail::CDefaultAsyncExecutorBusyForScope scope;

    if (partitions < 2 || scope.wasBusy()) {
        CLoopProgress progress{size, recordProgress};
        for (std::size_t i = start; i < end; ++i, progress.increment()) {
            f(i);
        }
        return TFunctionVec{std::forward<FUNCTION>(f)};
    }

    TFunctionVec functions(partitions, f);
    std::vector<future<bool>> blocks;
    blocks.reserve(partitions);

    // The first size % partitions blocks get one extra index.
    std::size_t blockSize{size / partitions};
    std::size_t remainder{size % partitions};
    for (std::size_t i = 0, blockStart = start; i < partitions; ++i) {
        std::size_t blockEnd{blockStart + blockSize + (i < remainder ? 1 : 0)};
        CLoopProgress progress{blockEnd - blockStart, recordProgress,
                               static_cast<double>(blockEnd - blockStart) /
                                   static_cast<double>(size)};
        auto& function = functions[i];
        blocks.push_back(async(defaultAsyncExecutor(),
                               [&function, progress, blockStart, blockEnd]() mutable {
                                   for (std::size_t j = blockStart; j < blockEnd;
                                        ++j, progress.increment()) {
                                       function(j);
                                   }
                                   return true;
                               }));
        blockStart = blockEnd;
    }

    get_conjunction_of_all(blocks);

    return functions;
}

//! Overload which uses one partition per default executor thread.
template<typename FUNCTION>
std::vector<std::decay_t<FUNCTION>>
parallel_for_each(std::size_t start,
                  std::size_t end,
                  FUNCTION&& f,
                  const std::function<void(double)>& recordProgress = concurrency_detail::noop) {
    return parallel_for_each(defaultAsyncThreadPoolSize(), start, end,
                             std::forward<FUNCTION>(f), recordProgress);
}
}
}

#endif // INCLUDED_cval_core_Concurrency_h
