/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_core_CStaticThreadPool_h
#define INCLUDED_cval_core_CStaticThreadPool_h

#include <core/ImportExport.h>

#include <boost/any.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace cval {
namespace core {

//! \brief A minimal fixed size thread pool for implementing the default
//! async executor.
//!
//! IMPLEMENTATION:\n
//! This purposely has very limited interface and is intended to mainly support
//! CThreadPoolExecutor which provides the mechanism by which we expose the thread
//! pool to the rest of the code via calls core::async.
//!
//! All workers pop from a single queue guarded by a mutex. The tasks we run are
//! whole placebo model fits so contention on the queue is negligible.
class CORE_EXPORT CStaticThreadPool {
public:
    using TTask = std::packaged_task<boost::any()>;

public:
    explicit CStaticThreadPool(std::size_t size);

    ~CStaticThreadPool();

    CStaticThreadPool(const CStaticThreadPool&) = delete;
    CStaticThreadPool(CStaticThreadPool&&) = delete;
    CStaticThreadPool& operator=(const CStaticThreadPool&) = delete;
    CStaticThreadPool& operator=(CStaticThreadPool&&) = delete;

    //! Get the number of threads in the pool.
    std::size_t size() const;

    //! Schedule a task to be executed by a thread in the pool.
    //!
    //! \note Any exception thrown by \p task is captured in its future.
    void schedule(TTask&& task);

    //! Check if the thread pool has been marked as busy.
    bool busy() const;

    //! Mark the thread pool as busy or not.
    void busy(bool busy);

private:
    using TTaskQueue = std::deque<TTask>;
    using TThreadVec = std::vector<std::thread>;

private:
    void shutdown();
    void worker();

private:
    bool m_Done{false};
    std::atomic_bool m_Busy;
    std::mutex m_Mutex;
    std::condition_variable m_TaskAvailable;
    TTaskQueue m_TaskQueue;
    TThreadVec m_Pool;
};
}
}

#endif // INCLUDED_cval_core_CStaticThreadPool_h
