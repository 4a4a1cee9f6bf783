/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/Concurrency.h>

#include <core/CLogger.h>
#include <core/CStaticThreadPool.h>

#include <exception>
#include <memory>
#include <thread>

namespace cval {
namespace core {
namespace {
//! \brief Runs each task as soon as it is scheduled in the scheduling thread.
class CSerialExecutor final : public CExecutor {
public:
    void schedule(TTask&& task) override { task(); }
    bool busy() const override { return false; }
    void busy(bool) override {}
};

//! \brief Hands tasks to a CStaticThreadPool.
class CThreadPoolExecutor final : public CExecutor {
public:
    explicit CThreadPoolExecutor(std::size_t size) : m_Pool{size} {}

    void schedule(TTask&& task) override { m_Pool.schedule(std::move(task)); }
    bool busy() const override { return m_Pool.busy(); }
    void busy(bool value) override { m_Pool.busy(value); }
    std::size_t size() const { return m_Pool.size(); }

private:
    CStaticThreadPool m_Pool;
};

using TExecutorUPtr = std::unique_ptr<CExecutor>;

TExecutorUPtr defaultExecutor{std::make_unique<CSerialExecutor>()};
std::size_t defaultThreadPoolSize{0};

void resetDefaultExecutor() {
    // Destroying the pool joins its threads so do this before replacing it.
    defaultExecutor.reset();
    defaultExecutor = std::make_unique<CSerialExecutor>();
    defaultThreadPoolSize = 0;
}
}

void startDefaultAsyncExecutor(std::size_t threadPoolSize) {
    resetDefaultExecutor();

    if (threadPoolSize == 0) {
        threadPoolSize = std::thread::hardware_concurrency();
        if (threadPoolSize == 0) {
            LOG_ERROR(<< "Unable to determine the hardware concurrency: running serially");
            return;
        }
    }
    if (threadPoolSize < 2) {
        LOG_DEBUG(<< "Default async executor runs serially");
        return;
    }

    try {
        auto executor = std::make_unique<CThreadPoolExecutor>(threadPoolSize);
        defaultThreadPoolSize = executor->size();
        defaultExecutor = std::move(executor);
    } catch (const std::exception& e) {
        LOG_ERROR(<< "Failed to start a thread pool: " << e.what() << ". Running serially");
        resetDefaultExecutor();
        return;
    }
    LOG_DEBUG(<< "Default async executor uses " << defaultThreadPoolSize << " threads");
}

void stopDefaultAsyncExecutor() {
    resetDefaultExecutor();
}

std::size_t defaultAsyncThreadPoolSize() {
    return defaultThreadPoolSize;
}

CExecutor& defaultAsyncExecutor() {
    return *defaultExecutor;
}

bool get_conjunction_of_all(std::vector<future<bool>>& futures) {
    wait_for_all(futures);
    bool result{true};
    std::exception_ptr firstException;
    for (auto& future : futures) {
        try {
            result = future.get() && result;
        } catch (...) {
            if (firstException == nullptr) {
                firstException = std::current_exception();
            }
        }
    }
    if (firstException != nullptr) {
        std::rethrow_exception(firstException);
    }
    return result;
}

namespace concurrency_detail {
CDefaultAsyncExecutorBusyForScope::CDefaultAsyncExecutorBusyForScope()
    : m_WasBusy{defaultAsyncExecutor().busy()} {
    if (m_WasBusy == false) {
        defaultAsyncExecutor().busy(true);
    }
}

CDefaultAsyncExecutorBusyForScope::~CDefaultAsyncExecutorBusyForScope() {
    if (m_WasBusy == false) {
        defaultAsyncExecutor().busy(false);
    }
}

bool CDefaultAsyncExecutorBusyForScope::wasBusy() const {
    return m_WasBusy;
}

void noop(double) {
}
}
}
}
