/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStaticThreadPool.h>

#include <core/CLogger.h>

#include <algorithm>
#include <system_error>

namespace cval {
namespace core {
namespace {
std::size_t computeSize(std::size_t hint) {
    std::size_t bound{std::thread::hardware_concurrency()};
    std::size_t size{bound > 0 ? std::min(hint, bound) : hint};
    return std::max(size, std::size_t{1});
}
}

CStaticThreadPool::CStaticThreadPool(std::size_t size) : m_Busy{false} {
    size = computeSize(size);
    m_Pool.reserve(size);
    for (std::size_t id = 0; id < size; ++id) {
        try {
            m_Pool.emplace_back([this] { this->worker(); });
        } catch (const std::system_error& e) {
            LOG_ERROR(<< "Failed to start worker " << id << ": " << e.what());
            this->shutdown();
            throw;
        }
    }
    LOG_TRACE(<< "Started thread pool with " << size << " threads");
}

CStaticThreadPool::~CStaticThreadPool() {
    this->shutdown();
}

std::size_t CStaticThreadPool::size() const {
    return m_Pool.size();
}

void CStaticThreadPool::schedule(TTask&& task) {
    {
        std::unique_lock<std::mutex> lock{m_Mutex};
        m_TaskQueue.push_back(std::move(task));
    }
    m_TaskAvailable.notify_one();
}

bool CStaticThreadPool::busy() const {
    return m_Busy.load();
}

void CStaticThreadPool::busy(bool value) {
    m_Busy.store(value);
}

void CStaticThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock{m_Mutex};
        m_Done = true;
    }
    m_TaskAvailable.notify_all();

    for (auto& thread : m_Pool) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    m_Pool.clear();
}

void CStaticThreadPool::worker() {
    for (;;) {
        TTask task;
        {
            std::unique_lock<std::mutex> lock{m_Mutex};
            m_TaskAvailable.wait(lock, [this] {
                return m_Done || m_TaskQueue.empty() == false;
            });
            // Drain outstanding work before exiting so no future is left
            // without a shared state.
            if (m_TaskQueue.empty()) {
                return;
            }
            task = std::move(m_TaskQueue.front());
            m_TaskQueue.pop_front();
        }
        if (task.valid()) {
            task();
        }
    }
}
}
}
