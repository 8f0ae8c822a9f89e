#ifndef UPTIME_WATCH_THREAD_POOL_HPP
#define UPTIME_WATCH_THREAD_POOL_HPP

#pragma once

#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace concurrency {
    // Fixed set of long-running workers. Every thread runs the same body with its
    // own worker index; join_all() waits for all of them and rethrows the first
    // exception that escaped a worker.
    class WorkerPool {
       public:
        WorkerPool(size_t num_workers, const std::function<void(size_t)>& worker_body);

        ~WorkerPool();
        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;
        WorkerPool(WorkerPool&&) = delete;
        WorkerPool& operator=(WorkerPool&&) = delete;

        void join_all();

       private:
        std::vector<std::thread> threads_;
        std::mutex error_mutex_;
        std::exception_ptr first_error_;
    };
}  // namespace concurrency

#endif
