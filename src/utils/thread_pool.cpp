#include "thread_pool.hpp"

#include <exception>
#include <thread>
#include <vector>

namespace concurrency {

    WorkerPool::WorkerPool(size_t num_workers, const std::function<void(size_t)>& worker_body) {
        threads_.reserve(num_workers);

        try {
            for (size_t i = 0; i < num_workers; ++i) {
                threads_.emplace_back([this, worker_body, i] {
                    try {
                        worker_body(i);
                    } catch (...) {
                        std::lock_guard<std::mutex> lock(error_mutex_);
                        if (!first_error_) {
                            first_error_ = std::current_exception();
                        }
                    }
                });
            }
        } catch (...) {
            // No destructor runs for a half-built pool; started workers must not outlive it.
            for (auto& thread : threads_) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
            throw;
        }
    }

    WorkerPool::~WorkerPool() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    void WorkerPool::join_all() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }

        std::lock_guard<std::mutex> lock(error_mutex_);
        if (first_error_) {
            std::exception_ptr error = first_error_;
            first_error_ = nullptr;
            std::rethrow_exception(error);
        }
    }
};  // namespace concurrency
