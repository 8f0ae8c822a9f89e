#ifndef UPTIME_WATCH_CHANNEL_HPP
#define UPTIME_WATCH_CHANNEL_HPP

#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace concurrency {
    // Unbounded multi-producer/multi-consumer queue. Each pushed item is popped
    // by exactly one consumer. After close(), pop() drains what is left and then
    // returns std::nullopt.
    template <typename T>
    class Channel {
       public:
        Channel() = default;

        ~Channel() = default;
        Channel(const Channel&) = delete;
        Channel& operator=(const Channel&) = delete;
        Channel(Channel&&) = delete;
        Channel& operator=(Channel&&) = delete;

        bool push(T item) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (closed_) {
                    return false;
                }
                items_.emplace(std::move(item));
            }

            condition_variable_.notify_one();
            return true;
        }

        std::optional<T> pop() {
            std::unique_lock<std::mutex> lock(mutex_);

            condition_variable_.wait(lock, [this]() { return !items_.empty() || closed_; });

            if (items_.empty()) {
                return std::nullopt;
            }

            T item = std::move(items_.front());
            items_.pop();
            return item;
        }

        void close() {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                closed_ = true;
            }

            condition_variable_.notify_all();
        }

       private:
        std::queue<T> items_;
        std::mutex mutex_;
        std::condition_variable condition_variable_;
        bool closed_ = false;
    };
}  // namespace concurrency

#endif
