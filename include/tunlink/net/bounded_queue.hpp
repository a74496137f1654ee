/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Bounded Queue
 * Capacity-limited FIFO handing work between the tunnel tasks
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

#include <datapod/datapod.hpp>

namespace tunlink {

    using namespace dp;

    namespace net {

        // Producers block while the queue is full, consumers block while it is empty.
        // close() wakes both sides; afterwards push fails and pop yields nothing,
        // even if items are still buffered.
        template <typename T> class BoundedQueue {
          private:
            std::deque<T> items_;
            usize capacity_;
            boolean closed_ = false;
            mutable std::mutex mutex_;
            std::condition_variable not_empty_;
            std::condition_variable not_full_;

          public:
            explicit BoundedQueue(usize capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

            BoundedQueue(const BoundedQueue &) = delete;
            auto operator=(const BoundedQueue &) -> BoundedQueue & = delete;

            // Returns false once the queue is closed
            auto push(T item) -> boolean {
                std::unique_lock<std::mutex> lock(mutex_);
                not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
                if (closed_) {
                    return false;
                }
                items_.push_back(std::move(item));
                lock.unlock();
                not_empty_.notify_one();
                return true;
            }

            // Blocks until an item arrives or the queue is closed
            [[nodiscard]] auto pop() -> Optional<T> {
                std::unique_lock<std::mutex> lock(mutex_);
                not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
                return take(lock);
            }

            // As pop(), but gives up after timeout_ms
            [[nodiscard]] auto pop_for(u64 timeout_ms) -> Optional<T> {
                std::unique_lock<std::mutex> lock(mutex_);
                not_empty_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                    [this] { return closed_ || !items_.empty(); });
                return take(lock);
            }

            auto close() -> void {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    closed_ = true;
                }
                not_empty_.notify_all();
                not_full_.notify_all();
            }

            [[nodiscard]] auto is_closed() const -> boolean {
                std::lock_guard<std::mutex> lock(mutex_);
                return closed_;
            }

            [[nodiscard]] auto size() const -> usize {
                std::lock_guard<std::mutex> lock(mutex_);
                return items_.size();
            }

            [[nodiscard]] auto capacity() const -> usize { return capacity_; }

          private:
            auto take(std::unique_lock<std::mutex> &lock) -> Optional<T> {
                if (closed_ || items_.empty()) {
                    return dp::nullopt;
                }
                T item = std::move(items_.front());
                items_.pop_front();
                lock.unlock();
                not_full_.notify_one();
                return Optional<T>(std::move(item));
            }
        };

    } // namespace net

} // namespace tunlink
