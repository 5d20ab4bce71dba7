/**
 * @file event_channel.hpp
 * @brief Publish/subscribe primitives used between worker threads and the caller
 *
 * Two distinct disciplines are provided:
 *
 * - WatchChannel<T>: holds only the latest value. Each receiver remembers
 *   the version it last observed and can ask whether the value changed
 *   since then. Used for the stop reason.
 *
 * - BroadcastChannel<T>: every live receiver gets its own bounded queue and
 *   receives every value sent after it subscribed. When a receiver falls
 *   more than `capacity` values behind, the oldest are dropped and counted
 *   as lagged. Used for device and probe events.
 *
 * Senders never block on receivers. Receivers hold their own state through
 * shared_ptr, so they stay valid after the channel is destroyed.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace asmd {

    template <typename T>
    class WatchChannel {
        struct Shared {
            std::mutex mutex;
            std::condition_variable cv;
            T value;
            uint64_t version = 0;

            explicit Shared(T initial) : value(std::move(initial)) {}
        };

    public:
        /**
         * @brief Receiving end of a WatchChannel
         *
         * A new receiver starts with the current version marked as seen.
         */
        class Receiver {
        public:
            /**
             * @brief Whether a value was sent since this receiver last looked
             */
            bool has_changed() const {
                std::lock_guard<std::mutex> lock(shared_->mutex);
                return shared_->version != seen_version_;
            }

            /**
             * @brief Current value, without marking it as seen
             */
            T borrow() const {
                std::lock_guard<std::mutex> lock(shared_->mutex);
                return shared_->value;
            }

            /**
             * @brief Current value, marking it as seen
             */
            T borrow_and_update() {
                std::lock_guard<std::mutex> lock(shared_->mutex);
                seen_version_ = shared_->version;
                return shared_->value;
            }

            /**
             * @brief Blocks until the value changes or the timeout elapses
             *
             * Does not mark the value as seen; call borrow_and_update() after.
             *
             * @return true if a change is pending
             */
            bool wait_changed(std::chrono::milliseconds timeout) const {
                std::unique_lock<std::mutex> lock(shared_->mutex);
                return shared_->cv.wait_for(lock, timeout, [this] {
                    return shared_->version != seen_version_;
                });
            }

        private:
            friend class WatchChannel;

            Receiver(std::shared_ptr<Shared> shared, uint64_t seen)
                : shared_(std::move(shared))
                , seen_version_(seen) {}

            std::shared_ptr<Shared> shared_;
            uint64_t seen_version_;
        };

        explicit WatchChannel(T initial = T{})
            : shared_(std::make_shared<Shared>(std::move(initial))) {}

        WatchChannel(const WatchChannel&) = delete;
        WatchChannel& operator=(const WatchChannel&) = delete;

        /**
         * @brief Replaces the value and wakes every waiting receiver
         */
        void send(T value) {
            {
                std::lock_guard<std::mutex> lock(shared_->mutex);
                shared_->value = std::move(value);
                ++shared_->version;
            }
            shared_->cv.notify_all();
        }

        Receiver subscribe() const {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            return Receiver(shared_, shared_->version);
        }

    private:
        std::shared_ptr<Shared> shared_;
    };

    template <typename T>
    class BroadcastChannel {
        struct Queue {
            std::mutex mutex;
            std::condition_variable cv;
            std::deque<T> items;
            size_t capacity;
            uint64_t lagged = 0;

            explicit Queue(size_t cap) : capacity(cap) {}
        };

    public:
        /**
         * @brief Receiving end of a BroadcastChannel (move-only)
         */
        class Receiver {
        public:
            Receiver(Receiver&&) noexcept = default;
            Receiver& operator=(Receiver&&) noexcept = default;
            Receiver(const Receiver&) = delete;
            Receiver& operator=(const Receiver&) = delete;

            /**
             * @brief Pops the oldest pending value without blocking
             */
            std::optional<T> try_recv() {
                std::lock_guard<std::mutex> lock(queue_->mutex);
                return pop_locked();
            }

            /**
             * @brief Waits up to `timeout` for a value
             */
            std::optional<T> recv(std::chrono::milliseconds timeout) {
                std::unique_lock<std::mutex> lock(queue_->mutex);
                queue_->cv.wait_for(lock, timeout, [this] { return !queue_->items.empty(); });
                return pop_locked();
            }

            /**
             * @brief Number of values dropped because this receiver fell behind
             */
            uint64_t lagged() const {
                std::lock_guard<std::mutex> lock(queue_->mutex);
                return queue_->lagged;
            }

            size_t pending() const {
                std::lock_guard<std::mutex> lock(queue_->mutex);
                return queue_->items.size();
            }

        private:
            friend class BroadcastChannel;

            explicit Receiver(std::shared_ptr<Queue> queue) : queue_(std::move(queue)) {}

            std::optional<T> pop_locked() {
                if (queue_->items.empty()) {
                    return std::nullopt;
                }
                T value = std::move(queue_->items.front());
                queue_->items.pop_front();
                return value;
            }

            std::shared_ptr<Queue> queue_;
        };

        explicit BroadcastChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

        BroadcastChannel(const BroadcastChannel&) = delete;
        BroadcastChannel& operator=(const BroadcastChannel&) = delete;

        /**
         * @brief Delivers a copy of `value` to every live receiver
         *
         * @return Number of receivers the value was delivered to
         */
        size_t send(const T& value) {
            std::lock_guard<std::mutex> lock(mutex_);

            size_t delivered = 0;
            auto it = receivers_.begin();
            while (it != receivers_.end()) {
                auto queue = it->lock();
                if (!queue) {
                    // Receiver dropped
                    it = receivers_.erase(it);
                    continue;
                }
                {
                    std::lock_guard<std::mutex> queue_lock(queue->mutex);
                    if (queue->items.size() >= queue->capacity) {
                        queue->items.pop_front();
                        ++queue->lagged;
                    }
                    queue->items.push_back(value);
                }
                queue->cv.notify_all();
                ++delivered;
                ++it;
            }
            return delivered;
        }

        Receiver subscribe() {
            auto queue = std::make_shared<Queue>(capacity_);
            std::lock_guard<std::mutex> lock(mutex_);
            receivers_.push_back(queue);
            return Receiver(queue);
        }

        [[nodiscard]] size_t capacity() const { return capacity_; }

    private:
        size_t capacity_;
        std::mutex mutex_;
        std::vector<std::weak_ptr<Queue>> receivers_;
    };

} // namespace asmd
