#ifndef BEAMPROTO_LATEST_VALUE_HPP
#define BEAMPROTO_LATEST_VALUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace BeamProto {

    /**
     * @brief Holds the most recent value of an asynchronously updated collection.
     *
     * publish() swaps in a new immutable snapshot, so readers never see a partially
     * updated value. get() never blocks on a writer for longer than the pointer swap.
     */
    template<typename T>
    class LatestValue {
    public:
        using Snapshot = std::shared_ptr<const T>;
        using Listener = std::function<void(const Snapshot&)>;
        using SubscriptionId = uint64_t;

        LatestValue() : value_(std::make_shared<const T>()) {}
        explicit LatestValue(T initial) : value_(std::make_shared<const T>(std::move(initial))) {}

        void publish(T value) {
            Snapshot snapshot = std::make_shared<const T>(std::move(value));
            std::map<SubscriptionId, Listener> listeners;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                value_ = snapshot;
                listeners = listeners_;
            }
            cv_.notify_all();
            for (auto& entry : listeners) {
                entry.second(snapshot);
            }
        }

        Snapshot get() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return value_;
        }

        /**
         * @brief Blocks until the current value satisfies pred or the timeout elapses.
         * @return The matching snapshot, or nullptr on timeout.
         */
        template<typename Pred, typename Rep, typename Period>
        Snapshot wait_for(Pred pred, std::chrono::duration<Rep, Period> timeout) const {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!cv_.wait_for(lock, timeout, [&] { return pred(*value_); })) {
                return nullptr;
            }
            return value_;
        }

        // Wakes every waiter so it re-checks its predicate (used on cancellation).
        void notify_waiters() {
            { std::lock_guard<std::mutex> lock(mutex_); }
            cv_.notify_all();
        }

        // Listeners run on the publishing thread, after the new value is visible.
        SubscriptionId subscribe(Listener listener) {
            std::lock_guard<std::mutex> lock(mutex_);
            SubscriptionId id = next_id_++;
            listeners_.emplace(id, std::move(listener));
            return id;
        }

        void unsubscribe(SubscriptionId id) {
            std::lock_guard<std::mutex> lock(mutex_);
            listeners_.erase(id);
        }

    private:
        mutable std::mutex mutex_;
        mutable std::condition_variable cv_;
        Snapshot value_;
        std::map<SubscriptionId, Listener> listeners_;
        SubscriptionId next_id_ = 1;
    };

} // namespace BeamProto

#endif // BEAMPROTO_LATEST_VALUE_HPP
