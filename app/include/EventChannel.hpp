#ifndef EVENT_CHANNEL_HPP
#define EVENT_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

// Multi-producer queue of events drained by the owner of the background work.
// When capacity is reached the oldest event is dropped.
template <typename Event>
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity = 4096)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(Event event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (events_.size() >= capacity_) {
                events_.pop_front();
                ++dropped_;
            }
            events_.push_back(std::move(event));
        }
        cv_.notify_all();
    }

    std::optional<Event> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.empty()) {
            return std::nullopt;
        }
        Event event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    template <typename Rep, typename Period>
    std::optional<Event> wait_pop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
            return std::nullopt;
        }
        Event event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    std::vector<Event> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Event> drained(std::make_move_iterator(events_.begin()),
                                   std::make_move_iterator(events_.end()));
        events_.clear();
        return drained;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
    std::size_t capacity_;
    std::size_t dropped_{0};
};

#endif
