#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <stdexcept>
#include <utility>

namespace bucketcp::infra {

/// Unbounded multi-consumer queue with explicit closure.
/// pop() returns nullopt only once the queue is closed AND empty,
/// or when the stop token fires.
template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void push(T item);
    void close();

    [[nodiscard]] auto pop(std::stop_token st = {}) -> std::optional<T>;

    // Забирает всё, что осталось (после отмены)
    [[nodiscard]] auto drain() -> std::deque<T>;

    [[nodiscard]] auto closed() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    bool closed_ = false;
};

// =============== Реализация шаблонов ===============

template<typename T>
void WorkQueue<T>::push(T item) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            throw std::logic_error("push to a closed WorkQueue");
        }
        items_.push_back(std::move(item));
    }
    cv_.notify_one();
}

template<typename T>
void WorkQueue<T>::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

template<typename T>
auto WorkQueue<T>::pop(std::stop_token st) -> std::optional<T> {
    std::unique_lock lock(mutex_);
    // wait() с stop_token сам просыпается при request_stop
    cv_.wait(lock, st, [this] { return !items_.empty() || closed_; });

    if (st.stop_requested() || items_.empty()) {
        return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
}

template<typename T>
auto WorkQueue<T>::drain() -> std::deque<T> {
    std::lock_guard lock(mutex_);
    return std::exchange(items_, {});
}

template<typename T>
auto WorkQueue<T>::closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

template<typename T>
auto WorkQueue<T>::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return items_.size();
}

} // namespace bucketcp::infra
