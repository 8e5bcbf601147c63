#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

/**
 * @class EventQueue
 * @brief Bounded multi-producer queue drained by a single consumer loop
 *
 * push() blocks while the queue is full. After close() pushes are refused
 * and pop() drains what is left, then returns false.
 */
template <typename T>
class EventQueue
{
public:
    explicit EventQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    EventQueue(const EventQueue &) = delete;
    EventQueue &operator=(const EventQueue &) = delete;

    bool push(T item)
    {
        std::unique_lock<std::mutex> lock(mtx_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_)
            return false;

        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool pop(T &out)
    {
        std::unique_lock<std::mutex> lock(mtx_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty())
            return false;

        out = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
    }

    size_t capacity() const noexcept { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};
