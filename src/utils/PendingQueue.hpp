#pragma once

#include <cstddef>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

namespace utils
{

// Multi-producer hand-off buffer; the consumer takes everything queued so far in one go
template <typename T>
class PendingQueue
{
public:
    void push(T item)
    {
        std::lock_guard<std::mutex> lock(m_);
        q_.push_back(std::move(item));
    }

    // Appends the queued items to out in push order and returns how many were moved
    std::size_t drainInto(std::vector<T>& out)
    {
        std::lock_guard<std::mutex> lock(m_);
        std::size_t count = q_.size();
        out.insert(out.end(), std::make_move_iterator(q_.begin()), std::make_move_iterator(q_.end()));
        q_.clear();
        return count;
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return q_.empty();
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return q_.size();
    }

private:
    mutable std::mutex m_;
    std::vector<T> q_;
};

} // namespace utils
