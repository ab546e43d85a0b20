#include "TaskLoop.hpp"

#include <algorithm>

namespace utils
{

void TaskLoop::post(Task task) { postDelayed(std::chrono::milliseconds(0), std::move(task)); }

void TaskLoop::postDelayed(std::chrono::milliseconds delay, Task task)
{
    if (!task)
        return;

    incoming_.push(TimedTask{ std::chrono::steady_clock::now() + delay, std::move(task) });
    std::lock_guard<std::mutex> lock(wake_mutex_);
    wake_.notify_one();
}

void TaskLoop::collectIncoming()
{
    if (incoming_.drainInto(scheduled_) == 0)
        return;
    std::stable_sort(scheduled_.begin(), scheduled_.end(),
                     [](const TimedTask& a, const TimedTask& b) { return a.due < b.due; });
}

std::size_t TaskLoop::runOnce(std::chrono::milliseconds maxWait)
{
    collectIncoming();

    auto now = std::chrono::steady_clock::now();
    auto deadline = now + maxWait;
    if (!scheduled_.empty() && scheduled_.front().due < deadline)
        deadline = scheduled_.front().due;

    if (deadline > now)
    {
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_until(lock, deadline, [this]() { return !incoming_.empty(); });
    }
    collectIncoming();

    // Tasks may post more tasks; those run on a later call
    std::vector<TimedTask> due;
    now = std::chrono::steady_clock::now();
    auto firstPending = std::find_if(scheduled_.begin(), scheduled_.end(),
                                     [now](const TimedTask& t) { return t.due > now; });
    due.insert(due.end(), std::make_move_iterator(scheduled_.begin()), std::make_move_iterator(firstPending));
    scheduled_.erase(scheduled_.begin(), firstPending);

    for (auto& t : due)
    {
        t.task();
    }
    return due.size();
}

std::size_t TaskLoop::pendingCount() const { return incoming_.size() + scheduled_.size(); }

} // namespace utils
