#pragma once

#include "PendingQueue.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <iterator>
#include <mutex>
#include <vector>

namespace utils
{

// Work queue drained by the UI thread. Worker threads hand results back with post();
// postDelayed() schedules timers such as the delayed update notifications.
class TaskLoop
{
public:
    using Task = std::function<void()>;

    void post(Task task);
    void postDelayed(std::chrono::milliseconds delay, Task task);

    // Run every due task, waiting up to maxWait when none is due. Call from one thread only.
    std::size_t runOnce(std::chrono::milliseconds maxWait);

    std::size_t pendingCount() const;

private:
    struct TimedTask
    {
        std::chrono::steady_clock::time_point due;
        Task task;
    };

    void collectIncoming();

    PendingQueue<TimedTask> incoming_;
    std::vector<TimedTask> scheduled_; // loop thread only

    mutable std::mutex wake_mutex_;
    std::condition_variable wake_;
};

} // namespace utils
