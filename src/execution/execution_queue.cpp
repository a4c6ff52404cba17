#include "execution_queue.hpp"
#include <algorithm>

void ExecutionQueue::assignSequence(ExecutionRequest &request)
{
    if (request.sequence == 0)
        request.sequence = next_sequence_++;
}

void ExecutionQueue::push(ExecutionRequest request)
{
    std::lock_guard<std::mutex> lock(mutex_);
    assignSequence(request);
    ready_.push(request);
    condition_.notify_one();
}

void ExecutionQueue::pushDelayed(ExecutionRequest request, double delay_seconds)
{
    std::lock_guard<std::mutex> lock(mutex_);
    assignSequence(request);
    request.not_before = Clock::now() + secondsToDuration(delay_seconds);
    delayed_.push_back(request);
    condition_.notify_one();
}

void ExecutionQueue::promoteDue(TimePoint now)
{
    for (auto it = delayed_.begin(); it != delayed_.end();)
    {
        if (it->not_before <= now)
        {
            ready_.push(*it);
            it = delayed_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

bool ExecutionQueue::pop(ExecutionRequest &request, int timeout_ms)
{
    std::unique_lock<std::mutex> lock(mutex_);
    TimePoint deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true)
    {
        TimePoint now = Clock::now();
        promoteDue(now);

        if (!ready_.empty())
        {
            request = ready_.top();
            ready_.pop();
            return true;
        }

        if (now >= deadline)
            return false;

        // Wake for the earliest retry if it comes due before the deadline
        TimePoint wake = deadline;
        for (const auto &pending : delayed_)
            wake = std::min(wake, pending.not_before);

        condition_.wait_until(lock, wake);
    }
}

size_t ExecutionQueue::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t cleared = ready_.size() + delayed_.size();
    ready_ = decltype(ready_)();
    delayed_.clear();
    return cleared;
}

size_t ExecutionQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size() + delayed_.size();
}
