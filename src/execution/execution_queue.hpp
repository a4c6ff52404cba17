#pragma once
#include <queue>
#include <vector>
#include <mutex>
#include <condition_variable>
#include "detector/skill_types.hpp"

// Highest priority first; equal priorities leave in arrival order
struct RequestOrder
{
    bool operator()(const ExecutionRequest &a, const ExecutionRequest &b) const
    {
        if (a.priority != b.priority)
            return a.priority < b.priority;
        return a.sequence > b.sequence;
    }
};

class ExecutionQueue
{
public:
    // Requests without a sequence number get the next one; a returned request keeps its place
    void push(ExecutionRequest request);

    // Held back until `delay_seconds` have passed (retries)
    void pushDelayed(ExecutionRequest request, double delay_seconds);

    bool pop(ExecutionRequest &request, int timeout_ms = 100);

    size_t clear();
    size_t size() const;
    bool empty() const { return size() == 0; }

private:
    void promoteDue(TimePoint now);
    void assignSequence(ExecutionRequest &request);

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::priority_queue<ExecutionRequest, std::vector<ExecutionRequest>, RequestOrder> ready_;
    std::vector<ExecutionRequest> delayed_;
    uint64_t next_sequence_ = 1;
};
