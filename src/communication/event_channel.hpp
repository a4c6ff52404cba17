#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "detector/skill_types.hpp"

enum class EventType
{
    ABILITY_DETECTED,
    STATE_CHANGED,
    EXECUTION_COMPLETED,
    QUEUE_IDLE,
    ROTATION_CHANGED,
    PROFILE_CHANGED,
    ERROR
};

std::string toString(EventType type);

struct SystemEvent
{
    uint64_t id = 0; // Assigned by the channel, increasing
    EventType type = EventType::ERROR;
    TimePoint timestamp{};

    std::string ability;
    int slot_index = -1;
    AbilityState old_state = AbilityState::UNKNOWN;
    AbilityState new_state = AbilityState::UNKNOWN;
    DetectionResult detection;
    ExecutionResult execution;
    std::string message; // Error text, rotation or profile name

    static SystemEvent abilityDetected(int slot, const DetectionResult &result);
    static SystemEvent stateChanged(const std::string &ability, AbilityState old_state, AbilityState new_state);
    static SystemEvent executionCompleted(const ExecutionResult &result);
    static SystemEvent queueIdle();
    static SystemEvent rotationChanged(const std::string &rotation);
    static SystemEvent profileChanged(const std::string &profile);
    static SystemEvent error(const std::string &message);
};

// One subscriber's bounded inbox. When full, the oldest event is dropped.
class EventSubscription
{
public:
    explicit EventSubscription(size_t capacity);

    bool pop(SystemEvent &event, int timeout_ms = 100);

    size_t size() const;
    uint64_t dropped() const { return dropped_; }
    bool isClosed() const { return closed_; }

private:
    friend class EventChannel;
    void push(const SystemEvent &event);
    void close();

    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<SystemEvent> events_;
    std::atomic<uint64_t> dropped_{0};
    std::atomic<bool> closed_{false};
};

// Fan-out of system events to independent subscribers. Publishing never waits on a consumer.
class EventChannel
{
public:
    std::shared_ptr<EventSubscription> subscribe(size_t capacity = 256);
    void unsubscribe(const std::shared_ptr<EventSubscription> &subscription);

    // Returns the id given to the event
    uint64_t publish(SystemEvent event);

    size_t subscriberCount() const;
    uint64_t published() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<EventSubscription>> subscribers_;
    uint64_t next_id_ = 1;
};

// Drains one subscription on its own thread and calls typed handlers.
// A throwing handler is logged and does not stop the others.
class EventDispatcher
{
public:
    explicit EventDispatcher(std::shared_ptr<EventChannel> channel, size_t capacity = 256);
    ~EventDispatcher();

    void start();
    void stop();
    bool isRunning() const { return running_; }

    int onAbilityDetected(std::function<void(int, const DetectionResult &)> callback);
    int onStateChanged(std::function<void(const std::string &, AbilityState, AbilityState)> callback);
    int onQueueIdle(std::function<void()> callback);
    int onError(std::function<void(const std::string &)> callback);
    int onExecution(std::function<void(const ExecutionResult &)> callback);

    bool unsubscribe(int id);

    uint64_t callbackErrors() const { return callback_errors_; }

private:
    struct Handler
    {
        int id;
        EventType type;
        std::function<void(const SystemEvent &)> callback;
    };

    int addHandler(EventType type, std::function<void(const SystemEvent &)> callback);
    void run();
    void dispatch(const SystemEvent &event);

    std::shared_ptr<EventChannel> channel_;
    std::shared_ptr<EventSubscription> subscription_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};

    std::mutex handlers_mutex_;
    std::vector<Handler> handlers_;
    int next_handler_id_ = 1;
    std::atomic<uint64_t> callback_errors_{0};
};
