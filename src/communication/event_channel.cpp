#include "event_channel.hpp"
#include "utils/logging.hpp"
#include <algorithm>

using namespace std;

string toString(EventType type)
{
    switch (type)
    {
    case EventType::ABILITY_DETECTED:
        return "ability_detected";
    case EventType::STATE_CHANGED:
        return "state_changed";
    case EventType::EXECUTION_COMPLETED:
        return "execution_completed";
    case EventType::QUEUE_IDLE:
        return "queue_idle";
    case EventType::ROTATION_CHANGED:
        return "rotation_changed";
    case EventType::PROFILE_CHANGED:
        return "profile_changed";
    case EventType::ERROR:
        return "error";
    }
    return "error";
}

SystemEvent SystemEvent::abilityDetected(int slot, const DetectionResult &result)
{
    SystemEvent event;
    event.type = EventType::ABILITY_DETECTED;
    event.ability = result.ability;
    event.slot_index = slot;
    event.new_state = result.state;
    event.detection = result;
    return event;
}

SystemEvent SystemEvent::stateChanged(const string &ability, AbilityState old_state, AbilityState new_state)
{
    SystemEvent event;
    event.type = EventType::STATE_CHANGED;
    event.ability = ability;
    event.old_state = old_state;
    event.new_state = new_state;
    return event;
}

SystemEvent SystemEvent::executionCompleted(const ExecutionResult &result)
{
    SystemEvent event;
    event.type = EventType::EXECUTION_COMPLETED;
    event.ability = result.ability;
    event.execution = result;
    return event;
}

SystemEvent SystemEvent::queueIdle()
{
    SystemEvent event;
    event.type = EventType::QUEUE_IDLE;
    return event;
}

SystemEvent SystemEvent::rotationChanged(const string &rotation)
{
    SystemEvent event;
    event.type = EventType::ROTATION_CHANGED;
    event.message = rotation;
    return event;
}

SystemEvent SystemEvent::profileChanged(const string &profile)
{
    SystemEvent event;
    event.type = EventType::PROFILE_CHANGED;
    event.message = profile;
    return event;
}

SystemEvent SystemEvent::error(const string &message)
{
    SystemEvent event;
    event.type = EventType::ERROR;
    event.message = message;
    return event;
}

EventSubscription::EventSubscription(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1))
{
}

void EventSubscription::push(const SystemEvent &event)
{
    lock_guard<mutex> lock(mutex_);
    if (closed_)
        return;

    if (events_.size() >= capacity_)
    {
        events_.pop_front();
        dropped_++;
    }
    events_.push_back(event);
    condition_.notify_one();
}

bool EventSubscription::pop(SystemEvent &event, int timeout_ms)
{
    unique_lock<mutex> lock(mutex_);

    if (condition_.wait_for(lock, chrono::milliseconds(timeout_ms),
                            [this]
                            { return !events_.empty() || closed_; }))
    {
        if (events_.empty())
            return false;

        event = events_.front();
        events_.pop_front();
        return true;
    }
    return false;
}

size_t EventSubscription::size() const
{
    lock_guard<mutex> lock(mutex_);
    return events_.size();
}

void EventSubscription::close()
{
    lock_guard<mutex> lock(mutex_);
    closed_ = true;
    condition_.notify_all();
}

shared_ptr<EventSubscription> EventChannel::subscribe(size_t capacity)
{
    auto subscription = make_shared<EventSubscription>(capacity);
    lock_guard<mutex> lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
}

void EventChannel::unsubscribe(const shared_ptr<EventSubscription> &subscription)
{
    if (!subscription)
        return;

    {
        lock_guard<mutex> lock(mutex_);
        subscribers_.erase(remove(subscribers_.begin(), subscribers_.end(), subscription), subscribers_.end());
    }
    subscription->close();
}

uint64_t EventChannel::publish(SystemEvent event)
{
    vector<shared_ptr<EventSubscription>> targets;
    {
        lock_guard<mutex> lock(mutex_);
        event.id = next_id_++;
        if (event.timestamp == TimePoint{})
            event.timestamp = Clock::now();
        targets = subscribers_;
    }

    for (auto &subscription : targets)
        subscription->push(event);

    return event.id;
}

size_t EventChannel::subscriberCount() const
{
    lock_guard<mutex> lock(mutex_);
    return subscribers_.size();
}

uint64_t EventChannel::published() const
{
    lock_guard<mutex> lock(mutex_);
    return next_id_ - 1;
}

EventDispatcher::EventDispatcher(shared_ptr<EventChannel> channel, size_t capacity)
    : channel_(move(channel))
{
    subscription_ = channel_->subscribe(capacity);
}

EventDispatcher::~EventDispatcher()
{
    stop();
    channel_->unsubscribe(subscription_);
}

void EventDispatcher::start()
{
    if (running_)
        return;

    running_ = true;
    worker_thread_ = thread(&EventDispatcher::run, this);
    log_debug("Event dispatcher started");
}

void EventDispatcher::stop()
{
    running_ = false;
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
        log_debug("Event dispatcher stopped");
    }
}

int EventDispatcher::addHandler(EventType type, function<void(const SystemEvent &)> callback)
{
    lock_guard<mutex> lock(handlers_mutex_);
    int id = next_handler_id_++;
    handlers_.push_back({id, type, move(callback)});
    return id;
}

int EventDispatcher::onAbilityDetected(function<void(int, const DetectionResult &)> callback)
{
    return addHandler(EventType::ABILITY_DETECTED, [callback](const SystemEvent &event)
                      { callback(event.slot_index, event.detection); });
}

int EventDispatcher::onStateChanged(function<void(const string &, AbilityState, AbilityState)> callback)
{
    return addHandler(EventType::STATE_CHANGED, [callback](const SystemEvent &event)
                      { callback(event.ability, event.old_state, event.new_state); });
}

int EventDispatcher::onQueueIdle(function<void()> callback)
{
    return addHandler(EventType::QUEUE_IDLE, [callback](const SystemEvent &)
                      { callback(); });
}

int EventDispatcher::onError(function<void(const string &)> callback)
{
    return addHandler(EventType::ERROR, [callback](const SystemEvent &event)
                      { callback(event.message); });
}

int EventDispatcher::onExecution(function<void(const ExecutionResult &)> callback)
{
    return addHandler(EventType::EXECUTION_COMPLETED, [callback](const SystemEvent &event)
                      { callback(event.execution); });
}

bool EventDispatcher::unsubscribe(int id)
{
    lock_guard<mutex> lock(handlers_mutex_);
    auto it = find_if(handlers_.begin(), handlers_.end(), [id](const Handler &handler)
                      { return handler.id == id; });
    if (it == handlers_.end())
        return false;

    handlers_.erase(it);
    return true;
}

void EventDispatcher::run()
{
    while (running_)
    {
        SystemEvent event;
        if (subscription_->pop(event, 100))
            dispatch(event);
    }
}

void EventDispatcher::dispatch(const SystemEvent &event)
{
    // Handlers may unsubscribe from inside a callback
    vector<Handler> handlers;
    {
        lock_guard<mutex> lock(handlers_mutex_);
        for (const auto &handler : handlers_)
        {
            if (handler.type == event.type)
                handlers.push_back(handler);
        }
    }

    for (const auto &handler : handlers)
    {
        try
        {
            handler.callback(event);
        }
        catch (const exception &e)
        {
            callback_errors_++;
            log_error("Callback for " + toString(event.type) + " threw: " + string(e.what()));
        }
        catch (...)
        {
            callback_errors_++;
            log_error("Callback for " + toString(event.type) + " threw an unknown exception");
        }
    }
}
