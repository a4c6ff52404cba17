#include "execution_engine.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>

using namespace std;

ExecutionEngine::ExecutionEngine(ReadinessModel &model, shared_ptr<InputTransport> transport,
                                 shared_ptr<SkillClassifier> classifier, const ExecutionSettings &settings)
    : model_(model), transport_(move(transport)), classifier_(move(classifier)), settings_(settings),
      global_cooldown_(settings.global_cooldown)
{
}

ExecutionEngine::~ExecutionEngine()
{
    stop();
}

bool ExecutionEngine::start()
{
    if (running_)
        return true;

    if (!transport_)
    {
        log_error("No input transport configured");
        return false;
    }

    running_ = true;
    worker_thread_ = thread(&ExecutionEngine::run, this);
    log_info("Execution engine started (" + transport_->describe() + ", global cooldown " +
             to_string(globalCooldown()) + " s)");
    return true;
}

void ExecutionEngine::stop()
{
    if (!running_ && !worker_thread_.joinable())
        return;

    running_ = false;
    size_t cleared = queue_.clear();
    wake_.notify_all();

    if (worker_thread_.joinable())
        worker_thread_.join();

    log_info("Execution engine stopped, " + log_string(cleared) + " queued requests discarded");
}

bool ExecutionEngine::execute(const string &ability, ExecutionMode mode, int priority, bool verify)
{
    if (!running_)
    {
        log_warning("Engine not running, ignoring " + log_string_src(ability));
        return false;
    }

    Ability info;
    if (!model_.get(ability, info))
    {
        log_error("Unknown ability " + log_string_src(ability));
        return false;
    }

    ExecutionSettings settings;
    {
        lock_guard<mutex> lock(settings_mutex_);
        settings = settings_;
    }

    ExecutionRequest request;
    request.ability = ability;
    request.mode = mode;
    request.priority = priority >= PRIORITY_MIN ? std::min(priority, PRIORITY_MAX) : info.priority;
    if (mode == ExecutionMode::PRIORITY)
        request.priority = PRIORITY_MAX + 1; // Above every ability priority
    request.verify = verify;
    request.max_retries = settings.auto_retry ? settings.max_retries : 0;
    request.created = Clock::now();
    request.timeout = settings.request_timeout;

    if (mode != ExecutionMode::IMMEDIATE)
    {
        queue_.push(request);
        log_debug("Queued " + log_string_src(ability) + " at priority " + log_string(request.priority));
        return true;
    }

    // Inline only when nobody is acting and the global cooldown has passed
    unique_lock<mutex> action(action_mutex_, try_to_lock);
    if (!action.owns_lock() || !gateOpen(Clock::now()))
    {
        if (action.owns_lock())
            action.unlock();

        queue_.push(request);
        log_debug("Demoted immediate " + log_string_src(ability) + " to the queue");
        return true;
    }

    return process(request, action) != Outcome::FAILED;
}

void ExecutionEngine::run()
{
    log_debug("Execution worker running");

    while (running_)
    {
        try
        {
            // Wait out the global cooldown before taking a request
            double remaining;
            {
                lock_guard<mutex> action(action_mutex_);
                remaining = gateRemaining(Clock::now());
            }
            if (remaining > 0.0)
            {
                waitFor(remaining);
                continue;
            }

            ExecutionRequest request;
            if (!queue_.pop(request, 100))
            {
                if (!idle_announced_)
                {
                    idle_announced_ = true;
                    publish(SystemEvent::queueIdle());
                }
                continue;
            }

            idle_announced_ = false;

            if (!running_)
                break;

            if (request.isExpired(Clock::now()))
            {
                {
                    lock_guard<mutex> lock(stats_mutex_);
                    stats_.dropped++;
                }
                log_debug("Dropped expired request for " + log_string_src(request.ability));
                continue;
            }

            unique_lock<mutex> action(action_mutex_);
            if (!gateOpen(Clock::now()))
            {
                // An inline request took the slot; this one keeps its place
                action.unlock();
                queue_.push(request);
                continue;
            }

            process(request, action);

            if (queue_.empty() && !idle_announced_)
            {
                idle_announced_ = true;
                publish(SystemEvent::queueIdle());
            }
        }
        catch (const exception &e)
        {
            log_error("Execution worker error: " + string(e.what()));
            publish(SystemEvent::error("Execution worker error: " + string(e.what())));
            waitFor(0.1);
        }
    }

    log_debug("Execution worker exiting");
}

ExecutionEngine::Outcome ExecutionEngine::process(ExecutionRequest request, unique_lock<mutex> &action)
{
    TimePoint started = Clock::now();

    ExecutionResult result;
    result.ability = request.ability;
    result.retry_count = request.retry_count;

    bool attempted = false;
    Outcome outcome = perform(request, result, attempted);
    action.unlock();

    // Verification runs outside the action lock; a stop lets it finish its one read
    if (outcome == Outcome::EXECUTED && request.verify)
        verify(request, result);

    result.execution_time = secondsBetween(started, Clock::now());

    // A failed send is recorded even when it goes back for a retry
    if (outcome != Outcome::REQUEUED || attempted)
        record(result);

    return outcome;
}

ExecutionEngine::Outcome ExecutionEngine::perform(ExecutionRequest &request, ExecutionResult &result, bool &attempted)
{
    TimePoint now = Clock::now();

    Ability ability;
    if (!model_.get(request.ability, ability))
    {
        result.error_message = "Unknown ability";
        return Outcome::FAILED;
    }

    if (!model_.isReady(request.ability, now))
    {
        if (scheduleRetry(request, "not ready"))
            return Outcome::REQUEUED;

        result.error_message = "Ability not ready";
        log_debug(log_string_src(request.ability) + " not ready, giving up");
        return Outcome::FAILED;
    }

    string error;
    attempted = true;
    bool sent = sendKeys(ability, error);

    TimePoint sent_at = Clock::now();
    last_action_ = sent_at;
    result.input_delay = secondsBetween(now, sent_at);

    if (!sent)
    {
        result.error_message = error;
        log_warning("Failed to execute " + log_string_src(request.ability) + ": " + error);
        if (scheduleRetry(request, error))
            return Outcome::REQUEUED;
        return Outcome::FAILED;
    }

    model_.markUsed(request.ability, sent_at);
    result.success = true;
    log_info("Executed " + log_string_src(request.ability) + " (key " + ability.key + ")");
    return Outcome::EXECUTED;
}

bool ExecutionEngine::sendKeys(const Ability &ability, string &error)
{
    vector<string> keys = {ability.key};
    if (ability.type == AbilityType::COMBO)
    {
        for (const auto &step : ability.combo_sequence)
        {
            Ability next;
            if (!model_.get(step, next))
            {
                error = "Unknown combo step " + step;
                return false;
            }
            keys.push_back(next.key);
        }
    }

    double step_delay;
    {
        lock_guard<mutex> lock(settings_mutex_);
        step_delay = settings_.combo_step_delay;
    }

    for (size_t i = 0; i < keys.size(); i++)
    {
        if (i > 0)
            this_thread::sleep_for(secondsToDuration(step_delay));

        bool ok = false;
        try
        {
            ok = transport_->sendKey(keys[i]);
        }
        catch (const exception &e)
        {
            error = "Transport error: " + string(e.what());
            return false;
        }

        if (!ok)
        {
            error = "Transport failed to send key " + keys[i];
            return false;
        }
    }
    return true;
}

void ExecutionEngine::verify(const ExecutionRequest &request, ExecutionResult &result)
{
    ExecutionSettings settings;
    DetectionConfig config;
    {
        lock_guard<mutex> lock(settings_mutex_);
        settings = settings_;
        config = detection_config_;
    }

    Ability ability;
    if (!settings.visual_verification || !classifier_ || !model_.get(request.ability, ability) ||
        !ability.hasPosition() || !ability.hasIcon())
        return;

    TimePoint wait_start = Clock::now();
    this_thread::sleep_for(secondsToDuration(settings.verification_delay));

    DetectionResult observed = classifier_->classify(ability, ability.position.region, config);
    TimePoint observed_at = Clock::now();
    result.verification_delay = secondsBetween(wait_start, observed_at);

    if (observed.confidence > 0.0f)
        model_.updateState(request.ability, observed.state, observed.confidence, observed.observed_at);

    // A fresh cooldown overlay proves the press registered
    result.verification_passed = observed.state == AbilityState::COOLDOWN;
    if (!result.verification_passed)
    {
        log_warning("Verification mismatch for " + log_string_src(request.ability) + ": expected cooldown, saw " +
                    toString(observed.state));
    }
}

bool ExecutionEngine::scheduleRetry(ExecutionRequest request, const string &reason)
{
    if (!running_)
        return false;

    double delay;
    bool auto_retry;
    {
        lock_guard<mutex> lock(settings_mutex_);
        delay = settings_.retry_delay;
        auto_retry = settings_.auto_retry;
    }

    if (!auto_retry || request.retry_count >= request.max_retries)
        return false;

    request.retry_count++;
    {
        lock_guard<mutex> lock(stats_mutex_);
        stats_.retries++;
    }

    queue_.pushDelayed(request, delay);
    log_debug("Retry " + log_string(request.retry_count) + "/" + to_string(request.max_retries) + " for " +
              log_string_src(request.ability) + " (" + reason + ")");
    return true;
}

void ExecutionEngine::record(const ExecutionResult &result)
{
    bool adaptive;
    {
        lock_guard<mutex> lock(settings_mutex_);
        adaptive = settings_.adaptive_timing;
    }

    bool tune = false;
    {
        lock_guard<mutex> lock(stats_mutex_);
        stats_.total++;
        if (result.success)
            stats_.successful++;
        else
            stats_.failed++;
        if (result.verification_passed)
            stats_.verified++;

        if (stats_.total == 1)
            stats_.avg_latency = result.execution_time;
        else
            stats_.avg_latency = 0.2 * result.execution_time + 0.8 * stats_.avg_latency;

        history_.push_back(result);
        if (history_.size() > 100)
            history_.pop_front();

        tune = adaptive && stats_.total % 10 == 0;
    }

    publish(SystemEvent::executionCompleted(result));

    if (tune)
        optimizePerformance();
}

bool ExecutionEngine::optimizePerformance()
{
    ExecutionSettings settings;
    {
        lock_guard<mutex> lock(settings_mutex_);
        settings = settings_;
    }

    lock_guard<mutex> lock(stats_mutex_);
    if (history_.size() < 10 || stats_.total == results_at_last_tune_)
        return false;

    results_at_last_tune_ = stats_.total;

    size_t count = std::min<size_t>(20, history_.size());
    double total_time = 0.0;
    for (size_t i = history_.size() - count; i < history_.size(); i++)
        total_time += history_[i].execution_time;
    double avg_time = total_time / count;

    double current = global_cooldown_;
    double tuned = current;
    if (avg_time > settings.slow_execution)
        tuned = std::min(current * 1.1, settings.max_global_cooldown);
    else if (avg_time < settings.fast_execution)
        tuned = std::max(current * 0.9, settings.min_global_cooldown);

    if (tuned == current)
        return false;

    global_cooldown_ = tuned;
    log_info("Global cooldown tuned from " + to_string(current) + " to " + to_string(tuned) + " s (avg execution " +
             to_string(avg_time) + " s)");
    return true;
}

size_t ExecutionEngine::clearQueue()
{
    size_t cleared = queue_.clear();
    log_info("Cleared " + log_string(cleared) + " queued requests");
    return cleared;
}

ExecutionStats ExecutionEngine::stats() const
{
    lock_guard<mutex> lock(stats_mutex_);
    ExecutionStats copy = stats_;
    copy.queue_size = queue_.size();
    copy.success_rate = copy.total > 0 ? static_cast<double>(copy.successful) / copy.total : 0.0;
    copy.verification_rate = copy.successful > 0 ? static_cast<double>(copy.verified) / copy.successful : 0.0;
    copy.global_cooldown = global_cooldown_;
    return copy;
}

vector<ExecutionResult> ExecutionEngine::history(size_t limit) const
{
    lock_guard<mutex> lock(stats_mutex_);
    size_t count = std::min(limit, history_.size());
    return vector<ExecutionResult>(history_.end() - count, history_.end());
}

double ExecutionEngine::globalCooldown() const
{
    return global_cooldown_;
}

void ExecutionEngine::setGlobalCooldown(double seconds)
{
    global_cooldown_ = std::max(0.0, seconds);
}

void ExecutionEngine::setSettings(const ExecutionSettings &settings)
{
    lock_guard<mutex> lock(settings_mutex_);
    settings_ = settings;
    global_cooldown_ = settings.global_cooldown;
}

void ExecutionEngine::setDetectionConfig(const DetectionConfig &config)
{
    lock_guard<mutex> lock(settings_mutex_);
    detection_config_ = config;
}

void ExecutionEngine::setEventChannel(shared_ptr<EventChannel> events)
{
    lock_guard<mutex> lock(settings_mutex_);
    events_ = move(events);
}

void ExecutionEngine::publish(const SystemEvent &event)
{
    shared_ptr<EventChannel> events;
    {
        lock_guard<mutex> lock(settings_mutex_);
        events = events_;
    }
    if (events)
        events->publish(event);
}

bool ExecutionEngine::gateOpen(TimePoint now) const
{
    return gateRemaining(now) <= 0.0;
}

double ExecutionEngine::gateRemaining(TimePoint now) const
{
    if (last_action_ == TimePoint{})
        return 0.0;
    return global_cooldown_ - secondsBetween(last_action_, now);
}

bool ExecutionEngine::waitFor(double seconds)
{
    unique_lock<mutex> lock(wake_mutex_);
    wake_.wait_for(lock, secondsToDuration(seconds), [this]
                   { return !running_; });
    return running_;
}
