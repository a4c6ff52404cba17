#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "execution_queue.hpp"
#include "input_transport.hpp"
#include "detector/readiness_model.hpp"
#include "detector/classifier/skill_classifier.hpp"
#include "communication/event_channel.hpp"

struct ExecutionStats
{
    uint64_t total = 0;
    uint64_t successful = 0;
    uint64_t failed = 0;
    uint64_t verified = 0;
    uint64_t retries = 0;
    uint64_t dropped = 0; // Expired before execution
    size_t queue_size = 0;
    double avg_latency = 0.0; // Seconds, exponential moving average
    double success_rate = 0.0;
    double verification_rate = 0.0;
    double global_cooldown = 0.0;
};

// Turns execution requests into key presses. Every press happens under one action
// lock, at least one global cooldown after the previous press.
class ExecutionEngine
{
public:
    ExecutionEngine(ReadinessModel &model, std::shared_ptr<InputTransport> transport,
                    std::shared_ptr<SkillClassifier> classifier, const ExecutionSettings &settings = ExecutionSettings());
    ~ExecutionEngine();

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // True when the request ran or was queued. False for unknown abilities, a stopped
    // engine, or an immediate request that failed with no retries left.
    // A priority below 1 means "use the ability's own priority".
    bool execute(const std::string &ability, ExecutionMode mode = ExecutionMode::QUEUED, int priority = 0,
                 bool verify = true);

    size_t clearQueue();
    size_t queueSize() const { return queue_.size(); }

    ExecutionStats stats() const;
    std::vector<ExecutionResult> history(size_t limit = 100) const;

    double globalCooldown() const;
    void setGlobalCooldown(double seconds);

    // Adjust the global cooldown from recent latency. False when nothing changed.
    bool optimizePerformance();

    void setSettings(const ExecutionSettings &settings);
    void setDetectionConfig(const DetectionConfig &config);
    void setEventChannel(std::shared_ptr<EventChannel> events);

private:
    enum class Outcome
    {
        EXECUTED,
        REQUEUED,
        FAILED
    };

    void run();
    Outcome process(ExecutionRequest request, std::unique_lock<std::mutex> &action);
    Outcome perform(ExecutionRequest &request, ExecutionResult &result, bool &attempted);
    bool sendKeys(const Ability &ability, std::string &error);
    void verify(const ExecutionRequest &request, ExecutionResult &result);
    bool scheduleRetry(ExecutionRequest request, const std::string &reason);
    void record(const ExecutionResult &result);
    void publish(const SystemEvent &event);

    bool gateOpen(TimePoint now) const;
    double gateRemaining(TimePoint now) const;
    bool waitFor(double seconds);

    ReadinessModel &model_;
    std::shared_ptr<InputTransport> transport_;
    std::shared_ptr<SkillClassifier> classifier_;

    mutable std::mutex settings_mutex_;
    ExecutionSettings settings_;
    DetectionConfig detection_config_;
    std::shared_ptr<EventChannel> events_;

    ExecutionQueue queue_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;

    // Held for the whole of one input action; guards last_action_
    std::mutex action_mutex_;
    TimePoint last_action_{};
    std::atomic<double> global_cooldown_;

    mutable std::mutex stats_mutex_;
    ExecutionStats stats_;
    std::deque<ExecutionResult> history_;
    uint64_t results_at_last_tune_ = 0;
    bool idle_announced_ = true;
};
