#pragma once
#include "event_channel.hpp"
#include "coordinator/skill_system.hpp"
#include <thread>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <httplib.h>
#include <nlohmann/json.hpp>

// HTTP/JSON view of a running SkillSystem, plus a short history of its events
class StatusService
{
public:
    StatusService(SkillSystem &system, int port = 13520, size_t event_history = 200);
    ~StatusService();

    void start();
    void stop();
    bool isRunning() const { return running_; }

    nlohmann::json healthJson() const;
    nlohmann::json statusJson() const;
    nlohmann::json abilitiesJson() const;
    nlohmann::json eventsJson(uint64_t since) const;
    nlohmann::json scanJson();
    nlohmann::json executeJson(const std::string &ability, const std::string &body, int &status);

    static nlohmann::json eventToJson(const SystemEvent &event);
    static nlohmann::json detectionToJson(const DetectionResult &result);
    static nlohmann::json executionToJson(const ExecutionResult &result);

    // Move pending events from the subscription into the history ring
    size_t drainEvents(int timeout_ms = 100);

private:
    void setupRoutes();
    void run();

    SkillSystem &system_;
    std::shared_ptr<EventSubscription> subscription_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::unique_ptr<httplib::Server> server_;
    int port_;

    size_t event_history_;
    mutable std::mutex events_mutex_;
    std::deque<SystemEvent> recent_events_;
};
