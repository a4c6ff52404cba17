#include "status_service.hpp"
#include "utils/logging.hpp"
#include <chrono>

using namespace std;
using json = nlohmann::json;

// Steady clock stamps shown as wall-clock milliseconds
static int64_t toEpochMs(TimePoint at)
{
    if (at == TimePoint{})
        return 0;

    auto wall = chrono::system_clock::now() - chrono::duration_cast<chrono::system_clock::duration>(Clock::now() - at);
    return chrono::duration_cast<chrono::milliseconds>(wall.time_since_epoch()).count();
}

static json rectToJson(const cv::Rect &rect)
{
    return json::array({rect.x, rect.y, rect.width, rect.height});
}

// Handler exceptions become a 500 with the message
static void guarded(httplib::Response &res, const function<void()> &handler)
{
    try
    {
        handler();
    }
    catch (const exception &e)
    {
        log_error("Request failed: " + string(e.what()));
        res.status = 500;
        res.set_content(json{{"error", e.what()}}.dump(), "application/json");
    }
}

StatusService::StatusService(SkillSystem &system, int port, size_t event_history)
    : system_(system), port_(port), event_history_(event_history)
{
    subscription_ = system_.events()->subscribe(event_history_);
}

StatusService::~StatusService()
{
    stop();
    system_.events()->unsubscribe(subscription_);
}

void StatusService::start()
{
    if (running_)
        return;

    // Built here so stop() never races the worker for the pointer
    server_ = make_unique<httplib::Server>();
    setupRoutes();

    running_ = true;
    worker_thread_ = thread(&StatusService::run, this);
    log_debug("Status service starting on port " + to_string(port_));
}

void StatusService::stop()
{
    running_ = false;

    if (server_)
    {
        server_->stop();
    }
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
        log_info("Status service stopped");
    }
}

void StatusService::setupRoutes()
{
    // CORS headers
    server_->set_default_headers({{"Access-Control-Allow-Origin", "*"},
                                  {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
                                  {"Access-Control-Allow-Headers", "Content-Type"}});

    server_->Get("/health", [this](const httplib::Request &, httplib::Response &res)
                 { guarded(res, [&]
                           { res.set_content(healthJson().dump(), "application/json"); }); });

    server_->Get("/status", [this](const httplib::Request &, httplib::Response &res)
                 { guarded(res, [&]
                           { res.set_content(statusJson().dump(), "application/json"); }); });

    server_->Get("/abilities", [this](const httplib::Request &, httplib::Response &res)
                 { guarded(res, [&]
                           { res.set_content(abilitiesJson().dump(), "application/json"); }); });

    server_->Get("/events", [this](const httplib::Request &req, httplib::Response &res)
                 { guarded(res, [&]
                           {
        uint64_t since = 0;
        if (req.has_param("since"))
        {
            try
            {
                since = stoull(req.get_param_value("since"));
            }
            catch (const exception &)
            {
                res.status = 400;
                res.set_content(json{{"error", "since must be an event id"}}.dump(), "application/json");
                return;
            }
        }
        res.set_content(eventsJson(since).dump(), "application/json"); }); });

    server_->Post("/scan", [this](const httplib::Request &, httplib::Response &res)
                  { guarded(res, [&]
                            { res.set_content(scanJson().dump(), "application/json"); }); });

    server_->Post(R"(/rotation/(.+))", [this](const httplib::Request &req, httplib::Response &res)
                  { guarded(res, [&]
                            {
        string name = req.matches[1].str();
        if (!system_.setActiveRotation(name))
        {
            res.status = 404;
            res.set_content(json{{"error", "unknown rotation"}, {"rotation", name}}.dump(), "application/json");
            return;
        }
        res.set_content(json{{"status", "ok"}, {"active_rotation", name}}.dump(), "application/json"); }); });

    server_->Post(R"(/execute/(.+))", [this](const httplib::Request &req, httplib::Response &res)
                  { guarded(res, [&]
                            {
        int status = 200;
        json body = executeJson(req.matches[1].str(), req.body, status);
        res.status = status;
        res.set_content(body.dump(), "application/json"); }); });
}

void StatusService::run()
{
    try
    {
        atomic<bool> listen_done{false};

        // Start server thread
        thread server_thread([&]()
                             {
            log_info("Status server listening on http://0.0.0.0:" + to_string(port_) + "/");
            if (!server_->listen("0.0.0.0", port_))
            {
                log_error("Status server could not listen on port " + to_string(port_));
            }
            listen_done = true; });

        // Keep the event history current while serving
        while (running_)
        {
            drainEvents(100);
        }

        // stop() is a no-op until listen() is actually running
        while (!listen_done && !server_->is_running())
        {
            this_thread::sleep_for(chrono::milliseconds(1));
        }
        server_->stop();
        if (server_thread.joinable())
        {
            server_thread.join();
        }
    }
    catch (const exception &e)
    {
        log_error("Status server error: " + string(e.what()));
    }
}

size_t StatusService::drainEvents(int timeout_ms)
{
    size_t drained = 0;
    SystemEvent event;
    while (subscription_->pop(event, drained == 0 ? timeout_ms : 0))
    {
        lock_guard<mutex> lock(events_mutex_);
        recent_events_.push_back(event);
        if (recent_events_.size() > event_history_)
            recent_events_.pop_front();
        drained++;
    }
    return drained;
}

json StatusService::healthJson() const
{
    return {{"status", "ok"}, {"service", "AbilitySight"}, {"state", toString(system_.state())}};
}

json StatusService::statusJson() const
{
    SystemStats stats = system_.stats();
    SkillBarMapping mapping = system_.barMapping();

    json slots = json::object();
    for (const auto &entry : mapping.detected)
        slots[to_string(entry.first)] = entry.second;

    json rotations = json::array();
    for (const auto &rotation : system_.rotations())
    {
        rotations.push_back({{"name", rotation.name},
                             {"enabled", rotation.enabled},
                             {"position", rotation.current_index},
                             {"length", rotation.abilities.size()},
                             {"dispatched", rotation.dispatched}});
    }

    const ExecutionStats &execution = stats.execution;
    const ClassifierStats &detector = stats.detector;

    return {
        {"state", toString(system_.state())},
        {"profile", system_.activeProfile()},
        {"active_rotation", system_.activeRotation()},
        {"monitoring", system_.isMonitoring()},
        {"bar", {{"region", rectToJson(mapping.bar_region)}, {"slots", mapping.slot_regions.size()}, {"detected", slots}, {"last_scan", toEpochMs(mapping.last_scan)}}},
        {"rotations", rotations},
        {"detection",
         {{"scans", stats.scans},
          {"abilities_detected", stats.abilities_detected},
          {"detection_errors", stats.detection_errors},
          {"monitor_iterations", stats.monitor_iterations},
          {"monitor_errors", stats.monitor_errors},
          {"state_changes", stats.state_changes},
          {"last_scan_ms", stats.last_scan_ms},
          {"detections", detector.detections},
          {"avg_detection_ms", detector.avg_detection_ms},
          {"cache_hits", detector.cache_hits},
          {"cache_misses", detector.cache_misses},
          {"failed_loads", detector.failed_loads},
          {"capture_failures", detector.capture_failures}}},
        {"execution",
         {{"total", execution.total},
          {"successful", execution.successful},
          {"failed", execution.failed},
          {"verified", execution.verified},
          {"retries", execution.retries},
          {"dropped", execution.dropped},
          {"queue_size", execution.queue_size},
          {"avg_latency", execution.avg_latency},
          {"success_rate", execution.success_rate},
          {"verification_rate", execution.verification_rate},
          {"global_cooldown", execution.global_cooldown}}}};
}

json StatusService::abilitiesJson() const
{
    TimePoint now = Clock::now();
    json abilities = json::array();

    for (const auto &ability : system_.abilities())
    {
        abilities.push_back({{"name", ability.name},
                             {"key", ability.key},
                             {"type", toString(ability.type)},
                             {"state", toString(ability.state)},
                             {"confidence", ability.confidence},
                             {"enabled", ability.enabled},
                             {"priority", ability.priority},
                             {"slot", ability.position.slot_index},
                             {"region", rectToJson(ability.position.region)},
                             {"cooldown", ability.cooldown},
                             {"remaining_cooldown", ability.remainingCooldown(now)},
                             {"ready", ability.isReady(now)},
                             {"last_used", toEpochMs(ability.last_used)},
                             {"last_detection", toEpochMs(ability.last_detection)}});
    }

    return abilities;
}

json StatusService::eventsJson(uint64_t since) const
{
    json events = json::array();
    uint64_t latest = since;

    lock_guard<mutex> lock(events_mutex_);
    for (const auto &event : recent_events_)
    {
        if (event.id <= since)
            continue;
        events.push_back(eventToJson(event));
        latest = std::max(latest, event.id);
    }

    return {{"events", events}, {"latest", latest}};
}

json StatusService::scanJson()
{
    json slots = json::object();
    for (const auto &entry : system_.autoDetect())
        slots[to_string(entry.first)] = detectionToJson(entry.second);

    return {{"detected", slots.size()}, {"slots", slots}};
}

json StatusService::executeJson(const string &ability, const string &body, int &status)
{
    ExecutionMode mode = ExecutionMode::IMMEDIATE;
    int priority = 0;
    bool verify = true;

    if (!body.empty())
    {
        try
        {
            json options = json::parse(body);
            mode = executionModeFromString(options.value("mode", string("immediate")));
            priority = options.value("priority", 0);
            verify = options.value("verify", true);
        }
        catch (const json::exception &e)
        {
            status = 400;
            return {{"error", "Invalid JSON: " + string(e.what())}};
        }
        catch (const ConfigError &e)
        {
            status = 400;
            return {{"error", e.what()}};
        }
    }

    Ability info;
    if (!system_.getAbilityInfo(ability, info))
    {
        status = 404;
        return {{"error", "unknown ability"}, {"ability", ability}};
    }

    bool accepted = system_.executeAbility(ability, mode, priority, verify);
    status = accepted ? 202 : 409;
    return {{"ability", ability}, {"mode", toString(mode)}, {"accepted", accepted}};
}

json StatusService::detectionToJson(const DetectionResult &result)
{
    return {{"ability", result.ability},
            {"slot", result.slot_index},
            {"region", rectToJson(result.region)},
            {"state", toString(result.state)},
            {"confidence", result.confidence},
            {"match_confidence", result.match_confidence},
            {"method", toString(result.method)},
            {"detection_time_ms", result.detection_time_ms}};
}

json StatusService::executionToJson(const ExecutionResult &result)
{
    return {{"ability", result.ability},
            {"success", result.success},
            {"execution_time", result.execution_time},
            {"error", result.error_message},
            {"verification_passed", result.verification_passed},
            {"input_delay", result.input_delay},
            {"verification_delay", result.verification_delay},
            {"retry_count", result.retry_count}};
}

json StatusService::eventToJson(const SystemEvent &event)
{
    json j = {{"id", event.id}, {"type", toString(event.type)}, {"timestamp", toEpochMs(event.timestamp)}};

    switch (event.type)
    {
    case EventType::ABILITY_DETECTED:
        j["slot"] = event.slot_index;
        j["detection"] = detectionToJson(event.detection);
        break;
    case EventType::STATE_CHANGED:
        j["ability"] = event.ability;
        j["old_state"] = toString(event.old_state);
        j["new_state"] = toString(event.new_state);
        break;
    case EventType::EXECUTION_COMPLETED:
        j["execution"] = executionToJson(event.execution);
        break;
    case EventType::ROTATION_CHANGED:
        j["rotation"] = event.message;
        break;
    case EventType::PROFILE_CHANGED:
        j["profile"] = event.message;
        break;
    case EventType::ERROR:
        j["message"] = event.message;
        break;
    case EventType::QUEUE_IDLE:
        break;
    }

    return j;
}
