#include "coordinator/skill_system.hpp"
#include "communication/status_service.hpp"
#include "capture/cached_screen_capture.hpp"
#include "capture/frame_grabbers.hpp"
#include "config/profile_loader.hpp"
#include "config/layout_cache.hpp"
#include "execution/serial_key_transport.hpp"
#include "utils/args.hpp"
#include "utils/debug.hpp"
#include "utils/signals.hpp"
#include "utils/logging.hpp"
#include "utils/overlay.hpp"
#include "utils/streamer.hpp"
#include <iostream>
#include <vector>
#include <string>
#include <thread>
#include <chrono>
#include <memory>

using namespace std;

// version string for the application
const string version = "0.3.0";

int main(int argc, char **argv)
{
  // Check for help or version flags first
  if (hasFlag(argc, argv, "--version"))
    debug::printVersionAndExit(version);
  if (hasFlag(argc, argv, "--help"))
    debug::printHelpAndExit();

  debug::RunConfig config;
  int width, height, fps, baud;
  string serial_device;
  bool rescan;

  // Parse command line arguments with defaults
  try
  {
    config.profiles = getArg(argc, argv, "--profiles", "profiles");
    config.class_name = getArg(argc, argv, "--class", "");
    config.rotation = getArg(argc, argv, "--rotation", "");
    config.source = getArg(argc, argv, "--source", "/dev/video0");
    config.bar = getArgRect(argc, argv, "--bar");
    config.slots = getArg(argc, argv, "--slots", 10);
    config.port = getArg(argc, argv, "--port", 13520);
    config.stream = hasFlag(argc, argv, "--stream");
    config.auto_rotation = hasFlag(argc, argv, "--auto");
    width = getArg(argc, argv, "--width", 1920);
    height = getArg(argc, argv, "--height", 1080);
    fps = getArg(argc, argv, "--fps", 30);
    baud = getArg(argc, argv, "--baud", 115200);
    serial_device = getArg(argc, argv, "--serial", "");
    rescan = hasFlag(argc, argv, "--rescan");
  }
  catch (const exception &e)
  {
    cerr << "Invalid arguments: " << e.what() << endl;
    return 1;
  }

  bool dry_run = hasFlag(argc, argv, "--dry-run") || serial_device.empty();
  bool debug_mode = hasFlag(argc, argv, "--debug") || hasFlag(argc, argv, "-d");
  bool quiet_mode = hasFlag(argc, argv, "--quiet") || hasFlag(argc, argv, "-q");

  // set log level based on debug mode
  if (debug_mode)
  {
    logging::setLogLevel(logging::LogLevel::DEBUG); // Show everything
    logging::setFileLogging(true);
    log_info("Debug mode enabled - showing all log messages");
  }
  else if (quiet_mode)
  {
    logging::setLogLevel(logging::LogLevel::ERROR); // Only errors
  }

  // Profiles first, nothing else is useful without one
  vector<ClassProfile> profiles;
  try
  {
    for (const auto &path : getArgVector(argc, argv, "--profiles", "profiles"))
    {
      auto loaded = profile_loader::loadPath(path);
      profiles.insert(profiles.end(), loaded.begin(), loaded.end());
    }
  }
  catch (const ConfigError &e)
  {
    log_error(e.what());
    return 1;
  }
  if (profiles.empty())
  {
    log_error("No usable profiles found in " + config.profiles);
    return 1;
  }
  if (config.class_name.empty())
    config.class_name = profiles.front().class_name;

  // Key presses go to the serial bridge, or nowhere in dry-run mode
  shared_ptr<InputTransport> transport;
  if (dry_run)
  {
    transport = make_shared<DryRunTransport>();
  }
  else
  {
    auto serial = make_shared<SerialKeyTransport>(serial_device, baud);
    if (!serial->open())
    {
      log_error("Could not open serial bridge " + serial_device);
      return 1;
    }
    transport = serial;
  }
  config.transport = transport->describe();

  // Print startup and configuration information
  debug::printStartup("AbilitySight", version);
  debug::printConfig(config);

  // Full frames from a device, recording or screenshot, cropped per slot
  shared_ptr<FrameGrabber> grabber;
  if (camera::isImageFile(config.source))
    grabber = make_shared<ImageFrameGrabber>(config.source);
  else
    grabber = make_shared<VideoFrameGrabber>(config.source, width, height, fps);

  if (!grabber->initialize())
  {
    log_error("Could not open capture source " + grabber->describe());
    return 1;
  }
  auto capture = make_shared<CachedScreenCapture>(grabber);

  SkillSystem system(capture, transport, debug_mode);
  for (const auto &profile : profiles)
  {
    try
    {
      system.addProfile(profile);
    }
    catch (const ConfigError &e)
    {
      log_error(e.what());
    }
  }

  bool initialized = config.bar.area() > 0 ? system.initialize(config.class_name, config.bar, config.slots)
                                           : system.initialize(config.class_name);
  if (!initialized)
  {
    log_error("Could not activate profile " + config.class_name);
    return 1;
  }

  SkillBarMapping mapping = system.barMapping();
  if (mapping.slot_regions.empty())
  {
    log_error("No skill bar region: pass --bar x,y,w,h or set skill_bar in the profile");
    return 1;
  }

  if (!config.rotation.empty() && !system.setActiveRotation(config.rotation))
  {
    log_warning("Unknown rotation " + config.rotation + ", keeping " + system.activeRotation());
  }

  // Reuse the last layout for this geometry, otherwise scan and remember it
  map<int, string> layout;
  if (!rescan && cache::layout::load(config.class_name, mapping.bar_region, (int)mapping.slot_regions.size(), layout) &&
      system.applyLayout(layout))
  {
    log_info("Using cached layout, skipping the initial scan");
  }
  else
  {
    auto detected = system.autoDetect();
    log_info("Initial scan bound " + to_string(detected.size()) + " abilities");
    if (!detected.empty())
      cache::layout::save(config.class_name, system.barMapping());
  }

  StatusService status(system, config.port);
  status.start();

  if (!system.start())
  {
    log_error("Skill system failed to start");
    status.stop();
    return 1;
  }

  // Register signal handlers; the main loop below notices and stops everything
  signals::setupSignalHandlers();

  unique_ptr<FrameStreamer> streamer;
  if (config.stream)
    streamer = make_unique<FrameStreamer>(8080, 10);

  double poll = max(0.01, system.detectionConfig().scan_interval);
  auto period = chrono::duration_cast<chrono::milliseconds>(chrono::duration<double>(poll));

  while (!signals::stopRequested())
  {
    if (config.auto_rotation)
      system.executeRotation();

    if (streamer)
    {
      cv::Mat frame;
      if (capture->frame(frame))
      {
        SkillBarMapping current = system.barMapping();
        cv::Mat annotated = overlay::drawBar(frame, current, system.abilities());
        streamer->push(debug::labelFrame(overlay::cropBar(annotated, current.bar_region),
                                         system.activeRotation()));
      }
    }

    this_thread::sleep_for(period);
  }

  log_warning("Received signal " + log_string(signals::lastSignal()) + ", shutting down...");
  system.stop();
  status.stop();

  SystemStats stats = system.stats();
  log_info("Executed " + log_string(stats.execution.total) + " requests, " + log_string(stats.execution.successful) +
           " successful, " + log_string(stats.scans) + " scans");

  return 0;
}
