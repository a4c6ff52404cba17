#pragma once
#include <iostream>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include "logging.hpp"

namespace debug
{

    // Runtime settings shown at startup
    struct RunConfig
    {
        std::string profiles;
        std::string class_name;
        std::string rotation;
        std::string source;
        cv::Rect bar;
        int slots = 10;
        std::string transport;
        int port = 13520;
        bool stream = false;
        bool auto_rotation = false;
    };

    // Print application startup banner
    inline void printStartup(const std::string &appName, const std::string &version)
    {
        std::cout << "=====================================\n";
        std::cout << "  " << appName << " v" << version << " starting...\n";
        std::cout << "=====================================\n";
    }

    // Print configuration details
    inline void printConfig(const RunConfig &config)
    {
        std::cout << "Configuration:\n";
        std::cout << "  - Profiles: " << config.profiles << "\n";
        std::cout << "  - Class: " << (config.class_name.empty() ? "(first loaded)" : config.class_name) << "\n";
        std::cout << "  - Rotation: " << (config.rotation.empty() ? "(profile default)" : config.rotation) << "\n";
        std::cout << "  - Source: " << config.source << "\n";
        if (config.bar.area() > 0)
        {
            std::cout << "  - Skill bar: " << config.bar.x << "," << config.bar.y << " " << config.bar.width << "x"
                      << config.bar.height << " (" << config.slots << " slots)\n";
        }
        else
        {
            std::cout << "  - Skill bar: from profile\n";
        }
        std::cout << "  - Input: " << config.transport << "\n";
        std::cout << "  - Status port: " << config.port << "\n";
        std::cout << "  - Stream: " << (config.stream ? "on" : "off") << "\n";
        std::cout << "  - Auto rotation: " << (config.auto_rotation ? "on" : "off") << "\n";
        std::cout << "-------------------------------------" << std::endl;
    }

    // Print version information and exit
    inline void printVersionAndExit(const std::string &version)
    {
        std::cout << "AbilitySight runtime version: " << version << std::endl;
        exit(0);
    }

    // Print help message and exit
    inline void printHelpAndExit()
    {
        std::cout << "Usage: abilitysight [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --profiles <paths>   Comma-separated profile files or directories (default: profiles)\n";
        std::cout << "  --class <name>       Class profile to activate (default: first loaded)\n";
        std::cout << "  --rotation <name>    Rotation to activate (default: profile's active_rotation)\n";
        std::cout << "  --source <src>       Capture device, video file or screenshot (default: /dev/video0)\n";
        std::cout << "  --width <width>      Capture width (default: 1920)\n";
        std::cout << "  --height <height>    Capture height (default: 1080)\n";
        std::cout << "  --fps <fps>          Capture frames per second (default: 30)\n";
        std::cout << "  --bar <x,y,w,h>      Skill bar region (default: from profile)\n";
        std::cout << "  --slots <n>          Number of slots in the bar (default: 10)\n";
        std::cout << "  --serial <device>    Serial keyboard bridge, e.g. /dev/ttyACM0\n";
        std::cout << "  --baud <rate>        Serial baud rate (default: 115200)\n";
        std::cout << "  --dry-run            Log key presses instead of sending them (default without --serial)\n";
        std::cout << "  --port <port>        Status service port (default: 13520)\n";
        std::cout << "  --stream             Stream the annotated bar as MJPEG on port 8080\n";
        std::cout << "  --auto               Run the active rotation continuously\n";
        std::cout << "  --rescan             Ignore the cached slot layout and scan the bar\n";
        std::cout << "  --debug, -d          Enable debug mode (saves crops to debug_frames/ directory)\n";
        std::cout << "  --quiet, -q          Quiet mode (only show errors)\n";
        std::cout << "  --version            Show version information\n";
        std::cout << "  --help               Show this help message\n";
        exit(0);
    }

    // Label one frame for the debug stream
    inline cv::Mat labelFrame(const cv::Mat &frame, const std::string &label)
    {
        if (frame.empty())
            return cv::Mat();

        cv::Mat labelled = frame.clone();
        cv::putText(labelled, label, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(0, 255, 0), 2);
        return labelled;
    }

} // namespace debug
