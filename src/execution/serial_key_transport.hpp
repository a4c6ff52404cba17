#pragma once
#include <mutex>
#include <string>
#include "input_transport.hpp"

// Key presses sent as "KEY <key>\n" lines to a USB HID bridge (8N1, no flow control)
class SerialKeyTransport : public InputTransport
{
public:
    SerialKeyTransport(const std::string &device, int baudrate = 115200);
    ~SerialKeyTransport() override;

    bool open();
    void close();
    bool isOpen() const { return fd_ >= 0; }

    bool sendKey(const std::string &key) override;
    std::string describe() const override { return device_ + " @ " + std::to_string(baudrate_); }

private:
    bool writeLine(const std::string &line);

    std::string device_;
    int baudrate_;
    int fd_ = -1;
    std::mutex mutex_;
};
