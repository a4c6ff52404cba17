#pragma once
#include <atomic>
#include <string>

// Delivers one key press to the game client
class InputTransport
{
public:
    virtual ~InputTransport() = default;

    // False when the key could not be delivered; never throws for delivery problems
    virtual bool sendKey(const std::string &key) = 0;

    virtual std::string describe() const = 0;
};

// Logs key presses without sending anything
class DryRunTransport : public InputTransport
{
public:
    bool sendKey(const std::string &key) override;
    std::string describe() const override { return "dry-run"; }

    uint64_t sent() const { return sent_; }

private:
    std::atomic<uint64_t> sent_{0};
};
