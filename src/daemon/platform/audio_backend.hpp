#pragma once

#include <expected>
#include <string>
#include <vector>

// Exclusive access to a capture device. Only ever driven from the audio
// worker thread.
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    // Labels of the capture devices currently available.
    virtual std::expected<std::vector<std::string>, std::string> list_devices() = 0;

    // Bind to a device by label; "default" or "" selects the system default.
    virtual std::expected<void, std::string> open(const std::string& device_name) = 0;
    virtual std::expected<void, std::string> start() = 0;
    // Stops capture and returns everything captured since start().
    virtual std::expected<std::vector<float>, std::string> stop() = 0;
    virtual void close() = 0;
};
