#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 300;

        // Capture buffer ceiling: 256 MiB of F32 samples.
        static constexpr size_t max_buffer_samples = 64 * 1024 * 1024;

        // Computed from max_seconds and sample_rate (no independent config key).
        size_t ring_buffer_samples() const {
            return static_cast<size_t>(max_seconds) * sample_rate;
        }
    } audio;

    struct Recorder {
        std::string default_device = "default";
    } recorder;

    static Config load(const std::string& path);
    static Config load_default();
};
