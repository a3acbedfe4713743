#pragma once

#include "platform/audio_backend.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>
#include <vector>

// Captures mono F32 audio from a PipeWire Audio/Source node.
class PipeWireBackend : public AudioBackend {
public:
    PipeWireBackend(uint32_t sample_rate, size_t buffer_samples);
    ~PipeWireBackend() override;

    PipeWireBackend(const PipeWireBackend&) = delete;
    PipeWireBackend& operator=(const PipeWireBackend&) = delete;

    // Fails when no PipeWire daemon is reachable.
    static std::expected<std::unique_ptr<AudioBackend>, std::string>
        create(uint32_t sample_rate, size_t buffer_samples);

    std::expected<std::vector<std::string>, std::string> list_devices() override;
    std::expected<void, std::string> open(const std::string& device_name) override;
    std::expected<void, std::string> start() override;
    std::expected<std::vector<float>, std::string> stop() override;
    void close() override;

    struct SourceNode {
        std::string node_name;
        std::string label;
    };

private:
    std::expected<std::vector<SourceNode>, std::string> query_sources();
    void destroy_stream();

    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    RingBuffer ring_buf_;
    uint32_t sample_rate_;
    std::string target_node_;
    bool session_open_ = false;
    std::atomic<bool> capturing_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
