#include "platform/linux/pipewire_backend.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

namespace {

// State shared with the registry/core callbacks during one enumeration round trip.
struct Roundtrip {
    pw_main_loop* loop = nullptr;
    int pending = 0;
    std::vector<PipeWireBackend::SourceNode> sources;
    std::string error;
};

void on_registry_global(void* data, uint32_t /*id*/, uint32_t /*permissions*/,
                        const char* type, uint32_t /*version*/, const spa_dict* props) {
    auto* rt = static_cast<Roundtrip*>(data);
    if (!props || std::strcmp(type, PW_TYPE_INTERFACE_Node) != 0) return;

    const char* media_class = spa_dict_lookup(props, PW_KEY_MEDIA_CLASS);
    if (!media_class || std::strcmp(media_class, "Audio/Source") != 0) return;

    const char* name = spa_dict_lookup(props, PW_KEY_NODE_NAME);
    if (!name) return;
    const char* description = spa_dict_lookup(props, PW_KEY_NODE_DESCRIPTION);

    rt->sources.push_back({.node_name = name, .label = description ? description : name});
}

void on_core_done(void* data, uint32_t id, int seq) {
    auto* rt = static_cast<Roundtrip*>(data);
    if (id == PW_ID_CORE && seq == rt->pending) {
        pw_main_loop_quit(rt->loop);
    }
}

void on_core_error(void* data, uint32_t id, int /*seq*/, int res, const char* message) {
    auto* rt = static_cast<Roundtrip*>(data);
    if (id != PW_ID_CORE) return;
    rt->error = std::format("{} ({})", message ? message : "core error", spa_strerror(res));
    pw_main_loop_quit(rt->loop);
}

constexpr pw_registry_events registry_events = {
    .version = PW_VERSION_REGISTRY_EVENTS,
    .global = on_registry_global,
};

constexpr pw_core_events core_events = {
    .version = PW_VERSION_CORE_EVENTS,
    .done = on_core_done,
    .error = on_core_error,
};

} // namespace

PipeWireBackend::PipeWireBackend(uint32_t sample_rate, size_t buffer_samples)
    : ring_buf_(buffer_samples), sample_rate_(sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireBackend::~PipeWireBackend() {
    close();
    pw_deinit();
}

std::expected<std::unique_ptr<AudioBackend>, std::string>
PipeWireBackend::create(uint32_t sample_rate, size_t buffer_samples) {
    auto backend = std::make_unique<PipeWireBackend>(sample_rate, buffer_samples);
    auto reachable = backend->query_sources();
    if (!reachable) return std::unexpected(reachable.error());
    return backend;
}

std::expected<std::vector<PipeWireBackend::SourceNode>, std::string>
PipeWireBackend::query_sources() {
    Roundtrip rt;
    rt.loop = pw_main_loop_new(nullptr);
    if (!rt.loop) return std::unexpected("failed to create PipeWire main loop");

    auto* context = pw_context_new(pw_main_loop_get_loop(rt.loop), nullptr, 0);
    if (!context) {
        pw_main_loop_destroy(rt.loop);
        return std::unexpected("failed to create PipeWire context");
    }

    auto* core = pw_context_connect(context, nullptr, 0);
    if (!core) {
        pw_context_destroy(context);
        pw_main_loop_destroy(rt.loop);
        return std::unexpected("failed to connect to PipeWire");
    }

    auto* registry = pw_core_get_registry(core, PW_VERSION_REGISTRY, 0);
    if (!registry) {
        pw_core_disconnect(core);
        pw_context_destroy(context);
        pw_main_loop_destroy(rt.loop);
        return std::unexpected("failed to get PipeWire registry");
    }

    spa_hook registry_listener{};
    spa_hook core_listener{};
    pw_registry_add_listener(registry, &registry_listener, &registry_events, &rt);
    pw_core_add_listener(core, &core_listener, &core_events, &rt);

    rt.pending = pw_core_sync(core, PW_ID_CORE, 0);
    pw_main_loop_run(rt.loop);

    spa_hook_remove(&core_listener);
    spa_hook_remove(&registry_listener);
    pw_proxy_destroy(reinterpret_cast<pw_proxy*>(registry));
    pw_core_disconnect(core);
    pw_context_destroy(context);
    pw_main_loop_destroy(rt.loop);

    if (!rt.error.empty()) return std::unexpected(rt.error);
    return std::move(rt.sources);
}

std::expected<std::vector<std::string>, std::string> PipeWireBackend::list_devices() {
    auto sources = query_sources();
    if (!sources) {
        std::println(stderr, "audio: device enumeration failed: {}", sources.error());
        return std::unexpected(sources.error());
    }

    std::vector<std::string> labels;
    labels.reserve(sources->size());
    for (auto& s : *sources) labels.push_back(s.label);
    return labels;
}

std::expected<void, std::string> PipeWireBackend::open(const std::string& device_name) {
    if (device_name.empty() || device_name == "default") {
        target_node_.clear();
        session_open_ = true;
        return {};
    }

    auto sources = query_sources();
    if (!sources) return std::unexpected(sources.error());

    // Labels are not guaranteed unique; the first match wins.
    auto it = std::ranges::find_if(*sources, [&](const SourceNode& s) {
        return s.label == device_name;
    });
    if (it == sources->end()) {
        return std::unexpected("Recording device not found: " + device_name);
    }

    target_node_ = it->node_name;
    session_open_ = true;
    return {};
}

std::expected<void, std::string> PipeWireBackend::start() {
    if (!session_open_) return std::unexpected("no device opened");
    if (capturing_.load(std::memory_order_relaxed)) return {};

    loop_ = pw_thread_loop_new("micgate", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: failed to create thread loop");
        return std::unexpected("failed to create PipeWire thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "micgate",
        PW_KEY_APP_NAME, "micgate",
        nullptr
    );
    if (!target_node_.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, target_node_.c_str());
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "micgate-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        std::println(stderr, "audio: failed to create stream");
        destroy_stream();
        return std::unexpected("failed to create PipeWire stream");
    }

    // F32, mono, configured rate
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_F32,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        std::println(stderr, "audio: stream connect failed: {}", spa_strerror(ret));
        destroy_stream();
        return std::unexpected(std::format("stream connect failed: {}", spa_strerror(ret)));
    }

    ring_buf_.clear();
    capturing_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        std::println(stderr, "audio: thread loop start failed: {}", spa_strerror(ret));
        capturing_.store(false, std::memory_order_release);
        destroy_stream();
        return std::unexpected(std::format("thread loop start failed: {}", spa_strerror(ret)));
    }

    return {};
}

std::expected<std::vector<float>, std::string> PipeWireBackend::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) {
        return std::unexpected("capture is not running");
    }

    capturing_.store(false, std::memory_order_release);
    destroy_stream();

    if (auto dropped = ring_buf_.dropped(); dropped > 0) {
        std::println(stderr, "audio: buffer full, dropped {} samples", dropped);
    }
    return ring_buf_.drain();
}

void PipeWireBackend::close() {
    if (capturing_.load(std::memory_order_relaxed)) {
        capturing_.store(false, std::memory_order_release);
        destroy_stream();
        ring_buf_.clear();
    }
    target_node_.clear();
    session_open_ = false;
}

void PipeWireBackend::destroy_stream() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireBackend::on_process(void* userdata) {
    auto* self = static_cast<PipeWireBackend*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const float*>(static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t count = d->chunk->size / sizeof(float);

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_buf_.push(std::span<const float>(data, count));
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireBackend::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
