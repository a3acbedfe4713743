#include "recorder/recorder_service.hpp"

#include <exception>
#include <format>
#include <print>
#include <system_error>

void to_json(nlohmann::json& j, const DeviceInfo& d) {
    j = {{"deviceId", d.device_id}, {"label", d.label}};
}

RecorderService::RecorderService(WorkerSpawner spawner, bool verbose)
    : spawner_(std::move(spawner)), verbose_(verbose) {}

// Dropping the link closes the command channel, which ends the worker loop.
RecorderService::~RecorderService() = default;

RecorderResult<RecorderService::Lock> RecorderService::acquire() const {
    try {
        return Lock(mutex_);
    } catch (const std::system_error& e) {
        std::println(stderr, "recorder: failed to acquire lock: {}", e.what());
        return std::unexpected(RecorderError::lock(e.what()));
    }
}

RecorderResult<void> RecorderService::ensure_initialized() {
    auto lock = acquire();
    if (!lock) return std::unexpected(lock.error());

    if (link_) return {};

    log("Audio thread not initialized, spawning worker");
    // A spawner that throws (e.g. bad_alloc for the capture buffer) counts as a failed spawn.
    auto link = [this]() -> std::expected<WorkerLink, std::string> {
        try {
            return spawner_();
        } catch (const std::exception& e) {
            return std::unexpected(e.what());
        }
    }();
    if (!link) {
        std::println(stderr, "recorder: failed to spawn audio thread: {}", link.error());
        return std::unexpected(RecorderError::send(link.error()));
    }

    link_.emplace(std::move(*link));
    log("Audio thread created");
    return {};
}

RecorderResult<AudioResponse> RecorderService::round_trip(WorkerLink& link, AudioCommand cmd) {
    auto name = describe(cmd);

    auto sent = link.commands.send(std::move(cmd));
    if (!sent) {
        std::println(stderr, "recorder: failed to send {}: {}", name, sent.error());
        return std::unexpected(RecorderError::send(sent.error()));
    }

    auto response = link.responses.recv();
    if (!response) {
        std::println(stderr, "recorder: no response to {}: {}", name, response.error());
        return std::unexpected(RecorderError::receive(response.error()));
    }

    return std::move(*response);
}

RecorderError RecorderService::reject(const AudioResponse& response, const std::string& action) {
    if (auto* err = std::get_if<Error>(&response)) {
        std::println(stderr, "recorder: failed to {}: {}", action, err->message);
        return RecorderError::audio(err->message);
    }
    std::println(stderr, "recorder: unexpected response to {}: {}", action, describe(response));
    return RecorderError::audio("Unexpected response");
}

RecorderResult<std::vector<DeviceInfo>> RecorderService::enumerate_recording_devices() {
    return with_worker<std::vector<DeviceInfo>>(
        EnumerateRecordingDevices{},
        [this](AudioResponse response) -> RecorderResult<std::vector<DeviceInfo>> {
            auto* list = std::get_if<RecordingDeviceList>(&response);
            if (!list) return std::unexpected(reject(response, "enumerate devices"));

            log(std::format("Found {} recording devices", list->devices.size()));
            std::vector<DeviceInfo> devices;
            devices.reserve(list->devices.size());
            for (auto& label : list->devices) {
                devices.push_back({.device_id = label, .label = label});
            }
            return devices;
        });
}

RecorderResult<void> RecorderService::init_recording_session(const std::string& device_name) {
    log("Initializing recording session on " + device_name);
    return with_worker<void>(
        InitRecordingSession{device_name},
        [this](AudioResponse response) -> RecorderResult<void> {
            if (!std::holds_alternative<Success>(response)) {
                return std::unexpected(reject(response, "initialize recording session"));
            }
            log("Recording session initialized");
            return {};
        });
}

RecorderResult<void> RecorderService::close_recording_session() {
    return with_worker<void>(
        CloseRecordingSession{},
        [this](AudioResponse response) -> RecorderResult<void> {
            if (!std::holds_alternative<Success>(response)) {
                return std::unexpected(reject(response, "close recording session"));
            }
            recording_ = false;
            log("Recording session closed");
            return {};
        });
}

RecorderResult<void> RecorderService::start_recording() {
    return with_worker<void>(
        StartRecording{},
        [this](AudioResponse response) -> RecorderResult<void> {
            if (!std::holds_alternative<Success>(response)) {
                return std::unexpected(reject(response, "start recording"));
            }
            recording_ = true;
            log("Recording started");
            return {};
        });
}

RecorderResult<std::vector<float>> RecorderService::stop_recording() {
    return with_worker<std::vector<float>>(
        StopRecording{},
        [this](AudioResponse response) -> RecorderResult<std::vector<float>> {
            auto* data = std::get_if<AudioData>(&response);
            if (!data) return std::unexpected(reject(response, "stop recording"));

            recording_ = false;
            log(std::format("Recording stopped ({} samples)", data->samples.size()));
            return std::move(data->samples);
        });
}

RecorderResult<void> RecorderService::cancel_recording() {
    return with_worker<void>(
        StopRecording{},
        [this](AudioResponse response) -> RecorderResult<void> {
            if (!std::holds_alternative<AudioData>(response)) {
                return std::unexpected(reject(response, "cancel recording"));
            }
            recording_ = false;
            log("Recording canceled");
            return {};
        });
}

RecorderResult<void> RecorderService::close_worker() {
    auto lock = acquire();
    if (!lock) return std::unexpected(lock.error());

    if (!link_) {
        log("No audio thread to close");
        return {};
    }

    // Detach first so concurrent callers see no worker rather than a closing one.
    WorkerLink link = std::move(*link_);
    link_.reset();

    auto response = round_trip(link, CloseThread{});
    if (!response) return std::unexpected(response.error());
    if (!std::holds_alternative<Success>(*response)) {
        return std::unexpected(reject(*response, "close audio thread"));
    }

    recording_ = false;
    log("Audio thread closed");
    return {};
}

RecorderResult<bool> RecorderService::is_recording() const {
    auto lock = acquire();
    if (!lock) return std::unexpected(lock.error());
    return recording_;
}

RecorderResult<bool> RecorderService::has_worker() const {
    auto lock = acquire();
    if (!lock) return std::unexpected(lock.error());
    return link_.has_value();
}

void RecorderService::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[micgate] {}", msg);
    }
}
