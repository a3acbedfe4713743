#pragma once

#include "recorder/audio_worker.hpp"
#include "recorder/protocol.hpp"
#include "recorder/recorder_error.hpp"

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct DeviceInfo {
    std::string device_id;
    std::string label;

    bool operator==(const DeviceInfo&) const = default;
};

void to_json(nlohmann::json& j, const DeviceInfo& d);

// Serializes every caller onto the single audio worker.
//
// The worker is spawned lazily on first use and lives until close_worker().
// One mutex guards the worker link and the recording flag, and is held for
// the full send/receive round trip, so at most one command is ever
// outstanding and commands reach the worker in lock-acquisition order.
class RecorderService {
public:
    explicit RecorderService(WorkerSpawner spawner, bool verbose = false);
    ~RecorderService();

    RecorderService(const RecorderService&) = delete;
    RecorderService& operator=(const RecorderService&) = delete;

    // Spawns the worker if none is running. A failed spawn leaves the
    // registry empty so a later call can retry.
    RecorderResult<void> ensure_initialized();

    RecorderResult<std::vector<DeviceInfo>> enumerate_recording_devices();
    RecorderResult<void> init_recording_session(const std::string& device_name);
    RecorderResult<void> close_recording_session();
    RecorderResult<void> start_recording();
    RecorderResult<std::vector<float>> stop_recording();
    // Same worker command as stop_recording(); the captured audio is dropped.
    RecorderResult<void> cancel_recording();

    // Detaches the worker, tells it to exit and waits for it. No-op without one.
    RecorderResult<void> close_worker();

    RecorderResult<bool> is_recording() const;
    RecorderResult<bool> has_worker() const;

private:
    using Lock = std::unique_lock<std::mutex>;

    RecorderResult<Lock> acquire() const;

    // Sends one command and waits for its response. Caller holds the lock.
    static RecorderResult<AudioResponse> round_trip(WorkerLink& link, AudioCommand cmd);

    template <typename T, typename Interpret>
    RecorderResult<T> with_worker(AudioCommand cmd, Interpret interpret);

    // Maps a response that is not the expected success variant.
    RecorderError reject(const AudioResponse& response, const std::string& action);

    void log(const std::string& msg);

    WorkerSpawner spawner_;
    bool verbose_;

    mutable std::mutex mutex_;
    std::optional<WorkerLink> link_;
    bool recording_ = false;
};

template <typename T, typename Interpret>
RecorderResult<T> RecorderService::with_worker(AudioCommand cmd, Interpret interpret) {
    if (auto ready = ensure_initialized(); !ready) {
        return std::unexpected(ready.error());
    }

    auto lock = acquire();
    if (!lock) return std::unexpected(lock.error());

    if (!link_) return std::unexpected(RecorderError::thread_not_initialized());

    auto response = round_trip(*link_, std::move(cmd));
    if (!response) return std::unexpected(response.error());

    return interpret(std::move(*response));
}
