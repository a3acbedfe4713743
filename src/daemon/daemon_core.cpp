#include "daemon_core.hpp"

#include "wav_encoder.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <print>

DaemonCore::DaemonCore(Config config, bool verbose, RecorderService& recorder)
    : config_(std::move(config)), verbose_(verbose), recorder_(recorder) {}

DaemonCore::~DaemonCore() = default;

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "devices") return handle_devices(cmd);
    if (cmd_str == "init") return handle_init(cmd);
    if (cmd_str == "close") return handle_close(cmd);
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "cancel") return handle_cancel(cmd);
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "shutdown") return handle_shutdown(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_devices(const nlohmann::json& /*cmd*/) {
    auto devices = recorder_.enumerate_recording_devices();
    if (!devices) return error_response(devices.error());
    return {{"status", "ok"}, {"devices", *devices}};
}

nlohmann::json DaemonCore::handle_init(const nlohmann::json& cmd) {
    auto device = cmd.value("device", config_.recorder.default_device);
    log("Opening recording session on " + device);
    auto result = recorder_.init_recording_session(device);
    if (result) session_open_ = true;
    return ok_or_error(result);
}

nlohmann::json DaemonCore::handle_close(const nlohmann::json& /*cmd*/) {
    auto result = recorder_.close_recording_session();
    if (result) session_open_ = false;
    return ok_or_error(result);
}

nlohmann::json DaemonCore::handle_start(const nlohmann::json& /*cmd*/) {
    auto result = recorder_.start_recording();
    if (result) log("Recording started");
    return ok_or_error(result);
}

nlohmann::json DaemonCore::handle_stop(const nlohmann::json& cmd) {
    auto samples = recorder_.stop_recording();
    if (!samples) return error_response(samples.error());

    double duration = static_cast<double>(samples->size()) / config_.audio.sample_rate;
    log(std::format("Recording stopped, {:.1f}s audio", duration));

    nlohmann::json resp = {
        {"status", "ok"},
        {"sample_count", samples->size()},
        {"sample_rate", config_.audio.sample_rate},
        {"duration", duration},
    };

    if (cmd.value("samples", false)) {
        resp["samples"] = *samples;
    }

    auto output = cmd.value("output", std::string{});
    if (!output.empty()) {
        auto written = write_wav(output, *samples);
        if (!written) {
            // The worker has already handed the audio over; keep what we can in the reply.
            auto err = error_response(RecorderError::audio(written.error()));
            for (auto& item : resp.items()) {
                if (item.key() != "status") err[item.key()] = item.value();
            }
            return err;
        }
        resp["path"] = output;
    }
    return resp;
}

nlohmann::json DaemonCore::handle_cancel(const nlohmann::json& /*cmd*/) {
    auto result = recorder_.cancel_recording();
    if (result) log("Recording canceled");
    return ok_or_error(result);
}

// Starts recording, opening a session first if needed, or stops the current one.
// The session stays open after a stop so the next toggle starts immediately.
nlohmann::json DaemonCore::handle_toggle(const nlohmann::json& cmd) {
    auto recording = recorder_.is_recording();
    if (!recording) return error_response(recording.error());

    if (*recording) {
        auto resp = handle_stop(cmd);
        if (auto still = recorder_.is_recording()) resp["recording"] = *still;
        return resp;
    }

    auto worker = recorder_.has_worker();
    if (!worker) return error_response(worker.error());
    if (!*worker) session_open_ = false;

    if (!session_open_) {
        auto opened = handle_init(cmd);
        if (opened["status"] != "ok") return opened;
    }

    auto started = recorder_.start_recording();
    if (!started) {
        // The session may have been lost with a worker; reopen it next time.
        session_open_ = false;
        return error_response(started.error());
    }
    log("Recording started");
    return {{"status", "ok"}, {"recording", true}};
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    auto recording = recorder_.is_recording();
    if (!recording) return error_response(recording.error());
    auto worker = recorder_.has_worker();
    if (!worker) return error_response(worker.error());

    return {{"status", "ok"}, {"recording", *recording}, {"worker", *worker}};
}

nlohmann::json DaemonCore::handle_shutdown(const nlohmann::json& /*cmd*/) {
    auto result = recorder_.close_worker();
    if (result) session_open_ = false;
    return ok_or_error(result);
}

void DaemonCore::shutdown() {
    session_open_ = false;
    auto closed = recorder_.close_worker();
    if (!closed) {
        std::println(stderr, "Failed to close audio worker: {}", closed.error().message());
    }
}

nlohmann::json DaemonCore::error_response(const RecorderError& err) {
    return {{"status", "error"}, {"message", err.message()}, {"error", err}};
}

nlohmann::json DaemonCore::ok_or_error(const RecorderResult<void>& result) {
    if (!result) return error_response(result.error());
    return {{"status", "ok"}};
}

std::expected<void, std::string> DaemonCore::write_wav(const std::string& path,
                                                       std::span<const float> samples) {
    if (!wav::fits(samples.size())) {
        std::println(stderr, "wav: {} samples exceed the WAV size limit", samples.size());
        return std::unexpected(std::format("recording too long for a WAV file: {}", path));
    }
    auto bytes = wav::encode(samples, config_.audio.sample_rate);

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        std::println(stderr, "wav: could not open {}: {}", path, std::strerror(errno));
        return std::unexpected(std::format("failed to write {}: {}", path, std::strerror(errno)));
    }
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) {
        std::println(stderr, "wav: write to {} failed", path);
        return std::unexpected(std::format("failed to write {}", path));
    }

    log(std::format("Wrote {} bytes to {}", bytes.size(), path));
    return {};
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[micgate] {}", msg);
    }
}
