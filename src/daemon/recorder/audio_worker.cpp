#include "recorder/audio_worker.hpp"

#include <exception>
#include <format>
#include <print>
#include <system_error>
#include <type_traits>
#include <utility>

AudioWorker::AudioWorker(std::unique_ptr<AudioBackend> backend, Receiver<AudioCommand> commands,
                         Sender<AudioResponse> responses, bool verbose)
    : backend_(std::move(backend)), commands_(std::move(commands)),
      responses_(std::move(responses)), verbose_(verbose) {}

void AudioWorker::run() {
    log("Audio worker started");

    while (true) {
        auto cmd = commands_.recv();
        if (!cmd) {
            log("Command channel closed, audio worker exiting");
            break;
        }

        log("Received command: " + describe(*cmd));
        bool closing = std::holds_alternative<CloseThread>(*cmd);

        auto sent = responses_.send(handle(*cmd));
        if (!sent) {
            std::println(stderr, "worker: failed to send response: {}", sent.error());
            break;
        }
        if (closing) break;
    }

    shutdown();
}

AudioResponse AudioWorker::handle(const AudioCommand& cmd) {
    try {
        return std::visit([this](const auto& c) -> AudioResponse {
            using C = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<C, EnumerateRecordingDevices>) return on_enumerate();
            else if constexpr (std::is_same_v<C, InitRecordingSession>) return on_init(c.device_name);
            else if constexpr (std::is_same_v<C, CloseRecordingSession>) return on_close_session();
            else if constexpr (std::is_same_v<C, StartRecording>) return on_start();
            else if constexpr (std::is_same_v<C, StopRecording>) return on_stop();
            else return on_close_thread();
        }, cmd);
    } catch (const std::exception& e) {
        std::println(stderr, "worker: {} failed: {}", describe(cmd), e.what());
        return Error{e.what()};
    }
}

AudioResponse AudioWorker::on_enumerate() {
    auto devices = backend_->list_devices();
    if (!devices) return Error{devices.error()};
    log(std::format("Found {} recording devices", devices->size()));
    return RecordingDeviceList{std::move(*devices)};
}

AudioResponse AudioWorker::on_init(const std::string& device_name) {
    if (state_ != State::Uninitialized) {
        return Error{"Recording session already active"};
    }
    auto opened = backend_->open(device_name);
    if (!opened) return Error{opened.error()};

    state_ = State::Ready;
    log("Recording session opened on " + device_name);
    return Success{};
}

AudioResponse AudioWorker::on_close_session() {
    if (state_ == State::Uninitialized) {
        return Error{"No active recording session"};
    }
    if (state_ == State::Recording) {
        // Closing mid-capture discards whatever was recorded.
        auto discarded = backend_->stop();
        if (!discarded) {
            std::println(stderr, "worker: stopping capture on close: {}", discarded.error());
        }
    }
    backend_->close();
    state_ = State::Uninitialized;
    log("Recording session closed");
    return Success{};
}

AudioResponse AudioWorker::on_start() {
    if (state_ == State::Uninitialized) return Error{"No active recording session"};
    if (state_ == State::Recording) return Error{"Already recording"};

    auto started = backend_->start();
    if (!started) return Error{started.error()};

    state_ = State::Recording;
    return Success{};
}

AudioResponse AudioWorker::on_stop() {
    if (state_ != State::Recording) return Error{"No active recording"};

    auto samples = backend_->stop();
    state_ = State::Ready;
    if (!samples) return Error{samples.error()};

    log(std::format("Captured {} samples", samples->size()));
    return AudioData{std::move(*samples)};
}

AudioResponse AudioWorker::on_close_thread() {
    shutdown();
    return Success{};
}

void AudioWorker::shutdown() {
    if (state_ == State::Recording) {
        auto discarded = backend_->stop();
        if (!discarded) {
            std::println(stderr, "worker: stopping capture on shutdown: {}", discarded.error());
        }
    }
    if (state_ != State::Uninitialized) {
        backend_->close();
        state_ = State::Uninitialized;
    }
}

void AudioWorker::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[micgate] worker: {}", msg);
    }
}

std::expected<WorkerLink, std::string> spawn_audio_worker(const BackendFactory& factory,
                                                          bool verbose) {
    std::expected<std::unique_ptr<AudioBackend>, std::string> backend;
    try {
        backend = factory();
    } catch (const std::exception& e) {
        return std::unexpected(std::format("failed to create audio backend: {}", e.what()));
    }
    if (!backend) return std::unexpected(backend.error());

    auto [command_tx, command_rx] = make_channel<AudioCommand>();
    auto [response_tx, response_rx] = make_channel<AudioResponse>();

    AudioWorker worker(std::move(*backend), std::move(command_rx), std::move(response_tx), verbose);

    std::jthread thread;
    try {
        thread = std::jthread([worker = std::move(worker)]() mutable { worker.run(); });
    } catch (const std::system_error& e) {
        return std::unexpected(std::format("failed to start audio thread: {}", e.what()));
    }

    return WorkerLink{std::move(thread), std::move(command_tx), std::move(response_rx)};
}
