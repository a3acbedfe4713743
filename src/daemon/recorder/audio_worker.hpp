#pragma once

#include "platform/audio_backend.hpp"
#include "recorder/channel.hpp"
#include "recorder/protocol.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <thread>

// Endpoints of one live worker. Members are destroyed in reverse order: the
// channels close first, which ends the worker loop, then the thread joins.
struct WorkerLink {
    std::jthread thread;
    Sender<AudioCommand> commands;
    Receiver<AudioResponse> responses;
};

using BackendFactory = std::function<std::expected<std::unique_ptr<AudioBackend>, std::string>()>;
using WorkerSpawner = std::function<std::expected<WorkerLink, std::string>()>;

// Owns the capture backend and answers one command at a time.
class AudioWorker {
public:
    AudioWorker(std::unique_ptr<AudioBackend> backend, Receiver<AudioCommand> commands,
                Sender<AudioResponse> responses, bool verbose = false);

    AudioWorker(AudioWorker&&) = default;

    // Processes commands until CloseThread or until every command sender is gone.
    void run();

private:
    enum class State { Uninitialized, Ready, Recording };

    AudioResponse handle(const AudioCommand& cmd);

    AudioResponse on_enumerate();
    AudioResponse on_init(const std::string& device_name);
    AudioResponse on_close_session();
    AudioResponse on_start();
    AudioResponse on_stop();
    AudioResponse on_close_thread();

    void shutdown();
    void log(const std::string& msg);

    std::unique_ptr<AudioBackend> backend_;
    Receiver<AudioCommand> commands_;
    Sender<AudioResponse> responses_;
    bool verbose_;
    State state_ = State::Uninitialized;
};

// Creates the channel pair, builds the backend and starts the worker thread.
std::expected<WorkerLink, std::string> spawn_audio_worker(const BackendFactory& factory,
                                                          bool verbose = false);
