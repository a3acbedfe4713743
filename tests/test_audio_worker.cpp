#include <catch2/catch_test_macros.hpp>

#include "recorder/audio_worker.hpp"

#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <vector>

namespace {

// What the fake backend was asked to do, shared with the test after the
// backend itself moves into the worker thread.
struct BackendLog {
    std::mutex mutex;
    std::vector<std::string> calls;
    std::vector<std::string> devices = {"Built-in Audio", "USB Microphone"};
    std::vector<float> captured = {0.25f, -0.25f};

    void add(std::string call) {
        std::lock_guard lock(mutex);
        calls.push_back(std::move(call));
    }

    std::vector<std::string> snapshot() {
        std::lock_guard lock(mutex);
        return calls;
    }
};

class FakeBackend : public AudioBackend {
public:
    explicit FakeBackend(std::shared_ptr<BackendLog> log) : log_(std::move(log)) {}

    std::expected<std::vector<std::string>, std::string> list_devices() override {
        log_->add("list");
        return log_->devices;
    }

    std::expected<void, std::string> open(const std::string& device_name) override {
        log_->add("open " + device_name);
        if (device_name == "default" || device_name.empty()) return {};
        for (auto& d : log_->devices) {
            if (d == device_name) return {};
        }
        return std::unexpected("Recording device not found: " + device_name);
    }

    std::expected<void, std::string> start() override {
        log_->add("start");
        return {};
    }

    std::expected<std::vector<float>, std::string> stop() override {
        log_->add("stop");
        return log_->captured;
    }

    void close() override { log_->add("close"); }

private:
    std::shared_ptr<BackendLog> log_;
};

struct Harness {
    std::shared_ptr<BackendLog> log = std::make_shared<BackendLog>();
    WorkerLink link;

    Harness() : link(spawn()) {}

    WorkerLink spawn() {
        auto spawned = spawn_audio_worker([log = log]() -> std::expected<std::unique_ptr<AudioBackend>, std::string> {
            return std::make_unique<FakeBackend>(log);
        });
        REQUIRE(spawned.has_value());
        return std::move(*spawned);
    }

    AudioResponse ask(AudioCommand cmd) {
        REQUIRE(link.commands.send(std::move(cmd)));
        auto response = link.responses.recv();
        REQUIRE(response.has_value());
        return std::move(*response);
    }
};

std::string error_of(const AudioResponse& response) {
    auto* err = std::get_if<Error>(&response);
    REQUIRE(err != nullptr);
    return err->message;
}

} // namespace

TEST_CASE("AudioWorker state machine", "[worker]") {
    Harness h;

    SECTION("EnumerateAnyTime") {
        auto response = h.ask(EnumerateRecordingDevices{});
        auto* list = std::get_if<RecordingDeviceList>(&response);
        REQUIRE(list != nullptr);
        REQUIRE(list->devices == std::vector<std::string>{"Built-in Audio", "USB Microphone"});
    }

    SECTION("FullRecordingCycle") {
        REQUIRE(std::holds_alternative<Success>(h.ask(InitRecordingSession{"USB Microphone"})));
        REQUIRE(std::holds_alternative<Success>(h.ask(StartRecording{})));

        auto response = h.ask(StopRecording{});
        auto* data = std::get_if<AudioData>(&response);
        REQUIRE(data != nullptr);
        REQUIRE(data->samples == std::vector<float>{0.25f, -0.25f});

        // Session stays open, so a second take works.
        REQUIRE(std::holds_alternative<Success>(h.ask(StartRecording{})));
        REQUIRE(std::holds_alternative<AudioData>(h.ask(StopRecording{})));
        REQUIRE(std::holds_alternative<Success>(h.ask(CloseRecordingSession{})));

        REQUIRE(h.log->snapshot() == std::vector<std::string>{
            "open USB Microphone", "start", "stop", "start", "stop", "close"});
    }

    SECTION("UnknownDevice") {
        REQUIRE(error_of(h.ask(InitRecordingSession{"Nope"})) == "Recording device not found: Nope");
        // Still uninitialized.
        REQUIRE(error_of(h.ask(StartRecording{})) == "No active recording session");
    }

    SECTION("DoubleInit") {
        REQUIRE(std::holds_alternative<Success>(h.ask(InitRecordingSession{"default"})));
        REQUIRE(error_of(h.ask(InitRecordingSession{"default"})) == "Recording session already active");
    }

    SECTION("StartWithoutSession") {
        REQUIRE(error_of(h.ask(StartRecording{})) == "No active recording session");
    }

    SECTION("StartTwice") {
        REQUIRE(std::holds_alternative<Success>(h.ask(InitRecordingSession{"default"})));
        REQUIRE(std::holds_alternative<Success>(h.ask(StartRecording{})));
        REQUIRE(error_of(h.ask(StartRecording{})) == "Already recording");
    }

    SECTION("StopWithoutRecording") {
        REQUIRE(error_of(h.ask(StopRecording{})) == "No active recording");
        REQUIRE(std::holds_alternative<Success>(h.ask(InitRecordingSession{"default"})));
        REQUIRE(error_of(h.ask(StopRecording{})) == "No active recording");
    }

    SECTION("CloseWithoutSession") {
        REQUIRE(error_of(h.ask(CloseRecordingSession{})) == "No active recording session");
    }

    SECTION("CloseWhileRecordingDiscards") {
        REQUIRE(std::holds_alternative<Success>(h.ask(InitRecordingSession{"default"})));
        REQUIRE(std::holds_alternative<Success>(h.ask(StartRecording{})));
        REQUIRE(std::holds_alternative<Success>(h.ask(CloseRecordingSession{})));
        REQUIRE(h.log->snapshot() == std::vector<std::string>{"open default", "start", "stop", "close"});

        REQUIRE(error_of(h.ask(StopRecording{})) == "No active recording");
    }
}

TEST_CASE("AudioWorker lifetime", "[worker]") {

    SECTION("CloseThreadEndsWorker") {
        Harness h;
        REQUIRE(std::holds_alternative<Success>(h.ask(InitRecordingSession{"default"})));
        REQUIRE(std::holds_alternative<Success>(h.ask(StartRecording{})));
        REQUIRE(std::holds_alternative<Success>(h.ask(CloseThread{})));

        h.link.thread.join();
        REQUIRE(h.log->snapshot() == std::vector<std::string>{"open default", "start", "stop", "close"});

        // The worker's receiver is gone.
        REQUIRE_FALSE(h.link.commands.send(StartRecording{}));
    }

    SECTION("DroppedSenderEndsWorker") {
        Harness h;
        REQUIRE(std::holds_alternative<Success>(h.ask(InitRecordingSession{"default"})));

        { auto gone = std::move(h.link.commands); }
        h.link.thread.join();

        REQUIRE(h.log->snapshot() == std::vector<std::string>{"open default", "close"});
        REQUIRE_FALSE(h.link.responses.recv());
    }

    SECTION("FactoryFailure") {
        auto spawned = spawn_audio_worker([]() -> std::expected<std::unique_ptr<AudioBackend>, std::string> {
            return std::unexpected("PipeWire unavailable");
        });
        REQUIRE_FALSE(spawned);
        REQUIRE(spawned.error() == "PipeWire unavailable");
    }

    SECTION("ThrowingFactory") {
        auto spawned = spawn_audio_worker([]() -> std::expected<std::unique_ptr<AudioBackend>, std::string> {
            throw std::bad_alloc();
        });
        REQUIRE_FALSE(spawned);
        REQUIRE(spawned.error().starts_with("failed to create audio backend: "));
    }
}
