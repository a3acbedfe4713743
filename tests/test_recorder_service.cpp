#include <catch2/catch_test_macros.hpp>

#include "recorder/recorder_service.hpp"
#include "scripted_worker.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <new>
#include <string>
#include <thread>
#include <vector>

namespace {

bool recording(const RecorderService& svc) {
    auto r = svc.is_recording();
    REQUIRE(r.has_value());
    return *r;
}

} // namespace

TEST_CASE("RecorderService operations", "[recorder]") {
    auto script = std::make_shared<WorkerScript>(healthy_reply);
    RecorderService svc(scripted_spawner(script));

    SECTION("WorkerSpawnedLazily") {
        REQUIRE(script->spawns == 0);
        REQUIRE_FALSE(*svc.has_worker());

        REQUIRE(svc.init_recording_session("Mic A"));
        REQUIRE(script->spawns == 1);
        REQUIRE(*svc.has_worker());

        REQUIRE(svc.ensure_initialized());
        REQUIRE(svc.start_recording());
        REQUIRE(script->spawns == 1);
    }

    SECTION("EnumerateMapsLabelsToDeviceInfo") {
        auto devices = svc.enumerate_recording_devices();
        REQUIRE(devices.has_value());
        REQUIRE(*devices == std::vector<DeviceInfo>{
            {.device_id = "Mic A", .label = "Mic A"},
            {.device_id = "Mic B", .label = "Mic B"},
        });
    }

    SECTION("InitSendsDeviceName") {
        REQUIRE(svc.init_recording_session("USB Mic"));
        auto cmds = script->commands();
        REQUIRE(cmds.size() == 1);
        auto* init = std::get_if<InitRecordingSession>(&cmds[0]);
        REQUIRE(init != nullptr);
        REQUIRE(init->device_name == "USB Mic");
    }

    SECTION("StartSetsRecording") {
        REQUIRE_FALSE(recording(svc));
        REQUIRE(svc.start_recording());
        REQUIRE(recording(svc));
    }

    SECTION("StopReturnsSamplesAndClearsRecording") {
        REQUIRE(svc.start_recording());
        auto samples = svc.stop_recording();
        REQUIRE(samples.has_value());
        REQUIRE(*samples == std::vector<float>{0.1f, 0.2f, 0.3f});
        REQUIRE_FALSE(recording(svc));
    }

    SECTION("CancelSendsStopAndDiscardsSamples") {
        REQUIRE(svc.start_recording());
        REQUIRE(svc.cancel_recording());
        REQUIRE_FALSE(recording(svc));

        auto cmds = script->commands();
        REQUIRE(cmds.size() == 2);
        REQUIRE(std::holds_alternative<StopRecording>(cmds[1]));
    }

    SECTION("CloseSessionClearsRecording") {
        REQUIRE(svc.start_recording());
        REQUIRE(svc.close_recording_session());
        REQUIRE_FALSE(recording(svc));
    }

    SECTION("CloseWorkerTwice") {
        REQUIRE(svc.start_recording());
        REQUIRE(svc.close_worker());
        REQUIRE_FALSE(*svc.has_worker());
        REQUIRE_FALSE(recording(svc));
        auto sent = script->command_count();

        REQUIRE(svc.close_worker());
        REQUIRE(script->command_count() == sent);
        REQUIRE(std::holds_alternative<CloseThread>(script->commands().back()));
    }

    SECTION("CloseWorkerWithoutWorkerSendsNothing") {
        REQUIRE(svc.close_worker());
        REQUIRE(script->spawns == 0);
        REQUIRE(script->command_count() == 0);
    }

    SECTION("RespawnAfterClose") {
        REQUIRE(svc.init_recording_session("Mic A"));
        REQUIRE(svc.close_worker());
        REQUIRE(svc.init_recording_session("Mic A"));
        REQUIRE(script->spawns == 2);
    }
}

TEST_CASE("RecorderService error mapping", "[recorder]") {
    SECTION("WorkerErrorBecomesAudioError") {
        auto script = std::make_shared<WorkerScript>([](const AudioCommand&) -> std::optional<AudioResponse> {
            return Error{"No active recording session"};
        });
        RecorderService svc(scripted_spawner(script));

        auto result = svc.start_recording();
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == RecorderError::audio("No active recording session"));
        REQUIRE_FALSE(recording(svc));
    }

    SECTION("UnexpectedResponseToStart") {
        auto script = std::make_shared<WorkerScript>([](const AudioCommand&) -> std::optional<AudioResponse> {
            return RecordingDeviceList{{"Mic A"}};
        });
        RecorderService svc(scripted_spawner(script));

        auto result = svc.start_recording();
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == RecorderErrorKind::AudioError);
        REQUIRE(result.error().detail == "Unexpected response");
        REQUIRE_FALSE(recording(svc));
    }

    SECTION("UnexpectedResponseToStopLeavesRecording") {
        auto script = std::make_shared<WorkerScript>([](const AudioCommand&) -> std::optional<AudioResponse> {
            return Success{};
        });
        RecorderService svc(scripted_spawner(script));

        REQUIRE(svc.start_recording());
        auto stopped = svc.stop_recording();
        REQUIRE_FALSE(stopped);
        REQUIRE(stopped.error().detail == "Unexpected response");
        REQUIRE(recording(svc));

        REQUIRE_FALSE(svc.cancel_recording());
        REQUIRE(recording(svc));
    }

    SECTION("ErrorOnCloseSessionLeavesRecording") {
        auto script = std::make_shared<WorkerScript>([](const AudioCommand& cmd) -> std::optional<AudioResponse> {
            if (std::holds_alternative<CloseRecordingSession>(cmd)) return Error{"device busy"};
            return Success{};
        });
        RecorderService svc(scripted_spawner(script));

        REQUIRE(svc.start_recording());
        REQUIRE_FALSE(svc.close_recording_session());
        REQUIRE(recording(svc));
    }

    SECTION("WorkerDiesMidRequest") {
        auto script = std::make_shared<WorkerScript>([](const AudioCommand& cmd) -> std::optional<AudioResponse> {
            if (std::holds_alternative<StartRecording>(cmd)) return std::nullopt;
            return Success{};
        });
        RecorderService svc(scripted_spawner(script));

        REQUIRE(svc.init_recording_session("Mic A"));

        auto started = svc.start_recording();
        REQUIRE_FALSE(started);
        REQUIRE(started.error().kind == RecorderErrorKind::ReceiveError);
        REQUIRE_FALSE(recording(svc));

        // The dead worker's entry stays until it is torn down; sends now fail.
        auto again = svc.init_recording_session("Mic A");
        REQUIRE_FALSE(again);
        REQUIRE(again.error().kind == RecorderErrorKind::SendError);
        REQUIRE(script->spawns == 1);
    }

    SECTION("CloseWorkerAfterCrashRemovesEntry") {
        auto script = std::make_shared<WorkerScript>([](const AudioCommand&) -> std::optional<AudioResponse> {
            return std::nullopt;
        });
        RecorderService svc(scripted_spawner(script));

        REQUIRE_FALSE(svc.init_recording_session("Mic A"));
        auto closed = svc.close_worker();
        REQUIRE_FALSE(closed);
        REQUIRE(closed.error().kind == RecorderErrorKind::SendError);
        REQUIRE_FALSE(*svc.has_worker());

        // Next operation spawns a fresh worker.
        REQUIRE_FALSE(svc.init_recording_session("Mic A"));
        REQUIRE(script->spawns == 2);
    }
}

TEST_CASE("RecorderService without a worker", "[recorder]") {
    auto attempts = std::make_shared<std::atomic<int>>(0);
    RecorderService svc(failing_spawner(attempts));

    auto expect_send_error = [](auto result) {
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == RecorderErrorKind::SendError);
        REQUIRE(result.error().detail == "no audio server");
    };

    expect_send_error(svc.enumerate_recording_devices());
    expect_send_error(svc.init_recording_session("Mic A"));
    expect_send_error(svc.close_recording_session());
    expect_send_error(svc.start_recording());
    expect_send_error(svc.stop_recording());
    expect_send_error(svc.cancel_recording());
    expect_send_error(svc.ensure_initialized());

    // Each call retries the spawn.
    REQUIRE(*attempts == 7);
    REQUIRE_FALSE(*svc.has_worker());
    REQUIRE_FALSE(recording(svc));
    REQUIRE(svc.close_worker());
}

TEST_CASE("RecorderService survives a throwing spawner", "[recorder]") {
    auto script = std::make_shared<WorkerScript>(healthy_reply);
    auto healthy = scripted_spawner(script);
    int calls = 0;

    RecorderService svc([&]() -> std::expected<WorkerLink, std::string> {
        if (++calls == 1) throw std::bad_alloc();
        return healthy();
    });

    auto first = svc.enumerate_recording_devices();
    REQUIRE_FALSE(first);
    REQUIRE(first.error().kind == RecorderErrorKind::SendError);
    REQUIRE_FALSE(*svc.has_worker());

    // The failed spawn leaves nothing behind, so the next call retries.
    auto second = svc.enumerate_recording_devices();
    REQUIRE(second.has_value());
    REQUIRE(second->size() == 2);
    REQUIRE(calls == 2);
    REQUIRE(script->spawns == 1);
}

TEST_CASE("RecorderService serializes concurrent callers", "[recorder]") {
    auto script = std::make_shared<WorkerScript>([](const AudioCommand& cmd) -> std::optional<AudioResponse> {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        // Echo the device name back so every caller can check it got its own reply.
        if (auto* init = std::get_if<InitRecordingSession>(&cmd)) return Error{init->device_name};
        return Success{};
    });
    RecorderService svc(scripted_spawner(script));

    constexpr int threads = 8;
    constexpr int calls_per_thread = 25;
    std::atomic<int> mismatches{0};

    {
        std::vector<std::jthread> callers;
        for (int t = 0; t < threads; ++t) {
            callers.emplace_back([&, t] {
                for (int i = 0; i < calls_per_thread; ++i) {
                    auto name = "dev-" + std::to_string(t) + "-" + std::to_string(i);
                    auto result = svc.init_recording_session(name);
                    if (result || result.error() != RecorderError::audio(name)) ++mismatches;
                }
            });
        }
    }

    REQUIRE(mismatches == 0);
    REQUIRE(script->spawns == 1);
    REQUIRE(script->command_count() == threads * calls_per_thread);
    // No command was ever queued behind another one.
    REQUIRE(script->max_pending == 0);
}
