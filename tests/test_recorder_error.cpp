#include <catch2/catch_test_macros.hpp>

#include "recorder/recorder_error.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

TEST_CASE("RecorderError", "[recorder_error]") {

    SECTION("Messages") {
        REQUIRE(RecorderError::thread_not_initialized().message() == "Audio thread not initialized");
        REQUIRE(RecorderError::send("closed").message() == "Failed to send command: closed");
        REQUIRE(RecorderError::receive("gone").message() == "Failed to receive response: gone");
        REQUIRE(RecorderError::audio("Already recording").message() == "Audio error: Already recording");
        REQUIRE(RecorderError::no_active_recording().message() == "No active recording");
        REQUIRE(RecorderError::lock("poisoned").message() == "Failed to acquire lock: poisoned");
    }

    SECTION("KindNames") {
        REQUIRE(to_string(RecorderErrorKind::SendError) == "SendError");
        REQUIRE(parse_error_kind("LockError") == RecorderErrorKind::LockError);
        REQUIRE_FALSE(parse_error_kind("Bogus").has_value());
    }

    SECTION("JsonShape") {
        json j = RecorderError::audio("Recording device not found: USB");
        REQUIRE(j["kind"] == "AudioError");
        REQUIRE(j["detail"] == "Recording device not found: USB");
    }

    SECTION("JsonRoundTrip") {
        auto original = RecorderError::receive("receiving on an empty and disconnected channel");
        json j = original;
        REQUIRE(j.get<RecorderError>() == original);
    }

    SECTION("MissingDetailIsEmpty") {
        auto err = json{{"kind", "NoActiveRecording"}}.get<RecorderError>();
        REQUIRE(err == RecorderError::no_active_recording());
    }

    SECTION("UnknownKindThrows") {
        json j = {{"kind", "Exploded"}, {"detail", ""}};
        REQUIRE_THROWS_AS(j.get<RecorderError>(), std::invalid_argument);
    }
}
