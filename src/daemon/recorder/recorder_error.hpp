#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

enum class RecorderErrorKind {
    ThreadNotInitialized,
    SendError,
    ReceiveError,
    AudioError,
    NoActiveRecording,
    LockError,
};

// Error returned by every RecorderService operation. Serializable so it can
// cross the IPC boundary unchanged.
struct RecorderError {
    RecorderErrorKind kind;
    std::string detail;

    static RecorderError thread_not_initialized() { return {RecorderErrorKind::ThreadNotInitialized, {}}; }
    static RecorderError send(std::string detail) { return {RecorderErrorKind::SendError, std::move(detail)}; }
    static RecorderError receive(std::string detail) { return {RecorderErrorKind::ReceiveError, std::move(detail)}; }
    static RecorderError audio(std::string detail) { return {RecorderErrorKind::AudioError, std::move(detail)}; }
    static RecorderError no_active_recording() { return {RecorderErrorKind::NoActiveRecording, {}}; }
    static RecorderError lock(std::string detail) { return {RecorderErrorKind::LockError, std::move(detail)}; }

    std::string message() const;

    bool operator==(const RecorderError&) const = default;
};

template <typename T>
using RecorderResult = std::expected<T, RecorderError>;

std::string_view to_string(RecorderErrorKind kind);
std::optional<RecorderErrorKind> parse_error_kind(std::string_view name);

void to_json(nlohmann::json& j, const RecorderError& e);
void from_json(const nlohmann::json& j, RecorderError& e);
