#include "recorder/recorder_error.hpp"

#include <array>
#include <format>
#include <stdexcept>
#include <utility>

namespace {

constexpr std::array<std::pair<RecorderErrorKind, std::string_view>, 6> kind_names = {{
    {RecorderErrorKind::ThreadNotInitialized, "ThreadNotInitialized"},
    {RecorderErrorKind::SendError, "SendError"},
    {RecorderErrorKind::ReceiveError, "ReceiveError"},
    {RecorderErrorKind::AudioError, "AudioError"},
    {RecorderErrorKind::NoActiveRecording, "NoActiveRecording"},
    {RecorderErrorKind::LockError, "LockError"},
}};

} // namespace

std::string RecorderError::message() const {
    switch (kind) {
        case RecorderErrorKind::ThreadNotInitialized:
            return "Audio thread not initialized";
        case RecorderErrorKind::SendError:
            return std::format("Failed to send command: {}", detail);
        case RecorderErrorKind::ReceiveError:
            return std::format("Failed to receive response: {}", detail);
        case RecorderErrorKind::AudioError:
            return std::format("Audio error: {}", detail);
        case RecorderErrorKind::NoActiveRecording:
            return "No active recording";
        case RecorderErrorKind::LockError:
            return std::format("Failed to acquire lock: {}", detail);
    }
    return detail;
}

std::string_view to_string(RecorderErrorKind kind) {
    for (auto& [k, name] : kind_names) {
        if (k == kind) return name;
    }
    return "Unknown";
}

std::optional<RecorderErrorKind> parse_error_kind(std::string_view name) {
    for (auto& [k, n] : kind_names) {
        if (n == name) return k;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const RecorderError& e) {
    j = {{"kind", std::string(to_string(e.kind))}, {"detail", e.detail}};
}

void from_json(const nlohmann::json& j, RecorderError& e) {
    auto kind = parse_error_kind(j.at("kind").get<std::string>());
    if (!kind) {
        throw std::invalid_argument("unknown recorder error kind: " + j.at("kind").get<std::string>());
    }
    e.kind = *kind;
    e.detail = j.value("detail", "");
}
