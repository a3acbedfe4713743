#pragma once

#include <format>
#include <string>
#include <variant>
#include <vector>

// Messages exchanged with the audio worker thread. One AudioResponse is
// produced for every AudioCommand, in the order the commands were sent.

struct EnumerateRecordingDevices {};
struct InitRecordingSession {
    std::string device_name;
};
struct CloseRecordingSession {};
struct StartRecording {};
struct StopRecording {};
struct CloseThread {};

using AudioCommand = std::variant<EnumerateRecordingDevices, InitRecordingSession,
                                  CloseRecordingSession, StartRecording, StopRecording,
                                  CloseThread>;

struct Success {};
struct Error {
    std::string message;
};
struct RecordingDeviceList {
    std::vector<std::string> devices;
};
struct AudioData {
    std::vector<float> samples;
};

using AudioResponse = std::variant<Success, Error, RecordingDeviceList, AudioData>;

inline std::string describe(const AudioCommand& cmd) {
    struct {
        std::string operator()(const EnumerateRecordingDevices&) const { return "EnumerateRecordingDevices"; }
        std::string operator()(const InitRecordingSession& c) const {
            return std::format("InitRecordingSession({})", c.device_name);
        }
        std::string operator()(const CloseRecordingSession&) const { return "CloseRecordingSession"; }
        std::string operator()(const StartRecording&) const { return "StartRecording"; }
        std::string operator()(const StopRecording&) const { return "StopRecording"; }
        std::string operator()(const CloseThread&) const { return "CloseThread"; }
    } visitor;
    return std::visit(visitor, cmd);
}

inline std::string describe(const AudioResponse& resp) {
    struct {
        std::string operator()(const Success&) const { return "Success"; }
        std::string operator()(const Error& e) const { return std::format("Error({})", e.message); }
        std::string operator()(const RecordingDeviceList& l) const {
            return std::format("RecordingDeviceList({} devices)", l.devices.size());
        }
        std::string operator()(const AudioData& d) const {
            return std::format("AudioData({} samples)", d.samples.size());
        }
    } visitor;
    return std::visit(visitor, resp);
}
