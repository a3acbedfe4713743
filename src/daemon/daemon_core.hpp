#pragma once

#include "config.hpp"
#include "recorder/recorder_error.hpp"
#include "recorder/recorder_service.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <span>
#include <string>

// Translates IPC commands into RecorderService operations. Platform-free so
// it can be driven directly from tests.
class DaemonCore {
public:
    DaemonCore(Config config, bool verbose, RecorderService& recorder);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Tears the worker down; called once when the daemon exits.
    void shutdown();

private:
    nlohmann::json handle_devices(const nlohmann::json& cmd);
    nlohmann::json handle_init(const nlohmann::json& cmd);
    nlohmann::json handle_close(const nlohmann::json& cmd);
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_shutdown(const nlohmann::json& cmd);

    static nlohmann::json error_response(const RecorderError& err);
    static nlohmann::json ok_or_error(const RecorderResult<void>& result);

    std::expected<void, std::string> write_wav(const std::string& path, std::span<const float> samples);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    RecorderService& recorder_;
    // Whether init succeeded since the last close; only toggle consults it.
    bool session_open_ = false;
};
