#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool fits_u32(const json& v) {
    return v.is_number_unsigned() && v.get<uint64_t>() <= std::numeric_limits<uint32_t>::max();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    Config parsed;
    try {
        auto j = json::parse(f);

        if (j.contains("audio")) {
            auto& a = j["audio"];
            for (auto* key : {"sample_rate", "max_seconds"}) {
                // get<uint32_t>() would silently wrap negatives and truncate wide values.
                if (a.contains(key) && !fits_u32(a[key])) {
                    std::println(stderr, "config: audio.{} must be an unsigned 32-bit integer, using defaults", key);
                    return cfg;
                }
            }
            if (a.contains("sample_rate")) parsed.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("max_seconds")) parsed.audio.max_seconds = a["max_seconds"].get<uint32_t>();
        }

        if (j.contains("recorder")) {
            auto& r = j["recorder"];
            if (r.contains("default_device")) {
                parsed.recorder.default_device = r["default_device"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error in {}: {}, using defaults", path, e.what());
        return cfg;
    }

    if (parsed.audio.sample_rate == 0 || parsed.audio.max_seconds == 0) {
        std::println(stderr, "config: audio.sample_rate and audio.max_seconds must be positive, using defaults");
        return cfg;
    }
    if (parsed.audio.ring_buffer_samples() > Config::Audio::max_buffer_samples) {
        std::println(stderr, "config: {}s at {} Hz exceeds the {} sample capture limit, using defaults",
                     parsed.audio.max_seconds, parsed.audio.sample_rate, Config::Audio::max_buffer_samples);
        return cfg;
    }

    return parsed;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
