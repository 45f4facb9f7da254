#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

static std::string absolute_or_empty(const std::string& path) {
    if (path.empty()) return path;
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    return ec ? path : abs.string();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("endpoint")) cfg.transcription.endpoint = t["endpoint"].get<std::string>();
            if (t.contains("model")) cfg.transcription.model = t["model"].get<std::string>();
            if (t.contains("timeout_s")) cfg.transcription.timeout_s = t["timeout_s"].get<long>();
            if (t.contains("connect_timeout_s")) {
                cfg.transcription.connect_timeout_s = t["connect_timeout_s"].get<long>();
            }
        }

        if (j.contains("recorder")) {
            auto& r = j["recorder"];
            if (r.contains("program")) cfg.recorder.program = r["program"].get<std::string>();
            if (r.contains("args")) cfg.recorder.args = r["args"].get<std::vector<std::string>>();
            if (r.contains("output_dir")) cfg.recorder.output_dir = r["output_dir"].get<std::string>();
            if (r.contains("stop_grace_ms")) cfg.recorder.stop_grace_ms = r["stop_grace_ms"].get<uint32_t>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("settings_db")) cfg.storage.settings_db = s["settings_db"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    // Resolve against the launch directory; the daemon later chdirs to "/".
    cfg.recorder.output_dir = absolute_or_empty(cfg.recorder.output_dir);
    cfg.storage.settings_db = absolute_or_empty(cfg.storage.settings_db);

    return cfg;
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

std::string Config::Storage::settings_db_path() const {
    if (!settings_db.empty()) return settings_db;

    auto data = platform::data_dir();
    if (data.empty()) return "/tmp/mic-scribe/settings.db";
    return data + "/settings.db";
}
