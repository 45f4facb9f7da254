#include "daemon_core.hpp"

#include "audio_file.hpp"
#include "stt/mistral_backend.hpp"

#include <algorithm>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

std::optional<std::string> optional_field(const json& cmd, const char* key) {
    if (!cmd.contains(key) || cmd[key].is_null()) return std::nullopt;
    return cmd[key].get<std::string>();
}

json nullable(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, CaptureController& capture,
                       IpcServer& ipc, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      capture_(capture), ipc_(ipc), notify_(std::move(notify)) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init() {
    backend_ = std::make_unique<MistralBackend>(
        config_.transcription.endpoint, config_.transcription.model,
        config_.transcription.timeout_s, config_.transcription.connect_timeout_s);

    auto db_path = config_.storage.settings_db_path();
    if (!settings_.open(db_path)) {
        std::println(stderr, "Failed to open settings database at {}", db_path);
        return false;
    }
    log("Settings database: " + db_path);

    return true;
}

json DaemonCore::handle_command(int client_fd, const json& cmd) {
    try {
        std::string cmd_str = cmd.value("cmd", "");

        if (cmd_str == "start") return handle_start(cmd);
        if (cmd_str == "stop") return handle_stop(client_fd, cmd);
        if (cmd_str == "cancel") return handle_cancel(client_fd, cmd);
        if (cmd_str == "transcribe") return handle_transcribe(client_fd, cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "get_settings") return handle_get_settings(cmd);
        if (cmd_str == "save_settings") return handle_save_settings(cmd);
        if (cmd_str == "save_audio") return handle_save_audio(cmd);
        return {{"status", "error"}, {"message", "unknown command"}};
    } catch (const json::exception& e) {
        return {{"status", "error"}, {"message", std::string("invalid request: ") + e.what()}};
    }
}

json DaemonCore::handle_start(const json& /*cmd*/) {
    auto path = capture_.start();
    if (!path) {
        log("Start failed: " + path.error().message);
        return error_reply(path.error());
    }

    log("Recording to " + path->string());
    return {{"status", "ok"}, {"path", path->string()}};
}

json DaemonCore::handle_stop(int client_fd, const json& cmd) {
    bool then_transcribe = cmd.value("transcribe", false);

    // Settings are read here, on the loop thread, before the task starts.
    std::optional<SttSettings> stt;
    if (then_transcribe) stt = settings_.load_stt_settings();

    return run_task(client_fd, [this, stt = std::move(stt)]() -> json {
        auto path = capture_.stop();
        if (!path) {
            log("Stop failed: " + path.error().message);
            return error_reply(path.error());
        }
        log("Recording saved to " + path->string());

        if (!stt) return {{"status", "ok"}, {"path", path->string()}};

        auto reply = transcribe_file(*path, stt->api_key, stt->language);
        reply["path"] = path->string();
        return reply;
    });
}

json DaemonCore::handle_cancel(int client_fd, const json& /*cmd*/) {
    return run_task(client_fd, [this]() -> json {
        bool cancelled = capture_.cancel();
        if (cancelled) log("Recording cancelled");
        return {{"status", "ok"}, {"cancelled", cancelled}};
    });
}

json DaemonCore::handle_transcribe(int client_fd, const json& cmd) {
    std::string path = cmd.value("path", "");
    if (path.empty()) {
        return {{"status", "error"}, {"message", "missing path"}};
    }

    // Explicit request fields win; otherwise the stored settings apply.
    auto stt = settings_.load_stt_settings();
    auto api_key = cmd.contains("api_key") ? optional_field(cmd, "api_key") : stt.api_key;
    auto language = cmd.contains("language") ? optional_field(cmd, "language") : stt.language;

    return run_task(client_fd, [this, path = std::filesystem::path(path),
                                api_key = std::move(api_key),
                                language = std::move(language)]() -> json {
        return transcribe_file(path, api_key, language);
    });
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    json resp = {{"status", "ok"}};
    auto active = capture_.active();
    if (active) {
        resp["state"] = "recording";
        resp["path"] = active->path.string();
        resp["pid"] = active->pid;
    } else {
        resp["state"] = "idle";
    }
    resp["pending_tasks"] = tasks_.size();
    return resp;
}

json DaemonCore::handle_get_settings(const json& /*cmd*/) {
    auto s = settings_.load_stt_settings();
    return {
        {"status", "ok"},
        {"provider", s.provider},
        {"api_key", nullable(s.api_key)},
        {"model", s.model},
        {"language", nullable(s.language)},
    };
}

json DaemonCore::handle_save_settings(const json& cmd) {
    if (!cmd.contains("provider") || !cmd.contains("model")) {
        return {{"status", "error"}, {"message", "provider and model are required"}};
    }

    SttSettings s{
        .provider = cmd["provider"].get<std::string>(),
        .api_key = optional_field(cmd, "api_key"),
        .model = cmd["model"].get<std::string>(),
        .language = optional_field(cmd, "language"),
    };

    if (auto res = settings_.save_stt_settings(s); !res) {
        return error_reply(res.error());
    }

    log("STT settings saved");
    return {{"status", "ok"}};
}

json DaemonCore::handle_save_audio(const json& cmd) {
    std::string data = cmd.value("data", "");
    std::string file_name = cmd.value("file_name", "");

    auto path = save_audio_temp_file(data, file_name, config_.recorder.output_dir);
    if (!path) return error_reply(path.error());

    log("Saved audio file to " + path->string());
    return {{"status", "ok"}, {"path", path->string()}};
}

json DaemonCore::run_task(int client_fd, std::function<json()> fn) {
    uint64_t id = next_task_id_++;

    std::jthread thread([this, id, fn = std::move(fn)] {
        json reply;
        try {
            reply = fn();
        } catch (const std::exception& e) {
            reply = {{"status", "error"}, {"message", e.what()}};
        }

        {
            std::lock_guard lock(completions_mutex_);
            completions_.push_back({id, std::move(reply)});
        }
        notify_();
    });

    tasks_.push_back(Task{.id = id, .client_fd = client_fd, .thread = std::move(thread)});
    return {{"status", "pending"}};
}

json DaemonCore::transcribe_file(const std::filesystem::path& path,
                                 const std::optional<std::string>& api_key,
                                 const std::optional<std::string>& language) {
    if (!api_key || api_key->empty()) {
        return error_reply(make_error(ErrorCode::MissingApiKey,
                                      "API key required. Configure it with save_settings."));
    }

    log(std::format("Transcribing {} (language: {})", path.string(), language.value_or("auto")));

    auto result = backend_->transcribe(path, *api_key, language);
    if (!result) {
        log("Transcription failed: " + result.error().message);
        return error_reply(result.error());
    }

    log(std::format("Transcription complete: {:.1f}s audio, {:.1f}s processing, {} chars",
                    result->duration_s, result->processing_s, result->text.size()));
    return {{"status", "ok"}, {"text", result->text}};
}

void DaemonCore::on_tasks_complete() {
    std::vector<Completion> done;
    {
        std::lock_guard lock(completions_mutex_);
        done.swap(completions_);
    }

    for (auto& c : done) {
        auto it = std::ranges::find_if(tasks_, [&c](const Task& t) { return t.id == c.task_id; });
        if (it == tasks_.end()) continue;

        if (it->thread.joinable()) it->thread.join();

        if (it->client_fd >= 0) {
            if (!ipc_.send_response(it->client_fd, c.reply)) {
                log(std::format("Failed to deliver reply to client {}", it->client_fd));
            }
        } else {
            log("Client went away, dropping reply");
        }
        tasks_.erase(it);
    }
}

void DaemonCore::remove_client(int fd) {
    for (auto& t : tasks_) {
        if (t.client_fd == fd) t.client_fd = -1;
    }
}

void DaemonCore::shutdown() {
    if (capture_.cancel()) {
        log("Discarded active recording on shutdown");
    }

    if (!tasks_.empty()) {
        log(std::format("Waiting for {} pending task(s) to complete...", tasks_.size()));
    }
    for (auto& t : tasks_) {
        if (t.thread.joinable()) t.thread.join();
    }
    on_tasks_complete();
}

json DaemonCore::error_reply(const Error& err) {
    json resp = {
        {"status", "error"},
        {"code", std::string(error_code_name(err.code))},
        {"message", err.message},
    };
    if (err.code == ErrorCode::HttpStatus) {
        resp["http_status"] = err.http_status;
        resp["body"] = err.body;
    } else if (err.code == ErrorCode::JsonParse) {
        resp["body"] = err.body;
    }
    return resp;
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mic-scribe] {}", msg);
    }
}
