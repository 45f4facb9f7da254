#pragma once

#include "capture_controller.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "platform/ipc_server.hpp"
#include "storage/settings_db.hpp"
#include "stt/backend.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Portable command handling. Blocking work (recorder shutdown, uploads)
// runs on one thread per request; the platform loop is told through
// NotifyCallback and then calls on_tasks_complete() on its own thread.
class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose, CaptureController& capture,
               IpcServer& ipc, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // Returns {"status":"pending"} when the reply will be sent later by
    // on_tasks_complete().
    nlohmann::json handle_command(int client_fd, const nlohmann::json& cmd);

    void on_tasks_complete();
    void remove_client(int fd);

    size_t pending_tasks() const { return tasks_.size(); }

    void shutdown();

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_cancel(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_transcribe(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_get_settings(const nlohmann::json& cmd);
    nlohmann::json handle_save_settings(const nlohmann::json& cmd);
    nlohmann::json handle_save_audio(const nlohmann::json& cmd);

    nlohmann::json run_task(int client_fd, std::function<nlohmann::json()> fn);

    // Runs on a task thread.
    nlohmann::json transcribe_file(const std::filesystem::path& path,
                                   const std::optional<std::string>& api_key,
                                   const std::optional<std::string>& language);

    static nlohmann::json error_reply(const Error& err);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    CaptureController& capture_;
    IpcServer& ipc_;
    NotifyCallback notify_;

    SettingsDb settings_;
    std::unique_ptr<TranscriptionBackend> backend_;

    struct Completion {
        uint64_t task_id;
        nlohmann::json reply;
    };
    std::mutex completions_mutex_;
    std::vector<Completion> completions_;

    // Touched only by the loop thread. Declared last so threads are
    // joined before anything they use is destroyed.
    struct Task {
        uint64_t id;
        int client_fd;  // -1 once the client has gone away
        std::jthread thread;
    };
    uint64_t next_task_id_ = 1;
    std::vector<Task> tasks_;
};
