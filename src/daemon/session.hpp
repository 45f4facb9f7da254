#pragma once

#include "errors.hpp"
#include "platform/child_process.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

// A running recorder and the file it is writing.
struct RecordingSession {
    std::unique_ptr<ChildProcess> process;
    std::filesystem::path path;
};

struct SessionInfo {
    std::filesystem::path path;
    int pid = -1;
};

enum class SessionState { Idle, Active };

// Owns at most one RecordingSession. The mutex guards only the slot itself;
// callers never hold it while waiting on a process.
class SessionSlot {
public:
    SessionSlot() = default;

    SessionSlot(const SessionSlot&) = delete;
    SessionSlot& operator=(const SessionSlot&) = delete;

    // Installs `session` if the slot is empty. On failure `session` is left
    // untouched and still owned by the caller.
    std::expected<void, Error> acquire(RecordingSession&& session);

    // Takes the session out of the slot, leaving it empty.
    std::optional<RecordingSession> release();

    SessionState state() const;
    std::optional<SessionInfo> peek() const;

private:
    mutable std::mutex mutex_;
    std::optional<RecordingSession> session_;
};
