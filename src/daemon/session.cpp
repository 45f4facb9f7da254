#include "session.hpp"

std::expected<void, Error> SessionSlot::acquire(RecordingSession&& session) {
    std::lock_guard lock(mutex_);
    if (session_) {
        return std::unexpected(make_error(ErrorCode::SessionAlreadyActive,
                                          "a recording is already in progress"));
    }
    session_.emplace(std::move(session));
    return {};
}

std::optional<RecordingSession> SessionSlot::release() {
    std::lock_guard lock(mutex_);
    std::optional<RecordingSession> out;
    out.swap(session_);
    return out;
}

SessionState SessionSlot::state() const {
    std::lock_guard lock(mutex_);
    return session_ ? SessionState::Active : SessionState::Idle;
}

std::optional<SessionInfo> SessionSlot::peek() const {
    std::lock_guard lock(mutex_);
    if (!session_) return std::nullopt;
    return SessionInfo{.path = session_->path, .pid = session_->process->pid()};
}
