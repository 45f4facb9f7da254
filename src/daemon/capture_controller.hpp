#pragma once

#include "errors.hpp"
#include "platform/child_process.hpp"
#include "session.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct RecorderOptions {
    std::string program = "arecord";
    // 16-bit signed little-endian PCM, 16 kHz, mono. The output path is appended.
    std::vector<std::string> args = {"-f", "S16_LE", "-r", "16000", "-c", "1"};
    std::filesystem::path output_dir;  // empty: OS temp directory
    std::chrono::milliseconds stop_grace{3000};
};

// Start/stop/cancel over a single recorder subprocess.
// stop() and cancel() block until the recorder exits; run them off the event loop.
class CaptureController {
public:
    CaptureController(ProcessLauncher& launcher, RecorderOptions options);

    CaptureController(const CaptureController&) = delete;
    CaptureController& operator=(const CaptureController&) = delete;

    // Spawns the recorder and returns the file it writes to.
    std::expected<std::filesystem::path, Error> start();

    // Stops the recorder gracefully and returns the validated recording.
    std::expected<std::filesystem::path, Error> stop();

    // Kills the recorder and deletes its file. Returns false if nothing was
    // recording.
    bool cancel();

    SessionState state() const { return slot_.state(); }
    std::optional<SessionInfo> active() const { return slot_.peek(); }

private:
    std::filesystem::path next_output_path() const;
    void shutdown_gracefully(ChildProcess& process);
    void discard(RecordingSession& session);

    ProcessLauncher& launcher_;
    RecorderOptions options_;
    SessionSlot slot_;
};
