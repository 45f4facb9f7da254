#include "capture_controller.hpp"

#include <atomic>
#include <cstdint>
#include <format>
#include <print>
#include <thread>

namespace fs = std::filesystem;

namespace {

std::atomic<uint64_t> recording_seq{0};

} // namespace

CaptureController::CaptureController(ProcessLauncher& launcher, RecorderOptions options)
    : launcher_(launcher), options_(std::move(options)) {}

std::expected<fs::path, Error> CaptureController::start() {
    if (slot_.state() == SessionState::Active) {
        return std::unexpected(make_error(ErrorCode::SessionAlreadyActive,
                                          "a recording is already in progress"));
    }

    auto path = next_output_path();

    std::vector<std::string> argv;
    argv.reserve(options_.args.size() + 2);
    argv.push_back(options_.program);
    argv.insert(argv.end(), options_.args.begin(), options_.args.end());
    argv.push_back(path.string());

    auto child = launcher_.spawn(argv);
    if (!child) {
        return std::unexpected(make_error(
            ErrorCode::ProcessSpawn,
            std::format("{}. Is {} installed?", child.error(), options_.program)));
    }

    RecordingSession session{.process = std::move(*child), .path = path};
    if (auto res = slot_.acquire(std::move(session)); !res) {
        // A concurrent start() installed its session first.
        discard(session);
        return std::unexpected(res.error());
    }

    return path;
}

std::expected<fs::path, Error> CaptureController::stop() {
    auto session = slot_.release();
    if (!session) {
        return std::unexpected(make_error(ErrorCode::NoActiveSession,
                                          "no active recording to stop"));
    }

    shutdown_gracefully(*session->process);

    const auto& path = session->path;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::unexpected(make_error(ErrorCode::FileNotCreated,
                                          "recording file was not created: " + path.string()));
    }

    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected(make_error(
            ErrorCode::FileRead,
            std::format("failed to read file metadata for {}: {}", path.string(), ec.message())));
    }

    if (size == 0) {
        fs::remove(path, ec);
        return std::unexpected(make_error(ErrorCode::EmptyRecording, "recording file is empty"));
    }

    return path;
}

bool CaptureController::cancel() {
    auto session = slot_.release();
    if (!session) return false;

    discard(*session);
    return true;
}

fs::path CaptureController::next_output_path() const {
    fs::path dir = options_.output_dir;
    if (dir.empty()) {
        std::error_code ec;
        dir = fs::temp_directory_path(ec);
        if (ec) dir = "/tmp";
    }
    if (dir.is_relative()) {
        std::error_code ec;
        auto abs = fs::absolute(dir, ec);
        if (!ec) dir = abs;
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return dir / std::format("recording_{}_{}.wav", ms, recording_seq.fetch_add(1));
}

void CaptureController::shutdown_gracefully(ChildProcess& process) {
    if (!process.request_stop()) {
        process.terminate();
    }

    auto deadline = std::chrono::steady_clock::now() + options_.stop_grace;
    while (!process.try_wait()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            std::println(stderr, "capture: recorder {} did not exit within {}ms, killing",
                         process.pid(), options_.stop_grace.count());
            process.terminate();
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (auto status = process.wait(); !status) {
        std::println(stderr, "capture: {}", status.error());
    }
}

void CaptureController::discard(RecordingSession& session) {
    auto& process = *session.process;
    if (!process.terminate()) {
        std::println(stderr, "capture: failed to signal recorder {}", process.pid());
    }
    if (auto status = process.wait(); !status) {
        std::println(stderr, "capture: {}", status.error());
    }

    std::error_code ec;
    fs::remove(session.path, ec);
    if (ec) {
        std::println(stderr, "capture: could not remove {}: {}", session.path.string(), ec.message());
    }
}
