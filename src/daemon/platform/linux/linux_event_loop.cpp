#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

RecorderOptions recorder_options(const Config& config) {
    return RecorderOptions{
        .program = config.recorder.program,
        .args = config.recorder.args,
        .output_dir = config.recorder.output_dir,
        .stop_grace = std::chrono::milliseconds(config.recorder.stop_grace_ms),
    };
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      capture_(launcher_, recorder_options(config_)),
      core_(config_, verbose_, capture_, ipc_server_,
            // NotifyCallback, called from task threads
            [this]() {
                uint64_t val = 1;
                if (::write(task_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (task_event_fd_ >= 0) ::close(task_event_fd_);
}

bool LinuxEventLoop::init() {
    // Signals are blocked before any task thread exists so every thread
    // inherits the mask and delivery goes through signalfd.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    task_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (task_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Core init (backend, settings db)
    if (!core_.init()) return false;

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(task_event_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == task_event_fd_) {
                uint64_t val;
                if (::read(task_event_fd_, &val, sizeof(val)) > 0) {
                    core_.on_tasks_complete();
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    nlohmann::json cmd;
    ReadResult rr;

    while ((rr = ipc_server_.read_command(fd, cmd)) == ReadResult::Command ||
           rr == ReadResult::Malformed) {
        if (rr == ReadResult::Malformed) {
            ipc_server_.send_response(fd, {{"status", "error"}, {"message", "malformed request"}});
            continue;
        }

        auto response = core_.handle_command(fd, cmd);
        if (response.value("status", "") != "pending") {
            ipc_server_.send_response(fd, response);
        }
    }

    if (rr == ReadResult::Closed) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        ipc_server_.close_client(fd);
        core_.remove_client(fd);
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mic-scribe] {}", msg);
    }
}
