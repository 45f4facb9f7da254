#include "platform/linux/posix_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/wait.h>
#include <unistd.h>

PosixChildProcess::PosixChildProcess(pid_t pid) : pid_(pid) {}

PosixChildProcess::~PosixChildProcess() {
    if (!reaped_) {
        ::kill(pid_, SIGKILL);
        int status;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }
}

bool PosixChildProcess::request_stop() {
    if (reaped_) return false;
    return ::kill(pid_, SIGTERM) == 0;
}

bool PosixChildProcess::terminate() {
    if (reaped_) return false;
    return ::kill(pid_, SIGKILL) == 0;
}

bool PosixChildProcess::try_wait() {
    if (reaped_) return true;

    int status;
    pid_t r;
    while ((r = ::waitpid(pid_, &status, WNOHANG)) < 0 && errno == EINTR) {}
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        reaped_ = true;
    }
    return reaped_;
}

std::expected<int, std::string> PosixChildProcess::wait() {
    if (reaped_) return 0;

    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno == EINTR) continue;
        int err = errno;
        if (err == ECHILD) reaped_ = true;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(err));
    }
    reaped_ = true;
    return status;
}

std::expected<std::unique_ptr<ChildProcess>, std::string>
PosixProcessLauncher::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return std::unexpected("empty command line");
    }

    // Everything the child touches is prepared before fork().
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    // exec failure is reported back through a close-on-exec pipe.
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe2() failed: ") + std::strerror(errno));
    }

    int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (devnull < 0) {
        int err = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return std::unexpected(std::string("open(/dev/null) failed: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(devnull);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // The daemon blocks SIGINT/SIGTERM for its signalfd; the recorder
        // must be able to receive SIGTERM.
        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);

        ::dup2(devnull, STDIN_FILENO);
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);

        ::execvp(args[0], args.data());

        int err = errno;
        ssize_t ignored = ::write(err_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(devnull);
    ::close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(err_pipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    ::close(err_pipe[0]);

    if (n > 0) {
        int status;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return std::unexpected(std::format("failed to start {}: {}", argv[0],
                                           std::strerror(child_errno)));
    }

    return std::make_unique<PosixChildProcess>(pid);
}
