#pragma once

#include "platform/child_process.hpp"

#include <sys/types.h>

class PosixChildProcess : public ChildProcess {
public:
    explicit PosixChildProcess(pid_t pid);
    ~PosixChildProcess() override;

    PosixChildProcess(const PosixChildProcess&) = delete;
    PosixChildProcess& operator=(const PosixChildProcess&) = delete;

    int pid() const override { return pid_; }
    bool request_stop() override;  // SIGTERM
    bool terminate() override;     // SIGKILL
    bool try_wait() override;
    std::expected<int, std::string> wait() override;

private:
    pid_t pid_;
    bool reaped_ = false;
};

class PosixProcessLauncher : public ProcessLauncher {
public:
    std::expected<std::unique_ptr<ChildProcess>, std::string>
        spawn(const std::vector<std::string>& argv) override;
};
