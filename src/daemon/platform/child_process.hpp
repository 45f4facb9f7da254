#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

// A running child process owned by the caller.
// Destroying an instance that has not been reaped kills and reaps it.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual int pid() const = 0;

    // Ask the process to end itself. Backends without a cooperative
    // signal fall back to terminate().
    virtual bool request_stop() = 0;

    // End the process immediately.
    virtual bool terminate() = 0;

    // Non-blocking. Returns true once the process has exited and been reaped.
    virtual bool try_wait() = 0;

    // Blocks until exit. Returns the raw wait status.
    virtual std::expected<int, std::string> wait() = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // argv[0] is resolved through PATH. No standard streams are attached.
    virtual std::expected<std::unique_ptr<ChildProcess>, std::string>
        spawn(const std::vector<std::string>& argv) = 0;
};
