#pragma once

#include <nlohmann/json.hpp>
#include <string>

enum class ReadResult {
    Command,     // `cmd` holds one complete request
    Incomplete,  // no complete line buffered yet
    Malformed,   // a complete line that is not JSON; it was discarded
    Closed,      // peer hung up or the read failed
};

class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    // Call repeatedly until it stops returning Command: one read may
    // buffer several requests.
    virtual ReadResult read_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
