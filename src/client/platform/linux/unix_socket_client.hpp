#pragma once

#include "platform/ipc_client.hpp"

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    std::expected<nlohmann::json, std::string> recv(int timeout_ms = 30000) override;
    void close() override;

private:
    int fd_ = -1;
    std::string buf_;  // bytes received past the last complete reply
};
