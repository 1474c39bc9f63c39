#pragma once

#include <nlohmann/json.hpp>
#include <string>

class IpcClient {
public:
    static constexpr int default_timeout_ms = 30000;

    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // Waits for one newline-terminated JSON response.
    virtual bool recv(nlohmann::json& response, int timeout_ms = default_timeout_ms) = 0;
    virtual void close() = 0;
};
