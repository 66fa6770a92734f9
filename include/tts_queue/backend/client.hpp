#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <ctime>
#include <string>
#include <utility>

#include <httplib.h>

namespace tts_queue {

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

class BackendPermissionError : public BackendError {
public:
    explicit BackendPermissionError(const std::string& message) : BackendError(message) {}
};

struct BackendRequestOptions {
    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds connect_timeout{60000};
    std::chrono::milliseconds sock_read_timeout{60000};
};

// Seconds and microseconds, the pair httplib's timeout setters take.
std::pair<std::time_t, std::time_t> split_timeout(std::chrono::milliseconds timeout);

class BackendClient {
public:
    BackendClient(const std::string& base_url,
                  std::optional<std::string> authorization_token,
                  BackendRequestOptions options);

    std::string get_binary(const std::string& path, const std::string& query);
    // Base url as parsed, default ports omitted.
    std::string endpoint() const;

private:
    std::string build_path(const std::string& path) const;
    httplib::Headers build_headers(const std::string& accept) const;
    template<typename T>
    void apply_timeouts(T& client) const {
        const auto connect = split_timeout(options_.connect_timeout);
        const auto read = split_timeout(options_.sock_read_timeout);
        const auto write = split_timeout(options_.request_timeout);
        client.set_connection_timeout(connect.first, connect.second);
        client.set_read_timeout(read.first, read.second);
        client.set_write_timeout(write.first, write.second);
    }

    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    std::optional<std::string> authorization_token_;
    BackendRequestOptions options_;
};

}
