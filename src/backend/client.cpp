#include "tts_queue/backend/client.hpp"

#include <memory>
#include <utility>

#include "tts_queue/utils/http.hpp"

namespace tts_queue {

BackendClient::BackendClient(const std::string& base_url,
                             std::optional<std::string> authorization_token,
                             BackendRequestOptions options)
    : authorization_token_(std::move(authorization_token)),
      options_(options) {
    utils::parse_url(base_url, scheme_, host_, port_, base_path_);
    if (host_.empty()) {
        throw BackendError("Backend url has no host: " + base_url);
    }
    if (scheme_ != "http" && scheme_ != "https") {
        throw BackendError("Unsupported backend scheme: " + scheme_);
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https") {
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
    }
#endif
}

std::pair<std::time_t, std::time_t> split_timeout(std::chrono::milliseconds timeout) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout - seconds);
    return {static_cast<std::time_t>(seconds.count()), static_cast<std::time_t>(micros.count())};
}

// A fresh httplib client per call: workers synthesize concurrently and a
// single client holds one connection.
std::string BackendClient::get_binary(const std::string& path, const std::string& query) {
    const auto headers = build_headers("*/*");
    const auto full_path = query.empty() ? build_path(path) : build_path(path) + "?" + query;

    httplib::Result response;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https") {
        httplib::SSLClient client(host_, port_);
        client.enable_server_certificate_verification(false);
        apply_timeouts(client);
        response = client.Get(full_path.c_str(), headers);
    } else {
        httplib::Client client(host_, port_);
        apply_timeouts(client);
        response = client.Get(full_path.c_str(), headers);
    }
#else
    httplib::Client client(host_, port_);
    apply_timeouts(client);
    response = client.Get(full_path.c_str(), headers);
#endif
    if (!response) {
        throw BackendError("Backend request failed: " + httplib::to_string(response.error()));
    }
    if (response->status == 401 || response->status == 403) {
        throw BackendPermissionError(response->body);
    }
    if (response->status < 200 || response->status >= 300) {
        throw BackendError("Backend returned status " + std::to_string(response->status) +
                           ": " + response->body.substr(0, 256));
    }
    return std::move(response->body);
}

std::string BackendClient::endpoint() const {
    return utils::build_url(scheme_, host_, port_, base_path_);
}

std::string BackendClient::build_path(const std::string& path) const {
    if (base_path_.empty() || base_path_ == "/") {
        return path;
    }
    if (path.empty()) {
        return base_path_;
    }
    if (base_path_.back() == '/' && path.front() == '/') {
        return base_path_ + path.substr(1);
    }
    if (base_path_.back() != '/' && path.front() != '/') {
        return base_path_ + "/" + path;
    }
    return base_path_ + path;
}

httplib::Headers BackendClient::build_headers(const std::string& accept) const {
    auto headers = httplib::Headers{{"Accept", accept}};
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    return headers;
}

}
