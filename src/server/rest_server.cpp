#include "tts_queue/server/rest_server.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "tts_queue/logging.hpp"
#include "tts_queue/metrics.hpp"

namespace tts_queue {

namespace {

// Any single path segment; malformed ids reach the service and get its JSON 404.
constexpr const char* kJobIdPattern = "([^/]+)";

ClientInfo client_info(const httplib::Request& req) {
    ClientInfo info;
    if (!req.remote_addr.empty()) {
        info.remote_addr = req.remote_addr;
    }
    if (req.has_header("User-Agent")) {
        info.user_agent = req.get_header_value("User-Agent");
    }
    return info;
}

class RouteTimer {
public:
    explicit RouteTimer(std::string route)
        : route_(std::move(route)), start_(std::chrono::steady_clock::now()) {
        Metrics::instance().increment_request();
    }

    ~RouteTimer() {
        const auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_).count();
        Metrics::instance().observe_response_summary(route_, elapsed);
    }

private:
    std::string route_;
    std::chrono::steady_clock::time_point start_;
};

}

RestServer::RestServer(const Config& config, TtsService& service)
    : config_(config),
      service_(service) {}

RestServer::~RestServer() {
    stop();
}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                      std::exception_ptr ep) {
        std::string message = "unknown error";
        try {
            if (ep) {
                std::rethrow_exception(ep);
            }
        } catch (const std::exception& ex) {
            message = ex.what();
        } catch (...) {
            message = "non-standard exception";
        }
        logging::error(
            "Unhandled error in request",
            {kv("path", req.path),
             kv("error", message)});
        res.status = 500;
        res.set_content(TtsService::error_body("Internal server error", {{"error", message}}).dump(),
                        "application/json");
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        RouteTimer timer("health");
        write_json(res, service_.health());
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/tts", [this](const httplib::Request& req, httplib::Response& res) {
        RouteTimer timer("submit");
        write_json(res, service_.submit(req.body, client_info(req)));
    });

    server_->Get("/tts/jobs", [this](const httplib::Request&, httplib::Response& res) {
        RouteTimer timer("list");
        write_json(res, service_.list_jobs());
    });

    server_->Get(std::string("/tts/status/") + kJobIdPattern,
                 [this](const httplib::Request& req, httplib::Response& res) {
        RouteTimer timer("status");
        write_json(res, service_.job_status(req.matches[1].str()));
    });

    server_->Get(std::string("/tts/audio/") + kJobIdPattern,
                 [this](const httplib::Request& req, httplib::Response& res) {
        RouteTimer timer("audio");
        auto audio = service_.fetch_audio(req.matches[1].str());
        res.status = audio.status;
        if (audio.status != 200) {
            res.set_content(audio.error.dump(), "application/json");
            return;
        }
        for (const auto& header : audio.headers) {
            res.set_header(header.first, header.second);
        }
        res.set_content(std::move(audio.data), audio.content_type);
    });

    server_->Delete(std::string("/tts/audio/") + kJobIdPattern,
                    [this](const httplib::Request& req, httplib::Response& res) {
        RouteTimer timer("delete");
        write_json(res, service_.delete_audio(req.matches[1].str()));
    });

    if (!server_->bind_to_port(config_.rest_api_host, config_.rest_api_port)) {
        throw std::runtime_error("cannot bind REST server to " + config_.rest_api_host + ":" +
                                 std::to_string(config_.rest_api_port));
    }

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("host", config_.rest_api_host),
             kv("port", config_.rest_api_port)});
        if (!server_->listen_after_bind()) {
            logging::error(
                "REST server stopped unexpectedly",
                {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
