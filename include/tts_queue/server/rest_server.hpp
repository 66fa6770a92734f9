#pragma once

#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "tts_queue/config.hpp"
#include "tts_queue/server/tts_service.hpp"

namespace tts_queue {

class RestServer {
public:
    RestServer(const Config& config, TtsService& service);
    ~RestServer();

    RestServer(const RestServer&) = delete;
    RestServer& operator=(const RestServer&) = delete;

    void start();
    void stop();

private:
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    TtsService& service_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
