#include "tts_queue/config.hpp"
#include "tts_queue/engine/http_engine.hpp"
#include "tts_queue/jobs/job_lister.hpp"
#include "tts_queue/jobs/job_manager.hpp"
#include "tts_queue/logging.hpp"
#include "tts_queue/server/rest_server.hpp"
#include "tts_queue/server/tts_service.hpp"
#include "tts_queue/storage/artifact_store.hpp"
#include "tts_queue/utils/async.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>

namespace {

std::atomic<bool> shutdown_requested{false};

void handle_signal(int) {
    shutdown_requested.store(true);
}

}

int main() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        const auto config = tts_queue::Config::load();
        config.validate();
        tts_queue::logging::init(config);
        tts_queue::logging::info(
            "Starting tts-queue",
            {tts_queue::kv("audio_dir", config.audio_dir.string()),
             tts_queue::kv("engine_url", config.engine_url),
             tts_queue::kv("max_concurrent", config.max_concurrent),
             tts_queue::kv("rest_port", config.rest_api_port)});

        tts_queue::ArtifactStore store(config.audio_dir);
        store.reload();

        const auto timeout = config.engine_timeout();
        tts_queue::HttpSynthesisEngine engine(config.engine_url, config.authorization_token,
                                              {timeout, timeout, timeout});

        tts_queue::JobManager manager({config.max_concurrent, config.admission_factor},
                                      store, engine);
        tts_queue::JobLister lister(store, manager,
                                    static_cast<std::size_t>(config.preview_length));
        tts_queue::utils::TaskQueue background("cleanup");
        tts_queue::TtsService service(config, manager, store, lister, background);
        tts_queue::RestServer server(config, service);

        manager.start();
        server.start();

        while (!shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        tts_queue::logging::info(
            "Shutting down",
            {tts_queue::kv("queue_size", manager.queue_size())});
        server.stop();
        manager.stop();
        background.stop();
    } catch (const std::exception& ex) {
        tts_queue::logging::error(
            "Startup failed",
            {tts_queue::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
