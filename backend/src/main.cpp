/**
 * phonebook — Backend Entry Point
 *
 * Loads config, seeds the phonebook, mounts the static front end and the
 * REST routes, then serves HTTP until SIGINT/SIGTERM.
 */

#include <csignal>
#include <cstdlib>
#include <exception>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "api/http_server.h"
#include "api/io_threads.h"
#include "api/router.h"
#include "api/static_files.h"
#include "config/app_config.h"
#include "phonebook/person_store.h"
#include "phonebook/phonebook_service.h"

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::info("phonebook backend starting…");

    try {
        const bool explicit_path = argc > 1;
        std::string config_path = explicit_path ? argv[1] : "config.json";
        AppConfig config = load_config(config_path, explicit_path);
        apply_env_overrides(config, std::getenv("PORT"));
        spdlog::set_level(config.log_level);

        PersonStore store(seed_people());
        PhonebookService service(store);
        StaticFiles static_files(config.static_dir);

        Router router;
        router.use([&static_files](const HttpRequest& req) { return static_files.serve(req); });
        service.register_routes(router);

        asio::io_context io;
        HttpServer server(io, config.bind_address, config.port, router, config.max_body_bytes);

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&server](const asio::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            spdlog::info("Received signal {}, shutting down", signal_number);
            server.stop();
        });

        server.start();
        spdlog::info("Server running on port {} with {} thread(s)", server.port(), config.threads);

        IoThreads workers(io);
        workers.spawn(config.threads - 1);
        io.run();
    } catch (const std::exception& ex) {
        spdlog::error("Fatal: {}", ex.what());
        return 1;
    }

    spdlog::info("Server stopped");
    return 0;
}
