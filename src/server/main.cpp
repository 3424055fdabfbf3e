#include "mload/api/routes.hpp"
#include "mload/core/config.hpp"
#include "mload/events/components.hpp"
#include "mload/events/event_bus.hpp"
#include "mload/events/events.hpp"
#include "mload/network/http_router.hpp"
#include "mload/network/http_server_asio.hpp"
#include "mload/service/model_service.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using mload::network::HttpContext;
using mload::network::HttpMethodUtils;
using mload::network::HttpResponse;
using mload::network::HttpRouter;
using mload::network::HttpServerAsio;

namespace fs = std::filesystem;
namespace asio = boost::asio;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -c, --config <file>      JSON configuration file\n"
              << "  -p, --port <port>        Listen port (default 8080)\n"
              << "  -d, --data <dir>         Data directory (default ./mload_data)\n"
              << "  -t, --threads <n>        io_context threads (default 1)\n"
              << "  -l, --log-level <level>  trace|debug|info|warn|error\n"
              << "  -h, --help               Show this help\n";
}

std::optional<unsigned long> parse_number(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 9) {
        return std::nullopt;
    }
    return std::stoul(text);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> config_path;
    std::optional<std::string> port_arg;
    std::optional<std::string> data_arg;
    std::optional<std::string> threads_arg;
    std::optional<std::string> level_arg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port_arg = argv[++i];
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            data_arg = argv[++i];
        } else if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
            threads_arg = argv[++i];
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            level_arg = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    mload::Config config;
    if (config_path) {
        auto loaded = mload::load_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error());
            return 1;
        }
        config = loaded.value();
    }

    if (port_arg) {
        auto port = parse_number(*port_arg);
        if (!port || *port > 65535) {
            spdlog::error("Invalid port: {}", *port_arg);
            return 2;
        }
        config.server.port = static_cast<uint16_t>(*port);
    }
    if (data_arg) {
        config.storage.data_root = fs::path(*data_arg);
    }
    if (threads_arg) {
        auto threads = parse_number(*threads_arg);
        if (!threads) {
            spdlog::error("Invalid thread count: {}", *threads_arg);
            return 2;
        }
        config.server.threads = *threads;
    }
    if (level_arg) {
        config.logging.level = *level_arg;
    }

    if (auto valid = mload::validate_config(config); valid.is_error()) {
        spdlog::error("Invalid configuration: {}", valid.error());
        return 2;
    }
    mload::apply_logging_config(config.logging);

    mload::events::EventBus event_bus;
    mload::events::LoggerComponent logger(event_bus);
    mload::events::MetricsComponent metrics(event_bus);

    mload::service::ModelService service(config, event_bus);
    if (auto opened = service.open(); opened.is_error()) {
        spdlog::error("Failed to open data directory {}: {}",
                      config.storage.data_root.string(), opened.error().to_string());
        return 1;
    }

    HttpRouter router;
    router.use([](const HttpContext& ctx, HttpResponse&) {
        spdlog::info("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
        return true;
    });
    mload::api::register_routes(router, service, &metrics);

    asio::io_context io_context;
    std::optional<HttpServerAsio> server;
    try {
        server.emplace(io_context, config.server.bind_address, config.server.port, config.server.max_request_bytes);
    } catch (const std::exception& e) {
        spdlog::error("Failed to listen on {}:{}: {}", config.server.bind_address, config.server.port, e.what());
        return 1;
    }
    server->set_handler([&router](const mload::network::HttpRequest& request) {
        return router.handle_request(request);
    });

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        event_bus.emit(mload::events::ServerShuttingDownEvent{"signal " + std::to_string(signal_number)});
        server->stop();
        io_context.stop();
    });

    event_bus.emit(mload::events::ServerStartedEvent{config.server.bind_address, server->get_port(),
                                                     config.server.threads});

    std::vector<std::thread> workers;
    for (std::size_t i = 1; i < config.server.threads; ++i) {
        workers.emplace_back([&io_context] { io_context.run(); });
    }
    io_context.run();
    for (auto& worker : workers) {
        worker.join();
    }

    metrics.print_stats();
    return EXIT_SUCCESS;
}
