#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "engine/DatasetCache.hpp"
#include "engine/DatasetIngestor.hpp"
#include "engine/LLMClientRegistry.hpp"
#include "engine/QueryExecutor.hpp"
#include "llm/WorkerClient.hpp"
#include "server/HttpServer.hpp"
#include "server/RequestHandler.hpp"
#include "storage/SessionStore.hpp"
#include <iostream>
#include <thread>
#include <vector>

using namespace datachat;

namespace net = boost::asio;
namespace beast = boost::beast;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config FILE        Settings file (key=value lines, @file syntax)\n"
              << "  -p, --port PORT      Port to listen on (default: 8080)\n"
              << "  -a, --address ADDR   Address to bind to (default: 0.0.0.0)\n"
              << "  -t, --threads N      Server threads (default: 4)\n"
              << "  -s, --storage PATH   SQLite database path (default: datachat.db)\n"
              << "  -w, --worker URL     Analysis worker URL\n"
              << "  --set KEY=VALUE      Override any setting\n"
              << "  -l, --log-level LVL  Log level: debug, info, warn, error (default: info)\n"
              << "  --log-file PATH      Also write logs to PATH\n"
              << "  -h, --help           Show this help\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        // Config file first, flags override it
        std::string configFile;
        std::vector<std::pair<std::string, std::string>> overrides;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                overrides.emplace_back("server.port", argv[++i]);
            } else if ((arg == "-a" || arg == "--address") && i + 1 < argc) {
                overrides.emplace_back("server.address", argv[++i]);
            } else if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
                overrides.emplace_back("server.threads", argv[++i]);
            } else if ((arg == "-s" || arg == "--storage") && i + 1 < argc) {
                overrides.emplace_back("storage.path", argv[++i]);
            } else if ((arg == "-w" || arg == "--worker") && i + 1 < argc) {
                overrides.emplace_back("worker.url", argv[++i]);
            } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                overrides.emplace_back("log.level", argv[++i]);
            } else if (arg == "--log-file" && i + 1 < argc) {
                overrides.emplace_back("log.file", argv[++i]);
            } else if (arg == "--set" && i + 1 < argc) {
                std::string setting = argv[++i];
                auto eq = setting.find('=');
                if (eq == std::string::npos) {
                    std::cerr << "Error: --set expects KEY=VALUE, got " << setting << std::endl;
                    return 1;
                }
                overrides.emplace_back(setting.substr(0, eq), setting.substr(eq + 1));
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Error: unknown argument " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        AppConfig config = configFile.empty() ? AppConfig{} : ConfigLoader::loadFile(configFile);
        for (const auto& [key, value] : overrides) {
            if (!config.set(key, value)) {
                std::cerr << "Error: unknown setting " << key << std::endl;
                return 1;
            }
        }
        config.validate();

        auto& logger = Logger::instance();
        logger.setLevel(Logger::parseLevel(config.logLevel));
        if (!config.logFile.empty()) {
            logger.enableFileLogging(config.logFile);
        }

        LOG_INFO("main", "=== datachat ===");

        storage::SessionStore store(config.storagePath);
        engine::DatasetCache cache(config.cacheCapacity);
        engine::LLMClientRegistry clients([options = llm::WorkerClient::optionsFromConfig(config)]() {
            return std::make_shared<llm::WorkerClient>(options);
        });
        engine::QueryExecutor executor(store, cache, clients, engine::QueryExecutorOptions::fromConfig(config));
        engine::DatasetIngestor ingestor(store);
        server::RequestHandler handler(store, cache, clients, executor, ingestor);

        net::io_context ioc{static_cast<int>(config.threads)};

        server::HttpServer httpServer(ioc, config.address, config.port, handler,
                                      std::chrono::milliseconds(config.requestTimeoutMs));
        httpServer.run();

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const beast::error_code&, int) {
            LOG_INFO("main", "Shutting down...");
            httpServer.stop();
            ioc.stop();
        });

        LOG_INFO("main", "Storage: " + store.getDbPath() + ", cache capacity " +
                 std::to_string(config.cacheCapacity) + ", worker " + config.workerUrl);

        std::vector<std::thread> threads;
        threads.reserve(config.threads - 1);
        for (unsigned i = 1; i < config.threads; ++i) {
            threads.emplace_back([&ioc]() { ioc.run(); });
        }
        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
