#include <QCoreApplication>
#include <QString>

#include <csignal>
#include <iostream>
#include <memory>

#include "core/block_store.h"
#include "core/config.h"
#include "core/http_origin.h"
#include "core/logger.h"
#include "core/range_service.h"
#include "core/thread_pool.h"
#include "server/http_server.h"
#include "server/signal_bridge.h"

namespace {

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " --config <file.json> [--port <n>]\n";
}

std::shared_ptr<BlockStore> makeStore(const CacheConfig& cache) {
    if (cache.type == "disk") {
        return std::make_shared<DiskBlockStore>(cache.directory);
    }
    if (cache.type != "memory") {
        Logger::instance().warn("unknown cache type '" + cache.type + "', using memory");
    }
    return std::make_shared<MemoryBlockStore>(cache.memory_capacity_bytes);
}

std::shared_ptr<Origin> makeOrigin(const ServiceConfig& config) {
    HttpConfig http;
    http.connect_timeout_sec = config.origin.connect_timeout_sec;
    http.transfer_timeout_sec = config.origin.transfer_timeout_sec;
    http.verify_ssl = config.origin.verify_ssl;
    http.host_header = config.origin.host_header;
    http.buffer_size = static_cast<long>(config.read_chunk_size);
    return std::make_shared<HttpOrigin>(config.origin.base_url, http);
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("blockrange_proxy");

    QString configPath;
    int portOverride = -1;
    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == "--config" && i + 1 < argc) {
            configPath = QString::fromLocal8Bit(argv[++i]);
        } else if (arg == "--port" && i + 1 < argc) {
            bool ok = false;
            portOverride = QString::fromLocal8Bit(argv[++i]).toInt(&ok);
            if (!ok || portOverride < 0 || portOverride > 65535) {
                printUsage(argv[0]);
                return 2;
            }
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }
    if (configPath.isEmpty()) {
        printUsage(argv[0]);
        return 2;
    }

    Logger& log = Logger::instance();
    log.setEchoToStderr(true);

    auto loaded = ConfigFile::load(configPath.toStdString());
    if (!loaded) {
        return 1;
    }
    ServiceConfig config = *loaded;
    if (portOverride >= 0) {
        config.listen_port = portOverride;
    }

    if (auto level = parseLogLevel(config.log_level)) {
        log.setMinLevel(*level);
    } else {
        log.warn("unknown log level '" + config.log_level + "', using info");
    }
    if (!config.log_file.empty() && !log.setLogFile(config.log_file)) {
        log.error("cannot open log file " + config.log_file);
        return 1;
    }

    if (config.origin.base_url.empty()) {
        log.error("origin.base_url is required");
        return 1;
    }

    std::unique_ptr<RangeService> service;
    try {
        service = std::make_unique<RangeService>(config, makeStore(config.cache), makeOrigin(config));
    } catch (const std::exception& e) {
        log.error(std::string("startup failed: ") + e.what());
        return 1;
    }

    ThreadPool workers(static_cast<size_t>(config.request_threads), "request");
    HttpServer server(service.get(), &workers);
    if (!server.start(QString::fromStdString(config.listen_address),
                      static_cast<quint16>(config.listen_port))) {
        return 1;
    }

    log.info("origin " + config.origin.base_url
        + ", block size " + std::to_string(config.block_size)
        + ", parallel " + std::to_string(config.max_parallel)
        + ", cache " + config.cache.type);

    SignalBridge signals_bridge;
    QObject::connect(&signals_bridge, &SignalBridge::signalReceived,
                     &app, &QCoreApplication::quit);
    if (!signals_bridge.install({SIGINT, SIGTERM})) {
        return 1;
    }

    int rc = app.exec();

    server.stop();
    // Finish in-flight requests before the service goes away.
    workers.shutdown();
    log.info("shut down");
    return rc;
}
