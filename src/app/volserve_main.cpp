#include <volserve/archive/archive_materializer.h>
#include <volserve/assembly/part_locator.h>
#include <volserve/cache/rebuild_cache.h>
#include <volserve/config/server_config.h>
#include <volserve/http/delivery_handler.h>
#include <volserve/http/http_server.h>
#include <volserve/manifest/part_manifest.h>
#include <volserve/version.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#if !defined(_WIN32)
#include <execinfo.h>
#endif

namespace {

void log_fatal(const char* what) {
    try {
        spdlog::critical("FATAL: {}", what);
        spdlog::default_logger()->flush();
    } catch (const std::exception&) {
        // Logger unusable; stderr is all that is left
        std::fprintf(stderr, "FATAL: %s\n", what);
    }
}

void signal_handler(int signo) {
    const char* sigstr = (signo == SIGSEGV)   ? "SIGSEGV"
                         : (signo == SIGABRT) ? "SIGABRT"
                                              : "UNKNOWN";
    log_fatal(sigstr);
#if !defined(_WIN32)
    void* bt[64];
    int n = backtrace(bt, 64);
    char** syms = backtrace_symbols(bt, n);
    if (syms) {
        for (int i = 0; i < n; ++i)
            spdlog::critical("Backtrace[{}]: {}", i, syms[i]);
        free(syms);
    }
#endif
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::_Exit(128 + signo);
}

void setup_fatal_handlers() {
    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGABRT, signal_handler);
#if !defined(_WIN32)
    // A vanished client must surface as EPIPE on write, not kill the process
    std::signal(SIGPIPE, SIG_IGN);
#endif
    std::set_terminate([]() noexcept {
        log_fatal("std::terminate called");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::_Exit(1);
    });
}

bool setup_logging(const std::string& level, const std::string& file) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file, 10 * 1024 * 1024, 5));
        }
        auto logger = std::make_shared<spdlog::logger>("volserve", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);

        if (level == "trace")
            spdlog::set_level(spdlog::level::trace);
        else if (level == "debug")
            spdlog::set_level(spdlog::level::debug);
        else if (level == "warn")
            spdlog::set_level(spdlog::level::warn);
        else if (level == "error")
            spdlog::set_level(spdlog::level::err);
        else
            spdlog::set_level(spdlog::level::info);

        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        spdlog::flush_on(spdlog::level::warn);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void print_banner(const volserve::config::ServerConfig& cfg,
                  const volserve::manifest::ArtifactManifest& manifest, std::uint16_t port) {
    spdlog::info("volserve {} serving {} (root: {})", VOLSERVE_VERSION_STRING,
                 manifest.outputName, cfg.rootDir().string());
    spdlog::info("Serving at http://localhost:{}", port);
    spdlog::info("Endpoints:");
    spdlog::info("  /          -> {}", cfg.server.indexDocument);
    spdlog::info("  /download  -> {} ({} mode, {} parts)", manifest.outputName,
                 volserve::config::toString(cfg.pipeline.mode), manifest.parts.size());
    spdlog::info("  /concat    -> raw concatenation of the parts");
    spdlog::info("  /rebuild   -> forced rebuild into {} (?force=0 to reuse)",
                 cfg.cacheDir().string());
    spdlog::info("  /extract   -> materialize and report the published directory");
    spdlog::info("  /diag      -> configuration and part report");
    spdlog::info("  /health    -> ok");
}

} // namespace

int main(int argc, char* argv[]) {
    setup_fatal_handlers();

    CLI::App app{"volserve - split-archive reassembly and delivery server"};

    std::string config_file;
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<std::uint16_t> positional_port;
    std::optional<std::string> root;
    std::optional<std::string> mode;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool print_config = false;

    app.add_option("-c,--config", config_file, "Configuration file (TOML)")->check(CLI::ExistingFile);
    app.add_option("--host", host, "Listen address");
    app.add_option("-p,--port", port, "Listen port")->check(CLI::Range(1, 65535));
    app.add_option("listen_port", positional_port, "Listen port (positional form of --port)")
        ->check(CLI::Range(1, 65535));
    app.add_option("-r,--root", root, "Directory to serve");
    app.add_option("-m,--mode", mode, "Pipeline mode")
        ->check(CLI::IsMember({"raw", "extract", "repackage"}));
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    app.add_option("--log-file", log_file, "Rotating log file (optional)");
    app.add_flag("--print-config", print_config, "Print the effective configuration and exit");
    CLI11_PARSE(app, argc, argv);

    // Defaults < config file < command line
    volserve::config::ServerConfig cfg;
    if (!config_file.empty()) {
        auto loaded = volserve::config::loadServerConfig(config_file);
        if (!loaded) {
            std::cerr << "Failed to load " << config_file << ": " << loaded.error().message
                      << std::endl;
            return 1;
        }
        cfg = std::move(loaded).value();
    }

    volserve::config::TomlSections overrides;
    if (host)
        overrides["server"]["host"] = *host;
    if (positional_port)
        overrides["server"]["port"] = std::to_string(*positional_port);
    if (port)
        overrides["server"]["port"] = std::to_string(*port);
    if (root)
        overrides["server"]["root_dir"] = *root;
    if (mode)
        overrides["pipeline"]["mode"] = *mode;
    if (log_level)
        overrides["logging"]["level"] = *log_level;
    if (log_file)
        overrides["logging"]["file"] = *log_file;
    if (auto applied = volserve::config::applyTomlSections(overrides, cfg); !applied) {
        std::cerr << applied.error().message << std::endl;
        return 1;
    }

    if (print_config) {
        std::cout << volserve::config::describe(cfg);
        return 0;
    }

    if (!setup_logging(cfg.logging.level, cfg.logging.file.string()))
        return 1;

    if (auto valid = volserve::config::validate(cfg); !valid) {
        spdlog::error("invalid configuration: {}", valid.error().message);
        return 1;
    }

    auto manifest = volserve::manifest::resolveManifest(cfg);
    if (!manifest) {
        spdlog::error("cannot resolve the part manifest: {}", manifest.error().message);
        return 1;
    }

    volserve::assembly::PartLocator::Options locatorOptions;
    locatorOptions.minPartBytes = cfg.parts.minPartBytes;
    volserve::assembly::PartLocator locator(locatorOptions);

    auto materializer = volserve::archive::makeMaterializer(cfg, manifest.value().outputName);
    volserve::cache::RebuildCache cache(cfg.cacheDir(), *materializer);
    if (auto init = cache.initialize(); !init) {
        spdlog::error("cannot prepare the cache: {}", init.error().message);
        return 1;
    }

    // Part problems are reported per request; at startup they are only worth a warning
    if (auto located = locator.locate(manifest.value()); !located) {
        spdlog::warn("parts not ready: {}", located.error().message);
    }

    volserve::http::DeliveryHandler handler(volserve::http::DeliveryContext{
        cfg, manifest.value(), locator, cache, materializer->extractor()});

    try {
        boost::asio::io_context ioc;
        volserve::http::HttpServer server(ioc, handler, {cfg.server.host, cfg.server.port});
        if (auto listening = server.listen(); !listening) {
            spdlog::error("{}", listening.error().message);
            return 1;
        }
        print_banner(cfg, manifest.value(), server.port());

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec)
                return;
            spdlog::info("Received signal {}, shutting down...", signo);
            server.stop();
        });

        server.start();
        ioc.run();
        spdlog::info("Bye!");
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
