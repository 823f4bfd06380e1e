/*
* @license
* (C) zachbabanov
*
*/

#include <config.hpp>
#include <host.hpp>
#include <logger.hpp>

#include <csignal>
#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gamecast;
using namespace gamecast::log;

static host::StreamHost *g_host = nullptr;

static void on_signal(int) {
    if (g_host) g_host->stop();
}

static void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [--config <file>] [--bind <address>] [--media-port <udp_port>]\n"
              << "       [--max-sessions <n>] [--tls-cert <pem> --tls-key <pem>] [--no-tls]\n"
              << "       [--log <log_file>] [--log-level trace|debug|info|warn|error] [<tcp_port>]\n";
    std::cerr << "Without --config, config.json next to the binary is used when present.\n";
    std::cerr << "Example: " << prog << " --log host.log --log-level info 47989\n";
}

int main(int argc, char **argv) {
    std::string config_path;
    std::string log_file;
    std::string log_level_str;
    std::string bind_cli;
    std::string media_port_cli;
    std::string max_sessions_cli;
    std::string tls_cert_cli;
    std::string tls_key_cli;
    bool no_tls = false;
    std::vector<std::string> pos;

    // parse flags, rest are positional
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (a == "--no-tls") {
            no_tls = true;
            continue;
        }
        std::string *target = nullptr;
        if (a == "--config") target = &config_path;
        else if (a == "--log") target = &log_file;
        else if (a == "--log-level") target = &log_level_str;
        else if (a == "--bind") target = &bind_cli;
        else if (a == "--media-port") target = &media_port_cli;
        else if (a == "--max-sessions") target = &max_sessions_cli;
        else if (a == "--tls-cert") target = &tls_cert_cli;
        else if (a == "--tls-key") target = &tls_key_cli;

        if (target) {
            if (i + 1 >= argc) {
                std::cerr << a << " requires a value\n";
                return 1;
            }
            *target = argv[++i];
        } else if (a.compare(0, 2, "--") == 0) {
            std::cerr << "Unknown option: " << a << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            pos.push_back(a);
        }
    }

    config::HostConfig cfg;
    try {
        if (config_path.empty()) {
            std::string def = config::get_exe_dir(argc > 0 ? argv[0] : nullptr) + "/config.json";
            if (config::file_exists(def)) config_path = def;
        }
        if (!config_path.empty()) cfg = config::load_host_config(config_path);

        // positional: [tcp_port]
        if (!pos.empty()) cfg.network.control_port = (uint16_t)std::stoul(pos[0]);
        if (!bind_cli.empty()) cfg.network.bind_address = bind_cli;
        if (!media_port_cli.empty()) cfg.network.media_port = (uint16_t)std::stoul(media_port_cli);
        if (!max_sessions_cli.empty()) cfg.network.max_sessions = (uint32_t)std::stoul(max_sessions_cli);
        if (!tls_cert_cli.empty()) cfg.tls.cert_file = tls_cert_cli;
        if (!tls_key_cli.empty()) cfg.tls.key_file = tls_key_cli;
        if (cfg.tls.cert_file.empty() != cfg.tls.key_file.empty()) {
            throw std::invalid_argument("--tls-cert and --tls-key must be given together");
        }
        if (no_tls) cfg.tls.enabled = false;
        if (!log_file.empty()) cfg.log.file = log_file;
        if (!log_level_str.empty()) cfg.log.level = log_level_str;
    } catch (const std::exception &e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    Logger::instance().set_level(parse_level(cfg.log.level, Level::INFO));

    // If user provided a log file, test opening it first for append/writability
    if (!cfg.log.file.empty()) {
        std::ofstream ofs(cfg.log.file.c_str(), std::ios::app);
        if (!ofs) {
            std::cerr << "Warning: could not open log file '" << cfg.log.file << "' for append, continuing without file logging\n";
        } else {
            ofs.close();
            Logger::instance().open_logfile(cfg.log.file);
        }
    }

    host::StreamHost srv(cfg);
    srv.set_discovery_hook([](uint16_t control_port, uint16_t media_port) {
        LOG_NET_INFO("Host discoverable: control tcp/{} media udp/{}", control_port, media_port);
    });
    if (!srv.start()) {
        LOG_GEN_ERROR("Host failed to start");
        return 1;
    }

    g_host = &srv;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);

    srv.runLoop();
    g_host = nullptr;
    LOG_GEN_INFO("Host stopped");
    return 0;
}
