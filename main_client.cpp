/*
* @license
* (C) zachbabanov
*
*/

#include <client.hpp>
#include <config.hpp>
#include <logger.hpp>

#include <csignal>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace gamecast;
using namespace gamecast::log;

static client::StreamClient *g_client = nullptr;

static void on_signal(int) {
    if (g_client) g_client->stop();
}

static void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [--config <file>] [--name <client_name>] [--media-port <udp_port>]\n"
              << "       [--resolution <WxH>] [--fps <n>] [--bitrate <kbps>] [--codec h264|hevc]\n"
              << "       [--duration <seconds>] [--output <file.h264>] [--player <cmd>]\n"
              << "       [--pin <sha256 fingerprint>] [--tls on|off]\n"
              << "       [--log <log_file>] [--log-level trace|debug|info|warn|error] [<host:port>]\n";
    std::cerr << "Without --config, config.json next to the binary is used when present.\n";
    std::cerr << "CLI options override values from the config file.\n";
    std::cerr << "Example: " << prog << " --resolution 1280x720 --fps 60 --output out.h264 127.0.0.1:47989\n";
}

static bool parse_resolution(const std::string &s, uint32_t &w, uint32_t &h) {
    size_t x = s.find('x');
    if (x == std::string::npos) return false;
    w = (uint32_t)std::stoul(s.substr(0, x));
    h = (uint32_t)std::stoul(s.substr(x + 1));
    return w > 0 && h > 0;
}

int main(int argc, char **argv) {
    std::string config_path;
    std::vector<std::string> pos;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            if (i + 1 >= argc) {
                std::cerr << a << " requires a value\n";
                return 1;
            }
            if (a == "--config") config_path = argv[++i];
            else overrides.emplace_back(a, argv[++i]);
        } else {
            pos.push_back(a);
        }
    }

    config::ClientConfig cfg;
    try {
        if (config_path.empty()) {
            std::string def = config::get_exe_dir(argc > 0 ? argv[0] : nullptr) + "/config.json";
            if (config::file_exists(def)) config_path = def;
        }
        if (!config_path.empty()) cfg = config::load_client_config(config_path);

        for (const auto &o : overrides) {
            const std::string &k = o.first;
            const std::string &v = o.second;
            if (k == "--name") cfg.name = v;
            else if (k == "--media-port") cfg.media_port = (uint16_t)std::stoul(v);
            else if (k == "--resolution") {
                if (!parse_resolution(v, cfg.params.width, cfg.params.height)) {
                    std::cerr << "Invalid resolution: " << v << "\n";
                    return 1;
                }
            } else if (k == "--fps") cfg.params.fps = (uint32_t)std::stoul(v);
            else if (k == "--bitrate") cfg.params.bitrate_kbps = (uint32_t)std::stoul(v);
            else if (k == "--codec") {
                if (!common::parse_codec(v, cfg.params.codec)) {
                    std::cerr << "Unknown codec: " << v << "\n";
                    return 1;
                }
            } else if (k == "--duration") cfg.duration_s = (uint32_t)std::stoul(v);
            else if (k == "--output") cfg.output_file = v;
            else if (k == "--player") cfg.player_cmd = v;
            else if (k == "--pin") cfg.tls.pinned_fingerprint = v;
            else if (k == "--tls") {
                if (v != "on" && v != "off") {
                    std::cerr << "--tls expects on or off\n";
                    return 1;
                }
                cfg.tls.enabled = v == "on";
            } else if (k == "--log") cfg.log.file = v;
            else if (k == "--log-level") cfg.log.level = v;
            else {
                std::cerr << "Unknown option: " << k << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (!pos.empty()) {
            size_t colon = pos[0].find(':');
            if (colon == std::string::npos) {
                std::cerr << "host:port required\n";
                print_usage(argv[0]);
                return 1;
            }
            cfg.host = pos[0].substr(0, colon);
            cfg.control_port = (uint16_t)std::stoul(pos[0].substr(colon + 1));
        }
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

    LOG_GEN_INFO("Starting client -> {}:{} offer {} duration={}s output='{}' player='{}'",
                 cfg.host, cfg.control_port, cfg.params.describe(), cfg.duration_s, cfg.output_file, cfg.player_cmd);

    client::StreamClient c(cfg);
    g_client = &c;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    bool ok = c.run();
    g_client = nullptr;
    if (!ok) {
        LOG_GEN_ERROR("Client run failed{}", c.end_reason().empty() ? std::string() : ": " + c.end_reason());
        return 2;
    }
    return 0;
}
