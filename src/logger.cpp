/*
* @license
* (C) zachbabanov
*
*/

#include <logger.hpp>

#include <fmt/core.h>
#include <fmt/chrono.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace gamecast::log {

    Level parse_level(const std::string &s, Level def) {
        std::string v = s;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)::tolower(c); });
        if (v == "trace") return Level::TRACE;
        if (v == "debug") return Level::DEBUG;
        if (v == "info") return Level::INFO;
        if (v == "warn" || v == "warning") return Level::WARN;
        if (v == "error" || v == "err") return Level::ERROR;
        return def;
    }

    const char *level_name(Level l) {
        switch (l) {
            case Level::TRACE: return "TRACE";
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERROR: return "ERROR";
        }
        return "?????";
    }

    const char *category_name(Category c) {
        switch (c) {
            case Category::GENERAL:  return "GEN";
            case Category::VIDEO:    return "VIDEO";
            case Category::AUDIO:    return "AUDIO";
            case Category::FEC:      return "FEC";
            case Category::SESSION:  return "SESSION";
            case Category::NETWORK:  return "NET";
            case Category::PIPELINE: return "PIPE";
        }
        return "GEN";
    }

    Logger &Logger::instance() {
        static Logger lg;
        return lg;
    }

    Logger::Logger() : min_level_(Level::INFO), console_(true) {}

    Logger::~Logger() {
        if (file_.is_open()) file_.close();
    }

    void Logger::set_level(Level l) {
        min_level_.store(l);
    }

    bool Logger::open_logfile(const std::string &path) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::out | std::ios::app);
        return file_.is_open();
    }

    void Logger::close_logfile() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (file_.is_open()) file_.close();
    }

    std::string Logger::timestamp_now() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto itt = system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&itt, &tm);
        auto us = duration_cast<microseconds>(now.time_since_epoch()) % 1000000;
        return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06}", tm, static_cast<int>(us.count()));
    }

    void Logger::log(Level lvl, Category cat, const std::string &msg, const char *file, int line) {
        if (lvl < min_level_.load()) return;

        std::string ts = timestamp_now();

        std::string location;
        if (file) {
            const char *fname = file;
            const char *p = std::strrchr(file, '/');
            if (p) fname = p + 1;
            location = fmt::format(" ({}:{})", fname, line);
        }

        std::string out = fmt::format("{} [{}] {{{}}}{} - {}\n", ts, level_name(lvl), category_name(cat), location, msg);

        std::lock_guard<std::mutex> lk(mtx_);
        if (console_.load()) {
            std::fwrite(out.data(), 1, out.size(), stdout);
            std::fflush(stdout);
        }
        if (file_.is_open()) {
            file_ << out;
            file_.flush();
        }
    }

} // namespace gamecast::log
