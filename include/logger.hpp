/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_LOGGER_HPP
#define GAMECAST_LOGGER_HPP

#pragma once

#include <fstream>
#include <string>
#include <atomic>
#include <mutex>

#include <fmt/core.h>

namespace gamecast::log {

/**
 * @brief Log level enumeration
 */
    enum class Level {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

/**
 * @brief Categories attached to each log line.
 *
 * One category per pipeline layer so a noisy layer can be grepped out.
 */
    enum class Category {
        GENERAL,
        VIDEO,
        AUDIO,
        FEC,
        SESSION,
        NETWORK,
        PIPELINE
    };

    /// Parse "trace|debug|info|warn|error" (case-insensitive). Unknown strings yield @p def.
    Level parse_level(const std::string &s, Level def = Level::INFO);

    const char *level_name(Level l);
    const char *category_name(Category c);

/**
 * @brief Thread-safe singleton logger using fmt for formatting.
 *
 * Usage:
 *   LOG_SESSION_INFO("session {} -> {}", token, state_name(to));
 */
    class Logger {
    public:
        static Logger &instance();

        /// Set global minimal log level (messages below will be ignored)
        void set_level(Level l);
        Level level() const { return min_level_.load(); }

        /// Returns true if a message at @p l would be written.
        bool enabled(Level l) const { return l >= min_level_.load(); }

        /// Open file to duplicate logs into
        bool open_logfile(const std::string &path);

        /// Close log file
        void close_logfile();

        /// Mute stdout (file output, if any, continues). Used by the test runner.
        void set_console(bool on) { console_.store(on); }

        /// Core logging call: prints a ready message
        void log(Level lvl, Category cat, const std::string &msg, const char *file = nullptr, int line = 0);

        /**
         * @brief logf - formats a message using fmt and forwards it to log().
         *
         * Level check happens before formatting so disabled TRACE lines in the
         * per-shard paths cost nothing.
         */
        template<typename... Args>
        void logf(Level lvl, Category cat, const char *file, int line, const char *fmt_str, Args&&... args) {
            if (!enabled(lvl)) return;
            std::string msg;
            try {
                if (fmt_str && fmt_str[0] != '\0') {
                    fmt::format_to(std::back_inserter(msg), fmt_str, std::forward<Args>(args)...);
                }
            } catch (const std::exception &e) {
                msg = std::string("[format_error:") + e.what() + "] " + (fmt_str ? fmt_str : "");
            }
            log(lvl, cat, msg, file, line);
        }

    private:
        Logger();
        ~Logger();

        std::mutex mtx_;
        std::ofstream file_;
        std::atomic<Level> min_level_;
        std::atomic<bool> console_;

        std::string timestamp_now();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;
    };

#define GAMECAST_LOG(lvl, cat, fmt, ...) gamecast::log::Logger::instance().logf(gamecast::log::Level::lvl, gamecast::log::Category::cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_GEN_TRACE(fmt, ...) GAMECAST_LOG(TRACE, GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_DEBUG(fmt, ...) GAMECAST_LOG(DEBUG, GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_INFO(fmt, ...)  GAMECAST_LOG(INFO,  GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_WARN(fmt, ...)  GAMECAST_LOG(WARN,  GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_ERROR(fmt, ...) GAMECAST_LOG(ERROR, GENERAL, fmt, ##__VA_ARGS__)

#define LOG_VIDEO_TRACE(fmt, ...) GAMECAST_LOG(TRACE, VIDEO, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_DEBUG(fmt, ...) GAMECAST_LOG(DEBUG, VIDEO, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_INFO(fmt, ...)  GAMECAST_LOG(INFO,  VIDEO, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_WARN(fmt, ...)  GAMECAST_LOG(WARN,  VIDEO, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_ERROR(fmt, ...) GAMECAST_LOG(ERROR, VIDEO, fmt, ##__VA_ARGS__)

#define LOG_AUDIO_TRACE(fmt, ...) GAMECAST_LOG(TRACE, AUDIO, fmt, ##__VA_ARGS__)
#define LOG_AUDIO_DEBUG(fmt, ...) GAMECAST_LOG(DEBUG, AUDIO, fmt, ##__VA_ARGS__)
#define LOG_AUDIO_INFO(fmt, ...)  GAMECAST_LOG(INFO,  AUDIO, fmt, ##__VA_ARGS__)
#define LOG_AUDIO_WARN(fmt, ...)  GAMECAST_LOG(WARN,  AUDIO, fmt, ##__VA_ARGS__)
#define LOG_AUDIO_ERROR(fmt, ...) GAMECAST_LOG(ERROR, AUDIO, fmt, ##__VA_ARGS__)

#define LOG_FEC_TRACE(fmt, ...) GAMECAST_LOG(TRACE, FEC, fmt, ##__VA_ARGS__)
#define LOG_FEC_DEBUG(fmt, ...) GAMECAST_LOG(DEBUG, FEC, fmt, ##__VA_ARGS__)
#define LOG_FEC_INFO(fmt, ...)  GAMECAST_LOG(INFO,  FEC, fmt, ##__VA_ARGS__)
#define LOG_FEC_WARN(fmt, ...)  GAMECAST_LOG(WARN,  FEC, fmt, ##__VA_ARGS__)
#define LOG_FEC_ERROR(fmt, ...) GAMECAST_LOG(ERROR, FEC, fmt, ##__VA_ARGS__)

#define LOG_SESSION_TRACE(fmt, ...) GAMECAST_LOG(TRACE, SESSION, fmt, ##__VA_ARGS__)
#define LOG_SESSION_DEBUG(fmt, ...) GAMECAST_LOG(DEBUG, SESSION, fmt, ##__VA_ARGS__)
#define LOG_SESSION_INFO(fmt, ...)  GAMECAST_LOG(INFO,  SESSION, fmt, ##__VA_ARGS__)
#define LOG_SESSION_WARN(fmt, ...)  GAMECAST_LOG(WARN,  SESSION, fmt, ##__VA_ARGS__)
#define LOG_SESSION_ERROR(fmt, ...) GAMECAST_LOG(ERROR, SESSION, fmt, ##__VA_ARGS__)

#define LOG_NET_TRACE(fmt, ...) GAMECAST_LOG(TRACE, NETWORK, fmt, ##__VA_ARGS__)
#define LOG_NET_DEBUG(fmt, ...) GAMECAST_LOG(DEBUG, NETWORK, fmt, ##__VA_ARGS__)
#define LOG_NET_INFO(fmt, ...)  GAMECAST_LOG(INFO,  NETWORK, fmt, ##__VA_ARGS__)
#define LOG_NET_WARN(fmt, ...)  GAMECAST_LOG(WARN,  NETWORK, fmt, ##__VA_ARGS__)
#define LOG_NET_ERROR(fmt, ...) GAMECAST_LOG(ERROR, NETWORK, fmt, ##__VA_ARGS__)

#define LOG_PIPE_TRACE(fmt, ...) GAMECAST_LOG(TRACE, PIPELINE, fmt, ##__VA_ARGS__)
#define LOG_PIPE_DEBUG(fmt, ...) GAMECAST_LOG(DEBUG, PIPELINE, fmt, ##__VA_ARGS__)
#define LOG_PIPE_INFO(fmt, ...)  GAMECAST_LOG(INFO,  PIPELINE, fmt, ##__VA_ARGS__)
#define LOG_PIPE_WARN(fmt, ...)  GAMECAST_LOG(WARN,  PIPELINE, fmt, ##__VA_ARGS__)
#define LOG_PIPE_ERROR(fmt, ...) GAMECAST_LOG(ERROR, PIPELINE, fmt, ##__VA_ARGS__)

} // namespace gamecast::log

#endif // GAMECAST_LOGGER_HPP
