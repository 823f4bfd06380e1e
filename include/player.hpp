/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_PLAYER_HPP
#define GAMECAST_PLAYER_HPP

#pragma once

#include <common.hpp>

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

namespace gamecast::client {

/**
 * @brief PlayerProcess launches an external player (ffplay) and feeds its stdin.
 *
 * A pipe + fork + execvp; the parent keeps the write end in non-blocking mode.
 */
    class PlayerProcess {
    public:
        /// Empty @p app_args selects low-latency ffplay flags for @p codec read from stdin.
        static std::unique_ptr<PlayerProcess> launch(const std::string &player_cmd, common::Codec codec,
                                                     const std::vector<std::string> &app_args = {});

        ~PlayerProcess();

        /**
         * @brief Write buffer to player stdin.
         * @return number of bytes written (0 when the pipe is full), or -1 on error.
         */
        ssize_t write_data(const uint8_t *buf, size_t len);

        int get_write_fd() const { return write_fd_; }

        /// Stop the player process and clean up resources.
        void stop();

    private:
        PlayerProcess() = default;

        int write_fd_ = -1;
        pid_t pid_ = -1;
    };

/**
 * @brief Sink for reassembled video: an Annex-B file and/or a player pipe.
 *
 * Nothing is written until the first access unit that carries parameter sets
 * and an IDR, so the output always starts decodable. Bytes the player pipe
 * could not take are kept and retried; past the hard limit the backlog is
 * discarded and output waits for the next keyframe again.
 */
    class VideoOutput {
    public:
        static constexpr size_t MAX_PLAYER_BACKLOG = 8 * 1024 * 1024;

        VideoOutput(common::Codec codec, const std::string &file_path, const std::string &player_cmd);
        ~VideoOutput();

        /// False when an output that was asked for could not be opened.
        bool ok() const { return ok_; }

        /**
         * @brief Hand one access unit over.
         * @return true when output is waiting for a keyframe (the caller should ask for one).
         */
        bool write_frame(const std::vector<uint8_t> &au);

        /// Retry bytes the player pipe refused earlier.
        void flush();

        uint64_t frames_written() const { return frames_written_; }
        uint64_t frames_skipped() const { return frames_skipped_; }
        bool waiting_for_keyframe() const { return waiting_keyframe_; }

    private:
        common::Codec codec_;
        std::ofstream file_;
        std::unique_ptr<PlayerProcess> player_;
        std::vector<uint8_t> backlog_;
        bool waiting_keyframe_ = true;
        bool ok_ = true;
        uint64_t frames_written_ = 0;
        uint64_t frames_skipped_ = 0;
    };

} // namespace gamecast::client

#endif // GAMECAST_PLAYER_HPP
