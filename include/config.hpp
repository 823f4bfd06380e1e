/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_CONFIG_HPP
#define GAMECAST_CONFIG_HPP

#pragma once

#include <common.hpp>
#include <fec.hpp>
#include <media.hpp>
#include <orchestrator.hpp>
#include <tls.hpp>

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace gamecast::config {

    struct NetworkConfig {
        std::string bind_address = "0.0.0.0";
        uint16_t control_port = 47989;          // 0 = ephemeral
        uint16_t media_port = 47998;            // 0 = ephemeral
        int media_tos = 160;                    // -1 = leave unmarked
        uint32_t control_send_timeout_ms = 1000;
        uint32_t liveness_timeout_ms = 10000;
        size_t media_queue_capacity = 1024;
        uint32_t pacing_kbps = 0;
        uint32_t max_sessions = (uint32_t)common::MAX_CLIENTS;
        uint32_t loop_interval_ms = 1;
    };

    struct EncoderPoolConfig {
        size_t video_slots = 2;
        size_t audio_slots = 2;
    };

    struct CaptureConfig {
        std::string video_device = "display:0";
        std::string audio_device = "audio:default";
        uint32_t max_restarts = 3;
        uint32_t audio_chunk_ms = 10;
    };

    struct LogConfig {
        std::string file;
        std::string level = "info";
    };

    struct HostConfig {
        NetworkConfig network;
        media::HostCapabilities capabilities;
        fec::FecConfig fec;
        pipeline::PipelineConfig pipeline;
        EncoderPoolConfig encoders;
        CaptureConfig capture;
        tls::TlsConfig tls;
        LogConfig log;
    };

    struct ClientConfig {
        std::string host = "127.0.0.1";
        uint16_t control_port = 47989;
        uint16_t media_port = 0;                // local UDP port, 0 = ephemeral
        std::string name = "gamecast-client";
        media::StreamParams params;
        uint32_t duration_s = 0;                // 0 = until interrupted
        uint32_t heartbeat_ms = 1000;
        uint32_t loss_report_ms = 500;
        uint32_t reassembly_max_age_ms = 500;
        uint32_t connect_timeout_ms = 3000;
        std::string output_file;                // Annex-B dump of the video track
        std::string player_cmd;                 // e.g. ffplay; empty = no player
        tls::TlsConfig tls;                     // cert_file/key_file unused on this side
        LogConfig log;
    };

    // Conversions used by the loaders. Missing keys keep their defaults;
    // values of the wrong type throw nlohmann::json::exception, invalid
    // values (unknown codec, zero fps...) throw std::invalid_argument.
    media::StreamParams stream_params_from_json(const nlohmann::json &j, const media::StreamParams &defaults = {});
    HostConfig host_config_from_json(const nlohmann::json &j);
    ClientConfig client_config_from_json(const nlohmann::json &j);

    nlohmann::json to_json(const media::StreamParams &p);

    /// Read and parse @p path. Throws std::runtime_error when the file cannot be read.
    HostConfig load_host_config(const std::string &path);
    ClientConfig load_client_config(const std::string &path);

    bool file_exists(const std::string &path);
    /// Directory of the running binary ("." when it cannot be determined).
    std::string get_exe_dir(const char *argv0);

} // namespace gamecast::config

#endif // GAMECAST_CONFIG_HPP
