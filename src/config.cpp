/*
* @license
* (C) zachbabanov
*
*/

#include <config.hpp>
#include <logger.hpp>

#include <fstream>
#include <stdexcept>

#include <sys/stat.h>
#include <limits.h>
#include <unistd.h>

using json = nlohmann::json;

namespace gamecast::config {

namespace {

    common::Codec codec_from_json(const json &v) {
        common::Codec c;
        if (!common::parse_codec(v.get<std::string>(), c)) {
            throw std::invalid_argument("unknown codec '" + v.get<std::string>() + "'");
        }
        return c;
    }

    void log_from_json(const json &j, LogConfig &out) {
        if (!j.is_object()) return;
        out.file = j.value("file", out.file);
        out.level = j.value("level", out.level);
    }

    void tls_from_json(const json &j, tls::TlsConfig &out) {
        if (!j.is_object()) return;
        out.enabled = j.value("enabled", out.enabled);
        out.cert_file = j.value("cert_file", out.cert_file);
        out.key_file = j.value("key_file", out.key_file);
        out.pinned_fingerprint = j.value("pinned_fingerprint", out.pinned_fingerprint);
        if (out.cert_file.empty() != out.key_file.empty()) {
            throw std::invalid_argument("tls: cert_file and key_file must be given together");
        }
    }

    json read_json_file(const std::string &path) {
        std::ifstream ifs(path);
        if (!ifs) throw std::runtime_error("cannot open config file '" + path + "'");
        json j;
        ifs >> j;
        return j;
    }

} // namespace

    media::StreamParams stream_params_from_json(const json &j, const media::StreamParams &defaults) {
        media::StreamParams p = defaults;
        if (!j.is_object()) return p;
        p.width = j.value("width", p.width);
        p.height = j.value("height", p.height);
        p.fps = j.value("fps", p.fps);
        p.bitrate_kbps = j.value("bitrate_kbps", p.bitrate_kbps);
        if (j.contains("codec")) p.codec = codec_from_json(j["codec"]);
        p.audio_sample_rate = j.value("audio_sample_rate", p.audio_sample_rate);
        p.audio_channels = j.value("audio_channels", p.audio_channels);
        p.shard_size = j.value("shard_size", p.shard_size);
        p.min_fec_shards = j.value("min_fec_shards", p.min_fec_shards);
        if (p.width == 0 || p.height == 0 || p.fps == 0) {
            throw std::invalid_argument("stream: width, height and fps must be non-zero");
        }
        return p;
    }

    json to_json(const media::StreamParams &p) {
        json j;
        j["width"] = p.width;
        j["height"] = p.height;
        j["fps"] = p.fps;
        j["bitrate_kbps"] = p.bitrate_kbps;
        j["codec"] = common::codec_name(p.codec);
        j["audio_sample_rate"] = p.audio_sample_rate;
        j["audio_channels"] = p.audio_channels;
        j["shard_size"] = p.shard_size;
        j["min_fec_shards"] = p.min_fec_shards;
        return j;
    }

    HostConfig host_config_from_json(const json &j) {
        HostConfig c;
        if (!j.is_object()) throw std::invalid_argument("host config must be a JSON object");

        if (j.contains("network")) {
            const json &n = j["network"];
            NetworkConfig &net = c.network;
            net.bind_address = n.value("bind_address", net.bind_address);
            net.control_port = n.value("control_port", net.control_port);
            net.media_port = n.value("media_port", net.media_port);
            net.media_tos = n.value("media_tos", net.media_tos);
            net.control_send_timeout_ms = n.value("control_send_timeout_ms", net.control_send_timeout_ms);
            net.liveness_timeout_ms = n.value("liveness_timeout_ms", net.liveness_timeout_ms);
            net.media_queue_capacity = n.value("media_queue_capacity", net.media_queue_capacity);
            net.pacing_kbps = n.value("pacing_kbps", net.pacing_kbps);
            net.max_sessions = n.value("max_sessions", net.max_sessions);
            net.loop_interval_ms = n.value("loop_interval_ms", net.loop_interval_ms);
        }

        if (j.contains("capabilities")) {
            const json &k = j["capabilities"];
            media::HostCapabilities &caps = c.capabilities;
            caps.max_width = k.value("max_width", caps.max_width);
            caps.max_height = k.value("max_height", caps.max_height);
            caps.max_fps = k.value("max_fps", caps.max_fps);
            caps.max_bitrate_kbps = k.value("max_bitrate_kbps", caps.max_bitrate_kbps);
            caps.min_bitrate_kbps = k.value("min_bitrate_kbps", caps.min_bitrate_kbps);
            if (k.contains("codecs")) {
                caps.codecs.clear();
                for (const json &v : k["codecs"]) caps.codecs.push_back(codec_from_json(v));
            }
            if (k.contains("audio_sample_rates")) {
                caps.audio_sample_rates = k["audio_sample_rates"].get<std::vector<uint32_t>>();
            }
            caps.max_audio_channels = k.value("max_audio_channels", caps.max_audio_channels);
            caps.min_shard_size = k.value("min_shard_size", caps.min_shard_size);
            caps.max_shard_size = k.value("max_shard_size", caps.max_shard_size);
            caps.max_min_fec_shards = k.value("max_min_fec_shards", caps.max_min_fec_shards);
        }

        if (j.contains("fec")) {
            const json &f = j["fec"];
            fec::FecConfig &fc = c.fec;
            fc.shard_size = f.value("shard_size", fc.shard_size);
            fc.max_overhead_ratio = f.value("max_overhead_ratio", fc.max_overhead_ratio);
            fc.base_ratio = f.value("base_ratio", fc.base_ratio);
            fc.min_parity = f.value("min_parity", fc.min_parity);
            fc.loss_alpha = f.value("loss_alpha", fc.loss_alpha);
            if (fc.loss_alpha <= 0.0 || fc.loss_alpha > 1.0) {
                throw std::invalid_argument("fec.loss_alpha must be in (0, 1]");
            }
            if (fc.max_overhead_ratio < 0.0) throw std::invalid_argument("fec.max_overhead_ratio must be >= 0");
        }

        if (j.contains("pipeline")) {
            const json &p = j["pipeline"];
            pipeline::PipelineConfig &pc = c.pipeline;
            pc.max_input_frames = p.value("max_input_frames", pc.max_input_frames);
            pc.max_pending_blocks = p.value("max_pending_blocks", pc.max_pending_blocks);
            pc.max_encoder_restarts = p.value("max_encoder_restarts", pc.max_encoder_restarts);
            pc.drop_log_capacity = p.value("drop_log_capacity", pc.drop_log_capacity);
        }

        if (j.contains("encoders")) {
            const json &e = j["encoders"];
            c.encoders.video_slots = e.value("video_slots", c.encoders.video_slots);
            c.encoders.audio_slots = e.value("audio_slots", c.encoders.audio_slots);
            c.pipeline.gop_frames = e.value("gop_frames", c.pipeline.gop_frames);
        }

        if (j.contains("capture")) {
            const json &cap = j["capture"];
            c.capture.video_device = cap.value("video_device", c.capture.video_device);
            c.capture.audio_device = cap.value("audio_device", c.capture.audio_device);
            c.capture.max_restarts = cap.value("max_restarts", c.capture.max_restarts);
            c.capture.audio_chunk_ms = cap.value("audio_chunk_ms", c.capture.audio_chunk_ms);
        }

        if (j.contains("tls")) tls_from_json(j["tls"], c.tls);
        if (j.contains("log")) log_from_json(j["log"], c.log);
        return c;
    }

    ClientConfig client_config_from_json(const json &j) {
        ClientConfig c;
        if (!j.is_object()) throw std::invalid_argument("client config must be a JSON object");
        c.host = j.value("host", c.host);
        c.control_port = j.value("control_port", c.control_port);
        c.media_port = j.value("media_port", c.media_port);
        c.name = j.value("name", c.name);
        if (j.contains("stream")) c.params = stream_params_from_json(j["stream"], c.params);
        c.duration_s = j.value("duration_s", c.duration_s);
        c.heartbeat_ms = j.value("heartbeat_ms", c.heartbeat_ms);
        c.loss_report_ms = j.value("loss_report_ms", c.loss_report_ms);
        c.reassembly_max_age_ms = j.value("reassembly_max_age_ms", c.reassembly_max_age_ms);
        c.connect_timeout_ms = j.value("connect_timeout_ms", c.connect_timeout_ms);
        c.output_file = j.value("output_file", c.output_file);
        c.player_cmd = j.value("player_cmd", c.player_cmd);
        if (j.contains("tls")) tls_from_json(j["tls"], c.tls);
        if (j.contains("log")) log_from_json(j["log"], c.log);
        return c;
    }

    HostConfig load_host_config(const std::string &path) {
        HostConfig c = host_config_from_json(read_json_file(path));
        LOG_GEN_INFO("Loaded host config from '{}'", path);
        return c;
    }

    ClientConfig load_client_config(const std::string &path) {
        ClientConfig c = client_config_from_json(read_json_file(path));
        LOG_GEN_INFO("Loaded client config from '{}'", path);
        return c;
    }

    bool file_exists(const std::string &path) {
        struct stat st;
        return stat(path.c_str(), &st) == 0;
    }

    std::string get_exe_dir(const char *argv0) {
        char buf[PATH_MAX];
        ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
        if (len > 0) {
            buf[len] = '\0';
            std::string p(buf);
            size_t pos = p.find_last_of('/');
            if (pos != std::string::npos) return p.substr(0, pos);
        }
        // fallback: use argv0 path if it contains a directory separator
        if (argv0) {
            std::string p(argv0);
            size_t pos = p.find_last_of('/');
            if (pos != std::string::npos) return p.substr(0, pos);
        }
        return ".";
    }

} // namespace gamecast::config
