/*
* @license
* (C) zachbabanov
*
*/

#include <player.hpp>
#include <annexb.hpp>
#include <logger.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace gamecast::common;

namespace gamecast::client {

namespace {

    /**
     * @brief Helper to build argv-like array for execvp.
     */
    std::vector<char *> build_argv(const std::string &cmd, const std::vector<std::string> &args) {
        std::vector<char *> argv;
        argv.push_back(const_cast<char *>(cmd.c_str()));
        for (auto &a : args) argv.push_back(const_cast<char *>(a.c_str()));
        argv.push_back(nullptr);
        return argv;
    }

} // namespace

    std::unique_ptr<PlayerProcess> PlayerProcess::launch(const std::string &player_cmd, Codec codec,
                                                         const std::vector<std::string> &app_args) {
        std::vector<std::string> args = app_args;
        if (args.empty()) {
            // low-latency decode of a raw elementary stream from stdin
            args = {
                    "-fflags", "nobuffer",
                    "-flags", "low_delay",
                    "-framedrop",
                    "-probesize", "32",
                    "-analyzeduration", "0",
                    "-f", codec == Codec::HEVC ? "hevc" : "h264",
                    "-i", "-",
                    "-window_title", "gamecast"
            };
        }

        int pipefd[2];
        if (pipe(pipefd) != 0) {
            LOG_VIDEO_ERROR("Player: pipe creation failed: {}", strerror(errno));
            return nullptr;
        }
        pid_t pid = fork();
        if (pid < 0) {
            LOG_VIDEO_ERROR("Player: fork failed: {}", strerror(errno));
            close(pipefd[0]);
            close(pipefd[1]);
            return nullptr;
        }
        if (pid == 0) {
            dup2(pipefd[0], STDIN_FILENO);
            close(pipefd[0]);
            close(pipefd[1]);
            std::vector<char *> argv = build_argv(player_cmd, args);
            execvp(player_cmd.c_str(), argv.data());
            _exit(127);
        }

        close(pipefd[0]);
        std::unique_ptr<PlayerProcess> p(new PlayerProcess());
        p->write_fd_ = pipefd[1];
        int flags = fcntl(p->write_fd_, F_GETFL, 0);
        fcntl(p->write_fd_, F_SETFL, flags | O_NONBLOCK);
        p->pid_ = pid;
        LOG_VIDEO_INFO("Player started: cmd='{}' pid={} write_fd={}", player_cmd, (int)pid, p->write_fd_);
        return p;
    }

    PlayerProcess::~PlayerProcess() {
        stop();
    }

    ssize_t PlayerProcess::write_data(const uint8_t *buf, size_t len) {
        if (write_fd_ < 0) return -1;
        ssize_t n = ::write(write_fd_, buf, len);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) return 0;
            LOG_VIDEO_WARN("Player write error: {}", strerror(errno));
            return -1;
        }
        return n;
    }

    void PlayerProcess::stop() {
        if (write_fd_ >= 0) {
            close(write_fd_);
            write_fd_ = -1;
        }
        if (pid_ > 0) {
            kill(pid_, SIGTERM);
            waitpid(pid_, nullptr, 0);
            LOG_VIDEO_INFO("Player process terminated pid={}", (int)pid_);
            pid_ = -1;
        }
    }

    VideoOutput::VideoOutput(Codec codec, const std::string &file_path, const std::string &player_cmd)
        : codec_(codec) {
        if (!file_path.empty()) {
            file_.open(file_path, std::ios::binary | std::ios::trunc);
            if (!file_) {
                LOG_VIDEO_ERROR("cannot open output file '{}'", file_path);
                ok_ = false;
            }
        }
        if (!player_cmd.empty()) {
            // a player that exits early must not kill us with SIGPIPE
            signal(SIGPIPE, SIG_IGN);
            player_ = PlayerProcess::launch(player_cmd, codec);
            if (!player_) ok_ = false;
        }
    }

    VideoOutput::~VideoOutput() {
        if (file_.is_open()) file_.flush();
        if (player_) player_->stop();
    }

    bool VideoOutput::write_frame(const std::vector<uint8_t> &au) {
        if (waiting_keyframe_) {
            media::annexb::NalSummary s = media::annexb::analyze(au.data(), au.size(), codec_);
            if (!(s.has_parameter_sets && s.has_idr)) {
                ++frames_skipped_;
                return true;
            }
            waiting_keyframe_ = false;
            LOG_VIDEO_INFO("output starts at keyframe ({} NAL units)", s.nal_count);
        }

        if (file_.is_open()) file_.write((const char *)au.data(), (std::streamsize)au.size());

        if (player_) {
            flush();
            if (backlog_.empty()) {
                ssize_t w = player_->write_data(au.data(), au.size());
                if (w < 0) {
                    LOG_VIDEO_ERROR("player pipe broken, output disabled");
                    player_.reset();
                } else if ((size_t)w < au.size()) {
                    backlog_.insert(backlog_.end(), au.begin() + w, au.end());
                }
            } else {
                backlog_.insert(backlog_.end(), au.begin(), au.end());
            }
            if (backlog_.size() > MAX_PLAYER_BACKLOG) {
                LOG_VIDEO_WARN("player backlog {} bytes exceeds limit, resyncing at next keyframe", (uint64_t)backlog_.size());
                backlog_.clear();
                waiting_keyframe_ = true;
            }
        }
        ++frames_written_;
        return waiting_keyframe_;
    }

    void VideoOutput::flush() {
        if (!player_ || backlog_.empty()) return;
        ssize_t w = player_->write_data(backlog_.data(), backlog_.size());
        if (w < 0) {
            LOG_VIDEO_ERROR("player pipe broken, output disabled");
            player_.reset();
            backlog_.clear();
        } else if (w > 0) {
            backlog_.erase(backlog_.begin(), backlog_.begin() + w);
        }
    }

} // namespace gamecast::client
