/*
* @license
* (C) zachbabanov
*
*/

#include <fec.hpp>
#include <logger.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstring>

// GF(256) arithmetic from the rscoder implementation
#include <gf.hpp>

using namespace gamecast::common;

namespace gamecast::fec {

namespace {

    constexpr double RATIO_EPS = 1e-9;
    constexpr size_t FINISHED_HISTORY = 4096;

    size_t parity_for(size_t k, double loss_estimate, const FecConfig &cfg) {
        double loss = std::min(1.0, std::max(0.0, loss_estimate));
        double ratio = std::max(loss, cfg.base_ratio);
        size_t m = (size_t)std::ceil((double)k * ratio - RATIO_EPS);

        size_t cap = (size_t)std::floor((double)k * std::max(0.0, cfg.max_overhead_ratio) + RATIO_EPS);
        if (m > cap) m = cap;

        size_t floor_m = std::min<size_t>(std::max<size_t>(1, cfg.min_parity), MAX_TOTAL_SHARDS - 1);
        if (m < floor_m) m = floor_m;
        return m;
    }

    /// Lookup table for multiplication by a fixed coefficient.
    void build_mul_table(uint8_t coeff, std::array<uint8_t, 256> &table) {
        for (int v = 0; v < 256; ++v) table[v] = RS::gf::mul((uint16_t)v, coeff);
    }

    /**
     * Gaussian elimination to invert square matrix (k x k) over GF(256).
     * Returns false when the matrix is singular.
     */
    bool invert_matrix_gf(std::vector<std::vector<uint8_t>> A, std::vector<std::vector<uint8_t>> &inv) {
        size_t n = A.size();
        inv.assign(n, std::vector<uint8_t>(n, 0));
        for (size_t i = 0; i < n; ++i) inv[i][i] = 1;

        for (size_t col = 0; col < n; ++col) {
            size_t pivot = col;
            while (pivot < n && A[pivot][col] == 0) ++pivot;
            if (pivot == n) return false;

            if (pivot != col) {
                std::swap(A[pivot], A[col]);
                std::swap(inv[pivot], inv[col]);
            }

            uint8_t pivot_val = A[col][col];
            if (pivot_val != 1) {
                uint8_t inv_pivot = RS::gf::inverse(pivot_val);
                for (size_t j = 0; j < n; ++j) {
                    A[col][j] = RS::gf::mul(A[col][j], inv_pivot);
                    inv[col][j] = RS::gf::mul(inv[col][j], inv_pivot);
                }
            }

            // row = row - factor * col (subtraction is xor in GF(2^8))
            for (size_t row = 0; row < n; ++row) {
                if (row == col) continue;
                uint8_t factor = A[row][col];
                if (factor == 0) continue;
                for (size_t j = 0; j < n; ++j) {
                    A[row][j] ^= RS::gf::mul(factor, A[col][j]);
                    inv[row][j] ^= RS::gf::mul(factor, inv[col][j]);
                }
            }
        }
        return true;
    }

} // namespace

    FecParams select_params(size_t payload_len, double loss_estimate, const FecConfig &cfg) {
        FecParams p;
        size_t configured = std::max<size_t>(1, cfg.shard_size);
        size_t k = std::max<size_t>(1, (payload_len + configured - 1) / configured);
        size_t shard = std::max<size_t>(1, (payload_len + k - 1) / k);
        size_t m = parity_for(k, loss_estimate, cfg);

        if (k + m > MAX_TOTAL_SHARDS) {
            // Too many data shards for the field: trade shard count for shard size.
            for (size_t target = std::min(k, MAX_TOTAL_SHARDS - 1); target >= 1; --target) {
                shard = (payload_len + target - 1) / target;
                k = std::max<size_t>(1, (payload_len + shard - 1) / shard);
                m = parity_for(k, loss_estimate, cfg);
                if (k + m <= MAX_TOTAL_SHARDS) break;
            }
        }

        if (shard > MAX_SHARD_BYTES || k + m > MAX_TOTAL_SHARDS) {
            p.k = 0;
            p.m = 0;
            p.shard_size = 0;
            return p;
        }
        p.k = (uint16_t)k;
        p.m = (uint16_t)m;
        p.shard_size = (uint16_t)shard;
        return p;
    }

    LossEstimator::LossEstimator(double alpha, double initial)
        : alpha_(std::min(1.0, std::max(0.0, alpha))),
          estimate_(std::min(1.0, std::max(0.0, initial))),
          samples_(0) {}

    double LossEstimator::update(double sample) {
        if (std::isnan(sample)) return estimate_;
        sample = std::min(1.0, std::max(0.0, sample));
        estimate_ += alpha_ * (sample - estimate_);
        ++samples_;
        return estimate_;
    }

    void LossEstimator::reset(double v) {
        estimate_ = std::min(1.0, std::max(0.0, v));
        samples_ = 0;
    }

    uint8_t ErasureCoder::coefficient(uint16_t k, uint16_t parity_row, uint16_t data_col) {
        // x_i = k + i and y_j = j are distinct field elements, so x_i ^ y_j != 0.
        uint8_t x = (uint8_t)(k + parity_row);
        uint8_t y = (uint8_t)data_col;
        return RS::gf::inverse((uint8_t)(x ^ y));
    }

    void ErasureCoder::encode(std::vector<std::vector<uint8_t>> &shards, uint16_t k, uint16_t m) {
        if (k == 0 || shards.size() < (size_t)k + m) return;
        const size_t size = shards[0].size();
        std::array<uint8_t, 256> table{};

        for (uint16_t p = 0; p < m; ++p) {
            std::vector<uint8_t> &parity = shards[(size_t)k + p];
            parity.assign(size, 0);
            for (uint16_t d = 0; d < k; ++d) {
                build_mul_table(coefficient(k, p, d), table);
                const uint8_t *src = shards[d].data();
                for (size_t b = 0; b < size; ++b) parity[b] ^= table[src[b]];
            }
        }
    }

    bool ErasureCoder::reconstruct(std::vector<std::vector<uint8_t>> &shards, const std::vector<uint8_t> &present,
                                   uint16_t k, uint16_t m) {
        size_t total = (size_t)k + m;
        if (k == 0 || shards.size() < total || present.size() < total) return false;

        std::vector<size_t> missing;
        for (uint16_t d = 0; d < k; ++d) {
            if (!present[d]) missing.push_back(d);
        }
        if (missing.empty()) return true;

        // Prefer data rows: they are unit vectors and keep the inversion cheap.
        std::vector<size_t> chosen;
        chosen.reserve(k);
        for (size_t i = 0; i < total && chosen.size() < k; ++i) {
            if (i < k && present[i]) chosen.push_back(i);
        }
        for (size_t i = k; i < total && chosen.size() < k; ++i) {
            if (present[i]) chosen.push_back(i);
        }
        if (chosen.size() < k) {
            LOG_FEC_DEBUG("reconstruct: insufficient shards have={} need={}", (unsigned)chosen.size(), k);
            return false;
        }

        std::vector<std::vector<uint8_t>> A(k, std::vector<uint8_t>(k, 0));
        for (size_t r = 0; r < k; ++r) {
            size_t idx = chosen[r];
            if (idx < k) {
                A[r][idx] = 1;
            } else {
                for (uint16_t c = 0; c < k; ++c) A[r][c] = coefficient(k, (uint16_t)(idx - k), c);
            }
        }

        std::vector<std::vector<uint8_t>> invA;
        if (!invert_matrix_gf(A, invA)) {
            LOG_FEC_ERROR("reconstruct: decode matrix singular (k={} m={})", k, m);
            return false;
        }

        const size_t size = shards[chosen[0]].size();
        std::array<uint8_t, 256> table{};
        for (size_t d : missing) {
            std::vector<uint8_t> rebuilt(size, 0);
            for (size_t j = 0; j < k; ++j) {
                uint8_t c = invA[d][j];
                if (c == 0) continue;
                build_mul_table(c, table);
                const std::vector<uint8_t> &src = shards[chosen[j]];
                for (size_t b = 0; b < size && b < src.size(); ++b) rebuilt[b] ^= table[src[b]];
            }
            shards[d] = std::move(rebuilt);
        }
        return true;
    }

    FecPacketizer::FecPacketizer(const FecConfig &cfg) : cfg_(cfg) {}

    bool FecPacketizer::packetize(const media::EncodedFrame &frame, double loss_estimate, uint16_t session_tag,
                                  FecBlock &out) {
        auto t0 = std::chrono::steady_clock::now();

        const size_t len = frame.payload.size();
        if (len == 0) {
            LOG_FEC_WARN("packetize: empty {} frame seq={} refused", media_kind_name(frame.kind), frame.frame_seq);
            return false;
        }
        FecParams params = select_params(len, loss_estimate, cfg_);
        if (params.shard_size == 0) {
            LOG_FEC_ERROR("packetize: {} frame seq={} of {} bytes cannot be coded",
                          media_kind_name(frame.kind), frame.frame_seq, (uint64_t)len);
            return false;
        }

        const size_t k = params.k;
        const size_t total = k + params.m;
        std::vector<std::vector<uint8_t>> shards(total, std::vector<uint8_t>(params.shard_size, 0));
        for (size_t d = 0; d < k; ++d) {
            size_t offset = d * params.shard_size;
            if (offset >= len) break;
            size_t take = std::min((size_t)params.shard_size, len - offset);
            std::memcpy(shards[d].data(), frame.payload.data() + offset, take);
        }
        ErasureCoder::encode(shards, params.k, params.m);

        out.frame_seq = frame.frame_seq;
        out.kind = frame.kind;
        out.keyframe = frame.keyframe;
        out.params = params;
        out.captured_at = frame.captured_at;
        out.packets.clear();
        out.packets.reserve(total);
        for (size_t i = 0; i < total; ++i) {
            ShardPacket pkt;
            pkt.frame_seq = frame.frame_seq;
            pkt.kind = frame.kind;
            pkt.keyframe = frame.keyframe;
            pkt.parity = i >= k;
            pkt.session_tag = session_tag;
            pkt.k = params.k;
            pkt.m = params.m;
            pkt.shard_index = (uint16_t)i;
            pkt.payload_len = (uint32_t)len;
            pkt.capture_ts_us = frame.capture_ts_us;
            pkt.shard = std::move(shards[i]);
            out.packets.push_back(std::move(pkt));
        }
        last_ = params;

        auto t1 = std::chrono::steady_clock::now();
        double encode_ms = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();
        LOG_FEC_DEBUG("packetize: {} seq={} len={} k={} m={} shard={} loss={:.3f} keyframe={} encode_time_ms={:.3f}",
                      media_kind_name(frame.kind), frame.frame_seq, (uint64_t)len, params.k, params.m,
                      params.shard_size, loss_estimate, frame.keyframe, encode_ms);
        return true;
    }

    FecReassembler::FecReassembler(std::chrono::milliseconds max_age, size_t max_blocks)
        : max_age_(max_age), max_blocks_(std::max<size_t>(1, max_blocks)) {}

    FecReassembler::Result FecReassembler::add(const ShardPacket &pkt, TimePoint now, ReassembledFrame &out) {
        Key key{(uint8_t)pkt.kind, pkt.frame_seq};
        if (finished_.count(key)) return Result::STALE;

        auto it = blocks_.find(key);
        if (it == blocks_.end()) {
            if (blocks_.size() >= max_blocks_) {
                auto oldest = blocks_.begin();
                for (auto jt = blocks_.begin(); jt != blocks_.end(); ++jt) {
                    if (jt->second.first_seen < oldest->second.first_seen) oldest = jt;
                }
                LOG_FEC_DEBUG("reassembler full, evicting {} seq={}",
                              media_kind_name((MediaKind)oldest->first.first), oldest->first.second);
                finalize(oldest->first, oldest->second);
                blocks_.erase(oldest);
            }
            Block b;
            b.k = pkt.k;
            b.m = pkt.m;
            b.shard_size = pkt.shard_size();
            b.payload_len = pkt.payload_len;
            b.keyframe = pkt.keyframe;
            b.capture_ts_us = pkt.capture_ts_us;
            b.shards.assign((size_t)pkt.k + pkt.m, std::vector<uint8_t>());
            b.present.assign((size_t)pkt.k + pkt.m, 0);
            b.first_seen = now;
            it = blocks_.emplace(key, std::move(b)).first;
        }

        Block &b = it->second;
        if (pkt.k != b.k || pkt.m != b.m || pkt.shard_size() != b.shard_size || pkt.payload_len != b.payload_len) {
            LOG_FEC_WARN("shard for {} seq={} disagrees with block (k={}/{} m={}/{} shard={}/{})",
                         media_kind_name(pkt.kind), pkt.frame_seq, pkt.k, b.k, pkt.m, b.m,
                         pkt.shard_size(), b.shard_size);
            return Result::INVALID;
        }
        if (b.present[pkt.shard_index]) return Result::DUPLICATE;
        b.present[pkt.shard_index] = 1;
        ++b.received;
        if (b.decoded) return Result::DUPLICATE;

        b.shards[pkt.shard_index] = pkt.shard;
        if (b.received < b.k) return Result::PENDING;

        if (!decode(b, out, pkt.kind, pkt.frame_seq)) {
            LOG_FEC_ERROR("decode failed for {} seq={} (k={} m={})", media_kind_name(pkt.kind), pkt.frame_seq, b.k, b.m);
            return Result::INVALID;
        }
        b.decoded = true;
        b.shards.clear();
        b.shards.shrink_to_fit();
        ++counters_.frames_completed;
        if (out.used_parity) ++counters_.frames_recovered;
        return Result::COMPLETE;
    }

    bool FecReassembler::decode(Block &b, ReassembledFrame &out, MediaKind kind, uint64_t seq) {
        bool data_complete = true;
        for (uint16_t d = 0; d < b.k; ++d) {
            if (!b.present[d]) {
                data_complete = false;
                break;
            }
        }
        if (!data_complete && !ErasureCoder::reconstruct(b.shards, b.present, b.k, b.m)) return false;

        out.frame_seq = seq;
        out.kind = kind;
        out.keyframe = b.keyframe;
        out.used_parity = !data_complete;
        out.capture_ts_us = b.capture_ts_us;
        out.payload.clear();
        out.payload.reserve(b.payload_len);
        for (uint16_t d = 0; d < b.k && out.payload.size() < b.payload_len; ++d) {
            const std::vector<uint8_t> &s = b.shards[d];
            size_t take = std::min(s.size(), (size_t)b.payload_len - out.payload.size());
            out.payload.insert(out.payload.end(), s.begin(), s.begin() + (std::ptrdiff_t)take);
        }
        return out.payload.size() == b.payload_len;
    }

    bool FecReassembler::finalize(const Key &key, const Block &b) {
        counters_.shards_expected += (uint64_t)b.k + b.m;
        counters_.shards_received += b.received;

        finished_.insert(key);
        finished_order_.push_back(key);
        while (finished_order_.size() > FINISHED_HISTORY) {
            finished_.erase(finished_order_.front());
            finished_order_.pop_front();
        }

        if (b.decoded) return false;
        ++counters_.frames_unrecoverable;
        if (key.first == (uint8_t)MediaKind::VIDEO) ++counters_.unrecoverable_video;
        LOG_FEC_WARN("unrecoverable {} frame seq={}: got {} of {} shards, needed {}",
                     media_kind_name((MediaKind)key.first), key.second, (unsigned)b.received,
                     b.k + b.m, b.k);
        return true;
    }

    size_t FecReassembler::expire(TimePoint now, size_t *video_lost) {
        size_t lost = 0;
        size_t video = 0;
        for (auto it = blocks_.begin(); it != blocks_.end();) {
            if (now - it->second.first_seen < max_age_) {
                ++it;
                continue;
            }
            if (finalize(it->first, it->second)) {
                ++lost;
                if (it->first.first == (uint8_t)MediaKind::VIDEO) ++video;
            }
            it = blocks_.erase(it);
        }
        if (video_lost) *video_lost = video;
        return lost;
    }

    ReassemblyCounters FecReassembler::take_counters() {
        ReassemblyCounters c = counters_;
        counters_ = ReassemblyCounters();
        return c;
    }

    const char *result_name(FecReassembler::Result r) {
        switch (r) {
            case FecReassembler::Result::PENDING: return "pending";
            case FecReassembler::Result::COMPLETE: return "complete";
            case FecReassembler::Result::DUPLICATE: return "duplicate";
            case FecReassembler::Result::STALE: return "stale";
            case FecReassembler::Result::INVALID: return "invalid";
        }
        return "unknown";
    }

} // namespace gamecast::fec
