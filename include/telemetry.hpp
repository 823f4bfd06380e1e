/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_TELEMETRY_HPP
#define GAMECAST_TELEMETRY_HPP

#pragma once

#include <common.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace gamecast::telemetry {

/**
 * @brief Fire-and-forget observer for counters and session transitions.
 *
 * Implementations must not block and must not throw back into the pipeline.
 */
    class ITelemetry {
    public:
        virtual ~ITelemetry() = default;

        virtual void counter(common::SessionToken token, const std::string &name, uint64_t value) = 0;
        virtual void transition(common::SessionToken token, const char *from, const char *to, const char *cause) = 0;
    };

    /// Writes observations to the log and remembers the last value of each counter.
    class LoggingTelemetry : public ITelemetry {
    public:
        void counter(common::SessionToken token, const std::string &name, uint64_t value) override;
        void transition(common::SessionToken token, const char *from, const char *to, const char *cause) override;

        /// 0 when the counter was never reported for @p token.
        uint64_t last(common::SessionToken token, const std::string &name) const;
        uint64_t transitions() const { return transitions_; }
        const std::string &last_transition() const { return last_transition_; }

    private:
        std::map<std::pair<common::SessionToken, std::string>, uint64_t> counters_;
        uint64_t transitions_ = 0;
        std::string last_transition_;
    };

} // namespace gamecast::telemetry

#endif // GAMECAST_TELEMETRY_HPP
