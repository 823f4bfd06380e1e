/*
* @license
* (C) zachbabanov
*
*/

#include <telemetry.hpp>
#include <logger.hpp>

namespace gamecast::telemetry {

    void LoggingTelemetry::counter(common::SessionToken token, const std::string &name, uint64_t value) {
        counters_[std::make_pair(token, name)] = value;
        LOG_GEN_DEBUG("telemetry session={:016x} {}={}", token, name, value);
    }

    void LoggingTelemetry::transition(common::SessionToken token, const char *from, const char *to, const char *cause) {
        ++transitions_;
        last_transition_ = std::string(from) + "->" + to;
        LOG_SESSION_INFO("telemetry session={:016x} {} -> {} ({})", token, from, to, cause);
    }

    uint64_t LoggingTelemetry::last(common::SessionToken token, const std::string &name) const {
        auto it = counters_.find(std::make_pair(token, name));
        return it == counters_.end() ? 0 : it->second;
    }

} // namespace gamecast::telemetry
