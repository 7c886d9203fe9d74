// mc_log.hpp - C++ side of mc_log: string messages and scoped sink overrides
#pragma once

#include "mc_log.h"
#include <string>

namespace mc {

inline void log(mc_log_level level, const std::string& msg) {
    mc_log(level, "%s", msg.c_str());
}

inline void log_debug(const std::string& msg) { log(MC_LOG_DEBUG, msg); }
inline void log_warn(const std::string& msg) { log(MC_LOG_WARN, msg); }
inline void log_error(const std::string& msg) { log(MC_LOG_ERROR, msg); }

inline std::string level_name(mc_log_level level) {
    return mc_log_level_name(level);
}

// Replaces the minimum level and the sink callback until destroyed, then puts
// back whatever was installed before. Scopes must nest: the log state is
// process-wide.
class LogScope {
public:
    LogScope(mc_log_level level, mc_log_callback callback)
        : prev_level_(mc_log_get_level()), prev_callback_(mc_log_get_callback()) {
        mc_log_set_level(level);
        mc_log_set_callback(callback);
    }

    ~LogScope() {
        mc_log_set_callback(prev_callback_);
        mc_log_set_level(prev_level_);
    }

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    mc_log_level prev_level_;
    mc_log_callback prev_callback_;
};

} // namespace mc
