//! # Log Configuration
//!
//! Reads `WEAVE_LOG` and `WEAVE_LOG_FORMAT` into a LogConfig.

#include "log/log.hpp"

#include <cstdlib>

namespace weave::log {

LogConfig log_config_from_env() {
    LogConfig config;

    if (const char* spec = std::getenv("WEAVE_LOG"); spec && *spec) {
        std::string_view value(spec);
        // "a=b" or "a,b" is a filter spec, anything else a single level
        if (value.find('=') != std::string_view::npos ||
            value.find(',') != std::string_view::npos) {
            config.filter_spec = value;
        } else {
            config.filter_spec = "*=" + std::string(value);
        }
    }

    if (const char* format = std::getenv("WEAVE_LOG_FORMAT")) {
        std::string_view value(format);
        if (value == "json" || value == "JSON") {
            config.format = LogFormat::JSON;
        }
    }
    return config;
}

} // namespace weave::log
