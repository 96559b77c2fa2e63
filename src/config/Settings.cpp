#include "config/Settings.hpp"

#include <cstdlib>

namespace money::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    if (s == "true" || s == "1") return true;
    if (s == "false" || s == "0") return false;
    return fallback;
}

} // namespace

bool is_known_output_format(const std::string& format) {
    return format == "text" || format == "json" || format == "inspect";
}

Settings Settings::from_environment() {
    std::string env = env_or("MONEY_ENV", "development");
    Settings s = (env == "production") ? production() : development();

    std::string format = env_or("MONEY_OUTPUT_FORMAT", s.output.format);
    if (is_known_output_format(format)) {
        s.output.format = format;
    }
    s.logging.verbose = env_bool_or("MONEY_VERBOSE", s.logging.verbose);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.logging.verbose = true;
    return s;
}

Settings Settings::production() {
    Settings s;
    s.output.format = "json";
    s.logging.verbose = false;
    return s;
}

} // namespace money::config
