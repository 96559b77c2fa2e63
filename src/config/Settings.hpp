#pragma once

#include <string>

namespace money::config {

struct OutputSettings {
    std::string format = "text";  // "text", "json", or "inspect"
};

struct LoggingSettings {
    bool verbose = false;
};

struct Settings {
    OutputSettings output;
    LoggingSettings logging;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

bool is_known_output_format(const std::string& format);

} // namespace money::config
