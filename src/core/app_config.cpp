#include "core/app_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

static const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return nullptr;
    return v;
}

static int parse_int(const char* name, const std::string& value) {
    size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + ": not an integer: " + value);
    }
    if (used != value.size()) {
        throw std::invalid_argument(std::string(name) + ": not an integer: " + value);
    }
    return out;
}

static bool parse_bool(const char* name, const std::string& value) {
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument(std::string(name) + ": not a boolean: " + value);
}

AppConfig loadConfigFromEnv(AppConfig base) {
    if (const char* v = env_or_null("MICSCRIBE_MODEL")) base.modelPath = v;
    if (const char* v = env_or_null("MICSCRIBE_LANGUAGE")) base.language = v;
    if (const char* v = env_or_null("MICSCRIBE_USE_GPU")) base.useGpu = parse_bool("MICSCRIBE_USE_GPU", v);
    if (const char* v = env_or_null("MICSCRIBE_THREADS")) base.threads = parse_int("MICSCRIBE_THREADS", v);
    if (const char* v = env_or_null("MICSCRIBE_STOP_KEYWORD")) base.stopKeyword = v;
    if (const char* v = env_or_null("MICSCRIBE_LOG_LEVEL")) base.logLevel = v;
    if (const char* v = env_or_null("MICSCRIBE_DEVICE")) base.deviceIndex = parse_int("MICSCRIBE_DEVICE", v);

    if (base.threads <= 0) {
        throw std::invalid_argument("MICSCRIBE_THREADS: must be positive");
    }
    return base;
}
