#include "typetag/types.hpp"
#include <stdexcept>

namespace typetag {

// ---------- LogLevel ----------

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:     return "debug";
        case LogLevel::Info:      return "info";
        case LogLevel::Notice:    return "notice";
        case LogLevel::Warning:   return "warning";
        case LogLevel::Error:     return "error";
        case LogLevel::Critical:  return "critical";
        case LogLevel::Alert:     return "alert";
        case LogLevel::Emergency: return "emergency";
        default:                  return "info";
    }
}

LogLevel log_level_from_string(const std::string& s) {
    if (s == "debug")     return LogLevel::Debug;
    if (s == "info")      return LogLevel::Info;
    if (s == "notice")    return LogLevel::Notice;
    if (s == "warning")   return LogLevel::Warning;
    if (s == "error")     return LogLevel::Error;
    if (s == "critical")  return LogLevel::Critical;
    if (s == "alert")     return LogLevel::Alert;
    if (s == "emergency") return LogLevel::Emergency;
    throw std::invalid_argument("Unknown log level: " + s);
}

// ---------- LogSink ----------

bool LogSink::enabled(LogLevel level) const {
    return callback && level >= min_level;
}

void LogSink::log(LogLevel level, const std::string& logger, const std::string& message) const {
    if (!enabled(level)) return;
    callback(LogMessage{level, logger, message});
}

// ---------- Markers ----------

bool is_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
           || (c >= '0' && c <= '9') || c == '_';
}

bool is_valid_codec_name(std::string_view name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!is_word_char(c)) return false;
    }
    return true;
}

void Markers::validate() const {
    if (tag == escape) {
        throw std::invalid_argument("Tag and escape markers must differ");
    }
    if (is_word_char(tag) || is_word_char(escape)) {
        throw std::invalid_argument("Markers must not be word characters");
    }
    if (type_key.empty()) {
        throw std::invalid_argument("Type key must not be empty");
    }
    if (type_key == value_key) {
        throw std::invalid_argument("Type key and value key must differ");
    }
    // A user mapping key equal to the type key must get escaped on the way out.
    if (type_key.front() != tag) {
        throw std::invalid_argument("Type key must start with the tag marker");
    }
}

} // namespace typetag
