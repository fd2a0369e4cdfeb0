#pragma once
#include "version.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace typetag {

// ---------- Logging ----------

enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

std::string log_level_to_string(LogLevel level);
LogLevel log_level_from_string(const std::string& s);

struct LogMessage {
    LogLevel level;
    std::optional<std::string> logger;
    std::string message;

    bool operator==(const LogMessage& o) const {
        return level == o.level && logger == o.logger && message == o.message;
    }
};

using LogCallback = std::function<void(const LogMessage&)>;

/// Filters by level and forwards to an optional callback.
struct LogSink {
    LogCallback callback;
    LogLevel min_level = LogLevel::Info;

    void log(LogLevel level, const std::string& logger, const std::string& message) const;
    [[nodiscard]] bool enabled(LogLevel level) const;
};

// ---------- Wire markers ----------

/// Reserved characters and keys of the tagging convention.
struct Markers {
    char tag = DEFAULT_TAG_MARKER;
    char escape = DEFAULT_ESCAPE_MARKER;
    std::string type_key{DEFAULT_TYPE_KEY};
    std::string value_key{DEFAULT_VALUE_KEY};

    /// Throws std::invalid_argument if the markers cannot round-trip.
    void validate() const;

    /// True if `s` would be mistaken for a tag or an escaped literal.
    [[nodiscard]] bool is_reserved(std::string_view s) const {
        return !s.empty() && (s.front() == tag || s.front() == escape);
    }

    bool operator==(const Markers& o) const {
        return tag == o.tag && escape == o.escape
               && type_key == o.type_key && value_key == o.value_key;
    }
};

/// [A-Za-z0-9_]
[[nodiscard]] bool is_word_char(char c);

/// Non-empty and made of word characters only.
[[nodiscard]] bool is_valid_codec_name(std::string_view name);

} // namespace typetag
