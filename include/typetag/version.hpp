#pragma once
#include <cstddef>
#include <string_view>

namespace typetag {

constexpr std::string_view LIBRARY_VERSION = "0.1.0";

// Wire convention defaults.
constexpr char             DEFAULT_TAG_MARKER    = '$';
constexpr char             DEFAULT_ESCAPE_MARKER = '/';
constexpr std::string_view DEFAULT_TYPE_KEY      = "$t";
constexpr std::string_view DEFAULT_VALUE_KEY     = "v";

constexpr std::size_t      DEFAULT_MAX_DEPTH     = 512;

} // namespace typetag
