#pragma once
#include "value.hpp"
#include "error.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace typetag {

/// Opaque text layer: primitive tree <-> text.
using TextEncoder = std::function<std::string(const Primitive& tree)>;
using TextDecoder = std::function<Primitive(std::string_view text)>;

class JsonCodec {
public:
    /// Parse JSON text, keeping object key order.
    /// Throws ParseError on empty, invalid or trailing input.
    [[nodiscard]] static Primitive parse(std::string_view raw);

    /// Serialize to JSON text. Compact unless indent >= 0.
    /// Throws EncodeError on strings that are not valid UTF-8.
    [[nodiscard]] static std::string serialize(const Primitive& tree, int indent = -1);

    [[nodiscard]] static TextEncoder encoder(int indent = -1);
    [[nodiscard]] static TextDecoder decoder();
};

} // namespace typetag
