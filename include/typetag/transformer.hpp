#pragma once
#include "registry.hpp"
#include "types.hpp"
#include "value.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace typetag {

struct TransformerOptions {
    Markers markers;
    std::size_t max_depth = DEFAULT_MAX_DEPTH;
};

/// `<tag>name` or `<tag>name:body`.
struct ParsedTag {
    std::string name;
    std::optional<std::string> body;

    bool operator==(const ParsedTag& o) const {
        return name == o.name && body == o.body;
    }
};

/// Parse a tagged scalar. Returns nullopt unless `text` starts with the tag
/// marker followed by at least one word character. An empty body counts as
/// no body, and text after the name that does not start with ':' is ignored.
[[nodiscard]] std::optional<ParsedTag> parse_tag(std::string_view text, const Markers& markers);

/// Rewrites Value trees into tagged primitive trees and back.
class Transformer {
public:
    explicit Transformer(std::shared_ptr<const Registry> registry,
                         TransformerOptions opts = {});

    /// Throws EncodeError, DepthLimitError, or whatever a codec throws.
    /// A codec that encodes to an empty string is an EncodeError, since
    /// `$name:` cannot be told apart from `$name`.
    [[nodiscard]] Primitive to_primitive(const Value& value) const;

    /// Throws UnknownCodecError, MalformedTagError, DecodeError,
    /// DepthLimitError, or whatever a codec throws.
    ///
    /// A tagged scalar body is decoded as a string before it reaches the
    /// codec: one leading escape marker is stripped and a leading tag marker
    /// starts a nested tag. So `"$money:/$5"` hands `"$5"` to the `money`
    /// codec, while `"$money:$5"` fails with UnknownCodecError("5").
    [[nodiscard]] Value from_primitive(const Primitive& tree) const;

    [[nodiscard]] const Registry& registry() const { return *registry_; }
    [[nodiscard]] const TransformerOptions& options() const { return opts_; }

private:
    Primitive encode(const Value& value, std::size_t depth) const;
    Primitive encode_custom(const KindEntry& entry, const Value& value, std::size_t depth) const;
    std::string encode_key(const Value& key, std::size_t depth) const;

    Value decode(const Primitive& node, std::size_t depth) const;
    Value decode_compound(const Primitive& node, std::size_t depth) const;
    Value decode_string(const std::string& text, std::size_t depth) const;

    std::string escape(const std::string& s) const;
    void check_depth(std::size_t depth) const;

    std::shared_ptr<const Registry> registry_;
    TransformerOptions opts_;
};

} // namespace typetag
