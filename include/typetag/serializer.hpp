#pragma once
#include "codec.hpp"
#include "registry.hpp"
#include "transformer.hpp"
#include "types.hpp"
#include "value.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace typetag {

/// Registry + transformer + text codec.
/// A const Serializer may be shared between threads.
class Serializer {
public:
    struct Options {
        Markers markers;
        std::size_t max_depth = DEFAULT_MAX_DEPTH;
        DuplicatePolicy duplicates = DuplicatePolicy::Reject;
        // JsonCodec when left empty
        TextEncoder encoder;
        TextDecoder decoder;
        LogCallback logger;
        LogLevel min_log_level = LogLevel::Info;
    };

    explicit Serializer(std::vector<Codec> codecs);
    Serializer(std::vector<Codec> codecs, Options opts);
    ~Serializer();

    Serializer(const Serializer&) = delete;
    Serializer& operator=(const Serializer&) = delete;
    Serializer(Serializer&&) noexcept;
    Serializer& operator=(Serializer&&) noexcept;

    [[nodiscard]] Primitive to_primitive(const Value& value) const;
    [[nodiscard]] Value from_primitive(const Primitive& tree) const;

    /// encoder(to_primitive(value))
    [[nodiscard]] std::string dumps(const Value& value) const;

    /// from_primitive(decoder(text))
    [[nodiscard]] Value loads(std::string_view text) const;

    [[nodiscard]] const Registry& registry() const;
    [[nodiscard]] const Transformer& transformer() const;
    [[nodiscard]] const Options& options() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace typetag
