#include "typetag/serializer.hpp"
#include "typetag/error.hpp"
#include <utility>

namespace typetag {

struct Serializer::Impl {
    Options opts;
    std::shared_ptr<const Registry> registry;
    Transformer transformer;

    Impl(std::vector<Codec> codecs, Options o)
        : opts(std::move(o)),
          registry(make_registry(std::move(codecs), opts)),
          transformer(registry, TransformerOptions{opts.markers, opts.max_depth}) {
        if (!opts.encoder) opts.encoder = JsonCodec::encoder();
        if (!opts.decoder) opts.decoder = JsonCodec::decoder();

        LogSink{opts.logger, opts.min_log_level}.log(
            LogLevel::Debug, "typetag.serializer",
            "serializer ready with " + std::to_string(registry->size()) + " codec(s)");
    }

    static std::shared_ptr<const Registry> make_registry(std::vector<Codec> codecs,
                                                         const Options& opts) {
        RegistryOptions reg_opts;
        reg_opts.duplicates = opts.duplicates;
        reg_opts.log = LogSink{opts.logger, opts.min_log_level};
        return std::make_shared<const Registry>(std::move(codecs), std::move(reg_opts));
    }
};

Serializer::Serializer(std::vector<Codec> codecs)
    : Serializer(std::move(codecs), Options{}) {}

Serializer::Serializer(std::vector<Codec> codecs, Options opts)
    : impl_(std::make_unique<Impl>(std::move(codecs), std::move(opts))) {}

Serializer::~Serializer() = default;
Serializer::Serializer(Serializer&&) noexcept = default;
Serializer& Serializer::operator=(Serializer&&) noexcept = default;

Primitive Serializer::to_primitive(const Value& value) const {
    return impl_->transformer.to_primitive(value);
}

Value Serializer::from_primitive(const Primitive& tree) const {
    return impl_->transformer.from_primitive(tree);
}

std::string Serializer::dumps(const Value& value) const {
    return impl_->opts.encoder(to_primitive(value));
}

Value Serializer::loads(std::string_view text) const {
    return from_primitive(impl_->opts.decoder(text));
}

const Registry& Serializer::registry() const {
    return *impl_->registry;
}

const Transformer& Serializer::transformer() const {
    return impl_->transformer;
}

const Serializer::Options& Serializer::options() const {
    return impl_->opts;
}

} // namespace typetag
