#include "typetag/registry.hpp"
#include "typetag/error.hpp"
#include <algorithm>
#include <stdexcept>

namespace typetag {

namespace {

constexpr const char* kLogger = "typetag.registry";

} // anonymous namespace

Registry::Registry(std::vector<Codec> codecs, RegistryOptions opts) {
    for (auto& codec : codecs) {
        if (!is_valid_codec_name(codec.name)) {
            throw std::invalid_argument("Invalid codec name '" + codec.name
                                        + "': expected one or more of [A-Za-z0-9_]");
        }
        if (!codec.encode || !codec.decode) {
            throw std::invalid_argument("Codec '" + codec.name + "' needs both encode and decode");
        }

        auto kind_it = by_kind_.find(codec.kind);
        bool name_taken = by_name_.count(codec.name) > 0;

        if (opts.duplicates == DuplicatePolicy::Reject) {
            if (name_taken) {
                throw DuplicateNameError("Codec name registered twice: '" + codec.name + "'",
                                         codec.name);
            }
            if (kind_it != by_kind_.end()) {
                throw DuplicateKindError("Codec '" + codec.name + "' registers kind "
                                         + codec.kind.name() + " already bound to '"
                                         + kind_it->second.name + "'",
                                         codec.name);
            }
        } else {
            if (name_taken) {
                opts.log.log(LogLevel::Warning, kLogger,
                             "codec name '" + codec.name + "' overwritten");
            }
            if (kind_it != by_kind_.end()) {
                opts.log.log(LogLevel::Warning, kLogger,
                             "kind " + std::string(codec.kind.name()) + " moved from '"
                             + kind_it->second.name + "' to '" + codec.name + "'");
            }
        }

        opts.log.log(LogLevel::Debug, kLogger,
                     "registered codec '" + codec.name + "' for kind " + codec.kind.name());

        if (!name_taken) names_.push_back(codec.name);
        by_kind_[codec.kind] = KindEntry{codec.name, std::move(codec.encode)};
        by_name_[codec.name] = std::move(codec.decode);
    }
}

const KindEntry* Registry::find_by_kind(std::type_index kind) const {
    auto it = by_kind_.find(kind);
    if (it == by_kind_.end()) return nullptr;
    return &it->second;
}

const DecodeFn* Registry::find_by_name(std::string_view name) const {
    auto it = by_name_.find(std::string(name));
    if (it == by_name_.end()) return nullptr;
    return &it->second;
}

const DecodeFn& Registry::decoder_for(std::string_view name) const {
    const DecodeFn* decode = find_by_name(name);
    if (!decode) {
        throw UnknownCodecError(std::string(name));
    }
    return *decode;
}

bool Registry::contains(std::string_view name) const {
    return find_by_name(name) != nullptr;
}

} // namespace typetag
