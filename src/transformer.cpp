#include "typetag/transformer.hpp"
#include "typetag/error.hpp"
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace typetag {

using value_t = Primitive::value_t;

std::optional<ParsedTag> parse_tag(std::string_view text, const Markers& markers) {
    if (text.empty() || text.front() != markers.tag) return std::nullopt;

    std::size_t end = 1;
    while (end < text.size() && is_word_char(text[end])) ++end;
    if (end == 1) return std::nullopt;

    ParsedTag tag;
    tag.name = std::string(text.substr(1, end - 1));
    if (end + 1 < text.size() && text[end] == ':') {
        tag.body = std::string(text.substr(end + 1));
    }
    return tag;
}

Transformer::Transformer(std::shared_ptr<const Registry> registry, TransformerOptions opts)
    : registry_(std::move(registry)), opts_(std::move(opts)) {
    if (!registry_) {
        throw std::invalid_argument("Transformer requires a registry");
    }
    opts_.markers.validate();
}

Primitive Transformer::to_primitive(const Value& value) const {
    return encode(value, 0);
}

Value Transformer::from_primitive(const Primitive& tree) const {
    return decode(tree, 0);
}

void Transformer::check_depth(std::size_t depth) const {
    if (depth > opts_.max_depth) {
        throw DepthLimitError(opts_.max_depth);
    }
}

std::string Transformer::escape(const std::string& s) const {
    std::string out;
    out.reserve(s.size() + 1);
    out.push_back(opts_.markers.escape);
    out += s;
    return out;
}

// ---------- Encode ----------

Primitive Transformer::encode(const Value& value, std::size_t depth) const {
    check_depth(depth);

    if (value.is_object()) {
        Primitive out = Primitive::object();
        for (const auto& [key, item] : value.as_object()) {
            out[encode_key(key, depth)] = encode(item, depth + 1);
        }
        return out;
    }
    if (value.is_array()) {
        Primitive out = Primitive::array();
        for (const auto& item : value.as_array()) {
            out.push_back(encode(item, depth + 1));
        }
        return out;
    }
    // Integers never go through codec lookup.
    if (value.is_int()) {
        return value.as_int();
    }
    if (const KindEntry* entry = registry_->find_by_kind(value.kind())) {
        return encode_custom(*entry, value, depth);
    }
    if (value.is_string()) {
        const std::string& s = value.as_string();
        if (opts_.markers.is_reserved(s)) return escape(s);
        return s;
    }
    if (value.is_null()) return nullptr;
    if (value.is_bool()) return value.as_bool();
    if (value.is_double()) return value.as_double();

    throw EncodeError("No codec registered for type " + value.type_name());
}

Primitive Transformer::encode_custom(const KindEntry& entry, const Value& value,
                                     std::size_t depth) const {
    const Markers& m = opts_.markers;
    std::string tag(1, m.tag);
    tag += entry.name;

    Value payload = entry.encode(value);
    if (payload.is_null()) {
        return tag;
    }

    Primitive inner = encode(payload, depth + 1);
    if (inner.is_string()) {
        // "$name:" reads back as a tag without a body.
        if (inner.get_ref<const std::string&>().empty()) {
            throw EncodeError("Codec '" + entry.name + "' encoded to an empty string");
        }
        tag += ':';
        tag += inner.get_ref<const std::string&>();
        return tag;
    }

    Primitive out = Primitive::object();
    out[m.type_key] = entry.name;
    out[m.value_key] = std::move(inner);
    return out;
}

std::string Transformer::encode_key(const Value& key, std::size_t depth) const {
    if (key.is_string() && opts_.markers.is_reserved(key.as_string())) {
        return escape(key.as_string());
    }
    if (const KindEntry* entry = registry_->find_by_kind(key.kind())) {
        Primitive tagged = encode_custom(*entry, key, depth);
        if (!tagged.is_string()) {
            throw EncodeError("Codec '" + entry->name
                              + "' does not encode to a string and cannot be used as a mapping key");
        }
        return tagged.get<std::string>();
    }
    if (key.is_string()) {
        return key.as_string();
    }
    throw EncodeError("Mapping keys must be strings or registered kinds, got " + key.type_name());
}

// ---------- Decode ----------

Value Transformer::decode(const Primitive& node, std::size_t depth) const {
    check_depth(depth);

    switch (node.type()) {
        case value_t::object: {
            if (node.contains(opts_.markers.type_key)) {
                return decode_compound(node, depth);
            }
            Value::Object out;
            for (auto it = node.begin(); it != node.end(); ++it) {
                out.insert_or_assign(decode_string(it.key(), depth + 1),
                                     decode(it.value(), depth + 1));
            }
            return out;
        }
        case value_t::array: {
            Value::Array out;
            out.reserve(node.size());
            for (const auto& item : node) {
                out.push_back(decode(item, depth + 1));
            }
            return out;
        }
        case value_t::string:
            return decode_string(node.get_ref<const std::string&>(), depth);
        case value_t::boolean:
            return node.get<bool>();
        case value_t::number_integer:
            return node.get<int64_t>();
        case value_t::number_unsigned: {
            auto u = node.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw DecodeError("Integer out of range: " + std::to_string(u));
            }
            return static_cast<int64_t>(u);
        }
        case value_t::number_float:
            return node.get<double>();
        case value_t::null:
            return Value();
        default:
            throw DecodeError(std::string("Unsupported primitive value: ") + node.type_name());
    }
}

Value Transformer::decode_compound(const Primitive& node, std::size_t depth) const {
    const Markers& m = opts_.markers;
    const Primitive& name = node.at(m.type_key);
    if (!name.is_string()) {
        throw MalformedTagError("Type key '" + m.type_key + "' must hold a codec name", node.dump());
    }
    auto payload = node.find(m.value_key);
    if (payload == node.end()) {
        throw MalformedTagError("Tagged compound is missing value key '" + m.value_key + "'",
                                node.dump());
    }
    const DecodeFn& decode_fn = registry_->decoder_for(name.get_ref<const std::string&>());
    return decode_fn(decode(*payload, depth + 1));
}

Value Transformer::decode_string(const std::string& text, std::size_t depth) const {
    const Markers& m = opts_.markers;
    if (text.empty()) return text;

    if (text.front() == m.escape) {
        return text.substr(1);
    }
    if (text.front() == m.tag) {
        auto parsed = parse_tag(text, m);
        if (!parsed) {
            throw MalformedTagError("Invalid tag: '" + text + "'", text);
        }
        const DecodeFn& decode_fn = registry_->decoder_for(parsed->name);
        if (!parsed->body) {
            return decode_fn(Value());
        }
        check_depth(depth + 1);
        // The body went through the string rules on the way out.
        return decode_fn(decode_string(*parsed->body, depth + 1));
    }
    return text;
}

} // namespace typetag
