#include "typetag/codec.hpp"
#include "typetag/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace typetag {

namespace {

Primitive number_to_primitive(simdjson::ondemand::number num) {
    switch (num.get_number_type()) {
        case simdjson::ondemand::number_type::signed_integer:
            return Primitive(num.get_int64());
        case simdjson::ondemand::number_type::unsigned_integer:
            return Primitive(num.get_uint64());
        default:
            return Primitive(num.as_double());
    }
}

// Convert simdjson value to an ordered primitive tree recursively
Primitive simdjson_to_primitive(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            Primitive obj = Primitive::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_primitive(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            Primitive arr = Primitive::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_primitive(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return Primitive(std::string(sv));
        }
        case simdjson::ondemand::json_type::number:
            return number_to_primitive(val.get_number());
        case simdjson::ondemand::json_type::boolean:
            return Primitive(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return Primitive(nullptr);
        default:
            throw ParseError("Unknown JSON value type");
    }
}

// Scalar documents cannot be read through get_value()
Primitive simdjson_doc_to_primitive(simdjson::ondemand::document& doc) {
    switch (doc.type()) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array: {
            auto val = doc.get_value();
            if (val.error()) {
                throw ParseError("Failed to get document value");
            }
            Primitive out = simdjson_to_primitive(val.value());
            if (!doc.at_end()) {
                throw ParseError("Trailing content after JSON document");
            }
            return out;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return Primitive(std::string(sv));
        }
        case simdjson::ondemand::json_type::number:
            return number_to_primitive(doc.get_number());
        case simdjson::ondemand::json_type::boolean:
            return Primitive(doc.get_bool().value());
        case simdjson::ondemand::json_type::null:
            if (!doc.is_null()) {
                throw ParseError("Invalid null literal");
            }
            return Primitive(nullptr);
        default:
            throw ParseError("Unknown JSON document type");
    }
}

} // anonymous namespace

Primitive JsonCodec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        return simdjson_doc_to_primitive(doc);
    } catch (const ParseError&) {
        throw;
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }
}

std::string JsonCodec::serialize(const Primitive& tree, int indent) {
    try {
        return tree.dump(indent);
    } catch (const nlohmann::json::exception& e) {
        throw EncodeError(std::string("JSON serialization error: ") + e.what());
    }
}

TextEncoder JsonCodec::encoder(int indent) {
    return [indent](const Primitive& tree) { return serialize(tree, indent); };
}

TextDecoder JsonCodec::decoder() {
    return [](std::string_view text) { return parse(text); };
}

} // namespace typetag
