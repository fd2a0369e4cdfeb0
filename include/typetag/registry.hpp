#pragma once
#include "types.hpp"
#include "value.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace typetag {

/// Application value -> primitive-shaped Value. A null result means "marker only".
using EncodeFn = std::function<Value(const Value& value)>;
/// Decoded payload (null when a tag has no body) -> application value.
using DecodeFn = std::function<Value(const Value& payload)>;

struct Codec {
    std::string name;
    std::type_index kind{typeid(void)};
    EncodeFn encode;
    DecodeFn decode;

    /// Typed codec for kind T.
    template<typename T>
    [[nodiscard]] static Codec make(std::string name,
                                    std::function<Value(const T&)> encode,
                                    std::function<T(const Value&)> decode) {
        Codec c;
        c.name = std::move(name);
        c.kind = typeid(T);
        c.encode = [enc = std::move(encode)](const Value& v) { return enc(v.as<T>()); };
        c.decode = [dec = std::move(decode)](const Value& payload) {
            return wrap<T>(dec(payload));
        };
        return c;
    }

    /// Codec backed by T's nlohmann to_json/from_json pair.
    template<typename T>
    [[nodiscard]] static Codec json_backed(std::string name) {
        return make<T>(
            std::move(name),
            [](const T& obj) {
                nlohmann::json j = obj;
                return j.get<Value>();
            },
            [](const Value& payload) {
                nlohmann::json j = payload;
                return j.get<T>();
            });
    }

private:
    template<typename T>
    static Value wrap(T obj) {
        if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t>
                      || std::is_same_v<T, double> || std::is_same_v<T, std::string>
                      || std::is_same_v<T, std::nullptr_t>) {
            return Value(std::move(obj));
        } else {
            return Value::custom(std::move(obj));
        }
    }
};

enum class DuplicatePolicy {
    Reject,   // DuplicateNameError / DuplicateKindError
    LastWins  // later codec overwrites the earlier index entries
};

struct RegistryOptions {
    DuplicatePolicy duplicates = DuplicatePolicy::Reject;
    LogSink log;
};

struct KindEntry {
    std::string name;
    EncodeFn encode;
};

/// Immutable name and kind indices over a codec list.
class Registry {
public:
    explicit Registry(std::vector<Codec> codecs, RegistryOptions opts = {});

    [[nodiscard]] const KindEntry* find_by_kind(std::type_index kind) const;
    [[nodiscard]] const DecodeFn* find_by_name(std::string_view name) const;

    /// Throws UnknownCodecError.
    [[nodiscard]] const DecodeFn& decoder_for(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::size_t size() const { return names_.size(); }

    /// Codec names in registration order.
    [[nodiscard]] const std::vector<std::string>& names() const { return names_; }

private:
    std::unordered_map<std::type_index, KindEntry> by_kind_;
    std::unordered_map<std::string, DecodeFn> by_name_;
    std::vector<std::string> names_;
};

} // namespace typetag
