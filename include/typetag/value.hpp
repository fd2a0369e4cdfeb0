#pragma once
#include "error.hpp"
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace typetag {

/// The tree handed to the underlying text encoder/decoder.
using Primitive = nlohmann::ordered_json;

class Value;

namespace detail {

template<typename T, typename = void>
struct is_equality_comparable : std::false_type {};

template<typename T>
struct is_equality_comparable<T, std::void_t<decltype(std::declval<const T&>() == std::declval<const T&>())>>
    : std::true_type {};

/// Unsigned types whose range exceeds int64_t.
template<typename T>
constexpr bool is_wide_unsigned_v = std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t);

} // namespace detail

// ---------- Custom ----------

/// Immutable, type-erased application value.
class Custom {
public:
    template<typename T>
    [[nodiscard]] static Custom make(T value) {
        using U = std::decay_t<T>;
        return Custom(std::make_shared<const Model<U>>(std::move(value)));
    }

    [[nodiscard]] std::type_index kind() const { return holder_->kind(); }

    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        if (holder_->kind() != std::type_index(typeid(T))) return nullptr;
        return &static_cast<const Model<T>*>(holder_.get())->value;
    }

    /// Uses T::operator== where T has one, identity otherwise.
    bool operator==(const Custom& o) const {
        return holder_ == o.holder_ || holder_->equals(*o.holder_);
    }
    bool operator!=(const Custom& o) const { return !(*this == o); }

private:
    struct Concept {
        virtual ~Concept() = default;
        virtual std::type_index kind() const = 0;
        virtual bool equals(const Concept& other) const = 0;
    };

    template<typename T>
    struct Model final : Concept {
        explicit Model(T v) : value(std::move(v)) {}

        std::type_index kind() const override { return typeid(T); }

        bool equals(const Concept& other) const override {
            if (other.kind() != kind()) return false;
            if constexpr (detail::is_equality_comparable<T>::value) {
                return static_cast<bool>(value == static_cast<const Model&>(other).value);
            } else {
                return this == &other;
            }
        }

        T value;
    };

    explicit Custom(std::shared_ptr<const Concept> holder) : holder_(std::move(holder)) {}

    std::shared_ptr<const Concept> holder_;
};

// ---------- Object ----------

/// Insertion-ordered mapping with unique keys. Keys may be any Value.
/// String keys are hashed; other keys are found by a linear scan.
class Object {
public:
    using value_type = std::pair<Value, Value>;
    using const_iterator = std::vector<value_type>::const_iterator;

    Object() = default;
    Object(std::initializer_list<value_type> init);

    /// Replaces the value of an existing key in place, appends otherwise.
    void insert_or_assign(Value key, Value value);

    [[nodiscard]] const Value* find(const Value& key) const;
    [[nodiscard]] const Value& at(const Value& key) const;
    [[nodiscard]] bool contains(const Value& key) const;

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    /// Order-sensitive.
    bool operator==(const Object& o) const;
    bool operator!=(const Object& o) const { return !(*this == o); }

private:
    [[nodiscard]] std::size_t index_of(const Value& key) const;

    std::vector<value_type> entries_;
    std::unordered_map<std::string, std::size_t> string_index_;
};

// ---------- Value ----------

/// Application-side tree: primitives, containers and registered custom kinds.
class Value {
public:
    using Array = std::vector<Value>;
    using Object = typetag::Object;

    Value() noexcept : data_(nullptr) {}
    Value(std::nullptr_t) noexcept : data_(nullptr) {}
    Value(bool b) noexcept : data_(b) {}

    /// Throws EncodeError for unsigned values above INT64_MAX.
    template<typename T,
             std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T i) noexcept(!detail::is_wide_unsigned_v<T>) : data_(to_int64(i)) {}

    template<typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    Value(T d) noexcept : data_(static_cast<double>(d)) {}

    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}
    Value(Custom c) : data_(std::move(c)) {}

    /// Wraps an application value. Built-in kinds use the plain constructors.
    template<typename T>
    [[nodiscard]] static Value custom(T value) {
        static_assert(!is_builtin<std::decay_t<T>>(),
                      "built-in kinds are stored directly, not as custom values");
        return Value(Custom::make(std::move(value)));
    }

    [[nodiscard]] bool is_null() const noexcept   { return std::holds_alternative<std::nullptr_t>(data_); }
    [[nodiscard]] bool is_bool() const noexcept   { return std::holds_alternative<bool>(data_); }
    [[nodiscard]] bool is_int() const noexcept    { return std::holds_alternative<int64_t>(data_); }
    [[nodiscard]] bool is_double() const noexcept { return std::holds_alternative<double>(data_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
    [[nodiscard]] bool is_array() const noexcept  { return std::holds_alternative<Array>(data_); }
    [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<Object>(data_); }
    [[nodiscard]] bool is_custom() const noexcept { return std::holds_alternative<Custom>(data_); }

    [[nodiscard]] bool as_bool() const                 { return checked<bool>("bool"); }
    [[nodiscard]] int64_t as_int() const               { return checked<int64_t>("int"); }
    [[nodiscard]] double as_double() const             { return checked<double>("float"); }
    [[nodiscard]] const std::string& as_string() const { return checked<std::string>("string"); }
    [[nodiscard]] const Array& as_array() const        { return checked<Array>("array"); }
    [[nodiscard]] const Object& as_object() const      { return checked<Object>("object"); }
    [[nodiscard]] const Custom& as_custom() const      { return checked<Custom>("custom"); }

    /// Pointer to the held T (built-in or custom), nullptr on mismatch.
    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        if constexpr (is_builtin<T>()) {
            return std::get_if<T>(&data_);
        } else {
            const Custom* c = std::get_if<Custom>(&data_);
            return c ? c->get_if<T>() : nullptr;
        }
    }

    /// Throws std::invalid_argument on mismatch.
    template<typename T>
    [[nodiscard]] const T& as() const {
        const T* p = get_if<T>();
        if (!p) {
            throw std::invalid_argument(std::string("Value holds ") + type_name()
                                        + ", not " + typeid(T).name());
        }
        return *p;
    }

    /// Exact runtime kind, used for codec lookup.
    [[nodiscard]] std::type_index kind() const;

    /// "null", "bool", "int", "float", "string", "array", "object" or the custom type's name.
    [[nodiscard]] std::string type_name() const;

    bool operator==(const Value& o) const { return data_ == o.data_; }
    bool operator!=(const Value& o) const { return !(*this == o); }

private:
    using Storage = std::variant<std::nullptr_t, bool, int64_t, double, std::string, Array, Object, Custom>;

    template<typename T>
    static constexpr bool is_builtin() {
        return std::is_same_v<T, std::nullptr_t> || std::is_same_v<T, bool>
               || std::is_same_v<T, int64_t> || std::is_same_v<T, double>
               || std::is_same_v<T, std::string> || std::is_same_v<T, Array>
               || std::is_same_v<T, Object> || std::is_same_v<T, Custom>;
    }

    template<typename T>
    static int64_t to_int64(T i) noexcept(!detail::is_wide_unsigned_v<T>) {
        if constexpr (detail::is_wide_unsigned_v<T>) {
            if (i > static_cast<T>(std::numeric_limits<int64_t>::max())) {
                throw EncodeError("Integer out of range: " + std::to_string(i));
            }
        }
        return static_cast<int64_t>(i);
    }

    template<typename T>
    const T& checked(const char* expected) const {
        const T* p = std::get_if<T>(&data_);
        if (!p) {
            throw std::invalid_argument(std::string("Expected ") + expected + ", got " + type_name());
        }
        return *p;
    }

    Storage data_;
};

// ---------- Plain JSON conversion (no tagging) ----------

/// A custom value or a non-string key has no plain JSON form.
template<typename BasicJsonType>
void to_json(BasicJsonType& j, const Value& v) {
    if (v.is_null()) {
        j = nullptr;
    } else if (v.is_bool()) {
        j = v.as_bool();
    } else if (v.is_int()) {
        j = v.as_int();
    } else if (v.is_double()) {
        j = v.as_double();
    } else if (v.is_string()) {
        j = v.as_string();
    } else if (v.is_array()) {
        j = BasicJsonType::array();
        for (const auto& item : v.as_array()) {
            BasicJsonType child;
            to_json(child, item);
            j.push_back(std::move(child));
        }
    } else if (v.is_object()) {
        j = BasicJsonType::object();
        for (const auto& [key, item] : v.as_object()) {
            if (!key.is_string()) {
                throw EncodeError("Plain JSON keys must be strings, got " + key.type_name());
            }
            BasicJsonType child;
            to_json(child, item);
            j[key.as_string()] = std::move(child);
        }
    } else {
        throw EncodeError("No plain JSON form for custom value of type " + v.type_name());
    }
}

template<typename BasicJsonType>
void from_json(const BasicJsonType& j, Value& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            v = Value();
            break;
        case nlohmann::json::value_t::boolean:
            v = j.template get<bool>();
            break;
        case nlohmann::json::value_t::number_integer:
            v = j.template get<int64_t>();
            break;
        case nlohmann::json::value_t::number_unsigned: {
            auto u = j.template get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw DecodeError("Integer out of range: " + std::to_string(u));
            }
            v = static_cast<int64_t>(u);
            break;
        }
        case nlohmann::json::value_t::number_float:
            v = j.template get<double>();
            break;
        case nlohmann::json::value_t::string:
            v = j.template get<std::string>();
            break;
        case nlohmann::json::value_t::array: {
            Value::Array arr;
            arr.reserve(j.size());
            for (const auto& item : j) {
                Value child;
                from_json(item, child);
                arr.push_back(std::move(child));
            }
            v = std::move(arr);
            break;
        }
        case nlohmann::json::value_t::object: {
            Value::Object obj;
            for (auto it = j.begin(); it != j.end(); ++it) {
                Value child;
                from_json(it.value(), child);
                obj.insert_or_assign(Value(it.key()), std::move(child));
            }
            v = std::move(obj);
            break;
        }
        default:
            throw DecodeError(std::string("Unsupported JSON value: ") + j.type_name());
    }
}

} // namespace typetag
