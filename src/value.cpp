#include "typetag/value.hpp"
#include <stdexcept>

namespace typetag {

// ---------- Object ----------

Object::Object(std::initializer_list<value_type> init) {
    entries_.reserve(init.size());
    string_index_.reserve(init.size());
    for (const auto& entry : init) {
        insert_or_assign(entry.first, entry.second);
    }
}

std::size_t Object::index_of(const Value& key) const {
    if (const std::string* s = key.get_if<std::string>()) {
        auto it = string_index_.find(*s);
        return it == string_index_.end() ? entries_.size() : it->second;
    }
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (!entries_[i].first.is_string() && entries_[i].first == key) return i;
    }
    return entries_.size();
}

void Object::insert_or_assign(Value key, Value value) {
    std::size_t i = index_of(key);
    if (i < entries_.size()) {
        entries_[i].second = std::move(value);
        return;
    }
    if (key.is_string()) {
        string_index_.emplace(key.as_string(), entries_.size());
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

const Value* Object::find(const Value& key) const {
    std::size_t i = index_of(key);
    return i < entries_.size() ? &entries_[i].second : nullptr;
}

const Value& Object::at(const Value& key) const {
    const Value* v = find(key);
    if (!v) {
        throw std::out_of_range("Key not found in object");
    }
    return *v;
}

bool Object::contains(const Value& key) const {
    return find(key) != nullptr;
}

bool Object::operator==(const Object& o) const {
    return entries_ == o.entries_;
}

// ---------- Value ----------

std::type_index Value::kind() const {
    return std::visit([](const auto& v) -> std::type_index {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Custom>) {
            return v.kind();
        } else {
            return typeid(T);
        }
    }, data_);
}

std::string Value::type_name() const {
    switch (data_.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "float";
        case 4: return "string";
        case 5: return "array";
        case 6: return "object";
        default: return std::get<Custom>(data_).kind().name();
    }
}

} // namespace typetag
