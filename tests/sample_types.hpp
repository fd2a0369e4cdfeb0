#pragma once
#include "typetag/registry.hpp"
#include "typetag/value.hpp"
#include <array>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>

// Application types used across the test suites.

namespace sample {

struct Uuid {
    std::array<uint8_t, 16> bytes{};

    static Uuid parse(std::string_view s) {
        if (s.size() != 36 || s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
            throw std::invalid_argument("Bad UUID: " + std::string(s));
        }
        Uuid u;
        std::size_t out = 0;
        for (std::size_t i = 0; i < s.size(); ) {
            if (s[i] == '-') { ++i; continue; }
            u.bytes[out++] = static_cast<uint8_t>((hex(s[i]) << 4) | hex(s[i + 1]));
            i += 2;
        }
        return u;
    }

    std::string str() const {
        static const char digits[] = "0123456789abcdef";
        std::string s;
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) s.push_back('-');
            s.push_back(digits[bytes[i] >> 4]);
            s.push_back(digits[bytes[i] & 0x0f]);
        }
        return s;
    }

    bool operator==(const Uuid& o) const { return bytes == o.bytes; }

private:
    static int hex(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument(std::string("Bad hex digit: ") + c);
    }
};

struct DateTime {
    int year = 1970, month = 1, day = 1;
    int hour = 0, minute = 0, second = 0, microsecond = 0;

    std::string iso() const {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06d",
                      year, month, day, hour, minute, second, microsecond);
        return buf;
    }

    static DateTime parse(const std::string& s) {
        DateTime dt;
        if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%6d", &dt.year, &dt.month, &dt.day,
                        &dt.hour, &dt.minute, &dt.second, &dt.microsecond) != 7) {
            throw std::invalid_argument("Bad timestamp: " + s);
        }
        return dt;
    }

    bool operator==(const DateTime& o) const {
        return year == o.year && month == o.month && day == o.day && hour == o.hour
               && minute == o.minute && second == o.second && microsecond == o.microsecond;
    }
};

struct MyType {
    typetag::Value a, b, c;

    bool operator==(const MyType& o) const { return a == o.a && b == o.b && c == o.c; }
};

/// Carries no data; encodes to a bare tag.
struct Nothing {
    bool operator==(const Nothing&) const { return true; }
};

inline const Uuid kUid = Uuid::parse("152e4227-6852-4f8e-912d-bd75478c7eaa");
inline const DateTime kDt{2019, 2, 3, 1, 23, 45, 12300};

inline typetag::Codec uuid_codec() {
    return typetag::Codec::make<Uuid>(
        "uuid",
        [](const Uuid& u) { return typetag::Value(u.str()); },
        [](const typetag::Value& v) { return Uuid::parse(v.as_string()); });
}

inline typetag::Codec datetime_codec() {
    return typetag::Codec::make<DateTime>(
        "dt",
        [](const DateTime& dt) { return typetag::Value(dt.iso()); },
        [](const typetag::Value& v) { return DateTime::parse(v.as_string()); });
}

inline typetag::Codec mytype_codec() {
    return typetag::Codec::make<MyType>(
        "mytype",
        [](const MyType& obj) { return typetag::Value(typetag::Value::Array{obj.a, obj.b, obj.c}); },
        [](const typetag::Value& v) {
            const auto& items = v.as_array();
            return MyType{items.at(0), items.at(1), items.at(2)};
        });
}

inline typetag::Codec nothing_codec() {
    return typetag::Codec::make<Nothing>(
        "nothing",
        [](const Nothing&) { return typetag::Value(); },
        [](const typetag::Value&) { return Nothing{}; });
}

} // namespace sample
