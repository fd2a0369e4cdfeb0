/// UUID and timestamp codecs over JSON.
/// Usage: ./uuid_datetime [json]
/// Without arguments prints an encoded sample document; with an argument
/// decodes it and reports what came back.

#include <typetag/typetag.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <random>

namespace {

struct Uuid {
    std::array<uint8_t, 16> bytes{};

    static Uuid random() {
        static std::mt19937_64 rng{std::random_device{}()};
        Uuid u;
        for (auto& b : u.bytes) b = static_cast<uint8_t>(rng());
        u.bytes[6] = static_cast<uint8_t>((u.bytes[6] & 0x0f) | 0x40);
        u.bytes[8] = static_cast<uint8_t>((u.bytes[8] & 0x3f) | 0x80);
        return u;
    }

    static Uuid parse(const std::string& s) {
        Uuid u;
        std::size_t out = 0;
        for (std::size_t i = 0; i + 1 < s.size() && out < u.bytes.size(); ) {
            if (s[i] == '-') { ++i; continue; }
            u.bytes[out++] = static_cast<uint8_t>(std::stoi(s.substr(i, 2), nullptr, 16));
            i += 2;
        }
        if (out != u.bytes.size()) throw std::invalid_argument("Bad UUID: " + s);
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
};

using Clock = std::chrono::system_clock;

// Seconds precision, UTC
std::string to_iso(Clock::time_point tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

Clock::time_point from_iso(const std::string& s) {
    std::tm tm{};
    if (!strptime(s.c_str(), "%Y-%m-%dT%H:%M:%SZ", &tm)) {
        throw std::invalid_argument("Bad timestamp: " + s);
    }
    return Clock::from_time_t(timegm(&tm));
}

} // anonymous namespace

int main(int argc, char** argv) {
    typetag::Serializer::Options opts;
    opts.encoder = typetag::JsonCodec::encoder(2);
    opts.logger = [](const typetag::LogMessage& m) {
        std::cerr << "[" << typetag::log_level_to_string(m.level) << "] "
                  << m.logger.value_or("") << ": " << m.message << "\n";
    };

    typetag::Serializer serializer{
        {
            typetag::Codec::make<Uuid>(
                "uuid",
                [](const Uuid& u) { return typetag::Value(u.str()); },
                [](const typetag::Value& v) { return Uuid::parse(v.as_string()); }),
            typetag::Codec::make<Clock::time_point>(
                "dt",
                [](const Clock::time_point& tp) { return typetag::Value(to_iso(tp)); },
                [](const typetag::Value& v) { return from_iso(v.as_string()); }),
        },
        std::move(opts)};

    try {
        if (argc > 1) {
            typetag::Value v = serializer.loads(argv[1]);
            std::cout << "decoded " << v.type_name() << "\n";
            if (v.is_object()) {
                for (const auto& [key, item] : v.as_object()) {
                    std::cout << "  " << (key.is_string() ? key.as_string() : key.type_name())
                              << " -> ";
                    if (const auto* u = item.get_if<Uuid>()) {
                        std::cout << "uuid " << u->str();
                    } else if (const auto* tp = item.get_if<Clock::time_point>()) {
                        std::cout << "time " << to_iso(*tp);
                    } else {
                        std::cout << item.type_name();
                    }
                    std::cout << "\n";
                }
            }
            return 0;
        }

        typetag::Value doc = typetag::Value::Object{
            {"uuid", typetag::Value::custom(Uuid::random())},
            {"datetime", typetag::Value::custom(Clock::now())},
            {"comment", "$ and / prefixed strings are escaped"},
            {"path", "/tmp/example"},
        };
        std::cout << serializer.dumps(doc) << "\n";
    } catch (const typetag::TypetagError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
