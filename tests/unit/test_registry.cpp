#include <gtest/gtest.h>
#include "typetag/registry.hpp"
#include "typetag/error.hpp"
#include "../sample_types.hpp"
#include <vector>

using namespace typetag;
using sample::Uuid;
using sample::DateTime;

namespace {

Codec uuid_as(const std::string& name) {
    Codec c = sample::uuid_codec();
    c.name = name;
    return c;
}

} // anonymous namespace

// ---- Lookup ----

TEST(Registry, LookupByKind) {
    Registry reg({sample::uuid_codec(), sample::datetime_codec()});
    const KindEntry* entry = reg.find_by_kind(typeid(Uuid));
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->name, "uuid");
    EXPECT_EQ(entry->encode(Value::custom(sample::kUid)),
              Value("152e4227-6852-4f8e-912d-bd75478c7eaa"));
    EXPECT_EQ(reg.find_by_kind(typeid(sample::MyType)), nullptr);
}

TEST(Registry, LookupByName) {
    Registry reg({sample::uuid_codec(), sample::datetime_codec()});
    ASSERT_NE(reg.find_by_name("dt"), nullptr);
    Value decoded = reg.decoder_for("dt")(Value("2019-02-03T01:23:45.012300"));
    EXPECT_EQ(decoded, Value::custom(sample::kDt));
    EXPECT_EQ(reg.find_by_name("nope"), nullptr);
}

TEST(Registry, UnknownNameThrows) {
    Registry reg({sample::uuid_codec()});
    try {
        (void)reg.decoder_for("nope");
        FAIL() << "expected UnknownCodecError";
    } catch (const UnknownCodecError& e) {
        EXPECT_EQ(e.name, "nope");
    }
}

TEST(Registry, NamesInRegistrationOrder) {
    Registry reg({sample::mytype_codec(), sample::uuid_codec(), sample::datetime_codec()});
    EXPECT_EQ(reg.size(), 3u);
    EXPECT_EQ(reg.names(), (std::vector<std::string>{"mytype", "uuid", "dt"}));
    EXPECT_TRUE(reg.contains("uuid"));
    EXPECT_FALSE(reg.contains("UUID"));
}

TEST(Registry, Empty) {
    Registry reg({});
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_EQ(reg.find_by_kind(typeid(Uuid)), nullptr);
}

// ---- Duplicates ----

TEST(Registry, DuplicateNameRejected) {
    Codec other = sample::datetime_codec();
    other.name = "uuid";
    EXPECT_THROW(Registry({sample::uuid_codec(), other}), DuplicateNameError);
}

TEST(Registry, DuplicateKindRejected) {
    EXPECT_THROW(Registry({sample::uuid_codec(), uuid_as("guid")}), DuplicateKindError);
}

TEST(Registry, DuplicatesDeriveFromCommonError) {
    EXPECT_THROW(Registry({sample::uuid_codec(), uuid_as("guid")}), DuplicateRegistrationError);
}

TEST(Registry, LastWinsOverwritesKind) {
    RegistryOptions opts;
    opts.duplicates = DuplicatePolicy::LastWins;
    Registry reg({sample::uuid_codec(), uuid_as("guid")}, opts);
    ASSERT_NE(reg.find_by_kind(typeid(Uuid)), nullptr);
    EXPECT_EQ(reg.find_by_kind(typeid(Uuid))->name, "guid");
    // Both names still decode.
    EXPECT_TRUE(reg.contains("uuid"));
    EXPECT_TRUE(reg.contains("guid"));
}

TEST(Registry, LastWinsOverwritesName) {
    RegistryOptions opts;
    opts.duplicates = DuplicatePolicy::LastWins;
    Codec first = Codec::make<Uuid>(
        "id", [](const Uuid& u) { return Value(u.str()); },
        [](const Value&) { return Uuid{}; });
    Registry reg({first, uuid_as("id")}, opts);
    EXPECT_EQ(reg.size(), 1u);
    EXPECT_EQ(reg.decoder_for("id")(Value("152e4227-6852-4f8e-912d-bd75478c7eaa")),
              Value::custom(sample::kUid));
}

TEST(Registry, LastWinsLogsWarning) {
    std::vector<LogMessage> seen;
    RegistryOptions opts;
    opts.duplicates = DuplicatePolicy::LastWins;
    opts.log = LogSink{[&seen](const LogMessage& m) { seen.push_back(m); }, LogLevel::Warning};
    Registry reg({sample::uuid_codec(), uuid_as("guid")}, opts);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].level, LogLevel::Warning);
    EXPECT_EQ(seen[0].logger, std::optional<std::string>("typetag.registry"));
}

TEST(Registry, RegistrationLoggedAtDebug) {
    std::vector<LogMessage> seen;
    RegistryOptions opts;
    opts.log = LogSink{[&seen](const LogMessage& m) { seen.push_back(m); }, LogLevel::Debug};
    Registry reg({sample::uuid_codec(), sample::datetime_codec()}, opts);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].level, LogLevel::Debug);
    EXPECT_NE(seen[0].message.find("'uuid'"), std::string::npos);
}

// ---- Validation ----

TEST(Registry, RejectsNameOutsideTagPattern) {
    EXPECT_THROW(Registry({uuid_as("date-time")}), std::invalid_argument);
    EXPECT_THROW(Registry({uuid_as("")}), std::invalid_argument);
}

TEST(Registry, RejectsMissingFunctions) {
    Codec c = sample::uuid_codec();
    c.decode = nullptr;
    EXPECT_THROW(Registry({c}), std::invalid_argument);
}

// ---- Codec factories ----

TEST(Codec, MakeSetsKind) {
    Codec c = sample::datetime_codec();
    EXPECT_EQ(c.kind, std::type_index(typeid(DateTime)));
    EXPECT_EQ(c.name, "dt");
}

TEST(Codec, MakeWrapsDecodedValue) {
    Codec c = sample::uuid_codec();
    Value v = c.decode(Value("152e4227-6852-4f8e-912d-bd75478c7eaa"));
    EXPECT_EQ(v.kind(), std::type_index(typeid(Uuid)));
}

TEST(Codec, MakeForBuiltinKindKeepsBuiltin) {
    Codec c = Codec::make<double>(
        "f", [](const double& d) { return Value(std::to_string(d)); },
        [](const Value& v) { return std::stod(v.as_string()); });
    EXPECT_TRUE(c.encode(Value(1.5)).is_string());
    EXPECT_TRUE(c.decode(Value("2.5")).is_double());
}
