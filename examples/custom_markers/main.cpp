/// Custom markers — two serializers with different wire conventions
/// encoding the same document.
/// Usage: ./custom_markers

#include <typetag/typetag.hpp>
#include <iostream>
#include <string>

namespace {

struct Color {
    int r = 0, g = 0, b = 0;
    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
};

typetag::Codec color_codec() {
    return typetag::Codec::make<Color>(
        "rgb",
        [](const Color& c) { return typetag::Value(typetag::Value::Array{c.r, c.g, c.b}); },
        [](const typetag::Value& v) {
            const auto& a = v.as_array();
            return Color{static_cast<int>(a.at(0).as_int()), static_cast<int>(a.at(1).as_int()),
                         static_cast<int>(a.at(2).as_int())};
        });
}

} // anonymous namespace

int main() {
    typetag::Value doc = typetag::Value::Object{
        {"background", typetag::Value::custom(Color{255, 255, 255})},
        {"price", "$12"},
        {"handle", "@typetag"},
    };

    typetag::Serializer standard({color_codec()});

    typetag::Serializer::Options opts;
    opts.markers.tag = '@';
    opts.markers.escape = '~';
    opts.markers.type_key = "@type";
    opts.markers.value_key = "value";
    typetag::Serializer at_sign({color_codec()}, std::move(opts));

    try {
        std::string a = standard.dumps(doc);
        std::string b = at_sign.dumps(doc);
        std::cout << "standard: " << a << "\n";
        std::cout << "at-sign:  " << b << "\n";

        bool ok = standard.loads(a) == doc && at_sign.loads(b) == doc;
        std::cout << (ok ? "both round-trip" : "round-trip mismatch") << "\n";
        return ok ? 0 : 1;
    } catch (const typetag::TypetagError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
