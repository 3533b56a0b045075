#include <catch2/catch_all.hpp>

#include "tract/tract.hpp"

using namespace Catch;

namespace {

    Tract::SchemaPtr team_schema() {
        static const Tract::SchemaPtr schema = [] {
            Tract::SchemaBuilder b{ "Team" };
            b.field("name", Tract::StringKind{}, { .required = true })
             .field("colors", Tract::StringKind{}, { .repeated = true })
             .field("mascot", Tract::StringKind{});
            return b.build();
        }();
        return schema;
    }

    Tract::SchemaPtr owner_schema() {
        static const Tract::SchemaPtr schema = [] {
            Tract::SchemaBuilder b{ "Owner" };
            b.field("team", Tract::MessageKind{ team_schema() }, { .required = true })
             .field("rivals", Tract::MessageKind{ team_schema() }, { .repeated = true });
            return b.build();
        }();
        return schema;
    }

    Tract::value object_of(std::string_view json) {
        auto v = Tract::parse(json);
        REQUIRE(v);
        return *std::move(v);
    }
}


TEST_CASE("Encoding Omits Unset Fields") {
    Tract::Message m{ team_schema() };
    REQUIRE(m.set("name", "Minnesota"));

    Tract::value out = Tract::encode_value(m);
    REQUIRE(out.is_object());
    REQUIRE(out.size() == 1);
    REQUIRE(out.find("name") != nullptr);
    REQUIRE(out.find("colors") == nullptr);
    REQUIRE(out.find("mascot") == nullptr);
}

TEST_CASE("Encoding Keeps Null and Empty Lists") {
    Tract::Message m{ team_schema() };
    REQUIRE(m.set_null("mascot"));
    REQUIRE(m.set("colors", Tract::Elements{}));

    Tract::value out = Tract::encode_value(m);
    REQUIRE(out.at("mascot").is_null());
    REQUIRE(out.at("colors").is_array());
    REQUIRE(out.at("colors").size() == 0);
    REQUIRE(Tract::dump(out) == R"({"colors":[],"mascot":null})");
}

TEST_CASE("Encoding Follows Declaration Order") {
    Tract::Message m{ team_schema() };
    REQUIRE(m.set("mascot", "Bucky"));
    REQUIRE(m.set("name", "Wisconsin"));

    REQUIRE(Tract::dump(Tract::encode_value(m)) == R"({"name":"Wisconsin","mascot":"Bucky"})");
}

TEST_CASE("Decoding Distinguishes Null From Absent") {
    auto m = Tract::decode_value(team_schema(), object_of(R"({"name":"Minnesota","mascot":null})"));
    REQUIRE(m);
    REQUIRE(m->is_set("mascot"));
    REQUIRE(std::holds_alternative<Tract::Null>(m->slot("mascot")));
    REQUIRE_FALSE(m->is_set("colors"));
}

TEST_CASE("Decoding Ignores Unknown Keys by Default") {
    auto m = Tract::decode_value(team_schema(), object_of(R"({"name":"Minnesota","coach":"Fleck"})"));
    REQUIRE(m);
    REQUIRE(Tract::dump(Tract::encode_value(*m)) == R"({"name":"Minnesota"})");
}

TEST_CASE("Strict Decoding Rejects Unknown Keys") {
    Tract::DecodeOptions opts;
    opts.unknown_fields = Tract::UnknownFields::reject;

    auto m = Tract::decode_value(team_schema(), object_of(R"({"name":"Minnesota","coach":"Fleck"})"), opts);
    REQUIRE_FALSE(m);
    REQUIRE(m.error().errc == Tract::Error::code::unknown_field);
    REQUIRE(m.error().field == "coach");

    auto nested = Tract::decode_value(owner_schema(), object_of(R"({"team":{"name":"Iowa","founded":1847}})"), opts);
    REQUIRE_FALSE(nested);
    REQUIRE(nested.error().field == "team.founded");
}

TEST_CASE("Decoding Reports Missing Required Fields") {
    auto m = Tract::decode_value(team_schema(), object_of(R"({"mascot":"Bucky"})"));
    REQUIRE_FALSE(m);
    REQUIRE(m.error().errc == Tract::Error::code::required_field_missing);
    REQUIRE(m.error().field == "name");

    auto nested = Tract::decode_value(owner_schema(), object_of(R"({"team":{"colors":[]}})"));
    REQUIRE_FALSE(nested);
    REQUIRE(nested.error().errc == Tract::Error::code::required_field_missing);
    REQUIRE(nested.error().field == "team.name");

    auto missing_team = Tract::decode_value(owner_schema(), object_of(R"({"rivals":[]})"));
    REQUIRE_FALSE(missing_team);
    REQUIRE(missing_team.error().field == "team");

    // null satisfies a required field
    REQUIRE(Tract::decode_value(team_schema(), object_of(R"({"name":null})")));
}

TEST_CASE("Decoding Repeated Fields") {
    SECTION("Null list") {
        auto m = Tract::decode_value(team_schema(), object_of(R"({"name":"x","colors":null})"));
        REQUIRE_FALSE(m);
        REQUIRE(m.error().errc == Tract::Error::code::type_mismatch);
        REQUIRE(m.error().field == "colors");
    }
    SECTION("Null element") {
        auto m = Tract::decode_value(team_schema(), object_of(R"({"name":"x","colors":["red",null]})"));
        REQUIRE_FALSE(m);
        REQUIRE(m.error().errc == Tract::Error::code::type_mismatch);
        REQUIRE(m.error().field == "colors[1]");
    }
    SECTION("Scalar instead of a list") {
        auto m = Tract::decode_value(team_schema(), object_of(R"({"name":"x","colors":"red"})"));
        REQUIRE_FALSE(m);
        REQUIRE(m.error().errc == Tract::Error::code::type_mismatch);
    }
    SECTION("Wrong element type") {
        auto m = Tract::decode_value(team_schema(), object_of(R"({"name":"x","colors":["red",7]})"));
        REQUIRE_FALSE(m);
        REQUIRE(m.error().field == "colors[1]");
    }
    SECTION("Nested element") {
        auto m = Tract::decode_value(owner_schema(), object_of(R"({"team":{"name":"a"},"rivals":[{"name":"b"},{}]})"));
        REQUIRE_FALSE(m);
        REQUIRE(m.error().errc == Tract::Error::code::required_field_missing);
        REQUIRE(m.error().field == "rivals[1].name");
    }
}

TEST_CASE("Untyped Lists Keep Null Elements") {
    Tract::SchemaBuilder b{ "Bag" };
    b.field("items", Tract::UntypedKind{}, { .repeated = true });
    auto bag = b.build();

    auto m = Tract::decode_value(bag, object_of(R"({"items":[1,null,"x"]})"));
    REQUIRE(m);
    REQUIRE(m->get_repeated("items").size() == 3);
    REQUIRE(Tract::dump(Tract::encode_value(*m)) == R"({"items":[1,null,"x"]})");
}

TEST_CASE("Decoding Needs an Object") {
    auto m = Tract::decode_value(team_schema(), Tract::value{ 42 });
    REQUIRE_FALSE(m);
    REQUIRE(m.error().errc == Tract::Error::code::type_mismatch);
    REQUIRE(m.error().field.empty());

    auto nested = Tract::decode_value(owner_schema(), object_of(R"({"team":"Minnesota"})"));
    REQUIRE_FALSE(nested);
    REQUIRE(nested.error().errc == Tract::Error::code::type_mismatch);
    REQUIRE(nested.error().field == "team");
}

TEST_CASE("Untyped Fields Hold Mixed Values") {
    Tract::SchemaBuilder b{ "Box" };
    b.field("height", Tract::UntypedKind{})
     .field("width", Tract::UntypedKind{});
    auto box = b.build();

    Tract::Message m{ box };
    REQUIRE(m.set("height", 123));
    REQUIRE(m.set("width", "65%"));
    REQUIRE(Tract::dump(Tract::encode_value(m)) == R"({"height":123,"width":"65%"})");

    auto decoded = Tract::decode_value(box, Tract::encode_value(m));
    REQUIRE(decoded);
    REQUIRE(*decoded == m);
}

TEST_CASE("Untyped Null Is the Null Slot") {
    Tract::SchemaBuilder b{ "Box" };
    b.field("height", Tract::UntypedKind{}, { .default_value = Tract::value{ 10 } })
     .field("sizes", Tract::UntypedKind{}, { .repeated = true });
    auto box = b.build();

    Tract::Message m{ box };
    REQUIRE(m.set("height", Tract::value{}));
    REQUIRE(std::holds_alternative<Tract::Null>(m.slot("height")));
    REQUIRE(m.get("height") == Tract::Element{ Tract::value{ 10 } });

    // null elements of a repeated untyped field stay elements
    REQUIRE(m.set("sizes", Tract::make_list(1, Tract::value{})));
    REQUIRE(m.get_repeated("sizes").size() == 2);

    REQUIRE(Tract::dump(Tract::encode_value(m)) == R"({"height":null,"sizes":[1,null]})");
    auto decoded = Tract::decode_value(box, Tract::encode_value(m));
    REQUIRE(decoded);
    REQUIRE(*decoded == m);
}

TEST_CASE("Mapping Round Trip") {
    Tract::Message team{ team_schema() };
    REQUIRE(team.set("name", "Minnesota"));
    REQUIRE(team.set("colors", Tract::make_list("maroon", "gold")));
    REQUIRE(team.set_null("mascot"));

    Tract::Message owner{ owner_schema() };
    REQUIRE(owner.set("team", team));
    REQUIRE(owner.set("rivals", Tract::make_list(team)));

    auto decoded = Tract::decode_value(owner_schema(), Tract::encode_value(owner));
    REQUIRE(decoded);
    REQUIRE(*decoded == owner);
}

TEST_CASE("Nested Messages Respect the Depth Limit") {
    Tract::SchemaBuilder b{ "Chain" };
    b.field("next", Tract::MessageKind{ b.handle() });
    auto chain = b.build();

    auto nested = [](std::size_t levels) {
        Tract::value root;
        Tract::value* cur = &root;
        for (std::size_t i = 0; i < levels; i++) cur = &(*cur)["next"];
        (void)cur->as_object();
        return root;
    };

    Tract::DecodeOptions opts;
    opts.parse.max_depth = 8;

    REQUIRE(Tract::decode_value(chain, nested(7), opts));

    auto deep = Tract::decode_value(chain, nested(8), opts);
    REQUIRE_FALSE(deep);
    REQUIRE(deep.error().errc == Tract::Error::code::malformed_input);
    REQUIRE(deep.error().field == "next.next.next.next.next.next.next.next");

    // the default limit applies without options
    REQUIRE_FALSE(Tract::decode_value(chain, nested(600)));
}
