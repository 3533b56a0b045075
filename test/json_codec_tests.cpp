#include <catch2/catch_all.hpp>

#include <sstream>

#include "tract/tract.hpp"

using namespace Catch;

namespace {

    Tract::SchemaPtr team_schema() {
        static const Tract::SchemaPtr schema = [] {
            Tract::SchemaBuilder b{ "Team" };
            b.field("name", Tract::StringKind{})
             .field("colors", Tract::StringKind{}, { .repeated = true })
             .field("mascot", Tract::StringKind{}, { .required = true });
            return b.build();
        }();
        return schema;
    }

    Tract::SchemaPtr scores_schema() {
        static const Tract::SchemaPtr schema = [] {
            auto result = Tract::make_enum("Result", { { "win", 1 }, { "loss", 2 }, { "tie", 3 } });
            Tract::SchemaBuilder b{ "Scores" };
            b.field("results", Tract::EnumKind{ result }, { .repeated = true })
             .field("ratio", Tract::FloatKind{})
             .field("played", Tract::IntegerKind{})
             .field("active", Tract::BooleanKind{})
             .field("extra", Tract::MappingKind{});
            return b.build();
        }();
        return schema;
    }
}


TEST_CASE("Team Encodes to Compact JSON") {
    Tract::Message team{ team_schema() };
    REQUIRE(team.set("name", "Minnesota"));
    REQUIRE(team.set("colors", Tract::make_list("maroon", "gold")));
    REQUIRE(team.set("mascot", "Goldy Gopher"));

    const std::string json = Tract::encode_message(team);
    REQUIRE(json == R"({"name":"Minnesota","colors":["maroon","gold"],"mascot":"Goldy Gopher"})");

    auto decoded = Tract::decode_message(team_schema(), json);
    REQUIRE(decoded);
    REQUIRE(*decoded == team);
}

TEST_CASE("Team Without Mascot Fails to Decode") {
    auto r = Tract::decode_message(team_schema(), R"({"name":"Wisconsin","colors":["cardinal","white"]})");
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Tract::Error::code::required_field_missing);
    REQUIRE(r.error().field == "mascot");
    REQUIRE_FALSE(r.error().parse);
}

TEST_CASE("Null Survives the JSON Round Trip") {
    auto r = Tract::decode_message(team_schema(), R"({"mascot":null})");
    REQUIRE(r);
    REQUIRE(std::holds_alternative<Tract::Null>(r->slot("mascot")));
    REQUIRE(Tract::encode_message(*r) == R"({"mascot":null})");
}

TEST_CASE("Scalar Kinds Round Trip Through JSON") {
    auto r = Tract::decode_message(scores_schema(),
        R"({"results":["win","loss",3],"ratio":2,"played":40,"active":true,"extra":{"coach":"Fleck"}})");
    REQUIRE(r);
    REQUIRE(std::get<Tract::EnumValue>(r->get_repeated("results")[2]).name == "tie");
    REQUIRE(r->get_as<double>("ratio") == Approx(2.0));
    REQUIRE(r->get_as<std::int64_t>("played") == 40);

    REQUIRE(Tract::encode_message(*r) ==
        R"({"results":["win","loss","tie"],"ratio":2.0,"played":40,"active":true,"extra":{"coach":"Fleck"}})");
}

TEST_CASE("Malformed JSON Keeps the Parser Error") {
    auto r = Tract::decode_message(team_schema(), R"({"mascot": "Bucky",})");
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Tract::Error::code::malformed_input);
    REQUIRE(r.error().field.empty());
    REQUIRE(r.error().parse);
    REQUIRE(r.error().parse->line == 1);

    auto empty = Tract::decode_message(team_schema(), "");
    REQUIRE_FALSE(empty);
    REQUIRE(empty.error().errc == Tract::Error::code::malformed_input);
}

TEST_CASE("Top-Level JSON Must Be an Object") {
    for (auto text : { "[]", "42", "\"team\"", "null" }) {
        INFO(text);
        auto r = Tract::decode_message(team_schema(), text);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == Tract::Error::code::malformed_input);
        REQUIRE_FALSE(r.error().parse);
    }
}

TEST_CASE("Empty Input Can Mean an Empty Object") {
    Tract::DecodeOptions opts;
    opts.allow_empty_input = true;

    auto r = Tract::decode_message(scores_schema(), "  \n", opts);
    REQUIRE(r);
    REQUIRE(Tract::encode_message(*r) == "{}");

    // required fields still apply
    auto team = Tract::decode_message(team_schema(), "", opts);
    REQUIRE_FALSE(team);
    REQUIRE(team.error().errc == Tract::Error::code::required_field_missing);
}

TEST_CASE("Parser Options Reach the Decoder") {
    Tract::DecodeOptions opts;
    opts.parse.allow_comments = true;
    opts.parse.allow_trailing_commas = true;

    auto r = Tract::decode_message(team_schema(), "{ // team\n \"mascot\": \"Bucky\", }", opts);
    REQUIRE(r);
    REQUIRE(r->get_as<std::string>("mascot") == "Bucky");
}

TEST_CASE("JSON Stream Overloads") {
    Tract::Message team{ team_schema() };
    REQUIRE(team.set("mascot", "Herky"));

    std::ostringstream os;
    Tract::encode_message(team, os);
    REQUIRE(os.str() == R"({"mascot":"Herky"})");

    std::istringstream is{ os.str() };
    auto decoded = Tract::decode_message(team_schema(), is);
    REQUIRE(decoded);
    REQUIRE(*decoded == team);
}

TEST_CASE("Pretty and Sorted Output") {
    Tract::Message team{ team_schema() };
    REQUIRE(team.set("name", "Iowa"));
    REQUIRE(team.set("mascot", "Herky"));

    Tract::WriteOptions opts;
    opts.pretty = true;
    opts.sort_keys = true;
    REQUIRE(Tract::encode_message(team, opts) == "{\n  \"mascot\": \"Herky\",\n  \"name\": \"Iowa\"\n}");
}

TEST_CASE("Deeply Nested Input Fails Cleanly") {
    Tract::SchemaBuilder b{ "Box" };
    b.field("height", Tract::UntypedKind{});
    auto box = b.build();

    const std::size_t depth = 100000;
    const std::string json = "{\"height\":" + std::string(depth, '[') + std::string(depth, ']') + "}";

    auto r = Tract::decode_message(box, json);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Tract::Error::code::malformed_input);
    REQUIRE(r.error().parse);
    REQUIRE(r.error().parse->errc == Tract::ParseError::code::depth_limit_exceeded);

    // within the default limit
    REQUIRE(Tract::decode_message(box, "{\"height\":" + std::string(100, '[') + std::string(100, ']') + "}"));
}

TEST_CASE("Bytes, Times and UUIDs Through JSON") {
    Tract::SchemaBuilder b{ "Upload" };
    b.field("id", Tract::UuidKind{}, { .required = true })
     .field("payload", Tract::BytesKind{})
     .field("created", Tract::DateTimeKind{})
     .field("seen", Tract::DateTimeMsKind{}, { .repeated = true });
    auto upload = b.build();

    const std::string json =
        R"({"id":"06335e84-2872-4914-8c5d-3ed07d2a2f16","payload":"YW5vdGhlciBieXRlcw==",)"
        R"("created":"2000-01-01T01:00:59.999999","seen":[1349019110262,1264067520000]})";

    auto decoded = Tract::decode_message(upload, json);
    REQUIRE(decoded);
    REQUIRE(decoded->get_repeated("seen").size() == 2);
    REQUIRE(Tract::encode_message(*decoded) == json);

    auto bad = Tract::decode_message(upload, R"({"id":"06335e84-2872-4914-8c5d-3ed07d2a2f16","seen":[1,"soon"]})");
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().errc == Tract::Error::code::type_mismatch);
    REQUIRE(bad.error().field == "seen[1]");
}
