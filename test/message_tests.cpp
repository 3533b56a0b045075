#include <catch2/catch_all.hpp>

#include <sstream>

#include "tract/tract.hpp"

using namespace Catch;

namespace {

    Tract::SchemaPtr team_schema() {
        static const Tract::SchemaPtr schema = [] {
            Tract::SchemaBuilder b{ "Team" };
            b.field("name", Tract::StringKind{}, { .required = true })
             .field("colors", Tract::StringKind{}, { .repeated = true })
             .field("mascot", Tract::StringKind{}, { .default_value = Tract::value{ "none" } })
             .field("wins", Tract::IntegerKind{});
            return b.build();
        }();
        return schema;
    }

    Tract::SchemaPtr league_schema() {
        static const Tract::SchemaPtr schema = [] {
            Tract::SchemaBuilder b{ "League" };
            b.field("champion", Tract::MessageKind{ team_schema() })
             .field("teams", Tract::MessageKind{ team_schema() }, { .repeated = true });
            return b.build();
        }();
        return schema;
    }
}


TEST_CASE("Fields Start Unset") {
    Tract::Message m{ team_schema() };

    for (const auto& fd : *team_schema()) {
        REQUIRE_FALSE(m.is_set(fd.name));
        REQUIRE(std::holds_alternative<Tract::Unset>(m.slot(fd.name)));
    }
    REQUIRE_FALSE(m.get("wins"));
    REQUIRE(m.get_repeated("colors").empty());
}

TEST_CASE("Three Presence States") {
    Tract::Message m{ team_schema() };

    REQUIRE(m.set("mascot", "Goldy Gopher"));
    REQUIRE(m.is_set("mascot"));
    REQUIRE(m.get_as<std::string>("mascot") == "Goldy Gopher");

    REQUIRE(m.set_null("mascot"));
    REQUIRE(m.is_set("mascot"));
    REQUIRE(std::holds_alternative<Tract::Null>(m.slot("mascot")));

    m.clear("mascot");
    REQUIRE_FALSE(m.is_set("mascot"));

    REQUIRE(m.set("wins", nullptr));
    REQUIRE(std::holds_alternative<Tract::Null>(m.slot("wins")));
}

TEST_CASE("Reads Fall Back to the Default") {
    Tract::Message m{ team_schema() };

    REQUIRE(m.get_as<std::string>("mascot") == "none");
    REQUIRE_FALSE(m.is_set("mascot"));

    REQUIRE(m.set_null("mascot"));
    REQUIRE(m.get_as<std::string>("mascot") == "none");
    REQUIRE(std::holds_alternative<Tract::Null>(m.slot("mascot")));
}

TEST_CASE("Failed Assignment Leaves the Slot Alone") {
    Tract::Message m{ team_schema() };
    REQUIRE(m.set("wins", 12));

    auto r = m.set("wins", "twelve");
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Tract::Error::code::type_mismatch);
    REQUIRE(r.error().field == "wins");
    REQUIRE(m.get_as<std::int64_t>("wins") == 12);

    REQUIRE(m.set("colors", Tract::make_list("maroon")));
    auto bad_item = m.set("colors", Tract::make_list("maroon", 7));
    REQUIRE_FALSE(bad_item);
    REQUIRE(bad_item.error().field == "colors[1]");
    REQUIRE(m.get_repeated("colors").size() == 1);
}

TEST_CASE("Repeated and Single Fields Do Not Mix") {
    Tract::Message m{ team_schema() };

    auto list_on_single = m.set("name", Tract::make_list("a", "b"));
    REQUIRE_FALSE(list_on_single);
    REQUIRE(list_on_single.error().errc == Tract::Error::code::type_mismatch);

    auto single_on_list = m.set("colors", "maroon");
    REQUIRE_FALSE(single_on_list);
    REQUIRE(single_on_list.error().errc == Tract::Error::code::type_mismatch);

    auto null_on_list = m.set_null("colors");
    REQUIRE_FALSE(null_on_list);
    REQUIRE(null_on_list.error().errc == Tract::Error::code::type_mismatch);
    REQUIRE_FALSE(m.is_set("colors"));

    REQUIRE(m.set("colors", Tract::Elements{}));
    REQUIRE(m.is_set("colors"));
    REQUIRE(m.get_repeated("colors").empty());
}

TEST_CASE("Unknown Field Names Throw") {
    Tract::Message m{ team_schema() };

    REQUIRE_THROWS_AS(m.is_set("coach"), std::out_of_range);
    REQUIRE_THROWS_AS(m.set("coach", "Fleck"), std::out_of_range);
    REQUIRE_THROWS_AS(m.get("coach"), std::out_of_range);
    REQUIRE_THROWS_AS(m.clear("coach"), std::out_of_range);
}

TEST_CASE("Message Equality") {
    Tract::Message a{ team_schema() };
    Tract::Message b{ team_schema() };
    REQUIRE(a == b);

    REQUIRE(a.set("name", "Minnesota"));
    REQUIRE_FALSE(a == b);
    REQUIRE(b.set("name", "Minnesota"));
    REQUIRE(a == b);

    // null and unset differ even though both read as the default
    REQUIRE(a.set_null("mascot"));
    REQUIRE_FALSE(a == b);

    Tract::SchemaBuilder other{ "Team" };
    other.field("name", Tract::StringKind{});
    Tract::Message c{ other.build() };
    REQUIRE(c.set("name", "Minnesota"));
    REQUIRE_FALSE(b == c);
}

TEST_CASE("Nested Messages Are Deep Copied") {
    Tract::Message team{ team_schema() };
    REQUIRE(team.set("name", "Minnesota"));

    Tract::Message league{ league_schema() };
    REQUIRE(league.set("champion", team));
    REQUIRE(league.set("teams", Tract::make_list(team, team)));

    REQUIRE(team.set("name", "Wisconsin"));
    REQUIRE(league.get_as<Tract::Message>("champion")->get_as<std::string>("name") == "Minnesota");

    Tract::Message copy = league;
    REQUIRE(copy == league);
    REQUIRE(copy.set("champion", team));
    REQUIRE_FALSE(copy == league);
}

TEST_CASE("Nested Fields Check the Schema") {
    Tract::Message league{ league_schema() };

    auto wrong_schema = league.set("champion", Tract::Message{ league_schema() });
    REQUIRE_FALSE(wrong_schema);
    REQUIRE(wrong_schema.error().errc == Tract::Error::code::type_mismatch);

    auto not_a_message = league.set("champion", "Minnesota");
    REQUIRE_FALSE(not_a_message);
    REQUIRE(not_a_message.error().errc == Tract::Error::code::type_mismatch);
}

TEST_CASE("Debug Output Lists Set Fields") {
    Tract::Message m{ team_schema() };
    REQUIRE(m.set("name", "Minnesota"));
    REQUIRE(m.set("colors", Tract::make_list("maroon", "gold")));
    REQUIRE(m.set_null("mascot"));

    std::ostringstream os;
    os << m;
    REQUIRE(os.str() == "<Team\n name: \"Minnesota\"\n colors: [\"maroon\",\"gold\"]\n mascot: null>");

    std::ostringstream empty;
    empty << Tract::Message{ team_schema() };
    REQUIRE(empty.str() == "<Team>");
}
