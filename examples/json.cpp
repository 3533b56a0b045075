#include <iostream>

#include "tract/tract.hpp"

int main() {
    auto division = Tract::make_enum("Division", {
        { "east", 1 },
        { "west", 2 },
    });

    Tract::SchemaBuilder b{ "Team" };
    b.field("name", Tract::StringKind{}, { .required = true })
     .field("colors", Tract::StringKind{}, { .repeated = true })
     .field("mascot", Tract::StringKind{})
     .field("division", Tract::EnumKind{ division }, { .default_value = Tract::value{ "east" } });
    Tract::SchemaPtr team_schema = b.build();

    Tract::Message team{ team_schema };
    team.set("name", "Minnesota").value();
    team.set("colors", Tract::make_list("maroon", "gold")).value();
    team.set("mascot", "Goldy Gopher").value();

    std::cout << Tract::encode_message(team) << "\n";
    std::cout << Tract::encode_message(team, {.pretty = true, .indent = 4}) << "\n";
    std::cout << team << "\n";

    // a PATCH body: clear the mascot, leave everything else alone
    auto patch = Tract::decode_message(team_schema, R"({"name":"Minnesota","mascot":null})");
    if (!patch) {
        std::cerr << "Decode error! -> " << patch.error().msg << "\n";
        return 1;
    }
    std::cout << "mascot set: " << std::boolalpha << patch->is_set("mascot")
              << ", colors set: " << patch->is_set("colors") << "\n";

    auto bad = Tract::decode_message(team_schema, R"({"colors":["red", 7]})");
    if (!bad) {
        std::cout << Tract::encode_message(Tract::make_error_message(bad.error())) << "\n";
    }

    return 0;
}
