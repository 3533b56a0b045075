#pragma once


/*
    ----------------------------------------------------------------
    Tract - Schema-driven message contracts for C++ (schemas + codecs)
    ----------------------------------------------------------------

    This is the main public header for Tract

    It brings together:
        - The generic JSON value:       `Tract::value`
        - Error reporting types:        `Tract::ParseError`, `Tract::Error`,
                                        `Tract::SchemaError`
        - Options:                      `Tract::ParseOptions`,
                                        `Tract::WriteOptions`,
                                        `Tract::DecodeOptions`
        - Field kinds and descriptors:  `Tract::FieldKind`, `Tract::FieldOptions`
        - Schemas:                      `Tract::SchemaBuilder`, `Tract::Schema`
        - Messages:                     `Tract::Message`
        - Codecs:                       `Tract::encode_value` / `decode_value`,
                                        `Tract::encode_message` / `decode_message`
        - Built-in message types:       `VoidMessage`, `ErrorMessage`

    -------------------
    High-Level Overview
    -------------------
    - A schema is declared once and shared by every message of its type
    - Every message field is unset, null, or set to a value. Unset fields
      are left out when encoding, null fields are written as `null`, so a
      decoded body tells "clear this field" apart from "leave it alone"
    - Decoding validates every value against its field's kind and checks
      required fields; failures come back as `std::expected` errors with
      the path of the offending field

    -----
    Usage
    -----
        #include <tract/tract.hpp>

        int main() {
            Tract::SchemaBuilder b{ "Team" };
            b.field("name", Tract::StringKind{})
             .field("colors", Tract::StringKind{}, { .repeated = true })
             .field("mascot", Tract::StringKind{}, { .required = true });
            Tract::SchemaPtr team = b.build();

            auto res = Tract::decode_message(team, R"({"name":"Wisconsin"})");
            if (!res) {
                std::cerr << res.error().field << ": " << res.error().msg << '\n';
                return 1;
            }
            std::cout << Tract::encode_message(*res, {.pretty = true});
        }

    Include this header if you want the full Tract API. For finer-grained
    control you can include individual headers such as `value.hpp`,
    `schema.hpp` or `message.hpp` directly
*/

#include "tract/config.hpp"
#include "tract/value.hpp"
#include "tract/error.hpp"
#include "tract/options.hpp"
#include "tract/field.hpp"
#include "tract/schema.hpp"
#include "tract/message.hpp"
#include "tract/codec.hpp"
#include "tract/json.hpp"
#include "tract/message_types.hpp"
