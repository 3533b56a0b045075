#pragma once


/*
    ----------------------------------------------------------------
    Tract JSON text layer
    ----------------------------------------------------------------
    Converts between JSON text and `Tract::value`, and between JSON text
    and message instances.

    - Text <-> value:
        * `ParseResult parse(std::string_view, const ParseOptions& = {})`
        * `ParseResult parse(std::istream&, const ParseOptions& = {})`
        * `std::string dump(const value&, const WriteOptions& = {})`
        * `void dump(const value&, std::ostream&, const WriteOptions& = {})`
    - Text <-> message (composition of the text layer with the
      generic-mapping codec in `codec.hpp`):
        * `std::string encode_message(const Message&, const WriteOptions& = {})`
        * `DecodeResult decode_message(const SchemaPtr&, std::string_view, const DecodeOptions& = {})`

    ------
    Numbers
    ------
    - A number token without fraction or exponent parses as an integer,
      falling back to a double when it does not fit `std::int64_t`
    - Doubles are written in shortest round-trip form and always carry a
      fraction or exponent (`10.0`, `1e+300`), so a float field stays a
      float across a round trip
    - NaN and infinities are written as `null`

    -----
    Usage
    -----
        auto team = Tract::decode_message(team_schema, R"({"name":"Minnesota"})");
        if (!team) {
            std::cerr << team.error().field << ": " << team.error().msg << '\n';
            return 1;
        }
        std::cout << Tract::encode_message(*team, {.pretty = true});
*/

/// @defgroup TractJson JSON Text Layer
/// @ingroup Tract
/// @brief Free functions for reading and writing JSON text

#include <expected>
#include <string>
#include <string_view>
#include <iosfwd>

#include "tract/value.hpp"
#include "tract/error.hpp"
#include "tract/options.hpp"
#include "tract/codec.hpp"

namespace Tract {

    /// @ingroup TractJson
    /// @brief Result of parsing JSON text into a generic value
    using ParseResult = std::expected<value, ParseError>;

    /// @ingroup TractJson
    /// @brief Parses a JSON document from a string view
    ///
    /// @details
    /// Attempts to parse the UTF-8 JSON text provided in @p input according
    /// to RFC 8259 as modified by @p opts. Duplicate object keys keep the
    /// last occurrence, at the position of the first.
    ///
    /// @param input UTF-8 encoded JSON text to parse
    /// @param opts Parsing configuration options (comments, trailing commas, etc.)
    /// @return A `ParseResult` containing either a value or a parse error
    [[nodiscard]] TRACT_API ParseResult parse(std::string_view input, const ParseOptions& opts = {});

    /// @ingroup TractJson
    /// @brief Parses a JSON document from an input stream
    ///
    /// @details
    /// Reads the entire contents of @p is and parses it. A stream that goes
    /// bad while reading yields `ParseError::code::io_error`.
    [[nodiscard]] TRACT_API ParseResult parse(std::istream& is, const ParseOptions& opts = {});

    /// @ingroup TractJson
    /// @brief Serializes a value to a JSON string
    ///
    /// @param v The value to serialize
    /// @param opts Formatting options (pretty printing, key sorting)
    /// @return A UTF-8 JSON string representation of @p v.
    [[nodiscard]] TRACT_API std::string dump(const value& v, const WriteOptions& opts = {});

    /// @ingroup TractJson
    /// @brief Serializes a value and writes it to an output stream
    TRACT_API void dump(const value& v, std::ostream& os, const WriteOptions& opts = {});

    /// @ingroup TractJson
    /// @brief Encodes a message as JSON text
    ///
    /// @details
    /// Equivalent to `dump(encode_value(msg), opts)`. Unset fields are
    /// omitted, null fields are written as `null`. Never fails.
    [[nodiscard]] TRACT_API std::string encode_message(const Message& msg, const WriteOptions& opts = {});

    /// @ingroup TractJson
    /// @brief Encodes a message as JSON text onto an output stream
    TRACT_API void encode_message(const Message& msg, std::ostream& os, const WriteOptions& opts = {});

    /// @ingroup TractJson
    /// @brief Decodes JSON text into a message of the given schema
    ///
    /// @details
    /// Text that is not valid JSON, or whose top level is not an object,
    /// fails with `Error::code::malformed_input` and the parser error in
    /// `Error::parse`. With `DecodeOptions::allow_empty_input`, text that is
    /// empty or only whitespace decodes as `{}`. Everything else is
    /// `decode_value(schema, parse(text), opts)`.
    [[nodiscard]] TRACT_API DecodeResult decode_message(const SchemaPtr& schema, std::string_view text, const DecodeOptions& opts = {});

    /// @ingroup TractJson
    /// @brief Decodes a message from the whole contents of an input stream
    [[nodiscard]] TRACT_API DecodeResult decode_message(const SchemaPtr& schema, std::istream& is, const DecodeOptions& opts = {});

} // namespace Tract
