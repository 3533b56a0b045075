#pragma once


/*
    -----------------------------------------------------
    Tract error reporting
    -----------------------------------------------------
    Three kinds of failure are reported by Tract:

    - `ParseError`: the JSON text itself is not valid JSON. Produced by
      `Tract::parse(...)` with a byte offset, a line and a column.
    - `Error`: a value could not be turned into (or assigned to) a message.
      Produced by field assignment, the generic-mapping codec and the JSON
      codec. Carries a category code and the path of the offending field.
    - `SchemaError`: a schema or enum declaration is invalid, or a message
      was created from a schema that was never defined. These are
      programming mistakes and are thrown rather than returned.

    Naming an undeclared field on a message is also a programming mistake
    and throws `std::out_of_range`.

    ------------
    Field paths
    ------------
    `Error::field` names the offending field relative to the message that
    was being decoded:
        - `name`           top level field
        - `colors[1]`      element of a repeated field
        - `owner.address`  field of a nested message
    The path is empty when the failure concerns the whole input (for
    example a top level that is not an object).
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "tract/config.hpp"


/// @defgroup TractError Errors
/// @ingroup Tract
/// @brief Error codes and structures produced by parsing, validation and decoding
namespace Tract {

    /// @ingroup TractError
    /// @brief Structured error information produced during JSON parsing.
    ///
    /// @details
    /// A `ParseError` is returned whenever `Tract::parse(...)` fails to
    /// interpret the input as valid JSON. Each error contains:
    ///
    /// - **errc** - a classification of the error (syntax/format issue)
    /// - **offset** - byte offset from the start of input where the error occurred
    /// - **line** - 1-based line number of the error position
    /// - **column** - 1-based column number (UTF-8 byte offset within the line)
    /// - **msg** - human-readable explanation of the error
    struct ParseError {
        /// @ingroup TractError
        /// @brief Enumeration of possible error categories detected by the parser.
        ///
        /// Members:
        /// - `unexpected_character`
        ///     Encountered a character that is not valid in the current parsing state.
        /// - `invalid_number`
        ///     Number format does not match JSON grammar (`012`, `1e+`, `1.`).
        /// - `invalid_string`
        ///     Unescaped control characters, invalid UTF-8 or a missing closing quote.
        /// - `invalid_escape`
        ///     Invalid escape sequence inside a string (e.g. `\k`).
        /// - `invalid_unicode_escape`
        ///     Malformed `\uXXXX` sequence or unpaired surrogate.
        /// - `unexpected_end_of_input`
        ///     Input ended before a complete JSON value could be parsed.
        /// - `trailing_characters`
        ///     Non-whitespace characters follow a complete JSON value.
        /// - `depth_limit_exceeded`
        ///     Nesting went past `ParseOptions::max_depth`.
        /// - `io_error`
        ///     Reading from a stream failed.
        enum class code : uint8_t {
            unexpected_character,   ///< Invalid or unexpected character.
            invalid_number,         ///< Malformed numeric literal.
            invalid_string,         ///< Malformed string literal.
            invalid_escape,         ///< Invalid escape sequence.
            invalid_unicode_escape, ///< Invalid or malformed Unicode escape.
            unexpected_end_of_input,///< Input ended prematurely.
            trailing_characters,    ///< Extra characters after valid JSON.
            depth_limit_exceeded,   ///< Maximum depth limit exceeded.
            io_error,               ///< Stream read failure.
        };

        code errc{};          ///< The classification of the parsing error.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup TractError
        /// @brief Constructs a fully-populated `ParseError` instance.
        TRACT_API static ParseError make(code c, size_t o, size_t l, size_t col, std::string_view m);
    };


    /// @ingroup TractError
    /// @brief Failure to assign, validate or decode a message value.
    ///
    /// @details
    /// Returned (never thrown) by `Message::set`, `Schema::validate_complete`,
    /// `decode_value` and `decode_message`. A failed decode never yields a
    /// partially populated message.
    struct Error {
        /// @ingroup TractError
        /// @brief Error categories
        enum class code : uint8_t {
            type_mismatch,          ///< Value has the wrong shape for the field's kind.
            invalid_enum_value,     ///< Name or number is not a member of the enum.
            required_field_missing, ///< A required field was never set.
            malformed_input,        ///< Text is not parseable JSON, or its top level is not an object.
            unknown_field,          ///< Key has no matching field (strict decoding only).
        };

        code errc{};                       ///< Error category.
        std::string field{};               ///< Path of the offending field, empty for whole-input errors.
        std::string msg{};                 ///< Human-readable diagnostic message.
        std::optional<ParseError> parse{}; ///< Underlying parser error for `malformed_input`.

        TRACT_API static Error make(code c, std::string_view field, std::string_view m);
    };

    /// @ingroup TractError
    /// @brief Returns the identifier of an error code (e.g. `"type_mismatch"`)
    [[nodiscard]] TRACT_API std::string_view to_string(Error::code c) noexcept;

    /// @ingroup TractError
    /// @brief Returns a short human-readable title (e.g. `"Type mismatch"`)
    [[nodiscard]] TRACT_API std::string_view title(Error::code c) noexcept;


    /// @ingroup TractError
    /// @brief Invalid schema or enum declaration, or use of an undefined schema
    class SchemaError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

} // namespace Tract
