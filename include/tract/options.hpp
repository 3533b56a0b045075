#pragma once


/*
    ----------------------------------
    Tract parsing, writing and decoding options
    ----------------------------------
    Plain aggregates configuring the three layers:

    - `ParseOptions`  : JSON text -> `value`
    - `WriteOptions`  : `value` / message -> JSON text
    - `DecodeOptions` : `value` / JSON text -> message

    All are suitable for designated initialization:
        * `Tract::parse(text, { .allow_comments = true })`
        * `Tract::encode_message(msg, { .pretty = true })`
        * `Tract::decode_message(schema, text, { .unknown_fields = UnknownFields::reject })`
*/


#include <cstddef>
#include <cstdint>

/// @defgroup TractOptions Options
/// @ingroup Tract
/// @brief Configuration objects controlling parsing, serialization and decoding

namespace Tract {

    /// @ingroup TractOptions
    /// @brief Configuration controlling JSON parsing behavior
    ///
    /// @details
    /// `allow_comments`
    ///   - When `true`, the parser accepts both line comments (`// ...`) and
    ///     block comments (`/* ... */`)
    /// `allow_trailing_commas`
    ///   - When `true` the parser accepts `[1,2,]` or `{"a":1,}`
    /// `max_depth`
    ///   - Maximum allowed nesting depth of arrays/objects. `0` means unlimited,
    ///     which lets hostile input exhaust the stack. The message decoder
    ///     applies the same bound to nested messages.
    struct ParseOptions {
        bool allow_comments = false; ///< Accept `//` and `/* */` comments if true
        bool allow_trailing_commas = false; ///< Permit trailing commas in arrays/objects if true
        size_t max_depth = 512; ///< Maximum allowed nesting depth (0 = unlimited)
    };

    /// @ingroup TractOptions
    /// @brief Configuration options controlling JSON serialization (dumping).
    ///
    /// @details
    /// `sort_keys` writes object members in lexicographic key order instead
    /// of insertion order. Messages encode in field declaration order unless
    /// it is set.
    struct WriteOptions {
        bool pretty = false;        ///< Enable pretty-printing (formatted output).
        std::size_t indent = 2;     ///< Number of spaces per indentation level.
        bool sort_keys = false;     ///< Sort object keys before writing if true.
    };

    /// @ingroup TractOptions
    /// @brief Handling of mapping keys that name no declared field
    enum class UnknownFields : uint8_t {
        ignore, ///< Skip them silently
        reject, ///< Fail with `Error::code::unknown_field`
    };

    /// @ingroup TractOptions
    /// @brief Configuration controlling message decoding
    struct DecodeOptions {
        ParseOptions parse{};                           ///< Used by the JSON codec only.
        UnknownFields unknown_fields = UnknownFields::ignore;
        bool allow_empty_input = false;                 ///< Blank JSON text decodes to an empty message.
    };

} // namespace Tract
