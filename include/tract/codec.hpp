#pragma once


/*
    ------------------------------------------------
    Tract generic-mapping codec
    ------------------------------------------------
    Converts messages to and from `Tract::value` objects.

    Encoding visits fields in declaration order:
        - unset fields are left out
        - null fields become `null`
        - values go through their kind's encode rule, repeated fields
          always become arrays

    Decoding visits the mapping's keys in input order, coerces each value
    through its field's kind and finally checks required fields. Keys with
    no matching field are skipped unless `DecodeOptions::unknown_fields` is
    `UnknownFields::reject`. The first failure is returned, with the path
    of the offending field.
*/

/// @defgroup TractCodec Mapping Codec
/// @ingroup Tract

#include <expected>
#include <string_view>

#include "tract/config.hpp"
#include "tract/error.hpp"
#include "tract/message.hpp"
#include "tract/options.hpp"
#include "tract/value.hpp"

namespace Tract {

    /// @ingroup TractCodec
    /// @brief Result of decoding a message
    using DecodeResult = std::expected<Message, Error>;

    /// @ingroup TractCodec
    /// @brief Encodes a message as an insertion-ordered object
    [[nodiscard]] TRACT_API value encode_value(const Message& msg);

    /// @ingroup TractCodec
    /// @brief Decodes an object into a message of @p schema
    ///
    /// @details
    /// A @p mapping that is not an object is a `type_mismatch` with an
    /// empty path. Messages nested deeper than `opts.parse.max_depth` fail
    /// with `malformed_input` at the path where the limit was passed.
    [[nodiscard]] TRACT_API DecodeResult decode_value(const SchemaPtr& schema, const value& mapping, const DecodeOptions& opts = {});

    namespace detail {
        struct Codec {
            static value encode_object(const Message& msg);
            static DecodeResult decode_object(const SchemaPtr& schema, const value& mapping, const DecodeOptions& opts, std::string_view path);
        };
    } // namespace detail

} // namespace Tract
