#pragma once


/*
    ------------------------------------------------
    Tract built-in message types
    ------------------------------------------------
    - `VoidMessage`: no fields, for endpoints with an empty body
    - `ErrorMessage`: `title`, `message` and `explanation` strings, the body
      a service sends back when a request cannot be decoded

    Both schemas are built on first use and shared afterwards.
*/

#include "tract/config.hpp"
#include "tract/error.hpp"
#include "tract/message.hpp"

/// @defgroup TractMessageTypes Built-in Message Types
/// @ingroup Tract

namespace Tract {

    /// @ingroup TractMessageTypes
    [[nodiscard]] TRACT_API const SchemaPtr& void_message_schema();

    /// @ingroup TractMessageTypes
    [[nodiscard]] TRACT_API const SchemaPtr& error_message_schema();

    /// @ingroup TractMessageTypes
    /// @brief Describes a failed decode as an `ErrorMessage`
    ///
    /// @details
    /// `title` is `title(err.errc)`, `message` is `err.msg`, and
    /// `explanation` names the offending field when `err.field` is not empty.
    [[nodiscard]] TRACT_API Message make_error_message(const Error& err);

} // namespace Tract
