#pragma once


/*
    ------------------------------------------------
    Tract::Message - Schema-typed value holder
    ------------------------------------------------
    A message holds one slot per field of its schema. Every slot is in one
    of three states:

        Unset       never written, or cleared
        Null        explicitly set to null
        value       an `Element`, or `Elements` for repeated fields

    `is_set` is true for the last two. Reading an unset or null field gives
    the field's default and leaves the slot alone.

    -----
    Usage
    -----
        Tract::Message team{ team_schema };
        team.set("name", "Minnesota");
        team.set("colors", Tract::make_list("maroon", "gold"));
        team.set_null("mascot");

        team.is_set("mascot");           // true
        team.get_as<std::string>("name"); // "Minnesota"

    `set` validates the value against the field's kind and leaves the slot
    untouched when it fails. Naming a field the schema does not declare
    throws `std::out_of_range`.

    -------------
    Thread-Safety
    -------------
    - `Message` is an ordinary value; concurrent mutation of one instance
      must be externally synchronized
*/

/// @defgroup TractMessage Messages
/// @ingroup Tract

#include <concepts>
#include <cstddef>
#include <expected>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "tract/config.hpp"
#include "tract/error.hpp"
#include "tract/field.hpp"
#include "tract/schema.hpp"

namespace Tract {

    namespace detail { struct Codec; }

    /// @ingroup TractMessage
    /// @brief Slot state of a field that was never written
    struct Unset {
        friend bool operator==(Unset, Unset) noexcept { return true; }
    };

    /// @ingroup TractMessage
    /// @brief Slot state of a field explicitly set to null
    struct Null {
        friend bool operator==(Null, Null) noexcept { return true; }
    };

    /// @ingroup TractMessage
    /// @brief Three-state field slot
    using Slot = std::variant<Unset, Null, Element, Elements>;

    using SetResult = std::expected<void, Error>;

    /// @ingroup TractMessage
    /// @brief Mutable instance of a message schema
    class Message {
    public:
        /// @brief Creates a message with every field unset
        /// @throws SchemaError if @p schema is null or not built
        TRACT_API explicit Message(SchemaPtr schema);

        [[nodiscard]] const SchemaPtr& schema() const noexcept { return m_Schema; }

        /// @brief Presence flag, true for null and value slots
        [[nodiscard]] TRACT_API bool is_set(std::string_view field) const;

        [[nodiscard]] TRACT_API const Slot& slot(std::string_view field) const;

        /// @brief Value of a single field
        /// @return The value, else the default, else `std::nullopt`
        [[nodiscard]] TRACT_API std::optional<Element> get(std::string_view field) const;

        /// @brief Elements of a repeated field, empty when unset
        [[nodiscard]] TRACT_API Elements get_repeated(std::string_view field) const;

        /// @brief Typed read of a single field
        ///
        /// @details
        /// `T` is one of the `Element` alternatives, or `Message` for
        /// nested fields. Returns `std::nullopt` when `get` has nothing.
        /// @throws std::bad_variant_access if the field holds another type
        template<class T>
        [[nodiscard]] std::optional<T> get_as(std::string_view field) const {
            auto e = get(field);
            if (!e) return std::nullopt;
            if constexpr (std::same_as<T, Message>) return std::get<Nested>(*e).get();
            else return std::get<T>(std::move(*e));
        }

        /// @brief Assigns a single value
        ///
        /// @details
        /// @p v is anything `make_element` accepts: strings, integers,
        /// floating point numbers, `bool`, `EnumValue`, `value`, `Message`
        /// or a ready `Element`.
        template<class T>
            requires (!std::same_as<std::remove_cvref_t<T>, Elements>
                   && !std::same_as<std::remove_cvref_t<T>, std::nullptr_t>)
        SetResult set(std::string_view field, T&& v) {
            return assign(field, make_element(std::forward<T>(v)));
        }

        /// @brief Assigns the elements of a repeated field
        TRACT_API SetResult set(std::string_view field, Elements items);

        /// @brief Same as `set_null`
        SetResult set(std::string_view field, std::nullptr_t) { return set_null(field); }

        /// @brief Marks a single field as explicitly null
        /// @return `type_mismatch` for repeated fields
        TRACT_API SetResult set_null(std::string_view field);

        /// @brief Returns the field to the unset state
        TRACT_API void clear(std::string_view field);

        /// @brief Same schema identity and identical slots
        TRACT_API friend bool operator==(const Message& lhs, const Message& rhs);

        /// @brief Debug representation, e.g. `<Team\n name: "Minnesota">`
        TRACT_API friend std::ostream& operator<<(std::ostream& os, const Message& msg);

    private:
        friend struct detail::Codec;

        const FieldDescriptor& descriptor(std::string_view field) const;
        SetResult assign(std::string_view field, Element e);

        SchemaPtr m_Schema;
        std::vector<Slot> m_Slots;
    };

} // namespace Tract
