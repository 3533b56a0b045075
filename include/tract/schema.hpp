#pragma once


/*
    ------------------------------------------------
    Tract::Schema - Immutable message type definition
    ------------------------------------------------
    A schema is the ordered list of field descriptors of one message type.
    It is produced once by a `SchemaBuilder` and shared, read-only, by every
    message of that type.

    ------------
    Construction
    ------------
    Declaration is two-phase so that a schema can refer to itself, or to a
    schema declared after it:

        Tract::SchemaBuilder node{ "Node" };
        node.field("label", Tract::StringKind{})
            .field("children", Tract::MessageKind{ node.handle() }, { .repeated = true });
        Tract::SchemaPtr node_schema = node.build();

    `handle()` is available before any field is attached. Every schema a
    builder creates is kept in a process-wide pool, so schema references
    never dangle: holding one `SchemaPtr` of a recursive group is enough,
    and references between schemas never form an ownership cycle. Schemas
    are therefore never released, which suits declarations made once at
    startup.

    -------------
    Thread-Safety
    -------------
    - A built `Schema` is never mutated and may be shared freely
    - `SchemaBuilder` is not thread-safe, separate builders may run on
      separate threads
*/

/// @defgroup TractSchema Message Schemas
/// @ingroup Tract

#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tract/config.hpp"
#include "tract/error.hpp"
#include "tract/field.hpp"

namespace Tract {

    /// @ingroup TractSchema
    /// @brief Ordered, immutable collection of field descriptors
    class Schema {
    public:
        using const_iterator = std::vector<FieldDescriptor>::const_iterator;

        [[nodiscard]] const std::string& name() const noexcept { return m_Name; }

        /// @brief True once the owning builder has built this schema
        [[nodiscard]] bool defined() const noexcept { return m_Defined; }

        [[nodiscard]] std::span<const FieldDescriptor> fields() const noexcept { return m_Fields; }
        [[nodiscard]] const_iterator begin() const noexcept { return m_Fields.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return m_Fields.end(); }
        [[nodiscard]] std::size_t size() const noexcept { return m_Fields.size(); }

        /// @brief Looks a field up by name
        /// @return The descriptor, or nullptr if the schema declares no such field
        [[nodiscard]] TRACT_API const FieldDescriptor* find(std::string_view name) const noexcept;

        /// @throws std::out_of_range if the schema declares no such field
        [[nodiscard]] TRACT_API const FieldDescriptor& at(std::string_view name) const;

        [[nodiscard]] TRACT_API std::optional<std::size_t> index_of(std::string_view name) const noexcept;

        /// @ingroup TractSchema
        /// @brief Checks that every required field of @p msg is set
        ///
        /// @details
        /// Fields are checked in declaration order and the first unset
        /// required field is reported as `required_field_missing`. Set nested
        /// messages are checked as well, with dotted paths
        /// (`owner.address`, `members[2].name`). @p msg must be an instance
        /// of this schema.
        [[nodiscard]] TRACT_API std::expected<void, Error> validate_complete(const Message& msg) const;

    private:
        /// @brief Only `SchemaBuilder` can name this
        struct Token {
            explicit Token() = default;
        };

    public:
        Schema(Token, std::string name) : m_Name{ std::move(name) } {}

    private:
        friend class SchemaBuilder;

        std::expected<void, Error> validate_complete(const Message& msg, const std::string& prefix) const;

        std::string m_Name;
        std::vector<FieldDescriptor> m_Fields;
        std::map<std::string, std::size_t, std::less<>> m_Index;
        bool m_Defined = false;
    };


    /// @ingroup TractSchema
    /// @brief Declares the fields of a schema, then seals it
    ///
    /// @details
    /// Declaration mistakes throw `SchemaError`:
    /// - empty or duplicate field names
    /// - a field both `required` and `repeated`
    /// - a default on a repeated or message field
    /// - a default the field's kind does not accept
    /// - calling `field` or `build` after `build`
    class SchemaBuilder {
    public:
        TRACT_API explicit SchemaBuilder(std::string name);

        SchemaBuilder(const SchemaBuilder&) = delete;
        SchemaBuilder& operator=(const SchemaBuilder&) = delete;

        /// @brief Reference to the schema under construction
        [[nodiscard]] TRACT_API SchemaRef handle() const;

        /// @brief Appends a field in declaration order
        TRACT_API SchemaBuilder& field(std::string name, FieldKind kind, FieldOptions opts = {});

        /// @brief Seals the schema
        /// @return The schema, from now on immutable
        [[nodiscard]] TRACT_API SchemaPtr build();

    private:
        std::shared_ptr<Schema> m_Schema;
        bool m_Built = false;
    };

} // namespace Tract
