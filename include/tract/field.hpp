#pragma once


/*
    ------------------------------------------------
    Tract field descriptors and the kind registry
    ------------------------------------------------
    A field descriptor is the immutable metadata of one named slot of a
    message type: its kind, whether it is repeated or required, and its
    default.

    -----
    Kinds
    -----
    `FieldKind` is a closed `std::variant`, one arm per kind:

        StringKind      std::string
        IntegerKind     std::int64_t
        FloatKind       finite double (integers widen)
        BooleanKind     bool
        EnumKind        EnumValue, one symbol of an EnumType
        MessageKind     Nested, a Message of the referenced schema
        UntypedKind     value, passed through unchecked
        MappingKind     value holding an object
        BytesKind       Bytes, base64 text in JSON
        DateTimeKind    Timestamp, ISO 8601 text in JSON
        DateTimeMsKind  Timestamp, integer milliseconds since the epoch in JSON
        UuidKind        Uuid, 8-4-4-4-12 hex text in JSON

    Every arm provides the same three operations:
        - `coerce(Element, path)`   validate a native value, return its canonical form
        - `decode(value, opts, path)` turn a generic value into the canonical form
        - `encode(Element)`        project the canonical form back into a value

    and the free functions `coerce`, `decode`, `encode` and `kind_name`
    dispatch over the variant with `std::visit`.

    --------
    Elements
    --------
    `Element` holds one canonical value of any kind. Repeated fields hold
    `Elements`. `make_element` and `make_list` build them from ordinary C++
    values, so `msg.set("colors", make_list("maroon", "gold"))` works
    without spelling out variant types.
*/

/// @defgroup TractField Field Descriptors
/// @ingroup Tract
/// @brief Field kinds, enum types and field descriptors

#include <array>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "tract/config.hpp"
#include "tract/error.hpp"
#include "tract/options.hpp"
#include "tract/value.hpp"

namespace Tract {

    class Message;
    class Schema;

    /// @ingroup TractField
    /// @brief Shared handle to a built, immutable schema
    using SchemaPtr = std::shared_ptr<const Schema>;

    // ------------------------------------------------------------
    // Enumerations
    // ------------------------------------------------------------

    /// @ingroup TractField
    /// @brief One declared member of an enum type
    struct EnumSymbol {
        std::string name;
        std::int64_t number{};
    };

    /// @ingroup TractField
    /// @brief Canonical value of an enumeration field
    struct EnumValue {
        std::string name;
        std::int64_t number{};

        friend bool operator==(const EnumValue&, const EnumValue&) = default;
    };

    /// @ingroup TractField
    /// @brief Named, closed set of symbols
    ///
    /// @details
    /// Created through `make_enum`, which checks that there is at least one
    /// symbol and that names and numbers are unique.
    class EnumType {
    public:
        EnumType(std::string name, std::vector<EnumSymbol> symbols);

        [[nodiscard]] const std::string& name() const noexcept { return m_Name; }
        [[nodiscard]] const std::vector<EnumSymbol>& symbols() const noexcept { return m_Symbols; }

        [[nodiscard]] TRACT_API const EnumSymbol* find(std::string_view name) const noexcept;
        [[nodiscard]] TRACT_API const EnumSymbol* find(std::int64_t number) const noexcept;

        /// @brief Returns the value for symbol @p name
        /// @throws std::out_of_range if there is no such symbol
        [[nodiscard]] TRACT_API EnumValue at(std::string_view name) const;

    private:
        std::string m_Name;
        std::vector<EnumSymbol> m_Symbols;
    };

    using EnumTypePtr = std::shared_ptr<const EnumType>;

    /// @ingroup TractField
    /// @brief Declares an enum type
    /// @throws SchemaError on an empty symbol list or duplicate names/numbers
    [[nodiscard]] TRACT_API EnumTypePtr make_enum(std::string name, std::vector<EnumSymbol> symbols);


    // ------------------------------------------------------------
    // Schema references
    // ------------------------------------------------------------

    /// @ingroup TractField
    /// @brief Reference from a message field to its schema
    ///
    /// @details
    /// Made from a `SchemaPtr` or from `SchemaBuilder::handle()`, in which
    /// case it becomes usable once that builder has built. References are
    /// weak; the schema pool keeps their targets alive.
    class SchemaRef {
    public:
        SchemaRef() = default;
        SchemaRef(const SchemaPtr& schema) : m_Schema{ schema } {}

        /// @brief Returns the referenced schema
        /// @throws SchemaError if the reference is empty or the schema is not built yet
        [[nodiscard]] TRACT_API SchemaPtr lock() const;

        /// @brief Identity of the referenced schema, for comparisons
        [[nodiscard]] const Schema* get() const noexcept { return m_Schema.lock().get(); }

    private:
        std::weak_ptr<const Schema> m_Schema;
    };


    // ------------------------------------------------------------
    // Bytes, timestamps and identifiers
    // ------------------------------------------------------------

    /// @ingroup TractField
    /// @brief Canonical value of a bytes field
    using Bytes = std::vector<std::uint8_t>;

    /// @ingroup TractField
    /// @brief Canonical value of the date-time kinds
    ///
    /// @details
    /// A UTC instant with microsecond precision. Date-time fields hold
    /// instants from year 1 through year 9999.
    using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

    /// @ingroup TractField
    /// @brief 128-bit universally unique identifier
    struct Uuid {
        std::array<std::uint8_t, 16> bytes{};

        /// @brief Parses 32 hex digits
        ///
        /// @details
        /// Digits are case-insensitive and hyphens may appear anywhere. The
        /// text may be wrapped in braces or prefixed with `urn:uuid:`.
        /// @return The identifier, or `std::nullopt` if @p text is not one
        [[nodiscard]] static TRACT_API std::optional<Uuid> parse(std::string_view text) noexcept;

        /// @brief Lowercase 8-4-4-4-12 form
        [[nodiscard]] TRACT_API std::string to_string() const;

        friend bool operator==(const Uuid&, const Uuid&) = default;
    };


    // ------------------------------------------------------------
    // Elements
    // ------------------------------------------------------------

    /// @ingroup TractField
    /// @brief Owning, deep-copying box around a nested message
    class Nested {
    public:
        TRACT_API explicit Nested(Message msg);
        TRACT_API Nested(const Nested& other);
        TRACT_API Nested(Nested&& other) noexcept;
        TRACT_API Nested& operator=(const Nested& other);
        TRACT_API Nested& operator=(Nested&& other) noexcept;
        TRACT_API ~Nested();

        [[nodiscard]] const Message& get() const noexcept { return *m_Msg; }
        [[nodiscard]] Message& get() noexcept { return *m_Msg; }
        [[nodiscard]] const Message& operator*() const noexcept { return *m_Msg; }
        [[nodiscard]] const Message* operator->() const noexcept { return m_Msg.get(); }

        TRACT_API friend bool operator==(const Nested& lhs, const Nested& rhs);

    private:
        std::unique_ptr<Message> m_Msg;
    };

    /// @ingroup TractField
    /// @brief One canonical field value
    using Element = std::variant<
        std::string,
        std::int64_t,
        double,
        bool,
        EnumValue,
        value,
        Nested,
        Bytes,
        Timestamp,
        Uuid
    >;

    /// @ingroup TractField
    /// @brief Canonical value of a repeated field
    using Elements = std::vector<Element>;

    using ElementResult = std::expected<Element, Error>;

    inline Element make_element(Element e) { return e; }
    inline Element make_element(const char* s) { return std::string{ s }; }
    inline Element make_element(std::string_view s) { return std::string{ s }; }
    inline Element make_element(std::string s) { return s; }
    inline Element make_element(bool b) { return b; }
    inline Element make_element(EnumValue e) { return e; }
    inline Element make_element(value v) { return v; }
    inline Element make_element(Bytes b) { return b; }
    inline Element make_element(Uuid u) { return u; }
    TRACT_API Element make_element(Message msg);

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    Element make_element(I i) { return static_cast<std::int64_t>(i); }

    template<std::floating_point F>
    Element make_element(F f) { return static_cast<double>(f); }

    /// @brief Any system-clock time point, truncated to microseconds
    template<class Duration>
    Element make_element(std::chrono::sys_time<Duration> t) {
        return std::chrono::floor<std::chrono::microseconds>(t);
    }

    /// @ingroup TractField
    /// @brief Builds the value of a repeated field from ordinary C++ values
    ///
    /// @code
    /// team.set("colors", Tract::make_list("maroon", "gold"));
    /// @endcode
    template<class... Ts>
    Elements make_list(Ts&&... items) {
        Elements out;
        out.reserve(sizeof...(Ts));
        (out.push_back(make_element(std::forward<Ts>(items))), ...);
        return out;
    }


    // ------------------------------------------------------------
    // Kinds
    // ------------------------------------------------------------

    struct StringKind {
        static constexpr std::string_view name = "string";
        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    struct IntegerKind {
        static constexpr std::string_view name = "integer";
        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    struct FloatKind {
        static constexpr std::string_view name = "float";
        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    struct BooleanKind {
        static constexpr std::string_view name = "boolean";
        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    /// @ingroup TractField
    /// @brief Enumeration field, accepts symbol names or numbers
    struct EnumKind {
        static constexpr std::string_view name = "enum";
        EnumTypePtr type;

        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    /// @ingroup TractField
    /// @brief Nested message field
    ///
    /// @details
    /// Coercion compares schema identity: a message built from a different
    /// schema is a type mismatch even when its fields look the same.
    struct MessageKind {
        static constexpr std::string_view name = "message";
        SchemaRef schema;

        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    /// @ingroup TractField
    /// @brief Any JSON value, scalars set natively are wrapped
    struct UntypedKind {
        static constexpr std::string_view name = "untyped";
        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    /// @ingroup TractField
    /// @brief JSON object with no per-key schema
    struct MappingKind {
        static constexpr std::string_view name = "mapping";
        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    /// @ingroup TractField
    /// @brief Binary data, written as standard padded base64
    struct BytesKind {
        static constexpr std::string_view name = "bytes";
        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    /// @ingroup TractField
    /// @brief Date-time written as ISO 8601 text
    ///
    /// @details
    /// Decoding accepts `YYYY-MM-DD`, optionally followed by `T` (or a
    /// space), `hh:mm[:ss[.ffffff]]` and a `Z` or `+hh:mm` offset. Offsets
    /// are folded into the UTC instant. Encoding writes
    /// `YYYY-MM-DDThh:mm:ss` in UTC with no offset, plus six fraction digits
    /// when the instant has a sub-second part.
    struct DateTimeKind {
        static constexpr std::string_view name = "datetime";
        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    /// @ingroup TractField
    /// @brief Date-time written as integer milliseconds since the Unix epoch
    ///
    /// @details
    /// Coercion truncates to whole milliseconds, so a stored value always
    /// survives the codec unchanged.
    struct DateTimeMsKind {
        static constexpr std::string_view name = "datetime_ms";
        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    struct UuidKind {
        static constexpr std::string_view name = "uuid";
        TRACT_API ElementResult coerce(Element e, std::string_view path) const;
        TRACT_API ElementResult decode(const value& v, const DecodeOptions& opts, std::string_view path) const;
        TRACT_API value encode(const Element& e) const;
    };

    /// @ingroup TractField
    /// @brief The closed set of field kinds
    using FieldKind = std::variant<
        StringKind,
        IntegerKind,
        FloatKind,
        BooleanKind,
        EnumKind,
        MessageKind,
        UntypedKind,
        MappingKind,
        BytesKind,
        DateTimeKind,
        DateTimeMsKind,
        UuidKind
    >;

    [[nodiscard]] TRACT_API std::string_view kind_name(const FieldKind& kind) noexcept;
    [[nodiscard]] TRACT_API ElementResult coerce(const FieldKind& kind, Element e, std::string_view path);
    [[nodiscard]] TRACT_API ElementResult decode(const FieldKind& kind, const value& v, const DecodeOptions& opts, std::string_view path);
    [[nodiscard]] TRACT_API value encode(const FieldKind& kind, const Element& e);


    // ------------------------------------------------------------
    // Descriptors
    // ------------------------------------------------------------

    /// @ingroup TractField
    /// @brief Per-field declaration options
    ///
    /// @details
    /// `default_value` is given as a generic value and is checked against
    /// the field's kind when the schema is built.
    struct FieldOptions {
        bool repeated = false;
        bool required = false;
        std::optional<value> default_value{};
    };

    /// @ingroup TractField
    /// @brief Immutable metadata for one field of a schema
    struct FieldDescriptor {
        std::string name;
        FieldKind kind;
        bool repeated = false;
        bool required = false;
        std::optional<Element> default_value{}; ///< Canonical default, if any
        std::size_t index = 0;                  ///< Position in declaration order
    };

} // namespace Tract
