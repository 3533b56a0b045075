#pragma once


/*
    ------------------------------------------------
    Tract::value - Generic JSON value / ordered mapping
    ------------------------------------------------
    The `Tract::value` type represents any JSON value:
        - null
        - boolean
        - integer (as std::int64_t)
        - number (as double)
        - string
        - array
        - object (insertion-ordered)
    It is the intermediate form between message instances and JSON text:
    the generic-mapping codec produces and consumes `value` objects, and
    the JSON text layer parses into and writes from them

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (strings, arrays, objects)
    - Each `value` instance stores a pointer to its `memory_resource`:
        * All nested containers and strings owned by that `value` are allocated
          from this resource
    - Copy construction/assignment:
        * The destination `value` adopts the allocator of the source and performs
          a deep copy of the underlying JSON tree into that allocator
    - Move construction/assignment:
        * The destination `value` steals the allocator and storage of the source

    -------
    Numbers
    -------
    - Integral JSON numbers (no fraction, no exponent) are held as
      `std::int64_t`, everything else as `double`
    - `is_number()` is true for both; `is_integer()` and `is_float()`
      distinguish them
    - `number_value()` reads either representation as a double

    -------
    Objects
    -------
    - An `object` is a vector of key/value members kept in insertion order,
      so encoding a message keeps its declaration order
    - Keys are unique: `operator[]` on an existing key returns the existing
      member, and the parser keeps the last duplicate
    - Lookup is linear, which is the right trade for message-sized objects

    ---------------------
    Equality
    ---------------------
    - Two values compare equal if they hold the same JSON value:
        * integer and float compare by numeric value (`1 == 1.0`)
        * arrays compare element-wise in order
        * objects compare as unordered key/value sets, since JSON object
          member order carries no meaning

    -------------
    Thread-Safety
    -------------
    - `value` is not inherently thread-safe
    - It is safe to use separate `value` instances from multiple threads
    - Concurrent access to the same `value` instance must be externally synchronized
*/

/// @defgroup Tract Tract Message Library
/// @brief Core types and functions for Tract

/// @defgroup TractValue Generic Value
/// @ingroup Tract

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <utility>
#include "tract/config.hpp"

namespace Tract {
    /// @brief Enumerates the possible JSON value kinds held by Tract::value
    enum class kind : uint8_t {
        null, ///< JSON null value
        boolean, ///< JSON boolean value (`true` or `false`)
        integer, ///< JSON integral number (stored as `std::int64_t`)
        number, ///< JSON non-integral number (stored as `double`)
        string, ///< JSON string value
        array, ///< JSON array value
        object, ///< JSON object value
    };


    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    /// @ingroup TractValue
    /// @brief String type used by Tract::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup TractValue
    /// @brief Array type used by Tract::value (JSON arrays)
    using array = pmr_vector<value>;

    /// @ingroup TractValue
    /// @brief One key/value entry of an object
    using member = std::pair<string, value>;

    /// @ingroup TractValue
    /// @brief Object type used by Tract::value (insertion-ordered JSON objects)
    using object = pmr_vector<member>;

    /// @ingroup TractValue
    /// @brief Variant storage used internally by Tract::value
    /// @details Exposed only for completeness; most users interact via
    ///          Tract::value member functions instead of using this alias
    using storage_t = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        string,
        array,
        object
    >;


    /// @ingroup TractValue
    /// @brief Dynamic JSON value.
    ///
    /// @details
    /// `Tract::value` can hold any JSON value. All nested allocations
    /// (strings, arrays, objects) are performed using a
    /// `std::pmr::memory_resource` associated with each `value` instance.
    /// Container-like operations (e.g. `as_array`, `as_object`, `operator[]`)
    /// use this allocator
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @ingroup TractValue
        /// @brief Constructs a null JSON value using the given memory resource
        /// @param res Pointer to the memory resource used for all internal
        ///            allocations in this value. If omitted, the global
        ///            default resource is used
        TRACT_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup TractValue
        /// @brief Constructs a null JSON value using the given memory resource
        TRACT_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup TractValue
        /// @brief Constructs a boolean JSON value
        TRACT_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup TractValue
        /// @brief Constructs a non-integral numeric JSON value from a double
        TRACT_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup TractValue
        /// @brief Constructs an integral JSON value from an integral type
        ///
        /// @tparam I Integral type (e.g. int, long, int64_t)
        /// @param i Integer value to store as `std::int64_t`
        /// @param res Memory resource used for nested allocations (if any)
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<std::int64_t>(i) } {}

        /// @ingroup TractValue
        /// @brief Constructs a string JSON value from a C string
        TRACT_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup TractValue
        /// @brief Constructs a string JSON value from a string_view
        TRACT_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup TractValue
        /// @brief Constructs a string JSON value from an existing Tract::string
        TRACT_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup TractValue
        /// @brief Constructs an array JSON value from an existing array
        TRACT_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup TractValue
        /// @brief Constructs an object JSON value from an existing object
        ///
        /// @details
        /// The members are taken as-is; callers passing duplicate keys get
        /// duplicate members. Use `operator[]` to build objects key by key.
        TRACT_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup TractValue
        /// @brief Copy-constructs a JSON value (deep copy, adopts @p other's allocator)
        TRACT_API value(const value& other);

        /// @ingroup TractValue
        /// @brief Move-constructs a JSON value
        TRACT_API value(value&& other) noexcept;

        TRACT_API value& operator=(const value& other);
        TRACT_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @ingroup TractValue
        /// @brief Returns the kind of JSON value currently stored.
        [[nodiscard]] TRACT_API kind type() const noexcept;

        [[nodiscard]] bool is_null()    const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()    const noexcept { return type() == kind::boolean; }

        /// @ingroup TractValue
        /// @brief Checks whether the value holds a number of either representation
        [[nodiscard]] bool is_number()  const noexcept { return is_integer() || is_float(); }
        [[nodiscard]] bool is_integer() const noexcept { return type() == kind::integer; }
        [[nodiscard]] bool is_float()   const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string()  const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()   const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object()  const noexcept { return type() == kind::object;  }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        /// @ingroup TractValue
        /// @brief Returns a reference to the stored boolean value
        /// @throws std::bad_variant_access if `is_bool()` is false
        [[nodiscard]] TRACT_API bool&       as_bool();
        [[nodiscard]] TRACT_API const bool& as_bool() const;

        /// @ingroup TractValue
        /// @brief Returns a reference to the stored integer
        /// @throws std::bad_variant_access if `is_integer()` is false
        [[nodiscard]] TRACT_API std::int64_t&       as_integer();
        [[nodiscard]] TRACT_API const std::int64_t& as_integer() const;

        /// @ingroup TractValue
        /// @brief Returns a reference to the stored double
        /// @throws std::bad_variant_access if `is_float()` is false
        [[nodiscard]] TRACT_API double&       as_number();
        [[nodiscard]] TRACT_API const double& as_number() const;

        /// @ingroup TractValue
        /// @brief Reads either numeric representation as a double
        /// @pre `is_number()` must be true; returns 0.0 otherwise
        [[nodiscard]] TRACT_API double number_value() const noexcept;

        /// @ingroup TractValue
        /// @brief Returns a reference to the stored string value
        /// @throws std::bad_variant_access if `is_string()` is false
        [[nodiscard]] TRACT_API string&       as_string();
        [[nodiscard]] TRACT_API const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        /// @ingroup TractValue
        /// @brief Returns a reference to the stored array value
        /// @details
        /// If `is_array()` is true, returns the existing array.
        /// Otherwise, the current contents are discarded and replaced with
        /// an empty array allocated from `resource()`, and that array is returned
        [[nodiscard]] TRACT_API array&       as_array();
        [[nodiscard]] TRACT_API const array& as_array() const;

        /// @ingroup TractValue
        /// @brief Returns a reference to the stored object value
        /// @details
        /// If `is_object()` is true, returns the existing object.
        /// Otherwise, the current contents are discarded and replaced with
        /// an empty object allocated from `resource()`, and that object is returned
        [[nodiscard]] TRACT_API object&       as_object();
        [[nodiscard]] TRACT_API const object& as_object() const;

        /// @ingroup TractValue
        /// @brief Returns the number of array elements or object members, 0 otherwise
        [[nodiscard]] TRACT_API size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @ingroup TractValue
        /// @brief Accesses or creates an array element by index, growing array as needed
        /// @details
        /// If the current value is **not** an array, it is implicitly converted
        /// into an empty array (`[]`) before access.
        /// If @p idx is greater than or equal to the current array size,
        /// the array is resized to `idx + 1` with `null` elements.
        TRACT_API value& operator[](size_t idx);

        /// @ingroup TractValue
        /// @brief Accesses an array element by index (const overload)
        /// @details Returns a shared null value when not an array or out of range
        TRACT_API const value& operator[](size_t idx) const;

        /// @ingroup TractValue
        /// @brief Accesses or creates an object member by key
        ///
        /// @details
        /// If the value is not an object, it is converted to an empty object.
        /// If @p key does not exist, a new member is appended with a `null` value.
        /// Returns a reference to the value associated with @p key
        TRACT_API value& operator[](std::string_view key);

        /// @ingroup TractValue
        /// @brief Finds a member with the given key in the object
        /// @return Pointer to the value mapped to @p key, or nullptr when the
        ///         key is missing or this is not an object
        TRACT_API const value* find(std::string_view key) const;

        /// @ingroup TractValue
        /// @brief Returns a const reference to the value associated with @p key
        /// @throws std::out_of_range If the key does not exist or the value is not an object
        TRACT_API const value& at(std::string_view key) const;

        /// @ingroup TractValue
        /// @brief JSON equality, see the header notes
        TRACT_API friend bool operator==(const value& lhs, const value& rhs);

        /// @ingroup TractValue
        /// @brief Returns the memory resource associated with this value
        [[nodiscard]] TRACT_API std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        /// @ingroup TractValue
        /// @brief Returns a const reference to the underlying variant storage
        [[nodiscard]] TRACT_API const storage_t& storage() const noexcept { return m_Storage; }

        /// @ingroup TractValue
        /// @brief Returns a mutable reference to the underlying variant storage
        ///
        /// @details
        /// Bypasses the invariants kept by the rest of the API (unique object
        /// keys in particular). **Use with extreme caution.**
        [[nodiscard]] TRACT_API storage_t& storage() noexcept { return m_Storage; }


    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace Tract
