#pragma once


/*
    --------------------------------------
    Sieve::value - Generic JSON tree node
    --------------------------------------
    `Sieve::value` is the dynamically-typed input every decoder narrows:
        - null
        - boolean
        - number (as double)
        - string
        - array
        - object (insertion ordered, unique keys)

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware; strings, arrays and objects nested in a
      `value` allocate from the `std::pmr::memory_resource` it was built with
    - Copies adopt the source's resource and deep-copy the tree
    - Moves steal resource and storage

    -------
    Objects
    -------
    - `object` is a vector of `member { key, val }` kept in insertion order
    - Keys are unique: `operator[](key)` on an existing key returns the
      existing member, so re-assigning a key overwrites in place
    - Lookup is linear; objects fed to decoders are usually small records

    -------------
    Thread-Safety
    -------------
    - Concurrent reads of the same `value` are safe; decoders only read
    - Mutation must be externally synchronized
*/

/// @defgroup Sieve Sieve decoding library
/// @brief Typed decoders and encoders over a generic JSON tree

/// @defgroup SieveValue Generic Value
/// @ingroup Sieve

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <utility>
#include "sieve/config.hpp"

namespace Sieve {
    /// @brief Enumerates the possible JSON value kinds held by Sieve::value
    enum class kind : uint8_t {
        null,    ///< JSON null value
        boolean, ///< JSON boolean value (`true` or `false`)
        number,  ///< JSON number value (stored as `double`)
        string,  ///< JSON string value
        array,   ///< JSON array value
        object,  ///< JSON object value
    };

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    /// @ingroup SieveValue
    /// @brief String type used by Sieve::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    struct member;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup SieveValue
    /// @brief Array type used by Sieve::value (JSON arrays)
    using array = pmr_vector<value>;

    /// @ingroup SieveValue
    /// @brief Object type used by Sieve::value (JSON objects, insertion ordered)
    using object = pmr_vector<member>;

    /// @ingroup SieveValue
    /// @brief Variant storage used internally by Sieve::value
    using storage_t = std::variant<
        std::monostate,
        bool,
        double,
        string,
        array,
        object
    >;

    /// @ingroup SieveValue
    /// @brief Dynamic JSON tree node
    ///
    /// @details
    /// Decoders take a `const value&` and never mutate it. The mutating
    /// accessors exist for building trees by hand and for the parser.
    struct value {
        SIEVE_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        SIEVE_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        SIEVE_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        SIEVE_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a number from an integral type (stored as double)
        template<std::integral I>
        explicit value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<double>(i) } {}

        SIEVE_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        SIEVE_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        SIEVE_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        SIEVE_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        SIEVE_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Deep copy; the new value adopts @p other's memory resource
        SIEVE_API value(const value& other);
        SIEVE_API value(value&& other) noexcept;
        SIEVE_API value& operator=(const value& other);
        SIEVE_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        SIEVE_API [[nodiscard]] kind type() const noexcept;

        [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_number() const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string() const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object() const noexcept { return type() == kind::object;  }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        /// @pre `is_bool()`; throws `std::bad_variant_access` otherwise
        SIEVE_API [[nodiscard]] bool&         as_bool();
        SIEVE_API [[nodiscard]] const bool&   as_bool() const;
        /// @pre `is_number()`
        SIEVE_API [[nodiscard]] double&       as_number();
        SIEVE_API [[nodiscard]] const double& as_number() const;
        /// @pre `is_string()`
        SIEVE_API [[nodiscard]] string&       as_string();
        SIEVE_API [[nodiscard]] const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        /// @brief Returns the array, replacing any other content with `[]` first
        SIEVE_API [[nodiscard]] array&        as_array();
        /// @pre `is_array()`
        SIEVE_API [[nodiscard]] const array&  as_array() const;
        /// @brief Returns the object, replacing any other content with `{}` first
        SIEVE_API [[nodiscard]] object&       as_object();
        /// @pre `is_object()`
        SIEVE_API [[nodiscard]] const object& as_object() const;

        /// @brief Number of elements (array) or members (object); 0 otherwise
        SIEVE_API [[nodiscard]] size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @brief Accesses or creates an array element, growing with nulls
        SIEVE_API value& operator[](size_t idx);

        /// @brief Accesses an array element; returns a null sentinel when
        ///        this is not an array or @p idx is out of range
        SIEVE_API const value& operator[](size_t idx) const;

        /// @brief Accesses or appends an object member (inserted as `null`)
        SIEVE_API value& operator[](std::string_view key);

        /// @brief Finds a member by key
        /// @return Pointer to the member's value, or nullptr when this is
        ///         not an object or the key is absent
        SIEVE_API [[nodiscard]] const value* find(std::string_view key) const;

        /// @throws std::out_of_range If the key does not exist or the value is not an object
        SIEVE_API [[nodiscard]] const value& at(std::string_view key) const;

        /// @brief Structural equality; memory resources are not compared
        SIEVE_API friend bool operator==(const value& lhs, const value& rhs);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

    /// @ingroup SieveValue
    /// @brief One key/value entry of an object
    struct member {
        string key;
        value val;

        friend bool operator==(const member& lhs, const member& rhs) {
            return lhs.key == rhs.key && lhs.val == rhs.val;
        }
    };

} // namespace Sieve
