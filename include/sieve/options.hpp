#pragma once


/*
    ---------------------------------
    Sieve parsing and writing options
    ---------------------------------
    Plain aggregates, suitable for designated initializers:

        auto r = Sieve::parse(text, { .max_depth = 64 });
        auto s = Sieve::dump(v, { .pretty = true, .indent = 4 });
*/


#include <cstddef>

#include "sieve/config.hpp"

/// @defgroup SieveOptions Parsing and Writing Options
/// @ingroup Sieve
/// @brief Configuration objects controlling parsing and serialization

namespace Sieve {

    /// @ingroup SieveOptions
    /// @brief Configuration controlling JSON text parsing
    ///
    /// @details
    /// `allow_comments`
    ///   - Accept `// ...` and `/* ... */` wherever whitespace is allowed
    /// `allow_trailing_commas`
    ///   - Accept `[1,2,]` and `{"a":1,}`
    /// `max_depth`
    ///   - Maximum nesting of arrays/objects; `0` means unlimited
    ///   - Deeper input fails with `depth_limit_exceeded`
    ///
    /// Example:
    /// @code
    /// Sieve::ParseOptions opts{ .allow_comments = true, .max_depth = 32 };
    /// auto r = Sieve::parse(text, opts);
    /// @endcode
    struct ParseOptions {
        bool allow_comments = false;        ///< Accept `//` and `/* */` comments if true
        bool allow_trailing_commas = false; ///< Accept a comma before `]` or `}` if true
        size_t max_depth = 0;               ///< Maximum nesting depth (0 = unlimited)
    };

    /// @ingroup SieveOptions
    /// @brief Configuration controlling serialization
    ///
    /// @details
    /// `pretty`
    ///   - Newlines and `indent` spaces per nesting level, `": "` between
    ///     key and value. Compact output otherwise
    /// `max_depth`
    ///   - Only consulted by `try_dump`; `0` means unlimited
    ///
    /// Object members are always written in insertion order.
    struct WriteOptions {
        bool pretty = false;        ///< Enable pretty-printing
        std::size_t indent = 2;     ///< Spaces per indentation level; ignored unless `pretty`
        std::size_t max_depth = 0;  ///< Nesting `try_dump` gives up beyond (0 = unlimited)
    };

    /// @ingroup SieveOptions
    /// @brief Options `decode_string` parses with when none are given
    inline constexpr ParseOptions default_decode_parse_options{ .max_depth = SIEVE_DEFAULT_MAX_DEPTH };

} // namespace Sieve
