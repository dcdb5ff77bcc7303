#pragma once


/*
    ------------------------------------
    Sieve text boundary - parse and dump
    ------------------------------------
    Decoders operate on an already-built `Sieve::value`. This header is the
    boundary that produces one from JSON text and prints one back:

        - `parse(text)`           -> `std::expected<value, ParseError>`
        - `dump(value, opts)`     -> compact or pretty JSON text
        - `try_dump(value, opts)` -> as `dump`, but gives up (nullopt) on
                                     nesting deeper than `opts.max_depth`

    Object members are written in insertion order. Integral numbers are
    written without a fractional part, non-finite numbers as `null`.
*/

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <iosfwd>

#include "sieve/value.hpp"
#include "sieve/error.hpp"
#include "sieve/options.hpp"

namespace Sieve {

    /// @ingroup Sieve
    /// @brief Result of every `parse(...)` overload
    using ParseResult = std::expected<value, ParseError>;

    /// @ingroup Sieve
    /// @brief Parses a UTF-8 JSON document
    ///
    /// @code
    /// auto res = Sieve::parse(R"({"x":42})");
    /// if (!res) std::println("{}:{} {}", res.error().line, res.error().column, res.error().msg);
    /// @endcode
    SIEVE_API [[nodiscard]] ParseResult parse(std::string_view input, const ParseOptions& opts = {});

    /// @ingroup Sieve
    /// @brief Reads @p is to the end and parses it
    SIEVE_API [[nodiscard]] ParseResult parse(std::istream& is, const ParseOptions& opts = {});

    /// @ingroup Sieve
    /// @brief Serializes @p v to a string
    SIEVE_API [[nodiscard]] std::string dump(const value& v, const WriteOptions& opts = {});

    /// @ingroup Sieve
    /// @brief Serializes @p v to @p os
    SIEVE_API void dump(const value& v, std::ostream& os, const WriteOptions& opts = {});

    /// @ingroup Sieve
    /// @brief Serializes @p v, or returns `std::nullopt` when the tree nests
    ///        deeper than `opts.max_depth` (0 = unlimited)
    SIEVE_API [[nodiscard]] std::optional<std::string> try_dump(const value& v, const WriteOptions& opts);

} // namespace Sieve
