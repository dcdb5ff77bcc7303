#pragma once


/*
    -----------------------------------------------------
    Sieve::ParseError - Text boundary error reporting
    -----------------------------------------------------
    `Sieve::ParseError` describes a failure while turning JSON text into a
    `Sieve::value`. It never reaches decoder code directly: the
    `decode_string` runners wrap it into a `DecodeError` of kind `direct`.

    - `errc`   : category of failure
    - `offset` : byte offset into the input, in `[0, input.size()]`
    - `line`   : 1-based line
    - `column` : 1-based column (bytes within the line)
    - `msg`    : human-readable explanation, not stable for programmatic use
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "sieve/config.hpp"


/// @defgroup SieveError Parsing Errors
/// @ingroup Sieve
/// @brief Error codes and structures produced by the JSON parser
namespace Sieve {

    /// @ingroup SieveError
    /// @brief Structured error information produced while parsing JSON text
    ///
    /// @details
    /// Returned by every `Sieve::parse(...)` overload inside a
    /// `ParseResult`. The position fields let a caller point at the failure
    /// in the source; `msg` is for people.
    struct ParseError {
        /// @ingroup SieveError
        /// @brief Category of a parse failure
        ///
        /// @details
        /// `unexpected_character` also covers comments when
        /// `ParseOptions::allow_comments` is off, and `trailing_characters`
        /// covers a trailing comma when `allow_trailing_commas` is off.
        enum class code : uint8_t {
            unexpected_character,   ///< Invalid or unexpected character.
            invalid_number,         ///< Malformed numeric literal.
            invalid_string,         ///< Malformed string literal or invalid UTF-8.
            invalid_escape,         ///< Invalid escape sequence.
            invalid_unicode_escape, ///< Invalid `\uXXXX` or unpaired surrogate.
            unexpected_end_of_input,///< Input ended prematurely.
            trailing_characters,    ///< Extra characters after valid JSON.
            depth_limit_exceeded,   ///< Nesting deeper than `ParseOptions::max_depth`.
        };

        code errc{};            ///< The classification of the failure.
        std::size_t offset{};   ///< Byte offset from the beginning of the input.
        std::size_t line{};     ///< Line of the failure (1-based).
        std::size_t column{};   ///< Column of the failure, in bytes (1-based).
        std::string msg{};      ///< Human-readable diagnostic message.

        /// @ingroup SieveError
        /// @brief Builds a fully populated `ParseError`
        ///
        /// @details
        /// Used by the parser, which tracks the position as it consumes
        /// input:
        /// @code
        /// return ParseError::make(code::invalid_number, m_Idx, m_Line, m_Column, "Leading zeros disallowed");
        /// @endcode
        ///
        /// @param c    Category of the failure
        /// @param o    Byte offset from the start of the input
        /// @param l    Line number (1-based)
        /// @param col  Column number (1-based)
        /// @param m    Human-readable message
        /// @return The error
        SIEVE_API static ParseError make(code c, size_t o, size_t l, size_t col, std::string_view m);
    };

} // namespace Sieve
