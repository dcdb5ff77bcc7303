#pragma once


/*
    ---------------------------------------------------
    Sieve::DecodeError - Structured decoding failures
    ---------------------------------------------------
    Every decoder returns `std::expected<T, DecodeError>`. A `DecodeError`
    records one terminal failure reason; it is never rendered while decoders
    compose. Only the consumer (`unwrap`, `decode_value`, or an explicit
    `message()` call) turns it into text.

    -----
    Kinds
    -----
    Shape errors (a value is present but has the wrong kind):
        - `bad_primitive`        expected <desc>, got <actual>
        - `bad_primitive_extra`  as above, plus a reason (`detail`)
        - `bad_type`             expected an object (or an object at a path)
    Presence errors (something asked for is absent):
        - `bad_field`            object lacks the field
        - `bad_path`             a segment of a path is missing (`detail`)
        - `too_small_array`      array is shorter than the requested index
    Other:
        - `fail_message`         produced by `Decode::fail` (`detail`)
        - `bad_one_of`           every alternative failed (`messages`)
        - `direct`               opaque text from the boundary (`detail`)

    Only presence errors are recoverable by `option` and the optional
    getters; everything else propagates.

    ---------
    Rendering
    ---------
    The offending value is pretty-printed with `SIEVE_ERROR_DUMP_INDENT`
    spaces. Values nesting deeper than `SIEVE_DEFAULT_MAX_DEPTH` are not
    printed; a fixed fallback sentence is used instead.
*/

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "sieve/config.hpp"
#include "sieve/value.hpp"

/// @defgroup SieveDecodeError Decoding Errors
/// @ingroup Sieve
/// @brief The structured error every decoder reports and its rendering

namespace Sieve {

    /// @ingroup SieveDecodeError
    /// @brief One structured decoding failure
    ///
    /// @details
    /// A `DecodeError` is the error half of every `decode_result<T>`. It is
    /// built by the factories below and only rendered on request, so
    /// combinators that recover from a failure (`option`, `one_of`, the
    /// optional getters) never pay for formatting. Which fields are set
    /// depends on `errc`:
    ///
    /// - `expected` and `actual`: every kind except `fail_message`,
    ///   `bad_one_of` and `direct`
    /// - `detail`: `bad_primitive_extra` (reason), `bad_path` (missing
    ///   segment), `fail_message` and `direct` (text)
    /// - `messages`: `bad_one_of` only
    ///
    /// `actual` is shared and immutable. Copying or moving an error never
    /// copies the value it reports.
    struct DecodeError {
        /// @ingroup SieveDecodeError
        /// @brief Closed set of failure reasons
        ///
        /// @details
        /// Shape errors (`bad_primitive`, `bad_primitive_extra`, `bad_type`)
        /// mean something is present with the wrong kind or content.
        /// Presence errors (`bad_field`, `bad_path`, `too_small_array`)
        /// mean something asked for is absent. `to_string(code)` gives each
        /// a stable name.
        enum class code : uint8_t {
            bad_primitive,          ///< Value of the wrong kind.
            bad_primitive_extra,    ///< Right kind, unusable content; carries a reason.
            bad_type,               ///< Expected an object.
            bad_field,              ///< Object lacks the field.
            bad_path,               ///< A path segment is missing.
            too_small_array,        ///< Index past the end of an array.
            fail_message,           ///< Raised by `Decode::fail`.
            bad_one_of,             ///< Every `one_of` alternative failed.
            direct,                 ///< Opaque text (invalid JSON, user exceptions).
        };

        code errc{};                            ///< The kind of failure.
        std::string expected{};                 ///< What was expected ("an int", "an object with a field named `x`").
        std::shared_ptr<const value> actual{};  ///< The value reported; null for kinds that carry none.
        std::string detail{};                   ///< Reason, missing segment, fail or direct text.
        std::vector<std::string> messages{};    ///< Rendered alternatives of `bad_one_of`, in order.

        /// @ingroup SieveDecodeError
        /// @brief A value of the wrong kind
        ///
        /// @details
        /// Renders as `Expecting <desc> but instead got: <v>`, @p v being
        /// pretty-printed with `SIEVE_ERROR_DUMP_INDENT` spaces.
        ///
        /// Example:
        /// @code
        /// if (!v.is_string()) return std::unexpected(DecodeError::bad_primitive("a string", v));
        /// @endcode
        ///
        /// @param desc What was expected, with its article ("a string")
        /// @param v The offending value; copied once into `actual`
        /// @return An error of kind `bad_primitive`
        SIEVE_API static DecodeError bad_primitive(std::string_view desc, const value& v);

        /// @brief As `bad_primitive`, followed by a `Reason: <reason>` line
        /// @param desc What was expected
        /// @param v The offending value
        /// @param reason Why the content was refused
        SIEVE_API static DecodeError bad_primitive_extra(std::string_view desc, const value& v, std::string_view reason);

        SIEVE_API static DecodeError bad_type(std::string_view desc, const value& v);

        /// @brief @p v is the object lacking the field
        SIEVE_API static DecodeError bad_field(std::string_view desc, const value& v);

        /// @ingroup SieveDecodeError
        /// @brief A path segment is missing
        ///
        /// @details
        /// Renders the `bad_type` text followed by
        /// ``Node `<missing_segment>` is unknown.``
        ///
        /// @param desc "an object with path `a.b.c`"
        /// @param v The root the path was walked from
        /// @param missing_segment The first segment not found
        /// @return An error of kind `bad_path`
        SIEVE_API static DecodeError bad_path(std::string_view desc, const value& v, std::string_view missing_segment);

        /// @brief @p v is the whole array; @p desc names the wanted index and the size
        SIEVE_API static DecodeError too_small_array(std::string_view desc, const value& v);

        SIEVE_API static DecodeError fail_message(std::string_view text);

        /// @brief @p rendered holds one message per failed alternative
        SIEVE_API static DecodeError bad_one_of(std::vector<std::string> rendered);

        /// @brief Text rendered verbatim
        SIEVE_API static DecodeError direct(std::string_view text);

        /// @brief Present value of the wrong kind
        [[nodiscard]] bool is_shape_error() const noexcept {
            return errc == code::bad_primitive || errc == code::bad_primitive_extra || errc == code::bad_type;
        }

        /// @brief Absent field, path segment or array index
        [[nodiscard]] bool is_presence_error() const noexcept {
            return errc == code::bad_field || errc == code::bad_path || errc == code::too_small_array;
        }

        /// @brief Renders the human readable, possibly multi-line message
        ///
        /// @details
        /// The exact texts are listed in the header comment. A value nesting
        /// deeper than `SIEVE_DEFAULT_MAX_DEPTH` is not printed; the message
        /// then ends with "Couldn't report given value due to circular
        /// structure." instead.
        SIEVE_API [[nodiscard]] std::string message() const;
    };

    /// @ingroup SieveDecodeError
    /// @brief Same as `err.message()`
    SIEVE_API [[nodiscard]] std::string to_string(const DecodeError& err);

    /// @ingroup SieveDecodeError
    /// @brief Stable lowercase name of an error kind ("bad_field", ...)
    SIEVE_API [[nodiscard]] std::string_view to_string(DecodeError::code c) noexcept;

    /// @ingroup SieveDecodeError
    /// @brief Thrown by `unwrap`; `what()` is the rendered message
    ///
    /// @details
    /// `run` recognises it and returns the carried error unchanged, so a
    /// builder may call `unwrap` on a nested decoder without losing the
    /// structure of the failure.
    class DecodeException : public std::runtime_error {
    public:
        /// @param err The failure; rendered once, for `what()`
        SIEVE_API explicit DecodeException(DecodeError err);

        /// @brief The structured failure
        [[nodiscard]] const DecodeError& error() const noexcept { return m_Error; }

    private:
        DecodeError m_Error;
    };

} // namespace Sieve
