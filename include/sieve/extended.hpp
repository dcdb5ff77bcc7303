#pragma once


/*
    ----------------------------------------------
    Sieve extended primitives - lossless scalars
    ----------------------------------------------
    JSON numbers are doubles, which cannot carry 64-bit integers, arbitrary
    precision integers or exact decimals. These types travel through their
    canonical string form instead:

        - `big_integer`       "-12345678901234567890123"
        - `decimal`           "0.7833"  (scale is kept: "1.50" prints as "1.50")
        - `guid`              "1e5dee25-8558-4392-a9fb-aae03f81068f"
        - `date_time`         "2018-10-01T11:12:55Z"  (UTC, millisecond precision)
        - `date_time_offset`  "2018-07-02T12:23:45+02:00"

    Every `parse` returns the reason text on failure; decoders put it in the
    `Reason:` line of a `bad_primitive_extra` error.
*/

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "sieve/config.hpp"

/// @defgroup SieveExtended Lossless Scalars
/// @ingroup Sieve
/// @brief Values that travel through JSON as canonical strings

namespace Sieve {

    /// @ingroup SieveExtended
    /// @brief Arbitrary-length signed integer kept in canonical decimal form
    ///
    /// @details
    /// Stores a sign and a digit string; no arithmetic is provided. The
    /// canonical form has no leading zeros and no negative zero, so equal
    /// numbers compare equal and print the same.
    ///
    /// Example:
    /// @code
    /// auto n = Sieve::big_integer::parse("-000123456789012345678901234567890");
    /// // n->to_string() == "-123456789012345678901234567890"
    /// @endcode
    class big_integer {
    public:
        /// @brief Zero
        big_integer() = default;
        SIEVE_API explicit big_integer(std::int64_t v);

        /// @brief Parses `[+-]?[0-9]+`; leading zeros are dropped, `-0` becomes `0`
        ///
        /// @param text Decimal digits with an optional sign, nothing else
        /// @return The number, or "Input string was not in a correct format."
        SIEVE_API static std::expected<big_integer, std::string> parse(std::string_view text);

        [[nodiscard]] bool is_negative() const noexcept { return m_Negative; }
        SIEVE_API [[nodiscard]] std::string to_string() const;

        friend bool operator==(const big_integer&, const big_integer&) = default;

    private:
        bool m_Negative = false;
        std::string m_Digits = "0";
    };

    /// @ingroup SieveExtended
    /// @brief Signed fixed-point decimal: at most 29 significant digits,
    ///        at most 28 of them after the point
    ///
    /// @details
    /// Equality is numeric (`1.50 == 1.5`); `to_string` keeps the parsed scale.
    class decimal {
    public:
        decimal() = default;

        /// @brief Parses `[+-]?[0-9]+(\.[0-9]+)?`
        ///
        /// @param text Decimal text; no exponent, no surrounding spaces
        /// @return The number with the scale of @p text, or the reason it was
        ///         refused (bad format, or beyond 29 significant / 28
        ///         fractional digits)
        SIEVE_API static std::expected<decimal, std::string> parse(std::string_view text);

        /// @brief Shortest decimal text that round-trips @p d
        /// @pre `std::isfinite(d)`
        SIEVE_API static std::expected<decimal, std::string> from_double(double d);

        [[nodiscard]] bool is_negative() const noexcept { return m_Negative; }
        [[nodiscard]] std::size_t scale() const noexcept { return m_Fraction.size(); }
        SIEVE_API [[nodiscard]] std::string to_string() const;
        SIEVE_API [[nodiscard]] double to_double() const;

        SIEVE_API friend bool operator==(const decimal& lhs, const decimal& rhs);

    private:
        bool m_Negative = false;
        std::string m_Integral = "0";
        std::string m_Fraction;
    };

    /// @ingroup SieveExtended
    /// @brief 128-bit globally unique identifier
    class guid {
    public:
        guid() = default;
        explicit guid(const std::array<std::uint8_t, 16>& bytes) noexcept : m_Bytes{ bytes } {}

        /// @brief Accepts `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx`, the same in
        ///        braces, or 32 bare hex digits; case-insensitive
        SIEVE_API static std::expected<guid, std::string> parse(std::string_view text);

        /// @brief Lowercase hyphenated form
        SIEVE_API [[nodiscard]] std::string to_string() const;
        [[nodiscard]] const std::array<std::uint8_t, 16>& bytes() const noexcept { return m_Bytes; }

        friend bool operator==(const guid&, const guid&) = default;

    private:
        std::array<std::uint8_t, 16> m_Bytes{};
    };

    /// @ingroup SieveExtended
    /// @brief UTC point in time with millisecond precision
    using date_time = std::chrono::sys_time<std::chrono::milliseconds>;

    /// @ingroup SieveExtended
    /// @brief Local wall-clock time plus its offset from UTC
    ///
    /// @details
    /// Keeps the offset it was given, so `"2018-07-02T12:23:45+02:00"`
    /// prints back unchanged. Equality compares both members: the same
    /// instant at two offsets is two different values. Compare `to_utc()`
    /// for the instant.
    struct date_time_offset {
        std::chrono::local_time<std::chrono::milliseconds> local{};    ///< Wall-clock time at `offset`
        std::chrono::minutes offset{};                                  ///< Offset east of UTC

        /// @brief Parses ISO-8601; a missing zone means offset 0
        SIEVE_API static std::expected<date_time_offset, std::string> parse(std::string_view text);

        [[nodiscard]] date_time to_utc() const noexcept {
            return date_time{ local.time_since_epoch() - offset };
        }

        /// @brief `YYYY-MM-DDTHH:MM:SS[.mmm]+HH:MM`
        SIEVE_API [[nodiscard]] std::string to_string() const;

        friend bool operator==(const date_time_offset&, const date_time_offset&) = default;
    };

    /// @ingroup SieveExtended
    /// @brief Parses `YYYY-MM-DD[(T| )HH:MM[:SS[.fraction]]][Z|(+|-)HH[:]MM]`
    ///        and converts to UTC; a missing zone means UTC
    SIEVE_API std::expected<date_time, std::string> parse_date_time(std::string_view text);

    /// @ingroup SieveExtended
    /// @brief `YYYY-MM-DDTHH:MM:SS[.mmm]Z`, fraction only when non-zero
    SIEVE_API [[nodiscard]] std::string format_date_time(date_time t);

} // namespace Sieve
