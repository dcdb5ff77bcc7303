#pragma once


/*
    --------------------------------------------
    Sieve encoders - typed values to value trees
    --------------------------------------------
    The mirror of `Decode`: plain functions building a `Sieve::value`. They
    cannot fail. Object members keep the order they are given in.

        auto v = Sieve::Encode::object({
            { "firstname", Sieve::Encode::string("maxime") },
            { "age",       Sieve::Encode::int32(25) },
        });

        Sieve::Encode::to_string(v, 0);  // {"firstname":"maxime","age":25}
        Sieve::Encode::to_string(v, 4);  // 4-space pretty printed

    64-bit and arbitrary precision numbers, decimals, guids and dates are
    written as strings in the canonical form their decoders accept.
*/

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "sieve/config.hpp"
#include "sieve/value.hpp"
#include "sieve/extended.hpp"

namespace Sieve::Encode {

    /// @brief One `{ key, value }` entry given to `object`
    using property = std::pair<std::string, Sieve::value>;

    SIEVE_API Sieve::value string(std::string_view s);
    SIEVE_API Sieve::value int32(int i);
    SIEVE_API Sieve::value float64(double d);
    SIEVE_API Sieve::value boolean(bool b);
    SIEVE_API Sieve::value nil();

    SIEVE_API Sieve::value object(std::vector<property> members);
    SIEVE_API Sieve::value object(std::initializer_list<property> members);

    SIEVE_API Sieve::value array(std::vector<Sieve::value> items);
    SIEVE_API Sieve::value list(std::list<Sieve::value> items);

    /// @brief Object with the map's keys in ascending order
    SIEVE_API Sieve::value dict(const std::map<std::string, Sieve::value>& entries);

    SIEVE_API Sieve::value bigint(const Sieve::big_integer& i);
    SIEVE_API Sieve::value decimal(const Sieve::decimal& d);
    SIEVE_API Sieve::value int64(std::int64_t i);
    SIEVE_API Sieve::value uint64(std::uint64_t i);
    SIEVE_API Sieve::value guid(const Sieve::guid& g);
    SIEVE_API Sieve::value datetime(Sieve::date_time t);
    SIEVE_API Sieve::value datetime_offset(const Sieve::date_time_offset& t);

    /// @brief `encoder(*opt)`, or `null` when empty
    template<class T, class F>
    Sieve::value option(const F& encoder, const std::optional<T>& opt) {
        if (!opt) return nil();
        return std::invoke(encoder, *opt);
    }

    /// @brief Array of `encoder(item)` for every item of @p items
    template<class Range, class F>
    Sieve::value seq(const F& encoder, const Range& items) {
        Sieve::array out;
        for (const auto& item : items) out.push_back(std::invoke(encoder, item));
        return Sieve::value{ std::move(out) };
    }

    /// @brief Array whose element `i` is `encoders...[i](std::get<i>(values))`
    template<class... Ts, class... Fs>
        requires (sizeof...(Ts) == sizeof...(Fs))
    Sieve::value tuple(const std::tuple<Ts...>& values, const Fs&... encoders) {
        Sieve::array out;
        out.reserve(sizeof...(Ts));
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            (out.push_back(std::invoke(encoders, std::get<I>(values))), ...);
        }(std::index_sequence_for<Ts...>{});
        return Sieve::value{ std::move(out) };
    }

    /// @brief Compact text for @p indent 0, otherwise @p indent spaces per level
    SIEVE_API std::string to_string(const Sieve::value& v, std::size_t indent = 0);

} // namespace Sieve::Encode
