#pragma once


/*
    ----------------------------------------------------
    Sieve decoders - typed views over a generic value
    ----------------------------------------------------
    A `decoder<T>` is a pure function `const value& -> decode_result<T>`,
    where `decode_result<T>` is `std::expected<T, DecodeError>`. Decoders are
    built once from smaller decoders and reused; they hold no state between
    calls and may be invoked from several threads at once.

    -----------
    Primitives
    -----------
        Decode::string()   Decode::int32()    Decode::boolean()  Decode::float64()
        Decode::int64()    Decode::uint64()   Decode::bigint()   Decode::decimal()
        Decode::guid()     Decode::datetime() Decode::datetime_offset()
        Decode::raw()      (identity: a copy of the input)

    ----------
    Navigation
    ----------
        field("name", d)          d applied to member "name" of an object
        at({"a", "b"}, d)         d applied to input.a.b
        index(2, d)               d applied to element 2 of an array

    ---------------------
    Structure and control
    ---------------------
        list(d), array(d), key_value_pairs(d), dict(d)    fail at the first bad element
        option(d)       absent (presence error) -> std::nullopt, other failures propagate
        one_of({...})   first success wins, otherwise every message is collected
        nil(x), succeed(x), fail<T>("why")
        and_then(f, d)  f(result of d) picks the decoder run on the same input
        map(ctor, d1, ..., dn)  all on the same input, left to right, fail-fast
        resolve(d)      runs the decoder that `d` decodes to

    -------
    Example
    -------
        struct point { int x; int y; };

        auto point_decoder = Sieve::Decode::map(
            [](int x, int y) { return point{ x, y }; },
            Sieve::Decode::field("x", Sieve::Decode::int32()),
            Sieve::Decode::field("y", Sieve::Decode::int32()));

        auto p = Sieve::decode_string(point_decoder, R"({"x":1,"y":2})");

    -----------------
    Recursion depth
    -----------------
    Decoders recurse only as deep as they are composed; the input can only
    drive deeper recursion through user-written recursive decoders. Text
    parsed by `decode_string` is limited to `SIEVE_DEFAULT_MAX_DEPTH` levels.
*/

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <initializer_list>
#include <list>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "sieve/config.hpp"
#include "sieve/value.hpp"
#include "sieve/json.hpp"
#include "sieve/decode_error.hpp"
#include "sieve/extended.hpp"

/// @defgroup SieveDecode Decoders
/// @ingroup Sieve
/// @brief The `decoder<T>` type, its runners and the `Decode` combinators

namespace Sieve {

    /// @ingroup SieveDecode
    /// @brief Outcome of running a decoder
    ///
    /// @details
    /// Alias for `std::expected<T, DecodeError>`. The error is structured;
    /// call `DecodeError::message()` for the text, or use one of the
    /// string-returning runners (`decode_value`, `decode_string`).
    template<class T>
    using decode_result = std::expected<T, DecodeError>;

    /// @ingroup SieveDecode
    /// @brief Copyable, stateless function from `value` to `decode_result<T>`
    ///
    /// @details
    /// A `decoder<T>` wraps any callable `const value& -> decode_result<T>`.
    /// Decoders are values: they are built once, copied freely into larger
    /// decoders and run any number of times. Running one never modifies the
    /// input and never retains a reference to it.
    ///
    /// Failures are returned, not thrown. The exceptions are user code run by
    /// a decoder (constructors given to `map`, `object` builders) which may
    /// throw; `run` converts such a `std::exception` into a `direct` error.
    ///
    /// Example:
    /// @code
    /// Sieve::decoder<int> even = [](const Sieve::value& v) -> Sieve::decode_result<int> {
    ///     auto n = Sieve::Decode::int32()(v);
    ///     if (n && *n % 2 != 0) return std::unexpected(Sieve::DecodeError::fail_message("odd"));
    ///     return n;
    /// };
    /// @endcode
    ///
    /// @tparam T Type produced on success
    template<class T>
    class decoder {
    public:
        using value_type = T;           ///< Type produced on success
        using function_type = std::function<decode_result<T>(const value&)>;

        /// @brief Wraps @p fn, any callable `const value& -> decode_result<T>`
        template<class F>
            requires (!std::same_as<std::remove_cvref_t<F>, decoder>)
                  && std::is_invocable_r_v<decode_result<T>, const F&, const value&>
        decoder(F fn) : m_Fn(std::move(fn)) {}

        /// @brief Runs the decoder on @p v
        ///
        /// @details
        /// Exceptions thrown by user code pass through; use `run` to have
        /// them reported as a `DecodeError`.
        ///
        /// @param v Input value; only read
        /// @return The decoded value or the first failure
        decode_result<T> operator()(const value& v) const { return m_Fn(v); }

    private:
        function_type m_Fn;
    };

    template<class T>
    struct is_decoder : std::false_type {};

    template<class T>
    struct is_decoder<decoder<T>> : std::true_type {};

    template<class T>
    inline constexpr bool is_decoder_v = is_decoder<std::remove_cvref_t<T>>::value;

    // ------------------------------------------------------------
    // Runners
    // ------------------------------------------------------------

    /// @ingroup SieveDecode
    /// @brief Runs @p d, reporting exceptions thrown by user code as errors
    ///
    /// @details
    /// - A `DecodeException` (thrown by a nested `unwrap`) gives back its
    ///   original `DecodeError`
    /// - Any other `std::exception` becomes `DecodeError::direct(what())`
    ///
    /// Every runner below goes through `run`.
    ///
    /// @param d Decoder to run
    /// @param v Input value
    /// @return The decoded value or the failure
    template<class T>
    decode_result<T> run(const decoder<T>& d, const value& v) {
        try {
            return d(v);
        } catch (const DecodeException& e) {
            return std::unexpected(e.error());
        } catch (const std::exception& e) {
            return std::unexpected(DecodeError::direct(e.what()));
        }
    }

    /// @ingroup SieveDecode
    /// @brief As `run`, with the error rendered to text
    /// @return The decoded value, or `DecodeError::message()` of the failure
    template<class T>
    std::expected<T, std::string> decode_value(const decoder<T>& d, const value& v) {
        auto r = run(d, v);
        if (!r) return std::unexpected(r.error().message());
        return *std::move(r);
    }

    /// @ingroup SieveDecode
    /// @brief Parses @p text, then runs @p d
    ///
    /// @details
    /// A parse failure becomes `direct("Given an invalid JSON: <msg>")`,
    /// `<msg>` being `ParseError::msg`. The default options bound nesting to
    /// `SIEVE_DEFAULT_MAX_DEPTH`, so hostile input cannot exhaust the stack.
    ///
    /// Example:
    /// @code
    /// auto r = Sieve::decode_string_error(Sieve::Decode::field("age", Sieve::Decode::int32()), text);
    /// if (!r && r.error().errc == Sieve::DecodeError::code::bad_field) {
    ///     // the document parsed but has no "age"
    /// }
    /// @endcode
    ///
    /// @param d Decoder to run on the parsed document
    /// @param text UTF-8 JSON text
    /// @param opts Parsing options
    /// @return The decoded value, or the parse or decode failure
    template<class T>
    decode_result<T> decode_string_error(const decoder<T>& d, std::string_view text, const ParseOptions& opts = default_decode_parse_options) {
        auto parsed = parse(text, opts);
        if (!parsed) return std::unexpected(DecodeError::direct("Given an invalid JSON: " + parsed.error().msg));
        return run(d, *parsed);
    }

    /// @ingroup SieveDecode
    /// @brief As `decode_string_error`, with the error rendered to text
    ///
    /// @details
    /// The usual entry point:
    /// @code
    /// auto user = Sieve::decode_string(user_decoder, text);
    /// if (!user) std::println("{}", user.error());
    /// @endcode
    template<class T>
    std::expected<T, std::string> decode_string(const decoder<T>& d, std::string_view text, const ParseOptions& opts = default_decode_parse_options) {
        auto r = decode_string_error(d, text, opts);
        if (!r) return std::unexpected(r.error().message());
        return *std::move(r);
    }

    /// @ingroup SieveDecode
    /// @brief Runs @p d and returns the value
    ///
    /// @details
    /// For code that treats a decoding failure as exceptional. Exceptions
    /// thrown by user code propagate unchanged.
    ///
    /// @param d Decoder to run
    /// @param v Input value
    /// @return The decoded value
    /// @throws DecodeException on failure, `what()` being the rendered message
    template<class T>
    T unwrap(const decoder<T>& d, const value& v) {
        auto r = d(v);
        if (!r) throw DecodeException{ std::move(r.error()) };
        return *std::move(r);
    }

    namespace Decode {
        class getters;
    }

    namespace detail {

        // Unwinds one `object` decode. Not a std::exception, so `run` lets it
        // through to the builder that owns `owner`; only `one_of` stops it
        // early, to try its next alternative.
        struct builder_abort {
            const Decode::getters* owner;
            DecodeError error;
        };

        // Why a narrowing step found nothing. Building the `DecodeError` is
        // deferred so that callers recovering from absence copy nothing.
        struct lookup_miss {
            DecodeError::code errc;     ///< bad_type, bad_primitive, bad_field, bad_path or too_small_array
            const value* where;         ///< Node the error reports
            std::size_t segment;        ///< Path segments walked before the miss
        };

        using lookup_result = std::expected<const value*, lookup_miss>;

        SIEVE_API lookup_result find_field(const value& v, std::string_view name) noexcept;
        SIEVE_API lookup_result find_path(const value& v, std::span<const std::string> path) noexcept;
        SIEVE_API lookup_result find_index(const value& v, std::size_t i) noexcept;

        SIEVE_API DecodeError field_error(const lookup_miss& miss, std::string_view name);
        SIEVE_API DecodeError path_error(const lookup_miss& miss, std::span<const std::string> path);
        SIEVE_API DecodeError index_error(const lookup_miss& miss, std::size_t i);

        [[nodiscard]] inline bool is_absence(const lookup_miss& miss) noexcept {
            return miss.errc == DecodeError::code::bad_field
                || miss.errc == DecodeError::code::bad_path
                || miss.errc == DecodeError::code::too_small_array;
        }

        // Narrowing steps shared by the navigation decoders and the builders.
        // On success they point into the input value.
        SIEVE_API decode_result<const value*> field_of(const value& v, std::string_view name);
        SIEVE_API decode_result<const value*> path_of(const value& v, std::span<const std::string> path);
        SIEVE_API decode_result<const value*> index_of(const value& v, std::size_t i);

        // Absent -> fallback; present `null` that `d` rejects -> fallback;
        // anything else is decoded by `d` and its error kept. `locate` returns
        // a `lookup_result`, `report` turns a non-absent miss into the error.
        template<class T, class Locate, class Report>
        decode_result<T> optional_lookup(const value& root, const Locate& locate, const Report& report, const decoder<T>& d, const T& fallback) {
            lookup_result found = locate(root);
            if (!found) {
                if (is_absence(found.error())) return fallback;
                return std::unexpected(report(found.error()));
            }
            auto r = d(**found);
            if (!r && (*found)->is_null()) return fallback;
            return r;
        }

        template<class Ctor, class Tuple, std::size_t... I>
        auto map_apply(const Ctor& ctor, const Tuple& decoders, const value& v, std::index_sequence<I...>)
            -> decode_result<std::invoke_result_t<const Ctor&, typename std::tuple_element_t<I, Tuple>::value_type...>> {
            std::tuple<std::optional<typename std::tuple_element_t<I, Tuple>::value_type>...> slots;
            std::optional<DecodeError> failure;

            auto step = [&]<std::size_t K>() -> bool {
                auto r = std::get<K>(decoders)(v);
                if (!r) {
                    failure = std::move(r.error());
                    return false;
                }
                std::get<K>(slots).emplace(std::move(*r));
                return true;
            };

            // && folds left to right and stops at the first failure
            if (!(step.template operator()<I>() && ...)) return std::unexpected(std::move(*failure));
            return std::invoke(ctor, std::move(*std::get<I>(slots))...);
        }

    } // namespace detail

    namespace Decode {

        // ------------------------------------------------------------
        // Primitives
        // ------------------------------------------------------------

        /// @brief Succeeds on strings only
        SIEVE_API decoder<std::string> string();

        /// @brief Succeeds on integral numbers within the 32-bit signed range;
        ///        other numbers fail with a `Reason:`
        SIEVE_API decoder<int> int32();

        /// @brief Succeeds on booleans only
        SIEVE_API decoder<bool> boolean();

        /// @brief Succeeds on any number
        SIEVE_API decoder<double> float64();

        /// @brief Decimal string, or a number exactly representable as a double
        SIEVE_API decoder<std::int64_t> int64();
        SIEVE_API decoder<std::uint64_t> uint64();

        /// @brief Decimal string or integral number
        SIEVE_API decoder<Sieve::big_integer> bigint();

        /// @brief Decimal string or finite number
        SIEVE_API decoder<Sieve::decimal> decimal();

        SIEVE_API decoder<Sieve::guid> guid();
        SIEVE_API decoder<Sieve::date_time> datetime();
        SIEVE_API decoder<Sieve::date_time_offset> datetime_offset();

        /// @brief Identity: a copy of the input
        SIEVE_API decoder<Sieve::value> raw();

        // ------------------------------------------------------------
        // Constants
        // ------------------------------------------------------------

        template<class T>
        decoder<T> succeed(T output) {
            return [output = std::move(output)](const Sieve::value&) -> decode_result<T> { return output; };
        }

        template<class T>
        decoder<T> fail(std::string msg) {
            return [msg = std::move(msg)](const Sieve::value&) -> decode_result<T> {
                return std::unexpected(DecodeError::fail_message(msg));
            };
        }

        /// @brief Succeeds with @p output on `null` only
        template<class T>
        decoder<T> nil(T output) {
            return [output = std::move(output)](const Sieve::value& v) -> decode_result<T> {
                if (v.is_null()) return output;
                return std::unexpected(DecodeError::bad_primitive("null", v));
            };
        }

        // ------------------------------------------------------------
        // Navigation
        // ------------------------------------------------------------

        /// @brief Decodes member @p name of an object with @p d
        ///
        /// @details
        /// Fails with `bad_type("an object")` on a non-object and with
        /// `bad_field` when the member is missing. A member holding `null` is
        /// present: it is handed to @p d like any other value.
        ///
        /// @param name Member key
        /// @param d Decoder for the member's value
        template<class T>
        decoder<T> field(std::string name, decoder<T> d) {
            return [name = std::move(name), d = std::move(d)](const Sieve::value& v) -> decode_result<T> {
                auto sub = detail::field_of(v, name);
                if (!sub) return std::unexpected(std::move(sub.error()));
                return d(**sub);
            };
        }

        /// @brief Decodes the value reached by following @p path with @p d
        ///
        /// @details
        /// `at({"user", "name"}, d)` is `field("user", field("name", d))` with
        /// a single error for the whole path:
        /// - a missing segment fails `bad_path`, reporting the root and
        ///   naming the segment
        /// - a non-object met on the way fails `bad_type`, citing the part of
        ///   the path already walked
        ///
        /// An empty path decodes the input itself.
        template<class T>
        decoder<T> at(std::vector<std::string> path, decoder<T> d) {
            return [path = std::move(path), d = std::move(d)](const Sieve::value& v) -> decode_result<T> {
                auto sub = detail::path_of(v, path);
                if (!sub) return std::unexpected(std::move(sub.error()));
                return d(**sub);
            };
        }

        /// @brief Decodes element @p i of an array with @p d
        ///
        /// @details
        /// Fails with `bad_primitive("an array")` on a non-array and with
        /// `too_small_array` when @p i is past the end.
        template<class T>
        decoder<T> index(std::size_t i, decoder<T> d) {
            return [i, d = std::move(d)](const Sieve::value& v) -> decode_result<T> {
                auto sub = detail::index_of(v, i);
                if (!sub) return std::unexpected(std::move(sub.error()));
                return d(**sub);
            };
        }

        // ------------------------------------------------------------
        // Data structures
        // ------------------------------------------------------------

        template<class T>
        decoder<std::vector<T>> array(decoder<T> d) {
            return [d = std::move(d)](const Sieve::value& v) -> decode_result<std::vector<T>> {
                if (!v.is_array()) return std::unexpected(DecodeError::bad_primitive("an array", v));
                std::vector<T> out;
                out.reserve(v.size());
                for (const auto& elem : v.as_array()) {
                    auto r = d(elem);
                    if (!r) return std::unexpected(std::move(r.error()));
                    out.push_back(std::move(*r));
                }
                return out;
            };
        }

        template<class T>
        decoder<std::list<T>> list(decoder<T> d) {
            return [d = std::move(d)](const Sieve::value& v) -> decode_result<std::list<T>> {
                if (!v.is_array()) return std::unexpected(DecodeError::bad_primitive("a list", v));
                std::list<T> out;
                for (const auto& elem : v.as_array()) {
                    auto r = d(elem);
                    if (!r) return std::unexpected(std::move(r.error()));
                    out.push_back(std::move(*r));
                }
                return out;
            };
        }

        /// @brief Members in input order
        template<class T>
        decoder<std::vector<std::pair<std::string, T>>> key_value_pairs(decoder<T> d) {
            using pairs = std::vector<std::pair<std::string, T>>;
            return [d = std::move(d)](const Sieve::value& v) -> decode_result<pairs> {
                if (!v.is_object()) return std::unexpected(DecodeError::bad_primitive("an object", v));
                pairs out;
                out.reserve(v.size());
                for (const auto& m : v.as_object()) {
                    auto r = d(m.val);
                    if (!r) return std::unexpected(std::move(r.error()));
                    out.emplace_back(std::string{ m.key }, std::move(*r));
                }
                return out;
            };
        }

        template<class T>
        decoder<std::map<std::string, T>> dict(decoder<T> d) {
            using result_map = std::map<std::string, T>;
            auto pairs = key_value_pairs(std::move(d));
            return [pairs = std::move(pairs)](const Sieve::value& v) -> decode_result<result_map> {
                auto r = pairs(v);
                if (!r) return std::unexpected(std::move(r.error()));
                result_map out;
                for (auto& [k, val] : *r) out.insert_or_assign(std::move(k), std::move(val));
                return out;
            };
        }

        // ------------------------------------------------------------
        // Inconsistent structure
        // ------------------------------------------------------------

        /// @brief `std::nullopt` when @p d reports something absent
        ///        (`bad_field`, `bad_path`, `too_small_array`); every other
        ///        failure, malformed data included, propagates
        template<class T>
        decoder<std::optional<T>> option(decoder<T> d) {
            return [d = std::move(d)](const Sieve::value& v) -> decode_result<std::optional<T>> {
                auto r = d(v);
                if (r) return std::optional<T>{ std::move(*r) };
                if (r.error().is_presence_error()) return std::optional<T>{};
                return std::unexpected(std::move(r.error()));
            };
        }

        /// @brief Tries @p decoders in order; order them most specific first
        ///
        /// @details
        /// The first success wins. When every alternative fails the result is
        /// `bad_one_of`, holding each alternative's rendered message in order.
        /// An alternative that fails through the getters of an enclosing
        /// `object` counts as a failed alternative like any other.
        template<class T>
        decoder<T> one_of(std::vector<decoder<T>> decoders) {
            return [decoders = std::move(decoders)](const Sieve::value& v) -> decode_result<T> {
                std::vector<std::string> messages;
                messages.reserve(decoders.size());
                for (const auto& d : decoders) {
                    try {
                        auto r = run(d, v);
                        if (r) return r;
                        messages.push_back(r.error().message());
                    } catch (const Sieve::detail::builder_abort& abort) {
                        // An enclosing builder's getter failed inside this alternative
                        messages.push_back(abort.error.message());
                    }
                }
                return std::unexpected(DecodeError::bad_one_of(std::move(messages)));
            };
        }

        template<class T>
        decoder<T> one_of(std::initializer_list<decoder<T>> decoders) {
            return one_of(std::vector<decoder<T>>(decoders));
        }

        // ------------------------------------------------------------
        // Chaining and mapping
        // ------------------------------------------------------------

        /// @brief Runs @p d, then the decoder `f(result)` on the same input
        template<class F, class T>
            requires is_decoder_v<std::invoke_result_t<const F&, T>>
        auto and_then(F f, decoder<T> d) -> std::remove_cvref_t<std::invoke_result_t<const F&, T>> {
            using next_decoder = std::remove_cvref_t<std::invoke_result_t<const F&, T>>;
            using U = typename next_decoder::value_type;
            return [f = std::move(f), d = std::move(d)](const Sieve::value& v) -> decode_result<U> {
                auto first = d(v);
                if (!first) return std::unexpected(std::move(first.error()));
                next_decoder next = std::invoke(f, std::move(*first));
                return next(v);
            };
        }

        /// @brief Applies every decoder to the same input, left to right,
        ///        stopping at the first failure, then calls @p ctor
        ///
        /// @details
        /// Takes any number of decoders. Decoders to the right of a failure
        /// are never run, and @p ctor runs only when all of them succeed.
        ///
        /// Example:
        /// @code
        /// auto point = Sieve::Decode::map(
        ///     [](int x, int y) { return point_t{ x, y }; },
        ///     Sieve::Decode::field("x", Sieve::Decode::int32()),
        ///     Sieve::Decode::field("y", Sieve::Decode::int32()));
        /// @endcode
        ///
        /// @param ctor Callable receiving every decoded value, in order
        /// @param ds Decoders, all run on the same input
        /// @return Decoder producing `ctor(results...)`
        template<class Ctor, class... Ts>
            requires (sizeof...(Ts) >= 1) && std::invocable<const Ctor&, Ts...>
        auto map(Ctor ctor, decoder<Ts>... ds) -> decoder<std::invoke_result_t<const Ctor&, Ts...>> {
            return [ctor = std::move(ctor), steps = std::make_tuple(std::move(ds)...)](const Sieve::value& v) {
                return detail::map_apply(ctor, steps, v, std::index_sequence_for<Ts...>{});
            };
        }

        /// @brief Runs the decoder produced by @p d on the same input
        template<class T>
        decoder<T> resolve(decoder<decoder<T>> d) {
            return [d = std::move(d)](const Sieve::value& v) -> decode_result<T> {
                auto inner = d(v);
                if (!inner) return std::unexpected(std::move(inner.error()));
                return (*inner)(v);
            };
        }

    } // namespace Decode

} // namespace Sieve
