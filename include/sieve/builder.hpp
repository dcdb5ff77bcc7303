#pragma once


/*
    ---------------------------------------------------
    Sieve record builders - object getters and pipeline
    ---------------------------------------------------
    Two ways of assembling a record from several independent decoders, both
    running every step against the same input and stopping at the first
    failure.

    ----------------
    Decode::object
    ----------------
    The builder receives a `getters` whose `required` and `optional` facets
    run `field`, `at` and `index` on the input right away and hand back the
    plain value:

        auto user = Sieve::Decode::object([](const Sieve::Decode::getters& get) {
            return user_t{
                get.required.field("firstname", Sieve::Decode::string()),
                get.required.field("age", Sieve::Decode::int32()),
                get.optional.field("email", Sieve::Decode::string(), "none"),
            };
        });

    A failing getter abandons the builder at once; getters further right in
    a braced initializer are never evaluated. Optional getters return the
    fallback when the field, path or index is absent, or when it holds `null`
    that the decoder rejects. Malformed present data still fails.

    ------------------
    Decode::pipeline
    ------------------
    The same record, spelled as a chain of steps fed to a constructor:

        auto user = Sieve::Decode::pipeline<>{}
            .required("firstname", Sieve::Decode::string())
            .required("age", Sieve::Decode::int32())
            .optional("email", Sieve::Decode::string(), "none")
            .into([](std::string name, int age, std::string email) {
                return user_t{ std::move(name), age, std::move(email) };
            });
*/

#include <functional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "sieve/decoder.hpp"

/// @defgroup SieveBuilder Record Builders
/// @ingroup Sieve
/// @brief `Decode::object` with its getters, and `Decode::pipeline`

namespace Sieve::Decode {

    /// @ingroup SieveBuilder
    /// @brief Getters that abort the builder when the lookup or decoder fails
    ///
    /// @details
    /// Each getter runs the navigation decoder of the same name on the
    /// builder's input and returns the plain value. On failure it abandons
    /// the builder: the enclosing `object` decoder then returns that failure.
    /// Only reachable through `getters::required`.
    class required_getter {
    public:
        /// @brief `Decode::field(name, d)` on the input
        /// @param name Member key
        /// @param d Decoder for the member's value
        /// @return The decoded member; aborts the builder on failure
        template<class T>
        T field(std::string name, const decoder<T>& d) const {
            return take(Decode::field(std::move(name), d)(m_Root));
        }

        template<class T>
        T at(std::vector<std::string> path, const decoder<T>& d) const {
            return take(Decode::at(std::move(path), d)(m_Root));
        }

        template<class T>
        T index(std::size_t i, const decoder<T>& d) const {
            return take(Decode::index(i, d)(m_Root));
        }

    private:
        friend class getters;
        friend class optional_getter;

        required_getter(const getters& owner, const Sieve::value& root) noexcept
            : m_Owner{ owner }, m_Root{ root } {}

        template<class T>
        T take(decode_result<T>&& r) const {
            if (!r) throw Sieve::detail::builder_abort{ &m_Owner, std::move(r.error()) };
            return *std::move(r);
        }

        const getters& m_Owner;
        const Sieve::value& m_Root;
    };

    /// @ingroup SieveBuilder
    /// @brief Getters that fall back when the target is absent or `null`
    ///
    /// @details
    /// For each getter the outcome depends on what the lookup finds:
    /// - nothing (missing field or path segment, index past the end):
    ///   @p fallback
    /// - `null` that @p d rejects: @p fallback
    /// - anything else: the result of @p d, a failure aborting the builder
    ///
    /// A lookup that cannot proceed because the data has the wrong shape (a
    /// non-object under `field`/`at`, a non-array under `index`) aborts the
    /// builder as well. Recovering from absence copies nothing from the
    /// input.
    ///
    /// Example:
    /// @code
    /// auto email = get.optional.field("email", Sieve::Decode::string(), "none");
    /// auto zip = get.optional.at({ "address", "zip" }, Sieve::Decode::int32(), 0);
    /// @endcode
    class optional_getter {
    public:
        template<class T>
        T field(std::string name, const decoder<T>& d, std::type_identity_t<T> fallback) const {
            auto locate = [&name](const Sieve::value& v) { return Sieve::detail::find_field(v, name); };
            auto report = [&name](const Sieve::detail::lookup_miss& miss) { return Sieve::detail::field_error(miss, name); };
            return m_Required.take(Sieve::detail::optional_lookup(m_Required.m_Root, locate, report, d, fallback));
        }

        template<class T>
        T at(std::vector<std::string> path, const decoder<T>& d, std::type_identity_t<T> fallback) const {
            auto locate = [&path](const Sieve::value& v) { return Sieve::detail::find_path(v, path); };
            auto report = [&path](const Sieve::detail::lookup_miss& miss) { return Sieve::detail::path_error(miss, path); };
            return m_Required.take(Sieve::detail::optional_lookup(m_Required.m_Root, locate, report, d, fallback));
        }

        template<class T>
        T index(std::size_t i, const decoder<T>& d, std::type_identity_t<T> fallback) const {
            auto locate = [i](const Sieve::value& v) { return Sieve::detail::find_index(v, i); };
            auto report = [i](const Sieve::detail::lookup_miss& miss) { return Sieve::detail::index_error(miss, i); };
            return m_Required.take(Sieve::detail::optional_lookup(m_Required.m_Root, locate, report, d, fallback));
        }

    private:
        friend class getters;

        optional_getter(const getters& owner, const Sieve::value& root) noexcept
            : m_Required{ owner, root } {}

        required_getter m_Required;
    };

    /// @ingroup SieveBuilder
    /// @brief Capability handed to an `object` builder; bound to one input
    ///
    /// @details
    /// Neither copyable nor assignable. A builder may let a nested `object`
    /// capture it by reference; a failure through it then ends the decode it
    /// belongs to, unless a `one_of` in between takes it as the failure of
    /// one alternative.
    class getters {
    public:
        explicit getters(const Sieve::value& root) noexcept
            : required{ *this, root }, optional{ *this, root } {}

        getters(const getters&) = delete;
        getters& operator=(const getters&) = delete;

        const required_getter required;     ///< Getters that must succeed
        const optional_getter optional;     ///< Getters with a fallback
    };

    /// @ingroup SieveBuilder
    /// @brief Decoder running @p builder once per input
    ///
    /// @details
    /// @p builder receives a fresh `getters` bound to the input and returns
    /// the record. The first failing getter stops it and becomes the result
    /// of the decoder. Other exceptions thrown by @p builder propagate and
    /// are reported as `direct` errors by `run`.
    ///
    /// An abort raised by the getters of an enclosing `object` (a nested
    /// builder capturing the outer `getters`) passes through this decoder
    /// and reaches its owner, or the nearest `one_of` on the way.
    ///
    /// @param builder Callable `const getters& -> T`
    /// @return `decoder<T>`
    template<class Builder>
        requires std::invocable<const Builder&, const getters&>
    auto object(Builder builder) -> decoder<std::invoke_result_t<const Builder&, const getters&>> {
        using result_type = std::invoke_result_t<const Builder&, const getters&>;
        return [builder = std::move(builder)](const Sieve::value& v) -> decode_result<result_type> {
            getters get{ v };
            try {
                return std::invoke(builder, std::as_const(get));
            } catch (Sieve::detail::builder_abort& abort) {
                if (abort.owner != &get) throw;
                return std::unexpected(std::move(abort.error));
            }
        };
    }

    /// @ingroup SieveBuilder
    /// @brief Immutable list of decoding steps; each call returns a longer pipeline
    ///
    /// @details
    /// `pipeline<Ts...>` holds one `decoder<T>` per step. `into(ctor)`
    /// turns it into a decoder that runs every step on the same input, left
    /// to right, stopping at the first failure, and calls `ctor` with the
    /// results in step order. A pipeline can be extended in several
    /// directions; extending never changes the original.
    ///
    /// @tparam Ts Result type of each step so far
    template<class... Ts>
    class pipeline {
    public:
        pipeline() = default;
        explicit pipeline(std::tuple<decoder<Ts>...> steps) : m_Steps(std::move(steps)) {}

        /// @brief Any decoder, run on the same input as the other steps
        template<class U>
        pipeline<Ts..., U> custom(decoder<U> d) const {
            return pipeline<Ts..., U>{ std::tuple_cat(m_Steps, std::make_tuple(std::move(d))) };
        }

        /// @brief `Decode::field(key, d)`
        template<class U>
        pipeline<Ts..., U> required(std::string key, decoder<U> d) const {
            return custom(Decode::field(std::move(key), std::move(d)));
        }

        template<class U>
        pipeline<Ts..., U> required_at(std::vector<std::string> path, decoder<U> d) const {
            return custom(Decode::at(std::move(path), std::move(d)));
        }

        /// @brief Member @p key decoded with @p d, or @p fallback when absent
        ///
        /// @details
        /// The input must be an object (`bad_type("an object")` otherwise).
        /// A missing member, or a `null` member that @p d rejects, yields
        /// @p fallback. Any other failure of @p d is the step's failure.
        ///
        /// @param key Member key
        /// @param d Decoder for the member's value
        /// @param fallback Result when the member is absent or an unusable `null`
        template<class U>
        pipeline<Ts..., U> optional(std::string key, decoder<U> d, std::type_identity_t<U> fallback) const {
            return custom(decoder<U>{ [key = std::move(key), d = std::move(d), fallback = std::move(fallback)](const Sieve::value& v) -> decode_result<U> {
                if (!v.is_object()) return std::unexpected(DecodeError::bad_type("an object", v));
                auto locate = [&key](const Sieve::value& root) { return Sieve::detail::find_field(root, key); };
                auto report = [&key](const Sieve::detail::lookup_miss& miss) { return Sieve::detail::field_error(miss, key); };
                return Sieve::detail::optional_lookup(v, locate, report, d, fallback);
            } });
        }

        /// @brief As `optional`, following @p path; a non-object met on the
        ///        way is a failure, not an absence
        template<class U>
        pipeline<Ts..., U> optional_at(std::vector<std::string> path, decoder<U> d, std::type_identity_t<U> fallback) const {
            return custom(decoder<U>{ [path = std::move(path), d = std::move(d), fallback = std::move(fallback)](const Sieve::value& v) -> decode_result<U> {
                if (!v.is_object()) return std::unexpected(DecodeError::bad_type("an object", v));
                auto locate = [&path](const Sieve::value& root) { return Sieve::detail::find_path(root, path); };
                auto report = [&path](const Sieve::detail::lookup_miss& miss) { return Sieve::detail::path_error(miss, path); };
                return Sieve::detail::optional_lookup(v, locate, report, d, fallback);
            } });
        }

        /// @brief A constant, ignoring the input
        template<class U>
        pipeline<Ts..., U> hardcoded(U output) const {
            return custom(Decode::succeed(std::move(output)));
        }

        /// @brief Decoder feeding every step's result, in order, to @p ctor
        template<class Ctor>
            requires (sizeof...(Ts) >= 1) && std::invocable<const Ctor&, Ts...>
        auto into(Ctor ctor) const -> decoder<std::invoke_result_t<const Ctor&, Ts...>> {
            return std::apply([&ctor](const auto&... steps) { return Decode::map(std::move(ctor), steps...); }, m_Steps);
        }

    private:
        std::tuple<decoder<Ts>...> m_Steps;
    };

} // namespace Sieve::Decode
