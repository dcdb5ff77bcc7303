#include "sieve/decoder.hpp"

#include <charconv>
#include <cmath>
#include <limits>


namespace Sieve {

    namespace {

        // Largest magnitude a double holds with every integer below it exact
        constexpr double max_exact_integer = 9007199254740992.0; // 2^53

        constexpr std::string_view not_integral = "Value is not an integral value";

        std::string join(std::span<const std::string> segments, std::string_view sep) {
            std::string out;
            for (size_t i = 0; i < segments.size(); i++) {
                if (i != 0) out += sep;
                out += segments[i];
            }
            return out;
        }

        bool is_integral(double d) noexcept {
            return std::isfinite(d) && d == std::trunc(d);
        }

        // Full-string integer parse shared by int64 and uint64
        template<class I>
        std::expected<I, std::string> parse_integer(std::string_view text, std::string_view range_reason) {
            I out{};
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
            if (ec == std::errc::result_out_of_range) return std::unexpected(std::string{ range_reason });
            if (ec != std::errc{} || ptr != text.data() + text.size())
                return std::unexpected(std::string{ "Input string was not in a correct format." });
            return out;
        }

        template<class I>
        decode_result<I> decode_integer(const value& v, std::string_view desc, std::string_view range_reason) {
            if (v.is_string()) {
                auto parsed = parse_integer<I>(v.as_string(), range_reason);
                if (!parsed) return std::unexpected(DecodeError::bad_primitive_extra(desc, v, parsed.error()));
                return *parsed;
            }
            if (v.is_number()) {
                const double d = v.as_number();
                if (!is_integral(d)) return std::unexpected(DecodeError::bad_primitive_extra(desc, v, not_integral));
                if (std::fabs(d) > max_exact_integer || (std::is_unsigned_v<I> && d < 0))
                    return std::unexpected(DecodeError::bad_primitive_extra(desc, v, range_reason));
                return static_cast<I>(d);
            }
            return std::unexpected(DecodeError::bad_primitive(desc, v));
        }

        // String-only decoders built on a `parse(text) -> std::expected<T, std::string>`
        template<class T, class Parse>
        decoder<T> from_text(std::string_view desc, Parse parse) {
            return [desc = std::string{ desc }, parse](const value& v) -> decode_result<T> {
                if (!v.is_string()) return std::unexpected(DecodeError::bad_primitive(desc, v));
                auto parsed = parse(v.as_string());
                if (!parsed) return std::unexpected(DecodeError::bad_primitive_extra(desc, v, parsed.error()));
                return *std::move(parsed);
            };
        }

    } // namespace

    namespace detail {

        lookup_result find_field(const value& v, std::string_view name) noexcept {
            if (!v.is_object()) return std::unexpected(lookup_miss{ DecodeError::code::bad_type, &v, 0 });
            const value* found = v.find(name);
            if (!found) return std::unexpected(lookup_miss{ DecodeError::code::bad_field, &v, 0 });
            return found;
        }

        lookup_result find_path(const value& v, std::span<const std::string> path) noexcept {
            const value* cur = &v;
            for (size_t i = 0; i < path.size(); i++) {
                if (!cur->is_object()) return std::unexpected(lookup_miss{ DecodeError::code::bad_type, cur, i });
                const value* next = cur->find(path[i]);
                // bad_path reports the root, not the node lacking the segment
                if (!next) return std::unexpected(lookup_miss{ DecodeError::code::bad_path, &v, i });
                cur = next;
            }
            return cur;
        }

        lookup_result find_index(const value& v, std::size_t i) noexcept {
            if (!v.is_array()) return std::unexpected(lookup_miss{ DecodeError::code::bad_primitive, &v, 0 });
            if (i >= v.size()) return std::unexpected(lookup_miss{ DecodeError::code::too_small_array, &v, 0 });
            return &v.as_array()[i];
        }

        DecodeError field_error(const lookup_miss& miss, std::string_view name) {
            if (miss.errc == DecodeError::code::bad_type) return DecodeError::bad_type("an object", *miss.where);
            std::string desc = "an object with a field named `";
            desc.append(name).append("`");
            return DecodeError::bad_field(desc, *miss.where);
        }

        DecodeError path_error(const lookup_miss& miss, std::span<const std::string> path) {
            if (miss.errc == DecodeError::code::bad_type)
                return DecodeError::bad_type("an object at `" + join(path.first(miss.segment), ".") + "`", *miss.where);
            return DecodeError::bad_path("an object with path `" + join(path, ".") + "`", *miss.where, path[miss.segment]);
        }

        DecodeError index_error(const lookup_miss& miss, std::size_t i) {
            if (miss.errc == DecodeError::code::bad_primitive) return DecodeError::bad_primitive("an array", *miss.where);
            return DecodeError::too_small_array(
                "a longer array. Need index `" + std::to_string(i) + "` but there are only `" + std::to_string(miss.where->size()) + "` entries",
                *miss.where);
        }

        decode_result<const value*> field_of(const value& v, std::string_view name) {
            auto found = find_field(v, name);
            if (!found) return std::unexpected(field_error(found.error(), name));
            return *found;
        }

        decode_result<const value*> path_of(const value& v, std::span<const std::string> path) {
            auto found = find_path(v, path);
            if (!found) return std::unexpected(path_error(found.error(), path));
            return *found;
        }

        decode_result<const value*> index_of(const value& v, std::size_t i) {
            auto found = find_index(v, i);
            if (!found) return std::unexpected(index_error(found.error(), i));
            return *found;
        }

    } // namespace detail

    namespace Decode {

#pragma region basic

        decoder<std::string> string() {
            return [](const Sieve::value& v) -> decode_result<std::string> {
                if (!v.is_string()) return std::unexpected(DecodeError::bad_primitive("a string", v));
                const auto& s = v.as_string();
                return std::string{ s.begin(), s.end() };
            };
        }

        decoder<int> int32() {
            return [](const Sieve::value& v) -> decode_result<int> {
                if (!v.is_number()) return std::unexpected(DecodeError::bad_primitive("an int", v));
                const double d = v.as_number();
                if (std::isnan(d) || (std::isfinite(d) && d != std::trunc(d)))
                    return std::unexpected(DecodeError::bad_primitive_extra("an int", v, not_integral));
                if (d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max())
                    return std::unexpected(DecodeError::bad_primitive_extra("an int", v, "Value was either too large or too small for an int"));
                return static_cast<int>(d);
            };
        }

        decoder<bool> boolean() {
            return [](const Sieve::value& v) -> decode_result<bool> {
                if (!v.is_bool()) return std::unexpected(DecodeError::bad_primitive("a boolean", v));
                return v.as_bool();
            };
        }

        decoder<double> float64() {
            return [](const Sieve::value& v) -> decode_result<double> {
                if (!v.is_number()) return std::unexpected(DecodeError::bad_primitive("a float", v));
                return v.as_number();
            };
        }

        decoder<Sieve::value> raw() {
            return [](const Sieve::value& v) -> decode_result<Sieve::value> { return v; };
        }

#pragma endregion
#pragma region extended

        decoder<std::int64_t> int64() {
            return [](const Sieve::value& v) {
                return decode_integer<std::int64_t>(v, "an int64", "Value was either too large or too small for an Int64.");
            };
        }

        decoder<std::uint64_t> uint64() {
            return [](const Sieve::value& v) {
                return decode_integer<std::uint64_t>(v, "an uint64", "Value was either too large or too small for a UInt64.");
            };
        }

        decoder<Sieve::big_integer> bigint() {
            return [](const Sieve::value& v) -> decode_result<Sieve::big_integer> {
                if (v.is_number()) {
                    const double d = v.as_number();
                    if (!is_integral(d)) return std::unexpected(DecodeError::bad_primitive_extra("a bigint", v, not_integral));
                    char buf[400];
                    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed, 0);
                    auto parsed = ec == std::errc{}
                        ? Sieve::big_integer::parse(std::string_view{ buf, static_cast<size_t>(ptr - buf) })
                        : std::expected<Sieve::big_integer, std::string>{ std::unexpect, "Input string was not in a correct format." };
                    if (!parsed) return std::unexpected(DecodeError::bad_primitive_extra("a bigint", v, parsed.error()));
                    return *std::move(parsed);
                }
                if (v.is_string()) {
                    auto parsed = Sieve::big_integer::parse(v.as_string());
                    if (!parsed) return std::unexpected(DecodeError::bad_primitive_extra("a bigint", v, parsed.error()));
                    return *std::move(parsed);
                }
                return std::unexpected(DecodeError::bad_primitive("a bigint", v));
            };
        }

        decoder<Sieve::decimal> decimal() {
            return [](const Sieve::value& v) -> decode_result<Sieve::decimal> {
                std::expected<Sieve::decimal, std::string> parsed;
                if (v.is_number()) {
                    if (!std::isfinite(v.as_number()))
                        return std::unexpected(DecodeError::bad_primitive_extra("a decimal", v, "Value was either too large or too small for a Decimal."));
                    parsed = Sieve::decimal::from_double(v.as_number());
                } else if (v.is_string()) {
                    parsed = Sieve::decimal::parse(v.as_string());
                } else {
                    return std::unexpected(DecodeError::bad_primitive("a decimal", v));
                }
                if (!parsed) return std::unexpected(DecodeError::bad_primitive_extra("a decimal", v, parsed.error()));
                return *std::move(parsed);
            };
        }

        decoder<Sieve::guid> guid() {
            return from_text<Sieve::guid>("a guid", [](std::string_view s) { return Sieve::guid::parse(s); });
        }

        decoder<Sieve::date_time> datetime() {
            return from_text<Sieve::date_time>("a datetime", [](std::string_view s) { return parse_date_time(s); });
        }

        decoder<Sieve::date_time_offset> datetime_offset() {
            return from_text<Sieve::date_time_offset>("a datetimeoffset", [](std::string_view s) { return Sieve::date_time_offset::parse(s); });
        }

#pragma endregion

    } // namespace Decode

} // namespace Sieve
