#include "sieve/extended.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <format>
#include <optional>

namespace Sieve {

    namespace {

        constexpr std::string_view bad_format = "Input string was not in a correct format.";

        bool all_digits(std::string_view s) noexcept {
            if (s.empty()) return false;
            for (char c : s) {
                if (c < '0' || c > '9') return false;
            }
            return true;
        }

        std::string_view strip_leading_zeros(std::string_view s) noexcept {
            while (s.size() > 1 && s.front() == '0') s.remove_prefix(1);
            return s;
        }

        std::string_view strip_trailing_zeros(std::string_view s) noexcept {
            while (!s.empty() && s.back() == '0') s.remove_suffix(1);
            return s;
        }

        // Splits an optional leading sign off `text`; true when negative
        bool take_sign(std::string_view& text) noexcept {
            if (text.empty()) return false;
            if (text.front() == '-') { text.remove_prefix(1); return true; }
            if (text.front() == '+') text.remove_prefix(1);
            return false;
        }

        int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
            if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        // Reads exactly `n` digits at `pos`
        std::optional<int> fixed_digits(std::string_view text, size_t pos, size_t n) noexcept {
            if (pos + n > text.size()) return std::nullopt;
            int out = 0;
            for (size_t i = pos; i < pos + n; i++) {
                if (text[i] < '0' || text[i] > '9') return std::nullopt;
                out = out * 10 + (text[i] - '0');
            }
            return out;
        }

        struct iso_parts {
            std::chrono::local_time<std::chrono::milliseconds> local;
            std::optional<std::chrono::minutes> offset;
        };

        std::expected<iso_parts, std::string> parse_iso(std::string_view text) {
            using namespace std::chrono;
            const std::string invalid = "String '" + std::string{ text } + "' was not recognized as a valid DateTime.";

            auto year = fixed_digits(text, 0, 4);
            auto month = fixed_digits(text, 5, 2);
            auto day = fixed_digits(text, 8, 2);
            if (!year || !month || !day || text[4] != '-' || text[7] != '-') return std::unexpected(invalid);

            year_month_day ymd{ std::chrono::year{ *year }, std::chrono::month{ static_cast<unsigned>(*month) }, std::chrono::day{ static_cast<unsigned>(*day) } };
            if (!ymd.ok()) return std::unexpected(invalid);

            int hour = 0, minute = 0, second = 0;
            milliseconds fraction{ 0 };
            size_t pos = 10;

            if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' ')) {
                auto h = fixed_digits(text, pos + 1, 2);
                auto m = fixed_digits(text, pos + 4, 2);
                if (!h || !m || text[pos + 3] != ':') return std::unexpected(invalid);
                hour = *h;
                minute = *m;
                pos += 6;

                if (pos < text.size() && text[pos] == ':') {
                    auto s = fixed_digits(text, pos + 1, 2);
                    if (!s) return std::unexpected(invalid);
                    second = *s;
                    pos += 3;

                    if (pos < text.size() && text[pos] == '.') {
                        pos++;
                        size_t digits = 0;
                        int ms = 0;
                        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                            // Sub-millisecond digits are truncated
                            if (digits < 3) ms = ms * 10 + (text[pos] - '0');
                            digits++;
                            pos++;
                        }
                        if (digits == 0 || digits > 9) return std::unexpected(invalid);
                        for (size_t d = digits; d < 3; d++) ms *= 10;
                        fraction = milliseconds{ ms };
                    }
                }
                if (hour > 23 || minute > 59 || second > 59) return std::unexpected(invalid);
            }

            iso_parts parts;
            parts.local = local_days{ ymd } + hours{ hour } + minutes{ minute } + seconds{ second } + fraction;

            if (pos == text.size()) return parts;

            if (text[pos] == 'Z' || text[pos] == 'z') {
                if (pos + 1 != text.size()) return std::unexpected(invalid);
                parts.offset = minutes{ 0 };
                return parts;
            }

            if (text[pos] != '+' && text[pos] != '-') return std::unexpected(invalid);
            const int sign = text[pos] == '-' ? -1 : 1;
            auto oh = fixed_digits(text, pos + 1, 2);
            size_t minute_pos = pos + 3;
            if (minute_pos < text.size() && text[minute_pos] == ':') minute_pos++;
            auto om = fixed_digits(text, minute_pos, 2);
            if (!oh || !om || minute_pos + 2 != text.size() || *oh > 14 || *om > 59) return std::unexpected(invalid);

            parts.offset = minutes{ sign * (*oh * 60 + *om) };
            return parts;
        }

        // "YYYY-MM-DDTHH:MM:SS[.mmm]" of a time point counted in milliseconds
        template<class Clock>
        std::string format_clock(std::chrono::time_point<Clock, std::chrono::milliseconds> tp) {
            using namespace std::chrono;
            auto day_point = floor<days>(tp);
            year_month_day ymd{ day_point };
            hh_mm_ss hms{ tp - day_point };

            std::string out = std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                hms.hours().count(), hms.minutes().count(), hms.seconds().count());
            if (auto ms = hms.subseconds().count(); ms != 0) out += std::format(".{:03}", ms);
            return out;
        }

    } // namespace

#pragma region big_integer

    big_integer::big_integer(std::int64_t v)
        : m_Negative{ v < 0 } {
        // Magnitude through uint64 so INT64_MIN does not overflow
        std::uint64_t magnitude = v < 0 ? 0 - static_cast<std::uint64_t>(v) : static_cast<std::uint64_t>(v);
        m_Digits = std::to_string(magnitude);
    }

    std::expected<big_integer, std::string> big_integer::parse(std::string_view text) {
        bool negative = take_sign(text);
        if (!all_digits(text)) return std::unexpected(std::string{ bad_format });

        big_integer out;
        out.m_Digits = std::string{ strip_leading_zeros(text) };
        out.m_Negative = negative && out.m_Digits != "0";
        return out;
    }

    std::string big_integer::to_string() const {
        return m_Negative ? "-" + m_Digits : m_Digits;
    }

#pragma endregion
#pragma region decimal

    std::expected<decimal, std::string> decimal::parse(std::string_view text) {
        bool negative = take_sign(text);

        std::string_view integral = text;
        std::string_view fraction;
        if (auto dot = text.find('.'); dot != std::string_view::npos) {
            integral = text.substr(0, dot);
            fraction = text.substr(dot + 1);
            if (!all_digits(fraction)) return std::unexpected(std::string{ bad_format });
        }
        if (!all_digits(integral)) return std::unexpected(std::string{ bad_format });

        integral = strip_leading_zeros(integral);
        const size_t significant = (integral == "0" ? 0 : integral.size()) + fraction.size();
        if (fraction.size() > 28 || significant > 29)
            return std::unexpected(std::string{ "Value was either too large or too small for a Decimal." });

        decimal out;
        out.m_Integral = std::string{ integral };
        out.m_Fraction = std::string{ fraction };
        out.m_Negative = negative && !(out.m_Integral == "0" && strip_trailing_zeros(out.m_Fraction).empty());
        return out;
    }

    std::expected<decimal, std::string> decimal::from_double(double d) {
        char buf[400];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed);
        if (ec != std::errc{}) return std::unexpected(std::string{ "Value was either too large or too small for a Decimal." });
        return parse(std::string_view{ buf, static_cast<size_t>(ptr - buf) });
    }

    std::string decimal::to_string() const {
        std::string out = m_Negative ? "-" + m_Integral : m_Integral;
        if (!m_Fraction.empty()) out += "." + m_Fraction;
        return out;
    }

    double decimal::to_double() const {
        std::string text = to_string();
        double d = 0.0;
        std::from_chars(text.data(), text.data() + text.size(), d);
        return d;
    }

    bool operator==(const decimal& lhs, const decimal& rhs) {
        return lhs.m_Negative == rhs.m_Negative
            && lhs.m_Integral == rhs.m_Integral
            && strip_trailing_zeros(lhs.m_Fraction) == strip_trailing_zeros(rhs.m_Fraction);
    }

#pragma endregion
#pragma region guid

    std::expected<guid, std::string> guid::parse(std::string_view text) {
        const std::string invalid = "Unrecognized Guid format.";

        if (text.size() == 38) {
            if (text.front() != '{' || text.back() != '}') return std::unexpected(invalid);
            text = text.substr(1, 36);
        }

        std::string hex;
        if (text.size() == 36) {
            for (size_t i = 0; i < text.size(); i++) {
                const bool dash_slot = i == 8 || i == 13 || i == 18 || i == 23;
                if (dash_slot != (text[i] == '-')) return std::unexpected(invalid);
                if (!dash_slot) hex.push_back(text[i]);
            }
        } else if (text.size() == 32) {
            hex.assign(text.begin(), text.end());
        } else {
            return std::unexpected(invalid);
        }

        std::array<std::uint8_t, 16> bytes{};
        for (size_t i = 0; i < bytes.size(); i++) {
            int hi = hex_value(hex[2 * i]);
            int lo = hex_value(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) return std::unexpected(invalid);
            bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
        }
        return guid{ bytes };
    }

    std::string guid::to_string() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < m_Bytes.size(); i++) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
            out.push_back(digits[m_Bytes[i] >> 4]);
            out.push_back(digits[m_Bytes[i] & 0xF]);
        }
        return out;
    }

#pragma endregion
#pragma region date and time

    std::expected<date_time, std::string> parse_date_time(std::string_view text) {
        auto parts = parse_iso(text);
        if (!parts) return std::unexpected(std::move(parts.error()));
        auto offset = parts->offset.value_or(std::chrono::minutes{ 0 });
        return date_time{ parts->local.time_since_epoch() - offset };
    }

    std::string format_date_time(date_time t) {
        return format_clock(t) + "Z";
    }

    std::expected<date_time_offset, std::string> date_time_offset::parse(std::string_view text) {
        auto parts = parse_iso(text);
        if (!parts) return std::unexpected(std::move(parts.error()));
        return date_time_offset{ parts->local, parts->offset.value_or(std::chrono::minutes{ 0 }) };
    }

    std::string date_time_offset::to_string() const {
        const auto total = offset.count();
        const auto magnitude = std::abs(total);
        return format_clock(local) + std::format("{}{:02}:{:02}", total < 0 ? '-' : '+', magnitude / 60, magnitude % 60);
    }

#pragma endregion

} // namespace Sieve
