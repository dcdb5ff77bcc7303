#include "sieve/json.hpp"

#include <sstream>
#include <charconv>
#include <cctype>
#include <cmath>
#include <limits>


namespace Sieve {

    namespace detail {

        template<typename T>
        using expected_t = std::expected<T, ParseError>;
        using expected_void = std::expected<void, ParseError>;

        bool is_valid_utf8(std::string_view s) {
            const auto* data = reinterpret_cast<const unsigned char*>(s.data());
            size_t i = 0;
            const size_t n = s.size();

            auto continuation = [&](size_t at) { return at < n && (data[at] & 0xC0) == 0x80; };

            while (i < n) {
                unsigned char c = data[i];
                if (c <= 0x7F) { i++; continue; }

                size_t len = 0;
                unsigned char lo = 0x80, hi = 0xBF; // allowed range of the 2nd byte
                if (c >= 0xC2 && c <= 0xDF) len = 2;
                else if (c == 0xE0) { len = 3; lo = 0xA0; }
                else if (c == 0xED) { len = 3; hi = 0x9F; }
                else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) len = 3;
                else if (c == 0xF0) { len = 4; lo = 0x90; }
                else if (c >= 0xF1 && c <= 0xF3) len = 4;
                else if (c == 0xF4) { len = 4; hi = 0x8F; }
                else return false;

                if (i + len > n) return false;
                if (data[i + 1] < lo || data[i + 1] > hi) return false;
                for (size_t k = 2; k < len; k++) {
                    if (!continuation(i + k)) return false;
                }
                i += len;
            }
            return true;
        }

        void append_utf8(uint32_t cp, string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        // Number literal beyond the range of a double: infinity when its
        // magnitude is at least 1, zero otherwise. `text` is already validated.
        double out_of_range_number(std::string_view text) noexcept {
            auto digit = [&text](size_t at) { return at < text.size() && text[at] >= '0' && text[at] <= '9'; };

            const bool negative = text.front() == '-';
            size_t i = negative ? 1 : 0;

            // decimal exponent of the leading significant digit
            long long lead = 0;
            bool significant = text[i] != '0';
            const size_t int_start = i;
            while (digit(i)) i++;
            if (significant) lead = static_cast<long long>(i - int_start) - 1;

            if (i < text.size() && text[i] == '.') {
                i++;
                for (long long pos = 1; digit(i); i++, pos++) {
                    if (!significant && text[i] != '0') {
                        significant = true;
                        lead = -pos;
                    }
                }
            }

            if (!significant) return negative ? -0.0 : 0.0;

            long long exp = 0;
            if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
                i++;
                bool exp_negative = false;
                if (text[i] == '+' || text[i] == '-') exp_negative = text[i++] == '-';
                for (; digit(i); i++) {
                    if (exp < 1'000'000'000) exp = exp * 10 + (text[i] - '0');
                }
                if (exp_negative) exp = -exp;
            }

            const double magnitude = lead + exp >= 0 ? std::numeric_limits<double>::infinity() : 0.0;
            return negative ? -magnitude : magnitude;
        }

#pragma region Parser

        class reader {
        public:
            reader(std::string_view text, const ParseOptions& opts, std::pmr::memory_resource* res)
                : m_Text{ text }, m_Opts{ opts }, m_MemRes{ res } {}

            ParseResult document() {
                auto v = parse_value();
                if (!v) return std::unexpected(std::move(v.error()));
                if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                if (!eof()) return fail(ParseError::code::trailing_characters, "Trailing characters after top-level JSON value");
                return *std::move(v);
            }

        private:
            std::string_view m_Text;
            const ParseOptions& m_Opts;
            std::pmr::memory_resource* m_MemRes;
            size_t m_Idx = 0;
            size_t m_Line = 1;
            size_t m_Column = 1;
            size_t m_Depth = 0;

            [[nodiscard]] bool eof() const noexcept { return m_Idx >= m_Text.size(); }
            [[nodiscard]] char peek(size_t ahead = 0) const noexcept {
                return m_Idx + ahead < m_Text.size() ? m_Text[m_Idx + ahead] : '\0';
            }

            char get() {
                if (eof()) return '\0';
                char c = m_Text[m_Idx++];
                if (c == '\n') {
                    m_Line++;
                    m_Column = 1;
                } else m_Column++;
                return c;
            }

            bool consume(char c) {
                if (eof() || peek() != c) return false;
                get();
                return true;
            }

            [[nodiscard]] std::unexpected<ParseError> fail(ParseError::code c, std::string_view msg) const {
                return std::unexpected(ParseError::make(c, m_Idx, m_Line, m_Column, msg));
            }

            // Entering an array/object; undone by `leave`
            expected_void enter() {
                if (m_Opts.max_depth != 0 && m_Depth + 1 > m_Opts.max_depth)
                    return fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
                m_Depth++;
                return {};
            }
            void leave() noexcept { m_Depth--; }

            static bool is_ws(char c) noexcept { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
            static bool is_digit(char c) noexcept { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

            expected_void skip_ws() {
                while (!eof()) {
                    char c = peek();
                    if (is_ws(c)) { get(); continue; }
                    if (!m_Opts.allow_comments || c != '/') break;

                    if (peek(1) == '/') {
                        while (!eof() && peek() != '\n') get();
                    } else if (peek(1) == '*') {
                        get();
                        get();
                        bool closed = false;
                        while (!eof()) {
                            if (get() == '*' && peek() == '/') {
                                get();
                                closed = true;
                                break;
                            }
                        }
                        if (!closed) return fail(ParseError::code::unexpected_end_of_input, "Nonterminated block comment");
                    } else {
                        break;
                    }
                }
                return {};
            }

            expected_void literal(std::string_view word) {
                for (char expected : word) {
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Truncated literal");
                    if (get() != expected) return fail(ParseError::code::unexpected_character, "Invalid literal");
                }
                return {};
            }

            expected_t<uint16_t> hex4() {
                uint16_t val = 0;
                for (int i = 0; i < 4; i++) {
                    if (eof()) return fail(ParseError::code::invalid_unicode_escape, "Unexpected end in unicode escape");
                    char h = get();
                    unsigned digit = 0;
                    if (h >= '0' && h <= '9') digit = h - '0';
                    else if (h >= 'A' && h <= 'F') digit = 10 + (h - 'A');
                    else if (h >= 'a' && h <= 'f') digit = 10 + (h - 'a');
                    else return fail(ParseError::code::invalid_unicode_escape, "Invalid hex digit in unicode escape");
                    val = static_cast<uint16_t>((val << 4) | digit);
                }
                return val;
            }

            expected_void unicode_escape(string& out) {
                auto first = hex4();
                if (!first) return std::unexpected(first.error());

                uint32_t cp = *first;
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (!(consume('\\') && consume('u')))
                        return fail(ParseError::code::invalid_unicode_escape, "Expected low surrogate after high surrogate");
                    auto second = hex4();
                    if (!second) return std::unexpected(second.error());
                    if (*second < 0xDC00 || *second > 0xDFFF)
                        return fail(ParseError::code::invalid_unicode_escape, "Invalid low surrogate");
                    cp = 0x10000u + (((cp - 0xD800u) << 10) | (*second - 0xDC00u));
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    return fail(ParseError::code::invalid_unicode_escape, "Unpaired low surrogate");
                }
                append_utf8(cp, out);
                return {};
            }

            expected_t<string> parse_string() {
                if (!consume('"')) return fail(ParseError::code::invalid_string, "Expected '\"' to start a string");

                string out{ allocator_type(m_MemRes) };
                while (!eof()) {
                    char c = get();
                    if (c == '"') {
                        if (!is_valid_utf8(out)) return fail(ParseError::code::invalid_string, "Invalid UTF-8 sequence in string");
                        return out;
                    }
                    if (static_cast<unsigned char>(c) < 0x20) return fail(ParseError::code::invalid_string, "Control character in string");
                    if (c != '\\') {
                        out.push_back(c);
                        continue;
                    }
                    if (eof()) return fail(ParseError::code::invalid_escape, "Unfinished escape sequence");
                    switch (get()) {
                    case '"':  out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/':  out.push_back('/'); break;
                    case 'b':  out.push_back('\b'); break;
                    case 'f':  out.push_back('\f'); break;
                    case 'n':  out.push_back('\n'); break;
                    case 'r':  out.push_back('\r'); break;
                    case 't':  out.push_back('\t'); break;
                    case 'u':
                        if (auto r = unicode_escape(out); !r) return std::unexpected(r.error());
                        break;
                    default:
                        return fail(ParseError::code::invalid_escape, "Invalid escape sequence");
                    }
                }
                return fail(ParseError::code::unexpected_end_of_input, "Nonterminated string");
            }

            expected_t<double> parse_number() {
                const size_t start = m_Idx;

                if (consume('-') && !is_digit(peek()))
                    return fail(ParseError::code::unexpected_character, "Expected digit after '-'");

                char first = get();
                if (!is_digit(first)) return fail(ParseError::code::invalid_number, "Expected digit");
                if (first == '0' && is_digit(peek())) return fail(ParseError::code::invalid_number, "Leading zeros disallowed");
                while (is_digit(peek())) get();

                if (consume('.')) {
                    if (!is_digit(peek())) return fail(ParseError::code::invalid_number, "Expected digit after '.'");
                    while (is_digit(peek())) get();
                }

                if (peek() == 'e' || peek() == 'E') {
                    get();
                    if (peek() == '+' || peek() == '-') get();
                    if (!is_digit(peek())) return fail(ParseError::code::invalid_number, "Expected digit in exponent");
                    while (is_digit(peek())) get();
                    char c = peek();
                    if (!(c == '\0' || c == ',' || c == ']' || c == '}' || is_ws(c)))
                        return fail(ParseError::code::invalid_number, "Invalid character in exponent");
                }

                auto text = m_Text.substr(start, m_Idx - start);
                double res = 0.0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), res);
                if (ec == std::errc::result_out_of_range) return out_of_range_number(text);
                if (ec != std::errc{}) return fail(ParseError::code::invalid_number, "Failed to parse number");
                return res;
            }

            // After a ',' inside a container: true when a permitted trailing comma closes it
            expected_t<bool> trailing_close(char close) {
                if (peek() != close) return false;
                if (!m_Opts.allow_trailing_commas) return fail(ParseError::code::trailing_characters, "Trailing commas not allowed");
                get();
                return true;
            }

            expected_t<value> parse_array() {
                if (auto d = enter(); !d) return std::unexpected(d.error());
                auto result = parse_array_body();
                leave();
                return result;
            }

            expected_t<value> parse_array_body() {
                get(); // '['
                array arr{ allocator_type(m_MemRes) };

                if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                if (consume(']')) return value{ std::move(arr), m_MemRes };

                while (true) {
                    auto elem = parse_value();
                    if (!elem) return std::unexpected(std::move(elem.error()));
                    arr.emplace_back(std::move(*elem));

                    if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                    if (consume(']')) break;
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated array, expected ',' or ']'");
                    if (!consume(',')) return fail(ParseError::code::unexpected_character, "Expected ',' or ']' in array");

                    if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                    auto closed = trailing_close(']');
                    if (!closed) return std::unexpected(closed.error());
                    if (*closed) break;
                }
                return value{ std::move(arr), m_MemRes };
            }

            expected_t<value> parse_object() {
                if (auto d = enter(); !d) return std::unexpected(d.error());
                auto result = parse_object_body();
                leave();
                return result;
            }

            expected_t<value> parse_object_body() {
                get(); // '{'
                value result{ object{ allocator_type(m_MemRes) }, m_MemRes };

                if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                if (consume('}')) return result;

                while (true) {
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected '}' or string key");
                    if (peek() != '"') return fail(ParseError::code::unexpected_character, "Expected '\"' to start object key");
                    auto key = parse_string();
                    if (!key) return std::unexpected(key.error());

                    if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ':' after key");
                    if (!consume(':')) return fail(ParseError::code::unexpected_character, "Expected ':' after object key");

                    auto val = parse_value();
                    if (!val) return std::unexpected(std::move(val.error()));
                    // Duplicate keys: last value wins, first position is kept
                    result[*key] = std::move(*val);

                    if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                    if (consume('}')) break;
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ',' or '}'");
                    if (!consume(',')) return fail(ParseError::code::unexpected_character, "Expected ',' or '}' in object");

                    if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                    auto closed = trailing_close('}');
                    if (!closed) return std::unexpected(closed.error());
                    if (*closed) break;
                }
                return result;
            }

            expected_t<value> parse_value() {
                if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Expected JSON value");

                switch (char c = peek()) {
                case 'n':
                    if (auto r = literal("null"); !r) return std::unexpected(r.error());
                    return value{ nullptr, m_MemRes };
                case 't':
                    if (auto r = literal("true"); !r) return std::unexpected(r.error());
                    return value{ true, m_MemRes };
                case 'f':
                    if (auto r = literal("false"); !r) return std::unexpected(r.error());
                    return value{ false, m_MemRes };
                case '"': {
                    auto str = parse_string();
                    if (!str) return std::unexpected(str.error());
                    return value{ std::move(*str), m_MemRes };
                }
                case '[': return parse_array();
                case '{': return parse_object();
                default:
                    if (c == '-' || is_digit(c)) {
                        auto num = parse_number();
                        if (!num) return std::unexpected(num.error());
                        return value{ *num, m_MemRes };
                    }
                    if (c == '.') return fail(ParseError::code::invalid_number, "Fractional values must start with a 0");
                    return fail(ParseError::code::unexpected_character, "Unexpected character while parsing value");
                }
            }
        };

#pragma endregion
#pragma region Serializer

        class writer {
        public:
            writer(std::ostream& os, const WriteOptions& opts, bool bounded)
                : m_Os{ os }, m_Opts{ opts }, m_Bounded{ bounded && opts.max_depth != 0 } {}

            // False when the depth bound was hit; output is then incomplete
            bool write(const value& v, size_t depth) {
                switch (v.type()) {
                case kind::null: m_Os << "null"; return true;
                case kind::boolean: m_Os << (v.as_bool() ? "true" : "false"); return true;
                case kind::number: number(v.as_number()); return true;
                case kind::string: quoted(v.as_string()); return true;
                case kind::array: {
                    if (m_Bounded && depth >= m_Opts.max_depth) return false;
                    const auto& arr = v.as_array();
                    if (arr.empty()) { m_Os << "[]"; return true; }
                    m_Os.put('[');
                    for (size_t i = 0; i < arr.size(); i++) {
                        if (i != 0) m_Os.put(',');
                        newline(depth + 1);
                        if (!write(arr[i], depth + 1)) return false;
                    }
                    newline(depth);
                    m_Os.put(']');
                    return true;
                }
                case kind::object: {
                    if (m_Bounded && depth >= m_Opts.max_depth) return false;
                    const auto& obj = v.as_object();
                    if (obj.empty()) { m_Os << "{}"; return true; }
                    m_Os.put('{');
                    for (size_t i = 0; i < obj.size(); i++) {
                        if (i != 0) m_Os.put(',');
                        newline(depth + 1);
                        quoted(obj[i].key);
                        m_Os << (m_Opts.pretty ? ": " : ":");
                        if (!write(obj[i].val, depth + 1)) return false;
                    }
                    newline(depth);
                    m_Os.put('}');
                    return true;
                }
                }
                m_Os << "null";
                return true;
            }

        private:
            std::ostream& m_Os;
            const WriteOptions& m_Opts;
            bool m_Bounded;

            void newline(size_t depth) {
                if (!m_Opts.pretty) return;
                m_Os.put('\n');
                for (size_t i = 0; i < depth * m_Opts.indent; i++) m_Os.put(' ');
            }

            void number(double d) {
                if (!std::isfinite(d)) {
                    m_Os << "null";
                    return;
                }
                char buf[64];
                // Shortest round-trip form: 25.0 -> "25", 1.2 -> "1.2"
                auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
                if (ec != std::errc{}) m_Os << "0";
                else m_Os.write(buf, ptr - buf);
            }

            void quoted(std::string_view s) {
                m_Os.put('"');
                for (unsigned char c : s) {
                    switch (c) {
                    case '"': m_Os << "\\\""; break;
                    case '\\': m_Os << "\\\\"; break;
                    case '\b': m_Os << "\\b"; break;
                    case '\f': m_Os << "\\f"; break;
                    case '\n': m_Os << "\\n"; break;
                    case '\r': m_Os << "\\r"; break;
                    case '\t': m_Os << "\\t"; break;
                    default:
                        if (c < 0x20) {
                            static constexpr char hex[] = "0123456789ABCDEF";
                            m_Os << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                        } else {
                            m_Os.put(static_cast<char>(c));
                        }
                        break;
                    }
                }
                m_Os.put('"');
            }
        };

#pragma endregion

    } // namespace detail

    ParseResult parse(std::string_view input, const ParseOptions& opts) {
        detail::reader r{ input, opts, std::pmr::get_default_resource() };
        return r.document();
    }

    ParseResult parse(std::istream& is, const ParseOptions& opts) {
        std::ostringstream oss;
        oss << is.rdbuf();
        return parse(oss.str(), opts);
    }

    std::string dump(const value& v, const WriteOptions& opts) {
        std::ostringstream oss;
        dump(v, oss, opts);
        return oss.str();
    }

    void dump(const value& v, std::ostream& os, const WriteOptions& opts) {
        detail::writer w{ os, opts, false };
        w.write(v, 0);
    }

    std::optional<std::string> try_dump(const value& v, const WriteOptions& opts) {
        std::ostringstream oss;
        detail::writer w{ oss, opts, true };
        if (!w.write(v, 0)) return std::nullopt;
        return oss.str();
    }

} // namespace Sieve
