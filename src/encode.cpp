#include "sieve/encode.hpp"
#include "sieve/json.hpp"


namespace Sieve::Encode {

    Sieve::value string(std::string_view s) {
        return Sieve::value{ s };
    }

    Sieve::value int32(int i) {
        return Sieve::value{ static_cast<double>(i) };
    }

    Sieve::value float64(double d) {
        return Sieve::value{ d };
    }

    Sieve::value boolean(bool b) {
        return Sieve::value{ b };
    }

    Sieve::value nil() {
        return Sieve::value{ nullptr };
    }

    Sieve::value object(std::vector<property> members) {
        Sieve::value out;
        auto& obj = out.as_object();
        obj.reserve(members.size());
        for (auto& [key, val] : members) out[key] = std::move(val);
        return out;
    }

    Sieve::value object(std::initializer_list<property> members) {
        return object(std::vector<property>(members));
    }

    Sieve::value array(std::vector<Sieve::value> items) {
        Sieve::array out;
        out.reserve(items.size());
        for (auto& item : items) out.push_back(std::move(item));
        return Sieve::value{ std::move(out) };
    }

    Sieve::value list(std::list<Sieve::value> items) {
        Sieve::array out;
        out.reserve(items.size());
        for (auto& item : items) out.push_back(std::move(item));
        return Sieve::value{ std::move(out) };
    }

    Sieve::value dict(const std::map<std::string, Sieve::value>& entries) {
        Sieve::value out;
        auto& obj = out.as_object();
        obj.reserve(entries.size());
        for (const auto& [key, val] : entries) out[key] = val;
        return out;
    }

    Sieve::value bigint(const Sieve::big_integer& i) {
        return string(i.to_string());
    }

    Sieve::value decimal(const Sieve::decimal& d) {
        return string(d.to_string());
    }

    Sieve::value int64(std::int64_t i) {
        return string(std::to_string(i));
    }

    Sieve::value uint64(std::uint64_t i) {
        return string(std::to_string(i));
    }

    Sieve::value guid(const Sieve::guid& g) {
        return string(g.to_string());
    }

    Sieve::value datetime(Sieve::date_time t) {
        return string(format_date_time(t));
    }

    Sieve::value datetime_offset(const Sieve::date_time_offset& t) {
        return string(t.to_string());
    }

    std::string to_string(const Sieve::value& v, std::size_t indent) {
        if (indent == 0) return dump(v);
        return dump(v, { .pretty = true, .indent = indent });
    }

} // namespace Sieve::Encode
