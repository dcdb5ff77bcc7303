#include "sieve/value.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>


namespace Sieve {

    static_assert(std::variant_size_v<storage_t> == 6, "storage_t alternatives must follow Sieve::kind");

#pragma region Construction

    value::value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res } {}

    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res } {}

    value::value(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::in_place_type<bool>, b } {}

    value::value(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::in_place_type<double>, d } {}

    value::value(const char* s, std::pmr::memory_resource* res)
        : value(std::string_view{ s }, res) {}

    value::value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<string>, sv, res } {}

    value::value(string s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<string>, std::move(s) } {}

    value::value(array a, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<array>, std::move(a) } {}

    value::value(object o, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<object>, std::move(o) } {}

    value::value(const value& other)
        : m_MemRes{ other.m_MemRes }, m_Storage{ clone_storage(other.m_Storage, other.m_MemRes) } {}

    value::value(value&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    value& value::operator=(const value& other) {
        if (this != &other) {
            // `other` may be a node of this tree: clone before replacing
            storage_t copy = clone_storage(other.m_Storage, other.m_MemRes);
            m_MemRes = other.m_MemRes;
            m_Storage = std::move(copy);
        }
        return *this;
    }

    value& value::operator=(value&& other) noexcept {
        if (this != &other) {
            m_MemRes = other.m_MemRes;
            m_Storage = std::move(other.m_Storage);
        }
        return *this;
    }

    storage_t value::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        if (const auto* str = std::get_if<string>(&s)) return string{ *str, res };

        if (const auto* arr = std::get_if<array>(&s)) {
            array copy(allocator_type{ res });
            copy.reserve(arr->size());
            for (const auto& item : *arr) copy.emplace_back(item);
            return copy;
        }

        if (const auto* obj = std::get_if<object>(&s)) {
            object copy(allocator_type{ res });
            copy.reserve(obj->size());
            for (const auto& m : *obj) copy.push_back(member{ string{ m.key, res }, value{ m.val } });
            return copy;
        }

        // null, bool and double carry no allocation
        return s;
    }

#pragma endregion
#pragma region Access

    kind value::type() const noexcept {
        return static_cast<kind>(m_Storage.index());
    }

    bool& value::as_bool() { return std::get<bool>(m_Storage); }
    const bool& value::as_bool() const { return std::get<bool>(m_Storage); }
    double& value::as_number() { return std::get<double>(m_Storage); }
    const double& value::as_number() const { return std::get<double>(m_Storage); }
    string& value::as_string() { return std::get<string>(m_Storage); }
    const string& value::as_string() const { return std::get<string>(m_Storage); }

    array& value::as_array() {
        if (!is_array()) m_Storage.emplace<array>(allocator_type{ m_MemRes });
        return std::get<array>(m_Storage);
    }
    const array& value::as_array() const { return std::get<array>(m_Storage); }

    object& value::as_object() {
        if (!is_object()) m_Storage.emplace<object>(allocator_type{ m_MemRes });
        return std::get<object>(m_Storage);
    }
    const object& value::as_object() const { return std::get<object>(m_Storage); }

    size_t value::size() const noexcept {
        switch (type()) {
        case kind::array: return std::get<array>(m_Storage).size();
        case kind::object: return std::get<object>(m_Storage).size();
        default: return 0;
        }
    }

#pragma endregion
#pragma region Indexing

    value& value::operator[](std::size_t idx) {
        auto& arr = as_array();
        while (arr.size() <= idx) arr.emplace_back(m_MemRes);
        return arr[idx];
    }

    const value& value::operator[](std::size_t idx) const {
        static const value absent{};
        const auto* arr = std::get_if<array>(&m_Storage);
        return arr && idx < arr->size() ? (*arr)[idx] : absent;
    }

    value& value::operator[](std::string_view key) {
        auto& obj = as_object();
        auto it = std::find_if(obj.begin(), obj.end(), [key](const member& m) { return m.key == key; });
        if (it != obj.end()) return it->val;
        return obj.emplace_back(member{ string{ key, m_MemRes }, value{ m_MemRes } }).val;
    }

    const value* value::find(std::string_view key) const {
        const auto* obj = std::get_if<object>(&m_Storage);
        if (!obj) return nullptr;
        auto it = std::find_if(obj->begin(), obj->end(), [key](const member& m) { return m.key == key; });
        return it == obj->end() ? nullptr : std::addressof(it->val);
    }

    const value& value::at(std::string_view key) const {
        if (const auto* v = find(key)) return *v;
        throw std::out_of_range{ "Sieve::value::at: no member `" + std::string{ key } + "`" };
    }

    bool operator==(const value& lhs, const value& rhs) {
        return lhs.m_Storage == rhs.m_Storage;
    }

#pragma endregion

} // namespace Sieve
