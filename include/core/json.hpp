#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace equipstat {

/**
 * @brief Read-only wrapper around glz::json_t
 *
 * Stores json_t by value. Const operator[] returns copies. Used to decode
 * persisted snapshot documents; encoding is done with std::format.
 */
class JsonValue {
public:
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    // ===== Container Properties =====

    [[nodiscard]] size_t size() const { return data_.size(); }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double; cast to target integral type
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    // value() with default: node.value("key", default)
    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        if (!data_.is_object()) return default_value;
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it == obj.end()) return default_value;
        const JsonValue v(it->second);
        if constexpr (std::is_same_v<T, std::string>) {
            if (!v.is_string()) return default_value;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (!v.is_boolean()) return default_value;
        } else {
            if (!v.is_number()) return default_value;
        }
        return v.get<T>();
    }

    /// Number at key, or NaN when absent or null (NaN is written as null)
    [[nodiscard]] double number_or_nan(std::string_view key) const {
        const auto v = (*this)[key];
        return v.is_number() ? v.get<double>() : std::numeric_limits<double>::quiet_NaN();
    }

    // ===== Object members as (key, value) pairs =====

    class items_range {
        const object_t* obj_;

    public:
        explicit items_range(const object_t* obj) : obj_(obj) {}

        class iterator {
            object_t::const_iterator it_;

        public:
            explicit iterator(object_t::const_iterator it) : it_(it) {}

            [[nodiscard]] std::pair<std::string, JsonValue> operator*() const {
                return {it_->first, JsonValue(it_->second)};
            }

            iterator& operator++() { ++it_; return *this; }
            [[nodiscard]] bool operator!=(const iterator& o) const { return it_ != o.it_; }
        };

        [[nodiscard]] iterator begin() const { return iterator(obj_->begin()); }
        [[nodiscard]] iterator end() const { return iterator(obj_->end()); }
    };

    [[nodiscard]] items_range items() const {
        static const object_t empty_obj;
        if (data_.is_object()) {
            return items_range(&data_.get_object());
        }
        return items_range(&empty_obj);
    }

    // ===== Parsing =====

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

private:
    glz::json_t data_{};
};

} // namespace equipstat
