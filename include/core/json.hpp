#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tempo {

/**
 * @brief Thin wrapper around glz::json_t
 *
 * Used to validate and canonicalize JSON payloads (json columns, audit
 * old/new values) and to decode them back into field values.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

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

    /**
     * @brief Elements of an array value (empty for non-arrays)
     */
    [[nodiscard]] std::vector<JsonValue> elements() const {
        std::vector<JsonValue> result;
        if (!data_.is_array()) return result;
        const auto& arr = data_.get_array();
        result.reserve(arr.size());
        for (const auto& e : arr) {
            result.emplace_back(e);
        }
        return result;
    }

    // ===== Parse / Serialize =====

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    /**
     * @brief Compact serialization; object keys come out sorted
     */
    [[nodiscard]] std::string dump() const {
        std::string buffer;
        auto ec = glz::write_json(data_, buffer);
        if (ec) {
            throw std::runtime_error("JSON serialization error");
        }
        return buffer;
    }

    // ===== Raw Access =====

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace tempo
