#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace tempo {

class JsonValue;

/**
 * @brief Arbitrary-precision number carried as its decimal text ("12.50")
 */
struct Decimal {
    std::string text;
    bool operator==(const Decimal&) const = default;
};

/**
 * @brief Structured value carried as JSON text
 */
struct Json {
    std::string text;
    bool operator==(const Json&) const = default;
};

using StringArray = std::vector<std::string>;

/**
 * @brief One field of a record payload; std::monostate is SQL NULL
 */
using FieldValue = std::variant<
    std::monostate,
    bool,
    int64_t,
    double,
    Decimal,
    std::string,
    Json,
    StringArray>;

/**
 * @brief Record payload: column name -> value (ordered for stable SQL)
 */
using Record = std::map<std::string, FieldValue>;

[[nodiscard]] inline bool is_null(const FieldValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

/**
 * @brief Human-readable rendering for logs and error messages
 */
[[nodiscard]] std::string field_value_to_string(const FieldValue& value);

/**
 * @brief JSON text for a value (audit old/new values)
 */
[[nodiscard]] std::string field_value_to_json(const FieldValue& value);

/**
 * @brief JSON object for a whole record, keys in column-name order
 */
[[nodiscard]] std::string record_to_json(const Record& record);

/**
 * @brief Decode a JSON value back into a field value of the given column type
 */
[[nodiscard]] FieldValue field_value_from_json(const JsonValue& json, LogicalType type);

} // namespace tempo
