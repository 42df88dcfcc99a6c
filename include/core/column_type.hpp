#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tempo {

/**
 * @brief Dialect-independent column type of a declared or introspected column
 *
 * Drives DDL spelling, parameter coercion and row decoding.
 */
enum class LogicalType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Numeric
    FLOAT,      // double precision
    REAL,
    DECIMAL,    // arbitrary precision, carried as text

    // String family
    STRING,     // varchar(n)
    TEXT,
    CHAR,

    BOOLEAN,

    // Date/Time
    DATE,
    TIMESTAMP,      // with time zone
    TIMESTAMP_NAIVE,

    UUID,
    JSON,
    BYTES,

    STRING_ARRAY,
};

/**
 * @brief Type info attached to result-set columns
 */
struct ColumnTypeInfo {
    LogicalType logical_type = LogicalType::UNKNOWN;
    uint32_t vendor_type_id = 0;       // PG OID
    std::string vendor_type_name;

    ColumnTypeInfo() = default;
    ColumnTypeInfo(LogicalType lt, uint32_t vid, std::string vname)
        : logical_type(lt), vendor_type_id(vid), vendor_type_name(std::move(vname)) {}
};

[[nodiscard]] inline const char* logical_type_to_string(LogicalType type) {
    switch (type) {
        case LogicalType::UNKNOWN: return "unknown";
        case LogicalType::SMALLINT: return "smallint";
        case LogicalType::INTEGER: return "integer";
        case LogicalType::BIGINT: return "bigint";
        case LogicalType::FLOAT: return "float";
        case LogicalType::REAL: return "real";
        case LogicalType::DECIMAL: return "decimal";
        case LogicalType::STRING: return "string";
        case LogicalType::TEXT: return "text";
        case LogicalType::CHAR: return "char";
        case LogicalType::BOOLEAN: return "boolean";
        case LogicalType::DATE: return "date";
        case LogicalType::TIMESTAMP: return "timestamp";
        case LogicalType::TIMESTAMP_NAIVE: return "timestamp_naive";
        case LogicalType::UUID: return "uuid";
        case LogicalType::JSON: return "json";
        case LogicalType::BYTES: return "bytes";
        case LogicalType::STRING_ARRAY: return "string_array";
        default: return "unknown";
    }
}

/**
 * @brief Parse a declared logical type name (as written in config / code)
 * @return std::nullopt if the name has no mapping
 */
[[nodiscard]] inline std::optional<LogicalType> parse_logical_type(const std::string& name) {
    if (name == "smallint") return LogicalType::SMALLINT;
    if (name == "integer" || name == "int") return LogicalType::INTEGER;
    if (name == "bigint") return LogicalType::BIGINT;
    if (name == "float" || name == "double") return LogicalType::FLOAT;
    if (name == "real") return LogicalType::REAL;
    if (name == "decimal" || name == "numeric") return LogicalType::DECIMAL;
    if (name == "string" || name == "varchar") return LogicalType::STRING;
    if (name == "text") return LogicalType::TEXT;
    if (name == "char") return LogicalType::CHAR;
    if (name == "boolean" || name == "bool") return LogicalType::BOOLEAN;
    if (name == "date") return LogicalType::DATE;
    if (name == "timestamp" || name == "datetime") return LogicalType::TIMESTAMP;
    if (name == "timestamp_naive") return LogicalType::TIMESTAMP_NAIVE;
    if (name == "uuid") return LogicalType::UUID;
    if (name == "json" || name == "jsonb") return LogicalType::JSON;
    if (name == "bytes") return LogicalType::BYTES;
    if (name == "string_array") return LogicalType::STRING_ARRAY;
    return std::nullopt;
}

[[nodiscard]] inline bool is_floating_point(LogicalType type) {
    return type == LogicalType::FLOAT || type == LogicalType::REAL;
}

[[nodiscard]] inline bool is_integral(LogicalType type) {
    return type == LogicalType::SMALLINT || type == LogicalType::INTEGER
        || type == LogicalType::BIGINT;
}

} // namespace tempo
